// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_PRECISION_POLICY_H
#define LOGSENTINEL_SRC_TRAINING_PRECISION_POLICY_H

#include "kernels/kernels.h"
#include "utilities/dtype.h"
#include "utilities/tensor.h"

/**
 * @brief Device and numeric precision shared by every trainable submodule.
 *
 * Parameters are always kept as FP32 master weights. Activations leaving a module are rounded
 * to `ModelDType`, which emulates running the module in reduced precision. Only FP16 needs
 * dynamic loss scaling.
 */
struct PrecisionPolicy {
    //! -1 is the host.
    int Device = -1;
    ETensorDType ModelDType = ETensorDType::FP32;
    ETensorDType MasterDType = ETensorDType::FP32;

    [[nodiscard]] bool use_loss_scaling() const { return ModelDType == ETensorDType::FP16; }
    [[nodiscard]] bool is_reduced_precision() const { return ModelDType != ETensorDType::FP32; }

    void cast(float* data, std::size_t count) const { round_inplace(data, count, ModelDType); }
    void cast(Tensor& tensor) const { round_inplace(tensor, ModelDType); }
};

#endif //LOGSENTINEL_SRC_TRAINING_PRECISION_POLICY_H
