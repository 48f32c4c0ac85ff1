// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_TRAINING_EVALUATOR_H
#define LOGSENTINEL_SRC_TRAINING_EVALUATOR_H

#include <array>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "training/model.h"

class ILogSink;
class LogDataset;

struct ClassMetrics {
    double Precision = 0.0;
    double Recall = 0.0;
    double F1 = 0.0;
    long Support = 0;
};

/**
 * @brief Binary classification metrics with anomalous as the positive class.
 *
 * Undefined ratios (no predicted or no actual positives) are reported as 0.
 */
struct EvaluationMetrics {
    double Accuracy = 0.0;
    double Precision = 0.0;
    double Recall = 0.0;
    double F1 = 0.0;
    double TimePerRecordMs = 0.0;
    std::optional<double> TotalRunTimeSec;

    ClassMetrics Normal;
    ClassMetrics Anomalous;
    //! [[tn, fp], [fn, tp]], rows are true labels in the order [normal, anomalous].
    std::array<std::array<long, 2>, 2> ConfusionMatrix{};

    std::vector<float> TrainingLossSeries;

    //! Records that received a prediction and records excluded for lack of one.
    long Records = 0;
    long Excluded = 0;

    [[nodiscard]] nlohmann::json to_json() const;
    //! accuracy, precision, recall and f1_score only.
    [[nodiscard]] nlohmann::json overall_for_plot() const;
};

//! Metrics over paired labels; both vectors must have the same length.
EvaluationMetrics compute_metrics(const std::vector<int>& y_true, const std::vector<int>& y_pred);

//! Index of the larger logit, or nullopt for a row without prediction.
std::optional<int> argmax(const std::optional<ClassLogits>& logits);

/**
 * @brief Batched inference over a held-out dataset.
 *
 * Reports `{epoch: "Final Evaluation", progress}` after every batch. Cancellation is not
 * checked while evaluating.
 */
class Evaluator {
public:
    Evaluator(int batch_size, ILogSink& sink, bool show_progress = false);

    EvaluationMetrics evaluate(IModel& model, const LogDataset& dataset, const std::vector<float>& loss_series);

private:
    int mBatchSize;
    ILogSink& mSink;
    bool mShowProgress;
};

#endif //LOGSENTINEL_SRC_TRAINING_EVALUATOR_H
