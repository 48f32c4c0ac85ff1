// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOGSENTINEL_SRC_UTILITIES_ALLOCATOR_H
#define LOGSENTINEL_SRC_UTILITIES_ALLOCATOR_H

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tensor.h"

//! \brief Owns the memory behind parameter tensors. All allocations are zero-initialized
//! and released together when the allocator is destroyed.
class TensorAllocator {
public:
    TensorAllocator();
    ~TensorAllocator() noexcept;
    TensorAllocator(TensorAllocator&&) noexcept;
    TensorAllocator(const TensorAllocator&) = delete;
    TensorAllocator& operator=(TensorAllocator&&) noexcept;
    TensorAllocator& operator=(const TensorAllocator&) = delete;

    Tensor allocate(ETensorDType dtype, const char* name, const std::vector<long>& shape);
    Tensor allocate(ETensorDType dtype, const char* name, const std::initializer_list<long>& shape);

    std::size_t total_allocation() const;
    std::size_t num_allocations() const { return m_Pointers.size(); }

    void set_context(const std::string& ctx);
    const std::string& get_context() const;

    class AllocationMonitor {
    public:
        AllocationMonitor(const std::string& name, TensorAllocator*);
        AllocationMonitor(const AllocationMonitor&) = delete;
        AllocationMonitor& operator=(const AllocationMonitor&) = delete;
        AllocationMonitor(AllocationMonitor&& other) noexcept;
        AllocationMonitor& operator=(AllocationMonitor&& other) noexcept;
        ~AllocationMonitor() noexcept;
    private:
        std::string mParent;
        TensorAllocator* mAllocator;
        bool mActive = true;
    };

    [[nodiscard]] AllocationMonitor with_context(const std::string& ctx) { return AllocationMonitor(ctx, this); }

    //! Bytes allocated per context, in order of first use.
    std::vector<std::pair<std::string, long>> get_allocation_segments() const;

private:
    template<typename Container>
    Tensor allocate_impl(ETensorDType dtype, const char* name, const Container& shape);

    struct sAllocationData {
        std::byte* Pointer;
        long Size;
        std::string Name;
        std::string Context;
    };

    std::vector<sAllocationData> m_Pointers;
    std::string m_Context;
};

#endif //LOGSENTINEL_SRC_UTILITIES_ALLOCATOR_H
