// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "allocator.h"

#include <algorithm>
#include <functional>
#include <numeric>

#include <fmt/core.h>

TensorAllocator::TensorAllocator(TensorAllocator&&) noexcept = default;
TensorAllocator& TensorAllocator::operator=(TensorAllocator&&) noexcept = default;

TensorAllocator::TensorAllocator() = default;

/**
 * @brief Destructor; frees all tracked allocations.
 */
TensorAllocator::~TensorAllocator() noexcept {
    for (auto& ptr: m_Pointers) {
        delete[] ptr.Pointer;
    }
}

/**
 * @brief Implementation helper for allocate() overloads.
 *
 * Allocates zeroed host storage, records the pointer for later cleanup, and tags it
 * with the current context for statistics.
 *
 * @tparam Container Container type providing .size() and iteration over dimension sizes.
 * @param dtype Tensor element type.
 * @param name Logical name used for stats and error reporting.
 * @param shape Tensor dimensions.
 * @return Allocated Tensor.
 * @throws std::runtime_error If the tensor rank is too large or a dimension is negative.
 */
template<typename Container>
Tensor TensorAllocator::allocate_impl(ETensorDType dtype, const char* name, const Container& shape) {
    if (shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error(fmt::format("Tensor rank too large for `{}`", name ? name : "<unnamed>"));
    }
    for (long s : shape) {
        if (s < 0) {
            throw std::runtime_error(fmt::format("Negative dimension in shape of `{}`", name ? name : "<unnamed>"));
        }
    }

    std::size_t total = std::accumulate(std::begin(shape), std::end(shape), 1l, std::multiplies<>());
    std::size_t bytes = total * get_dtype_size(dtype);
    auto* ptr = new std::byte[std::max<std::size_t>(bytes, 1)]{};

    const char* safe_name = name ? name : "<unnamed>";
    m_Pointers.emplace_back(sAllocationData{ptr, narrow<long>(bytes), safe_name, m_Context});
    return Tensor::from_pointer(ptr, -1, dtype, shape);
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, const std::vector<long>& shape) {
    return allocate_impl(dtype, name, shape);
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, const std::initializer_list<long>& shape) {
    return allocate_impl(dtype, name, shape);
}

std::size_t TensorAllocator::total_allocation() const {
    std::size_t total = 0;
    for (const auto& ptr : m_Pointers) {
        total += ptr.Size;
    }
    return total;
}

void TensorAllocator::set_context(const std::string& ctx) {
    m_Context = ctx;
}

const std::string& TensorAllocator::get_context() const {
    return m_Context;
}

std::vector<std::pair<std::string, long>> TensorAllocator::get_allocation_segments() const {
    std::vector<std::pair<std::string, long>> result;
    for (const auto& ptr : m_Pointers) {
        const std::string& ctx = ptr.Context.empty() ? std::string("<root>") : ptr.Context;
        auto found = std::find_if(result.begin(), result.end(), [&](const auto& entry) { return entry.first == ctx; });
        if (found == result.end()) {
            result.emplace_back(ctx, ptr.Size);
        } else {
            found->second += ptr.Size;
        }
    }
    return result;
}

TensorAllocator::AllocationMonitor::AllocationMonitor(const std::string& name, TensorAllocator* alloc) :
    mParent(alloc->get_context()), mAllocator(alloc) {
    if (mParent.empty()) {
        mAllocator->set_context(name);
    } else {
        mAllocator->set_context(mParent + "." + name);
    }
}

TensorAllocator::AllocationMonitor::AllocationMonitor(AllocationMonitor&& other) noexcept :
    mParent(std::move(other.mParent)), mAllocator(other.mAllocator), mActive(std::exchange(other.mActive, false)) {
}

TensorAllocator::AllocationMonitor& TensorAllocator::AllocationMonitor::operator=(AllocationMonitor&& other) noexcept {
    if (this != &other) {
        if (mActive) {
            mAllocator->set_context(mParent);
        }
        mParent = std::move(other.mParent);
        mAllocator = other.mAllocator;
        mActive = std::exchange(other.mActive, false);
    }
    return *this;
}

TensorAllocator::AllocationMonitor::~AllocationMonitor() noexcept {
    if (mActive) {
        mAllocator->set_context(mParent);
    }
}
