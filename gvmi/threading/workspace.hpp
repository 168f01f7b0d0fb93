#pragma once

#include "gvmi/config.hpp"
#include "gvmi/core/type.hpp"
#include "gvmi/core/macros.hpp"
#include "gvmi/core/memory.hpp"

#include <cstddef>

// =============================================================================
// FILE: gvmi/threading/workspace.hpp
// BRIEF: Per-thread scratch buffers for parallel loops
// =============================================================================

namespace gvmi::threading {

// One contiguous allocation split into n_threads slices of `capacity`
// elements, indexed by the thread_rank that parallel_for hands out.
template <typename T>
class WorkspacePool {
public:
    WorkspacePool() = default;

    WorkspacePool(size_t n_threads, size_t capacity) {
        init(n_threads, capacity);
    }

    void init(size_t n_threads, size_t capacity) {
        n_threads_ = n_threads;
        capacity_ = capacity;
        data_ = gvmi::memory::aligned_alloc<T>(n_threads * capacity, GVMI_ALIGNMENT);
    }

    WorkspacePool(const WorkspacePool&) = delete;
    WorkspacePool& operator=(const WorkspacePool&) = delete;
    WorkspacePool(WorkspacePool&&) noexcept = default;
    WorkspacePool& operator=(WorkspacePool&&) noexcept = default;
    ~WorkspacePool() = default;

    GVMI_FORCE_INLINE T* get(size_t thread_rank) noexcept {
        return data_.get() + thread_rank * capacity_;
    }

    GVMI_FORCE_INLINE const T* get(size_t thread_rank) const noexcept {
        return data_.get() + thread_rank * capacity_;
    }

    GVMI_FORCE_INLINE Array<T> span(size_t thread_rank) noexcept {
        return Array<T>(get(thread_rank), capacity_);
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t n_threads() const noexcept { return n_threads_; }

private:
    gvmi::memory::AlignedPtr<T> data_{nullptr, gvmi::memory::AlignedDeleter<T>(GVMI_ALIGNMENT)};
    size_t n_threads_ = 0;
    size_t capacity_ = 0;
};

} // namespace gvmi::threading
