#pragma once

#include "gvmi/config.hpp"
#include "gvmi/core/macros.hpp"
#include "gvmi/threading/scheduler.hpp"

#include <algorithm>
#include <cstddef>
#include <future>
#include <type_traits>
#include <vector>

// =============================================================================
// FILE: gvmi/threading/parallel_for.hpp
// BRIEF: Backend-independent parallel loop
// =============================================================================

#if defined(GVMI_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(GVMI_USE_OPENMP)
    #include <omp.h>
#endif

namespace gvmi::threading {

namespace detail {

template <typename Func>
inline constexpr bool takes_rank_v = std::is_invocable_v<Func, size_t, size_t>;

// Run body over [lo, hi) on the calling thread with a fixed rank
template <typename Func>
GVMI_FORCE_INLINE void run_range(Func& func, size_t lo, size_t hi, size_t rank) {
    for (size_t i = lo; i < hi; ++i) {
        if constexpr (takes_rank_v<Func>) {
            func(i, rank);
        } else {
            func(i);
        }
    }
}

} // namespace detail

// Parallel loop over [start, end).
//   parallel_for(0, n, [&](size_t i) { ... });
//   parallel_for(0, n, [&](size_t i, size_t thread_rank) { ... });
//
// thread_rank is always < Scheduler::max_thread_ranks(), so it can index a
// WorkspacePool. grain is the minimum number of iterations handed to one
// task (0 lets the backend decide). The body must not throw under OpenMP.
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func, size_t grain = 0) {
    if (GVMI_UNLIKELY(start >= end)) {
        return;
    }

#if defined(GVMI_USE_OPENMP)
    (void)grain;
    if (omp_in_parallel()) {
        // Nested call: the whole range runs on this thread, so rank 0 is the
        // only slot in use. The outer team may be larger than max_thread_ranks().
        detail::run_range(func, start, end, 0);
        return;
    }
    const auto n = static_cast<std::ptrdiff_t>(end - start);
    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t k = 0; k < n; ++k) {
        const size_t i = start + static_cast<size_t>(k);
        detail::run_range(func, i, i + 1, static_cast<size_t>(omp_get_thread_num()));
    }

#elif defined(GVMI_USE_TBB)
    const size_t tbb_grain = grain > 0 ? grain : 1;
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end, tbb_grain),
        [&func](const tbb::blocked_range<size_t>& r) {
            const int slot = tbb::this_task_arena::current_thread_index();
            detail::run_range(func, r.begin(), r.end(), slot > 0 ? static_cast<size_t>(slot) : 0);
        });

#elif defined(GVMI_USE_BS)
    // One contiguous block per worker; the block index doubles as the rank
    auto& pool = detail::get_global_pool();
    const size_t workers = std::max<size_t>(1, pool.get_thread_count());
    const size_t total = end - start;
    const size_t block = std::max((total + workers - 1) / workers, std::max<size_t>(grain, 1));

    std::vector<std::future<void>> pending;
    pending.reserve(workers);
    size_t rank = 0;
    for (size_t lo = start; lo < end; lo += block, ++rank) {
        const size_t hi = std::min(lo + block, end);
        pending.push_back(pool.submit([&func, lo, hi, rank]() {
            detail::run_range(func, lo, hi, rank);
        }));
    }
    for (auto& f : pending) {
        f.get();
    }

#else
    (void)grain;
    detail::run_range(func, start, end, 0);
#endif
}

} // namespace gvmi::threading
