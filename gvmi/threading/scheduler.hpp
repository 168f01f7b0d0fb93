#pragma once

#include <cstddef>
#include <memory>
#include <thread>

#include "gvmi/config.hpp"
#include "gvmi/core/macros.hpp"

// =============================================================================
// FILE: gvmi/threading/scheduler.hpp
// BRIEF: Worker count control for the configured threading backend
// =============================================================================

#if defined(GVMI_USE_BS)
    #include "BS_thread_pool.hpp"
#elif defined(GVMI_USE_OPENMP)
    #include <omp.h>
#elif defined(GVMI_USE_TBB)
    #include <tbb/global_control.h>
    #include <tbb/task_arena.h>
#endif

namespace gvmi::threading {

namespace detail {

constexpr size_t MAX_THREADS = 1024;

#if defined(GVMI_USE_BS)
// Process-wide pool, never destroyed
inline BS::thread_pool& get_global_pool() {
    static BS::thread_pool pool;
    return pool;
}
#endif

inline void apply_thread_count(size_t n) {
#if defined(GVMI_USE_OPENMP)
    omp_set_num_threads(static_cast<int>(n));
#elif defined(GVMI_USE_BS)
    // Recreates the pool
    get_global_pool().reset(n);
#elif defined(GVMI_USE_TBB)
    // global_control only applies while alive
    static std::unique_ptr<tbb::global_control> control;
    control = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, n);
#else
    (void)n;
#endif
}

inline size_t query_thread_count() noexcept {
#if defined(GVMI_USE_OPENMP)
    const int n = omp_get_max_threads();
    return n > 0 ? static_cast<size_t>(n) : 1;
#elif defined(GVMI_USE_BS)
    const size_t n = get_global_pool().get_thread_count();
    return n > 0 ? n : 1;
#elif defined(GVMI_USE_TBB)
    const size_t n = tbb::global_control::active_value(
        tbb::global_control::max_allowed_parallelism);
    return n > 0 ? n : 1;
#else
    return 1;
#endif
}

} // namespace detail

class Scheduler {
public:
    // At least 1, even when detection fails
    GVMI_FORCE_INLINE static size_t hardware_concurrency() noexcept {
        const size_t hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 1;
    }

    // n == 0 selects hardware_concurrency(); values above MAX_THREADS are clamped.
    // Not safe to call while a parallel_for is running.
    static void set_num_threads(size_t n) {
        if (n == 0) n = hardware_concurrency();
        if (n > detail::MAX_THREADS) n = detail::MAX_THREADS;
        detail::apply_thread_count(n);
    }

    static size_t get_num_threads() noexcept {
        return detail::query_thread_count();
    }

    // Exclusive bound on the thread_rank parallel_for passes to its body
    static size_t max_thread_ranks() noexcept {
#if defined(GVMI_USE_TBB)
        // Arena slot indices are not capped by global_control
        const int slots = tbb::this_task_arena::max_concurrency();
        const size_t arena = slots > 0 ? static_cast<size_t>(slots) : 1;
        const size_t configured = get_num_threads();
        return arena > configured ? arena : configured;
#else
        return get_num_threads();
#endif
    }
};

// Sets the worker count for one scope and restores the previous count.
// n == 0 leaves the current setting untouched.
class ThreadCountGuard {
public:
    explicit ThreadCountGuard(size_t n)
        : previous_(Scheduler::get_num_threads()), active_(n > 0) {
        if (active_) {
            Scheduler::set_num_threads(n);
        }
    }

    ~ThreadCountGuard() {
        if (active_) {
            Scheduler::set_num_threads(previous_);
        }
    }

    ThreadCountGuard(const ThreadCountGuard&) = delete;
    ThreadCountGuard& operator=(const ThreadCountGuard&) = delete;

private:
    size_t previous_;
    bool active_;
};

} // namespace gvmi::threading
