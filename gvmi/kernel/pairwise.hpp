#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/dense.hpp"
#include "gvmi/core/error.hpp"
#include "gvmi/core/macros.hpp"
#include "gvmi/core/progress.hpp"
#include "gvmi/threading/parallel_for.hpp"
#include "gvmi/threading/scheduler.hpp"
#include "gvmi/threading/workspace.hpp"
#include "gvmi/kernel/discretize.hpp"
#include "gvmi/kernel/mutual_info.hpp"
#include "gvmi/kernel/mi_table.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gvmi/kernel/pairwise.hpp
// BRIEF: All-pairs mutual information over the rows of an expression matrix
// =============================================================================

namespace gvmi::kernel::mi {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    inline const char* const START_MESSAGE = "Computing mutual information...";
    inline const char* const FINISH_MESSAGE = "Mutual information computation completed!";
    // Pairs per scheduling task; one pair is only O(n_samples) work
    constexpr Size PAIR_GRAIN = 64;
}

struct PairwiseOptions {
    Index n_bins = config::DEFAULT_N_BINS;
    // Worker count for this call only; 0 keeps the scheduler's setting
    Size n_threads = 0;
};

// =============================================================================
// Pair Enumeration
// =============================================================================

// Unordered pairs including self-pairs: n(n+1)/2
GVMI_FORCE_INLINE constexpr Size pair_count(Size n) noexcept {
    return n * (n + 1) / 2;
}

namespace detail {

// Number of pairs (i', j) with i' < i in the upper triangle
GVMI_FORCE_INLINE constexpr Size row_offset(Size i, Size n) noexcept {
    return i * (2 * n - i + 1) / 2;
}

} // namespace detail

// Flat index k -> (i, j), i <= j, row-major over the upper triangle
inline std::pair<Size, Size> decode_pair(Size k, Size n) noexcept {
    const double b = 2.0 * static_cast<double>(n) + 1.0;
    const double disc = b * b - 8.0 * static_cast<double>(k);
    double est = (b - std::sqrt(disc > 0.0 ? disc : 0.0)) / 2.0;
    Size i = est > 0.0 ? static_cast<Size>(est) : 0;
    if (i >= n) i = n - 1;

    // Floating point estimate can be off by one near row boundaries
    while (i > 0 && detail::row_offset(i, n) > k) --i;
    while (i + 1 < n && detail::row_offset(i + 1, n) <= k) ++i;

    return {i, i + (k - detail::row_offset(i, n))};
}

// =============================================================================
// Validation
// =============================================================================

// Emptiness is checked before the label count
inline void validate_input(
    DenseArray<const Real> matrix,
    Size n_labels,
    const PairwiseOptions& options
) {
    if (matrix.empty()) {
        throw EmptyInputError();
    }
    if (static_cast<Size>(matrix.rows) != n_labels) {
        throw DimensionMismatchError(static_cast<Size>(matrix.rows), n_labels);
    }
    check_n_bins(options.n_bins);
    GVMI_CHECK_ARG(matrix.stride >= matrix.cols,
                   "Row stride must be at least the number of columns");
}

// =============================================================================
// Pairwise Engine
// =============================================================================

inline MITable compute_pairwise(
    DenseArray<const Real> matrix,
    const std::vector<std::string>& labels,
    const PairwiseOptions& options = {},
    progress::ProgressSink* sink = nullptr
) {
    validate_input(matrix, labels.size(), options);

    threading::ThreadCountGuard threads(options.n_threads);

    const Size n_genes = static_cast<Size>(matrix.rows);
    const Size n_samples = static_cast<Size>(matrix.cols);
    const Index n_bins = options.n_bins;
    const Size n_pairs = pair_count(n_genes);

    std::vector<Bin> binned(n_genes * n_samples);
    discretize_rows(matrix, n_bins, as_array(binned));

    std::vector<Real> scores(n_pairs, Real(0));
    threading::WorkspacePool<Size> count_pool(
        threading::Scheduler::max_thread_ranks(), detail::counts_capacity(n_bins));

    progress::ProgressTracker tracker(sink, n_pairs);
    tracker.start(config::START_MESSAGE);

    const Bin* bins_ptr = binned.data();
    Real* scores_ptr = scores.data();

    threading::parallel_for(Size(0), n_pairs, [&](size_t k, size_t thread_rank) {
        const auto [i, j] = decode_pair(k, n_genes);
        scores_ptr[k] = mutual_information_binned(
            bins_ptr + i * n_samples,
            bins_ptr + j * n_samples,
            n_samples,
            n_bins,
            count_pool.get(thread_rank));
        tracker.advance();
    }, config::PAIR_GRAIN);

    tracker.finish(config::FINISH_MESSAGE);

    MITable table(labels);
    Size k = 0;
    for (Size i = 0; i < n_genes; ++i) {
        for (Size j = i; j < n_genes; ++j, ++k) {
            table.set(i, j, scores[k]);
        }
    }
    return table;
}

} // namespace gvmi::kernel::mi
