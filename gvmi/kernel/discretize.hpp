#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/dense.hpp"
#include "gvmi/core/error.hpp"
#include "gvmi/core/macros.hpp"
#include "gvmi/core/sort.hpp"
#include "gvmi/threading/parallel_for.hpp"
#include "gvmi/threading/scheduler.hpp"
#include "gvmi/threading/workspace.hpp"

#include <algorithm>
#include <cstdint>

// =============================================================================
// FILE: gvmi/kernel/discretize.hpp
// BRIEF: Equal-count quantile binning of expression rows
// =============================================================================

namespace gvmi::kernel::mi {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Index DEFAULT_N_BINS = 10;
    constexpr Index MIN_N_BINS = 2;
    constexpr Index MAX_N_BINS = 1024;
}

// Bin indices are stored compactly; MAX_N_BINS must fit
using Bin = std::uint16_t;

static_assert(config::MAX_N_BINS <= 65536);

inline void check_n_bins(Index n_bins) {
    GVMI_CHECK_ARG(n_bins >= config::MIN_N_BINS && n_bins <= config::MAX_N_BINS,
                   "Number of bins must be in [" + std::to_string(config::MIN_N_BINS) +
                   ", " + std::to_string(config::MAX_N_BINS) + "], got " +
                   std::to_string(n_bins));
}

// =============================================================================
// Single Value
// =============================================================================

// Boundary i (1 <= i < n_bins) sits at sorted[(i * n) / n_bins]. A value
// belongs to the first bin whose upper boundary it does not exceed; values
// above every boundary land in the last bin. Ties resolve to the lower bin.
GVMI_FORCE_INLINE Index quantile_bin(
    Real value,
    Array<const Real> sorted,
    Index n_bins = config::DEFAULT_N_BINS
) noexcept {
    const Size n = sorted.len;
    if (GVMI_UNLIKELY(n == 0)) return 0;

    const Size bins = static_cast<Size>(n_bins);
    for (Size i = 1; i < bins; ++i) {
        const Size cut = (i * n) / bins;
        if (cut < n && value <= sorted[cut]) {
            return static_cast<Index>(i - 1);
        }
    }
    return n_bins - 1;
}

// =============================================================================
// Whole Row
// =============================================================================

// Bin every value against an already sorted reference
template <typename B>
inline void discretize_quantile(
    Array<const Real> values,
    Array<const Real> sorted,
    Index n_bins,
    Array<B> binned
) {
    GVMI_CHECK_DIM(binned.len >= values.len,
                   "discretize_quantile: output shorter than input");
    for (Size k = 0; k < values.len; ++k) {
        binned[k] = static_cast<B>(quantile_bin(values[k], sorted, n_bins));
    }
}

// Copy into sort_buf, sort it, and bin the row against its own quantiles
template <typename B>
inline void discretize_row(
    Array<const Real> values,
    Index n_bins,
    Array<Real> sort_buf,
    Array<B> binned
) {
    GVMI_CHECK_DIM(sort_buf.len >= values.len,
                   "discretize_row: sort buffer shorter than input");
    Array<Real> sorted = sort_buf.subspan(0, values.len);
    std::copy(values.begin(), values.end(), sorted.begin());
    gvmi::sort::sort(sorted);
    discretize_quantile(values, Array<const Real>(sorted), n_bins, binned);
}

// =============================================================================
// Matrix (Parallel over Rows)
// =============================================================================

// binned is row-major rows x cols, one bin row per expression row
inline void discretize_rows(
    DenseArray<const Real> matrix,
    Index n_bins,
    Array<Bin> binned
) {
    check_n_bins(n_bins);
    const Size rows = static_cast<Size>(matrix.rows);
    const Size cols = static_cast<Size>(matrix.cols);
    GVMI_CHECK_DIM(binned.len >= rows * cols,
                   "discretize_rows: output buffer too small");
    if (GVMI_UNLIKELY(rows == 0 || cols == 0)) return;

    threading::WorkspacePool<Real> sort_pool(
        threading::Scheduler::max_thread_ranks(), cols);

    threading::parallel_for(Size(0), rows, [&](size_t r, size_t thread_rank) {
        Array<Real> buf = sort_pool.span(thread_rank);
        Array<const Real> row = matrix.row(static_cast<Index>(r));
        Array<Real> sorted = buf.subspan(0, cols);
        std::copy(row.begin(), row.end(), sorted.begin());
        gvmi::sort::sort(sorted);

        Bin* out = binned.ptr + r * cols;
        for (Size k = 0; k < cols; ++k) {
            out[k] = static_cast<Bin>(quantile_bin(row[k], Array<const Real>(sorted), n_bins));
        }
    });
}

} // namespace gvmi::kernel::mi
