// =============================================================================
// FILE: gvmi/kernel/discretize.h
// BRIEF: API reference for equal-count quantile binning
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/dense.hpp"

namespace gvmi::kernel::mi {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Index DEFAULT_N_BINS = 10;
    constexpr Index MIN_N_BINS = 2;
    constexpr Index MAX_N_BINS = 1024;
}

using Bin = std::uint16_t;

// =============================================================================
// Binning Functions
// =============================================================================

/* -----------------------------------------------------------------------------
 * FUNCTION: quantile_bin
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Map one value to a quantile bin of a sorted reference row.
 *
 * PARAMETERS:
 *     value   [in]  Value to bin
 *     sorted  [in]  Reference values, ascending [n]
 *     n_bins  [in]  Number of bins
 *
 * PRECONDITIONS:
 *     - sorted is ascending
 *     - n_bins >= 1
 *
 * POSTCONDITIONS:
 *     - For i = 1 .. n_bins-1 with cut = (i * n) / n_bins, returns i-1 for
 *       the first i where cut < n and value <= sorted[cut]
 *     - Returns n_bins-1 when no boundary matches
 *     - Returns 0 when sorted is empty
 *     - Ties with a boundary go to the lower bin
 *
 * COMPLEXITY:
 *     Time:  O(n_bins)
 *     Space: O(1)
 *
 * THREAD SAFETY:
 *     Safe - no shared state
 * -------------------------------------------------------------------------- */
Index quantile_bin(
    Real value,                              // Value to bin
    Array<const Real> sorted,                // Ascending reference [n]
    Index n_bins = config::DEFAULT_N_BINS    // Number of bins
) noexcept;

/* -----------------------------------------------------------------------------
 * FUNCTION: discretize_row
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Bin every value of a row against the row's own quantiles.
 *
 * PARAMETERS:
 *     values    [in]  Row values [n]
 *     n_bins    [in]  Number of bins
 *     sort_buf  [out] Scratch buffer [>= n], holds the sorted row on return
 *     binned    [out] Bin indices [>= n]
 *
 * PRECONDITIONS:
 *     - sort_buf.len >= values.len
 *     - binned.len >= values.len
 *
 * POSTCONDITIONS:
 *     - binned[k] == quantile_bin(values[k], sort(values), n_bins)
 *
 * COMPLEXITY:
 *     Time:  O(n log n + n * n_bins)
 *     Space: O(1) auxiliary
 *
 * THREAD SAFETY:
 *     Safe - caller owns all buffers
 *
 * THROWS:
 *     DimensionError - buffers too short
 * -------------------------------------------------------------------------- */
template <typename B>
void discretize_row(
    Array<const Real> values,                // Row values [n]
    Index n_bins,                            // Number of bins
    Array<Real> sort_buf,                    // Scratch [>= n]
    Array<B> binned                          // Output bins [>= n]
);

/* -----------------------------------------------------------------------------
 * FUNCTION: discretize_rows
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Bin every row of a dense matrix against its own quantiles.
 *
 * PARAMETERS:
 *     matrix  [in]  Dense row-major matrix [rows x cols]
 *     n_bins  [in]  Number of bins
 *     binned  [out] Bin indices, row-major [rows x cols]
 *
 * PRECONDITIONS:
 *     - binned.len >= rows * cols
 *     - MIN_N_BINS <= n_bins <= MAX_N_BINS
 *
 * POSTCONDITIONS:
 *     - Row r of binned equals discretize_row(matrix.row(r))
 *
 * COMPLEXITY:
 *     Time:  O(rows * (cols log cols + cols * n_bins))
 *     Space: O(threads * cols) auxiliary
 *
 * THREAD SAFETY:
 *     Safe - parallelized over rows, per-thread sort buffers
 *
 * THROWS:
 *     ValueError     - n_bins out of range
 *     DimensionError - output buffer too small
 * -------------------------------------------------------------------------- */
void discretize_rows(
    DenseArray<const Real> matrix,           // Expression matrix [rows x cols]
    Index n_bins,                            // Number of bins
    Array<Bin> binned                        // Output bins [rows x cols]
);

} // namespace gvmi::kernel::mi
