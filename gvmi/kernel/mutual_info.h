// =============================================================================
// FILE: gvmi/kernel/mutual_info.h
// BRIEF: API reference for plug-in mutual information estimation
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "gvmi/core/type.hpp"

namespace gvmi::kernel::mi {

/* -----------------------------------------------------------------------------
 * FUNCTION: mutual_information_binned
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Plug-in mutual information (nats) of two pre-binned rows.
 *
 * PARAMETERS:
 *     x_binned  [in]  Bin indices of row x [n]
 *     y_binned  [in]  Bin indices of row y [n]
 *     n         [in]  Number of samples
 *     n_bins    [in]  Number of bins
 *     counts    [out] Scratch [counts_capacity(n_bins)], overwritten
 *
 * PRECONDITIONS:
 *     - All bin indices < n_bins
 *
 * POSTCONDITIONS:
 *     - Returns sum over (a, b) with count > 0 of
 *       p_ab * ln(p_ab / (p_a * p_b)), probabilities = count / n
 *     - Cells visited in x-bin-major order
 *     - Returns 0 when n == 0
 *
 * COMPLEXITY:
 *     Time:  O(n + n_bins^2)
 *     Space: O(1) auxiliary
 *
 * THREAD SAFETY:
 *     Safe - caller owns counts
 * -------------------------------------------------------------------------- */
template <typename B>
Real mutual_information_binned(
    const B* x_binned,                       // Bins of x [n]
    const B* y_binned,                       // Bins of y [n]
    Size n,                                  // Number of samples
    Index n_bins,                            // Number of bins
    Size* counts                             // Count scratch
) noexcept;

/* -----------------------------------------------------------------------------
 * FUNCTION: mutual_information
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Quantile-bin two raw rows and return their plug-in mutual information.
 *
 * PARAMETERS:
 *     x       [in]  Row x [n]
 *     y       [in]  Row y [n]
 *     n_bins  [in]  Number of bins
 *
 * PRECONDITIONS:
 *     - Values are finite
 *
 * POSTCONDITIONS:
 *     - Result >= 0 up to rounding
 *     - mutual_information(x, y) == mutual_information(y, x)
 *     - mutual_information(x, x) is the entropy of the binned x
 *     - Returns 0 for empty rows
 *
 * COMPLEXITY:
 *     Time:  O(n log n + n * n_bins + n_bins^2)
 *     Space: O(n + n_bins^2)
 *
 * THREAD SAFETY:
 *     Safe - no shared state
 *
 * THROWS:
 *     DimensionError - x.len != y.len
 *     ValueError     - n_bins out of range
 * -------------------------------------------------------------------------- */
Real mutual_information(
    Array<const Real> x,                     // Row x [n]
    Array<const Real> y,                     // Row y [n]
    Index n_bins = 10                        // Number of bins
);

} // namespace gvmi::kernel::mi
