#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/error.hpp"
#include "gvmi/core/macros.hpp"
#include "gvmi/kernel/discretize.hpp"

#include <cmath>
#include <cstring>
#include <vector>

// =============================================================================
// FILE: gvmi/kernel/mutual_info.hpp
// BRIEF: Plug-in mutual information between two quantile-binned rows
// =============================================================================

namespace gvmi::kernel::mi {

// =============================================================================
// Internal Helpers
// =============================================================================

namespace detail {

// Count buffer layout: [joint n_bins*n_bins | marginal x n_bins | marginal y n_bins]
GVMI_FORCE_INLINE constexpr Size counts_capacity(Index n_bins) noexcept {
    const Size nb = static_cast<Size>(n_bins);
    return nb * nb + 2 * nb;
}

} // namespace detail

// =============================================================================
// Mutual Information from Binned Rows
// =============================================================================

// I(X;Y) = sum p_xy * ln(p_xy / (p_x * p_y)) over cells with p_xy > 0,
// visited in x-bin-major order. counts must hold counts_capacity(n_bins)
// elements and is overwritten.
template <typename B>
GVMI_HOT inline Real mutual_information_binned(
    const B* GVMI_RESTRICT x_binned,
    const B* GVMI_RESTRICT y_binned,
    Size n,
    Index n_bins,
    Size* GVMI_RESTRICT counts
) noexcept {
    if (GVMI_UNLIKELY(n == 0)) return Real(0);

    const Size nb = static_cast<Size>(n_bins);
    Size* joint = counts;
    Size* marginal_x = counts + nb * nb;
    Size* marginal_y = marginal_x + nb;
    std::memset(counts, 0, detail::counts_capacity(n_bins) * sizeof(Size));

    for (Size k = 0; k < n; ++k) {
        const Size bx = static_cast<Size>(x_binned[k]);
        const Size by = static_cast<Size>(y_binned[k]);
        ++joint[bx * nb + by];
        ++marginal_x[bx];
        ++marginal_y[by];
    }

    const Real total = static_cast<Real>(n);
    Real mi = Real(0);

    for (Size a = 0; a < nb; ++a) {
        if (marginal_x[a] == 0) continue;
        const Real p_x = static_cast<Real>(marginal_x[a]) / total;
        const Size* joint_row = joint + a * nb;

        for (Size b = 0; b < nb; ++b) {
            if (joint_row[b] == 0 || marginal_y[b] == 0) continue;
            const Real p_xy = static_cast<Real>(joint_row[b]) / total;
            const Real p_y = static_cast<Real>(marginal_y[b]) / total;
            mi += p_xy * std::log(p_xy / (p_x * p_y));
        }
    }

    return mi;
}

// =============================================================================
// Mutual Information from Raw Rows
// =============================================================================

// Each row is binned against its own quantiles. Empty input yields 0.
// mutual_information(x, x) is the entropy of x's binned distribution.
inline Real mutual_information(
    Array<const Real> x,
    Array<const Real> y,
    Index n_bins = config::DEFAULT_N_BINS
) {
    GVMI_CHECK_DIM(x.len == y.len,
                   "mutual_information: rows must have the same length (" +
                   std::to_string(x.len) + " vs " + std::to_string(y.len) + ")");
    check_n_bins(n_bins);

    const Size n = x.len;
    if (n == 0) return Real(0);

    std::vector<Real> sort_buf(n);
    std::vector<Bin> x_binned(n);
    std::vector<Bin> y_binned(n);
    std::vector<Size> counts(detail::counts_capacity(n_bins));

    discretize_row(x, n_bins, as_array(sort_buf), as_array(x_binned));
    discretize_row(y, n_bins, as_array(sort_buf), as_array(y_binned));

    return mutual_information_binned(
        x_binned.data(), y_binned.data(), n, n_bins, counts.data());
}

// Entropy of a row after quantile binning, in nats
inline Real binned_entropy(
    Array<const Real> x,
    Index n_bins = config::DEFAULT_N_BINS
) {
    return mutual_information(x, x, n_bins);
}

} // namespace gvmi::kernel::mi
