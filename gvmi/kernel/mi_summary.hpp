#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/kernel/mi_table.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

// =============================================================================
// FILE: gvmi/kernel/mi_summary.hpp
// BRIEF: Descriptive statistics and ranking over an MITable
// =============================================================================

namespace gvmi::kernel::mi {

struct ScoreStats {
    Size count = 0;
    Real mean = Real(0);
    Real min = Real(0);
    Real max = Real(0);
};

struct MISummary {
    Size n_genes = 0;
    Size n_pairs = 0;          // unordered, self-pairs included
    ScoreStats diagonal;       // self-information
    ScoreStats off_diagonal;   // i < j
};

struct ScoredPair {
    Size i;
    Size j;
    Real score;
};

namespace detail {

struct StatsAccumulator {
    Size count = 0;
    Real sum = Real(0);
    Real min = std::numeric_limits<Real>::max();
    Real max = std::numeric_limits<Real>::lowest();

    void add(Real v) noexcept {
        ++count;
        sum += v;
        min = std::min(min, v);
        max = std::max(max, v);
    }

    [[nodiscard]] ScoreStats finish() const noexcept {
        ScoreStats s;
        if (count == 0) return s;
        s.count = count;
        s.mean = sum / static_cast<Real>(count);
        s.min = min;
        s.max = max;
        return s;
    }
};

} // namespace detail

inline MISummary summarize(const MITable& table) {
    const Size n = table.size();
    detail::StatsAccumulator diag;
    detail::StatsAccumulator off;

    for (Size i = 0; i < n; ++i) {
        Array<const Real> r = table.row(i);
        diag.add(r[i]);
        for (Size j = i + 1; j < n; ++j) {
            off.add(r[j]);
        }
    }

    MISummary out;
    out.n_genes = n;
    out.n_pairs = n * (n + 1) / 2;
    out.diagonal = diag.finish();
    out.off_diagonal = off.finish();
    return out;
}

// Highest off-diagonal scores, each unordered pair once.
// Equal scores are ordered by (i, j) ascending.
inline std::vector<ScoredPair> top_pairs(const MITable& table, Size k) {
    const Size n = table.size();
    std::vector<ScoredPair> pairs;
    if (n < 2 || k == 0) return pairs;

    pairs.reserve(n * (n - 1) / 2);
    for (Size i = 0; i < n; ++i) {
        Array<const Real> r = table.row(i);
        for (Size j = i + 1; j < n; ++j) {
            pairs.push_back(ScoredPair{i, j, r[j]});
        }
    }

    auto before = [](const ScoredPair& a, const ScoredPair& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.i != b.i) return a.i < b.i;
        return a.j < b.j;
    };

    const Size keep = std::min(k, pairs.size());
    std::partial_sort(pairs.begin(), pairs.begin() + static_cast<std::ptrdiff_t>(keep),
                      pairs.end(), before);
    pairs.resize(keep);
    return pairs;
}

} // namespace gvmi::kernel::mi
