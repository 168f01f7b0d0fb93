#pragma once

// =============================================================================
// GVMI - Test Data Generators
// =============================================================================
//
// Random and structured expression data.
//
// Features:
//   - Random expression matrices (genes x samples, row-major)
//   - Special patterns (ramps, constant rows, reversed copies)
//   - Reproducible with seed control
//
// =============================================================================

#include "oracle.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace gvmi::test {

// =============================================================================
// Random Number Generator
// =============================================================================

class Random {
public:
    explicit Random(uint64_t seed = 42) : rng_(seed) {}

    /// Uniform random double in [min, max]
    [[nodiscard]] double uniform(double min = 0.0, double max = 1.0) {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(rng_);
    }

    /// Uniform random integer in [min, max]
    [[nodiscard]] int64_t uniform_int(int64_t min, int64_t max) {
        std::uniform_int_distribution<int64_t> dist(min, max);
        return dist(rng_);
    }

    /// Standard normal (mean=0, stddev=1)
    [[nodiscard]] double normal(double mean = 0.0, double stddev = 1.0) {
        std::normal_distribution<double> dist(mean, stddev);
        return dist(rng_);
    }

    [[nodiscard]] std::mt19937_64& engine() { return rng_; }

private:
    std::mt19937_64 rng_;
};

// =============================================================================
// Rows
// =============================================================================

/// 1, 2, ..., n
inline std::vector<double> ramp(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<double>(i + 1);
    return v;
}

inline std::vector<double> constant(std::size_t n, double value = 3.5) {
    return std::vector<double>(n, value);
}

inline std::vector<double> reversed(std::vector<double> v) {
    std::reverse(v.begin(), v.end());
    return v;
}

/// Uniform random permutation of v
inline std::vector<double> shuffled(Random& rng, std::vector<double> v) {
    std::shuffle(v.begin(), v.end(), rng.engine());
    return v;
}

/// Count-like values: mostly zeros with a Poisson tail, as in scRNA-seq
inline std::vector<double> sparse_counts(Random& rng, std::size_t n, double zero_frac = 0.6) {
    std::poisson_distribution<int> pois(4.0);
    std::vector<double> v(n);
    for (auto& x : v) {
        x = rng.uniform() < zero_frac ? 0.0 : static_cast<double>(pois(rng.engine()));
    }
    return v;
}

// =============================================================================
// Matrices
// =============================================================================

/// Row-major genes x samples with N(0, 1) entries
inline EigenDense random_expression(Random& rng, Eigen::Index genes, Eigen::Index samples) {
    EigenDense m(genes, samples);
    for (Eigen::Index i = 0; i < genes; ++i) {
        for (Eigen::Index j = 0; j < samples; ++j) {
            m(i, j) = rng.normal();
        }
    }
    return m;
}

/// Row i of `m` as a vector
inline std::vector<double> row_of(const EigenDense& m, Eigen::Index i) {
    return std::vector<double>(m.row(i).data(), m.row(i).data() + m.cols());
}

/// "g0", "g1", ...
inline std::vector<std::string> gene_names(std::size_t n, const char* prefix = "g") {
    std::vector<std::string> names;
    names.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        names.push_back(prefix + std::to_string(i));
    }
    return names;
}

} // namespace gvmi::test
