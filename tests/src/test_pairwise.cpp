// =============================================================================
// GVMI - Pairwise Engine Tests
// =============================================================================
//
// Complete test coverage for gvmi/kernel/pairwise.hpp
//
// Functions tested (5 total):
//   ✓ pair_count
//   ✓ decode_pair
//   ✓ validate_input
//   ✓ compute_pairwise
//   ✓ threading::ThreadCountGuard
//
// =============================================================================

#include "test.hpp"

#include "gvmi/kernel/pairwise.hpp"
#include "gvmi/threading/scheduler.hpp"

#include <string>
#include <vector>

#if defined(GVMI_USE_OPENMP)
    #include <omp.h>
#endif

using namespace gvmi::test;
namespace mi = gvmi::kernel::mi;

using gvmi::DenseArray;
using gvmi::Index;
using gvmi::Real;
using gvmi::Size;

namespace {

/// Records every event in order
class RecordingSink : public gvmi::progress::ProgressSink {
public:
    void on_start(Size total, const std::string& message) override {
        started = true;
        start_total = total;
        start_message = message;
    }

    void on_advance(Size position, Size /*total*/) noexcept override {
        positions.push_back(position);
    }

    void on_finish(const std::string& message) override {
        finish_message = message;
    }

    bool started = false;
    Size start_total = 0;
    std::string start_message;
    std::string finish_message;
    std::vector<Size> positions;
};

/// Row-major genes x samples built from rows of equal length
struct Matrix {
    std::vector<Real> values;
    Index rows = 0;
    Index cols = 0;

    explicit Matrix(const std::vector<std::vector<Real>>& r) {
        rows = static_cast<Index>(r.size());
        cols = r.empty() ? 0 : static_cast<Index>(r[0].size());
        for (const auto& row : r) values.insert(values.end(), row.begin(), row.end());
    }

    [[nodiscard]] DenseArray<const Real> view() const {
        return DenseArray<const Real>(values.data(), rows, cols);
    }
};

mi::MITable run(const Matrix& m, const std::vector<std::string>& labels, Index n_bins = 10) {
    mi::PairwiseOptions opts;
    opts.n_bins = n_bins;
    return mi::compute_pairwise(m.view(), labels, opts);
}

} // namespace

GVMI_TEST_BEGIN

// =============================================================================
// Pair Enumeration
// =============================================================================

GVMI_TEST_SUITE(enumeration)

GVMI_TEST_CASE(pair_count_includes_self_pairs) {
    GVMI_ASSERT_EQ(mi::pair_count(0), Size(0));
    GVMI_ASSERT_EQ(mi::pair_count(1), Size(1));
    GVMI_ASSERT_EQ(mi::pair_count(2), Size(3));
    GVMI_ASSERT_EQ(mi::pair_count(1000), Size(500500));
}

GVMI_TEST_CASE(decode_pair_visits_upper_triangle_in_order) {
    for (Size n = 1; n <= 64; ++n) {
        Size k = 0;
        for (Size i = 0; i < n; ++i) {
            for (Size j = i; j < n; ++j, ++k) {
                auto [di, dj] = mi::decode_pair(k, n);
                GVMI_ASSERT_EQ(di, i);
                GVMI_ASSERT_EQ(dj, j);
            }
        }
        GVMI_ASSERT_EQ(k, mi::pair_count(n));
    }
}

GVMI_TEST_CASE(decode_pair_large_n_row_boundaries) {
    const Size n = 20000;
    for (Size i : {Size(0), Size(1), Size(7), Size(9999), Size(19998), Size(19999)}) {
        const Size first = i * (2 * n - i + 1) / 2;
        auto [a, b] = mi::decode_pair(first, n);
        GVMI_ASSERT_EQ(a, i);
        GVMI_ASSERT_EQ(b, i);

        auto [c, d] = mi::decode_pair(first + (n - i - 1), n);
        GVMI_ASSERT_EQ(c, i);
        GVMI_ASSERT_EQ(d, n - 1);
    }
}

GVMI_TEST_SUITE_END

// =============================================================================
// Validation
// =============================================================================

GVMI_TEST_SUITE(validation)

GVMI_TEST_CASE(no_rows_is_empty_input) {
    std::vector<Real> none;
    DenseArray<const Real> m(none.data(), 0, 5);
    GVMI_ASSERT_THROWS(mi::compute_pairwise(m, {}), gvmi::EmptyInputError);
}

GVMI_TEST_CASE(no_samples_is_empty_input) {
    std::vector<Real> none;
    DenseArray<const Real> m(none.data(), 3, 0);
    GVMI_ASSERT_THROWS(mi::compute_pairwise(m, gene_names(3)), gvmi::EmptyInputError);
}

GVMI_TEST_CASE(empty_checked_before_label_count) {
    std::vector<Real> none;
    DenseArray<const Real> m(none.data(), 0, 0);
    GVMI_ASSERT_THROWS(mi::compute_pairwise(m, gene_names(4)), gvmi::EmptyInputError);
}

GVMI_TEST_CASE(label_count_mismatch_reports_both_counts) {
    Matrix m({ramp(6), ramp(6), ramp(6)});
    try {
        (void)run(m, gene_names(2));
        GVMI_FAIL("expected DimensionMismatchError");
    } catch (const gvmi::DimensionMismatchError& e) {
        GVMI_ASSERT_EQ(e.matrix_rows(), Size(3));
        GVMI_ASSERT_EQ(e.label_count(), Size(2));
        GVMI_ASSERT_STR_CONTAINS(e.what(), "3 rows");
        GVMI_ASSERT_STR_CONTAINS(e.what(), "2 genes");
    }
}

GVMI_TEST_CASE(too_many_labels) {
    Matrix m({ramp(6), ramp(6)});
    GVMI_ASSERT_THROWS(run(m, gene_names(3)), gvmi::DimensionMismatchError);
}

GVMI_TEST_CASE(invalid_bins) {
    Matrix m({ramp(6), ramp(6)});
    GVMI_ASSERT_THROWS(run(m, gene_names(2), 1), gvmi::ValueError);
}

GVMI_TEST_CASE(stride_shorter_than_row) {
    std::vector<Real> data(12, 1.0);
    DenseArray<const Real> m(data.data(), 2, 6, 4);
    GVMI_ASSERT_THROWS(mi::compute_pairwise(m, gene_names(2)), gvmi::ValueError);
}

GVMI_TEST_SUITE_END

// =============================================================================
// Results
// =============================================================================

GVMI_TEST_SUITE(results)

GVMI_TEST_CASE(identical_rows) {
    Matrix m({ramp(20), ramp(20)});
    auto table = run(m, {"g1", "g2"});

    GVMI_ASSERT_EQ(table.at("g1", "g2"), table.at("g2", "g1"));
    GVMI_ASSERT_EQ(table.at("g1", "g2"), table.at("g1", "g1"));
    GVMI_ASSERT_EQ(table.at("g2", "g2"), table.at("g1", "g1"));
    GVMI_ASSERT_GT(table.at("g1", "g1"), Real(0));
}

GVMI_TEST_CASE(reversed_copy) {
    auto x = ramp(20);
    Matrix m({x, reversed(x)});
    auto table = run(m, {"g1", "g2"});

    GVMI_ASSERT_GE(table.at("g1", "g2"), Real(0));
    GVMI_ASSERT_LT(table.at("g1", "g2"), table.at("g1", "g1"));
}

GVMI_TEST_CASE(independent_permutation) {
    Random rng(47);
    auto x = ramp(20);
    Matrix m({x, shuffled(rng, x)});
    auto table = run(m, {"g1", "g2"});

    GVMI_ASSERT_EQ(table.at("g1", "g2"), table.at("g2", "g1"));
    GVMI_ASSERT_GE(table.at("g1", "g2"), Real(0));
    GVMI_ASSERT_LT(table.at("g1", "g2"), table.at("g1", "g1"));
}

GVMI_TEST_CASE(constant_row) {
    Random rng(53);
    Matrix m({constant(40), sparse_counts(rng, 40), sparse_counts(rng, 40)});
    auto table = run(m, {"flat", "a", "b"});

    for (const char* other : {"flat", "a", "b"}) {
        GVMI_ASSERT_EQ(table.at("flat", other), Real(0));
        GVMI_ASSERT_EQ(table.at(other, "flat"), Real(0));
    }
}

GVMI_TEST_CASE(every_entry_present_and_symmetric) {
    Random rng(59);
    auto expr = random_expression(rng, 12, 80);
    auto names = gene_names(12);
    auto table = mi::compute_pairwise(DenseArray<const Real>(expr.data(), 12, 80), names);

    GVMI_ASSERT_EQ(table.size(), Size(12));
    auto nested = table.to_nested_map();
    GVMI_ASSERT_EQ(nested.size(), Size(12));
    for (const auto& a : names) {
        GVMI_ASSERT_EQ(nested.at(a).size(), Size(12));
        GVMI_ASSERT_TRUE(nested.at(a).count(a) == 1);
        for (const auto& b : names) {
            GVMI_ASSERT_EQ(nested.at(a).at(b), nested.at(b).at(a));
            GVMI_ASSERT_GE(table.at(a, b), Real(-1e-9));
        }
    }
}

GVMI_TEST_CASE(matches_oracle) {
    Random rng(61);
    auto expr = random_expression(rng, 7, 113);
    for (Eigen::Index j = 0; j < expr.cols(); ++j) {
        expr(3, j) = expr(1, j) * 2.0 + 0.1 * expr(3, j);
    }

    auto table = mi::compute_pairwise(DenseArray<const Real>(expr.data(), 7, 113), gene_names(7));
    auto expected = oracle::pairwise(expr, 10);

    EigenDense actual(7, 7);
    for (Size i = 0; i < 7; ++i) {
        for (Size j = 0; j < 7; ++j) {
            actual(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = table.at(i, j);
        }
    }
    GVMI_ASSERT_TRUE(matrices_near(actual, expected, 1e-10));
    GVMI_ASSERT_GT(table.at(1, 3), table.at(1, 2));
}

GVMI_TEST_CASE(deterministic_across_runs_and_threads) {
    Random rng(67);
    auto expr = random_expression(rng, 15, 64);
    DenseArray<const Real> view(expr.data(), 15, 64);
    auto names = gene_names(15);

    const Size saved = gvmi::threading::Scheduler::get_num_threads();

    mi::PairwiseOptions one;
    one.n_threads = 1;
    auto serial = mi::compute_pairwise(view, names, one);

    mi::PairwiseOptions many;
    many.n_threads = 4;
    auto parallel_a = mi::compute_pairwise(view, names, many);
    auto parallel_b = mi::compute_pairwise(view, names, many);

    // n_threads only applies for the duration of each call
    GVMI_ASSERT_EQ(gvmi::threading::Scheduler::get_num_threads(), saved);

    auto s = serial.data();
    auto a = parallel_a.data();
    auto b = parallel_b.data();
    for (Size k = 0; k < s.size(); ++k) {
        GVMI_ASSERT_EQ(a[k], b[k]);
        GVMI_ASSERT_EQ(a[k], s[k]);
    }
}

GVMI_TEST_CASE(thread_count_guard_restores) {
    using gvmi::threading::Scheduler;
    using gvmi::threading::ThreadCountGuard;
    const Size saved = Scheduler::get_num_threads();

    {
        ThreadCountGuard keep(0);
        GVMI_ASSERT_EQ(Scheduler::get_num_threads(), saved);
    }
    {
        ThreadCountGuard two(2);
        GVMI_ASSERT_GE(Scheduler::get_num_threads(), Size(1));
        GVMI_ASSERT_LE(Scheduler::get_num_threads(), Size(2));
    }
    GVMI_ASSERT_EQ(Scheduler::get_num_threads(), saved);
}

#if defined(GVMI_USE_OPENMP)
GVMI_TEST_CASE(called_from_wider_parallel_region) {
    Random rng(83);
    auto expr = random_expression(rng, 6, 30);
    DenseArray<const Real> view(expr.data(), 6, 30);
    auto names = gene_names(6);
    auto expected = mi::compute_pairwise(view, names);

    // Outer team larger than the configured worker count
    const int saved = omp_get_max_threads();
    omp_set_num_threads(2);
    std::vector<int> status(8, 1);
    #pragma omp parallel num_threads(8)
    {
        const auto t = static_cast<Size>(omp_get_thread_num());
        try {
            auto table = mi::compute_pairwise(view, names);
            for (Size k = 0; k < table.data().size(); ++k) {
                if (table.data()[k] != expected.data()[k]) status[t] = 0;
            }
        } catch (const gvmi::Exception&) {
            status[t] = -1;
        }
    }
    omp_set_num_threads(saved);

    for (int s : status) {
        GVMI_ASSERT_EQ(s, 1);
    }
}
#endif

GVMI_TEST_CASE(honours_row_stride) {
    Random rng(71);
    auto expr = random_expression(rng, 4, 30);

    std::vector<Real> padded(4 * 33, 1e6);
    for (Eigen::Index i = 0; i < 4; ++i) {
        for (Eigen::Index j = 0; j < 30; ++j) {
            padded[static_cast<Size>(i * 33 + j)] = expr(i, j);
        }
    }

    auto compact = mi::compute_pairwise(DenseArray<const Real>(expr.data(), 4, 30), gene_names(4));
    auto strided = mi::compute_pairwise(DenseArray<const Real>(padded.data(), 4, 30, 33), gene_names(4));

    for (Size k = 0; k < 16; ++k) {
        GVMI_ASSERT_EQ(compact.data()[k], strided.data()[k]);
    }
}

GVMI_TEST_CASE(single_gene) {
    Matrix m({ramp(10)});
    auto table = run(m, {"only"});
    GVMI_ASSERT_EQ(table.size(), Size(1));
    GVMI_ASSERT_GT(table.at("only", "only"), Real(0));
}

GVMI_TEST_CASE(duplicate_labels_resolve_to_last_row) {
    auto x = ramp(20);
    Random rng(73);
    Matrix m({x, sparse_counts(rng, 20), reversed(x)});
    auto table = run(m, {"a", "b", "a"});

    GVMI_ASSERT_TRUE(table.has_duplicate_labels());
    GVMI_ASSERT_EQ(table.size(), Size(3));
    GVMI_ASSERT_EQ(table.index_of("a"), Size(2));
    GVMI_ASSERT_EQ(table.at("a", "b"), table.at(2, 1));
    GVMI_ASSERT_EQ(table.at("a", "a"), table.at(2, 2));
}

GVMI_TEST_SUITE_END

// =============================================================================
// Progress
// =============================================================================

GVMI_TEST_SUITE(progress)

GVMI_TEST_CASE(messages_and_final_position) {
    Random rng(79);
    auto expr = random_expression(rng, 30, 40);
    RecordingSink sink;

    auto table = mi::compute_pairwise(DenseArray<const Real>(expr.data(), 30, 40),
                                      gene_names(30), {}, &sink);

    const Size total = mi::pair_count(30);
    GVMI_ASSERT_TRUE(sink.started);
    GVMI_ASSERT_EQ(sink.start_total, total);
    GVMI_ASSERT_STR_EQ(sink.start_message, "Computing mutual information...");
    GVMI_ASSERT_STR_EQ(sink.finish_message, "Mutual information computation completed!");

    GVMI_ASSERT_FALSE(sink.positions.empty());
    GVMI_ASSERT_EQ(sink.positions.back(), total);
    for (Size k = 1; k < sink.positions.size(); ++k) {
        GVMI_ASSERT_GT(sink.positions[k], sink.positions[k - 1]);
    }
    GVMI_ASSERT_EQ(table.size(), Size(30));
}

GVMI_TEST_CASE(no_events_on_validation_failure) {
    Matrix m({ramp(6), ramp(6)});
    RecordingSink sink;
    GVMI_ASSERT_THROWS(mi::compute_pairwise(m.view(), gene_names(3), {}, &sink),
                       gvmi::DimensionMismatchError);
    GVMI_ASSERT_FALSE(sink.started);
    GVMI_ASSERT_TRUE(sink.positions.empty());
}

GVMI_TEST_SUITE_END

GVMI_TEST_END

GVMI_TEST_MAIN()
