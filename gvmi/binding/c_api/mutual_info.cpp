// =============================================================================
// FILE: gvmi/binding/c_api/mutual_info.cpp
// BRIEF: C API implementation for quantile binning and pairwise MI
// =============================================================================

#include "gvmi/binding/c_api/mutual_info.h"
#include "gvmi/binding/c_api/core/internal.hpp"
#include "gvmi/kernel/discretize.hpp"
#include "gvmi/kernel/mutual_info.hpp"
#include "gvmi/kernel/pairwise.hpp"
#include "gvmi/core/progress.hpp"
#include "gvmi/core/type.hpp"
#include "gvmi/core/error.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace gvmi;
using namespace gvmi::binding;

namespace {

// 0 selects the kernel default; anything else is validated by the kernel
inline Index resolve_n_bins(gvmi_index_t n_bins) {
    return n_bins == 0 ? kernel::mi::config::DEFAULT_N_BINS : static_cast<Index>(n_bins);
}

} // namespace

extern "C" {

// =============================================================================
// Single Rows
// =============================================================================

GVMI_EXPORT gvmi_error_t gvmi_mi_discretize(
    const gvmi_real_t* values,
    const gvmi_size_t n,
    const gvmi_index_t n_bins,
    gvmi_index_t* out_bins) {

    GVMI_C_API_CHECK(n == 0 || values != nullptr, GVMI_ERROR_NULL_POINTER,
                     "Values array is null");
    GVMI_C_API_CHECK(n == 0 || out_bins != nullptr, GVMI_ERROR_NULL_POINTER,
                     "Output bins array is null");

    GVMI_C_API_TRY
        const Index bins = resolve_n_bins(n_bins);
        kernel::mi::check_n_bins(bins);

        Array<const Real> row(reinterpret_cast<const Real*>(values), n);
        Array<Index> binned(reinterpret_cast<Index*>(out_bins), n);
        std::vector<Real> sort_buf(n);

        kernel::mi::discretize_row(row, bins, as_array(sort_buf), binned);

        GVMI_C_API_RETURN_OK;
    GVMI_C_API_CATCH
}

GVMI_EXPORT gvmi_error_t gvmi_mi_mutual_information(
    const gvmi_real_t* x,
    const gvmi_real_t* y,
    const gvmi_size_t n,
    const gvmi_index_t n_bins,
    gvmi_real_t* out) {

    GVMI_C_API_CHECK(n == 0 || x != nullptr, GVMI_ERROR_NULL_POINTER, "X array is null");
    GVMI_C_API_CHECK(n == 0 || y != nullptr, GVMI_ERROR_NULL_POINTER, "Y array is null");
    GVMI_C_API_CHECK_NULL(out, "Output pointer is null");

    GVMI_C_API_TRY
        Array<const Real> xs(reinterpret_cast<const Real*>(x), n);
        Array<const Real> ys(reinterpret_cast<const Real*>(y), n);

        *out = static_cast<gvmi_real_t>(kernel::mi::mutual_information(xs, ys, resolve_n_bins(n_bins)));

        GVMI_C_API_RETURN_OK;
    GVMI_C_API_CATCH
}

// =============================================================================
// Pairwise
// =============================================================================

GVMI_EXPORT gvmi_error_t gvmi_mi_compute_pairwise(
    const gvmi_real_t* data,
    const gvmi_index_t rows,
    const gvmi_index_t cols,
    const gvmi_index_t stride,
    const char* const* labels,
    const gvmi_size_t n_labels,
    const gvmi_index_t n_bins,
    gvmi_progress_fn progress_fn,
    void* user_data,
    gvmi_mi_table_t* out_table) {

    GVMI_C_API_CHECK_NULL(out_table, "Output table pointer is null");
    GVMI_C_API_CHECK(rows >= 0 && cols >= 0, GVMI_ERROR_INVALID_ARGUMENT,
                     "Dimensions must be non-negative");
    GVMI_C_API_CHECK(rows == 0 || cols == 0 || data != nullptr, GVMI_ERROR_NULL_POINTER,
                     "Data array is null");
    GVMI_C_API_CHECK(n_labels == 0 || labels != nullptr, GVMI_ERROR_NULL_POINTER,
                     "Labels array is null");

    GVMI_C_API_TRY
        std::vector<std::string> names;
        names.reserve(n_labels);
        for (gvmi_size_t i = 0; i < n_labels; ++i) {
            GVMI_CHECK_NULL(labels[i], "Label " + std::to_string(i) + " is null");
            names.emplace_back(labels[i]);
        }

        DenseArray<const Real> matrix(reinterpret_cast<const Real*>(data),
                                      rows, cols, stride > 0 ? stride : cols);

        kernel::mi::PairwiseOptions options;
        options.n_bins = resolve_n_bins(n_bins);

        std::unique_ptr<progress::CallbackProgressSink> sink;
        if (progress_fn != nullptr) {
            sink = std::make_unique<progress::CallbackProgressSink>(progress_fn, user_data);
        }

        kernel::mi::MITable table = kernel::mi::compute_pairwise(
            matrix, names, options, sink.get());

        *out_table = new gvmi_mi_table(std::move(table));

        GVMI_C_API_RETURN_OK;
    GVMI_C_API_CATCH
}

// =============================================================================
// Result Table
// =============================================================================

GVMI_EXPORT gvmi_error_t gvmi_mi_table_destroy(gvmi_mi_table_t* table) {
    if (table == nullptr || *table == nullptr) {
        GVMI_C_API_RETURN_OK;
    }
    delete *table;
    *table = nullptr;
    GVMI_C_API_RETURN_OK;
}

GVMI_EXPORT gvmi_error_t gvmi_mi_table_size(gvmi_mi_table_t table, gvmi_size_t* out) {
    GVMI_C_API_CHECK_NULL(table, "Table handle is null");
    GVMI_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = table->table.size();
    GVMI_C_API_RETURN_OK;
}

GVMI_EXPORT gvmi_error_t gvmi_mi_table_label(
    gvmi_mi_table_t table,
    const gvmi_size_t i,
    const char** out) {

    GVMI_C_API_CHECK_NULL(table, "Table handle is null");
    GVMI_C_API_CHECK_NULL(out, "Output pointer is null");

    GVMI_C_API_TRY
        *out = table->table.label(i).c_str();
        GVMI_C_API_RETURN_OK;
    GVMI_C_API_CATCH
}

GVMI_EXPORT gvmi_error_t gvmi_mi_table_get(
    gvmi_mi_table_t table,
    const char* label_a,
    const char* label_b,
    gvmi_real_t* out) {

    GVMI_C_API_CHECK_NULL(table, "Table handle is null");
    GVMI_C_API_CHECK_NULL(label_a, "First label is null");
    GVMI_C_API_CHECK_NULL(label_b, "Second label is null");
    GVMI_C_API_CHECK_NULL(out, "Output pointer is null");

    GVMI_C_API_TRY
        *out = static_cast<gvmi_real_t>(table->table.at(std::string(label_a),
                                                        std::string(label_b)));
        GVMI_C_API_RETURN_OK;
    GVMI_C_API_CATCH
}

GVMI_EXPORT gvmi_error_t gvmi_mi_table_get_index(
    gvmi_mi_table_t table,
    const gvmi_size_t i,
    const gvmi_size_t j,
    gvmi_real_t* out) {

    GVMI_C_API_CHECK_NULL(table, "Table handle is null");
    GVMI_C_API_CHECK_NULL(out, "Output pointer is null");

    GVMI_C_API_TRY
        *out = static_cast<gvmi_real_t>(table->table.at(i, j));
        GVMI_C_API_RETURN_OK;
    GVMI_C_API_CATCH
}

GVMI_EXPORT gvmi_error_t gvmi_mi_table_copy_dense(
    gvmi_mi_table_t table,
    gvmi_real_t* out,
    const gvmi_size_t capacity) {

    GVMI_C_API_CHECK_NULL(table, "Table handle is null");

    const Size n = table->table.size();
    GVMI_C_API_CHECK(capacity >= n * n, GVMI_ERROR_DIMENSION_MISMATCH,
                     "Output buffer smaller than n * n");
    GVMI_C_API_CHECK(n == 0 || out != nullptr, GVMI_ERROR_NULL_POINTER,
                     "Output array is null");

    Array<const Real> values = table->table.data();
    std::copy(values.begin(), values.end(), reinterpret_cast<Real*>(out));
    GVMI_C_API_RETURN_OK;
}

} // extern "C"
