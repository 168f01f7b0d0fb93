#pragma once

// =============================================================================
// FILE: gvmi/binding/c_api/mutual_info.h
// BRIEF: C API for quantile binning and pairwise mutual information
// =============================================================================

#include "gvmi/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Single Rows
// =============================================================================
//
// n_bins == 0 selects the default of 10 in every function below. Any other
// value outside 2 .. 1024 fails with GVMI_ERROR_INVALID_ARGUMENT.

// Quantile bin of every value against the row's own sorted copy
gvmi_error_t gvmi_mi_discretize(
    const gvmi_real_t* values,        // [n]
    gvmi_size_t n,
    gvmi_index_t n_bins,              // 2 .. 1024, or 0 for the default
    gvmi_index_t* out_bins            // Output [n]
);

// Plug-in mutual information in nats; 0 when n == 0
gvmi_error_t gvmi_mi_mutual_information(
    const gvmi_real_t* x,             // [n]
    const gvmi_real_t* y,             // [n]
    gvmi_size_t n,
    gvmi_index_t n_bins,              // 2 .. 1024, or 0 for the default
    gvmi_real_t* out
);

// =============================================================================
// Pairwise
// =============================================================================

// All-pairs mutual information over the rows of a row-major matrix.
// Errors: GVMI_ERROR_EMPTY_INPUT if rows or cols is 0 (checked first),
//         GVMI_ERROR_DIMENSION_MISMATCH if n_labels != rows.
gvmi_error_t gvmi_mi_compute_pairwise(
    const gvmi_real_t* data,          // [rows x stride], one gene per row
    gvmi_index_t rows,
    gvmi_index_t cols,
    gvmi_index_t stride,              // >= cols; 0 means cols
    const char* const* labels,        // [n_labels] NUL-terminated
    gvmi_size_t n_labels,
    gvmi_index_t n_bins,              // 0 selects the default (10)
    gvmi_progress_fn progress_fn,     // Optional
    void* user_data,
    gvmi_mi_table_t* out_table        // Output handle, destroy when done
);

// =============================================================================
// Result Table
// =============================================================================

// Releases *table and sets it to NULL; NULL or *table == NULL is a no-op
gvmi_error_t gvmi_mi_table_destroy(gvmi_mi_table_t* table);

gvmi_error_t gvmi_mi_table_size(gvmi_mi_table_t table, gvmi_size_t* out);

// *out stays valid until the table is destroyed
gvmi_error_t gvmi_mi_table_label(gvmi_mi_table_t table, gvmi_size_t i, const char** out);

// Score by label; GVMI_ERROR_LABEL_NOT_FOUND for unknown labels
gvmi_error_t gvmi_mi_table_get(
    gvmi_mi_table_t table,
    const char* label_a,
    const char* label_b,
    gvmi_real_t* out
);

gvmi_error_t gvmi_mi_table_get_index(
    gvmi_mi_table_t table,
    gvmi_size_t i,
    gvmi_size_t j,
    gvmi_real_t* out
);

// Copies the full n x n row-major matrix; capacity must be >= n * n
gvmi_error_t gvmi_mi_table_copy_dense(
    gvmi_mi_table_t table,
    gvmi_real_t* out,
    gvmi_size_t capacity
);

#ifdef __cplusplus
}
#endif
