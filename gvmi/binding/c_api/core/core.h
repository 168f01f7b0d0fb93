#pragma once

// =============================================================================
// FILE: gvmi/binding/c_api/core/core.h
// BRIEF: C ABI for the gvmi mutual information library
// =============================================================================
//
// DESIGN PRINCIPLES:
//   - Stable C ABI for Python FFI and cross-language bindings
//   - Opaque handles for result tables
//   - Thread-local error reporting
//   - C++ exceptions never cross the boundary
//
// MEMORY MODEL:
//   - Input arrays are borrowed for the duration of a call
//   - Result handles are owned by the caller and released with
//     gvmi_*_destroy()
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define GVMI_C_API_VERSION_MAJOR 1
#define GVMI_C_API_VERSION_MINOR 0
#define GVMI_C_API_VERSION_PATCH 0

// =============================================================================
// Export Macro
// =============================================================================

#ifndef GVMI_EXPORT
    #if defined(_MSC_VER)
        #define GVMI_EXPORT __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define GVMI_EXPORT __attribute__((visibility("default")))
    #else
        #define GVMI_EXPORT
    #endif
#endif

// Runtime version string (e.g., "1.0.0")
const char* gvmi_get_version(void);

// Build configuration (e.g., "float64+int64+openmp")
const char* gvmi_get_build_config(void);

// =============================================================================
// Opaque Handle Types
// =============================================================================

typedef struct gvmi_mi_table gvmi_mi_table;

// NULL is never a valid handle
typedef gvmi_mi_table* gvmi_mi_table_t;

// =============================================================================
// Basic Value Types (Must Match C++ gvmi::Real and gvmi::Index)
// =============================================================================

#if defined(GVMI_USE_FLOAT32) || (defined(GVMI_PRECISION) && GVMI_PRECISION == 0)
typedef float gvmi_real_t;
#define GVMI_REAL_TYPE_NAME "float32"
#else
typedef double gvmi_real_t;
#define GVMI_REAL_TYPE_NAME "float64"
#endif

#if defined(GVMI_USE_INT32) || (defined(GVMI_INDEX_PRECISION) && GVMI_INDEX_PRECISION == 1)
typedef int32_t gvmi_index_t;
#define GVMI_INDEX_TYPE_NAME "int32"
#else
typedef int64_t gvmi_index_t;
#define GVMI_INDEX_TYPE_NAME "int64"
#endif

typedef size_t gvmi_size_t;

// Progress callback: (completed pairs, total pairs, user_data).
// Called from worker threads, one call at a time; must not block for long.
typedef void (*gvmi_progress_fn)(gvmi_size_t position, gvmi_size_t total, void* user_data);

// =============================================================================
// Error Handling
// =============================================================================

// Error codes (stable across versions, matches gvmi::ErrorCode)
typedef int32_t gvmi_error_t;

#define GVMI_OK 0

// General errors (1-9)
#define GVMI_ERROR_UNKNOWN 1
#define GVMI_ERROR_INTERNAL 2
#define GVMI_ERROR_OUT_OF_MEMORY 3
#define GVMI_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define GVMI_ERROR_INVALID_ARGUMENT 10
#define GVMI_ERROR_DIMENSION_MISMATCH 11
#define GVMI_ERROR_INDEX_OUT_OF_BOUNDS 14
#define GVMI_ERROR_EMPTY_INPUT 15
#define GVMI_ERROR_LABEL_NOT_FOUND 16

// Type errors (20-29)
#define GVMI_ERROR_TYPE_ERROR 20

// I/O errors (30-39)
#define GVMI_ERROR_IO_ERROR 30
#define GVMI_ERROR_FILE_NOT_FOUND 31
#define GVMI_ERROR_READ_ERROR 33
#define GVMI_ERROR_WRITE_ERROR 34

// Message for the last error on this thread; "No error" if none
const char* gvmi_get_last_error(void);

// Code of the last error on this thread; GVMI_OK if none
gvmi_error_t gvmi_get_last_error_code(void);

void gvmi_clear_error(void);

// =============================================================================
// Threading
// =============================================================================

// n == 0 selects the hardware concurrency
gvmi_error_t gvmi_set_num_threads(gvmi_size_t n);

gvmi_size_t gvmi_get_num_threads(void);

#ifdef __cplusplus
}
#endif
