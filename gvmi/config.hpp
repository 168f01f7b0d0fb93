#pragma once

#include <cstdint>

// =============================================================================
// FILE: gvmi/config.hpp
// BRIEF: GVMI Configuration Header
// =============================================================================

// =============================================================================
// HWY Scalar-Only Control
// =============================================================================

#ifdef GVMI_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define GVMI_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define GVMI_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define GVMI_OS_LINUX
#else
    #define GVMI_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

#if !defined(GVMI_BACKEND_SERIAL) && !defined(GVMI_BACKEND_TBB) && \
    !defined(GVMI_BACKEND_OPENMP) && !defined(GVMI_BACKEND_BS)
    #if defined(GVMI_OS_MAC)
        // macOS: BS::thread_pool unless GVMI_MAC_USE_OPENMP is set
        #if defined(GVMI_MAC_USE_OPENMP)
            #define GVMI_BACKEND_OPENMP
        #else
            #define GVMI_BACKEND_BS
        #endif
    #elif defined(GVMI_OS_WINDOWS) || defined(GVMI_OS_LINUX)
        #define GVMI_BACKEND_OPENMP
    #else
        #define GVMI_BACKEND_BS
    #endif
#endif

#if (defined(GVMI_BACKEND_SERIAL) && (defined(GVMI_BACKEND_TBB) || defined(GVMI_BACKEND_OPENMP) || defined(GVMI_BACKEND_BS))) || \
    (defined(GVMI_BACKEND_TBB) && (defined(GVMI_BACKEND_OPENMP) || defined(GVMI_BACKEND_BS))) || \
    (defined(GVMI_BACKEND_OPENMP) && defined(GVMI_BACKEND_BS))
    #error "GVMI Configuration Error: Multiple threading backends defined! " \
           "Please define only one backend."
#endif

#if defined(GVMI_OS_MAC) && defined(GVMI_BACKEND_OPENMP)
    #pragma GCC warning "GVMI_WARNING: OpenMP enabled on macOS. " \
                        "Ensure 'libomp' is installed and linker flags are correct."
#endif

// =============================================================================
// Feature Flags (Public API)
// =============================================================================

#if defined(GVMI_BACKEND_OPENMP)
    #define GVMI_USE_OPENMP 1
#elif defined(GVMI_BACKEND_TBB)
    #define GVMI_USE_TBB 1
#elif defined(GVMI_BACKEND_BS)
    #define GVMI_USE_BS 1
#elif defined(GVMI_BACKEND_SERIAL)
    #define GVMI_USE_SERIAL 1
#endif

// =============================================================================
// Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default)
#ifndef GVMI_PRECISION
    #define GVMI_PRECISION 1
#endif

#if GVMI_PRECISION == 0
    #define GVMI_USE_FLOAT32
#elif GVMI_PRECISION == 1
    #define GVMI_USE_FLOAT64
#else
    #error "GVMI Configuration Error: Invalid GVMI_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Index Precision Control
// =============================================================================

// 1: int32 - Max 2B elements
// 2: int64 - NumPy-compatible (default)
#ifndef GVMI_INDEX_PRECISION
    #define GVMI_INDEX_PRECISION 2
#endif

#if GVMI_INDEX_PRECISION == 1
    #define GVMI_USE_INT32
#elif GVMI_INDEX_PRECISION == 2
    #define GVMI_USE_INT64
#else
    #error "GVMI Configuration Error: Invalid GVMI_INDEX_PRECISION value. " \
           "Must be 1 (int32) or 2 (int64)."
#endif

// =============================================================================
// Memory Configuration
// =============================================================================

#include <cstddef>

namespace gvmi::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;  // AVX-512 width
}
