#pragma once

#include "gvmi/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: gvmi/core/macros.hpp
// BRIEF: Compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define GVMI_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define GVMI_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define GVMI_LIKELY(x)   (x)
    #define GVMI_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Compiler Attributes
// =============================================================================

#if defined(__has_cpp_attribute)
    #if __has_cpp_attribute(nodiscard) >= 201603L
        #define GVMI_NODISCARD [[nodiscard]]
    #else
        #define GVMI_NODISCARD
    #endif
#else
    #define GVMI_NODISCARD
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define GVMI_HOT __attribute__((hot))
#else
    #define GVMI_HOT
#endif

// =============================================================================
// SECTION 3: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define GVMI_FORCE_INLINE __forceinline
    #define GVMI_RESTRICT __restrict
#else
    #define GVMI_FORCE_INLINE inline __attribute__((always_inline))
    #define GVMI_RESTRICT __restrict__
#endif

// Also defined by the C API header
#ifndef GVMI_EXPORT
    #if defined(_MSC_VER)
        #define GVMI_EXPORT __declspec(dllexport)
    #else
        #define GVMI_EXPORT __attribute__((visibility("default")))
    #endif
#endif

// =============================================================================
// SECTION 4: Memory Alignment
// =============================================================================

#define GVMI_ALIGNMENT 64  // 64-byte alignment for AVX-512
