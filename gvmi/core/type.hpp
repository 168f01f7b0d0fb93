#pragma once

#include "gvmi/config.hpp"
#include "gvmi/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <cassert>
#include <vector>

// =============================================================================
// FILE: gvmi/core/type.hpp
// BRIEF: Scalar types and zero-overhead array views
// =============================================================================

namespace gvmi {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

#if defined(GVMI_USE_FLOAT32)
    using Real = float;
    constexpr const char* DTYPE_NAME = "float32";
#elif defined(GVMI_USE_FLOAT64)
    using Real = double;
    constexpr const char* DTYPE_NAME = "float64";
#else
    #error "GVMI: No precision macro defined."
#endif

#if defined(GVMI_USE_INT32)
    using Index = std::int32_t;
    constexpr const char* INDEX_DTYPE_NAME = "int32";
#elif defined(GVMI_USE_INT64)
    using Index = std::int64_t;
    constexpr const char* INDEX_DTYPE_NAME = "int64";
#else
    #error "GVMI: No index precision selected."
#endif

using Size = std::size_t;

// =============================================================================
// SECTION 2: Array View
// =============================================================================

// Non-owning {pointer, length} view. The pointee must outlive the view.
template <typename T>
struct Array {
    using value_type = T;
    using size_type = Size;
    using iterator = T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    // Conversion from non-const to const
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    GVMI_FORCE_INLINE constexpr auto operator[](Size i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i < len && "Array index out of bounds");
#endif
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] GVMI_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] GVMI_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] GVMI_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] GVMI_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] GVMI_FORCE_INLINE constexpr auto end() const noexcept -> T* {
        return ptr + len;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] GVMI_FORCE_INLINE constexpr auto subspan(Size offset, Size count) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(offset + count <= len && "Subspan exceeds array bounds");
#endif
        return Array<T>(ptr + offset, count);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);
static_assert(std::is_trivially_copyable_v<Array<const Real>>);
static_assert(std::is_standard_layout_v<Array<Real>>);

// View over a whole std::vector
template <typename T>
GVMI_FORCE_INLINE auto as_array(std::vector<T>& v) noexcept -> Array<T> {
    return Array<T>(v.data(), v.size());
}

template <typename T>
GVMI_FORCE_INLINE auto as_array(const std::vector<T>& v) noexcept -> Array<const T> {
    return Array<const T>(v.data(), v.size());
}

} // namespace gvmi
