#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/error.hpp"

// =============================================================================
/// @file dense.hpp
/// @brief Dense row-major matrix view
///
/// Expression matrices are stored genes x samples, one gene per row.
/// DenseArray never owns its memory; the caller keeps the buffer alive
/// for as long as the view is in use.
// =============================================================================

namespace gvmi {

/// @brief Dense row-major matrix with an explicit row stride.
///
/// Memory Layout: row r starts at ptr + r * stride, stride >= cols.
///
/// Example:
///
/// std::vector<double> data(20);
/// DenseArray<const double> mat(data.data(), 2, 10);
/// auto first_gene = mat.row(0);
template <typename T>
struct DenseArray {
    using ValueType = T;

    T* ptr;
    Index rows;
    Index cols;
    Index stride;

    constexpr DenseArray() noexcept : ptr(nullptr), rows(0), cols(0), stride(0) {}

    constexpr DenseArray(T* p, Index r, Index c) noexcept
        : ptr(p), rows(r), cols(c), stride(c) {}

    constexpr DenseArray(T* p, Index r, Index c, Index s) noexcept
        : ptr(p), rows(r), cols(c), stride(s) {}

    /// @brief Conversion to a read-only view.
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr DenseArray(const DenseArray<U>& other) noexcept
        : ptr(other.ptr), rows(other.rows), cols(other.cols), stride(other.stride) {}

    /// @brief Element access.
    GVMI_NODISCARD GVMI_FORCE_INLINE T& operator()(Index r, Index c) const {
#if !defined(NDEBUG)
        GVMI_ASSERT(r >= 0 && r < rows, "DenseArray: Row out of bounds");
        GVMI_ASSERT(c >= 0 && c < cols, "DenseArray: Col out of bounds");
#endif
        return ptr[r * stride + c];
    }

    /// @brief Get entire row as a view.
    GVMI_NODISCARD GVMI_FORCE_INLINE Array<T> row(Index r) const {
#if !defined(NDEBUG)
        GVMI_ASSERT(r >= 0 && r < rows, "DenseArray: Row out of bounds");
#endif
        return Array<T>(ptr + (r * stride), static_cast<Size>(cols));
    }

    GVMI_NODISCARD constexpr bool empty() const noexcept {
        return rows <= 0 || cols <= 0;
    }

    GVMI_NODISCARD constexpr Size size() const noexcept {
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }
};

} // namespace gvmi
