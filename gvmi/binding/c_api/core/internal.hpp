#pragma once

// =============================================================================
// FILE: gvmi/binding/c_api/core/internal.hpp
// BRIEF: Internal C++ side of the C API binding layer
// =============================================================================
//
// WARNING: This header is INTERNAL to the C API binding layer
// NOT part of the public API - do not include from user code
// =============================================================================

#include "gvmi/binding/c_api/core/core.h"
#include "gvmi/core/error.hpp"
#include "gvmi/core/macros.hpp"
#include "gvmi/core/type.hpp"
#include "gvmi/kernel/mi_table.hpp"

#include <string_view>
#include <type_traits>
#include <utility>

static_assert(sizeof(gvmi_real_t) == sizeof(gvmi::Real),
              "gvmi_real_t does not match gvmi::Real; check GVMI_PRECISION");
static_assert(sizeof(gvmi_index_t) == sizeof(gvmi::Index),
              "gvmi_index_t does not match gvmi::Index; check GVMI_INDEX_PRECISION");

namespace gvmi::binding {

// =============================================================================
// Internal Table Wrapper
// =============================================================================

/// @brief Owns an MITable handed out through the C API
struct TableWrapper {
    kernel::mi::MITable table;

    TableWrapper() = default;

    explicit TableWrapper(kernel::mi::MITable&& t) noexcept
        : table(std::move(t)) {}

    TableWrapper(const TableWrapper&) = delete;
    TableWrapper& operator=(const TableWrapper&) = delete;
    TableWrapper(TableWrapper&&) noexcept = default;
    TableWrapper& operator=(TableWrapper&&) noexcept = default;
    ~TableWrapper() = default;
};

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

void set_last_error(gvmi_error_t code, const char* message) noexcept;
void set_last_error(gvmi_error_t code, std::string_view message) noexcept;
void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;
[[nodiscard]] auto get_last_error_code() noexcept -> gvmi_error_t;

// =============================================================================
// Exception Handling
// =============================================================================

// Convert the active exception to an error code.
// Must be called from within a catch block.
[[nodiscard]] auto handle_exception() noexcept -> gvmi_error_t;

// =============================================================================
// Convenience Macros for Error Handling
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define GVMI_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (GVMI_UNLIKELY((ptr) == nullptr)) { \
            gvmi::binding::set_last_error(GVMI_ERROR_NULL_POINTER, (msg)); \
            return GVMI_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define GVMI_C_API_CHECK(cond, code, msg) \
    do { \
        if (GVMI_UNLIKELY(!(cond))) { \
            gvmi::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define GVMI_C_API_TRY try {

#define GVMI_C_API_CATCH \
    } catch (...) { \
        return gvmi::binding::handle_exception(); \
    }

#define GVMI_C_API_RETURN_OK \
    do { \
        gvmi::binding::clear_last_error(); \
        return GVMI_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace gvmi::binding

// =============================================================================
// Opaque Handle Definitions
// =============================================================================

// Completes the forward declaration in core.h. Allocate as gvmi_mi_table,
// never as TableWrapper, so delete matches new.
struct gvmi_mi_table : gvmi::binding::TableWrapper {
    using TableWrapper::TableWrapper;

    ~gvmi_mi_table() = default;

    gvmi_mi_table(gvmi_mi_table&&) noexcept = default;
    gvmi_mi_table& operator=(gvmi_mi_table&&) noexcept = default;
    gvmi_mi_table(const gvmi_mi_table&) = delete;
    gvmi_mi_table& operator=(const gvmi_mi_table&) = delete;
};

static_assert(std::is_base_of_v<gvmi::binding::TableWrapper, gvmi_mi_table>,
              "gvmi_mi_table must inherit from TableWrapper");
static_assert(!std::is_copy_constructible_v<gvmi_mi_table>,
              "gvmi_mi_table must not be copyable");
