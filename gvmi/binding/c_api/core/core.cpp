// =============================================================================
// FILE: gvmi/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-local error handling
// =============================================================================

#include "gvmi/binding/c_api/core/core.h"
#include "gvmi/binding/c_api/core/internal.hpp"
#include "gvmi/core/error.hpp"
#include "gvmi/threading/scheduler.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>

namespace gvmi::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local gvmi_error_t g_last_error_code = GVMI_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

void set_last_error(gvmi_error_t code, const char* message) noexcept {
    g_last_error_code = code;

    if (GVMI_LIKELY(message != nullptr)) {
        std::strncpy(g_last_error_message.data(), message,
                     ERROR_MESSAGE_BUFFER_SIZE - 1);
        g_last_error_message[ERROR_MESSAGE_BUFFER_SIZE - 1] = '\0';
    } else {
        g_last_error_message[0] = '\0';
    }
}

void set_last_error(gvmi_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = GVMI_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (GVMI_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> gvmi_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

// Most specific types first; each library exception maps to its own code
[[nodiscard]] auto handle_exception() noexcept -> gvmi_error_t {
    try {
        throw;
    }
    catch (const EmptyInputError& e) {
        set_last_error(GVMI_ERROR_EMPTY_INPUT, e.what());
        return GVMI_ERROR_EMPTY_INPUT;
    }
    catch (const LabelNotFoundError& e) {
        set_last_error(GVMI_ERROR_LABEL_NOT_FOUND, e.what());
        return GVMI_ERROR_LABEL_NOT_FOUND;
    }
    catch (const IndexOutOfBoundsError& e) {
        set_last_error(GVMI_ERROR_INDEX_OUT_OF_BOUNDS, e.what());
        return GVMI_ERROR_INDEX_OUT_OF_BOUNDS;
    }
    catch (const DimensionError& e) {
        set_last_error(GVMI_ERROR_DIMENSION_MISMATCH, e.what());
        return GVMI_ERROR_DIMENSION_MISMATCH;
    }
    catch (const ValueError& e) {
        set_last_error(GVMI_ERROR_INVALID_ARGUMENT, e.what());
        return GVMI_ERROR_INVALID_ARGUMENT;
    }
    catch (const TypeError& e) {
        set_last_error(GVMI_ERROR_TYPE_ERROR, e.what());
        return GVMI_ERROR_TYPE_ERROR;
    }
    catch (const NullPointerError& e) {
        set_last_error(GVMI_ERROR_NULL_POINTER, e.what());
        return GVMI_ERROR_NULL_POINTER;
    }
    catch (const OutOfMemoryError& e) {
        set_last_error(GVMI_ERROR_OUT_OF_MEMORY, e.what());
        return GVMI_ERROR_OUT_OF_MEMORY;
    }
    catch (const FileNotFoundError& e) {
        set_last_error(GVMI_ERROR_FILE_NOT_FOUND, e.what());
        return GVMI_ERROR_FILE_NOT_FOUND;
    }
    catch (const ReadError& e) {
        set_last_error(GVMI_ERROR_READ_ERROR, e.what());
        return GVMI_ERROR_READ_ERROR;
    }
    catch (const WriteError& e) {
        set_last_error(GVMI_ERROR_WRITE_ERROR, e.what());
        return GVMI_ERROR_WRITE_ERROR;
    }
    catch (const IOError& e) {
        set_last_error(GVMI_ERROR_IO_ERROR, e.what());
        return GVMI_ERROR_IO_ERROR;
    }
    catch (const InternalError& e) {
        set_last_error(GVMI_ERROR_INTERNAL, e.what());
        return GVMI_ERROR_INTERNAL;
    }
    catch (const Exception& e) {
        set_last_error(GVMI_ERROR_UNKNOWN, e.what());
        return GVMI_ERROR_UNKNOWN;
    }
    catch (const std::bad_alloc&) {
        set_last_error(GVMI_ERROR_OUT_OF_MEMORY,
                       "Memory allocation failed (std::bad_alloc)");
        return GVMI_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::length_error& e) {
        set_last_error(GVMI_ERROR_INVALID_ARGUMENT, e.what());
        return GVMI_ERROR_INVALID_ARGUMENT;
    }
    catch (const std::exception& e) {
        set_last_error(GVMI_ERROR_UNKNOWN, e.what());
        return GVMI_ERROR_UNKNOWN;
    }
    catch (...) {
        set_last_error(GVMI_ERROR_UNKNOWN,
                       "Unknown exception (not derived from std::exception)");
        return GVMI_ERROR_UNKNOWN;
    }
}

} // namespace gvmi::binding

// =============================================================================
// C API Implementation
// =============================================================================

extern "C" {

// =============================================================================
// Version Information
// =============================================================================

GVMI_EXPORT const char* gvmi_get_version(void) {
    return "1.0.0";
}

GVMI_EXPORT const char* gvmi_get_build_config(void) {
    static const char* config_str =
        GVMI_REAL_TYPE_NAME "+" GVMI_INDEX_TYPE_NAME
#if defined(GVMI_USE_OPENMP)
        "+openmp"
#elif defined(GVMI_USE_TBB)
        "+tbb"
#elif defined(GVMI_USE_BS)
        "+bs"
#else
        "+serial"
#endif
        ;
    return config_str;
}

// =============================================================================
// Error Handling
// =============================================================================

GVMI_EXPORT const char* gvmi_get_last_error(void) {
    return gvmi::binding::get_last_error_message();
}

GVMI_EXPORT gvmi_error_t gvmi_get_last_error_code(void) {
    return gvmi::binding::get_last_error_code();
}

GVMI_EXPORT void gvmi_clear_error(void) {
    gvmi::binding::clear_last_error();
}

// =============================================================================
// Threading
// =============================================================================

GVMI_EXPORT gvmi_error_t gvmi_set_num_threads(gvmi_size_t n) {
    GVMI_C_API_TRY
        gvmi::threading::Scheduler::set_num_threads(n);
        GVMI_C_API_RETURN_OK;
    GVMI_C_API_CATCH
}

GVMI_EXPORT gvmi_size_t gvmi_get_num_threads(void) {
    return gvmi::threading::Scheduler::get_num_threads();
}

} // extern "C"
