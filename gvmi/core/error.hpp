#pragma once

#include "gvmi/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: gvmi/core/error.hpp
// BRIEF: GVMI Exception System
// =============================================================================

namespace gvmi {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    INDEX_OUT_OF_BOUNDS = 14,
    EMPTY_INPUT = 15,
    LABEL_NOT_FOUND = 16,

    // Type errors
    TYPE_ERROR = 20,

    // I/O errors
    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,
    WRITE_ERROR = 34,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class GVMI_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Runtime Errors
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class OutOfMemoryError : public RuntimeError {
public:
    explicit OutOfMemoryError(const std::string& msg = "Out of memory")
        : RuntimeError(ErrorCode::OUT_OF_MEMORY, msg) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(const std::string& msg = "Null pointer encountered")
        : RuntimeError(ErrorCode::NULL_POINTER, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal GVMI Error: " + msg) {}
};

// =============================================================================
// Argument Errors
// =============================================================================

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

// Row count of the expression matrix disagrees with the number of labels.
class DimensionMismatchError : public DimensionError {
public:
    DimensionMismatchError(std::size_t matrix_rows, std::size_t label_count)
        : DimensionError(
              "Matrix and gene labels have different lengths: matrix has " +
              std::to_string(matrix_rows) + " rows, but " +
              std::to_string(label_count) + " genes provided"),
          matrix_rows_(matrix_rows),
          label_count_(label_count) {}

    [[nodiscard]] auto matrix_rows() const noexcept -> std::size_t { return matrix_rows_; }
    [[nodiscard]] auto label_count() const noexcept -> std::size_t { return label_count_; }

private:
    std::size_t matrix_rows_;
    std::size_t label_count_;
};

class EmptyInputError : public ValueError {
public:
    explicit EmptyInputError(const std::string& msg = "Empty input: matrix or gene list is empty")
        : ValueError(ErrorCode::EMPTY_INPUT, msg) {}
};

class LabelNotFoundError : public ValueError {
public:
    explicit LabelNotFoundError(const std::string& label)
        : ValueError(ErrorCode::LABEL_NOT_FOUND, "Unknown gene label: " + label) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

// =============================================================================
// Type Errors
// =============================================================================

class TypeError : public Exception {
public:
    explicit TypeError(const std::string& msg)
        : Exception(ErrorCode::TYPE_ERROR, msg) {}
};

// =============================================================================
// I/O Errors
// =============================================================================

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    explicit IOError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "File not found: " + path) {}
};

class ReadError : public IOError {
public:
    explicit ReadError(const std::string& msg)
        : IOError(ErrorCode::READ_ERROR, msg) {}
};

class WriteError : public IOError {
public:
    explicit WriteError(const std::string& msg)
        : IOError(ErrorCode::WRITE_ERROR, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Assertion for internal invariants (active in all builds)
#define GVMI_ASSERT(condition, msg) \
    do { \
        if (GVMI_UNLIKELY(!(condition))) { \
            throw gvmi::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Validation for user inputs
#define GVMI_CHECK_ARG(condition, msg) \
    do { \
        if (GVMI_UNLIKELY(!(condition))) { \
            throw gvmi::ValueError(msg); \
        } \
    } while(0)

// Validation for dimension mismatches
#define GVMI_CHECK_DIM(condition, msg) \
    do { \
        if (GVMI_UNLIKELY(!(condition))) { \
            throw gvmi::DimensionError(msg); \
        } \
    } while(0)

#define GVMI_CHECK_NULL(ptr, msg) \
    do { \
        if (GVMI_UNLIKELY((ptr) == nullptr)) { \
            throw gvmi::NullPointerError(msg); \
        } \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace gvmi
