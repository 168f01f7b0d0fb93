#pragma once

// =============================================================================
// GVMI - Test Registration and Execution Framework
// =============================================================================
//
// Header-only test runner with pytest-style output.
//
// Features:
//   ✓ Auto-registration via __COUNTER__
//   ✓ Test suites and grouping
//   ✓ Skip markers
//   ✓ Assertion macros with expected/actual output
//   ✓ Name filtering and fail-fast
//
// Usage:
//   GVMI_TEST_BEGIN
//
//   GVMI_TEST_UNIT(my_test) {
//       GVMI_ASSERT_EQ(1 + 1, 2);
//   }
//
//   GVMI_TEST_SUITE(math_tests)
//   GVMI_TEST_CASE(addition) { ... }
//   GVMI_TEST_SUITE_END
//
//   GVMI_TEST_END
//   GVMI_TEST_MAIN()
//
// CLI:
//   ./test --help                     # Show all options
//   ./test --filter "pairwise"        # Filter by name pattern
//   ./test --fail-fast                # Stop on first failure
//   ./test -v                         # Verbose output
//
// =============================================================================

#ifndef GVMI_TEST_CORE_HPP
#define GVMI_TEST_CORE_HPP

#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#define GVMI_TEST_UNIX_LIKE 1
#else
#define GVMI_TEST_UNIX_LIKE 0
#endif

// =============================================================================
// Configuration
// =============================================================================

namespace gvmi::test {

constexpr std::size_t MAX_TEST_UNITS = 512;

} // namespace gvmi::test

// =============================================================================
// ANSI Color Codes
// =============================================================================

namespace gvmi::test::detail {

inline bool& color_enabled() {
    static bool enabled = true;
    return enabled;
}

inline const char* ansi(const char* code) {
    return color_enabled() ? code : "";
}

} // namespace gvmi::test::detail

namespace gvmi::test::color {

inline const char* reset()      { return detail::ansi("\033[0m"); }
inline const char* bold()       { return detail::ansi("\033[1m"); }
inline const char* dim()        { return detail::ansi("\033[2m"); }
inline const char* cyan()       { return detail::ansi("\033[38;5;80m"); }
inline const char* gray()       { return detail::ansi("\033[38;5;245m"); }

// Status colors (pytest-style)
inline const char* passed()     { return detail::ansi("\033[38;5;114m"); }
inline const char* failed()     { return detail::ansi("\033[38;5;203m"); }
inline const char* skipped()    { return detail::ansi("\033[38;5;221m"); }
inline const char* error()      { return detail::ansi("\033[38;5;196m"); }

} // namespace gvmi::test::color

namespace gvmi::test::util {

inline bool is_tty() {
#if GVMI_TEST_UNIX_LIKE
    return isatty(STDOUT_FILENO) != 0;
#else
    return false;
#endif
}

inline std::string format_duration(double ms) {
    char buf[32];
    if (ms < 1.0) {
        std::snprintf(buf, sizeof(buf), "%dµs", static_cast<int>(ms * 1000));
    } else if (ms < 1000.0) {
        std::snprintf(buf, sizeof(buf), "%.2fms", ms);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2fs", ms / 1000.0);
    }
    return buf;
}

} // namespace gvmi::test::util

// =============================================================================
// Exception Classes
// =============================================================================

namespace gvmi::test {

class TestException : public std::exception {
public:
    TestException(const char* file, int line, const std::string& message,
                  const std::string& expected = "", const std::string& actual = "")
        : file_(file), line_(line), message_(message),
          expected_(expected), actual_(actual) {

        std::ostringstream oss;
        oss << file << ":" << line << ": " << message;
        if (!expected.empty() || !actual.empty()) {
            oss << "\n  Expected: " << expected;
            oss << "\n  Actual:   " << actual;
        }
        full_message_ = oss.str();
    }

    const char* what() const noexcept override { return full_message_.c_str(); }
    const char* file() const { return file_; }
    int line() const { return line_; }
    const std::string& message() const { return message_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    const char* file_;
    int line_;
    std::string message_;
    std::string expected_;
    std::string actual_;
    std::string full_message_;
};

class SkipException : public std::exception {
public:
    explicit SkipException(const std::string& reason = "") : reason_(reason) {}
    const char* what() const noexcept override {
        return reason_.empty() ? "Test skipped" : reason_.c_str();
    }
    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

} // namespace gvmi::test

// =============================================================================
// Test Metadata and Results
// =============================================================================

namespace gvmi::test {

enum class TestStatus {
    PASSED,
    FAILED,
    SKIPPED,
    ERROR
};

inline const char* status_string(TestStatus status) {
    switch (status) {
        case TestStatus::PASSED:   return "PASSED";
        case TestStatus::FAILED:   return "FAILED";
        case TestStatus::SKIPPED:  return "SKIPPED";
        case TestStatus::ERROR:    return "ERROR";
        default:                   return "UNKNOWN";
    }
}

using test_func_t = void(*)();

struct TestInfo {
    test_func_t func = nullptr;
    const char* name_str = nullptr;
    const char* file = nullptr;
    int line = 0;
    const char* suite = nullptr;
};

struct TestResult {
    const TestInfo* test = nullptr;
    TestStatus status = TestStatus::PASSED;
    double duration_ms = 0.0;
    std::string error_message;
    std::string error_file;
    int error_line = 0;
    std::string expected_value;
    std::string actual_value;
};

} // namespace gvmi::test

// =============================================================================
// Global Test Storage
// =============================================================================

namespace gvmi::test::detail {

inline std::array<TestInfo, MAX_TEST_UNITS>& get_tests() {
    static std::array<TestInfo, MAX_TEST_UNITS> tests{};
    return tests;
}

inline std::size_t& get_count() {
    static std::size_t count = 0;
    return count;
}

inline const char*& current_suite() {
    static const char* suite = nullptr;
    return suite;
}

} // namespace gvmi::test::detail

// =============================================================================
// Test Configuration
// =============================================================================

namespace gvmi::test {

struct Config {
    bool verbose = false;
    bool color = true;
    const char* filter = nullptr;
    bool fail_fast = false;
    bool list_tests = false;

    static Config& instance() {
        static Config cfg;
        return cfg;
    }
};

inline void print_help(const char* prog_name) {
    std::printf(R"(
GVMI - Test Runner

Usage: %s [options]

Options:
  --filter <pattern>    Run tests whose name contains pattern
  --list                List all tests without running
  --fail-fast, -x       Stop on first failure
  --verbose, -v         Print every test result
  --no-color            Disable ANSI colors
  --help, -h            Show this help message

Environment:
  GVMI_TEST_FILTER      Same as --filter

)", prog_name);
}

inline void parse_args(int argc, char* argv[]) {
    auto& cfg = Config::instance();
    cfg.color = util::is_tty();

    if (const char* env = std::getenv("GVMI_TEST_FILTER")) {
        cfg.filter = env;
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }
        else if (std::strcmp(arg, "--filter") == 0 && i + 1 < argc) {
            cfg.filter = argv[++i];
        }
        else if (std::strcmp(arg, "--list") == 0) {
            cfg.list_tests = true;
        }
        else if (std::strcmp(arg, "--fail-fast") == 0 || std::strcmp(arg, "-x") == 0) {
            cfg.fail_fast = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            cfg.verbose = true;
        }
        else if (std::strcmp(arg, "--no-color") == 0) {
            cfg.color = false;
        }
        else {
            std::fprintf(stderr, "Error: Unknown option '%s'\n", arg);
            std::fprintf(stderr, "Use --help for usage information\n");
            std::exit(2);
        }
    }

    detail::color_enabled() = cfg.color;
}

// =============================================================================
// Test Runner
// =============================================================================

class Runner {
public:
    Runner() : cfg_(Config::instance()) {}

    int run() {
        const auto& tests = detail::get_tests();
        const std::size_t count = detail::get_count();

        if (cfg_.list_tests) {
            for (std::size_t i = 0; i < count; ++i) {
                if (!tests[i].func) continue;
                std::printf("%s%s%s\n",
                            tests[i].suite ? tests[i].suite : "",
                            tests[i].suite ? "::" : "",
                            tests[i].name_str);
            }
            return 0;
        }

        std::vector<std::size_t> test_indices;
        for (std::size_t i = 0; i < count; ++i) {
            if (!tests[i].func) continue;
            if (cfg_.filter && std::strstr(tests[i].name_str, cfg_.filter) == nullptr) continue;
            test_indices.push_back(i);
        }

        std::printf("\n%s%s test session starts %s\n", color::bold(), "==========", color::reset());
        std::printf("  Tests: %s%zu%s", color::bold(), test_indices.size(), color::reset());
        if (cfg_.filter) {
            std::printf("  Filter: %s%s%s", color::cyan(), cfg_.filter, color::reset());
        }
        std::printf("\n\n");

        auto start_time = std::chrono::steady_clock::now();

        for (std::size_t idx : test_indices) {
            TestResult result = run_test(tests[idx]);
            report(result);
            results_.push_back(result);

            if (cfg_.fail_fast && is_failure(result.status)) {
                break;
            }
        }

        double total_time = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();

        return summarize(total_time);
    }

private:
    Config& cfg_;
    std::vector<TestResult> results_;

    static bool is_failure(TestStatus status) {
        return status == TestStatus::FAILED || status == TestStatus::ERROR;
    }

    static TestResult run_test(const TestInfo& test) {
        TestResult result;
        result.test = &test;

        auto t0 = std::chrono::steady_clock::now();
        try {
            test.func();
            result.status = TestStatus::PASSED;
        } catch (const SkipException& e) {
            result.status = TestStatus::SKIPPED;
            result.error_message = e.reason();
        } catch (const TestException& e) {
            result.status = TestStatus::FAILED;
            result.error_message = e.message();
            result.error_file = e.file();
            result.error_line = e.line();
            result.expected_value = e.expected();
            result.actual_value = e.actual();
        } catch (const std::exception& e) {
            result.status = TestStatus::ERROR;
            result.error_message = std::string("Unhandled exception: ") + e.what();
        } catch (...) {
            result.status = TestStatus::ERROR;
            result.error_message = "Unhandled non-standard exception";
        }
        auto t1 = std::chrono::steady_clock::now();
        result.duration_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        return result;
    }

    void report(const TestResult& r) const {
        const TestInfo& t = *r.test;
        const char* suite = t.suite ? t.suite : "";
        const char* sep = t.suite ? "::" : "";

        switch (r.status) {
            case TestStatus::PASSED:
                if (cfg_.verbose) {
                    std::printf("  %s%-7s%s %s%s%s %s(%s)%s\n",
                                color::passed(), status_string(r.status), color::reset(),
                                suite, sep, t.name_str,
                                color::gray(), util::format_duration(r.duration_ms).c_str(),
                                color::reset());
                }
                break;
            case TestStatus::SKIPPED:
                std::printf("  %s%-7s%s %s%s%s %s%s%s\n",
                            color::skipped(), status_string(r.status), color::reset(),
                            suite, sep, t.name_str,
                            color::dim(), r.error_message.c_str(), color::reset());
                break;
            case TestStatus::FAILED:
            case TestStatus::ERROR:
                std::printf("  %s%-7s%s %s%s%s\n",
                            r.status == TestStatus::FAILED ? color::failed() : color::error(),
                            status_string(r.status), color::reset(),
                            suite, sep, t.name_str);
                if (!r.error_file.empty()) {
                    std::printf("    %s%s:%d%s\n", color::gray(),
                                r.error_file.c_str(), r.error_line, color::reset());
                }
                std::printf("    %s\n", r.error_message.c_str());
                if (!r.expected_value.empty() || !r.actual_value.empty()) {
                    std::printf("    Expected: %s\n", r.expected_value.c_str());
                    std::printf("    Actual:   %s\n", r.actual_value.c_str());
                }
                break;
        }
    }

    int summarize(double total_time) const {
        int passed = 0, failed = 0, skipped = 0, errors = 0;
        for (const auto& r : results_) {
            switch (r.status) {
                case TestStatus::PASSED:  passed++;  break;
                case TestStatus::FAILED:  failed++;  break;
                case TestStatus::SKIPPED: skipped++; break;
                case TestStatus::ERROR:   errors++;  break;
            }
        }

        const bool ok = failed == 0 && errors == 0;
        std::printf("\n%s==========%s ", ok ? color::passed() : color::failed(), color::reset());
        std::printf("%s%d passed%s", color::passed(), passed, color::reset());
        if (failed > 0) std::printf(", %s%d failed%s", color::failed(), failed, color::reset());
        if (errors > 0) std::printf(", %s%d errors%s", color::error(), errors, color::reset());
        if (skipped > 0) std::printf(", %s%d skipped%s", color::skipped(), skipped, color::reset());
        std::printf(" in %.2fs\n\n", total_time);

        return ok ? 0 : 1;
    }
};

} // namespace gvmi::test

// =============================================================================
// Assertion Macros
// =============================================================================

namespace gvmi::test::detail {

template<typename T>
inline std::string to_string_impl(const T& value) {
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return oss.str();
}

inline std::string to_string_impl(const char* value) {
    return value ? std::string("\"") + value + "\"" : "nullptr";
}

inline std::string to_string_impl(const std::string& value) {
    return "\"" + value + "\"";
}

inline std::string to_string_impl(std::nullptr_t) {
    return "nullptr";
}

template<typename T>
inline std::string to_string_impl(T* ptr) {
    if (!ptr) return "nullptr";
    std::ostringstream oss;
    oss << "0x" << std::hex << reinterpret_cast<std::uintptr_t>(ptr);
    return oss.str();
}

template<typename T>
inline std::string value_to_string(const T& value) {
    return to_string_impl(value);
}

} // namespace gvmi::test::detail

/// Assertion with custom message
#define GVMI_ASSERT_MSG(expr, msg) \
    do { \
        if (!(expr)) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, msg); \
        } \
    } while (0)

/// Equality assertion
#define GVMI_ASSERT_EQ(expected, actual) \
    do { \
        auto&& _exp = (expected); \
        auto&& _act = (actual); \
        if (!(_exp == _act)) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected equality: " #expected " == " #actual, \
                ::gvmi::test::detail::value_to_string(_exp), \
                ::gvmi::test::detail::value_to_string(_act)); \
        } \
    } while (0)

/// Inequality assertion
#define GVMI_ASSERT_NE(expected, actual) \
    do { \
        auto&& _exp = (expected); \
        auto&& _act = (actual); \
        if (_exp == _act) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected inequality: " #expected " != " #actual, \
                "not " + ::gvmi::test::detail::value_to_string(_exp), \
                ::gvmi::test::detail::value_to_string(_act)); \
        } \
    } while (0)

/// Less than assertion
#define GVMI_ASSERT_LT(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a < _b)) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " < " #b, \
                "< " + ::gvmi::test::detail::value_to_string(_b), \
                ::gvmi::test::detail::value_to_string(_a)); \
        } \
    } while (0)

/// Less than or equal assertion
#define GVMI_ASSERT_LE(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a <= _b)) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " <= " #b, \
                "<= " + ::gvmi::test::detail::value_to_string(_b), \
                ::gvmi::test::detail::value_to_string(_a)); \
        } \
    } while (0)

/// Greater than assertion
#define GVMI_ASSERT_GT(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a > _b)) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " > " #b, \
                "> " + ::gvmi::test::detail::value_to_string(_b), \
                ::gvmi::test::detail::value_to_string(_a)); \
        } \
    } while (0)

/// Greater than or equal assertion
#define GVMI_ASSERT_GE(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a >= _b)) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " >= " #b, \
                ">= " + ::gvmi::test::detail::value_to_string(_b), \
                ::gvmi::test::detail::value_to_string(_a)); \
        } \
    } while (0)

/// True assertion
#define GVMI_ASSERT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected true: " #expr, "true", "false"); \
        } \
    } while (0)

/// False assertion
#define GVMI_ASSERT_FALSE(expr) \
    do { \
        if (expr) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected false: " #expr, "false", "true"); \
        } \
    } while (0)

/// Null pointer assertion
#define GVMI_ASSERT_NULL(ptr) \
    do { \
        auto&& _ptr = (ptr); \
        if (_ptr != nullptr) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected nullptr: " #ptr, "nullptr", \
                ::gvmi::test::detail::value_to_string(_ptr)); \
        } \
    } while (0)

/// Non-null pointer assertion
#define GVMI_ASSERT_NOT_NULL(ptr) \
    do { \
        auto&& _ptr = (ptr); \
        if (_ptr == nullptr) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected non-null: " #ptr, "non-null", "nullptr"); \
        } \
    } while (0)

/// Floating-point near assertion
#define GVMI_ASSERT_NEAR(expected, actual, tolerance) \
    do { \
        auto _exp = static_cast<double>(expected); \
        auto _act = static_cast<double>(actual); \
        auto _tol = static_cast<double>(tolerance); \
        if (std::abs(_exp - _act) > _tol) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected near: |" #expected " - " #actual "| <= " #tolerance, \
                std::to_string(_exp) + " ± " + std::to_string(_tol), \
                std::to_string(_act)); \
        } \
    } while (0)

/// String equality (case-sensitive)
#define GVMI_ASSERT_STR_EQ(expected, actual) \
    do { \
        std::string _exp(expected); \
        std::string _act(actual); \
        if (_exp != _act) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "String mismatch", \
                "\"" + _exp + "\"", \
                "\"" + _act + "\""); \
        } \
    } while (0)

/// String contains
#define GVMI_ASSERT_STR_CONTAINS(haystack, needle) \
    do { \
        std::string _hay(haystack); \
        std::string _ndl(needle); \
        if (_hay.find(_ndl) == std::string::npos) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "String does not contain substring", \
                "contains \"" + _ndl + "\"", \
                "\"" + _hay + "\""); \
        } \
    } while (0)

/// Exception assertion
#define GVMI_ASSERT_THROWS(expr, exception_type) \
    do { \
        bool _caught = false; \
        try { \
            expr; \
        } catch (const exception_type&) { \
            _caught = true; \
        } catch (const std::exception& _e) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Wrong exception type thrown by: " #expr, \
                #exception_type, _e.what()); \
        } \
        if (!_caught) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Expected exception not thrown: " #expr, \
                #exception_type, "no exception"); \
        } \
    } while (0)

/// No exception assertion
#define GVMI_ASSERT_NO_THROW(expr) \
    do { \
        try { \
            expr; \
        } catch (const std::exception& e) { \
            throw ::gvmi::test::TestException(__FILE__, __LINE__, \
                "Unexpected exception: " #expr, \
                "no exception", e.what()); \
        } \
    } while (0)

/// Fail immediately
#define GVMI_FAIL(msg) \
    throw ::gvmi::test::TestException(__FILE__, __LINE__, msg)

/// Skip test
#define GVMI_SKIP(reason) \
    throw ::gvmi::test::SkipException(reason)

/// Skip test if condition
#define GVMI_SKIP_IF(condition, reason) \
    do { \
        if (condition) { \
            throw ::gvmi::test::SkipException(reason); \
        } \
    } while (0)

// =============================================================================
// Test Registration Macros
// =============================================================================

/// Begin test file
#define GVMI_TEST_BEGIN \
    namespace { \
    static constexpr std::size_t _gvmi_test_base = __COUNTER__;

/// Define a test unit
#define GVMI_TEST_UNIT(name) \
    static void _gvmi_test_##name(); \
    [[maybe_unused]] static bool _gvmi_reg_##name = []() { \
        constexpr std::size_t idx = __COUNTER__ - _gvmi_test_base - 1; \
        auto& test_info = ::gvmi::test::detail::get_tests()[idx]; \
        test_info.func = _gvmi_test_##name; \
        test_info.name_str = #name; \
        test_info.file = __FILE__; \
        test_info.line = __LINE__; \
        test_info.suite = ::gvmi::test::detail::current_suite(); \
        if (idx + 1 > ::gvmi::test::detail::get_count()) { \
            ::gvmi::test::detail::get_count() = idx + 1; \
        } \
        return true; \
    }(); \
    static void _gvmi_test_##name()

/// Begin a test suite
#define GVMI_TEST_SUITE(name) \
    namespace _gvmi_suite_##name { \
    [[maybe_unused]] static bool _gvmi_suite_init = []() { \
        ::gvmi::test::detail::current_suite() = #name; \
        return true; \
    }();

/// End a test suite
#define GVMI_TEST_SUITE_END \
    [[maybe_unused]] static bool _gvmi_suite_cleanup = []() { \
        ::gvmi::test::detail::current_suite() = nullptr; \
        return true; \
    }(); \
    }

/// Test case within a suite (alias for GVMI_TEST_UNIT)
#define GVMI_TEST_CASE(name) GVMI_TEST_UNIT(name)

/// End test file
#define GVMI_TEST_END \
    } /* anonymous namespace */

/// Generate main() function with CLI support
#define GVMI_TEST_MAIN() \
    int main(int argc, char* argv[]) { \
        ::gvmi::test::parse_args(argc, argv); \
        ::gvmi::test::Runner runner; \
        return runner.run(); \
    }

#endif // GVMI_TEST_CORE_HPP
