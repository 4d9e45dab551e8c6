// Minimal assertion helpers shared by the ddr_dfi test executables.
//
// Each test executable is a plain main() that runs a list of
// `static void test_xxx(TestResults&)` functions and returns non-zero when
// any assertion failed. CTest treats the exit code as the verdict.

#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <type_traits>

/// Aggregates test failure count across all test functions.
struct TestResults {
    int failures = 0;
};

/// Record a test assertion failure with source location context.
///
/// @param results   Test results accumulator.
/// @param func      Name of the calling function (__func__).
/// @param line      Source line number (__LINE__).
/// @param msg       Human-readable failure description.
inline void test_fail(TestResults& results, const char* func, int line, const char* msg) {
    std::fprintf(stderr, "FAIL: %s (line %d): %s\n", func, line, msg);
    results.failures++;
}

/// Render a value for a failure message; enums print their underlying value.
template <typename T>
std::string test_value_str(const T& value) {
    if constexpr (std::is_enum_v<T>) {
        return std::format("{}", static_cast<unsigned long long>(value));
    } else if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        return std::format("{} (0x{:x})", value, value);
    } else {
        return std::format("{}", value);
    }
}

/// Record a test equality assertion failure with expected/actual values.
template <typename E, typename A>
void test_fail_eq(
    TestResults& results, const char* func, int line, const char* msg, E expected, A actual
) {
    std::fprintf(
        stderr,
        "FAIL: %s (line %d): %s (expected %s, got %s)\n",
        func,
        line,
        msg,
        test_value_str(expected).c_str(),
        test_value_str(actual).c_str()
    );
    results.failures++;
}

/// Assert a boolean condition, recording a failure if false.
///
/// A macro is used so that __func__ and __LINE__ are evaluated at the call
/// site.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define TEST_ASSERT(results, cond, msg)                      \
    do {                                                     \
        if (!(cond)) {                                       \
            test_fail((results), __func__, __LINE__, (msg)); \
        }                                                    \
    } while (0)

/// Assert equality between two values, recording a failure with details.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define TEST_ASSERT_EQ(results, a, b, msg)                                \
    do {                                                                  \
        if ((a) != (b)) {                                                 \
            test_fail_eq((results), __func__, __LINE__, (msg), (b), (a)); \
        }                                                                 \
    } while (0)

/// Expect `expr` to throw `exc`.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define TEST_ASSERT_THROWS(results, expr, exc, msg)              \
    do {                                                         \
        bool thrown_ = false;                                    \
        try {                                                    \
            (void)(expr);                                        \
        } catch (const exc&) {                                   \
            thrown_ = true;                                      \
        }                                                        \
        if (!thrown_) {                                          \
            test_fail((results), __func__, __LINE__, (msg));     \
        }                                                        \
    } while (0)

/// Print the verdict line and return the process exit code.
inline int test_summary(const TestResults& results) {
    std::printf("\n");
    if (results.failures == 0) {
        std::printf("All tests PASSED.\n");
        return 0;
    }
    std::printf("%d test(s) FAILED.\n", results.failures);
    return 1;
}
