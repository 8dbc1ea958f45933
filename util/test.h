#ifndef ECMATH_UTIL_TEST_H_INCLUDED
#define ECMATH_UTIL_TEST_H_INCLUDED

#include <sstream>
#include <string>
#include <cstdlib>

namespace ecmath { namespace test {

std::string failure_message(const char* what, const char* func, const char* file, int line, const std::string& message);

void check_failed(const char* func, const char* file, int line, const std::string& message);
void assert_failed(const char* func, const char* file, int line, const std::string& message);

// Like check_failed, but reports the failure as Exception
template<typename Exception>
void check_failed_as(const char* func, const char* file, int line, const std::string& message)
{
    throw Exception(failure_message("Check", func, file, line, message));
}

} } // namespace ecmath::test

#define ECMATH_CHECK_FAILURE(msg) do {                                  \
    ecmath::test::check_failed(__PRETTY_FUNCTION__, __FILE__,           \
                    __LINE__, msg);                                     \
    std::abort();                                                       \
    } while (0)

#define ECMATH_ASSERT_THROWS_MESSAGE(expr, exception_type, message)     \
    do {                                                                \
        try {                                                           \
            expr;                                                       \
            std::ostringstream _ecmath_oss;                             \
            _ecmath_oss << "Expected " << #expr                         \
                << " to throw exception of type "                       \
                << #exception_type                                      \
                << "\n" << message;                                     \
            ecmath::test::assert_failed(__PRETTY_FUNCTION__, __FILE__,  \
                    __LINE__, _ecmath_oss.str());                       \
        } catch (const exception_type &) {}                             \
    } while(0)

#define ECMATH_ASSERT_THROWS(expr, exception_type) \
    ECMATH_ASSERT_THROWS_MESSAGE(expr, exception_type, "")

#define ECMATH_CHECK_BINARY_(expected, bin_op, actual, message, fail)   \
    do {                                                                \
        const auto _a_val = (expected);                                 \
        const auto _b_val = (actual);                                   \
        if (!(_a_val bin_op _b_val)) {                                  \
            std::ostringstream _ecmath_oss;                             \
            _ecmath_oss << "Expected:\n" << #expected << " "            \
                << #bin_op << " " << #actual << "\n"                    \
                << "Failure:\n"                                         \
                << "\"" << _a_val << "\"\n" << #bin_op << "\n\""        \
                << _b_val << "\"\n" << message;                         \
            fail(__PRETTY_FUNCTION__, __FILE__, __LINE__,               \
                    _ecmath_oss.str());                                 \
        }                                                               \
    } while (0)

#define ECMATH_ASSERT_BINARY_MESSAGE(expected, bin_op, actual, message) \
    ECMATH_CHECK_BINARY_(expected, bin_op, actual, message, ecmath::test::assert_failed)

#define ECMATH_ASSERT_EQUAL(expected, actual) ECMATH_ASSERT_BINARY_MESSAGE(expected, ==, actual, "")
#define ECMATH_ASSERT_EQUAL_MESSAGE(expected, actual, message) ECMATH_ASSERT_BINARY_MESSAGE(expected, ==, actual, message)

#define ECMATH_ASSERT_NOT_EQUAL(expected, actual) ECMATH_ASSERT_BINARY_MESSAGE(expected, !=, actual, "")

#define ECMATH_CHECK_BINARY(expected, bin_op, actual, message) \
    ECMATH_CHECK_BINARY_(expected, bin_op, actual, message, ecmath::test::check_failed)

// Throws exception_type (constructible from std::string) when the check fails
#define ECMATH_CHECK_BINARY_THROW(exception_type, expected, bin_op, actual, message) \
    ECMATH_CHECK_BINARY_(expected, bin_op, actual, message, ecmath::test::check_failed_as<exception_type>)

#endif
