#include "test.h"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>

namespace ecmath { namespace test {

std::string failure_message(const char* what, const char* func, const char* file, int line, const std::string& message)
{
    std::ostringstream oss;
    oss << what << " failed in " << func << " " << file << " line " << line << std::endl;
    oss << message;
    return oss.str();
}

void assert_failed(const char* func, const char* file, int line, const std::string& message)
{
    std::cerr << failure_message("Assertion", func, file, line, message) << std::endl;
    std::abort();
}

void check_failed(const char* func, const char* file, int line, const std::string& message)
{
    throw std::runtime_error(failure_message("Check", func, file, line, message));
}

} } // namespace ecmath::test
