#ifndef ECMATH_UTIL_RANDOM_H_INCLUDED
#define ECMATH_UTIL_RANDOM_H_INCLUDED

#include <stddef.h>

namespace ecmath { namespace util {

void get_random_bytes(void* dest, size_t count);

} } // namespace ecmath::util

#endif
