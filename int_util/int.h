#ifndef ECMATH_INT_UTIL_INT_H_INCLUDED
#define ECMATH_INT_UTIL_INT_H_INCLUDED

#ifdef _MSC_VER
#pragma warning(disable: 4319) // C4319: '~': zero extending 'const unsigned long' to 'boost::multiprecision::double_limb_type' of greater size
#endif
#include <boost/multiprecision/cpp_int.hpp>

namespace ecmath {

// Signed, unbounded. Field values and exponents can be negative in intermediate steps.
using large_int = boost::multiprecision::cpp_int;

// Exact rationals stand in for the real numbers so curve equations can be compared with ==
using real = boost::multiprecision::cpp_rational;

} // namespace ecmath

#endif
