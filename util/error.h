#ifndef ECMATH_UTIL_ERROR_H_INCLUDED
#define ECMATH_UTIL_ERROR_H_INCLUDED

#include <stdexcept>
#include <string>

namespace ecmath {

// Base of all arithmetic domain errors. Every operation either succeeds or throws one of these.
class error : public std::runtime_error {
public:
    explicit error(const std::string& what) : std::runtime_error(what) {}
};

// Field element value outside [0, prime)
class out_of_range_value : public error {
public:
    explicit out_of_range_value(const std::string& what) : error(what) {}
};

// Binary field operation on elements of different fields
class field_mismatch : public error {
public:
    explicit field_mismatch(const std::string& what) : error(what) {}
};

class division_by_zero : public error {
public:
    explicit division_by_zero(const std::string& what) : error(what) {}
};

class point_not_on_curve : public error {
public:
    explicit point_not_on_curve(const std::string& what) : error(what) {}
};

// Binary point operation on points with different (a, b)
class curve_mismatch : public error {
public:
    explicit curve_mismatch(const std::string& what) : error(what) {}
};

} // namespace ecmath

#endif
