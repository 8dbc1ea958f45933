#ifndef ECMATH_FIELD_FIELD_ELEMENT_H_INCLUDED
#define ECMATH_FIELD_FIELD_ELEMENT_H_INCLUDED

#include <iosfwd>
#include <string>

#include <int_util/int.h>

namespace ecmath { namespace field {

// Element of the prime field F_p. Immutable; 0 <= num() < prime() always holds.
class field_element {
public:
    // Throws out_of_range_value unless 0 <= num < prime
    field_element(const large_int& num, const large_int& prime);

    const large_int& num() const { return num_; }
    const large_int& prime() const { return prime_; }

    // num^exponent (mod prime). Negative exponents are reduced modulo prime-1 (Fermat's little theorem).
    field_element pow(const large_int& exponent) const;

    std::string to_string() const;

private:
    large_int num_;
    large_int prime_;
};

bool operator==(const field_element& lhs, const field_element& rhs);
bool operator!=(const field_element& lhs, const field_element& rhs);

// Binary operations throw field_mismatch when the primes differ
field_element operator+(const field_element& lhs, const field_element& rhs);
field_element operator-(const field_element& lhs, const field_element& rhs);
field_element operator*(const field_element& lhs, const field_element& rhs);
// lhs * rhs^(p-2). Throws division_by_zero when rhs is zero.
field_element operator/(const field_element& lhs, const field_element& rhs);

field_element operator-(const field_element& e);
field_element operator*(const large_int& coefficient, const field_element& e);

bool is_zero(const field_element& e);

std::ostream& operator<<(std::ostream& os, const field_element& e);

} } // namespace ecmath::field

#endif
