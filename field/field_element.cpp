#include "field_element.h"
#include <ostream>
#include <sstream>
#include <util/error.h>
#include <util/test.h>
#include <int_util/int_util.h>

namespace {

using namespace ecmath;

void check_same_field(const char* op, const field::field_element& lhs, const field::field_element& rhs)
{
    ECMATH_CHECK_BINARY_THROW(field_mismatch, lhs.prime(), ==, rhs.prime(), std::string("Cannot ") + op + " two elements from different fields");
}

} // unnamed namespace

namespace ecmath { namespace field {

field_element::field_element(const large_int& num, const large_int& prime) : num_(num), prime_(prime)
{
    ECMATH_CHECK_BINARY_THROW(out_of_range_value, prime_, >, 0, "Field order must be positive");
    if (num_ < 0 || num_ >= prime_) {
        std::ostringstream oss;
        oss << "Num " << num_ << " not in field range 0 to " << large_int(prime_ - 1);
        throw out_of_range_value(oss.str());
    }
}

field_element field_element::pow(const large_int& exponent) const
{
    if (num_ == 0) {
        ECMATH_CHECK_BINARY_THROW(division_by_zero, exponent, >=, 0, "Zero has no inverse");
        return field_element(exponent == 0 ? 1 : 0, prime_);
    }
    // a^(p-1) = 1, so a^-n = a^(p-1-n)
    const large_int n = pmod(exponent, large_int(prime_ - 1));
    return field_element(powm_mod(num_, n, prime_), prime_);
}

std::string field_element::to_string() const
{
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

bool operator==(const field_element& lhs, const field_element& rhs)
{
    return lhs.num() == rhs.num() && lhs.prime() == rhs.prime();
}

bool operator!=(const field_element& lhs, const field_element& rhs)
{
    return !(lhs == rhs);
}

field_element operator+(const field_element& lhs, const field_element& rhs)
{
    check_same_field("add", lhs, rhs);
    return field_element(pmod(lhs.num() + rhs.num(), lhs.prime()), lhs.prime());
}

field_element operator-(const field_element& lhs, const field_element& rhs)
{
    check_same_field("subtract", lhs, rhs);
    return field_element(pmod(lhs.num() - rhs.num(), lhs.prime()), lhs.prime());
}

field_element operator*(const field_element& lhs, const field_element& rhs)
{
    check_same_field("multiply", lhs, rhs);
    return field_element(pmod(lhs.num() * rhs.num(), lhs.prime()), lhs.prime());
}

field_element operator/(const field_element& lhs, const field_element& rhs)
{
    check_same_field("divide", lhs, rhs);
    if (is_zero(rhs)) {
        throw division_by_zero("Cannot divide " + lhs.to_string() + " by zero");
    }
    const large_int p = lhs.prime();
    const large_int inverse = powm_mod(rhs.num(), large_int(p - 2), p);
    return field_element(pmod(lhs.num() * inverse, p), p);
}

field_element operator-(const field_element& e)
{
    return field_element(pmod(large_int(-e.num()), e.prime()), e.prime());
}

field_element operator*(const large_int& coefficient, const field_element& e)
{
    return field_element(pmod(coefficient * e.num(), e.prime()), e.prime());
}

bool is_zero(const field_element& e)
{
    return e.num() == 0;
}

std::ostream& operator<<(std::ostream& os, const field_element& e)
{
    return os << "FieldElement_" << e.num() << "(" << e.prime() << ")";
}

} } // namespace ecmath::field
