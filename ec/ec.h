#ifndef ECMATH_EC_EC_H_INCLUDED
#define ECMATH_EC_EC_H_INCLUDED

#include <iosfwd>
#include <string>

#include <int_util/int.h>
#include <field/field_element.h>
#include <util/variant.h>

namespace ecmath { namespace ec {

enum class point_kind { infinity, affine };

struct at_infinity {};

template<typename Coord>
struct affine_coordinates {
    Coord x;
    Coord y;
};

// Arithmetic a coordinate domain must supply beyond + - * / and ==
template<typename Coord>
struct coordinate_traits;

template<>
struct coordinate_traits<real> {
    static bool is_zero(const real& c) { return c == 0; }
    static real square(const real& c) { return c * c; }
    static real times(int k, const real& c) { return k * c; }
    static void check_same_domain(const real&, const real&) {}
    static void print(std::ostream& os, const real& c);
};

template<>
struct coordinate_traits<field::field_element> {
    static bool is_zero(const field::field_element& c) { return field::is_zero(c); }
    static field::field_element square(const field::field_element& c) { return c.pow(2); }
    static field::field_element times(int k, const field::field_element& c) { return large_int(k) * c; }
    // Throws field_mismatch when the primes differ
    static void check_same_domain(const field::field_element& lhs, const field::field_element& rhs);
    static void print(std::ostream& os, const field::field_element& c);
};

// Point on the curve y^2 = x^3 + ax + b with coordinates in Coord, or the point at infinity.
// Points are values: they are either constructed on the curve or the constructor throws.
template<typename Coord>
class point {
public:
    // Throws point_not_on_curve unless y^2 = x^3 + ax + b, field_mismatch if the coordinates come from different fields
    point(const Coord& x, const Coord& y, const Coord& a, const Coord& b);

    // Throws field_mismatch if a and b come from different fields
    static point infinity(const Coord& a, const Coord& b);

    point_kind kind() const;
    bool is_infinity() const { return kind() == point_kind::infinity; }

    // Throw std::logic_error for the point at infinity
    const Coord& x() const;
    const Coord& y() const;

    const Coord& a() const { return a_; }
    const Coord& b() const { return b_; }

    // Group law. Throws curve_mismatch if other has different a or b.
    point add(const point& other) const;

    bool equals(const point& other) const;

    std::string to_string() const;
    void print(std::ostream& os) const;

private:
    using state_type = util::variant<at_infinity, affine_coordinates<Coord>>;

    state_type state_;
    Coord      a_;
    Coord      b_;

    point(const at_infinity& inf, const Coord& a, const Coord& b);
    const affine_coordinates<Coord>& coordinates() const;
};

template<typename Coord>
inline point<Coord> operator+(const point<Coord>& lhs, const point<Coord>& rhs) {
    return lhs.add(rhs);
}

template<typename Coord>
inline bool operator==(const point<Coord>& lhs, const point<Coord>& rhs) {
    return lhs.equals(rhs);
}

template<typename Coord>
inline bool operator!=(const point<Coord>& lhs, const point<Coord>& rhs) {
    return !lhs.equals(rhs);
}

template<typename Coord>
inline std::ostream& operator<<(std::ostream& os, const point<Coord>& p) {
    p.print(os);
    return os;
}

std::ostream& operator<<(std::ostream& os, point_kind kind);

using real_point  = point<real>;
using field_point = point<field::field_element>;

extern template class point<real>;
extern template class point<field::field_element>;

// Quick membership probe on plain integers: y^2 = a*x^3 + b (mod p)
bool curve_check(const large_int& x, const large_int& y, const large_int& a, const large_int& b, const large_int& p);

} } // namespace ecmath::ec

#endif
