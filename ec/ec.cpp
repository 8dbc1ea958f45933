#include "ec.h"
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <util/error.h>
#include <util/test.h>
#include <int_util/int_util.h>

namespace {

using namespace ecmath;

template<typename Coord>
bool satisfies_curve(const Coord& x, const Coord& y, const Coord& a, const Coord& b)
{
    using traits = ec::coordinate_traits<Coord>;
    const Coord lhs = traits::square(y);
    const Coord rhs = traits::square(x) * x + a * x + b;
    return lhs == rhs;
}

} // unnamed namespace

namespace ecmath { namespace ec {

void coordinate_traits<real>::print(std::ostream& os, const real& c)
{
    os << c;
}

void coordinate_traits<field::field_element>::check_same_domain(const field::field_element& lhs, const field::field_element& rhs)
{
    ECMATH_CHECK_BINARY_THROW(field_mismatch, lhs.prime(), ==, rhs.prime(), "Point coordinates from different fields");
}

void coordinate_traits<field::field_element>::print(std::ostream& os, const field::field_element& c)
{
    os << c.num();
}

std::ostream& operator<<(std::ostream& os, point_kind kind)
{
    switch (kind) {
    case point_kind::infinity: return os << "infinity";
    case point_kind::affine:   return os << "affine";
    }
    return os << "point_kind(" << static_cast<int>(kind) << ")";
}

template<typename Coord>
point<Coord>::point(const Coord& x, const Coord& y, const Coord& a, const Coord& b)
    : state_(affine_coordinates<Coord>{x, y}), a_(a), b_(b)
{
    using traits = coordinate_traits<Coord>;
    traits::check_same_domain(x, a);
    traits::check_same_domain(y, a);
    traits::check_same_domain(b, a);
    if (!satisfies_curve(x, y, a, b)) {
        std::ostringstream oss;
        oss << "(";
        coordinate_traits<Coord>::print(oss, x);
        oss << ", ";
        coordinate_traits<Coord>::print(oss, y);
        oss << ") is not on the curve";
        throw point_not_on_curve(oss.str());
    }
}

template<typename Coord>
point<Coord>::point(const at_infinity& inf, const Coord& a, const Coord& b)
    : state_(inf), a_(a), b_(b)
{
    coordinate_traits<Coord>::check_same_domain(b, a);
}

template<typename Coord>
point<Coord> point<Coord>::infinity(const Coord& a, const Coord& b)
{
    return point(at_infinity{}, a, b);
}

template<typename Coord>
point_kind point<Coord>::kind() const
{
    return state_.template is<at_infinity>() ? point_kind::infinity : point_kind::affine;
}

template<typename Coord>
const affine_coordinates<Coord>& point<Coord>::coordinates() const
{
    if (is_infinity()) {
        throw std::logic_error("The point at infinity has no coordinates");
    }
    return state_.template get<affine_coordinates<Coord>>();
}

template<typename Coord>
const Coord& point<Coord>::x() const
{
    return coordinates().x;
}

template<typename Coord>
const Coord& point<Coord>::y() const
{
    return coordinates().y;
}

template<typename Coord>
point<Coord> point<Coord>::add(const point& other) const
{
    using traits = coordinate_traits<Coord>;

    if (a_ != other.a_ || b_ != other.b_) {
        throw curve_mismatch("Points " + to_string() + ", " + other.to_string() + " are not on the same curve");
    }

    // Identity
    if (is_infinity()) {
        return other;
    } else if (other.is_infinity()) {
        return *this;
    }

    const Coord& x1 = x();
    const Coord& y1 = y();
    const Coord& x2 = other.x();
    const Coord& y2 = other.y();

    // Additive inverses: vertical line
    if (x1 == x2 && y1 != y2) {
        return infinity(a_, b_);
    }

    // Secant through two distinct points
    if (x1 != x2) {
        const Coord s  = (y2 - y1) / (x2 - x1);
        const Coord x3 = traits::square(s) - x1 - x2;
        const Coord y3 = s * (x1 - x3) - y1;
        return point(x3, y3, a_, b_);
    }

    // Tangent at a single point
    if (equals(other)) {
        if (traits::is_zero(y1)) {
            return infinity(a_, b_);
        }
        const Coord s  = (traits::times(3, traits::square(x1)) + a_) / traits::times(2, y1);
        const Coord x3 = traits::square(s) - traits::times(2, x1);
        const Coord y3 = s * (x1 - x3) - y1;
        return point(x3, y3, a_, b_);
    }

    ECMATH_CHECK_FAILURE("Unhandled point addition " + to_string() + " + " + other.to_string());
}

template<typename Coord>
bool point<Coord>::equals(const point& other) const
{
    if (kind() != other.kind() || a_ != other.a_ || b_ != other.b_) {
        return false;
    }
    if (is_infinity()) {
        return true;
    }
    return x() == other.x() && y() == other.y();
}

template<typename Coord>
std::string point<Coord>::to_string() const
{
    std::ostringstream oss;
    print(oss);
    return oss.str();
}

namespace {

template<typename Coord>
struct coordinates_printer {
    std::ostream& os;

    void operator()(const at_infinity&) const {
        os << "infinity";
    }
    void operator()(const affine_coordinates<Coord>& c) const {
        coordinate_traits<Coord>::print(os, c.x);
        os << ", ";
        coordinate_traits<Coord>::print(os, c.y);
    }
};

} // unnamed namespace

template<typename Coord>
void point<Coord>::print(std::ostream& os) const
{
    using traits = coordinate_traits<Coord>;
    os << "Point(";
    state_.invoke(coordinates_printer<Coord>{os});
    os << ")_";
    traits::print(os, a_);
    os << "_";
    traits::print(os, b_);
}

template class point<real>;
template class point<field::field_element>;

bool curve_check(const large_int& x, const large_int& y, const large_int& a, const large_int& b, const large_int& p)
{
    return pmod(y * y, p) == pmod(a * x * x * x + b, p);
}

} } // namespace ecmath::ec
