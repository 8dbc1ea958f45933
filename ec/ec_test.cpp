#include <ec/ec.h>
#include <int_util/int_util.h>
#include <util/error.h>
#include <util/test.h>

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>

using namespace ecmath;
using field::field_element;

namespace {

template<typename Coord>
ec::point<Coord> scalar_mul(large_int k, ec::point<Coord> p)
{
    auto res = ec::point<Coord>::infinity(p.a(), p.b());
    while (k != 0) {
        if ((k & 1) != 0) res = res + p;
        p = p + p;
        k >>= 1;
    }
    return res;
}

template<typename Coord>
ec::point<Coord> negate(const ec::point<Coord>& p)
{
    return ec::point<Coord>(p.x(), -p.y(), p.a(), p.b());
}

const int prime = 223;

// y^2 = x^3 + 7 over F_223
struct f223_curve {

    field_element fe(int n) const {
        return field_element(n, prime);
    }
    ec::field_point pt(int x, int y) const {
        return ec::field_point(fe(x), fe(y), fe(0), fe(7));
    }
    ec::field_point inf() const {
        return ec::field_point::infinity(fe(0), fe(7));
    }
    std::vector<ec::field_point> all_points() const {
        std::vector<ec::field_point> res;
        for (int x = 0; x < prime; ++x) {
            for (int y = 0; y < prime; ++y) {
                if ((y * y) % prime == (x * x * x + 7) % prime) {
                    res.push_back(pt(x, y));
                }
            }
        }
        return res;
    }
};

ec::real_point rp(int x, int y, int a, int b)
{
    return ec::real_point(real(x), real(y), real(a), real(b));
}

} // unnamed namespace

void test_curve_check()
{
    ECMATH_ASSERT_EQUAL(true,  ec::curve_check(192, 105, 1, 7, 223));
    ECMATH_ASSERT_EQUAL(true,  ec::curve_check(17, 56, 1, 7, 223));
    ECMATH_ASSERT_EQUAL(false, ec::curve_check(200, 119, 1, 7, 223));
    ECMATH_ASSERT_EQUAL(true,  ec::curve_check(1, 193, 1, 7, 223));
    ECMATH_ASSERT_EQUAL(false, ec::curve_check(42, 99, 1, 7, 223));
    // Negative inputs are reduced
    ECMATH_ASSERT_EQUAL(true,  ec::curve_check(192, -118, 1, 7, 223));
}

void test_real_construction()
{
    const auto p = rp(-1, -1, 5, 7);
    ECMATH_ASSERT_EQUAL(ec::point_kind::affine, p.kind());
    ECMATH_ASSERT_EQUAL(real(-1), p.x());
    ECMATH_ASSERT_EQUAL(real(-1), p.y());
    ECMATH_ASSERT_EQUAL(real(5), p.a());
    ECMATH_ASSERT_EQUAL(real(7), p.b());
    ECMATH_ASSERT_EQUAL("Point(-1, -1)_5_7", p.to_string());

    rp(18, 77, 5, 7);
    ECMATH_ASSERT_THROWS(rp(2, 4, 5, 7), point_not_on_curve);
    ECMATH_ASSERT_THROWS(rp(-1, -2, 5, 7), point_not_on_curve);
    ECMATH_ASSERT_THROWS(rp(5, 7, 5, 7), ecmath::error);

    const auto o = ec::real_point::infinity(real(5), real(7));
    ECMATH_ASSERT_EQUAL(ec::point_kind::infinity, o.kind());
    ECMATH_ASSERT_EQUAL(true, o.is_infinity());
    ECMATH_ASSERT_EQUAL("Point(infinity)_5_7", o.to_string());
    ECMATH_ASSERT_THROWS(o.x(), std::logic_error);
    ECMATH_ASSERT_THROWS(o.y(), std::logic_error);
}

void test_real_equality()
{
    ECMATH_ASSERT_EQUAL(rp(-1, -1, 5, 7), rp(-1, -1, 5, 7));
    ECMATH_ASSERT_NOT_EQUAL(rp(-1, -1, 5, 7), rp(-1, 1, 5, 7));
    ECMATH_ASSERT_NOT_EQUAL(rp(-1, -1, 5, 7), ec::real_point::infinity(real(5), real(7)));
    ECMATH_ASSERT_EQUAL(ec::real_point::infinity(real(5), real(7)), ec::real_point::infinity(real(5), real(7)));
    ECMATH_ASSERT_NOT_EQUAL(ec::real_point::infinity(real(5), real(7)), ec::real_point::infinity(real(5), real(8)));
}

void test_real_add()
{
    const auto p1 = rp(-1, -1, 5, 7);
    const auto p2 = rp(-1, 1, 5, 7);
    const auto p3 = rp(2, 5, 5, 7);
    const auto o = ec::real_point::infinity(real(5), real(7));

    // Identity
    ECMATH_ASSERT_EQUAL(p1, p1 + o);
    ECMATH_ASSERT_EQUAL(p1, o + p1);
    ECMATH_ASSERT_EQUAL(o, o + o);

    // Inverses
    ECMATH_ASSERT_EQUAL(o, p1 + p2);
    ECMATH_ASSERT_EQUAL(o, p2 + p1);

    // Secant
    ECMATH_ASSERT_EQUAL(rp(3, -7, 5, 7), p3 + p1);
    ECMATH_ASSERT_EQUAL(rp(3, -7, 5, 7), p1 + p3);

    // Tangent
    ECMATH_ASSERT_EQUAL(rp(18, 77, 5, 7), p1 + p1);

    // Non-integral slope, the results must still be exactly on the curve
    const auto q = rp(18, 77, 5, 7);
    const auto r = q + p3;
    ECMATH_ASSERT_EQUAL(r, p3 + q);
    ECMATH_ASSERT_EQUAL(ec::point_kind::affine, r.kind());
    ECMATH_ASSERT_EQUAL((q + p3) + p1, q + (p3 + p1));
    ECMATH_ASSERT_EQUAL(o, r + negate(r));

    // Vertical tangent on y^2 = x^3 - x
    const auto t = rp(1, 0, -1, 0);
    ECMATH_ASSERT_EQUAL(ec::real_point::infinity(real(-1), real(0)), t + t);
    ECMATH_ASSERT_EQUAL(rp(0, 0, -1, 0), t + rp(-1, 0, -1, 0));

    // Different curves
    ECMATH_ASSERT_THROWS(p1 + ec::real_point::infinity(real(5), real(8)), curve_mismatch);
    ECMATH_ASSERT_THROWS(ec::real_point::infinity(real(4), real(7)) + p1, curve_mismatch);
    ECMATH_ASSERT_THROWS(p1 + rp(0, 0, -1, 0), curve_mismatch);
}

void test_field_construction()
{
    const f223_curve c;
    const auto p = c.pt(192, 105);
    ECMATH_ASSERT_EQUAL(ec::point_kind::affine, p.kind());
    ECMATH_ASSERT_EQUAL(c.fe(192), p.x());
    ECMATH_ASSERT_EQUAL(c.fe(105), p.y());
    ECMATH_ASSERT_EQUAL("Point(192, 105)_0_7", p.to_string());
    ECMATH_ASSERT_EQUAL("Point(infinity)_0_7", c.inf().to_string());

    c.pt(17, 56);
    c.pt(1, 193);
    ECMATH_ASSERT_THROWS(c.pt(200, 119), point_not_on_curve);
    ECMATH_ASSERT_THROWS(c.pt(42, 99), point_not_on_curve);

    // Coordinates from another field
    ECMATH_ASSERT_THROWS(ec::field_point(field_element(192, 227), c.fe(105), c.fe(0), c.fe(7)), field_mismatch);
    ECMATH_ASSERT_THROWS(ec::field_point(c.fe(192), field_element(105, 227), c.fe(0), c.fe(7)), field_mismatch);
    ECMATH_ASSERT_THROWS(ec::field_point(c.fe(192), c.fe(105), c.fe(0), field_element(7, 227)), field_mismatch);
    ECMATH_ASSERT_THROWS(ec::field_point(c.fe(192), c.fe(105), field_element(0, 227), c.fe(7)), field_mismatch);
    ECMATH_ASSERT_THROWS(ec::field_point::infinity(c.fe(0), field_element(7, 227)), field_mismatch);

    try {
        ec::field_point(c.fe(192), field_element(105, 227), c.fe(0), c.fe(7));
        ECMATH_CHECK_FAILURE("Expected field_mismatch");
    } catch (const field_mismatch& e) {
        const std::string what = e.what();
        ECMATH_ASSERT_NOT_EQUAL(std::string::npos, what.find("different fields"));
    }
}

void test_field_add()
{
    const f223_curve c;
    const auto o = c.inf();

    ECMATH_ASSERT_EQUAL(c.pt(220, 181), c.pt(170, 142) + c.pt(60, 139));
    ECMATH_ASSERT_EQUAL(c.pt(215, 68),  c.pt(47, 71) + c.pt(17, 56));
    ECMATH_ASSERT_EQUAL(c.pt(47, 71),   c.pt(143, 98) + c.pt(76, 66));

    ECMATH_ASSERT_EQUAL(c.pt(49, 71),   c.pt(192, 105) + c.pt(192, 105));
    ECMATH_ASSERT_EQUAL(c.pt(64, 168),  c.pt(143, 98) + c.pt(143, 98));
    ECMATH_ASSERT_EQUAL(c.pt(36, 111),  c.pt(47, 71) + c.pt(47, 71));

    ECMATH_ASSERT_EQUAL(o, c.pt(47, 71) + c.pt(47, 152));

    // 6^3 = -7 (mod 223): a point of order two
    const auto t = c.pt(6, 0);
    ECMATH_ASSERT_EQUAL(o, t + t);

    const auto other_curve = ec::field_point::infinity(c.fe(1), c.fe(7));
    ECMATH_ASSERT_THROWS(c.pt(47, 71) + other_curve, curve_mismatch);
    ECMATH_ASSERT_THROWS(other_curve + c.pt(47, 71), curve_mismatch);
    const auto other_field = ec::field_point::infinity(field_element(0, 227), field_element(7, 227));
    ECMATH_ASSERT_THROWS(c.pt(47, 71) + other_field, curve_mismatch);
}

void test_field_multiples()
{
    const f223_curve c;
    const auto g = c.pt(47, 71);
    const struct {
        int x, y;
    } multiples[] = {
        { 47,  71 }, { 36, 111 }, { 15, 137 }, { 194,  51 }, { 126,  96 },
        { 139, 137 }, { 92,  47 }, { 116, 55 }, {  69,  86 }, { 154, 150 },
        { 154,  73 }, { 69, 137 }, { 116, 168 }, { 92, 176 }, { 139,  86 },
        { 126, 127 }, { 194, 172 }, { 15, 86 }, {  36, 112 }, {  47, 152 },
    };
    auto acc = g;
    for (size_t i = 0; i < sizeof(multiples)/sizeof(*multiples); ++i) {
        const auto expected = c.pt(multiples[i].x, multiples[i].y);
        ECMATH_ASSERT_EQUAL_MESSAGE(expected, acc, std::to_string(i + 1) + " * " + g.to_string());
        ECMATH_ASSERT_EQUAL(expected, scalar_mul(large_int(i + 1), g));
        acc = acc + g;
    }
    ECMATH_ASSERT_EQUAL(c.inf(), acc);
    ECMATH_ASSERT_EQUAL(c.inf(), scalar_mul(large_int(21), g));
    ECMATH_ASSERT_EQUAL(c.inf(), scalar_mul(large_int(0), g));
}

void test_field_group_laws()
{
    const f223_curve c;
    const auto o = c.inf();
    const auto points = c.all_points();
    ECMATH_ASSERT_BINARY_MESSAGE(points.size(), >, 0U, "No points found");
    const std::vector<ec::field_point> others = { c.pt(47, 71), c.pt(6, 0), c.pt(192, 105), c.pt(17, 56) };

    for (const auto& p : points) {
        ECMATH_ASSERT_EQUAL(p, p + o);
        ECMATH_ASSERT_EQUAL(p, o + p);
        ECMATH_ASSERT_EQUAL(o, p + negate(p));
        for (const auto& q : others) {
            ECMATH_ASSERT_EQUAL(p + q, q + p);
        }
    }
}

void test_secp256k1()
{
    const large_int p("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F");
    const large_int n("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");
    auto fe = [&p](const char* s) { return field_element(large_int(s), p); };
    const auto a = field_element(0, p);
    const auto b = field_element(7, p);
    const ec::field_point g(fe("0x79BE667EF9DCBBAC55A06295CE870B07029BFCDB2DCE28D959F2815B16F81798"),
                            fe("0x483ADA7726A3C4655DA4FBFC0E1108A8FD17B448A68554199C47D08FFB10D4B8"), a, b);
    const ec::field_point g2(fe("0xC6047F9441ED7D6D3045406E95C07CD85C778E4B8CEF3CA7ABAC09B95C709EE5"),
                             fe("0x1AE168FEA63DC339A3C58419466CEAEEF7F632653266D0E1236431A950CFE52A"), a, b);
    const ec::field_point g3(fe("0xF9308A019258C31049344F85F89D5229B531C845836F99B08601F113BCE036F9"),
                             fe("0x388F7B0F632DE8140FE337E62A37F3566500A99934C2231B6CB9FD7584B8E672"), a, b);

    ECMATH_ASSERT_EQUAL(true, ec::curve_check(g.x().num(), g.y().num(), 1, 7, p));
    ECMATH_ASSERT_EQUAL(g2, g + g);
    ECMATH_ASSERT_EQUAL(g3, g + g2);
    ECMATH_ASSERT_EQUAL(g3, g2 + g);
    ECMATH_ASSERT_EQUAL(ec::field_point::infinity(a, b), scalar_mul(n, g));
    ECMATH_ASSERT_EQUAL(negate(g), scalar_mul(large_int(n - 1), g));

    for (int i = 0; i < 5; ++i) {
        const auto k1 = rand_positive_int_less(n);
        const auto k2 = rand_positive_int_less(n);
        const auto p1 = scalar_mul(k1, g);
        const auto p2 = scalar_mul(k2, g);
        ECMATH_ASSERT_EQUAL(p1 + p2, p2 + p1);
        ECMATH_ASSERT_EQUAL(scalar_mul(pmod(large_int(k1 + k2), n), g), p1 + p2);
    }
}

int main()
{
    test_curve_check();
    test_real_construction();
    test_real_equality();
    test_real_add();
    test_field_construction();
    test_field_add();
    test_field_multiples();
    test_field_group_laws();
    test_secp256k1();
}
