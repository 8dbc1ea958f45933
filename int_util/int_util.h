#ifndef ECMATH_INT_UTIL_INT_UTIL_H_INCLUDED
#define ECMATH_INT_UTIL_INT_UTIL_H_INCLUDED

#include <cassert>
#include <cstdlib>
#include <vector>
#include <int_util/int.h>
#include <util/random.h>
#include <stdint.h>

#ifdef _MSC_VER
#pragma warning(disable: 4319) // C4319: '~': zero extending 'const unsigned long' to 'boost::multiprecision::double_limb_type' of greater size
#pragma warning(disable: 4193) // C4193 : #pragma warning(pop) : no matching '#pragma warning(push)'
#endif
#include <boost/multiprecision/miller_rabin.hpp>

namespace ecmath {

// Mathematical modulo: the result is in [0, p) even when a is negative
template<typename a_expr, typename IntType>
IntType pmod(const a_expr& a, const IntType& p) {
    IntType res = a % p;
    if (res < 0) res += p;
    assert(res >= 0 && res < p);
    return res;
}

// base^exponent (mod modulus) by repeated squaring, exponent must be non-negative
template<typename IntType>
IntType powm_mod(const IntType& base, const IntType& exponent, const IntType& modulus) {
    assert(exponent >= 0);
    assert(modulus > 0);
    return IntType(boost::multiprecision::powm(pmod(base, modulus), exponent, modulus));
}

template<typename IntType>
IntType be_uint_from_bytes(const std::vector<uint8_t>& bytes)
{
    IntType res = 0;
    for (const auto& byte : bytes ) {
        res <<= 8;
        res |= byte;
    }
    return res;
}

template<typename IntType>
size_t ilog256(IntType n)
{
    assert(n >= 0);
    size_t size = 1;
    while (n > 255) {
        ++size;
        n >>= 8;
    }
    return size;
}

template<typename IntType>
IntType rand_int_less(const IntType& less_than) {
    assert(less_than > 0);
    const auto byte_count   = static_cast<uint32_t>(ilog256<IntType>(less_than - 1));
    const auto leading_byte = static_cast<uint8_t>(((less_than-1) >> (8*(byte_count-1))) & 0xff);

    uint8_t lead_byte_mask = 0xFF;
    while ((lead_byte_mask>>1) > leading_byte) {
        lead_byte_mask >>= 1;
    }
    assert(lead_byte_mask);

    assert(byte_count != 0);
    std::vector<uint8_t> bytes(byte_count);
    IntType res;
    int iter = 0;
    do {
        util::get_random_bytes(&bytes[0], bytes.size());
        bytes[0] &= lead_byte_mask;
        res = be_uint_from_bytes<IntType>(bytes);
        if (++iter > 1000) {
            assert(!"Internal error");
            std::abort();
        }
    } while (res >= less_than);
    return res;
}

template<typename IntType>
IntType rand_positive_int_less(const IntType& n) {
    assert(n > 1 && "Empty range");
    return 1 + rand_int_less<IntType>(n - 1);
}

template<typename IntType>
bool is_prime(const IntType& n) {
    if (n < 2) return false;
    return miller_rabin_test(n, 25);
}

} // namespace ecmath

#endif
