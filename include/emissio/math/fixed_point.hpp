#pragma once

#include <cstdint>

#include <boost/multiprecision/cpp_int.hpp>

#include <emissio/math/error.hpp>

namespace emissio::math {

using uint128 = boost::multiprecision::uint128_t;
using uint256 = boost::multiprecision::uint256_t;

constexpr std::uint64_t basis_points = 10'000;
constexpr std::uint64_t wad          = 1'000'000'000'000'000'000;

result< uint128 > checked_add( const uint128& a, const uint128& b ) noexcept;
result< uint128 > checked_sub( const uint128& a, const uint128& b ) noexcept;
result< uint128 > checked_mul( const uint128& a, const uint128& b ) noexcept;

/**
 * Computes a * b / denominator with a 256-bit intermediate. The quotient is
 * rounded toward zero and must fit in 128 bits.
 */
result< uint128 > mul_div( const uint128& a, const uint128& b, const uint128& denominator ) noexcept;

/**
 * Raises a fixed point number to an integer power by repeated squaring.
 *
 * Both the base and the result carry the given scale, so pow_scaled( 2 * scale, 3, scale )
 * yields 8 * scale. Every intermediate product is truncated back to the scale and checked
 * for overflow.
 */
result< uint128 > pow_scaled( const uint128& base, const uint128& exponent, const uint128& scale ) noexcept;

// (1 + rate)^exponent where base_bps = 10'000 + rate in basis points
result< uint128 > pow_bps( const uint128& base_bps, const uint128& exponent ) noexcept;

} // namespace emissio::math
