#include <emissio/math/fixed_point.hpp>

#include <limits>

namespace emissio::math {

result< uint128 > checked_add( const uint128& a, const uint128& b ) noexcept
{
  if( std::numeric_limits< uint128 >::max() - a < b )
    return std::unexpected( math_errc::arithmetic_overflow );

  return a + b;
}

result< uint128 > checked_sub( const uint128& a, const uint128& b ) noexcept
{
  if( b > a )
    return std::unexpected( math_errc::arithmetic_underflow );

  return a - b;
}

result< uint128 > checked_mul( const uint128& a, const uint128& b ) noexcept
{
  uint256 product = uint256( a ) * uint256( b );

  if( product > uint256( std::numeric_limits< uint128 >::max() ) )
    return std::unexpected( math_errc::arithmetic_overflow );

  return static_cast< uint128 >( product );
}

result< uint128 > mul_div( const uint128& a, const uint128& b, const uint128& denominator ) noexcept
{
  if( denominator == 0 )
    return std::unexpected( math_errc::division_by_zero );

  uint256 quotient = uint256( a ) * uint256( b ) / uint256( denominator );

  if( quotient > uint256( std::numeric_limits< uint128 >::max() ) )
    return std::unexpected( math_errc::arithmetic_overflow );

  return static_cast< uint128 >( quotient );
}

result< uint128 > pow_scaled( const uint128& base, const uint128& exponent, const uint128& scale ) noexcept
{
  if( scale == 0 )
    return std::unexpected( math_errc::division_by_zero );

  uint128 value  = scale;
  uint128 square = base;
  uint128 e      = exponent;

  while( e > 0 )
  {
    if( boost::multiprecision::bit_test( e, 0 ) )
    {
      auto product = mul_div( value, square, scale );
      if( !product )
        return product;

      value = *product;
    }

    e >>= 1;

    if( e > 0 )
    {
      auto product = mul_div( square, square, scale );
      if( !product )
        return product;

      square = *product;
    }
  }

  return value;
}

result< uint128 > pow_bps( const uint128& base_bps, const uint128& exponent ) noexcept
{
  return pow_scaled( base_bps, exponent, basis_points );
}

} // namespace emissio::math
