#include <gtest/gtest.h>

#include <limits>

#include <emissio/math/fixed_point.hpp>

using emissio::math::math_errc;
using emissio::math::uint128;

TEST( fixed_point, checked_arithmetic )
{
  const auto max = std::numeric_limits< uint128 >::max();

  auto sum = emissio::math::checked_add( uint128( 40 ), uint128( 2 ) );
  ASSERT_TRUE( sum );
  EXPECT_EQ( *sum, 42 );

  sum = emissio::math::checked_add( max, uint128( 1 ) );
  ASSERT_FALSE( sum );
  EXPECT_EQ( sum.error(), math_errc::arithmetic_overflow );

  auto difference = emissio::math::checked_sub( uint128( 1 ), uint128( 2 ) );
  ASSERT_FALSE( difference );
  EXPECT_EQ( difference.error(), math_errc::arithmetic_underflow );

  auto product = emissio::math::checked_mul( max / 2, uint128( 2 ) );
  ASSERT_TRUE( product );
  EXPECT_EQ( *product, max - 1 );

  product = emissio::math::checked_mul( max / 2 + 1, uint128( 2 ) );
  ASSERT_FALSE( product );
  EXPECT_EQ( product.error(), math_errc::arithmetic_overflow );
}

TEST( fixed_point, mul_div )
{
  const auto max = std::numeric_limits< uint128 >::max();

  auto value = emissio::math::mul_div( uint128( 7 ), uint128( 3 ), uint128( 2 ) );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 10 );

  // The numerator does not fit in 128 bits but the quotient does
  value = emissio::math::mul_div( max, max, max );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, max );

  value = emissio::math::mul_div( max, uint128( 3 ), uint128( 2 ) );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), math_errc::arithmetic_overflow );

  value = emissio::math::mul_div( uint128( 1 ), uint128( 1 ), uint128( 0 ) );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), math_errc::division_by_zero );
  EXPECT_EQ( value.error().message(), "division by zero" );
}

TEST( fixed_point, pow_bps )
{
  auto value = emissio::math::pow_bps( uint128( 10'150 ), uint128( 0 ) );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 10'000 );

  value = emissio::math::pow_bps( uint128( 10'150 ), uint128( 1 ) );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 10'150 );

  // 1.015^2 = 1.030225, truncated to basis points
  value = emissio::math::pow_bps( uint128( 10'150 ), uint128( 2 ) );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 10'302 );

  value = emissio::math::pow_bps( uint128( 10'150 ), uint128( 10 ) );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 11'603 );

  value = emissio::math::pow_bps( uint128( 20'000 ), uint128( 10 ) );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 10'240'000 );

  value = emissio::math::pow_bps( uint128( 10'000 ), std::numeric_limits< uint128 >::max() );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, 10'000 );

  value = emissio::math::pow_bps( uint128( 20'000 ), uint128( 200 ) );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), math_errc::arithmetic_overflow );
}

TEST( fixed_point, pow_scaled )
{
  const uint128 scale = emissio::math::wad;

  auto value = emissio::math::pow_scaled( scale * 2, uint128( 3 ), scale );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value, scale * 8 );

  // 1.015^100 at 18 decimal places
  value = emissio::math::pow_scaled( scale + scale * 150 / 10'000, uint128( 100 ), scale );
  ASSERT_TRUE( value );
  EXPECT_EQ( *value / ( scale / 1'000 ), 4'432 );

  value = emissio::math::pow_scaled( scale, uint128( 5 ), uint128( 0 ) );
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), math_errc::division_by_zero );
}
