#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include <emissio/curve/pricing.hpp>

using emissio::curve::curve_errc;
using emissio::math::uint128;

class pricing: public ::testing::Test
{
protected:
  pricing()
  {
    config.base_price      = 1'000;
    config.growth_rate_bps = 150;
    config.max_supply      = 1'000'000;
  }

  emissio::curve::curve_config config;
  emissio::curve::pricing_engine engine{ config };
};

TEST_F( pricing, price_at )
{
  auto price = engine.price_at( 0 );
  ASSERT_TRUE( price );
  EXPECT_EQ( *price, 1'000 );

  price = engine.price_at( 1 );
  ASSERT_TRUE( price );
  EXPECT_EQ( *price, 1'015 );

  price = engine.price_at( 99 );
  ASSERT_TRUE( price );
  EXPECT_EQ( *price, 4'366 );

  price = engine.price_at( 100 );
  ASSERT_TRUE( price );
  EXPECT_EQ( *price, 4'432 );

  price = engine.price_at( 1'000 );
  ASSERT_TRUE( price );
  EXPECT_EQ( *price, 2'924'436'860 );

  price = engine.price_at( 10'000 );
  ASSERT_FALSE( price );
  EXPECT_EQ( price.error(), emissio::math::math_errc::arithmetic_overflow );
}

TEST_F( pricing, first_token )
{
  auto price = engine.price_at( 0 );
  ASSERT_TRUE( price );
  EXPECT_EQ( *price, config.base_price );

  // The trapezoid between price( 0 ) = 1000 and price( 1 ) = 1015
  auto cost = engine.quote_buy( 0, 1 );
  ASSERT_TRUE( cost );
  EXPECT_EQ( *cost, 1'007 );
}

TEST_F( pricing, hundredth_token )
{
  auto cost = engine.quote_buy( 99, 1 );
  ASSERT_TRUE( cost );

  const double reference = 1'000.0 * std::pow( 1.015, 99.5 );
  EXPECT_LE( std::abs( cost->convert_to< double >() - reference ), 1.0 );
  EXPECT_EQ( *cost, 4'399 );
}

TEST_F( pricing, quote_buy )
{
  auto cost = engine.quote_buy( 0, 10 );
  ASSERT_TRUE( cost );
  EXPECT_EQ( *cost, 10'800 );

  cost = engine.quote_buy( 0, 100 );
  ASSERT_TRUE( cost );
  EXPECT_EQ( *cost, 271'600 );

  cost = engine.quote_buy( 0, 0 );
  ASSERT_TRUE( cost );
  EXPECT_EQ( *cost, 0 );

  cost = engine.quote_buy( 999'999, 2 );
  ASSERT_FALSE( cost );
  EXPECT_EQ( cost.error(), curve_errc::supply_exceeded );

  cost = engine.quote_buy( 0, 5'000 );
  ASSERT_FALSE( cost );
  EXPECT_EQ( cost.error(), emissio::math::math_errc::arithmetic_overflow );
}

TEST_F( pricing, quote_sell )
{
  auto payout = engine.quote_sell( 10, 11 );
  ASSERT_FALSE( payout );
  EXPECT_EQ( payout.error(), curve_errc::insufficient_supply );

  payout = engine.quote_sell( 10, 10 );
  ASSERT_TRUE( payout );
  EXPECT_EQ( *payout, 10'800 );
}

TEST_F( pricing, round_trip_symmetry )
{
  for( std::uint64_t supply: { 0, 1, 7, 99, 250, 1'000, 2'000 } )
  {
    for( std::uint64_t amount: { 1, 2, 13, 100, 500 } )
    {
      auto cost = engine.quote_buy( supply, amount );
      ASSERT_TRUE( cost ) << "supply " << supply << " amount " << amount;

      auto payout = engine.quote_sell( supply + amount, amount );
      ASSERT_TRUE( payout ) << "supply " << supply << " amount " << amount;

      EXPECT_EQ( *cost, *payout ) << "supply " << supply << " amount " << amount;
    }
  }
}

TEST_F( pricing, cost_is_monotonic )
{
  uint128 previous = 0;
  for( std::uint64_t amount = 1; amount <= 300; ++amount )
  {
    auto cost = engine.quote_buy( 50, amount );
    ASSERT_TRUE( cost );
    EXPECT_GT( *cost, previous );
    previous = *cost;
  }
}

TEST_F( pricing, market_cap )
{
  auto cap = engine.market_cap( 0 );
  ASSERT_TRUE( cap );
  EXPECT_EQ( *cap, 0 );

  cap = engine.market_cap( 100 );
  ASSERT_TRUE( cap );
  EXPECT_EQ( *cap, 443'200 );
}

TEST_F( pricing, tokens_for )
{
  auto tokens = engine.tokens_for( 0, 10'800, 1'000 );
  ASSERT_TRUE( tokens );
  EXPECT_EQ( *tokens, 10 );

  tokens = engine.tokens_for( 0, 10'799, 1'000 );
  ASSERT_TRUE( tokens );
  EXPECT_EQ( *tokens, 9 );

  tokens = engine.tokens_for( 0, 1'006, 1'000 );
  ASSERT_TRUE( tokens );
  EXPECT_EQ( *tokens, 0 );

  tokens = engine.tokens_for( 0, 1'007, 1'000 );
  ASSERT_TRUE( tokens );
  EXPECT_EQ( *tokens, 1 );

  tokens = engine.tokens_for( 0, 10'800, 4 );
  ASSERT_TRUE( tokens );
  EXPECT_EQ( *tokens, 4 );

  // Quotes past the overflow point are treated as unaffordable
  tokens = engine.tokens_for( 0, std::numeric_limits< uint128 >::max(), 100'000 );
  ASSERT_TRUE( tokens );
  EXPECT_GT( *tokens, 3'000 );
  EXPECT_LT( *tokens, 3'176 );
}
