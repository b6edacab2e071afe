#pragma once

#include <emissio/curve/error.hpp>
#include <emissio/curve/types.hpp>

namespace emissio::curve {

/**
 * Prices tokens on the exponential curve
 *
 *   price( s ) = base_price * ( 1 + growth_rate_bps / 10'000 )^s
 *
 * The growth factor is raised with 18 decimals of precision (math::wad, via
 * math::pow_scaled) in place of the four decimals of math::pow_bps, and the
 * result is truncated to the smallest base currency unit. The cost of the half open range
 * [s, s + n) is the trapezoid ( price( s ) + price( s + n ) ) * n / 2, rounded down.
 * Selling n tokens at supply s pays exactly what buying them at s - n cost.
 *
 * All members are pure and may be used for read only quotes.
 */
class pricing_engine
{
public:
  explicit pricing_engine( const curve_config& config ) noexcept;

  result< uint128 > price_at( const uint128& supply ) const noexcept;
  result< uint128 > market_cap( const uint128& supply ) const noexcept;

  result< uint128 > quote_buy( const uint128& supply, const uint128& amount ) const noexcept;
  result< uint128 > quote_sell( const uint128& supply, const uint128& amount ) const noexcept;

  /**
   * The largest token count in [0, limit] whose buy cost at supply does not exceed
   * base_amount. Rounds the token count down; quotes that overflow count as
   * unaffordable.
   */
  result< uint128 > tokens_for( const uint128& supply, const uint128& base_amount, const uint128& limit ) const noexcept;

private:
  const curve_config& _config;
};

} // namespace emissio::curve
