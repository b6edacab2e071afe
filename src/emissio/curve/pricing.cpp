#include <emissio/curve/pricing.hpp>

namespace emissio::curve {

pricing_engine::pricing_engine( const curve_config& config ) noexcept:
    _config( config )
{}

result< uint128 > pricing_engine::price_at( const uint128& supply ) const noexcept
{
  const uint128 scale  = math::wad;
  const uint128 growth = scale + scale * _config.growth_rate_bps / math::basis_points;

  auto factor = math::pow_scaled( growth, supply, scale );
  if( !factor )
    return factor;

  return math::mul_div( _config.base_price, *factor, scale );
}

result< uint128 > pricing_engine::market_cap( const uint128& supply ) const noexcept
{
  auto price = price_at( supply );
  if( !price )
    return price;

  return math::checked_mul( supply, *price );
}

result< uint128 > pricing_engine::quote_buy( const uint128& supply, const uint128& amount ) const noexcept
{
  if( supply > _config.max_supply || amount > _config.max_supply - supply )
    return std::unexpected( curve_errc::supply_exceeded );

  auto start = price_at( supply );
  if( !start )
    return start;

  auto end = price_at( supply + amount );
  if( !end )
    return end;

  auto sum = math::checked_add( *start, *end );
  if( !sum )
    return sum;

  return math::mul_div( *sum, amount, 2 );
}

result< uint128 > pricing_engine::quote_sell( const uint128& supply, const uint128& amount ) const noexcept
{
  if( amount > supply )
    return std::unexpected( curve_errc::insufficient_supply );

  return quote_buy( supply - amount, amount );
}

result< uint128 >
pricing_engine::tokens_for( const uint128& supply, const uint128& base_amount, const uint128& limit ) const noexcept
{
  uint128 low  = 0;
  uint128 high = limit;

  while( low < high )
  {
    uint128 mid = low + ( high - low + 1 ) / 2;

    auto cost = quote_buy( supply, mid );
    if( cost && *cost <= base_amount )
    {
      low = mid;
    }
    else if( !cost && cost.error() != math::math_errc::arithmetic_overflow )
    {
      return std::unexpected( cost.error() );
    }
    else
    {
      high = mid - 1;
    }
  }

  return low;
}

} // namespace emissio::curve
