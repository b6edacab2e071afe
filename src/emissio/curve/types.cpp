#include <emissio/curve/types.hpp>

#include <algorithm>
#include <utility>

namespace emissio::curve {

namespace {

constexpr std::uint8_t busd_block  = 2;
constexpr std::uint16_t busd_tx    = 56'801;
constexpr std::uint8_t frbtc_block = 32;
constexpr std::uint16_t frbtc_tx   = 0;

bool empty_account( const protocol::account& a ) noexcept
{
  return std::ranges::all_of( a, []( std::byte b ) { return b == std::byte{ 0 }; } );
}

} // namespace

std::error_code curve_config::validate() const noexcept
{
  if( base_price == 0 || growth_rate_bps == 0 || max_supply == 0 )
    return curve_errc::invalid_config;

  if( auto rewards = std::get_if< community_rewards >( &strategy ); rewards && !rewards->recipients )
    return curve_errc::invalid_config;

  if( auto dao = std::get_if< dao_governance >( &strategy ); dao && empty_account( dao->recipient ) )
    return curve_errc::invalid_config;

  return curve_errc::ok;
}

result< uint128 > distribution_plan::total() const noexcept
{
  uint128 sum = burned;

  for( const auto& allocation: allocations )
  {
    auto next = math::checked_add( sum, allocation.amount );
    if( !next )
      return next;

    sum = *next;
  }

  return sum;
}

std::error_code launch_parameters::validate() const noexcept
{
  if( name.empty() || symbol.empty() )
    return curve_errc::invalid_argument;

  return config.validate();
}

std::string_view to_string( base_currency currency ) noexcept
{
  switch( currency )
  {
    case base_currency::busd:
      return "busd";
    case base_currency::frbtc:
      return "frbtc";
  }
  std::unreachable();
}

std::string_view strategy_name( const lp_strategy& strategy ) noexcept
{
  struct visitor
  {
    std::string_view operator()( const full_burn& ) const noexcept
    {
      return "full_burn";
    }

    std::string_view operator()( const community_rewards& ) const noexcept
    {
      return "community_rewards";
    }

    std::string_view operator()( const creator_allocation& ) const noexcept
    {
      return "creator_allocation";
    }

    std::string_view operator()( const dao_governance& ) const noexcept
    {
      return "dao_governance";
    }
  };

  return std::visit( visitor{}, strategy );
}

protocol::account currency_account( base_currency currency ) noexcept
{
  protocol::account a{};
  a[ 0 ] = static_cast< std::byte >( protocol::account_kind::asset );

  auto [ block, tx ] = currency == base_currency::busd ? std::pair{ busd_block, busd_tx }
                                                       : std::pair{ frbtc_block, frbtc_tx };

  a[ 1 ] = static_cast< std::byte >( block );
  a[ 2 ] = static_cast< std::byte >( tx >> 8 );
  a[ 3 ] = static_cast< std::byte >( tx & 0xff );
  return a;
}

} // namespace emissio::curve
