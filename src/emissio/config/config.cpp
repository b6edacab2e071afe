#include <emissio/config/config.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <emissio/encode/hex.hpp>

namespace emissio::config {

namespace {

using namespace std::string_literals;

const auto curve_section   = "curve"s;
const auto factory_section = "factory"s;

std::string scalar( const YAML::Node& node, std::string_view key )
{
  if( !node.IsScalar() )
    throw std::runtime_error( "option '" + std::string( key ) + "' must be a scalar" );

  return node.Scalar();
}

math::uint128 amount_or( const YAML::Node& node, std::string_view key, const math::uint128& fallback )
{
  auto child = node[ std::string( key ) ];
  if( !child )
    return fallback;

  return parse_amount( key, scalar( child, key ) );
}

std::uint64_t integer_or( const YAML::Node& node, std::string_view key, std::uint64_t fallback )
{
  auto child = node[ std::string( key ) ];
  if( !child )
    return fallback;

  auto value = parse_amount( key, scalar( child, key ) );
  if( value > std::numeric_limits< std::uint64_t >::max() )
    throw std::runtime_error( "option '" + std::string( key ) + "' is out of range" );

  return static_cast< std::uint64_t >( value );
}

protocol::account account_from( const YAML::Node& node, std::string_view key )
{
  auto bytes = encode::from_hex( scalar( node, key ) );
  if( !bytes || bytes->size() != protocol::account_size )
    throw std::runtime_error( "option '" + std::string( key ) + "' must be a hex encoded account" );

  protocol::account a{};
  std::ranges::copy( *bytes, a.begin() );
  return a;
}

curve::base_currency currency_from( const YAML::Node& node )
{
  auto name = scalar( node, "currency" );
  if( name == curve::to_string( curve::base_currency::busd ) )
    return curve::base_currency::busd;
  if( name == curve::to_string( curve::base_currency::frbtc ) )
    return curve::base_currency::frbtc;

  throw std::runtime_error( "option 'currency' has unknown value '" + name + "'" );
}

curve::lp_strategy strategy_from( const YAML::Node& node )
{
  auto strategy = node[ "strategy" ];
  if( !strategy )
    return curve::full_burn{};

  auto name = scalar( strategy, "strategy" );

  if( name == "full_burn" )
    return curve::full_burn{};

  if( name == "community_rewards" )
  {
    curve::community_rewards rewards;
    auto recipients = integer_or( node, "reward_recipients", curve::defaults::reward_recipients );
    if( recipients > std::numeric_limits< std::uint32_t >::max() )
      throw std::runtime_error( "option 'reward_recipients' is out of range" );

    rewards.recipients = static_cast< std::uint32_t >( recipients );
    return rewards;
  }

  if( name == "creator_allocation" )
    return curve::creator_allocation{};

  if( name == "dao_governance" )
  {
    auto recipient = node[ "dao_recipient" ];
    if( !recipient )
      throw std::runtime_error( "option 'dao_recipient' is required by the dao_governance strategy" );

    return curve::dao_governance{ account_from( recipient, "dao_recipient" ) };
  }

  throw std::runtime_error( "option 'strategy' has unknown value '" + name + "'" );
}

} // namespace

math::uint128 parse_amount( std::string_view key, std::string_view value )
{
  if( value.empty() )
    throw std::runtime_error( "option '" + std::string( key ) + "' is empty" );

  const math::uint128 max = std::numeric_limits< math::uint128 >::max();
  math::uint128 result    = 0;

  for( char c: value )
  {
    if( c == '_' || c == '\'' )
      continue;

    if( c < '0' || c > '9' )
      throw std::runtime_error( "option '" + std::string( key ) + "' is not a decimal amount" );

    const unsigned digit = static_cast< unsigned >( c - '0' );
    if( result > ( max - digit ) / 10 )
      throw std::runtime_error( "option '" + std::string( key ) + "' is out of range" );

    result = result * 10 + digit;
  }

  return result;
}

curve::launch_parameters parse_launch( const YAML::Node& node )
{
  curve::launch_parameters launch;
  if( !node )
    return launch;

  if( auto name = node[ "name" ] )
    launch.name = scalar( name, "name" );

  if( auto symbol = node[ "symbol" ] )
    launch.symbol = scalar( symbol, "symbol" );

  if( auto data = node[ "data" ] )
  {
    auto bytes = encode::from_hex( scalar( data, "data" ) );
    if( !bytes )
      throw std::runtime_error( "option 'data' must be hex encoded" );

    launch.data = std::move( *bytes );
  }

  auto& config = launch.config;

  // clang-format off
  config.base_price                      = amount_or( node, "base_price", config.base_price );
  config.growth_rate_bps                 = integer_or( node, "growth_rate_bps", config.growth_rate_bps );
  config.max_supply                      = amount_or( node, "max_supply", config.max_supply );
  config.graduation_market_cap_threshold = amount_or( node, "market_cap_threshold", config.graduation_market_cap_threshold );
  config.graduation_liquidity_threshold  = amount_or( node, "liquidity_threshold", config.graduation_liquidity_threshold );
  config.minimum_unique_holders          = integer_or( node, "minimum_unique_holders", config.minimum_unique_holders );
  config.minimum_age                     = integer_or( node, "minimum_age", config.minimum_age );
  config.fallback_age                    = integer_or( node, "fallback_age", config.fallback_age );
  config.fallback_liquidity              = amount_or( node, "fallback_liquidity", config.fallback_liquidity );
  // clang-format on

  if( auto currency = node[ "currency" ] )
    config.currency = currency_from( currency );

  config.strategy = strategy_from( node );

  if( config.validate() )
    throw std::runtime_error( "curve configuration is invalid" );

  return launch;
}

controller::factory_options parse_factory( const YAML::Node& node )
{
  controller::factory_options options;
  if( !node )
    return options;

  options.deployment_fee = amount_or( node, "deployment_fee", options.deployment_fee );

  if( auto collector = node[ "fee_collector" ] )
    options.fee_collector = account_from( collector, "fee_collector" );

  return options;
}

configuration parse( const YAML::Node& root )
{
  configuration c;
  c.launch  = parse_launch( root[ curve_section ] );
  c.factory = parse_factory( root[ factory_section ] );
  return c;
}

configuration load_file( const std::filesystem::path& path )
{
  return parse( YAML::LoadFile( path.string() ) );
}

} // namespace emissio::config
