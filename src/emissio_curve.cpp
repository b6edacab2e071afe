#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <emissio/config/config.hpp>
#include <emissio/curve/pricing.hpp>
#include <emissio/log.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option         = "help,h"s;
constexpr auto config_option       = "config,c"s;
const auto config_default          = "config.yml"s;
constexpr auto log_level_option    = "log-level,l"s;
constexpr auto log_level_default   = "info"s;
constexpr auto supply_option       = "supply,s"s;
constexpr auto supply_default      = "0"s;
constexpr auto amount_option       = "amount,a"s;
constexpr auto amount_default      = "1"s;
constexpr auto base_amount_option  = "base-amount,b"s;
constexpr auto base_amount_default = "0"s;

} // namespace constants

namespace program_options = boost::program_options;

using namespace emissio;

namespace {

std::string describe( const curve::result< math::uint128 >& value )
{
  if( !value )
    return "unavailable (" + value.error().message() + ")";

  return value->str();
}

// Overflow on the way to the cap means the threshold is passed before max supply
bool reachable( const curve::result< math::uint128 >& at_cap, const math::uint128& threshold )
{
  if( !at_cap )
    return at_cap.error() == math::math_errc::arithmetic_overflow;

  return *at_cap >= threshold;
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level;
  math::uint128 supply, amount, base_amount;
  curve::launch_parameters launch;

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()       , "Print this help message and exit" )
      ( constants::config_option.data()     , program_options::value< std::string >(), "The launch configuration file" )
      ( constants::log_level_option.data()  , program_options::value< std::string >(), "The log filtering level" )
      ( constants::supply_option.data()     , program_options::value< std::string >(), "The circulating supply to quote at" )
      ( constants::amount_option.data()     , program_options::value< std::string >(), "The token amount to quote" )
      ( constants::base_amount_option.data(), program_options::value< std::string >(), "The base currency amount to spend" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    auto config_file = std::filesystem::path(
      config::get_option< std::string >( constants::config_option, constants::config_default, args ) );

    YAML::Node root;
    YAML::Node cli_config;

    if( std::filesystem::exists( config_file ) )
    {
      root       = YAML::LoadFile( config_file.string() );
      cli_config = root[ "quote" ];
    }

    // clang-format off
    log_level   = config::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, cli_config );
    supply      = config::parse_amount( "supply", config::get_option< std::string >( constants::supply_option, constants::supply_default, args, cli_config ) );
    amount      = config::parse_amount( "amount", config::get_option< std::string >( constants::amount_option, constants::amount_default, args, cli_config ) );
    base_amount = config::parse_amount( "base-amount", config::get_option< std::string >( constants::base_amount_option, constants::base_amount_default, args, cli_config ) );
    // clang-format on

    log::initialize();
    log::set_level( log_level );

    if( root.IsNull() )
      LOG_WARNING( log::instance(), "Could not find config at {}. Using default values", config_file.string() );

    launch = config::parse( root ).launch;
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  const auto& cfg = launch.config;
  curve::pricing_engine engine( cfg );

  LOG_INFO( log::instance(),
            "Quoting {} curve with base price {} and growth rate {} bps",
            curve::to_string( cfg.currency ),
            log::amount{ cfg.base_price },
            cfg.growth_rate_bps );

  if( supply > cfg.max_supply )
  {
    LOG_ERROR( log::instance(), "Supply {} exceeds max supply {}", log::amount{ supply }, log::amount{ cfg.max_supply } );
    return EXIT_FAILURE;
  }

  std::cout << "price:      " << describe( engine.price_at( supply ) ) << '\n';
  std::cout << "market cap: " << describe( engine.market_cap( supply ) ) << '\n';
  std::cout << "buy " << amount << ":    " << describe( engine.quote_buy( supply, amount ) ) << '\n';

  if( amount <= supply )
    std::cout << "sell " << amount << ":   " << describe( engine.quote_sell( supply, amount ) ) << '\n';
  else
    std::cout << "sell " << amount << ":   unavailable (exceeds supply)" << '\n';

  if( base_amount > 0 )
  {
    const math::uint128 remaining = cfg.max_supply - supply;
    auto limit = math::mul_div( remaining, curve::defaults::max_trade_bps, math::basis_points );
    const math::uint128 cap = limit && *limit > 0 ? *limit : math::uint128( remaining > 0 ? 1 : 0 );

    std::cout << "tokens for " << base_amount << ": " << describe( engine.tokens_for( supply, base_amount, cap ) )
              << " (trade limit " << cap << ")" << '\n';
  }

  std::cout << "market cap threshold reachable: " << std::boolalpha
            << reachable( engine.market_cap( cfg.max_supply ), cfg.graduation_market_cap_threshold ) << '\n';
  std::cout << "liquidity threshold reachable:  " << std::boolalpha
            << reachable( engine.quote_buy( 0, cfg.max_supply ), cfg.graduation_liquidity_threshold ) << '\n';

  return EXIT_SUCCESS;
}
