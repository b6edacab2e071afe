#include <test/fixture.hpp>

#include <algorithm>

#include <gtest/gtest.h>

#include <emissio/encode.hpp>
#include <emissio/log.hpp>

namespace test {

namespace {

constexpr std::uint8_t fee_collector_id = 0xfe;

template< typename T >
T expect_value( emissio::encode::result< T >&& value, const char* what )
{
  if( !value )
  {
    ADD_FAILURE() << "could not decode " << what << ": " << value.error().message();
    return T{};
  }

  return std::move( *value );
}

} // namespace

fixture::fixture( const std::string& log_level ):
    _fee_collector( make_user( fee_collector_id ) )
{
  emissio::log::initialize();
  emissio::log::set_level( log_level );

  emissio::controller::factory_options options;
  options.deployment_fee = deployment_fee;
  options.fee_collector  = _fee_collector;

  _controller = std::make_unique< emissio::controller::controller >( _amm, options );
}

fixture::~fixture() = default;

emissio::curve::launch_parameters fixture::make_launch( const std::string& symbol,
                                                        const emissio::math::uint128& liquidity_threshold )
{
  emissio::curve::launch_parameters parameters;
  parameters.name   = symbol + " Token";
  parameters.symbol = symbol;

  auto& config                           = parameters.config;
  config.base_price                      = 1'000;
  config.growth_rate_bps                 = 150;
  config.max_supply                      = 1'000'000;
  config.currency                        = emissio::curve::base_currency::busd;
  config.graduation_market_cap_threshold = emissio::math::uint128( 1 ) << 100;
  config.graduation_liquidity_threshold  = liquidity_threshold;
  config.minimum_unique_holders          = 1;
  config.minimum_age                     = 0;
  config.fallback_age                    = 0;
  config.strategy                        = emissio::curve::full_burn{};

  return parameters;
}

emissio::protocol::account fixture::make_funded_user( std::uint8_t id )
{
  auto user = make_user( id );

  for( auto currency: { emissio::curve::base_currency::busd, emissio::curve::base_currency::frbtc } )
    if( auto error = _controller->credit( user, currency, starting_funds ); error )
      ADD_FAILURE() << "could not fund user: " << error.message();

  return user;
}

emissio::protocol::account fixture::deploy( const emissio::protocol::account& creator,
                                            const emissio::curve::launch_parameters& parameters )
{
  auto token = _controller->deploy( creator, parameters );
  if( !token )
  {
    ADD_FAILURE() << "could not deploy " << parameters.symbol << ": " << token.error().message();
    return {};
  }

  return *token;
}

emissio::controller::result< emissio::protocol::program_output >
fixture::call( const emissio::protocol::account& caller,
               const emissio::protocol::account& token,
               const emissio::program::instruction::request& request,
               const emissio::math::uint128& attached )
{
  return _controller->process( caller, token, make_input( request ), attached );
}

emissio::controller::result< emissio::protocol::program_output >
fixture::query( const emissio::protocol::account& token, const emissio::program::instruction::request& request ) const
{
  return _controller->read_program( token, make_input( request ) );
}

emissio::math::uint128 fixture::funds( const emissio::protocol::account& account ) const
{
  auto balance = _controller->balance( account, emissio::curve::base_currency::busd );
  if( !balance )
  {
    ADD_FAILURE() << "could not read balance: " << balance.error().message();
    return 0;
  }

  return *balance;
}

emissio::protocol::program_input fixture::make_input( const emissio::program::instruction::request& request )
{
  emissio::protocol::program_input input;
  input.stdin = emissio::program::instruction::encode( request );
  return input;
}

trade_receipt fixture::decode_trade( const emissio::protocol::program_output& output )
{
  emissio::encode::span_source source( output.stdout );
  emissio::encode::reader r( source );

  trade_receipt receipt;
  receipt.tokens      = expect_value( r.read_uint128(), "tokens" );
  receipt.base_amount = expect_value( r.read_uint128(), "base amount" );
  receipt.refund      = expect_value( r.read_uint128(), "refund" );
  receipt.graduated   = expect_value( r.read_bool(), "graduation flag" );

  EXPECT_EQ( source.remaining(), 0 );
  return receipt;
}

emissio::math::uint128 fixture::decode_amount( const emissio::protocol::program_output& output )
{
  emissio::encode::span_source source( output.stdout );
  emissio::encode::reader r( source );

  auto amount = expect_value( r.read_uint128(), "amount" );
  EXPECT_EQ( source.remaining(), 0 );
  return amount;
}

bool fixture::decode_bool( const emissio::protocol::program_output& output )
{
  emissio::encode::span_source source( output.stdout );
  emissio::encode::reader r( source );

  auto value = expect_value( r.read_bool(), "bool" );
  EXPECT_EQ( source.remaining(), 0 );
  return value;
}

std::string fixture::decode_string( const emissio::protocol::program_output& output )
{
  emissio::encode::span_source source( output.stdout );
  emissio::encode::reader r( source );

  auto str = expect_value( r.read_string(), "string" );
  EXPECT_EQ( source.remaining(), 0 );
  return str;
}

std::optional< emissio::protocol::account > fixture::decode_pool( const emissio::protocol::program_output& output )
{
  emissio::encode::span_source source( output.stdout );
  emissio::encode::reader r( source );

  if( !expect_value( r.read_bool(), "pool flag" ) )
    return std::nullopt;

  return expect_value( r.read_array< emissio::protocol::account_size >(), "pool" );
}

} // namespace test
