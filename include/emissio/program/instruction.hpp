#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <emissio/curve/types.hpp>
#include <emissio/encode/binary.hpp>
#include <emissio/program/error.hpp>

namespace emissio::program::instruction {

enum class opcode : std::uint32_t // NOLINT(performance-enum-size)
{
  initialize            = 200,
  buy                   = 201,
  sell                  = 202,
  get_buy_quote         = 203,
  get_sell_quote        = 204,
  graduate              = 205,
  get_state             = 206,
  transfer              = 207,
  get_name              = 299,
  get_symbol            = 300,
  get_supply            = 301,
  get_reserves          = 302,
  get_pool              = 303,
  is_graduated          = 304,
  balance_of            = 305,
  get_graduation_record = 306,
  get_data              = 1'000
};

struct initialize
{
  curve::launch_parameters parameters;
};

// The base amount spent is the value attached to the invocation
struct buy
{
  math::uint128 min_tokens_out = 0;
};

struct sell
{
  math::uint128 amount       = 0;
  math::uint128 min_base_out = 0;
};

struct get_buy_quote
{
  math::uint128 amount = 0;
};

struct get_sell_quote
{
  math::uint128 amount = 0;
};

struct graduate
{};

struct get_state
{};

struct transfer
{
  protocol::account to{};
  math::uint128 amount = 0;
};

struct get_name
{};

struct get_symbol
{};

struct get_supply
{};

struct get_reserves
{};

struct get_pool
{};

struct is_graduated
{};

struct balance_of
{
  protocol::account holder{};
};

struct get_graduation_record
{};

struct get_data
{};

using request = std::variant< initialize,
                              buy,
                              sell,
                              get_buy_quote,
                              get_sell_quote,
                              graduate,
                              get_state,
                              transfer,
                              get_name,
                              get_symbol,
                              get_supply,
                              get_reserves,
                              get_pool,
                              is_graduated,
                              balance_of,
                              get_graduation_record,
                              get_data >;

opcode code( const request& r ) noexcept;

// Whether the request changes curve state
bool mutates( const request& r ) noexcept;

// Encodes the opcode followed by the request payload
std::vector< std::byte > encode( const request& r );

void encode_config( encode::writer& w, const curve::curve_config& config );

template< typename T, typename U >
std::error_code read_into( T& field, result< U >&& value )
{
  if( !value )
    return value.error();

  field = std::move( *value );
  return program_errc::ok;
}

template< encode::byte_source Source >
result< curve::curve_config > decode_config( encode::reader< Source >& r )
{
  curve::curve_config config;
  std::uint8_t currency = 0;

  if( auto error = read_into( config.base_price, r.read_uint128() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.growth_rate_bps, r.template read_integral< std::uint64_t >() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.max_supply, r.read_uint128() ); error )
    return std::unexpected( error );

  if( auto error = read_into( currency, r.template read_integral< std::uint8_t >() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.graduation_market_cap_threshold, r.read_uint128() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.graduation_liquidity_threshold, r.read_uint128() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.minimum_unique_holders, r.template read_integral< std::uint64_t >() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.minimum_age, r.template read_integral< std::uint64_t >() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.fallback_age, r.template read_integral< std::uint64_t >() ); error )
    return std::unexpected( error );

  if( auto error = read_into( config.fallback_liquidity, r.read_uint128() ); error )
    return std::unexpected( error );

  if( currency > std::to_underlying( curve::base_currency::frbtc ) )
    return std::unexpected( encode::encode_errc::invalid_value );

  config.currency = static_cast< curve::base_currency >( currency );

  auto tag = r.template read_integral< std::uint8_t >();
  if( !tag )
    return std::unexpected( tag.error() );

  switch( *tag )
  {
    case 0:
      config.strategy = curve::full_burn{};
      break;
    case 1:
      {
        curve::community_rewards rewards;
        if( auto error = read_into( rewards.recipients, r.template read_integral< std::uint32_t >() ); error )
          return std::unexpected( error );

        config.strategy = rewards;
        break;
      }
    case 2:
      config.strategy = curve::creator_allocation{};
      break;
    case 3:
      {
        curve::dao_governance dao;
        if( auto error = read_into( dao.recipient, r.template read_array< protocol::account_size >() ); error )
          return std::unexpected( error );

        config.strategy = dao;
        break;
      }
    default:
      return std::unexpected( encode::encode_errc::invalid_value );
  }

  return config;
}

/**
 * Decodes a request from its opcode and payload. Unknown opcodes fail with
 * program_errc::invalid_instruction; truncated payloads with an encode error.
 */
template< encode::byte_source Source >
result< request > decode( Source& source )
{
  encode::reader< Source > r( source );

  auto op = r.template read_integral< std::uint32_t >();
  if( !op )
    return std::unexpected( op.error() );

  switch( static_cast< opcode >( *op ) )
  {
    case opcode::initialize:
      {
        initialize init;

        auto name = r.read_string();
        if( !name )
          return std::unexpected( name.error() );

        auto symbol = r.read_string();
        if( !symbol )
          return std::unexpected( symbol.error() );

        auto config = decode_config( r );
        if( !config )
          return std::unexpected( config.error() );

        auto data = r.read_blob();
        if( !data )
          return std::unexpected( data.error() );

        init.parameters.name   = std::move( *name );
        init.parameters.symbol = std::move( *symbol );
        init.parameters.config = std::move( *config );
        init.parameters.data   = std::move( *data );
        return init;
      }
    case opcode::buy:
      {
        auto min_tokens_out = r.read_uint128();
        if( !min_tokens_out )
          return std::unexpected( min_tokens_out.error() );

        return buy{ *min_tokens_out };
      }
    case opcode::sell:
      {
        auto amount = r.read_uint128();
        if( !amount )
          return std::unexpected( amount.error() );

        auto min_base_out = r.read_uint128();
        if( !min_base_out )
          return std::unexpected( min_base_out.error() );

        return sell{ *amount, *min_base_out };
      }
    case opcode::get_buy_quote:
      {
        auto amount = r.read_uint128();
        if( !amount )
          return std::unexpected( amount.error() );

        return get_buy_quote{ *amount };
      }
    case opcode::get_sell_quote:
      {
        auto amount = r.read_uint128();
        if( !amount )
          return std::unexpected( amount.error() );

        return get_sell_quote{ *amount };
      }
    case opcode::graduate:
      return graduate{};
    case opcode::get_state:
      return get_state{};
    case opcode::transfer:
      {
        auto to = r.template read_array< protocol::account_size >();
        if( !to )
          return std::unexpected( to.error() );

        auto amount = r.read_uint128();
        if( !amount )
          return std::unexpected( amount.error() );

        return transfer{ *to, *amount };
      }
    case opcode::get_name:
      return get_name{};
    case opcode::get_symbol:
      return get_symbol{};
    case opcode::get_supply:
      return get_supply{};
    case opcode::get_reserves:
      return get_reserves{};
    case opcode::get_pool:
      return get_pool{};
    case opcode::is_graduated:
      return is_graduated{};
    case opcode::balance_of:
      {
        auto holder = r.template read_array< protocol::account_size >();
        if( !holder )
          return std::unexpected( holder.error() );

        return balance_of{ *holder };
      }
    case opcode::get_graduation_record:
      return get_graduation_record{};
    case opcode::get_data:
      return get_data{};
  }

  return std::unexpected( program_errc::invalid_instruction );
}

} // namespace emissio::program::instruction
