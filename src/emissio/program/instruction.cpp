#include <emissio/program/instruction.hpp>

#include <iterator>
#include <utility>
#include <variant>

namespace emissio::program::instruction {

namespace {

struct encoder
{
  encode::writer& w;

  void operator()( const initialize& init ) const
  {
    w.write_string( init.parameters.name ).write_string( init.parameters.symbol );
    encode_config( w, init.parameters.config );
    w.write_blob( init.parameters.data );
  }

  void operator()( const buy& b ) const
  {
    w.write_uint128( b.min_tokens_out );
  }

  void operator()( const sell& s ) const
  {
    w.write_uint128( s.amount ).write_uint128( s.min_base_out );
  }

  void operator()( const get_buy_quote& q ) const
  {
    w.write_uint128( q.amount );
  }

  void operator()( const get_sell_quote& q ) const
  {
    w.write_uint128( q.amount );
  }

  void operator()( const transfer& t ) const
  {
    w.write_bytes( t.to ).write_uint128( t.amount );
  }

  void operator()( const balance_of& b ) const
  {
    w.write_bytes( b.holder );
  }

  template< typename T >
  void operator()( const T& ) const
  {}
};

struct strategy_encoder
{
  encode::writer& w;

  void operator()( const curve::full_burn& ) const {}

  void operator()( const curve::community_rewards& rewards ) const
  {
    w.write_integral( rewards.recipients );
  }

  void operator()( const curve::creator_allocation& ) const {}

  void operator()( const curve::dao_governance& dao ) const
  {
    w.write_bytes( dao.recipient );
  }
};

} // namespace

opcode code( const request& r ) noexcept
{
  static constexpr opcode codes[] = { opcode::initialize,
                                      opcode::buy,
                                      opcode::sell,
                                      opcode::get_buy_quote,
                                      opcode::get_sell_quote,
                                      opcode::graduate,
                                      opcode::get_state,
                                      opcode::transfer,
                                      opcode::get_name,
                                      opcode::get_symbol,
                                      opcode::get_supply,
                                      opcode::get_reserves,
                                      opcode::get_pool,
                                      opcode::is_graduated,
                                      opcode::balance_of,
                                      opcode::get_graduation_record,
                                      opcode::get_data };

  static_assert( std::size( codes ) == std::variant_size_v< request > );

  return codes[ r.index() ];
}

bool mutates( const request& r ) noexcept
{
  switch( code( r ) )
  {
    case opcode::initialize:
    case opcode::buy:
    case opcode::sell:
    case opcode::graduate:
    case opcode::transfer:
      return true;
    default:
      return false;
  }
}

void encode_config( encode::writer& w, const curve::curve_config& config )
{
  w.write_uint128( config.base_price )
    .write_integral( config.growth_rate_bps )
    .write_uint128( config.max_supply )
    .write_integral( std::to_underlying( config.currency ) )
    .write_uint128( config.graduation_market_cap_threshold )
    .write_uint128( config.graduation_liquidity_threshold )
    .write_integral( config.minimum_unique_holders )
    .write_integral( config.minimum_age )
    .write_integral( config.fallback_age )
    .write_uint128( config.fallback_liquidity )
    .write_integral( static_cast< std::uint8_t >( config.strategy.index() ) );

  std::visit( strategy_encoder{ w }, config.strategy );
}

std::vector< std::byte > encode( const request& r )
{
  encode::writer w;
  w.write_integral( std::to_underlying( code( r ) ) );
  std::visit( encoder{ w }, r );
  return w.release();
}

} // namespace emissio::program::instruction
