#include <emissio/controller/controller.hpp>
#include <emissio/controller/bank.hpp>
#include <emissio/controller/execution_context.hpp>
#include <emissio/controller/state.hpp>

#include <emissio/encode.hpp>
#include <emissio/log.hpp>
#include <emissio/program.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <utility>

#include <boost/endian.hpp>

namespace emissio::controller {

namespace {

using index_bytes = std::array< std::byte, sizeof( std::uint64_t ) >;

index_bytes to_big_endian( std::uint64_t value ) noexcept
{
  index_bytes bytes{};
  boost::endian::native_to_big_inplace( value );
  std::memcpy( bytes.data(), &value, sizeof( value ) );
  return bytes;
}

std::uint64_t from_big_endian( std::span< const std::byte, sizeof( std::uint64_t ) > bytes ) noexcept
{
  std::uint64_t value = 0;
  std::memcpy( &value, bytes.data(), sizeof( value ) );
  return boost::endian::big_to_native( value );
}

std::uint64_t to_seconds( std::chrono::system_clock::time_point time ) noexcept
{
  return static_cast< std::uint64_t >(
    std::chrono::duration_cast< std::chrono::seconds >( time.time_since_epoch() ).count() );
}

std::vector< std::byte > creator_key( const protocol::account& creator, std::uint64_t index )
{
  std::vector< std::byte > key( creator.begin(), creator.end() );
  auto bytes = to_big_endian( index );
  key.insert( key.end(), bytes.begin(), bytes.end() );
  return state_db::make_key( state::space::creator_index(), key );
}

result< std::uint64_t > read_counter( const state_db::state_delta& delta, std::span< const std::byte > key )
{
  auto object = delta.get( state_db::make_key( state::space::metadata(), key ) );
  if( !object )
    return 0;

  if( object->size() != sizeof( std::uint64_t ) )
    return std::unexpected( controller_errc::unexpected_object );

  return from_big_endian( object->first< sizeof( std::uint64_t ) >() );
}

result< std::uint64_t > read_token_count( const state_db::state_delta& delta )
{
  return read_counter( delta, state::key::token_count() );
}

// The fee stored by set_deployment_fee, or the configured fee if none was set
result< math::uint128 > read_deployment_fee( const state_db::state_delta& delta, const math::uint128& fallback )
{
  auto object = delta.get( state_db::make_key( state::space::metadata(), state::key::deployment_fee() ) );
  if( !object )
    return fallback;

  if( object->size() != encode::uint128_size )
    return std::unexpected( controller_errc::unexpected_object );

  return encode::from_little_endian( object->first< encode::uint128_size >() );
}

void put_entry( state_db::state_delta& delta, const state::token_entry& entry )
{
  delta.put( state_db::make_key( state::space::registry(), to_big_endian( entry.index ) ), encode::to_archive( entry ) );
}

/**
 * Marks the registry entry graduated once the program has stored its
 * graduation record. The record only ever appears through a successful
 * graduation, so its presence in the invocation delta is the signal.
 */
std::error_code record_graduation( state_db::state_delta& delta, state::token_entry& entry )
{
  if( entry.graduated )
    return controller_errc::ok;

  auto object = delta.get(
    state_db::make_key( state::space::program( entry.account, program::bonding_curve::record_id ), std::span< const std::byte >{} ) );
  if( !object )
    return controller_errc::ok;

  auto record = encode::from_archive< curve::graduation_record >( *object );
  if( !record )
    return controller_errc::unexpected_object;

  auto count = read_counter( delta, state::key::graduated_count() );
  if( !count )
    return count.error();

  entry.graduated = true;
  entry.pool      = record->pool;

  put_entry( delta, entry );
  delta.put( state_db::make_key( state::space::metadata(), state::key::graduated_count() ), to_big_endian( *count + 1 ) );

  LOG_INFO( emissio::log::instance(),
            "Registry marked {} graduated - Pool: {}",
            entry.symbol,
            emissio::log::hex{ entry.pool.data(), entry.pool.size() } );

  return controller_errc::ok;
}

} // namespace

controller::controller( amm::pool_interface& pool, factory_options options ):
    _root( std::make_shared< state_db::state_delta >() ),
    _program( std::make_unique< program::bonding_curve >() ),
    _pool( pool ),
    _options( std::move( options ) )
{}

controller::~controller() = default;

result< protocol::account > controller::deploy( const protocol::account& creator,
                                                const curve::launch_parameters& parameters,
                                                std::chrono::system_clock::time_point now )
{
  if( auto error = parameters.validate(); error )
    return std::unexpected( error );

  const auto currency = parameters.config.currency;
  auto delta          = _root->make_child();

  auto fee = read_deployment_fee( *delta, _options.deployment_fee );
  if( !fee )
    return std::unexpected( fee.error() );

  if( *fee > 0 )
  {
    bank b( delta );
    if( auto error = b.transfer( creator, _options.fee_collector, currency, *fee ); error )
    {
      if( error == controller_errc::insufficient_funds )
        return std::unexpected( controller_errc::insufficient_fee );

      return std::unexpected( error );
    }
  }

  auto index = read_token_count( *delta );
  if( !index )
    return std::unexpected( index.error() );

  const auto account = protocol::token_account( *index );

  protocol::program_input input;
  input.stdin = program::instruction::encode( program::instruction::initialize{ parameters } );

  if( auto output = invoke( delta, creator, account, currency, input, 0, now ); !output )
  {
    LOG_INFO( emissio::log::instance(), "Deployment of {} failed: {}", parameters.symbol, output.error().message() );
    return std::unexpected( output.error() );
  }

  state::token_entry entry;
  entry.index       = *index;
  entry.account     = account;
  entry.name        = parameters.name;
  entry.symbol      = parameters.symbol;
  entry.creator     = creator;
  entry.currency    = currency;
  entry.launched_at = to_seconds( now );

  put_entry( *delta, entry );
  delta->put( state_db::make_key( state::space::token_index(), account ), to_big_endian( *index ) );
  delta->put( creator_key( creator, *index ), std::vector< std::byte >{} );
  delta->put( state_db::make_key( state::space::metadata(), state::key::token_count() ), to_big_endian( *index + 1 ) );

  delta->squash();

  LOG_INFO( emissio::log::instance(),
            "Deployed {} ({}) at {} - Creator: {}, Currency: {}",
            entry.name,
            entry.symbol,
            emissio::log::hex{ account.data(), account.size() },
            emissio::log::hex{ creator.data(), creator.size() },
            curve::to_string( currency ) );

  return account;
}

result< protocol::program_output > controller::process( const protocol::account& caller,
                                                        const protocol::account& token,
                                                        const protocol::program_input& input,
                                                        const math::uint128& attached,
                                                        std::chrono::system_clock::time_point now )
{
  auto entry = this->token( token );
  if( !entry )
    return std::unexpected( entry.error() );

  auto delta  = _root->make_child();
  auto output = invoke( delta, caller, token, entry->currency, input, attached, now );
  if( !output )
  {
    LOG_INFO( emissio::log::instance(),
              "Invocation of {} failed: {}",
              emissio::log::hex{ token.data(), token.size() },
              output.error().message() );
    return output;
  }

  if( auto error = record_graduation( *delta, *entry ); error )
    return std::unexpected( error );

  delta->squash();
  return output;
}

result< protocol::program_output > controller::read_program( const protocol::account& token,
                                                             const protocol::program_input& input,
                                                             std::chrono::system_clock::time_point now ) const
{
  auto entry = this->token( token );
  if( !entry )
    return std::unexpected( entry.error() );

  encode::span_source source( input.stdin );
  if( auto request = program::instruction::decode( source ); request && program::instruction::mutates( *request ) )
    return std::unexpected( controller_errc::read_only );

  return invoke( _root->make_child(), protocol::account{}, token, entry->currency, input, 0, now );
}

result< protocol::program_output > controller::invoke( const std::shared_ptr< state_db::state_delta >& delta,
                                                       const protocol::account& caller,
                                                       const protocol::account& token,
                                                       curve::base_currency currency,
                                                       const protocol::program_input& input,
                                                       const math::uint128& attached,
                                                       std::chrono::system_clock::time_point now ) const
{
  if( attached > 0 )
  {
    bank b( delta );
    if( auto error = b.transfer( caller, token, currency, attached ); error )
      return std::unexpected( error );
  }

  invocation frame;
  frame.program_id = token;
  frame.caller     = caller;
  frame.currency   = currency;
  frame.stdin      = input.stdin;
  frame.arguments  = input.arguments;
  frame.attached   = attached;
  frame.time       = to_seconds( now );

  execution_context context( delta, _pool, frame );

  if( auto error = context.run( *_program ); error )
    return std::unexpected( error );

  return std::move( context.output() );
}

std::error_code
controller::credit( const protocol::account& account, curve::base_currency currency, const math::uint128& amount )
{
  bank b( _root );
  return b.credit( account, currency, amount );
}

result< math::uint128 > controller::balance( const protocol::account& account, curve::base_currency currency ) const
{
  bank b( _root );
  return b.balance( account, currency );
}

std::uint64_t controller::token_count() const
{
  return read_token_count( *_root ).value_or( 0 );
}

result< factory_stats > controller::stats() const
{
  factory_stats s;

  auto total = read_token_count( *_root );
  if( !total )
    return std::unexpected( total.error() );

  auto graduated = read_counter( *_root, state::key::graduated_count() );
  if( !graduated )
    return std::unexpected( graduated.error() );

  auto fee = read_deployment_fee( *_root, _options.deployment_fee );
  if( !fee )
    return std::unexpected( fee.error() );

  s.total_tokens     = *total;
  s.graduated_tokens = *graduated;
  s.deployment_fee   = *fee;
  return s;
}

std::error_code controller::set_deployment_fee( const protocol::account& caller, const math::uint128& fee )
{
  if( caller != _options.fee_collector )
    return controller_errc::unauthorized;

  _root->put( state_db::make_key( state::space::metadata(), state::key::deployment_fee() ), encode::to_little_endian( fee ) );

  LOG_INFO( emissio::log::instance(), "Deployment fee set to {}", emissio::log::amount{ fee } );
  return controller_errc::ok;
}

result< state::token_entry > controller::entry_at( std::uint64_t index ) const
{
  auto object = _root->get( state_db::make_key( state::space::registry(), to_big_endian( index ) ) );
  if( !object )
    return std::unexpected( controller_errc::unknown_token );

  auto entry = encode::from_archive< state::token_entry >( *object );
  if( !entry )
    return std::unexpected( controller_errc::unexpected_object );

  return entry;
}

result< state::token_entry > controller::token( const protocol::account& account ) const
{
  auto object = _root->get( state_db::make_key( state::space::token_index(), account ) );
  if( !object )
    return std::unexpected( controller_errc::unknown_token );

  if( object->size() != sizeof( std::uint64_t ) )
    return std::unexpected( controller_errc::unexpected_object );

  return entry_at( from_big_endian( object->first< sizeof( std::uint64_t ) >() ) );
}

result< std::vector< state::token_entry > > controller::tokens( std::uint64_t offset, std::uint64_t limit ) const
{
  std::vector< state::token_entry > entries;

  const auto count = token_count();
  for( auto index = offset; index < count && index - offset < limit; ++index )
  {
    auto entry = entry_at( index );
    if( !entry )
      return std::unexpected( entry.error() );

    entries.push_back( std::move( *entry ) );
  }

  return entries;
}

result< std::vector< state::token_entry > > controller::creator_tokens( const protocol::account& creator ) const
{
  std::vector< state::token_entry > entries;

  const auto prefix = state_db::make_key( state::space::creator_index(), creator );
  auto cursor       = prefix;

  for( auto object = _root->next( cursor ); object; object = _root->next( cursor ) )
  {
    const auto& key = object->first;
    if( key.size() != prefix.size() + sizeof( std::uint64_t ) || !std::ranges::equal( prefix, key.first( prefix.size() ) ) )
      break;

    auto entry = entry_at( from_big_endian( key.last< sizeof( std::uint64_t ) >() ) );
    if( !entry )
      return std::unexpected( entry.error() );

    entries.push_back( std::move( *entry ) );
    cursor.assign( key.begin(), key.end() );
  }

  return entries;
}

} // namespace emissio::controller
