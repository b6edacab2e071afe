#include <emissio/controller/execution_context.hpp>
#include <emissio/controller/state.hpp>

#include <algorithm>
#include <stdexcept>

#include <emissio/encode/error.hpp>

namespace emissio::controller {

execution_context::execution_context( std::shared_ptr< state_db::state_delta > delta,
                                      amm::pool_interface& pool,
                                      invocation frame ):
    _delta( std::move( delta ) ),
    _pool( pool ),
    _bank( _delta ),
    _frame( frame )
{
  if( !_delta )
    throw std::runtime_error( "state delta does not exist" );
}

std::error_code execution_context::run( program::program& p )
{
  return p.run( this, _frame.arguments );
}

protocol::program_output& execution_context::output() noexcept
{
  return _output;
}

std::span< const std::string > execution_context::arguments()
{
  return _frame.arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    _output.stdout.insert( _output.stdout.end(), buffer.begin(), buffer.end() );
    return program::program_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    _output.stderr.insert( _output.stderr.end(), buffer.begin(), buffer.end() );
    return program::program_errc::ok;
  }

  return program::program_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return program::program_errc::bad_file_descriptor;

  if( buffer.size() > _frame.stdin.size() - _input_offset )
    return encode::encode_errc::unexpected_end;

  std::ranges::copy( _frame.stdin.subspan( _input_offset, buffer.size() ), buffer.begin() );
  _input_offset += buffer.size();
  return program::program_errc::ok;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id ) const
{
  return state::space::program( _frame.program_id, id );
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( auto result = _delta->get( state_db::make_key( create_object_space( id ), key ) ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::pair< std::span< const std::byte >, std::span< const std::byte > >
execution_context::get_next_object( std::uint32_t id, std::span< const std::byte > key )
{
  auto space = create_object_space( id );

  if( auto result = _delta->next( state_db::make_key( space, key ) ); result )
    if( state_db::in_space( space, result->first ) )
      return std::make_pair( result->first.subspan( state_db::object_space_key_size ), result->second );

  return std::make_pair( std::span< const std::byte >{}, std::span< const std::byte >{} );
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  _delta->put( state_db::make_key( create_object_space( id ), key ), value );
  return program::program_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  _delta->remove( state_db::make_key( create_object_space( id ), key ) );
  return program::program_errc::ok;
}

protocol::account_view execution_context::get_caller()
{
  return _frame.caller;
}

protocol::account_view execution_context::get_self()
{
  return _frame.program_id;
}

std::uint64_t execution_context::get_time()
{
  return _frame.time;
}

math::uint128 execution_context::get_attached_value()
{
  return _frame.attached;
}

std::error_code execution_context::transfer( protocol::account_view to, const math::uint128& amount )
{
  if( auto error = _bank.transfer( _frame.program_id, to, _frame.currency, amount ); error )
  {
    if( error == controller_errc::insufficient_funds )
      return program::program_errc::insufficient_funds;

    return error;
  }

  return program::program_errc::ok;
}

amm::pool_interface& execution_context::amm()
{
  return _pool;
}

} // namespace emissio::controller
