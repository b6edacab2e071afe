#include <emissio/controller/bank.hpp>

#include <utility>
#include <vector>

#include <emissio/controller/state.hpp>
#include <emissio/encode/binary.hpp>

namespace emissio::controller {

namespace {

std::vector< std::byte > balance_key( protocol::account_view account, curve::base_currency currency )
{
  std::vector< std::byte > key( account.begin(), account.end() );
  key.push_back( static_cast< std::byte >( std::to_underlying( currency ) ) );
  return state_db::make_key( state::space::bank(), key );
}

} // namespace

bank::bank( std::shared_ptr< state_db::state_delta > delta ) noexcept:
    _delta( std::move( delta ) )
{}

result< math::uint128 > bank::balance( protocol::account_view account, curve::base_currency currency ) const
{
  auto object = _delta->get( balance_key( account, currency ) );
  if( !object )
    return math::uint128( 0 );

  if( object->size() != encode::uint128_size )
    return std::unexpected( controller_errc::unexpected_object );

  return encode::from_little_endian( object->first< encode::uint128_size >() );
}

std::error_code bank::credit( protocol::account_view account, curve::base_currency currency, const math::uint128& amount )
{
  auto current = balance( account, currency );
  if( !current )
    return current.error();

  auto next = math::checked_add( *current, amount );
  if( !next )
    return next.error();

  _delta->put( balance_key( account, currency ), encode::to_little_endian( *next ) );
  return controller_errc::ok;
}

std::error_code bank::debit( protocol::account_view account, curve::base_currency currency, const math::uint128& amount )
{
  auto current = balance( account, currency );
  if( !current )
    return current.error();

  if( *current < amount )
    return controller_errc::insufficient_funds;

  if( *current == amount )
    _delta->remove( balance_key( account, currency ) );
  else
    _delta->put( balance_key( account, currency ), encode::to_little_endian( *current - amount ) );

  return controller_errc::ok;
}

std::error_code bank::transfer( protocol::account_view from,
                                protocol::account_view to,
                                curve::base_currency currency,
                                const math::uint128& amount )
{
  if( amount == 0 )
    return controller_errc::ok;

  if( auto error = debit( from, currency, amount ); error )
    return error;

  return credit( to, currency, amount );
}

} // namespace emissio::controller
