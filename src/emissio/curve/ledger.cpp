#include <emissio/curve/ledger.hpp>

#include <algorithm>

namespace emissio::curve {

reserve_ledger::reserve_ledger( const curve_config& config,
                                curve_state& state,
                                holder_book& holders,
                                treasury& custody ) noexcept:
    _config( config ),
    _state( state ),
    _holders( holders ),
    _custody( custody ),
    _pricing( config )
{}

uint128 reserve_ledger::trade_limit() const noexcept
{
  if( _state.current_supply >= _config.max_supply )
    return 0;

  auto limit = math::mul_div( _config.max_supply - _state.current_supply, defaults::max_trade_bps, math::basis_points );

  return limit && *limit > 0 ? *limit : uint128( 1 );
}

result< trade >
reserve_ledger::buy( const protocol::account& buyer, const uint128& amount_in, const uint128& min_tokens_out )
{
  if( amount_in == 0 )
    return std::unexpected( curve_errc::invalid_argument );

  if( _state.current_supply >= _config.max_supply )
    return std::unexpected( curve_errc::trade_too_large );

  const uint128 remaining = _config.max_supply - _state.current_supply;
  const uint128 limit     = trade_limit();

  // Searching one token past the cap tells an oversized trade apart from one that fits exactly
  auto tokens = _pricing.tokens_for( _state.current_supply, amount_in, std::min( uint128( limit + 1 ), remaining ) );
  if( !tokens )
    return std::unexpected( tokens.error() );

  if( *tokens > limit )
    return std::unexpected( curve_errc::trade_too_large );

  if( *tokens == 0 )
    return std::unexpected( curve_errc::insufficient_amount );

  if( *tokens < min_tokens_out )
    return std::unexpected( curve_errc::slippage_exceeded );

  auto cost = _pricing.quote_buy( _state.current_supply, *tokens );
  if( !cost )
    return std::unexpected( cost.error() );

  auto reserves = math::checked_add( _state.base_reserves, *cost );
  if( !reserves )
    return std::unexpected( reserves.error() );

  if( auto error = credit( buyer, *tokens ); error )
    return std::unexpected( error );

  _state.current_supply += *tokens;
  _state.base_reserves   = *reserves;

  trade t;
  t.direction      = trade_direction::buy;
  t.tokens         = *tokens;
  t.base_amount    = *cost;
  t.price          = *cost / *tokens;
  t.refund         = amount_in - *cost;
  t.supply_after   = _state.current_supply;
  t.reserves_after = _state.base_reserves;

  if( t.refund > 0 )
    if( auto error = _custody.pay( buyer, t.refund ); error )
      return std::unexpected( error );

  return t;
}

result< trade >
reserve_ledger::sell( const protocol::account& seller, const uint128& amount, const uint128& min_base_out )
{
  if( amount == 0 )
    return std::unexpected( curve_errc::invalid_argument );

  auto balance = _holders.balance_of( seller );
  if( !balance )
    return std::unexpected( balance.error() );

  if( *balance < amount )
    return std::unexpected( curve_errc::insufficient_balance );

  auto payout = _pricing.quote_sell( _state.current_supply, amount );
  if( !payout )
    return std::unexpected( payout.error() );

  if( *payout < min_base_out )
    return std::unexpected( curve_errc::slippage_exceeded );

  auto reserves = math::checked_sub( _state.base_reserves, *payout );
  if( !reserves )
    return std::unexpected( curve_errc::insufficient_reserves );

  if( auto error = debit( seller, amount ); error )
    return std::unexpected( error );

  _state.current_supply -= amount;
  _state.base_reserves   = *reserves;

  trade t;
  t.direction      = trade_direction::sell;
  t.tokens         = amount;
  t.base_amount    = *payout;
  t.price          = *payout / amount;
  t.supply_after   = _state.current_supply;
  t.reserves_after = _state.base_reserves;

  if( *payout > 0 )
    if( auto error = _custody.pay( seller, *payout ); error )
      return std::unexpected( error );

  return t;
}

std::error_code reserve_ledger::transfer( const protocol::account& from, const protocol::account& to, const uint128& amount )
{
  if( amount == 0 || from == to )
    return curve_errc::invalid_argument;

  if( auto error = debit( from, amount ); error )
    return error;

  return credit( to, amount );
}

std::error_code reserve_ledger::mint( const protocol::account& to, const uint128& amount )
{
  if( _state.current_supply > _config.max_supply || amount > _config.max_supply - _state.current_supply )
    return curve_errc::supply_exceeded;

  if( auto error = credit( to, amount ); error )
    return error;

  _state.current_supply += amount;
  return curve_errc::ok;
}

std::error_code reserve_ledger::credit( const protocol::account& holder, const uint128& amount )
{
  auto balance = _holders.balance_of( holder );
  if( !balance )
    return balance.error();

  auto next = math::checked_add( *balance, amount );
  if( !next )
    return next.error();

  if( auto error = _holders.set_balance( holder, *next ); error )
    return error;

  if( *balance == 0 && amount > 0 )
    _state.holder_count++;

  return curve_errc::ok;
}

std::error_code reserve_ledger::debit( const protocol::account& holder, const uint128& amount )
{
  auto balance = _holders.balance_of( holder );
  if( !balance )
    return balance.error();

  if( *balance < amount )
    return curve_errc::insufficient_balance;

  if( auto error = _holders.set_balance( holder, *balance - amount ); error )
    return error;

  if( *balance == amount && amount > 0 && _state.holder_count > 0 )
    _state.holder_count--;

  return curve_errc::ok;
}

} // namespace emissio::curve
