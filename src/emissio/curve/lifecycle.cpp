#include <emissio/curve/lifecycle.hpp>

#include <emissio/log.hpp>

namespace emissio::curve {

lifecycle::lifecycle( const curve_config& config,
                      curve_state& state,
                      holder_book& holders,
                      treasury& custody,
                      amm::pool_interface& pool,
                      const protocol::account& token,
                      const protocol::account& deployer ) noexcept:
    _config( config ),
    _state( state ),
    _holders( holders ),
    _custody( custody ),
    _pool( pool ),
    _token( token ),
    _deployer( deployer ),
    _ledger( config, state, holders, custody ),
    _pricing( config )
{}

const pricing_engine& lifecycle::pricing() const noexcept
{
  return _pricing;
}

result< trade > lifecycle::buy( const protocol::account& buyer,
                                const uint128& amount_in,
                                const uint128& min_tokens_out,
                                std::uint64_t now )
{
  if( _state.phase == lifecycle_phase::graduated )
    return std::unexpected( curve_errc::already_graduated );

  auto t = _ledger.buy( buyer, amount_in, min_tokens_out );
  if( !t )
    return t;

  if( auto error = settle( *t, now ); error )
    return std::unexpected( error );

  return t;
}

result< trade > lifecycle::sell( const protocol::account& seller,
                                 const uint128& amount,
                                 const uint128& min_base_out,
                                 std::uint64_t now )
{
  if( _state.phase == lifecycle_phase::graduated )
    return std::unexpected( curve_errc::already_graduated );

  auto t = _ledger.sell( seller, amount, min_base_out );
  if( !t )
    return t;

  if( auto error = settle( *t, now ); error )
    return std::unexpected( error );

  return t;
}

std::error_code lifecycle::transfer( const protocol::account& from, const protocol::account& to, const uint128& amount )
{
  return _ledger.transfer( from, to, amount );
}

result< graduation_record > lifecycle::graduate( std::uint64_t now )
{
  if( _state.phase == lifecycle_phase::graduated )
    return std::unexpected( curve_errc::already_graduated );

  return run_graduation( now );
}

std::error_code lifecycle::settle( trade& t, std::uint64_t now )
{
  auto ready = criteria_met( _config, _state, now );
  if( !ready )
    return ready.error();

  if( !*ready )
    return curve_errc::ok;

  auto record = run_graduation( now );
  if( !record )
  {
    const auto& error = record.error();
    if( error == curve_errc::pool_creation_failed || error == curve_errc::liquidity_transfer_failed
        || error == curve_errc::lp_distribution_failed )
    {
      // Nothing was committed, the trade stands on its own
      LOG_WARNING( emissio::log::instance(),
                   "Discarding graduation of {}: {}",
                   emissio::log::hex{ _token.data(), _token.size() },
                   error.message() );
      return curve_errc::ok;
    }

    return error;
  }

  t.graduation = std::move( *record );
  return curve_errc::ok;
}

result< graduation_record > lifecycle::run_graduation( std::uint64_t now )
{
  auto holdings = _holders.holdings();
  if( !holdings )
    return std::unexpected( holdings.error() );

  graduation_builder builder( _config, _state, _pool, _token, _deployer );

  auto record = builder.stage( *holdings, now );
  if( !record )
    return record;

  if( auto error = commit( *record, _state, _ledger, _custody ); error )
    return std::unexpected( error );

  return record;
}

} // namespace emissio::curve
