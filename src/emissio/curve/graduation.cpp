#include <emissio/curve/graduation.hpp>

#include <algorithm>

#include <emissio/curve/distribution.hpp>
#include <emissio/curve/pricing.hpp>
#include <emissio/log.hpp>

namespace emissio::curve {

result< bool > criteria_met( const curve_config& config, const curve_state& state, std::uint64_t now )
{
  if( state.phase != lifecycle_phase::trading )
    return false;

  const std::uint64_t elapsed = now > state.created_at ? now - state.created_at : 0;

  if( config.fallback_age > 0 && elapsed >= config.fallback_age
      && state.base_reserves >= std::max( config.fallback_liquidity, uint128( 1 ) ) )
    return true;

  if( state.holder_count < config.minimum_unique_holders || elapsed < config.minimum_age )
    return false;

  if( state.base_reserves >= config.graduation_liquidity_threshold )
    return true;

  pricing_engine pricing( config );
  auto market_cap = pricing.market_cap( state.current_supply );
  if( !market_cap )
  {
    if( market_cap.error() == math::math_errc::arithmetic_overflow )
      return true;

    return std::unexpected( market_cap.error() );
  }

  return *market_cap >= config.graduation_market_cap_threshold;
}

graduation_builder::graduation_builder( const curve_config& config,
                                        const curve_state& state,
                                        amm::pool_interface& pool,
                                        const protocol::account& token,
                                        const protocol::account& deployer ) noexcept:
    _config( config ),
    _state( state ),
    _pool( pool ),
    _token( token ),
    _deployer( deployer )
{}

result< uint128 > graduation_builder::token_liquidity() const
{
  pricing_engine pricing( _config );

  auto price = pricing.price_at( _state.current_supply );
  if( !price )
    return std::unexpected( price.error() );

  if( *price == 0 || _state.current_supply >= _config.max_supply )
    return uint128( 0 );

  return std::min( uint128( _state.base_reserves / *price ), uint128( _config.max_supply - _state.current_supply ) );
}

result< graduation_record > graduation_builder::stage( std::span< const holding > holders, std::uint64_t now )
{
  auto ready = criteria_met( _config, _state, now );
  if( !ready )
    return std::unexpected( ready.error() );

  if( !*ready )
    return std::unexpected( curve_errc::graduation_criteria_not_met );

  graduation_record record;
  record.graduated_at   = now;
  record.base_liquidity = _state.base_reserves;

  auto tokens = token_liquidity();
  if( !tokens )
    return std::unexpected( tokens.error() );

  record.token_liquidity = *tokens;

  if( record.base_liquidity == 0 || record.token_liquidity == 0 )
  {
    LOG_WARNING( emissio::log::instance(),
                 "Graduation of {} has no liquidity to provide",
                 emissio::log::hex{ _token.data(), _token.size() } );
    return std::unexpected( curve_errc::liquidity_transfer_failed );
  }

  auto pool = _pool.create_pool( _token, currency_account( _config.currency ) );
  if( !pool )
  {
    LOG_WARNING( emissio::log::instance(), "Pool creation failed: {}", pool.error().message() );
    return std::unexpected( curve_errc::pool_creation_failed );
  }

  record.pool = *pool;

  auto lp = _pool.add_liquidity( record.pool, record.token_liquidity, record.base_liquidity );
  if( !lp )
  {
    LOG_WARNING( emissio::log::instance(), "Adding liquidity failed: {}", lp.error().message() );
    return std::unexpected( curve_errc::liquidity_transfer_failed );
  }

  if( *lp == 0 )
    return std::unexpected( curve_errc::liquidity_transfer_failed );

  record.lp_received = *lp;

  auto plan = plan_distribution( _config.strategy, record.lp_received, holders, _deployer );
  if( !plan )
    return std::unexpected( plan.error() );

  LOG_DEBUG( emissio::log::instance(),
             "Distributing {} LP tokens by {} to {} recipients",
             emissio::log::amount{ record.lp_received },
             strategy_name( _config.strategy ),
             plan->allocations.size() );

  // LP is burned only after every transfer succeeded
  for( const auto& allocation: plan->allocations )
  {
    if( auto error = _pool.transfer_lp( record.pool, allocation.recipient, allocation.amount ); error )
    {
      LOG_WARNING( emissio::log::instance(), "Transferring LP tokens failed: {}", error.message() );
      return std::unexpected( curve_errc::lp_distribution_failed );
    }
  }

  if( plan->burned > 0 )
  {
    if( auto error = _pool.burn_lp( record.pool, plan->burned ); error )
    {
      LOG_WARNING( emissio::log::instance(), "Burning LP tokens failed: {}", error.message() );
      return std::unexpected( curve_errc::lp_distribution_failed );
    }
  }

  record.distribution = std::move( *plan );
  return record;
}

std::error_code commit( const graduation_record& record, curve_state& state, reserve_ledger& ledger, treasury& custody )
{
  if( state.phase != lifecycle_phase::trading )
    return curve_errc::already_graduated;

  if( auto error = ledger.mint( record.pool, record.token_liquidity ); error )
    return error;

  if( auto error = custody.pay( record.pool, record.base_liquidity ); error )
    return error;

  state.base_reserves = 0;
  state.phase         = lifecycle_phase::graduated;
  state.pool          = record.pool;

  LOG_INFO( emissio::log::instance(),
            "Graduated to pool {} with {} base and {} tokens, {} LP ({} burned)",
            emissio::log::hex{ record.pool.data(), record.pool.size() },
            emissio::log::amount{ record.base_liquidity },
            emissio::log::amount{ record.token_liquidity },
            emissio::log::amount{ record.lp_received },
            emissio::log::amount{ record.distribution.burned } );

  return curve_errc::ok;
}

} // namespace emissio::curve
