#pragma once

#include <cstdint>
#include <span>

#include <emissio/amm/pool.hpp>
#include <emissio/curve/error.hpp>
#include <emissio/curve/ledger.hpp>
#include <emissio/curve/types.hpp>

namespace emissio::curve {

/**
 * Whether the curve may leave the trading phase at time now (seconds).
 *
 * Either the regular criteria hold (enough reserves or market cap, enough
 * holders and a minimum age) or the fallback age has passed with at least
 * fallback_liquidity in reserves. A market cap too large to represent counts as
 * meeting its threshold.
 */
result< bool > criteria_met( const curve_config& config, const curve_state& state, std::uint64_t now );

/**
 * Stages the hand-off of the curve reserves to a new external pool.
 *
 * stage() performs every external call (pool creation, liquidity provisioning
 * and LP distribution) without touching the curve state. The returned record is
 * applied with commit() once everything succeeded. A failed stage() leaves the
 * curve exactly as it was and may be retried later.
 */
class graduation_builder
{
public:
  graduation_builder( const curve_config& config,
                      const curve_state& state,
                      amm::pool_interface& pool,
                      const protocol::account& token,
                      const protocol::account& deployer ) noexcept;

  result< graduation_record > stage( std::span< const holding > holders, std::uint64_t now );

private:
  result< uint128 > token_liquidity() const;

  const curve_config& _config;
  const curve_state& _state;
  amm::pool_interface& _pool;
  const protocol::account& _token;
  const protocol::account& _deployer;
};

/**
 * Applies a staged graduation: mints the token liquidity to the pool, moves the
 * reserves into it and closes the trading phase.
 */
std::error_code commit( const graduation_record& record, curve_state& state, reserve_ledger& ledger, treasury& custody );

} // namespace emissio::curve
