#pragma once

#include <cstdint>

#include <emissio/amm/pool.hpp>
#include <emissio/curve/error.hpp>
#include <emissio/curve/graduation.hpp>
#include <emissio/curve/ledger.hpp>
#include <emissio/curve/pricing.hpp>
#include <emissio/curve/types.hpp>

namespace emissio::curve {

/**
 * Guards the curve by phase and drives graduation.
 *
 * Trading is only possible while the curve is in the trading phase. After every
 * successful trade the graduation criteria are evaluated and, when they hold,
 * graduation runs as part of the same call. A failed automatic graduation does
 * not fail the trade; it is logged and may be retried with graduate().
 */
class lifecycle
{
public:
  lifecycle( const curve_config& config,
             curve_state& state,
             holder_book& holders,
             treasury& custody,
             amm::pool_interface& pool,
             const protocol::account& token,
             const protocol::account& deployer ) noexcept;

  result< trade > buy( const protocol::account& buyer,
                       const uint128& amount_in,
                       const uint128& min_tokens_out,
                       std::uint64_t now );

  result< trade >
  sell( const protocol::account& seller, const uint128& amount, const uint128& min_base_out, std::uint64_t now );

  std::error_code transfer( const protocol::account& from, const protocol::account& to, const uint128& amount );

  result< graduation_record > graduate( std::uint64_t now );

  const pricing_engine& pricing() const noexcept;

private:
  result< graduation_record > run_graduation( std::uint64_t now );
  std::error_code settle( trade& t, std::uint64_t now );

  const curve_config& _config;
  curve_state& _state;
  holder_book& _holders;
  treasury& _custody;
  amm::pool_interface& _pool;
  const protocol::account& _token;
  const protocol::account& _deployer;
  reserve_ledger _ledger;
  pricing_engine _pricing;
};

} // namespace emissio::curve
