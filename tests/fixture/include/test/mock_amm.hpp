#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <emissio/amm.hpp>

namespace test {

/**
 * An in-memory constant product AMM. Each failure flag makes the matching call
 * fail with amm_errc::rejected. Creating a pool for a pair that already has one
 * returns the empty pool again, or amm_errc::pool_exists once it holds liquidity.
 */
class mock_amm final: public emissio::amm::pool_interface
{
public:
  struct pool
  {
    emissio::protocol::account token_a{};
    emissio::protocol::account token_b{};
    emissio::math::uint128 reserve_a = 0;
    emissio::math::uint128 reserve_b = 0;
    emissio::math::uint128 lp_supply = 0;
    emissio::math::uint128 lp_burned = 0;
    std::map< emissio::protocol::account, emissio::math::uint128 > lp_balances;
  };

  emissio::amm::result< emissio::protocol::account > create_pool( const emissio::protocol::account& token_a,
                                                                  const emissio::protocol::account& token_b ) override;

  emissio::amm::result< emissio::math::uint128 > add_liquidity( const emissio::protocol::account& pool,
                                                                const emissio::math::uint128& amount_a,
                                                                const emissio::math::uint128& amount_b ) override;

  std::error_code burn_lp( const emissio::protocol::account& pool, const emissio::math::uint128& amount ) override;

  std::error_code transfer_lp( const emissio::protocol::account& pool,
                               const emissio::protocol::account& to,
                               const emissio::math::uint128& amount ) override;

  bool fail_create_pool   = false;
  bool fail_add_liquidity = false;
  bool fail_burn_lp       = false;
  bool fail_transfer_lp   = false;

  std::map< emissio::protocol::account, pool > pools;
  std::uint32_t calls = 0;

private:
  std::uint64_t _next_pool = 1;
};

} // namespace test
