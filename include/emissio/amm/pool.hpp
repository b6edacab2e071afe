#pragma once

#include <system_error>

#include <emissio/amm/error.hpp>
#include <emissio/math/fixed_point.hpp>
#include <emissio/protocol/account.hpp>

namespace emissio::amm {

/**
 * The boundary to an external automated market maker.
 *
 * Every call is fallible. LP tokens received by add_liquidity are owned by the
 * caller until they are burned or transferred.
 */
struct pool_interface
{
  pool_interface()                        = default;
  pool_interface( const pool_interface& ) = delete;
  pool_interface( pool_interface&& )      = delete;
  virtual ~pool_interface()               = default;

  pool_interface& operator=( const pool_interface& ) = delete;
  pool_interface& operator=( pool_interface&& )      = delete;

  virtual result< protocol::account > create_pool( const protocol::account& token_a,
                                                   const protocol::account& token_b ) = 0;

  virtual result< math::uint128 >
  add_liquidity( const protocol::account& pool, const math::uint128& amount_a, const math::uint128& amount_b ) = 0;

  virtual std::error_code burn_lp( const protocol::account& pool, const math::uint128& amount ) = 0;

  virtual std::error_code
  transfer_lp( const protocol::account& pool, const protocol::account& to, const math::uint128& amount ) = 0;
};

} // namespace emissio::amm
