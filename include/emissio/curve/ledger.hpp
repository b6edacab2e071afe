#pragma once

#include <system_error>
#include <vector>

#include <emissio/curve/error.hpp>
#include <emissio/curve/pricing.hpp>
#include <emissio/curve/types.hpp>

namespace emissio::curve {

// Token balances of a single curve
struct holder_book
{
  holder_book()                     = default;
  holder_book( const holder_book& ) = delete;
  holder_book( holder_book&& )      = delete;
  virtual ~holder_book()            = default;

  holder_book& operator=( const holder_book& ) = delete;
  holder_book& operator=( holder_book&& )      = delete;

  virtual result< uint128 > balance_of( const protocol::account& holder )                      = 0;
  virtual std::error_code set_balance( const protocol::account& holder, const uint128& balance ) = 0;

  // Every holder with a non-zero balance
  virtual result< std::vector< holding > > holdings() = 0;
};

// Base currency held in custody by the curve
struct treasury
{
  treasury()                  = default;
  treasury( const treasury& ) = delete;
  treasury( treasury&& )      = delete;
  virtual ~treasury()         = default;

  treasury& operator=( const treasury& ) = delete;
  treasury& operator=( treasury&& )      = delete;

  virtual std::error_code pay( const protocol::account& to, const uint128& amount ) = 0;
};

/**
 * Executes buys and sells against the curve reserves.
 *
 * Every operation validates its input, quotes the trade, checks the outcome and
 * only then mutates the curve state and balances. Base currency leaves custody as
 * the last step. The ledger does not know about the lifecycle phase.
 */
class reserve_ledger
{
public:
  reserve_ledger( const curve_config& config, curve_state& state, holder_book& holders, treasury& custody ) noexcept;

  // Spends at most amount_in from custody on tokens and refunds the unspent remainder
  result< trade > buy( const protocol::account& buyer, const uint128& amount_in, const uint128& min_tokens_out );
  result< trade > sell( const protocol::account& seller, const uint128& amount, const uint128& min_base_out );

  std::error_code transfer( const protocol::account& from, const protocol::account& to, const uint128& amount );
  std::error_code mint( const protocol::account& to, const uint128& amount );

  // The per transaction token cap at the current supply
  uint128 trade_limit() const noexcept;

private:
  std::error_code credit( const protocol::account& holder, const uint128& amount );
  std::error_code debit( const protocol::account& holder, const uint128& amount );

  const curve_config& _config;
  curve_state& _state;
  holder_book& _holders;
  treasury& _custody;
  pricing_engine _pricing;
};

} // namespace emissio::curve
