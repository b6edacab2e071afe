#pragma once

#include <expected>
#include <system_error>

namespace emissio::curve {

enum class curve_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,

  // Validation
  invalid_argument,
  invalid_config,

  // Economic
  slippage_exceeded,
  insufficient_reserves,
  insufficient_balance,
  insufficient_supply,
  insufficient_amount,
  supply_exceeded,
  trade_too_large,

  // Lifecycle
  not_initialized,
  already_initialized,
  already_graduated,
  not_graduated,
  graduation_criteria_not_met,

  // External
  pool_creation_failed,
  liquidity_transfer_failed,
  lp_distribution_failed,
  transfer_failed
};

const std::error_category& curve_category() noexcept;

std::error_code make_error_code( curve_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace emissio::curve

template<>
struct std::is_error_code_enum< emissio::curve::curve_errc >: public std::true_type
{};
