#pragma once

#include <expected>
#include <system_error>

namespace emissio::amm {

enum class amm_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  pool_exists,
  unknown_pool,
  insufficient_liquidity,
  insufficient_lp,
  rejected
};

const std::error_category& amm_category() noexcept;

std::error_code make_error_code( amm_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace emissio::amm

template<>
struct std::is_error_code_enum< emissio::amm::amm_errc >: public std::true_type
{};
