#pragma once

#include <expected>
#include <system_error>

namespace emissio::math {

enum class math_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  arithmetic_overflow,
  arithmetic_underflow,
  division_by_zero
};

const std::error_category& math_category() noexcept;

std::error_code make_error_code( math_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace emissio::math

template<>
struct std::is_error_code_enum< emissio::math::math_errc >: public std::true_type
{};
