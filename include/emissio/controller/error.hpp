#pragma once

#include <expected>
#include <system_error>

namespace emissio::controller {

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unknown_token,
  insufficient_fee,
  insufficient_funds,
  unexpected_object,
  read_only,
  unauthorized
};

const std::error_category& controller_category() noexcept;

std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace emissio::controller

template<>
struct std::is_error_code_enum< emissio::controller::controller_errc >: public std::true_type
{};
