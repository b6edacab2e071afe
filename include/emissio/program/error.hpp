#pragma once

#include <expected>
#include <system_error>

namespace emissio::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_instruction,
  unexpected_object,
  bad_file_descriptor,
  insufficient_funds
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace emissio::program

template<>
struct std::is_error_code_enum< emissio::program::program_errc >: public std::true_type
{};
