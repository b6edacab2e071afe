#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace emissio::protocol {

constexpr std::size_t account_size = 32;

using account      = std::array< std::byte, account_size >;
using account_view = std::span< const std::byte, account_size >;

enum class account_kind : std::uint8_t
{
  user,
  token,
  pool,
  asset
};

account_kind kind( account_view a ) noexcept;

// Deterministic account of the index-th token deployed by the factory
account token_account( std::uint64_t index ) noexcept;

} // namespace emissio::protocol
