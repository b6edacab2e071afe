#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>

#include <emissio/amm/pool.hpp>
#include <emissio/math/fixed_point.hpp>
#include <emissio/program/error.hpp>
#include <emissio/protocol/account.hpp>

namespace emissio::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * The host as seen by a running program. Objects are scoped to the program's
 * own object space. Base currency amounts are in the currency of the program's
 * custody.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                       = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  // The next object after key, or an empty key once the object id is exhausted
  virtual std::pair< std::span< const std::byte >, std::span< const std::byte > >
  get_next_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual protocol::account_view get_caller() = 0;
  virtual protocol::account_view get_self()   = 0;

  // Seconds since the epoch at which the invocation runs
  virtual std::uint64_t get_time() = 0;

  // Base currency sent along with the invocation, already held in custody
  virtual math::uint128 get_attached_value() = 0;

  virtual std::error_code transfer( protocol::account_view to, const math::uint128& amount ) = 0;

  virtual amm::pool_interface& amm() = 0;
};

} // namespace emissio::program
