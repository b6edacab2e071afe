#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <emissio/amm/pool.hpp>
#include <emissio/controller/bank.hpp>
#include <emissio/controller/error.hpp>
#include <emissio/curve/types.hpp>
#include <emissio/program.hpp>
#include <emissio/protocol.hpp>
#include <emissio/state_db.hpp>

namespace emissio::controller {

// Everything a single program invocation sees of the host
struct invocation
{
  protocol::account program_id{};
  protocol::account caller{};
  curve::base_currency currency = curve::base_currency::busd;
  std::span< const std::byte > stdin;
  std::span< const std::string > arguments;
  math::uint128 attached = 0;
  std::uint64_t time     = 0;
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( std::shared_ptr< state_db::state_delta > delta, amm::pool_interface& pool, invocation frame );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  std::error_code run( program::program& p );

  protocol::program_output& output() noexcept;

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::pair< std::span< const std::byte >, std::span< const std::byte > >
  get_next_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  protocol::account_view get_caller() final;
  protocol::account_view get_self() final;
  std::uint64_t get_time() final;
  math::uint128 get_attached_value() final;

  std::error_code transfer( protocol::account_view to, const math::uint128& amount ) final;

  amm::pool_interface& amm() final;

private:
  state_db::object_space create_object_space( std::uint32_t id ) const;

  std::shared_ptr< state_db::state_delta > _delta;
  amm::pool_interface& _pool;
  bank _bank;
  invocation _frame;
  std::size_t _input_offset = 0;
  protocol::program_output _output;
};

} // namespace emissio::controller
