#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include <emissio/amm/pool.hpp>
#include <emissio/controller/error.hpp>
#include <emissio/controller/state.hpp>
#include <emissio/curve/types.hpp>
#include <emissio/program/program.hpp>
#include <emissio/protocol.hpp>
#include <emissio/state_db.hpp>

namespace emissio::controller {

constexpr std::uint64_t default_deployment_fee = 100'000'000;

struct factory_options
{
  math::uint128 deployment_fee = default_deployment_fee;
  protocol::account fee_collector{};
};

struct factory_stats
{
  std::uint64_t total_tokens     = 0;
  std::uint64_t graduated_tokens = 0;
  math::uint128 deployment_fee   = 0;
};

/**
 * Hosts the token factory and every deployed curve.
 *
 * Each invocation runs in a child of the root state delta that is merged only
 * when the program succeeds. Read only invocations are always discarded and
 * refuse requests that would mutate a curve.
 */
class controller
{
public:
  explicit controller( amm::pool_interface& pool, factory_options options = {} );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  result< protocol::account > deploy( const protocol::account& creator,
                                      const curve::launch_parameters& parameters,
                                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now() );

  result< protocol::program_output >
  process( const protocol::account& caller,
           const protocol::account& token,
           const protocol::program_input& input,
           const math::uint128& attached             = 0,
           std::chrono::system_clock::time_point now = std::chrono::system_clock::now() );

  result< protocol::program_output >
  read_program( const protocol::account& token,
                const protocol::program_input& input      = {},
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now() ) const;

  std::error_code credit( const protocol::account& account, curve::base_currency currency, const math::uint128& amount );
  result< math::uint128 > balance( const protocol::account& account, curve::base_currency currency ) const;

  std::uint64_t token_count() const;
  result< factory_stats > stats() const;

  // Only the fee collector may change the fee charged by later deployments
  std::error_code set_deployment_fee( const protocol::account& caller, const math::uint128& fee );

  result< state::token_entry > token( const protocol::account& account ) const;

  // Entries in deployment order starting at offset
  result< std::vector< state::token_entry > > tokens( std::uint64_t offset, std::uint64_t limit ) const;
  result< std::vector< state::token_entry > > creator_tokens( const protocol::account& creator ) const;

private:
  result< protocol::program_output > invoke( const std::shared_ptr< state_db::state_delta >& delta,
                                             const protocol::account& caller,
                                             const protocol::account& token,
                                             curve::base_currency currency,
                                             const protocol::program_input& input,
                                             const math::uint128& attached,
                                             std::chrono::system_clock::time_point now ) const;

  result< state::token_entry > entry_at( std::uint64_t index ) const;

  std::shared_ptr< state_db::state_delta > _root;
  std::unique_ptr< program::program > _program;
  amm::pool_interface& _pool;
  factory_options _options;
};

} // namespace emissio::controller
