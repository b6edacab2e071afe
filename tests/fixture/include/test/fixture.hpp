#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <emissio/controller.hpp>
#include <emissio/curve.hpp>
#include <emissio/program.hpp>
#include <emissio/protocol.hpp>

#include <test/books.hpp>
#include <test/mock_amm.hpp>

namespace test {

constexpr std::uint64_t deployment_fee = 500;
constexpr std::uint64_t starting_funds = 1'000'000'000;

// The decoded stdout of a buy or sell
struct trade_receipt
{
  emissio::math::uint128 tokens      = 0;
  emissio::math::uint128 base_amount = 0;
  emissio::math::uint128 refund      = 0;
  bool graduated                     = false;
};

/**
 * Hosts a controller over an in-memory AMM. Users created through the fixture
 * start with starting_funds of every base currency.
 */
struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  explicit fixture( const std::string& log_level = "info" );
  ~fixture();

  // A busd curve with base price 1000 and 150 bps growth that graduates once reserves reach liquidity_threshold
  static emissio::curve::launch_parameters make_launch( const std::string& symbol,
                                                        const emissio::math::uint128& liquidity_threshold );

  emissio::protocol::account make_funded_user( std::uint8_t id );
  emissio::protocol::account deploy( const emissio::protocol::account& creator,
                                     const emissio::curve::launch_parameters& parameters );

  emissio::controller::result< emissio::protocol::program_output >
  call( const emissio::protocol::account& caller,
        const emissio::protocol::account& token,
        const emissio::program::instruction::request& request,
        const emissio::math::uint128& attached = 0 );

  emissio::controller::result< emissio::protocol::program_output >
  query( const emissio::protocol::account& token, const emissio::program::instruction::request& request ) const;

  emissio::math::uint128 funds( const emissio::protocol::account& account ) const;

  static emissio::protocol::program_input make_input( const emissio::program::instruction::request& request );

  static trade_receipt decode_trade( const emissio::protocol::program_output& output );
  static emissio::math::uint128 decode_amount( const emissio::protocol::program_output& output );
  static bool decode_bool( const emissio::protocol::program_output& output );
  static std::string decode_string( const emissio::protocol::program_output& output );
  static std::optional< emissio::protocol::account > decode_pool( const emissio::protocol::program_output& output );

  mock_amm _amm;
  std::unique_ptr< emissio::controller::controller > _controller;
  emissio::protocol::account _fee_collector;
};

} // namespace test
