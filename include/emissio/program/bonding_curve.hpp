#pragma once

#include <cstdint>
#include <span>
#include <string>

#include <emissio/program/program.hpp>

namespace emissio::program {

/**
 * The token program. Each deployed token runs its own instance state through
 * this program; the opcode read from stdin selects the operation.
 */
struct bonding_curve final: public program
{
  bonding_curve()                       = default;
  bonding_curve( const bonding_curve& ) = delete;
  bonding_curve( bonding_curve&& )      = delete;
  ~bonding_curve() override             = default;

  bonding_curve& operator=( const bonding_curve& ) = delete;
  bonding_curve& operator=( bonding_curve&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

  static constexpr std::uint32_t config_id   = 0;
  static constexpr std::uint32_t state_id    = 1;
  static constexpr std::uint32_t metadata_id = 2;
  static constexpr std::uint32_t balance_id  = 3;
  static constexpr std::uint32_t record_id   = 4;
};

} // namespace emissio::program
