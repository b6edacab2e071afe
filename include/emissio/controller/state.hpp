#pragma once

#include <cstdint>
#include <span>
#include <string>

#include <emissio/curve/types.hpp>
#include <emissio/protocol.hpp>
#include <emissio/state_db.hpp>

namespace emissio::controller { namespace state {

namespace space {

// Base currency balances keyed by account and currency
const state_db::object_space& bank();

// Token entries keyed by big endian deployment index
const state_db::object_space& registry();

// Deployment index keyed by token account
const state_db::object_space& token_index();

// Empty objects keyed by creator account and deployment index
const state_db::object_space& creator_index();

const state_db::object_space& metadata();

// Objects owned by the program deployed at account
state_db::object_space program( const protocol::account& account, std::uint32_t id );

} // namespace space

namespace key {

std::span< const std::byte > token_count();
std::span< const std::byte > graduated_count();
std::span< const std::byte > deployment_fee();

} // namespace key

struct token_entry
{
  std::uint64_t index = 0;
  protocol::account account{};
  std::string name;
  std::string symbol;
  protocol::account creator{};
  curve::base_currency currency = curve::base_currency::busd;
  std::uint64_t launched_at     = 0;
  bool graduated                = false;
  protocol::account pool{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & index;
    ar & account;
    ar & name;
    ar & symbol;
    ar & creator;
    ar & currency;
    ar & launched_at;
    ar & graduated;
    ar & pool;
  }
};

}} // namespace emissio::controller::state
