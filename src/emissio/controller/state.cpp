#include <emissio/controller/state.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace emissio::controller { namespace state {

namespace space {

namespace {

enum class space_id : std::uint32_t // NOLINT(performance-enum-size)
{
  bank,
  registry,
  token_index,
  creator_index,
  metadata
};

state_db::object_space make_system_space( space_id id )
{
  state_db::object_space s;
  s.system = true;
  s.id     = std::to_underlying( id );
  return s;
}

} // namespace

const state_db::object_space& bank()
{
  static const auto s = make_system_space( space_id::bank );
  return s;
}

const state_db::object_space& registry()
{
  static const auto s = make_system_space( space_id::registry );
  return s;
}

const state_db::object_space& token_index()
{
  static const auto s = make_system_space( space_id::token_index );
  return s;
}

const state_db::object_space& creator_index()
{
  static const auto s = make_system_space( space_id::creator_index );
  return s;
}

const state_db::object_space& metadata()
{
  static const auto s = make_system_space( space_id::metadata );
  return s;
}

state_db::object_space program( const protocol::account& account, std::uint32_t id )
{
  state_db::object_space s{ .system = false, .id = id };
  std::ranges::copy( account, s.address.begin() );
  return s;
}

} // namespace space

namespace key {

std::span< const std::byte > token_count()
{
  static constexpr std::array< std::byte, 1 > k{ std::byte{ 0x01 } };
  return k;
}

std::span< const std::byte > graduated_count()
{
  static constexpr std::array< std::byte, 1 > k{ std::byte{ 0x02 } };
  return k;
}

std::span< const std::byte > deployment_fee()
{
  static constexpr std::array< std::byte, 1 > k{ std::byte{ 0x03 } };
  return k;
}

} // namespace key

}} // namespace emissio::controller::state
