#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace emissio::state_db {

class state_delta;

constexpr std::size_t address_size = 32;

struct object_space
{
  bool system = false;
  std::array< std::byte, address_size > address{};
  std::uint32_t id = 0;
};

constexpr std::size_t object_space_key_size = 1 + address_size + sizeof( std::uint32_t );

/**
 * Builds the database key of an object. The space is encoded big endian ahead of
 * the object key so that every object of a space is contiguous in key order.
 */
std::vector< std::byte > make_key( const object_space& space, std::span< const std::byte > key );

bool in_space( const object_space& space, std::span< const std::byte > db_key );

} // namespace emissio::state_db
