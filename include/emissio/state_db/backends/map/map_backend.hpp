#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace emissio::state_db::backends::map {

using map_type = std::map< std::vector< std::byte >, std::vector< std::byte > >;

class map_backend
{
public:
  using const_iterator = map_type::const_iterator;

  std::int64_t put( std::vector< std::byte >&& key, std::vector< std::byte >&& value );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;
  std::int64_t remove( const std::vector< std::byte >& key );

  const_iterator upper_bound( const std::vector< std::byte >& key ) const;
  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  map_type::node_type extract_front();

  bool empty() const noexcept;

private:
  map_type _map;
};

} // namespace emissio::state_db::backends::map
