#pragma once

#include <emissio/state_db/backends/map/map_backend.hpp>
#include <emissio/state_db/types.hpp>

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace emissio::state_db {

using object_view = std::pair< std::span< const std::byte >, std::span< const std::byte > >;

/**
 * A layer of key/value modifications over an optional parent.
 *
 * Reads fall through to the parent chain unless the key was written or removed in a
 * closer layer. A child is merged into its parent with squash(), or discarded by
 * dropping it. Once squashed, a delta is complete and rejects further writes.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  std::shared_ptr< state_delta > _parent;
  backends::map::map_backend _backend;
  std::set< std::vector< std::byte > > _removed_objects;
  bool _complete = false;

public:
  state_delta() noexcept = default;
  explicit state_delta( std::shared_ptr< state_delta > parent ) noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  std::int64_t put( std::vector< std::byte >&& key, const ValueType& value );
  std::int64_t remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  // First live object with a key strictly greater than key
  std::optional< object_view > next( const std::vector< std::byte >& key ) const;

  std::shared_ptr< state_delta > make_child();
  void squash();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;
  bool complete() const;

  const std::shared_ptr< state_delta >& parent() const;
};

template< std::ranges::range ValueType >
std::int64_t state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  if( complete() )
    throw std::runtime_error( "cannot modify a complete state delta" );

  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _removed_objects.erase( key );
  _backend.put( std::move( key ), std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );

  return size;
}

} // namespace emissio::state_db
