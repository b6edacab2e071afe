#include <emissio/state_db/backends/map/map_backend.hpp>

#include <iterator>

namespace emissio::state_db::backends::map {

std::int64_t map_backend::put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
{
  std::int64_t size = std::ssize( value );
  auto itr          = _map.lower_bound( key );

  if( itr != _map.end() && itr->first == key )
    size -= std::ssize( itr->second );
  else
    size += std::ssize( key );

  _map.insert_or_assign( itr, std::move( key ), std::move( value ) );

  return size;
}

std::optional< std::span< const std::byte > > map_backend::get( const std::vector< std::byte >& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

std::int64_t map_backend::remove( const std::vector< std::byte >& key )
{
  std::int64_t size = 0;

  if( auto itr = _map.find( key ); itr != _map.end() )
  {
    size -= std::ssize( itr->first ) + std::ssize( itr->second );
    _map.erase( itr );
  }

  return size;
}

map_backend::const_iterator map_backend::upper_bound( const std::vector< std::byte >& key ) const
{
  return _map.upper_bound( key );
}

map_backend::const_iterator map_backend::begin() const noexcept
{
  return _map.begin();
}

map_backend::const_iterator map_backend::end() const noexcept
{
  return _map.end();
}

map_type::node_type map_backend::extract_front()
{
  return _map.extract( _map.begin() );
}

bool map_backend::empty() const noexcept
{
  return _map.empty();
}

} // namespace emissio::state_db::backends::map
