#include <emissio/state_db/types.hpp>

#include <algorithm>

#include <boost/endian.hpp>

namespace emissio::state_db {

std::vector< std::byte > make_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > db_key;
  db_key.reserve( object_space_key_size + key.size() );

  db_key.push_back( space.system ? std::byte{ 1 } : std::byte{ 0 } );
  db_key.insert( db_key.end(), space.address.begin(), space.address.end() );

  auto id = boost::endian::native_to_big( space.id );
  auto id_bytes = std::as_bytes( std::span( &id, 1 ) );
  db_key.insert( db_key.end(), id_bytes.begin(), id_bytes.end() );

  db_key.insert( db_key.end(), key.begin(), key.end() );
  return db_key;
}

bool in_space( const object_space& space, std::span< const std::byte > db_key )
{
  if( db_key.size() < object_space_key_size )
    return false;

  auto prefix = make_key( space, {} );
  return std::ranges::equal( prefix, db_key.first( object_space_key_size ) );
}

} // namespace emissio::state_db
