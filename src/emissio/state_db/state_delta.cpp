#include <emissio/state_db/state_delta.hpp>

namespace emissio::state_db {

state_delta::state_delta( std::shared_ptr< state_delta > parent ) noexcept:
    _parent( std::move( parent ) )
{}

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  if( complete() )
    throw std::runtime_error( "cannot modify a complete state delta" );

  std::int64_t size = _backend.remove( key );

  if( !root() && !removed( key ) )
  {
    if( auto current_value = _parent->get( key ); current_value )
    {
      if( size == 0 )
        size -= std::ssize( key ) + std::ssize( *current_value );

      _removed_objects.emplace( std::move( key ) );
    }
  }

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* delta = this; delta; delta = delta->_parent.get() )
  {
    if( delta->removed( key ) )
      return {};

    if( auto value = delta->_backend.get( key ); value )
      return value;
  }

  return {};
}

std::optional< object_view > state_delta::next( const std::vector< std::byte >& key ) const
{
  std::vector< std::byte > cursor = key;

  while( true )
  {
    std::optional< std::vector< std::byte > > candidate;

    for( const state_delta* delta = this; delta; delta = delta->_parent.get() )
    {
      if( auto itr = delta->_backend.upper_bound( cursor ); itr != delta->_backend.end() )
        if( !candidate || itr->first < *candidate )
          candidate = itr->first;
    }

    if( !candidate )
      return {};

    // The candidate may be shadowed by a removal in a closer delta
    if( auto value = get( *candidate ); value )
    {
      for( const state_delta* delta = this; delta; delta = delta->_parent.get() )
      {
        auto itr = delta->_backend.upper_bound( cursor );
        if( itr != delta->_backend.end() && itr->first == *candidate && !delta->removed( *candidate ) )
          return object_view{ std::span< const std::byte >( itr->first ), *value };
      }
    }

    cursor = std::move( *candidate );
  }
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  if( complete() )
    throw std::runtime_error( "cannot make a child of a complete state delta" );

  return std::make_shared< state_delta >( shared_from_this() );
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a root state delta" );

  if( complete() )
    throw std::runtime_error( "state delta has already been squashed" );

  // A removal here shadows the parent. When the parent is the root the object is
  // simply erased, otherwise the tombstone moves up with it.
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    _parent->_backend.remove( *itr );

    if( !_parent->root() )
      _parent->_removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  while( !_backend.empty() )
  {
    auto node = _backend.extract_front();

    if( !_parent->root() )
      _parent->_removed_objects.erase( node.key() );

    _parent->_backend.put( std::move( node.key() ), std::move( node.mapped() ) );
  }

  _complete = true;
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

bool state_delta::complete() const
{
  return _complete;
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

} // namespace emissio::state_db
