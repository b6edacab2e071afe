// NOLINTBEGIN

#include <gtest/gtest.h>

#include <emissio/state_db/state_delta.hpp>
#include <emissio/state_db/types.hpp>

namespace {

std::vector< std::byte > bytes( std::initializer_list< std::uint8_t > values )
{
  std::vector< std::byte > v;
  for( auto value: values )
    v.push_back( std::byte{ value } );
  return v;
}

} // namespace

TEST( state_delta, crud )
{
  auto delta = std::make_shared< emissio::state_db::state_delta >();
  ASSERT_TRUE( delta );

  EXPECT_TRUE( delta->root() );
  EXPECT_FALSE( delta->complete() );
  EXPECT_FALSE( delta->get( bytes( { 0x01 } ) ) );

  auto key_1 = bytes( { 0x01 } ), value_1 = bytes( { 0x10 } );
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1 ), key_1.size() + value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  auto value_1a = bytes( { 0x10, 0x11, 0x12 } );
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1a ), value_1a.size() - value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), -1 * std::int64_t( key_1.size() + value_1a.size() ) );
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_FALSE( delta->removed( key_1 ) );
  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), 0 );
}

TEST( state_delta, children )
{
  auto parent = std::make_shared< emissio::state_db::state_delta >();

  auto key_1 = bytes( { 0x01 } ), value_1 = bytes( { 0x10 } );
  auto key_2 = bytes( { 0x02 } ), value_2 = bytes( { 0x20 } );
  auto key_3 = bytes( { 0x03 } ), value_3 = bytes( { 0x30 } );
  parent->put( std::vector< std::byte >( key_1 ), value_1 );
  parent->put( std::vector< std::byte >( key_2 ), value_2 );
  parent->put( std::vector< std::byte >( key_3 ), value_3 );

  auto child = parent->make_child();
  ASSERT_TRUE( child );
  EXPECT_FALSE( child->root() );
  EXPECT_EQ( child->parent(), parent );

  if( auto value = child->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "child did not read through to its parent";

  auto value_2a = bytes( { 0x21 } );
  child->put( std::vector< std::byte >( key_2 ), value_2a );
  EXPECT_EQ( child->remove( std::vector< std::byte >( key_3 ) ), -2 );
  EXPECT_TRUE( child->removed( key_3 ) );

  EXPECT_FALSE( child->get( key_3 ) );
  EXPECT_TRUE( parent->get( key_3 ) );
  EXPECT_TRUE( std::ranges::equal( *parent->get( key_2 ), value_2 ) );
  EXPECT_TRUE( std::ranges::equal( *child->get( key_2 ), value_2a ) );

  // Writing a removed key brings it back
  auto grandchild = child->make_child();
  grandchild->put( std::vector< std::byte >( key_3 ), value_3 );
  EXPECT_TRUE( grandchild->get( key_3 ) );
  EXPECT_FALSE( child->get( key_3 ) );

  child->squash();
  EXPECT_TRUE( child->complete() );
  EXPECT_THROW( child->put( std::vector< std::byte >( key_1 ), value_1 ), std::runtime_error );

  EXPECT_FALSE( parent->get( key_3 ) );
  EXPECT_TRUE( std::ranges::equal( *parent->get( key_2 ), value_2a ) );
  EXPECT_TRUE( std::ranges::equal( *parent->get( key_1 ), value_1 ) );
}

TEST( state_delta, discard )
{
  auto parent = std::make_shared< emissio::state_db::state_delta >();
  auto key    = bytes( { 0x01 } ), value = bytes( { 0x10 } );
  parent->put( std::vector< std::byte >( key ), value );

  {
    auto child = parent->make_child();
    child->put( std::vector< std::byte >( key ), bytes( { 0x11 } ) );
    child->put( bytes( { 0x02 } ), bytes( { 0x20 } ) );
  }

  EXPECT_TRUE( std::ranges::equal( *parent->get( key ), value ) );
  EXPECT_FALSE( parent->get( bytes( { 0x02 } ) ) );
  EXPECT_THROW( parent->squash(), std::runtime_error );
}

TEST( state_delta, next )
{
  auto parent = std::make_shared< emissio::state_db::state_delta >();
  parent->put( bytes( { 0x01 } ), bytes( { 0x10 } ) );
  parent->put( bytes( { 0x03 } ), bytes( { 0x30 } ) );
  parent->put( bytes( { 0x05 } ), bytes( { 0x50 } ) );

  auto child = parent->make_child();
  child->put( bytes( { 0x02 } ), bytes( { 0x20 } ) );
  child->remove( bytes( { 0x03 } ) );
  child->put( bytes( { 0x05 } ), bytes( { 0x51 } ) );

  std::vector< std::vector< std::byte > > keys;
  std::vector< std::vector< std::byte > > values;
  std::vector< std::byte > cursor;

  while( auto object = child->next( cursor ) )
  {
    cursor.assign( object->first.begin(), object->first.end() );
    keys.push_back( cursor );
    values.emplace_back( object->second.begin(), object->second.end() );
  }

  ASSERT_EQ( keys.size(), 3 );
  EXPECT_EQ( keys[ 0 ], bytes( { 0x01 } ) );
  EXPECT_EQ( keys[ 1 ], bytes( { 0x02 } ) );
  EXPECT_EQ( keys[ 2 ], bytes( { 0x05 } ) );
  EXPECT_EQ( values[ 2 ], bytes( { 0x51 } ) );

  EXPECT_FALSE( parent->next( bytes( { 0x05 } ) ) );
}

TEST( state_delta, object_space )
{
  emissio::state_db::object_space space;
  space.address[ 0 ] = std::byte{ 0x02 };
  space.id           = 3;

  auto key = emissio::state_db::make_key( space, bytes( { 0xaa } ) );
  ASSERT_EQ( key.size(), emissio::state_db::object_space_key_size + 1 );
  EXPECT_EQ( key[ 0 ], std::byte{ 0x00 } );
  EXPECT_EQ( key[ 1 ], std::byte{ 0x02 } );
  EXPECT_EQ( key[ emissio::state_db::object_space_key_size - 1 ], std::byte{ 0x03 } );
  EXPECT_EQ( key.back(), std::byte{ 0xaa } );

  EXPECT_TRUE( emissio::state_db::in_space( space, key ) );

  space.id = 4;
  EXPECT_FALSE( emissio::state_db::in_space( space, key ) );
}

// NOLINTEND
