#include <gtest/gtest.h>

#include <limits>

#include <boost/serialization/vector.hpp>

#include <emissio/encode/binary.hpp>

using emissio::encode::encode_errc;
using emissio::math::uint128;

TEST( binary, uint128_layout )
{
  auto bytes = emissio::encode::to_little_endian( uint128( 0x0102 ) );
  EXPECT_EQ( bytes[ 0 ], std::byte{ 0x02 } );
  EXPECT_EQ( bytes[ 1 ], std::byte{ 0x01 } );

  for( std::size_t i = 2; i < bytes.size(); ++i )
    EXPECT_EQ( bytes[ i ], std::byte{ 0x00 } );

  const auto max = std::numeric_limits< uint128 >::max();
  EXPECT_EQ( emissio::encode::from_little_endian( emissio::encode::to_little_endian( max ) ), max );

  uint128 high = uint128( 1 ) << 120;
  bytes        = emissio::encode::to_little_endian( high );
  EXPECT_EQ( bytes[ 15 ], std::byte{ 0x01 } );
  EXPECT_EQ( emissio::encode::from_little_endian( bytes ), high );
}

TEST( binary, reader )
{
  emissio::encode::writer out;
  out.write_integral( std::uint32_t( 201 ) )
    .write_uint128( uint128( 1'000'000 ) )
    .write_string( "Emissio" )
    .write_bool( true );

  emissio::encode::span_source source( out.data() );
  emissio::encode::reader in( source );

  auto opcode = in.read_integral< std::uint32_t >();
  ASSERT_TRUE( opcode );
  EXPECT_EQ( *opcode, 201 );

  auto amount = in.read_uint128();
  ASSERT_TRUE( amount );
  EXPECT_EQ( *amount, 1'000'000 );

  auto name = in.read_string();
  ASSERT_TRUE( name );
  EXPECT_EQ( *name, "Emissio" );

  auto flag = in.read_bool();
  ASSERT_TRUE( flag );
  EXPECT_TRUE( *flag );

  EXPECT_EQ( source.remaining(), 0 );

  auto missing = in.read_integral< std::uint8_t >();
  ASSERT_FALSE( missing );
  EXPECT_EQ( missing.error(), encode_errc::unexpected_end );
}

TEST( binary, reader_rejects_malformed_input )
{
  emissio::encode::writer out;
  out.write_integral( std::uint32_t( 10 ) ).write_bytes( std::vector< std::byte >( 4 ) );

  emissio::encode::span_source truncated( out.data() );
  emissio::encode::reader in( truncated );

  auto blob = in.read_blob();
  ASSERT_FALSE( blob );
  EXPECT_EQ( blob.error(), encode_errc::unexpected_end );

  emissio::encode::writer oversized;
  oversized.write_integral( emissio::encode::max_field_length + 1 );

  emissio::encode::span_source oversized_source( oversized.data() );
  emissio::encode::reader oversized_in( oversized_source );

  auto str = oversized_in.read_string();
  ASSERT_FALSE( str );
  EXPECT_EQ( str.error(), encode_errc::invalid_length );

  emissio::encode::writer flag;
  flag.write_integral( std::uint8_t( 2 ) );

  emissio::encode::span_source flag_source( flag.data() );
  emissio::encode::reader flag_in( flag_source );

  auto value = flag_in.read_bool();
  ASSERT_FALSE( value );
  EXPECT_EQ( value.error(), encode_errc::invalid_value );
}

TEST( binary, archive )
{
  std::vector< std::uint64_t > values{ 4, 8, 15, 16, 23, 42 };

  auto bytes = emissio::encode::to_archive( values );
  ASSERT_FALSE( bytes.empty() );

  auto decoded = emissio::encode::from_archive< std::vector< std::uint64_t > >( bytes );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( *decoded, values );

  bytes.resize( bytes.size() / 2 );
  decoded = emissio::encode::from_archive< std::vector< std::uint64_t > >( bytes );
  ASSERT_FALSE( decoded );
  EXPECT_EQ( decoded.error(), encode_errc::invalid_archive );
}
