#include <emissio/encode/hex.hpp>

#include <array>
#include <cstdint>

namespace emissio::encode {

namespace {

constexpr std::array< char, 16 > digits{ '0', '1', '2', '3', '4', '5', '6', '7',
                                         '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };

constexpr std::uint8_t nibble_bits = 4;
constexpr std::uint8_t nibble_mask = 0x0f;
constexpr std::uint8_t alpha_base  = 10;

result< std::uint8_t > nibble( char c ) noexcept
{
  if( c >= '0' && c <= '9' )
    return static_cast< std::uint8_t >( c - '0' );
  if( c >= 'a' && c <= 'f' )
    return static_cast< std::uint8_t >( c - 'a' + alpha_base );
  if( c >= 'A' && c <= 'F' )
    return static_cast< std::uint8_t >( c - 'A' + alpha_base );

  return std::unexpected( encode_errc::invalid_character );
}

} // namespace

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string str;
  str.reserve( 2 + s.size() * 2 );
  str += "0x";

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( digits[ value >> nibble_bits ] );
    str.push_back( digits[ value & nibble_mask ] );
  }

  return str;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << nibble_bits | *low ) );
  }

  return bytes;
}

} // namespace emissio::encode
