#include <emissio/encode/binary.hpp>

namespace emissio::encode {

constexpr unsigned int bits_per_byte = 8;
constexpr unsigned int byte_mask     = 0xff;

uint128_bytes to_little_endian( const math::uint128& value ) noexcept
{
  uint128_bytes bytes{};
  math::uint128 remaining = value;

  for( auto& b: bytes )
  {
    math::uint128 low = remaining & byte_mask;
    b                 = static_cast< std::byte >( low.convert_to< unsigned int >() );
    remaining       >>= bits_per_byte;
  }

  return bytes;
}

math::uint128 from_little_endian( std::span< const std::byte, uint128_size > bytes ) noexcept
{
  math::uint128 value = 0;

  for( auto itr = bytes.rbegin(); itr != bytes.rend(); ++itr )
  {
    value <<= bits_per_byte;
    value  |= std::to_integer< unsigned int >( *itr );
  }

  return value;
}

} // namespace emissio::encode
