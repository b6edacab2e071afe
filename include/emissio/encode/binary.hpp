#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/endian.hpp>

#include <emissio/encode/error.hpp>
#include <emissio/math/fixed_point.hpp>

namespace emissio::encode {

constexpr std::size_t uint128_size       = 16;
constexpr std::uint32_t max_field_length = 64 * 1'024;

using uint128_bytes = std::array< std::byte, uint128_size >;

uint128_bytes to_little_endian( const math::uint128& value ) noexcept;
math::uint128 from_little_endian( std::span< const std::byte, uint128_size > bytes ) noexcept;

template< typename T >
concept byte_source = requires( T& source, std::span< std::byte > buffer ) {
  { source.read( buffer ) } -> std::same_as< std::error_code >;
};

class span_source
{
public:
  explicit span_source( std::span< const std::byte > bytes ) noexcept:
      _bytes( bytes )
  {}

  std::error_code read( std::span< std::byte > buffer ) noexcept
  {
    if( buffer.size() > _bytes.size() )
      return encode_errc::unexpected_end;

    std::memcpy( buffer.data(), _bytes.data(), buffer.size() );
    _bytes = _bytes.subspan( buffer.size() );
    return encode_errc::ok;
  }

  std::size_t remaining() const noexcept
  {
    return _bytes.size();
  }

private:
  std::span< const std::byte > _bytes;
};

/**
 * Reads little endian integers, 128-bit amounts, fixed arrays and length
 * prefixed strings from a byte source. Lengths are 32-bit and bounded by
 * max_field_length.
 */
template< byte_source Source >
class reader
{
public:
  explicit reader( Source& source ) noexcept:
      _source( source )
  {}

  template< std::integral T >
  result< T > read_integral()
  {
    T value{};
    if( auto error = _source.read( std::as_writable_bytes( std::span( &value, 1 ) ) ); error )
      return std::unexpected( error );

    boost::endian::little_to_native_inplace( value );
    return value;
  }

  result< bool > read_bool()
  {
    auto value = read_integral< std::uint8_t >();
    if( !value )
      return std::unexpected( value.error() );

    if( *value > 1 )
      return std::unexpected( encode_errc::invalid_value );

    return *value == 1;
  }

  result< math::uint128 > read_uint128()
  {
    uint128_bytes bytes{};
    if( auto error = _source.read( bytes ); error )
      return std::unexpected( error );

    return from_little_endian( bytes );
  }

  template< std::size_t N >
  result< std::array< std::byte, N > > read_array()
  {
    std::array< std::byte, N > bytes{};
    if( auto error = _source.read( bytes ); error )
      return std::unexpected( error );

    return bytes;
  }

  result< std::vector< std::byte > > read_blob()
  {
    auto length = read_integral< std::uint32_t >();
    if( !length )
      return std::unexpected( length.error() );

    if( *length > max_field_length )
      return std::unexpected( encode_errc::invalid_length );

    std::vector< std::byte > bytes( *length );
    if( auto error = _source.read( bytes ); error )
      return std::unexpected( error );

    return bytes;
  }

  result< std::string > read_string()
  {
    auto bytes = read_blob();
    if( !bytes )
      return std::unexpected( bytes.error() );

    return std::string( reinterpret_cast< const char* >( bytes->data() ), bytes->size() ); // NOLINT
  }

private:
  Source& _source;
};

class writer
{
public:
  template< std::integral T >
  writer& write_integral( T value )
  {
    boost::endian::native_to_little_inplace( value );
    return write_bytes( std::as_bytes( std::span( &value, 1 ) ) );
  }

  writer& write_bool( bool value )
  {
    return write_integral( static_cast< std::uint8_t >( value ? 1 : 0 ) );
  }

  writer& write_uint128( const math::uint128& value )
  {
    return write_bytes( to_little_endian( value ) );
  }

  writer& write_bytes( std::span< const std::byte > bytes )
  {
    _buffer.insert( _buffer.end(), bytes.begin(), bytes.end() );
    return *this;
  }

  writer& write_blob( std::span< const std::byte > bytes )
  {
    write_integral( static_cast< std::uint32_t >( bytes.size() ) );
    return write_bytes( bytes );
  }

  writer& write_string( std::string_view str )
  {
    return write_blob( std::as_bytes( std::span( str ) ) );
  }

  const std::vector< std::byte >& data() const noexcept
  {
    return _buffer;
  }

  std::vector< std::byte > release() noexcept
  {
    return std::move( _buffer );
  }

private:
  std::vector< std::byte > _buffer;
};

constexpr unsigned int archive_flags = boost::archive::no_header | boost::archive::no_tracking;

template< typename T >
std::vector< std::byte > to_archive( const T& t )
{
  std::stringstream stream;

  {
    boost::archive::binary_oarchive archive( stream, archive_flags );
    archive << t;
  }

  auto str   = stream.str();
  auto bytes = std::as_bytes( std::span( str ) );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

template< typename T >
result< T > from_archive( std::span< const std::byte > bytes )
{
  std::stringstream stream( std::string( reinterpret_cast< const char* >( bytes.data() ), // NOLINT
                                         bytes.size() ) );

  try
  {
    boost::archive::binary_iarchive archive( stream, archive_flags );
    T t;
    archive >> t;
    return t;
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( encode_errc::invalid_archive );
  }
}

} // namespace emissio::encode
