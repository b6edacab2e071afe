#include <emissio/protocol/account.hpp>

#include <boost/endian.hpp>

#include <cstring>
#include <utility>

namespace emissio::protocol {

constexpr std::size_t index_offset = account_size - sizeof( std::uint64_t );

account_kind kind( account_view a ) noexcept
{
  switch( std::to_integer< std::uint8_t >( a[ 0 ] ) )
  {
    case std::to_underlying( account_kind::token ):
      return account_kind::token;
    case std::to_underlying( account_kind::pool ):
      return account_kind::pool;
    case std::to_underlying( account_kind::asset ):
      return account_kind::asset;
    default:
      return account_kind::user;
  }
}

account token_account( std::uint64_t index ) noexcept
{
  account a{};
  a[ 0 ] = static_cast< std::byte >( account_kind::token );

  boost::endian::native_to_big_inplace( index );
  std::memcpy( a.data() + index_offset, &index, sizeof( index ) );
  return a;
}

} // namespace emissio::protocol
