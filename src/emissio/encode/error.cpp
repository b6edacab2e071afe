#include <emissio/encode/error.hpp>

#include <string>
#include <utility>

namespace emissio::encode {

struct _encode_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "encode";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< encode_errc >( condition ) )
    {
      case encode_errc::ok:
        return "ok"s;
      case encode_errc::invalid_character:
        return "invalid character"s;
      case encode_errc::invalid_length:
        return "invalid length"s;
      case encode_errc::unexpected_end:
        return "unexpected end of input"s;
      case encode_errc::invalid_value:
        return "invalid value"s;
      case encode_errc::invalid_archive:
        return "invalid archive"s;
    }
    std::unreachable();
  }
};

const std::error_category& encode_category() noexcept
{
  static _encode_category category;
  return category;
}

std::error_code make_error_code( encode_errc e )
{
  return std::error_code( static_cast< int >( e ), encode_category() );
}

} // namespace emissio::encode
