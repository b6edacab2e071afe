#include <emissio/controller/error.hpp>

#include <string>
#include <utility>

namespace emissio::controller {

struct _controller_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "controller";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< controller_errc >( condition ) )
    {
      case controller_errc::ok:
        return "ok"s;
      case controller_errc::unknown_token:
        return "unknown token"s;
      case controller_errc::insufficient_fee:
        return "insufficient deployment fee"s;
      case controller_errc::insufficient_funds:
        return "insufficient funds"s;
      case controller_errc::unexpected_object:
        return "unexpected object"s;
      case controller_errc::read_only:
        return "mutating request in a read only invocation"s;
      case controller_errc::unauthorized:
        return "unauthorized"s;
    }
    std::unreachable();
  }
};

const std::error_category& controller_category() noexcept
{
  static _controller_category category;
  return category;
}

std::error_code make_error_code( controller_errc e )
{
  return std::error_code( static_cast< int >( e ), controller_category() );
}

} // namespace emissio::controller
