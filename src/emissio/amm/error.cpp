#include <emissio/amm/error.hpp>

#include <string>
#include <utility>

namespace emissio::amm {

struct _amm_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "amm";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< amm_errc >( condition ) )
    {
      case amm_errc::ok:
        return "ok"s;
      case amm_errc::pool_exists:
        return "pool already exists"s;
      case amm_errc::unknown_pool:
        return "unknown pool"s;
      case amm_errc::insufficient_liquidity:
        return "insufficient liquidity"s;
      case amm_errc::insufficient_lp:
        return "insufficient lp tokens"s;
      case amm_errc::rejected:
        return "rejected by pool"s;
    }
    std::unreachable();
  }
};

const std::error_category& amm_category() noexcept
{
  static _amm_category category;
  return category;
}

std::error_code make_error_code( amm_errc e )
{
  return std::error_code( static_cast< int >( e ), amm_category() );
}

} // namespace emissio::amm
