#include <emissio/curve/error.hpp>

#include <string>
#include <utility>

namespace emissio::curve {

struct _curve_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "curve";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< curve_errc >( condition ) )
    {
      case curve_errc::ok:
        return "ok"s;
      case curve_errc::invalid_argument:
        return "invalid argument"s;
      case curve_errc::invalid_config:
        return "invalid curve configuration"s;
      case curve_errc::slippage_exceeded:
        return "slippage exceeded"s;
      case curve_errc::insufficient_reserves:
        return "insufficient reserves"s;
      case curve_errc::insufficient_balance:
        return "insufficient balance"s;
      case curve_errc::insufficient_supply:
        return "insufficient supply"s;
      case curve_errc::insufficient_amount:
        return "amount does not cover a single token"s;
      case curve_errc::supply_exceeded:
        return "supply exceeded"s;
      case curve_errc::trade_too_large:
        return "trade too large"s;
      case curve_errc::not_initialized:
        return "curve not initialized"s;
      case curve_errc::already_initialized:
        return "curve already initialized"s;
      case curve_errc::already_graduated:
        return "curve already graduated"s;
      case curve_errc::not_graduated:
        return "curve not graduated"s;
      case curve_errc::graduation_criteria_not_met:
        return "graduation criteria not met"s;
      case curve_errc::pool_creation_failed:
        return "pool creation failed"s;
      case curve_errc::liquidity_transfer_failed:
        return "liquidity transfer failed"s;
      case curve_errc::lp_distribution_failed:
        return "lp distribution failed"s;
      case curve_errc::transfer_failed:
        return "transfer failed"s;
    }
    std::unreachable();
  }
};

const std::error_category& curve_category() noexcept
{
  static _curve_category category;
  return category;
}

std::error_code make_error_code( curve_errc e )
{
  return std::error_code( static_cast< int >( e ), curve_category() );
}

} // namespace emissio::curve
