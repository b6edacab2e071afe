#pragma once

#include <memory>
#include <system_error>

#include <emissio/controller/error.hpp>
#include <emissio/curve/types.hpp>
#include <emissio/math/fixed_point.hpp>
#include <emissio/protocol/account.hpp>
#include <emissio/state_db/state_delta.hpp>

namespace emissio::controller {

// Base currency balances held in a state delta
class bank
{
public:
  explicit bank( std::shared_ptr< state_db::state_delta > delta ) noexcept;

  result< math::uint128 > balance( protocol::account_view account, curve::base_currency currency ) const;

  std::error_code credit( protocol::account_view account, curve::base_currency currency, const math::uint128& amount );
  std::error_code debit( protocol::account_view account, curve::base_currency currency, const math::uint128& amount );

  std::error_code transfer( protocol::account_view from,
                            protocol::account_view to,
                            curve::base_currency currency,
                            const math::uint128& amount );

private:
  std::shared_ptr< state_db::state_delta > _delta;
};

} // namespace emissio::controller
