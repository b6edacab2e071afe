#pragma once

#include <span>

#include <emissio/curve/error.hpp>
#include <emissio/curve/types.hpp>

namespace emissio::curve {

/**
 * Splits the LP tokens received at graduation according to the strategy.
 *
 * The plan is a pure function of its inputs; nothing is transferred. Pro-rata
 * shares round down and the remainder is burned, so burned plus allocated always
 * equals lp_amount. Allocations of zero are omitted.
 */
result< distribution_plan > plan_distribution( const lp_strategy& strategy,
                                               const uint128& lp_amount,
                                               std::span< const holding > holders,
                                               const protocol::account& deployer );

// The holders that receive community rewards, largest balance first
std::vector< holding > top_holders( std::span< const holding > holders, std::size_t count );

} // namespace emissio::curve
