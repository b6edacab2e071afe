#include <emissio/curve/distribution.hpp>

#include <algorithm>

namespace emissio::curve {

namespace {

result< distribution_plan >
single_recipient( const uint128& lp_amount, std::uint64_t share_bps, const protocol::account& recipient )
{
  auto share = math::mul_div( lp_amount, share_bps, math::basis_points );
  if( !share )
    return std::unexpected( share.error() );

  distribution_plan plan;
  plan.burned = lp_amount - *share;

  if( *share > 0 )
    plan.allocations.push_back( { recipient, *share } );

  return plan;
}

struct planner
{
  const uint128& lp_amount;
  std::span< const holding > holders;
  const protocol::account& deployer;

  result< distribution_plan > operator()( const full_burn& ) const
  {
    distribution_plan plan;
    plan.burned = lp_amount;
    return plan;
  }

  result< distribution_plan > operator()( const community_rewards& rewards ) const
  {
    auto reward_pool = math::mul_div( lp_amount, defaults::community_rewards_bps, math::basis_points );
    if( !reward_pool )
      return std::unexpected( reward_pool.error() );

    auto recipients = top_holders( holders, rewards.recipients );

    uint128 weight = 0;
    for( const auto& recipient: recipients )
    {
      auto next = math::checked_add( weight, recipient.balance );
      if( !next )
        return std::unexpected( next.error() );

      weight = *next;
    }

    distribution_plan plan;
    uint128 distributed = 0;

    if( weight > 0 )
    {
      for( const auto& recipient: recipients )
      {
        auto share = math::mul_div( *reward_pool, recipient.balance, weight );
        if( !share )
          return std::unexpected( share.error() );

        if( *share == 0 )
          continue;

        plan.allocations.push_back( { recipient.holder, *share } );
        distributed += *share;
      }
    }

    plan.burned = lp_amount - distributed;
    return plan;
  }

  result< distribution_plan > operator()( const creator_allocation& ) const
  {
    return single_recipient( lp_amount, defaults::creator_allocation_bps, deployer );
  }

  result< distribution_plan > operator()( const dao_governance& dao ) const
  {
    return single_recipient( lp_amount, defaults::dao_governance_bps, dao.recipient );
  }
};

} // namespace

std::vector< holding > top_holders( std::span< const holding > holders, std::size_t count )
{
  std::vector< holding > ranked;
  ranked.reserve( holders.size() );

  for( const auto& h: holders )
    if( h.balance > 0 )
      ranked.push_back( h );

  std::ranges::sort( ranked,
                     []( const holding& a, const holding& b )
                     {
                       if( a.balance != b.balance )
                         return a.balance > b.balance;

                       return a.holder < b.holder;
                     } );

  if( ranked.size() > count )
    ranked.resize( count );

  return ranked;
}

result< distribution_plan > plan_distribution( const lp_strategy& strategy,
                                               const uint128& lp_amount,
                                               std::span< const holding > holders,
                                               const protocol::account& deployer )
{
  return std::visit( planner{ lp_amount, holders, deployer }, strategy );
}

} // namespace emissio::curve
