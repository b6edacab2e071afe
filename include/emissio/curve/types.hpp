#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

#include <boost/archive/archive_exception.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <emissio/curve/error.hpp>
#include <emissio/math/fixed_point.hpp>
#include <emissio/protocol/account.hpp>

namespace emissio::curve {

using math::uint128;

enum class base_currency : std::uint8_t
{
  busd,
  frbtc
};

enum class lifecycle_phase : std::uint8_t
{
  trading,
  graduated
};

enum class trade_direction : std::uint8_t
{
  buy,
  sell
};

namespace defaults {

constexpr std::uint64_t base_price                 = 4'000'000;
constexpr std::uint64_t growth_rate_bps            = 150;
constexpr std::uint64_t max_supply                 = 1'000'000'000;
constexpr std::uint64_t market_cap_threshold       = 6'900'000'000;
constexpr std::uint64_t liquidity_threshold        = 3'500'000'000;
constexpr std::uint64_t minimum_unique_holders     = 100;
constexpr std::uint64_t minimum_age                = 86'400;
constexpr std::uint64_t fallback_age               = 30 * minimum_age;
constexpr std::uint64_t fallback_liquidity         = 100'000'000;
constexpr std::uint32_t reward_recipients          = 10;
constexpr std::uint64_t max_trade_bps              = 1'000;
constexpr std::uint64_t community_rewards_bps      = 2'000;
constexpr std::uint64_t creator_allocation_bps     = 1'000;
constexpr std::uint64_t dao_governance_bps         = 2'000;

} // namespace defaults

struct full_burn
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct community_rewards
{
  std::uint32_t recipients = defaults::reward_recipients;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & recipients;
  }
};

struct creator_allocation
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct dao_governance
{
  protocol::account recipient{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & recipient;
  }
};

using lp_strategy = std::variant< full_burn, community_rewards, creator_allocation, dao_governance >;

struct curve_config
{
  uint128 base_price                      = defaults::base_price;
  std::uint64_t growth_rate_bps           = defaults::growth_rate_bps;
  uint128 max_supply                      = defaults::max_supply;
  base_currency currency                  = base_currency::busd;
  uint128 graduation_market_cap_threshold = defaults::market_cap_threshold;
  uint128 graduation_liquidity_threshold  = defaults::liquidity_threshold;
  std::uint64_t minimum_unique_holders    = defaults::minimum_unique_holders;
  std::uint64_t minimum_age               = defaults::minimum_age;
  std::uint64_t fallback_age              = defaults::fallback_age;
  uint128 fallback_liquidity              = defaults::fallback_liquidity;
  lp_strategy strategy                    = full_burn{};

  std::error_code validate() const noexcept;

  template< class Archive >
  void save( Archive& ar, const unsigned int ) const
  {
    ar & base_price;
    ar & growth_rate_bps;
    ar & max_supply;
    ar & currency;
    ar & graduation_market_cap_threshold;
    ar & graduation_liquidity_threshold;
    ar & minimum_unique_holders;
    ar & minimum_age;
    ar & fallback_age;
    ar & fallback_liquidity;

    auto tag = static_cast< std::uint8_t >( strategy.index() );
    ar & tag;
    std::visit( [ & ]( const auto& s ) { ar & s; }, strategy );
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int )
  {
    ar & base_price;
    ar & growth_rate_bps;
    ar & max_supply;
    ar & currency;
    ar & graduation_market_cap_threshold;
    ar & graduation_liquidity_threshold;
    ar & minimum_unique_holders;
    ar & minimum_age;
    ar & fallback_age;
    ar & fallback_liquidity;

    std::uint8_t tag = 0;
    ar & tag;
    switch( tag )
    {
      case 0:
        strategy = full_burn{};
        break;
      case 1:
        strategy = community_rewards{};
        break;
      case 2:
        strategy = creator_allocation{};
        break;
      case 3:
        strategy = dao_governance{};
        break;
      default:
        throw boost::archive::archive_exception( boost::archive::archive_exception::input_stream_error,
                                                 "unknown lp strategy" );
    }
    std::visit( [ & ]( auto& s ) { ar & s; }, strategy );
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

struct curve_state
{
  uint128 current_supply = 0;
  uint128 base_reserves  = 0;
  lifecycle_phase phase  = lifecycle_phase::trading;
  std::optional< protocol::account > pool;
  std::uint64_t holder_count = 0;
  std::uint64_t created_at   = 0;

  bool operator==( const curve_state& ) const = default;

  template< class Archive >
  void save( Archive& ar, const unsigned int ) const
  {
    ar & current_supply;
    ar & base_reserves;
    ar & phase;

    bool has_pool = pool.has_value();
    ar & has_pool;
    if( has_pool )
      ar & *pool;

    ar & holder_count;
    ar & created_at;
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int )
  {
    ar & current_supply;
    ar & base_reserves;
    ar & phase;

    bool has_pool = false;
    ar & has_pool;
    if( has_pool )
    {
      pool.emplace();
      ar & *pool;
    }
    else
      pool.reset();

    ar & holder_count;
    ar & created_at;
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

struct holding
{
  protocol::account holder{};
  uint128 balance = 0;
};

struct lp_allocation
{
  protocol::account recipient{};
  uint128 amount = 0;

  bool operator==( const lp_allocation& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & recipient;
    ar & amount;
  }
};

struct distribution_plan
{
  uint128 burned = 0;
  std::vector< lp_allocation > allocations;

  result< uint128 > total() const noexcept;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & burned;
    ar & allocations;
  }
};

struct graduation_record
{
  protocol::account pool{};
  uint128 base_liquidity  = 0;
  uint128 token_liquidity = 0;
  uint128 lp_received     = 0;
  distribution_plan distribution;
  std::uint64_t graduated_at = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & pool;
    ar & base_liquidity;
    ar & token_liquidity;
    ar & lp_received;
    ar & distribution;
    ar & graduated_at;
  }
};

/**
 * The outcome of one buy or sell. Trades are never persisted; the graduation
 * member is set when the trade pushed the curve over its graduation criteria.
 */
struct trade
{
  trade_direction direction = trade_direction::buy;
  uint128 tokens            = 0;
  uint128 base_amount       = 0;
  uint128 price             = 0;
  uint128 refund            = 0;
  uint128 supply_after      = 0;
  uint128 reserves_after    = 0;
  std::optional< graduation_record > graduation;
};

struct token_metadata
{
  std::string name;
  std::string symbol;
  protocol::account deployer{};
  base_currency currency   = base_currency::busd;
  std::uint64_t created_at = 0;
  std::vector< std::byte > data;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & name;
    ar & symbol;
    ar & deployer;
    ar & currency;
    ar & created_at;
    ar & data;
  }
};

struct launch_parameters
{
  std::string name;
  std::string symbol;
  curve_config config;
  std::vector< std::byte > data;

  std::error_code validate() const noexcept;
};

std::string_view to_string( base_currency currency ) noexcept;
std::string_view strategy_name( const lp_strategy& strategy ) noexcept;

// The asset identifier the external pool uses for a base currency
protocol::account currency_account( base_currency currency ) noexcept;

} // namespace emissio::curve
