#include <gtest/gtest.h>

#include <emissio/program/instruction.hpp>

using namespace emissio;
using namespace emissio::program;

namespace {

result< instruction::request > decode( const std::vector< std::byte >& bytes )
{
  encode::span_source source( bytes );
  return instruction::decode( source );
}

} // namespace

TEST( instruction, opcode_prefix )
{
  auto bytes = instruction::encode( instruction::sell{ 5, 7 } );
  ASSERT_EQ( bytes.size(), 4 + 2 * encode::uint128_size );

  EXPECT_EQ( bytes[ 0 ], std::byte{ 202 } );
  EXPECT_EQ( bytes[ 1 ], std::byte{ 0 } );
  EXPECT_EQ( bytes[ 4 ], std::byte{ 5 } );
  EXPECT_EQ( bytes[ 4 + encode::uint128_size ], std::byte{ 7 } );

  bytes = instruction::encode( instruction::get_data{} );
  ASSERT_EQ( bytes.size(), 4 );
  EXPECT_EQ( bytes[ 0 ], std::byte{ 0xe8 } );
  EXPECT_EQ( bytes[ 1 ], std::byte{ 0x03 } );
}

TEST( instruction, initialize )
{
  instruction::initialize init;
  init.parameters.name                   = "Emissio";
  init.parameters.symbol                 = "EMS";
  init.parameters.config.base_price      = 1'000;
  init.parameters.config.growth_rate_bps = 150;
  init.parameters.config.currency        = curve::base_currency::frbtc;
  init.parameters.config.fallback_age    = 0;
  init.parameters.data                   = { std::byte{ 1 }, std::byte{ 2 } };

  protocol::account recipient{};
  recipient[ 31 ]                 = std::byte{ 9 };
  init.parameters.config.strategy = curve::dao_governance{ recipient };

  auto request = decode( instruction::encode( init ) );
  ASSERT_TRUE( request );
  ASSERT_TRUE( std::holds_alternative< instruction::initialize >( *request ) );

  const auto& decoded = std::get< instruction::initialize >( *request ).parameters;
  EXPECT_EQ( decoded.name, "Emissio" );
  EXPECT_EQ( decoded.symbol, "EMS" );
  EXPECT_EQ( decoded.config.base_price, 1'000 );
  EXPECT_EQ( decoded.config.growth_rate_bps, 150 );
  EXPECT_EQ( decoded.config.max_supply, curve::defaults::max_supply );
  EXPECT_EQ( decoded.config.currency, curve::base_currency::frbtc );
  EXPECT_EQ( decoded.config.fallback_age, 0 );
  EXPECT_EQ( decoded.data, init.parameters.data );

  auto dao = std::get_if< curve::dao_governance >( &decoded.config.strategy );
  ASSERT_NE( dao, nullptr );
  EXPECT_EQ( dao->recipient, recipient );
}

TEST( instruction, unknown_opcode )
{
  std::vector< std::byte > bytes{ std::byte{ 42 }, std::byte{ 0 }, std::byte{ 0 }, std::byte{ 0 } };

  auto request = decode( bytes );
  ASSERT_FALSE( request );
  EXPECT_EQ( request.error(), program_errc::invalid_instruction );
}

TEST( instruction, truncated_payload )
{
  auto bytes = instruction::encode( instruction::transfer{ protocol::account{}, 10 } );
  bytes.pop_back();

  auto request = decode( bytes );
  ASSERT_FALSE( request );
  EXPECT_EQ( request.error(), encode::encode_errc::unexpected_end );

  request = decode( {} );
  ASSERT_FALSE( request );
  EXPECT_EQ( request.error(), encode::encode_errc::unexpected_end );
}

TEST( instruction, invalid_strategy )
{
  instruction::initialize init;
  init.parameters.name   = "Emissio";
  init.parameters.symbol = "EMS";

  auto bytes = instruction::encode( init );

  // The strategy tag follows the fixed size config fields and precedes the empty data blob
  auto& tag = bytes[ bytes.size() - sizeof( std::uint32_t ) - 1 ];
  ASSERT_EQ( tag, std::byte{ 0 } );
  tag = std::byte{ 4 };

  auto request = decode( bytes );
  ASSERT_FALSE( request );
  EXPECT_EQ( request.error(), encode::encode_errc::invalid_value );
}

TEST( instruction, mutates )
{
  EXPECT_TRUE( instruction::mutates( instruction::buy{} ) );
  EXPECT_TRUE( instruction::mutates( instruction::sell{} ) );
  EXPECT_TRUE( instruction::mutates( instruction::graduate{} ) );
  EXPECT_TRUE( instruction::mutates( instruction::transfer{} ) );
  EXPECT_FALSE( instruction::mutates( instruction::get_buy_quote{} ) );
  EXPECT_FALSE( instruction::mutates( instruction::get_state{} ) );
  EXPECT_FALSE( instruction::mutates( instruction::balance_of{} ) );

  EXPECT_EQ( instruction::code( instruction::get_graduation_record{} ), instruction::opcode::get_graduation_record );
}
