#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <emissio/encode/hex.hpp>
#include <emissio/math/fixed_point.hpp>

namespace emissio::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

// Wraps a 128-bit amount so it is formatted on the backend thread
struct amount
{
  math::uint128 value;
};

} // namespace emissio::log

template<>
struct fmtquill::formatter< emissio::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const emissio::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                emissio::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< emissio::log::hex >: quill::BinaryDataDeferredFormatCodec< emissio::log::hex >
{};

template<>
struct fmtquill::formatter< emissio::log::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const emissio::log::amount& a, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", a.value.str() );
  }
};

template<>
struct quill::Codec< emissio::log::amount >: quill::DeferredFormatCodec< emissio::log::amount >
{};
