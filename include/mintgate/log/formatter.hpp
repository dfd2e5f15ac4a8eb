#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <mintgate/encode/hex.hpp>
#include <mintgate/protocol/types.hpp>

namespace mintgate::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace mintgate::log

template<>
struct fmtquill::formatter< mintgate::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintgate::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                mintgate::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< mintgate::log::hex >: quill::BinaryDataDeferredFormatCodec< mintgate::log::hex >
{};

template<>
struct fmtquill::formatter< mintgate::protocol::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintgate::protocol::amount& value, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", mintgate::protocol::to_string( value ) );
  }
};

template<>
struct quill::Codec< mintgate::protocol::amount >: quill::DeferredFormatCodec< mintgate::protocol::amount >
{};
