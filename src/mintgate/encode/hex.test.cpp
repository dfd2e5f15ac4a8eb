#include <array>

#include <gtest/gtest.h>

#include <mintgate/encode/hex.hpp>
#include <mintgate/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 5 > key_bytes{ 'u', 'a', 'b', 'c', '-' };
constexpr auto key_hex = "0x756162632d"sv;

TEST( hex, encode_continuation_key )
{
  EXPECT_EQ( mintgate::encode::to_hex( mintgate::memory::as_bytes( key_bytes ) ), key_hex );
  EXPECT_EQ( mintgate::encode::to_hex( std::span< const std::byte >{} ), "0x" );
}

TEST( hex, encode_pads_each_byte )
{
  const std::array< std::byte, 3 > key{ std::byte{ 0x00 }, std::byte{ 0x0a }, std::byte{ 0xff } };
  EXPECT_EQ( mintgate::encode::to_hex( key ), "0x000aff" );
}
