#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <mintgate/protocol/serialization.hpp>

namespace mintgate::protocol {

using address = std::string;
using bytes   = std::vector< std::byte >;

// Token amounts are at least as wide as the host's 128 bit integers.
using amount = boost::multiprecision::uint128_t;

std::string to_string( const amount& value );
std::optional< amount > amount_from_string( std::string_view str ) noexcept;

struct coin
{
  amount value;
  std::string denom;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & value;
    ar & denom;
  }

  bool operator==( const coin& ) const = default;
};

coin make_coin( const amount& value, std::string denom );

} // namespace mintgate::protocol
