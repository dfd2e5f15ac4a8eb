#include <mintgate/protocol/types.hpp>

#include <limits>
#include <utility>

namespace mintgate::protocol {

std::string to_string( const amount& value )
{
  return value.str();
}

std::optional< amount > amount_from_string( std::string_view str ) noexcept
{
  if( str.empty() )
    return std::nullopt;

  static const amount ten = 10;
  amount value            = 0;

  for( char c: str )
  {
    if( c < '0' || c > '9' )
      return std::nullopt;

    const amount digit = static_cast< unsigned int >( c - '0' );
    if( value > ( std::numeric_limits< amount >::max() - digit ) / ten )
      return std::nullopt;

    value = value * ten + digit;
  }

  return value;
}

coin make_coin( const amount& value, std::string denom )
{
  return coin{ .value = value, .denom = std::move( denom ) };
}

} // namespace mintgate::protocol
