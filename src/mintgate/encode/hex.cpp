#include <mintgate/encode/hex.hpp>

#include <bit>
#include <iomanip>
#include <sstream>

namespace mintgate::encode {

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::stringstream stream;
  stream << "0x" << std::hex << std::setfill( '0' );
  for( const auto& b: s )
    stream << std::setw( 2 ) << static_cast< unsigned int >( std::bit_cast< unsigned char >( b ) );

  return stream.str();
}

} // namespace mintgate::encode
