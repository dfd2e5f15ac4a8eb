#pragma once

#include <cstddef>
#include <exception>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <mintgate/encode/error.hpp>
#include <mintgate/memory.hpp>

namespace mintgate::encode {

constexpr auto archive_flags = boost::archive::no_header | boost::archive::no_tracking;

template< typename T >
std::vector< std::byte > to_bytes( const T& t )
{
  std::stringstream ss;
  {
    boost::archive::binary_oarchive oa( ss, archive_flags );
    oa << t;
  }

  const auto str   = ss.str();
  const auto bytes = memory::as_bytes( str );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

template< typename T >
result< T > from_bytes( std::span< const std::byte > bytes ) noexcept
{
  try
  {
    std::stringstream ss( std::string( memory::pointer_cast< const char* >( bytes.data() ), bytes.size() ) );
    boost::archive::binary_iarchive ia( ss, archive_flags );

    T t;
    ia >> t;
    return t;
  }
  catch( const std::exception& )
  {
    return std::unexpected( encode_errc::invalid_archive );
  }
}

} // namespace mintgate::encode
