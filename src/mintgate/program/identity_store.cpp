#include <mintgate/program/identity_store.hpp>
#include <mintgate/program/state.hpp>

#include <boost/algorithm/string/case_conv.hpp>

#include <mintgate/memory.hpp>

namespace mintgate::program {

std::string make_denomination( std::string_view subunit, std::string_view program_address )
{
  std::string denomination;
  denomination.reserve( subunit.size() + program_address.size() + 1 );
  denomination.append( subunit );
  denomination.push_back( '-' );
  denomination.append( program_address );

  boost::algorithm::to_lower( denomination );
  return denomination;
}

identity_store::identity_store( system_interface* system ) noexcept:
    _system( system )
{}

std::error_code identity_store::save( std::string_view denomination )
{
  if( denomination.empty() )
    return program_errc::invalid_argument;

  if( _system->get_object( state::space::denomination, std::span< const std::byte >{} ).size() )
    return program_errc::already_initialized;

  return _system->put_object( state::space::denomination,
                              std::span< const std::byte >{},
                              memory::as_bytes( denomination ) );
}

result< std::string > identity_store::load() const
{
  auto object = _system->get_object( state::space::denomination, std::span< const std::byte >{} );
  if( !object.size() )
    return std::unexpected( program_errc::not_found );

  return std::string( memory::as_string_view( object ) );
}

} // namespace mintgate::program
