#include <mintgate/program/contract_info.hpp>
#include <mintgate/program/state.hpp>

#include <mintgate/encode/archive.hpp>

namespace mintgate::program {

std::error_code set_contract_info( system_interface* system, std::string_view name, std::string_view version )
{
  protocol::contract_info info{ .name = std::string( name ), .version = std::string( version ) };
  auto bytes = encode::to_bytes( info );

  return system->put_object( state::space::contract_info, std::span< const std::byte >{}, bytes );
}

result< protocol::contract_info > get_contract_info( system_interface* system )
{
  auto object = system->get_object( state::space::contract_info, std::span< const std::byte >{} );
  if( !object.size() )
    return std::unexpected( program_errc::not_found );

  return encode::from_bytes< protocol::contract_info >( object );
}

} // namespace mintgate::program
