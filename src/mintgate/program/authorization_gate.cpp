#include <mintgate/program/authorization_gate.hpp>
#include <mintgate/program/state.hpp>

#include <mintgate/memory.hpp>

namespace mintgate::program {

authorization_gate::authorization_gate( system_interface* system ) noexcept:
    _system( system )
{}

std::error_code authorization_gate::initialize( const protocol::address& controller )
{
  if( controller.empty() )
    return program_errc::invalid_argument;

  if( _system->get_object( state::space::ownership, std::span< const std::byte >{} ).size() )
    return program_errc::already_initialized;

  return _system->put_object( state::space::ownership,
                              std::span< const std::byte >{},
                              memory::as_bytes( controller ) );
}

std::error_code authorization_gate::assert_caller_is_controller( const protocol::address& caller ) const
{
  auto object = _system->get_object( state::space::ownership, std::span< const std::byte >{} );
  if( !object.size() )
    return program_errc::not_found;

  if( memory::as_string_view( object ) != caller )
    return program_errc::unauthorized;

  return program_errc::ok;
}

result< protocol::address > authorization_gate::controller() const
{
  auto object = _system->get_object( state::space::ownership, std::span< const std::byte >{} );
  if( !object.size() )
    return std::unexpected( program_errc::not_found );

  return protocol::address( memory::as_string_view( object ) );
}

} // namespace mintgate::program
