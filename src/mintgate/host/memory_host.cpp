#include <mintgate/host/memory_host.hpp>

#include <array>
#include <string>
#include <type_traits>

#include <mintgate/encode/archive.hpp>
#include <mintgate/log.hpp>

namespace mintgate::host {

memory_host::memory_host( protocol::address program_address, std::uint64_t page_size ):
    _program_address( std::move( program_address ) ),
    _ledger( page_size )
{}

asset_ft_ledger& memory_host::ledger() noexcept
{
  return _ledger;
}

const asset_ft_ledger& memory_host::ledger() const noexcept
{
  return _ledger;
}

std::uint64_t memory_host::query_count() const noexcept
{
  return _queries;
}

std::span< const std::byte > memory_host::input()
{
  return _stdin;
}

std::error_code memory_host::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd != program::file_descriptor::stdout )
    return program::program_errc::invalid_argument;

  _stdout.insert( _stdout.end(), buffer.begin(), buffer.end() );
  return program::program_errc::ok;
}

std::span< const std::byte > memory_host::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( auto it = _objects.find( object_key{ id, protocol::bytes( key.begin(), key.end() ) } ); it != _objects.end() )
    return it->second;

  return std::span< const std::byte >{};
}

std::error_code
memory_host::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  _objects[ object_key{ id, protocol::bytes( key.begin(), key.end() ) } ] =
    protocol::bytes( value.begin(), value.end() );
  return program::program_errc::ok;
}

const protocol::address& memory_host::get_caller()
{
  return _caller;
}

const protocol::address& memory_host::get_program_address()
{
  return _program_address;
}

program::result< protocol::asset_ft::query_response >
memory_host::query( const protocol::asset_ft::query& request )
{
  ++_queries;
  return _ledger.query( request );
}

std::error_code memory_host::apply( const protocol::response& response )
{
  for( const auto& message: response.messages )
  {
    if( auto error = _ledger.apply( _program_address, message ); error )
    {
      LOG_WARNING( mintgate::log::instance(), "Effect of {} rejected by asset_ft: {}", _program_address, error.message() );
      return error;
    }
  }

  return asset_ft_errc::ok;
}

template< typename Response, typename Message >
program::result< Response > memory_host::invoke( program::program& p,
                                                 const protocol::address& sender,
                                                 std::string_view entry,
                                                 const Message& msg )
{
  auto objects = _objects;
  auto ledger  = _ledger;

  auto revert = [ & ]( std::error_code error ) -> program::result< Response >
  {
    _objects = std::move( objects );
    _ledger  = std::move( ledger );
    return std::unexpected( error );
  };

  _caller = sender;
  _stdin  = encode::to_bytes( msg );
  _stdout.clear();

  const std::array< std::string, 1 > arguments{ std::string( entry ) };

  if( auto error = p.run( this, arguments ); error )
  {
    LOG_DEBUG( mintgate::log::instance(), "{} on {} failed: {}", entry, _program_address, error.message() );
    return revert( error );
  }

  auto response = encode::from_bytes< Response >( _stdout );
  if( !response )
    return revert( response.error() );

  if constexpr( std::is_same_v< Response, protocol::response > )
  {
    if( auto error = apply( *response ); error )
      return revert( error );
  }

  return response;
}

program::result< protocol::response > memory_host::instantiate( program::program& p,
                                                                 const protocol::address& sender,
                                                                 const protocol::instantiate_msg& msg )
{
  return invoke< protocol::response >( p, sender, program::entry_point::instantiate, msg );
}

program::result< protocol::response >
memory_host::execute( program::program& p, const protocol::address& sender, const protocol::execute_msg& msg )
{
  return invoke< protocol::response >( p, sender, program::entry_point::execute, msg );
}

program::result< protocol::query_response > memory_host::read( program::program& p, const protocol::query_msg& msg )
{
  return invoke< protocol::query_response >( p, protocol::address{}, program::entry_point::query, msg );
}

} // namespace mintgate::host
