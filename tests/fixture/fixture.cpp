// NOLINTBEGIN

#include <test/fixture.hpp>

#include <mintgate/log.hpp>
#include <mintgate/memory.hpp>

namespace test {

mock_host::mock_host( mintgate::protocol::address program_address ):
    _program_address( std::move( program_address ) )
{}

void mock_host::set_caller( mintgate::protocol::address caller )
{
  _caller = std::move( caller );
}

void mock_host::set_handler( handler h )
{
  _handler = std::move( h );
}

void mock_host::set_raw_input( std::vector< std::byte > bytes )
{
  _stdin = std::move( bytes );
}

const std::vector< mintgate::protocol::asset_ft::query >& mock_host::queries() const noexcept
{
  return _queries;
}

const std::vector< std::byte >& mock_host::output() const noexcept
{
  return _stdout;
}

const std::vector< std::uint32_t >& mock_host::writes() const noexcept
{
  return _writes;
}

std::span< const std::byte > mock_host::input()
{
  return _stdin;
}

std::error_code mock_host::write( mintgate::program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd != mintgate::program::file_descriptor::stdout )
    return mintgate::program::program_errc::invalid_argument;

  _stdout.insert( _stdout.end(), buffer.begin(), buffer.end() );
  return mintgate::program::program_errc::ok;
}

std::span< const std::byte > mock_host::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( auto it = _objects.find( { id, std::vector< std::byte >( key.begin(), key.end() ) } ); it != _objects.end() )
    return it->second;

  return std::span< const std::byte >{};
}

std::error_code
mock_host::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  _objects[ { id, std::vector< std::byte >( key.begin(), key.end() ) } ] =
    std::vector< std::byte >( value.begin(), value.end() );
  _writes.push_back( id );
  return mintgate::program::program_errc::ok;
}

const mintgate::protocol::address& mock_host::get_caller()
{
  return _caller;
}

const mintgate::protocol::address& mock_host::get_program_address()
{
  return _program_address;
}

mintgate::program::result< mintgate::protocol::asset_ft::query_response >
mock_host::query( const mintgate::protocol::asset_ft::query& request )
{
  _queries.push_back( request );

  if( !_handler )
    return std::unexpected( mintgate::program::program_errc::unexpected_response );

  return _handler( request );
}

fixture::fixture( const std::string& name, const std::string& log_level )
{
  mintgate::log::initialize();
  if( !mintgate::log::set_level( log_level ) )
    LOG_WARNING( mintgate::log::instance(), "Unknown log level {}", log_level );

  LOG_INFO( mintgate::log::instance(), "Starting {} tests", name );
}

std::vector< std::byte > key( std::string_view text )
{
  auto bytes = mintgate::memory::as_bytes( text );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

} // namespace test

// NOLINTEND
