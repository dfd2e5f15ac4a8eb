#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mintgate/encode.hpp>
#include <mintgate/program.hpp>
#include <mintgate/protocol.hpp>

namespace test {

/**
 * A scripted host. Queries are answered by a handler supplied by the test
 * and recorded in the order they were issued.
 */
class mock_host final: public mintgate::program::system_interface
{
public:
  using handler = std::function< mintgate::program::result< mintgate::protocol::asset_ft::query_response >(
    const mintgate::protocol::asset_ft::query& ) >;

  explicit mock_host( mintgate::protocol::address program_address = "contractX" );
  mock_host( const mock_host& ) = delete;
  mock_host( mock_host&& )      = delete;
  ~mock_host() override         = default;

  mock_host& operator=( const mock_host& ) = delete;
  mock_host& operator=( mock_host&& )      = delete;

  void set_caller( mintgate::protocol::address caller );
  void set_handler( handler h );

  template< typename T >
  void set_input( const T& message )
  {
    _stdin = mintgate::encode::to_bytes( message );
  }

  void set_raw_input( std::vector< std::byte > bytes );

  const std::vector< mintgate::protocol::asset_ft::query >& queries() const noexcept;
  const std::vector< std::byte >& output() const noexcept;

  // Object spaces in the order they were written
  const std::vector< std::uint32_t >& writes() const noexcept;

  template< typename T >
  mintgate::program::result< T > output_as() const
  {
    return mintgate::encode::from_bytes< T >( _stdout );
  }

  std::span< const std::byte > input() override;
  std::error_code write( mintgate::program::file_descriptor fd, std::span< const std::byte > buffer ) override;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) override;
  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) override;

  const mintgate::protocol::address& get_caller() override;
  const mintgate::protocol::address& get_program_address() override;

  mintgate::program::result< mintgate::protocol::asset_ft::query_response >
  query( const mintgate::protocol::asset_ft::query& request ) override;

private:
  mintgate::protocol::address _program_address;
  mintgate::protocol::address _caller;
  handler _handler;
  std::vector< mintgate::protocol::asset_ft::query > _queries;
  std::vector< std::uint32_t > _writes;
  std::map< std::pair< std::uint32_t, std::vector< std::byte > >, std::vector< std::byte > > _objects;
  std::vector< std::byte > _stdin;
  std::vector< std::byte > _stdout;
};

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture() = default;
};

// Builds a continuation key from its text
std::vector< std::byte > key( std::string_view text );

} // namespace test
