#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <string_view>
#include <utility>

#include <mintgate/host/asset_ft_ledger.hpp>
#include <mintgate/program/program.hpp>
#include <mintgate/program/system_interface.hpp>
#include <mintgate/protocol.hpp>

namespace mintgate::host {

/**
 * Runs a program against in-memory state and an in-memory asset_ft ledger.
 *
 * Each invocation is atomic: the effect messages a program returns are
 * applied on behalf of the program address once it has finished, and any
 * failure restores the program state and the ledger to what they were
 * before the call.
 */
class memory_host final: public program::system_interface
{
public:
  explicit memory_host( protocol::address program_address, std::uint64_t page_size = 100 );
  memory_host( const memory_host& ) = delete;
  memory_host( memory_host&& )      = delete;
  ~memory_host() override           = default;

  memory_host& operator=( const memory_host& ) = delete;
  memory_host& operator=( memory_host&& )      = delete;

  program::result< protocol::response >
  instantiate( program::program& p, const protocol::address& sender, const protocol::instantiate_msg& msg );

  program::result< protocol::response >
  execute( program::program& p, const protocol::address& sender, const protocol::execute_msg& msg );

  program::result< protocol::query_response > read( program::program& p, const protocol::query_msg& msg );

  asset_ft_ledger& ledger() noexcept;
  const asset_ft_ledger& ledger() const noexcept;

  // Number of queries the program issued to the ledger
  std::uint64_t query_count() const noexcept;

  std::span< const std::byte > input() override;
  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) override;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) override;
  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) override;

  const protocol::address& get_caller() override;
  const protocol::address& get_program_address() override;

  program::result< protocol::asset_ft::query_response > query( const protocol::asset_ft::query& request ) override;

private:
  using object_key = std::pair< std::uint32_t, protocol::bytes >;

  template< typename Response, typename Message >
  program::result< Response > invoke( program::program& p,
                                      const protocol::address& sender,
                                      std::string_view entry,
                                      const Message& msg );

  std::error_code apply( const protocol::response& response );

  protocol::address _program_address;
  protocol::address _caller;
  asset_ft_ledger _ledger;
  std::map< object_key, protocol::bytes > _objects;
  protocol::bytes _stdin;
  protocol::bytes _stdout;
  std::uint64_t _queries = 0;
};

} // namespace mintgate::host
