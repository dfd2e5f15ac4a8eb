#pragma once

#include <cstdint>
#include <span>

#include <mintgate/program/error.hpp>
#include <mintgate/protocol.hpp>

namespace mintgate::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::byte > input()                                              = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual const protocol::address& get_caller()           = 0;
  virtual const protocol::address& get_program_address() = 0;

  virtual result< protocol::asset_ft::query_response > query( const protocol::asset_ft::query& request ) = 0;
};

} // namespace mintgate::program
