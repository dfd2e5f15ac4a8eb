#pragma once

#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <mintgate/program/system_interface.hpp>

namespace mintgate::program {

namespace entry_point {

constexpr std::string_view instantiate = "instantiate";
constexpr std::string_view execute     = "execute";
constexpr std::string_view query       = "query";

} // namespace entry_point

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( system_interface* system, std::span< const std::string > arguments ) = 0;
};

} // namespace mintgate::program
