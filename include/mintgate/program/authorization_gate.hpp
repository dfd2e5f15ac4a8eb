#pragma once

#include <mintgate/program/error.hpp>
#include <mintgate/program/system_interface.hpp>
#include <mintgate/protocol/types.hpp>

namespace mintgate::program {

class authorization_gate final
{
public:
  explicit authorization_gate( system_interface* system ) noexcept;

  std::error_code initialize( const protocol::address& controller );

  // Succeeds without effect when caller is the recorded controller
  std::error_code assert_caller_is_controller( const protocol::address& caller ) const;

  result< protocol::address > controller() const;

private:
  system_interface* _system;
};

} // namespace mintgate::program
