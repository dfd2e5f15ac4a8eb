#pragma once

#include <string>
#include <string_view>

#include <mintgate/program/error.hpp>
#include <mintgate/program/system_interface.hpp>

namespace mintgate::program {

/**
 * Derives the host-wide denomination of the token issued by a program.
 *
 * The result is the lower-cased concatenation of the subunit and the program
 * address, separated by a hyphen. Case folding is byte-wise in the global
 * locale, so only ASCII letters are lowered and multi-byte UTF-8 sequences
 * are kept as they are.
 */
std::string make_denomination( std::string_view subunit, std::string_view program_address );

/**
 * Holds the denomination of the token controlled by this program.
 *
 * The value is written once during initialization and read by every
 * operation that addresses the token afterwards.
 */
class identity_store final
{
public:
  explicit identity_store( system_interface* system ) noexcept;

  std::error_code save( std::string_view denomination );
  result< std::string > load() const;

private:
  system_interface* _system;
};

} // namespace mintgate::program
