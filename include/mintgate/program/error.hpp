#pragma once

#include <expected>
#include <system_error>

namespace mintgate::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  unauthorized,
  not_found,
  already_initialized,
  resource_exhausted,
  invalid_instruction,
  invalid_argument,
  unexpected_response,
  no_more_pages
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintgate::program

template<>
struct std::is_error_code_enum< mintgate::program::program_errc >: public std::true_type
{};
