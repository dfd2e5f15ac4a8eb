#pragma once

#include <system_error>

namespace mintgate::host {

enum class asset_ft_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_denom,
  token_exists,
  token_not_found,
  feature_disabled,
  unauthorized,
  invalid_account,
  invalid_amount,
  insufficient_balance,
  insufficient_frozen_balance,
  globally_frozen,
  whitelisted_limit_exceeded,
  overflow
};

const std::error_category& asset_ft_category() noexcept;

std::error_code make_error_code( asset_ft_errc e );

} // namespace mintgate::host

template<>
struct std::is_error_code_enum< mintgate::host::asset_ft_errc >: public std::true_type
{};
