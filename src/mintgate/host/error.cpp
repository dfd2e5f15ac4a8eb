#include <mintgate/host/error.hpp>

#include <string>
#include <utility>

namespace mintgate::host {

struct _asset_ft_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _asset_ft_category::name() const noexcept
{
  return "asset_ft";
}

std::string _asset_ft_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< asset_ft_errc >( condition ) )
  {
    case asset_ft_errc::ok:
      return "ok"s;
    case asset_ft_errc::invalid_denom:
      return "invalid denom"s;
    case asset_ft_errc::token_exists:
      return "token already exists"s;
    case asset_ft_errc::token_not_found:
      return "token not found"s;
    case asset_ft_errc::feature_disabled:
      return "feature disabled"s;
    case asset_ft_errc::unauthorized:
      return "unauthorized"s;
    case asset_ft_errc::invalid_account:
      return "invalid account"s;
    case asset_ft_errc::invalid_amount:
      return "invalid amount"s;
    case asset_ft_errc::insufficient_balance:
      return "insufficient balance"s;
    case asset_ft_errc::insufficient_frozen_balance:
      return "insufficient frozen balance"s;
    case asset_ft_errc::globally_frozen:
      return "globally frozen"s;
    case asset_ft_errc::whitelisted_limit_exceeded:
      return "whitelisted limit exceeded"s;
    case asset_ft_errc::overflow:
      return "overflow"s;
  }
  std::unreachable();
}

const std::error_category& asset_ft_category() noexcept
{
  static _asset_ft_category category;
  return category;
}

std::error_code make_error_code( asset_ft_errc e )
{
  return std::error_code( static_cast< int >( e ), asset_ft_category() );
}

} // namespace mintgate::host
