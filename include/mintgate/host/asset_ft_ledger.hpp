#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include <mintgate/host/error.hpp>
#include <mintgate/program/error.hpp>
#include <mintgate/protocol.hpp>

namespace mintgate::host {

/**
 * In-memory stand-in for the host ledger's native fungible token module.
 *
 * It executes the effect messages emitted by programs and answers their
 * queries. Multi-page answers are cut into pages of at most page_size
 * items, continuation keys are the denomination of the next item.
 */
class asset_ft_ledger final
{
public:
  explicit asset_ft_ledger( std::uint64_t page_size = 100 );

  std::error_code apply( const protocol::address& sender, const protocol::asset_ft::msg& message );
  program::result< protocol::asset_ft::query_response > query( const protocol::asset_ft::query& request ) const;

  void set_params( protocol::asset_ft::params params );
  std::uint64_t page_size() const noexcept;

  protocol::amount balance_of( const protocol::address& account, const std::string& denom ) const;
  protocol::amount supply_of( const std::string& denom ) const;

private:
  using balance_key = std::pair< protocol::address, std::string >;
  using balances    = std::map< balance_key, protocol::amount >;

  std::error_code issue( const protocol::address& sender, const protocol::asset_ft::issue& msg );
  std::error_code mint( const protocol::address& sender, const protocol::asset_ft::mint& msg );
  std::error_code burn( const protocol::address& sender, const protocol::asset_ft::burn& msg );
  std::error_code freeze( const protocol::address& sender, const protocol::asset_ft::freeze& msg );
  std::error_code unfreeze( const protocol::address& sender, const protocol::asset_ft::unfreeze& msg );
  std::error_code set_frozen( const protocol::address& sender, const protocol::asset_ft::set_frozen& msg );
  std::error_code set_global_freeze( const protocol::address& sender, const std::string& denom, bool frozen );
  std::error_code set_whitelisted_limit( const protocol::address& sender,
                                         const protocol::asset_ft::set_whitelisted_limit& msg );

  program::result< const protocol::asset_ft::token* >
  administered_token( const protocol::address& sender,
                      const std::string& denom,
                      protocol::asset_ft::feature required ) const;

  protocol::asset_ft::tokens_response tokens( const protocol::asset_ft::tokens_request& request ) const;
  std::pair< std::vector< protocol::coin >, protocol::page_response >
  account_coins( const balances& source,
                 const protocol::address& account,
                 const std::optional< protocol::page_request >& pagination ) const;

  static protocol::amount get( const balances& source, const protocol::address& account, const std::string& denom );

  std::map< std::string, protocol::asset_ft::token > _tokens;
  std::map< std::string, protocol::amount > _supply;
  balances _balances;
  balances _frozen;
  balances _whitelisted;
  protocol::asset_ft::params _params;
  std::uint64_t _page_size;
};

} // namespace mintgate::host
