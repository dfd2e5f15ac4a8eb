#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <mintgate/protocol/pagination.hpp>
#include <mintgate/protocol/serialization.hpp>
#include <mintgate/protocol/types.hpp>

// Messages and queries understood by the host ledger's native fungible token
// module.
namespace mintgate::protocol::asset_ft {

enum class feature : std::uint32_t // NOLINT(performance-enum-size)
{
  minting,
  burning,
  freezing,
  whitelisting,
  ibc,
  block_smart_contracts,
  clawback,
  extension
};

std::string_view to_string( feature f ) noexcept;
std::optional< feature > feature_from_string( std::string_view str ) noexcept;

struct params
{
  coin issue_fee;
  std::uint64_t token_upgrade_decision_timeout = 0;
  std::uint64_t token_upgrade_grace_period     = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & issue_fee;
    ar & token_upgrade_decision_timeout;
    ar & token_upgrade_grace_period;
  }

  bool operator==( const params& ) const = default;
};

struct token
{
  std::string denom;
  address issuer;
  std::string symbol;
  std::string subunit;
  std::uint32_t precision = 0;
  std::string description;
  std::vector< feature > features;
  std::string burn_rate;
  std::string send_commission_rate;
  bool globally_frozen  = false;
  std::uint32_t version = 0;
  std::string uri;
  std::string uri_hash;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & denom;
    ar & issuer;
    ar & symbol;
    ar & subunit;
    ar & precision;
    ar & description;
    ar & features;
    ar & burn_rate;
    ar & send_commission_rate;
    ar & globally_frozen;
    ar & this->version;
    ar & uri;
    ar & uri_hash;
  }

  bool operator==( const token& ) const = default;
};

// Effect messages

struct issue
{
  std::string symbol;
  std::string subunit;
  std::uint32_t precision = 0;
  amount initial_amount;
  std::optional< std::string > description;
  std::optional< std::vector< feature > > features;
  std::optional< std::string > burn_rate;
  std::optional< std::string > send_commission_rate;
  std::optional< std::string > uri;
  std::optional< std::string > uri_hash;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & symbol;
    ar & subunit;
    ar & precision;
    ar & initial_amount;
    ar & description;
    ar & features;
    ar & burn_rate;
    ar & send_commission_rate;
    ar & uri;
    ar & uri_hash;
  }

  bool operator==( const issue& ) const = default;
};

struct mint
{
  protocol::coin coin;
  std::optional< address > recipient;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & coin;
    ar & recipient;
  }

  bool operator==( const mint& ) const = default;
};

struct burn
{
  protocol::coin coin;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & coin;
  }

  bool operator==( const burn& ) const = default;
};

struct freeze
{
  address account;
  protocol::coin coin;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & coin;
  }

  bool operator==( const freeze& ) const = default;
};

struct unfreeze
{
  address account;
  protocol::coin coin;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & coin;
  }

  bool operator==( const unfreeze& ) const = default;
};

struct set_frozen
{
  address account;
  protocol::coin coin;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & coin;
  }

  bool operator==( const set_frozen& ) const = default;
};

struct globally_freeze
{
  std::string denom;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & denom;
  }

  bool operator==( const globally_freeze& ) const = default;
};

struct globally_unfreeze
{
  std::string denom;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & denom;
  }

  bool operator==( const globally_unfreeze& ) const = default;
};

struct set_whitelisted_limit
{
  address account;
  protocol::coin coin;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & coin;
  }

  bool operator==( const set_whitelisted_limit& ) const = default;
};

using msg = std::variant< issue,
                          mint,
                          burn,
                          freeze,
                          unfreeze,
                          set_frozen,
                          globally_freeze,
                          globally_unfreeze,
                          set_whitelisted_limit >;

// Queries

struct params_request
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}

  bool operator==( const params_request& ) const = default;
};

struct token_request
{
  std::string denom;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & denom;
  }

  bool operator==( const token_request& ) const = default;
};

struct tokens_request
{
  std::optional< page_request > pagination;
  address issuer;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & pagination;
    ar & issuer;
  }

  bool operator==( const tokens_request& ) const = default;
};

struct balance_request
{
  address account;
  std::string denom;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & denom;
  }

  bool operator==( const balance_request& ) const = default;
};

struct frozen_balance_request
{
  address account;
  std::string denom;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & denom;
  }

  bool operator==( const frozen_balance_request& ) const = default;
};

struct frozen_balances_request
{
  std::optional< page_request > pagination;
  address account;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & pagination;
    ar & account;
  }

  bool operator==( const frozen_balances_request& ) const = default;
};

struct whitelisted_balance_request
{
  address account;
  std::string denom;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & denom;
  }

  bool operator==( const whitelisted_balance_request& ) const = default;
};

struct whitelisted_balances_request
{
  std::optional< page_request > pagination;
  address account;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & pagination;
    ar & account;
  }

  bool operator==( const whitelisted_balances_request& ) const = default;
};

using query = std::variant< params_request,
                            token_request,
                            tokens_request,
                            balance_request,
                            frozen_balance_request,
                            frozen_balances_request,
                            whitelisted_balance_request,
                            whitelisted_balances_request >;

// Query responses

struct params_response
{
  asset_ft::params params;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & params;
  }

  bool operator==( const params_response& ) const = default;
};

struct token_response
{
  asset_ft::token token;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & token;
  }

  bool operator==( const token_response& ) const = default;
};

struct tokens_response
{
  page_response pagination;
  std::vector< asset_ft::token > tokens;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & pagination;
    ar & tokens;
  }

  bool operator==( const tokens_response& ) const = default;
};

struct balance_response
{
  amount balance;
  amount whitelisted;
  amount frozen;
  amount locked;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & balance;
    ar & whitelisted;
    ar & frozen;
    ar & locked;
  }

  bool operator==( const balance_response& ) const = default;
};

struct frozen_balance_response
{
  coin balance;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & balance;
  }

  bool operator==( const frozen_balance_response& ) const = default;
};

struct frozen_balances_response
{
  page_response pagination;
  std::vector< coin > balances;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & pagination;
    ar & balances;
  }

  bool operator==( const frozen_balances_response& ) const = default;
};

struct whitelisted_balance_response
{
  coin balance;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & balance;
  }

  bool operator==( const whitelisted_balance_response& ) const = default;
};

struct whitelisted_balances_response
{
  page_response pagination;
  std::vector< coin > balances;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & pagination;
    ar & balances;
  }

  bool operator==( const whitelisted_balances_response& ) const = default;
};

using query_response = std::variant< params_response,
                                     token_response,
                                     tokens_response,
                                     balance_response,
                                     frozen_balance_response,
                                     frozen_balances_response,
                                     whitelisted_balance_response,
                                     whitelisted_balances_response >;

} // namespace mintgate::protocol::asset_ft
