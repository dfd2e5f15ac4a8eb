#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <mintgate/protocol/asset_ft.hpp>
#include <mintgate/protocol/serialization.hpp>
#include <mintgate/protocol/types.hpp>

namespace mintgate::protocol {

struct instantiate_msg
{
  std::string symbol;
  std::string subunit;
  std::uint32_t precision = 0;
  amount initial_amount;
  std::optional< std::string > description;
  std::optional< std::vector< asset_ft::feature > > features;
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
};

namespace execute {

struct mint
{
  protocol::amount amount;
  std::optional< address > recipient;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & amount;
    ar & recipient;
  }
};

struct burn
{
  protocol::amount amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & amount;
  }
};

struct freeze
{
  address account;
  protocol::amount amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & amount;
  }
};

struct unfreeze
{
  address account;
  protocol::amount amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & amount;
  }
};

struct set_frozen
{
  address account;
  protocol::amount amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & amount;
  }
};

struct globally_freeze
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct globally_unfreeze
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct set_whitelisted_limit
{
  address account;
  protocol::amount amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
    ar & amount;
  }
};

} // namespace execute

using execute_msg = std::variant< execute::mint,
                                  execute::burn,
                                  execute::freeze,
                                  execute::unfreeze,
                                  execute::set_frozen,
                                  execute::globally_freeze,
                                  execute::globally_unfreeze,
                                  execute::set_whitelisted_limit >;

namespace query {

struct params
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct token
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct tokens
{
  address issuer;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & issuer;
  }
};

struct balance
{
  address account;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
  }
};

struct frozen_balance
{
  address account;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
  }
};

struct frozen_balances
{
  address account;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
  }
};

struct whitelisted_balance
{
  address account;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
  }
};

struct whitelisted_balances
{
  address account;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & account;
  }
};

struct ownership
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

struct contract_info
{
  template< class Archive >
  void serialize( Archive&, const unsigned int )
  {}
};

} // namespace query

using query_msg = std::variant< query::params,
                                query::token,
                                query::tokens,
                                query::balance,
                                query::frozen_balance,
                                query::frozen_balances,
                                query::whitelisted_balance,
                                query::whitelisted_balances,
                                query::ownership,
                                query::contract_info >;

struct attribute
{
  std::string key;
  std::string value;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & key;
    ar & value;
  }

  bool operator==( const attribute& ) const = default;
};

struct response
{
  std::vector< attribute > attributes;
  std::vector< asset_ft::msg > messages;

  response& add_attribute( std::string key, std::string value );
  response& add_message( asset_ft::msg message );

  const std::string* attribute_value( std::string_view key ) const noexcept;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & attributes;
    ar & messages;
  }
};

struct ownership_response
{
  address owner;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
  }

  bool operator==( const ownership_response& ) const = default;
};

struct contract_info
{
  std::string name;
  std::string version;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & name;
    ar & version;
  }

  bool operator==( const contract_info& ) const = default;
};

using query_response = std::variant< asset_ft::params_response,
                                     asset_ft::token_response,
                                     asset_ft::tokens_response,
                                     asset_ft::balance_response,
                                     asset_ft::frozen_balance_response,
                                     asset_ft::frozen_balances_response,
                                     asset_ft::whitelisted_balance_response,
                                     asset_ft::whitelisted_balances_response,
                                     ownership_response,
                                     contract_info >;

} // namespace mintgate::protocol
