#include <mintgate/host/scenario.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <mintgate/encode/hex.hpp>
#include <mintgate/log.hpp>
#include <mintgate/memory.hpp>

namespace mintgate::host {

namespace {

template< class... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

protocol::amount amount_of( const YAML::Node& node, const std::string& key )
{
  if( !node || !node[ key ] )
    throw std::runtime_error( "missing " + key );

  auto text   = node[ key ].as< std::string >();
  auto parsed = protocol::amount_from_string( text );
  if( !parsed )
    throw std::runtime_error( "invalid " + key + ": " + text );

  return *parsed;
}

template< typename T >
T required( const YAML::Node& node, const std::string& key )
{
  if( !node || !node[ key ] )
    throw std::runtime_error( "missing " + key );

  return node[ key ].as< T >();
}

template< typename T >
std::optional< T > optional_value( const YAML::Node& node, const std::string& key )
{
  if( !node || !node[ key ] )
    return std::nullopt;

  return node[ key ].as< T >();
}

// A bare scalar names a request without fields
std::pair< std::string, YAML::Node > single_entry( const YAML::Node& node, const std::string& what )
{
  if( node.IsScalar() )
    return { node.as< std::string >(), YAML::Node() };

  if( !node.IsMap() || node.size() != 1 )
    throw std::runtime_error( what + " must name exactly one request" );

  auto it = node.begin();
  return { it->first.as< std::string >(), it->second };
}

protocol::instantiate_msg parse_instantiate( const YAML::Node& node )
{
  protocol::instantiate_msg msg;
  msg.symbol               = required< std::string >( node, "symbol" );
  msg.subunit              = required< std::string >( node, "subunit" );
  msg.precision            = optional_value< std::uint32_t >( node, "precision" ).value_or( 0 );
  msg.initial_amount       = node[ "initial_amount" ] ? amount_of( node, "initial_amount" ) : protocol::amount( 0 );
  msg.description          = optional_value< std::string >( node, "description" );
  msg.burn_rate            = optional_value< std::string >( node, "burn_rate" );
  msg.send_commission_rate = optional_value< std::string >( node, "send_commission_rate" );
  msg.uri                  = optional_value< std::string >( node, "uri" );
  msg.uri_hash             = optional_value< std::string >( node, "uri_hash" );

  if( node[ "features" ] )
  {
    msg.features.emplace();
    for( const auto& entry: node[ "features" ] )
    {
      auto name    = entry.as< std::string >();
      auto feature = protocol::asset_ft::feature_from_string( name );
      if( !feature )
        throw std::runtime_error( "unknown feature: " + name );

      msg.features->push_back( *feature );
    }
  }

  return msg;
}

protocol::execute_msg parse_execute( const YAML::Node& node )
{
  auto [ name, body ] = single_entry( node, "execute" );

  if( name == "mint" )
    return protocol::execute::mint{ .amount    = amount_of( body, "amount" ),
                                    .recipient = optional_value< std::string >( body, "recipient" ) };
  if( name == "burn" )
    return protocol::execute::burn{ .amount = amount_of( body, "amount" ) };
  if( name == "freeze" )
    return protocol::execute::freeze{ .account = required< std::string >( body, "account" ),
                                      .amount  = amount_of( body, "amount" ) };
  if( name == "unfreeze" )
    return protocol::execute::unfreeze{ .account = required< std::string >( body, "account" ),
                                        .amount  = amount_of( body, "amount" ) };
  if( name == "set_frozen" )
    return protocol::execute::set_frozen{ .account = required< std::string >( body, "account" ),
                                          .amount  = amount_of( body, "amount" ) };
  if( name == "globally_freeze" )
    return protocol::execute::globally_freeze{};
  if( name == "globally_unfreeze" )
    return protocol::execute::globally_unfreeze{};
  if( name == "set_whitelisted_limit" )
    return protocol::execute::set_whitelisted_limit{ .account = required< std::string >( body, "account" ),
                                                     .amount  = amount_of( body, "amount" ) };

  throw std::runtime_error( "unknown execute request: " + name );
}

protocol::query_msg parse_query( const YAML::Node& node )
{
  auto [ name, body ] = single_entry( node, "query" );

  if( name == "params" )
    return protocol::query::params{};
  if( name == "token" )
    return protocol::query::token{};
  if( name == "tokens" )
    return protocol::query::tokens{ .issuer = required< std::string >( body, "issuer" ) };
  if( name == "balance" )
    return protocol::query::balance{ .account = required< std::string >( body, "account" ) };
  if( name == "frozen_balance" )
    return protocol::query::frozen_balance{ .account = required< std::string >( body, "account" ) };
  if( name == "frozen_balances" )
    return protocol::query::frozen_balances{ .account = required< std::string >( body, "account" ) };
  if( name == "whitelisted_balance" )
    return protocol::query::whitelisted_balance{ .account = required< std::string >( body, "account" ) };
  if( name == "whitelisted_balances" )
    return protocol::query::whitelisted_balances{ .account = required< std::string >( body, "account" ) };
  if( name == "ownership" )
    return protocol::query::ownership{};
  if( name == "contract_info" )
    return protocol::query::contract_info{};

  throw std::runtime_error( "unknown query request: " + name );
}

YAML::Node coin_yaml( const protocol::coin& coin )
{
  YAML::Node node;
  node[ "amount" ] = protocol::to_string( coin.value );
  node[ "denom" ]  = coin.denom;
  return node;
}

YAML::Node coins_yaml( const std::vector< protocol::coin >& coins )
{
  YAML::Node node( YAML::NodeType::Sequence );
  for( const auto& coin: coins )
    node.push_back( coin_yaml( coin ) );

  return node;
}

YAML::Node pagination_yaml( const protocol::page_response& pagination )
{
  YAML::Node node( YAML::NodeType::Map );
  if( pagination.next_key )
    node[ "next_key" ] = encode::to_hex( *pagination.next_key );

  if( pagination.total )
    node[ "total" ] = *pagination.total;

  return node;
}

YAML::Node token_yaml( const protocol::asset_ft::token& token )
{
  YAML::Node node;
  node[ "denom" ]                = token.denom;
  node[ "issuer" ]               = token.issuer;
  node[ "symbol" ]               = token.symbol;
  node[ "subunit" ]              = token.subunit;
  node[ "precision" ]            = token.precision;
  node[ "description" ]          = token.description;
  node[ "burn_rate" ]            = token.burn_rate;
  node[ "send_commission_rate" ] = token.send_commission_rate;
  node[ "globally_frozen" ]      = token.globally_frozen;
  node[ "version" ]              = token.version;
  node[ "uri" ]                  = token.uri;
  node[ "uri_hash" ]             = token.uri_hash;

  node[ "features" ] = YAML::Node( YAML::NodeType::Sequence );
  for( auto feature: token.features )
    node[ "features" ].push_back( std::string( protocol::asset_ft::to_string( feature ) ) );

  return node;
}

YAML::Node account_coin_yaml( std::string_view type, const protocol::address& account, const protocol::coin& coin )
{
  YAML::Node node;
  node[ "type" ]    = std::string( type );
  node[ "account" ] = account;
  node[ "coin" ]    = coin_yaml( coin );
  return node;
}

YAML::Node message_yaml( const protocol::asset_ft::msg& message )
{
  using namespace protocol::asset_ft;

  return std::visit(
    overloaded{
      []( const issue& m )
      {
        YAML::Node node;
        node[ "type" ]           = "issue";
        node[ "symbol" ]         = m.symbol;
        node[ "subunit" ]        = m.subunit;
        node[ "precision" ]      = m.precision;
        node[ "initial_amount" ] = protocol::to_string( m.initial_amount );
        return node;
      },
      []( const mint& m )
      {
        YAML::Node node;
        node[ "type" ] = "mint";
        node[ "coin" ] = coin_yaml( m.coin );
        if( m.recipient )
          node[ "recipient" ] = *m.recipient;
        return node;
      },
      []( const burn& m )
      {
        YAML::Node node;
        node[ "type" ] = "burn";
        node[ "coin" ] = coin_yaml( m.coin );
        return node;
      },
      []( const freeze& m ) { return account_coin_yaml( "freeze", m.account, m.coin ); },
      []( const unfreeze& m ) { return account_coin_yaml( "unfreeze", m.account, m.coin ); },
      []( const set_frozen& m ) { return account_coin_yaml( "set_frozen", m.account, m.coin ); },
      []( const set_whitelisted_limit& m ) { return account_coin_yaml( "set_whitelisted_limit", m.account, m.coin ); },
      []( const globally_freeze& m )
      {
        YAML::Node node;
        node[ "type" ]  = "globally_freeze";
        node[ "denom" ] = m.denom;
        return node;
      },
      []( const globally_unfreeze& m )
      {
        YAML::Node node;
        node[ "type" ]  = "globally_unfreeze";
        node[ "denom" ] = m.denom;
        return node;
      } },
    message );
}

std::string_view request_name( const step& s )
{
  return std::visit( overloaded{ []( const protocol::instantiate_msg& ) { return std::string_view( "instantiate" ); },
                                 []( const protocol::execute_msg& ) { return std::string_view( "execute" ); },
                                 []( const protocol::query_msg& ) { return std::string_view( "query" ); } },
                     s.request );
}

} // namespace

std::vector< step > parse_scenario( const YAML::Node& document )
{
  if( !document.IsSequence() )
    throw std::runtime_error( "scenario must be a sequence of steps" );

  std::vector< step > steps;
  for( const auto& node: document )
  {
    step s;
    s.sender       = optional_value< std::string >( node, "sender" ).value_or( std::string{} );
    s.expect_error = optional_value< bool >( node, "expect_error" ).value_or( false );

    const int requests = int( bool( node[ "instantiate" ] ) ) + int( bool( node[ "execute" ] ) )
                         + int( bool( node[ "query" ] ) );
    if( requests != 1 )
      throw std::runtime_error( "step " + std::to_string( steps.size() ) + " must hold exactly one request" );

    if( node[ "instantiate" ] )
      s.request = parse_instantiate( node[ "instantiate" ] );
    else if( node[ "execute" ] )
      s.request = parse_execute( node[ "execute" ] );
    else
      s.request = parse_query( node[ "query" ] );

    steps.push_back( std::move( s ) );
  }

  return steps;
}

YAML::Node to_yaml( const protocol::response& response )
{
  YAML::Node node;

  node[ "attributes" ] = YAML::Node( YAML::NodeType::Map );
  for( const auto& attribute: response.attributes )
    node[ "attributes" ][ attribute.key ] = attribute.value;

  node[ "messages" ] = YAML::Node( YAML::NodeType::Sequence );
  for( const auto& message: response.messages )
    node[ "messages" ].push_back( message_yaml( message ) );

  return node;
}

YAML::Node to_yaml( const protocol::query_response& response )
{
  using namespace protocol::asset_ft;

  return std::visit(
    overloaded{
      []( const params_response& r )
      {
        YAML::Node node;
        node[ "issue_fee" ]                      = coin_yaml( r.params.issue_fee );
        node[ "token_upgrade_decision_timeout" ] = r.params.token_upgrade_decision_timeout;
        node[ "token_upgrade_grace_period" ]     = r.params.token_upgrade_grace_period;
        return node;
      },
      []( const token_response& r ) { return token_yaml( r.token ); },
      []( const tokens_response& r )
      {
        YAML::Node node;
        node[ "pagination" ] = pagination_yaml( r.pagination );
        node[ "tokens" ]     = YAML::Node( YAML::NodeType::Sequence );
        for( const auto& token: r.tokens )
          node[ "tokens" ].push_back( token_yaml( token ) );
        return node;
      },
      []( const balance_response& r )
      {
        YAML::Node node;
        node[ "balance" ]     = protocol::to_string( r.balance );
        node[ "whitelisted" ] = protocol::to_string( r.whitelisted );
        node[ "frozen" ]      = protocol::to_string( r.frozen );
        node[ "locked" ]      = protocol::to_string( r.locked );
        return node;
      },
      []( const frozen_balance_response& r ) { return coin_yaml( r.balance ); },
      []( const frozen_balances_response& r )
      {
        YAML::Node node;
        node[ "pagination" ] = pagination_yaml( r.pagination );
        node[ "balances" ]   = coins_yaml( r.balances );
        return node;
      },
      []( const whitelisted_balance_response& r ) { return coin_yaml( r.balance ); },
      []( const whitelisted_balances_response& r )
      {
        YAML::Node node;
        node[ "pagination" ] = pagination_yaml( r.pagination );
        node[ "balances" ]   = coins_yaml( r.balances );
        return node;
      },
      []( const protocol::ownership_response& r )
      {
        YAML::Node node;
        node[ "owner" ] = r.owner;
        return node;
      },
      []( const protocol::contract_info& r )
      {
        YAML::Node node;
        node[ "contract" ] = r.name;
        node[ "version" ]  = r.version;
        return node;
      } },
    response );
}

std::error_code run_scenario( memory_host& host,
                              program::program& p,
                              const std::vector< step >& steps,
                              YAML::Emitter& out )
{
  for( std::size_t index = 0; index < steps.size(); ++index )
  {
    const auto& s = steps[ index ];

    YAML::Node outcome;
    outcome[ "step" ]    = index;
    outcome[ "request" ] = std::string( request_name( s ) );

    std::error_code error = std::visit(
      overloaded{
        [ & ]( const protocol::instantiate_msg& msg ) -> std::error_code
        {
          auto response = host.instantiate( p, s.sender, msg );
          if( !response )
            return response.error();

          outcome[ "response" ] = to_yaml( *response );
          return {};
        },
        [ & ]( const protocol::execute_msg& msg ) -> std::error_code
        {
          auto response = host.execute( p, s.sender, msg );
          if( !response )
            return response.error();

          outcome[ "response" ] = to_yaml( *response );
          return {};
        },
        [ & ]( const protocol::query_msg& msg ) -> std::error_code
        {
          auto response = host.read( p, msg );
          if( !response )
            return response.error();

          outcome[ "response" ] = to_yaml( *response );
          return {};
        } },
      s.request );

    if( error )
    {
      outcome[ "error" ]    = error.message();
      outcome[ "category" ] = error.category().name();
    }

    out << YAML::BeginDoc << outcome;

    if( bool( error ) != s.expect_error )
    {
      if( error )
        LOG_ERROR( mintgate::log::instance(), "Step {} ({}) failed: {}", index, request_name( s ), error.message() );
      else
        LOG_ERROR( mintgate::log::instance(), "Step {} ({}) succeeded but an error was expected", index, request_name( s ) );

      return error ? error : program::program_errc::invalid_argument;
    }

    if( error )
      LOG_INFO( mintgate::log::instance(), "Step {} ({}) failed as expected: {}", index, request_name( s ), error.message() );
    else
      LOG_DEBUG( mintgate::log::instance(), "Step {} ({}) succeeded", index, request_name( s ) );
  }

  return {};
}

} // namespace mintgate::host
