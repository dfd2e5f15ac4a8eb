#include <mintgate/program/contract_info.hpp>
#include <mintgate/program/token_controller.hpp>

#include <mintgate/encode/archive.hpp>
#include <mintgate/log.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

namespace mintgate::program {

template< class... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

template< typename Response >
static result< Response > query_as( system_interface* system, protocol::asset_ft::query request )
{
  auto response = system->query( request );
  if( !response )
    return std::unexpected( response.error() );

  if( auto value = std::get_if< Response >( &*response ) )
    return std::move( *value );

  return std::unexpected( program_errc::unexpected_response );
}

static void log_page( std::string_view what,
                      const protocol::address& owner,
                      std::size_t count,
                      const protocol::page_response& pagination )
{
  if( pagination.has_next() )
    LOG_DEBUG( mintgate::log::instance(),
               "Received {} {} {}, next key {}",
               count,
               what,
               owner,
               mintgate::log::hex{ pagination.next_key->data(), pagination.next_key->size() } );
  else
    LOG_DEBUG( mintgate::log::instance(), "Received {} {} {}, last page", count, what, owner );
}

/*
 * Every mutation checks the caller before anything else is read or built, an
 * unauthorized call leaves no trace beyond its error.
 */
template< typename Build >
static result< protocol::response > authorized_effect( const authorization_gate& gate,
                                                       const identity_store& store,
                                                       const protocol::address& caller,
                                                       std::string_view method,
                                                       const std::optional< protocol::amount >& amount,
                                                       Build&& build )
{
  if( auto error = gate.assert_caller_is_controller( caller ); error )
  {
    if( error == program_errc::unauthorized )
      LOG_WARNING( mintgate::log::instance(), "Rejected {} from {}: caller is not the controller", method, caller );
    else
      LOG_ERROR( mintgate::log::instance(), "Could not read the controller for {}: {}", method, error.message() );

    return std::unexpected( error );
  }

  auto denom = store.load();
  if( !denom )
  {
    LOG_ERROR( mintgate::log::instance(), "Denomination missing while handling {}", method );
    return std::unexpected( denom.error() );
  }

  protocol::response response;
  response.add_attribute( "method", std::string( method ) ).add_attribute( "denom", *denom );

  if( amount )
  {
    response.add_attribute( "amount", protocol::to_string( *amount ) );
    LOG_DEBUG( mintgate::log::instance(), "Authorized {} of {} {}", method, *amount, *denom );
  }
  else
    LOG_DEBUG( mintgate::log::instance(), "Authorized {} of {}", method, *denom );

  response.add_message( build( *denom ) );
  return response;
}

token_controller::token_controller( pagination_options options ):
    _options( std::move( options ) )
{}

const pagination_options& token_controller::options() const noexcept
{
  return _options;
}

std::error_code token_controller::run( system_interface* system, std::span< const std::string > arguments )
{
  if( arguments.empty() )
    return program_errc::invalid_instruction;

  const auto& entry = arguments.front();
  std::vector< std::byte > output;

  if( entry == entry_point::instantiate || entry == entry_point::execute )
  {
    result< protocol::response > response;

    if( entry == entry_point::instantiate )
    {
      auto msg = encode::from_bytes< protocol::instantiate_msg >( system->input() );
      if( !msg )
        return program_errc::invalid_argument;

      response = instantiate( system, *msg );
    }
    else
    {
      auto msg = encode::from_bytes< protocol::execute_msg >( system->input() );
      if( !msg )
        return program_errc::invalid_argument;

      response = execute( system, *msg );
    }

    if( !response )
      return response.error();

    output = encode::to_bytes( *response );
  }
  else if( entry == entry_point::query )
  {
    auto msg = encode::from_bytes< protocol::query_msg >( system->input() );
    if( !msg )
      return program_errc::invalid_argument;

    auto response = query( system, *msg );
    if( !response )
      return response.error();

    output = encode::to_bytes( *response );
  }
  else
    return program_errc::invalid_instruction;

  return system->write( file_descriptor::stdout, output );
}

result< protocol::response > token_controller::instantiate( system_interface* system,
                                                            const protocol::instantiate_msg& msg )
{
  const auto& caller = system->get_caller();

  if( auto error = set_contract_info( system, contract_name, contract_version ); error )
    return std::unexpected( error );

  auto denom = make_denomination( msg.subunit, system->get_program_address() );

  identity_store store( system );
  if( auto error = store.save( denom ); error )
    return std::unexpected( error );

  authorization_gate gate( system );
  if( auto error = gate.initialize( caller ); error )
    return std::unexpected( error );

  LOG_INFO( mintgate::log::instance(), "Issuing {} ({}) with controller {}", denom, msg.symbol, caller );

  protocol::response response;
  response.add_attribute( "owner", caller )
    .add_attribute( "denom", denom )
    .add_message( protocol::asset_ft::issue{ .symbol               = msg.symbol,
                                             .subunit              = msg.subunit,
                                             .precision            = msg.precision,
                                             .initial_amount       = msg.initial_amount,
                                             .description          = msg.description,
                                             .features             = msg.features,
                                             .burn_rate            = msg.burn_rate,
                                             .send_commission_rate = msg.send_commission_rate,
                                             .uri                  = msg.uri,
                                             .uri_hash             = msg.uri_hash } );
  return response;
}

result< protocol::response > token_controller::execute( system_interface* system, const protocol::execute_msg& msg )
{
  const authorization_gate gate( system );
  const identity_store store( system );
  const auto& caller = system->get_caller();

  return std::visit(
    overloaded{
      [ & ]( const protocol::execute::mint& m ) { return mint( gate, store, caller, m ); },
      [ & ]( const protocol::execute::burn& m ) { return burn( gate, store, caller, m ); },
      [ & ]( const protocol::execute::freeze& m ) { return freeze( gate, store, caller, m ); },
      [ & ]( const protocol::execute::unfreeze& m ) { return unfreeze( gate, store, caller, m ); },
      [ & ]( const protocol::execute::set_frozen& m ) { return set_frozen( gate, store, caller, m ); },
      [ & ]( const protocol::execute::globally_freeze& ) { return globally_freeze( gate, store, caller ); },
      [ & ]( const protocol::execute::globally_unfreeze& ) { return globally_unfreeze( gate, store, caller ); },
      [ & ]( const protocol::execute::set_whitelisted_limit& m )
      {
        return set_whitelisted_limit( gate, store, caller, m );
      } },
    msg );
}

result< protocol::response > token_controller::mint( const authorization_gate& gate,
                                                     const identity_store& store,
                                                     const protocol::address& caller,
                                                     const protocol::execute::mint& msg )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "mint",
                            msg.amount,
                            [ & ]( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::mint{ .coin      = protocol::make_coin( msg.amount, denom ),
                                                               .recipient = msg.recipient };
                            } );
}

result< protocol::response > token_controller::burn( const authorization_gate& gate,
                                                     const identity_store& store,
                                                     const protocol::address& caller,
                                                     const protocol::execute::burn& msg )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "burn",
                            msg.amount,
                            [ & ]( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::burn{ .coin = protocol::make_coin( msg.amount, denom ) };
                            } );
}

result< protocol::response > token_controller::freeze( const authorization_gate& gate,
                                                       const identity_store& store,
                                                       const protocol::address& caller,
                                                       const protocol::execute::freeze& msg )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "freeze",
                            msg.amount,
                            [ & ]( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::freeze{ .account = msg.account,
                                                                 .coin = protocol::make_coin( msg.amount, denom ) };
                            } );
}

result< protocol::response > token_controller::unfreeze( const authorization_gate& gate,
                                                         const identity_store& store,
                                                         const protocol::address& caller,
                                                         const protocol::execute::unfreeze& msg )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "unfreeze",
                            msg.amount,
                            [ & ]( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::unfreeze{ .account = msg.account,
                                                                   .coin = protocol::make_coin( msg.amount, denom ) };
                            } );
}

result< protocol::response > token_controller::set_frozen( const authorization_gate& gate,
                                                           const identity_store& store,
                                                           const protocol::address& caller,
                                                           const protocol::execute::set_frozen& msg )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "set_frozen",
                            msg.amount,
                            [ & ]( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::set_frozen{ .account = msg.account,
                                                                     .coin = protocol::make_coin( msg.amount, denom ) };
                            } );
}

result< protocol::response > token_controller::globally_freeze( const authorization_gate& gate,
                                                                const identity_store& store,
                                                                const protocol::address& caller )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "globally_freeze",
                            std::nullopt,
                            []( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::globally_freeze{ .denom = denom };
                            } );
}

result< protocol::response > token_controller::globally_unfreeze( const authorization_gate& gate,
                                                                  const identity_store& store,
                                                                  const protocol::address& caller )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "globally_unfreeze",
                            std::nullopt,
                            []( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::globally_unfreeze{ .denom = denom };
                            } );
}

result< protocol::response > token_controller::set_whitelisted_limit( const authorization_gate& gate,
                                                                      const identity_store& store,
                                                                      const protocol::address& caller,
                                                                      const protocol::execute::set_whitelisted_limit& msg )
{
  return authorized_effect( gate,
                            store,
                            caller,
                            "set_whitelisted_limit",
                            msg.amount,
                            [ & ]( const std::string& denom ) -> protocol::asset_ft::msg
                            {
                              return protocol::asset_ft::set_whitelisted_limit{
                                .account = msg.account,
                                .coin    = protocol::make_coin( msg.amount, denom ) };
                            } );
}

result< protocol::query_response > token_controller::query( system_interface* system, const protocol::query_msg& msg )
{
  const identity_store store( system );

  // Lifts an upstream answer into the program's own response type
  auto lift = []< typename T >( result< T >&& r ) -> result< protocol::query_response >
  {
    if( !r )
      return std::unexpected( r.error() );

    return protocol::query_response{ std::move( *r ) };
  };

  auto scoped = [ & ]< typename Response, typename Build >( Build&& build ) -> result< protocol::query_response >
  {
    auto denom = store.load();
    if( !denom )
    {
      LOG_ERROR( mintgate::log::instance(), "Denomination missing while answering a query" );
      return std::unexpected( denom.error() );
    }

    return lift( query_as< Response >( system, build( *denom ) ) );
  };

  using namespace protocol::asset_ft;

  return std::visit(
    overloaded{
      [ & ]( const protocol::query::params& )
      {
        return lift( query_as< params_response >( system, params_request{} ) );
      },
      [ & ]( const protocol::query::token& )
      {
        return scoped.template operator()< token_response >(
          []( const std::string& denom ) { return token_request{ .denom = denom }; } );
      },
      [ & ]( const protocol::query::tokens& q ) { return lift( tokens( system, q.issuer ) ); },
      [ & ]( const protocol::query::balance& q )
      {
        return scoped.template operator()< balance_response >(
          [ & ]( const std::string& denom ) { return balance_request{ .account = q.account, .denom = denom }; } );
      },
      [ & ]( const protocol::query::frozen_balance& q )
      {
        return scoped.template operator()< frozen_balance_response >(
          [ & ]( const std::string& denom )
          {
            return frozen_balance_request{ .account = q.account, .denom = denom };
          } );
      },
      [ & ]( const protocol::query::frozen_balances& q ) { return lift( frozen_balances( system, q.account ) ); },
      [ & ]( const protocol::query::whitelisted_balance& q )
      {
        return scoped.template operator()< whitelisted_balance_response >(
          [ & ]( const std::string& denom )
          {
            return whitelisted_balance_request{ .account = q.account, .denom = denom };
          } );
      },
      [ & ]( const protocol::query::whitelisted_balances& q )
      {
        return lift( whitelisted_balances( system, q.account ) );
      },
      [ & ]( const protocol::query::ownership& ) -> result< protocol::query_response >
      {
        auto owner = authorization_gate( system ).controller();
        if( !owner )
          return std::unexpected( owner.error() );

        return protocol::query_response{ protocol::ownership_response{ .owner = std::move( *owner ) } };
      },
      [ & ]( const protocol::query::contract_info& ) { return lift( get_contract_info( system ) ); } },
    msg );
}

result< protocol::asset_ft::tokens_response > token_controller::tokens( system_interface* system,
                                                                        const protocol::address& issuer )
{
  using namespace protocol::asset_ft;

  auto all = paginate< token >(
    [ & ]( std::optional< protocol::page_request > pagination ) -> result< page< token > >
    {
      auto response =
        query_as< tokens_response >( system, tokens_request{ .pagination = std::move( pagination ), .issuer = issuer } );
      if( !response )
        return std::unexpected( response.error() );

      log_page( "token(s) issued by", issuer, response->tokens.size(), response->pagination );
      return page< token >{ .items = std::move( response->tokens ), .pagination = std::move( response->pagination ) };
    },
    _options );

  if( !all )
  {
    if( all.error() == program_errc::resource_exhausted )
      LOG_ERROR( mintgate::log::instance(), "Tokens of {} exceed {} pages", issuer, _options.max_page_count );

    return std::unexpected( all.error() );
  }

  return tokens_response{ .pagination = std::move( all->pagination ), .tokens = std::move( all->items ) };
}

result< protocol::asset_ft::frozen_balances_response >
token_controller::frozen_balances( system_interface* system, const protocol::address& account )
{
  using namespace protocol::asset_ft;

  auto all = paginate< protocol::coin >(
    [ & ]( std::optional< protocol::page_request > pagination ) -> result< page< protocol::coin > >
    {
      auto response = query_as< frozen_balances_response >(
        system,
        frozen_balances_request{ .pagination = std::move( pagination ), .account = account } );
      if( !response )
        return std::unexpected( response.error() );

      log_page( "frozen balance(s) of", account, response->balances.size(), response->pagination );
      return page< protocol::coin >{ .items      = std::move( response->balances ),
                                     .pagination = std::move( response->pagination ) };
    },
    _options );

  if( !all )
  {
    if( all.error() == program_errc::resource_exhausted )
      LOG_ERROR( mintgate::log::instance(),
                 "Frozen balances of {} exceed {} pages",
                 account,
                 _options.max_page_count );

    return std::unexpected( all.error() );
  }

  return frozen_balances_response{ .pagination = std::move( all->pagination ), .balances = std::move( all->items ) };
}

result< protocol::asset_ft::whitelisted_balances_response >
token_controller::whitelisted_balances( system_interface* system, const protocol::address& account )
{
  using namespace protocol::asset_ft;

  auto all = paginate< protocol::coin >(
    [ & ]( std::optional< protocol::page_request > pagination ) -> result< page< protocol::coin > >
    {
      auto response = query_as< whitelisted_balances_response >(
        system,
        whitelisted_balances_request{ .pagination = std::move( pagination ), .account = account } );
      if( !response )
        return std::unexpected( response.error() );

      log_page( "whitelisted balance(s) of", account, response->balances.size(), response->pagination );
      return page< protocol::coin >{ .items      = std::move( response->balances ),
                                     .pagination = std::move( response->pagination ) };
    },
    _options );

  if( !all )
  {
    if( all.error() == program_errc::resource_exhausted )
      LOG_ERROR( mintgate::log::instance(),
                 "Whitelisted balances of {} exceed {} pages",
                 account,
                 _options.max_page_count );

    return std::unexpected( all.error() );
  }

  return whitelisted_balances_response{ .pagination = std::move( all->pagination ),
                                        .balances   = std::move( all->items ) };
}

} // namespace mintgate::program
