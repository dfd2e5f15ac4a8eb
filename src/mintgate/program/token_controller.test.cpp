// NOLINTBEGIN

#include <array>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <mintgate/host/error.hpp>
#include <mintgate/program/token_controller.hpp>

#include <test/fixture.hpp>

using namespace mintgate;

class token_controller: public ::testing::Test,
                        public test::fixture
{
public:
  token_controller():
      test::fixture( "token_controller", "error" )
  {
    host.set_caller( "owner" );
  }

  token_controller( const token_controller& ) = delete;
  token_controller( token_controller&& )      = delete;

  ~token_controller() override = default;

  token_controller& operator=( const token_controller& ) = delete;
  token_controller& operator=( token_controller&& )      = delete;

  protocol::instantiate_msg make_instantiate_msg()
  {
    protocol::instantiate_msg msg;
    msg.symbol         = "ABC";
    msg.subunit        = "uabc";
    msg.precision      = 6;
    msg.initial_amount = 0;
    msg.description    = "A token";
    msg.features       = std::vector< protocol::asset_ft::feature >{ protocol::asset_ft::feature::minting,
                                                                     protocol::asset_ft::feature::freezing };
    return msg;
  }

  void instantiate()
  {
    auto response = controller.instantiate( &host, make_instantiate_msg() );
    ASSERT_TRUE( response );
  }

  test::mock_host host;
  program::token_controller controller;
};

namespace {

std::vector< protocol::execute_msg > all_mutations()
{
  return { protocol::execute::mint{ .amount = 1'000, .recipient = std::nullopt },
           protocol::execute::burn{ .amount = 10 },
           protocol::execute::freeze{ .account = "alice", .amount = 20 },
           protocol::execute::unfreeze{ .account = "alice", .amount = 5 },
           protocol::execute::set_frozen{ .account = "alice", .amount = 7 },
           protocol::execute::globally_freeze{},
           protocol::execute::globally_unfreeze{},
           protocol::execute::set_whitelisted_limit{ .account = "alice", .amount = 300 } };
}

std::string denom_of( const protocol::asset_ft::msg& message )
{
  return std::visit(
    []< typename T >( const T& m ) -> std::string
    {
      if constexpr( requires { m.coin; } )
        return m.coin.denom;
      else if constexpr( requires { m.denom; } )
        return m.denom;
      else
        return std::string{};
    },
    message );
}

protocol::asset_ft::tokens_response make_tokens_page( std::vector< std::string > denoms,
                                                      std::optional< std::string > next )
{
  protocol::asset_ft::tokens_response response;
  for( auto& denom: denoms )
  {
    protocol::asset_ft::token token;
    token.denom  = std::move( denom );
    token.issuer = "contractX";
    response.tokens.push_back( std::move( token ) );
  }

  if( next )
    response.pagination.next_key = test::key( *next );

  return response;
}

} // namespace

TEST_F( token_controller, instantiate_issues_token )
{
  auto response = controller.instantiate( &host, make_instantiate_msg() );
  ASSERT_TRUE( response );

  ASSERT_NE( response->attribute_value( "owner" ), nullptr );
  EXPECT_EQ( *response->attribute_value( "owner" ), "owner" );
  ASSERT_NE( response->attribute_value( "denom" ), nullptr );
  EXPECT_EQ( *response->attribute_value( "denom" ), "uabc-contractx" );

  ASSERT_EQ( response->messages.size(), 1 );
  auto issue = std::get_if< protocol::asset_ft::issue >( &response->messages.front() );
  ASSERT_NE( issue, nullptr );
  EXPECT_EQ( issue->symbol, "ABC" );
  EXPECT_EQ( issue->subunit, "uabc" );
  EXPECT_EQ( issue->precision, 6 );
  EXPECT_EQ( issue->description, "A token" );
  EXPECT_EQ( issue->features, make_instantiate_msg().features );

  EXPECT_TRUE( host.queries().empty() );
}

TEST_F( token_controller, instantiate_writes_contract_info_first )
{
  ASSERT_TRUE( controller.instantiate( &host, make_instantiate_msg() ) );

  EXPECT_EQ( host.writes(),
             ( std::vector< std::uint32_t >{ program::state::space::contract_info,
                                             program::state::space::denomination,
                                             program::state::space::ownership } ) );
}

TEST_F( token_controller, instantiate_twice )
{
  instantiate();

  host.set_caller( "mallory" );
  auto response = controller.instantiate( &host, make_instantiate_msg() );
  ASSERT_FALSE( response );
  EXPECT_EQ( response.error(), program::program_errc::already_initialized );

  auto owner = controller.query( &host, protocol::query::ownership{} );
  ASSERT_TRUE( owner );
  EXPECT_EQ( std::get< protocol::ownership_response >( *owner ).owner, "owner" );
}

TEST_F( token_controller, unauthorized_mutations_produce_no_message )
{
  instantiate();
  host.set_caller( "mallory" );

  for( const auto& msg: all_mutations() )
  {
    auto response = controller.execute( &host, msg );
    ASSERT_FALSE( response ) << "mutation " << msg.index() << " was authorized";
    EXPECT_EQ( response.error(), program::program_errc::unauthorized );
  }

  EXPECT_TRUE( host.queries().empty() );
}

TEST_F( token_controller, mutations_before_instantiate )
{
  for( const auto& msg: all_mutations() )
  {
    auto response = controller.execute( &host, msg );
    ASSERT_FALSE( response );
    EXPECT_EQ( response.error(), program::program_errc::not_found );
  }
}

TEST_F( token_controller, controller_mutations_carry_denomination )
{
  instantiate();

  constexpr std::array< std::string_view, 8 > methods{ "mint",       "burn",
                                                       "freeze",     "unfreeze",
                                                       "set_frozen", "globally_freeze",
                                                       "globally_unfreeze", "set_whitelisted_limit" };

  auto mutations = all_mutations();
  for( std::size_t i = 0; i < mutations.size(); ++i )
  {
    auto response = controller.execute( &host, mutations[ i ] );
    ASSERT_TRUE( response ) << methods[ i ];

    ASSERT_EQ( response->messages.size(), 1 ) << methods[ i ];
    EXPECT_EQ( response->messages.front().index(), i + 1 ) << methods[ i ];
    EXPECT_EQ( denom_of( response->messages.front() ), "uabc-contractx" ) << methods[ i ];

    ASSERT_NE( response->attribute_value( "method" ), nullptr );
    EXPECT_EQ( *response->attribute_value( "method" ), methods[ i ] );
    ASSERT_NE( response->attribute_value( "denom" ), nullptr );
    EXPECT_EQ( *response->attribute_value( "denom" ), "uabc-contractx" );
  }

  EXPECT_TRUE( host.queries().empty() );
}

TEST_F( token_controller, mint )
{
  instantiate();

  auto response = controller.execute( &host, protocol::execute::mint{ .amount = 1'000, .recipient = "alice" } );
  ASSERT_TRUE( response );

  ASSERT_NE( response->attribute_value( "amount" ), nullptr );
  EXPECT_EQ( *response->attribute_value( "amount" ), "1000" );

  ASSERT_EQ( response->messages.size(), 1 );
  auto mint = std::get_if< protocol::asset_ft::mint >( &response->messages.front() );
  ASSERT_NE( mint, nullptr );
  EXPECT_EQ( mint->coin, protocol::make_coin( 1'000, "uabc-contractx" ) );
  EXPECT_EQ( mint->recipient, "alice" );
}

TEST_F( token_controller, freeze_targets_account )
{
  instantiate();

  auto response = controller.execute( &host, protocol::execute::freeze{ .account = "alice", .amount = 20 } );
  ASSERT_TRUE( response );

  auto freeze = std::get_if< protocol::asset_ft::freeze >( &response->messages.front() );
  ASSERT_NE( freeze, nullptr );
  EXPECT_EQ( freeze->account, "alice" );
  EXPECT_EQ( freeze->coin, protocol::make_coin( 20, "uabc-contractx" ) );
}

TEST_F( token_controller, token_query_uses_fresh_denomination )
{
  instantiate();

  host.set_handler(
    []( const protocol::asset_ft::query& request ) -> program::result< protocol::asset_ft::query_response >
    {
      auto token_request = std::get< protocol::asset_ft::token_request >( request );
      protocol::asset_ft::token_response response;
      response.token.denom  = token_request.denom;
      response.token.symbol = "ABC";
      return response;
    } );

  auto response = controller.query( &host, protocol::query::token{} );
  ASSERT_TRUE( response );
  EXPECT_EQ( std::get< protocol::asset_ft::token_response >( *response ).token.denom, "uabc-contractx" );

  ASSERT_EQ( host.queries().size(), 1 );
  EXPECT_EQ( std::get< protocol::asset_ft::token_request >( host.queries().front() ).denom, "uabc-contractx" );
}

TEST_F( token_controller, balance_query )
{
  instantiate();

  host.set_handler(
    []( const protocol::asset_ft::query& ) -> program::result< protocol::asset_ft::query_response >
    {
      return protocol::asset_ft::balance_response{ .balance = 100, .whitelisted = 0, .frozen = 10, .locked = 0 };
    } );

  auto response = controller.query( &host, protocol::query::balance{ .account = "alice" } );
  ASSERT_TRUE( response );

  auto balance = std::get< protocol::asset_ft::balance_response >( *response );
  EXPECT_EQ( balance.balance, 100 );
  EXPECT_EQ( balance.frozen, 10 );

  ASSERT_EQ( host.queries().size(), 1 );
  auto request = std::get< protocol::asset_ft::balance_request >( host.queries().front() );
  EXPECT_EQ( request.account, "alice" );
  EXPECT_EQ( request.denom, "uabc-contractx" );
}

TEST_F( token_controller, params_query_needs_no_initialization )
{
  host.set_handler(
    []( const protocol::asset_ft::query& ) -> program::result< protocol::asset_ft::query_response >
    {
      protocol::asset_ft::params_response response;
      response.params.issue_fee = protocol::make_coin( 10, "ucore" );
      return response;
    } );

  auto response = controller.query( &host, protocol::query::params{} );
  ASSERT_TRUE( response );
  EXPECT_EQ( std::get< protocol::asset_ft::params_response >( *response ).params.issue_fee,
             protocol::make_coin( 10, "ucore" ) );
}

TEST_F( token_controller, scoped_query_before_instantiate )
{
  auto response = controller.query( &host, protocol::query::frozen_balance{ .account = "alice" } );
  ASSERT_FALSE( response );
  EXPECT_EQ( response.error(), program::program_errc::not_found );
  EXPECT_TRUE( host.queries().empty() );
}

TEST_F( token_controller, tokens_are_aggregated )
{
  instantiate();

  host.set_handler(
    []( const protocol::asset_ft::query& request ) -> program::result< protocol::asset_ft::query_response >
    {
      const auto& tokens_request = std::get< protocol::asset_ft::tokens_request >( request );
      if( !tokens_request.pagination )
        return make_tokens_page( { "a", "b" }, "X" );

      return make_tokens_page( { "c" }, std::nullopt );
    } );

  auto response = controller.query( &host, protocol::query::tokens{ .issuer = "contractX" } );
  ASSERT_TRUE( response );

  const auto& tokens = std::get< protocol::asset_ft::tokens_response >( *response );
  ASSERT_EQ( tokens.tokens.size(), 3 );
  EXPECT_EQ( tokens.tokens[ 0 ].denom, "a" );
  EXPECT_EQ( tokens.tokens[ 1 ].denom, "b" );
  EXPECT_EQ( tokens.tokens[ 2 ].denom, "c" );
  EXPECT_FALSE( tokens.pagination.has_next() );

  ASSERT_EQ( host.queries().size(), 2 );
  const auto& second = std::get< protocol::asset_ft::tokens_request >( host.queries()[ 1 ] );
  EXPECT_EQ( second.issuer, "contractX" );
  ASSERT_TRUE( second.pagination );
  EXPECT_EQ( second.pagination->key, test::key( "X" ) );
}

TEST_F( token_controller, frozen_balances_are_aggregated )
{
  instantiate();

  host.set_handler(
    []( const protocol::asset_ft::query& request ) -> program::result< protocol::asset_ft::query_response >
    {
      const auto& frozen_request = std::get< protocol::asset_ft::frozen_balances_request >( request );
      protocol::asset_ft::frozen_balances_response response;
      if( !frozen_request.pagination )
      {
        response.balances.push_back( protocol::make_coin( 1, "a" ) );
        response.pagination.next_key = test::key( "b" );
      }
      else
        response.balances.push_back( protocol::make_coin( 2, "b" ) );

      return response;
    } );

  auto response = controller.query( &host, protocol::query::frozen_balances{ .account = "alice" } );
  ASSERT_TRUE( response );

  const auto& balances = std::get< protocol::asset_ft::frozen_balances_response >( *response ).balances;
  ASSERT_EQ( balances.size(), 2 );
  EXPECT_EQ( balances[ 0 ], protocol::make_coin( 1, "a" ) );
  EXPECT_EQ( balances[ 1 ], protocol::make_coin( 2, "b" ) );
  EXPECT_EQ( host.queries().size(), 2 );
}

TEST_F( token_controller, page_cap_is_enforced )
{
  program::token_controller capped( program::pagination_options{ .max_page_count = 3, .page_limit = std::nullopt } );
  instantiate();

  // Never reports a final page
  host.set_handler(
    []( const protocol::asset_ft::query& ) -> program::result< protocol::asset_ft::query_response >
    {
      protocol::asset_ft::whitelisted_balances_response response;
      response.balances.push_back( protocol::make_coin( 1, "a" ) );
      response.pagination.next_key = test::key( "a" );
      return response;
    } );

  auto response = capped.query( &host, protocol::query::whitelisted_balances{ .account = "alice" } );
  ASSERT_FALSE( response );
  EXPECT_EQ( response.error(), program::program_errc::resource_exhausted );
  EXPECT_EQ( host.queries().size(), 3 );
}

TEST_F( token_controller, upstream_error_is_propagated )
{
  instantiate();

  host.set_handler(
    []( const protocol::asset_ft::query& ) -> program::result< protocol::asset_ft::query_response >
    {
      return std::unexpected( mintgate::host::asset_ft_errc::token_not_found );
    } );

  auto response = controller.query( &host, protocol::query::token{} );
  ASSERT_FALSE( response );
  EXPECT_EQ( response.error(), mintgate::host::asset_ft_errc::token_not_found );
  EXPECT_EQ( host.queries().size(), 1 );
}

TEST_F( token_controller, mismatched_upstream_answer )
{
  instantiate();

  host.set_handler(
    []( const protocol::asset_ft::query& ) -> program::result< protocol::asset_ft::query_response >
    {
      return protocol::asset_ft::params_response{};
    } );

  auto response = controller.query( &host, protocol::query::balance{ .account = "alice" } );
  ASSERT_FALSE( response );
  EXPECT_EQ( response.error(), program::program_errc::unexpected_response );
}

TEST_F( token_controller, repeated_query_is_identical )
{
  instantiate();

  host.set_handler(
    []( const protocol::asset_ft::query& request ) -> program::result< protocol::asset_ft::query_response >
    {
      const auto& whitelisted = std::get< protocol::asset_ft::whitelisted_balance_request >( request );
      return protocol::asset_ft::whitelisted_balance_response{ .balance = protocol::make_coin( 42,
                                                                                               whitelisted.denom ) };
    } );

  auto first  = controller.query( &host, protocol::query::whitelisted_balance{ .account = "alice" } );
  auto second = controller.query( &host, protocol::query::whitelisted_balance{ .account = "alice" } );

  ASSERT_TRUE( first );
  ASSERT_TRUE( second );
  EXPECT_EQ( *first, *second );
  EXPECT_EQ( host.queries().size(), 2 );
}

TEST_F( token_controller, ownership_and_contract_info )
{
  auto owner = controller.query( &host, protocol::query::ownership{} );
  ASSERT_FALSE( owner );
  EXPECT_EQ( owner.error(), program::program_errc::not_found );

  instantiate();

  owner = controller.query( &host, protocol::query::ownership{} );
  ASSERT_TRUE( owner );
  EXPECT_EQ( std::get< protocol::ownership_response >( *owner ).owner, "owner" );

  auto info = controller.query( &host, protocol::query::contract_info{} );
  ASSERT_TRUE( info );
  EXPECT_EQ( std::get< protocol::contract_info >( *info ),
             ( protocol::contract_info{ .name    = std::string( program::contract_name ),
                                        .version = std::string( program::contract_version ) } ) );
}

TEST_F( token_controller, run_entry_points )
{
  host.set_input( make_instantiate_msg() );
  const std::array< std::string, 1 > instantiate_args{ std::string( program::entry_point::instantiate ) };
  ASSERT_FALSE( controller.run( &host, instantiate_args ) );

  auto response = host.output_as< protocol::response >();
  ASSERT_TRUE( response );
  ASSERT_NE( response->attribute_value( "denom" ), nullptr );
  EXPECT_EQ( *response->attribute_value( "denom" ), "uabc-contractx" );

  host.set_input( protocol::execute_msg{ protocol::execute::burn{ .amount = 3 } } );
  host.set_caller( "mallory" );
  const std::array< std::string, 1 > execute_args{ std::string( program::entry_point::execute ) };
  EXPECT_EQ( controller.run( &host, execute_args ), program::program_errc::unauthorized );
}

TEST_F( token_controller, run_rejects_malformed_requests )
{
  EXPECT_EQ( controller.run( &host, std::span< const std::string >{} ), program::program_errc::invalid_instruction );

  const std::array< std::string, 1 > unknown{ "migrate" };
  EXPECT_EQ( controller.run( &host, unknown ), program::program_errc::invalid_instruction );

  host.set_raw_input( test::key( "not an archive" ) );
  const std::array< std::string, 1 > query_args{ std::string( program::entry_point::query ) };
  EXPECT_EQ( controller.run( &host, query_args ), program::program_errc::invalid_argument );
  EXPECT_TRUE( host.output().empty() );
}

// NOLINTEND
