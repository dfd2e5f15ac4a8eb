#include <gtest/gtest.h>

#include <mintgate/program/authorization_gate.hpp>

#include <test/fixture.hpp>

TEST( authorization_gate, uninitialized )
{
  test::mock_host host;
  const mintgate::program::authorization_gate gate( &host );

  EXPECT_EQ( gate.assert_caller_is_controller( "alice" ), mintgate::program::program_errc::not_found );

  auto controller = gate.controller();
  ASSERT_FALSE( controller );
  EXPECT_EQ( controller.error(), mintgate::program::program_errc::not_found );
}

TEST( authorization_gate, only_the_controller_passes )
{
  test::mock_host host;
  mintgate::program::authorization_gate gate( &host );

  ASSERT_FALSE( gate.initialize( "alice" ) );

  EXPECT_FALSE( gate.assert_caller_is_controller( "alice" ) );
  EXPECT_EQ( gate.assert_caller_is_controller( "bob" ), mintgate::program::program_errc::unauthorized );
  EXPECT_EQ( gate.assert_caller_is_controller( "" ), mintgate::program::program_errc::unauthorized );
  EXPECT_EQ( gate.assert_caller_is_controller( "Alice" ), mintgate::program::program_errc::unauthorized );

  auto controller = gate.controller();
  ASSERT_TRUE( controller );
  EXPECT_EQ( *controller, "alice" );
}

TEST( authorization_gate, controller_is_fixed )
{
  test::mock_host host;
  mintgate::program::authorization_gate gate( &host );

  EXPECT_EQ( gate.initialize( "" ), mintgate::program::program_errc::invalid_argument );
  ASSERT_FALSE( gate.initialize( "alice" ) );
  EXPECT_EQ( gate.initialize( "bob" ), mintgate::program::program_errc::already_initialized );

  EXPECT_FALSE( gate.assert_caller_is_controller( "alice" ) );
  EXPECT_EQ( gate.assert_caller_is_controller( "bob" ), mintgate::program::program_errc::unauthorized );
}
