#pragma once

#include <span>
#include <string>
#include <string_view>

#include <mintgate/program/authorization_gate.hpp>
#include <mintgate/program/error.hpp>
#include <mintgate/program/identity_store.hpp>
#include <mintgate/program/pagination.hpp>
#include <mintgate/program/program.hpp>
#include <mintgate/protocol.hpp>

namespace mintgate::program {

constexpr std::string_view contract_name    = "mintgate.token_controller";
constexpr std::string_view contract_version = "0.1.0";

/**
 * Issues a fungible token on the host ledger and gates every change to it
 * behind a single controller.
 *
 * Mutations are answered with attributes and exactly one effect message for
 * the host's asset_ft module. Queries are forwarded to the module, multi-page
 * queries are drained into one complete answer.
 */
struct token_controller final: public program
{
  token_controller( pagination_options options = {} );
  token_controller( const token_controller& ) = delete;
  token_controller( token_controller&& )      = delete;
  ~token_controller() override                = default;

  token_controller& operator=( const token_controller& ) = delete;
  token_controller& operator=( token_controller&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

  result< protocol::response > instantiate( system_interface* system, const protocol::instantiate_msg& msg );
  result< protocol::response > execute( system_interface* system, const protocol::execute_msg& msg );
  result< protocol::query_response > query( system_interface* system, const protocol::query_msg& msg );

  const pagination_options& options() const noexcept;

private:
  result< protocol::response > mint( const authorization_gate& gate,
                                     const identity_store& store,
                                     const protocol::address& caller,
                                     const protocol::execute::mint& msg );
  result< protocol::response > burn( const authorization_gate& gate,
                                     const identity_store& store,
                                     const protocol::address& caller,
                                     const protocol::execute::burn& msg );
  result< protocol::response > freeze( const authorization_gate& gate,
                                       const identity_store& store,
                                       const protocol::address& caller,
                                       const protocol::execute::freeze& msg );
  result< protocol::response > unfreeze( const authorization_gate& gate,
                                         const identity_store& store,
                                         const protocol::address& caller,
                                         const protocol::execute::unfreeze& msg );
  result< protocol::response > set_frozen( const authorization_gate& gate,
                                           const identity_store& store,
                                           const protocol::address& caller,
                                           const protocol::execute::set_frozen& msg );
  result< protocol::response > globally_freeze( const authorization_gate& gate,
                                                const identity_store& store,
                                                const protocol::address& caller );
  result< protocol::response > globally_unfreeze( const authorization_gate& gate,
                                                  const identity_store& store,
                                                  const protocol::address& caller );
  result< protocol::response > set_whitelisted_limit( const authorization_gate& gate,
                                                      const identity_store& store,
                                                      const protocol::address& caller,
                                                      const protocol::execute::set_whitelisted_limit& msg );

  result< protocol::asset_ft::tokens_response > tokens( system_interface* system, const protocol::address& issuer );
  result< protocol::asset_ft::frozen_balances_response > frozen_balances( system_interface* system,
                                                                          const protocol::address& account );
  result< protocol::asset_ft::whitelisted_balances_response > whitelisted_balances( system_interface* system,
                                                                                    const protocol::address& account );

  pagination_options _options;
};

} // namespace mintgate::program
