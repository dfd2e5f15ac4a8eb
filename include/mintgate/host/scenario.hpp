#pragma once

#include <cstddef>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <mintgate/host/memory_host.hpp>
#include <mintgate/program/program.hpp>
#include <mintgate/protocol.hpp>

namespace mintgate::host {

struct step
{
  protocol::address sender;
  std::variant< protocol::instantiate_msg, protocol::execute_msg, protocol::query_msg > request;
  bool expect_error = false;
};

/**
 * Reads a scenario from a YAML sequence of steps.
 *
 * Each step names an optional sender, exactly one of the keys instantiate,
 * execute or query, and optionally expect_error. Throws std::runtime_error
 * or YAML::Exception when the document does not describe a scenario.
 */
std::vector< step > parse_scenario( const YAML::Node& document );

/**
 * Runs every step in order and writes one YAML document per step.
 *
 * Returns the error of the first step whose outcome does not match its
 * expectation. Steps after it are not run.
 */
std::error_code run_scenario( memory_host& host,
                              program::program& p,
                              const std::vector< step >& steps,
                              YAML::Emitter& out );

YAML::Node to_yaml( const protocol::response& response );
YAML::Node to_yaml( const protocol::query_response& response );

} // namespace mintgate::host
