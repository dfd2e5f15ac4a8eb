#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <mintgate/program/pagination.hpp>

namespace mintgate::config {

namespace constants {

constexpr auto service = "mintgate";

constexpr auto help_option           = "help,h";
constexpr auto version_option        = "version,v";
constexpr auto basedir_option        = "basedir,d";
constexpr auto scenario_option       = "scenario,s";
constexpr auto log_level_option      = "log-level,l";
constexpr auto log_level_default     = "info";
constexpr auto max_page_count_option = "max-page-count";
constexpr auto page_limit_option     = "page-limit";
constexpr auto page_size_option      = "page-size";
constexpr auto address_option        = "address,a";
constexpr auto address_default       = "contract";

constexpr std::uint64_t max_page_count_default = 1'024;
constexpr std::uint64_t page_size_default      = 100;

} // namespace constants

struct options
{
  std::string log_level      = constants::log_level_default;
  std::string address        = constants::address_default;
  std::uint64_t page_size    = constants::page_size_default;
  program::pagination_options pagination;
};

/*
 * Resolves an option by precedence: the command line, the service section of
 * the config file, its global section, then the default.
 */
template< typename T >
T get_option( std::string_view key,
              T default_value,
              const boost::program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  const auto name = std::string( key.substr( 0, key.find( ',' ) ) );

  if( cli_args.count( name ) )
    return cli_args[ name ].as< T >();

  if( service_config && service_config[ name ] )
    return service_config[ name ].as< T >();

  if( global_config && global_config[ name ] )
    return global_config[ name ].as< T >();

  return default_value;
}

boost::program_options::options_description make_options_description();

options load( const boost::program_options::variables_map& cli_args, const YAML::Node& config = YAML::Node() );

} // namespace mintgate::config
