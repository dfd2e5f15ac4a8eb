#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <mintgate/config.hpp>
#include <mintgate/host.hpp>
#include <mintgate/host/scenario.hpp>
#include <mintgate/log.hpp>
#include <mintgate/program.hpp>

namespace po = boost::program_options;

static std::string version_string()
{
  return std::string( "mintgate v" ) + MINTGATE_VERSION;
}

int main( int argc, char** argv )
{
  mintgate::log::initialize();

  mintgate::config::options opts;
  std::vector< mintgate::host::step > steps;

  try
  {
    auto options = mintgate::config::make_options_description();

    po::variables_map args;
    po::store( po::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << version_string() << '\n';
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
      config = YAML::LoadFile( yaml_config.string() );

    opts = mintgate::config::load( args, config );

    if( !mintgate::log::set_level( opts.log_level ) )
      throw std::runtime_error( opts.log_level + " is not a valid log level" );

    LOG_INFO( mintgate::log::instance(), "{}", version_string() );

    if( config.IsNull() )
      LOG_WARNING( mintgate::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( !args.count( "scenario" ) )
      throw std::runtime_error( "a scenario is required" );

    auto scenario = std::filesystem::path( args[ "scenario" ].as< std::string >() );
    if( !std::filesystem::exists( scenario ) )
      throw std::runtime_error( "unable to locate scenario at " + scenario.string() );

    steps = mintgate::host::parse_scenario( YAML::LoadFile( scenario.string() ) );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( mintgate::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  LOG_INFO( mintgate::log::instance(), "Program address: {}", opts.address );
  LOG_INFO( mintgate::log::instance(),
            "Pagination: at most {} page(s) per query, host page size {}",
            opts.pagination.max_page_count,
            opts.page_size );

  mintgate::host::memory_host host( opts.address, opts.page_size );
  mintgate::program::token_controller controller( opts.pagination );

  YAML::Emitter out;
  auto error = mintgate::host::run_scenario( host, controller, steps, out );
  std::cout << out.c_str() << '\n';

  if( error )
  {
    LOG_ERROR( mintgate::log::instance(), "Scenario stopped: {}", error.message() );
    return EXIT_FAILURE;
  }

  LOG_INFO( mintgate::log::instance(), "Ran {} step(s)", steps.size() );
  return EXIT_SUCCESS;
}
