#include <mintgate/config/options.hpp>

namespace mintgate::config {

boost::program_options::options_description make_options_description()
{
  namespace po = boost::program_options;
  po::options_description options;

  // clang-format off
  options.add_options()
    ( constants::help_option          , "Print this help message and exit" )
    ( constants::version_option       , "Print version string and exit" )
    ( constants::basedir_option       , po::value< std::string >()->default_value( "." ), "Directory holding config.yml" )
    ( constants::scenario_option      , po::value< std::string >(), "YAML scenario of requests to run" )
    ( constants::log_level_option     , po::value< std::string >(), "The log filtering level" )
    ( constants::max_page_count_option, po::value< std::uint64_t >(), "Maximum pages aggregated per query (0 disables the limit)" )
    ( constants::page_limit_option    , po::value< std::uint64_t >(), "Items requested per page" )
    ( constants::page_size_option     , po::value< std::uint64_t >(), "Items served per page by the reference host" )
    ( constants::address_option       , po::value< std::string >(), "Address of the program on the reference host" );
  // clang-format on

  return options;
}

options load( const boost::program_options::variables_map& cli_args, const YAML::Node& config )
{
  YAML::Node service_config;
  YAML::Node global_config;

  if( config && config.IsMap() )
  {
    service_config = config[ constants::service ];
    global_config  = config[ "global" ];
  }

  options opts;

  // clang-format off
  opts.log_level                 = get_option< std::string >( constants::log_level_option, constants::log_level_default, cli_args, service_config, global_config );
  opts.address                   = get_option< std::string >( constants::address_option, constants::address_default, cli_args, service_config, global_config );
  opts.page_size                 = get_option< std::uint64_t >( constants::page_size_option, constants::page_size_default, cli_args, service_config, global_config );
  opts.pagination.max_page_count = get_option< std::uint64_t >( constants::max_page_count_option, constants::max_page_count_default, cli_args, service_config, global_config );
  // clang-format on

  if( auto limit = get_option< std::uint64_t >( constants::page_limit_option, 0, cli_args, service_config, global_config );
      limit )
    opts.pagination.page_limit = limit;

  return opts;
}

} // namespace mintgate::config
