#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include <emissio/controller/controller.hpp>
#include <emissio/curve/types.hpp>

namespace emissio::config {

struct configuration
{
  curve::launch_parameters launch;
  controller::factory_options factory;
};

// Parses a decimal amount, throwing std::runtime_error that names key on failure
math::uint128 parse_amount( std::string_view key, std::string_view value );

curve::launch_parameters parse_launch( const YAML::Node& node );
controller::factory_options parse_factory( const YAML::Node& node );

// Reads the curve and factory sections of a configuration document
configuration parse( const YAML::Node& root );
configuration load_file( const std::filesystem::path& path );

/**
 * Resolves an option from the command line, falling back to each YAML node in
 * turn and finally to the default. The key may carry a short option suffix such
 * as "log-level,l".
 */
template< typename T, typename... Nodes >
T get_option( std::string key,
              T default_value,
              const boost::program_options::variables_map& args,
              const Nodes&... nodes )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key.resize( pos );

  if( args.count( key ) )
    return args[ key ].as< T >();

  T value        = std::move( default_value );
  bool found     = false;
  auto from_node = [ & ]( const YAML::Node& node )
  {
    if( !found && node && node[ key ] )
    {
      value = node[ key ].template as< T >();
      found = true;
    }
  };

  ( from_node( nodes ), ... );
  return value;
}

} // namespace emissio::config
