#include <fstream>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "cfnorm.hh"

namespace {

  const char* const USAGE =
    "usage: cfnorm [options] [template]\n"
    "Reads a YAML or JSON template (standard input when no path is given)\n"
    "and writes the normalized template to standard output.\n"
    "\n"
    "  --normalize-parameters  default unreferenced asset parameters\n"
    "  --json                  write JSON instead of YAML\n"
    "  --resource-ids          print 'LogicalId: ResourceId' lines instead\n"
    "  --verbose               log debug diagnostics\n"
    "  --quiet                 log errors only\n"
    "  --help                  show this message\n";

  struct Options {
    bool normalize_parameters = false;
    bool json = false;
    bool resource_ids = false;
    bool help = false;
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string input; // empty means standard input
  };

  Options parse_options( int argc, char* argv[] ) {
    Options opts;
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( arg == "--normalize-parameters" ) opts.normalize_parameters = true;
      else if ( arg == "--json" ) opts.json = true;
      else if ( arg == "--resource-ids" ) opts.resource_ids = true;
      else if ( arg == "--verbose" ) opts.log_level = spdlog::level::debug;
      else if ( arg == "--quiet" ) opts.log_level = spdlog::level::err;
      else if ( arg == "--help" || arg == "-h" ) opts.help = true;
      else if ( !arg.empty() && arg[0] == '-' && arg != "-" ) {
        throw std::invalid_argument( "unknown option '" + arg + "'" );
      }
      else if ( opts.input.empty() ) opts.input = ( arg == "-" ? "" : arg );
      else throw std::invalid_argument( "more than one template given" );
    }
    return opts;
  }

  cfnorm::ordered_node read_template( const std::string& path ) {
    if ( path.empty() ) return cfnorm::load_template( std::cin );
    std::ifstream in( path );
    if ( !in ) throw std::runtime_error( "cannot open '" + path + "'" );
    return cfnorm::load_template( in );
  }

} // namespace

int main( int argc, char* argv[] ) {
  Options opts;
  try {
    opts = parse_options( argc, argv );
  } catch ( const std::invalid_argument& ex ) {
    std::cerr << "[cfnorm] " << ex.what() << "\n" << USAGE;
    return 2;
  }
  if ( opts.help ) {
    std::cout << USAGE;
    return 0;
  }

  try {
    auto logger = spdlog::stderr_color_mt( "cfnorm" );
    logger->set_pattern( "[%n] %^%l%$: %v" );
    logger->set_level( opts.log_level );

    cfnorm::ordered_node tmpl = read_template( opts.input );
    const cfnorm::Normalizer normalizer( logger );

    if ( opts.resource_ids ) {
      for ( const auto& [logical_id, id] : normalizer.resource_ids(tmpl) ) {
        std::cout << logical_id << ": " << id << "\n";
      }
      return 0;
    }

    normalizer.normalize( tmpl, opts.normalize_parameters );
    if ( opts.json ) std::cout << cfnorm::to_json( tmpl ) << "\n";
    else std::cout << cfnorm::to_yaml( tmpl );
    return 0;
  } catch ( const std::exception& ex ) {
    std::cerr << "[cfnorm] error: " << ex.what() << "\n";
    return 1;
  }
}
