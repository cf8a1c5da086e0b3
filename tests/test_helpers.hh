#pragma once

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "cfnorm.hh"

namespace cfnorm::test {

  // Logger that records every message as "<L> <text>" lines, where <L> is
  // spdlog's one-letter level name (W for warnings, D for debug, ...)
  struct CapturedLog {
    std::ostringstream stream;
    std::shared_ptr< spdlog::logger > logger;

    CapturedLog() {
      auto sink = std::make_shared< spdlog::sinks::ostream_sink_mt >( stream );
      sink->set_pattern( "%L %v" );
      logger = std::make_shared< spdlog::logger >( "cfnorm-test", sink );
      logger->set_level( spdlog::level::trace );
    }

    std::size_t count( char level ) const {
      std::istringstream lines( stream.str() );
      std::size_t n = 0;
      for ( std::string line; std::getline(lines, line); ) {
        if ( !line.empty() && line[0] == level ) ++n;
      }
      return n;
    }

    std::size_t warnings() const { return count( 'W' ); }

    std::string text() const { return stream.str(); }
  };

  inline std::string str( const ordered_node& n ) {
    return n.get_value< std::string >();
  }

  inline const ordered_node& resource( const ordered_node& tmpl,
    const std::string& logical_id )
  {
    return tmpl.at( "Resources" ).at( logical_id );
  }

} // namespace cfnorm::test
