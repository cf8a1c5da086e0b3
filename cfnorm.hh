// cfnorm
// CloudFormation template normalizer for synthesized asset metadata
// version 0.1.0 | MIT License
// Copyright (C) 2026 by the cfnorm contributors
#pragma once

// Standard library includes
#include <charconv>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include <fkYAML/node.hpp>

// spdlog logging library
// https://github.com/gabime/spdlog
#include <spdlog/spdlog.h>

namespace cfnorm {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of the template, so a
  // normalized document serializes in the order it was authored.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  // Template sections and resource/parameter fields
  inline const std::string RESOURCES = "Resources";
  inline const std::string PARAMETERS = "Parameters";
  inline const std::string PROPERTIES = "Properties";
  inline const std::string METADATA = "Metadata";
  inline const std::string TYPE = "Type";
  inline const std::string DEFAULT = "Default";

  // Vendor metadata keys consumed by the normalizer
  inline const std::string CDK_PATH = "aws:cdk:path";
  inline const std::string ASSET_PATH = "aws:asset:path";
  inline const std::string ASSET_PROPERTY = "aws:asset:property";
  inline const std::string ASSET_DOCKERFILE_PATH = "aws:asset:dockerfile-path";
  inline const std::string ASSET_DOCKER_BUILD_ARGS
    = "aws:asset:docker-build-args";
  inline const std::string ASSET_IS_BUNDLED = "aws:asset:is-bundled";
  inline const std::string RESOURCE_ID = "SamResourceId";

  // Metadata keys written back for the build system
  inline const std::string IS_NORMALIZED = "SamNormalized";
  inline const std::string DOCKERFILE = "Dockerfile";
  inline const std::string DOCKER_CONTEXT = "DockerContext";
  inline const std::string DOCKER_BUILD_ARGS = "DockerBuildArgs";
  inline const std::string SKIP_BUILD = "SkipBuild";

  inline const std::string IMAGE_ASSET_PROPERTY = "Code.ImageUri";
  inline const std::string ASSET_PARAMETER_PREFIX = "AssetParameters";
  inline const std::string STRING_PARAMETER_TYPE = "String";
  inline const std::string PARAMETER_PLACEHOLDER = " ";
  inline const std::string NESTED_STACK_TYPE = "AWS::CloudFormation::Stack";
  inline const std::string NESTED_STACK_SUFFIX = ".NestedStack";
  inline const std::string CDK_METADATA_TYPE = "AWS::CDK::Metadata";

  inline constexpr char PROPERTY_DELIMITER = '.';
  inline constexpr char CONSTRUCT_PATH_DELIMITER = '/';
  inline constexpr char FS_PATH_DELIMITER = '/';

} // namespace cfnorm::internal

  // Typed view over the vendor keys of a resource's Metadata mapping. Keys
  // that are missing, or present with an unexpected YAML type, are left
  // unset.
  struct AssetMetadata {
    std::optional< std::string > asset_path;
    std::optional< std::string > asset_property;
    std::optional< std::string > dockerfile_path;
    // Copied verbatim when present, whatever its shape
    ordered_node docker_build_args = ordered_node::mapping();
    bool is_bundled = false;
    bool normalized = false;
    std::optional< std::string > resource_id;
    std::optional< std::string > cdk_path;

    static AssetMetadata from_node( const ordered_node& metadata );
  };

  // Build instructions derived for image assets and merged into Metadata
  struct ImageAssetMetadata {
    std::string dockerfile;
    std::string docker_context;
    ordered_node docker_build_args;

    static ImageAssetMetadata from_asset( const AssetMetadata& asset );

    // Overwrites any existing keys of the same name
    void merge_into( ordered_node& metadata ) const;
  };

  // Decides whether a whole template was synthesized by the CDK. Only used
  // to gate the parameter defaulting pass.
  using SynthesisDetector = std::function< bool( const ordered_node& ) >;

  inline bool is_cdk_template( const ordered_node& tmpl );

  class Normalizer {
  public:
    // A null logger selects spdlog's default logger. An empty detector
    // selects is_cdk_template().
    inline explicit Normalizer(
      std::shared_ptr< spdlog::logger > logger = nullptr,
      SynthesisDetector detector = is_cdk_template )
      : logger_( logger ? std::move(logger) : spdlog::default_logger() ),
        detector_( detector ? std::move(detector)
          : SynthesisDetector(is_cdk_template) ) {}

    // Rewrite the template in place. Per-resource problems are logged and
    // skipped; nothing here throws on malformed metadata.
    void normalize( ordered_node& tmpl,
      bool normalize_parameters = false ) const;

    // Stable identifier for a resource: customer id, then the construct
    // path, then the logical id. Never mutates the resource.
    std::string resource_id( const ordered_node& resource,
      const std::string& logical_id ) const;

    // (logical id, resource id) for every resource, in template order
    std::vector< std::pair< std::string, std::string > >
      resource_ids( const ordered_node& tmpl ) const;

  private:

    std::shared_ptr< spdlog::logger > logger_;
    SynthesisDetector detector_;

    // Processing passes. Each returns whether it changed anything.
    bool rewrite_asset( ordered_node& resource,
      const std::string& logical_id ) const;
    bool propagate_skip_build( ordered_node& resource ) const;
    std::size_t default_asset_parameters( ordered_node& tmpl ) const;

    void replace_property( ordered_node& resource, const std::string& locator,
      const std::string& value ) const;

  }; // class Normalizer

  // Convenience entry points backed by a default-constructed Normalizer
  inline void normalize( ordered_node& tmpl,
    bool normalize_parameters = false );
  inline std::string get_resource_id( const ordered_node& resource,
    const std::string& logical_id );

  // Parse a YAML or JSON template and expand short-form intrinsic tags
  // (!Ref, !GetAtt, !Sub, ...) into their long mapping form
  inline ordered_node load_template( std::istream& in );
  inline ordered_node load_template( const std::string& text );

  // Compact JSON text with the same separators as Python's json.dumps
  inline std::string to_json( const ordered_node& node );

  // Block-style YAML text that loads back into the same document
  inline std::string to_yaml( const ordered_node& node );

namespace internal {

  // Divide a string by every instance of a delimiter. An empty input gives
  // a single empty segment.
  inline std::vector< std::string > split_segments( const std::string& s,
    char delimiter )
  {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = s.find( delimiter, start );
      if ( pos == std::string::npos ) {
        segs.push_back( s.substr(start) );
        break;
      }
      segs.push_back( s.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  inline bool starts_with( const std::string& s, const std::string& prefix ) {
    return s.rfind( prefix, 0 ) == 0;
  }

  inline bool ends_with( const std::string& s, const std::string& suffix ) {
    return s.size() >= suffix.size()
      && s.compare( s.size() - suffix.size(), suffix.size(), suffix ) == 0;
  }

  inline std::string lower_ascii( std::string s ) {
    for ( char& c : s ) {
      if ( c >= 'A' && c <= 'Z' ) c = static_cast< char >( c - 'A' + 'a' );
    }
    return s;
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Truthiness of a flag value: null, false, zero and empty
  // strings/collections are false
  inline bool is_truthy( const ordered_node& n ) {
    if ( n.is_null() ) return false;
    if ( n.is_boolean() ) return n.get_value< bool >();
    if ( n.is_integer() ) return to_native_checked< std::int64_t >( n ) != 0;
    if ( n.is_float_number() ) return to_native_checked< double >( n ) != 0.0;
    if ( n.is_string() ) return !to_native_checked< std::string >( n ).empty();
    return n.size() > 0;
  }

  // String value stored under a key of a mapping, if there is one
  inline std::optional< std::string > string_field( const ordered_node& m,
    const std::string& key )
  {
    if ( !m.is_mapping() || !m.contains(key) ) return std::nullopt;
    const ordered_node& v = m.at( key );
    if ( !v.is_string() ) return std::nullopt;
    return to_native_checked< std::string >( v );
  }

  // Keys of a mapping in document order. Non-string keys are not logical
  // ids or parameter names and are left out.
  inline std::vector< std::string > string_keys( const ordered_node& m ) {
    std::vector< std::string > keys;
    if ( !m.is_mapping() ) return keys;
    for ( const auto& [mk, mv] : m.map_items() ) {
      if ( mk.is_string() ) keys.push_back( mk.get_value< std::string >() );
    }
    return keys;
  }

  // POSIX path helpers. Paths are normalized the way pathlib does it: empty
  // and "." components are dropped, ".." is kept as written.

  inline bool is_absolute_path( const std::string& p ) {
    return !p.empty() && p[ 0 ] == FS_PATH_DELIMITER;
  }

  inline std::vector< std::string > path_parts( const std::string& p ) {
    std::vector< std::string > parts;
    for ( auto& seg : split_segments(p, FS_PATH_DELIMITER) ) {
      if ( seg.empty() || seg == "." ) continue;
      parts.push_back( std::move(seg) );
    }
    return parts;
  }

  inline std::string path_from_parts( bool absolute,
    const std::vector< std::string >& parts )
  {
    std::string s = absolute ? std::string( 1, FS_PATH_DELIMITER ) : "";
    for ( size_t i = 0; i < parts.size(); ++i ) {
      if ( i ) s += FS_PATH_DELIMITER;
      s += parts[ i ];
    }
    return s.empty() ? "." : s;
  }

  // Final component without its last suffix, e.g. "a/Dockerfile.dev" gives
  // "Dockerfile". Dot-files keep their full name.
  inline std::string path_stem( const std::string& p ) {
    const std::vector< std::string > parts = path_parts( p );
    if ( parts.empty() ) return "";
    const std::string& name = parts.back();
    const size_t dot = name.rfind( '.' );
    if ( dot == std::string::npos || dot == 0 || dot + 1 == name.size() ) {
      return name;
    }
    return name.substr( 0, dot );
  }

  inline std::string path_parent( const std::string& p ) {
    std::vector< std::string > parts = path_parts( p );
    if ( !parts.empty() ) parts.pop_back();
    return path_from_parts( is_absolute_path(p), parts );
  }

  // An absolute right-hand side replaces the left-hand side
  inline std::string path_join( const std::string& base,
    const std::string& rel )
  {
    if ( is_absolute_path(rel) ) return path_from_parts( true,
      path_parts(rel) );
    std::vector< std::string > parts = path_parts( base );
    for ( auto& seg : path_parts(rel) ) parts.push_back( std::move(seg) );
    return path_from_parts( is_absolute_path(base), parts );
  }

  // JSON text writer. Separators and escapes follow Python's json.dumps
  // defaults so that textual scans match what that tooling would see.

  inline void write_json_escape( std::ostream& os, unsigned int unit ) {
    static const char* HEX = "0123456789abcdef";
    os << "\\u" << HEX[ (unit >> 12) & 0xF ] << HEX[ (unit >> 8) & 0xF ]
      << HEX[ (unit >> 4) & 0xF ] << HEX[ unit & 0xF ];
  }

  // Code point of the UTF-8 sequence starting at s[i], advancing i past it.
  // A malformed sequence yields its first byte as a code point.
  inline unsigned int next_code_point( const std::string& s, size_t& i ) {
    const unsigned char lead = static_cast< unsigned char >( s[i] );
    size_t extra = 0;
    unsigned int cp = lead;
    if ( lead >= 0xF0 && lead < 0xF8 ) { extra = 3; cp = lead & 0x07; }
    else if ( lead >= 0xE0 ) { extra = 2; cp = lead & 0x0F; }
    else if ( lead >= 0xC0 ) { extra = 1; cp = lead & 0x1F; }

    if ( lead < 0xC0 || lead >= 0xF8 || i + extra >= s.size() ) {
      ++i;
      return lead;
    }
    for ( size_t k = 1; k <= extra; ++k ) {
      const unsigned char c = static_cast< unsigned char >( s[i + k] );
      if ( (c & 0xC0) != 0x80 ) {
        ++i;
        return lead;
      }
      cp = ( cp << 6 ) | ( c & 0x3F );
    }
    i += extra + 1;
    return cp;
  }

  // Non-ASCII text is written as \uXXXX escapes (UTF-16 surrogate pairs
  // above the BMP), as json.dumps does with ensure_ascii
  inline void write_json_string( std::ostream& os, const std::string& s ) {
    os << '"';
    for ( size_t i = 0; i < s.size(); ) {
      const unsigned char c = static_cast< unsigned char >( s[i] );
      if ( c >= 0x80 ) {
        const unsigned int cp = next_code_point( s, i );
        if ( cp >= 0x10000 ) {
          const unsigned int v = cp - 0x10000;
          write_json_escape( os, 0xD800 + (v >> 10) );
          write_json_escape( os, 0xDC00 + (v & 0x3FF) );
        }
        else {
          write_json_escape( os, cp );
        }
        continue;
      }
      switch ( c ) {
        case '"': os << "\\\""; break;
        case '\\': os << "\\\\"; break;
        case '\n': os << "\\n"; break;
        case '\r': os << "\\r"; break;
        case '\t': os << "\\t"; break;
        case '\b': os << "\\b"; break;
        case '\f': os << "\\f"; break;
        default:
          if ( c < 0x20 ) write_json_escape( os, c );
          else os << static_cast< char >( c );
      }
      ++i;
    }
    os << '"';
  }

  inline void write_json_number( std::ostream& os, double v ) {
    if ( std::isnan(v) ) { os << "NaN"; return; }
    if ( std::isinf(v) ) { os << ( v < 0 ? "-Infinity" : "Infinity" ); return; }

    // Shortest round-trip representation, always with a fraction or exponent
    char buf[ 32 ];
    const auto res = std::to_chars( buf, buf + sizeof(buf), v );
    const std::string text( buf, res.ptr );
    os << text;
    if ( text.find_first_of(".e") == std::string::npos ) os << ".0";
  }

  // Mapping keys are always strings in JSON; scalar keys take the text their
  // value would have
  inline void write_json_key( std::ostream& os, const ordered_node& k ) {
    if ( k.is_float_number() ) {
      std::ostringstream num;
      write_json_number( num, to_native_checked< double >(k) );
      write_json_string( os, num.str() );
    }
    else if ( k.is_null() ) {
      write_json_string( os, "null" );
    }
    else {
      write_json_string( os, to_string_any(k) );
    }
  }

  inline void write_json( std::ostream& os, const ordered_node& n ) {
    if ( n.is_mapping() ) {
      os << '{';
      bool first = true;
      for ( const auto& [mk, mv] : n.map_items() ) {
        if ( !first ) os << ", ";
        first = false;
        write_json_key( os, mk );
        os << ": ";
        write_json( os, mv );
      }
      os << '}';
    }
    else if ( n.is_sequence() ) {
      os << '[';
      for ( size_t i = 0; i < n.size(); ++i ) {
        if ( i ) os << ", ";
        write_json( os, n.at(i) );
      }
      os << ']';
    }
    else if ( n.is_string() ) {
      write_json_string( os, to_native_checked< std::string >(n) );
    }
    else if ( n.is_boolean() ) {
      os << ( n.get_value< bool >() ? "true" : "false" );
    }
    else if ( n.is_integer() ) {
      os << to_native_checked< std::int64_t >( n );
    }
    else if ( n.is_float_number() ) {
      write_json_number( os, to_native_checked< double >(n) );
    }
    else {
      os << "null";
    }
  }

  // YAML text writer. Strings are written plain only when they cannot read
  // back as anything else; all other strings are double-quoted.

  inline bool is_plain_safe( const std::string& s ) {
    static const std::string INDICATORS = "-?:,[]{}#&*!|>'\"%@`";
    if ( s.empty() || s.front() == ' ' || s.back() == ' ' ) return false;
    if ( INDICATORS.find(s.front()) != std::string::npos ) return false;

    // Leading digits, signs and dots may read back as numbers or .inf/.nan
    const char first = s.front();
    if ( (first >= '0' && first <= '9') || first == '+' || first == '.' ) {
      return false;
    }
    for ( char ch : s ) {
      const unsigned char c = static_cast< unsigned char >( ch );
      if ( c < 0x20 || c == 0x7F ) return false;
    }
    if ( s.find_first_of(":#") != std::string::npos ) return false;

    static const char* const KEYWORDS[] = { "true", "false", "null", "~",
      "yes", "no", "on", "off", "y", "n" };
    const std::string lowered = lower_ascii( s );
    for ( const char* kw : KEYWORDS ) {
      if ( lowered == kw ) return false;
    }
    return true;
  }

  inline void write_yaml_quoted( std::ostream& os, const std::string& s ) {
    static const char* HEX = "0123456789abcdef";
    os << '"';
    for ( char ch : s ) {
      const unsigned char c = static_cast< unsigned char >( ch );
      switch ( c ) {
        case '"': os << "\\\""; break;
        case '\\': os << "\\\\"; break;
        case '\n': os << "\\n"; break;
        case '\r': os << "\\r"; break;
        case '\t': os << "\\t"; break;
        default:
          if ( c < 0x20 || c == 0x7F ) {
            os << "\\x" << HEX[ c >> 4 ] << HEX[ c & 0xF ];
          }
          else {
            os << ch;
          }
      }
    }
    os << '"';
  }

  // Scalars and empty collections, which fit on the current line
  inline void write_yaml_inline( std::ostream& os, const ordered_node& n ) {
    if ( n.is_mapping() ) {
      if ( n.size() == 0 ) { os << "{}"; return; }
      write_yaml_quoted( os, to_string_any(n) );
    }
    else if ( n.is_sequence() ) {
      if ( n.size() == 0 ) { os << "[]"; return; }
      write_yaml_quoted( os, to_string_any(n) );
    }
    else if ( n.is_string() ) {
      const std::string s = to_native_checked< std::string >( n );
      if ( is_plain_safe(s) ) os << s;
      else write_yaml_quoted( os, s );
    }
    else if ( n.is_boolean() ) {
      os << ( n.get_value< bool >() ? "true" : "false" );
    }
    else if ( n.is_integer() ) {
      os << to_native_checked< std::int64_t >( n );
    }
    else if ( n.is_float_number() ) {
      const double v = to_native_checked< double >( n );
      if ( std::isnan(v) ) os << ".nan";
      else if ( std::isinf(v) ) os << ( v < 0 ? "-.inf" : ".inf" );
      else write_json_number( os, v );
    }
    else {
      os << "null";
    }
  }

  inline bool is_block_collection( const ordered_node& n ) {
    return ( n.is_mapping() || n.is_sequence() ) && n.size() > 0;
  }

  // Block-style mapping or sequence at the given indent. A continued
  // collection starts on a line already holding "- ".
  inline void write_yaml_block( std::ostream& os, const ordered_node& n,
    size_t indent, bool continued = false )
  {
    const std::string pad( indent, ' ' );
    bool first = true;
    auto lead = [&]() {
      if ( !(first && continued) ) os << pad;
      first = false;
    };

    if ( n.is_mapping() ) {
      for ( const auto& [mk, mv] : n.map_items() ) {
        lead();
        write_yaml_inline( os, mk );
        os << ':';
        if ( is_block_collection(mv) ) {
          os << '\n';
          write_yaml_block( os, mv, indent + 2 );
        }
        else {
          os << ' ';
          write_yaml_inline( os, mv );
          os << '\n';
        }
      }
      return;
    }

    for ( size_t i = 0; i < n.size(); ++i ) {
      const ordered_node& item = n.at( i );
      lead();
      os << "- ";
      if ( is_block_collection(item) ) {
        write_yaml_block( os, item, indent + 2, true );
      }
      else {
        write_yaml_inline( os, item );
        os << '\n';
      }
    }
  }

  // Copy of a scalar without any tag attached
  inline ordered_node untagged_scalar( const ordered_node& n ) {
    if ( n.is_string() ) {
      return make_node_from( to_native_checked< std::string >(n) );
    }
    if ( n.is_boolean() ) return make_node_from( n.get_value< bool >() );
    if ( n.is_integer() ) {
      return make_node_from( to_native_checked< std::int64_t >(n) );
    }
    if ( n.is_float_number() ) {
      return make_node_from( to_native_checked< double >(n) );
    }
    return ordered_node();
  }

  // CloudFormation intrinsic name for a short-form local tag, or nothing for
  // untagged nodes and core YAML tags ("!!str" and friends)
  inline std::optional< std::string > intrinsic_name( const ordered_node& n ) {
    if ( !n.has_tag_name() ) return std::nullopt;
    std::string tag = n.get_tag_name();
    if ( tag.empty() || tag[0] != '!' ) return std::nullopt;
    tag.erase( 0, 1 );
    if ( tag.empty() || tag[0] == '!' || tag[0] == '<' ) return std::nullopt;
    if ( tag == "Ref" || tag == "Condition" ) return tag;
    return "Fn::" + tag;
  }

  // Rebuild a node with short-form intrinsic tags replaced by their long
  // form, e.g. "!Ref Bucket" becomes {"Ref": "Bucket"}
  inline ordered_node expand_intrinsic_tags( const ordered_node& n ) {
    ordered_node out;
    if ( n.is_mapping() ) {
      out = ordered_node::mapping();
      for ( const auto& [mk, mv] : n.map_items() ) {
        // Keys keep their scalar type; only tags are dropped
        ordered_node key = mk.has_tag_name() ? untagged_scalar( mk ) : mk;
        out[ std::move(key) ] = expand_intrinsic_tags( mv );
      }
    }
    else if ( n.is_sequence() ) {
      std::vector< ordered_node > elems;
      elems.reserve( n.size() );
      for ( size_t i = 0; i < n.size(); ++i ) {
        elems.push_back( expand_intrinsic_tags(n.at(i)) );
      }
      out = make_node_from( elems );
    }
    else if ( n.has_tag_name() ) {
      out = untagged_scalar( n );
    }
    else {
      out = n;
    }

    const std::optional< std::string > name = intrinsic_name( n );
    if ( !name ) return out;

    // "!GetAtt Resource.Attribute" is split at the first delimiter only
    if ( *name == "Fn::GetAtt" && out.is_string() ) {
      const std::string target = to_native_checked< std::string >( out );
      const size_t dot = target.find( '.' );
      std::vector< ordered_node > pieces;
      if ( dot == std::string::npos ) {
        pieces.push_back( make_node_from(target) );
      }
      else {
        pieces.push_back( make_node_from(target.substr(0, dot)) );
        pieces.push_back( make_node_from(target.substr(dot + 1)) );
      }
      out = make_node_from( pieces );
    }

    ordered_node wrapped = ordered_node::mapping();
    wrapped[ *name ] = out;
    return wrapped;
  }

} // namespace cfnorm::internal

} // namespace cfnorm

inline cfnorm::AssetMetadata cfnorm::AssetMetadata::from_node(
  const ordered_node& metadata )
{
  using namespace internal;

  AssetMetadata asset;
  if ( !metadata.is_mapping() ) return asset;

  asset.asset_path = string_field( metadata, ASSET_PATH );
  asset.asset_property = string_field( metadata, ASSET_PROPERTY );
  asset.dockerfile_path = string_field( metadata, ASSET_DOCKERFILE_PATH );
  asset.resource_id = string_field( metadata, RESOURCE_ID );
  asset.cdk_path = string_field( metadata, CDK_PATH );

  if ( metadata.contains(ASSET_DOCKER_BUILD_ARGS) ) {
    asset.docker_build_args = metadata.at( ASSET_DOCKER_BUILD_ARGS );
  }
  if ( metadata.contains(ASSET_IS_BUNDLED) ) {
    asset.is_bundled = is_truthy( metadata.at(ASSET_IS_BUNDLED) );
  }
  if ( metadata.contains(IS_NORMALIZED) ) {
    asset.normalized = is_truthy( metadata.at(IS_NORMALIZED) );
  }
  return asset;
}

// The build context is the asset directory joined with the directory part
// of the dockerfile path; the dockerfile name is its stem.
inline cfnorm::ImageAssetMetadata cfnorm::ImageAssetMetadata::from_asset(
  const AssetMetadata& asset )
{
  const std::string dockerfile_path = asset.dockerfile_path.value_or( "" );

  ImageAssetMetadata image;
  image.dockerfile = internal::path_stem( dockerfile_path );
  image.docker_context = internal::path_join( asset.asset_path.value_or(""),
    internal::path_parent(dockerfile_path) );
  image.docker_build_args = asset.docker_build_args;
  return image;
}

inline void cfnorm::ImageAssetMetadata::merge_into(
  ordered_node& metadata ) const
{
  using namespace internal;
  metadata[ DOCKERFILE ] = make_node_from( dockerfile );
  metadata[ DOCKER_CONTEXT ] = make_node_from( docker_context );
  metadata[ DOCKER_BUILD_ARGS ] = docker_build_args;
}

// A template counts as CDK-synthesized when it carries the CDK metadata
// resource or any resource records its construct path
inline bool cfnorm::is_cdk_template( const ordered_node& tmpl ) {
  using namespace internal;
  if ( !tmpl.is_mapping() || !tmpl.contains(RESOURCES) ) return false;
  const ordered_node& resources = tmpl.at( RESOURCES );
  if ( !resources.is_mapping() ) return false;

  for ( const auto& [mk, resource] : resources.map_items() ) {
    if ( !resource.is_mapping() ) continue;
    if ( string_field(resource, TYPE).value_or("") == CDK_METADATA_TYPE ) {
      return true;
    }
    if ( resource.contains(METADATA) ) {
      const AssetMetadata asset = AssetMetadata::from_node(
        resource.at(METADATA) );
      if ( asset.cdk_path && !asset.cdk_path->empty() ) return true;
    }
  }
  return false;
}

// Main implementation of template normalization. The asset rewrite and the
// skip-build propagation run per resource; parameter defaulting runs last,
// against the already rewritten resources.
inline void cfnorm::Normalizer::normalize( ordered_node& tmpl,
  bool normalize_parameters ) const
{
  using internal::RESOURCES;

  // A template without resources has nothing to normalize
  if ( tmpl.is_mapping() && tmpl.contains(RESOURCES)
    && tmpl.at(RESOURCES).is_mapping() )
  {
    ordered_node& resources = tmpl[ RESOURCES ];

    std::size_t rewritten = 0, skipped = 0;
    for ( const std::string& logical_id : internal::string_keys(resources) ) {
      ordered_node& resource = resources[ logical_id ];
      if ( !resource.is_mapping() ) continue;

      // 1) Asset rewrite (guarded by the normalized marker)
      if ( this->rewrite_asset(resource, logical_id) ) ++rewritten;

      // 2) Skip-build propagation (every resource, every invocation)
      if ( this->propagate_skip_build(resource) ) ++skipped;
    }
    logger_->debug( "Normalized {} asset resource(s), {} marked to skip build",
      rewritten, skipped );
  }

  // 3) Parameter defaulting, only for synthesized templates
  if ( !normalize_parameters ) return;
  if ( !detector_(tmpl) ) {
    logger_->debug( "Template is not CDK-synthesized; parameters left as is" );
    return;
  }
  const std::size_t defaulted = this->default_asset_parameters( tmpl );
  if ( defaulted ) {
    logger_->info( "Added placeholder defaults to {} unreferenced asset "
      "parameter(s)", defaulted );
  }
}

inline bool cfnorm::Normalizer::rewrite_asset( ordered_node& resource,
  const std::string& logical_id ) const
{
  using namespace internal;

  if ( !resource.contains(METADATA) ) return false;
  ordered_node& metadata = resource[ METADATA ];
  if ( !metadata.is_mapping() ) return false;

  const AssetMetadata asset = AssetMetadata::from_node( metadata );
  if ( asset.normalized ) return false;

  const std::string locator = asset.asset_property.value_or( "" );
  std::string value;
  if ( locator == IMAGE_ASSET_PROPERTY ) {
    ImageAssetMetadata::from_asset( asset ).merge_into( metadata );
    // Image resources are addressed by image name, and the build names
    // the image after the lower-cased logical id
    value = lower_ascii( logical_id );
  }
  else {
    value = asset.asset_path.value_or( "" );
  }

  if ( locator.empty() && value.empty() ) return false;
  if ( locator.empty() || value.empty() ) {
    logger_->warn( "Ignoring Metadata for Resource {}. Metadata contains only "
      "{} or {} but not both", logical_id, ASSET_PATH, ASSET_PROPERTY );
    return false;
  }

  this->replace_property( resource, locator, value );

  // Looked up again: inserting Properties may have moved the entries of
  // the resource mapping
  resource[ METADATA ][ IS_NORMALIZED ] = make_node_from( true );
  return true;
}

// Write value at a dotted locator under Properties. Every intermediate
// segment is replaced by a fresh empty mapping, so sibling keys along the
// rewritten path do NOT survive: "Code.S3Key" drops Code.S3Bucket.
inline void cfnorm::Normalizer::replace_property( ordered_node& resource,
  const std::string& locator, const std::string& value ) const
{
  using namespace internal;

  if ( !resource.contains(PROPERTIES)
    || !resource.at(PROPERTIES).is_mapping() )
  {
    resource[ PROPERTIES ] = ordered_node::mapping();
  }

  const std::vector< std::string > keys
    = split_segments( locator, PROPERTY_DELIMITER );

  ordered_node* target = &resource[ PROPERTIES ];
  for ( size_t i = 0; i + 1 < keys.size(); ++i ) {
    ( *target )[ keys[i] ] = ordered_node::mapping();
    target = &( *target )[ keys[i] ];
  }
  ( *target )[ keys.back() ] = make_node_from( value );
}

inline bool cfnorm::Normalizer::propagate_skip_build(
  ordered_node& resource ) const
{
  using namespace internal;

  if ( !resource.contains(METADATA) ) return false;
  ordered_node& metadata = resource[ METADATA ];
  if ( !metadata.is_mapping() ) return false;
  if ( !AssetMetadata::from_node(metadata).is_bundled ) return false;

  metadata[ SKIP_BUILD ] = make_node_from( true );
  return true;
}

// Give unreferenced, defaultless String asset parameters a single-space
// default. A parameter counts as referenced when the JSON text of Resources
// contains "Ref": "<name>" verbatim; differently formatted references are
// not recognized.
inline std::size_t cfnorm::Normalizer::default_asset_parameters(
  ordered_node& tmpl ) const
{
  using namespace internal;

  if ( !tmpl.is_mapping() || !tmpl.contains(PARAMETERS)
    || !tmpl.at(PARAMETERS).is_mapping() ) return 0;

  const std::string resources_text = tmpl.contains( RESOURCES )
    ? to_json( tmpl.at(RESOURCES) ) : "{}";

  ordered_node& parameters = tmpl[ PARAMETERS ];
  std::size_t defaulted = 0;
  for ( const std::string& name : string_keys(parameters) ) {
    if ( !starts_with(name, ASSET_PARAMETER_PREFIX) ) continue;

    ordered_node& parameter = parameters[ name ];
    if ( !parameter.is_mapping() || parameter.contains(DEFAULT) ) continue;
    if ( string_field(parameter, TYPE).value_or("") != STRING_PARAMETER_TYPE ) {
      continue;
    }

    const std::string reference = "\"Ref\": \"" + name + '"';
    if ( resources_text.find(reference) != std::string::npos ) {
      logger_->debug( "Parameter {} is referenced by a resource", name );
      continue;
    }

    parameter[ DEFAULT ] = make_node_from( PARAMETER_PLACEHOLDER );
    logger_->debug( "Parameter {} defaulted to a placeholder", name );
    ++defaulted;
  }
  return defaulted;
}

// aws:cdk:path has the form {stack_id}/{construct_id}/Resource, so the
// construct id is the second-to-last segment
inline std::string cfnorm::Normalizer::resource_id(
  const ordered_node& resource, const std::string& logical_id ) const
{
  using namespace internal;

  AssetMetadata asset;
  if ( resource.is_mapping() && resource.contains(METADATA) ) {
    asset = AssetMetadata::from_node( resource.at(METADATA) );
  }

  if ( asset.resource_id && !asset.resource_id->empty() ) {
    return *asset.resource_id;
  }

  if ( !asset.cdk_path || asset.cdk_path->empty() ) {
    logger_->debug( "No {} metadata on {}, using logical id", CDK_PATH,
      logical_id );
    return logical_id;
  }

  const std::vector< std::string > segs
    = split_segments( *asset.cdk_path, CONSTRUCT_PATH_DELIMITER );
  if ( segs.size() < 2 ) {
    logger_->warn( "Cannot detect resource id from {} metadata '{}', using "
      "default logical id", CDK_PATH, *asset.cdk_path );
    return logical_id;
  }

  std::string id = segs[ segs.size() - 2 ];

  // Nested stacks are recorded as "<id>.NestedStack"
  if ( string_field(resource, TYPE).value_or("") == NESTED_STACK_TYPE
    && ends_with(id, NESTED_STACK_SUFFIX) )
  {
    id.erase( id.size() - NESTED_STACK_SUFFIX.size() );
  }
  return id;
}

inline std::vector< std::pair< std::string, std::string > >
  cfnorm::Normalizer::resource_ids( const ordered_node& tmpl ) const
{
  using internal::RESOURCES;

  std::vector< std::pair< std::string, std::string > > ids;
  if ( !tmpl.is_mapping() || !tmpl.contains(RESOURCES) ) return ids;
  const ordered_node& resources = tmpl.at( RESOURCES );

  for ( const std::string& logical_id : internal::string_keys(resources) ) {
    ids.emplace_back( logical_id,
      this->resource_id(resources.at(logical_id), logical_id) );
  }
  return ids;
}

inline void cfnorm::normalize( ordered_node& tmpl, bool normalize_parameters )
{
  Normalizer().normalize( tmpl, normalize_parameters );
}

inline std::string cfnorm::get_resource_id( const ordered_node& resource,
  const std::string& logical_id )
{
  return Normalizer().resource_id( resource, logical_id );
}

// Read from an input stream until end-of-file, then parse the resulting
// string
inline cfnorm::ordered_node cfnorm::load_template( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_template( ss.str() );
}

inline cfnorm::ordered_node cfnorm::load_template( const std::string& text ) {
  const ordered_node dom = ordered_node::deserialize( text );
  return internal::expand_intrinsic_tags( dom );
}

inline std::string cfnorm::to_json( const ordered_node& node ) {
  std::ostringstream oss;
  internal::write_json( oss, node );
  return oss.str();
}

inline std::string cfnorm::to_yaml( const ordered_node& node ) {
  std::ostringstream oss;
  if ( internal::is_block_collection(node) ) {
    internal::write_yaml_block( oss, node, 0 );
  }
  else {
    internal::write_yaml_inline( oss, node );
    oss << '\n';
  }
  return oss.str();
}
