// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace ym {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Deep structural equality. Mappings compare equal regardless of the
  // order in which their keys were inserted.
  bool nodes_equal( const ordered_node& a, const ordered_node& b );

  // Parser/serializer boundary. Parser failures are rethrown as
  // std::runtime_error so callers only ever see one exception family.
  ordered_node parse_document( const std::string& text );
  std::string serialize_document( const ordered_node& doc );

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';

  // Divide a dotted key path by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& path ) {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = path.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( path.substr(start) );
        break;
      }
      segs.push_back( path.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Connects path segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Full path of a child entry below prefix ("" is the document root)
  inline std::string child_path( const std::string& prefix,
    const std::string& key )
  {
    if ( prefix.empty() ) return key;
    return prefix + PATH_DELIMITER + key;
  }

  // True if path equals ancestor or lies somewhere below it
  inline bool path_within( const std::string& path,
    const std::string& ancestor )
  {
    if ( path.size() < ancestor.size() ) return false;
    if ( path.compare(0, ancestor.size(), ancestor) != 0 ) return false;
    return path.size() == ancestor.size()
      || path[ ancestor.size() ] == PATH_DELIMITER;
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

  // Mapping keys are addressed by their string form only
  inline bool is_string_key( const ordered_node& key ) {
    return key.is_string();
  }

  inline std::string key_text( const ordered_node& key ) {
    return to_native_checked< std::string >( key );
  }

  // Copy of a mapping without the entry stored under key
  inline ordered_node mapping_without( const ordered_node& map,
    const std::string& key )
  {
    ordered_node kept = ordered_node::mapping();
    for ( const auto& [mk, mv] : map.map_items() ) {
      if ( is_string_key(mk) && key_text(mk) == key ) continue;
      kept[ mk ] = mv;
    }
    return kept;
  }

} // namespace ym::internal

} // namespace ym

inline bool ym::nodes_equal( const ordered_node& a, const ordered_node& b ) {
  if ( a.get_type() != b.get_type() ) return false;

  switch ( a.get_type() ) {
    case fkyaml::node_type::MAPPING: {
      if ( a.size() != b.size() ) return false;
      for ( const auto& [ak, av] : a.map_items() ) {
        if ( !b.contains(ak) ) return false;
        if ( !nodes_equal(av, b.at(ak)) ) return false;
      }
      return true;
    }
    case fkyaml::node_type::SEQUENCE: {
      if ( a.size() != b.size() ) return false;
      for ( size_t i = 0; i < a.size(); ++i ) {
        if ( !nodes_equal(a.at(i), b.at(i)) ) return false;
      }
      return true;
    }
    case fkyaml::node_type::NULL_OBJECT:
      return true;
    case fkyaml::node_type::BOOLEAN:
      return a.get_value< bool >() == b.get_value< bool >();
    case fkyaml::node_type::INTEGER:
      return a.get_value< std::int64_t >() == b.get_value< std::int64_t >();
    case fkyaml::node_type::FLOAT: {
      const double x = a.get_value< double >();
      const double y = b.get_value< double >();
      // .nan must equal itself or an untouched document would always diff
      if ( std::isnan(x) || std::isnan(y) ) {
        return std::isnan( x ) && std::isnan( y );
      }
      return x == y;
    }
    case fkyaml::node_type::STRING:
      return a.get_value< std::string >() == b.get_value< std::string >();
  }
  return false;
}

inline ym::ordered_node ym::parse_document( const std::string& text ) {
  try {
    return ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& ex ) {
    std::ostringstream oss;
    oss << "Failed to parse YAML: " << ex.what();
    throw std::runtime_error( oss.str() );
  }
}

inline std::string ym::serialize_document( const ordered_node& doc ) {
  return ordered_node::serialize( doc );
}
