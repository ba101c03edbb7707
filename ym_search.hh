// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

#include <regex>
#include <utility>

#include "ym.hh"

namespace ym {

  // A search hit: full dotted path and the subtree found there
  using Match = std::pair< std::string, ordered_node >;

  // Depth-first search over full key paths. A path that matches pattern is
  // reported with its whole subtree and is not descended into. Sequences are
  // treated as opaque leaves.
  std::vector< Match > search( const ordered_node& doc,
    const std::string& pattern );

namespace internal {

  // Compile up front so that a bad pattern fails before any result exists
  inline std::regex compile_pattern( const std::string& pattern ) {
    try {
      return std::regex( pattern, std::regex::ECMAScript );
    }
    catch ( const std::regex_error& ex ) {
      std::ostringstream oss;
      oss << "Invalid regex pattern '" << pattern << "': " << ex.what();
      throw std::runtime_error( oss.str() );
    }
  }

  inline void collect_matching_keys( const ordered_node& node,
    const std::regex& re, const std::string& prefix,
    std::vector< Match >& out )
  {
    if ( !node.is_mapping() ) return;

    for ( const auto& [mk, mv] : node.map_items() ) {
      if ( !is_string_key(mk) ) continue;
      const std::string path = child_path( prefix, key_text(mk) );

      if ( std::regex_search(path, re) ) {
        out.emplace_back( path, mv );
        continue;
      }
      collect_matching_keys( mv, re, path, out );
    }
  }

} // namespace ym::internal

} // namespace ym

inline std::vector< ym::Match > ym::search( const ordered_node& doc,
  const std::string& pattern )
{
  const std::regex re = internal::compile_pattern( pattern );
  std::vector< Match > results;
  internal::collect_matching_keys( doc, re, "", results );
  return results;
}
