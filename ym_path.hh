// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

#include <optional>
#include <utility>

#include "ym.hh"

namespace ym {

  // Ordered list of (dotted key path, new value) pairs
  using KeyUpdates = std::vector< std::pair< std::string, ordered_node > >;

  // Returns the subtree stored at path, or std::nullopt if any segment is
  // missing or is reached through something other than a mapping
  std::optional< ordered_node > get_value( const ordered_node& doc,
    const std::string& path );

  // Store value at path, creating (or clobbering) intermediate mappings as
  // needed. A non-mapping document root is replaced by an empty mapping.
  void set_value( ordered_node& doc, const std::string& path,
    const ordered_node& value );

  // Remove the entry at path. Never creates structure; removing something
  // that is not there is a no-op.
  void unset_value( ordered_node& doc, const std::string& path );

  void set_values( ordered_node& doc, const KeyUpdates& updates );
  void unset_values( ordered_node& doc, const std::vector< std::string >& keys );

namespace internal {

  // Split a key path, rejecting the empty path and empty segments
  inline std::vector< std::string > checked_segments(
    const std::string& path )
  {
    if ( path.empty() ) throw std::runtime_error( "Empty key path" );

    std::vector< std::string > segs = split_segments( path );
    for ( const auto& s : segs ) {
      if ( s.empty() ) {
        std::ostringstream oss;
        oss << "Empty segment in key path '" << path << "'";
        throw std::runtime_error( oss.str() );
      }
    }
    return segs;
  }

} // namespace ym::internal

} // namespace ym

inline std::optional< ym::ordered_node > ym::get_value(
  const ordered_node& doc, const std::string& path )
{
  const std::vector< std::string > segs = internal::checked_segments( path );

  const ordered_node* cur = &doc;
  for ( const auto& seg : segs ) {
    if ( !cur->is_mapping() || !cur->contains(seg) ) return std::nullopt;
    cur = &cur->at( seg );
  }
  return *cur;
}

inline void ym::set_value( ordered_node& doc, const std::string& path,
  const ordered_node& value )
{
  const std::vector< std::string > segs = internal::checked_segments( path );

  if ( !doc.is_mapping() ) doc = ordered_node::mapping();

  ordered_node* cur = &doc;
  for ( size_t i = 0; i + 1 < segs.size(); ++i ) {
    const std::string& seg = segs[ i ];
    // Anything that is not already a mapping gets clobbered
    if ( !cur->contains(seg) || !cur->at(seg).is_mapping() ) {
      ( *cur )[ seg ] = ordered_node::mapping();
    }
    cur = &( *cur )[ seg ];
  }
  ( *cur )[ segs.back() ] = value;
}

inline void ym::unset_value( ordered_node& doc, const std::string& path ) {
  const std::vector< std::string > segs = internal::checked_segments( path );

  // Walk to the parent through existing mappings only
  ordered_node* cur = &doc;
  for ( size_t i = 0; i + 1 < segs.size(); ++i ) {
    if ( !cur->is_mapping() || !cur->contains(segs[i]) ) return;
    cur = &cur->at( segs[i] );
  }

  const std::string& last = segs.back();
  if ( !cur->is_mapping() || !cur->contains(last) ) return;
  *cur = internal::mapping_without( *cur, last );
}

inline void ym::set_values( ordered_node& doc, const KeyUpdates& updates ) {
  for ( const auto& [path, value] : updates ) {
    set_value( doc, path, value );
  }
}

inline void ym::unset_values( ordered_node& doc,
  const std::vector< std::string >& keys )
{
  for ( const auto& path : keys ) unset_value( doc, path );
}
