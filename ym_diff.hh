// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

#include <algorithm>

#include "ym.hh"

namespace ym {

  // Leaf-level difference between an original and an edited document
  struct ChangeSet {

    struct Change {
      std::string path;
      ordered_node value;
    };

    // Modified scalars and added keys, in edited-document order
    std::vector< Change > changes;

    // Keys present in the original only, in original-document order. No
    // descendant of a removed path is listed separately.
    std::vector< std::string > removed;

    // False when the edit cannot be expressed by rewriting individual lines
    bool line_patchable = true;

    inline bool empty() const { return changes.empty() && removed.empty(); }

    inline const Change* find_change( const std::string& path ) const;

    // True if path is removed itself or lies below a removed path
    inline bool is_removed( const std::string& path ) const;
  };

  ChangeSet diff_documents( const ordered_node& before,
    const ordered_node& after );

  // Conservative test for whether after can be produced from the text of
  // before by replacing, deleting and appending whole lines
  bool is_line_patchable( const ordered_node& before,
    const ordered_node& after );

namespace internal {

  inline void collect_value_changes( const ordered_node& before,
    const ordered_node& after, const std::string& prefix, ChangeSet& cs )
  {
    if ( !before.is_mapping() || !after.is_mapping() ) {
      // Differently shaped values are replaced as a whole
      if ( !nodes_equal(before, after) ) {
        cs.changes.push_back( { prefix, after } );
      }
      return;
    }

    for ( const auto& [nk, nv] : after.map_items() ) {
      if ( !is_string_key(nk) ) continue;
      const std::string key = key_text( nk );
      const std::string path = child_path( prefix, key );

      if ( !before.contains(key) ) {
        cs.changes.push_back( { path, nv } );
        continue;
      }

      const ordered_node& ov = before.at( key );
      if ( nodes_equal(ov, nv) ) continue;

      if ( nv.is_mapping() || nv.is_sequence() ) {
        collect_value_changes( ov, nv, path, cs );
      }
      else {
        cs.changes.push_back( { path, nv } );
      }
    }
  }

  inline void collect_removed_keys( const ordered_node& before,
    const ordered_node& after, const std::string& prefix, ChangeSet& cs )
  {
    if ( !before.is_mapping() || !after.is_mapping() ) return;

    for ( const auto& [ok, ov] : before.map_items() ) {
      if ( !is_string_key(ok) ) continue;
      const std::string key = key_text( ok );
      const std::string path = child_path( prefix, key );

      if ( !after.contains(key) ) {
        cs.removed.push_back( path );
        continue;
      }

      const ordered_node& nv = after.at( key );
      if ( ov.is_mapping() && nv.is_mapping() ) {
        collect_removed_keys( ov, nv, path, cs );
      }
    }
  }

  // Keys that a dotted path can name unambiguously
  inline bool is_addressable_key( const ordered_node& key ) {
    if ( !is_string_key(key) ) return false;
    const std::string text = key_text( key );
    return !text.empty() && text.find( PATH_DELIMITER ) == std::string::npos;
  }

} // namespace ym::internal

} // namespace ym

inline const ym::ChangeSet::Change* ym::ChangeSet::find_change(
  const std::string& path ) const
{
  auto it = std::find_if( changes.begin(), changes.end(),
    [&]( const Change& c ) { return c.path == path; } );
  return it == changes.end() ? nullptr : &*it;
}

inline bool ym::ChangeSet::is_removed( const std::string& path ) const {
  for ( const auto& r : removed ) {
    if ( internal::path_within(path, r) ) return true;
  }
  return false;
}

inline bool ym::is_line_patchable( const ordered_node& before,
  const ordered_node& after )
{
  if ( nodes_equal(before, after) ) return true;

  // Only a mapping root has addressable lines
  if ( !before.is_mapping() || !after.is_mapping() ) return false;

  // Removing a key that no path names
  for ( const auto& [ok, ov] : before.map_items() ) {
    if ( !internal::is_addressable_key(ok) && !after.contains(ok) ) {
      return false;
    }
  }

  for ( const auto& [nk, nv] : after.map_items() ) {
    // Keys that no path names may only be carried over untouched
    if ( !internal::is_addressable_key(nk) ) {
      if ( !before.contains(nk) || !nodes_equal(before.at(nk), nv) ) {
        return false;
      }
      continue;
    }

    const std::string key = internal::key_text( nk );

    if ( !before.contains(key) ) {
      // New nested structure cannot be synthesized line by line
      if ( nv.is_mapping() ) return false;
      continue;
    }

    const ordered_node& ov = before.at( key );
    if ( nodes_equal(ov, nv) ) continue;

    if ( ov.is_mapping() && nv.is_mapping() ) {
      if ( !is_line_patchable(ov, nv) ) return false;
    }
    else if ( ov.is_mapping() || nv.is_mapping() ) {
      return false;
    }
  }
  return true;
}

inline ym::ChangeSet ym::diff_documents( const ordered_node& before,
  const ordered_node& after )
{
  ChangeSet cs;
  internal::collect_value_changes( before, after, "", cs );
  internal::collect_removed_keys( before, after, "", cs );
  cs.line_patchable = is_line_patchable( before, after );
  return cs;
}
