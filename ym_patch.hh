// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "ym.hh"
#include "ym_diff.hh"
#include "ym_format.hh"
#include "ym_path.hh"

namespace ym {

  // Maps source line numbers to the full key path each line defines.
  // Built by tracking a stack of (indentation, key) frames while scanning.
  class LineKeyIndex {
  public:

    struct Entry {
      std::string path; // full dotted path, e.g. "database.host"
      size_t indent; // leading spaces on the line
      std::string key; // key exactly as written, quotes included
    };

    static LineKeyIndex build( const std::vector< std::string >& lines );

    // Entry for a line, or nullptr if the line defines no addressable key
    const Entry* find( size_t line ) const;

    inline size_t size() const { return entries_.size(); }

  private:
    std::unordered_map< size_t, Entry > entries_;
  };

  // Rewrites the text of a document so that it represents an edited tree,
  // touching only the lines affected by the edit. Edits that cannot be
  // expressed line by line fall back to full re-serialization.
  class Patcher {
  public:
    explicit Patcher( const std::string& original_text );

    std::string patch( const ordered_node& edited );

  private:

    // Output state for a single call to patch(...)
    struct PatchSession {
      ChangeSet cs;
      std::vector< std::string > out;
      std::unordered_set< std::string > applied_changes;
      std::unordered_set< std::string > applied_removals;
    };

    std::string text_;
    ordered_node original_;
    std::vector< std::string > lines_;
    PatchSession session_;

    // Processing stages
    void rewrite_lines( const LineKeyIndex& index );
    bool append_additions(); // false if a fallback is required
    std::string rebuild_from_changes() const;
    std::string join_output() const;

    // Drops the block below the key line at start and returns the index of
    // the first line after it. Retained blank/comment lines go to output.
    size_t drop_block( size_t start, size_t indent );
  };

  std::string patch_document( const std::string& original_text,
    const ordered_node& edited );

namespace internal {

  // A key found at the start of a content line
  struct KeyToken {
    std::string raw; // as written, e.g. "'a b'" or "host"
    std::string name; // unquoted key text
    bool has_inline_value; // something other than a comment follows ':'
  };

  inline bool ends_with_cr( const std::string& line ) {
    return !line.empty() && line.back() == '\r';
  }

  inline std::string without_cr( const std::string& line ) {
    return ends_with_cr( line ) ? line.substr( 0, line.size() - 1 ) : line;
  }

  inline size_t indentation_of( const std::string& line ) {
    size_t n = 0;
    while ( n < line.size() && line[n] == ' ' ) ++n;
    return n;
  }

  inline bool is_blank_line( const std::string& line ) {
    return line.find_first_not_of( " \t\r" ) == std::string::npos;
  }

  inline bool is_comment_line( const std::string& line ) {
    size_t p = line.find_first_not_of( " \t" );
    return p != std::string::npos && line[p] == '#';
  }

  // Blank and comment lines never take part in structure decisions
  inline bool is_passive_line( const std::string& line ) {
    return is_blank_line( line ) || is_comment_line( line );
  }

  // "- item" or a lone "-" opens a sequence entry
  inline bool is_sequence_entry( const std::string& body ) {
    return !body.empty() && body[0] == '-'
      && ( body.size() == 1 || body[1] == ' ' || body[1] == '\t' );
  }

  inline bool is_value_separator( const std::string& body, size_t colon ) {
    return colon + 1 >= body.size() || body[ colon + 1 ] == ' '
      || body[ colon + 1 ] == '\t';
  }

  // Characters that cannot start a plain mapping key
  inline bool is_key_indicator( char c ) {
    switch ( c ) {
      case '[': case ']': case '{': case '}': case '?': case '|': case '>':
      case '!': case '&': case '*': case '%': case '@': case '`': case '#':
      case ',':
        return true;
      default: return false;
    }
  }

  // Completes a KeyToken given the position of the ':' after the key
  inline std::optional< KeyToken > finish_key( const std::string& body,
    size_t colon, std::string raw, std::string name )
  {
    if ( colon >= body.size() || body[colon] != ':' ) return std::nullopt;
    if ( !is_value_separator(body, colon) ) return std::nullopt;

    std::string rest = trim( body.substr(colon + 1) );
    KeyToken tok;
    tok.raw = std::move( raw );
    tok.name = std::move( name );
    tok.has_inline_value = !rest.empty() && rest[0] != '#';
    return tok;
  }

  inline std::optional< KeyToken > scan_double_quoted_key(
    const std::string& body )
  {
    std::string name;
    size_t i = 1;
    for ( ; i < body.size() && body[i] != '"'; ++i ) {
      if ( body[i] == '\\' && i + 1 < body.size() ) {
        ++i;
        switch ( body[i] ) {
          case 'n': name += '\n'; break;
          case 't': name += '\t'; break;
          case 'r': name += '\r'; break;
          case '0': name += '\0'; break;
          default: name += body[ i ];
        }
        continue;
      }
      name += body[ i ];
    }
    if ( i >= body.size() ) return std::nullopt; // unterminated
    size_t colon = body.find_first_not_of( " \t", i + 1 );
    if ( colon == std::string::npos ) return std::nullopt;
    return finish_key( body, colon, body.substr(0, i + 1), name );
  }

  inline std::optional< KeyToken > scan_single_quoted_key(
    const std::string& body )
  {
    std::string name;
    size_t i = 1;
    while ( i < body.size() ) {
      if ( body[i] == '\'' ) {
        if ( i + 1 < body.size() && body[i + 1] == '\'' ) {
          name += '\'';
          i += 2;
          continue;
        }
        break;
      }
      name += body[ i++ ];
    }
    if ( i >= body.size() ) return std::nullopt; // unterminated
    size_t colon = body.find_first_not_of( " \t", i + 1 );
    if ( colon == std::string::npos ) return std::nullopt;
    return finish_key( body, colon, body.substr(0, i + 1), name );
  }

  inline std::optional< KeyToken > scan_plain_key( const std::string& body ) {
    if ( is_key_indicator(body[0]) ) return std::nullopt;

    for ( size_t i = 0; i < body.size(); ++i ) {
      // " #" starts a comment before any key separator was seen
      if ( body[i] == '#' && i > 0
        && ( body[i - 1] == ' ' || body[i - 1] == '\t' ) ) return std::nullopt;

      if ( body[i] == ':' && is_value_separator(body, i) ) {
        std::string raw = trim( body.substr(0, i) );
        if ( raw.empty() ) return std::nullopt;
        return finish_key( body, i, raw, raw );
      }
    }
    return std::nullopt;
  }

  // Recognize "key:" at the start of body (indentation already removed)
  inline std::optional< KeyToken > scan_key( const std::string& body ) {
    if ( body.empty() ) return std::nullopt;
    if ( body[0] == '"' ) return scan_double_quoted_key( body );
    if ( body[0] == '\'' ) return scan_single_quoted_key( body );
    return scan_plain_key( body );
  }

  // A key written as a string that a dotted path can name
  inline bool is_addressable_key_token( const KeyToken& tok ) {
    if ( tok.name.empty() ) return false;
    if ( tok.name.find(PATH_DELIMITER) != std::string::npos ) return false;
    const bool quoted = tok.raw[0] == '"' || tok.raw[0] == '\'';
    return quoted || reads_back_as_string( tok.name );
  }

  // Key text for a newly appended top-level entry
  inline std::string format_new_key( const std::string& name ) {
    return format_string_scalar( name );
  }

  // Lines for "key: value" at the given indentation. Containers are written
  // as "key:" followed by serializer output nested one step deeper.
  inline std::vector< std::string > format_entry_lines(
    const std::string& indent, const std::string& key,
    const ordered_node& value )
  {
    std::vector< std::string > lines;

    if ( ( value.is_mapping() || value.is_sequence() )
      && !is_empty_container(value) )
    {
      lines.push_back( indent + key + ':' );
      for ( const auto& l : split_lines(serialize_document(value)) ) {
        lines.push_back( l.empty() ? l : indent + BLOCK_INDENT + l );
      }
      return lines;
    }

    const std::string formatted = format_inline_value( value );
    if ( formatted.empty() ) lines.push_back( indent + key + ':' );
    else lines.push_back( indent + key + ": " + formatted );
    return lines;
  }

} // namespace ym::internal

} // namespace ym

// LineKeyIndex member function definitions

inline ym::LineKeyIndex ym::LineKeyIndex::build(
  const std::vector< std::string >& lines )
{
  // Frames nested under an opaque frame (sequence entries, scalar
  // continuations, keys no path names) never define addressable keys
  struct Frame {
    size_t indent;
    std::string segment;
    bool opaque;
  };

  LineKeyIndex index;
  std::vector< Frame > stack;

  for ( size_t li = 0; li < lines.size(); ++li ) {
    const std::string line = internal::without_cr( lines[li] );
    if ( internal::is_passive_line(line) ) continue;

    const size_t indent = internal::indentation_of( line );
    const std::string body = line.substr( indent );

    while ( !stack.empty() && stack.back().indent >= indent ) {
      stack.pop_back();
    }

    const bool inside_opaque = !stack.empty() && stack.back().opaque;
    if ( inside_opaque || internal::is_sequence_entry(body) ) {
      stack.push_back( { indent, std::string(), true } );
      continue;
    }

    std::optional< internal::KeyToken > tok = internal::scan_key( body );
    if ( !tok || !internal::is_addressable_key_token(*tok) ) {
      stack.push_back( { indent, std::string(), true } );
      continue;
    }

    std::vector< std::string > segs;
    segs.reserve( stack.size() + 1 );
    for ( const auto& f : stack ) segs.push_back( f.segment );
    segs.push_back( tok->name );

    index.entries_.emplace( li,
      Entry{ internal::join_path(segs), indent, tok->raw } );

    // Lines below a key that already carries a value are continuations
    stack.push_back( { indent, tok->name, tok->has_inline_value } );
  }

  return index;
}

inline const ym::LineKeyIndex::Entry* ym::LineKeyIndex::find(
  size_t line ) const
{
  auto it = entries_.find( line );
  return it == entries_.end() ? nullptr : &it->second;
}

// Patcher member function definitions

inline ym::Patcher::Patcher( const std::string& original_text )
  : text_( original_text ), original_( parse_document(original_text) ),
    lines_( internal::split_lines(original_text) ), session_() {}

inline std::string ym::Patcher::patch( const ordered_node& edited ) {
  // Rebuild default session state for this call
  session_ = PatchSession();

  // 1) Nothing changed: hand back the original bytes
  if ( nodes_equal(original_, edited) ) return text_;

  // 2) Structural edits are not expressible as line patches
  session_.cs = diff_documents( original_, edited );
  if ( !session_.cs.line_patchable ) return serialize_document( edited );
  if ( session_.cs.empty() ) return text_;

  // 3) Replace and drop existing lines
  this->rewrite_lines( LineKeyIndex::build(lines_) );

  // 4) Every removal must have been located in the text
  for ( const auto& r : session_.cs.removed ) {
    if ( !session_.applied_removals.count(r) ) {
      return this->rebuild_from_changes();
    }
  }

  // 5) Append new top-level keys
  if ( !this->append_additions() ) return this->rebuild_from_changes();

  return this->join_output();
}

inline void ym::Patcher::rewrite_lines( const LineKeyIndex& index ) {
  const ChangeSet& cs = session_.cs;
  std::vector< std::string >& out = session_.out;

  size_t i = 0;
  while ( i < lines_.size() ) {
    const std::string& line = lines_[ i ];

    const LineKeyIndex::Entry* entry = nullptr;
    if ( !internal::is_passive_line(line) ) entry = index.find( i );

    if ( !entry ) {
      out.push_back( line );
      ++i;
      continue;
    }

    // Removed keys take their whole block with them
    auto removed_it = std::find_if( cs.removed.begin(), cs.removed.end(),
      [&]( const std::string& r ) {
        return internal::path_within( entry->path, r );
      } );
    if ( removed_it != cs.removed.end() ) {
      session_.applied_removals.insert( *removed_it );
      i = this->drop_block( i, entry->indent );
      continue;
    }

    // Changed keys are rewritten in place with the original indentation
    // and key spelling; their old value lines are superseded
    if ( const ChangeSet::Change* change = cs.find_change(entry->path) ) {
      const std::string eol = internal::ends_with_cr( line ) ? "\r" : "";
      const std::string indent = line.substr( 0, entry->indent );
      for ( const auto& l
        : internal::format_entry_lines(indent, entry->key, change->value) )
      {
        out.push_back( l + eol );
      }
      session_.applied_changes.insert( entry->path );
      i = this->drop_block( i, entry->indent );
      continue;
    }

    out.push_back( line );
    ++i;
  }
}

inline size_t ym::Patcher::drop_block( size_t start, size_t indent ) {
  size_t j = start + 1;
  while ( j < lines_.size() ) {
    const std::string& line = lines_[ j ];

    // Blank lines always survive; comments survive unless they are nested
    // deeper than the dropped key
    if ( internal::is_blank_line(line) ) {
      session_.out.push_back( line );
      ++j;
      continue;
    }
    if ( internal::is_comment_line(line) ) {
      if ( internal::indentation_of(line) <= indent ) {
        session_.out.push_back( line );
      }
      ++j;
      continue;
    }

    const size_t li = internal::indentation_of( line );
    if ( li > indent ) { ++j; continue; }

    // Compact sequence entries may sit at the key's own indentation
    if ( li == indent
      && internal::is_sequence_entry(internal::without_cr(line).substr(li)) )
    {
      ++j;
      continue;
    }
    break;
  }
  return j;
}

inline bool ym::Patcher::append_additions() {
  std::vector< std::string >& out = session_.out;

  // Appended lines follow the ending of the last content line
  std::string eol;
  for ( auto it = lines_.rbegin(); it != lines_.rend(); ++it ) {
    if ( internal::is_blank_line(*it) ) continue;
    if ( internal::ends_with_cr(*it) ) eol = "\r";
    break;
  }

  for ( const auto& change : session_.cs.changes ) {
    if ( session_.applied_changes.count(change.path) ) continue;

    // Nested additions would need new indented structure
    if ( change.path.find(internal::PATH_DELIMITER) != std::string::npos ) {
      return false;
    }

    // The key exists but its line could not be located
    if ( original_.is_mapping() && original_.contains(change.path) ) {
      return false;
    }

    if ( !out.empty() && !internal::is_blank_line(out.back()) ) {
      out.push_back( eol );
    }
    for ( const auto& l : internal::format_entry_lines( "",
      internal::format_new_key(change.path), change.value ) )
    {
      out.push_back( l + eol );
    }
  }
  return true;
}

inline std::string ym::Patcher::rebuild_from_changes() const {
  ordered_node rebuilt = parse_document( text_ );
  for ( const auto& change : session_.cs.changes ) {
    set_value( rebuilt, change.path, change.value );
  }
  unset_values( rebuilt, session_.cs.removed );
  return serialize_document( rebuilt );
}

inline std::string ym::Patcher::join_output() const {
  std::string result;
  for ( size_t i = 0; i < session_.out.size(); ++i ) {
    if ( i ) result += '\n';
    result += session_.out[ i ];
  }
  // Trailing newline mirrors the original text
  if ( !text_.empty() && text_.back() == '\n' ) result += '\n';
  return result;
}

inline std::string ym::patch_document( const std::string& original_text,
  const ordered_node& edited )
{
  Patcher patcher( original_text );
  return patcher.patch( edited );
}
