// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <locale>

#include "ym.hh"

namespace ym {

  // Text for value as it should appear after "key: " on a single line
  std::string format_inline_value( const ordered_node& value );

  // Human-readable "key: value" rendering of a search hit. Scalars are cut
  // to terminal_width bytes; mappings and sequences are printed as an
  // indented block below "key:".
  std::string format_result( const std::string& key, const ordered_node& value,
    size_t terminal_width );

namespace internal {

  // Indentation added in front of serializer output nested below a key
  inline const std::string BLOCK_INDENT = "  ";

  inline constexpr const char* TRUNCATION_MARK = "...";

  // Split serializer output into lines, dropping the final empty piece
  inline std::vector< std::string > split_lines( const std::string& text ) {
    std::vector< std::string > lines;
    size_t start = 0;
    while ( start < text.size() ) {
      size_t pos = text.find( '\n', start );
      if ( pos == std::string::npos ) {
        lines.push_back( text.substr(start) );
        break;
      }
      lines.push_back( text.substr(start, pos - start) );
      start = pos + 1;
    }
    return lines;
  }

  inline std::string trim( const std::string& s ) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of( ws );
    if ( b == std::string::npos ) return std::string();
    size_t e = s.find_last_not_of( ws );
    return s.substr( b, e - b + 1 );
  }

  // Shortest decimal form that reads back as the same double. A '.' is kept
  // so the text is not re-read as an integer.
  inline std::string format_float( double v ) {
    if ( std::isnan(v) ) return ".nan";
    if ( std::isinf(v) ) return v < 0 ? "-.inf" : ".inf";

    std::string s;
    for ( int prec = 1; prec <= 17; ++prec ) {
      std::ostringstream oss;
      oss.imbue( std::locale::classic() );
      oss << std::setprecision( prec ) << v;
      s = oss.str();
      if ( std::strtod(s.c_str(), nullptr) == v ) break;
    }
    if ( s.find_first_of(".eE") == std::string::npos ) s += ".0";
    return s;
  }

  inline bool has_control_chars( const std::string& s ) {
    for ( char ch : s ) {
      unsigned char c = static_cast< unsigned char >( ch );
      if ( c < 0x20 || c == 0x7f ) return true;
    }
    return false;
  }

  // Would the plain (unquoted) text be read back as exactly this string?
  inline bool reads_back_as_string( const std::string& s ) {
    try {
      const ordered_node n = ordered_node::deserialize( s );
      return n.is_string() && n.get_value< std::string >() == s;
    }
    catch ( const fkyaml::exception& ) {
      // Text the parser rejects cannot be written plain
      return false;
    }
  }

  inline bool needs_quotes( const std::string& s ) {
    if ( s.empty() ) return true;
    if ( s.find(' ') != std::string::npos ) return true;
    if ( s.find(':') != std::string::npos ) return true;
    if ( s.front() == '#' ) return true;
    return !reads_back_as_string( s );
  }

  inline std::string single_quoted( const std::string& s ) {
    std::string out = "'";
    for ( char c : s ) {
      if ( c == '\'' ) out += "''";
      else out += c;
    }
    out += '\'';
    return out;
  }

  inline std::string double_quoted( const std::string& s ) {
    std::string out = "\"";
    for ( char ch : s ) {
      switch ( ch ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: {
          unsigned char c = static_cast< unsigned char >( ch );
          if ( c < 0x20 || c == 0x7f ) {
            char buf[ 5 ];
            std::snprintf( buf, sizeof(buf), "\\x%02x", c );
            out += buf;
          }
          else {
            out += ch;
          }
        }
      }
    }
    out += '"';
    return out;
  }

  inline std::string format_string_scalar( const std::string& s ) {
    if ( has_control_chars(s) ) return double_quoted( s );
    if ( needs_quotes(s) ) return single_quoted( s );
    return s;
  }

  // Cut text to at most width bytes (including the mark), without
  // splitting a UTF-8 sequence
  inline std::string truncate_if_needed( const std::string& text,
    size_t width )
  {
    if ( text.size() <= width ) return text;
    const std::string mark = TRUNCATION_MARK;
    size_t cut = width > mark.size() ? width - mark.size() : 0;
    while ( cut > 0
      && ( static_cast< unsigned char >( text[cut] ) & 0xC0 ) == 0x80 ) --cut;
    return text.substr( 0, cut ) + mark;
  }

  inline bool is_empty_container( const ordered_node& n ) {
    return ( n.is_mapping() || n.is_sequence() ) && n.size() == 0;
  }

  inline std::string empty_container_text( const ordered_node& n ) {
    return n.is_mapping() ? "{}" : "[]";
  }

} // namespace ym::internal

} // namespace ym

inline std::string ym::format_inline_value( const ordered_node& value ) {
  switch ( value.get_type() ) {
    case fkyaml::node_type::STRING:
      return internal::format_string_scalar(
        value.get_value< std::string >() );
    case fkyaml::node_type::BOOLEAN:
      return value.get_value< bool >() ? "true" : "false";
    case fkyaml::node_type::INTEGER:
      return std::to_string( value.get_value< std::int64_t >() );
    case fkyaml::node_type::FLOAT:
      return internal::format_float( value.get_value< double >() );
    case fkyaml::node_type::NULL_OBJECT:
      return "null";
    case fkyaml::node_type::MAPPING:
    case fkyaml::node_type::SEQUENCE:
      if ( internal::is_empty_container(value) ) {
        return internal::empty_container_text( value );
      }
      return internal::trim( serialize_document(value) );
  }
  return std::string();
}

inline std::string ym::format_result( const std::string& key,
  const ordered_node& value, size_t terminal_width )
{
  if ( ( value.is_mapping() || value.is_sequence() )
    && !internal::is_empty_container(value) )
  {
    std::ostringstream oss;
    oss << key << ':';
    for ( const auto& line
      : internal::split_lines(serialize_document(value)) )
    {
      oss << '\n';
      if ( !line.empty() ) oss << internal::BLOCK_INDENT << line;
    }
    return oss.str();
  }

  std::string shown;
  if ( value.is_string() ) shown = value.get_value< std::string >();
  else shown = format_inline_value( value );

  return internal::truncate_if_needed( key + ": " + shown, terminal_width );
}
