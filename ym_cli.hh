// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <tuple>
#include <utility>

#include "ym.hh"
#include "ym_edit.hh"
#include "ym_format.hh"
#include "ym_path.hh"
#include "ym_search.hh"

namespace ym {

  inline constexpr const char* VERSION = "0.1.0";

  enum class CommandKind { Help, Version, Grep, Set, Unset, Copy, Move };

  // Fully validated command line. Only the fields used by kind are filled.
  struct Command {
    CommandKind kind = CommandKind::Help;

    // grep
    std::string pattern;
    bool recursive = false;
    std::vector< std::string > paths;

    // set, unset
    std::string file;
    KeyUpdates updates;
    std::vector< std::string > keys;

    // cp, mv (destination already defaulted from the source)
    std::string src_file;
    std::string src_key;
    std::string dst_file;
    std::string dst_key;
  };

  // args excludes the program name
  Command parse_command_line( const std::vector< std::string >& args );

  // Typed value for the VALUE part of KEY=VALUE. Scalars keep the type YAML
  // gives them; everything else stays the literal string.
  ordered_node parse_scalar_argument( const std::string& text );

  // "file:key" with both parts non-empty
  std::pair< std::string, std::string > parse_file_key_pair(
    const std::string& input );

  // "file:key", "file:", ":key" or a bare "key"
  std::pair< std::optional< std::string >, std::optional< std::string > >
    parse_optional_file_key_pair( const std::string& input );

  std::string usage_text();

  // Runs a grep command. Results go to out, per-file warnings to err.
  void run_grep( const Command& cmd, std::istream& in, std::ostream& out,
    std::ostream& err, size_t terminal_width );

  void run_command( const Command& cmd, std::istream& in, std::ostream& out,
    std::ostream& err, size_t terminal_width );

namespace internal {

  inline constexpr size_t DEFAULT_TERMINAL_WIDTH = 80;

  inline bool is_yaml_file( const std::filesystem::path& p ) {
    const std::string ext = p.extension().string();
    return ext == ".yaml" || ext == ".yml";
  }

  inline void print_matches( const ordered_node& doc,
    const std::string& pattern, const std::string& label, std::ostream& out,
    size_t terminal_width )
  {
    for ( const auto& [path, value] : search(doc, pattern) ) {
      if ( !label.empty() ) out << label << ':';
      out << format_result( path, value, terminal_width ) << '\n';
    }
  }

  inline void grep_file( const std::string& file, const std::string& pattern,
    bool show_filename, std::ostream& out, size_t terminal_width )
  {
    const std::string text = read_text_file( file );
    const ordered_node doc = parse_file_text( text, file );
    print_matches( doc, pattern, show_filename ? file : std::string(), out,
      terminal_width );
  }

  // Recursive walk in sorted order. Files that cannot be searched are
  // reported and skipped.
  inline void grep_directory( const std::filesystem::path& dir,
    const std::string& pattern, bool show_filename, std::ostream& out,
    std::ostream& err, size_t terminal_width )
  {
    std::vector< std::filesystem::path > entries;
    std::error_code ec;
    for ( std::filesystem::directory_iterator it( dir, ec ), end;
      !ec && it != end; it.increment(ec) )
    {
      entries.push_back( it->path() );
    }
    if ( ec ) {
      std::ostringstream oss;
      oss << "Failed to read directory '" << dir.string() << "': "
        << ec.message();
      throw std::runtime_error( oss.str() );
    }
    std::sort( entries.begin(), entries.end() );

    for ( const auto& p : entries ) {
      if ( std::filesystem::is_directory(p, ec) ) {
        grep_directory( p, pattern, show_filename, out, err, terminal_width );
      }
      else if ( std::filesystem::is_regular_file(p, ec) && is_yaml_file(p) ) {
        try {
          grep_file( p.string(), pattern, show_filename, out, terminal_width );
        }
        catch ( const std::runtime_error& ex ) {
          err << "[ym] warning: " << ex.what() << '\n';
        }
      }
    }
  }

  // cp and mv share one argument grammar
  inline void parse_transfer_arguments( const std::string& name,
    const std::vector< std::string >& rest, Command& cmd )
  {
    if ( rest.empty() ) {
      std::ostringstream oss;
      oss << name << " requires a source argument (file.yaml:key.path)";
      throw std::runtime_error( oss.str() );
    }
    if ( rest.size() > 2 ) {
      std::ostringstream oss;
      oss << name << " accepts at most one destination argument";
      throw std::runtime_error( oss.str() );
    }

    std::tie( cmd.src_file, cmd.src_key ) = parse_file_key_pair( rest[0] );

    std::optional< std::string > dst_file, dst_key;
    if ( rest.size() == 2 ) {
      std::tie( dst_file, dst_key ) = parse_optional_file_key_pair( rest[1] );
    }
    if ( !dst_file && !dst_key ) {
      throw std::runtime_error(
        "destination file and destination key cannot both be omitted" );
    }

    cmd.dst_file = dst_file.value_or( cmd.src_file );
    cmd.dst_key = dst_key.value_or( cmd.src_key );
  }

  inline void parse_grep_arguments( const std::vector< std::string >& rest,
    Command& cmd )
  {
    size_t i = 0;
    for ( ; i < rest.size(); ++i ) {
      const std::string& a = rest[ i ];
      if ( a == "--" ) { ++i; break; }
      if ( a == "-R" || a == "-r" ) { cmd.recursive = true; continue; }
      if ( a.size() > 1 && a[0] == '-' ) {
        std::ostringstream oss;
        oss << "unknown option '" << a << "' for grep";
        throw std::runtime_error( oss.str() );
      }
      break;
    }
    if ( i >= rest.size() ) {
      throw std::runtime_error( "grep requires a pattern" );
    }
    cmd.pattern = rest[ i ];
    cmd.paths.assign( rest.begin() + i + 1, rest.end() );
  }

} // namespace ym::internal

} // namespace ym

inline ym::ordered_node ym::parse_scalar_argument( const std::string& text ) {
  // Text after '#' would be read as a comment and lost
  if ( text.empty() || text.find('#') != std::string::npos ) {
    return internal::make_node_from( text );
  }

  try {
    const ordered_node n = ordered_node::deserialize( text );
    switch ( n.get_type() ) {
      case fkyaml::node_type::BOOLEAN:
      case fkyaml::node_type::INTEGER:
      case fkyaml::node_type::FLOAT:
        return n;
      case fkyaml::node_type::NULL_OBJECT: {
        // Blank text also reads as null
        const std::string t = internal::trim( text );
        if ( t == "~" || t == "null" || t == "Null" || t == "NULL" ) return n;
        break;
      }
      default: break;
    }
  }
  catch ( const fkyaml::exception& ) {
    // Not valid YAML on its own: keep the literal text
  }
  return internal::make_node_from( text );
}

inline std::pair< std::string, std::string > ym::parse_file_key_pair(
  const std::string& input )
{
  const size_t colon = input.find( ':' );
  if ( colon == std::string::npos || colon == 0
    || colon + 1 >= input.size() )
  {
    std::ostringstream oss;
    oss << "Invalid file:key pair: " << input
      << " (expected format: file.yaml:key.path)";
    throw std::runtime_error( oss.str() );
  }
  return { input.substr(0, colon), input.substr(colon + 1) };
}

inline std::pair< std::optional< std::string >, std::optional< std::string > >
  ym::parse_optional_file_key_pair( const std::string& input )
{
  std::optional< std::string > file, key;

  const size_t colon = input.find( ':' );
  if ( colon == std::string::npos ) {
    if ( input.empty() ) throw std::runtime_error( "Key cannot be empty" );
    key = input;
    return { file, key };
  }

  if ( colon == 0 && colon + 1 >= input.size() ) {
    std::ostringstream oss;
    oss << "Invalid file:key pair: " << input
      << " (file and key cannot both be empty)";
    throw std::runtime_error( oss.str() );
  }
  if ( colon > 0 ) file = input.substr( 0, colon );
  if ( colon + 1 < input.size() ) key = input.substr( colon + 1 );
  return { file, key };
}

inline ym::Command ym::parse_command_line(
  const std::vector< std::string >& args )
{
  if ( args.empty() ) {
    throw std::runtime_error( "no command given (try 'ym --help')" );
  }

  Command cmd;
  const std::string& name = args.front();
  const std::vector< std::string > rest( args.begin() + 1, args.end() );

  if ( name == "-h" || name == "--help" || name == "help" ) {
    cmd.kind = CommandKind::Help;
  }
  else if ( name == "-V" || name == "--version" ) {
    cmd.kind = CommandKind::Version;
  }
  else if ( name == "grep" ) {
    cmd.kind = CommandKind::Grep;
    internal::parse_grep_arguments( rest, cmd );
  }
  else if ( name == "set" ) {
    cmd.kind = CommandKind::Set;
    if ( rest.empty() ) throw std::runtime_error( "set requires a file" );
    cmd.file = rest[ 0 ];
    if ( rest.size() < 2 ) {
      throw std::runtime_error( "set requires at least one key=value pair" );
    }
    for ( size_t i = 1; i < rest.size(); ++i ) {
      const size_t eq = rest[ i ].find( '=' );
      if ( eq == std::string::npos ) {
        std::ostringstream oss;
        oss << "Invalid key=value pair: " << rest[ i ];
        throw std::runtime_error( oss.str() );
      }
      cmd.updates.emplace_back( rest[i].substr(0, eq),
        parse_scalar_argument(rest[i].substr(eq + 1)) );
    }
  }
  else if ( name == "unset" ) {
    cmd.kind = CommandKind::Unset;
    if ( rest.empty() ) throw std::runtime_error( "unset requires a file" );
    cmd.file = rest[ 0 ];
    if ( rest.size() < 2 ) {
      throw std::runtime_error( "unset requires at least one key" );
    }
    cmd.keys.assign( rest.begin() + 1, rest.end() );
  }
  else if ( name == "cp" ) {
    cmd.kind = CommandKind::Copy;
    internal::parse_transfer_arguments( name, rest, cmd );
  }
  else if ( name == "mv" ) {
    cmd.kind = CommandKind::Move;
    internal::parse_transfer_arguments( name, rest, cmd );
  }
  else {
    std::ostringstream oss;
    oss << "unknown command '" << name << "' (try 'ym --help')";
    throw std::runtime_error( oss.str() );
  }

  return cmd;
}

inline std::string ym::usage_text() {
  return
    "ym: YAML search and format-preserving patch tool\n"
    "\n"
    "Usage:\n"
    "  ym grep [-R] PATTERN [FILE|DIR ...]   search key paths by regex\n"
    "                                        (reads stdin if no files given)\n"
    "  ym set FILE KEY=VALUE [KEY=VALUE ...]  set values at key paths\n"
    "  ym unset FILE KEY [KEY ...]            remove keys\n"
    "  ym cp FILE:KEY [FILE:KEY | FILE: | KEY]\n"
    "                                        copy a value\n"
    "  ym mv FILE:KEY [FILE:KEY | FILE: | KEY]\n"
    "                                        move a value\n"
    "  ym --help | --version\n"
    "\n"
    "Key paths are dotted, e.g. database.host\n";
}

inline void ym::run_grep( const Command& cmd, std::istream& in,
  std::ostream& out, std::ostream& err, size_t terminal_width )
{
  // Report a bad pattern before touching any input
  internal::compile_pattern( cmd.pattern );

  if ( cmd.paths.empty() ) {
    std::ostringstream ss;
    ss << in.rdbuf();
    const ordered_node doc = internal::parse_file_text( ss.str(), "<stdin>" );
    internal::print_matches( doc, cmd.pattern, "", out, terminal_width );
    return;
  }

  // A lone regular file is printed without its name
  std::error_code ec;
  const bool show_filename = !( cmd.paths.size() == 1
    && std::filesystem::is_regular_file(cmd.paths.front(), ec) );

  for ( const auto& p : cmd.paths ) {
    if ( std::filesystem::is_regular_file(p, ec) ) {
      internal::grep_file( p, cmd.pattern, show_filename, out,
        terminal_width );
    }
    else if ( std::filesystem::is_directory(p, ec) ) {
      internal::grep_directory( p, cmd.pattern, show_filename, out, err,
        terminal_width );
    }
    else {
      std::ostringstream oss;
      oss << "'" << p << "' is not a file or directory";
      throw std::runtime_error( oss.str() );
    }
  }
}

inline void ym::run_command( const Command& cmd, std::istream& in,
  std::ostream& out, std::ostream& err, size_t terminal_width )
{
  switch ( cmd.kind ) {
    case CommandKind::Help:
      out << usage_text();
      break;
    case CommandKind::Version:
      out << "ym " << VERSION << '\n';
      break;
    case CommandKind::Grep:
      run_grep( cmd, in, out, err, terminal_width );
      break;
    case CommandKind::Set:
      set_in_file( cmd.file, cmd.updates );
      break;
    case CommandKind::Unset:
      unset_in_file( cmd.file, cmd.keys );
      break;
    case CommandKind::Copy:
      copy_value( cmd.src_file, cmd.src_key, cmd.dst_file, cmd.dst_key );
      break;
    case CommandKind::Move:
      move_value( cmd.src_file, cmd.src_key, cmd.dst_file, cmd.dst_key );
      break;
  }
}
