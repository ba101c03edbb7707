// ╻ ╻┏┳┓
// ┗┳┛┃┃┃
//  ╹ ╹ ╹
//  YAML search & format-preserving patch
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>

#include "ym.hh"
#include "ym_patch.hh"
#include "ym_path.hh"

namespace ym {

  // A YAML file held in memory as its parsed tree plus (when the file
  // existed) the text it was read from. Saving goes through the
  // format-preserving patcher so untouched lines keep their bytes.
  class Document {
  public:

    // Reads and parses file. Missing or unreadable files are errors.
    static Document load( const std::string& file );

    // Like load(), but a file that does not exist yields an empty mapping
    // with no original text
    static Document load_or_empty( const std::string& file );

    inline const std::string& file() const { return file_; }
    inline ordered_node& tree() { return tree_; }
    inline const ordered_node& tree() const { return tree_; }
    inline bool has_original_text() const { return text_.has_value(); }

    // Text that represents the current tree
    std::string render() const;

    // Write render() back to file()
    void save() const;

  private:
    Document( const std::string& file, const ordered_node& tree,
      const std::optional< std::string >& text );

    std::string file_;
    ordered_node tree_;
    std::optional< std::string > text_;
  };

  // Apply updates to file in order and save it
  void set_in_file( const std::string& file, const KeyUpdates& updates );

  // Remove keys from file and save it
  void unset_in_file( const std::string& file,
    const std::vector< std::string >& keys );

  // Copy the subtree at src_key in src_file to dst_key in dst_file. The
  // destination file is created if it does not exist yet.
  void copy_value( const std::string& src_file, const std::string& src_key,
    const std::string& dst_file, const std::string& dst_key );

  // copy_value() followed by removal of src_key from src_file
  void move_value( const std::string& src_file, const std::string& src_key,
    const std::string& dst_file, const std::string& dst_key );

namespace internal {

  inline std::string read_text_file( const std::string& file ) {
    std::ifstream in( file, std::ios::binary );
    if ( !in ) {
      std::ostringstream oss;
      oss << "Failed to read file '" << file << "': " << std::strerror( errno );
      throw std::runtime_error( oss.str() );
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if ( in.bad() ) {
      std::ostringstream oss;
      oss << "Failed to read file '" << file << "': " << std::strerror( errno );
      throw std::runtime_error( oss.str() );
    }
    return ss.str();
  }

  inline void write_text_file( const std::string& file,
    const std::string& text )
  {
    std::ofstream out( file, std::ios::binary | std::ios::trunc );
    if ( out ) {
      out << text;
      out.flush();
    }
    if ( !out ) {
      std::ostringstream oss;
      oss << "Failed to write file '" << file << "': " << std::strerror( errno );
      throw std::runtime_error( oss.str() );
    }
  }

  // parse_document() with the file name in the message
  inline ordered_node parse_file_text( const std::string& text,
    const std::string& file )
  {
    try {
      return ordered_node::deserialize( text );
    }
    catch ( const fkyaml::exception& ex ) {
      std::ostringstream oss;
      oss << "Failed to parse YAML in '" << file << "': " << ex.what();
      throw std::runtime_error( oss.str() );
    }
  }

} // namespace ym::internal

} // namespace ym

// Document member function definitions

inline ym::Document::Document( const std::string& file,
  const ordered_node& tree, const std::optional< std::string >& text )
  : file_( file ), tree_( tree ), text_( text ) {}

inline ym::Document ym::Document::load( const std::string& file ) {
  std::string text = internal::read_text_file( file );
  ordered_node tree = internal::parse_file_text( text, file );
  return Document( file, tree, text );
}

inline ym::Document ym::Document::load_or_empty( const std::string& file ) {
  std::error_code ec;
  if ( !std::filesystem::exists(file, ec) ) {
    return Document( file, ordered_node::mapping(), std::nullopt );
  }
  return load( file );
}

inline std::string ym::Document::render() const {
  if ( text_ ) return patch_document( *text_, tree_ );
  return serialize_document( tree_ );
}

inline void ym::Document::save() const {
  internal::write_text_file( file_, this->render() );
}

inline void ym::set_in_file( const std::string& file,
  const KeyUpdates& updates )
{
  Document doc = Document::load( file );
  set_values( doc.tree(), updates );
  doc.save();
}

inline void ym::unset_in_file( const std::string& file,
  const std::vector< std::string >& keys )
{
  Document doc = Document::load( file );
  unset_values( doc.tree(), keys );
  doc.save();
}

inline void ym::copy_value( const std::string& src_file,
  const std::string& src_key, const std::string& dst_file,
  const std::string& dst_key )
{
  const Document src = Document::load( src_file );

  std::optional< ordered_node > value = get_value( src.tree(), src_key );
  if ( !value ) {
    std::ostringstream oss;
    oss << "Key '" << src_key << "' not found in '" << src_file << "'";
    throw std::runtime_error( oss.str() );
  }

  Document dst = Document::load_or_empty( dst_file );
  set_value( dst.tree(), dst_key, *value );
  dst.save();
}

inline void ym::move_value( const std::string& src_file,
  const std::string& src_key, const std::string& dst_file,
  const std::string& dst_key )
{
  copy_value( src_file, src_key, dst_file, dst_key );

  // Reload: the destination may be the source file itself
  Document src = Document::load( src_file );
  unset_value( src.tree(), src_key );
  src.save();
}
