//  ┏┓ ╻┏┓ ╺┳╸┏━╸╻ ╻
//  ┣┻┓┃┣┻┓ ┃ ┣╸ ┏╋┛
//  ┗━┛╹┗━┛ ╹ ┗━╸╹ ╹
//  BibTeX document container, string resolver & exporters
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the bibtex contributors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// JSON for Modern C++
// https://github.com/nlohmann/json
#include <nlohmann/json.hpp>

// pugixml
// https://pugixml.org
#include <pugixml.hpp>

namespace bibtex {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map keeps entry fields in the order they were written
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  class Bibliography;
  class Entry;
  class StringConstant;
  class Parser;

  // The closed set of element variants held by a Bibliography
  enum class ElementType { Entry, String, Preamble, Comment, MetaComment };

  inline std::string to_string( ElementType type ) {
    switch ( type ) {
      case ElementType::Entry: return "entry";
      case ElementType::String: return "string";
      case ElementType::Preamble: return "preamble";
      case ElementType::Comment: return "comment";
      case ElementType::MetaComment: return "meta comment";
    }
    return "unknown";
  }

  // A symbolic reference to a string constant (a BibTeX macro)
  struct Reference {
    std::string name;
  };

  inline bool operator==( const Reference& a, const Reference& b ) {
    return a.name == b.name;
  }

  inline bool operator!=( const Reference& a, const Reference& b ) {
    return !( a == b );
  }

  // One piece of a Value: a literal string or a constant reference
  using Fragment = std::variant< std::string, Reference >;

  // Constant name -> definition, owned by the container's index
  using ConstantTable = std::unordered_map< std::string,
    std::shared_ptr< StringConstant > >;

  // A field value before (and after) resolution: an ordered sequence of
  // literal and reference fragments, concatenated with '#' in BibTeX source
  class Value {
  public:
    Value() = default;
    Value( const std::string& literal );
    Value( const char* literal );
    Value( const Reference& ref );
    explicit Value( std::vector< Fragment > fragments );

    Value& add( const Fragment& fragment );

    inline const std::vector< Fragment >& fragments() const
      { return fragments_; }
    inline bool empty() const { return fragments_.empty(); }
    inline std::size_t size() const { return fragments_.size(); }

    // Exactly one fragment
    inline bool is_atomic() const { return fragments_.size() == 1; }
    bool has_references() const;

    // Substitute every reference defined in the table with the fragments of
    // the constant's current value. Unknown references are left alone.
    void replace( const ConstantTable& constants );

    // Merge runs of adjacent literal fragments into a single literal
    void join();

    // Plain rendering: an atomic literal as-is, anything else as the BibTeX
    // concatenation "literal" # reference
    std::string to_s() const;

    // Source rendering. Atomic literals use the supplied delimiters.
    std::string to_bibtex( char open, char close ) const;

    bool operator==( const Value& other ) const;
    inline bool operator!=( const Value& other ) const
      { return !( *this == other ); }

  private:
    std::vector< Fragment > fragments_;
  };

namespace internal {

  // Names used by the exporters, collected in one place
  inline const std::string KEY = "key";
  inline const std::string TYPE = "type";
  inline const std::string ENTRY_TAG = "entry";
  inline const std::string ROOT_TAG = "bibliography";

  // Container-owned lookup tables. Elements register themselves here from
  // their attach hooks; the Bibliography never writes into it directly.
  struct Index {

    // normalized entry key -> entry (last registration wins)
    std::unordered_map< std::string, std::shared_ptr< Entry > > entries;

    // first-registration order of the keys in entries
    std::vector< std::string > entry_order;

    // constant name -> definition (last registration wins)
    ConstantTable constants;

    void register_entry( const std::shared_ptr< Entry >& entry );

    // Only drops the key while it still maps to the given entry
    void unregister_entry( const std::string& key, const Entry* entry );

    void register_constant( const std::shared_ptr< StringConstant >& str );
    void unregister_constant( const std::string& name,
      const StringConstant* str );

    std::vector< std::shared_ptr< Entry > > ordered_entries() const;

    void clear();
  };

} // namespace bibtex::internal

  // Capability exposed by elements whose values may contain references
  class Resolvable {
  public:
    virtual ~Resolvable() = default;
    virtual void replace( const ConstantTable& constants ) = 0;
    virtual void join() = 0;
  };

  // Base class of all document nodes. Elements are shared between the
  // container and user code; the back-reference to the owning Bibliography
  // is non-owning and managed exclusively by the container.
  class Element : public std::enable_shared_from_this< Element > {
  public:
    Element() = default;
    // Copies start out detached. Assignment would bypass the index, so
    // attached elements are changed through their setters only.
    Element( const Element& ) : std::enable_shared_from_this< Element >() {}
    Element& operator=( const Element& ) = delete;
    virtual ~Element() = default;

    virtual ElementType type() const = 0;

    // BibTeX source rendering
    virtual std::string to_s() const = 0;

    // Structural equality (same exact variant, same content)
    virtual bool equals( const Element& other ) const = 0;

    // nullptr for variants that cannot be resolved/joined
    inline virtual Resolvable* resolvable() { return nullptr; }

    inline Bibliography* bibliography() const { return bibliography_; }
    inline bool attached() const { return bibliography_ != nullptr; }

  protected:
    // Lifecycle hooks called by the container. The return value of the
    // attach hook is what the container stores.
    virtual std::shared_ptr< Element > added_to_bibliography(
      Bibliography& bib, internal::Index& index );
    virtual void removed_from_bibliography( Bibliography& bib,
      internal::Index& index );

    Bibliography* bibliography_ = nullptr;

    friend class Bibliography;
  };

  using element_ptr = std::shared_ptr< Element >;

  // A bibliographic record, e.g. @article{key, title = {...}}
  class Entry : public Element, public Resolvable {
  public:
    using field_list = std::vector< std::pair< std::string, Value > >;

    Entry( const std::string& key, const std::string& type );

    inline ElementType type() const override { return ElementType::Entry; }

    inline const std::string& key() const { return key_; }
    // Re-registers the entry when it belongs to a bibliography
    void set_key( const std::string& key );

    // Lower-case BibTeX type, e.g. "article"
    inline const std::string& type_name() const { return type_; }
    void set_type_name( const std::string& type );

    inline const field_list& fields() const { return fields_; }
    bool has_field( const std::string& name ) const;
    std::optional< Value > field( const std::string& name ) const;

    // Replaces an existing field in place, otherwise appends
    Entry& set_field( const std::string& name, const Value& value );
    bool remove_field( const std::string& name );

    // All fields required by the entry type are present
    bool valid() const;

    void replace( const ConstantTable& constants ) override;
    void join() override;
    inline Resolvable* resolvable() override { return this; }

    std::string to_s() const override;
    ordered_node to_hash() const;
    void to_xml( pugi::xml_node parent ) const;

    bool equals( const Element& other ) const override;

  protected:
    element_ptr added_to_bibliography( Bibliography& bib,
      internal::Index& index ) override;
    void removed_from_bibliography( Bibliography& bib,
      internal::Index& index ) override;

  private:
    std::string key_;
    std::string type_;
    field_list fields_;
  };

  // @string{ name = value }
  class StringConstant : public Element, public Resolvable {
  public:
    StringConstant( const std::string& name, const Value& value );

    inline ElementType type() const override { return ElementType::String; }

    inline const std::string& name() const { return name_; }
    inline const Value& value() const { return value_; }
    inline void set_value( const Value& value ) { value_ = value; }

    void replace( const ConstantTable& constants ) override;
    void join() override;
    inline Resolvable* resolvable() override { return this; }

    std::string to_s() const override;
    bool equals( const Element& other ) const override;

  protected:
    element_ptr added_to_bibliography( Bibliography& bib,
      internal::Index& index ) override;
    void removed_from_bibliography( Bibliography& bib,
      internal::Index& index ) override;

  private:
    std::string name_;
    Value value_;
  };

  // @preamble{ value }
  class Preamble : public Element, public Resolvable {
  public:
    explicit Preamble( const Value& value );

    inline ElementType type() const override
      { return ElementType::Preamble; }

    inline const Value& value() const { return value_; }
    inline void set_value( const Value& value ) { value_ = value; }

    void replace( const ConstantTable& constants ) override;
    void join() override;
    inline Resolvable* resolvable() override { return this; }

    std::string to_s() const override;
    bool equals( const Element& other ) const override;

  private:
    Value value_;
  };

  // @comment{ text }
  class Comment : public Element {
  public:
    explicit Comment( const std::string& text ) : text_( text ) {}

    inline ElementType type() const override { return ElementType::Comment; }
    inline const std::string& text() const { return text_; }

    std::string to_s() const override;
    bool equals( const Element& other ) const override;

  private:
    std::string text_;
  };

  // Free text found between BibTeX objects
  class MetaComment : public Element {
  public:
    explicit MetaComment( const std::string& text ) : text_( text ) {}

    inline ElementType type() const override
      { return ElementType::MetaComment; }
    inline const std::string& text() const { return text_; }

    std::string to_s() const override;
    bool equals( const Element& other ) const override;

  private:
    std::string text_;
  };

  // A source fragment that could not be parsed. Kept verbatim.
  struct ParseError {
    std::string content;
    std::size_t line = 0;
    std::string message;
  };

  // Minimal leveled logger writing "[bibtex] level: message" lines to a
  // stream. Passed explicitly to the parser and to Bibliography::open; a
  // default-constructed one (warnings on std::clog) is used otherwise.
  class Logger {
  public:
    enum class Level { Debug, Info, Warn, Error, Silent };

    explicit Logger( std::ostream& os = std::clog,
      Level threshold = Level::Warn ) : os_( &os ), threshold_( threshold ) {}

    inline Level level() const { return threshold_; }
    inline void set_level( Level threshold ) { threshold_ = threshold; }
    inline bool enabled( Level lv ) const
      { return lv != Level::Silent && lv >= threshold_; }

    void log( Level lv, const std::string& msg ) const;

    inline void debug( const std::string& msg ) const
      { log( Level::Debug, msg ); }
    inline void info( const std::string& msg ) const
      { log( Level::Info, msg ); }
    inline void warn( const std::string& msg ) const
      { log( Level::Warn, msg ); }
    inline void error( const std::string& msg ) const
      { log( Level::Error, msg ); }

  private:
    std::ostream* os_;
    Level threshold_;
  };

  struct ParseOptions {
    // Retain unparsable fragments in Bibliography::errors()
    bool include_errors = true;
    // Keep text found outside of BibTeX objects as MetaComment elements
    bool include_meta_content = false;
    // Trim white space at the edges of delimited literals
    bool strip = true;
  };

  struct ResolveOptions {
    // Exact element variants taking part in replace/join
    std::vector< ElementType > include = { ElementType::String,
      ElementType::Preamble, ElementType::Entry };
  };

  // An ordered collection of BibTeX elements, typically one .bib file
  class Bibliography {
  public:
    using iterator = std::vector< element_ptr >::const_iterator;

    // Read and parse the file at path. Parse problems are retained in
    // errors(); an unreadable file throws std::system_error.
    static Bibliography open( const std::string& path,
      const ParseOptions& options = ParseOptions(),
      const Logger& log = Logger() );

    Bibliography() = default;
    explicit Bibliography( const std::vector< element_ptr >& data );
    ~Bibliography();

    Bibliography( const Bibliography& ) = delete;
    Bibliography& operator=( const Bibliography& ) = delete;
    Bibliography( Bibliography&& other ) noexcept;
    Bibliography& operator=( Bibliography&& other ) noexcept;

    // Adding returns the bibliography for chaining. A null element, one that
    // already belongs to a bibliography (this one included), or a pointer
    // listed twice throws std::invalid_argument before anything is added.
    Bibliography& add( const element_ptr& element );
    Bibliography& add( const std::vector< element_ptr >& data );
    Bibliography& append( const element_ptr& element );
    inline Bibliography& operator<<( const element_ptr& element )
      { return append( element ); }

    // Removes the first element structurally equal to obj and returns it,
    // or nullptr if there is none
    element_ptr remove( const Element& obj );
    void remove_all();

    std::vector< element_ptr > preambles() const;
    std::vector< element_ptr > comments() const;
    std::vector< element_ptr > meta_comments() const;

    inline const std::vector< ParseError >& errors() const { return errors_; }
    inline bool has_errors() const { return !errors_.empty(); }
    void add_error( const ParseError& error );

    // No retained errors and every entry is valid
    bool valid() const;

    // Resolve references in element order. A constant's value is taken as
    // it is at the point of use; there is no second pass.
    void replace_strings( const ResolveOptions& options = ResolveOptions() );
    void join_strings( const ResolveOptions& options = ResolveOptions() );

    inline bool empty() const { return elements_.empty(); }
    inline std::size_t size() const { return elements_.size(); }
    inline const std::vector< element_ptr >& to_a() const { return elements_; }
    inline iterator begin() const { return elements_.begin(); }
    inline iterator end() const { return elements_.end(); }

    // Entry registered under key, or nullptr
    std::shared_ptr< Entry > operator[]( const std::string& key ) const;

    // Read-only views of the index: registered entries in key registration
    // order, and the string constants by (case-sensitive) name
    inline std::vector< std::shared_ptr< Entry > > entries() const
      { return index_.ordered_entries(); }
    inline const ConstantTable& constants() const { return index_.constants; }
    std::shared_ptr< StringConstant > constant( const std::string& name ) const;

    inline const std::optional< std::string >& path() const { return path_; }
    inline void set_path( const std::string& path ) { path_ = path; }

    void save() const;
    void save_to( const std::string& path );

    // Exporters. Only entries are included in the hash-based formats.
    std::string to_s() const;
    ordered_node to_hash() const;
    std::string to_yaml() const;
    std::string to_json( int indent = -1 ) const;
    std::unique_ptr< pugi::xml_document > to_xml() const;
    std::string to_xml_string() const;

  private:
    std::vector< element_ptr > elements_;
    internal::Index index_;
    std::vector< ParseError > errors_;
    std::optional< std::string > path_;

    std::vector< element_ptr > find_by_type( ElementType type ) const;
    std::vector< element_ptr > find_by_type(
      const std::vector< ElementType >& types ) const;

    // Linear scan over the indexed entries by their own keys
    std::shared_ptr< Entry > find_entry( const std::string& key ) const;

    // Called by Entry::set_key on an attached entry
    void rekey_entry( Entry& entry, const std::string& old_key );

    // Point the back-references of all held elements at this container
    void rebind_elements();
    void release_elements();

    friend class Entry;
  };

  // Reads BibTeX source text into a Bibliography. Each object is handed to
  // Bibliography::add once it has been read completely; malformed objects
  // are retained as ParseError fragments.
  class Parser {
  public:
    explicit Parser( const ParseOptions& options = ParseOptions(),
      const Logger& log = Logger() )
      : options_( options ), log_( log ) {}

    Bibliography parse( const std::string& text );
    Bibliography parse( std::istream& in );

  private:
    ParseOptions options_;
    Logger log_;

    struct Scanner;
  };

namespace internal {

  // Thrown by the scanner and caught by Parser::parse, which turns it into
  // a retained ParseError
  class SyntaxError : public std::runtime_error {
  public:
    SyntaxError( const std::string& msg, std::size_t line )
      : std::runtime_error( msg ), line_( line ) {}
    inline std::size_t line() const { return line_; }
  private:
    std::size_t line_;
  };

  inline std::string to_lower( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(), []( unsigned char c ) {
      return static_cast< char >( std::tolower(c) );
    } );
    return s;
  }

  inline bool is_space( char ch ) {
    return std::isspace( static_cast< unsigned char >(ch) ) != 0;
  }

  inline std::string trim( const std::string& s ) {
    std::size_t b = 0, e = s.size();
    while ( b < e && is_space(s[b]) ) ++b;
    while ( e > b && is_space(s[e - 1]) ) --e;
    return s.substr( b, e - b );
  }

  inline bool is_blank( const std::string& s ) {
    return std::all_of( s.begin(), s.end(), is_space );
  }

  // Entry keys are compared after trimming surrounding white space
  inline std::string normalize_key( const std::string& key ) {
    return trim( key );
  }

  // Characters allowed in entry types, keys, field and constant names
  inline bool is_name_char( char ch ) {
    if ( is_space(ch) ) return false;
    switch ( ch ) {
      case '{': case '}': case '(': case ')': case ',':
      case '=': case '#': case '"': case '%': case '@':
        return false;
      default: return true;
    }
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

  // Mirror an ordered_node tree as an insertion-ordered JSON value
  inline nlohmann::ordered_json to_json_value( const ordered_node& n ) {
    if ( n.is_mapping() ) {
      nlohmann::ordered_json obj = nlohmann::ordered_json::object();
      for ( const auto& [mk, mv] : n.map_items() ) {
        obj[ mk.get_value< std::string >() ] = to_json_value( mv );
      }
      return obj;
    }
    if ( n.is_sequence() ) {
      nlohmann::ordered_json arr = nlohmann::ordered_json::array();
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        arr.push_back( to_json_value(n.at( i )) );
      }
      return arr;
    }
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return to_native_checked< std::int64_t >( n );
    if ( n.is_boolean() ) return n.get_value< bool >();
    if ( n.is_float_number() ) return to_native_checked< double >( n );
    return nullptr;
  }

  // A literal inside "..." cannot contain a bare double quote, so such
  // literals fall back to braces
  inline std::string quote_literal( const std::string& s, char open,
    char close )
  {
    if ( open == '"' && s.find('"') != std::string::npos ) {
      return '{' + s + '}';
    }
    return open + s + close;
  }

  // Required fields by entry type. Each inner list is a set of
  // alternatives, at least one of which must be present.
  inline const std::vector< std::vector< std::string > >& required_fields(
    const std::string& type )
  {
    static const std::unordered_map< std::string,
      std::vector< std::vector< std::string > > > table = {
      { "article", { {"author"}, {"title"}, {"journal"}, {"year"} } },
      { "book", { {"author", "editor"}, {"title"}, {"publisher"},
        {"year"} } },
      { "booklet", { {"title"} } },
      { "conference", { {"author"}, {"title"}, {"booktitle"}, {"year"} } },
      { "inbook", { {"author", "editor"}, {"title"}, {"chapter", "pages"},
        {"publisher"}, {"year"} } },
      { "incollection", { {"author"}, {"title"}, {"booktitle"},
        {"publisher"}, {"year"} } },
      { "inproceedings", { {"author"}, {"title"}, {"booktitle"},
        {"year"} } },
      { "manual", { {"title"} } },
      { "mastersthesis", { {"author"}, {"title"}, {"school"}, {"year"} } },
      { "misc", {} },
      { "phdthesis", { {"author"}, {"title"}, {"school"}, {"year"} } },
      { "proceedings", { {"title"}, {"year"} } },
      { "techreport", { {"author"}, {"title"}, {"institution"},
        {"year"} } },
      { "unpublished", { {"author"}, {"title"}, {"note"} } }
    };
    static const std::vector< std::vector< std::string > > none;

    auto it = table.find( type );
    return it == table.end() ? none : it->second;
  }

} // namespace bibtex::internal

} // namespace bibtex

// Value member function definitions

inline bibtex::Value::Value( const std::string& literal )
  : fragments_{ Fragment(literal) } {}

inline bibtex::Value::Value( const char* literal )
  : fragments_{ Fragment(std::string(literal)) } {}

inline bibtex::Value::Value( const Reference& ref )
  : fragments_{ Fragment(ref) } {}

inline bibtex::Value::Value( std::vector< Fragment > fragments )
  : fragments_( std::move(fragments) ) {}

inline bibtex::Value& bibtex::Value::add( const Fragment& fragment ) {
  fragments_.push_back( fragment );
  return *this;
}

inline bool bibtex::Value::has_references() const {
  return std::any_of( fragments_.begin(), fragments_.end(),
    []( const Fragment& f ) { return std::holds_alternative< Reference >(f); } );
}

inline void bibtex::Value::replace( const ConstantTable& constants ) {
  if ( !has_references() ) return;

  // Build the result separately: a constant may refer to itself, in which
  // case its current value is read while it is being replaced
  std::vector< Fragment > out;
  out.reserve( fragments_.size() );
  for ( const auto& f : fragments_ ) {
    const Reference* ref = std::get_if< Reference >( &f );
    if ( !ref ) { out.push_back( f ); continue; }

    auto it = constants.find( ref->name );
    if ( it == constants.end() || !it->second ) {
      out.push_back( f );
      continue;
    }
    const auto& spliced = it->second->value().fragments();
    out.insert( out.end(), spliced.begin(), spliced.end() );
  }
  fragments_ = std::move( out );
}

inline void bibtex::Value::join() {
  std::vector< Fragment > out;
  out.reserve( fragments_.size() );
  for ( const auto& f : fragments_ ) {
    if ( !out.empty() && std::holds_alternative< std::string >(f)
      && std::holds_alternative< std::string >(out.back()) )
    {
      std::get< std::string >( out.back() ) += std::get< std::string >( f );
      continue;
    }
    out.push_back( f );
  }
  fragments_ = std::move( out );
}

inline std::string bibtex::Value::to_s() const {
  if ( is_atomic() ) {
    if ( const auto* s = std::get_if< std::string >(&fragments_.front()) ) {
      return *s;
    }
  }
  return to_bibtex( '"', '"' );
}

inline std::string bibtex::Value::to_bibtex( char open, char close ) const {
  if ( fragments_.empty() ) return std::string( 1, open ) + close;

  if ( is_atomic() ) {
    const Fragment& f = fragments_.front();
    if ( const auto* s = std::get_if< std::string >(&f) ) {
      return internal::quote_literal( *s, open, close );
    }
    return std::get< Reference >( f ).name;
  }

  std::ostringstream oss;
  for ( std::size_t i = 0; i < fragments_.size(); ++i ) {
    if ( i ) oss << " # ";
    const Fragment& f = fragments_[ i ];
    if ( const auto* s = std::get_if< std::string >(&f) ) {
      oss << internal::quote_literal( *s, '"', '"' );
    }
    else {
      oss << std::get< Reference >( f ).name;
    }
  }
  return oss.str();
}

inline bool bibtex::Value::operator==( const Value& other ) const {
  return fragments_ == other.fragments_;
}

// Index member function definitions

inline void bibtex::internal::Index::register_entry(
  const std::shared_ptr< Entry >& entry )
{
  const std::string& key = entry->key();
  if ( !entries.count(key) ) entry_order.push_back( key );
  entries[ key ] = entry;
}

inline void bibtex::internal::Index::unregister_entry(
  const std::string& key, const Entry* entry )
{
  auto it = entries.find( key );
  if ( it == entries.end() || it->second.get() != entry ) return;
  entries.erase( it );
  entry_order.erase( std::remove(entry_order.begin(), entry_order.end(), key),
    entry_order.end() );
}

inline void bibtex::internal::Index::register_constant(
  const std::shared_ptr< StringConstant >& str )
{
  constants[ str->name() ] = str;
}

inline void bibtex::internal::Index::unregister_constant(
  const std::string& name, const StringConstant* str )
{
  auto it = constants.find( name );
  if ( it != constants.end() && it->second.get() == str ) {
    constants.erase( it );
  }
}

inline std::vector< std::shared_ptr< bibtex::Entry > >
  bibtex::internal::Index::ordered_entries() const
{
  std::vector< std::shared_ptr< Entry > > out;
  out.reserve( entry_order.size() );
  for ( const auto& key : entry_order ) {
    auto it = entries.find( key );
    if ( it != entries.end() ) out.push_back( it->second );
  }
  return out;
}

inline void bibtex::internal::Index::clear() {
  entries.clear();
  entry_order.clear();
  constants.clear();
}

// Element member function definitions

inline bibtex::element_ptr bibtex::Element::added_to_bibliography(
  Bibliography& bib, internal::Index& /*index*/ )
{
  bibliography_ = &bib;
  return shared_from_this();
}

inline void bibtex::Element::removed_from_bibliography(
  Bibliography& /*bib*/, internal::Index& /*index*/ )
{
  bibliography_ = nullptr;
}

// Entry member function definitions

inline bibtex::Entry::Entry( const std::string& key, const std::string& type )
  : key_( internal::normalize_key(key) ), type_( internal::to_lower(type) ) {}

inline void bibtex::Entry::set_key( const std::string& key ) {
  const std::string normalized = internal::normalize_key( key );
  if ( normalized == key_ ) return;
  const std::string old_key = key_;
  key_ = normalized;
  if ( bibliography_ ) bibliography_->rekey_entry( *this, old_key );
}

inline void bibtex::Entry::set_type_name( const std::string& type ) {
  type_ = internal::to_lower( type );
}

inline bool bibtex::Entry::has_field( const std::string& name ) const {
  return field( name ).has_value();
}

inline std::optional< bibtex::Value > bibtex::Entry::field(
  const std::string& name ) const
{
  const std::string k = internal::to_lower( name );
  for ( const auto& [fname, fvalue] : fields_ ) {
    if ( fname == k ) return fvalue;
  }
  return std::nullopt;
}

inline bibtex::Entry& bibtex::Entry::set_field( const std::string& name,
  const Value& value )
{
  const std::string k = internal::to_lower( name );
  for ( auto& [fname, fvalue] : fields_ ) {
    if ( fname == k ) { fvalue = value; return *this; }
  }
  fields_.emplace_back( k, value );
  return *this;
}

inline bool bibtex::Entry::remove_field( const std::string& name ) {
  const std::string k = internal::to_lower( name );
  auto it = std::find_if( fields_.begin(), fields_.end(),
    [&]( const auto& kv ) { return kv.first == k; } );
  if ( it == fields_.end() ) return false;
  fields_.erase( it );
  return true;
}

inline bool bibtex::Entry::valid() const {
  if ( key_.empty() ) return false;
  for ( const auto& alternatives : internal::required_fields(type_) ) {
    bool present = std::any_of( alternatives.begin(), alternatives.end(),
      [&]( const std::string& f ) { return has_field( f ); } );
    if ( !present ) return false;
  }
  return true;
}

inline void bibtex::Entry::replace( const ConstantTable& constants ) {
  for ( auto& kv : fields_ ) kv.second.replace( constants );
}

inline void bibtex::Entry::join() {
  for ( auto& kv : fields_ ) kv.second.join();
}

inline std::string bibtex::Entry::to_s() const {
  std::ostringstream oss;
  oss << '@' << type_ << '{' << key_;
  for ( const auto& [fname, fvalue] : fields_ ) {
    oss << ",\n  " << fname << " = " << fvalue.to_bibtex( '{', '}' );
  }
  oss << "\n}\n";
  return oss.str();
}

inline bibtex::ordered_node bibtex::Entry::to_hash() const {
  ordered_node hash = ordered_node::mapping();
  hash[ internal::KEY ] = internal::make_node_from( key_ );
  hash[ internal::TYPE ] = internal::make_node_from( type_ );
  for ( const auto& [fname, fvalue] : fields_ ) {
    hash[ fname ] = internal::make_node_from( fvalue.to_s() );
  }
  return hash;
}

inline void bibtex::Entry::to_xml( pugi::xml_node parent ) const {
  pugi::xml_node node = parent.append_child( internal::ENTRY_TAG.c_str() );
  node.append_attribute( internal::KEY.c_str() ) = key_.c_str();
  node.append_attribute( internal::TYPE.c_str() ) = type_.c_str();
  for ( const auto& [fname, fvalue] : fields_ ) {
    pugi::xml_node f = node.append_child( fname.c_str() );
    f.append_child( pugi::node_pcdata ).set_value( fvalue.to_s().c_str() );
  }
}

inline bool bibtex::Entry::equals( const Element& other ) const {
  if ( other.type() != ElementType::Entry ) return false;
  const auto& e = static_cast< const Entry& >( other );
  return key_ == e.key_ && type_ == e.type_ && fields_ == e.fields_;
}

inline bibtex::element_ptr bibtex::Entry::added_to_bibliography(
  Bibliography& bib, internal::Index& index )
{
  element_ptr self = Element::added_to_bibliography( bib, index );
  index.register_entry( std::static_pointer_cast< Entry >(self) );
  return self;
}

inline void bibtex::Entry::removed_from_bibliography( Bibliography& bib,
  internal::Index& index )
{
  index.unregister_entry( key_, this );
  Element::removed_from_bibliography( bib, index );
}

// StringConstant member function definitions

inline bibtex::StringConstant::StringConstant( const std::string& name,
  const Value& value ) : name_( internal::trim(name) ), value_( value ) {}

inline void bibtex::StringConstant::replace( const ConstantTable& constants ) {
  value_.replace( constants );
}

inline void bibtex::StringConstant::join() {
  value_.join();
}

inline std::string bibtex::StringConstant::to_s() const {
  return "@string{ " + name_ + " = " + value_.to_bibtex( '"', '"' ) + " }\n";
}

inline bool bibtex::StringConstant::equals( const Element& other ) const {
  if ( other.type() != ElementType::String ) return false;
  const auto& s = static_cast< const StringConstant& >( other );
  return name_ == s.name_ && value_ == s.value_;
}

inline bibtex::element_ptr bibtex::StringConstant::added_to_bibliography(
  Bibliography& bib, internal::Index& index )
{
  element_ptr self = Element::added_to_bibliography( bib, index );
  index.register_constant( std::static_pointer_cast< StringConstant >(self) );
  return self;
}

inline void bibtex::StringConstant::removed_from_bibliography(
  Bibliography& bib, internal::Index& index )
{
  index.unregister_constant( name_, this );
  Element::removed_from_bibliography( bib, index );
}

// Preamble, Comment and MetaComment member function definitions

inline bibtex::Preamble::Preamble( const Value& value ) : value_( value ) {}

inline void bibtex::Preamble::replace( const ConstantTable& constants ) {
  value_.replace( constants );
}

inline void bibtex::Preamble::join() {
  value_.join();
}

inline std::string bibtex::Preamble::to_s() const {
  return "@preamble{ " + value_.to_bibtex( '"', '"' ) + " }\n";
}

inline bool bibtex::Preamble::equals( const Element& other ) const {
  return other.type() == ElementType::Preamble
    && value_ == static_cast< const Preamble& >( other ).value_;
}

inline std::string bibtex::Comment::to_s() const {
  return "@comment{ " + text_ + " }\n";
}

inline bool bibtex::Comment::equals( const Element& other ) const {
  return other.type() == ElementType::Comment
    && text_ == static_cast< const Comment& >( other ).text_;
}

inline std::string bibtex::MetaComment::to_s() const {
  return text_;
}

inline bool bibtex::MetaComment::equals( const Element& other ) const {
  return other.type() == ElementType::MetaComment
    && text_ == static_cast< const MetaComment& >( other ).text_;
}

// Logger member function definitions

inline void bibtex::Logger::log( Level lv, const std::string& msg ) const {
  if ( !enabled(lv) ) return;
  const char* label = "error";
  switch ( lv ) {
    case Level::Debug: label = "debug"; break;
    case Level::Info: label = "info"; break;
    case Level::Warn: label = "warn"; break;
    default: break;
  }
  *os_ << "[bibtex] " << label << ": " << msg << '\n';
}

// Bibliography member function definitions

inline bibtex::Bibliography::Bibliography(
  const std::vector< element_ptr >& data )
{
  this->add( data );
}

inline bibtex::Bibliography::~Bibliography() {
  this->release_elements();
}

inline bibtex::Bibliography::Bibliography( Bibliography&& other ) noexcept
  : elements_( std::move(other.elements_) ),
    index_( std::move(other.index_) ),
    errors_( std::move(other.errors_) ),
    path_( std::move(other.path_) )
{
  other.elements_.clear();
  other.index_.clear();
  this->rebind_elements();
}

inline bibtex::Bibliography& bibtex::Bibliography::operator=(
  Bibliography&& other ) noexcept
{
  if ( this == &other ) return *this;
  this->release_elements();
  elements_ = std::move( other.elements_ );
  index_ = std::move( other.index_ );
  errors_ = std::move( other.errors_ );
  path_ = std::move( other.path_ );
  other.elements_.clear();
  other.index_.clear();
  this->rebind_elements();
  return *this;
}

inline void bibtex::Bibliography::rebind_elements() {
  for ( auto& e : elements_ ) e->bibliography_ = this;
}

// Clear back-references without touching the index; used when the
// container goes away
inline void bibtex::Bibliography::release_elements() {
  for ( auto& e : elements_ ) {
    if ( e->bibliography_ == this ) e->bibliography_ = nullptr;
  }
}

inline bibtex::Bibliography& bibtex::Bibliography::add(
  const element_ptr& element )
{
  return this->append( element );
}

inline bibtex::Bibliography& bibtex::Bibliography::add(
  const std::vector< element_ptr >& data )
{
  // Check every item first so that a bad collection adds nothing
  for ( std::size_t i = 0; i < data.size(); ++i ) {
    const element_ptr& e = data[ i ];
    if ( !e ) {
      std::ostringstream oss;
      oss << "Bibliography::add expected a list of elements; item " << i
        << " is null";
      throw std::invalid_argument( oss.str() );
    }
    if ( e->bibliography_ ) {
      std::ostringstream oss;
      oss << "Bibliography::add item " << i << " (" << to_string( e->type() )
        << ") already belongs to a bibliography";
      throw std::invalid_argument( oss.str() );
    }
    if ( std::find(data.begin(), data.begin() + i, e) != data.begin() + i ) {
      std::ostringstream oss;
      oss << "Bibliography::add item " << i << " (" << to_string( e->type() )
        << ") appears more than once";
      throw std::invalid_argument( oss.str() );
    }
  }
  for ( const auto& e : data ) this->append( e );
  return *this;
}

inline bibtex::Bibliography& bibtex::Bibliography::append(
  const element_ptr& element )
{
  if ( !element ) {
    throw std::invalid_argument( "A Bibliography can contain only elements;"
      " was: null" );
  }
  if ( element->bibliography_ ) {
    throw std::invalid_argument( "Cannot add " + to_string( element->type() )
      + ": it already belongs to a bibliography" );
  }
  elements_.push_back( element->added_to_bibliography(*this, index_) );
  return *this;
}

inline bibtex::element_ptr bibtex::Bibliography::remove( const Element& obj ) {
  auto it = std::find_if( elements_.begin(), elements_.end(),
    [&]( const element_ptr& e ) { return e->equals( obj ); } );
  if ( it == elements_.end() ) return nullptr;

  element_ptr removed = *it;
  removed->removed_from_bibliography( *this, index_ );
  elements_.erase( it );
  return removed;
}

inline void bibtex::Bibliography::remove_all() {
  for ( auto& e : elements_ ) e->removed_from_bibliography( *this, index_ );
  elements_.clear();
  index_.clear();
}

inline std::vector< bibtex::element_ptr >
  bibtex::Bibliography::preambles() const
{
  return find_by_type( ElementType::Preamble );
}

inline std::vector< bibtex::element_ptr >
  bibtex::Bibliography::comments() const
{
  return find_by_type( ElementType::Comment );
}

inline std::vector< bibtex::element_ptr >
  bibtex::Bibliography::meta_comments() const
{
  return find_by_type( ElementType::MetaComment );
}

inline void bibtex::Bibliography::add_error( const ParseError& error ) {
  errors_.push_back( error );
}

inline bool bibtex::Bibliography::valid() const {
  if ( has_errors() ) return false;
  for ( const auto& e : find_by_type(ElementType::Entry) ) {
    if ( !static_cast< const Entry& >( *e ).valid() ) return false;
  }
  return true;
}

inline void bibtex::Bibliography::replace_strings(
  const ResolveOptions& options )
{
  for ( const auto& e : find_by_type(options.include) ) {
    if ( Resolvable* r = e->resolvable() ) r->replace( index_.constants );
  }
}

inline void bibtex::Bibliography::join_strings( const ResolveOptions& options )
{
  for ( const auto& e : find_by_type(options.include) ) {
    if ( Resolvable* r = e->resolvable() ) r->join();
  }
}

inline std::shared_ptr< bibtex::Entry > bibtex::Bibliography::operator[](
  const std::string& key ) const
{
  const std::string normalized = internal::normalize_key( key );
  auto it = index_.entries.find( normalized );
  if ( it == index_.entries.end() ) return nullptr;
  if ( it->second->key() == normalized ) return it->second;
  return find_entry( normalized );
}

inline void bibtex::Bibliography::save() const {
  if ( !path_ ) {
    throw std::logic_error( "Bibliography::save called without a path;"
      " use save_to" );
  }
  std::ofstream out( *path_, std::ios::binary | std::ios::trunc );
  if ( !out ) {
    throw std::system_error( errno, std::generic_category(),
      "Unable to write '" + *path_ + "'" );
  }
  out << to_s();
  out.flush();
  if ( !out ) {
    throw std::system_error( errno, std::generic_category(),
      "Error while writing '" + *path_ + "'" );
  }
}

inline void bibtex::Bibliography::save_to( const std::string& path ) {
  path_ = path;
  this->save();
}

inline std::string bibtex::Bibliography::to_s() const {
  std::string out;
  for ( const auto& e : elements_ ) out += e->to_s();
  return out;
}

inline bibtex::ordered_node bibtex::Bibliography::to_hash() const {
  std::vector< ordered_node > items;
  for ( const auto& e : index_.ordered_entries() ) {
    items.push_back( e->to_hash() );
  }
  return internal::make_node_from( items );
}

inline std::string bibtex::Bibliography::to_yaml() const {
  return ordered_node::serialize( to_hash() );
}

inline std::string bibtex::Bibliography::to_json( int indent ) const {
  return internal::to_json_value( to_hash() ).dump( indent );
}

inline std::unique_ptr< pugi::xml_document >
  bibtex::Bibliography::to_xml() const
{
  auto doc = std::make_unique< pugi::xml_document >();
  pugi::xml_node decl = doc->append_child( pugi::node_declaration );
  decl.append_attribute( "version" ) = "1.0";
  decl.append_attribute( "encoding" ) = "UTF-8";

  pugi::xml_node root = doc->append_child( internal::ROOT_TAG.c_str() );
  for ( const auto& e : index_.ordered_entries() ) e->to_xml( root );
  return doc;
}

inline std::string bibtex::Bibliography::to_xml_string() const {
  std::ostringstream oss;
  to_xml()->save( oss, "  " );
  return oss.str();
}

inline std::vector< bibtex::element_ptr > bibtex::Bibliography::find_by_type(
  ElementType type ) const
{
  return find_by_type( std::vector< ElementType >{ type } );
}

// Exact variant match; order is that of the bibliography
inline std::vector< bibtex::element_ptr > bibtex::Bibliography::find_by_type(
  const std::vector< ElementType >& types ) const
{
  std::vector< element_ptr > out;
  for ( const auto& e : elements_ ) {
    if ( std::find(types.begin(), types.end(), e->type()) != types.end() ) {
      out.push_back( e );
    }
  }
  return out;
}

inline std::shared_ptr< bibtex::StringConstant >
  bibtex::Bibliography::constant( const std::string& name ) const
{
  auto it = index_.constants.find( name );
  if ( it == index_.constants.end() ) return nullptr;
  return it->second;
}

inline std::shared_ptr< bibtex::Entry > bibtex::Bibliography::find_entry(
  const std::string& key ) const
{
  const std::string normalized = internal::normalize_key( key );
  for ( const auto& [k, entry] : index_.entries ) {
    if ( entry->key() == normalized ) return entry;
  }
  return nullptr;
}

inline void bibtex::Bibliography::rekey_entry( Entry& entry,
  const std::string& old_key )
{
  index_.unregister_entry( old_key, &entry );
  index_.register_entry(
    std::static_pointer_cast< Entry >( entry.shared_from_this() ) );
}

// Parser member function definitions

// Cursor over the source text. Throws internal::SyntaxError on malformed
// input; Parser::parse decides what to do with it.
struct bibtex::Parser::Scanner {

  const std::string& text;
  const ParseOptions& options;
  std::size_t pos = 0;

  // Offsets of every '\n' in text, for line lookups
  std::vector< std::size_t > newlines;

  Scanner( const std::string& t, const ParseOptions& o )
    : text( t ), options( o )
  {
    for ( std::size_t i = 0; i < text.size(); ++i ) {
      if ( text[i] == '\n' ) newlines.push_back( i );
    }
  }

  std::size_t line_at( std::size_t offset ) const {
    return 1 + static_cast< std::size_t >( std::lower_bound(
      newlines.begin(), newlines.end(), offset ) - newlines.begin() );
  }

  [[noreturn]] void throw_error_at( const std::string& msg ) const {
    throw internal::SyntaxError( msg, line_at(pos) );
  }

  bool eof() const { return pos >= text.size(); }

  char peek() const {
    if ( eof() ) throw_error_at( "unexpected end of input" );
    return text[ pos ];
  }

  void skip_ws() {
    while ( !eof() && internal::is_space(text[pos]) ) ++pos;
  }

  void expect( char ch ) {
    skip_ws();
    if ( peek() != ch ) {
      std::ostringstream oss;
      oss << "expected '" << ch << "' but found '" << text[ pos ] << "'";
      throw_error_at( oss.str() );
    }
    ++pos;
  }

  std::string read_name() {
    skip_ws();
    std::size_t start = pos;
    while ( !eof() && internal::is_name_char(text[pos]) ) ++pos;
    return text.substr( start, pos - start );
  }

  // Content of a {...} group; pos is on the opening brace
  std::string read_braced() {
    std::size_t start = ++pos;
    int depth = 1;
    while ( true ) {
      char c = peek();
      if ( c == '{' ) ++depth;
      else if ( c == '}' && --depth == 0 ) break;
      ++pos;
    }
    std::string s = text.substr( start, pos - start );
    ++pos;
    return s;
  }

  // Content of a "..." string; double quotes nested in braces do not end it
  std::string read_quoted() {
    std::size_t start = ++pos;
    int depth = 0;
    while ( true ) {
      char c = peek();
      if ( c == '{' ) ++depth;
      else if ( c == '}' ) --depth;
      else if ( c == '"' && depth <= 0 ) break;
      ++pos;
    }
    std::string s = text.substr( start, pos - start );
    ++pos;
    return s;
  }

  Fragment read_fragment() {
    skip_ws();
    char c = peek();
    if ( c == '{' || c == '"' ) {
      if ( c == '{' ) return read_braced();
      return read_quoted();
    }
    if ( std::isdigit(static_cast< unsigned char >(c)) ) {
      std::size_t start = pos;
      while ( !eof() && std::isdigit(static_cast< unsigned char >(text[pos])) ) {
        ++pos;
      }
      return text.substr( start, pos - start );
    }
    if ( internal::is_name_char(c) ) return Reference{ read_name() };

    std::ostringstream oss;
    oss << "unexpected character '" << c << "' in value";
    throw_error_at( oss.str() );
  }

  // Fragments joined by '#'. Only a value made of a single literal is
  // stripped; the pieces of a concatenation keep their white space.
  Value read_value() {
    std::vector< Fragment > fragments;
    while ( true ) {
      fragments.push_back( read_fragment() );
      skip_ws();
      if ( !eof() && text[pos] == '#' ) { ++pos; continue; }
      break;
    }
    if ( options.strip && fragments.size() == 1 ) {
      if ( auto* s = std::get_if< std::string >(&fragments.front()) ) {
        *s = internal::trim( *s );
      }
    }
    return Value( fragments );
  }

  // Body of @comment, up to the matching closing delimiter
  std::string read_comment_body( char open, char close ) {
    std::size_t start = pos;
    int depth = 1;
    while ( true ) {
      char c = peek();
      if ( c == open ) ++depth;
      else if ( c == close && --depth == 0 ) break;
      ++pos;
    }
    std::string s = text.substr( start, pos - start );
    ++pos;
    return s;
  }

  // pos is on '@'. Returns the element read, fully formed.
  element_ptr read_object() {
    ++pos;
    const std::string type = internal::to_lower( read_name() );
    if ( type.empty() ) throw_error_at( "expected an object type after '@'" );

    skip_ws();
    const char open = peek();
    if ( open != '{' && open != '(' ) {
      throw_error_at( "expected '{' or '(' after @" + type );
    }
    const char close = ( open == '{' ) ? '}' : ')';
    ++pos;

    if ( type == "comment" ) {
      return std::make_shared< Comment >(
        internal::trim( read_comment_body(open, close) ) );
    }

    if ( type == "preamble" ) {
      Value v = read_value();
      expect( close );
      return std::make_shared< Preamble >( v );
    }

    if ( type == "string" ) {
      const std::string name = read_name();
      if ( name.empty() ) throw_error_at( "expected a string constant name" );
      expect( '=' );
      Value v = read_value();
      expect( close );
      return std::make_shared< StringConstant >( name, v );
    }

    // Regular entry
    skip_ws();
    std::size_t key_start = pos;
    while ( !eof() && text[pos] != ',' && text[pos] != close
      && !internal::is_space(text[pos]) ) ++pos;
    const std::string key = text.substr( key_start, pos - key_start );
    if ( key.empty() ) throw_error_at( "missing citation key in @" + type );

    auto entry = std::make_shared< Entry >( key, type );
    while ( true ) {
      skip_ws();
      if ( peek() == close ) break;
      expect( ',' );
      skip_ws();
      if ( peek() == close ) break;

      const std::string fname = read_name();
      if ( fname.empty() ) {
        throw_error_at( "expected a field name in entry '" + key + "'" );
      }
      expect( '=' );
      entry->set_field( fname, read_value() );
    }
    ++pos;
    return entry;
  }

  // Start of the next object on a later line: an '@' preceded only by white
  // space on its line
  std::size_t next_object_start( std::size_t from ) const {
    for ( std::size_t i = from; i < text.size(); ++i ) {
      if ( text[i] != '@' ) continue;
      std::size_t j = i;
      while ( j > 0 && (text[j - 1] == ' ' || text[j - 1] == '\t') ) --j;
      if ( j > 0 && text[j - 1] == '\n' ) return i;
    }
    return text.size();
  }
};

inline bibtex::Bibliography bibtex::Parser::parse( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->parse( ss.str() );
}

inline bibtex::Bibliography bibtex::Parser::parse( const std::string& text ) {
  Bibliography bib;
  Scanner sc( text, options_ );

  while ( !sc.eof() ) {
    std::size_t at = text.find( '@', sc.pos );
    const std::size_t meta_end = ( at == std::string::npos ) ? text.size() : at;

    // Everything between objects is meta content
    if ( options_.include_meta_content && meta_end > sc.pos ) {
      std::string meta = text.substr( sc.pos, meta_end - sc.pos );
      if ( !internal::is_blank(meta) ) {
        bib.add( std::make_shared< MetaComment >(meta) );
      }
    }
    if ( at == std::string::npos ) break;

    sc.pos = at;
    try {
      bib.add( sc.read_object() );
    }
    catch ( const internal::SyntaxError& err ) {
      const std::size_t end = sc.next_object_start( at + 1 );
      ParseError pe;
      pe.content = text.substr( at, end - at );
      while ( !pe.content.empty() && internal::is_space(pe.content.back()) ) {
        pe.content.pop_back();
      }
      pe.line = sc.line_at( at );
      std::ostringstream oss;
      oss << "line " << err.line() << ": " << err.what();
      pe.message = oss.str();

      log_.warn( "skipping malformed object at line "
        + std::to_string( pe.line ) + " (" + pe.message + ")" );
      if ( options_.include_errors ) bib.add_error( pe );
      sc.pos = end;
    }
  }

  log_.debug( "Parsed " + std::to_string( bib.size() ) + " element(s), "
    + std::to_string( bib.errors().size() ) + " error(s)" );
  return bib;
}

inline bibtex::Bibliography bibtex::Bibliography::open(
  const std::string& path, const ParseOptions& options, const Logger& log )
{
  log.debug( "Opening file " + path );
  std::ifstream in( path, std::ios::binary );
  if ( !in ) {
    throw std::system_error( errno, std::generic_category(),
      "Unable to read '" + path + "'" );
  }
  Bibliography bib = Parser( options, log ).parse( in );
  bib.set_path( path );
  return bib;
}
