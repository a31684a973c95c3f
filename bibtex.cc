#include "bibtex.hh"

#include <getopt.h>

namespace {

  void print_usage( std::ostream& os ) {
    os << "Usage: bibtex [options] [file]\n"
      << "Reads a BibTeX file (or standard input) and writes it back out.\n\n"
      << "  -f, --format FMT  output format: text, yaml, json or xml"
      << " (default text)\n"
      << "  -r, --replace     replace and join string constants\n"
      << "  -c, --check       report validity and retained errors\n"
      << "  -m, --meta        keep text found between objects\n"
      << "  -v, --verbose     debug logging\n"
      << "  -h, --help        show this message\n";
  }

} // namespace

int main( int argc, char* argv[] ) {
  static struct option long_options[] = {
    { "format", required_argument, nullptr, 'f' },
    { "replace", no_argument, nullptr, 'r' },
    { "check", no_argument, nullptr, 'c' },
    { "meta", no_argument, nullptr, 'm' },
    { "verbose", no_argument, nullptr, 'v' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 }
  };

  std::string format = "text";
  bool replace = false, check = false;
  bibtex::ParseOptions options;
  bibtex::Logger log( std::cerr );

  int c;
  while ( (c = getopt_long(argc, argv, "f:rcmvh", long_options, nullptr))
    != -1 )
  {
    switch ( c ) {
      case 'f': format = optarg; break;
      case 'r': replace = true; break;
      case 'c': check = true; break;
      case 'm': options.include_meta_content = true; break;
      case 'v': log.set_level( bibtex::Logger::Level::Debug ); break;
      case 'h': print_usage( std::cout ); return 0;
      default: print_usage( std::cerr ); return 1;
    }
  }

  try {
    bibtex::Bibliography bib = ( optind < argc )
      ? bibtex::Bibliography::open( argv[optind], options, log )
      : bibtex::Parser( options, log ).parse( std::cin );

    if ( check ) {
      for ( const auto& err : bib.errors() ) {
        std::cout << err.message << "\n  " << err.content << '\n';
      }
      std::cout << ( bib.valid() ? "valid" : "invalid" ) << '\n';
      return bib.valid() ? 0 : 1;
    }

    if ( replace ) {
      bib.replace_strings();
      bib.join_strings();
    }

    if ( format == "text" ) std::cout << bib.to_s();
    else if ( format == "yaml" ) std::cout << bib.to_yaml();
    else if ( format == "json" ) std::cout << bib.to_json( 2 ) << '\n';
    else if ( format == "xml" ) std::cout << bib.to_xml_string();
    else throw std::invalid_argument( "Unknown output format '" + format
      + "'" );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[bibtex] error: " << ex.what() << "\n";
    return 1;
  }
}
