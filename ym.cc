#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdlib>

#include "ym_cli.hh"

namespace {

  // Columns of the terminal on stdout, then $COLUMNS, then a fixed default
  size_t terminal_width() {
    struct winsize ws;
    if ( ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 ) {
      return ws.ws_col;
    }
    if ( const char* cols = std::getenv("COLUMNS") ) {
      char* end = nullptr;
      unsigned long w = std::strtoul( cols, &end, 10 );
      if ( end != cols && *end == '\0' && w > 0 ) return w;
    }
    return ym::internal::DEFAULT_TERMINAL_WIDTH;
  }

}

int main( int argc, char** argv ) {
  try {
    const std::vector< std::string > args( argv + 1, argv + argc );
    const ym::Command cmd = ym::parse_command_line( args );
    ym::run_command( cmd, std::cin, std::cout, std::cerr, terminal_width() );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[ym] error: " << ex.what() << "\n";
    return 1;
  }
}
