#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "floe/about.hpp"
#include "floe/board.hpp"
#include "floe/options.hpp"
#include "floe/protocol.hpp"

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "floe";
  const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  floe::Options options;
  try {
    options = floe::parse_options(args);
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << '\n' << floe::usage(program) << '\n';
    return floe::protocol::EXIT_PROTOCOL_ERROR;
  }

  if (options.about) {
    floe::print_about(std::cout);
    return 0;
  }

  std::ostream* log = options.quiet ? nullptr : &std::cerr;
  if (log != nullptr) {
    *log << floe::about_message() << '\n';
  }

  try {
    floe::protocol::run_loop(std::cin, std::cout, log, options);
  } catch (const floe::protocol::ProtocolError& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    return floe::protocol::EXIT_PROTOCOL_ERROR;
  } catch (const floe::InvalidMoveError& ex) {
    std::cerr << "error: internal: " << ex.what() << '\n';
    return floe::protocol::EXIT_INTERNAL_ERROR;
  } catch (const std::exception& ex) {
    std::cerr << "error: internal: " << ex.what() << '\n';
    return floe::protocol::EXIT_INTERNAL_ERROR;
  }

  return 0;
}
