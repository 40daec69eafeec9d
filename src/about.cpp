#include "floe/about.hpp"

namespace floe {

std::string agent_name() {
  return "floe";
}

std::string agent_author() {
  return "the floe developers";
}

std::string about_message() {
  return agent_name() + " - Hey, That's My Fish! agent (author: " + agent_author() + ")";
}

void print_about(std::ostream& os) {
  os << about_message() << '\n';
}

} // namespace floe
