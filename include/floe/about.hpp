#pragma once

#include <ostream>
#include <string>

namespace floe {

std::string agent_name();
std::string agent_author();
std::string about_message();
void print_about(std::ostream& os);

} // namespace floe
