#include "floe/options.hpp"

#include <stdexcept>

#include "floe/search.hpp"

namespace floe {
namespace {

std::uint8_t parse_depth(const std::string& option, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != value.size() || parsed < 1 || parsed > search::MAX_DEPTH) {
      throw std::out_of_range("depth out of range");
    }
    return static_cast<std::uint8_t>(parsed);
  } catch (...) {
    throw std::runtime_error("invalid value for '" + option + "' option");
  }
}

std::chrono::milliseconds parse_duration(const std::string& option, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const long long ms = std::stoll(value, &consumed);
    if (consumed != value.size() || ms < 0) {
      throw std::out_of_range("negative");
    }
    return std::chrono::milliseconds{ms};
  } catch (...) {
    throw std::runtime_error("invalid value for '" + option + "' option");
  }
}

PlacementRule parse_placement(const std::string& option, const std::string& value) {
  if (value == "single") {
    return PlacementRule::SingleFish;
  }
  if (value == "any") {
    return PlacementRule::AnyTile;
  }
  throw std::runtime_error("invalid value for '" + option + "' option");
}

} // namespace

Options parse_options(const std::vector<std::string>& args) {
  Options options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& option = args[i];

    if (option == "--quiet") {
      options.quiet = true;
      continue;
    }

    if (option == "--about") {
      options.about = true;
      continue;
    }

    if (option != "--movetime" && option != "--depth" && option != "--placement") {
      throw std::runtime_error("unknown option '" + option + "'");
    }

    if (i + 1 >= args.size()) {
      throw std::runtime_error("missing value for '" + option + "' option");
    }

    const std::string& value = args[++i];

    if (option == "--movetime") {
      options.movetime = parse_duration(option, value);
    } else if (option == "--depth") {
      options.depth = parse_depth(option, value);
    } else {
      options.placement = parse_placement(option, value);
    }
  }

  return options;
}

std::string usage(const std::string& program) {
  return "Usage: " + program +
         " [--movetime <ms>] [--depth <1-64>] [--placement single|any] [--quiet] [--about]";
}

} // namespace floe
