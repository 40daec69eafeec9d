#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "floe/board.hpp"

namespace floe {

inline constexpr std::chrono::milliseconds DEFAULT_MOVETIME{1000};

struct Options {
  std::chrono::milliseconds movetime{DEFAULT_MOVETIME};
  std::optional<std::uint8_t> depth{};
  PlacementRule placement{PlacementRule::SingleFish};
  bool quiet{false};
  bool about{false};
};

// Parse command line arguments (without the program name), throwing
// std::runtime_error on unknown options or bad values.
Options parse_options(const std::vector<std::string>& args);

std::string usage(const std::string& program);

} // namespace floe
