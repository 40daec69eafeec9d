#pragma once

#include <optional>
#include <ostream>

#include "floe/cell.hpp"

namespace floe {

// A placement has no origin; a slide carries both ends of its straight line.
// Moves are plain values and never refer back to a board.
struct Move {
  std::optional<Cell> from{};
  Cell to{};

  [[nodiscard]] static constexpr Move placement(Cell cell) noexcept {
    return Move{.from = std::nullopt, .to = cell};
  }

  [[nodiscard]] static constexpr Move slide(Cell from, Cell to) noexcept {
    return Move{.from = from, .to = to};
  }

  [[nodiscard]] constexpr bool is_placement() const noexcept { return !from.has_value(); }
  [[nodiscard]] constexpr bool is_slide() const noexcept { return from.has_value(); }

  friend constexpr bool operator==(const Move&, const Move&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const Move& mv) {
  if (mv.is_placement()) {
    return os << "place " << mv.to;
  }
  return os << *mv.from << " -> " << mv.to;
}

} // namespace floe
