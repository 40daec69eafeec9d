#pragma once

// =============================================================================
// HEX GEOMETRY: Cells and Directions
// =============================================================================
//
// The ice floe is a rectangle of hexagonal tiles stored in axial coordinates.
// Every cell (r, c) touches six others:
//
//            (r-1,c-1)  (r-1,c)
//       (r,c-1)      (r,c)     (r,c+1)
//               (r+1,c)  (r+1,c+1)
//
// A penguin slides along one of these six lines. Keeping the grid axial means
// a straight line is just repeated addition of the same (drow, dcol) delta,
// with no odd/even row bookkeeping.
//
// =============================================================================

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace floe {

inline constexpr std::uint8_t MAX_DIMENSION = 64;

struct Direction {
  std::int8_t drow{0};
  std::int8_t dcol{0};

  friend constexpr bool operator==(const Direction&, const Direction&) = default;
};

// Fixed enumeration order: walks around the hexagon so consecutive directions
// are neighbours. Move generation and territory both depend on this order.
inline constexpr std::array<Direction, 6> DIRECTIONS = {{
    {-1, 0},  // up
    {0, 1},   // right
    {1, 1},   // down-right
    {1, 0},   // down
    {0, -1},  // left
    {-1, -1}, // up-left
}};

struct Cell {
  std::uint8_t row{0};
  std::uint8_t col{0};

  [[nodiscard]] constexpr std::size_t index(std::uint8_t width) const noexcept {
    return static_cast<std::size_t>(row) * width + col;
  }

  [[nodiscard]] static constexpr Cell from_index(std::size_t index, std::uint8_t width) noexcept {
    return Cell{static_cast<std::uint8_t>(index / width), static_cast<std::uint8_t>(index % width)};
  }

  /// Returns the neighbouring cell in the given direction, or nullopt when it
  /// falls off a width x height grid.
  [[nodiscard]] constexpr std::optional<Cell> step(Direction dir, std::uint8_t width,
                                                   std::uint8_t height) const noexcept {
    const int r = row + dir.drow;
    const int c = col + dir.dcol;
    if (r < 0 || c < 0 || r >= height || c >= width) {
      return std::nullopt;
    }
    return Cell{static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(c)};
  }

  /// Wire form used by the judge: "row col".
  [[nodiscard]] std::string to_string() const {
    return std::to_string(row) + ' ' + std::to_string(col);
  }

  friend constexpr auto operator<=>(const Cell&, const Cell&) = default;
};

inline std::ostream& operator<<(std::ostream& os, Cell cell) {
  return os << '(' << static_cast<int>(cell.row) << ", " << static_cast<int>(cell.col) << ')';
}

/// Returns the direction and distance that lead from `from` to `to` along one
/// straight hex line, or nullopt if the two cells are not aligned.
[[nodiscard]] constexpr std::optional<std::pair<Direction, std::uint8_t>> line_between(Cell from,
                                                                                       Cell to) {
  const int drow = to.row - from.row;
  const int dcol = to.col - from.col;

  if (drow == 0 && dcol == 0) {
    return std::nullopt;
  }

  int distance = 0;
  if (drow == 0) {
    distance = dcol < 0 ? -dcol : dcol;
  } else if (dcol == 0 || dcol == drow) {
    distance = drow < 0 ? -drow : drow;
  } else {
    return std::nullopt;
  }

  const Direction dir{static_cast<std::int8_t>(drow / distance),
                      static_cast<std::int8_t>(dcol / distance)};
  return std::make_pair(dir, static_cast<std::uint8_t>(distance));
}

} // namespace floe
