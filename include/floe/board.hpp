#pragma once

// =============================================================================
// BOARD MODEL: Tiles, Penguins and Captured Fish
// =============================================================================
//
// The board answers two kinds of questions during search:
//
//   1. "What is on cell (r, c)?"   → tiles_, indexed by row * width + col
//   2. "Where are player p's penguins?" → penguins_, indexed by penguin id
//
// Both views are kept in sync by apply_move/undo_move. A tile stores its fish
// count and the id of the penguin standing on it (if any); a penguin stores
// its owner and cell. Penguin ids are handed out in placement order across all
// players, which is also how the judge numbers them.
//
// Fish accounting:
//   - Placing a penguin captures nothing; the tile keeps its fish.
//   - Sliding away from a tile captures that tile's fish and sinks it (fish 0).
//   - A tile with fish 0 is water: nothing can stand on it or slide across it.
//
// apply_move returns the fish captured by the move. undo_move needs that same
// value back, which lets search backtrack without copying the board.
//
// =============================================================================

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "floe/cell.hpp"
#include "floe/move.hpp"
#include "floe/player.hpp"

namespace floe {

// Raised when a move that the move generator would never produce is applied or
// undone. This is a bug in the caller, not bad input.
class InvalidMoveError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

using PenguinId = std::uint8_t;

inline constexpr std::uint8_t MAX_FISH = 3;
inline constexpr std::uint8_t MAX_PENGUINS_PER_PLAYER = 16;

// Which tiles a penguin may be placed on during the placement phase.
enum class PlacementRule : std::uint8_t {
  SingleFish, // only unoccupied tiles carrying exactly one fish
  AnyTile,    // any unoccupied tile with fish
};

struct Tile {
  std::uint8_t fish{0};
  std::optional<PenguinId> penguin{};

  friend bool operator==(const Tile&, const Tile&) = default;
};

struct Penguin {
  Player owner{0};
  Cell cell{};

  friend bool operator==(const Penguin&, const Penguin&) = default;
};

class Board {
public:
  Board(std::uint8_t width, std::uint8_t height, std::uint8_t players,
        std::uint8_t penguins_per_player, PlacementRule rule = PlacementRule::SingleFish);

  // Parse the text form (see board_text.cpp), throwing std::runtime_error on error.
  static Board from_text(std::string_view text, std::uint8_t players,
                         std::uint8_t penguins_per_player,
                         PlacementRule rule = PlacementRule::SingleFish);

  // Serialise the tiles and penguins back to text form.
  [[nodiscard]] std::string to_text() const;

  [[nodiscard]] std::uint8_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint8_t height() const noexcept { return height_; }
  [[nodiscard]] std::uint8_t players() const noexcept { return players_; }
  [[nodiscard]] std::uint8_t penguins_per_player() const noexcept { return penguins_per_player_; }
  [[nodiscard]] PlacementRule placement_rule() const noexcept { return rule_; }
  [[nodiscard]] std::size_t cell_count() const noexcept { return tiles_.size(); }

  [[nodiscard]] bool contains(Cell cell) const noexcept {
    return cell.row < height_ && cell.col < width_;
  }

  [[nodiscard]] const Tile& tile(Cell cell) const { return tiles_[cell.index(width_)]; }
  [[nodiscard]] std::uint8_t fish_at(Cell cell) const { return tile(cell).fish; }
  [[nodiscard]] std::optional<PenguinId> penguin_at(Cell cell) const { return tile(cell).penguin; }
  [[nodiscard]] std::optional<Player> occupant(Cell cell) const;

  // A cell a penguin can land on or slide across: fish left and nobody on it.
  [[nodiscard]] bool is_open(Cell cell) const {
    const auto& t = tile(cell);
    return t.fish > 0 && !t.penguin.has_value();
  }

  // Setup only: changing fish under a live game breaks undo.
  void set_fish(Cell cell, std::uint8_t fish);
  void set_captured(Player player, std::uint32_t fish);

  [[nodiscard]] const std::vector<Penguin>& penguins() const noexcept { return penguins_; }
  [[nodiscard]] std::vector<Cell> penguin_cells(Player player) const;
  [[nodiscard]] std::uint8_t placed_count(Player player) const noexcept;

  [[nodiscard]] std::uint32_t captured(Player player) const { return captured_[player]; }
  [[nodiscard]] std::uint32_t fish_on_board() const noexcept;

  // Placement lasts until every penguin is down or the judge closes it.
  [[nodiscard]] bool is_placement_phase() const noexcept {
    return !placement_closed_ && penguins_.size() < static_cast<std::size_t>(players_) *
                                                        penguins_per_player_;
  }
  void finish_placement() noexcept { placement_closed_ = true; }

  // Can `player` place on this cell under the board's placement rule?
  [[nodiscard]] bool is_placeable(Cell cell) const;

  // Apply a move for `player`, returning the fish it captured.
  // Throws InvalidMoveError if the move is not legal on this board.
  std::uint8_t apply_move(const Move& mv, Player player);

  // Reverse apply_move. `captured` must be the value apply_move returned.
  void undo_move(const Move& mv, Player player, std::uint8_t captured);

  // True when no player has any legal move left.
  [[nodiscard]] bool is_terminal() const;

  friend bool operator==(const Board&, const Board&) = default;

private:
  void check_player(Player player) const;
  void check_placement(const Move& mv, Player player) const;
  void check_slide(const Move& mv, Player player) const;

  Tile& tile_mut(Cell cell) { return tiles_[cell.index(width_)]; }

  std::uint8_t width_;
  std::uint8_t height_;
  std::uint8_t players_;
  std::uint8_t penguins_per_player_;
  PlacementRule rule_;
  bool placement_closed_{false};
  std::vector<Tile> tiles_;
  std::vector<Penguin> penguins_;
  std::array<std::uint32_t, MAX_PLAYERS> captured_{};
};

} // namespace floe
