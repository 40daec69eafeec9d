// =============================================================================
// BOARD STATE AND MOVE EXECUTION
// =============================================================================
//
// This file handles the two operations search leans on:
//
// 1. APPLY/UNDO MOVES
//    Applying a move updates the tile table, the penguin table and the mover's
//    captured total together. Undoing restores exactly those fields, so search
//    can walk the whole tree on one board instance.
//
// 2. VALIDATION
//    Every applied move is checked against the rules before anything changes.
//    Search only ever applies generated moves, so a failed check means a bug
//    and surfaces as InvalidMoveError rather than a corrupted board.
//
// =============================================================================

#include "floe/board.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <string>

#include "floe/movegen.hpp"

namespace floe {

namespace {

[[nodiscard]] InvalidMoveError make_error(const Move& mv, Player player, const std::string& why) {
  std::ostringstream oss;
  oss << "invalid move " << mv << " for player " << static_cast<int>(player) << ": " << why;
  return InvalidMoveError(oss.str());
}

} // namespace

Board::Board(std::uint8_t width, std::uint8_t height, std::uint8_t players,
             std::uint8_t penguins_per_player, PlacementRule rule)
    : width_(width), height_(height), players_(players), penguins_per_player_(penguins_per_player),
      rule_(rule) {
  if (width == 0 || height == 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
    throw std::invalid_argument("board dimensions must be between 1 and " +
                                std::to_string(MAX_DIMENSION));
  }
  if (players < MIN_PLAYERS || players > MAX_PLAYERS) {
    throw std::invalid_argument("player count must be between " + std::to_string(MIN_PLAYERS) +
                                " and " + std::to_string(MAX_PLAYERS));
  }
  if (penguins_per_player == 0 || penguins_per_player > MAX_PENGUINS_PER_PLAYER) {
    throw std::invalid_argument("penguins per player must be between 1 and " +
                                std::to_string(MAX_PENGUINS_PER_PLAYER));
  }

  tiles_.resize(static_cast<std::size_t>(width) * height);
  penguins_.reserve(static_cast<std::size_t>(players) * penguins_per_player);
}

std::optional<Player> Board::occupant(Cell cell) const {
  const auto id = penguin_at(cell);
  if (!id.has_value()) {
    return std::nullopt;
  }
  return penguins_[*id].owner;
}

void Board::set_fish(Cell cell, std::uint8_t fish) {
  if (!contains(cell)) {
    throw std::out_of_range("cell outside the board");
  }
  if (fish > MAX_FISH) {
    throw std::invalid_argument("fish count must be between 0 and " + std::to_string(MAX_FISH));
  }
  tile_mut(cell).fish = fish;
}

void Board::set_captured(Player player, std::uint32_t fish) {
  check_player(player);
  captured_[player] = fish;
}

std::vector<Cell> Board::penguin_cells(Player player) const {
  std::vector<Cell> cells;
  for (const auto& penguin : penguins_) {
    if (penguin.owner == player) {
      cells.push_back(penguin.cell);
    }
  }
  std::ranges::sort(cells);
  return cells;
}

std::uint8_t Board::placed_count(Player player) const noexcept {
  return static_cast<std::uint8_t>(std::ranges::count_if(
      penguins_, [player](const Penguin& penguin) { return penguin.owner == player; }));
}

std::uint32_t Board::fish_on_board() const noexcept {
  return std::accumulate(tiles_.begin(), tiles_.end(), std::uint32_t{0},
                         [](std::uint32_t sum, const Tile& t) { return sum + t.fish; });
}

bool Board::is_placeable(Cell cell) const {
  if (!is_open(cell)) {
    return false;
  }
  return rule_ == PlacementRule::AnyTile || fish_at(cell) == 1;
}

void Board::check_player(Player player) const {
  if (player >= players_) {
    throw InvalidMoveError("unknown player " + std::to_string(player));
  }
}

void Board::check_placement(const Move& mv, Player player) const {
  if (!is_placement_phase()) {
    throw make_error(mv, player, "placement phase is over");
  }
  if (placed_count(player) >= penguins_per_player_) {
    throw make_error(mv, player, "no penguins left to place");
  }
  if (!contains(mv.to)) {
    throw make_error(mv, player, "cell outside the board");
  }
  if (!is_placeable(mv.to)) {
    throw make_error(mv, player, "tile cannot take a penguin");
  }
}

void Board::check_slide(const Move& mv, Player player) const {
  if (is_placement_phase()) {
    throw make_error(mv, player, "penguins cannot slide during placement");
  }
  if (!contains(*mv.from) || !contains(mv.to)) {
    throw make_error(mv, player, "cell outside the board");
  }
  if (occupant(*mv.from) != player) {
    throw make_error(mv, player, "no penguin of this player on the origin");
  }

  const auto line = line_between(*mv.from, mv.to);
  if (!line.has_value()) {
    throw make_error(mv, player, "origin and destination are not on one hex line");
  }

  // Every cell up to and including the destination must still carry fish and
  // be free of penguins.
  const auto [dir, distance] = *line;
  Cell cell = *mv.from;
  for (std::uint8_t step = 0; step < distance; ++step) {
    cell = *cell.step(dir, width_, height_);
    if (!is_open(cell)) {
      throw make_error(mv, player, "path is blocked");
    }
  }
}

// =============================================================================
// APPLY MOVE
// =============================================================================
// Placement: append a penguin and mark its tile. Nothing is captured.
// Slide:     the origin tile's fish go to the mover, the origin sinks, and the
//            penguin moves to the destination (whose fish stay put until it
//            leaves again).
// =============================================================================

std::uint8_t Board::apply_move(const Move& mv, Player player) {
  check_player(player);

  if (mv.is_placement()) {
    check_placement(mv, player);

    const auto id = static_cast<PenguinId>(penguins_.size());
    penguins_.push_back(Penguin{.owner = player, .cell = mv.to});
    tile_mut(mv.to).penguin = id;
    return 0;
  }

  check_slide(mv, player);

  Tile& origin = tile_mut(*mv.from);
  const PenguinId id = *origin.penguin;
  const std::uint8_t fish = origin.fish;

  origin.fish = 0;
  origin.penguin = std::nullopt;
  tile_mut(mv.to).penguin = id;
  penguins_[id].cell = mv.to;
  captured_[player] += fish;

  return fish;
}

void Board::undo_move(const Move& mv, Player player, std::uint8_t captured) {
  check_player(player);

  if (mv.is_placement()) {
    if (penguins_.empty() || penguins_.back() != Penguin{.owner = player, .cell = mv.to} ||
        captured != 0) {
      throw make_error(mv, player, "placement was not the last move applied");
    }
    penguins_.pop_back();
    tile_mut(mv.to).penguin = std::nullopt;
    return;
  }

  if (!contains(*mv.from) || !contains(mv.to)) {
    throw make_error(mv, player, "cell outside the board");
  }

  Tile& origin = tile_mut(*mv.from);
  Tile& destination = tile_mut(mv.to);

  if (occupant(mv.to) != player || origin.fish != 0 || origin.penguin.has_value()) {
    throw make_error(mv, player, "slide was not applied");
  }
  if (captured == 0 || captured > MAX_FISH || captured_[player] < captured) {
    throw make_error(mv, player, "captured fish does not match the slide");
  }

  const PenguinId id = *destination.penguin;
  destination.penguin = std::nullopt;
  origin.penguin = id;
  origin.fish = captured;
  penguins_[id].cell = *mv.from;
  captured_[player] -= captured;
}

bool Board::is_terminal() const {
  for (Player player = 0; player < players_; ++player) {
    if (has_legal_move(*this, player)) {
      return false;
    }
  }
  return true;
}

} // namespace floe
