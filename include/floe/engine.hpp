#pragma once

#include <cstdint>

#include "floe/board.hpp"
#include "floe/move.hpp"
#include "floe/player.hpp"
#include "floe/search.hpp"

namespace floe {

// Engine façade that owns the one board of the game. The protocol layer feeds
// every move through it and asks it for decisions; search runs on a private
// copy so the game board never sees half-applied search moves.
class Engine {
public:
  Engine(Board board, Player me);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  [[nodiscard]] const Board& board() const noexcept { return board_; }
  [[nodiscard]] Player me() const noexcept { return me_; }

  // Apply a move to the game board, returning the fish it captured.
  std::uint8_t apply_move(const Move& mv, Player player);

  void finish_placement() noexcept { board_.finish_placement(); }

  [[nodiscard]] search::SearchResult search(const search::Limits& limits,
                                            search::Reporter& reporter) const;

private:
  Board board_;
  Player me_;
};

} // namespace floe
