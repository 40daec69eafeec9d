// =============================================================================
// MOVE GENERATION: Placements and Slides
// =============================================================================
//
// Two kinds of moves exist, one per game phase:
//
// 1. PLACEMENT
//    Before anyone moves, players take turns putting penguins on the floe.
//    Any unoccupied tile allowed by the board's placement rule is legal.
//
// 2. SLIDE
//    A penguin travels in a straight line along one of the six hex
//    directions. It may stop on any tile of the ray, but cannot cross water
//    (fish 0) or another penguin. The ray is walked one cell at a time and
//    ends at the first blocked cell.
//
// Generation is lazy: the iterator keeps its place (penguin, direction, last
// cell on the ray) and produces the next move on demand. Search materialises
// the moves it needs with legal_moves(); cheap queries like has_legal_move()
// stop at the first hit.
//
// =============================================================================

#include "floe/movegen.hpp"

#include <algorithm>

namespace floe {

LegalMoves::Iterator::Iterator(const Board* board, Player player)
    : board_(board), player_(player), placement_(board->is_placement_phase()), done_(false) {
  if (player >= board->players() ||
      (placement_ && board->placed_count(player) >= board->penguins_per_player())) {
    done_ = true;
    return;
  }
  advance();
}

void LegalMoves::Iterator::advance() {
  if (done_) {
    return;
  }
  if (placement_) {
    advance_placement();
  } else {
    advance_slide();
  }
}

void LegalMoves::Iterator::advance_placement() {
  const auto width = board_->width();

  while (cursor_ < board_->cell_count()) {
    const Cell cell = Cell::from_index(cursor_++, width);
    if (board_->is_placeable(cell)) {
      current_ = Move::placement(cell);
      return;
    }
  }

  done_ = true;
}

void LegalMoves::Iterator::advance_slide() {
  const auto& penguins = board_->penguins();
  const auto width = board_->width();
  const auto height = board_->height();

  while (cursor_ < penguins.size()) {
    const Penguin& penguin = penguins[cursor_];

    if (penguin.owner == player_) {
      while (direction_ < DIRECTIONS.size()) {
        const Cell last = ray_.value_or(penguin.cell);
        const auto next = last.step(DIRECTIONS[direction_], width, height);

        if (next.has_value() && board_->is_open(*next)) {
          ray_ = next;
          current_ = Move::slide(penguin.cell, *next);
          return;
        }

        // Ray blocked: move on to the next direction.
        ++direction_;
        ray_ = std::nullopt;
      }
    }

    ++cursor_;
    direction_ = 0;
    ray_ = std::nullopt;
  }

  done_ = true;
}

MoveList legal_moves(const Board& board, Player player) {
  MoveList moves;
  legal_moves(board, player, moves);
  return moves;
}

void legal_moves(const Board& board, Player player, MoveList& moves) {
  moves.clear();
  for (const auto& mv : LegalMoves(board, player)) {
    moves.push_back(mv);
  }
}

bool has_legal_move(const Board& board, Player player) {
  const LegalMoves moves(board, player);
  return moves.begin() != moves.end();
}

bool is_legal_move(const Board& board, const Move& mv, Player player) {
  const LegalMoves moves(board, player);
  return std::find(moves.begin(), moves.end(), mv) != moves.end();
}

std::size_t count_slides(const Board& board, Cell from) {
  std::size_t count = 0;

  for (const auto dir : DIRECTIONS) {
    auto next = from.step(dir, board.width(), board.height());
    while (next.has_value() && board.is_open(*next)) {
      ++count;
      next = next->step(dir, board.width(), board.height());
    }
  }

  return count;
}

std::uint64_t perft(Board& board, Player player, std::uint8_t depth) {
  if (depth == 0) {
    return 1;
  }

  const MoveList moves = legal_moves(board, player);
  const Player next = next_player(player, board.players());

  if (moves.empty()) {
    if (board.is_terminal()) {
      return 1;
    }
    return perft(board, next, static_cast<std::uint8_t>(depth - 1));
  }

  std::uint64_t nodes = 0;
  for (const auto& mv : moves) {
    const auto captured = board.apply_move(mv, player);
    nodes += perft(board, next, static_cast<std::uint8_t>(depth - 1));
    board.undo_move(mv, player, captured);
  }

  return nodes;
}

} // namespace floe
