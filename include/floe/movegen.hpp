#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

#include "floe/board.hpp"
#include "floe/move.hpp"
#include "floe/player.hpp"

namespace floe {

using MoveList = std::vector<Move>;

// Lazy view over the legal moves of one player.
//
// Order is fixed: placements in increasing (row, col); slides by penguin id,
// then DIRECTIONS order, then increasing distance along the ray. The view can
// be iterated any number of times. The board must not change while an
// iterator is live.
class LegalMoves {
public:
  class Iterator {
  public:
    using iterator_concept = std::forward_iterator_tag;
    using iterator_category = std::forward_iterator_tag;
    using value_type = Move;
    using difference_type = std::ptrdiff_t;
    using pointer = const Move*;
    using reference = const Move&;

    Iterator() = default;

    reference operator*() const noexcept { return current_; }
    pointer operator->() const noexcept { return &current_; }

    Iterator& operator++() {
      advance();
      return *this;
    }

    Iterator operator++(int) {
      Iterator copy = *this;
      advance();
      return copy;
    }

    friend bool operator==(const Iterator& lhs, const Iterator& rhs) noexcept {
      if (lhs.done_ || rhs.done_) {
        return lhs.done_ == rhs.done_;
      }
      return lhs.board_ == rhs.board_ && lhs.cursor_ == rhs.cursor_ &&
             lhs.direction_ == rhs.direction_ && lhs.current_ == rhs.current_;
    }

  private:
    friend class LegalMoves;

    Iterator(const Board* board, Player player);

    void advance();
    void advance_placement();
    void advance_slide();

    const Board* board_{nullptr};
    Player player_{0};
    bool placement_{false};
    bool done_{true};
    std::size_t cursor_{0};    // next cell index (placement) or penguin id (slide)
    std::size_t direction_{0}; // index into DIRECTIONS
    std::optional<Cell> ray_{};
    Move current_{};
  };

  LegalMoves(const Board& board, Player player) noexcept : board_(&board), player_(player) {}

  [[nodiscard]] Iterator begin() const { return Iterator(board_, player_); }
  [[nodiscard]] Iterator end() const noexcept { return Iterator{}; }

private:
  const Board* board_;
  Player player_;
};

// Materialised legal moves, in the LegalMoves order. Empty means the player
// has to pass; it is not an error.
MoveList legal_moves(const Board& board, Player player);

// Same, written into `moves` (cleared first) so a caller can reuse its buffer.
void legal_moves(const Board& board, Player player, MoveList& moves);

[[nodiscard]] bool has_legal_move(const Board& board, Player player);
[[nodiscard]] bool is_legal_move(const Board& board, const Move& mv, Player player);

// Number of slide destinations open to a penguin standing on `from`.
[[nodiscard]] std::size_t count_slides(const Board& board, Cell from);

// Leaf count of the game tree `depth` plies deep. A player without moves
// passes and uses up a ply; a finished game counts as one leaf.
std::uint64_t perft(Board& board, Player player, std::uint8_t depth);

} // namespace floe
