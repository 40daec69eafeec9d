#pragma once

// =============================================================================
// SEARCH: Finding the Best Move
// =============================================================================
//
// Given a board and the player to move, we want the move that leads to the
// best outcome assuming every opponent answers as well as it can.
//
// THE BASIC ALGORITHM: MINIMAX
// The player we search for (the root player) picks the move that maximises
// the evaluation; every other player picks the move that minimises it. With
// more than two players this is the "paranoid" assumption: all opponents are
// treated as one coalition against us.
//
// THE OPTIMIZATION: ALPHA-BETA PRUNING
// alpha is the score the root player is already guaranteed, beta the score
// the opponents are already guaranteed. Once alpha >= beta the remaining
// siblings cannot change the result and are skipped.
//
// PASSING
// A player without a legal move passes: the same board goes to the next
// player one ply shallower. Only when nobody can move is the node terminal.
//
// ITERATIVE DEEPENING
// Search depth 1, then 2, then 3... until the time runs out. Each finished
// iteration leaves a best move behind, and its principal variation is tried
// first in the next iteration, which makes the cutoffs come much earlier.
// An iteration interrupted by the clock is thrown away: its score only covers
// part of the tree.
//
// =============================================================================

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

#include "floe/board.hpp"
#include "floe/movegen.hpp"
#include "floe/player.hpp"

namespace floe::search {

inline constexpr std::uint8_t MAX_DEPTH = 64;

// ---------------------------------------------------------------------------
// Reporting and limits
// ---------------------------------------------------------------------------

struct Report {
  std::uint8_t depth{0};
  std::uint64_t nodes{0};
  bool aborted{false};         // current iteration hit a limit
  bool reached_horizon{false}; // current iteration cut a live line at depth 0
  std::optional<std::pair<MoveList, int>> pv{};
  std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};

  [[nodiscard]] std::chrono::steady_clock::duration elapsed() const {
    return std::chrono::steady_clock::now() - started_at;
  }
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual void send(const Report& report) = 0;
};

class NullReporter : public Reporter {
public:
  void send(const Report&) override {}
};

struct Limits {
  std::optional<std::uint8_t> depth{};
  std::optional<std::uint64_t> nodes{};
  std::optional<std::chrono::milliseconds> time{};
};

class Stopper {
public:
  void at_elapsed(std::optional<std::chrono::milliseconds> elapsed) { elapsed_ = elapsed; }
  void at_nodes(std::optional<std::uint64_t> nodes) { nodes_ = nodes; }

  // Cheap check for the hot path: only looks at the clock every few nodes.
  [[nodiscard]] bool should_stop(const Report& report) const;

  // Full check, used between root moves and between iterations.
  [[nodiscard]] bool limit_reached(const Report& report) const;

private:
  std::optional<std::chrono::milliseconds> elapsed_{};
  std::optional<std::uint64_t> nodes_{};
};

// ---------------------------------------------------------------------------
// Per-ply buffers
// ---------------------------------------------------------------------------

// Move list and principal variation for each ply, indexed by distance from
// the root. One stack serves a whole search, so nodes reuse the buffers
// instead of allocating their own.
class PlyStack {
public:
  PlyStack();

  [[nodiscard]] MoveList& moves(std::uint8_t ply) { return moves_[ply]; }
  [[nodiscard]] MoveList& pv(std::uint8_t ply) { return pvs_[ply]; }

private:
  std::array<MoveList, MAX_DEPTH + 1> moves_{};
  std::array<MoveList, MAX_DEPTH + 1> pvs_{};
};

// ---------------------------------------------------------------------------
// Search API
// ---------------------------------------------------------------------------

struct SearchResult {
  std::uint8_t depth{0};
  int eval{0};
  MoveList pv{};
  std::uint64_t nodes{0};
  bool exhausted{false}; // the whole remaining game tree was searched

  // nullopt means pass: the player to move has no legal move.
  [[nodiscard]] std::optional<Move> best_move() const {
    if (pv.empty()) {
      return std::nullopt;
    }
    return pv.front();
  }
};

// The board is used as scratch space and is back to its original state when
// the call returns.
SearchResult search(Board& board, Player to_move, const Limits& limits, Reporter& reporter);
SearchResult search(Board& board, Player to_move, std::uint8_t depth);

// Exposed for tests
namespace detail {
void order_moves(MoveList& moves, std::optional<Move> pv_move);
// Both leave the principal variation of the node in stack.pv(ply); the root
// is ply 0.
int search_root(Board& board, Player root, std::uint8_t depth, std::span<const Move> pv_hint,
                PlyStack& stack, Report& report, const Stopper& stopper);
int minimax(Board& board, Player to_move, Player root, std::uint8_t depth, std::uint8_t ply,
            int alpha, int beta, std::span<const Move> pv_hint, PlyStack& stack, Report& report,
            const Stopper& stopper);
} // namespace detail

} // namespace floe::search
