// =============================================================================
// MINIMAX SEARCH IMPLEMENTATION
// =============================================================================
//
// High-level flow:
//
// search() → Iterative deepening loop
//   └── search_root() → Root moves, clock checked after each one
//         └── minimax() → Recursive minimax with alpha-beta pruning
//
// The board is mutated in place with apply_move/undo_move pairs; no node
// copies the board. Move lists and principal variations live in a PlyStack
// shared by the whole search.
//
// =============================================================================

#include "floe/search.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>

#include "floe/eval.hpp"

namespace floe::search {
namespace {

// Check the clock every 64 nodes instead of every node. An evaluation costs a
// few breadth-first searches, so 64 nodes stay well under a millisecond on
// tournament-sized boards.
constexpr std::uint64_t STOPPER_NODES_MASK = 0x3F;

// Initial capacity of each ply's move list; larger lists grow once and keep
// their capacity for the rest of the search.
constexpr std::size_t MOVES_RESERVE = 128;

std::span<const Move> child_hint(std::span<const Move> pv_hint, const Move& mv) {
  if (!pv_hint.empty() && pv_hint.front() == mv) {
    return pv_hint.subspan(1);
  }
  return {};
}

// Leaf value. A finished game is final; anything else means the horizon cut
// a line short and a deeper iteration could learn more.
int leaf(const Board& board, Player root, Report& report) {
  if (!board.is_terminal()) {
    report.reached_horizon = true;
  }
  return eval(board, root);
}

} // namespace

// ---------------------------------------------------------------------------
// Stopper
// ---------------------------------------------------------------------------

bool Stopper::should_stop(const Report& report) const {
  if ((report.nodes & STOPPER_NODES_MASK) != 0) {
    return false;
  }
  return limit_reached(report);
}

bool Stopper::limit_reached(const Report& report) const {
  if (elapsed_.has_value() && report.elapsed() >= *elapsed_) {
    return true;
  }

  if (nodes_.has_value() && report.nodes > *nodes_) {
    return true;
  }

  return false;
}

// ---------------------------------------------------------------------------
// PlyStack
// ---------------------------------------------------------------------------

PlyStack::PlyStack() {
  for (auto& moves : moves_) {
    moves.reserve(MOVES_RESERVE);
  }
  for (auto& pv : pvs_) {
    pv.reserve(MAX_DEPTH + 1);
  }
}

// ---------------------------------------------------------------------------
// MOVE ORDERING
// ---------------------------------------------------------------------------
// The previous iteration's principal variation move goes first; the rest keep
// generator order. Combined with strict comparisons below, ties go to the
// move searched first, so results are reproducible.
// ---------------------------------------------------------------------------

void detail::order_moves(MoveList& moves, std::optional<Move> pv_move) {
  if (!pv_move.has_value()) {
    return;
  }

  const auto it = std::ranges::find(moves, *pv_move);
  if (it != moves.end()) {
    std::rotate(moves.begin(), it, std::next(it));
  }
}

// =============================================================================
// MINIMAX WITH ALPHA-BETA
// =============================================================================
// Scores are always from the root player's perspective:
//   - root player's nodes maximise and raise alpha
//   - everyone else's nodes minimise and lower beta
// When alpha >= beta the node is cut off.
//
// Only a strictly better score replaces the current best. A later move that
// ties (or only proves a bound equal to the best) never displaces an earlier
// one.
// =============================================================================

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
int detail::minimax(Board& board, Player to_move, Player root, std::uint8_t depth,
                    std::uint8_t ply, int alpha, int beta, std::span<const Move> pv_hint,
                    PlyStack& stack, Report& report, const Stopper& stopper) {
  if (stopper.should_stop(report)) {
    report.aborted = true;
    return 0;
  }

  report.nodes += 1;
  MoveList& pv = stack.pv(ply);
  pv.clear();

  if (depth == 0) {
    return leaf(board, root, report);
  }

  MoveList& moves = stack.moves(ply);
  legal_moves(board, to_move, moves);
  const Player next = next_player(to_move, board.players());
  const auto child_ply = static_cast<std::uint8_t>(ply + 1);

  // PASS: no move for this player. Terminal only if nobody else can move
  // either; otherwise the turn passes on and one ply is used up.
  if (moves.empty()) {
    if (board.is_terminal()) {
      return eval(board, root);
    }
    const int score = minimax(board, next, root, static_cast<std::uint8_t>(depth - 1), child_ply,
                              alpha, beta, pv_hint, stack, report, stopper);
    const MoveList& child_pv = stack.pv(child_ply);
    pv.assign(child_pv.begin(), child_pv.end());
    return score;
  }

  order_moves(moves, pv_hint.empty() ? std::nullopt : std::make_optional(pv_hint.front()));

  const bool maximising = to_move == root;
  int best = maximising ? SCORE_MIN : SCORE_MAX;

  for (const auto& mv : moves) {
    const auto captured = board.apply_move(mv, to_move);

    const int score = minimax(board, next, root, static_cast<std::uint8_t>(depth - 1), child_ply,
                              alpha, beta, child_hint(pv_hint, mv), stack, report, stopper);

    board.undo_move(mv, to_move, captured);

    if (report.aborted) {
      return 0;
    }

    if (maximising ? score > best : score < best) {
      best = score;
      const MoveList& child_pv = stack.pv(child_ply);
      pv.clear();
      pv.push_back(mv);
      pv.insert(pv.end(), child_pv.begin(), child_pv.end());
    }

    if (maximising) {
      alpha = std::max(alpha, best);
    } else {
      beta = std::min(beta, best);
    }

    // CUTOFF: the other side already has something at least as good
    if (alpha >= beta) {
      break;
    }
  }

  return best;
}

// ---------------------------------------------------------------------------
// ROOT
// ---------------------------------------------------------------------------
// Same as a maximising minimax node, plus a full clock check between root
// moves so a slow subtree cannot run far past the deadline.
// ---------------------------------------------------------------------------

int detail::search_root(Board& board, Player root, std::uint8_t depth,
                        std::span<const Move> pv_hint, PlyStack& stack, Report& report,
                        const Stopper& stopper) {
  report.nodes += 1;
  MoveList& pv = stack.pv(0);
  pv.clear();

  MoveList& moves = stack.moves(0);
  legal_moves(board, root, moves);

  // No move: the caller has to pass. There is nothing to deepen.
  if (moves.empty()) {
    return eval(board, root);
  }

  order_moves(moves, pv_hint.empty() ? std::nullopt : std::make_optional(pv_hint.front()));

  const Player next = next_player(root, board.players());
  int alpha = SCORE_MIN;
  int best = SCORE_MIN;

  for (const auto& mv : moves) {
    if (!pv.empty() && stopper.limit_reached(report)) {
      report.aborted = true;
      return 0;
    }

    const auto captured = board.apply_move(mv, root);

    const int score = minimax(board, next, root, static_cast<std::uint8_t>(depth - 1), 1, alpha,
                              SCORE_MAX, child_hint(pv_hint, mv), stack, report, stopper);

    board.undo_move(mv, root, captured);

    if (report.aborted) {
      return 0;
    }

    if (score > best) {
      best = score;
      const MoveList& child_pv = stack.pv(1);
      pv.clear();
      pv.push_back(mv);
      pv.insert(pv.end(), child_pv.begin(), child_pv.end());
    }

    alpha = std::max(alpha, best);
  }

  return best;
}

// ---------------------------------------------------------------------------
// ITERATIVE DEEPENING
// ---------------------------------------------------------------------------
// Depth 1 always runs to completion: it is cheap (one evaluation per root
// move) and guarantees a legal answer even with no time left. Later
// iterations run until:
//
//   - an iteration is interrupted (its result is discarded),
//   - the depth limit is reached,
//   - an iteration never reached its horizon (the game tree is exhausted), or
//   - the budget is spent, so the next iteration could not finish anyway.
// ---------------------------------------------------------------------------

SearchResult search(Board& board, Player to_move, const Limits& limits, Reporter& reporter) {
  Stopper stopper;
  stopper.at_nodes(limits.nodes);
  stopper.at_elapsed(limits.time);

  const Stopper unlimited;
  Report report;
  PlyStack stack;

  std::uint8_t max_depth = std::clamp<std::uint8_t>(limits.depth.value_or(MAX_DEPTH), 1, MAX_DEPTH);
  if (limits.time.has_value() && limits.time->count() <= 0) {
    max_depth = 1;
  }

  SearchResult result;

  for (std::uint8_t depth = 1; depth <= max_depth; ++depth) {
    report.aborted = false;
    report.reached_horizon = false;

    const int score = detail::search_root(board, to_move, depth, result.pv, stack, report,
                                          depth == 1 ? unlimited : stopper);

    if (report.aborted) {
      break;
    }

    const MoveList& pv = stack.pv(0);

    result.depth = depth;
    result.eval = score;
    result.pv = pv;

    report.depth = depth;
    report.pv = std::make_pair(pv, score);
    reporter.send(report);

    if (!report.reached_horizon) {
      result.exhausted = true;
      break;
    }

    if (stopper.limit_reached(report)) {
      break;
    }
  }

  result.nodes = report.nodes;
  return result;
}

SearchResult search(Board& board, Player to_move, std::uint8_t depth) {
  NullReporter reporter;
  Limits limits;
  limits.depth = depth;
  return search(board, to_move, limits, reporter);
}

} // namespace floe::search
