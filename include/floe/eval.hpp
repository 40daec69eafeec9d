#pragma once

// =============================================================================
// POSITION EVALUATION: Estimating Who's Winning
// =============================================================================
//
// The evaluation assigns an integer score to a board from one player's point
// of view: positive means that player is ahead, negative means behind.
//
// The game is won on fish, so fish already captured dominate. The remaining
// terms estimate the fish still to come:
//
//   score = FISH_WEIGHT      * (captured fish    - best opponent's)
//         + MOBILITY_WEIGHT  * (slide count      - best opponent's)
//         + TERRITORY_WEIGHT * (cells we own     - best opponent's)
//         - ISOLATION_WEIGHT * (our stuck penguins - all opponents' stuck penguins)
//
// "Cells we own" are fish-bearing cells that our nearest penguin reaches in
// fewer steps than any opponent penguin. With more than two players each
// balance is taken against the strongest opponent on that term.
//
// Evaluation never looks ahead; that is search's job. Its cost depends only on
// the board size.
//
// =============================================================================

#include <array>
#include <cstdint>

#include "floe/board.hpp"
#include "floe/cell.hpp"
#include "floe/player.hpp"

namespace floe {

inline constexpr int SCORE_MAX = 100'000'000;
inline constexpr int SCORE_MIN = -SCORE_MAX;

inline constexpr int FISH_WEIGHT = 100;
inline constexpr int MOBILITY_WEIGHT = 10;
inline constexpr int TERRITORY_WEIGHT = 5;
inline constexpr int ISOLATION_WEIGHT = 60;

// Every fish on the largest board, captured by one player, must still score
// below the clamp.
static_assert(FISH_WEIGHT * MAX_DIMENSION * MAX_DIMENSION * MAX_FISH < SCORE_MAX / 10);

// Raw per-player feature values the score is built from.
struct Features {
  std::array<int, MAX_PLAYERS> captured{};
  std::array<int, MAX_PLAYERS> mobility{};
  std::array<int, MAX_PLAYERS> territory{};
  std::array<int, MAX_PLAYERS> isolated{};
};

[[nodiscard]] Features features(const Board& board);

// Number of cells each player reaches strictly first.
[[nodiscard]] std::array<int, MAX_PLAYERS> territory(const Board& board);

[[nodiscard]] int eval_captured(const Board& board, Player perspective) noexcept;
[[nodiscard]] int eval(const Board& board, Player perspective);

} // namespace floe
