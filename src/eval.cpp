// =============================================================================
// STATIC EVALUATION IMPLEMENTATION
// =============================================================================
//
// Features are gathered for every player in one pass, then folded into a score
// for the requested perspective:
//
// 1. CAPTURED FISH
//    Straight from the board's running totals.
//
// 2. MOBILITY AND ISOLATION
//    Slide destinations per penguin. A penguin with none is stuck for good
//    (tiles only ever sink), so it scores an isolation penalty on top.
//
// 3. TERRITORY
//    A breadth-first search from each player's penguins over open cells. A
//    cell belongs to whoever gets there in strictly fewer steps; ties belong
//    to nobody. This is a cheap proxy for the fish each side can still
//    collect once the floe breaks up into separate regions.
//
// =============================================================================

#include "floe/eval.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

#include "floe/movegen.hpp"

namespace floe {
namespace {

constexpr std::uint16_t UNREACHED = std::numeric_limits<std::uint16_t>::max();

// Own value minus the strongest opponent's value.
int relative(const std::array<int, MAX_PLAYERS>& values, Player perspective, std::uint8_t players) {
  int best_opponent = std::numeric_limits<int>::min();
  for (Player p = 0; p < players; ++p) {
    if (p != perspective) {
      best_opponent = std::max(best_opponent, values[p]);
    }
  }
  return values[perspective] - best_opponent;
}

// Step distances from one player's penguins to every open cell.
void distances_from(const Board& board, Player player, std::vector<std::uint16_t>& dist,
                    std::vector<Cell>& queue) {
  std::ranges::fill(dist, UNREACHED);
  queue.clear();

  for (const auto& penguin : board.penguins()) {
    if (penguin.owner == player) {
      dist[penguin.cell.index(board.width())] = 0;
      queue.push_back(penguin.cell);
    }
  }

  for (std::size_t head = 0; head < queue.size(); ++head) {
    const Cell cell = queue[head];
    const auto next_dist = static_cast<std::uint16_t>(dist[cell.index(board.width())] + 1);

    for (const auto dir : DIRECTIONS) {
      const auto next = cell.step(dir, board.width(), board.height());
      if (!next.has_value() || !board.is_open(*next)) {
        continue;
      }
      auto& d = dist[next->index(board.width())];
      if (d == UNREACHED) {
        d = next_dist;
        queue.push_back(*next);
      }
    }
  }
}

} // namespace

std::array<int, MAX_PLAYERS> territory(const Board& board) {
  const std::size_t cells = board.cell_count();
  const std::uint8_t players = board.players();

  std::vector<std::uint16_t> dist(cells * players, UNREACHED);
  std::vector<std::uint16_t> scratch(cells);
  std::vector<Cell> queue;
  queue.reserve(cells);

  for (Player p = 0; p < players; ++p) {
    distances_from(board, p, scratch, queue);
    std::ranges::copy(scratch, dist.begin() + static_cast<std::ptrdiff_t>(p * cells));
  }

  std::array<int, MAX_PLAYERS> owned{};

  for (std::size_t i = 0; i < cells; ++i) {
    if (!board.is_open(Cell::from_index(i, board.width()))) {
      continue;
    }

    std::uint16_t nearest = UNREACHED;
    std::optional<Player> owner;

    for (Player p = 0; p < players; ++p) {
      const auto d = dist[p * cells + i];
      if (d < nearest) {
        nearest = d;
        owner = p;
      } else if (d == nearest) {
        owner = std::nullopt;
      }
    }

    if (owner.has_value()) {
      ++owned[*owner];
    }
  }

  return owned;
}

Features features(const Board& board) {
  Features result;

  for (Player p = 0; p < board.players(); ++p) {
    result.captured[p] = static_cast<int>(board.captured(p));
  }

  for (const auto& penguin : board.penguins()) {
    const auto slides = static_cast<int>(count_slides(board, penguin.cell));
    result.mobility[penguin.owner] += slides;
    if (slides == 0) {
      ++result.isolated[penguin.owner];
    }
  }

  result.territory = territory(board);

  return result;
}

int eval_captured(const Board& board, Player perspective) noexcept {
  std::array<int, MAX_PLAYERS> captured{};
  for (Player p = 0; p < board.players(); ++p) {
    captured[p] = static_cast<int>(board.captured(p));
  }
  return FISH_WEIGHT * relative(captured, perspective, board.players());
}

int eval(const Board& board, Player perspective) {
  const auto f = features(board);
  const auto players = board.players();

  int opponents_isolated = 0;
  for (Player p = 0; p < players; ++p) {
    if (p != perspective) {
      opponents_isolated += f.isolated[p];
    }
  }

  int score = FISH_WEIGHT * relative(f.captured, perspective, players);
  score += MOBILITY_WEIGHT * relative(f.mobility, perspective, players);
  score += TERRITORY_WEIGHT * relative(f.territory, perspective, players);
  score -= ISOLATION_WEIGHT * (f.isolated[perspective] - opponents_isolated);

  return std::clamp(score, SCORE_MIN + 1, SCORE_MAX - 1);
}

} // namespace floe
