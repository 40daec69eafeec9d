#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "floe/eval.hpp"
#include "floe/movegen.hpp"
#include "floe/search.hpp"

using namespace floe;
namespace search = floe::search;
using namespace std::chrono_literals;

namespace {

Board parse(std::string_view text, std::uint8_t players = 2, std::uint8_t penguins = 1) {
  return Board::from_text(text, players, penguins);
}

// Mid-game position with plenty of moves for both sides.
Board open_position() {
  return parse("1a 2 1 3/2 1 3 1b/1b 3 2 1/3 1 2a 2", 2, 2);
}

// 20x20 floe with three penguins each: far too big to search out in a few
// milliseconds.
Board large_position() {
  std::string text;
  for (int row = 0; row < 20; ++row) {
    if (row > 0) {
      text += '/';
    }
    for (int col = 0; col < 20; ++col) {
      if (col > 0) {
        text += ' ';
      }
      text += std::to_string(1 + (row + col) % 3);
      if ((row == 2 && col == 2) || (row == 10 && col == 10) || (row == 17 && col == 5)) {
        text += 'a';
      } else if ((row == 2 && col == 17) || (row == 10 && col == 4) || (row == 17 && col == 14)) {
        text += 'b';
      }
    }
  }
  return parse(text, 2, 3);
}

class CountingReporter : public search::Reporter {
public:
  void send(const search::Report& report) override { depths.push_back(report.depth); }

  std::vector<std::uint8_t> depths;
};

} // namespace

// Move ordering ----------------------------------------------------------------

TEST(SearchOrdering, PrincipalVariationMoveGoesFirst) {
  const auto a = Move::slide(Cell{0, 0}, Cell{0, 1});
  const auto b = Move::slide(Cell{0, 0}, Cell{0, 2});
  const auto c = Move::slide(Cell{0, 0}, Cell{1, 1});

  MoveList moves{a, b, c};
  search::detail::order_moves(moves, c);
  EXPECT_EQ(moves, (MoveList{c, a, b}));

  MoveList unchanged{a, b, c};
  search::detail::order_moves(unchanged, std::nullopt);
  EXPECT_EQ(unchanged, (MoveList{a, b, c}));

  search::detail::order_moves(unchanged, Move::placement(Cell{3, 3}));
  EXPECT_EQ(unchanged, (MoveList{a, b, c}));
}

// Per-ply buffers -------------------------------------------------------------

TEST(SearchStack, BuffersAreReservedUpFront) {
  search::PlyStack stack;

  for (std::uint8_t ply = 0; ply <= search::MAX_DEPTH; ++ply) {
    EXPECT_TRUE(stack.moves(ply).empty());
    EXPECT_TRUE(stack.pv(ply).empty());
    EXPECT_GT(stack.pv(ply).capacity(), search::MAX_DEPTH);
  }
}

TEST(SearchStack, RootLeavesItsLineAtPlyZero) {
  auto board = parse("1a . 1b/. 1 ./1a . 1b", 2, 2);
  search::PlyStack stack;
  search::Report report;
  const search::Stopper unlimited;

  const int score = search::detail::search_root(board, 0, 2, {}, stack, report, unlimited);

  EXPECT_EQ(score, FISH_WEIGHT);
  ASSERT_FALSE(stack.pv(0).empty());
  EXPECT_EQ(stack.pv(0).front(), Move::slide(Cell{0, 0}, Cell{1, 1}));

  // A second search on the same stack reuses the buffers.
  const auto* buffer = stack.pv(0).data();
  (void)search::detail::search_root(board, 0, 2, {}, stack, report, unlimited);
  EXPECT_EQ(stack.pv(0).data(), buffer);
}

// Decisions --------------------------------------------------------------------

TEST(Search, FindsTheOnlyCapturingSlide) {
  auto board = parse("1a . 1b/. 1 ./1a . 1b", 2, 2);
  ASSERT_EQ(legal_moves(board, 0).size(), 1U);

  const auto result = search::search(board, 0, 4);

  ASSERT_TRUE(result.best_move().has_value());
  EXPECT_EQ(*result.best_move(), Move::slide(Cell{0, 0}, Cell{1, 1}));
  EXPECT_TRUE(result.exhausted);
  EXPECT_EQ(result.depth, 1);
  EXPECT_EQ(result.eval, FISH_WEIGHT);
}

TEST(Search, PassesWhenNoMoveExists) {
  auto board = parse("1a ./. 1b");

  const auto result = search::search(board, 0, 3);

  EXPECT_FALSE(result.best_move().has_value());
  EXPECT_TRUE(result.pv.empty());
  EXPECT_TRUE(result.exhausted);
}

TEST(Search, TiesGoToTheFirstGeneratedMove) {
  // Every slide of the lone penguin scores the same at depth 1.
  auto board = parse("1 1 1a 1 1");
  board.finish_placement();

  const auto result = search::search(board, 0, 1);

  ASSERT_TRUE(result.best_move().has_value());
  EXPECT_EQ(*result.best_move(), legal_moves(board, 0).front());
  EXPECT_EQ(*result.best_move(), Move::slide(Cell{0, 2}, Cell{0, 3}));
}

TEST(Search, BestMoveIsAlwaysLegal) {
  for (std::uint8_t depth = 1; depth <= 3; ++depth) {
    for (Player p = 0; p < 2; ++p) {
      auto board = open_position();
      const auto moves = legal_moves(board, p);

      const auto result = search::search(board, p, depth);

      ASSERT_TRUE(result.best_move().has_value());
      EXPECT_NE(std::ranges::find(moves, *result.best_move()), moves.end());
    }
  }
}

TEST(Search, PlacementDecision) {
  auto board = parse("1 2 1/2 3 2/1 2 1", 2, 2);
  const auto moves = legal_moves(board, 0);

  const auto result = search::search(board, 0, 2);

  ASSERT_TRUE(result.best_move().has_value());
  EXPECT_TRUE(result.best_move()->is_placement());
  EXPECT_NE(std::ranges::find(moves, *result.best_move()), moves.end());
}

TEST(Search, MoreThanTwoPlayers) {
  auto board = parse("1a 2 1 3 1/2 1b 3 1 2/1 3 2c 1 1/3 1 2 2 1", 3, 1);

  for (Player p = 0; p < 3; ++p) {
    const auto moves = legal_moves(board, p);
    const auto result = search::search(board, p, 3);

    ASSERT_TRUE(result.best_move().has_value());
    EXPECT_NE(std::ranges::find(moves, *result.best_move()), moves.end());
  }
}

TEST(Search, LeavesTheBoardUntouched) {
  auto board = open_position();
  const auto before = board;

  (void)search::search(board, 0, 3);

  EXPECT_EQ(board, before);
}

// Limits -----------------------------------------------------------------------

TEST(SearchLimits, ZeroTimeStillCompletesDepthOne) {
  auto board = open_position();

  search::Limits limits;
  limits.time = 0ms;
  search::NullReporter reporter;

  const auto result = search::search(board, 0, limits, reporter);

  EXPECT_EQ(result.depth, 1);
  ASSERT_TRUE(result.best_move().has_value());
  EXPECT_TRUE(is_legal_move(board, *result.best_move(), 0));
}

TEST(SearchLimits, NodeLimitKeepsLastCompletedDepth) {
  auto board = open_position();
  const auto reference = search::search(board, 0, 2);
  ASSERT_EQ(reference.depth, 2);
  ASSERT_FALSE(reference.exhausted);

  // Depth 3 runs past the budget and is thrown away.
  search::Limits limits;
  limits.depth = 3;
  limits.nodes = reference.nodes;
  CountingReporter reporter;

  const auto result = search::search(board, 0, limits, reporter);

  EXPECT_EQ(result.depth, 2);
  EXPECT_EQ(result.pv, reference.pv);
  EXPECT_EQ(result.eval, reference.eval);
  EXPECT_EQ(reporter.depths, (std::vector<std::uint8_t>{1, 2}));
}

TEST(SearchLimits, TinyNodeLimitStillAnswers) {
  auto board = open_position();

  search::Limits limits;
  limits.nodes = 1;
  search::NullReporter reporter;

  const auto result = search::search(board, 0, limits, reporter);

  EXPECT_EQ(result.depth, 1);
  ASSERT_TRUE(result.best_move().has_value());
  EXPECT_TRUE(is_legal_move(board, *result.best_move(), 0));
}

TEST(SearchLimits, DeadlineStopsTheSearchMidway) {
  auto board = large_position();
  ASSERT_FALSE(board.is_placement_phase());

  search::Limits limits;
  limits.time = 30ms;
  CountingReporter reporter;

  const auto started = std::chrono::steady_clock::now();
  const auto result = search::search(board, 0, limits, reporter);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_GE(result.depth, 1);
  EXPECT_LT(result.depth, search::MAX_DEPTH);
  EXPECT_FALSE(result.exhausted);
  ASSERT_TRUE(result.best_move().has_value());
  EXPECT_TRUE(is_legal_move(board, *result.best_move(), 0));

  // Only completed iterations are reported, and the last one is the answer.
  ASSERT_FALSE(reporter.depths.empty());
  EXPECT_EQ(reporter.depths.back(), result.depth);
  EXPECT_EQ(reporter.depths.size(), result.depth);

  // The clock is polled often enough that the overshoot stays small.
  EXPECT_LT(elapsed, 30ms + 500ms);
}

TEST(SearchLimits, DepthLimitReportsEachIteration) {
  auto board = open_position();

  search::Limits limits;
  limits.depth = 3;
  CountingReporter reporter;

  const auto result = search::search(board, 0, limits, reporter);

  EXPECT_EQ(result.depth, 3);
  EXPECT_EQ(reporter.depths, (std::vector<std::uint8_t>{1, 2, 3}));
}
