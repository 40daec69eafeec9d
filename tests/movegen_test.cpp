#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string_view>

#include "floe/board.hpp"
#include "floe/movegen.hpp"

using namespace floe;

namespace {

Board parse(std::string_view text, std::uint8_t players = 2, std::uint8_t penguins = 1,
            PlacementRule rule = PlacementRule::SingleFish) {
  return Board::from_text(text, players, penguins, rule);
}

Move slide(Cell from, Cell to) {
  return Move::slide(from, to);
}

} // namespace

// Placement --------------------------------------------------------------------

TEST(MovegenPlacement, RowMajorOrderUnderSingleFish) {
  const auto board = parse("1 2/1 1");
  const MoveList expected{
      Move::placement(Cell{0, 0}),
      Move::placement(Cell{1, 0}),
      Move::placement(Cell{1, 1}),
  };
  EXPECT_EQ(legal_moves(board, 0), expected);
}

TEST(MovegenPlacement, AnyTileAllowsEveryFreeIceTile) {
  const auto board = parse("1 2/. 1a", 2, 1, PlacementRule::AnyTile);
  const MoveList expected{
      Move::placement(Cell{0, 0}),
      Move::placement(Cell{0, 1}),
  };
  EXPECT_EQ(legal_moves(board, 1), expected);
}

TEST(MovegenPlacement, NothingLeftToPlace) {
  const auto board = parse("1a 1/1 1", 2, 1);
  ASSERT_TRUE(board.is_placement_phase());
  EXPECT_TRUE(legal_moves(board, 0).empty());
  EXPECT_EQ(legal_moves(board, 1).size(), 3U);
}

// Slides -----------------------------------------------------------------------

TEST(MovegenSlide, DirectionOrderAroundTheHexagon) {
  auto board = parse("1 1 1/1 1a 1/1 1 1");
  board.finish_placement();

  const Cell centre{1, 1};
  const MoveList expected{
      slide(centre, {0, 1}), slide(centre, {1, 2}), slide(centre, {2, 2}),
      slide(centre, {2, 1}), slide(centre, {1, 0}), slide(centre, {0, 0}),
  };
  EXPECT_EQ(legal_moves(board, 0), expected);
}

TEST(MovegenSlide, IncreasingDistanceAlongARay) {
  auto board = parse("1a 1 1 1");
  board.finish_placement();

  const MoveList expected{
      slide({0, 0}, {0, 1}),
      slide({0, 0}, {0, 2}),
      slide({0, 0}, {0, 3}),
  };
  EXPECT_EQ(legal_moves(board, 0), expected);
}

TEST(MovegenSlide, WaterAndPenguinsStopTheRay) {
  auto water = parse("1a 1 . 1");
  water.finish_placement();
  EXPECT_EQ(legal_moves(water, 0), (MoveList{slide({0, 0}, {0, 1})}));

  const auto penguins = parse("1a 1 1b 1");
  EXPECT_EQ(legal_moves(penguins, 0), (MoveList{slide({0, 0}, {0, 1})}));
  EXPECT_EQ(legal_moves(penguins, 1), (MoveList{slide({0, 2}, {0, 3}), slide({0, 2}, {0, 1})}));
}

TEST(MovegenSlide, PenguinsInIdOrder) {
  auto board = parse("1a 1 ./. . ./1a 1 .", 2, 2);
  board.finish_placement();

  const MoveList expected{
      slide({0, 0}, {0, 1}),
      slide({2, 0}, {2, 1}),
  };
  EXPECT_EQ(legal_moves(board, 0), expected);
}

TEST(MovegenSlide, StuckPlayerHasNoMoves) {
  const auto board = parse("1a ./. 1b");
  EXPECT_TRUE(legal_moves(board, 0).empty());
  EXPECT_FALSE(has_legal_move(board, 0));
  EXPECT_FALSE(has_legal_move(board, 1));
}

TEST(MovegenSlide, GeneratedMovesNeverCrossWaterOrPenguins) {
  const auto board = parse("1a 2 . 3/2 1b 1 ./3 . 2a 1/1 2 1b 3", 2, 2);

  for (Player p = 0; p < board.players(); ++p) {
    for (const auto& mv : legal_moves(board, p)) {
      ASSERT_TRUE(mv.is_slide());
      EXPECT_EQ(board.occupant(*mv.from), p);

      const auto line = line_between(*mv.from, mv.to);
      ASSERT_TRUE(line.has_value());

      Cell cell = *mv.from;
      for (std::uint8_t i = 0; i < line->second; ++i) {
        cell = *cell.step(line->first, board.width(), board.height());
        EXPECT_TRUE(board.is_open(cell)) << mv;
      }
    }
  }
}

// Lazy view and helpers -------------------------------------------------------

TEST(LegalMoves, ViewIsRestartable) {
  auto board = parse("1 1 1/1 1a 1/1 1 1");
  board.finish_placement();

  const LegalMoves view(board, 0);
  EXPECT_EQ(std::distance(view.begin(), view.end()), 6);
  EXPECT_EQ(std::distance(view.begin(), view.end()), 6);
  EXPECT_EQ(*view.begin(), slide({1, 1}, {0, 1}));
}

TEST(LegalMoves, LegalityMatchesGeneration) {
  const auto board = parse("1a 1 1b 1");

  for (const auto& mv : legal_moves(board, 1)) {
    EXPECT_TRUE(is_legal_move(board, mv, 1));
    EXPECT_FALSE(is_legal_move(board, mv, 0));
  }
  EXPECT_FALSE(is_legal_move(board, slide({0, 0}, {0, 3}), 0));
  EXPECT_FALSE(is_legal_move(board, Move::placement(Cell{0, 1}), 0));
}

TEST(LegalMoves, CountSlides) {
  const auto board = parse("1 1 1/1 1a 1/1 1 1");
  EXPECT_EQ(count_slides(board, Cell{1, 1}), 6U);

  const auto row = parse("1a 1 1 1");
  EXPECT_EQ(count_slides(row, Cell{0, 0}), 3U);
}

// Perft ------------------------------------------------------------------------

TEST(Perft, PlacementTree) {
  auto board = parse("1 1/1 1");
  EXPECT_EQ(perft(board, 0, 0), 1U);
  EXPECT_EQ(perft(board, 0, 1), 4U);
  EXPECT_EQ(perft(board, 0, 2), 12U);
}

TEST(Perft, SlidesWithPassAndGameEnd) {
  // a can go one or two cells right. After two, b is stuck and passes; after
  // one, b steps left and nobody can move again.
  auto board = parse("1a 1 1 1b");
  const auto before = board;

  EXPECT_EQ(perft(board, 0, 1), 2U);
  EXPECT_EQ(perft(board, 0, 2), 2U);
  EXPECT_EQ(perft(board, 0, 3), 2U);
  EXPECT_EQ(board, before);
}
