#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "floe/engine.hpp"
#include "floe/movegen.hpp"
#include "floe/search.hpp"

using namespace floe;
namespace search = floe::search;

namespace {

Board parse(std::string_view text, std::uint8_t players = 2, std::uint8_t penguins = 1) {
  return Board::from_text(text, players, penguins);
}

} // namespace

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------

TEST(Engine, OwnsTheGivenBoard) {
  const Engine engine(parse("1 1/1 1"), 1);

  EXPECT_EQ(engine.me(), 1);
  EXPECT_EQ(engine.board().to_text(), "1 1/1 1");
}

TEST(Engine, RejectsUnknownPlayer) {
  EXPECT_THROW(Engine(parse("1 1/1 1"), 2), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Moves and decisions
// -----------------------------------------------------------------------------

TEST(Engine, AppliesMovesToTheGameBoard) {
  Engine engine(parse("1 1/1 1"), 0);

  EXPECT_EQ(engine.apply_move(Move::placement(Cell{0, 0}), 0), 0);
  EXPECT_EQ(engine.apply_move(Move::placement(Cell{1, 1}), 1), 0);
  EXPECT_EQ(engine.board().to_text(), "1a 1/1 1b");

  EXPECT_EQ(engine.apply_move(Move::slide(Cell{0, 0}, Cell{0, 1}), 0), 1);
  EXPECT_EQ(engine.board().captured(0), 1U);

  EXPECT_THROW(engine.apply_move(Move::slide(Cell{1, 1}, Cell{0, 0}), 1), InvalidMoveError);
}

TEST(Engine, FinishPlacementSwitchesToSlides) {
  Engine engine(parse("1 1 1/1 1 1"), 0);
  engine.apply_move(Move::placement(Cell{0, 0}), 0);
  ASSERT_TRUE(engine.board().is_placement_phase());

  engine.finish_placement();

  EXPECT_FALSE(engine.board().is_placement_phase());
  EXPECT_TRUE(legal_moves(engine.board(), 0).front().is_slide());
}

TEST(Engine, SearchDoesNotTouchTheGameBoard) {
  const Engine engine(parse("1a 2 1 3/2 1 3 1b/1b 3 2 1/3 1 2a 2", 2, 2), 0);
  const Board before = engine.board();

  search::Limits limits;
  limits.depth = 3;
  search::NullReporter reporter;

  const auto result = engine.search(limits, reporter);

  EXPECT_EQ(engine.board(), before);
  ASSERT_TRUE(result.best_move().has_value());
  EXPECT_TRUE(is_legal_move(engine.board(), *result.best_move(), engine.me()));
}
