#include "floe/board.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Text form: rows top to bottom separated by '/', cells separated by spaces.
//
//   .    water (no fish)
//   1-3  ice with that many fish
//   2b   ice with two fish and a penguin of player 1 ('a' is player 0)
//
// Example, a 3x3 floe with one penguin each:  "1a 1 ./. 2 ./1b . 3"

namespace floe {
namespace {

[[nodiscard]] std::runtime_error make_error(const std::string& msg) {
  return std::runtime_error(msg);
}

std::vector<std::string_view> split(std::string_view str, char delimiter) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto end = str.find(delimiter, start);
    parts.push_back(str.substr(start, end == std::string_view::npos ? end : end - start));
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return parts;
}

std::vector<std::string_view> split_cells(std::string_view row) {
  std::vector<std::string_view> cells;
  for (const auto part : split(row, ' ')) {
    if (!part.empty()) {
      cells.push_back(part);
    }
  }
  return cells;
}

struct ParsedCell {
  std::uint8_t fish{0};
  std::optional<Player> penguin{};
};

ParsedCell parse_cell(std::string_view token, std::uint8_t players) {
  if (token == ".") {
    return {};
  }

  if (token.size() > 2 || token[0] < '0' || token[0] > static_cast<char>('0' + MAX_FISH)) {
    throw make_error("invalid cell '" + std::string(token) + "'");
  }

  ParsedCell cell{.fish = static_cast<std::uint8_t>(token[0] - '0')};

  if (token.size() == 2) {
    const char letter = token[1];
    if (letter < 'a' || letter >= static_cast<char>('a' + players)) {
      throw make_error("invalid penguin owner in cell '" + std::string(token) + "'");
    }
    if (cell.fish == 0) {
      throw make_error("penguin standing on water in cell '" + std::string(token) + "'");
    }
    cell.penguin = static_cast<Player>(letter - 'a');
  }

  return cell;
}

} // namespace

Board Board::from_text(std::string_view text, std::uint8_t players,
                       std::uint8_t penguins_per_player, PlacementRule rule) {
  const auto rows = split(text, '/');

  std::vector<std::vector<std::string_view>> grid;
  grid.reserve(rows.size());
  for (const auto row : rows) {
    grid.push_back(split_cells(row));
  }

  const std::size_t width = grid.front().size();
  if (width == 0) {
    throw make_error("board text has an empty row");
  }
  for (const auto& row : grid) {
    if (row.size() != width) {
      std::ostringstream oss;
      oss << "board rows must all have " << width << " cells, got " << row.size();
      throw make_error(oss.str());
    }
  }
  if (width > MAX_DIMENSION || grid.size() > MAX_DIMENSION) {
    throw make_error("board text is larger than " + std::to_string(MAX_DIMENSION) + " cells a side");
  }

  Board board(static_cast<std::uint8_t>(width), static_cast<std::uint8_t>(grid.size()), players,
              penguins_per_player, rule);

  // Penguins take ids in reading order. They are put down directly so that a
  // text board may hold penguins regardless of the placement rule.
  for (std::size_t r = 0; r < grid.size(); ++r) {
    for (std::size_t c = 0; c < width; ++c) {
      const Cell cell{static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(c)};
      const auto parsed = parse_cell(grid[r][c], players);
      board.tile_mut(cell).fish = parsed.fish;

      if (parsed.penguin.has_value()) {
        if (board.placed_count(*parsed.penguin) >= penguins_per_player) {
          throw make_error("too many penguins for player " +
                           std::string(1, static_cast<char>('a' + *parsed.penguin)));
        }
        board.tile_mut(cell).penguin = static_cast<PenguinId>(board.penguins_.size());
        board.penguins_.push_back(Penguin{.owner = *parsed.penguin, .cell = cell});
      }
    }
  }

  return board;
}

std::string Board::to_text() const {
  std::string out;

  for (std::uint8_t r = 0; r < height_; ++r) {
    if (r > 0) {
      out += '/';
    }
    for (std::uint8_t c = 0; c < width_; ++c) {
      if (c > 0) {
        out += ' ';
      }
      const auto& t = tile(Cell{r, c});
      if (t.fish == 0 && !t.penguin.has_value()) {
        out += '.';
        continue;
      }
      out += static_cast<char>('0' + t.fish);
      if (t.penguin.has_value()) {
        out += static_cast<char>('a' + penguins_[*t.penguin].owner);
      }
    }
  }

  return out;
}

} // namespace floe
