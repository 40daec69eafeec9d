#pragma once

// =============================================================================
// JUDGE PROTOCOL
// =============================================================================
//
// The judge talks to us over stdin/stdout, one message per line, integers
// separated by whitespace.
//
//   header        width height penguins_per_player my_id players
//   fish grid     width*height counts 0..3, row-major, over one or more lines
//   broken grid   width*height flags 0/1, same layout
//
//   placement phase
//     p [ms]            p == my_id: place a penguin, reply "row col"
//     p row col         an opponent placed a penguin
//     -1                placement is over
//
//   movement phase
//     p [ms]            p == my_id: move, reply "penguin row col"
//     p penguin row col an opponent moved penguin to (row, col)
//     -1                game over (so is end of input)
//
// "ms" is an optional budget for this decision in milliseconds. When we have
// no legal action the reply is "pass". Anything else is a ProtocolError: no
// reply is written and the agent exits.
//
// =============================================================================

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "floe/board.hpp"
#include "floe/cell.hpp"
#include "floe/engine.hpp"
#include "floe/options.hpp"
#include "floe/player.hpp"
#include "floe/search.hpp"

namespace floe::protocol {

class ProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline constexpr std::string_view PASS_TOKEN = "pass";
inline constexpr int END_OF_PHASE = -1;

inline constexpr int EXIT_PROTOCOL_ERROR = 1;
inline constexpr int EXIT_INTERNAL_ERROR = 2;

enum class State { AwaitInit, AwaitTurn, ComputingMove, GameOver };
enum class Phase { Placement, Movement };

struct Header {
  std::uint8_t width{0};
  std::uint8_t height{0};
  std::uint8_t penguins_per_player{0};
  Player me{0};
  std::uint8_t players{0};

  friend constexpr bool operator==(const Header&, const Header&) = default;
};

enum class MessageType { OwnTurn, OpponentPlacement, OpponentSlide, EndOfPhase };

struct TurnMessage {
  MessageType type{MessageType::OwnTurn};
  Player player{0};
  std::optional<std::chrono::milliseconds> budget{};
  std::optional<PenguinId> penguin{};
  std::optional<Cell> cell{};
};

[[nodiscard]] std::vector<int> parse_ints(const std::string& line);
[[nodiscard]] Header parse_header(const std::string& line);
[[nodiscard]] TurnMessage parse_turn(const std::string& line, Phase phase, const Header& header);

[[nodiscard]] std::string format_placement(Cell cell);
[[nodiscard]] std::string format_slide(PenguinId penguin, Cell to);

// Share of a decision budget handed to search; the rest covers I/O and the
// search's own overshoot.
[[nodiscard]] std::chrono::milliseconds allocate_time(std::chrono::milliseconds budget) noexcept;

// Build the game board from the header and the fish/broken grids.
[[nodiscard]] Board build_board(const Header& header, const std::vector<int>& grids,
                                PlacementRule rule);

// Writes one "info ..." line per finished search iteration.
class LogReporter : public search::Reporter {
public:
  explicit LogReporter(std::ostream* out);

  void send(const search::Report& report) override;

private:
  std::ostream* out_;
};

class Session {
public:
  Session(Options options, std::ostream& out, std::ostream* log = nullptr);

  // Consume one line from the judge, writing a reply when one is due.
  // Throws ProtocolError on malformed or unexpected input.
  void feed(const std::string& line);

  // The judge closed its end of the pipe.
  void finish();

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] Phase phase() const noexcept { return phase_; }
  [[nodiscard]] const std::optional<Header>& header() const noexcept { return header_; }

  // Throws std::logic_error before the board has been received.
  [[nodiscard]] const Engine& engine() const;

private:
  void feed_init(const std::string& line);
  void feed_turn(const std::string& line);
  void apply_opponent_move(const TurnMessage& msg);
  void play_own_turn(const TurnMessage& msg);
  void log(const std::string& message) const;

  Options options_;
  std::ostream* out_;
  std::ostream* log_;
  State state_{State::AwaitInit};
  Phase phase_{Phase::Placement};
  std::optional<Header> header_{};
  std::vector<int> grids_{};
  std::optional<Engine> engine_{};
};

// Play one game from `in` to `out`. Returns on game over or end of input;
// throws ProtocolError when the judge's input cannot be trusted.
void run_loop(std::istream& in, std::ostream& out, std::ostream* log, const Options& options);

} // namespace floe::protocol
