#include "floe/protocol.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include "floe/movegen.hpp"

namespace floe::protocol {

namespace {

std::vector<std::string> split_tokens(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> parts;
  std::string token;
  while (iss >> token) {
    parts.push_back(token);
  }
  return parts;
}

int parse_int(const std::string& token) {
  int value = 0;
  const auto* const first = token.data();
  const auto* const last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    throw ProtocolError("invalid integer '" + token + "'");
  }
  return value;
}

std::uint8_t parse_field(const std::string& name, int value, int min, int max) {
  if (value < min || value > max) {
    throw ProtocolError("invalid value " + std::to_string(value) + " for " + name + " (expected " +
                        std::to_string(min) + ".." + std::to_string(max) + ")");
  }
  return static_cast<std::uint8_t>(value);
}

Cell parse_cell(int row, int col, const Header& header) {
  if (row < 0 || col < 0 || row >= header.height || col >= header.width) {
    throw ProtocolError("cell " + std::to_string(row) + " " + std::to_string(col) +
                        " is off the board");
  }
  return Cell{static_cast<std::uint8_t>(row), static_cast<std::uint8_t>(col)};
}

std::string compact(const Move& mv) {
  std::string out;
  if (mv.from.has_value()) {
    out += std::to_string(mv.from->row) + ',' + std::to_string(mv.from->col) + '-';
  } else {
    out += '@';
  }
  out += std::to_string(mv.to.row) + ',' + std::to_string(mv.to.col);
  return out;
}

template <typename T> std::string describe(const T& value) {
  std::ostringstream ss;
  ss << value;
  return ss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// Message parsing
// ---------------------------------------------------------------------------

std::vector<int> parse_ints(const std::string& line) {
  std::vector<int> values;
  for (const auto& token : split_tokens(line)) {
    values.push_back(parse_int(token));
  }
  return values;
}

Header parse_header(const std::string& line) {
  const auto fields = parse_ints(line);
  if (fields.size() != 5) {
    throw ProtocolError("expected 'width height penguins player players', got " +
                        std::to_string(fields.size()) + " fields");
  }

  Header header{
      .width = parse_field("width", fields[0], 1, MAX_DIMENSION),
      .height = parse_field("height", fields[1], 1, MAX_DIMENSION),
      .penguins_per_player = parse_field("penguins", fields[2], 1, MAX_PENGUINS_PER_PLAYER),
      .me = 0,
      .players = parse_field("players", fields[4], MIN_PLAYERS, MAX_PLAYERS),
  };
  header.me = parse_field("player", fields[3], 0, header.players - 1);

  return header;
}

TurnMessage parse_turn(const std::string& line, Phase phase, const Header& header) {
  const auto fields = parse_ints(line);
  if (fields.empty()) {
    throw ProtocolError("empty turn message");
  }

  if (fields[0] == END_OF_PHASE) {
    if (fields.size() != 1) {
      throw ProtocolError("unexpected fields after end of phase marker");
    }
    return TurnMessage{.type = MessageType::EndOfPhase};
  }

  const Player player = parse_field("player", fields[0], 0, header.players - 1);

  if (player == header.me) {
    if (fields.size() > 2) {
      throw ProtocolError("expected 'player [ms]' for our own turn");
    }
    TurnMessage msg{.type = MessageType::OwnTurn, .player = player};
    if (fields.size() == 2) {
      msg.budget = std::chrono::milliseconds{fields[1]};
    }
    return msg;
  }

  if (phase == Phase::Placement) {
    if (fields.size() != 3) {
      throw ProtocolError("expected 'player row col' for an opponent placement");
    }
    return TurnMessage{
        .type = MessageType::OpponentPlacement,
        .player = player,
        .cell = parse_cell(fields[1], fields[2], header),
    };
  }

  if (fields.size() != 4) {
    throw ProtocolError("expected 'player penguin row col' for an opponent move");
  }

  const int max_penguin = header.players * header.penguins_per_player - 1;
  return TurnMessage{
      .type = MessageType::OpponentSlide,
      .player = player,
      .penguin = parse_field("penguin", fields[1], 0, max_penguin),
      .cell = parse_cell(fields[2], fields[3], header),
  };
}

// ---------------------------------------------------------------------------
// Replies
// ---------------------------------------------------------------------------

std::string format_placement(Cell cell) {
  return cell.to_string();
}

std::string format_slide(PenguinId penguin, Cell to) {
  return std::to_string(penguin) + ' ' + to.to_string();
}

// ---------------------------------------------------------------------------
// Time management
// ---------------------------------------------------------------------------

std::chrono::milliseconds allocate_time(std::chrono::milliseconds budget) noexcept {
  if (budget.count() <= 0) {
    return std::chrono::milliseconds{0};
  }

  const auto reserve = std::max(budget / 10, std::chrono::milliseconds{10});
  return budget > reserve ? budget - reserve : std::chrono::milliseconds{0};
}

// ---------------------------------------------------------------------------
// Board setup
// ---------------------------------------------------------------------------

Board build_board(const Header& header, const std::vector<int>& grids, PlacementRule rule) {
  const std::size_t cells = static_cast<std::size_t>(header.width) * header.height;
  if (grids.size() != 2 * cells) {
    throw ProtocolError("expected " + std::to_string(2 * cells) + " grid values, got " +
                        std::to_string(grids.size()));
  }

  Board board(header.width, header.height, header.players, header.penguins_per_player, rule);

  for (std::size_t i = 0; i < cells; ++i) {
    const auto fish = parse_field("fish", grids[i], 0, MAX_FISH);
    const auto broken = parse_field("broken flag", grids[cells + i], 0, 1);
    board.set_fish(Cell::from_index(i, header.width), broken == 1 ? std::uint8_t{0} : fish);
  }

  return board;
}

// ---------------------------------------------------------------------------
// Log reporter
// ---------------------------------------------------------------------------

LogReporter::LogReporter(std::ostream* out) : out_(out) {}

void LogReporter::send(const search::Report& report) {
  if (out_ == nullptr) {
    return;
  }

  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(report.elapsed()).count();

  std::vector<std::string> info{
      "depth " + std::to_string(report.depth),
      "nodes " + std::to_string(report.nodes),
      "time " + std::to_string(elapsed_ms),
  };

  if (report.pv.has_value()) {
    const auto& [moves, eval] = *report.pv;
    info.push_back("score " + std::to_string(eval));

    if (!moves.empty()) {
      std::string pv;
      for (std::size_t i = 0; i < moves.size(); ++i) {
        pv += compact(moves[i]);
        if (i + 1 < moves.size()) {
          pv += ' ';
        }
      }
      info.push_back("pv " + pv);
    }
  }

  std::ostringstream line;
  line << "info ";
  for (std::size_t i = 0; i < info.size(); ++i) {
    line << info[i];
    if (i + 1 < info.size()) {
      line << ' ';
    }
  }

  *out_ << line.str() << '\n' << std::flush;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

Session::Session(Options options, std::ostream& out, std::ostream* log)
    : options_(std::move(options)), out_(&out), log_(log) {}

const Engine& Session::engine() const {
  if (!engine_.has_value()) {
    throw std::logic_error("no board received yet");
  }
  return *engine_;
}

void Session::log(const std::string& message) const {
  if (log_ != nullptr) {
    *log_ << message << '\n' << std::flush;
  }
}

void Session::feed(const std::string& line) {
  if (split_tokens(line).empty()) {
    return;
  }

  switch (state_) {
  case State::AwaitInit:
    feed_init(line);
    break;
  case State::AwaitTurn:
    feed_turn(line);
    break;
  case State::ComputingMove:
    throw std::logic_error("input received while computing a move");
  case State::GameOver:
    throw ProtocolError("unexpected input after game over: '" + line + "'");
  }
}

void Session::finish() {
  if (state_ == State::AwaitInit) {
    throw ProtocolError("end of input before the board was complete");
  }
  state_ = State::GameOver;
  log("end of input, game over");
}

void Session::feed_init(const std::string& line) {
  if (!header_.has_value()) {
    header_ = parse_header(line);
    log("game: " + std::to_string(header_->width) + "x" + std::to_string(header_->height) +
        ", " + std::to_string(header_->players) + " players, " +
        std::to_string(header_->penguins_per_player) + " penguins each, playing as " +
        std::to_string(header_->me));
    return;
  }

  const std::size_t cells = static_cast<std::size_t>(header_->width) * header_->height;
  const bool in_fish_grid = grids_.size() < cells;
  const std::size_t block_end = in_fish_grid ? cells : 2 * cells;

  const auto values = parse_ints(line);
  if (grids_.size() + values.size() > block_end) {
    throw ProtocolError(std::string("line runs past the end of the ") +
                        (in_fish_grid ? "fish" : "broken tile") + " grid");
  }
  grids_.insert(grids_.end(), values.begin(), values.end());

  if (grids_.size() == 2 * cells) {
    engine_.emplace(build_board(*header_, grids_, options_.placement), header_->me);
    grids_.clear();
    state_ = State::AwaitTurn;
    log("board ready, " + std::to_string(engine_->board().fish_on_board()) + " fish on the floe");
  }
}

void Session::feed_turn(const std::string& line) {
  const auto msg = parse_turn(line, phase_, *header_);

  switch (msg.type) {
  case MessageType::EndOfPhase:
    if (phase_ == Phase::Placement) {
      engine_->finish_placement();
      phase_ = Phase::Movement;
      log("placement over");
    } else {
      state_ = State::GameOver;
      log("game over");
    }
    break;

  case MessageType::OwnTurn:
    play_own_turn(msg);
    break;

  case MessageType::OpponentPlacement:
  case MessageType::OpponentSlide:
    apply_opponent_move(msg);
    break;
  }
}

void Session::apply_opponent_move(const TurnMessage& msg) {
  const Board& board = engine_->board();
  Move mv;

  if (msg.type == MessageType::OpponentPlacement) {
    mv = Move::placement(*msg.cell);
  } else {
    if (*msg.penguin >= board.penguins().size()) {
      throw ProtocolError("penguin " + std::to_string(*msg.penguin) + " has not been placed");
    }
    const Penguin& penguin = board.penguins()[*msg.penguin];
    if (penguin.owner != msg.player) {
      throw ProtocolError("penguin " + std::to_string(*msg.penguin) +
                          " does not belong to player " + std::to_string(msg.player));
    }
    mv = Move::slide(penguin.cell, *msg.cell);
  }

  if (!is_legal_move(board, mv, msg.player)) {
    throw ProtocolError("illegal move from player " + std::to_string(msg.player) + ": " +
                        describe(mv));
  }

  const auto captured = engine_->apply_move(mv, msg.player);
  log("player " + std::to_string(msg.player) + ": " + describe(mv) +
      (mv.is_slide() ? ", captured " + std::to_string(captured) : ""));
}

void Session::play_own_turn(const TurnMessage& msg) {
  const Board& board = engine_->board();
  if (phase_ == Phase::Placement && !board.is_placement_phase()) {
    throw ProtocolError("asked to place a penguin after every penguin is down");
  }

  state_ = State::ComputingMove;

  search::Limits limits;
  limits.depth = options_.depth;
  limits.time = allocate_time(msg.budget.value_or(options_.movetime));

  LogReporter reporter(log_);
  const auto result = engine_->search(limits, reporter);

  std::string reply;

  if (const auto best = result.best_move()) {
    if (!is_legal_move(board, *best, engine_->me())) {
      throw InvalidMoveError("search chose an illegal move: " + describe(*best));
    }

    if (best->is_placement()) {
      reply = format_placement(best->to);
    } else {
      reply = format_slide(*board.penguin_at(*best->from), best->to);
    }

    engine_->apply_move(*best, engine_->me());
    log("played " + describe(*best) + " (depth " + std::to_string(result.depth) + ", score " +
        std::to_string(result.eval) + ", nodes " + std::to_string(result.nodes) + ")");
  } else {
    reply = std::string(PASS_TOKEN);
    log("no legal move, passing");
  }

  *out_ << reply << '\n' << std::flush;
  state_ = State::AwaitTurn;
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

void run_loop(std::istream& in, std::ostream& out, std::ostream* log, const Options& options) {
  Session session(options, out, log);

  std::string line;
  while (session.state() != State::GameOver && std::getline(in, line)) {
    session.feed(line);
  }

  if (session.state() != State::GameOver) {
    session.finish();
  }
}

} // namespace floe::protocol
