#include "floe/engine.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace floe {

Engine::Engine(Board board, Player me) : board_(std::move(board)), me_(me) {
  if (me_ >= board_.players()) {
    throw std::invalid_argument("player id " + std::to_string(me_) + " is not in the game");
  }
}

std::uint8_t Engine::apply_move(const Move& mv, Player player) {
  return board_.apply_move(mv, player);
}

search::SearchResult Engine::search(const search::Limits& limits,
                                    search::Reporter& reporter) const {
  Board scratch = board_;
  return search::search(scratch, me_, limits, reporter);
}

} // namespace floe
