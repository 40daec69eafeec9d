#pragma once

#include <cstdint>

namespace floe {

// Player ids are dense, 0..players-1, and play in cyclic order.
using Player = std::uint8_t;

inline constexpr std::uint8_t MIN_PLAYERS = 2;
inline constexpr std::uint8_t MAX_PLAYERS = 8;

constexpr Player next_player(Player player, std::uint8_t players) {
  return static_cast<Player>((player + 1) % players);
}

} // namespace floe
