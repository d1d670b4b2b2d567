#pragma once

#include <string>
#include <vector>

#include "orbitwarp/core/vec2.h"

namespace orbitwarp {

// Stable identifier of a warp destination (planet / waypoint).
using DestinationId = std::string;

// A waypoint the player can warp to.
//
// `discovered` mirrors the discovery registry: only discovered destinations can be
// targeted or committed to.
struct Destination {
  DestinationId id;
  std::string name;
  Vec2 position;
  double radius{0.0};
  bool discovered{false};
};

// Memory key of a destination. Destinations without an id are keyed by their
// coordinates ("x,y").
DestinationId destination_key(const Destination& d);

// Something hostile near the player (asteroid field, hunter drone, ...).
struct Danger {
  Vec2 position;
  double radius{0.0};
  std::string kind;
};

// Read-only view of the player owned by the game's physics layer. The warp
// subsystem only writes it when a warp arrives.
struct PlayerModel {
  Vec2 position;
  Vec2 velocity;
  double health{100.0};  // 0..100
  std::vector<Danger> nearby_dangers;
};

// Situation in which a warp is quoted or attempted.
//
// Captured by value into the in-flight attempt so learning at arrival sees the
// same situation the quote saw.
struct WarpContext {
  double health{100.0};
  int nearby_dangers{0};
  // Subsystem clock, seconds.
  double now_seconds{0.0};
};

inline WarpContext make_warp_context(const PlayerModel& player, double now_seconds) {
  WarpContext ctx;
  ctx.health = player.health;
  ctx.nearby_dangers = static_cast<int>(player.nearby_dangers.size());
  ctx.now_seconds = now_seconds;
  return ctx;
}

} // namespace orbitwarp
