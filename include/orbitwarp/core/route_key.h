#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

#include "orbitwarp/core/vec2.h"
#include "orbitwarp/core/warp_types.h"

namespace orbitwarp {

// Identity of a route: the grid cell the warp started from plus the destination.
struct RouteKey {
  std::int64_t cell_x{0};
  std::int64_t cell_y{0};
  DestinationId destination;

  bool operator==(const RouteKey& o) const {
    return cell_x == o.cell_x && cell_y == o.cell_y && destination == o.destination;
  }
  bool operator!=(const RouteKey& o) const { return !(*this == o); }
  bool operator<(const RouteKey& o) const {
    return std::tie(cell_x, cell_y, destination) < std::tie(o.cell_x, o.cell_y, o.destination);
  }
};

struct RouteKeyHash {
  std::size_t operator()(const RouteKey& k) const {
    std::size_t h = std::hash<std::int64_t>{}(k.cell_x);
    h ^= std::hash<std::int64_t>{}(k.cell_y) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(k.destination) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

// Quantizes `source` into cells of `cell_pitch` world units (floor division, so
// negative coordinates land in negative cells).
RouteKey make_route_key(const Vec2& source, const DestinationId& destination, double cell_pitch);

// "cx,cy->destination"
std::string route_key_to_string(const RouteKey& k);

// Inverse of route_key_to_string. Returns false on malformed text.
bool parse_route_key(const std::string& text, RouteKey* out);

} // namespace orbitwarp
