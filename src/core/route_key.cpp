#include "orbitwarp/core/route_key.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace orbitwarp {
namespace {

std::int64_t quantize(double v, double pitch) {
  if (!std::isfinite(v)) return 0;
  const double cell = std::floor(v / pitch);
  constexpr double kLimit = 9.0e18;
  if (cell > kLimit) return std::numeric_limits<std::int64_t>::max();
  if (cell < -kLimit) return std::numeric_limits<std::int64_t>::min();
  return static_cast<std::int64_t>(cell);
}

bool parse_int64(const std::string& s, std::int64_t* out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end != s.c_str() + s.size()) return false;
  *out = static_cast<std::int64_t>(v);
  return true;
}

} // namespace

RouteKey make_route_key(const Vec2& source, const DestinationId& destination, double cell_pitch) {
  if (!(cell_pitch > 0.0)) cell_pitch = 100.0;
  RouteKey k;
  k.cell_x = quantize(source.x, cell_pitch);
  k.cell_y = quantize(source.y, cell_pitch);
  k.destination = destination;
  return k;
}

std::string route_key_to_string(const RouteKey& k) {
  return std::to_string(k.cell_x) + "," + std::to_string(k.cell_y) + "->" + k.destination;
}

bool parse_route_key(const std::string& text, RouteKey* out) {
  // The cell part never contains '>', so the first "->" is the separator.
  const std::size_t arrow = text.find("->");
  if (arrow == std::string::npos) return false;
  const std::string cells = text.substr(0, arrow);
  const std::size_t comma = cells.find(',');
  if (comma == std::string::npos) return false;

  RouteKey k;
  if (!parse_int64(cells.substr(0, comma), &k.cell_x)) return false;
  if (!parse_int64(cells.substr(comma + 1), &k.cell_y)) return false;
  k.destination = text.substr(arrow + 2);
  if (k.destination.empty()) return false;
  if (out) *out = std::move(k);
  return true;
}

} // namespace orbitwarp
