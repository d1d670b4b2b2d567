#include <iostream>
#include <string>
#include <unordered_set>

#include "orbitwarp/core/route_key.h"

#define OW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_route_key() {
  using namespace orbitwarp;

  // Quantization uses floor, so negative coordinates land in negative cells.
  const RouteKey k = make_route_key(Vec2{150.0, -20.0}, "ember", 100.0);
  OW_ASSERT(k.cell_x == 1);
  OW_ASSERT(k.cell_y == -1);
  OW_ASSERT(k.destination == "ember");

  // Sources within the same cell share a route.
  OW_ASSERT(make_route_key(Vec2{101.0, -99.0}, "ember", 100.0) == k);
  OW_ASSERT(make_route_key(Vec2{99.0, -20.0}, "ember", 100.0) != k);
  OW_ASSERT(make_route_key(Vec2{150.0, -20.0}, "glacier", 100.0) != k);

  OW_ASSERT(route_key_to_string(k) == "1,-1->ember");

  RouteKey parsed;
  OW_ASSERT(parse_route_key("1,-1->ember", &parsed));
  OW_ASSERT(parsed == k);

  // Destination ids may themselves contain separators.
  OW_ASSERT(parse_route_key("-3,7->12.5,-40", &parsed));
  OW_ASSERT(parsed.cell_x == -3 && parsed.cell_y == 7);
  OW_ASSERT(parsed.destination == "12.5,-40");

  OW_ASSERT(!parse_route_key("", &parsed));
  OW_ASSERT(!parse_route_key("ember", &parsed));
  OW_ASSERT(!parse_route_key("1,2", &parsed));
  OW_ASSERT(!parse_route_key("1->ember", &parsed));
  OW_ASSERT(!parse_route_key("1,x->ember", &parsed));
  OW_ASSERT(!parse_route_key("1,2->", &parsed));

  // Hash/equality work as a map key; ordering is total.
  std::unordered_set<RouteKey, RouteKeyHash> set;
  set.insert(k);
  set.insert(make_route_key(Vec2{120.0, -80.0}, "ember", 100.0));
  set.insert(make_route_key(Vec2{0.0, 0.0}, "ember", 100.0));
  OW_ASSERT(set.size() == 2);

  const RouteKey a = make_route_key(Vec2{0.0, 0.0}, "a", 100.0);
  const RouteKey b = make_route_key(Vec2{0.0, 0.0}, "b", 100.0);
  OW_ASSERT(a < b);
  OW_ASSERT(!(b < a));
  OW_ASSERT(!(a < a));

  // A bad pitch falls back to the default cell size.
  OW_ASSERT(make_route_key(Vec2{150.0, 0.0}, "x", 0.0).cell_x == 1);

  return 0;
}
