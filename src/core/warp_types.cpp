#include "orbitwarp/core/warp_types.h"

#include <cstdio>

namespace orbitwarp {

DestinationId destination_key(const Destination& d) {
  if (!d.id.empty()) return d.id;
  char buf[96];
  std::snprintf(buf, sizeof(buf), "%g,%g", d.position.x, d.position.y);
  return DestinationId(buf);
}

} // namespace orbitwarp
