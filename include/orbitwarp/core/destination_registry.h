#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "orbitwarp/core/warp_types.h"
#include "orbitwarp/util/json.h"

namespace orbitwarp {

// The discovery registry: every waypoint the game knows about, and which ones the
// player has found. Keeps insertion order so listings are stable.
class DestinationRegistry {
 public:
  // Adds or replaces (by destination key). Returns false for an entry without id
  // or position.
  bool add(const Destination& d);

  const Destination* find(const DestinationId& id) const;

  // Marks a destination discovered. Returns false if unknown.
  bool discover(const DestinationId& id);
  bool is_discovered(const DestinationId& id) const;

  const std::vector<Destination>& all() const { return destinations_; }
  std::vector<Destination> discovered() const;
  std::size_t size() const { return destinations_.size(); }
  void clear() { destinations_.clear(); }

  // Galaxy document:
  // {"destinations": [{"id": "...", "name": "...", "x": 0, "y": 0, "radius": 40,
  //                    "discovered": true}, ...]}
  // Malformed entries are skipped with a warning. Throws std::runtime_error when
  // the document has no destinations array.
  static DestinationRegistry from_json(const json::Value& doc);
  static DestinationRegistry load_from_file(const std::string& path);

  json::Value to_json() const;

 private:
  std::vector<Destination> destinations_;
};

} // namespace orbitwarp
