#include "orbitwarp/core/destination_registry.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "orbitwarp/util/file_io.h"
#include "orbitwarp/util/log.h"
#include "orbitwarp/util/strings.h"

namespace orbitwarp {

bool DestinationRegistry::add(const Destination& d) {
  if (!std::isfinite(d.position.x) || !std::isfinite(d.position.y)) return false;
  const DestinationId key = destination_key(d);
  if (key.empty()) return false;

  for (auto& existing : destinations_) {
    if (destination_key(existing) == key) {
      existing = d;
      return true;
    }
  }
  destinations_.push_back(d);
  return true;
}

const Destination* DestinationRegistry::find(const DestinationId& id) const {
  for (const auto& d : destinations_) {
    if (destination_key(d) == id) return &d;
  }
  return nullptr;
}

bool DestinationRegistry::discover(const DestinationId& id) {
  for (auto& d : destinations_) {
    if (destination_key(d) != id) continue;
    if (!d.discovered) {
      d.discovered = true;
      log::info("Discovered " + (d.name.empty() ? id : d.name));
    }
    return true;
  }
  return false;
}

bool DestinationRegistry::is_discovered(const DestinationId& id) const {
  const Destination* d = find(id);
  return d && d->discovered;
}

std::vector<Destination> DestinationRegistry::discovered() const {
  std::vector<Destination> out;
  for (const auto& d : destinations_) {
    if (d.discovered) out.push_back(d);
  }
  return out;
}

DestinationRegistry DestinationRegistry::from_json(const json::Value& doc) {
  const json::Object* root = doc.as_object();
  const json::Array* arr = root ? json::find_array(*root, "destinations") : nullptr;
  if (!arr) throw std::runtime_error("Galaxy document has no 'destinations' array");

  DestinationRegistry reg;
  std::size_t index = 0;
  for (const auto& v : *arr) {
    ++index;
    const json::Object* o = v.as_object();
    if (!o) {
      log::warn("Galaxy: destination #" + std::to_string(index) + " is not an object; skipped");
      continue;
    }
    Destination d;
    d.id = trim_copy(json::string_or(*o, "id", ""));
    d.name = trim_copy(json::string_or(*o, "name", d.id));
    const double nan = std::nan("");
    d.position = Vec2{json::number_or(*o, "x", nan), json::number_or(*o, "y", nan)};
    d.radius = std::max(0.0, json::number_or(*o, "radius", 0.0));
    d.discovered = json::bool_or(*o, "discovered", false);

    if (!reg.add(d)) {
      log::warn("Galaxy: destination #" + std::to_string(index) + " has no usable position; skipped");
    }
  }
  return reg;
}

DestinationRegistry DestinationRegistry::load_from_file(const std::string& path) {
  return from_json(json::parse(read_text_file(path)));
}

json::Value DestinationRegistry::to_json() const {
  json::Array arr;
  arr.reserve(destinations_.size());
  for (const auto& d : destinations_) {
    json::Object o;
    o["id"] = d.id;
    o["name"] = d.name;
    o["x"] = d.position.x;
    o["y"] = d.position.y;
    o["radius"] = d.radius;
    o["discovered"] = d.discovered;
    arr.push_back(json::Value(std::move(o)));
  }
  json::Object root;
  root["destinations"] = json::Value(std::move(arr));
  return json::Value(std::move(root));
}

} // namespace orbitwarp
