#include "orbitwarp/core/warp_serialization.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <set>
#include <utility>

#include "orbitwarp/core/route_key.h"
#include "orbitwarp/util/log.h"

namespace orbitwarp {
namespace {

using json::Array;
using json::Object;

const char* const kRoutes = "routes";
const char* const kBehavior = "behavior_profile";
const char* const kAffinity = "planet_affinity";
const char* const kEfficiency = "efficiency_metrics";
const char* const kEmergency = "emergency_patterns";
const char* const kEnergy = "energy";
const char* const kFailed = "failed_attempts";

class Recovery {
 public:
  explicit Recovery(std::vector<std::string>* out) : out_(out) {}

  void note(const std::string& field, const std::string& problem) {
    log::warn("Warp save: " + field + " " + problem + "; using default");
    if (out_) out_->push_back(field);
  }

 private:
  std::vector<std::string>* out_;
};

std::string join(const std::string& section, const std::string& key) {
  return section.empty() ? key : section + "." + key;
}

// Missing -> def silently. Present but not a finite number (or negative when
// non_negative is set) -> def, reported.
double read_number(const Object& o, const std::string& key, const std::string& section, double def,
                   bool non_negative, Recovery& rec) {
  const json::Value* v = json::find(o, key);
  if (!v) return def;
  const double* d = v->as_number();
  if (!d || !std::isfinite(*d) || (non_negative && *d < 0.0)) {
    rec.note(join(section, key), "is malformed");
    return def;
  }
  return *d;
}

std::uint32_t read_count(const Object& o, const std::string& key, const std::string& section, std::uint32_t def,
                         Recovery& rec) {
  const json::Value* v = json::find(o, key);
  if (!v) return def;
  const double* d = v->as_number();
  if (!d || !std::isfinite(*d) || *d < 0.0 || *d > 4294967295.0 || std::floor(*d) != *d) {
    rec.note(join(section, key), "is not a valid count");
    return def;
  }
  return static_cast<std::uint32_t>(*d);
}

bool read_bool(const Object& o, const std::string& key, const std::string& section, bool def, Recovery& rec) {
  const json::Value* v = json::find(o, key);
  if (!v) return def;
  const bool* b = v->as_bool();
  if (!b) {
    rec.note(join(section, key), "is not a boolean");
    return def;
  }
  return *b;
}

// Returns the section object, or nullptr (reporting it when present but not an object).
const Object* read_section(const Object& root, const std::string& key, Recovery& rec) {
  const json::Value* v = json::find(root, key);
  if (!v) return nullptr;
  const Object* o = v->as_object();
  if (!o) rec.note(key, "is not an object");
  return o;
}

Object unknown_of(const Object& o, const std::set<std::string>& known) {
  Object out;
  for (const auto& kv : o) {
    if (!known.count(kv.first)) out[kv.first] = kv.second;
  }
  return out;
}

// Unknown fields first, so the known ones always win.
Object with_unknown(const WarpSaveData& d, const std::string& section) {
  auto it = d.unknown_section_fields.find(section);
  return it == d.unknown_section_fields.end() ? Object{} : it->second;
}

Object with_unknown_entry(const WarpSaveData& d, const std::string& section, const std::string& entry) {
  auto sit = d.unknown_entry_fields.find(section);
  if (sit == d.unknown_entry_fields.end()) return Object{};
  auto it = sit->second.find(entry);
  return it == sit->second.end() ? Object{} : it->second;
}

void keep_unknown_entry(WarpSaveData& d, const std::string& section, const std::string& entry, Object extra) {
  if (extra.empty()) return;
  d.unknown_entry_fields[section][entry] = std::move(extra);
}

void read_routes(const Object& root, WarpSaveData& d, Recovery& rec) {
  const Object* routes = read_section(root, kRoutes, rec);
  if (!routes) return;
  for (const auto& kv : *routes) {
    const std::string field = std::string(kRoutes) + "." + kv.first;
    RouteKey key;
    if (!parse_route_key(kv.first, &key)) {
      rec.note(field, "has a malformed route key");
      continue;
    }
    const Object* o = kv.second.as_object();
    if (!o) {
      rec.note(field, "is not an object");
      continue;
    }
    RouteStat st;
    st.uses = read_count(*o, "uses", field, 0, rec);
    st.total_cost_paid = read_number(*o, "total_cost_paid", field, 0.0, true, rec);
    if (st.uses == 0) continue;
    d.memory.routes[key] = st;
    keep_unknown_entry(d, kRoutes, route_key_to_string(key), unknown_of(*o, {"uses", "total_cost_paid"}));
  }
}

void read_behavior(const Object& root, WarpSaveData& d, Recovery& rec) {
  const Object* o = read_section(root, kBehavior, rec);
  if (!o) return;
  BehaviorProfile& b = d.memory.behavior;
  b.total_warps = read_count(*o, "total_warps", kBehavior, 0, rec);
  b.emergency_warps = read_count(*o, "emergency_warps", kBehavior, 0, rec);
  b.exploration_warps = read_count(*o, "exploration_warps", kBehavior, 0, rec);
  b.return_warps = read_count(*o, "return_warps", kBehavior, 0, rec);
  b.warp_chains = read_count(*o, "warp_chains", kBehavior, 0, rec);
  b.last_warp_time = read_number(*o, "last_warp_time", kBehavior, 0.0, false, rec);
  b.average_warp_distance = read_number(*o, "average_warp_distance", kBehavior, 0.0, true, rec);
  // skill_level is derived and recomputed on restore; it is written for readers only.
  d.unknown_section_fields[kBehavior] =
      unknown_of(*o, {"total_warps", "emergency_warps", "exploration_warps", "return_warps", "warp_chains",
                      "last_warp_time", "average_warp_distance", "skill_level"});
}

void read_affinity(const Object& root, WarpSaveData& d, Recovery& rec) {
  const Object* affinity = read_section(root, kAffinity, rec);
  if (!affinity) return;
  for (const auto& kv : *affinity) {
    const std::string field = std::string(kAffinity) + "." + kv.first;
    const Object* o = kv.second.as_object();
    if (kv.first.empty() || !o) {
      rec.note(field, "is not a valid destination entry");
      continue;
    }
    PlanetAffinity a;
    a.visits = read_count(*o, "visits", field, 0, rec);
    a.last_visit_time = read_number(*o, "last_visit_time", field, 0.0, false, rec);
    // affinity itself is renormalized from the visit counts on restore.
    if (a.visits == 0) continue;
    d.memory.planet_affinity[kv.first] = a;
    keep_unknown_entry(d, kAffinity, kv.first, unknown_of(*o, {"visits", "last_visit_time", "affinity"}));
  }
}

void read_efficiency(const Object& root, WarpSaveData& d, Recovery& rec) {
  const Object* o = read_section(root, kEfficiency, rec);
  if (!o) return;
  EfficiencyMetrics& e = d.memory.efficiency;
  e.wasted_energy = read_number(*o, "wasted_energy", kEfficiency, 0.0, true, rec);
  e.optimal_routes = read_count(*o, "optimal_routes", kEfficiency, 0, rec);
  e.adaptation_level = std::clamp(read_number(*o, "adaptation_level", kEfficiency, 0.0, true, rec), 0.0, 1.0);

  if (const json::Value* v = json::find(*o, "learning_curve")) {
    const Array* arr = v->as_array();
    if (!arr) {
      rec.note(std::string(kEfficiency) + ".learning_curve", "is not an array");
    } else {
      std::size_t bad = 0;
      for (const auto& sv : *arr) {
        const Object* so = sv.as_object();
        const double cost = so ? json::number_or(*so, "cost", -1.0) : -1.0;
        if (!so || cost < 0.0) {
          ++bad;
          continue;
        }
        LearningSample s;
        s.time = json::number_or(*so, "time", 0.0);
        s.cost = cost;
        s.was_optimal = json::bool_or(*so, "was_optimal", false);
        e.learning_curve.push_back(s);
      }
      if (bad > 0) {
        rec.note(std::string(kEfficiency) + ".learning_curve",
                 "had " + std::to_string(bad) + " malformed sample(s) dropped");
      }
    }
  }
  d.unknown_section_fields[kEfficiency] =
      unknown_of(*o, {"wasted_energy", "optimal_routes", "learning_curve", "adaptation_level"});
}

void read_emergency(const Object& root, WarpSaveData& d, Recovery& rec) {
  const Object* o = read_section(root, kEmergency, rec);
  if (!o) return;
  EmergencyPatterns& e = d.memory.emergency;
  e.low_health_warps = read_count(*o, "low_health_warps", kEmergency, 0, rec);
  e.panic_warps = read_count(*o, "panic_warps", kEmergency, 0, rec);
  e.last_emergency_time = read_number(*o, "last_emergency_time", kEmergency, 0.0, false, rec);
  d.unknown_section_fields[kEmergency] = unknown_of(*o, {"low_health_warps", "panic_warps", "last_emergency_time"});
}

void read_energy(const Object& root, WarpSaveData& d, Recovery& rec) {
  const Object* o = read_section(root, kEnergy, rec);
  if (!o) return;
  const double nan = std::nan("");
  d.energy.energy = read_number(*o, "energy", kEnergy, nan, true, rec);
  d.energy.max_energy = read_number(*o, "max_energy", kEnergy, nan, true, rec);
  d.energy.regen_per_second = read_number(*o, "regen_per_second", kEnergy, nan, true, rec);
  d.has_energy = true;
  d.unknown_section_fields[kEnergy] = unknown_of(*o, {"energy", "max_energy", "regen_per_second"});
}

void read_failed(const Object& root, WarpSaveData& d, Recovery& rec) {
  const Object* o = read_section(root, kFailed, rec);
  if (!o) return;
  d.memory.failed_attempts = read_count(*o, "count", kFailed, 0, rec);

  if (const json::Value* v = json::find(*o, "recent")) {
    const Array* arr = v->as_array();
    if (!arr) {
      rec.note(std::string(kFailed) + ".recent", "is not an array");
    } else {
      for (const auto& fv : *arr) {
        const Object* fo = fv.as_object();
        if (!fo) continue;
        FailedAttempt f;
        f.time = json::number_or(*fo, "time", 0.0);
        f.destination = json::string_or(*fo, "destination", "");
        f.cost_needed = json::number_or(*fo, "cost_needed", 0.0);
        f.energy_available = json::number_or(*fo, "energy_available", 0.0);
        f.shortfall = std::max(0.0, f.cost_needed - f.energy_available);
        d.memory.failed_attempt_log.push_back(f);
        keep_unknown_entry(d, kFailed, failed_attempt_entry_key(f),
                           unknown_of(*fo, {"time", "destination", "cost_needed", "energy_available", "shortfall"}));
      }
    }
  }
  d.unknown_section_fields[kFailed] = unknown_of(*o, {"count", "recent"});
}

} // namespace

std::string failed_attempt_entry_key(const FailedAttempt& f) {
  return json::stringify(json::Value(f.time)) + "@" + f.destination;
}

json::Value warp_save_to_json_value(const WarpSaveData& d) {
  Object root = d.unknown_fields;
  const WarpMemoryState& m = d.memory;

  root["save_version"] = static_cast<double>(d.save_version);
  root["unlocked"] = d.unlocked;
  root["clock_seconds"] = d.clock_seconds;

  {
    Object routes;
    for (const auto& kv : m.routes) {
      const std::string key = route_key_to_string(kv.first);
      Object o = with_unknown_entry(d, kRoutes, key);
      o["uses"] = static_cast<double>(kv.second.uses);
      o["total_cost_paid"] = kv.second.total_cost_paid;
      routes[key] = std::move(o);
    }
    root[kRoutes] = std::move(routes);
  }

  {
    Object o = with_unknown(d, kBehavior);
    const BehaviorProfile& b = m.behavior;
    o["total_warps"] = static_cast<double>(b.total_warps);
    o["emergency_warps"] = static_cast<double>(b.emergency_warps);
    o["exploration_warps"] = static_cast<double>(b.exploration_warps);
    o["return_warps"] = static_cast<double>(b.return_warps);
    o["warp_chains"] = static_cast<double>(b.warp_chains);
    o["last_warp_time"] = b.last_warp_time;
    o["average_warp_distance"] = b.average_warp_distance;
    o["skill_level"] = b.skill_level;
    root[kBehavior] = std::move(o);
  }

  {
    Object affinity;
    for (const auto& kv : m.planet_affinity) {
      Object o = with_unknown_entry(d, kAffinity, kv.first);
      o["visits"] = static_cast<double>(kv.second.visits);
      o["last_visit_time"] = kv.second.last_visit_time;
      o["affinity"] = kv.second.affinity;
      affinity[kv.first] = std::move(o);
    }
    root[kAffinity] = std::move(affinity);
  }

  {
    Object o = with_unknown(d, kEfficiency);
    const EfficiencyMetrics& e = m.efficiency;
    o["wasted_energy"] = e.wasted_energy;
    o["optimal_routes"] = static_cast<double>(e.optimal_routes);
    o["adaptation_level"] = e.adaptation_level;
    Array curve;
    curve.reserve(e.learning_curve.size());
    for (const auto& s : e.learning_curve) {
      Object so;
      so["time"] = s.time;
      so["cost"] = s.cost;
      so["was_optimal"] = s.was_optimal;
      curve.push_back(std::move(so));
    }
    o["learning_curve"] = std::move(curve);
    root[kEfficiency] = std::move(o);
  }

  {
    Object o = with_unknown(d, kEmergency);
    o["low_health_warps"] = static_cast<double>(m.emergency.low_health_warps);
    o["panic_warps"] = static_cast<double>(m.emergency.panic_warps);
    o["last_emergency_time"] = m.emergency.last_emergency_time;
    root[kEmergency] = std::move(o);
  }

  if (d.has_energy) {
    Object o = with_unknown(d, kEnergy);
    o["energy"] = d.energy.energy;
    o["max_energy"] = d.energy.max_energy;
    o["regen_per_second"] = d.energy.regen_per_second;
    root[kEnergy] = std::move(o);
  }

  {
    Object o = with_unknown(d, kFailed);
    o["count"] = static_cast<double>(m.failed_attempts);
    Array recent;
    for (const auto& f : m.failed_attempt_log) {
      Object fo = with_unknown_entry(d, kFailed, failed_attempt_entry_key(f));
      fo["time"] = f.time;
      fo["destination"] = f.destination;
      fo["cost_needed"] = f.cost_needed;
      fo["energy_available"] = f.energy_available;
      fo["shortfall"] = f.shortfall;
      recent.push_back(std::move(fo));
    }
    o["recent"] = std::move(recent);
    root[kFailed] = std::move(o);
  }

  return json::Value(std::move(root));
}

std::string serialize_warp_save(const WarpSaveData& d) { return json::stringify(warp_save_to_json_value(d), 2); }

WarpSaveData warp_save_from_json_value(const json::Value& doc, const MemoryConfig& cfg,
                                       std::vector<std::string>* recovered) {
  Recovery rec(recovered);
  WarpSaveData d;
  d.memory.efficiency.learning_curve.set_capacity(static_cast<std::size_t>(std::max(0, cfg.learning_curve_capacity)));
  d.memory.failed_attempt_log.set_capacity(static_cast<std::size_t>(std::max(0, cfg.failed_attempt_log_capacity)));

  const Object* root = doc.as_object();
  if (!root) {
    rec.note("document", "is not a JSON object");
    return d;
  }

  {
    const json::Value* v = json::find(*root, "save_version");
    const double* n = v ? v->as_number() : nullptr;
    if (v && (!n || !std::isfinite(*n) || *n < 1.0)) rec.note("save_version", "is malformed");
    const int loaded = (n && std::isfinite(*n) && *n >= 1.0) ? static_cast<int>(*n) : kWarpSaveVersion;
    if (loaded > kWarpSaveVersion) {
      log::warn("Warp save: written by a newer version (" + std::to_string(loaded) + "); unknown data is kept");
    }
    d.save_version = std::max(loaded, kWarpSaveVersion);
  }

  d.unlocked = read_bool(*root, "unlocked", "", false, rec);
  d.clock_seconds = read_number(*root, "clock_seconds", "", 0.0, true, rec);

  read_routes(*root, d, rec);
  read_behavior(*root, d, rec);
  read_affinity(*root, d, rec);
  read_efficiency(*root, d, rec);
  read_emergency(*root, d, rec);
  read_energy(*root, d, rec);
  read_failed(*root, d, rec);

  d.unknown_fields = unknown_of(*root, {"save_version", "unlocked", "clock_seconds", kRoutes, kBehavior, kAffinity,
                                        kEfficiency, kEmergency, kEnergy, kFailed});
  return d;
}

WarpSaveData deserialize_warp_save(const std::string& json_text, const MemoryConfig& cfg,
                                   std::vector<std::string>* recovered) {
  json::Value doc;
  try {
    doc = json::parse(json_text);
  } catch (const std::exception& e) {
    log::warn(std::string("Warp save: not valid JSON (") + e.what() + "); starting with a fresh memory");
    if (recovered) recovered->push_back("document");
    WarpSaveData fresh;
    fresh.memory.efficiency.learning_curve.set_capacity(
        static_cast<std::size_t>(std::max(0, cfg.learning_curve_capacity)));
    fresh.memory.failed_attempt_log.set_capacity(
        static_cast<std::size_t>(std::max(0, cfg.failed_attempt_log_capacity)));
    return fresh;
  }
  return warp_save_from_json_value(doc, cfg, recovered);
}

} // namespace orbitwarp
