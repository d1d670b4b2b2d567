#pragma once

#include <map>
#include <string>
#include <vector>

#include "orbitwarp/core/energy_pool.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/core/warp_memory.h"
#include "orbitwarp/util/json.h"

namespace orbitwarp {

inline constexpr int kWarpSaveVersion = 1;

// Everything the warp subsystem persists under its key-value store key.
struct WarpSaveData {
  int save_version{kWarpSaveVersion};

  WarpMemoryState memory;

  bool has_energy{false};
  EnergySnapshot energy;

  bool unlocked{false};
  // Subsystem clock; resumed on load so memory timestamps stay monotonic.
  double clock_seconds{0.0};

  // Fields this version does not understand, written back untouched.
  json::Object unknown_fields;
  // Per section ("behavior_profile", "efficiency_metrics", ...).
  std::map<std::string, json::Object> unknown_section_fields;
  // Per entry of a keyed section: routes by route key, planet_affinity by
  // destination id, failed_attempts by failed_attempt_entry_key().
  std::map<std::string, std::map<std::string, json::Object>> unknown_entry_fields;
};

// Identifies a failed-attempt log entry across a save/load cycle.
std::string failed_attempt_entry_key(const FailedAttempt& f);

json::Value warp_save_to_json_value(const WarpSaveData& data);
std::string serialize_warp_save(const WarpSaveData& data);

// Never throws. Every field is read independently: a missing field takes its
// default, a malformed one takes its default and is reported (log::warn, and
// appended to `recovered` as a dotted path when given). A document that is not a
// JSON object yields a fresh save.
//
// `cfg` provides the ring-buffer capacities of the restored memory.
WarpSaveData warp_save_from_json_value(const json::Value& doc, const MemoryConfig& cfg,
                                       std::vector<std::string>* recovered = nullptr);
WarpSaveData deserialize_warp_save(const std::string& json_text, const MemoryConfig& cfg,
                                   std::vector<std::string>* recovered = nullptr);

} // namespace orbitwarp
