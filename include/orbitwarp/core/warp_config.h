#pragma once

#include <string>
#include <vector>

#include "orbitwarp/util/json.h"

namespace orbitwarp {

struct EnergyConfig {
  double max_energy{1000.0};
  double regen_per_second{50.0};

  // base_cost(d) = max(min_warp_cost, floor(d / distance_per_cost_unit)).
  double min_warp_cost{50.0};
  double distance_per_cost_unit{100.0};

  // Each capacity upgrade level adds this fraction of max_energy.
  double capacity_upgrade_step{0.2};
  // Each regeneration upgrade level adds this fraction of regen_per_second.
  double regen_upgrade_step{0.25};
};

struct MemoryConfig {
  // Source positions are quantized into square cells of this size for route keys.
  double route_cell_pitch{100.0};

  int familiarity_saturation_uses{10};
  double familiarity_max_reduction{0.25};

  double mastery_max_reduction{0.25};
  double mastery_floor{0.75};

  double exploration_first_visit_bonus{0.85};
  double exploration_early_visit_bonus{0.90};
  // Visits below this count still get the early-visit bonus.
  int exploration_early_visit_limit{3};

  double affinity_max_reduction{0.15};

  // Emergency detection.
  double critical_health_ratio{0.3};
  double low_health_ratio{0.6};
  double critical_health_weight{0.4};
  double low_health_weight{0.2};
  double rapid_warp_window_seconds{5.0};
  double rapid_warp_weight{0.3};
  double danger_weight{0.4};
  double emergency_threshold{0.5};

  // A warp started within this many seconds of the previous one is a chain.
  double chain_window_seconds{10.0};

  // Warps at or below this cost count as optimal route choices.
  double optimal_cost_threshold{100.0};

  int learning_curve_capacity{50};
  int adaptation_window{10};
  // Average per-sample cost drop that maps to adaptation_level 1.0.
  double adaptation_scale{20.0};

  // Consolidation cadence and capacity policy.
  int consolidate_every_warps{10};
  int consolidate_min_route_uses{3};
  int consolidated_curve_samples{30};

  int failed_attempt_log_capacity{20};
};

struct CostConfig {
  // Emergency relief: multiplier = max(emergency_floor, emergency_base - score * emergency_slope)
  // once the emergency score exceeds MemoryConfig::emergency_threshold.
  double emergency_base{0.7};
  double emergency_slope{0.3};
  double emergency_floor{0.4};

  // No combination of bonuses may push a quote below this fraction of the base cost.
  double min_cost_fraction{0.25};
};

struct WarpDriveConfig {
  double warp_duration_seconds{2.0};
  // Arrival places the player this far outside the destination's radius.
  double arrival_standoff{30.0};
  // Effect envelope fade-out rate once the warp is over (alpha per second).
  double effect_fade_per_second{2.0};
};

struct TargetingConfig {
  double selection_radius{50.0};
};

struct WarpConfig {
  EnergyConfig energy;
  MemoryConfig memory;
  CostConfig cost;
  WarpDriveConfig drive;
  TargetingConfig targeting;

  // Key under which the learned state is stored in the key-value store.
  std::string persistence_key{"orbitwarp.warp_drive"};
};

// Applies the overrides present in a tuning document on top of `base`.
//
// Expected layout: {"energy": {...}, "memory": {...}, "cost": {...}, "drive": {...},
// "targeting": {...}, "persistence_key": "..."} with the same field names as the
// structs above. Unknown keys are ignored; wrong-typed values keep the base value.
WarpConfig warp_config_from_json(const json::Value& doc, const WarpConfig& base = WarpConfig{});

// Throws std::runtime_error if the file is missing or not valid JSON.
WarpConfig load_warp_config_from_file(const std::string& path);

json::Value warp_config_to_json(const WarpConfig& cfg);

// Returns a list of human-readable problems (empty when the config is usable).
std::vector<std::string> validate_warp_config(const WarpConfig& cfg);

} // namespace orbitwarp
