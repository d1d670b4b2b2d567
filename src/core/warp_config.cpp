#include "orbitwarp/core/warp_config.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "orbitwarp/util/file_io.h"
#include "orbitwarp/util/log.h"

namespace orbitwarp {
namespace {

using json::Object;
using json::Value;

void read(const Object& o, const char* key, double& field) { field = json::number_or(o, key, field); }

void read(const Object& o, const char* key, int& field) {
  const double v = json::number_or(o, key, static_cast<double>(field));
  if (std::isnan(v)) return;
  const double lo = static_cast<double>(std::numeric_limits<int>::min());
  const double hi = static_cast<double>(std::numeric_limits<int>::max());
  field = static_cast<int>(std::llround(std::clamp(v, lo, hi)));
}

void read_energy(const Object& o, EnergyConfig& c) {
  read(o, "max_energy", c.max_energy);
  read(o, "regen_per_second", c.regen_per_second);
  read(o, "min_warp_cost", c.min_warp_cost);
  read(o, "distance_per_cost_unit", c.distance_per_cost_unit);
  read(o, "capacity_upgrade_step", c.capacity_upgrade_step);
  read(o, "regen_upgrade_step", c.regen_upgrade_step);
}

void read_memory(const Object& o, MemoryConfig& c) {
  read(o, "route_cell_pitch", c.route_cell_pitch);
  read(o, "familiarity_saturation_uses", c.familiarity_saturation_uses);
  read(o, "familiarity_max_reduction", c.familiarity_max_reduction);
  read(o, "mastery_max_reduction", c.mastery_max_reduction);
  read(o, "mastery_floor", c.mastery_floor);
  read(o, "exploration_first_visit_bonus", c.exploration_first_visit_bonus);
  read(o, "exploration_early_visit_bonus", c.exploration_early_visit_bonus);
  read(o, "exploration_early_visit_limit", c.exploration_early_visit_limit);
  read(o, "affinity_max_reduction", c.affinity_max_reduction);
  read(o, "critical_health_ratio", c.critical_health_ratio);
  read(o, "low_health_ratio", c.low_health_ratio);
  read(o, "critical_health_weight", c.critical_health_weight);
  read(o, "low_health_weight", c.low_health_weight);
  read(o, "rapid_warp_window_seconds", c.rapid_warp_window_seconds);
  read(o, "rapid_warp_weight", c.rapid_warp_weight);
  read(o, "danger_weight", c.danger_weight);
  read(o, "emergency_threshold", c.emergency_threshold);
  read(o, "chain_window_seconds", c.chain_window_seconds);
  read(o, "optimal_cost_threshold", c.optimal_cost_threshold);
  read(o, "learning_curve_capacity", c.learning_curve_capacity);
  read(o, "adaptation_window", c.adaptation_window);
  read(o, "adaptation_scale", c.adaptation_scale);
  read(o, "consolidate_every_warps", c.consolidate_every_warps);
  read(o, "consolidate_min_route_uses", c.consolidate_min_route_uses);
  read(o, "consolidated_curve_samples", c.consolidated_curve_samples);
  read(o, "failed_attempt_log_capacity", c.failed_attempt_log_capacity);
}

void read_cost(const Object& o, CostConfig& c) {
  read(o, "emergency_base", c.emergency_base);
  read(o, "emergency_slope", c.emergency_slope);
  read(o, "emergency_floor", c.emergency_floor);
  read(o, "min_cost_fraction", c.min_cost_fraction);
}

void read_drive(const Object& o, WarpDriveConfig& c) {
  read(o, "warp_duration_seconds", c.warp_duration_seconds);
  read(o, "arrival_standoff", c.arrival_standoff);
  read(o, "effect_fade_per_second", c.effect_fade_per_second);
}

void read_targeting(const Object& o, TargetingConfig& c) { read(o, "selection_radius", c.selection_radius); }

} // namespace

WarpConfig warp_config_from_json(const json::Value& doc, const WarpConfig& base) {
  WarpConfig cfg = base;
  const Object* root = doc.as_object();
  if (!root) {
    log::warn("Warp config: document is not a JSON object; using defaults");
    return cfg;
  }
  if (const Object* o = json::find_object(*root, "energy")) read_energy(*o, cfg.energy);
  if (const Object* o = json::find_object(*root, "memory")) read_memory(*o, cfg.memory);
  if (const Object* o = json::find_object(*root, "cost")) read_cost(*o, cfg.cost);
  if (const Object* o = json::find_object(*root, "drive")) read_drive(*o, cfg.drive);
  if (const Object* o = json::find_object(*root, "targeting")) read_targeting(*o, cfg.targeting);
  cfg.persistence_key = json::string_or(*root, "persistence_key", cfg.persistence_key);
  return cfg;
}

WarpConfig load_warp_config_from_file(const std::string& path) {
  return warp_config_from_json(json::parse(read_text_file(path)));
}

json::Value warp_config_to_json(const WarpConfig& cfg) {
  Object energy;
  energy["max_energy"] = cfg.energy.max_energy;
  energy["regen_per_second"] = cfg.energy.regen_per_second;
  energy["min_warp_cost"] = cfg.energy.min_warp_cost;
  energy["distance_per_cost_unit"] = cfg.energy.distance_per_cost_unit;
  energy["capacity_upgrade_step"] = cfg.energy.capacity_upgrade_step;
  energy["regen_upgrade_step"] = cfg.energy.regen_upgrade_step;

  const MemoryConfig& m = cfg.memory;
  Object memory;
  memory["route_cell_pitch"] = m.route_cell_pitch;
  memory["familiarity_saturation_uses"] = static_cast<double>(m.familiarity_saturation_uses);
  memory["familiarity_max_reduction"] = m.familiarity_max_reduction;
  memory["mastery_max_reduction"] = m.mastery_max_reduction;
  memory["mastery_floor"] = m.mastery_floor;
  memory["exploration_first_visit_bonus"] = m.exploration_first_visit_bonus;
  memory["exploration_early_visit_bonus"] = m.exploration_early_visit_bonus;
  memory["exploration_early_visit_limit"] = static_cast<double>(m.exploration_early_visit_limit);
  memory["affinity_max_reduction"] = m.affinity_max_reduction;
  memory["critical_health_ratio"] = m.critical_health_ratio;
  memory["low_health_ratio"] = m.low_health_ratio;
  memory["critical_health_weight"] = m.critical_health_weight;
  memory["low_health_weight"] = m.low_health_weight;
  memory["rapid_warp_window_seconds"] = m.rapid_warp_window_seconds;
  memory["rapid_warp_weight"] = m.rapid_warp_weight;
  memory["danger_weight"] = m.danger_weight;
  memory["emergency_threshold"] = m.emergency_threshold;
  memory["chain_window_seconds"] = m.chain_window_seconds;
  memory["optimal_cost_threshold"] = m.optimal_cost_threshold;
  memory["learning_curve_capacity"] = static_cast<double>(m.learning_curve_capacity);
  memory["adaptation_window"] = static_cast<double>(m.adaptation_window);
  memory["adaptation_scale"] = m.adaptation_scale;
  memory["consolidate_every_warps"] = static_cast<double>(m.consolidate_every_warps);
  memory["consolidate_min_route_uses"] = static_cast<double>(m.consolidate_min_route_uses);
  memory["consolidated_curve_samples"] = static_cast<double>(m.consolidated_curve_samples);
  memory["failed_attempt_log_capacity"] = static_cast<double>(m.failed_attempt_log_capacity);

  Object cost;
  cost["emergency_base"] = cfg.cost.emergency_base;
  cost["emergency_slope"] = cfg.cost.emergency_slope;
  cost["emergency_floor"] = cfg.cost.emergency_floor;
  cost["min_cost_fraction"] = cfg.cost.min_cost_fraction;

  Object drive;
  drive["warp_duration_seconds"] = cfg.drive.warp_duration_seconds;
  drive["arrival_standoff"] = cfg.drive.arrival_standoff;
  drive["effect_fade_per_second"] = cfg.drive.effect_fade_per_second;

  Object targeting;
  targeting["selection_radius"] = cfg.targeting.selection_radius;

  Object root;
  root["energy"] = std::move(energy);
  root["memory"] = std::move(memory);
  root["cost"] = std::move(cost);
  root["drive"] = std::move(drive);
  root["targeting"] = std::move(targeting);
  root["persistence_key"] = cfg.persistence_key;
  return root;
}

std::vector<std::string> validate_warp_config(const WarpConfig& cfg) {
  std::vector<std::string> errors;
  const auto require = [&](bool ok, const char* what) {
    if (!ok) errors.emplace_back(what);
  };
  const auto in01 = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };

  require(cfg.energy.max_energy > 0.0, "energy.max_energy must be > 0");
  require(cfg.energy.regen_per_second >= 0.0, "energy.regen_per_second must be >= 0");
  require(cfg.energy.min_warp_cost >= 0.0, "energy.min_warp_cost must be >= 0");
  require(cfg.energy.distance_per_cost_unit > 0.0, "energy.distance_per_cost_unit must be > 0");

  const MemoryConfig& m = cfg.memory;
  require(m.route_cell_pitch > 0.0, "memory.route_cell_pitch must be > 0");
  require(m.familiarity_saturation_uses > 0, "memory.familiarity_saturation_uses must be > 0");
  require(in01(m.familiarity_max_reduction), "memory.familiarity_max_reduction must be in [0,1]");
  require(in01(m.mastery_max_reduction), "memory.mastery_max_reduction must be in [0,1]");
  require(in01(m.mastery_floor), "memory.mastery_floor must be in [0,1]");
  require(in01(m.exploration_first_visit_bonus), "memory.exploration_first_visit_bonus must be in [0,1]");
  require(in01(m.exploration_early_visit_bonus), "memory.exploration_early_visit_bonus must be in [0,1]");
  require(in01(m.affinity_max_reduction), "memory.affinity_max_reduction must be in [0,1]");
  require(m.learning_curve_capacity > 0, "memory.learning_curve_capacity must be > 0");
  require(m.adaptation_window >= 2, "memory.adaptation_window must be >= 2");
  require(m.adaptation_scale > 0.0, "memory.adaptation_scale must be > 0");
  require(m.consolidate_every_warps > 0, "memory.consolidate_every_warps must be > 0");
  require(m.consolidated_curve_samples > 0 && m.consolidated_curve_samples <= m.learning_curve_capacity,
          "memory.consolidated_curve_samples must be in [1, learning_curve_capacity]");
  require(m.failed_attempt_log_capacity >= 0, "memory.failed_attempt_log_capacity must be >= 0");

  require(in01(cfg.cost.emergency_floor), "cost.emergency_floor must be in [0,1]");
  require(in01(cfg.cost.emergency_base), "cost.emergency_base must be in [0,1]");
  require(in01(cfg.cost.min_cost_fraction), "cost.min_cost_fraction must be in [0,1]");

  require(cfg.drive.warp_duration_seconds > 0.0, "drive.warp_duration_seconds must be > 0");
  require(cfg.drive.effect_fade_per_second > 0.0, "drive.effect_fade_per_second must be > 0");
  require(cfg.targeting.selection_radius > 0.0, "targeting.selection_radius must be > 0");
  require(!cfg.persistence_key.empty(), "persistence_key must not be empty");
  return errors;
}

} // namespace orbitwarp
