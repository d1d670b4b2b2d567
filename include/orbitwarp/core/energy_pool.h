#pragma once

#include "orbitwarp/core/warp_config.h"

namespace orbitwarp {

struct EnergyStatus {
  double current{0.0};
  double max{0.0};
  double percent{0.0};
  double regen_per_second{0.0};
  bool regen_suspended{false};
};

// Persisted part of the pool.
struct EnergySnapshot {
  double energy{0.0};
  double max_energy{0.0};
  double regen_per_second{0.0};
};

// Capped, regenerating warp energy.
//
// Invariant: 0 <= current() <= max(). Consumption is all-or-nothing.
class EnergyPool {
 public:
  explicit EnergyPool(const EnergyConfig& cfg = EnergyConfig{});

  double current() const { return current_; }
  double max() const { return max_; }
  double regen_per_second() const { return regen_per_second_; }
  double percent() const;

  bool has_energy(double cost) const;

  // Returns false (and leaves the pool untouched) when the cost is not affordable
  // or not a finite non-negative number.
  bool consume(double cost);

  // Adds regen_per_second * dt, clamped to max. No-op while suspended.
  void regenerate(double dt);

  // Regeneration is suspended while a warp is in flight.
  void set_regen_suspended(bool suspended) { regen_suspended_ = suspended; }
  bool regen_suspended() const { return regen_suspended_; }

  // Pickups / bonuses. Clamped to max; non-positive amounts are ignored.
  void add(double amount);
  void refill() { current_ = max_; }

  // Capacity change that keeps the fill ratio. Returns false for non-positive values.
  bool set_max(double new_max);
  void upgrade_capacity(int level);
  void upgrade_regeneration(int level);

  // Physics floor under every learned adjustment:
  // max(min_warp_cost, floor(distance / distance_per_cost_unit)).
  double base_cost(double distance) const;

  EnergyStatus status() const;

  EnergySnapshot snapshot() const;
  // Out-of-range snapshot values fall back to the configured defaults.
  void restore(const EnergySnapshot& s);

  const EnergyConfig& config() const { return cfg_; }

 private:
  EnergyConfig cfg_;
  double current_{0.0};
  double max_{0.0};
  double regen_per_second_{0.0};
  bool regen_suspended_{false};
};

} // namespace orbitwarp
