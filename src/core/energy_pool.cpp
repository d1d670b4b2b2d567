#include "orbitwarp/core/energy_pool.h"

#include <algorithm>
#include <cmath>

#include "orbitwarp/util/log.h"

namespace orbitwarp {

EnergyPool::EnergyPool(const EnergyConfig& cfg)
    : cfg_(cfg),
      current_(std::max(0.0, cfg.max_energy)),
      max_(std::max(0.0, cfg.max_energy)),
      regen_per_second_(std::max(0.0, cfg.regen_per_second)) {}

double EnergyPool::percent() const {
  if (max_ <= 0.0) return 0.0;
  return current_ / max_;
}

bool EnergyPool::has_energy(double cost) const { return std::isfinite(cost) && cost <= current_; }

bool EnergyPool::consume(double cost) {
  if (!std::isfinite(cost) || cost < 0.0) return false;
  if (cost > current_) return false;
  current_ = std::max(0.0, current_ - cost);
  return true;
}

void EnergyPool::regenerate(double dt) {
  if (regen_suspended_) return;
  if (!std::isfinite(dt) || dt <= 0.0) return;
  if (current_ >= max_) return;
  current_ = std::min(max_, current_ + regen_per_second_ * dt);
}

void EnergyPool::add(double amount) {
  if (!std::isfinite(amount) || amount <= 0.0) return;
  current_ = std::min(max_, current_ + amount);
}

bool EnergyPool::set_max(double new_max) {
  if (!std::isfinite(new_max) || new_max <= 0.0) return false;
  const double ratio = percent();
  max_ = new_max;
  current_ = std::clamp(std::floor(new_max * ratio), 0.0, max_);
  return true;
}

void EnergyPool::upgrade_capacity(int level) {
  const double new_max = cfg_.max_energy * (1.0 + std::max(0, level) * cfg_.capacity_upgrade_step);
  if (!set_max(new_max)) log::warn("Energy capacity upgrade produced an invalid maximum; ignored");
}

void EnergyPool::upgrade_regeneration(int level) {
  regen_per_second_ = std::max(0.0, cfg_.regen_per_second * (1.0 + std::max(0, level) * cfg_.regen_upgrade_step));
}

double EnergyPool::base_cost(double distance) const {
  if (!std::isfinite(distance) || distance < 0.0) distance = 0.0;
  const double per_unit = cfg_.distance_per_cost_unit > 0.0 ? cfg_.distance_per_cost_unit : 100.0;
  return std::max(cfg_.min_warp_cost, std::floor(distance / per_unit));
}

EnergyStatus EnergyPool::status() const {
  EnergyStatus s;
  s.current = current_;
  s.max = max_;
  s.percent = percent();
  s.regen_per_second = regen_per_second_;
  s.regen_suspended = regen_suspended_;
  return s;
}

EnergySnapshot EnergyPool::snapshot() const {
  EnergySnapshot s;
  s.energy = current_;
  s.max_energy = max_;
  s.regen_per_second = regen_per_second_;
  return s;
}

void EnergyPool::restore(const EnergySnapshot& s) {
  max_ = (std::isfinite(s.max_energy) && s.max_energy > 0.0) ? s.max_energy : std::max(0.0, cfg_.max_energy);
  regen_per_second_ = (std::isfinite(s.regen_per_second) && s.regen_per_second >= 0.0)
                          ? s.regen_per_second
                          : std::max(0.0, cfg_.regen_per_second);
  current_ = std::isfinite(s.energy) ? std::clamp(s.energy, 0.0, max_) : max_;
}

} // namespace orbitwarp
