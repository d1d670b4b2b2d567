#include "orbitwarp/core/cost_engine.h"

#include <algorithm>
#include <cmath>

namespace orbitwarp {
namespace {

// Learned factors may only discount. Anything outside (0, 1] or not finite is
// treated as "no opinion".
double sane_factor(double f) {
  if (!std::isfinite(f) || f <= 0.0) return 1.0;
  return std::min(f, 1.0);
}

} // namespace

CostEngine::CostEngine(const EnergyPool& energy, const WarpMemory& memory, const CostConfig& cfg)
    : energy_(energy), memory_(memory), cfg_(cfg) {}

WarpQuote CostEngine::quote(double distance) const {
  WarpQuote q;
  q.distance = (std::isfinite(distance) && distance > 0.0) ? distance : 0.0;
  q.base_cost = energy_.base_cost(q.distance);
  q.cost = q.base_cost;
  return q;
}

WarpQuote CostEngine::quote(double distance, const Vec2* source, const Destination* dest,
                            const WarpContext* ctx) const {
  WarpQuote q = quote(distance);
  if (!source || !dest || !ctx) return q;

  const DestinationId key = destination_key(*dest);
  q.adaptive = true;

  q.familiarity = sane_factor(memory_.route_familiarity_bonus(*source, key));
  q.mastery = sane_factor(memory_.mastery_multiplier());

  q.emergency_score = memory_.detect_emergency(*ctx);
  if (q.emergency_score > memory_.config().emergency_threshold) {
    q.emergency = sane_factor(std::max(cfg_.emergency_floor, cfg_.emergency_base - q.emergency_score * cfg_.emergency_slope));
  }

  q.exploration = sane_factor(memory_.exploration_bonus(key));
  q.affinity = sane_factor(memory_.affinity_bonus(key));

  q.multiplier = q.familiarity * q.mastery * q.emergency * q.exploration * q.affinity;

  double cost = q.base_cost * q.multiplier;
  const double floor_cost = q.base_cost * std::clamp(cfg_.min_cost_fraction, 0.0, 1.0);
  if (cost < floor_cost) {
    cost = floor_cost;
    q.floored = true;
  }
  q.cost = std::floor(cost);
  return q;
}

WarpQuote CostEngine::quote_for(const Vec2& source, const Destination& dest, const WarpContext& ctx) const {
  return quote(distance(source, dest.position), &source, &dest, &ctx);
}

} // namespace orbitwarp
