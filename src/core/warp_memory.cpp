#include "orbitwarp/core/warp_memory.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "orbitwarp/util/log.h"
#include "orbitwarp/util/strings.h"

namespace orbitwarp {
namespace {

double health_ratio(const WarpContext& ctx) {
  if (!std::isfinite(ctx.health)) return 1.0;
  return std::clamp(ctx.health / 100.0, 0.0, 1.0);
}

// Seconds since `then`, or -1 when the clock is not past it.
double seconds_since(double now, double then) {
  if (!std::isfinite(now) || !std::isfinite(then) || now < then) return -1.0;
  return now - then;
}

double ratio(std::uint32_t part, std::uint32_t whole) {
  if (whole == 0) return 0.0;
  return static_cast<double>(part) / static_cast<double>(whole);
}

std::size_t to_size(int v) { return v > 0 ? static_cast<std::size_t>(v) : 0; }

} // namespace

WarpMemory::WarpMemory(const MemoryConfig& cfg) : cfg_(cfg) { apply_capacities(); }

RouteKey WarpMemory::route_key(const Vec2& source, const DestinationId& dest) const {
  return make_route_key(source, dest, cfg_.route_cell_pitch);
}

const RouteStat* WarpMemory::find_route(const RouteKey& key) const {
  auto it = state_.routes.find(key);
  return it == state_.routes.end() ? nullptr : &it->second;
}

const PlanetAffinity* WarpMemory::find_affinity(const DestinationId& dest) const {
  auto it = state_.planet_affinity.find(dest);
  return it == state_.planet_affinity.end() ? nullptr : &it->second;
}

double WarpMemory::route_familiarity_bonus(const Vec2& source, const DestinationId& dest) const {
  const RouteStat* r = find_route(route_key(source, dest));
  if (!r || r->uses == 0) return 1.0;
  const double saturation = static_cast<double>(std::max(1, cfg_.familiarity_saturation_uses));
  const double familiarity = std::min(static_cast<double>(r->uses) / saturation, 1.0);
  return 1.0 - familiarity * cfg_.familiarity_max_reduction;
}

double WarpMemory::mastery_multiplier() const {
  const BehaviorProfile& b = state_.behavior;
  if (b.total_warps == 0) return 1.0;

  const double efficiency_ratio = ratio(state_.efficiency.optimal_routes, b.total_warps);
  const double emergency_ratio = ratio(b.emergency_warps, b.total_warps);
  const double exploration_ratio = ratio(b.exploration_warps, b.total_warps);

  const double mastery = efficiency_ratio * 0.5 + (1.0 - emergency_ratio) * 0.3 + exploration_ratio * 0.2;
  const double multiplier = 1.0 - mastery * cfg_.mastery_max_reduction;
  return std::clamp(multiplier, cfg_.mastery_floor, 1.0);
}

double WarpMemory::exploration_bonus(const DestinationId& dest) const {
  const PlanetAffinity* a = find_affinity(dest);
  if (!a || a->visits == 0) return cfg_.exploration_first_visit_bonus;
  if (a->visits < static_cast<std::uint32_t>(std::max(0, cfg_.exploration_early_visit_limit))) {
    return cfg_.exploration_early_visit_bonus;
  }
  return 1.0;
}

double WarpMemory::affinity_bonus(const DestinationId& dest) const {
  const PlanetAffinity* a = find_affinity(dest);
  if (!a) return 1.0;
  const double floor = 1.0 - cfg_.affinity_max_reduction;
  return std::clamp(1.0 - a->affinity * cfg_.affinity_max_reduction, floor, 1.0);
}

double WarpMemory::detect_emergency(const WarpContext& ctx) const {
  double score = 0.0;

  const double health = health_ratio(ctx);
  if (health < cfg_.critical_health_ratio) {
    score += cfg_.critical_health_weight;
  } else if (health < cfg_.low_health_ratio) {
    score += cfg_.low_health_weight;
  }

  if (state_.behavior.total_warps > 0) {
    const double since = seconds_since(ctx.now_seconds, state_.behavior.last_warp_time);
    if (since >= 0.0 && since < cfg_.rapid_warp_window_seconds) score += cfg_.rapid_warp_weight;
  }

  if (ctx.nearby_dangers > 0) score += cfg_.danger_weight;

  return std::clamp(score, 0.0, 1.0);
}

WarpLearning WarpMemory::record_warp(const Vec2& source, const DestinationId& dest, double actual_cost,
                                     const WarpContext& ctx, double distance) {
  if (!std::isfinite(actual_cost) || actual_cost < 0.0) {
    log::warn("Warp memory: ignoring invalid cost for warp to " + dest);
    actual_cost = 0.0;
  }
  const double now = ctx.now_seconds;

  WarpLearning out;
  out.route = route_key(source, dest);
  // Judged against the state before this warp is folded in.
  out.emergency_score = detect_emergency(ctx);

  RouteStat& route = state_.routes[out.route];
  route.uses += 1;
  route.total_cost_paid += actual_cost;

  BehaviorProfile& b = state_.behavior;
  const bool had_previous_warp = b.total_warps > 0;
  b.total_warps += 1;

  if (out.emergency_score > cfg_.emergency_threshold) {
    out.emergency = true;
    b.emergency_warps += 1;
    state_.emergency.last_emergency_time = now;
    if (health_ratio(ctx) < cfg_.critical_health_ratio) state_.emergency.low_health_warps += 1;
    const double since = seconds_since(now, b.last_warp_time);
    if (had_previous_warp && since >= 0.0 && since < cfg_.rapid_warp_window_seconds) {
      state_.emergency.panic_warps += 1;
    }
  }

  if (had_previous_warp) {
    const double since = seconds_since(now, b.last_warp_time);
    if (since >= 0.0 && since < cfg_.chain_window_seconds) {
      out.chain = true;
      b.warp_chains += 1;
    }
  }
  b.last_warp_time = now;

  if (std::isfinite(distance) && distance >= 0.0) {
    b.average_warp_distance += (distance - b.average_warp_distance) / static_cast<double>(b.total_warps);
  }

  PlanetAffinity& visit = state_.planet_affinity[dest];
  out.exploration = visit.visits == 0;
  if (out.exploration) {
    b.exploration_warps += 1;
  } else {
    b.return_warps += 1;
  }
  visit.visits += 1;
  visit.last_visit_time = now;
  renormalize_affinity();

  EfficiencyMetrics& eff = state_.efficiency;
  out.optimal = actual_cost <= cfg_.optimal_cost_threshold;
  if (out.optimal) {
    eff.optimal_routes += 1;
  } else {
    eff.wasted_energy += actual_cost - cfg_.optimal_cost_threshold;
  }
  eff.learning_curve.push_back(LearningSample{now, actual_cost, out.optimal});
  recompute_adaptation();
  recompute_skill_level();

  log::debug("Learned from warp: route " + route_key_to_string(out.route) + ", cost " +
             format_fixed(actual_cost, 0) + ", emergency " + format_fixed(out.emergency_score, 1));

  const int every = std::max(1, cfg_.consolidate_every_warps);
  if (b.total_warps % static_cast<std::uint32_t>(every) == 0) {
    consolidate();
    out.consolidated = true;
  }
  return out;
}

void WarpMemory::record_failed_attempt(const DestinationId& dest, double cost_needed, double energy_available,
                                       const WarpContext& ctx) {
  FailedAttempt f;
  f.time = ctx.now_seconds;
  f.destination = dest;
  f.cost_needed = std::isfinite(cost_needed) ? cost_needed : 0.0;
  f.energy_available = std::isfinite(energy_available) ? energy_available : 0.0;
  f.shortfall = std::max(0.0, f.cost_needed - f.energy_available);

  state_.failed_attempts += 1;
  state_.failed_attempt_log.push_back(f);

  log::debug("Warp to " + dest + " rejected: needs " + format_fixed(f.cost_needed, 0) + ", have " +
             format_fixed(f.energy_available, 0) + " (short " + format_fixed(f.shortfall, 0) + ")");
}

ConsolidationResult WarpMemory::consolidate() {
  ConsolidationResult r;
  const auto min_uses = static_cast<std::uint32_t>(std::max(0, cfg_.consolidate_min_route_uses));
  for (auto it = state_.routes.begin(); it != state_.routes.end();) {
    if (it->second.uses < min_uses) {
      it = state_.routes.erase(it);
      ++r.routes_evicted;
    } else {
      ++it;
    }
  }

  r.samples_dropped = state_.efficiency.learning_curve.keep_recent(to_size(cfg_.consolidated_curve_samples));
  r.failed_attempts_dropped = state_.failed_attempt_log.keep_recent(to_size(cfg_.failed_attempt_log_capacity));
  recompute_skill_level();

  log::info("Consolidated warp memory: " + std::to_string(state_.routes.size()) + " routes kept, " +
            std::to_string(r.routes_evicted) + " evicted, " + std::to_string(r.samples_dropped) +
            " learning samples archived");
  return r;
}

MemoryStats WarpMemory::stats() const {
  const BehaviorProfile& b = state_.behavior;
  MemoryStats s;
  s.total_warps = b.total_warps;
  s.known_routes = state_.routes.size();
  s.known_destinations = state_.planet_affinity.size();
  s.efficiency = ratio(state_.efficiency.optimal_routes, b.total_warps);
  s.skill_level = b.skill_level;
  s.adaptation_level = state_.efficiency.adaptation_level;
  s.emergency_rate = ratio(b.emergency_warps, b.total_warps);
  s.failed_attempts = state_.failed_attempts;
  return s;
}

void WarpMemory::restore(WarpMemoryState s) {
  state_ = std::move(s);

  for (auto it = state_.routes.begin(); it != state_.routes.end();) {
    if (it->second.uses == 0) {
      it = state_.routes.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = state_.planet_affinity.begin(); it != state_.planet_affinity.end();) {
    if (it->second.visits == 0) {
      it = state_.planet_affinity.erase(it);
    } else {
      ++it;
    }
  }

  BehaviorProfile& b = state_.behavior;
  b.emergency_warps = std::min(b.emergency_warps, b.total_warps);
  b.exploration_warps = std::min(b.exploration_warps, b.total_warps);
  state_.efficiency.optimal_routes = std::min(state_.efficiency.optimal_routes, b.total_warps);
  state_.efficiency.adaptation_level = std::clamp(state_.efficiency.adaptation_level, 0.0, 1.0);

  apply_capacities();
  renormalize_affinity();
  recompute_skill_level();
}

void WarpMemory::reset() {
  state_ = WarpMemoryState{};
  apply_capacities();
}

void WarpMemory::apply_capacities() {
  state_.efficiency.learning_curve.set_capacity(to_size(cfg_.learning_curve_capacity));
  state_.failed_attempt_log.set_capacity(to_size(cfg_.failed_attempt_log_capacity));
}

void WarpMemory::renormalize_affinity() {
  double total = 0.0;
  for (const auto& kv : state_.planet_affinity) total += static_cast<double>(kv.second.visits);
  for (auto& kv : state_.planet_affinity) {
    kv.second.affinity = total > 0.0 ? static_cast<double>(kv.second.visits) / total : 0.0;
  }
}

void WarpMemory::recompute_adaptation() {
  const auto& curve = state_.efficiency.learning_curve;
  const std::size_t window = to_size(std::max(2, cfg_.adaptation_window));
  if (curve.size() < window) return;

  const std::size_t first = curve.size() - window;
  double total_change = 0.0;
  for (std::size_t i = first + 1; i < curve.size(); ++i) total_change += curve[i - 1].cost - curve[i].cost;

  const double improvement = total_change / static_cast<double>(window - 1);
  const double scale = cfg_.adaptation_scale > 0.0 ? cfg_.adaptation_scale : 20.0;
  state_.efficiency.adaptation_level = std::clamp(improvement / scale, 0.0, 1.0);
}

void WarpMemory::recompute_skill_level() {
  BehaviorProfile& b = state_.behavior;
  if (b.total_warps == 0) {
    b.skill_level = 0.0;
    return;
  }
  const double total = static_cast<double>(b.total_warps);
  const double efficiency = ratio(state_.efficiency.optimal_routes, b.total_warps);
  const double experience = std::min(1.0, total / 50.0);
  const double emergency_handling = 1.0 - ratio(b.emergency_warps, b.total_warps);
  const double courage = std::min(1.0, static_cast<double>(b.exploration_warps) / std::max(1.0, total * 0.3));

  b.skill_level = std::clamp(efficiency * 0.4 + experience * 0.3 + emergency_handling * 0.2 + courage * 0.1, 0.0, 1.0);
}

} // namespace orbitwarp
