#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "orbitwarp/core/route_key.h"
#include "orbitwarp/core/vec2.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/core/warp_types.h"
#include "orbitwarp/util/ring_buffer.h"

namespace orbitwarp {

struct RouteStat {
  std::uint32_t uses{0};
  double total_cost_paid{0.0};

  double average_cost() const { return uses > 0 ? total_cost_paid / static_cast<double>(uses) : 0.0; }
};

struct PlanetAffinity {
  std::uint32_t visits{0};
  double last_visit_time{0.0};
  // Share of all destination visits that went to this destination (0..1).
  double affinity{0.0};
};

struct BehaviorProfile {
  std::uint32_t total_warps{0};
  std::uint32_t emergency_warps{0};
  std::uint32_t exploration_warps{0};
  std::uint32_t return_warps{0};
  std::uint32_t warp_chains{0};
  double last_warp_time{0.0};
  double average_warp_distance{0.0};

  // Derived from the counters above; recomputed on every write.
  double skill_level{0.0};
};

struct LearningSample {
  double time{0.0};
  double cost{0.0};
  bool was_optimal{false};
};

struct EfficiencyMetrics {
  double wasted_energy{0.0};
  std::uint32_t optimal_routes{0};
  util::RingBuffer<LearningSample> learning_curve{50};
  // Derived from the cost trend of the most recent samples (0..1).
  double adaptation_level{0.0};
};

struct EmergencyPatterns {
  std::uint32_t low_health_warps{0};
  std::uint32_t panic_warps{0};
  double last_emergency_time{0.0};
};

// Debug record of a rejected warp. Informs balancing only.
struct FailedAttempt {
  double time{0.0};
  DestinationId destination;
  double cost_needed{0.0};
  double energy_available{0.0};
  double shortfall{0.0};
};

using RouteTable = std::unordered_map<RouteKey, RouteStat, RouteKeyHash>;
using AffinityTable = std::unordered_map<DestinationId, PlanetAffinity>;

// Everything the memory learns; this is what gets persisted.
struct WarpMemoryState {
  RouteTable routes;
  BehaviorProfile behavior;
  AffinityTable planet_affinity;
  EfficiencyMetrics efficiency;
  EmergencyPatterns emergency;

  std::uint32_t failed_attempts{0};
  util::RingBuffer<FailedAttempt> failed_attempt_log{20};
};

// What a single record_warp() call concluded about the warp.
struct WarpLearning {
  RouteKey route;
  double emergency_score{0.0};
  bool emergency{false};
  bool exploration{false};
  bool chain{false};
  bool optimal{false};
  bool consolidated{false};
};

struct ConsolidationResult {
  std::size_t routes_evicted{0};
  std::size_t samples_dropped{0};
  std::size_t failed_attempts_dropped{0};
};

struct MemoryStats {
  std::uint32_t total_warps{0};
  std::size_t known_routes{0};
  std::size_t known_destinations{0};
  double efficiency{0.0};
  double skill_level{0.0};
  double adaptation_level{0.0};
  double emergency_rate{0.0};
  std::uint32_t failed_attempts{0};
};

// Bounded, online-learning memory of how the player warps.
//
// All queries are const, never throw, and return neutral values (multiplier 1.0,
// zero counts) for routes and destinations the memory has not seen. The only
// mutations are record_warp(), record_failed_attempt(), consolidate() and
// restore().
class WarpMemory {
 public:
  explicit WarpMemory(const MemoryConfig& cfg = MemoryConfig{});

  // 1.0 for an unknown route, falling linearly to 1 - familiarity_max_reduction at
  // familiarity_saturation_uses uses.
  double route_familiarity_bonus(const Vec2& source, const DestinationId& dest) const;

  // Experienced, calm, curious players pay less (floor: mastery_floor).
  double mastery_multiplier() const;

  // Never visited: 0.85; fewer than 3 visits: 0.90; otherwise 1.0.
  double exploration_bonus(const DestinationId& dest) const;

  // Frequently chosen destinations are cheaper (down to 1 - affinity_max_reduction).
  double affinity_bonus(const DestinationId& dest) const;

  // 0..1 estimate of whether the player is fleeing.
  double detect_emergency(const WarpContext& ctx) const;

  // Learns from a completed warp. `distance` feeds the average-distance statistic.
  WarpLearning record_warp(const Vec2& source, const DestinationId& dest, double actual_cost,
                           const WarpContext& ctx, double distance = 0.0);

  // Logs the shortfall of a rejected warp. Does not touch learned aggregates.
  void record_failed_attempt(const DestinationId& dest, double cost_needed, double energy_available,
                             const WarpContext& ctx);

  // Capacity policy: evicts rarely used routes, trims the learning curve and the
  // failed-attempt log. Runs automatically every consolidate_every_warps warps.
  ConsolidationResult consolidate();

  MemoryStats stats() const;

  RouteKey route_key(const Vec2& source, const DestinationId& dest) const;
  const RouteStat* find_route(const RouteKey& key) const;
  const PlanetAffinity* find_affinity(const DestinationId& dest) const;

  const RouteTable& routes() const { return state_.routes; }
  const AffinityTable& planet_affinity() const { return state_.planet_affinity; }
  const BehaviorProfile& behavior() const { return state_.behavior; }
  const EfficiencyMetrics& efficiency() const { return state_.efficiency; }
  const EmergencyPatterns& emergency_patterns() const { return state_.emergency; }
  std::uint32_t failed_attempts() const { return state_.failed_attempts; }
  const util::RingBuffer<FailedAttempt>& failed_attempt_log() const { return state_.failed_attempt_log; }

  const WarpMemoryState& state() const { return state_; }

  // Replaces the learned state (e.g. after loading a save). Derived values are
  // recomputed and capacities re-applied, so a hand-edited or partial state can not
  // break the invariants.
  void restore(WarpMemoryState s);
  void reset();

  const MemoryConfig& config() const { return cfg_; }

 private:
  void renormalize_affinity();
  void recompute_adaptation();
  void recompute_skill_level();
  void apply_capacities();

  MemoryConfig cfg_;
  WarpMemoryState state_;
};

} // namespace orbitwarp
