#include "orbitwarp/core/warp_targeting.h"

#include <algorithm>
#include <cmath>

#include "orbitwarp/util/log.h"

namespace orbitwarp {

WarpTargeting::WarpTargeting(WarpDrive& drive, const CostEngine& costs, const TargetingConfig& cfg)
    : drive_(drive), costs_(costs), cfg_(cfg) {}

bool WarpTargeting::toggle_selection() {
  selected_.reset();
  if (selecting()) {
    drive_.end_selection();
    return false;
  }
  return drive_.begin_selection();
}

std::optional<Destination> WarpTargeting::pick_nearest(double x, double y, const std::vector<Destination>& destinations,
                                                       double radius) {
  if (!std::isfinite(x) || !std::isfinite(y) || !(radius > 0.0)) return std::nullopt;

  const Vec2 at{x, y};
  const Destination* best = nullptr;
  double best_dist = 0.0;
  for (const auto& d : destinations) {
    if (!d.discovered) continue;
    const double dist = distance(at, d.position);
    if (!(dist < radius)) continue;
    if (!best || dist < best_dist || (dist == best_dist && destination_key(d) < destination_key(*best))) {
      best = &d;
      best_dist = dist;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

SelectionResult WarpTargeting::select_and_maybe_commit(double x, double y, const std::vector<Destination>& destinations,
                                                       const PlayerModel& player, const WarpContext& ctx) {
  SelectionResult out;
  if (!selecting()) return out;

  out.picked = pick_nearest(x, y, destinations, cfg_.selection_radius);
  if (!out.picked) return out;

  selected_ = out.picked;
  if (!drive_.can_commit(*out.picked, player, ctx)) {
    log::debug("Selected " + destination_key(*out.picked) + " but cannot warp there yet");
    return out;
  }

  out.committed = drive_.commit(*out.picked, player, ctx);
  if (out.committed) selected_.reset();
  return out;
}

std::vector<DestinationInRange> WarpTargeting::destinations_in_range(const PlayerModel& player,
                                                                     const std::vector<Destination>& destinations,
                                                                     double max_range, const WarpContext& ctx) const {
  std::vector<DestinationInRange> out;
  for (const auto& d : destinations) {
    if (!d.discovered) continue;
    const double dist = distance(player.position, d.position);
    if (dist > max_range) continue;
    WarpQuote q = costs_.quote_for(player.position, d, ctx);
    if (!costs_.affordable(q)) continue;
    out.push_back(DestinationInRange{d, dist, q});
  }
  std::sort(out.begin(), out.end(), [](const DestinationInRange& a, const DestinationInRange& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return destination_key(a.destination) < destination_key(b.destination);
  });
  return out;
}

WarpRoutePlan WarpTargeting::plan_route(const Vec2& source, const Destination& dest, const WarpContext& ctx) const {
  WarpRoutePlan plan;
  plan.source = source;
  plan.destination = dest;
  plan.total_distance = distance(source, dest.position);
  plan.quote = costs_.quote_for(source, dest, ctx);
  plan.ok = dest.discovered && costs_.affordable(plan.quote);
  return plan;
}

} // namespace orbitwarp
