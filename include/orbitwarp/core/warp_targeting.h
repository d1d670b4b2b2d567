#pragma once

#include <optional>
#include <vector>

#include "orbitwarp/core/cost_engine.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/core/warp_drive.h"
#include "orbitwarp/core/warp_types.h"

namespace orbitwarp {

struct SelectionResult {
  std::optional<Destination> picked;
  bool committed{false};
};

struct DestinationInRange {
  Destination destination;
  double distance{0.0};
  WarpQuote quote;
};

// Single-hop warp plan. Warps are point to point, so there is exactly one leg.
struct WarpRoutePlan {
  bool ok{false};
  Vec2 source;
  Destination destination;
  double total_distance{0.0};
  WarpQuote quote;
};

// Turns a world-space pick into a warp commit.
class WarpTargeting {
 public:
  WarpTargeting(WarpDrive& drive, const CostEngine& costs, const TargetingConfig& cfg = TargetingConfig{});

  // Enters or leaves selection mode. Returns whether selection mode is active after the call.
  bool toggle_selection();
  bool selecting() const { return drive_.phase() == WarpPhase::Selecting; }

  // Nearest discovered destination strictly inside `radius` of (x, y).
  // Exact distance ties go to the smaller destination key.
  static std::optional<Destination> pick_nearest(double x, double y, const std::vector<Destination>& destinations,
                                                 double radius);

  // Only acts in selection mode. An affordable pick commits and leaves selection
  // mode; an unaffordable one stays highlighted.
  SelectionResult select_and_maybe_commit(double x, double y, const std::vector<Destination>& destinations,
                                          const PlayerModel& player, const WarpContext& ctx);

  const std::optional<Destination>& selected() const { return selected_; }

  // Discovered destinations within `max_range` of the player whose quote is
  // currently affordable, nearest first.
  std::vector<DestinationInRange> destinations_in_range(const PlayerModel& player,
                                                        const std::vector<Destination>& destinations,
                                                        double max_range, const WarpContext& ctx) const;

  WarpRoutePlan plan_route(const Vec2& source, const Destination& dest, const WarpContext& ctx) const;

  const TargetingConfig& config() const { return cfg_; }

 private:
  WarpDrive& drive_;
  const CostEngine& costs_;
  TargetingConfig cfg_;
  std::optional<Destination> selected_;
};

} // namespace orbitwarp
