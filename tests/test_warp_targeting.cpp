#include <cmath>
#include <iostream>
#include <vector>

#include "orbitwarp/core/warp_targeting.h"

#define OW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

orbitwarp::Destination dest(const char* id, double x, double y, bool discovered = true) {
  orbitwarp::Destination d;
  d.id = id;
  d.name = id;
  d.position = orbitwarp::Vec2{x, y};
  d.radius = 20.0;
  d.discovered = discovered;
  return d;
}

} // namespace

int test_warp_targeting() {
  using namespace orbitwarp;

  // Picking.
  {
    const std::vector<Destination> ds = {
        dest("bravo", 100.0, 0.0),
        dest("alpha", 0.0, 100.0),
        dest("ghost", 10.0, 0.0, false),
    };

    // Undiscovered destinations are never picked, even when closest.
    OW_ASSERT(!WarpTargeting::pick_nearest(0.0, 0.0, ds, 50.0).has_value());

    // The radius is exclusive.
    OW_ASSERT(!WarpTargeting::pick_nearest(0.0, 0.0, ds, 100.0).has_value());

    // Exact tie: smaller key wins regardless of order.
    auto tie = WarpTargeting::pick_nearest(0.0, 0.0, ds, 101.0);
    OW_ASSERT(tie.has_value());
    OW_ASSERT(tie->id == "alpha");

    auto near = WarpTargeting::pick_nearest(90.0, 5.0, ds, 50.0);
    OW_ASSERT(near.has_value());
    OW_ASSERT(near->id == "bravo");

    OW_ASSERT(!WarpTargeting::pick_nearest(0.0, 0.0, {}, 50.0).has_value());
    OW_ASSERT(!WarpTargeting::pick_nearest(std::nan(""), 0.0, ds, 500.0).has_value());
    OW_ASSERT(!WarpTargeting::pick_nearest(0.0, 0.0, ds, 0.0).has_value());
  }

  const std::vector<Destination> galaxy = {
      dest("ember", 2500.0, 0.0),
      dest("near", 300.0, 400.0),
      dest("far", 9000.0, 0.0),
      dest("hidden", 100.0, 0.0, false),
  };

  // Affordable pick commits and leaves selection mode.
  {
    EnergyPool energy;
    WarpMemory memory;
    CostEngine costs(energy, memory);
    WarpDrive drive(energy, memory, costs);
    WarpTargeting targeting(drive, costs);
    drive.init();
    drive.unlock();

    PlayerModel player;
    const WarpContext ctx = drive.context_for(player);

    // Clicks outside selection mode do nothing.
    SelectionResult r = targeting.select_and_maybe_commit(2500.0, 0.0, galaxy, player, ctx);
    OW_ASSERT(!r.picked.has_value());
    OW_ASSERT(!r.committed);
    OW_ASSERT(drive.phase() == WarpPhase::Idle);

    OW_ASSERT(targeting.toggle_selection());
    OW_ASSERT(targeting.selecting());

    // Empty space: still selecting.
    r = targeting.select_and_maybe_commit(-5000.0, -5000.0, galaxy, player, ctx);
    OW_ASSERT(!r.picked.has_value());
    OW_ASSERT(targeting.selecting());

    r = targeting.select_and_maybe_commit(2510.0, 10.0, galaxy, player, ctx);
    OW_ASSERT(r.picked.has_value());
    OW_ASSERT(r.picked->id == "ember");
    OW_ASSERT(r.committed);
    OW_ASSERT(!targeting.selected().has_value());
    OW_ASSERT(!targeting.selecting());
    OW_ASSERT(drive.phase() == WarpPhase::Warping);
    OW_ASSERT(std::fabs(energy.current() - 958.0) < 1e-9);

    // Selection can not start mid-warp.
    OW_ASSERT(!targeting.toggle_selection());
  }

  // Unaffordable pick stays highlighted.
  {
    EnergyPool energy;
    WarpMemory memory;
    CostEngine costs(energy, memory);
    WarpDrive drive(energy, memory, costs);
    WarpTargeting targeting(drive, costs);
    drive.init();
    drive.unlock();
    OW_ASSERT(energy.consume(990.0));

    PlayerModel player;
    const WarpContext ctx = drive.context_for(player);
    OW_ASSERT(targeting.toggle_selection());
    const SelectionResult r = targeting.select_and_maybe_commit(2500.0, 0.0, galaxy, player, ctx);
    OW_ASSERT(r.picked.has_value());
    OW_ASSERT(!r.committed);
    OW_ASSERT(targeting.selected().has_value());
    OW_ASSERT(targeting.selected()->id == "ember");
    OW_ASSERT(targeting.selecting());
    OW_ASSERT(std::fabs(energy.current() - 10.0) < 1e-9);

    // Nothing affordable in range either.
    OW_ASSERT(targeting.destinations_in_range(player, galaxy, 1.0e6, ctx).empty());

    // Leaving selection mode clears the highlight.
    OW_ASSERT(!targeting.toggle_selection());
    OW_ASSERT(!targeting.selected().has_value());
    OW_ASSERT(drive.phase() == WarpPhase::Idle);
  }

  // Range listing and route planning.
  {
    EnergyPool energy;
    WarpMemory memory;
    CostEngine costs(energy, memory);
    WarpDrive drive(energy, memory, costs);
    WarpTargeting targeting(drive, costs);
    drive.init();

    PlayerModel player;
    const WarpContext ctx = drive.context_for(player);

    const auto in_range = targeting.destinations_in_range(player, galaxy, 3000.0, ctx);
    OW_ASSERT(in_range.size() == 2);
    OW_ASSERT(in_range[0].destination.id == "near");
    OW_ASSERT(std::fabs(in_range[0].distance - 500.0) < 1e-9);
    OW_ASSERT(in_range[1].destination.id == "ember");
    OW_ASSERT(in_range[1].quote.cost == 42.0);

    const auto everything = targeting.destinations_in_range(player, galaxy, 1.0e6, ctx);
    OW_ASSERT(everything.size() == 3);
    OW_ASSERT(everything.back().destination.id == "far");

    const WarpRoutePlan plan = targeting.plan_route(player.position, galaxy[0], ctx);
    OW_ASSERT(plan.ok);
    OW_ASSERT(std::fabs(plan.total_distance - 2500.0) < 1e-9);
    OW_ASSERT(plan.quote.cost == 42.0);
    OW_ASSERT(plan.quote.adaptive);

    const WarpRoutePlan hidden = targeting.plan_route(player.position, galaxy[3], ctx);
    OW_ASSERT(!hidden.ok);
  }

  return 0;
}
