#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "orbitwarp/core/warp_drive.h"

#define OW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

struct RecordingHooks : orbitwarp::WarpPresentationHooks {
  int committed{0};
  int arrived{0};
  int unlocked{0};
  double last_cost{0.0};
  std::vector<orbitwarp::WarpFailureReason> failures;

  void on_warp_committed(double cost) override {
    ++committed;
    last_cost = cost;
  }
  void on_warp_arrived() override { ++arrived; }
  void on_warp_failed(orbitwarp::WarpFailureReason r) override { failures.push_back(r); }
  void on_warp_unlocked() override { ++unlocked; }
};

orbitwarp::Destination make_dest(const char* id, double x, double y, bool discovered = true) {
  orbitwarp::Destination d;
  d.id = id;
  d.name = id;
  d.position = orbitwarp::Vec2{x, y};
  d.radius = 40.0;
  d.discovered = discovered;
  return d;
}

} // namespace

int test_warp_drive() {
  using namespace orbitwarp;

  const Destination ember = make_dest("ember", 2500.0, 0.0);
  const Destination hidden = make_dest("hidden", 800.0, 0.0, false);

  // Lifecycle: commit -> warping -> arrived -> idle.
  {
    EnergyPool energy;
    WarpMemory memory;
    CostEngine costs(energy, memory);
    RecordingHooks hooks;
    WarpDrive drive(energy, memory, costs, WarpDriveConfig{}, &hooks);

    PlayerModel player;

    // Before init every entry point is a logged no-op / rejection.
    OW_ASSERT(!drive.commit(ember, player, drive.context_for(player)));
    OW_ASSERT(drive.last_failure() == WarpFailureReason::NotInitialized);
    OW_ASSERT(!drive.tick(1.0, player));
    OW_ASSERT(!drive.begin_selection());
    OW_ASSERT(memory.failed_attempts() == 0);
    OW_ASSERT(hooks.failures.size() == 1);

    drive.init();
    OW_ASSERT(drive.phase() == WarpPhase::Idle);
    OW_ASSERT(!drive.unlocked());

    // Locked drive.
    OW_ASSERT(!drive.commit(ember, player));
    OW_ASSERT(drive.last_failure() == WarpFailureReason::Locked);
    OW_ASSERT(memory.failed_attempts() == 1);

    drive.unlock();
    drive.unlock();
    OW_ASSERT(drive.unlocked());
    OW_ASSERT(hooks.unlocked == 1);

    // Undiscovered destination.
    OW_ASSERT(!drive.can_commit(hidden, player));
    OW_ASSERT(!drive.commit(hidden, player));
    OW_ASSERT(drive.last_failure() == WarpFailureReason::Undiscovered);
    OW_ASSERT(memory.failed_attempts() == 2);

    // Static pricing: base cost 50 for 2500 units.
    OW_ASSERT(drive.can_commit(ember, player));
    OW_ASSERT(drive.commit(ember, player));
    OW_ASSERT(approx(energy.current(), 950.0));
    OW_ASSERT(drive.phase() == WarpPhase::Warping);
    OW_ASSERT(energy.regen_suspended());
    OW_ASSERT(hooks.committed == 1);
    OW_ASSERT(approx(hooks.last_cost, 50.0));
    OW_ASSERT(drive.attempt().has_value());
    OW_ASSERT(approx(drive.attempt()->quote.cost, 50.0));

    // No second commit while in flight.
    OW_ASSERT(!drive.commit(ember, player));
    OW_ASSERT(drive.last_failure() == WarpFailureReason::AlreadyWarping);
    OW_ASSERT(memory.failed_attempts() == 2);
    OW_ASSERT(approx(energy.current(), 950.0));

    OW_ASSERT(!drive.tick(0.5, player));
    OW_ASSERT(approx(drive.progress(), 0.25));
    OW_ASSERT(approx(drive.effect_alpha(), 0.5));
    OW_ASSERT(!drive.tick(0.5, player));
    OW_ASSERT(approx(drive.effect_alpha(), 1.0));
    OW_ASSERT(memory.behavior().total_warps == 0);

    OW_ASSERT(drive.tick(1.0, player));
    OW_ASSERT(drive.phase() == WarpPhase::Arrived);
    OW_ASSERT(!drive.attempt().has_value());
    OW_ASSERT(hooks.arrived == 1);
    OW_ASSERT(approx(drive.effect_alpha(), 0.0));
    OW_ASSERT(!energy.regen_suspended());
    OW_ASSERT(approx(player.position.x, 2500.0 + 40.0 + 30.0));
    OW_ASSERT(approx(player.position.y, 0.0));
    OW_ASSERT(approx(player.velocity.length(), 0.0));

    // Learned exactly once.
    OW_ASSERT(memory.behavior().total_warps == 1);
    OW_ASSERT(drive.last_learning().has_value());
    OW_ASSERT(drive.last_learning()->exploration);
    OW_ASSERT(memory.find_route(memory.route_key(Vec2{0.0, 0.0}, "ember"))->uses == 1);
    // Committed at clock 0, arrived at clock 2.
    OW_ASSERT(approx(memory.behavior().last_warp_time, 2.0));

    OW_ASSERT(!drive.tick(0.25, player));
    OW_ASSERT(drive.phase() == WarpPhase::Idle);
    OW_ASSERT(approx(drive.effect_alpha(), 0.0));
    OW_ASSERT(!drive.tick(1.0, player));
    OW_ASSERT(approx(drive.effect_alpha(), 0.0));
    OW_ASSERT(memory.behavior().total_warps == 1);
    OW_ASSERT(approx(drive.clock_seconds(), 3.25));
  }

  // Insufficient energy: rejected, nothing consumed, failure logged.
  {
    EnergyPool energy;
    WarpMemory memory;
    CostEngine costs(energy, memory);
    RecordingHooks hooks;
    WarpDrive drive(energy, memory, costs, WarpDriveConfig{}, &hooks);
    drive.init();
    drive.unlock();
    OW_ASSERT(energy.consume(990.0));

    PlayerModel player;
    const WarpContext ctx = drive.context_for(player);
    WarpQuote q;
    OW_ASSERT(drive.check_commit(ember, player, ctx, &q) == WarpFailureReason::InsufficientEnergy);
    OW_ASSERT(q.cost > 10.0);
    OW_ASSERT(!drive.commit(ember, player, ctx));
    OW_ASSERT(approx(energy.current(), 10.0));
    OW_ASSERT(drive.phase() == WarpPhase::Idle);
    OW_ASSERT(memory.failed_attempts() == 1);
    OW_ASSERT(memory.failed_attempt_log().back().destination == "ember");
    OW_ASSERT(approx(memory.failed_attempt_log().back().energy_available, 10.0));
    OW_ASSERT(hooks.failures.size() == 1);
    OW_ASSERT(hooks.failures.back() == WarpFailureReason::InsufficientEnergy);
    OW_ASSERT(hooks.committed == 0);
  }

  // Adaptive commit learns with the context captured at commit time.
  {
    EnergyPool energy;
    WarpMemory memory;
    CostEngine costs(energy, memory);
    WarpDrive drive(energy, memory, costs);
    drive.init();
    drive.unlock();

    PlayerModel player;
    player.health = 10.0;
    player.nearby_dangers.push_back(Danger{Vec2{10.0, 0.0}, 50.0, "drone"});
    OW_ASSERT(drive.commit(ember, player, drive.context_for(player)));
    // 50 * 0.46 * 0.85
    OW_ASSERT(approx(drive.attempt()->quote.cost, 19.0));
    OW_ASSERT(approx(energy.current(), 981.0));

    // Recovered by the time it arrives; the warp still counts as an emergency.
    player.health = 100.0;
    player.nearby_dangers.clear();
    OW_ASSERT(!drive.tick(1.0, player));
    OW_ASSERT(drive.tick(1.0, player));
    OW_ASSERT(memory.behavior().emergency_warps == 1);
    OW_ASSERT(drive.last_learning()->emergency);
    OW_ASSERT(approx(memory.find_route(memory.route_key(Vec2{0.0, 0.0}, "ember"))->total_cost_paid, 19.0));
  }

  // Selection mode.
  {
    EnergyPool energy;
    WarpMemory memory;
    CostEngine costs(energy, memory);
    WarpDrive drive(energy, memory, costs);
    drive.init();
    OW_ASSERT(!drive.begin_selection());
    drive.unlock();
    OW_ASSERT(drive.begin_selection());
    OW_ASSERT(drive.phase() == WarpPhase::Selecting);
    OW_ASSERT(!drive.begin_selection());

    PlayerModel player;
    OW_ASSERT(drive.commit(ember, player));
    OW_ASSERT(drive.phase() == WarpPhase::Warping);
    drive.end_selection();
    OW_ASSERT(drive.phase() == WarpPhase::Warping);
    OW_ASSERT(!drive.begin_selection());

    // init() resets everything, including an in-flight warp.
    drive.init();
    OW_ASSERT(drive.phase() == WarpPhase::Idle);
    OW_ASSERT(!drive.attempt().has_value());
    OW_ASSERT(approx(energy.current(), energy.max()));
    OW_ASSERT(!energy.regen_suspended());
  }

  OW_ASSERT(std::string(warp_phase_label(WarpPhase::Warping)) == "warping");
  OW_ASSERT(std::string(warp_failure_reason_label(WarpFailureReason::InsufficientEnergy)) == "insufficient_energy");

  // Fan-out forwards to every subscriber once.
  {
    RecordingHooks a;
    RecordingHooks b;
    WarpHookFanout fan;
    fan.subscribe(&a);
    fan.subscribe(&b);
    fan.subscribe(&a);
    OW_ASSERT(fan.size() == 2);
    fan.on_warp_committed(12.0);
    fan.on_warp_failed(WarpFailureReason::Locked);
    fan.unsubscribe(&b);
    fan.on_warp_arrived();
    OW_ASSERT(a.committed == 1 && b.committed == 1);
    OW_ASSERT(a.failures.size() == 1 && b.failures.size() == 1);
    OW_ASSERT(a.arrived == 1 && b.arrived == 0);
  }

  return 0;
}
