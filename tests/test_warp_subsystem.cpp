#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "orbitwarp/core/warp_subsystem.h"
#include "orbitwarp/util/json.h"

#define OW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

struct CountingHooks : orbitwarp::WarpPresentationHooks {
  int committed{0};
  int arrived{0};
  int failed{0};
  int unlocked{0};
  void on_warp_committed(double) override { ++committed; }
  void on_warp_arrived() override { ++arrived; }
  void on_warp_failed(orbitwarp::WarpFailureReason) override { ++failed; }
  void on_warp_unlocked() override { ++unlocked; }
};

// A store whose backend is down.
struct BrokenStore : orbitwarp::KeyValueStore {
  std::optional<std::string> get(const std::string&) const override { throw std::runtime_error("disk offline"); }
  void put(const std::string&, const std::string&) override { throw std::runtime_error("disk offline"); }
  bool erase(const std::string&) override { return false; }
};

orbitwarp::Destination dest(const char* id, double x, double y, double radius = 40.0) {
  orbitwarp::Destination d;
  d.id = id;
  d.name = id;
  d.position = orbitwarp::Vec2{x, y};
  d.radius = radius;
  d.discovered = true;
  return d;
}

// Runs frames until the in-flight warp lands. Returns the number of frames, or -1.
int fly(orbitwarp::WarpSubsystem& warp, orbitwarp::PlayerModel& player, double dt = 0.25) {
  for (int frame = 1; frame <= 1000; ++frame) {
    if (warp.update(dt, player)) return frame;
  }
  return -1;
}

} // namespace

int test_warp_subsystem() {
  using namespace orbitwarp;

  const Destination ember = dest("ember", 2500.0, 0.0);
  const Destination glacier = dest("glacier", 1800.0, 3200.0, 55.0);

  // Fresh state, context-free pricing: the static base cost.
  {
    WarpSubsystem warp;
    warp.init();
    warp.unlock();
    PlayerModel player;

    OW_ASSERT(warp.costs().quote(2500.0).cost == 50.0);
    OW_ASSERT(warp.drive().commit(ember, player));
    OW_ASSERT(approx(warp.energy().current(), 950.0));

    const WarpStatus s = warp.status();
    OW_ASSERT(s.phase == WarpPhase::Warping);
    OW_ASSERT(s.destination.has_value() && *s.destination == "ember");

    // No regeneration in flight.
    warp.update(0.5, player);
    OW_ASSERT(approx(warp.energy().current(), 950.0));

    OW_ASSERT(fly(warp, player) > 0);
    OW_ASSERT(warp.memory().behavior().total_warps == 1);
    OW_ASSERT(approx(player.position.x, 2570.0));

    // Regeneration resumes once landed.
    warp.update(0.5, player);
    OW_ASSERT(approx(warp.energy().current(), 975.0));
  }

  // The same route gets cheaper with practice.
  {
    WarpSubsystem warp;
    warp.init();
    warp.unlock();
    PlayerModel player;

    const double base = warp.energy().base_cost(2500.0);
    for (int i = 0; i < 10; ++i) {
      player.position = Vec2{0.0, 0.0};
      OW_ASSERT(warp.commit(ember, player));
      OW_ASSERT(fly(warp, player) > 0);
      warp.update(10.0, player);
    }
    OW_ASSERT(warp.memory().behavior().total_warps == 10);

    player.position = Vec2{0.0, 0.0};
    const WarpQuote q = warp.quote(player, ember);
    OW_ASSERT(q.cost <= 0.80 * base);
    OW_ASSERT(q.cost >= std::floor(warp.config().cost.min_cost_fraction * base));
    OW_ASSERT(approx(q.familiarity, 0.75));
  }

  // Broke: rejected, nothing spent, the shortfall is remembered.
  {
    CountingHooks hooks;
    WarpSubsystem warp(WarpConfig{}, &hooks);
    warp.init();
    warp.unlock();
    OW_ASSERT(warp.energy().consume(990.0));
    PlayerModel player;

    OW_ASSERT(warp.quote(player, ember).cost > 10.0);
    OW_ASSERT(!warp.can_commit(ember, player));
    OW_ASSERT(!warp.commit(ember, player));
    OW_ASSERT(approx(warp.energy().current(), 10.0));
    OW_ASSERT(warp.memory().failed_attempts() == 1);
    OW_ASSERT(warp.memory().behavior().total_warps == 0);
    OW_ASSERT(hooks.failed == 1);
    OW_ASSERT(hooks.committed == 0);
    OW_ASSERT(hooks.unlocked == 1);
  }

  // First visits are discounted, the discount fades.
  {
    WarpSubsystem warp;
    warp.init();
    warp.unlock();
    PlayerModel player;

    OW_ASSERT(warp.memory().exploration_bonus("glacier") == 0.85);
    for (int i = 0; i < 3; ++i) {
      player.position = Vec2{0.0, 0.0};
      OW_ASSERT(warp.commit(glacier, player));
      OW_ASSERT(fly(warp, player) > 0);
      if (i == 0) OW_ASSERT(warp.memory().exploration_bonus("glacier") == 0.90);
    }
    OW_ASSERT(warp.memory().exploration_bonus("glacier") == 1.0);
  }

  // Fleeing at low health never costs more.
  {
    WarpSubsystem warp;
    warp.init();
    warp.unlock();
    PlayerModel player;
    player.health = 10.0;

    const WarpContext ctx = warp.context_for(player);
    OW_ASSERT(warp.memory().detect_emergency(ctx) >= 0.4);
    const WarpQuote q = warp.quote(player, ember);
    OW_ASSERT(q.multiplier <= 1.0);
    OW_ASSERT(q.cost <= q.base_cost);
  }

  // Persistence through the key-value store.
  {
    InMemoryKeyValueStore store;

    WarpSubsystem first;
    first.init();
    OW_ASSERT(!first.load(store).found);
    first.unlock();
    PlayerModel player;
    OW_ASSERT(first.commit(ember, player));
    OW_ASSERT(fly(first, player) > 0);
    OW_ASSERT(first.commit(glacier, player));
    OW_ASSERT(fly(first, player) > 0);
    first.update(3.0, player);
    OW_ASSERT(first.save(store));
    OW_ASSERT(store.get(first.config().persistence_key).has_value());

    WarpSubsystem second;
    second.init();
    const WarpLoadResult r = second.load(store);
    OW_ASSERT(r.found);
    OW_ASSERT(r.recovered_fields.empty());
    OW_ASSERT(r.error.empty());
    OW_ASSERT(second.drive().unlocked());
    OW_ASSERT(second.memory().behavior().total_warps == 2);
    OW_ASSERT(second.memory().routes().size() == 2);
    OW_ASSERT(approx(second.energy().current(), first.energy().current()));
    OW_ASSERT(approx(second.clock_seconds(), first.clock_seconds()));
    OW_ASSERT(approx(second.memory().behavior().skill_level, first.memory().behavior().skill_level));

    // Same state, same price.
    player.position = Vec2{0.0, 0.0};
    OW_ASSERT(second.quote(player, ember).cost == first.quote(player, ember).cost);

    // The clock keeps running forward from the saved value.
    second.update(1.0, player);
    OW_ASSERT(second.clock_seconds() > first.clock_seconds());
  }

  // Fields written by a newer build survive a load/save cycle.
  {
    InMemoryKeyValueStore store;
    const std::string key = WarpConfig{}.persistence_key;
    store.put(key, R"({"save_version": 1, "clock_seconds": 5, "cosmetics": {"trail": "violet"},
                      "behavior_profile": {"total_warps": 4, "last_warp_time": 12, "favorite": "ember"}})");

    WarpSubsystem warp;
    warp.init();
    const WarpLoadResult r = warp.load(store);
    OW_ASSERT(r.found);
    OW_ASSERT(r.recovered_fields.empty());
    OW_ASSERT(warp.memory().behavior().total_warps == 4);
    // Resumed at the memory's latest timestamp.
    OW_ASSERT(approx(warp.clock_seconds(), 12.0));

    OW_ASSERT(warp.save(store));
    const json::Value doc = json::parse(*store.get(key));
    OW_ASSERT(doc.at("cosmetics").at("trail").string_value() == "violet");
    OW_ASSERT(doc.at("behavior_profile").at("favorite").string_value() == "ember");
    OW_ASSERT(doc.at("behavior_profile").at("total_warps").number_value() == 4.0);
  }

  // A corrupt blob degrades to a fresh memory.
  {
    InMemoryKeyValueStore store;
    store.put(WarpConfig{}.persistence_key, "{\"routes\": [");

    WarpSubsystem warp;
    warp.init();
    const WarpLoadResult r = warp.load(store);
    OW_ASSERT(r.found);
    OW_ASSERT(std::find(r.recovered_fields.begin(), r.recovered_fields.end(), "document") !=
              r.recovered_fields.end());
    OW_ASSERT(warp.memory().behavior().total_warps == 0);
    OW_ASSERT(!warp.drive().unlocked());
  }

  // A deeply nested blob is rejected by the parser instead of overflowing the stack.
  {
    InMemoryKeyValueStore store;
    store.put(WarpConfig{}.persistence_key, "{\"routes\": " + std::string(100000, '['));

    WarpSubsystem warp;
    warp.init();
    const WarpLoadResult r = warp.load(store);
    OW_ASSERT(r.found);
    OW_ASSERT(std::find(r.recovered_fields.begin(), r.recovered_fields.end(), "document") !=
              r.recovered_fields.end());
    OW_ASSERT(warp.memory().behavior().total_warps == 0);
  }

  // Store failures are reported, not thrown.
  {
    BrokenStore broken;
    WarpSubsystem warp;
    warp.init();
    const WarpLoadResult r = warp.load(broken);
    OW_ASSERT(!r.found);
    OW_ASSERT(!r.error.empty());
    OW_ASSERT(!warp.save(broken));
  }

  // Selection through the subsystem.
  {
    CountingHooks hooks;
    WarpSubsystem warp;
    warp.set_hooks(&hooks);
    warp.init();
    warp.unlock();
    PlayerModel player;
    const std::vector<Destination> ds = {ember, glacier};

    OW_ASSERT(warp.toggle_selection());
    const SelectionResult pick = warp.select_at(1810.0, 3190.0, ds, player);
    OW_ASSERT(pick.committed);
    OW_ASSERT(pick.picked->id == "glacier");
    OW_ASSERT(hooks.committed == 1);
    OW_ASSERT(fly(warp, player) > 0);
    OW_ASSERT(hooks.arrived == 1);
    OW_ASSERT(warp.status().memory.total_warps == 1);
    OW_ASSERT(warp.status().memory.known_destinations == 1);
  }

  return 0;
}
