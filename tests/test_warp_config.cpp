#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/util/json.h"

#define OW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool has_problem(const std::vector<std::string>& problems, const std::string& needle) {
  return std::any_of(problems.begin(), problems.end(),
                     [&](const std::string& p) { return p.find(needle) != std::string::npos; });
}

} // namespace

int test_warp_config() {
  using namespace orbitwarp;

  // Defaults are valid.
  {
    const WarpConfig cfg;
    OW_ASSERT(validate_warp_config(cfg).empty());
    OW_ASSERT(cfg.energy.max_energy == 1000.0);
    OW_ASSERT(cfg.energy.min_warp_cost == 50.0);
    OW_ASSERT(cfg.memory.learning_curve_capacity == 50);
    OW_ASSERT(cfg.persistence_key == "orbitwarp.warp_drive");
  }

  // Partial override keeps everything else.
  {
    const std::string text = R"({
      "energy": {"max_energy": 1500, "regen_per_second": "fast"},
      "memory": {"adaptation_window": 7.6, "route_cell_pitch": 250},
      "drive": {"warp_duration_seconds": 3.5},
      "persistence_key": "slot_2",
      "unknown_section": {"x": 1}
    })";
    const WarpConfig cfg = warp_config_from_json(json::parse(text));
    OW_ASSERT(cfg.energy.max_energy == 1500.0);
    OW_ASSERT(cfg.energy.regen_per_second == 50.0);
    OW_ASSERT(cfg.memory.adaptation_window == 8);
    OW_ASSERT(cfg.memory.route_cell_pitch == 250.0);
    OW_ASSERT(cfg.memory.learning_curve_capacity == 50);
    OW_ASSERT(cfg.drive.warp_duration_seconds == 3.5);
    OW_ASSERT(cfg.targeting.selection_radius == 50.0);
    OW_ASSERT(cfg.persistence_key == "slot_2");
    OW_ASSERT(validate_warp_config(cfg).empty());

    // Layered on top of a non-default base.
    WarpConfig base;
    base.cost.min_cost_fraction = 0.5;
    const WarpConfig layered = warp_config_from_json(json::parse(text), base);
    OW_ASSERT(layered.cost.min_cost_fraction == 0.5);
    OW_ASSERT(layered.energy.max_energy == 1500.0);
  }

  // Not an object: defaults.
  {
    const WarpConfig cfg = warp_config_from_json(json::parse("[1, 2]"));
    OW_ASSERT(cfg.energy.max_energy == 1000.0);
  }

  // Export then import reproduces the config.
  {
    WarpConfig cfg;
    cfg.energy.regen_per_second = 75.0;
    cfg.memory.consolidate_every_warps = 25;
    cfg.cost.emergency_floor = 0.3;
    cfg.persistence_key = "slot_9";
    const WarpConfig back = warp_config_from_json(json::parse(json::stringify(warp_config_to_json(cfg))));
    OW_ASSERT(back.energy.regen_per_second == 75.0);
    OW_ASSERT(back.memory.consolidate_every_warps == 25);
    OW_ASSERT(back.cost.emergency_floor == 0.3);
    OW_ASSERT(back.persistence_key == "slot_9");
  }

  // Validation problems are reported by field.
  {
    WarpConfig cfg;
    cfg.energy.max_energy = 0.0;
    cfg.memory.adaptation_window = 1;
    cfg.memory.consolidated_curve_samples = 80;
    cfg.cost.min_cost_fraction = 1.5;
    cfg.targeting.selection_radius = -1.0;
    cfg.persistence_key.clear();
    const auto problems = validate_warp_config(cfg);
    OW_ASSERT(problems.size() == 6);
    OW_ASSERT(has_problem(problems, "energy.max_energy"));
    OW_ASSERT(has_problem(problems, "memory.adaptation_window"));
    OW_ASSERT(has_problem(problems, "memory.consolidated_curve_samples"));
    OW_ASSERT(has_problem(problems, "cost.min_cost_fraction"));
    OW_ASSERT(has_problem(problems, "targeting.selection_radius"));
    OW_ASSERT(has_problem(problems, "persistence_key"));
  }

  // Out-of-range integers saturate instead of overflowing.
  {
    const WarpConfig cfg = warp_config_from_json(
        json::parse("{\"memory\": {\"learning_curve_capacity\": 1e20, \"adaptation_window\": -1e20}}"));
    OW_ASSERT(cfg.memory.learning_curve_capacity == std::numeric_limits<int>::max());
    OW_ASSERT(cfg.memory.adaptation_window == std::numeric_limits<int>::min());
    const std::vector<std::string> problems = validate_warp_config(cfg);
    OW_ASSERT(has_problem(problems, "memory.adaptation_window"));
  }

  // The shipped tuning file is the defaults.
  {
    const WarpConfig cfg = load_warp_config_from_file("data/warp_config.json");
    OW_ASSERT(validate_warp_config(cfg).empty());
    OW_ASSERT(cfg.energy.max_energy == WarpConfig{}.energy.max_energy);
    OW_ASSERT(cfg.memory.consolidated_curve_samples == 30);
    OW_ASSERT(cfg.persistence_key == "orbitwarp.warp_drive");
  }

  bool threw = false;
  try {
    (void)load_warp_config_from_file("data/does_not_exist.json");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  OW_ASSERT(threw);

  return 0;
}
