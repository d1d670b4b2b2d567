#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "orbitwarp/core/cost_engine.h"
#include "orbitwarp/core/energy_pool.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/core/warp_drive.h"
#include "orbitwarp/core/warp_hooks.h"
#include "orbitwarp/core/warp_memory.h"
#include "orbitwarp/core/warp_targeting.h"
#include "orbitwarp/util/json.h"
#include "orbitwarp/util/kv_store.h"

namespace orbitwarp {

// Read-only snapshot for HUD / debug collaborators.
struct WarpStatus {
  WarpPhase phase{WarpPhase::Idle};
  bool unlocked{false};
  EnergyStatus energy;
  double progress{0.0};
  double effect_alpha{0.0};
  std::optional<DestinationId> destination;
  MemoryStats memory;
  double clock_seconds{0.0};
};

struct WarpLoadResult {
  bool found{false};
  // Dotted paths of the fields that were malformed and fell back to defaults.
  std::vector<std::string> recovered_fields;
  std::string error;
};

// Owns the whole warp mechanic: energy, memory, pricing, the state machine and
// targeting. One instance per game session, passed by reference to whoever needs
// it.
class WarpSubsystem {
 public:
  explicit WarpSubsystem(const WarpConfig& cfg = WarpConfig{}, WarpPresentationHooks* hooks = nullptr);

  WarpSubsystem(const WarpSubsystem&) = delete;
  WarpSubsystem& operator=(const WarpSubsystem&) = delete;

  void init() { drive_.init(); }
  void unlock() { drive_.unlock(); }
  void set_hooks(WarpPresentationHooks* hooks) { drive_.set_hooks(hooks); }

  // Per frame: energy regeneration first, then the state machine (which advances
  // the clock). Returns true on the frame a warp arrives.
  bool update(double dt, PlayerModel& player);

  WarpContext context_for(const PlayerModel& player) const { return drive_.context_for(player); }

  WarpQuote quote(const PlayerModel& player, const Destination& dest) const;
  bool can_commit(const Destination& dest, const PlayerModel& player) const;
  bool commit(const Destination& dest, const PlayerModel& player);

  bool toggle_selection() { return targeting_.toggle_selection(); }
  SelectionResult select_at(double x, double y, const std::vector<Destination>& destinations,
                            const PlayerModel& player);

  WarpStatus status() const;

  // Persistence through the generic key-value store under config().persistence_key.
  // Neither throws: storage or data problems are logged and reported in the result.
  bool save(KeyValueStore& store) const;
  WarpLoadResult load(const KeyValueStore& store);

  EnergyPool& energy() { return energy_; }
  const EnergyPool& energy() const { return energy_; }
  const WarpMemory& memory() const { return memory_; }
  const CostEngine& costs() const { return costs_; }
  WarpDrive& drive() { return drive_; }
  const WarpDrive& drive() const { return drive_; }
  WarpTargeting& targeting() { return targeting_; }
  const WarpTargeting& targeting() const { return targeting_; }

  double clock_seconds() const { return drive_.clock_seconds(); }
  const WarpConfig& config() const { return cfg_; }

 private:
  WarpConfig cfg_;
  EnergyPool energy_;
  WarpMemory memory_;
  CostEngine costs_;
  WarpDrive drive_;
  WarpTargeting targeting_;

  // Save-data fields this build does not understand, carried to the next save.
  json::Object unknown_fields_;
  std::map<std::string, json::Object> unknown_section_fields_;
  std::map<std::string, std::map<std::string, json::Object>> unknown_entry_fields_;
};

} // namespace orbitwarp
