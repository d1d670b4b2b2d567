#include "orbitwarp/core/warp_subsystem.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <utility>

#include "orbitwarp/core/warp_serialization.h"
#include "orbitwarp/util/log.h"

namespace orbitwarp {

WarpSubsystem::WarpSubsystem(const WarpConfig& cfg, WarpPresentationHooks* hooks)
    : cfg_(cfg),
      energy_(cfg_.energy),
      memory_(cfg_.memory),
      costs_(energy_, memory_, cfg_.cost),
      drive_(energy_, memory_, costs_, cfg_.drive, hooks),
      targeting_(drive_, costs_, cfg_.targeting) {}

bool WarpSubsystem::update(double dt, PlayerModel& player) {
  if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;
  energy_.regenerate(dt);
  return drive_.tick(dt, player);
}

WarpQuote WarpSubsystem::quote(const PlayerModel& player, const Destination& dest) const {
  return costs_.quote_for(player.position, dest, context_for(player));
}

bool WarpSubsystem::can_commit(const Destination& dest, const PlayerModel& player) const {
  return drive_.can_commit(dest, player, context_for(player));
}

bool WarpSubsystem::commit(const Destination& dest, const PlayerModel& player) {
  return drive_.commit(dest, player, context_for(player));
}

SelectionResult WarpSubsystem::select_at(double x, double y, const std::vector<Destination>& destinations,
                                         const PlayerModel& player) {
  return targeting_.select_and_maybe_commit(x, y, destinations, player, context_for(player));
}

WarpStatus WarpSubsystem::status() const {
  WarpStatus s;
  s.phase = drive_.phase();
  s.unlocked = drive_.unlocked();
  s.energy = energy_.status();
  s.progress = drive_.progress();
  s.effect_alpha = drive_.effect_alpha();
  if (drive_.attempt()) s.destination = destination_key(drive_.attempt()->destination);
  s.memory = memory_.stats();
  s.clock_seconds = drive_.clock_seconds();
  return s;
}

bool WarpSubsystem::save(KeyValueStore& store) const {
  WarpSaveData d;
  d.memory = memory_.state();
  d.has_energy = true;
  d.energy = energy_.snapshot();
  d.unlocked = drive_.unlocked();
  d.clock_seconds = drive_.clock_seconds();
  d.unknown_fields = unknown_fields_;
  d.unknown_section_fields = unknown_section_fields_;
  d.unknown_entry_fields = unknown_entry_fields_;

  try {
    store.put(cfg_.persistence_key, serialize_warp_save(d));
  } catch (const std::exception& e) {
    log::error(std::string("Failed to save warp memory: ") + e.what());
    return false;
  }
  log::debug("Saved warp memory under '" + cfg_.persistence_key + "'");
  return true;
}

WarpLoadResult WarpSubsystem::load(const KeyValueStore& store) {
  WarpLoadResult r;
  std::optional<std::string> blob;
  try {
    blob = store.get(cfg_.persistence_key);
  } catch (const std::exception& e) {
    r.error = e.what();
    log::error(std::string("Failed to read warp memory: ") + e.what() + "; keeping current state");
    return r;
  }
  if (!blob) {
    log::info("No saved warp memory under '" + cfg_.persistence_key + "'; starting fresh");
    return r;
  }
  r.found = true;

  WarpSaveData d = deserialize_warp_save(*blob, cfg_.memory, &r.recovered_fields);
  memory_.restore(std::move(d.memory));
  if (d.has_energy) energy_.restore(d.energy);
  drive_.set_unlocked(d.unlocked);
  // The clock never runs behind the memory's own timestamps.
  drive_.set_clock_seconds(std::max(d.clock_seconds, memory_.behavior().last_warp_time));
  unknown_fields_ = std::move(d.unknown_fields);
  unknown_section_fields_ = std::move(d.unknown_section_fields);
  unknown_entry_fields_ = std::move(d.unknown_entry_fields);

  log::info("Loaded warp memory: " + std::to_string(memory_.behavior().total_warps) + " warps, " +
            std::to_string(memory_.routes().size()) + " routes");
  return r;
}

} // namespace orbitwarp
