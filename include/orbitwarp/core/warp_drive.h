#pragma once

#include <optional>

#include "orbitwarp/core/cost_engine.h"
#include "orbitwarp/core/energy_pool.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/core/warp_hooks.h"
#include "orbitwarp/core/warp_memory.h"
#include "orbitwarp/core/warp_types.h"

namespace orbitwarp {

enum class WarpPhase { Idle, Selecting, Warping, Arrived };

const char* warp_phase_label(WarpPhase p);

// The warp currently in flight. Never persisted.
struct WarpAttempt {
  Vec2 source;
  Destination destination;
  WarpQuote quote;
  // Situation at commit time; learning at arrival uses this, not the arrival-time one.
  WarpContext context;
  double start_time{0.0};
  double progress{0.0};  // 0..1
};

// Idle -> (Selecting) -> Warping -> Arrived -> Idle.
//
// Committed warps always complete: there is no cancellation. Energy is paid in
// full at commit, and the memory learns from the warp exactly once, at arrival.
class WarpDrive {
 public:
  WarpDrive(EnergyPool& energy, WarpMemory& memory, const CostEngine& costs,
            const WarpDriveConfig& cfg = WarpDriveConfig{}, WarpPresentationHooks* hooks = nullptr);

  WarpDrive(const WarpDrive&) = delete;
  WarpDrive& operator=(const WarpDrive&) = delete;

  // Hooks are not owned. nullptr disables presentation callbacks.
  void set_hooks(WarpPresentationHooks* hooks) { hooks_ = hooks; }

  // Resets to Idle, refills energy and locks the drive.
  void init();
  bool initialized() const { return initialized_; }

  void unlock();
  // Restores the unlock flag from a save without firing on_warp_unlocked().
  void set_unlocked(bool unlocked) { unlocked_ = unlocked; }
  bool unlocked() const { return unlocked_; }

  // Why a commit to `dest` would be rejected right now (None if it would succeed).
  // `quote_out`, when given, receives the quote the check was made against.
  WarpFailureReason check_commit(const Destination& dest, const PlayerModel& player, const WarpContext& ctx,
                                 WarpQuote* quote_out = nullptr) const;
  bool can_commit(const Destination& dest, const PlayerModel& player, const WarpContext& ctx) const;

  // Returns false (see last_failure()) without changing any state except the
  // failed-attempt log.
  bool commit(const Destination& dest, const PlayerModel& player, const WarpContext& ctx);

  // Without a context the warp is priced at the static base cost. Learning at
  // arrival still sees the player's state at commit time.
  WarpFailureReason check_commit(const Destination& dest, const PlayerModel& player,
                                 WarpQuote* quote_out = nullptr) const;
  bool can_commit(const Destination& dest, const PlayerModel& player) const;
  bool commit(const Destination& dest, const PlayerModel& player);

  WarpFailureReason last_failure() const { return last_failure_; }

  // The drive's clock advances only through tick(). Contexts built from it keep
  // memory timestamps monotonic.
  double clock_seconds() const { return clock_seconds_; }
  void set_clock_seconds(double t) { clock_seconds_ = (t > clock_seconds_) ? t : clock_seconds_; }
  WarpContext context_for(const PlayerModel& player) const { return make_warp_context(player, clock_seconds_); }

  // Advances an in-flight warp. Returns true on the tick the warp arrives.
  bool tick(double dt, PlayerModel& player);

  // Selection mode (used by targeting). Only possible while Idle and unlocked.
  bool begin_selection();
  void end_selection();

  WarpPhase phase() const { return phase_; }
  bool warping() const { return phase_ == WarpPhase::Warping; }
  const std::optional<WarpAttempt>& attempt() const { return attempt_; }
  double progress() const { return attempt_ ? attempt_->progress : 0.0; }

  // Presentation envelope: rises to 1 at mid-warp and back to 0 at arrival. Any
  // residue fades at effect_fade_per_second while idle.
  double effect_alpha() const { return effect_alpha_; }

  // What the memory concluded about the most recent completed warp.
  const std::optional<WarpLearning>& last_learning() const { return last_learning_; }

  const WarpDriveConfig& config() const { return cfg_; }

 private:
  bool require_init(const char* op) const;
  WarpFailureReason evaluate(const Destination& dest, const WarpQuote& q) const;
  bool commit_quoted(const Destination& dest, const PlayerModel& player, const WarpQuote& q, const WarpContext& ctx);
  void fail(WarpFailureReason reason, const Destination& dest, const WarpQuote& q, const WarpContext& ctx);
  void arrive(PlayerModel& player);

  EnergyPool& energy_;
  WarpMemory& memory_;
  const CostEngine& costs_;
  WarpDriveConfig cfg_;
  WarpPresentationHooks* hooks_{nullptr};

  bool initialized_{false};
  bool unlocked_{false};
  mutable bool warned_uninitialized_{false};

  WarpPhase phase_{WarpPhase::Idle};
  std::optional<WarpAttempt> attempt_;
  std::optional<WarpLearning> last_learning_;
  WarpFailureReason last_failure_{WarpFailureReason::None};
  double effect_alpha_{0.0};
  double clock_seconds_{0.0};
};

} // namespace orbitwarp
