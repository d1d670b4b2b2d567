#include "orbitwarp/core/warp_drive.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "orbitwarp/util/log.h"
#include "orbitwarp/util/strings.h"

namespace orbitwarp {

const char* warp_phase_label(WarpPhase p) {
  switch (p) {
    case WarpPhase::Idle: return "idle";
    case WarpPhase::Selecting: return "selecting";
    case WarpPhase::Warping: return "warping";
    case WarpPhase::Arrived: return "arrived";
  }
  return "idle";
}

WarpDrive::WarpDrive(EnergyPool& energy, WarpMemory& memory, const CostEngine& costs, const WarpDriveConfig& cfg,
                     WarpPresentationHooks* hooks)
    : energy_(energy), memory_(memory), costs_(costs), cfg_(cfg), hooks_(hooks) {}

void WarpDrive::init() {
  initialized_ = true;
  unlocked_ = false;
  warned_uninitialized_ = false;
  phase_ = WarpPhase::Idle;
  attempt_.reset();
  last_learning_.reset();
  last_failure_ = WarpFailureReason::None;
  effect_alpha_ = 0.0;
  energy_.set_regen_suspended(false);
  energy_.refill();
}

void WarpDrive::unlock() {
  if (!require_init("unlock")) return;
  if (unlocked_) return;
  unlocked_ = true;
  log::info("Warp drive unlocked");
  if (hooks_) hooks_->on_warp_unlocked();
}

bool WarpDrive::require_init(const char* op) const {
  if (initialized_) return true;
  if (!warned_uninitialized_) {
    log::error(std::string("WarpDrive::") + op + " called before init(); ignoring");
    warned_uninitialized_ = true;
  }
  return false;
}

WarpFailureReason WarpDrive::evaluate(const Destination& dest, const WarpQuote& q) const {
  if (!initialized_) return WarpFailureReason::NotInitialized;
  if (phase_ != WarpPhase::Idle && phase_ != WarpPhase::Selecting) return WarpFailureReason::AlreadyWarping;
  if (!unlocked_) return WarpFailureReason::Locked;
  if (!dest.discovered) return WarpFailureReason::Undiscovered;
  if (!energy_.has_energy(q.cost)) return WarpFailureReason::InsufficientEnergy;
  return WarpFailureReason::None;
}

WarpFailureReason WarpDrive::check_commit(const Destination& dest, const PlayerModel& player, const WarpContext& ctx,
                                          WarpQuote* quote_out) const {
  const WarpQuote q = costs_.quote_for(player.position, dest, ctx);
  if (quote_out) *quote_out = q;
  return evaluate(dest, q);
}

WarpFailureReason WarpDrive::check_commit(const Destination& dest, const PlayerModel& player,
                                          WarpQuote* quote_out) const {
  const WarpQuote q = costs_.quote(distance(player.position, dest.position));
  if (quote_out) *quote_out = q;
  return evaluate(dest, q);
}

bool WarpDrive::can_commit(const Destination& dest, const PlayerModel& player, const WarpContext& ctx) const {
  return check_commit(dest, player, ctx) == WarpFailureReason::None;
}

bool WarpDrive::can_commit(const Destination& dest, const PlayerModel& player) const {
  return check_commit(dest, player) == WarpFailureReason::None;
}

bool WarpDrive::commit(const Destination& dest, const PlayerModel& player, const WarpContext& ctx) {
  return commit_quoted(dest, player, costs_.quote_for(player.position, dest, ctx), ctx);
}

bool WarpDrive::commit(const Destination& dest, const PlayerModel& player) {
  return commit_quoted(dest, player, costs_.quote(distance(player.position, dest.position)), context_for(player));
}

bool WarpDrive::commit_quoted(const Destination& dest, const PlayerModel& player, const WarpQuote& q,
                              const WarpContext& ctx) {
  const WarpFailureReason reason = evaluate(dest, q);
  if (reason == WarpFailureReason::NotInitialized) require_init("commit");
  if (reason != WarpFailureReason::None) {
    fail(reason, dest, q, ctx);
    return false;
  }

  // evaluate() guarantees this succeeds.
  if (!energy_.consume(q.cost)) {
    fail(WarpFailureReason::InsufficientEnergy, dest, q, ctx);
    return false;
  }
  energy_.set_regen_suspended(true);

  WarpAttempt a;
  a.source = player.position;
  a.destination = dest;
  a.quote = q;
  a.context = ctx;
  a.start_time = ctx.now_seconds;
  a.progress = 0.0;
  attempt_ = std::move(a);
  phase_ = WarpPhase::Warping;
  last_failure_ = WarpFailureReason::None;

  log::info("Warp committed to " + (dest.name.empty() ? destination_key(dest) : dest.name) + " for " +
            format_fixed(q.cost, 0) + " energy (base " + format_fixed(q.base_cost, 0) + ")");
  if (hooks_) hooks_->on_warp_committed(q.cost);
  return true;
}

void WarpDrive::fail(WarpFailureReason reason, const Destination& dest, const WarpQuote& q, const WarpContext& ctx) {
  last_failure_ = reason;
  switch (reason) {
    case WarpFailureReason::Locked:
    case WarpFailureReason::Undiscovered:
    case WarpFailureReason::InsufficientEnergy:
      memory_.record_failed_attempt(destination_key(dest), q.cost, energy_.current(), ctx);
      break;
    default:
      break;
  }
  log::debug(std::string("Warp commit rejected: ") + warp_failure_reason_label(reason));
  if (hooks_) hooks_->on_warp_failed(reason);
}

bool WarpDrive::tick(double dt, PlayerModel& player) {
  if (!require_init("tick")) return false;
  if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;
  clock_seconds_ += dt;

  if (phase_ == WarpPhase::Arrived) phase_ = WarpPhase::Idle;

  if (phase_ != WarpPhase::Warping || !attempt_) {
    const double fade = std::max(0.0, cfg_.effect_fade_per_second);
    effect_alpha_ = std::max(0.0, effect_alpha_ - fade * dt);
    return false;
  }

  const double duration = cfg_.warp_duration_seconds > 0.0 ? cfg_.warp_duration_seconds : 2.0;
  attempt_->progress = std::min(1.0, attempt_->progress + dt / duration);
  // Rises over the first half of the warp, falls over the second.
  const double p = attempt_->progress;
  effect_alpha_ = p < 0.5 ? p * 2.0 : (1.0 - p) * 2.0;

  if (attempt_->progress < 1.0) return false;
  arrive(player);
  return true;
}

void WarpDrive::arrive(PlayerModel& player) {
  const WarpAttempt a = *attempt_;
  attempt_.reset();
  phase_ = WarpPhase::Arrived;

  player.position = a.destination.position + Vec2{std::max(0.0, a.destination.radius) + cfg_.arrival_standoff, 0.0};
  player.velocity = Vec2{0.0, 0.0};

  energy_.set_regen_suspended(false);

  // Health and dangers as seen at commit; timestamps at arrival.
  WarpContext learned = a.context;
  learned.now_seconds = clock_seconds_;
  const double travelled = distance(a.source, a.destination.position);
  last_learning_ = memory_.record_warp(a.source, destination_key(a.destination), a.quote.cost, learned, travelled);

  log::info("Warp arrived at " + (a.destination.name.empty() ? destination_key(a.destination) : a.destination.name));
  if (hooks_) hooks_->on_warp_arrived();
}

bool WarpDrive::begin_selection() {
  if (!require_init("begin_selection")) return false;
  if (!unlocked_ || phase_ != WarpPhase::Idle) return false;
  phase_ = WarpPhase::Selecting;
  return true;
}

void WarpDrive::end_selection() {
  if (phase_ == WarpPhase::Selecting) phase_ = WarpPhase::Idle;
}

} // namespace orbitwarp
