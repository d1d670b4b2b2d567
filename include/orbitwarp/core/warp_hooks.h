#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace orbitwarp {

enum class WarpFailureReason {
  None,
  NotInitialized,
  Locked,
  Undiscovered,
  InsufficientEnergy,
  AlreadyWarping,
};

inline const char* warp_failure_reason_label(WarpFailureReason r) {
  switch (r) {
    case WarpFailureReason::None: return "none";
    case WarpFailureReason::NotInitialized: return "not_initialized";
    case WarpFailureReason::Locked: return "locked";
    case WarpFailureReason::Undiscovered: return "undiscovered";
    case WarpFailureReason::InsufficientEnergy: return "insufficient_energy";
    case WarpFailureReason::AlreadyWarping: return "already_warping";
  }
  return "none";
}

// Presentation collaborators (tunnel effect, HUD, audio, haptics, achievements).
//
// Fire and forget: the drive never waits on them and ignores what they do.
class WarpPresentationHooks {
 public:
  virtual ~WarpPresentationHooks() = default;

  virtual void on_warp_committed(double /*cost*/) {}
  virtual void on_warp_arrived() {}
  virtual void on_warp_failed(WarpFailureReason /*reason*/) {}
  virtual void on_warp_unlocked() {}
};

// Forwards every event to each subscriber, in subscription order.
// Subscribers are not owned and must outlive the fan-out.
class WarpHookFanout : public WarpPresentationHooks {
 public:
  void subscribe(WarpPresentationHooks* h) {
    if (h && h != this && std::find(subs_.begin(), subs_.end(), h) == subs_.end()) subs_.push_back(h);
  }
  void unsubscribe(WarpPresentationHooks* h) { subs_.erase(std::remove(subs_.begin(), subs_.end(), h), subs_.end()); }
  std::size_t size() const { return subs_.size(); }

  void on_warp_committed(double cost) override {
    for (auto* h : subs_) h->on_warp_committed(cost);
  }
  void on_warp_arrived() override {
    for (auto* h : subs_) h->on_warp_arrived();
  }
  void on_warp_failed(WarpFailureReason reason) override {
    for (auto* h : subs_) h->on_warp_failed(reason);
  }
  void on_warp_unlocked() override {
    for (auto* h : subs_) h->on_warp_unlocked();
  }

 private:
  std::vector<WarpPresentationHooks*> subs_;
};

} // namespace orbitwarp
