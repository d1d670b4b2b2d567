#pragma once

#include <deque>
#include <memory>
#include <string>

#include <SDL.h>

#include "orbitwarp/core/destination_registry.h"
#include "orbitwarp/core/warp_hooks.h"
#include "orbitwarp/core/warp_subsystem.h"
#include "orbitwarp/util/kv_store.h"

namespace orbitwarp::ui {

// Interactive debugging view of the warp mechanic: a pannable galaxy canvas, the
// energy pool, the in-flight warp and what the memory has learned.
//
// Not the game HUD. It listens to the same presentation hooks the HUD would.
class WarpSandbox : public WarpPresentationHooks {
 public:
  WarpSandbox(const WarpConfig& cfg, DestinationRegistry galaxy, std::unique_ptr<KeyValueStore> store);
  ~WarpSandbox() override;

  WarpSandbox(const WarpSandbox&) = delete;
  WarpSandbox& operator=(const WarpSandbox&) = delete;

  // Called once per frame.
  void frame(double dt);

  void on_event(const SDL_Event& e);

  void on_warp_committed(double cost) override;
  void on_warp_arrived() override;
  void on_warp_failed(WarpFailureReason reason) override;
  void on_warp_unlocked() override;

 private:
  void draw_canvas();
  void draw_controls();
  void draw_memory();
  void draw_console();
  void push_console(const std::string& line);

  DestinationRegistry galaxy_;
  std::unique_ptr<KeyValueStore> store_;
  WarpSubsystem warp_;
  PlayerModel player_;

  double zoom_{0.04};
  Vec2 pan_{0.0, 0.0};
  bool panning_{false};

  float thrust_{400.0f};
  int capacity_level_{0};
  int regen_level_{0};
  int dangers_{0};

  std::deque<std::string> console_;
};

} // namespace orbitwarp::ui
