#include "ui/warp_sandbox.h"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include <imgui.h>

#include "orbitwarp/util/log.h"
#include "orbitwarp/util/strings.h"

namespace orbitwarp::ui {
namespace {

constexpr std::size_t kConsoleLines = 200;

struct CanvasXform {
  ImVec2 center;
  double zoom{1.0};
  Vec2 pan;

  ImVec2 world_to_screen(const Vec2& w) const {
    return ImVec2(center.x + static_cast<float>((w.x + pan.x) * zoom), center.y + static_cast<float>((w.y + pan.y) * zoom));
  }
  Vec2 screen_to_world(const ImVec2& s) const {
    return Vec2{(s.x - center.x) / zoom - pan.x, (s.y - center.y) / zoom - pan.y};
  }
};

ImU32 phase_color(WarpPhase p) {
  switch (p) {
    case WarpPhase::Idle: return IM_COL32(140, 200, 255, 255);
    case WarpPhase::Selecting: return IM_COL32(255, 220, 90, 255);
    case WarpPhase::Warping: return IM_COL32(200, 120, 255, 255);
    case WarpPhase::Arrived: return IM_COL32(120, 255, 160, 255);
  }
  return IM_COL32(255, 255, 255, 255);
}

} // namespace

WarpSandbox::WarpSandbox(const WarpConfig& cfg, DestinationRegistry galaxy, std::unique_ptr<KeyValueStore> store)
    : galaxy_(std::move(galaxy)), store_(std::move(store)), warp_(cfg, this) {
  log::set_sink([this](log::Level lvl, const std::string& msg) {
    push_console(std::string("[") + log::level_label(lvl) + "] " + msg);
  });

  warp_.init();
  if (store_) {
    const auto r = warp_.load(*store_);
    if (!r.recovered_fields.empty()) {
      push_console("Recovered " + std::to_string(r.recovered_fields.size()) + " malformed save field(s)");
    }
  }

  const auto found = galaxy_.discovered();
  if (!found.empty()) player_.position = found.front().position + Vec2{found.front().radius + cfg.drive.arrival_standoff, 0.0};
  pan_ = Vec2{-player_.position.x, -player_.position.y};
}

WarpSandbox::~WarpSandbox() {
  log::set_sink(nullptr);
  if (store_ && !warp_.save(*store_)) log::error("Sandbox: final save failed");
}

void WarpSandbox::push_console(const std::string& line) {
  console_.push_back(line);
  while (console_.size() > kConsoleLines) console_.pop_front();
}

void WarpSandbox::on_warp_committed(double cost) { push_console("hook: committed, cost " + format_fixed(cost, 0)); }
void WarpSandbox::on_warp_arrived() { push_console("hook: arrived"); }
void WarpSandbox::on_warp_failed(WarpFailureReason reason) {
  push_console(std::string("hook: failed (") + warp_failure_reason_label(reason) + ")");
}
void WarpSandbox::on_warp_unlocked() { push_console("hook: warp unlocked"); }

void WarpSandbox::on_event(const SDL_Event& e) {
  if (e.type != SDL_KEYDOWN || e.key.repeat != 0) return;
  if (ImGui::GetIO().WantCaptureKeyboard) return;
  if (e.key.keysym.sym == SDLK_w) warp_.toggle_selection();
}

void WarpSandbox::frame(double dt) {
  // Simple thrust so routes start from different cells.
  if (!warp_.drive().warping() && !ImGui::GetIO().WantCaptureKeyboard) {
    Vec2 dir;
    if (ImGui::IsKeyDown(ImGuiKey_LeftArrow)) dir.x -= 1.0;
    if (ImGui::IsKeyDown(ImGuiKey_RightArrow)) dir.x += 1.0;
    if (ImGui::IsKeyDown(ImGuiKey_UpArrow)) dir.y -= 1.0;
    if (ImGui::IsKeyDown(ImGuiKey_DownArrow)) dir.y += 1.0;
    player_.velocity = dir * static_cast<double>(thrust_);
    player_.position = player_.position + player_.velocity * dt;
  }

  player_.nearby_dangers.clear();
  for (int i = 0; i < dangers_; ++i) player_.nearby_dangers.push_back(Danger{player_.position, 100.0, "drone"});

  warp_.update(dt, player_);

  const ImGuiViewport* vp = ImGui::GetMainViewport();
  const float side = 360.0f;

  ImGui::SetNextWindowPos(vp->WorkPos);
  ImGui::SetNextWindowSize(ImVec2(vp->WorkSize.x - side, vp->WorkSize.y));
  ImGui::Begin("Galaxy", nullptr, ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse);
  draw_canvas();
  ImGui::End();

  ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + vp->WorkSize.x - side, vp->WorkPos.y));
  ImGui::SetNextWindowSize(ImVec2(side, vp->WorkSize.y));
  ImGui::Begin("Warp", nullptr, ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse);
  draw_controls();
  ImGui::Separator();
  draw_memory();
  ImGui::Separator();
  draw_console();
  ImGui::End();
}

void WarpSandbox::draw_canvas() {
  const ImVec2 p0 = ImGui::GetCursorScreenPos();
  const ImVec2 sz = ImGui::GetContentRegionAvail();
  if (sz.x < 8.0f || sz.y < 8.0f) return;
  const ImVec2 p1(p0.x + sz.x, p0.y + sz.y);

  ImDrawList* dl = ImGui::GetWindowDrawList();
  dl->AddRectFilled(p0, p1, IM_COL32(8, 10, 16, 255));

  ImGui::InvisibleButton("##galaxy_canvas", sz, ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonMiddle);
  const bool hovered = ImGui::IsItemHovered();
  const ImGuiIO& io = ImGui::GetIO();

  CanvasXform xf;
  xf.center = ImVec2(p0.x + sz.x * 0.5f, p0.y + sz.y * 0.5f);
  xf.zoom = zoom_;
  xf.pan = pan_;

  if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Middle)) panning_ = true;
  if (panning_) {
    if (ImGui::IsMouseDown(ImGuiMouseButton_Middle)) {
      pan_.x += io.MouseDelta.x / zoom_;
      pan_.y += io.MouseDelta.y / zoom_;
    } else {
      panning_ = false;
    }
  }
  if (hovered && io.MouseWheel != 0.0f) {
    const Vec2 before = xf.screen_to_world(io.MousePos);
    zoom_ = std::clamp(zoom_ * std::pow(1.12, static_cast<double>(io.MouseWheel)), 0.002, 2.0);
    pan_.x = (io.MousePos.x - xf.center.x) / zoom_ - before.x;
    pan_.y = (io.MousePos.y - xf.center.y) / zoom_ - before.y;
    xf.zoom = zoom_;
    xf.pan = pan_;
  }

  const WarpStatus st = warp_.status();
  const WarpContext ctx = warp_.context_for(player_);
  const auto& selected = warp_.targeting().selected();

  dl->PushClipRect(p0, p1, true);

  // Pick radius is in world units; show it around the cursor while selecting.
  if (st.phase == WarpPhase::Selecting && hovered) {
    const float r = static_cast<float>(warp_.config().targeting.selection_radius * zoom_);
    dl->AddCircle(io.MousePos, std::max(r, 3.0f), IM_COL32(255, 220, 90, 160), 32, 1.0f);
  }

  for (const auto& d : galaxy_.all()) {
    const ImVec2 c = xf.world_to_screen(d.position);
    const float r = std::max(3.0f, static_cast<float>(d.radius * zoom_));
    if (!d.discovered) {
      dl->AddCircle(c, r, IM_COL32(90, 90, 100, 200), 24, 1.0f);
      continue;
    }
    const bool is_selected = selected && destination_key(*selected) == destination_key(d);
    const WarpQuote q = warp_.costs().quote_for(player_.position, d, ctx);
    const bool affordable = warp_.costs().affordable(q);
    const ImU32 col = is_selected ? IM_COL32(255, 220, 90, 255)
                                  : (affordable ? IM_COL32(110, 200, 255, 255) : IM_COL32(200, 90, 90, 255));
    dl->AddCircleFilled(c, r, col, 24);
    const std::string label = d.name + " (" + format_fixed(q.cost, 0) + ")";
    dl->AddText(ImVec2(c.x + r + 4.0f, c.y - 7.0f), IM_COL32(220, 220, 230, 255), label.c_str());
  }

  if (const auto& a = warp_.drive().attempt()) {
    const ImVec2 s = xf.world_to_screen(a->source);
    const ImVec2 e = xf.world_to_screen(a->destination.position);
    const ImU32 tunnel = ImGui::ColorConvertFloat4ToU32(ImVec4(0.8f, 0.5f, 1.0f, static_cast<float>(st.effect_alpha)));
    dl->AddLine(s, e, tunnel, 3.0f);
    const auto t = static_cast<float>(a->progress);
    dl->AddCircleFilled(ImVec2(s.x + (e.x - s.x) * t, s.y + (e.y - s.y) * t), 5.0f, tunnel);
  } else {
    dl->AddCircleFilled(xf.world_to_screen(player_.position), 5.0f, phase_color(st.phase));
  }

  dl->PopClipRect();

  if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left) && st.phase == WarpPhase::Selecting) {
    const Vec2 w = xf.screen_to_world(io.MousePos);
    const auto r = warp_.select_at(w.x, w.y, galaxy_.all(), player_);
    if (r.picked && !r.committed) push_console("Selected " + r.picked->name + " (not enough energy yet)");
  }
}

void WarpSandbox::draw_controls() {
  const WarpStatus st = warp_.status();

  ImGui::Text("Phase: %s", warp_phase_label(st.phase));
  ImGui::SameLine();
  ImGui::TextDisabled("(W toggles selection)");

  const std::string energy_label = format_fixed(st.energy.current, 0) + " / " + format_fixed(st.energy.max, 0);
  ImGui::ProgressBar(static_cast<float>(st.energy.percent), ImVec2(-1, 0), energy_label.c_str());
  if (st.energy.regen_suspended) ImGui::TextDisabled("Regeneration suspended while warping");
  if (st.phase == WarpPhase::Warping) ImGui::ProgressBar(static_cast<float>(st.progress), ImVec2(-1, 0), "en route");

  if (!st.unlocked) {
    if (ImGui::Button("Unlock warp drive")) warp_.unlock();
  } else if (ImGui::Button(st.phase == WarpPhase::Selecting ? "Cancel selection" : "Select destination")) {
    warp_.toggle_selection();
  }

  float health = static_cast<float>(player_.health);
  if (ImGui::SliderFloat("Health", &health, 0.0f, 100.0f, "%.0f")) player_.health = health;
  ImGui::SliderInt("Nearby dangers", &dangers_, 0, 5);
  ImGui::SliderFloat("Thrust", &thrust_, 50.0f, 2000.0f, "%.0f");

  if (ImGui::SliderInt("Capacity upgrade", &capacity_level_, 0, 5)) warp_.energy().upgrade_capacity(capacity_level_);
  if (ImGui::SliderInt("Regen upgrade", &regen_level_, 0, 5)) warp_.energy().upgrade_regeneration(regen_level_);
  if (ImGui::Button("Energy pickup (+250)")) warp_.energy().add(250.0);

  if (ImGui::CollapsingHeader("In range")) {
    const auto in_range =
        warp_.targeting().destinations_in_range(player_, galaxy_.all(), 1.0e9, warp_.context_for(player_));
    for (const auto& r : in_range) {
      ImGui::BulletText("%s  %.0f u  cost %.0f", r.destination.name.c_str(), r.distance, r.quote.cost);
    }
    if (in_range.empty()) ImGui::TextDisabled("Nothing affordable");
  }

  if (store_) {
    if (ImGui::Button("Save")) {
      if (warp_.save(*store_)) push_console("Saved");
    }
    ImGui::SameLine();
    if (ImGui::Button("Load")) {
      const auto r = warp_.load(*store_);
      push_console(r.found ? "Loaded" : "Nothing saved yet");
    }
  }
}

void WarpSandbox::draw_memory() {
  const MemoryStats m = warp_.memory().stats();
  ImGui::Text("Warps: %u  (rejected %u)", m.total_warps, m.failed_attempts);
  ImGui::Text("Routes: %zu  Destinations: %zu", m.known_routes, m.known_destinations);
  ImGui::Text("Efficiency %.0f%%  Skill %.2f  Adaptation %.2f", m.efficiency * 100.0, m.skill_level, m.adaptation_level);
  ImGui::Text("Mastery multiplier %.3f", warp_.memory().mastery_multiplier());

  if (const auto& l = warp_.drive().last_learning()) {
    ImGui::Text("Last warp: emergency %.2f%s%s%s", l->emergency_score, l->exploration ? "  exploration" : "",
                l->chain ? "  chain" : "", l->consolidated ? "  consolidated" : "");
  }

  const auto& curve = warp_.memory().efficiency().learning_curve;
  if (!curve.empty()) {
    std::vector<float> costs;
    costs.reserve(curve.size());
    for (const auto& s : curve) costs.push_back(static_cast<float>(s.cost));
    ImGui::PlotLines("Cost trend", costs.data(), static_cast<int>(costs.size()), 0, nullptr, 0.0f, FLT_MAX,
                     ImVec2(-1, 60));
  }
}

void WarpSandbox::draw_console() {
  ImGui::BeginChild("console", ImVec2(0, 0), true);
  for (const auto& line : console_) ImGui::TextUnformatted(line.c_str());
  if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
  ImGui::EndChild();
}

} // namespace orbitwarp::ui
