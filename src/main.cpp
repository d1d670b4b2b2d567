#include <SDL.h>

#include <memory>
#include <string>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "orbitwarp/core/destination_registry.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/util/file_io.h"
#include "orbitwarp/util/kv_store.h"
#include "orbitwarp/util/log.h"
#include "ui/warp_sandbox.h"

int main(int argc, char** argv) {
  try {
    orbitwarp::log::set_level(orbitwarp::log::Level::Info);

    std::string galaxy_path = "data/galaxy/demo_galaxy.json";
    std::string config_path = "data/warp_config.json";
    std::string store_dir = "saves";
    for (int i = 1; i < argc - 1; ++i) {
      const std::string a = argv[i];
      if (a == "--galaxy") galaxy_path = argv[i + 1];
      if (a == "--config") config_path = argv[i + 1];
      if (a == "--store") store_dir = argv[i + 1];
    }

    orbitwarp::WarpConfig cfg;
    if (orbitwarp::file_exists(config_path)) cfg = orbitwarp::load_warp_config_from_file(config_path);
    for (const auto& p : orbitwarp::validate_warp_config(cfg)) orbitwarp::log::warn("Config problem: " + p);

    auto galaxy = orbitwarp::DestinationRegistry::load_from_file(galaxy_path);
    auto store = std::make_unique<orbitwarp::FileKeyValueStore>(store_dir);

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      orbitwarp::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Window* window = SDL_CreateWindow("orbitwarp sandbox", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280,
                                          720, SDL_WINDOW_RESIZABLE);
    if (!window) {
      orbitwarp::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
      SDL_Quit();
      return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
      orbitwarp::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
      SDL_DestroyWindow(window);
      SDL_Quit();
      return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    {
      orbitwarp::ui::WarpSandbox sandbox(cfg, std::move(galaxy), std::move(store));

      Uint64 last = SDL_GetPerformanceCounter();
      bool running = true;
      while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
          ImGui_ImplSDL2_ProcessEvent(&e);
          if (e.type == SDL_QUIT) running = false;
          if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
              e.window.windowID == SDL_GetWindowID(window))
            running = false;
          sandbox.on_event(e);
        }

        const Uint64 now = SDL_GetPerformanceCounter();
        const double dt = static_cast<double>(now - last) / static_cast<double>(SDL_GetPerformanceFrequency());
        last = now;

        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        // Clamp so a stalled frame (window drag, breakpoint) does not jump the simulation.
        sandbox.frame(dt > 0.1 ? 0.1 : dt);

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
      }
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
  } catch (const std::exception& e) {
    orbitwarp::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
