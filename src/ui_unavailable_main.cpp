#include <iostream>
#include <string_view>

#ifndef ORBITWARP_VERSION
#define ORBITWARP_VERSION "unknown"
#endif

#ifndef ORBITWARP_UI_UNAVAILABLE_REASON
#define ORBITWARP_UI_UNAVAILABLE_REASON "SDL2 and/or Dear ImGui were not found when this build was configured."
#endif

namespace {

constexpr int kExitCodeOk = 0;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (!arg) continue;
    if (flag == arg) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "orbitwarp";
  std::cout << "orbitwarp sandbox launcher v" << ORBITWARP_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the interactive sandbox.\n";
  std::cout << "Reason: " << ORBITWARP_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "The headless driver exercises the same warp subsystem:\n";
  std::cout << "  orbitwarp_cli --warps 12 --store saves\n\n";
  std::cout << "To build the sandbox, install SDL2 and Dear ImGui (with its SDL2 and\n";
  std::cout << "SDL_Renderer2 backends) and re-run CMake.\n";
}

} // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << ORBITWARP_VERSION << "\n";
    return 0;
  }

  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  std::cerr << "orbitwarp sandbox is unavailable in this build.\n";
  std::cerr << "Reason: " << ORBITWARP_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Run with --help for details.\n";
  return has_flag(argc, argv, "--require-ui") ? kExitCodeUiRequiredUnavailable : kExitCodeOk;
}
