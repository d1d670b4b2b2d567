#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "orbitwarp/core/destination_registry.h"
#include "orbitwarp/core/warp_config.h"
#include "orbitwarp/core/warp_subsystem.h"
#include "orbitwarp/util/file_io.h"
#include "orbitwarp/util/kv_store.h"
#include "orbitwarp/util/log.h"
#include "orbitwarp/util/strings.h"

namespace {

#ifndef ORBITWARP_VERSION
#define ORBITWARP_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

// Prints the quote breakdown on one line.
void print_quote(const std::string& label, const orbitwarp::WarpQuote& q) {
  using orbitwarp::format_fixed;
  std::cout << "  " << label << ": cost " << format_fixed(q.cost, 0) << " (base " << format_fixed(q.base_cost, 0)
            << ", x" << format_fixed(q.multiplier, 3) << " = fam " << format_fixed(q.familiarity, 3) << " * mastery "
            << format_fixed(q.mastery, 3) << " * emerg " << format_fixed(q.emergency, 3) << " * explore "
            << format_fixed(q.exploration, 3) << " * affinity " << format_fixed(q.affinity, 3) << ")"
            << (q.floored ? " [floored]" : "") << "\n";
}

void print_status(const orbitwarp::WarpStatus& s) {
  using orbitwarp::format_fixed;
  std::cout << "Clock:        " << format_fixed(s.clock_seconds, 1) << " s\n";
  std::cout << "Energy:       " << format_fixed(s.energy.current, 0) << " / " << format_fixed(s.energy.max, 0) << " ("
            << format_fixed(s.energy.percent * 100.0, 0) << "%), +" << format_fixed(s.energy.regen_per_second, 1)
            << "/s\n";
  std::cout << "Warps:        " << s.memory.total_warps << " (" << s.memory.failed_attempts << " rejected)\n";
  std::cout << "Routes:       " << s.memory.known_routes << ", destinations " << s.memory.known_destinations << "\n";
  std::cout << "Efficiency:   " << format_fixed(s.memory.efficiency * 100.0, 0) << "%\n";
  std::cout << "Skill:        " << format_fixed(s.memory.skill_level, 3) << "\n";
  std::cout << "Adaptation:   " << format_fixed(s.memory.adaptation_level, 3) << "\n";
  std::cout << "Emergencies:  " << format_fixed(s.memory.emergency_rate * 100.0, 0) << "%\n";
}

void print_usage(const char* exe) {
  std::cout << "orbitwarp CLI v" << ORBITWARP_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "orbitwarp_cli") << " [options]\n\n";
  std::cout << "Runs a scripted warp tour through the discovered destinations of a galaxy,\n";
  std::cout << "learning from every warp, and prints the resulting memory statistics.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --galaxy PATH       Galaxy JSON (default: data/galaxy/demo_galaxy.json)\n";
  std::cout << "  --config PATH       Warp tuning JSON (default: data/warp_config.json if present)\n";
  std::cout << "  --store DIR         Persist the learned memory in DIR (default: in-memory only)\n";
  std::cout << "  --reset             Erase the stored memory before starting\n";
  std::cout << "  --warps N           Number of warps in the tour (default: 5)\n";
  std::cout << "  --health N          Player health 0..100 during the tour (default: 100)\n";
  std::cout << "  --dangers N         Number of nearby dangers during the tour (default: 0)\n";
  std::cout << "  --dt SECONDS        Frame time step (default: 0.0166)\n";
  std::cout << "  --max-wait SECONDS  Give up waiting for energy after this long (default: 120)\n";
  std::cout << "  --quote ID          Print the quote to destination ID and exit\n";
  std::cout << "  --list-destinations Print destination ids, positions and discovery state, then exit\n";
  std::cout << "  --validate-config   Validate the tuning file and exit\n";
  std::cout << "  --dump              Print the persisted JSON blob after the tour\n";
  std::cout << "  --verbose           Log learning events (debug level)\n";
  std::cout << "  --quiet             Suppress non-essential output\n";
  std::cout << "  -h, --help          Show this help\n";
  std::cout << "  --version           Print version and exit\n";
}

// Advances frames until `done` returns true or `max_seconds` elapse. Returns the
// simulated time spent.
template <typename Pred>
double run_frames(orbitwarp::WarpSubsystem& warp, orbitwarp::PlayerModel& player, double dt, double max_seconds,
                  Pred done) {
  double elapsed = 0.0;
  while (!done() && elapsed < max_seconds) {
    warp.update(dt, player);
    elapsed += dt;
  }
  return elapsed;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << ORBITWARP_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string galaxy_path = get_str_arg(argc, argv, "--galaxy", "data/galaxy/demo_galaxy.json");
    const bool explicit_config = has_kv_arg(argc, argv, "--config");
    const std::string config_path = get_str_arg(argc, argv, "--config", "data/warp_config.json");
    const std::string store_dir = get_str_arg(argc, argv, "--store", "");
    const int warps = std::max(0, get_int_arg(argc, argv, "--warps", 5));
    const double health = std::clamp(get_double_arg(argc, argv, "--health", 100.0), 0.0, 100.0);
    const int dangers = std::max(0, get_int_arg(argc, argv, "--dangers", 0));
    const double dt = get_double_arg(argc, argv, "--dt", 1.0 / 60.0);
    const double max_wait = std::max(0.0, get_double_arg(argc, argv, "--max-wait", 120.0));
    const std::string quote_id = get_str_arg(argc, argv, "--quote", "");

    const bool quiet = has_flag(argc, argv, "--quiet");
    if (has_flag(argc, argv, "--verbose")) orbitwarp::log::set_level(orbitwarp::log::Level::Debug);
    if (quiet) orbitwarp::log::set_level(orbitwarp::log::Level::Warn);

    if (!(dt > 0.0) || !std::isfinite(dt)) {
      std::cerr << "--dt must be a positive number\n";
      return 1;
    }

    orbitwarp::WarpConfig cfg;
    if (explicit_config || orbitwarp::file_exists(config_path)) {
      cfg = orbitwarp::load_warp_config_from_file(config_path);
    }
    const auto problems = orbitwarp::validate_warp_config(cfg);
    if (has_flag(argc, argv, "--validate-config")) {
      if (problems.empty()) {
        if (!quiet) std::cout << "Config OK\n";
        return 0;
      }
      for (const auto& p : problems) std::cout << "  - " << p << "\n";
      std::cout << "Config has " << problems.size() << " problem(s)\n";
      return 1;
    }
    if (!problems.empty()) {
      for (const auto& p : problems) std::cerr << "Config problem: " << p << "\n";
      return 1;
    }

    const auto galaxy = orbitwarp::DestinationRegistry::load_from_file(galaxy_path);

    if (has_flag(argc, argv, "--list-destinations")) {
      for (const auto& d : galaxy.all()) {
        std::cout << orbitwarp::destination_key(d) << "\t" << d.name << "\t(" << orbitwarp::format_fixed(d.position.x, 0)
                  << ", " << orbitwarp::format_fixed(d.position.y, 0) << ")\tr=" << orbitwarp::format_fixed(d.radius, 0)
                  << "\t" << (d.discovered ? "discovered" : "undiscovered") << "\n";
      }
      return 0;
    }

    std::unique_ptr<orbitwarp::KeyValueStore> store;
    if (store_dir.empty()) {
      store = std::make_unique<orbitwarp::InMemoryKeyValueStore>();
    } else {
      store = std::make_unique<orbitwarp::FileKeyValueStore>(store_dir);
    }
    if (has_flag(argc, argv, "--reset")) {
      if (store->erase(cfg.persistence_key) && !quiet) std::cout << "Erased stored warp memory\n";
    }

    orbitwarp::WarpSubsystem warp(cfg);
    warp.init();
    const auto loaded = warp.load(*store);
    if (!loaded.recovered_fields.empty() && !quiet) {
      std::cout << "Recovered " << loaded.recovered_fields.size() << " malformed field(s) from the stored memory\n";
    }
    warp.unlock();

    const std::vector<orbitwarp::Destination> stops = galaxy.discovered();
    if (stops.empty()) {
      std::cerr << "Galaxy has no discovered destinations\n";
      return 1;
    }

    orbitwarp::PlayerModel player;
    player.position = stops.front().position + orbitwarp::Vec2{stops.front().radius + cfg.drive.arrival_standoff, 0.0};
    player.health = health;
    for (int i = 0; i < dangers; ++i) {
      orbitwarp::Danger d;
      d.position = player.position;
      d.radius = 100.0;
      d.kind = "hostile";
      player.nearby_dangers.push_back(d);
    }

    if (!quote_id.empty()) {
      const orbitwarp::Destination* dest = galaxy.find(quote_id);
      if (!dest) {
        std::cerr << "Unknown destination: " << quote_id << "\n";
        return 1;
      }
      print_quote(quote_id, warp.quote(player, *dest));
      return 0;
    }

    if (!quiet) {
      std::cout << "Touring " << stops.size() << " destination(s) for " << warps << " warp(s)\n";
    }

    int completed = 0;
    std::size_t next = stops.size() > 1 ? 1 : 0;
    for (int i = 0; i < warps; ++i) {
      const orbitwarp::Destination& dest = stops[next];
      next = (next + 1) % stops.size();

      const auto q = warp.quote(player, dest);
      if (!quiet) print_quote("-> " + (dest.name.empty() ? orbitwarp::destination_key(dest) : dest.name), q);

      if (!warp.commit(dest, player)) {
        const auto reason = warp.drive().last_failure();
        if (!quiet) std::cout << "  rejected: " << orbitwarp::warp_failure_reason_label(reason) << "\n";
        if (reason != orbitwarp::WarpFailureReason::InsufficientEnergy) continue;

        const double waited = run_frames(warp, player, dt, max_wait, [&]() { return warp.can_commit(dest, player); });
        if (!warp.commit(dest, player)) {
          std::cout << "  gave up after waiting " << orbitwarp::format_fixed(waited, 1) << " s ("
                    << orbitwarp::warp_failure_reason_label(warp.drive().last_failure()) << ")\n";
          continue;
        }
        if (!quiet) std::cout << "  waited " << orbitwarp::format_fixed(waited, 1) << " s for energy\n";
      }

      run_frames(warp, player, dt, cfg.drive.warp_duration_seconds * 4.0 + 1.0,
                 [&]() { return !warp.drive().warping(); });
      if (!warp.drive().warping()) ++completed;
      // Let the Arrived phase settle before the next commit.
      warp.update(dt, player);
    }

    if (!quiet) {
      std::cout << "\nCompleted " << completed << " of " << warps << " warp(s)\n\n";
      print_status(warp.status());
    }

    if (!warp.save(*store)) return 1;
    if (!store_dir.empty() && !quiet) std::cout << "\nSaved warp memory to " << store_dir << "\n";

    if (has_flag(argc, argv, "--dump")) {
      const auto blob = store->get(cfg.persistence_key);
      if (blob) std::cout << "\n--- JSON ---\n" << *blob << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    orbitwarp::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
