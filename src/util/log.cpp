#include "orbitwarp/util/log.h"

#include <iostream>
#include <mutex>
#include <utility>

namespace orbitwarp::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;
Sink g_sink;

void emit(Level l, const std::string& msg) {
  if (l < g_level || g_level == Level::Off) return;
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_sink) {
    g_sink(l, msg);
    return;
  }
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace orbitwarp::log
