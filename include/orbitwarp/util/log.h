#pragma once

#include <functional>
#include <string>

namespace orbitwarp::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Replaces the stderr writer. Passing an empty function restores the default.
//
// The sandbox UI uses this to mirror messages into its console panel, and tests
// use it to assert that recoverable save-data problems were reported.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

const char* level_label(Level l);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace orbitwarp::log
