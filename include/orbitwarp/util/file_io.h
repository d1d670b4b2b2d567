#pragma once

#include <string>

namespace orbitwarp {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also tried
// against the source tree and the working directory's parents, so the tools can
// find data/ when launched from a build directory.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// Uses a temporary sibling file + rename so an interrupted write never leaves a
// truncated file behind. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

// Non-throwing helpers.
bool file_exists(const std::string& path);
bool remove_file(const std::string& path);

} // namespace orbitwarp
