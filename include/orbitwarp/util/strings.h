#pragma once

#include <string>

namespace orbitwarp {

// Strips leading/trailing whitespace.
std::string trim_copy(const std::string& s);

// Fixed-point formatting for status lines ("%.<precision>f").
std::string format_fixed(double v, int precision = 2);

} // namespace orbitwarp
