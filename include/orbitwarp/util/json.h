#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace orbitwarp::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// Small JSON value type (null, bool, number, string, array, object).
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  Array* as_array();
  Object* as_object();

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw on wrong type.
  const Object& object() const;
  const Array& array() const;
};

// Parse a JSON document into a tree. Throws std::runtime_error with line/column
// information on malformed input.
Value parse(const std::string& text);

// Convert a JSON value to text. Object keys are emitted in sorted order so the
// output is stable across platforms.
std::string stringify(const Value& v, int indent = 2);

// Lenient field lookups used by loaders that must never reject a document.
//
// A missing key, or a value of the wrong type, yields nullptr / the default.
const Value* find(const Object& o, const std::string& key);
const Object* find_object(const Object& o, const std::string& key);
const Array* find_array(const Object& o, const std::string& key);
double number_or(const Object& o, const std::string& key, double def);
bool bool_or(const Object& o, const std::string& key, bool def);
std::string string_or(const Object& o, const std::string& key, const std::string& def);

} // namespace orbitwarp::json
