#pragma once
/*
================================================================================
Fragment 9.1 - IO: JSON Value + Parser
FILE: cpp/engine/io/json_value.hpp

Purpose:
  - Small DOM (JsonValue) plus a strict recursive-descent parser used by the
    scenario reader and the result round-trip.

Hardening:
  - Strict JSON: no comments, no trailing commas, no NaN/Inf literals.
  - Errors carry byte offset and 1-based line/column.
  - Duplicate object keys: last one wins.
================================================================================
*/

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace powerplan {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

enum class JsonType { Null, Bool, Number, String, Object, Array };

const char* to_string(JsonType t) noexcept;

struct JsonValue {
  JsonType type = JsonType::Null;
  bool boolean = false;
  double number = 0.0;
  std::string string;
  std::map<std::string, JsonValue> object;
  std::vector<JsonValue> array;

  bool is_null() const noexcept { return type == JsonType::Null; }
  bool is_bool() const noexcept { return type == JsonType::Bool; }
  bool is_number() const noexcept { return type == JsonType::Number; }
  bool is_string() const noexcept { return type == JsonType::String; }
  bool is_object() const noexcept { return type == JsonType::Object; }
  bool is_array() const noexcept { return type == JsonType::Array; }

  // Member lookup; nullptr when this is not an object or the key is absent.
  const JsonValue* find(std::string_view key) const;
};

/// Parse one JSON document. On failure returns false and fills *err.
bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err = nullptr);

/// Stream convenience (reads the whole stream).
bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err = nullptr);

std::string describe(const JsonParseError& e);

} // namespace powerplan
