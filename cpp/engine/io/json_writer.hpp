#pragma once
/*
================================================================================
Fragment 9.2 - IO: JSON Writer
FILE: cpp/engine/io/json_writer.hpp

Purpose:
  - Pretty-printing streaming writer (2-space indent) that places commas
    itself, so emitters only say key / value / begin / end.

Hardening:
  - Non-finite numbers are written as null.
  - Numbers use the shortest form that parses back to the same double, so a
    parse + re-serialize of our own output is byte-identical.
  - Empty containers are written as {} / [].
================================================================================
*/

#include <string>
#include <string_view>
#include <vector>

namespace powerplan {

std::string json_quote(std::string_view s);

// Shortest round-trip text for v; "null" when v is not finite.
std::string json_number(double v);

class JsonWriter {
 public:
  explicit JsonWriter(int indent = 2) : indent_(indent) {}

  JsonWriter& begin_object();
  JsonWriter& end_object();
  JsonWriter& begin_array();
  JsonWriter& end_array();

  JsonWriter& key(std::string_view k);

  JsonWriter& value(double v);
  JsonWriter& value(int v);
  JsonWriter& value(bool v);
  JsonWriter& value(std::string_view v);
  JsonWriter& value(const char* v) { return value(std::string_view(v)); }
  JsonWriter& value(const std::string& v) { return value(std::string_view(v)); }
  JsonWriter& null();

  template <class T>
  JsonWriter& field(std::string_view k, const T& v) {
    key(k);
    return value(v);
  }

  const std::string& str() const noexcept { return out_; }

 private:
  void before_value();
  void open(char ch);
  void close(char ch);
  void nl();

  std::string out_;
  std::vector<bool> first_;   // per open container: nothing written yet
  bool after_key_ = false;
  int indent_ = 2;
};

} // namespace powerplan
