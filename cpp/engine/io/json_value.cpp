#include "engine/io/json_value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <iterator>
#include <sstream>
#include <utility>

namespace powerplan {

namespace {

// Nesting beyond this is rejected rather than recursing without bound.
constexpr int kMaxDepth = 256;

class Parser {
 public:
  Parser(std::string_view text, JsonParseError* err)
      : begin_(text.data()), p_(text.data()), end_(text.data() + text.size()), err_(err) {}

  bool document(JsonValue& out) {
    if (!value(out, 0)) return false;
    skip_ws();
    if (!at_end()) return fail("Trailing characters after JSON");
    return true;
  }

 private:
  bool at_end() const { return p_ >= end_; }
  char peek() const { return *p_; }

  void advance() {
    if (*p_ == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    ++p_;
  }

  bool fail(std::string msg) {
    if (err_) {
      err_->message = std::move(msg);
      err_->offset = static_cast<size_t>(p_ - begin_);
      err_->line = line_;
      err_->col = col_;
    }
    return false;
  }

  void skip_ws() {
    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\r' || peek() == '\n')) advance();
  }

  bool consume(char ch) {
    skip_ws();
    if (at_end() || peek() != ch) return fail(std::string("Expected '") + ch + "'");
    advance();
    return true;
  }

  bool literal(const char* lit) {
    const char* q = p_;
    for (const char* s = lit; *s; ++s, ++q) {
      if (q >= end_ || *q != *s) return fail("Invalid literal");
    }
    while (p_ < q) advance();
    return true;
  }

  bool value(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("Nesting too deep");
    skip_ws();
    if (at_end()) return fail("Unexpected EOF");

    switch (peek()) {
      case '{': return object(out, depth);
      case '[': return array(out, depth);
      case '"':
        out.type = JsonType::String;
        return quoted(out.string);
      case 't':
        out.type = JsonType::Bool;
        out.boolean = true;
        return literal("true");
      case 'f':
        out.type = JsonType::Bool;
        out.boolean = false;
        return literal("false");
      case 'n':
        out.type = JsonType::Null;
        return literal("null");
      default: break;
    }
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
      out.type = JsonType::Number;
      return number(out.number);
    }
    return fail("Unexpected token");
  }

  bool object(JsonValue& out, int depth) {
    advance();  // '{'
    out.type = JsonType::Object;
    out.object.clear();

    skip_ws();
    if (!at_end() && peek() == '}') {
      advance();
      return true;
    }
    for (;;) {
      skip_ws();
      std::string key;
      if (!quoted(key)) return false;
      if (!consume(':')) return false;
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.object[std::move(key)] = std::move(v);

      skip_ws();
      if (at_end()) return fail("Unexpected EOF in object");
      if (peek() == ',') {
        advance();
        continue;
      }
      if (peek() == '}') {
        advance();
        return true;
      }
      return fail("Expected ',' or '}'");
    }
  }

  bool array(JsonValue& out, int depth) {
    advance();  // '['
    out.type = JsonType::Array;
    out.array.clear();

    skip_ws();
    if (!at_end() && peek() == ']') {
      advance();
      return true;
    }
    for (;;) {
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      out.array.push_back(std::move(v));

      skip_ws();
      if (at_end()) return fail("Unexpected EOF in array");
      if (peek() == ',') {
        advance();
        continue;
      }
      if (peek() == ']') {
        advance();
        return true;
      }
      return fail("Expected ',' or ']'");
    }
  }

  bool hex4(unsigned& out) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (at_end()) return fail("Unexpected EOF in \\u escape");
      const char ch = peek();
      unsigned v = 0;
      if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
      else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
      else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
      else return fail("Invalid hex digit in \\u escape");
      out = (out << 4) | v;
      advance();
    }
    return true;
  }

  static void append_utf8(std::string& s, unsigned cp) {
    if (cp <= 0x7F) {
      s.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      s.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      s.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      s.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool unicode_escape(std::string& out) {
    unsigned u = 0;
    if (!hex4(u)) return false;
    if (u >= 0xDC00 && u <= 0xDFFF) return fail("Unexpected low surrogate");
    if (u < 0xD800 || u > 0xDBFF) {
      append_utf8(out, u);
      return true;
    }
    if (end_ - p_ < 2 || p_[0] != '\\' || p_[1] != 'u') {
      return fail("High surrogate not followed by low surrogate");
    }
    advance();
    advance();
    unsigned lo = 0;
    if (!hex4(lo)) return false;
    if (lo < 0xDC00 || lo > 0xDFFF) return fail("Invalid low surrogate");
    append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (lo - 0xDC00u)));
    return true;
  }

  bool quoted(std::string& out) {
    if (at_end() || peek() != '"') return fail("Expected string");
    advance();
    out.clear();

    while (!at_end()) {
      const char ch = peek();
      if (ch == '"') {
        advance();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("Unescaped control character in string");
      if (ch != '\\') {
        out.push_back(ch);
        advance();
        continue;
      }
      advance();
      if (at_end()) return fail("Unexpected EOF in string escape");
      const char esc = peek();
      advance();
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u':
          if (!unicode_escape(out)) return false;
          break;
        default: return fail("Invalid escape sequence");
      }
    }
    return fail("Unterminated string");
  }

  void digits() {
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) advance();
  }

  bool number(double& out) {
    const char* start = p_;
    if (peek() == '-') advance();
    if (at_end()) return fail("Expected digits after '-'");

    if (peek() == '0') {
      advance();
    } else if (peek() >= '1' && peek() <= '9') {
      digits();
    } else {
      return fail("Invalid number");
    }
    if (!at_end() && peek() == '.') {
      advance();
      if (at_end() || !std::isdigit(static_cast<unsigned char>(peek()))) return fail("Expected digits after '.'");
      digits();
    }
    if (!at_end() && (peek() == 'e' || peek() == 'E')) {
      advance();
      if (!at_end() && (peek() == '+' || peek() == '-')) advance();
      if (at_end() || !std::isdigit(static_cast<unsigned char>(peek()))) return fail("Expected digits in exponent");
      digits();
    }

    const std::string tmp(start, p_);
    errno = 0;
    char* endptr = nullptr;
    const double v = std::strtod(tmp.c_str(), &endptr);
    if (endptr == tmp.c_str() || *endptr != '\0') return fail("Failed to parse number");
    if (errno == ERANGE && !std::isfinite(v)) return fail("Number out of range");
    out = v;
    return true;
  }

  const char* begin_;
  const char* p_;
  const char* end_;
  JsonParseError* err_;
  int line_ = 1;
  int col_ = 1;
};

} // namespace

const char* to_string(JsonType t) noexcept {
  switch (t) {
    case JsonType::Null: return "null";
    case JsonType::Bool: return "bool";
    case JsonType::Number: return "number";
    case JsonType::String: return "string";
    case JsonType::Object: return "object";
    case JsonType::Array: return "array";
  }
  return "unknown";
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (type != JsonType::Object) return nullptr;
  auto it = object.find(std::string(key));
  return it == object.end() ? nullptr : &it->second;
}

bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  Parser parser(text, err);
  if (!parser.document(root)) return false;
  *out = std::move(root);
  return true;
}

bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err) {
  const std::string buf((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  return parse_json(std::string_view(buf), out, err);
}

std::string describe(const JsonParseError& e) {
  std::ostringstream oss;
  oss << e.message << " at line " << e.line << ", col " << e.col << " (offset " << e.offset << ")";
  return oss.str();
}

} // namespace powerplan
