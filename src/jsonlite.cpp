#include "genledger/jsonlite.hpp"

// DETERMINISM:
//   - to_json() iterates Object (std::map) in key order, so the same value
//     always serializes to the same bytes. Journal chaining depends on this.
//   - format_double() uses snprintf("%.6f") with trailing-zero trimming and is
//     locale-independent for digit output.
//
// Parsing of provider payloads must tolerate \uXXXX escapes (prompts and
// provider error messages are frequently non-ASCII), so the string parser
// decodes them to UTF-8, including surrogate pairs.

#include <cctype>
#include <cstdio>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace genledger::jsonlite {

namespace {

void append_utf8(std::string& o, uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool read_hex4(uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          uint32_t cp = 0;
          if (!read_hex4(cp)) { err = JsonError{"json_parse_error", "invalid \\u escape"}; return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            uint32_t lo = 0;
            if (!read_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              err = JsonError{"json_parse_error", "invalid surrogate pair"};
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default: o += n; break;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    try {
      if (is_float) {
        out_val = Value{std::stod(num_str)};
      } else if (num_str[0] == '-') {
        out_val = Value{static_cast<std::int64_t>(std::stoll(num_str))};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num_str))};
      }
      return true;
    } catch (const std::out_of_range&) {
      err = JsonError{"json_parse_error", "number out of range: " + num_str};
    } catch (const std::invalid_argument&) {
      err = JsonError{"json_parse_error", "invalid number: " + num_str};
    }
    return false;
  }

  Value parse_any() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    if (!err) err = JsonError{"json_parse_error", "unexpected token at offset " + std::to_string(i)};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_any();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_any());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  // Parse one complete document; trailing non-whitespace is an error.
  Value parse_document() {
    Value v = parse_any();
    ws();
    if (!err && i != s.size()) err = JsonError{"json_parse_error", "trailing data"};
    return v;
  }
};

// Fast path: most strings (ids, statuses, model names) need no escaping.
std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

}  // namespace

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape_inner(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<std::int64_t>(v.v)) return std::to_string(std::get<std::int64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) return to_json(std::get<Object>(v.v));
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

std::string to_json(const Object& o) {
  std::ostringstream oss; oss << "{"; bool first = true;
  for (const auto& [k, vv] : o) {
    if (!first) oss << ",";
    first = false;
    oss << "\"" << escape_inner(k) << "\":" << to_json(vv);
  }
  oss << "}";
  return oss.str();
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)p.parse_document();
  return p.err;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_document();
  if (!p.err && !std::holds_alternative<Object>(v.v)) {
    p.err = JsonError{"json_parse_error", "top-level value is not an object"};
  }
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(v.v);
}

bool has(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  return v && !std::holds_alternative<std::nullptr_t>(v->v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::string>(v->v)) return def;
  return std::get<std::string>(v->v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<bool>(v->v)) return def;
  return std::get<bool>(v->v);
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::uint64_t>(v->v)) return def;
  return std::get<std::uint64_t>(v->v);
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  const Value* v = find(obj, key);
  if (!v) return def;
  if (std::holds_alternative<std::int64_t>(v->v)) return std::get<std::int64_t>(v->v);
  if (std::holds_alternative<std::uint64_t>(v->v)) {
    const auto u = std::get<std::uint64_t>(v->v);
    if (u <= static_cast<std::uint64_t>(INT64_MAX)) return static_cast<std::int64_t>(u);
  }
  return def;
}

Object get_object(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Object>(v->v)) return {};
  return std::get<Object>(v->v);
}

Array get_array(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Array>(v->v)) return {};
  return std::get<Array>(v->v);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Array>(v->v)) return out;
  for (const auto& item : std::get<Array>(v->v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

std::vector<std::uint64_t> get_u64_array(const Object& obj, const std::string& key) {
  std::vector<std::uint64_t> out;
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Array>(v->v)) return out;
  for (const auto& item : std::get<Array>(v->v)) {
    if (std::holds_alternative<std::uint64_t>(item.v)) out.push_back(std::get<std::uint64_t>(item.v));
  }
  return out;
}

std::string escape(const std::string& s) { return escape_inner(s); }

}  // namespace genledger::jsonlite
