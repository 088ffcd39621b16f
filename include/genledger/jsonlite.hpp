#pragma once

// genledger/jsonlite.hpp — Minimal strict JSON codec.
//
// Used for every JSON surface in the project: config and price-table files,
// journal records, remote provider payloads and the CLI's NDJSON frames.
//
// INVARIANTS:
//   1. Parsing is strict: duplicate keys, trailing data, NaN/Infinity are errors.
//   2. to_json() output is deterministic (Object is a std::map, keys sorted).
//   3. Integers keep their sign: non-negative → uint64, negative → int64.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace genledger::jsonlite {

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, std::int64_t,
               double, Object, Array>
      v{nullptr};
};

// Parse a JSON document whose top level must be an object.
// On failure returns an empty object and sets *error (if non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse without keeping the result; reports the first error.
std::optional<JsonError> validate_strict(const std::string& text);

// Serialization.
std::string to_json(const Value& v);
std::string to_json(const Object& o);
std::string escape(const std::string& s);

// Type-safe extractors. Missing key or wrong type → def.
bool has(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::vector<std::uint64_t> get_u64_array(const Object& obj, const std::string& key);

}  // namespace genledger::jsonlite
