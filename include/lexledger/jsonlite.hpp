#pragma once

// lexledger/jsonlite.hpp - Minimal strict JSON codec used for canonical record
// serialization, the NDJSON store and the segment archive.
//
// DETERMINISM GUARANTEES:
//   - serialize() writes objects with sorted keys (std::map iteration) and
//     no insignificant whitespace.
//   - Unsigned integers are written as integer literals; doubles use a fixed
//     "%.6f" form with trailing zeros trimmed.
//   - parse() rejects duplicate keys, trailing data and NaN/Infinity.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lexledger::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error = nullptr);

// Parses a JSON object. Returns an empty object (and sets *error) on failure
// or when the top-level value is not an object.
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);

// Canonical single-line serialization.
std::string serialize(const Value& v);
std::string serialize(const Object& obj);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

bool has_string(const Object& obj, const std::string& key);
bool has_u64(const Object& obj, const std::string& key);

std::string escape(const std::string& s);

}  // namespace lexledger::jsonlite
