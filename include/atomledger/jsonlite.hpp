#pragma once

// atomledger/jsonlite.hpp - Strict JSON value model, parser and canonical writer.
//
// CANONICAL FORM (what to_canonical() produces, byte-for-byte):
//   - Object keys sorted by unsigned byte order at every depth (std::map order).
//   - No insignificant whitespace.
//   - Array order preserved.
//   - Strings are valid UTF-8 in NFC (ICU). \uXXXX escapes are decoded before
//     normalization; output escapes only '"', '\\' and control characters
//     below 0x20. Keys are normalized too, before the duplicate check.
//   - Integers print as plain decimal. Non-integral doubles print in shortest
//     round-trip form (std::to_chars). Integral doubles below 2^53 print as
//     integers so 1.0 and 1 canonicalize identically.
//
// REJECTED INPUT (JsonError.code):
//   json_parse_error, json_duplicate_key, json_non_finite, json_number_range,
//   json_number_precision, json_invalid_utf8, json_unnormalizable,
//   json_depth_exceeded, json_trailing_data.
//
// The value model is a tree, so cyclic structures cannot be represented. The
// nesting bound (kMaxDepth) stands in for the cycle check on adversarial input.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace atomledger::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

constexpr std::size_t kMaxDepth = 128;

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(std::uint32_t u) : v(static_cast<std::int64_t>(u)) {}
  Value(std::int64_t i) : v(i) {}
  Value(std::uint64_t u) : v(static_cast<std::int64_t>(u)) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
};

// Parse any JSON value. Returns nullopt and sets *error on failure.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty object and sets *error on failure or
// when the top-level value is not an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

// Canonical serialization of an in-memory value.
std::string to_canonical(const Value& v);

// Parse + canonical serialization. Returns "" and sets *error on failure.
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Escape a string body for embedding between double quotes.
std::string escape(const std::string& s);

// Type-safe extractors. Missing key or wrong type returns the default.
const Value* find(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
const Object* get_object(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace atomledger::jsonlite
