#include "atomledger/jsonlite.hpp"

// DETERMINISM GUARANTEES:
//   - Key order comes from std::map iteration, which is byte order for
//     std::string keys. No locale is consulted anywhere.
//   - Numbers are parsed and printed with <charconv>, which is locale
//     independent and round-trip exact for doubles. A fractional literal is
//     accepted only if its digits are exactly the shortest form of the
//     parsed double, so no two spellings silently collapse.
//   - Every string and object key is NFC-normalized (ICU) as it is parsed,
//     before duplicate-key detection.
//
// The parser is deliberately strict: anything a second implementation might
// read differently (duplicate keys, lone surrogates, leading zeros, raw
// control characters) is an error rather than a guess.

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string_view>

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>

namespace atomledger::jsonlite {

namespace {

// 2^53: largest magnitude below which every integer is exactly a double.
constexpr double kExactIntegerLimit = 9007199254740992.0;

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

bool is_ascii(const std::string& s) {
  for (unsigned char c : s) {
    if (c >= 0x80) return false;
  }
  return true;
}

// Rewrites s (valid UTF-8) into NFC. Returns false if ICU cannot normalize it.
bool nfc_normalize(std::string& s) {
  if (is_ascii(s)) return true;
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* norm = icu::Normalizer2::getNFCInstance(status);
  if (U_FAILURE(status) || norm == nullptr) return false;

  const icu::UnicodeString in = icu::UnicodeString::fromUTF8(icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
  if (norm->isNormalized(in, status) && U_SUCCESS(status)) return true;
  status = U_ZERO_ERROR;
  icu::UnicodeString out;
  norm->normalize(in, out, status);
  if (U_FAILURE(status)) return false;
  s.clear();
  out.toUTF8String(s);
  return true;
}

// Decimal value of a JSON number literal as (sign, significant digits,
// exponent), so that "0.10", "1e-1" and "0.1" compare equal.
struct DecimalForm {
  bool negative{false};
  std::string digits;  // no leading or trailing zeros; empty for zero
  long exponent{0};    // value = digits * 10^exponent

  bool operator==(const DecimalForm&) const = default;
};

DecimalForm decimal_form(std::string_view lit) {
  DecimalForm f;
  size_t k = 0;
  if (k < lit.size() && lit[k] == '-') { f.negative = true; ++k; }
  bool fraction = false;
  for (; k < lit.size() && lit[k] != 'e' && lit[k] != 'E'; ++k) {
    if (lit[k] == '.') { fraction = true; continue; }
    f.digits += lit[k];
    if (fraction) --f.exponent;
  }
  if (k < lit.size()) {
    ++k;
    long e = 0;
    const char* first = lit.data() + k + ((k < lit.size() && lit[k] == '+') ? 1 : 0);
    std::from_chars(first, lit.data() + lit.size(), e);
    f.exponent += e;
  }
  const size_t lead = f.digits.find_first_not_of('0');
  if (lead == std::string::npos) return DecimalForm{};  // zero, sign ignored
  f.digits.erase(0, lead);
  while (f.digits.back() == '0') {
    f.digits.pop_back();
    ++f.exponent;
  }
  return f;
}

struct Parser {
  const std::string& s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void fail(const char* code, std::string message) {
    if (!err) err = JsonError{code, std::move(message) + " at offset " + std::to_string(i)};
  }

  void ws() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
  }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool parse_hex4(uint32_t& out) {
    if (i + 4 > s.size()) { fail("json_parse_error", "truncated \\u escape"); return false; }
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
      else { fail("json_parse_error", "invalid \\u escape"); return false; }
    }
    return true;
  }

  // Copies one raw UTF-8 sequence starting at s[i], validating it.
  bool copy_utf8(std::string& o) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if (b0 < 0x80) { o += s[i++]; return true; }
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
    else { fail("json_invalid_utf8", "invalid UTF-8 lead byte"); return false; }
    if (i + len > s.size()) { fail("json_invalid_utf8", "truncated UTF-8 sequence"); return false; }
    for (size_t k = 1; k < len; ++k) {
      const auto b = static_cast<unsigned char>(s[i + k]);
      if ((b & 0xC0) != 0x80) { fail("json_invalid_utf8", "invalid UTF-8 continuation byte"); return false; }
      cp = (cp << 6) | (b & 0x3F);
    }
    const bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000);
    if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      fail("json_invalid_utf8", "non-canonical UTF-8 sequence");
      return false;
    }
    o.append(s, i, len);
    i += len;
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("json_parse_error", "expected string"); return {}; }
    std::string o;
    while (i < s.size() && !err) {
      const char c = s[i];
      if (c == '"') {
        ++i;
        if (!nfc_normalize(o)) { fail("json_unnormalizable", "string cannot be NFC-normalized"); return {}; }
        return o;
      }
      if (static_cast<unsigned char>(c) < 0x20) { fail("json_parse_error", "raw control character in string"); return {}; }
      if (c != '\\') { copy_utf8(o); continue; }
      ++i;
      if (i >= s.size()) break;
      const char n = s[i++];
      switch (n) {
        case '"': o += '"'; break;
        case '\\': o += '\\'; break;
        case '/': o += '/'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'n': o += '\n'; break;
        case 'r': o += '\r'; break;
        case 't': o += '\t'; break;
        case 'u': {
          uint32_t cp = 0;
          if (!parse_hex4(cp)) return {};
          if (cp >= 0xDC00 && cp <= 0xDFFF) { fail("json_invalid_utf8", "lone low surrogate"); return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t lo = 0;
            if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') { fail("json_invalid_utf8", "lone high surrogate"); return {}; }
            i += 2;
            if (!parse_hex4(lo)) return {};
            if (lo < 0xDC00 || lo > 0xDFFF) { fail("json_invalid_utf8", "invalid surrogate pair"); return {}; }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail("json_parse_error", std::string("invalid escape \\") + n);
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  bool is_digit(size_t k) const { return k < s.size() && s[k] >= '0' && s[k] <= '9'; }

  bool parse_number(Value& out_val) {
    ws();
    const size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      fail("json_non_finite", "NaN/Infinity unsupported");
      return false;
    }
    if (i < s.size() && s[i] == '-') ++i;
    if (!is_digit(i)) { fail("json_parse_error", "unexpected token"); return false; }
    if (s[i] == '0' && is_digit(i + 1)) { fail("json_parse_error", "leading zero"); return false; }
    while (is_digit(i)) ++i;

    bool integral = true;
    if (i < s.size() && s[i] == '.') {
      integral = false;
      ++i;
      if (!is_digit(i)) { fail("json_parse_error", "invalid number format"); return false; }
      while (is_digit(i)) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      integral = false;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (!is_digit(i)) { fail("json_parse_error", "invalid exponent"); return false; }
      while (is_digit(i)) ++i;
    }

    const char* first = s.data() + start;
    const char* last = s.data() + i;
    if (integral) {
      std::int64_t n = 0;
      const auto r = std::from_chars(first, last, n);
      if (r.ec != std::errc{} || r.ptr != last) {
        fail("json_number_range", "integer outside signed 64-bit range");
        return false;
      }
      out_val = Value{n};
      return true;
    }
    double d = 0.0;
    const auto r = std::from_chars(first, last, d);
    if (r.ec != std::errc{} || r.ptr != last || !std::isfinite(d)) {
      fail("json_non_finite", "number not representable as a finite double");
      return false;
    }
    char shortest[64];
    const auto w = std::to_chars(shortest, shortest + sizeof(shortest), d);
    if (decimal_form(std::string_view(first, static_cast<size_t>(last - first))) !=
        decimal_form(std::string_view(shortest, static_cast<size_t>(w.ptr - shortest)))) {
      fail("json_number_precision", "number has more precision than a double holds");
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("json_parse_error", "unexpected eof"); return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { fail("json_depth_exceeded", "nesting deeper than " + std::to_string(kMaxDepth)); return {}; }
      Value out = (s[i] == '{') ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      ws();
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { fail("json_duplicate_key", "duplicate key: " + k); break; }
      if (!eat(':')) { fail("json_parse_error", "expected :"); break; }
      Value v = parse_value();
      if (err) break;
      out.emplace(std::move(k), std::move(v));
      if (eat('}')) break;
      if (!eat(',')) { fail("json_parse_error", "expected , or }"); break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("json_parse_error", "expected , or ]"); break; }
    }
    return out;
  }

  std::optional<Value> parse_document() {
    Value v = parse_value();
    ws();
    if (!err && i != s.size()) fail("json_trailing_data", "trailing data");
    if (err) return std::nullopt;
    return v;
  }
};

// MICRO_OPT: strings with nothing to escape (the common case) are returned
// without building a second buffer.
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
    const auto u = static_cast<unsigned char>(c);
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (u < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", u);
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

std::string format_double(double d) {
  if (std::trunc(d) == d && std::fabs(d) < kExactIntegerLimit) {
    return std::to_string(static_cast<std::int64_t>(d));
  }
  char buf[64];
  const auto r = std::to_chars(buf, buf + sizeof(buf), d);
  return std::string(buf, r.ptr);
}

void write_canonical(const Value& v, std::string& out) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) { out += "null"; return; }
  if (std::holds_alternative<bool>(v.v)) { out += std::get<bool>(v.v) ? "true" : "false"; return; }
  if (std::holds_alternative<std::int64_t>(v.v)) { out += std::to_string(std::get<std::int64_t>(v.v)); return; }
  if (std::holds_alternative<double>(v.v)) { out += format_double(std::get<double>(v.v)); return; }
  if (std::holds_alternative<std::string>(v.v)) {
    out += '"';
    out += escape_inner(std::get<std::string>(v.v));
    out += '"';
    return;
  }
  if (std::holds_alternative<Object>(v.v)) {
    out += '{';
    bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) {
      if (!first) out += ',';
      first = false;
      out += '"';
      out += escape_inner(k);
      out += "\":";
      write_canonical(vv, out);
    }
    out += '}';
    return;
  }
  out += '[';
  bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) out += ',';
    first = false;
    write_canonical(vv, out);
  }
  out += ']';
}

}  // namespace

std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_document();
  if (error) *error = p.err;
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_document();
  if (!p.err && v && !v->is_object()) p.err = JsonError{"json_parse_error", "top-level value is not an object"};
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(std::move(v->v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)p.parse_document();
  return p.err;
}

std::string to_canonical(const Value& v) {
  std::string out;
  out.reserve(128);
  write_canonical(v, out);
  return out;
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  auto v = parse_value(text, error);
  if (!v) return {};
  return to_canonical(*v);
}

std::string escape(const std::string& s) { return escape_inner(s); }

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::int64_t>(it->second.v)) return def;
  return std::get<std::int64_t>(it->second.v);
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::int64_t>(it->second.v)) return static_cast<double>(std::get<std::int64_t>(it->second.v));
  return def;
}

const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return nullptr;
  return &std::get<Object>(it->second.v);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

}  // namespace atomledger::jsonlite
