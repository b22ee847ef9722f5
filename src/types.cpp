#include "atomledger/types.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

#include "atomledger/jsonlite.hpp"

namespace atomledger {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::canonicalization_error: return "canonicalization_error";
    case ErrorCode::invalid_draft: return "invalid_draft";
    case ErrorCode::causality_mismatch: return "causality_mismatch";
    case ErrorCode::sequence_conflict: return "sequence_conflict";
    case ErrorCode::signature_invalid: return "signature_invalid";
    case ErrorCode::policy_violation: return "policy_violation";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::storage_failure: return "storage_failure";
  }
  return "";
}

std::string to_string(PolicyViolationKind kind) {
  switch (kind) {
    case PolicyViolationKind::none: return "";
    case PolicyViolationKind::illegal_transition: return "illegal_transition";
    case PolicyViolationKind::raw_sensitive_data: return "raw_sensitive_data";
    case PolicyViolationKind::provenance: return "provenance";
    case PolicyViolationKind::tenant_scope: return "tenant_scope";
    case PolicyViolationKind::schema: return "schema";
    case PolicyViolationKind::physics: return "physics";
    case PolicyViolationKind::pact: return "pact";
    case PolicyViolationKind::permit: return "permit";
  }
  return "";
}

std::string Rejection::to_json() const {
  std::ostringstream o;
  o << "{\"code\":\"" << to_string(code) << "\"";
  if (policy != PolicyViolationKind::none) {
    o << ",\"policy\":\"" << to_string(policy) << "\"";
  }
  o << ",\"detail\":\"" << jsonlite::escape(detail) << "\""
    << ",\"retryable\":" << (retryable() ? "true" : "false") << "}";
  return o.str();
}

Rejection reject(ErrorCode code, std::string detail) {
  Rejection r;
  r.code = code;
  r.detail = std::move(detail);
  return r;
}

Rejection policy_reject(PolicyViolationKind kind, std::string detail) {
  Rejection r;
  r.code = ErrorCode::policy_violation;
  r.policy = kind;
  r.detail = std::move(detail);
  return r;
}

std::string to_string(IntentClass c) {
  switch (c) {
    case IntentClass::observation: return "observation";
    case IntentClass::conservation: return "conservation";
    case IntentClass::entropy: return "entropy";
    case IntentClass::evolution: return "evolution";
  }
  return "observation";
}

std::optional<IntentClass> intent_from_string(const std::string& s) {
  if (s == "observation") return IntentClass::observation;
  if (s == "conservation") return IntentClass::conservation;
  if (s == "entropy") return IntentClass::entropy;
  if (s == "evolution") return IntentClass::evolution;
  return std::nullopt;
}

std::string format_cursor(int64_t last_seen) { return "seq:" + std::to_string(last_seen); }

std::optional<int64_t> parse_cursor(const std::string& cursor) {
  constexpr std::string_view kPrefix = "seq:";
  if (!cursor.starts_with(kPrefix)) return std::nullopt;
  const char* first = cursor.data() + kPrefix.size();
  const char* last = cursor.data() + cursor.size();
  int64_t v = 0;
  const auto r = std::from_chars(first, last, v);
  if (r.ec != std::errc{} || r.ptr != last || first == last || v < -1) return std::nullopt;
  return v;
}

}  // namespace atomledger
