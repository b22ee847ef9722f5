#include "atomledger/policy.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <regex>

#include "atomledger/hash.hpp"

namespace atomledger {

namespace {

// ---------------------------------------------------------------------------
// Atom schema table
// ---------------------------------------------------------------------------
enum class FieldType { string, integer, object };

struct FieldSpec {
  const char* name;
  FieldType type;
};

struct AtomSchema {
  const char* type;
  std::vector<FieldSpec> required;
};

// Types not listed here only need a string "type" field.
static const AtomSchema kAtomSchemas[] = {
  { "job.created",        { {"job_id", FieldType::string}, {"title", FieldType::string} } },
  { "job.state_changed",  { {"job_id", FieldType::string}, {"from", FieldType::string}, {"to", FieldType::string} } },
  { "job.progress",       { {"job_id", FieldType::string}, {"percent", FieldType::integer} } },
  { "message.sent",       { {"message_id", FieldType::string}, {"author", FieldType::string}, {"text", FieldType::string} } },
  { "approval.requested", { {"job_id", FieldType::string}, {"card", FieldType::object} } },
  { "approval.decided",   { {"card_id", FieldType::string}, {"decision", FieldType::string} } },
  { "tool.called",        { {"call_id", FieldType::string}, {"tool", FieldType::string} } },
  { "tool.result",        { {"call_id", FieldType::string} } },
  { "presence.heartbeat", { {"entity_id", FieldType::string}, {"entity_kind", FieldType::string}, {"status", FieldType::string} } },
};

const char* type_name(FieldType t) {
  switch (t) {
    case FieldType::string: return "string";
    case FieldType::integer: return "integer";
    case FieldType::object: return "object";
  }
  return "?";
}

bool has_type(const jsonlite::Value& v, FieldType t) {
  switch (t) {
    case FieldType::string: return v.is_string();
    case FieldType::integer: return std::holds_alternative<std::int64_t>(v.v);
    case FieldType::object: return v.is_object();
  }
  return false;
}

struct JobEdge {
  const char* from;
  const char* to;
};

static const JobEdge kJobTransitions[] = {
  { "draft",         "proposed" },
  { "proposed",      "approved" },
  { "proposed",      "rejected" },
  { "approved",      "in_progress" },
  { "in_progress",   "waiting_input" },
  { "in_progress",   "completed" },
  { "in_progress",   "failed" },
  { "in_progress",   "cancelled" },
  { "waiting_input", "in_progress" },
  { "waiting_input", "cancelled" },
  { "waiting_input", "failed" },
};

static const char* const kJobStates[] = {
  "draft", "proposed", "approved", "rejected", "in_progress",
  "waiting_input", "completed", "failed", "cancelled",
};

struct SensitivePattern {
  const char* name;
  std::regex re;
};

const std::vector<SensitivePattern>& sensitive_patterns() {
  static const std::vector<SensitivePattern> patterns = {
    { "ssn",         std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)") },
    { "card_number", std::regex(R"(\b\d{4}[ -]?\d{4}[ -]?\d{4}[ -]?\d{4}\b)") },
    { "email",       std::regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})") },
    // NANP-style numbers with an optional country code; separators are
    // optional so "5551234567" and "+1 (555) 123 4567" both match.
    { "phone",       std::regex(R"((^|[^\w])(\+\d{1,3}[\s.-]?)?(\(\d{3}\)|\d{3})[\s.-]?\d{3}[\s.-]?\d{4}\b)") },
  };
  return patterns;
}

// Parses a committed atom; committed atoms are canonical so this only fails
// on a corrupted store, in which case the entry is skipped.
std::optional<jsonlite::Object> atom_object(const LedgerEntry& e) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(e.atom, &err);
  if (err) return std::nullopt;
  return o;
}

std::optional<Rejection> check_schema(const jsonlite::Value& atom) {
  if (!atom.is_object()) return policy_reject(PolicyViolationKind::schema, "atom must be a JSON object");
  const auto& o = std::get<jsonlite::Object>(atom.v);
  const std::string type = jsonlite::get_string(o, "type");
  if (type.empty()) return policy_reject(PolicyViolationKind::schema, "atom requires a string 'type'");

  for (const auto& schema : kAtomSchemas) {
    if (type != schema.type) continue;
    for (const auto& field : schema.required) {
      const auto* v = jsonlite::find(o, field.name);
      if (!v || !has_type(*v, field.type)) {
        return policy_reject(PolicyViolationKind::schema, type + " requires " + type_name(field.type) +
                                                              " field '" + field.name + "'");
      }
    }
  }
  if (type == "job.created") {
    const std::string state = jsonlite::get_string(o, "state", "draft");
    if (!is_job_state(state)) return policy_reject(PolicyViolationKind::schema, "unknown job state: " + state);
  }
  if (type == "approval.requested") {
    const auto* card = jsonlite::get_object(o, "card");
    if (jsonlite::get_string(*card, "card_id").empty()) {
      return policy_reject(PolicyViolationKind::schema, "approval.requested card requires 'card_id'");
    }
  }
  return std::nullopt;
}

std::optional<Rejection> check_job_transition(const Draft& draft, const jsonlite::Object& atom,
                                              const HistoryView& history) {
  const std::string type = jsonlite::get_string(atom, "type");
  const std::string job_id = jsonlite::get_string(atom, "job_id");
  if (type == "job.created") {
    const std::string initial = jsonlite::get_string(atom, "state", "draft");
    if (initial != "draft" && initial != "proposed") {
      return policy_reject(PolicyViolationKind::illegal_transition, "job cannot be created as " + initial);
    }
    if (current_job_state(history, draft.container_id, job_id)) {
      return policy_reject(PolicyViolationKind::illegal_transition, "job already exists: " + job_id);
    }
    return std::nullopt;
  }
  if (type != "job.state_changed") return std::nullopt;

  const std::string from = jsonlite::get_string(atom, "from");
  const std::string to = jsonlite::get_string(atom, "to");
  if (!job_transition_allowed(from, to)) {
    return policy_reject(PolicyViolationKind::illegal_transition, "job transition " + from + " -> " + to +
                                                                      " is not allowed");
  }
  const auto current = current_job_state(history, draft.container_id, job_id);
  if (!current) return policy_reject(PolicyViolationKind::illegal_transition, "unknown job: " + job_id);
  if (*current != from) {
    return policy_reject(PolicyViolationKind::illegal_transition,
                         "job " + job_id + " is " + *current + ", not " + from);
  }
  return std::nullopt;
}

std::optional<Rejection> check_card_provenance(const Draft& draft, const jsonlite::Object& atom,
                                               const HistoryView& history) {
  if (jsonlite::get_string(atom, "type") != "approval.decided") return std::nullopt;
  const std::string card_id = jsonlite::get_string(atom, "card_id");

  bool originated = false;
  bool already_decided = false;
  history.scan_newest_first(draft.container_id, [&](const LedgerEntry& e) {
    auto o = atom_object(e);
    if (!o) return true;
    if (jsonlite::get_string(*o, "type") == "approval.decided" &&
        jsonlite::get_string(*o, "card_id") == card_id) {
      already_decided = true;
      return false;
    }
    if (const auto* card = jsonlite::get_object(*o, "card")) {
      if (jsonlite::get_string(*card, "card_id") == card_id) {
        originated = true;
        return false;
      }
    }
    return true;
  });

  if (already_decided) return policy_reject(PolicyViolationKind::provenance, "card already decided: " + card_id);
  if (!originated) {
    return policy_reject(PolicyViolationKind::provenance, "card " + card_id + " was never issued in this container");
  }
  return std::nullopt;
}

std::optional<Rejection> check_tool_pairing(const Draft& draft, const jsonlite::Object& atom,
                                            const HistoryView& history) {
  if (jsonlite::get_string(atom, "type") != "tool.result") return std::nullopt;
  const std::string call_id = jsonlite::get_string(atom, "call_id");

  bool called = false;
  bool answered = false;
  history.scan_newest_first(draft.container_id, [&](const LedgerEntry& e) {
    auto o = atom_object(e);
    if (!o || jsonlite::get_string(*o, "call_id") != call_id) return true;
    const std::string type = jsonlite::get_string(*o, "type");
    if (type == "tool.result") {
      answered = true;
      return false;
    }
    if (type == "tool.called") {
      called = true;
      return false;
    }
    return true;
  });

  if (answered) return policy_reject(PolicyViolationKind::provenance, "tool call already has a result: " + call_id);
  if (!called) return policy_reject(PolicyViolationKind::provenance, "tool.result without tool.called: " + call_id);
  return std::nullopt;
}

}  // namespace

std::string to_string(RuleKind k) {
  switch (k) {
    case RuleKind::atom_schema: return "atom_schema";
    case RuleKind::job_transition: return "job_transition";
    case RuleKind::sensitive_data: return "sensitive_data";
    case RuleKind::card_provenance: return "card_provenance";
    case RuleKind::tool_pairing: return "tool_pairing";
    case RuleKind::tenant_scope: return "tenant_scope";
  }
  return "unknown";
}

bool PolicyRule::applies_to(const std::string& container_id, IntentClass intent) const {
  if (!container_id.starts_with(container_prefix)) return false;
  return intents.empty() || std::find(intents.begin(), intents.end(), intent) != intents.end();
}

std::vector<PolicyRule> default_policy_rules() {
  return {
    { RuleKind::atom_schema, "", {} },
    { RuleKind::tenant_scope, "", {} },
    { RuleKind::sensitive_data, "", {} },
    { RuleKind::job_transition, "", {} },
    { RuleKind::card_provenance, "", {} },
    { RuleKind::tool_pairing, "", {} },
  };
}

bool is_job_state(const std::string& s) {
  return std::any_of(std::begin(kJobStates), std::end(kJobStates), [&](const char* st) { return s == st; });
}

bool is_terminal_job_state(const std::string& s) {
  return s == "completed" || s == "rejected" || s == "cancelled" || s == "failed";
}

bool job_transition_allowed(const std::string& from, const std::string& to) {
  for (const auto& edge : kJobTransitions) {
    if (from == edge.from && to == edge.to) return true;
  }
  return false;
}

std::optional<std::string> current_job_state(const HistoryView& history, const std::string& container_id,
                                             const std::string& job_id) {
  std::optional<std::string> state;
  history.scan_newest_first(container_id, [&](const LedgerEntry& e) {
    auto o = atom_object(e);
    if (!o || jsonlite::get_string(*o, "job_id") != job_id) return true;
    const std::string type = jsonlite::get_string(*o, "type");
    if (type == "job.state_changed") {
      state = jsonlite::get_string(*o, "to");
      return false;
    }
    if (type == "job.created") {
      state = jsonlite::get_string(*o, "state", "draft");
      return false;
    }
    return true;
  });
  return state;
}

std::optional<std::string> find_sensitive_data(const jsonlite::Value& v) {
  if (v.is_string()) {
    const auto& s = std::get<std::string>(v.v);
    for (const auto& p : sensitive_patterns()) {
      if (std::regex_search(s, p.re)) return std::string(p.name);
    }
    return std::nullopt;
  }
  if (v.is_object()) {
    for (const auto& [k, child] : std::get<jsonlite::Object>(v.v)) {
      if (auto hit = find_sensitive_data(child)) return hit;
    }
  } else if (v.is_array()) {
    for (const auto& child : std::get<jsonlite::Array>(v.v)) {
      if (auto hit = find_sensitive_data(child)) return hit;
    }
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// PolicyEngine
// ---------------------------------------------------------------------------

PolicyEngine::PolicyEngine() : rules_(default_policy_rules()) {}

PolicyEngine::PolicyEngine(std::vector<PolicyRule> rules) : rules_(std::move(rules)) {}

void PolicyEngine::add_rule(PolicyRule rule) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  rules_.push_back(std::move(rule));
}

std::vector<PolicyRule> PolicyEngine::rules() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return rules_;
}

void PolicyEngine::bind_container_tenant(const std::string& container_id, const std::string& tenant_id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  container_tenants_[container_id] = tenant_id;
}

void PolicyEngine::bind_author_tenant(const std::string& author_pubkey, const std::string& tenant_id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  author_tenants_[author_pubkey] = tenant_id;
}

std::optional<std::string> PolicyEngine::container_tenant(const std::string& container_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = container_tenants_.find(container_id);
  if (it == container_tenants_.end()) return std::nullopt;
  return it->second;
}

// Caller holds mu_ (shared).
std::optional<Rejection> PolicyEngine::check_tenant_scope(const Draft& draft, const jsonlite::Object& atom) const {
  std::optional<std::string> container_tenant;
  std::optional<std::string> author_tenant;
  if (auto it = container_tenants_.find(draft.container_id); it != container_tenants_.end()) {
    container_tenant = it->second;
  }
  if (auto it = author_tenants_.find(draft.author_pubkey); it != author_tenants_.end()) {
    author_tenant = it->second;
  }

  if (container_tenant && author_tenant != container_tenant) {
    return policy_reject(PolicyViolationKind::tenant_scope,
                         "author is not a member of tenant " + *container_tenant);
  }
  const auto* atom_tenant = jsonlite::find(atom, "tenant_id");
  if (atom_tenant && atom_tenant->is_string()) {
    const auto& expected = container_tenant ? container_tenant : author_tenant;
    if (expected && std::get<std::string>(atom_tenant->v) != *expected) {
      return policy_reject(PolicyViolationKind::tenant_scope, "atom tenant_id does not match container tenant");
    }
  }
  return std::nullopt;
}

std::optional<Rejection> PolicyEngine::evaluate(const Draft& draft, const jsonlite::Value& atom,
                                                const HistoryView& history) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  static const jsonlite::Object kEmpty;
  const jsonlite::Object& obj = atom.is_object() ? std::get<jsonlite::Object>(atom.v) : kEmpty;

  for (const auto& rule : rules_) {
    if (!rule.applies_to(draft.container_id, draft.intent_class)) continue;
    std::optional<Rejection> r;
    switch (rule.kind) {
      case RuleKind::atom_schema:
        r = check_schema(atom);
        break;
      case RuleKind::job_transition:
        r = check_job_transition(draft, obj, history);
        break;
      case RuleKind::sensitive_data:
        if (auto hit = find_sensitive_data(atom)) {
          r = policy_reject(PolicyViolationKind::raw_sensitive_data, "unredacted " + *hit + " in atom");
        }
        break;
      case RuleKind::card_provenance:
        r = check_card_provenance(draft, obj, history);
        break;
      case RuleKind::tool_pairing:
        r = check_tool_pairing(draft, obj, history);
        break;
      case RuleKind::tenant_scope:
        r = check_tenant_scope(draft, obj);
        break;
    }
    if (r) return r;
  }
  return std::nullopt;
}

std::string PolicyEngine::policy_hash() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  jsonlite::Array arr;
  for (const auto& rule : rules_) {
    jsonlite::Object o;
    o["kind"] = to_string(rule.kind);
    o["container_prefix"] = rule.container_prefix;
    jsonlite::Array intents;
    for (auto i : rule.intents) intents.emplace_back(to_string(i));
    o["intents"] = std::move(intents);
    arr.emplace_back(std::move(o));
  }
  return hash_domain(tags::kPolicy, jsonlite::to_canonical(arr));
}

}  // namespace atomledger
