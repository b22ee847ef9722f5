#pragma once

// atomledger/policy.hpp - Policy rules evaluated by the membrane.
//
// DESIGN:
//   Rules are a closed set of tagged variants (RuleKind), each scoped by a
//   container prefix and an intent-class filter. evaluate() walks the rule
//   list in order and dispatches on the tag with a switch, so every possible
//   rejection reason is enumerable and has its own PolicyViolationKind.
//
// INVARIANTS:
//   - Rules read committed history only through HistoryView. They never see
//     uncommitted drafts and never mutate anything.
//   - History-dependent rules (job_transition, card_provenance, tool_pairing)
//     only look at the draft's own container. The ledger re-checks causality
//     under the container lock, so a verdict computed against head N is still
//     valid when the entry is appended at N+1.
//   - Fail-closed: a rule that cannot read a field it needs rejects.

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "atomledger/jsonlite.hpp"
#include "atomledger/types.hpp"

namespace atomledger {

// Read-only view of committed entries, implemented by the ledger.
class HistoryView {
 public:
  virtual ~HistoryView() = default;

  // Visits the container's entries newest first until visit returns false.
  virtual void scan_newest_first(const std::string& container_id,
                                 const std::function<bool(const LedgerEntry&)>& visit) const = 0;
};

enum class RuleKind {
  atom_schema,
  job_transition,
  sensitive_data,
  card_provenance,
  tool_pairing,
  tenant_scope,
};

std::string to_string(RuleKind k);

struct PolicyRule {
  RuleKind kind{RuleKind::atom_schema};
  std::string container_prefix;      // "" = every container
  std::vector<IntentClass> intents;  // empty = every intent class

  bool applies_to(const std::string& container_id, IntentClass intent) const;
};

// The standard rule set: every kind, every container, every intent.
std::vector<PolicyRule> default_policy_rules();

// ---------------------------------------------------------------------------
// Job state machine
// ---------------------------------------------------------------------------
//   draft -> proposed
//   proposed -> approved | rejected
//   approved -> in_progress
//   in_progress -> waiting_input | completed | failed | cancelled
//   waiting_input -> in_progress | cancelled | failed
//   completed, rejected, cancelled, failed: terminal
bool is_job_state(const std::string& s);
bool is_terminal_job_state(const std::string& s);
bool job_transition_allowed(const std::string& from, const std::string& to);

// Current state of job_id in a container, from committed history.
std::optional<std::string> current_job_state(const HistoryView& history, const std::string& container_id,
                                             const std::string& job_id);

// Name of the first sensitive-data pattern ("ssn", "card_number", "phone")
// found in any string inside v, or nullopt.
std::optional<std::string> find_sensitive_data(const jsonlite::Value& v);

class PolicyEngine {
 public:
  PolicyEngine();
  explicit PolicyEngine(std::vector<PolicyRule> rules);

  void add_rule(PolicyRule rule);
  std::vector<PolicyRule> rules() const;

  // Tenant bindings for the tenant_scope rule.
  void bind_container_tenant(const std::string& container_id, const std::string& tenant_id);
  void bind_author_tenant(const std::string& author_pubkey, const std::string& tenant_id);
  std::optional<std::string> container_tenant(const std::string& container_id) const;

  std::optional<Rejection> evaluate(const Draft& draft, const jsonlite::Value& atom,
                                    const HistoryView& history) const;

  // Stable digest of the active rule list; changes whenever rules change.
  std::string policy_hash() const;

 private:
  std::optional<Rejection> check_tenant_scope(const Draft& draft, const jsonlite::Object& atom) const;

  mutable std::shared_mutex mu_;
  std::vector<PolicyRule> rules_;
  std::map<std::string, std::string> container_tenants_;
  std::map<std::string, std::string> author_tenants_;
};

}  // namespace atomledger
