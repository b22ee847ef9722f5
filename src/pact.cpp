#include "atomledger/pact.hpp"

#include <algorithm>
#include <mutex>
#include <set>

#include "atomledger/canonical.hpp"
#include "atomledger/crypto.hpp"

namespace atomledger {

std::string to_string(RiskLevel r) {
  return "L" + std::to_string(static_cast<int>(r));
}

std::optional<RiskLevel> risk_from_string(const std::string& s) {
  if (s.size() != 2 || s[0] != 'L' || s[1] < '0' || s[1] > '5') return std::nullopt;
  return static_cast<RiskLevel>(s[1] - '0');
}

RiskLevel required_risk(IntentClass c) {
  switch (c) {
    case IntentClass::observation: return RiskLevel::L0;
    case IntentClass::conservation: return RiskLevel::L2;
    case IntentClass::entropy: return RiskLevel::L4;
    case IntentClass::evolution: return RiskLevel::L5;
  }
  return RiskLevel::L5;
}

bool PactScope::covers(const std::string& container_id) const {
  switch (kind) {
    case PactScopeKind::container: return container_id == value;
    case PactScopeKind::container_prefix: return container_id.starts_with(value);
    case PactScopeKind::global: return true;
  }
  return false;
}

std::optional<Rejection> PactRegistry::register_pact(Pact pact) {
  if (pact.pact_id.empty()) return policy_reject(PolicyViolationKind::pact, "pact_id is empty");
  if (pact.threshold == 0 || pact.threshold > pact.signers.size()) {
    return policy_reject(PolicyViolationKind::pact, "threshold must be in [1, signer count]");
  }
  for (const auto& s : pact.signers) {
    if (!is_public_key_hex(s)) return policy_reject(PolicyViolationKind::pact, "malformed signer key");
  }
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (pacts_.contains(pact.pact_id)) {
    return policy_reject(PolicyViolationKind::pact, "pact already registered: " + pact.pact_id);
  }
  const std::string id = pact.pact_id;
  pacts_.emplace(id, std::move(pact));
  return std::nullopt;
}

std::optional<Pact> PactRegistry::find(const std::string& pact_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = pacts_.find(pact_id);
  if (it == pacts_.end()) return std::nullopt;
  return it->second;
}

std::size_t PactRegistry::size() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return pacts_.size();
}

std::optional<Rejection> PactRegistry::validate(const PactProof& proof, const Draft& draft,
                                                uint64_t now_ms) const {
  const auto found = find(proof.pact_id);
  if (!found) return policy_reject(PolicyViolationKind::pact, "unknown pact: " + proof.pact_id);
  const Pact& pact = *found;

  if (!pact.window.contains(now_ms)) {
    return policy_reject(PolicyViolationKind::pact, "pact outside its validity window");
  }
  if (std::find(pact.intent_classes.begin(), pact.intent_classes.end(), draft.intent_class) ==
      pact.intent_classes.end()) {
    return policy_reject(PolicyViolationKind::pact,
                         "risk mismatch: pact " + to_string(pact.risk_level) + " does not govern " +
                             to_string(draft.intent_class) + " (requires " +
                             to_string(required_risk(draft.intent_class)) + ")");
  }
  if (!pact.scope.covers(draft.container_id)) {
    return policy_reject(PolicyViolationKind::pact, "container outside pact scope");
  }

  const std::string payload =
      pact_signing_payload(pact.pact_id, draft.atom_hash, draft.intent_class, draft.physics_delta);
  std::set<std::string> seen;
  for (const auto& sig : proof.signatures) {
    if (!seen.insert(sig.signer_pubkey).second) {
      return policy_reject(PolicyViolationKind::pact, "duplicate signer");
    }
    if (std::find(pact.signers.begin(), pact.signers.end(), sig.signer_pubkey) == pact.signers.end()) {
      return policy_reject(PolicyViolationKind::pact, "unauthorized signer");
    }
    if (!verify_detached(payload, sig.signature, sig.signer_pubkey)) {
      return policy_reject(PolicyViolationKind::pact, "invalid pact signature");
    }
  }
  if (seen.size() < pact.threshold) {
    return policy_reject(PolicyViolationKind::pact,
                         "threshold not met: " + std::to_string(seen.size()) + "/" +
                             std::to_string(pact.threshold));
  }
  return std::nullopt;
}

}  // namespace atomledger
