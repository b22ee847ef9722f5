#pragma once

// atomledger/pact.hpp - Multi-party authorization for high-risk intents.
//
// A Pact names a set of authorized signers, a threshold, the intent classes it
// governs, the containers it covers and a validity window. A draft carries a
// PactProof (pact_id + signatures); each signature is Ed25519 over
// pact_signing_payload(pact_id, atom_hash, intent_class, physics_delta), so a
// proof authorizes exactly one atom under exactly one classification.
//
// Validation order (first failure wins, all map to policy_violation/pact):
//   unknown pact -> window -> intent not governed (risk mismatch) -> scope
//   -> duplicate signer -> unauthorized signer -> bad signature -> threshold.

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "atomledger/types.hpp"

namespace atomledger {

enum class RiskLevel : uint8_t { L0 = 0, L1 = 1, L2 = 2, L3 = 3, L4 = 4, L5 = 5 };

std::string to_string(RiskLevel r);
std::optional<RiskLevel> risk_from_string(const std::string& s);

// Minimum risk level implied by an intent class.
RiskLevel required_risk(IntentClass c);

enum class PactScopeKind { container, container_prefix, global };

struct PactScope {
  PactScopeKind kind{PactScopeKind::container};
  std::string value;  // container id or prefix; unused for global

  bool covers(const std::string& container_id) const;
};

struct TimeWindow {
  uint64_t not_before_ms{0};
  uint64_t not_after_ms{0};  // 0 = open-ended

  bool contains(uint64_t now_ms) const {
    return now_ms >= not_before_ms && (not_after_ms == 0 || now_ms <= not_after_ms);
  }
};

struct Pact {
  std::string pact_id;
  PactScope scope;
  RiskLevel risk_level{RiskLevel::L0};
  std::vector<IntentClass> intent_classes;
  std::vector<std::string> signers;  // hex public keys
  uint32_t threshold{1};
  TimeWindow window;
};

class PactRegistry {
 public:
  // Rejects malformed pacts (empty id, threshold 0 or above signer count,
  // malformed signer key) and duplicate ids.
  std::optional<Rejection> register_pact(Pact pact);

  std::optional<Pact> find(const std::string& pact_id) const;
  std::size_t size() const;

  std::optional<Rejection> validate(const PactProof& proof, const Draft& draft, uint64_t now_ms) const;

 private:
  mutable std::shared_mutex mu_;
  std::map<std::string, Pact> pacts_;
};

}  // namespace atomledger
