#pragma once

// atomledger/membrane.hpp - Validation boundary in front of every append.
//
// Validation order (first failure wins, no side effects):
//   0. structure   invalid_draft        version, hex fields, atom hash match
//   1. causality   causality_mismatch   expected_sequence / previous_hash vs head
//                  sequence_conflict    draft matched a head that has since moved
//   2. signature   signature_invalid    Ed25519 over signing_payload(draft)
//   3. physics     policy_violation/physics
//   4. pact        policy_violation/pact
//   5. policy      policy_violation/<kind>
//
// The membrane holds no container state of its own. The caller supplies a
// head snapshot and a HistoryView; the ledger calls check_causality() a second
// time under the container lock.

#include <cstdint>
#include <optional>
#include <string>

#include "atomledger/canonical.hpp"
#include "atomledger/pact.hpp"
#include "atomledger/policy.hpp"
#include "atomledger/types.hpp"

namespace atomledger {

class Membrane {
 public:
  Membrane(PolicyEngine& policy, PactRegistry& pacts) : policy_(policy), pacts_(pacts) {}

  std::optional<Rejection> validate(const CommitRequest& req, const CanonicalAtom& atom,
                                    const ContainerState& head, const HistoryView& history,
                                    uint64_t now_ms) const;

  static std::optional<Rejection> check_structure(const Draft& draft, const CanonicalAtom& atom);

  // A draft that was correct for an earlier head which really existed lost a
  // race (sequence_conflict); anything else is causality_mismatch.
  static std::optional<Rejection> check_causality(const Draft& draft, const ContainerState& head,
                                                  const HistoryView& history);

  static std::optional<Rejection> check_signature(const Draft& draft, const std::string& signature_hex);

  static std::optional<Rejection> check_physics(const Draft& draft, const ContainerState& head);

  std::optional<Rejection> check_pact(const Draft& draft, uint64_t now_ms) const;

 private:
  PolicyEngine& policy_;
  PactRegistry& pacts_;
};

}  // namespace atomledger
