#include "atomledger/membrane.hpp"

#include <limits>

#include "atomledger/crypto.hpp"
#include "atomledger/hash.hpp"

namespace atomledger {

std::optional<Rejection> Membrane::check_structure(const Draft& draft, const CanonicalAtom& atom) {
  if (draft.version != version::LINK_VERSION) {
    return reject(ErrorCode::invalid_draft, "unsupported link version " + std::to_string(draft.version));
  }
  if (draft.container_id.empty()) return reject(ErrorCode::invalid_draft, "container_id is empty");
  if (!is_digest_hex(draft.previous_hash)) {
    return reject(ErrorCode::invalid_draft, "previous_hash is not a 64-char hex digest");
  }
  if (!is_digest_hex(draft.atom_hash)) {
    return reject(ErrorCode::invalid_draft, "atom_hash is not a 64-char hex digest");
  }
  if (static_cast<uint8_t>(draft.intent_class) > static_cast<uint8_t>(IntentClass::evolution)) {
    return reject(ErrorCode::invalid_draft, "unknown intent class");
  }
  if (!is_public_key_hex(draft.author_pubkey)) {
    return reject(ErrorCode::invalid_draft, "author_pubkey is not a 64-char hex Ed25519 key");
  }
  if (draft.atom_hash != atom.atom_hash) {
    return reject(ErrorCode::invalid_draft, "atom_hash does not match the submitted atom");
  }
  return std::nullopt;
}

std::optional<Rejection> Membrane::check_causality(const Draft& draft, const ContainerState& head,
                                                   const HistoryView& history) {
  const uint64_t next = head.next_sequence();
  if (draft.expected_sequence == next && draft.previous_hash == head.head_hash) return std::nullopt;

  if (draft.expected_sequence < next) {
    // Was the draft's (sequence, previous_hash) pair ever the real head?
    std::string predecessor = kGenesisHash;
    if (draft.expected_sequence > 0) {
      predecessor.clear();
      history.scan_newest_first(head.container_id, [&](const LedgerEntry& e) {
        if (e.sequence + 1 == draft.expected_sequence) {
          predecessor = e.entry_hash;
          return false;
        }
        return e.sequence >= draft.expected_sequence;
      });
    }
    if (!predecessor.empty() && predecessor == draft.previous_hash) {
      return reject(ErrorCode::sequence_conflict, "sequence " + std::to_string(draft.expected_sequence) +
                                                      " was committed by another writer; head is now " +
                                                      std::to_string(head.sequence));
    }
  }
  return reject(ErrorCode::causality_mismatch,
                "expected sequence " + std::to_string(next) + " after " + head.head_hash + ", draft has " +
                    std::to_string(draft.expected_sequence) + " after " + draft.previous_hash);
}

std::optional<Rejection> Membrane::check_signature(const Draft& draft, const std::string& signature_hex) {
  if (!verify_detached(signing_payload(draft), signature_hex, draft.author_pubkey)) {
    return reject(ErrorCode::signature_invalid, "signature does not verify against author_pubkey");
  }
  return std::nullopt;
}

std::optional<Rejection> Membrane::check_physics(const Draft& draft, const ContainerState& head) {
  const int64_t delta = draft.physics_delta;
  switch (draft.intent_class) {
    case IntentClass::observation:
      if (delta != 0) return policy_reject(PolicyViolationKind::physics, "observation must have physics_delta 0");
      break;
    case IntentClass::conservation: {
      const int64_t balance = head.physical_balance;
      const bool overflow = (delta > 0 && balance > std::numeric_limits<int64_t>::max() - delta) ||
                            (delta < 0 && balance < std::numeric_limits<int64_t>::min() - delta);
      if (overflow) return policy_reject(PolicyViolationKind::physics, "physical balance overflow");
      if (balance + delta < 0) {
        return policy_reject(PolicyViolationKind::physics, "conservation would make balance negative (" +
                                                               std::to_string(balance) + " + " +
                                                               std::to_string(delta) + ")");
      }
      break;
    }
    case IntentClass::entropy:
      if (delta != 0 && !draft.pact) {
        return policy_reject(PolicyViolationKind::physics, "entropy with non-zero delta requires a pact");
      }
      break;
    case IntentClass::evolution:
      if (!draft.pact) return policy_reject(PolicyViolationKind::physics, "evolution requires a pact");
      if (delta != 0) return policy_reject(PolicyViolationKind::physics, "evolution must have physics_delta 0");
      break;
  }
  return std::nullopt;
}

std::optional<Rejection> Membrane::check_pact(const Draft& draft, uint64_t now_ms) const {
  if (!draft.pact) return std::nullopt;
  return pacts_.validate(*draft.pact, draft, now_ms);
}

std::optional<Rejection> Membrane::validate(const CommitRequest& req, const CanonicalAtom& atom,
                                            const ContainerState& head, const HistoryView& history,
                                            uint64_t now_ms) const {
  const Draft& d = req.draft;
  if (auto r = check_structure(d, atom)) return r;
  if (auto r = check_causality(d, head, history)) return r;
  if (auto r = check_signature(d, req.signature)) return r;
  if (auto r = check_physics(d, head)) return r;
  if (auto r = check_pact(d, now_ms)) return r;
  return policy_.evaluate(d, atom.value, history);
}

}  // namespace atomledger
