#pragma once

// atomledger/types.hpp - Core data structures shared by every ledger component.
//
// MEMORY OWNERSHIP:
//   - All members are value-owned strings and integers. No borrowed references.
//   - Every public operation returns these types by value. Caller owns them.
//
// ERROR MODEL:
//   Expected failures never throw. Operations return a result struct carrying a
//   Rejection with a stable ErrorCode (and, for policy failures, a
//   PolicyViolationKind). to_string() names are part of the wire contract and
//   must not be renamed.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "atomledger/version.hpp"

namespace atomledger {

// 64 '0' characters: previous_hash of the first entry in every container.
inline const std::string kGenesisHash(64, '0');

enum class ErrorCode {
  none,
  canonicalization_error,
  invalid_draft,
  causality_mismatch,
  sequence_conflict,
  signature_invalid,
  policy_violation,
  not_found,
  storage_failure,
};

std::string to_string(ErrorCode code);

enum class PolicyViolationKind {
  none,
  illegal_transition,
  raw_sensitive_data,
  provenance,
  tenant_scope,
  schema,
  physics,
  pact,
  permit,
};

std::string to_string(PolicyViolationKind kind);

// ---------------------------------------------------------------------------
// Rejection - typed failure returned by every write-side operation
// ---------------------------------------------------------------------------
// Only sequence_conflict is retryable: re-query state, rebuild the draft,
// re-sign, resubmit. Every other code requires caller-side correction.
struct Rejection {
  ErrorCode code{ErrorCode::none};
  PolicyViolationKind policy{PolicyViolationKind::none};
  std::string detail;

  bool retryable() const { return code == ErrorCode::sequence_conflict; }
  std::string to_json() const;
};

Rejection reject(ErrorCode code, std::string detail);
Rejection policy_reject(PolicyViolationKind kind, std::string detail);

// ---------------------------------------------------------------------------
// IntentClass - policy-relevant classifier carried by every draft
// ---------------------------------------------------------------------------
enum class IntentClass : uint8_t {
  observation  = 0,
  conservation = 1,
  entropy      = 2,
  evolution    = 3,
};

std::string to_string(IntentClass c);
std::optional<IntentClass> intent_from_string(const std::string& s);

// ---------------------------------------------------------------------------
// PactProof - multi-party authorization attached to high-risk drafts
// ---------------------------------------------------------------------------
struct PactSignature {
  std::string signer_pubkey;  // hex, 64 chars
  std::string signature;      // hex, 128 chars
};

struct PactProof {
  std::string pact_id;
  std::vector<PactSignature> signatures;
};

// ---------------------------------------------------------------------------
// Draft - unsigned proposal to append one atom to one container
// ---------------------------------------------------------------------------
struct Draft {
  uint32_t version{version::LINK_VERSION};
  std::string container_id;
  uint64_t expected_sequence{0};
  std::string previous_hash{kGenesisHash};
  std::string atom_hash;
  IntentClass intent_class{IntentClass::observation};
  int64_t physics_delta{0};
  std::optional<PactProof> pact;
  std::string author_pubkey;  // hex; excluded from the signing payload
};

// What a caller submits to Ledger::commit(). atom_json need not be canonical;
// the ledger canonicalizes it and checks it against draft.atom_hash.
struct CommitRequest {
  Draft draft;
  std::string signature;  // hex Ed25519 over signing_payload(draft)
  std::string atom_json;
};

// ---------------------------------------------------------------------------
// LedgerEntry - committed, immutable record
// ---------------------------------------------------------------------------
struct LedgerEntry {
  std::string container_id;
  uint64_t sequence{0};
  std::string entry_hash;
  std::string previous_hash;
  std::string atom_hash;
  std::string atom;  // canonical JSON of the stored payload
  std::string signature;
  std::string author_pubkey;
  uint64_t committed_at_ms{0};
  IntentClass intent_class{IntentClass::observation};
  int64_t physics_delta{0};
};

struct ContainerState {
  std::string container_id;
  bool empty{true};
  uint64_t sequence{0};  // last committed sequence; meaningless when empty
  std::string head_hash{kGenesisHash};
  uint64_t entry_count{0};
  int64_t physical_balance{0};

  // The expected_sequence the next draft must carry.
  uint64_t next_sequence() const { return empty ? 0 : sequence + 1; }
};

// ---------------------------------------------------------------------------
// Cursors
// ---------------------------------------------------------------------------
// "seq:<n>" names the last sequence a reader has seen; "seq:-1" means nothing
// seen yet. Used by stream resumption and timeline pagination.
std::string format_cursor(int64_t last_seen);
std::optional<int64_t> parse_cursor(const std::string& cursor);

struct CommitResult {
  bool ok{false};
  uint64_t sequence{0};
  std::string entry_hash;
  Rejection rejection;
};

}  // namespace atomledger
