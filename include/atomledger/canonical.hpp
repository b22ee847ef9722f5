#pragma once

// atomledger/canonical.hpp - Atom identity, signing payloads and entry hashing.
//
// Everything that is hashed or signed is built here and nowhere else:
//
//   atom_hash     = H(tags::kAtom  || canonical(atom))
//   signing bytes = tags::kSign || canonical({version, container_id,
//                   expected_sequence, previous_hash, atom_hash, intent_class,
//                   physics_delta, pact})
//   entry_hash    = H(tags::kEntry || u32be(len(container_id)) || container_id
//                   || u64be(sequence) || atom_hash || previous_hash
//                   || u64be(committed_at_ms))
//   pact bytes    = tags::kPact || u32be(len(pact_id)) || pact_id || atom_hash
//                   || u8(intent_class) || i64be(physics_delta)
//
// author_pubkey and the signature are never part of the signing bytes.
// physics_delta is carried as a decimal string inside canonical JSON.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "atomledger/jsonlite.hpp"
#include "atomledger/types.hpp"

namespace atomledger {

struct CanonicalAtom {
  std::string canonical;
  std::string atom_hash;
  jsonlite::Value value;
};

// Canonicalize a caller-supplied atom. On failure returns nullopt and fills
// *rejection with canonicalization_error (detail = JsonError code + message).
std::optional<CanonicalAtom> canonicalize_atom(const std::string& atom_json, Rejection* rejection);

std::string atom_hash_of(std::string_view canonical_atom);

jsonlite::Value pact_proof_to_value(const PactProof& proof);

std::string signing_payload(const Draft& draft);

std::string compute_entry_hash(const std::string& container_id, uint64_t sequence,
                               const std::string& atom_hash, const std::string& previous_hash,
                               uint64_t committed_at_ms);

// Recompute the hash of a fetched entry from its own fields.
std::string recompute_entry_hash(const LedgerEntry& e);

std::string pact_signing_payload(const std::string& pact_id, const std::string& atom_hash,
                                 IntentClass intent, int64_t physics_delta);

// Caller-side helpers. Return "" for a malformed secret key.
std::string sign_draft(const Draft& draft, std::string_view secret_key_hex);
std::string sign_pact(const std::string& pact_id, const Draft& draft, std::string_view secret_key_hex);

// Entry serialization for the journal (include_atom=false) and stream frames.
std::string entry_to_json(const LedgerEntry& e, bool include_atom);
std::optional<LedgerEntry> entry_from_json(const std::string& line, std::string* error);

}  // namespace atomledger
