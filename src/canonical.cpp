#include "atomledger/canonical.hpp"

#include <charconv>

#include "atomledger/crypto.hpp"
#include "atomledger/hash.hpp"

namespace atomledger {
namespace {

void put_u32be(std::string& out, uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8) out += static_cast<char>((v >> shift) & 0xFF);
}

void put_u64be(std::string& out, uint64_t v) {
  for (int shift = 56; shift >= 0; shift -= 8) out += static_cast<char>((v >> shift) & 0xFF);
}

std::optional<int64_t> parse_i64(const std::string& s) {
  int64_t v = 0;
  const auto r = std::from_chars(s.data(), s.data() + s.size(), v);
  if (r.ec != std::errc{} || r.ptr != s.data() + s.size() || s.empty()) return std::nullopt;
  return v;
}

}  // namespace

std::optional<CanonicalAtom> canonicalize_atom(const std::string& atom_json, Rejection* rejection) {
  std::optional<jsonlite::JsonError> err;
  auto value = jsonlite::parse_value(atom_json, &err);
  if (!value) {
    if (rejection) {
      *rejection = reject(ErrorCode::canonicalization_error,
                          err ? err->code + ": " + err->message : "unparseable atom");
    }
    return std::nullopt;
  }
  CanonicalAtom out;
  out.canonical = jsonlite::to_canonical(*value);
  out.atom_hash = atom_hash_of(out.canonical);
  out.value = std::move(*value);
  return out;
}

std::string atom_hash_of(std::string_view canonical_atom) {
  return hash_domain(tags::kAtom, canonical_atom);
}

jsonlite::Value pact_proof_to_value(const PactProof& proof) {
  jsonlite::Array sigs;
  for (const auto& s : proof.signatures) {
    jsonlite::Object o;
    o["signer_pubkey"] = s.signer_pubkey;
    o["signature"] = s.signature;
    sigs.emplace_back(std::move(o));
  }
  jsonlite::Object o;
  o["pact_id"] = proof.pact_id;
  o["signatures"] = std::move(sigs);
  return o;
}

std::string signing_payload(const Draft& draft) {
  jsonlite::Object o;
  o["version"] = draft.version;
  o["container_id"] = draft.container_id;
  o["expected_sequence"] = draft.expected_sequence;
  o["previous_hash"] = draft.previous_hash;
  o["atom_hash"] = draft.atom_hash;
  o["intent_class"] = to_string(draft.intent_class);
  o["physics_delta"] = std::to_string(draft.physics_delta);
  o["pact"] = draft.pact ? pact_proof_to_value(*draft.pact) : jsonlite::Value{nullptr};
  std::string out(tags::kSign);
  out += jsonlite::to_canonical(o);
  return out;
}

std::string compute_entry_hash(const std::string& container_id, uint64_t sequence,
                               const std::string& atom_hash, const std::string& previous_hash,
                               uint64_t committed_at_ms) {
  std::string buf;
  buf.reserve(4 + container_id.size() + 8 + 64 + 64 + 8);
  put_u32be(buf, static_cast<uint32_t>(container_id.size()));
  buf += container_id;
  put_u64be(buf, sequence);
  buf += atom_hash;
  buf += previous_hash;
  put_u64be(buf, committed_at_ms);
  return hash_domain(tags::kEntry, buf);
}

std::string recompute_entry_hash(const LedgerEntry& e) {
  return compute_entry_hash(e.container_id, e.sequence, e.atom_hash, e.previous_hash, e.committed_at_ms);
}

std::string pact_signing_payload(const std::string& pact_id, const std::string& atom_hash,
                                 IntentClass intent, int64_t physics_delta) {
  std::string out(tags::kPact);
  put_u32be(out, static_cast<uint32_t>(pact_id.size()));
  out += pact_id;
  out += atom_hash;
  out += static_cast<char>(static_cast<uint8_t>(intent));
  put_u64be(out, static_cast<uint64_t>(physics_delta));
  return out;
}

std::string sign_draft(const Draft& draft, std::string_view secret_key_hex) {
  return sign_detached(signing_payload(draft), secret_key_hex);
}

std::string sign_pact(const std::string& pact_id, const Draft& draft, std::string_view secret_key_hex) {
  return sign_detached(pact_signing_payload(pact_id, draft.atom_hash, draft.intent_class, draft.physics_delta),
                       secret_key_hex);
}

std::string entry_to_json(const LedgerEntry& e, bool include_atom) {
  jsonlite::Object o;
  o["container_id"] = e.container_id;
  o["sequence"] = e.sequence;
  o["entry_hash"] = e.entry_hash;
  o["previous_hash"] = e.previous_hash;
  o["atom_hash"] = e.atom_hash;
  o["signature"] = e.signature;
  o["author_pubkey"] = e.author_pubkey;
  o["committed_at"] = e.committed_at_ms;
  o["intent_class"] = to_string(e.intent_class);
  o["physics_delta"] = std::to_string(e.physics_delta);
  if (include_atom) {
    auto atom = jsonlite::parse_value(e.atom, nullptr);
    if (atom) o["atom"] = std::move(*atom);
  }
  return jsonlite::to_canonical(o);
}

std::optional<LedgerEntry> entry_from_json(const std::string& line, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(line, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  LedgerEntry e;
  e.container_id = jsonlite::get_string(o, "container_id");
  const int64_t seq = jsonlite::get_i64(o, "sequence", -1);
  e.entry_hash = jsonlite::get_string(o, "entry_hash");
  e.previous_hash = jsonlite::get_string(o, "previous_hash");
  e.atom_hash = jsonlite::get_string(o, "atom_hash");
  e.signature = jsonlite::get_string(o, "signature");
  e.author_pubkey = jsonlite::get_string(o, "author_pubkey");
  const int64_t committed_at = jsonlite::get_i64(o, "committed_at", -1);
  const auto intent = intent_from_string(jsonlite::get_string(o, "intent_class"));
  const auto delta = parse_i64(jsonlite::get_string(o, "physics_delta"));

  if (e.container_id.empty() || seq < 0 || committed_at < 0 || !intent || !delta ||
      !is_digest_hex(e.entry_hash) || !is_digest_hex(e.previous_hash) || !is_digest_hex(e.atom_hash)) {
    if (error) *error = "entry record missing or malformed fields";
    return std::nullopt;
  }
  e.sequence = static_cast<uint64_t>(seq);
  e.committed_at_ms = static_cast<uint64_t>(committed_at);
  e.intent_class = *intent;
  e.physics_delta = *delta;
  if (const auto* atom = jsonlite::find(o, "atom")) e.atom = jsonlite::to_canonical(*atom);
  return e;
}

}  // namespace atomledger
