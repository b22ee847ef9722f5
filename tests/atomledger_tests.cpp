#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>

#include "atomledger/atom_store.hpp"
#include "atomledger/canonical.hpp"
#include "atomledger/config.hpp"
#include "atomledger/crypto.hpp"
#include "atomledger/hash.hpp"
#include "atomledger/jsonlite.hpp"
#include "atomledger/ledger.hpp"
#include "atomledger/observability.hpp"
#include "atomledger/permit.hpp"
#include "atomledger/projection.hpp"
#include "atomledger/stream.hpp"
#include "atomledger/version.hpp"

namespace fs = std::filesystem;
namespace al = atomledger;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

const al::KeyPair& alice() {
  static const al::KeyPair kp = al::keypair_from_seed(std::string(64, '1'));
  return kp;
}
const al::KeyPair& bob() {
  static const al::KeyPair kp = al::keypair_from_seed(std::string(64, '2'));
  return kp;
}
const al::KeyPair& carol() {
  static const al::KeyPair kp = al::keypair_from_seed(std::string(64, '3'));
  return kp;
}

std::string note(int n) { return "{\"type\":\"note\",\"n\":" + std::to_string(n) + "}"; }

al::Draft make_draft(const al::Ledger& ledger, const al::KeyPair& author, const std::string& cid,
                     const std::string& atom_json, al::IntentClass intent = al::IntentClass::observation,
                     int64_t delta = 0) {
  const al::ContainerState st = ledger.state(cid);
  al::Draft d;
  d.container_id = cid;
  d.expected_sequence = st.next_sequence();
  d.previous_hash = st.head_hash;
  d.atom_hash = al::atom_hash_of(al::jsonlite::canonicalize_json(atom_json, nullptr));
  d.intent_class = intent;
  d.physics_delta = delta;
  d.author_pubkey = author.public_key;
  return d;
}

al::CommitRequest sign_request(al::Draft d, const al::KeyPair& author, const std::string& atom_json) {
  al::CommitRequest req;
  req.draft = std::move(d);
  req.signature = al::sign_draft(req.draft, author.secret_key);
  req.atom_json = atom_json;
  return req;
}

al::CommitRequest make_request(const al::Ledger& ledger, const al::KeyPair& author, const std::string& cid,
                               const std::string& atom_json,
                               al::IntentClass intent = al::IntentClass::observation, int64_t delta = 0) {
  return sign_request(make_draft(ledger, author, cid, atom_json, intent, delta), author, atom_json);
}

al::CommitResult append(al::Ledger& ledger, const std::string& cid, const std::string& atom_json,
                        const al::KeyPair& author = alice(),
                        al::IntentClass intent = al::IntentClass::observation, int64_t delta = 0) {
  return ledger.commit(make_request(ledger, author, cid, atom_json, intent, delta));
}

void fill(al::Ledger& ledger, const std::string& cid, int count) {
  for (int i = 0; i < count; ++i) {
    expect(append(ledger, cid, note(i)).ok, "fill commit " + std::to_string(i));
  }
}

fs::path make_temp_dir() {
  const fs::path p = fs::temp_directory_path() / ("atomledger_test_" + al::random_hex(8));
  fs::create_directories(p);
  return p;
}

bool same_state(const al::ContainerState& a, const al::ContainerState& b) {
  return a.empty == b.empty && a.sequence == b.sequence && a.head_hash == b.head_hash &&
         a.entry_count == b.entry_count && a.physical_balance == b.physical_balance;
}

// Commits req and checks that it was rejected with code (and policy kind)
// without changing the container.
void expect_rejected(al::Ledger& ledger, const al::CommitRequest& req, al::ErrorCode code,
                     al::PolicyViolationKind policy, const std::string& what) {
  const al::ContainerState before = ledger.state(req.draft.container_id);
  const al::CommitResult r = ledger.commit(req);
  expect(!r.ok, what + ": must be rejected");
  expect(r.rejection.code == code,
         what + ": expected " + al::to_string(code) + ", got " + r.rejection.to_json());
  expect(r.rejection.policy == policy,
         what + ": expected policy " + al::to_string(policy) + ", got " + r.rejection.to_json());
  expect(same_state(before, ledger.state(req.draft.container_id)), what + ": rejection must leave no trace");
}

void expect_policy(al::Ledger& ledger, const std::string& cid, const std::string& atom_json,
                   al::PolicyViolationKind kind, const std::string& what, const al::KeyPair& author = alice()) {
  expect_rejected(ledger, make_request(ledger, author, cid, atom_json), al::ErrorCode::policy_violation, kind, what);
}

// ============================================================================
// Phase 1: Canonicalizer
// ============================================================================

void test_blake3_known_vectors() {
  expect(al::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(al::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  const auto info = al::hash_runtime_info();
  expect(info.primitive == "blake3" && info.digest_bytes == 32, "hash runtime info");
}

void test_domain_separation() {
  const std::string payload = "{\"type\":\"note\"}";
  const std::string atom = al::hash_domain(al::tags::kAtom, payload);
  const std::string entry = al::hash_domain(al::tags::kEntry, payload);
  const std::string sign = al::hash_domain(al::tags::kSign, payload);
  expect(atom != entry && atom != sign && entry != sign, "domain tags must separate digests");
  expect(atom != al::blake3_hex(payload), "tagged digest differs from plain digest");
  expect(al::is_digest_hex(atom), "domain digest is 64 lowercase hex");
  expect(al::atom_hash_of(payload) == atom, "atom_hash_of uses the atom tag");
}

void test_canonical_form() {
  std::optional<al::jsonlite::JsonError> err;
  const std::string c = al::jsonlite::canonicalize_json(" { \"b\" : 1 , \"a\" : [ true , null , 1.5 ] } ", &err);
  expect(!err, "well-formed input canonicalizes");
  expect(c == "{\"a\":[true,null,1.5],\"b\":1}", "keys sorted, whitespace removed: " + c);

  expect(al::jsonlite::canonicalize_json("{\"x\":1.0}", nullptr) == "{\"x\":1}",
         "integral double prints as integer");
  expect(al::jsonlite::canonicalize_json("{\"z\":{\"b\":2,\"a\":1}}", nullptr) == "{\"z\":{\"a\":1,\"b\":2}}",
         "nested keys sorted");
  expect(al::jsonlite::canonicalize_json("[3,1,2]", nullptr) == "[3,1,2]", "array order preserved");
  expect(al::jsonlite::canonicalize_json("\"\\u00e9\"", nullptr) == "\"\xC3\xA9\"",
         "\\u escapes decode to UTF-8");
  expect(al::jsonlite::canonicalize_json("\"\\ud83d\\ude00\"", nullptr) == "\"\xF0\x9F\x98\x80\"",
         "surrogate pair decodes to one code point");

  // Same atom, different spelling, same hash.
  const std::string h1 = al::atom_hash_of(al::jsonlite::canonicalize_json("{\"a\":1,\"b\":\"x\"}", nullptr));
  const std::string h2 = al::atom_hash_of(al::jsonlite::canonicalize_json("{ \"b\":\"x\", \"a\":1.0 }", nullptr));
  expect(h1 == h2, "equivalent atoms hash identically");
}

void test_canonical_idempotence() {
  const std::vector<std::string> inputs = {
      "{\"b\":[1,2,{\"d\":null,\"c\":false}],\"a\":\"text\"}",
      "[0.1,-2.5e-3,1e21,123456789012]",
      "\"ctl \\u0001 tab\\t quote\\\" slash\\\\\"",
      "{\"unicode\":\"\\u4e2d\\u6587\",\"emoji\":\"\\ud83d\\ude00\"}",
      "-9223372036854775808",
  };
  for (const auto& in : inputs) {
    std::optional<al::jsonlite::JsonError> err;
    const std::string once = al::jsonlite::canonicalize_json(in, &err);
    expect(!err, "input must parse: " + in);
    const std::string twice = al::jsonlite::canonicalize_json(once, &err);
    expect(!err && once == twice, "canonicalize must be idempotent for " + in);
  }
}

void test_canonical_rejections() {
  struct Case {
    std::string input;
    std::string code;
  };
  std::string deep;
  for (int i = 0; i < 129; ++i) deep += "[";
  for (int i = 0; i < 129; ++i) deep += "]";
  const std::vector<Case> cases = {
      {"{\"a\":1,\"a\":2}", "json_duplicate_key"},
      {"{\"a\":1} x", "json_trailing_data"},
      {"NaN", "json_non_finite"},
      {"1e400", "json_non_finite"},
      {"99999999999999999999", "json_number_range"},
      {"\"\\ud800\"", "json_invalid_utf8"},
      {"\"\xC0\xAF\"", "json_invalid_utf8"},
      {"{\"a\":", "json_parse_error"},
      {deep, "json_depth_exceeded"},
  };
  for (const auto& c : cases) {
    std::optional<al::jsonlite::JsonError> err;
    const std::string out = al::jsonlite::canonicalize_json(c.input, &err);
    expect(out.empty() && err.has_value(), "must reject: " + c.input);
    expect(err->code == c.code, "expected " + c.code + ", got " + err->code);
  }

  std::string ok_depth;
  for (int i = 0; i < 128; ++i) ok_depth += "[";
  for (int i = 0; i < 128; ++i) ok_depth += "]";
  std::optional<al::jsonlite::JsonError> err;
  al::jsonlite::canonicalize_json(ok_depth, &err);
  expect(!err, "nesting of exactly 128 is accepted");

  al::Rejection rej;
  expect(!al::canonicalize_atom("{\"a\":1,\"a\":1}", &rej), "canonicalize_atom rejects duplicates");
  expect(rej.code == al::ErrorCode::canonicalization_error, "canonicalize_atom maps to canonicalization_error");
}

void test_unicode_normalization() {
  const std::string composed = "{\"type\":\"note\",\"text\":\"caf\xC3\xA9\"}";
  const std::string decomposed = "{\"type\":\"note\",\"text\":\"cafe\xCC\x81\"}";
  const std::string escaped = "{\"type\":\"note\",\"text\":\"cafe\\u0301\"}";
  std::optional<al::jsonlite::JsonError> err;
  const std::string a = al::jsonlite::canonicalize_json(composed, &err);
  expect(!err, "composed form parses");
  expect(al::jsonlite::canonicalize_json(decomposed, &err) == a && !err, "decomposed form canonicalizes to NFC");
  expect(al::jsonlite::canonicalize_json(escaped, &err) == a && !err, "escaped combining mark normalizes too");
  expect(a.find("caf\xC3\xA9") != std::string::npos, "canonical text is composed");
  expect(al::atom_hash_of(a) == al::atom_hash_of(al::jsonlite::canonicalize_json(decomposed, nullptr)),
         "equivalent spellings share one atom_hash");

  const std::string keys = "{\"\xC3\xA9\":1,\"e\xCC\x81\":2}";
  const std::string out = al::jsonlite::canonicalize_json(keys, &err);
  expect(out.empty() && err && err->code == "json_duplicate_key", "keys equal after NFC are duplicates");

  expect(al::jsonlite::canonicalize_json("{\"\xE2\x84\xAB\":1}", nullptr) == "{\"\xC3\x85\":1}",
         "angstrom sign key normalizes to A-ring");
}

void test_number_precision() {
  std::optional<al::jsonlite::JsonError> err;
  const std::string out = al::jsonlite::canonicalize_json("{\"x\":0.10000000000000000001}", &err);
  expect(out.empty() && err && err->code == "json_number_precision", "silent rounding is refused");
  al::jsonlite::canonicalize_json("[1.00000000000000000000001]", &err);
  expect(err && err->code == "json_number_precision", "excess digits beyond a double are refused");

  const std::vector<std::pair<std::string, std::string>> exact = {
      {"[0.1]", "[0.1]"},
      {"[2.50]", "[2.5]"},
      {"[-2.5e-3]", "[-0.0025]"},
      {"[1.5e2]", "[150]"},
      {"[0.000]", "[0]"},
  };
  for (const auto& [in, want] : exact) {
    const std::string c = al::jsonlite::canonicalize_json(in, &err);
    expect(!err && c == want, in + " is exact and canonicalizes to " + want + ", got " + c);
  }

  al::Rejection rej;
  expect(!al::canonicalize_atom("{\"type\":\"note\",\"v\":3.14159265358979323846264}", &rej),
         "imprecise atom refused");
  expect(rej.code == al::ErrorCode::canonicalization_error, "precision loss is a canonicalization_error");
}

// ============================================================================
// Phase 2: Signatures and entry hashing
// ============================================================================

void test_ed25519_sign_verify() {
  const al::KeyPair kp = al::generate_keypair();
  expect(al::is_public_key_hex(kp.public_key), "public key is 64 hex chars");
  const std::string sig = al::sign_detached("payload", kp.secret_key);
  expect(sig.size() == 128, "signature is 128 hex chars");
  expect(al::verify_detached("payload", sig, kp.public_key), "signature verifies");
  expect(!al::verify_detached("payload!", sig, kp.public_key), "tampered payload fails");
  expect(!al::verify_detached("payload", sig, bob().public_key), "wrong key fails");
  expect(!al::verify_detached("payload", "zz", "zz"), "malformed input fails without throwing");
  expect(al::sign_detached("payload", "not-a-key").empty(), "malformed secret key cannot sign");

  const al::KeyPair again = al::keypair_from_seed(std::string(64, '1'));
  expect(again.public_key == alice().public_key, "seeded key pairs are deterministic");
}

void test_signing_payload_fields() {
  al::Ledger ledger;
  al::Draft d = make_draft(ledger, alice(), "sig/1", note(1));
  const std::string base = al::signing_payload(d);
  expect(base.rfind(std::string(al::tags::kSign), 0) == 0, "signing payload starts with the sign tag");

  al::Draft other_author = d;
  other_author.author_pubkey = bob().public_key;
  expect(al::signing_payload(other_author) == base, "author_pubkey is not part of the signing payload");

  al::Draft other_delta = d;
  other_delta.physics_delta = 7;
  expect(al::signing_payload(other_delta) != base, "physics_delta is part of the signing payload");

  al::Draft other_intent = d;
  other_intent.intent_class = al::IntentClass::entropy;
  expect(al::signing_payload(other_intent) != base, "intent_class is part of the signing payload");
}

void test_entry_hash_recompute() {
  al::Ledger ledger;
  fill(ledger, "hash/1", 3);
  for (uint64_t s = 0; s < 3; ++s) {
    const auto e = ledger.entry("hash/1", s);
    expect(e.has_value(), "entry exists");
    expect(al::recompute_entry_hash(*e) == e->entry_hash, "recomputed entry hash matches stored");

    std::string err;
    const auto back = al::entry_from_json(al::entry_to_json(*e, true), &err);
    expect(back.has_value(), "entry JSON parses back: " + err);
    expect(back->entry_hash == e->entry_hash && back->atom == e->atom && back->sequence == e->sequence,
           "entry JSON keeps every field");
  }
  al::LedgerEntry e = *ledger.entry("hash/1", 1);
  e.committed_at_ms += 1;
  expect(al::recompute_entry_hash(e) != e.entry_hash, "changing committed_at changes the entry hash");
}

// ============================================================================
// Phase 3: Membrane and policy
// ============================================================================

void test_scenario_accept_next_sequence() {
  al::Ledger ledger;
  fill(ledger, "X", 6);
  const al::ContainerState st = ledger.state("X");
  expect(!st.empty && st.sequence == 5, "container X at sequence 5");
  const std::string h5 = st.head_hash;

  const al::CommitResult r = append(ledger, "X", note(6));
  expect(r.ok, "draft with expected_sequence=6, previous_hash=H5 is accepted");
  expect(r.sequence == 6, "new entry has sequence 6");
  const auto e = ledger.entry("X", 6);
  expect(e && e->previous_hash == h5 && e->entry_hash == r.entry_hash, "new entry links to H5");
}

void test_scenario_stale_previous_hash() {
  al::Ledger ledger;
  fill(ledger, "X", 6);
  const std::string h4 = ledger.entry("X", 4)->entry_hash;

  al::Draft d = make_draft(ledger, alice(), "X", note(6));
  d.previous_hash = h4;
  expect_rejected(ledger, sign_request(d, alice(), note(6)), al::ErrorCode::causality_mismatch,
                  al::PolicyViolationKind::none, "stale previous_hash");

  al::Draft future = make_draft(ledger, alice(), "X", note(7));
  future.expected_sequence = 9;
  expect_rejected(ledger, sign_request(future, alice(), note(7)), al::ErrorCode::causality_mismatch,
                  al::PolicyViolationKind::none, "sequence from the future");
}

void test_scenario_signature_missing_delta() {
  al::Ledger ledger;
  fill(ledger, "X", 6);
  al::Draft d = make_draft(ledger, alice(), "X", note(6));

  al::jsonlite::Object o;
  o["version"] = d.version;
  o["container_id"] = d.container_id;
  o["expected_sequence"] = d.expected_sequence;
  o["previous_hash"] = d.previous_hash;
  o["atom_hash"] = d.atom_hash;
  o["intent_class"] = al::to_string(d.intent_class);
  o["pact"] = nullptr;
  std::string payload(al::tags::kSign);
  payload += al::jsonlite::to_canonical(o);

  al::CommitRequest req;
  req.draft = d;
  req.signature = al::sign_detached(payload, alice().secret_key);
  req.atom_json = note(6);
  expect_rejected(ledger, req, al::ErrorCode::signature_invalid, al::PolicyViolationKind::none,
                  "signature over a payload without physics_delta");

  al::CommitRequest wrong_key = make_request(ledger, alice(), "X", note(6));
  wrong_key.signature = al::sign_draft(wrong_key.draft, bob().secret_key);
  expect_rejected(ledger, wrong_key, al::ErrorCode::signature_invalid, al::PolicyViolationKind::none,
                  "signature by another key");
}

void test_scenario_illegal_job_transition() {
  al::Ledger ledger;
  expect_policy(ledger, "jobs/1", "{\"type\":\"job.created\",\"job_id\":\"j1\",\"title\":\"Ship\",\"state\":\"completed\"}",
                al::PolicyViolationKind::illegal_transition, "job cannot start in a terminal state");
  expect_policy(ledger, "jobs/1", "{\"type\":\"job.created\",\"job_id\":\"j1\",\"title\":\"Ship\",\"state\":\"in_progress\"}",
                al::PolicyViolationKind::illegal_transition, "job cannot skip approval at creation");
  const std::vector<std::string> to_completed = {
      "{\"type\":\"job.created\",\"job_id\":\"j1\",\"title\":\"Ship\",\"state\":\"proposed\"}",
      "{\"type\":\"job.state_changed\",\"job_id\":\"j1\",\"from\":\"proposed\",\"to\":\"approved\"}",
      "{\"type\":\"job.state_changed\",\"job_id\":\"j1\",\"from\":\"approved\",\"to\":\"in_progress\"}",
      "{\"type\":\"job.state_changed\",\"job_id\":\"j1\",\"from\":\"in_progress\",\"to\":\"completed\"}",
  };
  for (const auto& a : to_completed) expect(append(ledger, "jobs/1", a).ok, "legal step: " + a);
  expect_policy(ledger, "jobs/1", "{\"type\":\"job.state_changed\",\"job_id\":\"j1\",\"from\":\"completed\",\"to\":\"proposed\"}",
                al::PolicyViolationKind::illegal_transition, "completed -> proposed");

  expect(append(ledger, "jobs/1", "{\"type\":\"job.created\",\"job_id\":\"j2\",\"title\":\"Plan\"}").ok, "job j2");
  expect_policy(ledger, "jobs/1", "{\"type\":\"job.state_changed\",\"job_id\":\"j2\",\"from\":\"proposed\",\"to\":\"approved\"}",
                al::PolicyViolationKind::illegal_transition, "from must equal the current state");
  expect(append(ledger, "jobs/1", "{\"type\":\"job.state_changed\",\"job_id\":\"j2\",\"from\":\"draft\",\"to\":\"proposed\"}").ok,
         "draft -> proposed");
  expect(append(ledger, "jobs/1", "{\"type\":\"job.state_changed\",\"job_id\":\"j2\",\"from\":\"proposed\",\"to\":\"approved\"}").ok,
         "proposed -> approved");
  expect_policy(ledger, "jobs/1", "{\"type\":\"job.state_changed\",\"job_id\":\"nope\",\"from\":\"draft\",\"to\":\"proposed\"}",
                al::PolicyViolationKind::illegal_transition, "unknown job");
  expect_policy(ledger, "jobs/1", "{\"type\":\"job.created\",\"job_id\":\"j2\",\"title\":\"dup\"}",
                al::PolicyViolationKind::illegal_transition, "job created twice");

  expect(al::job_transition_allowed("in_progress", "waiting_input"), "in_progress -> waiting_input");
  expect(al::job_transition_allowed("waiting_input", "in_progress"), "waiting_input -> in_progress");
  expect(!al::job_transition_allowed("approved", "completed"), "approved cannot skip in_progress");
  for (const char* s : {"completed", "rejected", "cancelled", "failed"}) {
    expect(al::is_terminal_job_state(s), std::string(s) + " is terminal");
    expect(!al::job_transition_allowed(s, "in_progress"), std::string(s) + " has no outgoing edge");
  }
}

void test_invalid_drafts() {
  al::Ledger ledger;
  al::Draft bad_version = make_draft(ledger, alice(), "inv/1", note(1));
  bad_version.version = 2;
  expect_rejected(ledger, sign_request(bad_version, alice(), note(1)), al::ErrorCode::invalid_draft,
                  al::PolicyViolationKind::none, "link version 2");

  al::CommitRequest wrong_atom = make_request(ledger, alice(), "inv/1", note(1));
  wrong_atom.atom_json = note(2);
  expect_rejected(ledger, wrong_atom, al::ErrorCode::invalid_draft, al::PolicyViolationKind::none,
                  "atom does not match atom_hash");

  al::Draft bad_key = make_draft(ledger, alice(), "inv/1", note(1));
  bad_key.author_pubkey = "abc";
  expect_rejected(ledger, sign_request(bad_key, alice(), note(1)), al::ErrorCode::invalid_draft,
                  al::PolicyViolationKind::none, "malformed author key");

  al::CommitRequest bad_json = make_request(ledger, alice(), "inv/1", note(1));
  bad_json.atom_json = "{\"type\":\"note\",";
  expect_rejected(ledger, bad_json, al::ErrorCode::canonicalization_error, al::PolicyViolationKind::none,
                  "malformed atom");
  expect(ledger.state("inv/1").empty, "container still empty after rejections");
}

void test_sensitive_data_rule() {
  expect(al::find_sensitive_data(al::jsonlite::Value("ssn 123-45-6789")) == std::optional<std::string>("ssn"),
         "ssn detected");
  expect(al::find_sensitive_data(al::jsonlite::Value("card 4111 1111 1111 1111")) ==
             std::optional<std::string>("card_number"),
         "card number detected");
  expect(al::find_sensitive_data(al::jsonlite::Value("call 555-123-4567")) == std::optional<std::string>("phone"),
         "phone detected");
  expect(!al::find_sensitive_data(al::jsonlite::Value("ssn ***-**-6789")), "redacted value passes");
  const std::vector<std::pair<std::string, std::string>> hits = {
      {"reach me at ana@example.com", "email"},
      {"ops+alerts@mail.acme.io", "email"},
      {"+1 (555) 123 4567", "phone"},
      {"call (555) 123-4567 today", "phone"},
      {"555.123.4567", "phone"},
      {"5551234567", "phone"},
  };
  for (const auto& [text, kind] : hits) {
    expect(al::find_sensitive_data(al::jsonlite::Value(text)) == std::optional<std::string>(kind),
           kind + " detected in: " + text);
  }
  for (const char* clean : {"due 2026-10-19", "build 1.2.3", "ana at example dot com", "job-12345"}) {
    expect(!al::find_sensitive_data(al::jsonlite::Value(clean)), std::string("no false positive: ") + clean);
  }

  al::Ledger ledger;
  expect_policy(ledger, "msg/1",
                "{\"type\":\"message.sent\",\"message_id\":\"m1\",\"author\":\"ana\",\"text\":\"my ssn is 123-45-6789\"}",
                al::PolicyViolationKind::raw_sensitive_data, "raw ssn in message");
  expect_policy(ledger, "msg/1", "{\"type\":\"note\",\"meta\":{\"list\":[\"x\",\"4111-1111-1111-1111\"]}}",
                al::PolicyViolationKind::raw_sensitive_data, "card number nested in arrays");
  expect_policy(ledger, "msg/1",
                "{\"type\":\"message.sent\",\"message_id\":\"m2\",\"author\":\"ana\",\"text\":\"mail ana@example.com\"}",
                al::PolicyViolationKind::raw_sensitive_data, "raw email in message");
  expect(append(ledger, "msg/1",
                "{\"type\":\"message.sent\",\"message_id\":\"m1\",\"author\":\"ana\",\"text\":\"ssn ends in 6789\"}").ok,
         "redacted message accepted");
}

void test_schema_rule() {
  al::Ledger ledger;
  expect_policy(ledger, "schema/1", "[1,2]", al::PolicyViolationKind::schema, "atom must be an object");
  expect_policy(ledger, "schema/1", "{\"kind\":\"note\"}", al::PolicyViolationKind::schema, "atom needs a type");
  expect_policy(ledger, "schema/1", "{\"type\":\"job.progress\",\"job_id\":\"j\"}", al::PolicyViolationKind::schema,
                "job.progress needs percent");
  expect_policy(ledger, "schema/1", "{\"type\":\"job.progress\",\"job_id\":\"j\",\"percent\":\"40\"}",
                al::PolicyViolationKind::schema, "percent must be an integer");
  expect_policy(ledger, "schema/1", "{\"type\":\"job.created\",\"job_id\":\"j\",\"title\":\"t\",\"state\":\"limbo\"}",
                al::PolicyViolationKind::schema, "unknown initial job state");
  expect_policy(ledger, "schema/1", "{\"type\":\"approval.requested\",\"job_id\":\"j\",\"card\":{}}",
                al::PolicyViolationKind::schema, "approval card needs card_id");
}

void test_card_provenance_rule() {
  al::Ledger ledger;
  const std::string cid = "cards/1";
  expect_policy(ledger, cid, "{\"type\":\"approval.decided\",\"card_id\":\"c1\",\"decision\":\"approve\"}",
                al::PolicyViolationKind::provenance, "decision for a card never issued");
  expect(append(ledger, cid, "{\"type\":\"job.created\",\"job_id\":\"j1\",\"title\":\"Pay\"}").ok, "job");
  expect(append(ledger, cid, "{\"type\":\"approval.requested\",\"job_id\":\"j1\",\"card\":{\"card_id\":\"c1\"}}").ok,
         "card issued");
  expect_policy(ledger, "cards/other", "{\"type\":\"approval.decided\",\"card_id\":\"c1\",\"decision\":\"approve\"}",
                al::PolicyViolationKind::provenance, "card from another container");
  expect(append(ledger, cid, "{\"type\":\"approval.decided\",\"card_id\":\"c1\",\"decision\":\"approve\"}").ok,
         "first decision accepted");
  expect_policy(ledger, cid, "{\"type\":\"approval.decided\",\"card_id\":\"c1\",\"decision\":\"reject\"}",
                al::PolicyViolationKind::provenance, "card decided twice");
}

void test_tool_pairing_rule() {
  al::Ledger ledger;
  const std::string cid = "tools/1";
  expect_policy(ledger, cid, "{\"type\":\"tool.result\",\"call_id\":\"t1\"}", al::PolicyViolationKind::provenance,
                "result without call");
  expect(append(ledger, cid, "{\"type\":\"tool.called\",\"call_id\":\"t1\",\"tool\":\"search\"}").ok, "tool called");
  expect(append(ledger, cid, "{\"type\":\"tool.result\",\"call_id\":\"t1\",\"ok\":true}").ok, "tool result");
  expect_policy(ledger, cid, "{\"type\":\"tool.result\",\"call_id\":\"t1\",\"ok\":true}",
                al::PolicyViolationKind::provenance, "second result for one call");
}

void test_tenant_scope_rule() {
  al::Ledger ledger;
  ledger.policy().bind_container_tenant("acme/c1", "acme");
  ledger.policy().bind_author_tenant(alice().public_key, "acme");
  ledger.policy().bind_author_tenant(bob().public_key, "globex");

  expect_policy(ledger, "acme/c1", note(1), al::PolicyViolationKind::tenant_scope, "author from another tenant",
                bob());
  expect_policy(ledger, "acme/c1", "{\"type\":\"note\",\"tenant_id\":\"globex\"}", al::PolicyViolationKind::tenant_scope,
                "atom tenant mismatch");
  expect(append(ledger, "acme/c1", "{\"type\":\"note\",\"tenant_id\":\"acme\"}").ok, "same tenant accepted");
  expect(append(ledger, "free/c1", note(1), bob()).ok, "unbound container accepts any author");
  expect(ledger.policy().container_tenant("acme/c1") == std::optional<std::string>("acme"), "binding readable");
}

void test_scoped_rules_and_policy_hash() {
  al::PolicyEngine empty(std::vector<al::PolicyRule>{});
  al::PolicyEngine scoped(std::vector<al::PolicyRule>{
      {al::RuleKind::sensitive_data, "pii/", {al::IntentClass::observation}},
  });
  expect(empty.policy_hash() != scoped.policy_hash(), "policy hash depends on the rule list");
  expect(al::is_digest_hex(scoped.policy_hash()), "policy hash is a digest");

  al::PolicyRule rule{al::RuleKind::sensitive_data, "pii/", {al::IntentClass::observation}};
  expect(rule.applies_to("pii/1", al::IntentClass::observation), "prefix + intent match");
  expect(!rule.applies_to("ops/1", al::IntentClass::observation), "other prefix skipped");
  expect(!rule.applies_to("pii/1", al::IntentClass::conservation), "other intent skipped");

  const std::string before = scoped.policy_hash();
  scoped.add_rule({al::RuleKind::tool_pairing, "", {}});
  expect(scoped.policy_hash() != before, "adding a rule changes the policy hash");
}

void test_physics_rules() {
  al::Ledger ledger;
  const std::string cid = "phys/1";
  expect_rejected(ledger, make_request(ledger, alice(), cid, note(1), al::IntentClass::observation, 5),
                  al::ErrorCode::policy_violation, al::PolicyViolationKind::physics, "observation with delta");
  expect_rejected(ledger, make_request(ledger, alice(), cid, note(1), al::IntentClass::conservation, -1),
                  al::ErrorCode::policy_violation, al::PolicyViolationKind::physics, "negative balance");
  expect(append(ledger, cid, note(1), alice(), al::IntentClass::conservation, 10).ok, "deposit 10");
  expect(append(ledger, cid, note(2), alice(), al::IntentClass::conservation, -4).ok, "withdraw 4");
  expect(ledger.state(cid).physical_balance == 6, "balance is the running sum");
  expect_rejected(ledger, make_request(ledger, alice(), cid, note(3), al::IntentClass::conservation, -7),
                  al::ErrorCode::policy_violation, al::PolicyViolationKind::physics, "overdraw");
  expect_rejected(ledger, make_request(ledger, alice(), cid, note(3), al::IntentClass::entropy, 3),
                  al::ErrorCode::policy_violation, al::PolicyViolationKind::physics, "entropy without pact");
  expect_rejected(ledger, make_request(ledger, alice(), cid, note(3), al::IntentClass::evolution, 0),
                  al::ErrorCode::policy_violation, al::PolicyViolationKind::physics, "evolution without pact");
  expect(append(ledger, cid, note(3), alice(), al::IntentClass::entropy, 0).ok, "entropy with zero delta");
}

al::CommitRequest pact_request(const al::Ledger& ledger, const std::string& cid, const std::string& atom,
                               al::IntentClass intent, int64_t delta, const std::string& pact_id,
                               const std::vector<const al::KeyPair*>& signers) {
  al::Draft d = make_draft(ledger, alice(), cid, atom, intent, delta);
  al::PactProof proof;
  proof.pact_id = pact_id;
  for (const auto* s : signers) proof.signatures.push_back({s->public_key, al::sign_pact(pact_id, d, s->secret_key)});
  d.pact = proof;
  return sign_request(d, alice(), atom);
}

void test_pact_validation() {
  al::Ledger ledger;
  al::Pact p;
  p.pact_id = "ops-entropy";
  p.scope = {al::PactScopeKind::container_prefix, "ops/"};
  p.risk_level = al::RiskLevel::L4;
  p.intent_classes = {al::IntentClass::entropy};
  p.signers = {bob().public_key, carol().public_key};
  p.threshold = 2;
  expect(!ledger.pacts().register_pact(p), "pact registers");
  expect(ledger.pacts().register_pact(p).has_value(), "duplicate pact id refused");

  al::Pact expired = p;
  expired.pact_id = "expired";
  expired.window = {0, 1};
  expect(!ledger.pacts().register_pact(expired), "expired pact registers");

  al::Pact bad = p;
  bad.pact_id = "bad";
  bad.threshold = 3;
  expect(ledger.pacts().register_pact(bad).has_value(), "threshold above signer count refused");

  const std::string cid = "ops/1";
  const std::string atom = "{\"type\":\"note\",\"what\":\"burn\"}";
  const auto pact = al::PolicyViolationKind::pact;
  const auto pv = al::ErrorCode::policy_violation;
  expect_rejected(ledger, pact_request(ledger, cid, atom, al::IntentClass::entropy, 3, "ops-entropy", {&bob()}),
                  pv, pact, "threshold not met");
  expect_rejected(ledger, pact_request(ledger, cid, atom, al::IntentClass::entropy, 3, "ops-entropy", {&bob(), &bob()}),
                  pv, pact, "duplicate signer");
  expect_rejected(ledger, pact_request(ledger, cid, atom, al::IntentClass::entropy, 3, "ops-entropy", {&bob(), &alice()}),
                  pv, pact, "unauthorized signer");
  expect_rejected(ledger, pact_request(ledger, cid, atom, al::IntentClass::entropy, 3, "missing", {&bob(), &carol()}),
                  pv, pact, "unknown pact");
  expect_rejected(ledger, pact_request(ledger, cid, atom, al::IntentClass::entropy, 3, "expired", {&bob(), &carol()}),
                  pv, pact, "pact outside window");
  expect_rejected(ledger, pact_request(ledger, "finance/1", atom, al::IntentClass::entropy, 3, "ops-entropy", {&bob(), &carol()}),
                  pv, pact, "container outside scope");
  expect_rejected(ledger, pact_request(ledger, cid, atom, al::IntentClass::evolution, 0, "ops-entropy", {&bob(), &carol()}),
                  pv, pact, "intent not governed (risk mismatch)");

  // Signatures bound to a different delta do not transfer.
  al::CommitRequest moved = pact_request(ledger, cid, atom, al::IntentClass::entropy, 3, "ops-entropy", {&bob(), &carol()});
  moved.draft.physics_delta = 30;
  moved.signature = al::sign_draft(moved.draft, alice().secret_key);
  expect_rejected(ledger, moved, pv, pact, "pact signatures over another delta");

  const auto ok = ledger.commit(pact_request(ledger, cid, atom, al::IntentClass::entropy, 3, "ops-entropy", {&bob(), &carol()}));
  expect(ok.ok, "entropy with a satisfied pact is accepted: " + ok.rejection.to_json());
  expect(ledger.state(cid).physical_balance == 3, "entropy delta applied to balance");
  expect(al::required_risk(al::IntentClass::entropy) == al::RiskLevel::L4, "entropy requires L4");
  expect(al::risk_from_string("L5") == al::RiskLevel::L5 && !al::risk_from_string("L9"), "risk names");
}

// ============================================================================
// Phase 4: Append engine
// ============================================================================

void test_chain_linkage() {
  al::Ledger ledger;
  fill(ledger, "chain/1", 50);
  std::string prev = al::kGenesisHash;
  for (uint64_t s = 0; s < 50; ++s) {
    const auto e = ledger.entry("chain/1", s);
    expect(e && e->sequence == s, "sequence " + std::to_string(s) + " present");
    expect(e->previous_hash == prev, "previous_hash links to the prior entry at " + std::to_string(s));
    prev = e->entry_hash;
  }
  const auto report = ledger.verify_chain("chain/1");
  expect(report.ok && report.entries_checked == 50, "verify_chain over 50 entries");
  expect(ledger.state("chain/1").head_hash == prev, "head hash is the last entry hash");
  expect(!ledger.entry("chain/1", 50), "no entry past head");
}

void test_concurrent_commits_single_winner() {
  al::Ledger ledger;
  const std::string cid = "race/1";
  constexpr int kThreads = 8;
  for (int round = 0; round < 20; ++round) {
    std::vector<al::CommitRequest> reqs;
    for (int t = 0; t < kThreads; ++t) reqs.push_back(make_request(ledger, alice(), cid, note(round * 100 + t)));

    std::atomic<bool> go{false};
    std::vector<al::CommitResult> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&, t] {
        while (!go.load()) std::this_thread::yield();
        results[static_cast<size_t>(t)] = ledger.commit(reqs[static_cast<size_t>(t)]);
      });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    int accepted = 0;
    int conflicts = 0;
    for (const auto& r : results) {
      if (r.ok) ++accepted;
      if (!r.ok && r.rejection.code == al::ErrorCode::sequence_conflict) {
        ++conflicts;
        expect(r.rejection.retryable(), "sequence_conflict is retryable");
      }
    }
    expect(accepted == 1, "exactly one winner in round " + std::to_string(round));
    expect(conflicts == kThreads - 1, "every loser gets sequence_conflict in round " + std::to_string(round));
    expect(ledger.state(cid).entry_count == static_cast<uint64_t>(round + 1), "one entry per round");
  }
  expect(ledger.verify_chain(cid).ok, "chain intact after races");
}

void test_cross_container_parallelism() {
  al::Ledger ledger;
  constexpr int kContainers = 4;
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int c = 0; c < kContainers; ++c) {
    threads.emplace_back([&, c] {
      const std::string cid = "par/" + std::to_string(c);
      for (int i = 0; i < 25; ++i) {
        if (!append(ledger, cid, note(i)).ok) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(failures.load() == 0, "single writer per container never conflicts");
  for (int c = 0; c < kContainers; ++c) {
    const std::string cid = "par/" + std::to_string(c);
    expect(ledger.state(cid).entry_count == 25, cid + " has 25 entries");
    expect(ledger.verify_chain(cid).ok, cid + " chain intact");
  }
  expect(ledger.containers().size() == kContainers, "containers() lists every container");
}

void test_state_fetch_and_pagination() {
  al::Ledger ledger;
  const al::ContainerState empty = ledger.state("none");
  expect(empty.empty && empty.next_sequence() == 0 && empty.head_hash == al::kGenesisHash,
         "unknown container reports genesis state");

  fill(ledger, "page/1", 10);
  const auto e3 = ledger.entry("page/1", 3);
  const al::AtomResult atom = ledger.fetch_atom(e3->atom_hash);
  expect(atom.ok && atom.atom == e3->atom, "fetch_atom returns the canonical payload");
  expect(atom.atom == al::jsonlite::canonicalize_json(note(3), nullptr), "stored atom is canonical");

  const al::AtomResult missing = ledger.fetch_atom(std::string(64, 'a'));
  expect(!missing.ok && missing.rejection.code == al::ErrorCode::not_found, "unknown atom is not_found");
  expect(ledger.fetch_atom("xyz").rejection.code == al::ErrorCode::not_found, "malformed hash is not_found");

  const auto first = ledger.entries_after("page/1", -1, 4);
  expect(first.size() == 4 && first.front().sequence == 0 && first.back().sequence == 3, "first page");
  const auto rest = ledger.entries_after("page/1", 3, 100);
  expect(rest.size() == 6 && rest.front().sequence == 4 && rest.back().sequence == 9, "remaining entries");
  expect(ledger.entries_after("page/1", 9, 10).empty(), "nothing after head");
  expect(ledger.entries_after("none", -1, 10).empty(), "unknown container has no entries");
}

// A clock whose gate_call-th reading blocks until release(). Lets a test
// park a committer while it holds the container lock.
struct GatedClock {
  std::mutex mu;
  std::condition_variable cv;
  int calls{0};
  int gate_call{0};
  bool released{false};

  uint64_t read() {
    std::unique_lock<std::mutex> lk(mu);
    const int n = ++calls;
    cv.notify_all();
    if (n == gate_call) cv.wait(lk, [&] { return released; });
    return 1700000000000ull;
  }
  void wait_for_calls(int n) {
    std::unique_lock<std::mutex> lk(mu);
    cv.wait(lk, [&] { return calls >= n; });
  }
  void release() {
    std::lock_guard<std::mutex> lk(mu);
    released = true;
    cv.notify_all();
  }
};

void test_lock_timeout_is_conflict() {
  GatedClock clock;
  al::LedgerConfig cfg;
  cfg.lock_timeout_ms = 50;
  al::Ledger ledger(cfg);
  clock.gate_call = 2;  // first committer's stamp, taken under the lock
  ledger.set_clock([&clock] { return clock.read(); });

  const al::CommitRequest first = make_request(ledger, alice(), "lock/1", note(1));
  const al::CommitRequest second = make_request(ledger, bob(), "lock/1", note(2));
  al::CommitResult first_result;
  std::thread holder([&] { first_result = ledger.commit(first); });
  clock.wait_for_calls(2);

  const uint64_t timeouts_before = al::global_ledger_stats().lock_timeouts.load();
  const al::CommitResult r = ledger.commit(second);
  expect(!r.ok && r.rejection.code == al::ErrorCode::sequence_conflict, "lock timeout reports sequence_conflict");
  expect(r.rejection.retryable(), "lock timeout is retryable");
  expect(r.rejection.detail.find("timed out") != std::string::npos, "detail names the timeout: " + r.rejection.detail);
  expect(al::global_ledger_stats().lock_timeouts.load() == timeouts_before + 1, "lock timeout counted");

  clock.release();
  holder.join();
  expect(first_result.ok && first_result.sequence == 0, "lock holder commits");
  expect(ledger.state("lock/1").entry_count == 1, "only the holder's entry landed");
}

void test_head_moved_under_lock() {
  GatedClock clock;
  al::LedgerConfig cfg;
  cfg.lock_timeout_ms = 10000;
  al::Ledger ledger(cfg);
  clock.gate_call = 2;
  ledger.set_clock([&clock] { return clock.read(); });

  const al::CommitRequest first = make_request(ledger, alice(), "moved/1", note(1));
  const al::CommitRequest second = make_request(ledger, bob(), "moved/1", note(2));
  al::CommitResult first_result;
  al::CommitResult second_result;
  std::thread holder([&] { first_result = ledger.commit(first); });
  clock.wait_for_calls(2);
  // The second writer validates against the empty head, then queues on the lock.
  std::thread waiter([&] { second_result = ledger.commit(second); });
  clock.wait_for_calls(3);
  clock.release();
  holder.join();
  waiter.join();

  expect(first_result.ok, "first writer commits");
  expect(!second_result.ok && second_result.rejection.code == al::ErrorCode::sequence_conflict,
         "head moved under the lock: " + second_result.rejection.to_json());
  expect(second_result.rejection.detail.find("committed sequence 0 first") != std::string::npos,
         "detail names the lost sequence: " + second_result.rejection.detail);
  expect(ledger.verify_chain("moved/1").ok && ledger.state("moved/1").entry_count == 1, "chain intact");
}

void test_rejected_drafts_allocate_nothing() {
  al::Ledger ledger;
  fill(ledger, "real/1", 1);
  const std::size_t slots = ledger.slot_count();
  for (int i = 0; i < 50; ++i) {
    al::CommitRequest bad = make_request(ledger, alice(), "junk/" + std::to_string(i), note(i));
    bad.signature = std::string(128, '0');
    expect(!ledger.commit(bad).ok, "forged draft rejected");
    al::Draft stale = make_draft(ledger, alice(), "junk/x" + std::to_string(i), note(i));
    stale.expected_sequence = 7;
    expect(!ledger.commit(sign_request(stale, alice(), note(i))).ok, "draft against a missing head rejected");
  }
  expect(ledger.slot_count() == slots, "rejections leave no container state behind");
  expect(ledger.containers().size() == 1, "only the real container is listed");
}

fs::path only_journal(const fs::path& dir) {
  for (const auto& f : fs::directory_iterator(dir / "journal")) return f.path();
  return {};
}

void test_journal_append_failure_rolls_back() {
  const fs::path dir = make_temp_dir();
  al::LedgerConfig cfg;
  cfg.data_dir = dir.string();
  al::ContainerState before;
  std::uintmax_t journal_size = 0;
  {
    al::Ledger ledger(cfg);
    expect(ledger.open().empty(), "fresh dir");
    fill(ledger, "fail/1", 3);
    before = ledger.state("fail/1");
    const fs::path journal = only_journal(dir);
    journal_size = fs::file_size(journal);

    // Cap file growth so the next journal line is cut short mid-write.
    struct rlimit saved {};
    expect(getrlimit(RLIMIT_FSIZE, &saved) == 0, "getrlimit");
    auto old_handler = std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit capped = saved;
    capped.rlim_cur = static_cast<rlim_t>(journal_size + 50);
    expect(setrlimit(RLIMIT_FSIZE, &capped) == 0, "setrlimit");
    const al::CommitResult r = append(ledger, "fail/1", note(100));
    expect(setrlimit(RLIMIT_FSIZE, &saved) == 0, "restore rlimit");
    std::signal(SIGXFSZ, old_handler);

    expect(!r.ok && r.rejection.code == al::ErrorCode::storage_failure,
           "short journal write fails the commit: " + r.rejection.to_json());
    expect(fs::file_size(journal) == journal_size, "partial line cut back");
    expect(same_state(ledger.state("fail/1"), before), "failed commit leaves no trace");
    expect(!ledger.quarantined("fail/1"), "rolled-back journal stays writable");
    expect(append(ledger, "fail/1", note(101)).ok, "next commit succeeds");
  }
  {
    al::Ledger ledger(cfg);
    const auto problems = ledger.open();
    expect(problems.empty(), "journal reloads cleanly after a rolled-back append");
    expect(ledger.state("fail/1").entry_count == 4 && ledger.verify_chain("fail/1").ok, "chain continues");
  }
  fs::remove_all(dir);
}

void test_durable_reopen() {
  const fs::path dir = make_temp_dir();
  al::LedgerConfig cfg;
  cfg.data_dir = dir.string();
  al::ContainerState saved;
  {
    al::Ledger ledger(cfg);
    expect(ledger.open().empty(), "fresh data dir opens cleanly");
    fill(ledger, "dur/1", 5);
    saved = ledger.state("dur/1");
  }
  {
    al::Ledger ledger(cfg);
    const auto problems = ledger.open();
    expect(problems.empty(), "reopen verifies every chain");
    expect(same_state(ledger.state("dur/1"), saved), "state survives reopen");
    expect(ledger.verify_chain("dur/1").ok, "reloaded chain verifies");
    const auto e = ledger.entry("dur/1", 2);
    expect(e && ledger.fetch_atom(e->atom_hash).ok, "atoms reload from the store");
    expect(append(ledger, "dur/1", note(5)).ok, "commits continue after reopen");
    expect(ledger.state("dur/1").sequence == 5, "sequence continues at 5");
  }
  fs::remove_all(dir);
}

void test_journal_tamper_quarantines() {
  const fs::path dir = make_temp_dir();
  al::LedgerConfig cfg;
  cfg.data_dir = dir.string();
  {
    al::Ledger ledger(cfg);
    fill(ledger, "tamper/1", 4);
    fill(ledger, "tamper/2", 2);
  }

  const fs::path journal = dir / "journal" / (al::blake3_hex("tamper/1") + ".ndjson");
  std::vector<std::string> lines;
  {
    std::ifstream in(journal);
    for (std::string line; std::getline(in, line);) lines.push_back(line);
  }
  expect(lines.size() == 4, "one journal line per entry");
  const std::string key = "\"committed_at\":";
  const size_t pos = lines[1].find(key) + key.size();
  lines[1][pos] = lines[1][pos] == '1' ? '2' : '1';
  {
    std::ofstream out(journal, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
  }

  {
    al::Ledger ledger(cfg);
    const auto problems = ledger.open();
    expect(problems.size() == 1, "exactly one corrupt container reported");
    expect(problems.front().find("sequence 1") != std::string::npos, "problem names the broken sequence");
    expect(ledger.quarantined("tamper/1"), "corrupt container quarantined");
    expect(!ledger.quarantined("tamper/2"), "healthy container unaffected");
    const auto r = append(ledger, "tamper/1", note(9));
    expect(!r.ok && r.rejection.code == al::ErrorCode::storage_failure, "quarantined container refuses commits");
    expect(append(ledger, "tamper/2", note(9)).ok, "healthy container accepts commits");
    const auto report = ledger.verify_chain("tamper/1");
    expect(!report.ok && report.first_broken_sequence == std::optional<uint64_t>(1), "verify_chain finds the break");
  }
  fs::remove_all(dir);
}

void test_torn_journal_tail() {
  const fs::path dir = make_temp_dir();
  al::LedgerConfig cfg;
  cfg.data_dir = dir.string();
  {
    al::Ledger ledger(cfg);
    fill(ledger, "torn/1", 3);
  }
  const fs::path journal = dir / "journal" / (al::blake3_hex("torn/1") + ".ndjson");
  {
    std::ofstream out(journal, std::ios::app);
    out << "{\"container_id\":\"torn/1\",\"seq";
  }
  {
    al::Ledger ledger(cfg);
    expect(ledger.open().empty(), "torn trailing record is discarded, not fatal");
    expect(ledger.state("torn/1").entry_count == 3, "complete records kept");
    expect(append(ledger, "torn/1", note(3)).ok, "append after torn tail");
  }
  {
    al::Ledger ledger(cfg);
    expect(ledger.open().empty(), "journal clean after recovery");
    expect(ledger.state("torn/1").entry_count == 4, "recovered append persisted");
  }
  fs::remove_all(dir);
}

void test_atom_store_integrity() {
  const fs::path dir = make_temp_dir();
  al::FsAtomStore store((dir / "atoms").string());
  const std::string canonical = al::jsonlite::canonicalize_json(note(1), nullptr);
  const std::string h = store.put(canonical);
  expect(h == al::atom_hash_of(canonical), "store key is the atom hash");
  expect(store.put(canonical) == h, "put is idempotent");
  expect(store.size() == 1, "dedup keeps one object");
  expect(store.get(h) == std::optional<std::string>(canonical), "get returns the bytes");

  {
    std::ofstream out(store.object_path(h), std::ios::binary | std::ios::trunc);
    out << "{\"type\":\"forged\"}";
  }
  expect(!store.get(h), "corrupted object is never returned");
  expect(!store.get("not-a-hash"), "malformed key rejected");

  al::MemoryAtomStore mem;
  expect(mem.put(canonical) == h && mem.contains(h) && mem.backend_id() == "memory", "memory backend");
  fs::remove_all(dir);
}

#if defined(ATOMLEDGER_WITH_ZSTD)
void test_atom_store_zstd() {
  const fs::path dir = make_temp_dir();
  al::FsAtomStore store((dir / "atoms").string(), "zstd");
  std::string text;
  for (int i = 0; i < 200; ++i) text += "repeated payload text ";
  const std::string canonical = al::jsonlite::canonicalize_json("{\"type\":\"note\",\"text\":\"" + text + "\"}", nullptr);
  const std::string h = store.put(canonical);
  const auto info = store.info(h);
  expect(info && info->encoding == "zstd", "atom stored compressed");
  expect(info->stored_size < info->original_size, "compression shrinks repetitive atoms");
  expect(store.get(h) == std::optional<std::string>(canonical), "compressed atom round-trips");
  fs::remove_all(dir);
}
#endif

// ============================================================================
// Phase 5: Projections
// ============================================================================

void commit_job_flow(al::Ledger& ledger, const std::string& cid) {
  const std::vector<std::string> atoms = {
      "{\"type\":\"job.created\",\"job_id\":\"j1\",\"title\":\"Ship\"}",
      "{\"type\":\"job.state_changed\",\"job_id\":\"j1\",\"from\":\"draft\",\"to\":\"proposed\"}",
      "{\"type\":\"job.state_changed\",\"job_id\":\"j1\",\"from\":\"proposed\",\"to\":\"approved\"}",
      "{\"type\":\"job.progress\",\"job_id\":\"j1\",\"percent\":40}",
      "{\"type\":\"approval.requested\",\"job_id\":\"j1\",\"card\":{\"card_id\":\"c1\"}}",
      "{\"type\":\"approval.decided\",\"card_id\":\"c1\",\"decision\":\"approve\"}",
      "{\"type\":\"message.sent\",\"message_id\":\"m1\",\"author\":\"ana\",\"text\":\"done soon\"}",
  };
  for (const auto& a : atoms) {
    const auto r = append(ledger, cid, a);
    expect(r.ok, "job flow commit: " + a + " " + r.rejection.to_json());
  }
}

void test_jobs_projection() {
  al::Ledger ledger;
  al::ProjectionEngine engine(ledger);
  auto jobs = std::make_shared<al::JobsProjection>();
  auto timeline = std::make_shared<al::TimelineProjection>();
  engine.add(jobs);
  engine.add(timeline);
  engine.start();

  commit_job_flow(ledger, "proj/1");
  engine.sync();

  const auto j = jobs->job("proj/1", "j1");
  expect(j.has_value(), "job projected");
  expect(j->state == "approved" && j->percent == 40, "job state and progress");
  expect(j->open_cards.empty() && j->decisions.at("c1") == "approve", "card decided");
  expect(jobs->jobs_in("proj/1").size() == 1 && jobs->jobs_in_state("approved").size() == 1, "job queries");
  expect(timeline->size("proj/1") == 7, "every typed atom on the timeline");

  const auto c = engine.consistency("jobs", "proj/1");
  expect(c.as_of_sequence == 6 && c.lag == 0, "consistency label after sync");
  engine.stop();
}

void test_projection_idempotence_and_gaps() {
  al::Ledger ledger;
  commit_job_flow(ledger, "proj/2");

  al::ProjectionEngine engine(ledger);
  auto jobs = std::make_shared<al::JobsProjection>();
  engine.add(jobs);
  expect(engine.consistency("jobs", "proj/2").lag == 7, "unapplied entries show as lag");

  // Entry 3 arrives first: gap, so the engine catches up from the ledger.
  engine.deliver(*ledger.entry("proj/2", 3));
  expect(engine.checkpoint("jobs", "proj/2").last_sequence == 6, "gap triggers catch-up to head");
  expect(jobs->job("proj/2", "j1")->state == "approved", "catch-up applied in sequence order");

  const uint64_t skipped_before = al::global_ledger_stats().projection_skipped.load();
  engine.deliver(*ledger.entry("proj/2", 0));
  engine.deliver(*ledger.entry("proj/2", 6));
  expect(al::global_ledger_stats().projection_skipped.load() >= skipped_before + 2, "duplicates skipped");
  expect(engine.checkpoint("jobs", "proj/2").last_hash == ledger.state("proj/2").head_hash,
         "checkpoint hash is the head hash");
}

void test_projection_rebuild() {
  al::Ledger ledger;
  al::ProjectionEngine engine(ledger);
  auto jobs = std::make_shared<al::JobsProjection>();
  auto timeline = std::make_shared<al::TimelineProjection>();
  engine.add(jobs);
  engine.add(timeline);
  engine.start();
  commit_job_flow(ledger, "proj/3");
  commit_job_flow(ledger, "proj/4");
  engine.sync();

  const auto before = jobs->jobs_in("proj/3");
  const auto page_before = timeline->page("proj/4", "", 100);
  engine.rebuild();
  const auto after = jobs->jobs_in("proj/3");
  const auto page_after = timeline->page("proj/4", "", 100);

  expect(before.size() == after.size() && after.size() == 1, "rebuild yields the same jobs");
  expect(before[0].state == after[0].state && before[0].updated_sequence == after[0].updated_sequence,
         "rebuild yields the same job state");
  expect(page_before->items.size() == page_after->items.size(), "rebuild yields the same timeline");
  expect(engine.checkpoint("timeline", "proj/4").last_sequence == 6, "rebuild replays to head");
  engine.stop();
}

void test_jobs_scoped_per_container() {
  al::Ledger ledger;
  al::ProjectionEngine engine(ledger);
  auto jobs = std::make_shared<al::JobsProjection>();
  engine.add(jobs);

  const std::vector<std::pair<std::string, std::string>> commits = {
      {"team/a", "{\"type\":\"job.created\",\"job_id\":\"j1\",\"title\":\"A\"}"},
      {"team/a", "{\"type\":\"job.state_changed\",\"job_id\":\"j1\",\"from\":\"draft\",\"to\":\"proposed\"}"},
      {"team/a", "{\"type\":\"approval.requested\",\"job_id\":\"j1\",\"card\":{\"card_id\":\"c1\"}}"},
      {"team/b", "{\"type\":\"job.created\",\"job_id\":\"j1\",\"title\":\"B\"}"},
      {"team/b", "{\"type\":\"approval.requested\",\"job_id\":\"j1\",\"card\":{\"card_id\":\"c1\"}}"},
      {"team/b", "{\"type\":\"approval.decided\",\"card_id\":\"c1\",\"decision\":\"reject\"}"},
  };
  for (const auto& [cid, atom] : commits) {
    const auto r = append(ledger, cid, atom);
    expect(r.ok, "commit in " + cid + ": " + r.rejection.to_json());
  }

  auto check = [&](const std::string& when) {
    const auto a = jobs->job("team/a", "j1");
    const auto b = jobs->job("team/b", "j1");
    expect(a && b, when + ": both jobs projected");
    expect(a->title == "A" && a->state == "proposed", when + ": team/a keeps its own state");
    expect(b->title == "B" && b->state == "draft", when + ": team/b is not overwritten");
    expect(a->open_cards.size() == 1 && a->decisions.empty(), when + ": team/a card still open");
    expect(b->open_cards.empty() && b->decisions.at("c1") == "reject", when + ": decision stays in team/b");
    expect(jobs->jobs_in("team/a").size() == 1 && jobs->jobs_in("team/b").size() == 1, when + ": one job each");
    expect(!jobs->job("team/c", "j1"), when + ": no job outside its container");
  };
  engine.sync();
  check("incremental");
  engine.rebuild();
  check("rebuilt");
}

void test_labeled_queries() {
  al::Ledger ledger;
  al::ProjectionEngine engine(ledger);
  auto jobs = std::make_shared<al::JobsProjection>();
  auto timeline = std::make_shared<al::TimelineProjection>();
  engine.add(jobs);
  engine.add(timeline);
  commit_job_flow(ledger, "proj/6");

  const auto stale = engine.query("jobs", "proj/6", [&] { return jobs->jobs_in("proj/6"); });
  expect(stale.value.empty(), "nothing applied yet");
  expect(stale.consistency.as_of_sequence == -1 && stale.consistency.lag == 7, "stale read carries its lag");

  engine.sync();
  const auto fresh = engine.query("jobs", "proj/6", [&] { return jobs->job("proj/6", "j1"); });
  expect(fresh.value && fresh.value->state == "approved", "synced read sees the job");
  expect(fresh.consistency.as_of_sequence == 6 && fresh.consistency.lag == 0, "synced read is current");

  expect(append(ledger, "proj/6", note(1)).ok, "one more commit");
  const auto behind = engine.query("jobs", "proj/6", [&] { return jobs->jobs_in_state("approved").size(); });
  expect(behind.value == 1 && behind.consistency.lag == 1, "unsynced commit shows as lag 1");

  engine.sync();
  const auto page = engine.query("timeline", "proj/6", [&] { return timeline->page("proj/6", "seq:5", 10); });
  expect(page.value && page.value->items.size() == 2, "timeline page read through the barrier");
  expect(page.consistency.as_of_sequence == 7 && page.consistency.lag == 0, "timeline page labeled at head");
}

void test_timeline_pagination() {
  al::Ledger ledger;
  al::ProjectionEngine engine(ledger);
  auto timeline = std::make_shared<al::TimelineProjection>();
  engine.add(timeline);
  for (int i = 0; i < 7; ++i) {
    const std::string atom = "{\"type\":\"message.sent\",\"message_id\":\"m" + std::to_string(i) +
                             "\",\"author\":\"ana\",\"text\":\"hello " + std::to_string(i) + "\"}";
    expect(append(ledger, "tl/1", atom).ok, "message commit");
  }
  engine.sync();

  const auto p1 = timeline->page("tl/1", "", 3);
  expect(p1 && p1->items.size() == 3 && p1->has_more && p1->next_cursor == "seq:2", "page 1");
  expect(p1->items[0].author == "ana" && p1->items[0].text == "hello 0", "item fields");
  const auto p2 = timeline->page("tl/1", p1->next_cursor, 3);
  expect(p2 && p2->items.size() == 3 && p2->items.front().sequence == 3 && p2->has_more, "page 2");
  const auto p3 = timeline->page("tl/1", p2->next_cursor, 3);
  expect(p3 && p3->items.size() == 1 && !p3->has_more && p3->next_cursor == "seq:6", "last page");
  expect(!timeline->page("tl/1", "page-2", 3), "malformed cursor");
}

void test_presence_projection() {
  al::Ledger ledger;
  ledger.set_clock([] { return uint64_t{1000000}; });
  al::ProjectionEngine engine(ledger);
  auto presence = std::make_shared<al::PresenceProjection>();
  engine.add(presence);
  expect(append(ledger, "pres/1", "{\"type\":\"presence.heartbeat\",\"entity_id\":\"ana\",\"entity_kind\":\"human\",\"status\":\"working\"}").ok,
         "human heartbeat");
  expect(append(ledger, "pres/1", "{\"type\":\"presence.heartbeat\",\"entity_id\":\"bot\",\"entity_kind\":\"agent\",\"status\":\"waiting_on_you\"}").ok,
         "agent heartbeat");
  engine.sync();

  const uint64_t t0 = 1000000;
  const uint64_t minute = 60 * 1000;
  expect(presence->presence("ana", t0 + minute)->status == al::PresenceStatus::working, "human fresh");
  expect(presence->presence("ana", t0 + 31 * minute)->status == al::PresenceStatus::offline, "human TTL 30 min");
  expect(presence->presence("bot", t0 + 4 * minute)->status == al::PresenceStatus::waiting_on_you, "agent fresh");
  expect(presence->presence("bot", t0 + 6 * minute)->status == al::PresenceStatus::offline, "agent TTL 5 min");
  expect(!presence->presence("nobody", t0), "unknown entity");
  expect(presence->all(t0).size() == 2, "all entities listed");
  expect(al::to_string(al::PresenceStatus::waiting_on_you) == "waiting_on_you", "status names");
}

// ============================================================================
// Phase 6: Stream / tail
// ============================================================================

std::vector<uint64_t> drain_entries(al::Subscription& sub, size_t count) {
  std::vector<uint64_t> seqs;
  while (seqs.size() < count) {
    const auto f = sub.next(std::chrono::milliseconds(2000));
    expect(f.has_value(), "frame within timeout");
    if (f->kind == al::FrameKind::keepalive) continue;
    expect(f->kind == al::FrameKind::entry, "entry frame expected, got " + al::to_string(f->kind));
    seqs.push_back(f->entry->sequence);
  }
  return seqs;
}

void test_scenario_replay_within_bound() {
  al::Ledger ledger;
  al::TailService tail(ledger);
  fill(ledger, "S", 251);

  auto sub = tail.subscribe("S", std::string("seq:100"));
  expect(sub.ok, "subscribe at cursor 100");
  const auto seqs = drain_entries(*sub.subscription, 150);
  for (size_t i = 0; i < seqs.size(); ++i) {
    expect(seqs[i] == 101 + i, "replay in order without gaps at " + std::to_string(i));
  }
  expect(sub.subscription->cursor() == "seq:250", "cursor advanced to head");

  expect(append(ledger, "S", note(251)).ok, "live commit");
  const auto live = drain_entries(*sub.subscription, 1);
  expect(live[0] == 251, "live entry follows replay");
}

void test_scenario_resync_outside_bound() {
  al::LedgerConfig cfg;
  cfg.replay_bound = 100;
  al::Ledger ledger(cfg);
  al::TailService tail(ledger);
  fill(ledger, "S", 251);

  const uint64_t resyncs_before = al::global_ledger_stats().stream_resyncs.load();
  auto sub = tail.subscribe("S", std::string("seq:100"));
  expect(sub.ok, "subscribe outside the bound still opens");
  const auto f = sub.subscription->next(std::chrono::milliseconds(1000));
  expect(f && f->kind == al::FrameKind::resync, "resync frame instead of partial replay");
  const auto closed = sub.subscription->next(std::chrono::milliseconds(10));
  expect(closed && closed->kind == al::FrameKind::closed, "subscription closes after resync");
  expect(al::global_ledger_stats().stream_resyncs.load() == resyncs_before + 1, "resync counted");

  auto inside = tail.subscribe("S", std::string("seq:150"));
  const auto seqs = drain_entries(*inside.subscription, 100);
  expect(seqs.front() == 151 && seqs.back() == 250, "gap of exactly the bound replays");
}

void test_reconnect_no_duplicates() {
  al::Ledger ledger;
  al::TailService tail(ledger);
  fill(ledger, "R", 10);

  auto first = tail.subscribe("R", std::string("seq:-1"));
  expect(first.ok, "subscribe from genesis");
  const auto a = drain_entries(*first.subscription, 4);
  expect(a.front() == 0 && a.back() == 3, "first four entries");
  const std::string cursor = first.subscription->cursor();
  expect(cursor == "seq:3", "cursor is the last sequence seen");
  first.subscription->cancel();

  for (int i = 10; i < 13; ++i) expect(append(ledger, "R", note(i)).ok, "commit while disconnected");

  auto second = tail.subscribe("R", cursor);
  const auto b = drain_entries(*second.subscription, 9);
  for (size_t i = 0; i < b.size(); ++i) expect(b[i] == 4 + i, "resume strictly after cursor");
  expect(!second.subscription->next(std::chrono::milliseconds(50)), "no duplicates after catch-up");
}

void test_subscribe_cursor_errors() {
  al::Ledger ledger;
  al::TailService tail(ledger);
  fill(ledger, "C", 5);
  const auto beyond = tail.subscribe("C", std::string("seq:5"));
  expect(!beyond.ok && beyond.rejection.code == al::ErrorCode::not_found, "cursor beyond head is not_found");
  const auto bad = tail.subscribe("C", std::string("five"));
  expect(!bad.ok && bad.rejection.code == al::ErrorCode::not_found, "malformed cursor is not_found");
  expect(tail.subscribe("C", std::string("seq:4")).ok, "cursor at head is valid");
  expect(tail.subscribe("empty", std::string("seq:-1")).ok, "genesis cursor on an empty container");
}

void test_live_only_and_keepalive() {
  al::LedgerConfig cfg;
  cfg.keepalive_interval_ms = 30;
  al::Ledger ledger(cfg);
  al::TailService tail(ledger);
  fill(ledger, "L", 5);

  auto sub = tail.subscribe("L", std::nullopt);
  expect(sub.ok && sub.subscription->cursor() == "seq:4", "live-only starts at head");
  const auto ka = sub.subscription->next(std::chrono::milliseconds(1000));
  expect(ka && ka->kind == al::FrameKind::keepalive, "idle subscriber gets a keepalive");

  expect(append(ledger, "L", note(5)).ok, "live commit");
  const auto live = drain_entries(*sub.subscription, 1);
  expect(live[0] == 5, "live-only skips history");

  const auto json = al::frame_to_json(*ka);
  expect(json.find("\"type\":\"keepalive\"") != std::string::npos, "frame JSON carries the type");
}

void test_cancel_from_other_thread() {
  al::Ledger ledger;
  al::TailService tail(ledger);
  auto sub = tail.subscribe("K", std::nullopt);
  expect(sub.ok, "subscribe");

  std::optional<al::StreamFrame> got;
  const auto start = std::chrono::steady_clock::now();
  std::thread reader([&] { got = sub.subscription->next(std::chrono::milliseconds(5000)); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  sub.subscription->cancel();
  reader.join();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  expect(got && got->kind == al::FrameKind::closed, "cancel wakes the reader with closed");
  expect(elapsed < std::chrono::milliseconds(2000), "cancel does not wait for the timeout");
  expect(sub.subscription->closed(), "subscription reports closed");
  expect(tail.active_subscriptions() == 0, "cancelled subscription no longer active");
}

void test_lagging_live_subscriber_resyncs() {
  al::LedgerConfig cfg;
  cfg.replay_bound = 5;
  al::Ledger ledger(cfg);
  al::TailService tail(ledger);
  auto sub = tail.subscribe("lag", std::nullopt);
  for (int i = 0; i < 10; ++i) expect(append(ledger, "lag", note(i)).ok, "commit while subscriber idles");
  const auto f = sub.subscription->next(std::chrono::milliseconds(1000));
  expect(f && f->kind == al::FrameKind::resync, "subscriber behind by more than the bound gets resync");
}

// ============================================================================
// Phase 7: Permits
// ============================================================================

al::PermitRequest permit_request(al::RiskLevel risk) {
  al::PermitRequest r;
  r.tenant_id = "acme";
  r.actor_id = "agent-7";
  r.intent = "deploy";
  r.job_type = "release";
  r.target = "svc-api";
  al::jsonlite::Object params;
  params["version"] = "2.1.0";
  params["replicas"] = 3;
  r.params = params;
  r.risk = risk;
  return r;
}

void test_permit_grant_and_redeem() {
  al::PolicyEngine policy;
  al::PermitIssuer issuer(al::keypair_from_seed(std::string(64, '9')), policy);
  const uint64_t now = 5000000;

  const auto d = issuer.request(permit_request(al::RiskLevel::L2), now);
  expect(d.allowed && d.permit, "L2 permit granted: " + d.reason);
  const al::Permit& p = *d.permit;
  expect(p.aud == "runner:svc-api", "audience names the target");
  expect(p.exp_ms - p.iat_ms == 2 * 60 * 1000, "L2 TTL is 2 minutes");
  expect(p.scopes.subject_hash == al::subject_hash_of(permit_request(al::RiskLevel::L2).params), "subject bound");
  expect(p.scopes.policy_hash == policy.policy_hash(), "policy hash recorded");
  expect(al::verify_detached(al::permit_signing_payload(p), p.sig, issuer.public_key()), "permit signed by issuer");

  const auto params = permit_request(al::RiskLevel::L2).params;
  expect(!issuer.redeem(p, params, now + 1000), "first redemption accepted");
  const auto again = issuer.redeem(p, params, now + 2000);
  expect(again && again->policy == al::PolicyViolationKind::permit, "permit is single use");

  expect(issuer.request(permit_request(al::RiskLevel::L3), now).permit->exp_ms == now + 5 * 60 * 1000, "L3 TTL");

  expect(p.scopes.intent == "deploy", "intent scoped");
  expect(p.to_json().find("\"intent\":\"deploy\"") != std::string::npos, "intent in the permit JSON");
  al::Permit widened = p;
  widened.scopes.intent = "delete";
  const auto swapped = issuer.redeem(widened, params, now + 3000);
  expect(swapped && swapped->detail == "permit signature does not verify", "intent is covered by the signature");
  al::PermitRequest no_intent = permit_request(al::RiskLevel::L1);
  no_intent.intent.clear();
  expect(!issuer.request(no_intent, now).allowed, "intent is required");
}

void test_permit_expiry_pruning() {
  al::PolicyEngine policy;
  al::PermitIssuer issuer(al::keypair_from_seed(std::string(64, '9')), policy);
  const auto params = permit_request(al::RiskLevel::L1).params;

  std::vector<al::Permit> early;
  for (int i = 0; i < 20; ++i) early.push_back(*issuer.request(permit_request(al::RiskLevel::L1), 0).permit);
  expect(!issuer.redeem(early[0], params, 10), "redeemed before expiry");
  expect(issuer.issued_count() == 20, "all live permits tracked");

  const uint64_t later = early[0].exp_ms + 1;
  const al::Permit fresh = *issuer.request(permit_request(al::RiskLevel::L3), later).permit;
  expect(issuer.issued_count() == 1, "expired permits dropped on the next request");

  const auto old = issuer.redeem(early[1], params, later);
  expect(old && old->code == al::ErrorCode::not_found, "dropped permit reports not_found");
  const auto replay = issuer.redeem(early[0], params, later);
  expect(replay && !replay->retryable(), "dropped redeemed permit stays refused");
  expect(!issuer.redeem(fresh, params, later + 1), "live permit still redeems");
}

void test_permit_high_risk_requirements() {
  al::PolicyEngine policy;
  al::PermitIssuer issuer(al::keypair_from_seed(std::string(64, '9')), policy);
  al::PermitRequest r = permit_request(al::RiskLevel::L4);
  expect(!issuer.request(r, 0).allowed, "L4 without step-up denied");
  r.step_up_assertion = "webauthn:assert:abc";
  expect(!issuer.request(r, 0).allowed, "L4 without approval denied");
  r.approval_ref = "card:c1";
  const auto d = issuer.request(r, 0);
  expect(d.allowed && d.permit->exp_ms == 3 * 60 * 1000, "L4 with step-up and approval granted for 3 minutes");
  expect(d.permit->scopes.approval_ref == "card:c1", "approval reference carried in scopes");

  al::PermitRequest missing = permit_request(al::RiskLevel::L0);
  missing.target.clear();
  expect(!issuer.request(missing, 0).allowed, "target is required");

  policy.bind_container_tenant("svc-api", "globex");
  expect(!issuer.request(permit_request(al::RiskLevel::L1), 0).allowed, "target owned by another tenant");
}

void test_permit_binding_failures() {
  al::PolicyEngine policy;
  al::PermitIssuer issuer(al::keypair_from_seed(std::string(64, '9')), policy);
  const auto params = permit_request(al::RiskLevel::L1).params;

  const al::Permit p1 = *issuer.request(permit_request(al::RiskLevel::L1), 0).permit;
  al::jsonlite::Object other;
  other["version"] = "9.9.9";
  const auto wrong_payload = issuer.redeem(p1, other, 1);
  expect(wrong_payload && wrong_payload->policy == al::PolicyViolationKind::permit, "payload swap refused");

  const auto expired = issuer.redeem(p1, params, p1.exp_ms + 1);
  expect(expired && expired->detail == "permit expired", "expired permit refused");

  al::Permit tampered = p1;
  tampered.exp_ms += 60 * 60 * 1000;
  const auto forged = issuer.redeem(tampered, params, 1);
  expect(forged && forged->policy == al::PolicyViolationKind::permit, "tampered permit fails signature");

  al::Permit unknown = p1;
  unknown.jti = "0000";
  const auto nf = issuer.redeem(unknown, params, 1);
  expect(nf && nf->code == al::ErrorCode::not_found, "unknown jti is not_found");

  const al::Permit p2 = *issuer.request(permit_request(al::RiskLevel::L1), 0).permit;
  policy.add_rule({al::RuleKind::sensitive_data, "extra/", {}});
  const auto changed = issuer.redeem(p2, params, 1);
  expect(changed && changed->detail.find("policy changed") != std::string::npos, "policy change invalidates permits");
  expect(issuer.issued_count() == 2, "issued permits tracked");
}

// ============================================================================
// Phase 8: Events, config, versions
// ============================================================================

std::mutex g_capture_mu;
std::vector<al::LedgerEvent> g_captured;

void capture_event(const al::LedgerEvent& ev) {
  std::lock_guard<std::mutex> lk(g_capture_mu);
  g_captured.push_back(ev);
}

void test_commit_events_and_stats() {
  auto& stats = al::global_ledger_stats();
  const uint64_t accepted_before = stats.commits_accepted.load();
  const uint64_t rejected_before = stats.commits_rejected.load();
  const auto breakdown_before = stats.rejection_breakdown();
  const uint64_t illegal_before =
      breakdown_before.count("policy_violation/illegal_transition") ? breakdown_before.at("policy_violation/illegal_transition") : 0;

  {
    std::lock_guard<std::mutex> lk(g_capture_mu);
    g_captured.clear();
  }
  al::set_ledger_event_hook(capture_event);
  {
    al::Ledger ledger;
    expect(append(ledger, "ev/1", "{\"type\":\"job.created\",\"job_id\":\"j\",\"title\":\"t\"}").ok,
           "commit");
    expect(!append(ledger, "ev/1", "{\"type\":\"job.state_changed\",\"job_id\":\"j\",\"from\":\"draft\",\"to\":\"approved\"}").ok,
           "rejected commit");
  }
  al::set_ledger_event_hook(nullptr);

  {
    std::lock_guard<std::mutex> lk(g_capture_mu);
    expect(g_captured.size() == 2, "one event per commit attempt");
    expect(g_captured[0].kind == "commit" && g_captured[0].ok, "accepted event");
    expect(g_captured[1].error_code == "policy_violation" && g_captured[1].policy == "illegal_transition",
           "rejected event carries code and policy");
    expect(g_captured[1].to_json().find("\"ok\":false") != std::string::npos, "event JSON");
  }
  expect(stats.commits_accepted.load() == accepted_before + 1, "accepted counter");
  expect(stats.commits_rejected.load() == rejected_before + 1, "rejected counter");
  expect(stats.rejection_breakdown().at("policy_violation/illegal_transition") == illegal_before + 1,
         "rejection breakdown by code and policy");
  expect(stats.commit_latency.count() > 0, "latency recorded");
  expect(stats.to_json().find("\"commits\"") != std::string::npos, "stats JSON");
  expect(!stats.recent_events_snapshot().empty(), "recent events ring");
}

void test_config_from_env() {
  setenv("ATOMLEDGER_REPLAY_BOUND", "42", 1);
  setenv("ATOMLEDGER_LOCK_TIMEOUT_MS", "abc", 1);
  setenv("ATOMLEDGER_ATOM_COMPRESSION", "zstd", 1);
  const al::LedgerConfig c = al::config_from_env();
  unsetenv("ATOMLEDGER_REPLAY_BOUND");
  unsetenv("ATOMLEDGER_LOCK_TIMEOUT_MS");
  unsetenv("ATOMLEDGER_ATOM_COMPRESSION");

  expect(c.replay_bound == 42, "replay bound from env");
  expect(c.lock_timeout_ms == 250, "unparseable value keeps the default");
  expect(c.atom_compression == "zstd", "compression from env");
  expect(c.keepalive_interval_ms == 15000, "keepalive default");
  expect(c.validate().empty(), "env config valid");

  al::LedgerConfig bad;
  bad.replay_bound = 0;
  bad.atom_compression = "lz4";
  expect(bad.validate().size() == 2, "validate reports each bad field");
  bool threw = false;
  try {
    al::Ledger ledger(bad);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect(threw, "ledger refuses an invalid config");
}

void test_version_manifest_and_errors() {
  const auto m = al::version::current_manifest();
  expect(m.link == 1 && m.hash_primitive == "blake3" && m.signature_primitive == "ed25519", "manifest");
  const std::string json = al::version::manifest_to_json(m);
  expect(json.find("\"blake3\"") != std::string::npos && json.find("\"ed25519\"") != std::string::npos,
         "manifest JSON");

  expect(al::reject(al::ErrorCode::sequence_conflict, "x").retryable(), "sequence_conflict retryable");
  expect(!al::reject(al::ErrorCode::causality_mismatch, "x").retryable(), "causality_mismatch not retryable");
  const std::string rj = al::policy_reject(al::PolicyViolationKind::tenant_scope, "t").to_json();
  expect(rj.find("\"policy\":\"tenant_scope\"") != std::string::npos && rj.find("\"retryable\":false") != std::string::npos,
         "rejection JSON");
  expect(al::intent_from_string("entropy") == al::IntentClass::entropy && !al::intent_from_string("chaos"),
         "intent class names");
}

}  // namespace

int main() {
  std::cout << "=== atomledger Test Suite ===\n";

  std::cout << "\n[Phase 1] Canonicalizer\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("canonical form", test_canonical_form);
  run_test("canonical idempotence", test_canonical_idempotence);
  run_test("canonicalization rejections", test_canonical_rejections);
  run_test("unicode normalization", test_unicode_normalization);
  run_test("number precision", test_number_precision);

  std::cout << "\n[Phase 2] Signatures and entry hashing\n";
  run_test("Ed25519 sign/verify", test_ed25519_sign_verify);
  run_test("signing payload fields", test_signing_payload_fields);
  run_test("entry hash recompute", test_entry_hash_recompute);

  std::cout << "\n[Phase 3] Membrane and policy\n";
  run_test("accept next sequence", test_scenario_accept_next_sequence);
  run_test("stale previous hash", test_scenario_stale_previous_hash);
  run_test("signature missing physics_delta", test_scenario_signature_missing_delta);
  run_test("illegal job transition", test_scenario_illegal_job_transition);
  run_test("invalid drafts", test_invalid_drafts);
  run_test("sensitive data rule", test_sensitive_data_rule);
  run_test("schema rule", test_schema_rule);
  run_test("card provenance rule", test_card_provenance_rule);
  run_test("tool pairing rule", test_tool_pairing_rule);
  run_test("tenant scope rule", test_tenant_scope_rule);
  run_test("scoped rules and policy hash", test_scoped_rules_and_policy_hash);
  run_test("physics rules", test_physics_rules);
  run_test("pact validation", test_pact_validation);

  std::cout << "\n[Phase 4] Append engine\n";
  run_test("chain linkage (50)", test_chain_linkage);
  run_test("concurrent commits single winner (20x8)", test_concurrent_commits_single_winner);
  run_test("cross-container parallelism", test_cross_container_parallelism);
  run_test("lock timeout is a conflict", test_lock_timeout_is_conflict);
  run_test("head moved under lock", test_head_moved_under_lock);
  run_test("rejected drafts allocate nothing", test_rejected_drafts_allocate_nothing);
  run_test("state, fetch and pagination", test_state_fetch_and_pagination);
  run_test("durable reopen", test_durable_reopen);
  run_test("journal tamper quarantines", test_journal_tamper_quarantines);
  run_test("torn journal tail", test_torn_journal_tail);
  run_test("journal append failure rolls back", test_journal_append_failure_rolls_back);
  run_test("atom store integrity", test_atom_store_integrity);
#if defined(ATOMLEDGER_WITH_ZSTD)
  run_test("atom store zstd", test_atom_store_zstd);
#endif

  std::cout << "\n[Phase 5] Projections\n";
  run_test("jobs projection", test_jobs_projection);
  run_test("idempotence and gap catch-up", test_projection_idempotence_and_gaps);
  run_test("rebuild", test_projection_rebuild);
  run_test("jobs scoped per container", test_jobs_scoped_per_container);
  run_test("labeled queries", test_labeled_queries);
  run_test("timeline pagination", test_timeline_pagination);
  run_test("presence TTL", test_presence_projection);

  std::cout << "\n[Phase 6] Stream / tail\n";
  run_test("replay within bound", test_scenario_replay_within_bound);
  run_test("resync outside bound", test_scenario_resync_outside_bound);
  run_test("reconnect without duplicates", test_reconnect_no_duplicates);
  run_test("cursor errors", test_subscribe_cursor_errors);
  run_test("live-only and keepalive", test_live_only_and_keepalive);
  run_test("cancel from another thread", test_cancel_from_other_thread);
  run_test("lagging live subscriber resyncs", test_lagging_live_subscriber_resyncs);

  std::cout << "\n[Phase 7] Permits\n";
  run_test("grant and redeem", test_permit_grant_and_redeem);
  run_test("high-risk requirements", test_permit_high_risk_requirements);
  run_test("binding failures", test_permit_binding_failures);
  run_test("expiry pruning", test_permit_expiry_pruning);

  std::cout << "\n[Phase 8] Events, config, versions\n";
  run_test("commit events and stats", test_commit_events_and_stats);
  run_test("config from env", test_config_from_env);
  run_test("version manifest and errors", test_version_manifest_and_errors);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
