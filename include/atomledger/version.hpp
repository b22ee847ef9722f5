#pragma once

// atomledger/version.hpp - Explicit version manifest for every persisted or signed format.
//
// PURPOSE:
//   Prevent silent format drift across the signing payload, entry hashing, the
//   journal and the atom store. Every component that reads or writes one of
//   these formats checks its constant here before processing data.
//
// INVARIANT:
//   All constants are compile-time. A change to any byte layout that feeds a
//   hash or a signature requires a bump of the matching constant and a new
//   domain tag in hash.hpp. Old tags are never reused.

#include <cstdint>
#include <string>

namespace atomledger {
namespace version {

// ---------------------------------------------------------------------------
// LINK_VERSION
// The only accepted Draft.version. Drafts carrying any other value are
// rejected with invalid_draft before causality is evaluated.
// ---------------------------------------------------------------------------
constexpr uint32_t LINK_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, lowercase hex (64 chars), domain-tag prefixed.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// SIGNATURE_SCHEME_VERSION
// Version 1 = Ed25519 detached signatures, hex encoded (128 chars), public
// keys hex encoded (64 chars).
// ---------------------------------------------------------------------------
constexpr uint32_t SIGNATURE_SCHEME_VERSION = 1;

// ---------------------------------------------------------------------------
// JOURNAL_FORMAT_VERSION
// Version 1 = one NDJSON file per container, one committed entry per line.
// ---------------------------------------------------------------------------
constexpr uint32_t JOURNAL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// ATOM_STORE_FORMAT_VERSION
// Version 1 = AB/CD/<atom_hash> sharding with a JSON .meta sidecar.
// ---------------------------------------------------------------------------
constexpr uint32_t ATOM_STORE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// STREAM_FRAMING_VERSION
// Version 1 = entry / keepalive / resync / closed frames.
// ---------------------------------------------------------------------------
constexpr uint32_t STREAM_FRAMING_VERSION = 1;

struct VersionManifest {
  uint32_t link{LINK_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t signature_scheme{SIGNATURE_SCHEME_VERSION};
  uint32_t journal_format{JOURNAL_FORMAT_VERSION};
  uint32_t atom_store_format{ATOM_STORE_FORMAT_VERSION};
  uint32_t stream_framing{STREAM_FRAMING_VERSION};
  std::string library_semver;   // e.g. "0.3.0"
  std::string hash_primitive;   // "blake3"
  std::string signature_primitive;  // "ed25519"
};

VersionManifest current_manifest();

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace atomledger
