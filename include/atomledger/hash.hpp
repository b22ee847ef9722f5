#pragma once

// atomledger/hash.hpp - BLAKE3 hash authority and domain separation tags.
//
// DESIGN INVARIANTS:
//   1. BLAKE3-256 is the sole hash primitive. No fallbacks.
//   2. Every digest that means something is computed with hash_domain() and
//      one of the tags below, so an atom hash can never collide with an entry
//      hash or a signing payload even over identical bytes.
//   3. Tags end in a version and '\n' so no tag is a prefix of another.
//      Changing any tag invalidates every stored digest of that kind; bump
//      version::HASH_ALGORITHM_VERSION together with the tag.

#include <string>
#include <string_view>

namespace atomledger {

namespace tags {
inline constexpr std::string_view kAtom = "atomledger:atom:v1\n";
inline constexpr std::string_view kEntry = "atomledger:entry:v1\n";
inline constexpr std::string_view kSign = "atomledger:sign:v1\n";
inline constexpr std::string_view kPact = "atomledger:pact:v1\n";
inline constexpr std::string_view kPermit = "atomledger:permit:v1\n";
inline constexpr std::string_view kSubject = "atomledger:subject:v1\n";
inline constexpr std::string_view kPolicy = "atomledger:policy:v1\n";
}  // namespace tags

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  unsigned digest_bytes{0};
};

HashRuntimeInfo hash_runtime_info();

// Plain BLAKE3 (no domain tag), 64-char lowercase hex. Used for integrity
// checks on stored blobs, never for identities.
std::string blake3_hex(std::string_view payload);

// Binary digest (32 bytes).
std::string hash_bytes_blake3(std::string_view payload);

// BLAKE3(domain || payload), 64-char lowercase hex.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Hex helpers shared with the signature layer.
std::string to_hex(std::string_view bytes);
// Returns "" when the input is not an even-length hex string.
std::string from_hex(std::string_view hex);

// True for exactly 64 lowercase hex characters.
bool is_digest_hex(std::string_view s);

}  // namespace atomledger
