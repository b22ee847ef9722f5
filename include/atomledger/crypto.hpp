#pragma once

// atomledger/crypto.hpp - Ed25519 signatures (libsodium).
//
// Keys and signatures cross every API boundary hex-encoded:
//   public key  32 bytes -> 64 hex chars
//   secret key  64 bytes -> 128 hex chars (libsodium seed || public key form)
//   signature   64 bytes -> 128 hex chars
//
// verify_detached() never throws and returns false for any malformed input,
// so callers map a false return directly to signature_invalid.

#include <string>
#include <string_view>

namespace atomledger {

struct KeyPair {
  std::string public_key;  // hex
  std::string secret_key;  // hex
};

// Initializes libsodium once per process. Throws std::runtime_error if the
// library cannot be initialized; nothing in this file is usable after that.
void ensure_crypto_ready();

KeyPair generate_keypair();

// Deterministic key pair from a 32-byte seed given as 64 hex chars.
// Returns an empty KeyPair for a malformed seed.
KeyPair keypair_from_seed(std::string_view seed_hex);

// Returns "" if the secret key is malformed.
std::string sign_detached(std::string_view payload, std::string_view secret_key_hex);

bool verify_detached(std::string_view payload, std::string_view signature_hex,
                     std::string_view public_key_hex);

bool is_public_key_hex(std::string_view s);

// Random bytes from the libsodium CSPRNG, hex encoded.
std::string random_hex(std::size_t bytes);

}  // namespace atomledger
