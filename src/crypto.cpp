#include "atomledger/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

#include "atomledger/hash.hpp"

namespace atomledger {

void ensure_crypto_ready() {
  static std::once_flag once;
  static bool ok = false;
  std::call_once(once, [] { ok = sodium_init() >= 0; });
  if (!ok) throw std::runtime_error("libsodium initialization failed");
}

KeyPair generate_keypair() {
  ensure_crypto_ready();
  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  std::array<unsigned char, crypto_sign_SECRETKEYBYTES> secret_key{};
  crypto_sign_keypair(public_key.data(), secret_key.data());

  KeyPair kp;
  kp.public_key = to_hex(std::string_view(reinterpret_cast<const char*>(public_key.data()), public_key.size()));
  kp.secret_key = to_hex(std::string_view(reinterpret_cast<const char*>(secret_key.data()), secret_key.size()));
  sodium_memzero(secret_key.data(), secret_key.size());
  return kp;
}

KeyPair keypair_from_seed(std::string_view seed_hex) {
  ensure_crypto_ready();
  const std::string seed = from_hex(seed_hex);
  if (seed.size() != crypto_sign_SEEDBYTES) return {};

  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  std::array<unsigned char, crypto_sign_SECRETKEYBYTES> secret_key{};
  crypto_sign_seed_keypair(public_key.data(), secret_key.data(),
                           reinterpret_cast<const unsigned char*>(seed.data()));

  KeyPair kp;
  kp.public_key = to_hex(std::string_view(reinterpret_cast<const char*>(public_key.data()), public_key.size()));
  kp.secret_key = to_hex(std::string_view(reinterpret_cast<const char*>(secret_key.data()), secret_key.size()));
  sodium_memzero(secret_key.data(), secret_key.size());
  return kp;
}

std::string sign_detached(std::string_view payload, std::string_view secret_key_hex) {
  ensure_crypto_ready();
  std::string secret_key = from_hex(secret_key_hex);
  if (secret_key.size() != crypto_sign_SECRETKEYBYTES) return {};

  std::array<unsigned char, crypto_sign_BYTES> signature{};
  crypto_sign_detached(signature.data(), nullptr,
                       reinterpret_cast<const unsigned char*>(payload.data()),
                       static_cast<unsigned long long>(payload.size()),
                       reinterpret_cast<const unsigned char*>(secret_key.data()));
  sodium_memzero(secret_key.data(), secret_key.size());
  return to_hex(std::string_view(reinterpret_cast<const char*>(signature.data()), signature.size()));
}

bool verify_detached(std::string_view payload, std::string_view signature_hex,
                     std::string_view public_key_hex) {
  ensure_crypto_ready();
  const std::string sig_bytes = from_hex(signature_hex);
  const std::string public_key_bytes = from_hex(public_key_hex);
  if (sig_bytes.size() != crypto_sign_BYTES || public_key_bytes.size() != crypto_sign_PUBLICKEYBYTES) {
    return false;
  }
  return crypto_sign_verify_detached(
             reinterpret_cast<const unsigned char*>(sig_bytes.data()),
             reinterpret_cast<const unsigned char*>(payload.data()),
             static_cast<unsigned long long>(payload.size()),
             reinterpret_cast<const unsigned char*>(public_key_bytes.data())) == 0;
}

bool is_public_key_hex(std::string_view s) {
  return s.size() == crypto_sign_PUBLICKEYBYTES * 2 && from_hex(s).size() == crypto_sign_PUBLICKEYBYTES;
}

std::string random_hex(std::size_t bytes) {
  ensure_crypto_ready();
  std::string buf(bytes, '\0');
  randombytes_buf(buf.data(), buf.size());
  return to_hex(buf);
}

}  // namespace atomledger
