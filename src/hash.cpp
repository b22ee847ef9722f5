#include "atomledger/hash.hpp"

// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for nibble
// encoding instead of snprintf("%02x"); digests are hex-encoded on every
// commit, signature check and atom lookup.

#include <array>
#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace atomledger {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

std::array<unsigned char, BLAKE3_OUT_LEN> digest_of(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  if (!domain.empty()) blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  info.digest_bytes = BLAKE3_OUT_LEN;
  return info;
}

std::string to_hex(std::string_view bytes) {
  std::string out;
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const auto b = static_cast<unsigned char>(bytes[i]);
    out[i * 2]     = kHexChars[b >> 4];
    out[i * 2 + 1] = kHexChars[b & 0x0f];
  }
  return out;
}

std::string from_hex(std::string_view hex) {
  if (hex.size() % 2 != 0) return {};
  std::string out;
  out.resize(hex.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return {};
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

bool is_digest_hex(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

std::string blake3_hex(std::string_view payload) {
  const auto out = digest_of({}, payload);
  return to_hex(std::string_view(reinterpret_cast<const char*>(out.data()), out.size()));
}

std::string hash_bytes_blake3(std::string_view payload) {
  const auto out = digest_of({}, payload);
  return std::string(reinterpret_cast<const char*>(out.data()), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  const auto out = digest_of(domain, payload);
  return to_hex(std::string_view(reinterpret_cast<const char*>(out.data()), out.size()));
}

}  // namespace atomledger
