#include "atomledger/version.hpp"

#include <sstream>

namespace atomledger {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.library_semver = "0.3.0";
  m.hash_primitive = "blake3";
  m.signature_primitive = "ed25519";
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"link\":" << m.link
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"signature_scheme\":" << m.signature_scheme
    << ",\"journal_format\":" << m.journal_format
    << ",\"atom_store_format\":" << m.atom_store_format
    << ",\"stream_framing\":" << m.stream_framing
    << ",\"library_semver\":\"" << m.library_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"signature_primitive\":\"" << m.signature_primitive << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace atomledger
