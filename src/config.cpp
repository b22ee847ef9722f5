#include "atomledger/config.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <sstream>

#include "atomledger/jsonlite.hpp"

namespace atomledger {

namespace {

const char* env_or_null(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? e : nullptr;
}

void overlay_u64(const char* name, uint64_t& field) {
  const char* e = env_or_null(name);
  if (!e) return;
  const std::string s(e);
  uint64_t v = 0;
  const auto r = std::from_chars(s.data(), s.data() + s.size(), v);
  if (r.ec != std::errc{} || r.ptr != s.data() + s.size()) {
    std::cerr << "[config] ignoring " << name << "='" << s << "': not an unsigned integer\n";
    return;
  }
  field = v;
}

}  // namespace

std::vector<std::string> LedgerConfig::validate() const {
  std::vector<std::string> problems;
  if (lock_timeout_ms == 0) problems.push_back("lock_timeout_ms must be > 0");
  if (replay_bound == 0) problems.push_back("replay_bound must be > 0");
  if (keepalive_interval_ms == 0) problems.push_back("keepalive_interval_ms must be > 0");
  if (atom_compression != "off" && atom_compression != "zstd") {
    problems.push_back("atom_compression must be 'off' or 'zstd'");
  }
  return problems;
}

std::string LedgerConfig::to_json() const {
  std::ostringstream o;
  o << "{\"data_dir\":\"" << jsonlite::escape(data_dir) << "\""
    << ",\"lock_timeout_ms\":" << lock_timeout_ms
    << ",\"replay_bound\":" << replay_bound
    << ",\"keepalive_interval_ms\":" << keepalive_interval_ms
    << ",\"atom_compression\":\"" << atom_compression << "\"}";
  return o.str();
}

LedgerConfig config_from_env() {
  LedgerConfig c;
  if (const char* e = env_or_null("ATOMLEDGER_DATA_DIR")) c.data_dir = e;
  overlay_u64("ATOMLEDGER_LOCK_TIMEOUT_MS", c.lock_timeout_ms);
  overlay_u64("ATOMLEDGER_REPLAY_BOUND", c.replay_bound);
  overlay_u64("ATOMLEDGER_KEEPALIVE_MS", c.keepalive_interval_ms);
  if (const char* e = env_or_null("ATOMLEDGER_ATOM_COMPRESSION")) c.atom_compression = e;
  return c;
}

}  // namespace atomledger
