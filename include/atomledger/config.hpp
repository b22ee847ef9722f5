#pragma once

// atomledger/config.hpp - Ledger configuration.
//
// Resolution order: explicit LedgerConfig fields set by the embedding process,
// then ATOMLEDGER_* environment variables via config_from_env(), then the
// defaults below. The replay bound, hash primitive and signature primitive are
// fixed per deployment; changing the replay bound changes which reconnecting
// subscribers get a resync frame, nothing else.
//
// Environment:
//   ATOMLEDGER_DATA_DIR          journal + atom store root ("" = in-memory)
//   ATOMLEDGER_LOCK_TIMEOUT_MS   commit lock wait before sequence_conflict
//   ATOMLEDGER_REPLAY_BOUND      max entries replayed to a reconnecting subscriber
//   ATOMLEDGER_KEEPALIVE_MS      idle interval before a keepalive frame
//   ATOMLEDGER_ATOM_COMPRESSION  "off" | "zstd"
//   ATOMLEDGER_EVENT_LOG         JSONL event sink (read by observability.cpp)

#include <cstdint>
#include <string>
#include <vector>

namespace atomledger {

struct LedgerConfig {
  std::string data_dir;
  uint64_t lock_timeout_ms{250};
  uint64_t replay_bound{1000};
  uint64_t keepalive_interval_ms{15000};
  std::string atom_compression{"off"};

  // Returns one message per invalid field; empty means valid.
  std::vector<std::string> validate() const;
  std::string to_json() const;
};

// Defaults overlaid with ATOMLEDGER_* environment variables. Unparseable
// numeric values keep the default and are reported on stderr.
LedgerConfig config_from_env();

}  // namespace atomledger
