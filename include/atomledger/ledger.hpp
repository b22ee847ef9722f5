#pragma once

// atomledger/ledger.hpp - Append engine: one hash chain per container.
//
// DESIGN INVARIANTS:
//   1. One ContainerSlot per container id. The slot's commit lock is the only
//      critical section in the system; different containers never share one.
//   2. commit() validates against a head snapshot without the lock, then takes
//      the commit lock with a bounded wait and re-checks the head. Timeout or
//      a moved head both return sequence_conflict (retryable).
//   3. Within a container: sequence(n) = sequence(n-1) + 1 starting at 0,
//      previous_hash(n) = entry_hash(n-1), previous_hash(0) = kGenesisHash.
//   4. entry_hash is always computed by the ledger, never taken from a caller.
//   5. A rejected commit leaves sequence, head hash, entry count and balance
//      unchanged. Nothing is published until the journal write has succeeded.
//   6. Entries are never updated or removed.
//
// DURABILITY (data_dir set):
//   <data_dir>/journal/<blake3(container_id)>.ndjson  one entry per line, no atom
//   <data_dir>/atoms/objects/AB/CD/<atom_hash>         canonical atom bytes
//   open() reloads every journal and re-verifies its chain. A container whose
//   journal fails verification is quarantined: reads still work, commits fail
//   with storage_failure.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "atomledger/atom_store.hpp"
#include "atomledger/config.hpp"
#include "atomledger/membrane.hpp"
#include "atomledger/notifier.hpp"
#include "atomledger/pact.hpp"
#include "atomledger/policy.hpp"
#include "atomledger/types.hpp"

namespace atomledger {

struct AtomResult {
  bool ok{false};
  std::string atom;  // canonical JSON
  Rejection rejection;
};

// Outcome of a chain verification pass over one container.
struct ChainReport {
  bool ok{true};
  uint64_t entries_checked{0};
  std::optional<uint64_t> first_broken_sequence;
  std::string detail;
};

class Ledger : public HistoryView {
 public:
  using Clock = std::function<uint64_t()>;  // unix milliseconds

  // Throws std::invalid_argument if config.validate() reports a problem.
  explicit Ledger(LedgerConfig config = {});
  ~Ledger() override;

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

  // Reloads journals from config.data_dir. Returns one message per problem;
  // empty means every container verified cleanly. No-op in memory mode.
  std::vector<std::string> open();

  CommitResult commit(const CommitRequest& req);

  // Unknown containers report an empty state (next sequence 0, genesis head).
  ContainerState state(const std::string& container_id) const;

  std::optional<LedgerEntry> entry(const std::string& container_id, uint64_t sequence) const;

  // Entries with sequence > after (after = -1 for "from the start"), oldest
  // first, at most limit of them.
  std::vector<LedgerEntry> entries_after(const std::string& container_id, int64_t after,
                                         std::size_t limit) const;

  AtomResult fetch_atom(const std::string& atom_hash) const;

  ChainReport verify_chain(const std::string& container_id) const;

  // Ids of every container with at least one entry, sorted.
  std::vector<std::string> containers() const;

  bool quarantined(const std::string& container_id) const;

  // Containers with allocated state, including ones loaded empty.
  std::size_t slot_count() const;

  void scan_newest_first(const std::string& container_id,
                         const std::function<bool(const LedgerEntry&)>& visit) const override;

  const LedgerConfig& config() const { return config_; }
  PolicyEngine& policy() { return policy_; }
  PactRegistry& pacts() { return pacts_; }
  CommitNotifier& notifier() { return notifier_; }
  IAtomStore& atom_store() { return *atoms_; }

  void set_clock(Clock clock);
  uint64_t now_ms() const;

 private:
  struct ContainerSlot {
    std::timed_mutex commit_mu;
    mutable std::shared_mutex data_mu;
    std::vector<LedgerEntry> entries;  // index == sequence
    int64_t physical_balance{0};
    std::atomic<bool> quarantined{false};
  };

  ContainerSlot* find_slot(const std::string& container_id) const;
  ContainerSlot& slot_for(const std::string& container_id);
  static ContainerState snapshot(const std::string& container_id, const ContainerSlot& slot);

  CommitResult do_commit(const CommitRequest& req);
  std::string journal_path(const std::string& container_id) const;
  bool append_journal(const LedgerEntry& e, ContainerSlot& slot);
  std::vector<std::string> load_journal(const std::string& path);

  LedgerConfig config_;
  std::unique_ptr<IAtomStore> atoms_;
  PolicyEngine policy_;
  PactRegistry pacts_;
  Membrane membrane_;

  mutable std::shared_mutex slots_mu_;
  std::map<std::string, std::unique_ptr<ContainerSlot>> slots_;

  mutable std::mutex clock_mu_;
  Clock clock_;

  // Last member: its dispatcher thread must stop before the slots go away.
  CommitNotifier notifier_;
};

// Checks sequence contiguity, hash links, recomputed entry hashes and atom
// hashes over an ordered run of entries.
ChainReport verify_entries(const std::vector<LedgerEntry>& entries);

}  // namespace atomledger
