#pragma once

// atomledger/projection.hpp - Rebuildable read models derived from the ledger.
//
// DESIGN INVARIANTS:
//   1. Projections are disposable. rebuild() resets every projection and
//      replays every container from sequence 0; the result equals the
//      incrementally maintained state.
//   2. Each (projection, container) pair has a checkpoint {last_sequence,
//      last_hash}. An entry at or below the checkpoint is skipped. An entry
//      whose previous_hash is not the checkpoint hash triggers a catch-up read
//      from the ledger, so application order always equals sequence order.
//   3. Projections are written only by the engine's apply path (one thread at
//      a time) and are read-only to everything else.
//   4. Reads are eventually consistent. query() returns a Labeled result
//      carrying {as_of_sequence, lag}; sync() gives read-your-writes.

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "atomledger/jsonlite.hpp"
#include "atomledger/notifier.hpp"
#include "atomledger/types.hpp"

namespace atomledger {

class Ledger;

class IProjection {
 public:
  virtual ~IProjection() = default;

  virtual std::string name() const = 0;
  virtual bool accepts(const LedgerEntry& e, const jsonlite::Object& atom) const = 0;
  virtual void apply(const LedgerEntry& e, const jsonlite::Object& atom) = 0;
  virtual void reset() = 0;
};

struct Checkpoint {
  int64_t last_sequence{-1};
  std::string last_hash{kGenesisHash};
};

struct Consistency {
  int64_t as_of_sequence{-1};  // last applied sequence; -1 = nothing applied
  uint64_t lag{0};             // committed entries not yet applied
};

// A query result with the consistency it was read at.
template <typename T>
struct Labeled {
  T value;
  Consistency consistency;
};

// ---------------------------------------------------------------------------
// Built-in projections
// ---------------------------------------------------------------------------

struct JobView {
  std::string job_id;
  std::string container_id;
  std::string title;
  std::string state;
  int64_t percent{0};
  std::vector<std::string> open_cards;
  std::map<std::string, std::string> decisions;  // card_id -> decision
  uint64_t updated_sequence{0};
};

// job.created, job.state_changed, job.progress, approval.requested, approval.decided.
class JobsProjection : public IProjection {
 public:
  std::string name() const override { return "jobs"; }
  bool accepts(const LedgerEntry& e, const jsonlite::Object& atom) const override;
  void apply(const LedgerEntry& e, const jsonlite::Object& atom) override;
  void reset() override;

  // Job ids are scoped to their container.
  std::optional<JobView> job(const std::string& container_id, const std::string& job_id) const;
  std::vector<JobView> jobs_in(const std::string& container_id) const;
  std::vector<JobView> jobs_in_state(const std::string& state) const;

 private:
  using Key = std::pair<std::string, std::string>;  // (container_id, id)

  mutable std::shared_mutex mu_;
  std::map<Key, JobView> jobs_;
  std::map<Key, std::string> card_to_job_;  // (container_id, card_id) -> job_id
};

struct TimelineItem {
  uint64_t sequence{0};
  std::string type;
  std::string author;  // atom "author" if present, else author_pubkey
  std::string text;
  std::string atom_hash;
  uint64_t committed_at_ms{0};
};

struct TimelinePage {
  std::vector<TimelineItem> items;
  std::string next_cursor;  // pass back to page() to continue
  bool has_more{false};
};

// Every typed atom, per container, in sequence order.
class TimelineProjection : public IProjection {
 public:
  std::string name() const override { return "timeline"; }
  bool accepts(const LedgerEntry& e, const jsonlite::Object& atom) const override;
  void apply(const LedgerEntry& e, const jsonlite::Object& atom) override;
  void reset() override;

  // Items strictly after cursor ("" = from the start), oldest first.
  // nullopt for a malformed cursor.
  std::optional<TimelinePage> page(const std::string& container_id, const std::string& cursor,
                                   std::size_t limit) const;
  std::size_t size(const std::string& container_id) const;

 private:
  mutable std::shared_mutex mu_;
  std::map<std::string, std::vector<TimelineItem>> items_;
};

enum class PresenceStatus { working, waiting_on_you, available, offline };

std::string to_string(PresenceStatus s);
std::optional<PresenceStatus> presence_from_string(const std::string& s);

struct PresenceView {
  std::string entity_id;
  std::string entity_kind;  // "human" | "agent"
  PresenceStatus status{PresenceStatus::offline};
  uint64_t last_seen_ms{0};
};

// presence.heartbeat atoms. A heartbeat older than the entity's TTL reads as
// offline: humans 30 minutes, agents 5 minutes.
class PresenceProjection : public IProjection {
 public:
  static constexpr uint64_t kHumanTtlMs = 30ull * 60 * 1000;
  static constexpr uint64_t kAgentTtlMs = 5ull * 60 * 1000;

  std::string name() const override { return "presence"; }
  bool accepts(const LedgerEntry& e, const jsonlite::Object& atom) const override;
  void apply(const LedgerEntry& e, const jsonlite::Object& atom) override;
  void reset() override;

  std::optional<PresenceView> presence(const std::string& entity_id, uint64_t now_ms) const;
  std::vector<PresenceView> all(uint64_t now_ms) const;

 private:
  static PresenceView effective(PresenceView v, uint64_t now_ms);

  mutable std::shared_mutex mu_;
  std::map<std::string, PresenceView> entities_;
};

// ---------------------------------------------------------------------------
// ProjectionEngine
// ---------------------------------------------------------------------------

class ProjectionEngine {
 public:
  explicit ProjectionEngine(Ledger& ledger);
  ~ProjectionEngine();

  ProjectionEngine(const ProjectionEngine&) = delete;
  ProjectionEngine& operator=(const ProjectionEngine&) = delete;

  // A projection added after entries exist is caught up on the next sync().
  void add(std::shared_ptr<IProjection> projection);

  // Subscribes to commit notifications and starts the worker thread.
  void start();
  void stop();

  // Applies everything committed so far before returning.
  void sync();

  void rebuild();

  // At-least-once delivery path: duplicates are skipped, gaps caught up.
  void deliver(const LedgerEntry& e);

  Checkpoint checkpoint(const std::string& projection, const std::string& container_id) const;
  Consistency consistency(const std::string& projection, const std::string& container_id) const;

  // Runs fn against the projections with no apply in progress and labels the
  // result with the (projection, container) consistency at that instant.
  template <typename Fn>
  auto query(const std::string& projection, const std::string& container_id, Fn&& fn)
      -> Labeled<std::invoke_result_t<Fn&>> {
    std::lock_guard<std::mutex> lk(apply_mu_);
    auto value = fn();
    return {std::move(value), consistency(projection, container_id)};
  }

 private:
  void on_commit(const CommitNotice& notice);
  void run();
  void catch_up(const std::string& container_id);
  // false on a gap: e does not link to the checkpoint.
  bool apply_one(IProjection& p, Checkpoint& cp, const LedgerEntry& e, const jsonlite::Object& atom);
  std::vector<std::shared_ptr<IProjection>> projections_snapshot() const;

  Ledger& ledger_;

  mutable std::mutex state_mu_;  // projections_ + checkpoints_
  std::vector<std::shared_ptr<IProjection>> projections_;
  std::map<std::pair<std::string, std::string>, Checkpoint> checkpoints_;

  std::mutex apply_mu_;  // one applier at a time

  std::mutex queue_mu_;
  std::condition_variable queue_cv_;
  std::set<std::string> dirty_;
  bool stopping_{false};
  uint64_t notifier_token_{0};
  std::thread worker_;
};

}  // namespace atomledger
