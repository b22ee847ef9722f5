#pragma once

// atomledger/stream.hpp - Tail subscriptions with cursor resumption.
//
// DESIGN:
//   A subscription is a cursor into one container's log, not a push queue.
//   Commit notifications only wake the subscriber; next() pulls entries from
//   the ledger strictly after the cursor. A slow or abandoned subscriber
//   therefore holds no ledger lock and never delays a commit.
//
// RESUMPTION (cursor = last sequence seen, "seq:<n>", "seq:-1" = nothing yet):
//   - no cursor              live only, starting after the current head
//   - cursor beyond head     not_found
//   - head - cursor > bound  one resync frame, then closed
//   - otherwise              replay entries after the cursor, then live
//   A live subscriber that falls more than the bound behind also gets resync.
//
// Frames: entry | keepalive (idle for keepalive_interval) | resync | closed.
// cancel() is safe from any thread at any time; the next next() returns closed.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "atomledger/notifier.hpp"
#include "atomledger/types.hpp"

namespace atomledger {

class Ledger;

enum class FrameKind { entry, keepalive, resync, closed };

std::string to_string(FrameKind k);

struct StreamFrame {
  FrameKind kind{FrameKind::keepalive};
  std::optional<LedgerEntry> entry;
  std::string cursor;  // resume cursor after this frame
  std::string detail;
};

// One JSON object per frame, tagged with version::STREAM_FRAMING_VERSION.
std::string frame_to_json(const StreamFrame& frame);

class Subscription {
 public:
  Subscription(Ledger& ledger, std::string container_id, int64_t last_seen, bool resync);

  // Next frame, or nullopt if nothing (not even a keepalive) is due before
  // timeout elapses.
  std::optional<StreamFrame> next(std::chrono::milliseconds timeout);

  void cancel();
  bool closed() const;

  const std::string& container_id() const { return container_id_; }
  std::string cursor() const;

  // Called by TailService on a commit to this container.
  void wake();

 private:
  StreamFrame resync_frame(const std::string& detail);

  Ledger& ledger_;
  const std::string container_id_;
  const uint64_t replay_bound_;
  const std::chrono::milliseconds keepalive_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  int64_t last_seen_;
  std::deque<LedgerEntry> buffer_;
  bool resync_pending_;
  bool woken_{false};
  bool cancelled_{false};
  bool closed_{false};
  std::chrono::steady_clock::time_point last_frame_;
};

struct SubscribeResult {
  bool ok{false};
  std::shared_ptr<Subscription> subscription;
  Rejection rejection;
};

class TailService {
 public:
  explicit TailService(Ledger& ledger);
  ~TailService();

  TailService(const TailService&) = delete;
  TailService& operator=(const TailService&) = delete;

  SubscribeResult subscribe(const std::string& container_id, const std::optional<std::string>& cursor);

  // Subscriptions still open (not cancelled, not closed, still referenced).
  std::size_t active_subscriptions() const;

 private:
  void on_commit(const CommitNotice& notice);

  Ledger& ledger_;
  mutable std::mutex mu_;
  std::multimap<std::string, std::weak_ptr<Subscription>> subscribers_;
  uint64_t notifier_token_{0};
};

}  // namespace atomledger
