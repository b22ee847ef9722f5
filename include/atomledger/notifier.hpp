#pragma once

// atomledger/notifier.hpp - Commit notifications fanned out off the commit path.
//
// The ledger calls publish() after releasing the container lock. publish()
// only enqueues; a single dispatcher thread invokes the subscribed handlers in
// publish order. A slow handler delays other handlers, never a commit.
//
// A notification carries only {container_id, sequence}. Consumers read the
// entry itself from the ledger by cursor, so a dropped or coalesced
// notification can never lose data.

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace atomledger {

struct CommitNotice {
  std::string container_id;
  uint64_t sequence{0};
};

class CommitNotifier {
 public:
  using Handler = std::function<void(const CommitNotice&)>;

  CommitNotifier();
  ~CommitNotifier();

  CommitNotifier(const CommitNotifier&) = delete;
  CommitNotifier& operator=(const CommitNotifier&) = delete;

  // Returns a token for unsubscribe().
  uint64_t subscribe(Handler handler);
  void unsubscribe(uint64_t token);

  void publish(CommitNotice notice);

  // Blocks until every notice published so far has been dispatched.
  void drain();

  void stop();

 private:
  void run();

  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<CommitNotice> queue_;
  std::map<uint64_t, Handler> handlers_;
  uint64_t next_token_{1};
  uint64_t published_{0};
  uint64_t dispatched_{0};
  bool stopping_{false};
  std::thread dispatcher_;
};

}  // namespace atomledger
