#include "atomledger/notifier.hpp"

#include <vector>

namespace atomledger {

CommitNotifier::CommitNotifier() : dispatcher_([this] { run(); }) {}

CommitNotifier::~CommitNotifier() { stop(); }

uint64_t CommitNotifier::subscribe(Handler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t token = next_token_++;
  handlers_[token] = std::move(handler);
  return token;
}

void CommitNotifier::unsubscribe(uint64_t token) {
  std::lock_guard<std::mutex> lk(mu_);
  handlers_.erase(token);
}

void CommitNotifier::publish(CommitNotice notice) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) return;
    queue_.push_back(std::move(notice));
    ++published_;
  }
  cv_.notify_one();
}

void CommitNotifier::drain() {
  std::unique_lock<std::mutex> lk(mu_);
  const uint64_t target = published_;
  idle_cv_.wait(lk, [&] { return dispatched_ >= target || stopping_; });
}

void CommitNotifier::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
  if (dispatcher_.joinable()) dispatcher_.join();
}

void CommitNotifier::run() {
  std::unique_lock<std::mutex> lk(mu_);
  for (;;) {
    cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
    if (stopping_) return;

    CommitNotice notice = std::move(queue_.front());
    queue_.pop_front();
    // Handlers run unlocked so they may call back into the ledger.
    std::vector<Handler> handlers;
    handlers.reserve(handlers_.size());
    for (const auto& [token, h] : handlers_) handlers.push_back(h);
    lk.unlock();
    for (const auto& h : handlers) h(notice);
    lk.lock();

    ++dispatched_;
    idle_cv_.notify_all();
  }
}

}  // namespace atomledger
