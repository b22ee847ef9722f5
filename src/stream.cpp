#include "atomledger/stream.hpp"

#include <algorithm>

#include "atomledger/canonical.hpp"
#include "atomledger/jsonlite.hpp"
#include "atomledger/ledger.hpp"
#include "atomledger/observability.hpp"

namespace atomledger {

namespace {

constexpr std::size_t kReplayBatch = 256;

}  // namespace

std::string to_string(FrameKind k) {
  switch (k) {
    case FrameKind::entry: return "entry";
    case FrameKind::keepalive: return "keepalive";
    case FrameKind::resync: return "resync";
    case FrameKind::closed: return "closed";
  }
  return "closed";
}

std::string frame_to_json(const StreamFrame& frame) {
  std::string out = "{\"v\":" + std::to_string(version::STREAM_FRAMING_VERSION);
  out += ",\"type\":\"" + to_string(frame.kind) + "\"";
  out += ",\"cursor\":\"" + jsonlite::escape(frame.cursor) + "\"";
  if (frame.entry) out += ",\"entry\":" + entry_to_json(*frame.entry, true);
  if (!frame.detail.empty()) out += ",\"detail\":\"" + jsonlite::escape(frame.detail) + "\"";
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Subscription
// ---------------------------------------------------------------------------

Subscription::Subscription(Ledger& ledger, std::string container_id, int64_t last_seen, bool resync)
    : ledger_(ledger),
      container_id_(std::move(container_id)),
      replay_bound_(ledger.config().replay_bound),
      keepalive_(static_cast<int64_t>(ledger.config().keepalive_interval_ms)),
      last_seen_(last_seen),
      resync_pending_(resync),
      last_frame_(std::chrono::steady_clock::now()) {}

std::string Subscription::cursor() const {
  std::lock_guard<std::mutex> lk(mu_);
  return format_cursor(last_seen_);
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_ || cancelled_;
}

void Subscription::cancel() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void Subscription::wake() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    woken_ = true;
  }
  cv_.notify_all();
}

// Caller holds mu_.
StreamFrame Subscription::resync_frame(const std::string& detail) {
  resync_pending_ = false;
  closed_ = true;
  buffer_.clear();

  LedgerEvent ev;
  ev.kind = "resync";
  ev.container_id = container_id_;
  ev.sequence = static_cast<uint64_t>(last_seen_ + 1);
  ev.ok = true;
  ev.detail = detail;
  emit_ledger_event(ev);

  StreamFrame f;
  f.kind = FrameKind::resync;
  f.cursor = format_cursor(last_seen_);
  f.detail = detail;
  return f;
}

std::optional<StreamFrame> Subscription::next(std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;
  auto& stats = global_ledger_stats();

  std::unique_lock<std::mutex> lk(mu_);
  for (;;) {
    if (cancelled_) closed_ = true;
    if (closed_) {
      StreamFrame f;
      f.kind = FrameKind::closed;
      f.cursor = format_cursor(last_seen_);
      return f;
    }
    if (resync_pending_) {
      return resync_frame("cursor " + format_cursor(last_seen_) + " is outside the replay bound of " +
                          std::to_string(replay_bound_));
    }

    if (buffer_.empty()) {
      const ContainerState st = ledger_.state(container_id_);
      const int64_t head = static_cast<int64_t>(st.entry_count) - 1;
      if (head > last_seen_) {
        if (static_cast<uint64_t>(head - last_seen_) > replay_bound_) {
          return resync_frame("subscriber fell " + std::to_string(head - last_seen_) +
                              " entries behind, replay bound is " + std::to_string(replay_bound_));
        }
        auto batch = ledger_.entries_after(container_id_, last_seen_, kReplayBatch);
        buffer_.assign(std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
      }
    }

    if (!buffer_.empty()) {
      StreamFrame f;
      f.kind = FrameKind::entry;
      f.entry = std::move(buffer_.front());
      buffer_.pop_front();
      last_seen_ = static_cast<int64_t>(f.entry->sequence);
      f.cursor = format_cursor(last_seen_);
      last_frame_ = Clock::now();
      stats.stream_entries.fetch_add(1, std::memory_order_relaxed);
      return f;
    }

    const auto keepalive_at = last_frame_ + keepalive_;
    const auto now = Clock::now();
    if (now >= keepalive_at) {
      last_frame_ = now;
      stats.stream_keepalives.fetch_add(1, std::memory_order_relaxed);
      StreamFrame f;
      f.kind = FrameKind::keepalive;
      f.cursor = format_cursor(last_seen_);
      return f;
    }
    if (now >= deadline) return std::nullopt;

    woken_ = false;
    cv_.wait_until(lk, std::min(deadline, keepalive_at), [&] { return woken_ || cancelled_; });
  }
}

// ---------------------------------------------------------------------------
// TailService
// ---------------------------------------------------------------------------

TailService::TailService(Ledger& ledger) : ledger_(ledger) {
  notifier_token_ = ledger_.notifier().subscribe([this](const CommitNotice& n) { on_commit(n); });
}

TailService::~TailService() {
  ledger_.notifier().unsubscribe(notifier_token_);
  ledger_.notifier().drain();
}

SubscribeResult TailService::subscribe(const std::string& container_id,
                                       const std::optional<std::string>& cursor) {
  SubscribeResult out;
  const ContainerState st = ledger_.state(container_id);
  const int64_t head = static_cast<int64_t>(st.entry_count) - 1;

  int64_t last_seen = head;
  bool resync = false;
  if (cursor) {
    const auto parsed = parse_cursor(*cursor);
    if (!parsed) {
      out.rejection = reject(ErrorCode::not_found, "malformed cursor: " + *cursor);
      return out;
    }
    if (*parsed > head) {
      out.rejection = reject(ErrorCode::not_found, "cursor " + *cursor + " is beyond head " + format_cursor(head));
      return out;
    }
    last_seen = *parsed;
    resync = static_cast<uint64_t>(head - last_seen) > ledger_.config().replay_bound;
  }

  auto sub = std::make_shared<Subscription>(ledger_, container_id, last_seen, resync);
  {
    std::lock_guard<std::mutex> lk(mu_);
    subscribers_.emplace(container_id, sub);
  }
  out.ok = true;
  out.subscription = std::move(sub);
  return out;
}

void TailService::on_commit(const CommitNotice& notice) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto range = subscribers_.equal_range(notice.container_id);
    for (auto it = range.first; it != range.second;) {
      auto sub = it->second.lock();
      if (!sub || sub->closed()) {
        it = subscribers_.erase(it);
        continue;
      }
      targets.push_back(std::move(sub));
      ++it;
    }
  }
  for (const auto& sub : targets) sub->wake();
}

std::size_t TailService::active_subscriptions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(), [](const auto& kv) {
    auto sub = kv.second.lock();
    return sub && !sub->closed();
  }));
}

}  // namespace atomledger
