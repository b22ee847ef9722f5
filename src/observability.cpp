#include "atomledger/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "atomledger/jsonlite.hpp"

namespace atomledger {

namespace {

// bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

}  // namespace

std::string LedgerEvent::to_json() const {
  std::ostringstream o;
  o << "{\"kind\":\"" << kind << "\""
    << ",\"container_id\":\"" << jsonlite::escape(container_id) << "\""
    << ",\"sequence\":" << sequence
    << ",\"ok\":" << (ok ? "true" : "false")
    << ",\"error_code\":\"" << error_code << "\""
    << ",\"policy\":\"" << policy << "\""
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\""
    << ",\"duration_ns\":" << duration_ns << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of the bucket; bucket 0 covers [0,1)us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "{\"count\":%llu,\"mean_us\":%.2f,\"p50_us\":%.2f,\"p95_us\":%.2f,\"p99_us\":%.2f}",
                static_cast<unsigned long long>(count()), mean_us(), percentile(0.50),
                percentile(0.95), percentile(0.99));
  return buf;
}

// ---------------------------------------------------------------------------
// LedgerStats
// ---------------------------------------------------------------------------

void LedgerStats::record(const LedgerEvent& ev) {
  if (ev.kind == "commit") {
    if (ev.ok) {
      commits_accepted.fetch_add(1, std::memory_order_relaxed);
    } else {
      commits_rejected.fetch_add(1, std::memory_order_relaxed);
      if (ev.error_code == "sequence_conflict") sequence_conflicts.fetch_add(1, std::memory_order_relaxed);
      std::lock_guard<std::mutex> lk(breakdown_mu_);
      ++rejections_[ev.policy.empty() ? ev.error_code : ev.error_code + "/" + ev.policy];
    }
    commit_latency.record(ev.duration_ns);
  } else if (ev.kind == "resync") {
    stream_resyncs.fetch_add(1, std::memory_order_relaxed);
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::map<std::string, uint64_t> LedgerStats::rejection_breakdown() const {
  std::lock_guard<std::mutex> lk(breakdown_mu_);
  return rejections_;
}

std::vector<LedgerEvent> LedgerStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  // Oldest first.
  std::vector<LedgerEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string LedgerStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"commits\":{\"accepted\":";
  out += std::to_string(commits_accepted.load(std::memory_order_relaxed));
  out += ",\"rejected\":";
  out += std::to_string(commits_rejected.load(std::memory_order_relaxed));
  out += ",\"sequence_conflicts\":";
  out += std::to_string(sequence_conflicts.load(std::memory_order_relaxed));
  out += ",\"lock_timeouts\":";
  out += std::to_string(lock_timeouts.load(std::memory_order_relaxed));
  out += ",\"latency\":";
  out += commit_latency.to_json();
  out += "},\"rejections\":{";
  {
    std::lock_guard<std::mutex> lk(breakdown_mu_);
    bool first = true;
    for (const auto& [k, n] : rejections_) {
      if (!first) out += ',';
      first = false;
      out += "\"" + k + "\":" + std::to_string(n);
    }
  }
  out += "},\"projections\":{\"applied\":";
  out += std::to_string(projection_applied.load(std::memory_order_relaxed));
  out += ",\"skipped\":";
  out += std::to_string(projection_skipped.load(std::memory_order_relaxed));
  out += "},\"stream\":{\"entries\":";
  out += std::to_string(stream_entries.load(std::memory_order_relaxed));
  out += ",\"keepalives\":";
  out += std::to_string(stream_keepalives.load(std::memory_order_relaxed));
  out += ",\"resyncs\":";
  out += std::to_string(stream_resyncs.load(std::memory_order_relaxed));
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

LedgerStats& global_ledger_stats() {
  static LedgerStats inst;
  return inst;
}

namespace {
std::atomic<LedgerEventHook> g_event_hook{nullptr};
std::mutex g_event_log_mu;
}  // namespace

void set_ledger_event_hook(LedgerEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_ledger_event(const LedgerEvent& ev) {
  global_ledger_stats().record(ev);

  if (LedgerEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("ATOMLEDGER_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = ev.to_json() + "\n";
  std::lock_guard<std::mutex> lk(g_event_log_mu);
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace atomledger
