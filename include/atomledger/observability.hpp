#pragma once

// atomledger/observability.hpp - Structured ledger events and process-wide stats.
//
// DESIGN:
//   LedgerEvent is the observable unit. Every commit attempt (accepted or
//   rejected), journal recovery, resync and projection failure emits one.
//   emit_ledger_event() always updates LedgerStats, then either calls the
//   registered hook or appends one JSON line to $ATOMLEDGER_EVENT_LOG.
//
//   Emission never blocks a commit on anything but a short append; it is
//   called after the container lock is released.
//
// EXTENSION_POINT: metrics_exporter
//   Register a hook with set_ledger_event_hook() to forward events to an
//   external collector. The hook replaces the JSONL sink; stats still update.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace atomledger {

struct LedgerEvent {
  std::string kind;  // "commit", "recovery", "resync", "projection"
  std::string container_id;
  uint64_t sequence{0};
  bool ok{false};
  std::string error_code;
  std::string policy;
  std::string detail;
  uint64_t duration_ns{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds; 0.0 with no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// LedgerStats - global aggregated statistics
// ---------------------------------------------------------------------------
class LedgerStats {
 public:
  void record(const LedgerEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> commits_accepted{0};
  alignas(64) std::atomic<uint64_t> commits_rejected{0};
  alignas(64) std::atomic<uint64_t> sequence_conflicts{0};
  alignas(64) std::atomic<uint64_t> lock_timeouts{0};

  alignas(64) std::atomic<uint64_t> projection_applied{0};
  alignas(64) std::atomic<uint64_t> projection_skipped{0};

  alignas(64) std::atomic<uint64_t> stream_entries{0};
  alignas(64) std::atomic<uint64_t> stream_keepalives{0};
  alignas(64) std::atomic<uint64_t> stream_resyncs{0};

  LatencyHistogram commit_latency;

  // Rejections broken down by "<code>" or "<code>/<policy>".
  std::map<std::string, uint64_t> rejection_breakdown() const;

  static constexpr size_t kMaxRecentEvents = 1000;
  std::vector<LedgerEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex breakdown_mu_;
  std::map<std::string, uint64_t> rejections_;

  mutable std::mutex ring_mu_;
  std::vector<LedgerEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

LedgerStats& global_ledger_stats();

void emit_ledger_event(const LedgerEvent& ev);

using LedgerEventHook = void (*)(const LedgerEvent&);
void set_ledger_event_hook(LedgerEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace atomledger
