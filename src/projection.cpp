#include "atomledger/projection.hpp"

#include <algorithm>
#include <limits>

#include "atomledger/ledger.hpp"
#include "atomledger/observability.hpp"

namespace atomledger {

namespace {

constexpr std::size_t kCatchUpBatch = 256;

jsonlite::Object atom_of(const LedgerEntry& e) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(e.atom, &err);
  return err ? jsonlite::Object{} : o;
}

void report_gap(const std::string& projection, const LedgerEntry& e, const Checkpoint& cp) {
  LedgerEvent ev;
  ev.kind = "projection";
  ev.container_id = e.container_id;
  ev.sequence = e.sequence;
  ev.ok = false;
  ev.detail = projection + ": entry does not follow checkpoint " + std::to_string(cp.last_sequence);
  emit_ledger_event(ev);
}

}  // namespace

// ---------------------------------------------------------------------------
// JobsProjection
// ---------------------------------------------------------------------------

bool JobsProjection::accepts(const LedgerEntry&, const jsonlite::Object& atom) const {
  const std::string type = jsonlite::get_string(atom, "type");
  return type == "job.created" || type == "job.state_changed" || type == "job.progress" ||
         type == "approval.requested" || type == "approval.decided";
}

void JobsProjection::apply(const LedgerEntry& e, const jsonlite::Object& atom) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  const std::string type = jsonlite::get_string(atom, "type");

  if (type == "approval.decided") {
    const std::string card_id = jsonlite::get_string(atom, "card_id");
    auto owner = card_to_job_.find({e.container_id, card_id});
    if (owner == card_to_job_.end()) return;
    auto it = jobs_.find({e.container_id, owner->second});
    if (it == jobs_.end()) return;
    auto& cards = it->second.open_cards;
    cards.erase(std::remove(cards.begin(), cards.end(), card_id), cards.end());
    it->second.decisions[card_id] = jsonlite::get_string(atom, "decision");
    it->second.updated_sequence = e.sequence;
    return;
  }

  const std::string job_id = jsonlite::get_string(atom, "job_id");
  if (type == "job.created") {
    JobView v;
    v.job_id = job_id;
    v.container_id = e.container_id;
    v.title = jsonlite::get_string(atom, "title");
    v.state = jsonlite::get_string(atom, "state", "draft");
    v.updated_sequence = e.sequence;
    jobs_[{e.container_id, job_id}] = std::move(v);
    return;
  }

  auto it = jobs_.find({e.container_id, job_id});
  if (it == jobs_.end()) return;
  JobView& v = it->second;
  if (type == "job.state_changed") {
    v.state = jsonlite::get_string(atom, "to");
  } else if (type == "job.progress") {
    v.percent = jsonlite::get_i64(atom, "percent");
  } else if (type == "approval.requested") {
    if (const auto* card = jsonlite::get_object(atom, "card")) {
      const std::string card_id = jsonlite::get_string(*card, "card_id");
      v.open_cards.push_back(card_id);
      card_to_job_[{e.container_id, card_id}] = job_id;
    }
  }
  v.updated_sequence = e.sequence;
}

void JobsProjection::reset() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  jobs_.clear();
  card_to_job_.clear();
}

std::optional<JobView> JobsProjection::job(const std::string& container_id, const std::string& job_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = jobs_.find({container_id, job_id});
  if (it == jobs_.end()) return std::nullopt;
  return it->second;
}

std::vector<JobView> JobsProjection::jobs_in(const std::string& container_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<JobView> out;
  for (auto it = jobs_.lower_bound({container_id, std::string()});
       it != jobs_.end() && it->first.first == container_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<JobView> JobsProjection::jobs_in_state(const std::string& state) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<JobView> out;
  for (const auto& [key, v] : jobs_) {
    if (v.state == state) out.push_back(v);
  }
  return out;
}

// ---------------------------------------------------------------------------
// TimelineProjection
// ---------------------------------------------------------------------------

bool TimelineProjection::accepts(const LedgerEntry&, const jsonlite::Object& atom) const {
  return !jsonlite::get_string(atom, "type").empty();
}

void TimelineProjection::apply(const LedgerEntry& e, const jsonlite::Object& atom) {
  TimelineItem item;
  item.sequence = e.sequence;
  item.type = jsonlite::get_string(atom, "type");
  item.author = jsonlite::get_string(atom, "author", e.author_pubkey);
  item.text = jsonlite::get_string(atom, "text");
  item.atom_hash = e.atom_hash;
  item.committed_at_ms = e.committed_at_ms;

  std::unique_lock<std::shared_mutex> lk(mu_);
  items_[e.container_id].push_back(std::move(item));
}

void TimelineProjection::reset() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  items_.clear();
}

std::optional<TimelinePage> TimelineProjection::page(const std::string& container_id, const std::string& cursor,
                                                     std::size_t limit) const {
  int64_t after = -1;
  if (!cursor.empty()) {
    auto parsed = parse_cursor(cursor);
    if (!parsed) return std::nullopt;
    after = *parsed;
  }

  TimelinePage out;
  out.next_cursor = format_cursor(after);
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = items_.find(container_id);
  if (it == items_.end()) return out;

  const auto& items = it->second;
  auto first = std::find_if(items.begin(), items.end(),
                            [&](const TimelineItem& i) { return static_cast<int64_t>(i.sequence) > after; });
  for (; first != items.end() && out.items.size() < limit; ++first) out.items.push_back(*first);
  out.has_more = first != items.end();
  if (!out.items.empty()) out.next_cursor = format_cursor(static_cast<int64_t>(out.items.back().sequence));
  return out;
}

std::size_t TimelineProjection::size(const std::string& container_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = items_.find(container_id);
  return it == items_.end() ? 0 : it->second.size();
}

// ---------------------------------------------------------------------------
// PresenceProjection
// ---------------------------------------------------------------------------

std::string to_string(PresenceStatus s) {
  switch (s) {
    case PresenceStatus::working: return "working";
    case PresenceStatus::waiting_on_you: return "waiting_on_you";
    case PresenceStatus::available: return "available";
    case PresenceStatus::offline: return "offline";
  }
  return "offline";
}

std::optional<PresenceStatus> presence_from_string(const std::string& s) {
  if (s == "working") return PresenceStatus::working;
  if (s == "waiting_on_you") return PresenceStatus::waiting_on_you;
  if (s == "available") return PresenceStatus::available;
  if (s == "offline") return PresenceStatus::offline;
  return std::nullopt;
}

bool PresenceProjection::accepts(const LedgerEntry&, const jsonlite::Object& atom) const {
  return jsonlite::get_string(atom, "type") == "presence.heartbeat";
}

void PresenceProjection::apply(const LedgerEntry& e, const jsonlite::Object& atom) {
  const auto status = presence_from_string(jsonlite::get_string(atom, "status"));
  if (!status) return;
  PresenceView v;
  v.entity_id = jsonlite::get_string(atom, "entity_id");
  v.entity_kind = jsonlite::get_string(atom, "entity_kind");
  v.status = *status;
  v.last_seen_ms = e.committed_at_ms;

  std::unique_lock<std::shared_mutex> lk(mu_);
  entities_[v.entity_id] = std::move(v);
}

void PresenceProjection::reset() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  entities_.clear();
}

PresenceView PresenceProjection::effective(PresenceView v, uint64_t now_ms) {
  const uint64_t ttl = v.entity_kind == "agent" ? kAgentTtlMs : kHumanTtlMs;
  if (now_ms > v.last_seen_ms + ttl) v.status = PresenceStatus::offline;
  return v;
}

std::optional<PresenceView> PresenceProjection::presence(const std::string& entity_id, uint64_t now_ms) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = entities_.find(entity_id);
  if (it == entities_.end()) return std::nullopt;
  return effective(it->second, now_ms);
}

std::vector<PresenceView> PresenceProjection::all(uint64_t now_ms) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<PresenceView> out;
  out.reserve(entities_.size());
  for (const auto& [id, v] : entities_) out.push_back(effective(v, now_ms));
  return out;
}

// ---------------------------------------------------------------------------
// ProjectionEngine
// ---------------------------------------------------------------------------

ProjectionEngine::ProjectionEngine(Ledger& ledger) : ledger_(ledger) {}

ProjectionEngine::~ProjectionEngine() { stop(); }

void ProjectionEngine::add(std::shared_ptr<IProjection> projection) {
  std::lock_guard<std::mutex> lk(state_mu_);
  projections_.push_back(std::move(projection));
}

std::vector<std::shared_ptr<IProjection>> ProjectionEngine::projections_snapshot() const {
  std::lock_guard<std::mutex> lk(state_mu_);
  return projections_;
}

void ProjectionEngine::start() {
  if (worker_.joinable()) return;
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    stopping_ = false;
  }
  notifier_token_ = ledger_.notifier().subscribe([this](const CommitNotice& n) { on_commit(n); });
  worker_ = std::thread([this] { run(); });
}

void ProjectionEngine::stop() {
  if (!worker_.joinable()) return;
  ledger_.notifier().unsubscribe(notifier_token_);
  // A handler copied before unsubscribe may still be running.
  ledger_.notifier().drain();
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    stopping_ = true;
  }
  queue_cv_.notify_all();
  worker_.join();
}

void ProjectionEngine::on_commit(const CommitNotice& notice) {
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    dirty_.insert(notice.container_id);
  }
  queue_cv_.notify_one();
}

void ProjectionEngine::run() {
  std::unique_lock<std::mutex> lk(queue_mu_);
  for (;;) {
    queue_cv_.wait(lk, [&] { return stopping_ || !dirty_.empty(); });
    if (stopping_) return;
    std::set<std::string> batch;
    batch.swap(dirty_);
    lk.unlock();
    {
      std::lock_guard<std::mutex> apply_lk(apply_mu_);
      for (const auto& cid : batch) catch_up(cid);
    }
    lk.lock();
  }
}

bool ProjectionEngine::apply_one(IProjection& p, Checkpoint& cp, const LedgerEntry& e,
                                 const jsonlite::Object& atom) {
  auto& stats = global_ledger_stats();
  if (static_cast<int64_t>(e.sequence) <= cp.last_sequence) {
    stats.projection_skipped.fetch_add(1, std::memory_order_relaxed);
    return true;
  }
  if (static_cast<int64_t>(e.sequence) != cp.last_sequence + 1 || e.previous_hash != cp.last_hash) {
    return false;
  }
  if (p.accepts(e, atom)) {
    p.apply(e, atom);
    stats.projection_applied.fetch_add(1, std::memory_order_relaxed);
  }
  cp.last_sequence = static_cast<int64_t>(e.sequence);
  cp.last_hash = e.entry_hash;
  return true;
}

// Caller holds apply_mu_.
void ProjectionEngine::catch_up(const std::string& container_id) {
  const auto projections = projections_snapshot();
  if (projections.empty()) return;

  std::vector<Checkpoint> cps;
  int64_t from = std::numeric_limits<int64_t>::max();
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    for (const auto& p : projections) {
      cps.push_back(checkpoints_[{p->name(), container_id}]);
      from = std::min(from, cps.back().last_sequence);
    }
  }
  std::vector<bool> stalled(projections.size(), false);

  for (;;) {
    const auto batch = ledger_.entries_after(container_id, from, kCatchUpBatch);
    if (batch.empty()) break;
    for (const auto& e : batch) {
      const jsonlite::Object atom = atom_of(e);
      for (std::size_t i = 0; i < projections.size(); ++i) {
        if (stalled[i]) continue;
        if (!apply_one(*projections[i], cps[i], e, atom)) {
          stalled[i] = true;
          report_gap(projections[i]->name(), e, cps[i]);
        }
      }
      from = static_cast<int64_t>(e.sequence);
    }
    if (batch.size() < kCatchUpBatch) break;
  }

  std::lock_guard<std::mutex> lk(state_mu_);
  for (std::size_t i = 0; i < projections.size(); ++i) {
    checkpoints_[{projections[i]->name(), container_id}] = cps[i];
  }
}

void ProjectionEngine::deliver(const LedgerEntry& e) {
  std::lock_guard<std::mutex> apply_lk(apply_mu_);
  const auto projections = projections_snapshot();
  const jsonlite::Object atom = atom_of(e);
  bool gap = false;
  for (const auto& p : projections) {
    Checkpoint cp;
    {
      std::lock_guard<std::mutex> lk(state_mu_);
      cp = checkpoints_[{p->name(), e.container_id}];
    }
    if (!apply_one(*p, cp, e, atom)) {
      gap = true;
      continue;
    }
    std::lock_guard<std::mutex> lk(state_mu_);
    checkpoints_[{p->name(), e.container_id}] = cp;
  }
  if (gap) catch_up(e.container_id);
}

void ProjectionEngine::sync() {
  ledger_.notifier().drain();
  std::lock_guard<std::mutex> apply_lk(apply_mu_);
  for (const auto& cid : ledger_.containers()) catch_up(cid);
}

void ProjectionEngine::rebuild() {
  std::lock_guard<std::mutex> apply_lk(apply_mu_);
  for (const auto& p : projections_snapshot()) p->reset();
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    checkpoints_.clear();
  }
  for (const auto& cid : ledger_.containers()) catch_up(cid);
}

Checkpoint ProjectionEngine::checkpoint(const std::string& projection, const std::string& container_id) const {
  std::lock_guard<std::mutex> lk(state_mu_);
  auto it = checkpoints_.find({projection, container_id});
  return it == checkpoints_.end() ? Checkpoint{} : it->second;
}

Consistency ProjectionEngine::consistency(const std::string& projection, const std::string& container_id) const {
  Consistency c;
  c.as_of_sequence = checkpoint(projection, container_id).last_sequence;
  const uint64_t applied = static_cast<uint64_t>(c.as_of_sequence + 1);
  const uint64_t committed = ledger_.state(container_id).entry_count;
  c.lag = committed > applied ? committed - applied : 0;
  return c;
}

}  // namespace atomledger
