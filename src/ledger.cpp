#include "atomledger/ledger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "atomledger/canonical.hpp"
#include "atomledger/crypto.hpp"
#include "atomledger/hash.hpp"
#include "atomledger/observability.hpp"

namespace fs = std::filesystem;

namespace atomledger {

namespace {

uint64_t system_now_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

CommitResult failed(Rejection r) {
  CommitResult out;
  out.rejection = std::move(r);
  return out;
}

void report_recovery(const std::string& container_id, uint64_t sequence, bool ok, const std::string& detail) {
  if (!ok) std::cerr << "[ledger] " << container_id << ": " << detail << "\n";
  LedgerEvent ev;
  ev.kind = "recovery";
  ev.container_id = container_id;
  ev.sequence = sequence;
  ev.ok = ok;
  ev.error_code = ok ? "" : to_string(ErrorCode::storage_failure);
  ev.detail = detail;
  emit_ledger_event(ev);
}

}  // namespace

ChainReport verify_entries(const std::vector<LedgerEntry>& entries) {
  ChainReport report;
  std::string prev = kGenesisHash;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const LedgerEntry& e = entries[i];
    std::string problem;
    if (e.sequence != i) {
      problem = "sequence gap: expected " + std::to_string(i) + ", found " + std::to_string(e.sequence);
    } else if (e.previous_hash != prev) {
      problem = "previous_hash does not link to entry " + std::to_string(i == 0 ? 0 : i - 1);
    } else if (recompute_entry_hash(e) != e.entry_hash) {
      problem = "entry_hash does not match recomputed hash";
    } else if (atom_hash_of(e.atom) != e.atom_hash) {
      problem = "atom does not match atom_hash";
    }
    if (!problem.empty()) {
      report.ok = false;
      report.first_broken_sequence = static_cast<uint64_t>(i);
      report.detail = problem;
      return report;
    }
    prev = e.entry_hash;
    ++report.entries_checked;
  }
  return report;
}

// ---------------------------------------------------------------------------
// Construction / clock
// ---------------------------------------------------------------------------

Ledger::Ledger(LedgerConfig config)
    : config_(std::move(config)),
      atoms_(make_atom_store(config_.data_dir, config_.atom_compression)),
      membrane_(policy_, pacts_),
      clock_(system_now_ms) {
  const auto problems = config_.validate();
  if (!problems.empty()) throw std::invalid_argument("invalid ledger config: " + problems.front());
  ensure_crypto_ready();
}

Ledger::~Ledger() { notifier_.stop(); }

void Ledger::set_clock(Clock clock) {
  std::lock_guard<std::mutex> lk(clock_mu_);
  clock_ = std::move(clock);
}

// The clock runs outside clock_mu_ so a slow clock never serializes commits.
uint64_t Ledger::now_ms() const {
  Clock clock;
  {
    std::lock_guard<std::mutex> lk(clock_mu_);
    clock = clock_;
  }
  return clock();
}

// ---------------------------------------------------------------------------
// Slots
// ---------------------------------------------------------------------------

Ledger::ContainerSlot* Ledger::find_slot(const std::string& container_id) const {
  std::shared_lock<std::shared_mutex> lk(slots_mu_);
  auto it = slots_.find(container_id);
  return it == slots_.end() ? nullptr : it->second.get();
}

Ledger::ContainerSlot& Ledger::slot_for(const std::string& container_id) {
  if (ContainerSlot* s = find_slot(container_id)) return *s;
  std::unique_lock<std::shared_mutex> lk(slots_mu_);
  auto& slot = slots_[container_id];
  if (!slot) slot = std::make_unique<ContainerSlot>();
  return *slot;
}

ContainerState Ledger::snapshot(const std::string& container_id, const ContainerSlot& slot) {
  std::shared_lock<std::shared_mutex> lk(slot.data_mu);
  ContainerState st;
  st.container_id = container_id;
  st.entry_count = slot.entries.size();
  st.physical_balance = slot.physical_balance;
  if (!slot.entries.empty()) {
    st.empty = false;
    st.sequence = slot.entries.back().sequence;
    st.head_hash = slot.entries.back().entry_hash;
  }
  return st;
}

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

CommitResult Ledger::commit(const CommitRequest& req) {
  uint64_t duration_ns = 0;
  CommitResult result;
  {
    ScopeTimer timer(duration_ns);
    result = do_commit(req);
  }

  LedgerEvent ev;
  ev.kind = "commit";
  ev.container_id = req.draft.container_id;
  ev.sequence = result.ok ? result.sequence : req.draft.expected_sequence;
  ev.ok = result.ok;
  ev.duration_ns = duration_ns;
  if (!result.ok) {
    ev.error_code = to_string(result.rejection.code);
    if (result.rejection.policy != PolicyViolationKind::none) ev.policy = to_string(result.rejection.policy);
    ev.detail = result.rejection.detail;
  }
  emit_ledger_event(ev);

  if (result.ok) notifier_.publish({req.draft.container_id, result.sequence});
  return result;
}

CommitResult Ledger::do_commit(const CommitRequest& req) {
  const Draft& d = req.draft;

  Rejection canon_err;
  auto atom = canonicalize_atom(req.atom_json, &canon_err);
  if (!atom) return failed(std::move(canon_err));
  if (d.container_id.empty()) return failed(reject(ErrorCode::invalid_draft, "container_id is empty"));

  if (quarantined(d.container_id)) {
    return failed(reject(ErrorCode::storage_failure, "container is quarantined after a journal failure"));
  }

  // A rejected draft never allocates a slot.
  const ContainerState head = state(d.container_id);
  const uint64_t now = now_ms();
  if (auto r = membrane_.validate(req, *atom, head, *this, now)) return failed(std::move(*r));

  ContainerSlot& slot = slot_for(d.container_id);

  std::unique_lock<std::timed_mutex> commit_lk(slot.commit_mu, std::defer_lock);
  if (!commit_lk.try_lock_for(std::chrono::milliseconds(config_.lock_timeout_ms))) {
    global_ledger_stats().lock_timeouts.fetch_add(1, std::memory_order_relaxed);
    return failed(reject(ErrorCode::sequence_conflict, "timed out waiting for container lock"));
  }

  const ContainerState locked_head = snapshot(d.container_id, slot);
  if (locked_head.entry_count != head.entry_count || locked_head.head_hash != head.head_hash) {
    return failed(reject(ErrorCode::sequence_conflict, "another writer committed sequence " +
                                                           std::to_string(d.expected_sequence) + " first"));
  }

  LedgerEntry e;
  e.container_id = d.container_id;
  e.sequence = d.expected_sequence;
  e.previous_hash = d.previous_hash;
  e.atom_hash = atom->atom_hash;
  e.atom = atom->canonical;
  e.signature = req.signature;
  e.author_pubkey = d.author_pubkey;
  e.committed_at_ms = now_ms();
  e.intent_class = d.intent_class;
  e.physics_delta = d.physics_delta;
  e.entry_hash = recompute_entry_hash(e);

  if (atoms_->put(e.atom) != e.atom_hash) {
    return failed(reject(ErrorCode::storage_failure, "atom store rejected " + e.atom_hash));
  }
  if (!append_journal(e, slot)) {
    return failed(reject(ErrorCode::storage_failure, "journal append failed for " + d.container_id));
  }

  CommitResult result;
  result.ok = true;
  result.sequence = e.sequence;
  result.entry_hash = e.entry_hash;
  {
    std::unique_lock<std::shared_mutex> data_lk(slot.data_mu);
    slot.physical_balance += e.physics_delta;
    slot.entries.push_back(std::move(e));
  }
  return result;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

ContainerState Ledger::state(const std::string& container_id) const {
  if (const ContainerSlot* s = find_slot(container_id)) return snapshot(container_id, *s);
  ContainerState st;
  st.container_id = container_id;
  return st;
}

std::optional<LedgerEntry> Ledger::entry(const std::string& container_id, uint64_t sequence) const {
  const ContainerSlot* s = find_slot(container_id);
  if (!s) return std::nullopt;
  std::shared_lock<std::shared_mutex> lk(s->data_mu);
  if (sequence >= s->entries.size()) return std::nullopt;
  return s->entries[sequence];
}

std::vector<LedgerEntry> Ledger::entries_after(const std::string& container_id, int64_t after,
                                               std::size_t limit) const {
  std::vector<LedgerEntry> out;
  const ContainerSlot* s = find_slot(container_id);
  if (!s || after < -1) return out;
  std::shared_lock<std::shared_mutex> lk(s->data_mu);
  const std::size_t begin = static_cast<std::size_t>(after + 1);
  if (begin >= s->entries.size()) return out;
  const std::size_t end = std::min(s->entries.size(), begin + limit);
  out.assign(s->entries.begin() + static_cast<std::ptrdiff_t>(begin),
             s->entries.begin() + static_cast<std::ptrdiff_t>(end));
  return out;
}

AtomResult Ledger::fetch_atom(const std::string& atom_hash) const {
  AtomResult out;
  if (!is_digest_hex(atom_hash)) {
    out.rejection = reject(ErrorCode::not_found, "not an atom hash: " + atom_hash);
    return out;
  }
  auto bytes = atoms_->get(atom_hash);
  if (!bytes) {
    out.rejection = reject(ErrorCode::not_found, "no atom " + atom_hash);
    return out;
  }
  out.ok = true;
  out.atom = std::move(*bytes);
  return out;
}

ChainReport Ledger::verify_chain(const std::string& container_id) const {
  const ContainerSlot* s = find_slot(container_id);
  if (!s) return ChainReport{};
  std::shared_lock<std::shared_mutex> lk(s->data_mu);
  return verify_entries(s->entries);
}

std::vector<std::string> Ledger::containers() const {
  std::vector<std::string> out;
  std::shared_lock<std::shared_mutex> lk(slots_mu_);
  for (const auto& [id, slot] : slots_) {
    std::shared_lock<std::shared_mutex> data_lk(slot->data_mu);
    if (!slot->entries.empty()) out.push_back(id);
  }
  return out;
}

bool Ledger::quarantined(const std::string& container_id) const {
  const ContainerSlot* s = find_slot(container_id);
  return s && s->quarantined.load();
}

std::size_t Ledger::slot_count() const {
  std::shared_lock<std::shared_mutex> lk(slots_mu_);
  return slots_.size();
}

void Ledger::scan_newest_first(const std::string& container_id,
                               const std::function<bool(const LedgerEntry&)>& visit) const {
  const ContainerSlot* s = find_slot(container_id);
  if (!s) return;
  std::shared_lock<std::shared_mutex> lk(s->data_mu);
  for (auto it = s->entries.rbegin(); it != s->entries.rend(); ++it) {
    if (!visit(*it)) return;
  }
}

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

std::string Ledger::journal_path(const std::string& container_id) const {
  return (fs::path(config_.data_dir) / "journal" / (blake3_hex(container_id) + ".ndjson")).string();
}

// Caller holds the container's commit lock. A failed append is cut back to
// the previous length so the journal never keeps a partial line; if even that
// fails the container is quarantined.
bool Ledger::append_journal(const LedgerEntry& e, ContainerSlot& slot) {
  if (config_.data_dir.empty()) return true;

  const std::string path = journal_path(e.container_id);
  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) return false;

  std::uintmax_t before = 0;
  if (fs::exists(path, ec)) {
    before = fs::file_size(path, ec);
    if (ec) return false;
  }

  FILE* f = std::fopen(path.c_str(), "ab");
  if (!f) return false;
  const std::string line = entry_to_json(e, false) + "\n";
  const bool written = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  const bool flushed = std::fflush(f) == 0;
  const bool closed = std::fclose(f) == 0;
  if (written && flushed && closed) return true;

  fs::resize_file(path, before, ec);
  if (ec) {
    slot.quarantined.store(true);
    report_recovery(e.container_id, e.sequence, false,
                    "cannot roll back failed journal append: " + ec.message());
  }
  return false;
}

std::vector<std::string> Ledger::load_journal(const std::string& path) {
  std::vector<std::string> problems;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    problems.push_back(path + ": cannot open");
    return problems;
  }
  const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  in.close();

  std::vector<LedgerEntry> entries;
  std::string container_id;
  std::size_t pos = 0;
  std::size_t good_bytes = 0;
  std::string problem;
  while (pos < content.size()) {
    const std::size_t nl = content.find('\n', pos);
    if (nl == std::string::npos) {
      // Torn final write: drop it so the next append starts on a clean line.
      std::error_code ec;
      fs::resize_file(path, good_bytes, ec);
      if (ec) {
        problem = "cannot truncate torn trailing record: " + ec.message();
        break;
      }
      std::cerr << "[ledger] " << path << ": discarded torn trailing record ("
                << content.size() - pos << " bytes)\n";
      break;
    }
    const std::string line = content.substr(pos, nl - pos);
    pos = nl + 1;

    std::string err;
    auto e = entry_from_json(line, &err);
    if (!e) {
      problem = "unparseable journal record after sequence " + std::to_string(entries.size()) + ": " + err;
      break;
    }
    if (container_id.empty()) container_id = e->container_id;
    if (e->container_id != container_id || journal_path(container_id) != path) {
      problem = "journal record for " + e->container_id + " in the wrong journal file";
      break;
    }
    auto atom = atoms_->get(e->atom_hash);
    if (!atom) {
      problem = "atom " + e->atom_hash + " missing for sequence " + std::to_string(e->sequence);
      break;
    }
    e->atom = std::move(*atom);
    entries.push_back(std::move(*e));
    good_bytes = pos;
  }

  if (container_id.empty()) {
    if (!problem.empty()) problems.push_back(path + ": " + problem);
    return problems;
  }

  if (problem.empty()) {
    const ChainReport report = verify_entries(entries);
    if (!report.ok) {
      problem = "chain broken at sequence " + std::to_string(*report.first_broken_sequence) + ": " + report.detail;
    }
  }

  ContainerSlot& slot = slot_for(container_id);
  std::unique_lock<std::shared_mutex> lk(slot.data_mu);
  slot.physical_balance = 0;
  for (const auto& e : entries) slot.physical_balance += e.physics_delta;
  const uint64_t count = entries.size();
  slot.entries = std::move(entries);
  slot.quarantined.store(!problem.empty());
  lk.unlock();

  report_recovery(container_id, count, problem.empty(),
                  problem.empty() ? "verified " + std::to_string(count) + " entries" : problem);
  if (!problem.empty()) problems.push_back(container_id + ": " + problem);
  return problems;
}

std::vector<std::string> Ledger::open() {
  std::vector<std::string> problems;
  if (config_.data_dir.empty()) return problems;

  const fs::path dir = fs::path(config_.data_dir) / "journal";
  std::error_code ec;
  if (!fs::exists(dir, ec)) return problems;

  std::vector<std::string> paths;
  for (const auto& de : fs::directory_iterator(dir, ec)) {
    if (de.is_regular_file() && de.path().extension() == ".ndjson") paths.push_back(de.path().string());
  }
  if (ec) {
    problems.push_back(dir.string() + ": " + ec.message());
    return problems;
  }
  std::sort(paths.begin(), paths.end());
  for (const auto& p : paths) {
    auto found = load_journal(p);
    problems.insert(problems.end(), found.begin(), found.end());
  }
  return problems;
}

}  // namespace atomledger
