#include "lexledger/sync.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <sstream>
#include <tuple>

#include "lexledger/hash.hpp"
#include "lexledger/observability.hpp"
#include "lexledger/version.hpp"

namespace lexledger {

namespace {

uint64_t causal_rank(const AuditRecord& r) {
  uint64_t sum = 0;
  for (const auto& [node, c] : r.vector_clock.counters()) sum += c;
  return sum;
}

bool causally_before(const AuditRecord& a, const AuditRecord& b) {
  const uint64_t ra = causal_rank(a);
  const uint64_t rb = causal_rank(b);
  return std::tie(ra, a.node_id, a.local_sequence) < std::tie(rb, b.node_id, b.local_sequence);
}

// Remaining range of one node's chain still to be streamed.
struct RangeCursor {
  std::string node;
  uint64_t next{0};
  uint64_t last{0};
  std::deque<AuditRecord> buffered;

  bool source_left() const { return next <= last; }
};

using RangeFetch = std::function<std::optional<std::vector<AuditRecord>>(
    const std::string& node, uint64_t from, uint64_t to, LedgerError* error)>;
using MergedSink = std::function<bool(std::vector<AuditRecord>&&, SyncReport&)>;

// Streams the ranges as a k-way merge of per-node cursors. Each chain is
// already in causal-rank order, so merging the cursor heads yields the same
// order as sorting everything. A batch ends early when a cursor with records
// left at the source runs dry, since its next record may rank lower. At most
// batch_size records per node are held before being handed to sink.
void stream_merged(std::vector<RangeCursor>& cursors, uint64_t batch_size,
                   const std::string& source, const RangeFetch& fetch, SyncReport& report,
                   const CancellationToken* cancel, const MergedSink& sink) {
  auto refill = [&](RangeCursor& c) {
    if (!c.buffered.empty() || !c.source_left()) return true;
    const uint64_t to = std::min(c.last, c.next + batch_size - 1);
    LedgerError err;
    auto got = fetch(c.node, c.next, to, &err);
    if (!got) {
      report.errors.push_back(err.ok() ? make_error(ErrorCode::peer_unreachable, source) : err);
      return false;
    }
    if (got->size() != to - c.next + 1) {
      report.errors.push_back(make_error(ErrorCode::invalid_record, "short fetch reply"));
      return false;
    }
    for (uint64_t i = 0; i < got->size(); ++i) {
      const AuditRecord& r = (*got)[static_cast<size_t>(i)];
      if (r.node_id != c.node || r.local_sequence != c.next + i) {
        report.errors.push_back(make_error(ErrorCode::invalid_record, "fetch reply out of range"));
        return false;
      }
    }
    c.buffered.assign(std::make_move_iterator(got->begin()), std::make_move_iterator(got->end()));
    c.next = to + 1;
    return true;
  };

  while (true) {
    if (cancel && cancel->cancelled()) {
      report.cancelled = true;
      return;
    }
    for (auto& c : cursors) {
      if (!refill(c)) return;
    }

    std::vector<AuditRecord> batch;
    while (batch.size() < batch_size) {
      RangeCursor* best = nullptr;
      bool starved = false;
      for (auto& c : cursors) {
        if (c.buffered.empty()) {
          if (c.source_left()) starved = true;
          continue;
        }
        if (!best || causally_before(c.buffered.front(), best->buffered.front())) best = &c;
      }
      if (starved || !best) break;
      batch.push_back(std::move(best->buffered.front()));
      best->buffered.pop_front();
    }
    if (batch.empty()) return;
    if (!sink(std::move(batch), report)) return;
  }
}

void raise_sync_alert(const std::string& node_id, const LedgerError& e) {
  OperatorAlert alert;
  alert.component = "sync";
  alert.node_id = node_id;
  alert.error = e;
  raise_operator_alert(std::move(alert));
}

}  // namespace

void sort_causally(std::vector<AuditRecord>& records) {
  std::stable_sort(records.begin(), records.end(), causally_before);
}

std::string SyncReport::to_json() const {
  std::ostringstream o;
  o << "{\"peer_id\":\"" << jsonlite::escape(peer_id) << "\""
    << ",\"received\":" << received << ",\"sent\":" << sent << ",\"conflicts\":" << conflicts
    << ",\"cancelled\":" << (cancelled ? "true" : "false") << ",\"errors\":[";
  for (size_t i = 0; i < errors.size(); ++i) {
    if (i) o << ',';
    o << errors[i].to_json();
  }
  o << "]}";
  return o.str();
}

// ---------------------------------------------------------------------------
// RecordPool
// ---------------------------------------------------------------------------

RecordPool::RecordPool(HashChainLedger& local, StoreFactory replica_factory)
    : local_(local), factory_(std::move(replica_factory)) {
  LedgerError err;
  if (!index_local(&err)) log_line("sync", "cannot index local record ids: " + err.detail);
  local_.add_listener([this](const AuditRecord& r) { add_id(r.id); });
}

bool RecordPool::index_local(LedgerError* error) {
  const uint64_t n = local_.size();
  for (uint64_t from = 0; from < n; from += 4096) {
    auto chunk = local_.read_range(from, std::min(n - 1, from + 4095), error);
    if (!chunk) return false;
    for (const auto& r : *chunk) add_id(r.id);
  }
  return true;
}

void RecordPool::add_id(const std::string& id) {
  std::lock_guard<std::mutex> lk(ids_mu_);
  ids_.insert(id);
}

bool RecordPool::contains_id(const std::string& id) const {
  std::lock_guard<std::mutex> lk(ids_mu_);
  return ids_.count(id) > 0;
}

bool RecordPool::open_replica(const std::string& node_id, LedgerError* error) {
  if (node_id == local_.node_id()) return true;
  std::optional<LedgerError> broken;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (replicas_.count(node_id)) return true;
    auto store = factory_(node_id);
    if (!store) {
      return fail(error, make_error(ErrorCode::persistence_failure,
                                    "no replica store for " + node_id));
    }
    const uint64_t n = store->count();
    std::string prev = zero_digest();
    std::vector<std::string> ids;
    for (uint64_t from = 0; from < n && !broken; from += 4096) {
      const uint64_t to = std::min(n - 1, from + 4095);
      LedgerError read_err;
      auto chunk = store->read_range(from, to, &read_err);
      if (!chunk) {
        broken = read_err;
        break;
      }
      for (const auto& r : *chunk) {
        LedgerError verr;
        if (r.node_id != node_id) {
          broken = integrity_violation_at(r.local_sequence, "replica holds foreign record");
        } else if (!validate_sealed_record(r, &verr)) {
          broken = verr;
        } else if (r.prev_hash != prev) {
          broken = integrity_violation_at(r.local_sequence, "replica chain link broken");
        }
        if (broken) {
          broken->node_id = node_id;
          break;
        }
        prev = r.record_hash;
        ids.push_back(r.id);
      }
    }
    if (!broken) {
      replicas_[node_id] = std::move(store);
      if (n > 0) replica_tips_[node_id] = prev;
      std::lock_guard<std::mutex> idlk(ids_mu_);
      for (auto& id : ids) ids_.insert(std::move(id));
    }
  }
  if (broken) {
    if (is_fatal(broken->code)) raise_sync_alert(node_id, *broken);
    return fail(error, *broken);
  }
  return true;
}

uint64_t RecordPool::count_locked(const std::string& node_id) const {
  if (node_id == local_.node_id()) return local_.size();
  auto it = replicas_.find(node_id);
  return it == replicas_.end() ? 0 : it->second->count();
}

std::optional<std::string> RecordPool::hash_at_locked(const std::string& node_id, uint64_t seq,
                                                      LedgerError* error) const {
  if (node_id == local_.node_id()) {
    auto r = local_.read(seq, error);
    if (!r) return std::nullopt;
    return r->record_hash;
  }
  auto it = replicas_.find(node_id);
  if (it == replicas_.end()) {
    fail(error, make_error(ErrorCode::not_found, "no replica for " + node_id));
    return std::nullopt;
  }
  const uint64_t n = it->second->count();
  if (seq + 1 == n) {
    auto tip = replica_tips_.find(node_id);
    if (tip != replica_tips_.end()) return tip->second;
  }
  auto one = it->second->read_range(seq, seq, error);
  if (!one) return std::nullopt;
  return one->front().record_hash;
}

std::map<std::string, ChainHead> RecordPool::tips() const {
  std::map<std::string, ChainHead> out;
  std::lock_guard<std::mutex> lk(mu_);
  if (auto h = local_.head()) out[local_.node_id()] = *h;
  for (const auto& [node, store] : replicas_) {
    const uint64_t n = store->count();
    auto tip = replica_tips_.find(node);
    if (n > 0 && tip != replica_tips_.end()) out[node] = ChainHead{tip->second, n - 1};
  }
  return out;
}

VectorClock RecordPool::frontier() const {
  VectorClock f;
  for (const auto& [node, head] : tips()) f.set(node, head.local_sequence + 1);
  return f;
}

uint64_t RecordPool::count(const std::string& node_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return count_locked(node_id);
}

std::set<std::string> RecordPool::nodes() const {
  std::set<std::string> out;
  for (const auto& [node, head] : tips()) out.insert(node);
  return out;
}

uint64_t RecordPool::total() const {
  uint64_t n = 0;
  for (const auto& [node, head] : tips()) n += head.local_sequence + 1;
  return n;
}

std::optional<std::vector<AuditRecord>> RecordPool::read(const std::string& node_id,
                                                         uint64_t from, uint64_t to,
                                                         LedgerError* error) const {
  if (node_id == local_.node_id()) return local_.read_range(from, to, error);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = replicas_.find(node_id);
  if (it == replicas_.end()) {
    fail(error, make_error(ErrorCode::not_found, "no replica for " + node_id));
    return std::nullopt;
  }
  return it->second->read_range(from, to, error);
}

std::optional<std::string> RecordPool::hash_at(const std::string& node_id, uint64_t seq,
                                               LedgerError* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  return hash_at_locked(node_id, seq, error);
}

std::optional<uint64_t> RecordPool::commit(const std::vector<AuditRecord>& batch,
                                           LedgerError* error) {
  std::optional<LedgerError> rejected;
  std::optional<std::string> forked_node;
  std::vector<const AuditRecord*> accepted;
  VectorClock merged;

  {
    std::lock_guard<std::mutex> lk(mu_);
    std::map<std::string, Overlay> overlay;
    std::map<std::pair<std::string, uint64_t>, std::string> pending_hashes;
    std::unordered_set<std::string> batch_ids;

    auto count_of = [&](const std::string& node) {
      auto it = overlay.find(node);
      return it != overlay.end() ? it->second.count : count_locked(node);
    };

    for (const AuditRecord& r : batch) {
      LedgerError verr;
      if (!validate_sealed_record(r, &verr)) {
        rejected = verr;
        break;
      }
      if (auto f = forked_.find(r.node_id); f != forked_.end()) {
        rejected = f->second;
        break;
      }

      const uint64_t have = count_of(r.node_id);
      if (r.local_sequence < have) {
        // Slot already held: identical record is a duplicate, anything else
        // is a fork.
        std::optional<std::string> held;
        auto p = pending_hashes.find({r.node_id, r.local_sequence});
        if (p != pending_hashes.end()) {
          held = p->second;
        } else {
          LedgerError herr;
          held = hash_at_locked(r.node_id, r.local_sequence, &herr);
          if (!held) {
            rejected = herr;
            break;
          }
        }
        if (*held != r.record_hash) {
          rejected = fork_at(r.node_id, r.local_sequence,
                             "two records claim the same slot");
          forked_node = r.node_id;
          break;
        }
        continue;
      }

      if (r.node_id == local_.node_id() || r.local_sequence > have) {
        LedgerError e = make_error(ErrorCode::causal_order_violation,
                                   "record skips slots: holding " + std::to_string(have));
        e.node_id = r.node_id;
        e.local_sequence = r.local_sequence;
        rejected = e;
        break;
      }

      std::string expected_prev = zero_digest();
      if (have > 0) {
        auto o = overlay.find(r.node_id);
        if (o != overlay.end()) {
          expected_prev = o->second.tip_hash;
        } else {
          LedgerError herr;
          auto h = hash_at_locked(r.node_id, have - 1, &herr);
          if (!h) {
            rejected = herr;
            break;
          }
          expected_prev = *h;
        }
      }
      if (r.prev_hash != expected_prev) {
        rejected = fork_at(r.node_id, have - 1, "chains diverge before the offered record");
        forked_node = r.node_id;
        break;
      }

      bool causally_ready = true;
      for (const auto& [dep_node, dep_count] : r.vector_clock.counters()) {
        if (dep_node != r.node_id && count_of(dep_node) < dep_count) {
          causally_ready = false;
          break;
        }
      }
      if (!causally_ready) {
        LedgerError e = make_error(ErrorCode::causal_order_violation,
                                   "causal history of record not held");
        e.node_id = r.node_id;
        e.local_sequence = r.local_sequence;
        rejected = e;
        break;
      }

      if (contains_id(r.id) || !batch_ids.insert(r.id).second) {
        LedgerError e = make_error(ErrorCode::invalid_record, "record id reused: " + r.id);
        e.node_id = r.node_id;
        e.local_sequence = r.local_sequence;
        rejected = e;
        break;
      }

      overlay[r.node_id] = Overlay{have + 1, r.record_hash};
      pending_hashes[{r.node_id, r.local_sequence}] = r.record_hash;
      accepted.push_back(&r);
    }

    if (forked_node) forked_[*forked_node] = *rejected;

    if (rejected) {
      accepted.clear();
    } else {
      uint64_t stored = 0;
      for (const AuditRecord* r : accepted) {
        auto& store = replicas_[r->node_id];
        if (!store) store = factory_(r->node_id);
        LedgerError werr;
        if (!store || !store->append(*r, &werr)) {
          // Earlier records of this batch are durable and form a valid
          // prefix; the rest is dropped.
          rejected = store ? werr : make_error(ErrorCode::persistence_failure, "no replica store");
          break;
        }
        replica_tips_[r->node_id] = r->record_hash;
        add_id(r->id);
        ++stored;
      }
      accepted.resize(stored);
    }
    for (const AuditRecord* r : accepted) merged.merge(r->vector_clock);
    if (!accepted.empty()) local_.observe_clock(merged);
  }

  if (rejected) {
    if (forked_node || rejected->code == ErrorCode::integrity_violation) {
      raise_sync_alert(local_.node_id(), *rejected);
    }
    fail(error, *rejected);
    return std::nullopt;
  }
  return accepted.size();
}

void RecordPool::mark_forked(const std::string& node_id, const LedgerError& fork) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (forked_.count(node_id)) return;
    forked_[node_id] = fork;
  }
  raise_sync_alert(local_.node_id(), fork);
}

bool RecordPool::is_forked(const std::string& node_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return forked_.count(node_id) > 0;
}

std::vector<LedgerError> RecordPool::forks() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<LedgerError> out;
  for (const auto& [node, e] : forked_) out.push_back(e);
  return out;
}

// ---------------------------------------------------------------------------
// Synchronizer
// ---------------------------------------------------------------------------

Synchronizer::Synchronizer(RecordPool& pool, SyncOptions options)
    : pool_(pool), options_(options) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

TipSummary Synchronizer::local_summary() const {
  TipSummary s;
  s.sync_protocol = version::SYNC_PROTOCOL_VERSION;
  s.hash_algorithm = version::HASH_ALGORITHM_VERSION;
  s.node_id = pool_.local_node_id();
  s.tips = pool_.tips();
  return s;
}

std::optional<std::vector<AuditRecord>> Synchronizer::serve_fetch(const std::string& node_id,
                                                                  uint64_t from, uint64_t to,
                                                                  LedgerError* error) const {
  return pool_.read(node_id, from, to, error);
}

std::optional<uint64_t> Synchronizer::accept(const std::vector<AuditRecord>& batch,
                                             LedgerError* error) {
  return pool_.commit(batch, error);
}

std::optional<uint64_t> Synchronizer::ingest(const InboundBatch& batch, LedgerError* error) {
  return pool_.commit(batch.records, error);
}

bool Synchronizer::handshake(SyncPeer& peer, SyncReport& report, TipSummary* remote) {
  LedgerError err;
  auto summary = peer.summary(&err);
  if (!summary) {
    report.errors.push_back(err.ok() ? make_error(ErrorCode::peer_unreachable, peer.peer_id())
                                     : err);
    return false;
  }
  report.peer_sync_protocol = summary->sync_protocol;
  report.peer_hash_algorithm = summary->hash_algorithm;
  const auto compat =
      version::check_peer_compatibility(summary->sync_protocol, summary->hash_algorithm);
  if (!compat.ok) {
    report.errors.push_back(make_error(ErrorCode::protocol_version_mismatch, compat.description));
    return false;
  }
  *remote = std::move(*summary);
  return true;
}

void Synchronizer::check_forks(SyncPeer& peer, const TipSummary& remote, SyncReport& report,
                               const CancellationToken* cancel) {
  auto remote_hash_at = [&](const std::string& node, uint64_t seq,
                            LedgerError* err) -> std::optional<std::string> {
    auto got = peer.fetch(node, seq, seq, err);
    if (!got || got->size() != 1 || (*got)[0].local_sequence != seq ||
        (*got)[0].node_id != node) {
      if (err && err->ok()) *err = make_error(ErrorCode::peer_unreachable, "bad fetch reply");
      return std::nullopt;
    }
    return (*got)[0].record_hash;
  };

  for (const auto& [node, rhead] : remote.tips) {
    if (cancel && cancel->cancelled()) return;
    if (pool_.is_forked(node)) continue;
    const uint64_t have = pool_.count(node);
    if (have == 0) continue;
    const uint64_t common = std::min(have - 1, rhead.local_sequence);

    LedgerError err;
    auto mine = pool_.hash_at(node, common, &err);
    std::optional<std::string> theirs =
        common == rhead.local_sequence ? std::optional<std::string>(rhead.record_hash)
                                       : remote_hash_at(node, common, &err);
    if (!mine || !theirs) {
      report.errors.push_back(err);
      continue;
    }
    if (*mine == *theirs) continue;

    // Narrow to the first divergent slot. Equal at k implies equal below k.
    uint64_t lo = 0;
    uint64_t hi = common;
    bool narrowed = true;
    while (lo < hi) {
      const uint64_t mid = lo + (hi - lo) / 2;
      auto a = pool_.hash_at(node, mid, &err);
      auto b = remote_hash_at(node, mid, &err);
      if (!a || !b) {
        narrowed = false;
        break;
      }
      if (*a == *b) {
        lo = mid + 1;
      } else {
        hi = mid;
      }
    }
    if (!narrowed) report.errors.push_back(err);
    LedgerError fork = fork_at(node, hi, "peer " + peer.peer_id() + " holds a different record");
    pool_.mark_forked(node, fork);
    report.errors.push_back(fork);
  }
}

void Synchronizer::pull(SyncPeer& peer, const TipSummary& remote, SyncReport& report,
                        const CancellationToken* cancel, const BatchSink& sink) {
  std::vector<RangeCursor> cursors;
  for (const auto& [node, rhead] : remote.tips) {
    if (pool_.is_forked(node)) continue;
    const uint64_t have = pool_.count(node);
    if (rhead.local_sequence + 1 <= have) continue;
    if (node == pool_.local_node_id()) {
      LedgerError e = make_error(ErrorCode::causal_order_violation,
                                 "peer holds records of this node beyond its head");
      e.node_id = node;
      e.local_sequence = have;
      report.errors.push_back(e);
      continue;
    }
    RangeCursor c;
    c.node = node;
    c.next = have;
    c.last = rhead.local_sequence;
    cursors.push_back(std::move(c));
  }
  stream_merged(
      cursors, options_.batch_size, peer.peer_id(),
      [&peer](const std::string& node, uint64_t from, uint64_t to, LedgerError* err) {
        return peer.fetch(node, from, to, err);
      },
      report, cancel, sink);
}

void Synchronizer::push(SyncPeer& peer, const TipSummary& remote, SyncReport& report,
                        const CancellationToken* cancel) {
  std::vector<RangeCursor> cursors;
  for (const auto& [node, head] : pool_.tips()) {
    if (pool_.is_forked(node)) continue;
    auto rit = remote.tips.find(node);
    const uint64_t theirs = rit == remote.tips.end() ? 0 : rit->second.local_sequence + 1;
    if (head.local_sequence + 1 <= theirs) continue;
    RangeCursor c;
    c.node = node;
    c.next = theirs;
    c.last = head.local_sequence;
    cursors.push_back(std::move(c));
  }
  stream_merged(
      cursors, options_.batch_size, pool_.local_node_id(),
      [this](const std::string& node, uint64_t from, uint64_t to, LedgerError* err) {
        return pool_.read(node, from, to, err);
      },
      report, cancel, [&peer](std::vector<AuditRecord>&& batch, SyncReport& rep) {
        LedgerError err;
        auto stored = peer.deliver(batch, &err);
        if (!stored) {
          rep.errors.push_back(err.ok() ? make_error(ErrorCode::peer_unreachable, peer.peer_id())
                                        : err);
          return false;
        }
        rep.sent += *stored;
        return true;
      });
}

void Synchronizer::finish(const SyncReport& report) const {
  LedgerEvent ev;
  ev.kind = LedgerEventKind::sync;
  ev.node_id = pool_.local_node_id();
  ev.ok = report.ok();
  ev.count = report.received + report.sent;
  ev.detail = report.peer_id;
  if (!report.errors.empty()) ev.error_code = to_string(report.errors.front().code);
  emit_ledger_event(ev);
  for (const auto& e : report.errors) {
    log_line("sync", pool_.local_node_id() + " <-> " + report.peer_id + ": " +
                         to_string(e.code) + " " + e.detail);
  }
}

SyncReport Synchronizer::sync_with(SyncPeer& peer, const CancellationToken* cancel) {
  SyncReport report;
  report.peer_id = peer.peer_id();
  TipSummary remote;
  if (!handshake(peer, report, &remote)) {
    finish(report);
    return report;
  }
  check_forks(peer, remote, report, cancel);

  const VectorClock before = pool_.local().clock();
  pull(peer, remote, report, cancel,
       [this, &before](std::vector<AuditRecord>&& batch, SyncReport& rep) {
         uint64_t concurrent = 0;
         for (const auto& r : batch) {
           if (!pool_.contains_id(r.id) &&
               r.vector_clock.compare(before) == ClockOrder::Concurrent) {
             ++concurrent;
           }
         }
         LedgerError err;
         auto stored = pool_.commit(batch, &err);
         if (!stored) {
           rep.errors.push_back(err);
           return false;
         }
         rep.received += *stored;
         rep.conflicts += concurrent;
         return true;
       });
  if (!report.cancelled) push(peer, remote, report, cancel);
  finish(report);
  return report;
}

SyncReport Synchronizer::pull_into(SyncPeer& peer, BoundedChannel<InboundBatch>& inbound,
                                   const CancellationToken* cancel) {
  SyncReport report;
  report.peer_id = peer.peer_id();
  TipSummary remote;
  if (!handshake(peer, report, &remote)) {
    finish(report);
    return report;
  }
  check_forks(peer, remote, report, cancel);
  pull(peer, remote, report, cancel,
       [&peer, &inbound](std::vector<AuditRecord>&& batch, SyncReport& rep) {
         const uint64_t n = batch.size();
         if (!inbound.push(InboundBatch{peer.peer_id(), std::move(batch)})) {
           rep.errors.push_back(make_error(ErrorCode::cancelled, "inbound channel closed"));
           return false;
         }
         rep.received += n;
         return true;
       });
  finish(report);
  return report;
}

SyncReport Synchronizer::push_to(SyncPeer& peer, const CancellationToken* cancel) {
  SyncReport report;
  report.peer_id = peer.peer_id();
  TipSummary remote;
  if (!handshake(peer, report, &remote)) {
    finish(report);
    return report;
  }
  push(peer, remote, report, cancel);
  finish(report);
  return report;
}

// ---------------------------------------------------------------------------
// LocalPeer
// ---------------------------------------------------------------------------

LocalPeer::LocalPeer(Synchronizer& remote) : remote_(remote) {}

std::string LocalPeer::peer_id() const { return remote_.pool().local_node_id(); }

bool LocalPeer::reachable(LedgerError* error) {
  calls_.fetch_add(1);
  if (reachable_.load()) return true;
  return fail(error, make_error(ErrorCode::peer_unreachable, "peer " + peer_id() + " unreachable"));
}

std::optional<TipSummary> LocalPeer::summary(LedgerError* error) {
  if (!reachable(error)) return std::nullopt;
  return remote_.local_summary();
}

std::optional<std::vector<AuditRecord>> LocalPeer::fetch(const std::string& node_id,
                                                         uint64_t from, uint64_t to,
                                                         LedgerError* error) {
  if (!reachable(error)) return std::nullopt;
  return remote_.serve_fetch(node_id, from, to, error);
}

std::optional<uint64_t> LocalPeer::deliver(const std::vector<AuditRecord>& batch,
                                           LedgerError* error) {
  if (!reachable(error)) return std::nullopt;
  return remote_.accept(batch, error);
}

}  // namespace lexledger
