#include "lexledger/ledger.hpp"

#include <algorithm>

#include "lexledger/hash.hpp"
#include "lexledger/observability.hpp"

namespace lexledger {

namespace {
constexpr uint64_t kReplayChunk = 4096;
}  // namespace

HashChainLedger::HashChainLedger(std::string node_id, std::shared_ptr<IRecordStore> store)
    : node_id_(std::move(node_id)), store_(std::move(store)), head_hash_(zero_digest()) {}

void HashChainLedger::report_integrity_failure(const LedgerError& e) const {
  OperatorAlert alert;
  alert.component = "ledger";
  alert.node_id = node_id_;
  alert.error = e;
  raise_operator_alert(std::move(alert));
}

bool HashChainLedger::recover(LedgerError* error) {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t n = store_->count();
  std::string prev = zero_digest();
  VectorClock clock;
  for (uint64_t from = 0; from < n; from += kReplayChunk) {
    const uint64_t to = std::min(n - 1, from + kReplayChunk - 1);
    LedgerError read_err;
    auto chunk = store_->read_range(from, to, &read_err);
    if (!chunk) {
      if (read_err.code == ErrorCode::integrity_violation) report_integrity_failure(read_err);
      return fail(error, read_err);
    }
    VerificationResult vr = check_records(*chunk, from, prev);
    if (!vr.ok) {
      report_integrity_failure(vr.error);
      return fail(error, vr.error);
    }
    prev = chunk->back().record_hash;
    clock.merge(chunk->back().vector_clock);
  }
  clock.merge(clock_);  // keep anything observed before recovery
  clock.set(node_id_, n);
  next_sequence_ = n;
  head_hash_ = prev;
  clock_ = std::move(clock);
  log_line("ledger", node_id_ + " recovered " + std::to_string(n) + " records");
  return true;
}

std::optional<AuditRecord> HashChainLedger::append(AuditRecord record, LedgerError* error) {
  LedgerEvent ev;
  ev.node_id = node_id_;
  ev.count = 1;
  std::optional<AuditRecord> sealed;
  {
    ScopeTimer timer(ev.duration_ns);
    std::lock_guard<std::mutex> lk(mu_);

    if (record.id.empty()) {
      fail(error, make_error(ErrorCode::invalid_record, "record id must be set"));
      return std::nullopt;
    }
    if (store_->count() != next_sequence_) {
      fail(error, make_error(ErrorCode::persistence_failure,
                             "store holds " + std::to_string(store_->count()) +
                                 " records, ledger expects " + std::to_string(next_sequence_) +
                                 "; recover() first"));
      return std::nullopt;
    }

    VectorClock next_clock = clock_;
    next_clock.set(node_id_, next_sequence_ + 1);

    record.node_id = node_id_;
    record.local_sequence = next_sequence_;
    record.vector_clock = next_clock;
    record.prev_hash = head_hash_;
    record.format_version = version::RECORD_FORMAT_VERSION;
    record.hash_version = version::HASH_ALGORITHM_VERSION;
    if (record.timestamp_unix_ms == 0) record.timestamp_unix_ms = now_unix_ms();
    record.record_hash = compute_record_hash(record);

    LedgerError store_err;
    if (!store_->append(record, &store_err)) {
      ev.kind = LedgerEventKind::append_failed;
      ev.ok = false;
      ev.error_code = to_string(store_err.code);
      ev.detail = store_err.detail;
      emit_ledger_event(ev);
      fail(error, store_err);
      return std::nullopt;
    }

    ++next_sequence_;
    head_hash_ = record.record_hash;
    clock_ = std::move(next_clock);
    for (const auto& listener : listeners_) listener(record);
    sealed = std::move(record);
  }
  ev.kind = LedgerEventKind::append;
  emit_ledger_event(ev);
  return sealed;
}

VerificationResult HashChainLedger::check_records(const std::vector<AuditRecord>& records,
                                                  uint64_t from,
                                                  const std::string& expected_prev) const {
  VerificationResult vr;
  std::string prev = expected_prev;
  for (size_t i = 0; i < records.size(); ++i) {
    const AuditRecord& r = records[i];
    const uint64_t index = from + i;
    std::string why;
    if (r.node_id != node_id_) {
      why = "record belongs to node " + r.node_id;
    } else if (!record_hash_matches(r)) {
      why = "record_hash does not match content";
    } else if (r.prev_hash != prev) {
      why = "prev_hash does not match predecessor";
    } else if (r.vector_clock.get(node_id_) != index + 1) {
      why = "own clock entry is not local_sequence + 1";
    }
    ++vr.links_checked;
    if (!why.empty()) {
      vr.ok = false;
      vr.first_mismatch_at = index;
      vr.error = integrity_violation_at(index, why);
      vr.error.node_id = node_id_;
      vr.error.local_sequence = index;
      return vr;
    }
    prev = r.record_hash;
  }
  return vr;
}

VerificationResult HashChainLedger::verify_range(uint64_t from, uint64_t to) const {
  uint64_t limit;
  {
    std::lock_guard<std::mutex> lk(mu_);
    limit = next_sequence_;
  }

  VerificationResult vr;
  if (from > to || to >= limit) {
    vr.ok = false;
    vr.error = make_error(ErrorCode::invalid_argument,
                          "range [" + std::to_string(from) + ", " + std::to_string(to) +
                              "] outside chain of " + std::to_string(limit));
    return vr;
  }

  // The predecessor of `from` anchors the first link.
  const uint64_t read_from = from == 0 ? 0 : from - 1;
  LedgerError read_err;
  auto records = store_->read_range(read_from, to, &read_err);

  std::string prev = zero_digest();
  if (records) {
    if (from > 0) {
      prev = records->front().record_hash;
      records->erase(records->begin());
    }
    vr = check_records(*records, from, prev);
  } else if (read_err.code == ErrorCode::integrity_violation && read_err.at_index >= from) {
    // A slot failed to decode. Everything before it may still be sound; the
    // first failure wins.
    const uint64_t bad = read_err.at_index;
    vr = VerificationResult{};
    if (bad > from) {
      VerificationResult before = verify_range(from, bad - 1);
      if (!before.ok) return before;
      vr.links_checked = before.links_checked;
    }
    vr.ok = false;
    vr.first_mismatch_at = bad;
    vr.error = read_err;
    vr.error.node_id = node_id_;
    vr.error.local_sequence = bad;
    ++vr.links_checked;
  } else if (read_err.code == ErrorCode::integrity_violation) {
    // The anchor record (from - 1) itself is unreadable: trust already broke
    // before this range.
    vr.ok = false;
    vr.first_mismatch_at = read_err.at_index;
    vr.error = read_err;
  } else {
    vr.ok = false;
    vr.error = read_err;
  }

  LedgerEvent ev;
  ev.kind = LedgerEventKind::verify;
  ev.node_id = node_id_;
  ev.ok = vr.ok;
  ev.count = vr.links_checked;
  ev.error_code = to_string(vr.error.code);
  emit_ledger_event(ev);
  if (!vr.ok && vr.error.code == ErrorCode::integrity_violation) {
    report_integrity_failure(vr.error);
  }
  return vr;
}

VerificationResult HashChainLedger::verify_all() const {
  const auto h = head();
  if (!h) return VerificationResult{};
  return verify_range(0, h->local_sequence);
}

std::optional<ChainHead> HashChainLedger::head() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (next_sequence_ == 0) return std::nullopt;
  return ChainHead{head_hash_, next_sequence_ - 1};
}

uint64_t HashChainLedger::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return next_sequence_;
}

VectorClock HashChainLedger::clock() const {
  std::lock_guard<std::mutex> lk(mu_);
  return clock_;
}

void HashChainLedger::observe_clock(const VectorClock& remote) {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t own = clock_.get(node_id_);
  clock_.merge(remote);
  clock_.set(node_id_, own);
}

std::optional<std::vector<AuditRecord>> HashChainLedger::read_range(uint64_t from, uint64_t to,
                                                                    LedgerError* error) const {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (from > to || to >= next_sequence_) {
      fail(error, make_error(ErrorCode::not_found, "range out of bounds"));
      return std::nullopt;
    }
  }
  return store_->read_range(from, to, error);
}

std::optional<AuditRecord> HashChainLedger::read(uint64_t seq, LedgerError* error) const {
  auto one = read_range(seq, seq, error);
  if (!one) return std::nullopt;
  return std::move(one->front());
}

void HashChainLedger::add_listener(AppendListener listener) {
  std::lock_guard<std::mutex> lk(mu_);
  listeners_.push_back(std::move(listener));
}

}  // namespace lexledger
