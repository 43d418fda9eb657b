#include "lexledger/consensus.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

#include "lexledger/hash.hpp"
#include "lexledger/merkle.hpp"
#include "lexledger/observability.hpp"

namespace lexledger {

namespace {

void raise_consensus_alert(const std::string& node_id, const LedgerError& e) {
  OperatorAlert alert;
  alert.component = "consensus";
  alert.node_id = node_id;
  alert.error = e;
  raise_operator_alert(std::move(alert));
}

// Every record must follow its own chain predecessor and every record it
// causally depends on. `placed` starts at the sealed frontier.
bool respects_causality(const std::vector<AuditRecord>& ordered,
                        std::map<std::string, uint64_t> placed, LedgerError* error) {
  for (const AuditRecord& r : ordered) {
    if (placed[r.node_id] != r.local_sequence) {
      LedgerError e = make_error(ErrorCode::causal_order_violation,
                                 "record out of chain order in proposal");
      e.node_id = r.node_id;
      e.local_sequence = r.local_sequence;
      return fail(error, e);
    }
    for (const auto& [dep_node, dep_count] : r.vector_clock.counters()) {
      if (dep_node == r.node_id) continue;
      auto it = placed.find(dep_node);
      if (it == placed.end() || it->second < dep_count) {
        LedgerError e = make_error(ErrorCode::causal_order_violation,
                                   "record placed before its causal dependency on " + dep_node);
        e.node_id = r.node_id;
        e.local_sequence = r.local_sequence;
        return fail(error, e);
      }
    }
    ++placed[r.node_id];
  }
  return true;
}

std::vector<std::string> leaf_hashes(const std::vector<RecordRef>& order) {
  std::vector<std::string> out;
  out.reserve(order.size());
  for (const auto& ref : order) out.push_back(ref.record_hash);
  return out;
}

void emit_round_event(LedgerEventKind kind, const std::string& node_id, bool ok,
                      const std::string& error_code, uint64_t count, std::string detail) {
  LedgerEvent ev;
  ev.kind = kind;
  ev.node_id = node_id;
  ev.ok = ok;
  ev.error_code = error_code;
  ev.count = count;
  ev.detail = std::move(detail);
  emit_ledger_event(ev);
}

}  // namespace

std::vector<AuditRecord> canonical_order(std::vector<AuditRecord> records) {
  sort_causally(records);
  return records;
}

// ---------------------------------------------------------------------------
// Strategies
// ---------------------------------------------------------------------------

OrderingStrategy::OrderingStrategy(std::vector<std::string> known_nodes)
    : known_(std::move(known_nodes)) {
  std::sort(known_.begin(), known_.end());
  known_.erase(std::unique(known_.begin(), known_.end()), known_.end());
}

std::vector<AuditRecord> OrderingStrategy::propose(std::vector<AuditRecord> records) const {
  return canonical_order(std::move(records));
}

bool OrderingStrategy::may_propose(const std::string& node_id, uint64_t /*epoch*/) const {
  return is_known(node_id);
}

bool OrderingStrategy::accept_order(const std::vector<AuditRecord>& proposed) const {
  const auto expected = canonical_order(proposed);
  for (size_t i = 0; i < proposed.size(); ++i) {
    if (expected[i].node_id != proposed[i].node_id ||
        expected[i].local_sequence != proposed[i].local_sequence) {
      return false;
    }
  }
  return true;
}

bool OrderingStrategy::is_known(const std::string& node_id) const {
  return std::binary_search(known_.begin(), known_.end(), node_id);
}

void LeaderStrategy::observe_epoch(uint64_t epoch) {
  if (epoch > epoch_) epoch_ = epoch;
}

bool LeaderStrategy::may_propose(const std::string& node_id, uint64_t epoch) const {
  if (known_.empty()) return false;
  return known_[static_cast<size_t>(epoch % known_.size())] == node_id;
}

bool LeaderStrategy::accept_order(const std::vector<AuditRecord>& /*proposed*/) const {
  // The leader's order is authoritative once it is causally valid.
  return true;
}

const std::string& LeaderStrategy::leader() const {
  static const std::string none;
  if (known_.empty()) return none;
  return known_[static_cast<size_t>(epoch_ % known_.size())];
}

void BftStrategy::observe_epoch(uint64_t epoch) {
  if (epoch > view_) view_ = epoch;
}

bool BftStrategy::may_propose(const std::string& node_id, uint64_t epoch) const {
  if (known_.empty()) return false;
  return known_[static_cast<size_t>(epoch % known_.size())] == node_id;
}

void BftStrategy::on_conflicting_acks(const std::vector<std::string>& nodes) {
  suspected_.insert(nodes.begin(), nodes.end());
  if (nodes.size() > faults_tolerated()) {
    ++view_;
    log_line("consensus", std::to_string(nodes.size()) +
                              " conflicting acknowledgements; view change to " +
                              std::to_string(view_));
  }
}

const std::string& BftStrategy::primary() const {
  static const std::string none;
  if (known_.empty()) return none;
  return known_[static_cast<size_t>(view_ % known_.size())];
}

std::unique_ptr<OrderingStrategy> make_strategy(const std::string& name,
                                                std::vector<std::string> known_nodes,
                                                LedgerError* error) {
  if (known_nodes.empty()) {
    fail(error, make_error(ErrorCode::config_invalid, "consensus needs at least one known node"));
    return nullptr;
  }
  if (name == "majority") return std::make_unique<MajorityStrategy>(std::move(known_nodes));
  if (name == "leader") return std::make_unique<LeaderStrategy>(std::move(known_nodes));
  if (name == "bft") {
    auto s = std::make_unique<BftStrategy>(std::move(known_nodes));
    if (s->known_nodes().size() < 4) {
      fail(error, make_error(ErrorCode::config_invalid,
                             "bft needs at least 4 known nodes (3f + 1, f >= 1)"));
      return nullptr;
    }
    return s;
  }
  fail(error, make_error(ErrorCode::config_invalid, "unknown consensus strategy: " + name));
  return nullptr;
}

// ---------------------------------------------------------------------------
// Digests
// ---------------------------------------------------------------------------

std::string compute_proposal_digest(uint64_t segment_id, const std::string& strategy,
                                    const std::map<std::string, NodeRange>& ranges,
                                    const std::vector<std::string>& ordered_hashes) {
  std::string payload;
  payload.reserve(64 + ranges.size() * 96 + ordered_hashes.size() * 65);
  payload += "segment:" + std::to_string(segment_id) + "\n";
  payload += "strategy:" + strategy + "\n";
  for (const auto& [node, r] : ranges) {
    payload += "range:" + node + ":" + std::to_string(r.first_seq) + ":" +
               std::to_string(r.last_seq) + ":" + r.anchor_hash + "\n";
  }
  for (const auto& h : ordered_hashes) {
    payload += h;
    payload += '\n';
  }
  return proposal_digest(payload);
}

std::string compute_proposal_digest(const Proposal& p) {
  return compute_proposal_digest(p.segment_id, p.strategy, p.ranges, leaf_hashes(p.order));
}

std::string compute_proposal_digest(const SealedSegment& s) {
  std::vector<std::string> hashes;
  hashes.reserve(s.records.size());
  for (const auto& r : s.records) hashes.push_back(r.record_hash);
  return compute_proposal_digest(s.segment_id, s.strategy, s.ranges, hashes);
}

std::string RoundReport::to_json() const {
  std::ostringstream o;
  o << "{\"segment_id\":" << segment_id << ",\"sealed\":" << (sealed ? "true" : "false")
    << ",\"acks\":" << acks << ",\"conflicts\":" << conflicts << ",\"installed\":" << installed
    << ",\"merkle_root\":\"" << merkle_root << "\",\"error\":" << error.to_json() << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ConsensusCoordinator
// ---------------------------------------------------------------------------

ConsensusCoordinator::ConsensusCoordinator(RecordPool& pool,
                                           std::unique_ptr<OrderingStrategy> strategy,
                                           ConsensusOptions options,
                                           std::shared_ptr<ISegmentArchive> archive)
    : pool_(pool),
      strategy_(std::move(strategy)),
      options_(options),
      archive_(std::move(archive)),
      last_progress_ms_(now_unix_ms()) {}

std::optional<std::vector<AuditRecord>> ConsensusCoordinator::collect_locked(
    const std::map<std::string, NodeRange>& ranges, LedgerError* error) const {
  std::vector<AuditRecord> out;
  for (const auto& [node, r] : ranges) {
    auto part = pool_.read(node, r.first_seq, r.last_seq, error);
    if (!part) return std::nullopt;
    out.insert(out.end(), std::make_move_iterator(part->begin()),
               std::make_move_iterator(part->end()));
  }
  return out;
}

void ConsensusCoordinator::enter_fork_locked(const LedgerError& fork) {
  if (state_ == SegmentState::ForkDetected) return;
  if (state_ == SegmentState::Open) state_ = SegmentState::PendingQuorum;
  state_ = SegmentState::ForkDetected;
  fork_ = fork;
  pending_.reset();
  log_line("consensus", "segment " + std::to_string(current_segment_id_) +
                            " halted: fork at " + fork.node_id + "/" +
                            std::to_string(fork.local_sequence));
}

// A node stands behind at most one proposal per segment: its own, or the
// one it acknowledged. A newer proposal from the same proposer replaces the
// older one, which that proposer can no longer seal. Any other proposal is
// refused until the vote expires or the segment is sealed.
bool ConsensusCoordinator::vote_held_locked(const std::string& proposer,
                                            const std::string& digest, uint64_t now_ms) const {
  if (!pending_ || pending_->segment_id != current_segment_id_) return false;
  if (pending_->proposer == proposer) return false;
  if (!digest.empty() && pending_->digest == digest) return false;
  return now_ms < vote_expires_ms_;
}

std::optional<Proposal> ConsensusCoordinator::propose(LedgerError* error) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fork_) {
    fail(error, *fork_);
    return std::nullopt;
  }
  const uint64_t epoch = strategy_->epoch();
  if (!strategy_->may_propose(node_id(), epoch)) {
    fail(error, make_error(ErrorCode::not_leader,
                           node_id() + " may not propose in epoch " + std::to_string(epoch)));
    return std::nullopt;
  }
  if (auto forks = pool_.forks(); !forks.empty()) {
    enter_fork_locked(forks.front());
    fail(error, forks.front());
    return std::nullopt;
  }
  const uint64_t now = now_unix_ms();
  if (vote_held_locked(node_id(), "", now)) {
    fail(error, make_error(ErrorCode::proposal_mismatch,
                           "segment " + std::to_string(current_segment_id_) +
                               ": acknowledgement held for " + pending_->proposer));
    return std::nullopt;
  }

  // tips() is one consistent snapshot of the pool, which is causally closed.
  std::map<std::string, NodeRange> ranges;
  for (const auto& [node, head] : pool_.tips()) {
    const uint64_t have = head.local_sequence + 1;
    const uint64_t from = frontier_.count(node) ? frontier_.at(node) : 0;
    if (have <= from) continue;
    NodeRange r;
    r.first_seq = from;
    r.last_seq = have - 1;
    if (from == 0) {
      r.anchor_hash = zero_digest();
    } else {
      auto anchor = pool_.hash_at(node, from - 1, error);
      if (!anchor) return std::nullopt;
      r.anchor_hash = *anchor;
    }
    ranges[node] = std::move(r);
  }
  if (ranges.empty()) {
    fail(error, make_error(ErrorCode::not_found, "nothing to seal"));
    return std::nullopt;
  }

  auto records = collect_locked(ranges, error);
  if (!records) return std::nullopt;
  auto ordered = strategy_->propose(std::move(*records));
  if (!respects_causality(ordered, frontier_, error)) return std::nullopt;

  Proposal p;
  p.segment_id = current_segment_id_;
  p.epoch = epoch;
  p.proposer = node_id();
  p.strategy = strategy_->name();
  p.ranges = std::move(ranges);
  p.order.reserve(ordered.size());
  for (const auto& r : ordered) p.order.push_back(RecordRef{r.node_id, r.local_sequence, r.record_hash});
  p.digest = compute_proposal_digest(p);

  if (!can_transition(state_, SegmentState::PendingQuorum)) {
    fail(error, make_error(ErrorCode::segment_state_invalid,
                           "cannot propose from state " + to_string(state_)));
    return std::nullopt;
  }
  state_ = SegmentState::PendingQuorum;
  pending_ = p;
  deadline_ms_ = now + options_.quorum_timeout_ms;
  vote_expires_ms_ = deadline_ms_;
  return p;
}

Ack ConsensusCoordinator::validate_proposal(const Proposal& p) {
  Ack ack;
  ack.segment_id = p.segment_id;
  ack.node_id = node_id();
  ack.digest = p.digest;
  std::optional<LedgerError> alert;

  {
    std::lock_guard<std::mutex> lk(mu_);
    auto reject = [&](LedgerError e) {
      ack.accept = false;
      ack.epoch = strategy_->epoch();
      ack.reason = std::move(e);
      return ack;
    };

    if (fork_) return reject(*fork_);
    if (p.strategy != strategy_->name()) {
      return reject(make_error(ErrorCode::proposal_mismatch,
                               "proposal uses strategy " + p.strategy + ", local is " +
                                   strategy_->name()));
    }
    if (p.segment_id != current_segment_id_) {
      return reject(make_error(ErrorCode::segment_state_invalid,
                               "proposal for segment " + std::to_string(p.segment_id) +
                                   ", expecting " + std::to_string(current_segment_id_)));
    }
    if (p.epoch < strategy_->epoch() || !strategy_->may_propose(p.proposer, p.epoch)) {
      return reject(make_error(ErrorCode::not_leader,
                               p.proposer + " may not propose in epoch " + std::to_string(p.epoch)));
    }
    if (compute_proposal_digest(p) != p.digest) {
      return reject(make_error(ErrorCode::proposal_mismatch, "proposal digest does not match"));
    }
    const uint64_t now = now_unix_ms();
    if (vote_held_locked(p.proposer, p.digest, now)) {
      return reject(make_error(ErrorCode::proposal_mismatch,
                               "segment " + std::to_string(p.segment_id) +
                                   ": already acknowledged a proposal from " +
                                   pending_->proposer));
    }

    uint64_t declared = 0;
    for (const auto& [node, r] : p.ranges) {
      const uint64_t from = frontier_.count(node) ? frontier_.at(node) : 0;
      if (r.first_seq != from || r.last_seq < r.first_seq) {
        return reject(make_error(ErrorCode::proposal_mismatch,
                                 "range for " + node + " does not start at the sealed frontier"));
      }
      declared += r.last_seq - r.first_seq + 1;
    }
    if (declared != p.order.size()) {
      return reject(make_error(ErrorCode::proposal_mismatch, "order does not cover the ranges"));
    }

    for (const auto& [node, r] : p.ranges) {
      if (pool_.count(node) <= r.last_seq) {
        LedgerError e = make_error(ErrorCode::not_found, "records of " + node + " not yet held");
        e.node_id = node;
        e.local_sequence = r.last_seq;
        return reject(e);
      }
    }

    auto records = collect_locked(p.ranges, &ack.reason);
    if (!records) return reject(ack.reason);
    std::map<std::pair<std::string, uint64_t>, const AuditRecord*> by_slot;
    for (const auto& r : *records) by_slot[{r.node_id, r.local_sequence}] = &r;

    std::vector<AuditRecord> ordered;
    ordered.reserve(p.order.size());
    for (const auto& ref : p.order) {
      auto it = by_slot.find({ref.node_id, ref.local_sequence});
      if (it == by_slot.end() || it->second == nullptr) {
        return reject(make_error(ErrorCode::proposal_mismatch, "slot outside ranges or repeated"));
      }
      if (it->second->record_hash != ref.record_hash) {
        LedgerError f = fork_at(ref.node_id, ref.local_sequence,
                                "proposal carries a different record for a held slot");
        enter_fork_locked(f);
        alert = f;
        reject(f);
        break;
      }
      ordered.push_back(*it->second);
      it->second = nullptr;
    }
    if (!alert) {
      for (const auto& [node, r] : p.ranges) {
        const std::string anchor =
            r.first_seq == 0 ? zero_digest() : pool_.hash_at(node, r.first_seq - 1).value_or("");
        if (anchor != r.anchor_hash) {
          return reject(make_error(ErrorCode::proposal_mismatch, "anchor mismatch for " + node));
        }
      }
      LedgerError cerr;
      if (!respects_causality(ordered, frontier_, &cerr)) return reject(cerr);
      if (!strategy_->accept_order(ordered)) {
        return reject(make_error(ErrorCode::proposal_mismatch, "order differs from canonical order"));
      }

      strategy_->observe_epoch(p.epoch);
      state_ = SegmentState::PendingQuorum;
      if (!pending_ || pending_->digest != p.digest) vote_expires_ms_ = now + options_.quorum_timeout_ms;
      pending_ = p;
      last_progress_ms_ = now;
      ack.accept = true;
      ack.epoch = strategy_->epoch();
      ack.reason = LedgerError{};
    }
  }

  if (alert) raise_consensus_alert(node_id(), *alert);
  return ack;
}

bool ConsensusCoordinator::check_certificate_locked(const SealedSegment& s,
                                                    LedgerError* error) const {
  if (s.strategy != strategy_->name()) {
    return fail(error, make_error(ErrorCode::proposal_mismatch,
                                  "segment sealed under strategy " + s.strategy));
  }
  std::vector<std::string> cert = s.certificate;
  std::sort(cert.begin(), cert.end());
  if (std::adjacent_find(cert.begin(), cert.end()) != cert.end()) {
    return fail(error, make_error(ErrorCode::segment_state_invalid, "duplicate certificate entry"));
  }
  for (const auto& n : cert) {
    if (!strategy_->is_known(n)) {
      return fail(error, make_error(ErrorCode::segment_state_invalid,
                                    "certificate names unknown node " + n));
    }
  }
  if (cert.size() < strategy_->quorum_size()) {
    return fail(error, make_error(ErrorCode::segment_state_invalid,
                                  "certificate below quorum: " + std::to_string(cert.size()) +
                                      " of " + std::to_string(strategy_->quorum_size())));
  }
  if (!std::binary_search(cert.begin(), cert.end(), s.proposer) ||
      !strategy_->may_propose(s.proposer, s.epoch)) {
    return fail(error, make_error(ErrorCode::not_leader,
                                  s.proposer + " was not entitled to seal in epoch " +
                                      std::to_string(s.epoch)));
  }
  if (compute_proposal_digest(s) != s.proposal_digest) {
    return fail(error, make_error(ErrorCode::proposal_mismatch, "segment digest mismatch"));
  }
  return true;
}

bool ConsensusCoordinator::seal_locked(SegmentPtr segment, LedgerError* error) {
  if (!can_transition(state_, SegmentState::Sealed)) {
    return fail(error, make_error(ErrorCode::segment_state_invalid,
                                  "cannot seal from state " + to_string(state_)));
  }
  if (archive_ && !archive_->put_segment(*segment, error)) return false;

  for (const auto& [node, r] : segment->ranges) frontier_[node] = r.last_seq + 1;
  sealed_.push_back(std::move(segment));
  ++current_segment_id_;
  state_ = SegmentState::Open;
  pending_.reset();
  last_progress_ms_ = now_unix_ms();
  return true;
}

RoundReport ConsensusCoordinator::run_round(const std::vector<ConsensusPeer*>& peers) {
  RoundReport rep;
  auto p = propose(&rep.error);
  if (!p) return rep;
  rep.segment_id = p->segment_id;

  std::vector<std::string> accepted{node_id()};
  std::vector<std::string> conflicting;
  std::optional<LedgerError> peer_fork;
  uint64_t max_epoch = p->epoch;

  for (ConsensusPeer* peer : peers) {
    if (!peer || peer->peer_id() == node_id()) continue;
    LedgerError err;
    auto ack = peer->request_ack(*p, &err);
    if (!ack) {
      log_line("consensus", "no acknowledgement from " + peer->peer_id() + ": " + err.detail);
      continue;
    }
    max_epoch = std::max(max_epoch, ack->epoch);
    if (ack->segment_id != p->segment_id || !strategy_->is_known(ack->node_id)) continue;
    if (ack->accept && ack->digest == p->digest) {
      if (std::find(accepted.begin(), accepted.end(), ack->node_id) == accepted.end()) {
        accepted.push_back(ack->node_id);
      }
    } else if (ack->accept || ack->reason.code == ErrorCode::proposal_mismatch) {
      conflicting.push_back(ack->node_id);
    } else if (ack->reason.code == ErrorCode::fork_detected) {
      peer_fork = ack->reason;
    } else {
      log_line("consensus", ack->node_id + " declined segment " +
                                std::to_string(p->segment_id) + ": " + ack->reason.detail);
    }
  }
  rep.acks = accepted.size();
  rep.conflicts = conflicting.size();

  if (peer_fork) {
    report_fork(*peer_fork);
    rep.error = *peer_fork;
    return rep;
  }

  SegmentPtr sealed;
  bool timed_out = false;
  std::optional<LedgerError> integrity;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!conflicting.empty()) strategy_->on_conflicting_acks(conflicting);
    if (max_epoch > strategy_->epoch()) strategy_->observe_epoch(max_epoch);

    if (!pending_ || pending_->digest != p->digest || pending_->proposer != node_id()) {
      rep.error = make_error(ErrorCode::segment_state_invalid,
                             "proposal superseded before quorum was counted");
      return rep;
    }
    if (accepted.size() < strategy_->quorum_size() || now_unix_ms() >= deadline_ms_) {
      timed_out = true;
      pending_.reset();
      strategy_->on_timeout();
      rep.error = make_error(ErrorCode::quorum_timeout,
                             std::to_string(accepted.size()) + " of " +
                                 std::to_string(strategy_->quorum_size()) +
                                 " acknowledgements before the deadline");
    } else {
      auto records = collect_locked(p->ranges, &rep.error);
      if (!records) return rep;
      std::map<std::pair<std::string, uint64_t>, AuditRecord*> by_slot;
      for (auto& r : *records) by_slot[{r.node_id, r.local_sequence}] = &r;

      auto seg = std::make_shared<SealedSegment>();
      seg->segment_id = p->segment_id;
      seg->epoch = p->epoch;
      seg->strategy = p->strategy;
      seg->proposer = p->proposer;
      seg->proposal_digest = p->digest;
      seg->ranges = p->ranges;
      seg->records.reserve(p->order.size());
      for (const auto& ref : p->order) seg->records.push_back(std::move(*by_slot.at({ref.node_id, ref.local_sequence})));
      seg->merkle_root = build_segment(seg->records);
      std::sort(accepted.begin(), accepted.end());
      seg->certificate = accepted;
      seg->sealed_at_unix_ms = now_unix_ms();
      seg->build_index();

      VerificationResult vr = verify_full(*seg);
      if (!vr.ok) {
        integrity = vr.error;
        rep.error = vr.error;
      } else if (seal_locked(seg, &rep.error)) {
        sealed = seg;
      }
    }
  }

  if (integrity) raise_consensus_alert(node_id(), *integrity);
  if (timed_out) {
    emit_round_event(LedgerEventKind::quorum_timeout, node_id(), false,
                     to_string(ErrorCode::quorum_timeout), rep.acks, rep.error.detail);
    return rep;
  }
  if (!sealed) return rep;

  rep.sealed = true;
  rep.merkle_root = sealed->merkle_root;
  emit_round_event(LedgerEventKind::seal, node_id(), true, "", sealed->records.size(),
                   sealed->merkle_root);
  notify_sealed(sealed);

  for (ConsensusPeer* peer : peers) {
    if (!peer || peer->peer_id() == node_id()) continue;
    LedgerError err;
    if (peer->install(sealed, &err)) {
      ++rep.installed;
    } else {
      log_line("consensus", "install of segment " + std::to_string(sealed->segment_id) + " on " +
                                peer->peer_id() + " failed: " + err.detail);
    }
  }
  return rep;
}

bool ConsensusCoordinator::install_sealed(const SegmentPtr& segment, LedgerError* error) {
  if (!segment) return fail(error, make_error(ErrorCode::invalid_argument, "null segment"));

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (segment->segment_id < current_segment_id_) {
      const SegmentPtr& mine = sealed_[static_cast<size_t>(segment->segment_id)];
      if (mine->merkle_root == segment->merkle_root) return true;
      return fail(error, make_error(ErrorCode::segment_state_invalid,
                                    "segment " + std::to_string(segment->segment_id) +
                                        " already sealed with a different root"));
    }
    if (fork_) return fail(error, *fork_);
    if (segment->segment_id != current_segment_id_) {
      return fail(error, make_error(ErrorCode::segment_state_invalid,
                                    "segment " + std::to_string(segment->segment_id) +
                                        " is not next; expecting " +
                                        std::to_string(current_segment_id_)));
    }
    if (!check_certificate_locked(*segment, error)) return false;
  }

  VerificationResult vr = verify_full(*segment);
  if (!vr.ok) {
    raise_consensus_alert(node_id(), vr.error);
    return fail(error, vr.error);
  }

  // Records this node has not synced yet arrive with the segment.
  if (!pool_.commit(segment->records, error)) return false;

  std::optional<LedgerError> alert;
  bool ok = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (fork_) return fail(error, *fork_);
    if (segment->segment_id != current_segment_id_) {
      return fail(error, make_error(ErrorCode::segment_state_invalid,
                                    "segment " + std::to_string(segment->segment_id) +
                                        " was overtaken during install"));
    }
    for (const auto& [node, r] : segment->ranges) {
      const uint64_t from = frontier_.count(node) ? frontier_.at(node) : 0;
      if (r.first_seq != from) {
        return fail(error, make_error(ErrorCode::segment_state_invalid,
                                      "segment range for " + node + " is not contiguous"));
      }
    }
    for (const auto& r : segment->records) {
      auto held = pool_.hash_at(r.node_id, r.local_sequence, error);
      if (!held) return false;
      if (*held != r.record_hash) {
        LedgerError f = fork_at(r.node_id, r.local_sequence,
                                "sealed segment disagrees with the held record");
        enter_fork_locked(f);
        alert = f;
        fail(error, f);
        break;
      }
    }
    if (!alert) {
      if (state_ == SegmentState::Open) state_ = SegmentState::PendingQuorum;
      strategy_->observe_epoch(segment->epoch);
      ok = seal_locked(segment, error);
    }
  }
  if (alert) {
    raise_consensus_alert(node_id(), *alert);
    return false;
  }
  if (ok) {
    emit_round_event(LedgerEventKind::seal, node_id(), true, "", segment->records.size(),
                     segment->merkle_root);
    notify_sealed(segment);
  }
  return ok;
}

size_t ConsensusCoordinator::catch_up(ConsensusPeer& peer, LedgerError* error) {
  size_t installed = 0;
  for (;;) {
    const uint64_t next = current_segment_id();
    LedgerError ferr;
    SegmentPtr seg = peer.fetch_segment(next, &ferr);
    if (!seg) {
      if (ferr.code != ErrorCode::not_found) fail(error, ferr);
      break;
    }
    if (!install_sealed(seg, error)) break;
    ++installed;
  }
  return installed;
}

bool ConsensusCoordinator::check_timeouts(uint64_t now_ms) {
  bool proposer_timeout = false;
  bool leader_silent = false;
  uint64_t segment_id = 0;
  std::string released;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (fork_) return false;
    segment_id = current_segment_id_;
    if (pending_ && pending_->proposer != node_id() && now_ms >= vote_expires_ms_) {
      released = pending_->proposer;
      pending_.reset();
    }
    if (pending_ && pending_->proposer == node_id() && now_ms >= deadline_ms_) {
      pending_.reset();
      strategy_->on_timeout();
      proposer_timeout = true;
    } else if (strategy_->has_leader() && !strategy_->may_propose(node_id(), strategy_->epoch())) {
      // The leader is only expected to make progress while there is
      // something to seal.
      bool unsealed = false;
      for (const auto& [node, head] : pool_.tips()) {
        const uint64_t from = frontier_.count(node) ? frontier_.at(node) : 0;
        if (head.local_sequence + 1 > from) {
          unsealed = true;
          break;
        }
      }
      if (!unsealed) {
        last_progress_ms_ = now_ms;
      } else if (now_ms >= last_progress_ms_ + options_.quorum_timeout_ms) {
        strategy_->on_timeout();
        last_progress_ms_ = now_ms;
        leader_silent = true;
      }
    }
  }

  if (!released.empty()) {
    log_line("consensus", node_id() + ": acknowledgement for " + released + " on segment " +
                              std::to_string(segment_id) + " expired");
  }
  if (proposer_timeout) {
    emit_round_event(LedgerEventKind::quorum_timeout, node_id(), false,
                     to_string(ErrorCode::quorum_timeout), 0,
                     "segment " + std::to_string(segment_id) + " past its deadline");
  }
  if (leader_silent) {
    log_line("consensus", node_id() + ": no progress from the leader; moving to epoch " +
                              std::to_string(epoch()));
  }
  return proposer_timeout || leader_silent;
}

void ConsensusCoordinator::report_fork(const LedgerError& fork) {
  std::lock_guard<std::mutex> lk(mu_);
  enter_fork_locked(fork);
}

SegmentState ConsensusCoordinator::state(uint64_t segment_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (segment_id < current_segment_id_) return SegmentState::Sealed;
  if (segment_id == current_segment_id_) return state_;
  return SegmentState::Open;
}

SegmentState ConsensusCoordinator::current_state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

uint64_t ConsensusCoordinator::current_segment_id() const {
  std::lock_guard<std::mutex> lk(mu_);
  return current_segment_id_;
}

std::map<std::string, uint64_t> ConsensusCoordinator::sealed_frontier() const {
  std::lock_guard<std::mutex> lk(mu_);
  return frontier_;
}

std::vector<SegmentPtr> ConsensusCoordinator::sealed_segments() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sealed_;
}

SegmentPtr ConsensusCoordinator::segment(uint64_t segment_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (segment_id >= sealed_.size()) return nullptr;
  return sealed_[static_cast<size_t>(segment_id)];
}

std::optional<LedgerError> ConsensusCoordinator::fork() const {
  std::lock_guard<std::mutex> lk(mu_);
  return fork_;
}

bool ConsensusCoordinator::may_propose() const {
  std::lock_guard<std::mutex> lk(mu_);
  return !fork_ && strategy_->may_propose(node_id(), strategy_->epoch());
}

void ConsensusCoordinator::add_seal_listener(SealListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.push_back(std::move(listener));
}

void ConsensusCoordinator::notify_sealed(const SegmentPtr& segment) {
  std::vector<SealListener> listeners;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners = listeners_;
  }
  for (const auto& l : listeners) l(segment);
}

std::string ConsensusCoordinator::strategy_name() const {
  std::lock_guard<std::mutex> lk(mu_);
  return strategy_->name();
}

uint64_t ConsensusCoordinator::epoch() const {
  std::lock_guard<std::mutex> lk(mu_);
  return strategy_->epoch();
}

size_t ConsensusCoordinator::quorum_size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return strategy_->quorum_size();
}

std::optional<std::string> ConsensusCoordinator::export_root(uint64_t segment_id,
                                                             LedgerError* error) const {
  SegmentPtr seg = segment(segment_id);
  if (!seg) {
    fail(error, make_error(ErrorCode::not_found,
                           "segment " + std::to_string(segment_id) + " is not sealed"));
    return std::nullopt;
  }
  VerificationResult vr = verify_full(*seg);
  if (!vr.ok) {
    raise_consensus_alert(node_id(), vr.error);
    fail(error, vr.error);
    return std::nullopt;
  }
  return seg->merkle_root;
}

bool ConsensusCoordinator::import_attestation(uint64_t segment_id, Attestation proof,
                                              LedgerError* error) {
  SegmentPtr seg = segment(segment_id);
  if (!seg) {
    return fail(error, make_error(ErrorCode::not_found,
                                  "segment " + std::to_string(segment_id) + " is not sealed"));
  }
  if (proof.segment_id != segment_id && proof.segment_id != 0) {
    return fail(error, make_error(ErrorCode::invalid_argument, "attestation names another segment"));
  }
  if (proof.merkle_root != seg->merkle_root) {
    return fail(error, make_error(ErrorCode::invalid_argument, "attestation names another root"));
  }
  if (proof.proof.empty()) {
    return fail(error, make_error(ErrorCode::invalid_argument, "empty attestation proof"));
  }
  proof.segment_id = segment_id;
  if (proof.imported_at_unix_ms == 0) proof.imported_at_unix_ms = now_unix_ms();

  if (archive_ && !archive_->put_attestation(proof, error)) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    attestations_[segment_id].push_back(proof);
  }
  emit_round_event(LedgerEventKind::attestation, node_id(), true, "", 1,
                   proof.authority + " on segment " + std::to_string(segment_id));
  return true;
}

std::vector<Attestation> ConsensusCoordinator::attestations(uint64_t segment_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = attestations_.find(segment_id);
  return it == attestations_.end() ? std::vector<Attestation>{} : it->second;
}

bool ConsensusCoordinator::restore(LedgerError* error) {
  if (!archive_) return true;
  for (uint64_t id : archive_->segment_ids()) {
    if (id != current_segment_id()) {
      return fail(error, make_error(ErrorCode::integrity_violation,
                                    "archive has a gap before segment " + std::to_string(id)));
    }
    auto loaded = archive_->get_segment(id, error);
    if (!loaded) return false;
    VerificationResult vr = verify_full(*loaded);
    if (!vr.ok) {
      raise_consensus_alert(node_id(), vr.error);
      return fail(error, vr.error);
    }
    SegmentPtr seg = std::make_shared<const SealedSegment>(std::move(*loaded));
    if (!pool_.commit(seg->records, error)) return false;

    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!check_certificate_locked(*seg, error)) return false;
      for (const auto& r : seg->records) {
        auto held = pool_.hash_at(r.node_id, r.local_sequence, error);
        if (!held) return false;
        if (*held != r.record_hash) {
          LedgerError f =
              fork_at(r.node_id, r.local_sequence, "archived segment disagrees with chain");
          enter_fork_locked(f);
          return fail(error, f);
        }
      }
      state_ = SegmentState::PendingQuorum;
      strategy_->observe_epoch(seg->epoch);
      if (!seal_locked(seg, error)) return false;
      for (auto& a : archive_->attestations(id)) attestations_[id].push_back(std::move(a));
    }
    notify_sealed(seg);
  }
  if (current_segment_id() > 0) {
    log_line("consensus", "restored " + std::to_string(current_segment_id()) + " sealed segments");
  }
  return true;
}

// ---------------------------------------------------------------------------
// LocalConsensusPeer
// ---------------------------------------------------------------------------

bool LocalConsensusPeer::reachable(LedgerError* error) const {
  if (reachable_.load()) return true;
  return fail(error, make_error(ErrorCode::peer_unreachable, remote_.node_id() + " unreachable"));
}

std::optional<Ack> LocalConsensusPeer::request_ack(const Proposal& proposal, LedgerError* error) {
  if (!reachable(error)) return std::nullopt;
  return remote_.validate_proposal(proposal);
}

bool LocalConsensusPeer::install(const SegmentPtr& segment, LedgerError* error) {
  if (!reachable(error)) return false;
  return remote_.install_sealed(segment, error);
}

SegmentPtr LocalConsensusPeer::fetch_segment(uint64_t segment_id, LedgerError* error) {
  if (!reachable(error)) return nullptr;
  SegmentPtr seg = remote_.segment(segment_id);
  if (!seg) {
    fail(error, make_error(ErrorCode::not_found,
                           "segment " + std::to_string(segment_id) + " not sealed on " +
                               remote_.node_id()));
  }
  return seg;
}

}  // namespace lexledger
