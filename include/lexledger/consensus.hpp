#pragma once

// lexledger/consensus.hpp - Canonical ordering and sealing of segments.
//
// ROUND (proposer side, run_round()):
//   1. propose(): collect, per node, every pooled record past the sealed
//      frontier; order them with the active strategy; stamp epoch and
//      proposal digest. Current segment moves Open -> PendingQuorum.
//   2. request_ack() on each peer. A follower accepts only if it holds every
//      proposed record with the same hash, the ranges start at its own sealed
//      frontier, the set is causally closed, the strategy accepts the
//      proposer and the order, and it has not acknowledged a different
//      proposer's proposal for the same segment within quorum_timeout_ms.
//   3. With quorum_size() acceptances (proposer included), collected before
//      the proposal's deadline, the segment is sealed locally, archived, and
//      installed on every reachable peer. Otherwise the round is a
//      quorum_timeout: the segment stays PendingQuorum and
//      strategy.on_timeout() runs.
//
// INVARIANTS:
//   - Sealed segments are immutable and shared as SegmentPtr; readers never
//     lock.
//   - Segments are contiguous: segment k+1 starts, for every node, where
//     segment k ended.
//   - A slot held with two different hashes is never resolved here. The
//     current segment moves to ForkDetected, which is terminal; no segment is
//     proposed or installed on this coordinator afterwards.
//   - No coordinator lock is held across a peer call.
//   - One vote per segment. A vote lasts quorum_timeout_ms from the moment it
//     is cast, and a proposer only seals before its own deadline, which
//     started earlier. Two proposals for one segment can therefore never
//     both collect a majority.
//
// DEFAULT STRATEGY: MajorityStrategy. Every node recomputes the same order
// (causal rank, node_id, local_sequence), so a proposal is ratified by plain
// majority. LeaderStrategy and BftStrategy are optional; a cluster runs one
// strategy, and proposals naming a different strategy are refused.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "lexledger/archive.hpp"
#include "lexledger/record.hpp"
#include "lexledger/segment.hpp"
#include "lexledger/sync.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

// Deterministic linear extension of causal order: causal rank (sum of clock
// entries), then node_id, then local_sequence.
std::vector<AuditRecord> canonical_order(std::vector<AuditRecord> records);

// ---------------------------------------------------------------------------
// OrderingStrategy - capability interface, chosen once per deployment
// ---------------------------------------------------------------------------
// Not thread-safe; the owning ConsensusCoordinator serializes every call.
class OrderingStrategy {
 public:
  explicit OrderingStrategy(std::vector<std::string> known_nodes);
  virtual ~OrderingStrategy() = default;

  virtual std::string name() const = 0;

  // Orders a causally closed record set for a new segment.
  virtual std::vector<AuditRecord> propose(std::vector<AuditRecord> records) const;

  // Acknowledgements (proposer included) needed to seal.
  virtual size_t quorum_size() const = 0;

  // A round failed to reach quorum, or the leader stopped making progress.
  virtual void on_timeout() {}

  virtual uint64_t epoch() const { return 0; }
  virtual void observe_epoch(uint64_t /*epoch*/) {}

  // True if node_id is entitled to propose in `epoch`.
  virtual bool may_propose(const std::string& node_id, uint64_t epoch) const;

  // True when a single node drives ordering and followers must watch it.
  virtual bool has_leader() const { return false; }

  // `proposed` has already been checked for causal validity.
  virtual bool accept_order(const std::vector<AuditRecord>& proposed) const;

  // Nodes whose acknowledgement named a different digest for this round.
  virtual void on_conflicting_acks(const std::vector<std::string>& /*nodes*/) {}

  const std::vector<std::string>& known_nodes() const { return known_; }
  bool is_known(const std::string& node_id) const;

 protected:
  std::vector<std::string> known_;  // sorted, unique
};

class MajorityStrategy : public OrderingStrategy {
 public:
  using OrderingStrategy::OrderingStrategy;

  std::string name() const override { return "majority"; }
  size_t quorum_size() const override { return known_.size() / 2 + 1; }
};

// Raft-like: one leader per epoch assigns the order; followers replicate.
// Leader of epoch e is known_nodes[e % n]. A timeout advances the epoch,
// electing the next node round-robin; it resumes from the sealed frontier.
class LeaderStrategy : public OrderingStrategy {
 public:
  using OrderingStrategy::OrderingStrategy;

  std::string name() const override { return "leader"; }
  size_t quorum_size() const override { return known_.size() / 2 + 1; }
  void on_timeout() override { ++epoch_; }
  uint64_t epoch() const override { return epoch_; }
  void observe_epoch(uint64_t epoch) override;
  bool may_propose(const std::string& node_id, uint64_t epoch) const override;
  bool has_leader() const override { return true; }
  bool accept_order(const std::vector<AuditRecord>& proposed) const override;

  const std::string& leader() const;

 private:
  uint64_t epoch_{0};
};

// PBFT-like: n >= 3f + 1 replicas tolerate f faulty ones. Quorum is 2f + 1.
// Every replica recomputes the order; an acknowledgement for another digest
// marks its sender suspected. More than f conflicts, or a timeout, starts a
// view change (next primary round-robin).
class BftStrategy : public OrderingStrategy {
 public:
  using OrderingStrategy::OrderingStrategy;

  std::string name() const override { return "bft"; }
  size_t faults_tolerated() const { return known_.empty() ? 0 : (known_.size() - 1) / 3; }
  size_t quorum_size() const override { return 2 * faults_tolerated() + 1; }
  void on_timeout() override { ++view_; }
  uint64_t epoch() const override { return view_; }
  void observe_epoch(uint64_t epoch) override;
  bool may_propose(const std::string& node_id, uint64_t epoch) const override;
  bool has_leader() const override { return true; }
  void on_conflicting_acks(const std::vector<std::string>& nodes) override;

  const std::string& primary() const;
  const std::set<std::string>& suspected() const { return suspected_; }

 private:
  uint64_t view_{0};
  std::set<std::string> suspected_;
};

// "majority" | "leader" | "bft". bft requires at least 4 known nodes.
std::unique_ptr<OrderingStrategy> make_strategy(const std::string& name,
                                                std::vector<std::string> known_nodes,
                                                LedgerError* error = nullptr);

// ---------------------------------------------------------------------------
// Wire types
// ---------------------------------------------------------------------------
struct RecordRef {
  std::string node_id;
  uint64_t local_sequence{0};
  std::string record_hash;
};

struct Proposal {
  uint64_t segment_id{0};
  uint64_t epoch{0};
  std::string proposer;
  std::string strategy;
  std::map<std::string, NodeRange> ranges;
  std::vector<RecordRef> order;
  std::string digest;
};

struct Ack {
  uint64_t segment_id{0};
  uint64_t epoch{0};
  std::string node_id;
  std::string digest;
  bool accept{false};
  LedgerError reason;
};

// H("prop:" || segment id, strategy, ranges, ordered record hashes).
std::string compute_proposal_digest(uint64_t segment_id, const std::string& strategy,
                                    const std::map<std::string, NodeRange>& ranges,
                                    const std::vector<std::string>& ordered_hashes);
std::string compute_proposal_digest(const Proposal& p);
std::string compute_proposal_digest(const SealedSegment& s);

// ---------------------------------------------------------------------------
// ConsensusPeer - transport abstraction
// ---------------------------------------------------------------------------
class ConsensusPeer {
 public:
  virtual ~ConsensusPeer() = default;

  virtual std::string peer_id() const = 0;
  virtual std::optional<Ack> request_ack(const Proposal& proposal,
                                         LedgerError* error = nullptr) = 0;
  virtual bool install(const SegmentPtr& segment, LedgerError* error = nullptr) = 0;
  virtual SegmentPtr fetch_segment(uint64_t segment_id, LedgerError* error = nullptr) = 0;
};

// Called after a segment is sealed or installed, outside the coordinator
// lock, in segment order.
using SealListener = std::function<void(const SegmentPtr&)>;

struct ConsensusOptions {
  uint64_t quorum_timeout_ms{5000};
};

struct RoundReport {
  uint64_t segment_id{0};
  bool sealed{false};
  size_t acks{0};
  size_t conflicts{0};
  size_t installed{0};
  std::string merkle_root;
  LedgerError error;

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// ConsensusCoordinator
// ---------------------------------------------------------------------------
class ConsensusCoordinator {
 public:
  ConsensusCoordinator(RecordPool& pool, std::unique_ptr<OrderingStrategy> strategy,
                       ConsensusOptions options = {},
                       std::shared_ptr<ISegmentArchive> archive = nullptr);

  ConsensusCoordinator(const ConsensusCoordinator&) = delete;
  ConsensusCoordinator& operator=(const ConsensusCoordinator&) = delete;

  // Reloads sealed segments and attestations from the archive, checking
  // each segment against the pooled chains. Call after the pool is open.
  bool restore(LedgerError* error = nullptr);

  // Proposer side.
  std::optional<Proposal> propose(LedgerError* error = nullptr);
  RoundReport run_round(const std::vector<ConsensusPeer*>& peers);

  // Follower side.
  Ack validate_proposal(const Proposal& proposal);
  bool install_sealed(const SegmentPtr& segment, LedgerError* error = nullptr);

  // Installs every segment a peer sealed past our own, in order.
  size_t catch_up(ConsensusPeer& peer, LedgerError* error = nullptr);

  // Proposer deadline, vote expiry and leader liveness. Returns true if the
  // proposer deadline or the leader timeout fired.
  bool check_timeouts(uint64_t now_ms);

  // A fork found elsewhere (sync). The current segment becomes ForkDetected.
  void report_fork(const LedgerError& fork);

  SegmentState state(uint64_t segment_id) const;
  SegmentState current_state() const;
  uint64_t current_segment_id() const;
  std::map<std::string, uint64_t> sealed_frontier() const;
  std::vector<SegmentPtr> sealed_segments() const;
  SegmentPtr segment(uint64_t segment_id) const;
  std::optional<LedgerError> fork() const;

  // True if this node is entitled to propose in the current epoch and no
  // fork has halted it.
  bool may_propose() const;

  // Notarization interface. export_root() fully verifies the segment first.
  std::optional<std::string> export_root(uint64_t segment_id, LedgerError* error = nullptr) const;
  bool import_attestation(uint64_t segment_id, Attestation proof, LedgerError* error = nullptr);
  std::vector<Attestation> attestations(uint64_t segment_id) const;

  void add_seal_listener(SealListener listener);

  const std::string& node_id() const { return pool_.local_node_id(); }
  std::string strategy_name() const;
  uint64_t epoch() const;
  size_t quorum_size() const;

 private:
  bool vote_held_locked(const std::string& proposer, const std::string& digest,
                        uint64_t now_ms) const;
  bool seal_locked(SegmentPtr segment, LedgerError* error);
  bool check_certificate_locked(const SealedSegment& s, LedgerError* error) const;
  void enter_fork_locked(const LedgerError& fork);
  void notify_sealed(const SegmentPtr& segment);
  std::optional<std::vector<AuditRecord>> collect_locked(
      const std::map<std::string, NodeRange>& ranges, LedgerError* error) const;

  RecordPool& pool_;
  std::unique_ptr<OrderingStrategy> strategy_;
  ConsensusOptions options_;
  std::shared_ptr<ISegmentArchive> archive_;

  mutable std::mutex mu_;
  uint64_t current_segment_id_{0};
  SegmentState state_{SegmentState::Open};
  std::map<std::string, uint64_t> frontier_;  // records sealed per node
  std::vector<SegmentPtr> sealed_;
  std::map<uint64_t, std::vector<Attestation>> attestations_;
  std::optional<Proposal> pending_;
  uint64_t deadline_ms_{0};
  uint64_t vote_expires_ms_{0};
  uint64_t last_progress_ms_{0};
  std::optional<LedgerError> fork_;

  std::mutex listeners_mu_;
  std::vector<SealListener> listeners_;
};

// ---------------------------------------------------------------------------
// LocalConsensusPeer - in-process transport to another coordinator
// ---------------------------------------------------------------------------
class LocalConsensusPeer : public ConsensusPeer {
 public:
  explicit LocalConsensusPeer(ConsensusCoordinator& remote) : remote_(remote) {}

  std::string peer_id() const override { return remote_.node_id(); }
  std::optional<Ack> request_ack(const Proposal& proposal, LedgerError* error = nullptr) override;
  bool install(const SegmentPtr& segment, LedgerError* error = nullptr) override;
  SegmentPtr fetch_segment(uint64_t segment_id, LedgerError* error = nullptr) override;

  void set_reachable(bool reachable) { reachable_.store(reachable); }

 private:
  bool reachable(LedgerError* error) const;

  ConsensusCoordinator& remote_;
  std::atomic<bool> reachable_{true};
};

}  // namespace lexledger
