#pragma once

// lexledger/node.hpp - One ledger node: local chain, replicas, open Merkle
// segment, synchronizer, consensus coordinator and archive.
//
// OWNERSHIP:
//   LedgerNode owns every component. Components refer to each other by
//   reference, so the node is neither copyable nor movable.
//
// OPEN SEGMENT:
//   The node keeps an incremental MerkleTree over its own records that are
//   not yet sealed. It is fed by the ledger's append listener (inside the
//   append critical section) and cut back to the new frontier whenever a
//   segment is sealed. Readers get a snapshot under a separate lock.
//
// STARTUP (start()):
//   1. Replay the local chain (HashChainLedger::recover).
//   2. Open a replica for every known peer and replay it.
//   3. Restore sealed segments and attestations from the archive.
//   4. Rebuild the open tree from the unsealed local suffix.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/archive.hpp"
#include "lexledger/cluster.hpp"
#include "lexledger/config.hpp"
#include "lexledger/consensus.hpp"
#include "lexledger/ledger.hpp"
#include "lexledger/merkle.hpp"
#include "lexledger/query.hpp"
#include "lexledger/scheduler.hpp"
#include "lexledger/store.hpp"
#include "lexledger/sync.hpp"

namespace lexledger {

class LedgerNode {
 public:
  // Builds stores and archive from config: FileRecordStore under
  // store_path (memory when empty), FileSegmentArchive under archive_path
  // (none when empty). Does not call start().
  static std::unique_ptr<LedgerNode> open(const LedgerConfig& config,
                                          LedgerError* error = nullptr);

  LedgerNode(LedgerConfig config, std::shared_ptr<IRecordStore> local_store,
             StoreFactory replica_factory, std::shared_ptr<ISegmentArchive> archive,
             std::unique_ptr<OrderingStrategy> strategy);
  ~LedgerNode();

  LedgerNode(const LedgerNode&) = delete;
  LedgerNode& operator=(const LedgerNode&) = delete;

  bool start(LedgerError* error = nullptr);

  // Decision producer entry points. Either durably appended or an error.
  std::optional<AuditRecord> record_decision(EventType event_type, Actor actor,
                                             std::string statute_id, std::string subject_id,
                                             std::string decision_context,
                                             std::string decision_result,
                                             LedgerError* error = nullptr);
  std::optional<AuditRecord> record_correction(const std::string& corrected_id,
                                               EventType event_type, Actor actor,
                                               std::string statute_id, std::string subject_id,
                                               std::string decision_context,
                                               std::string decision_result,
                                               LedgerError* error = nullptr);

  // Synchronous sync round; folds the report into the peer registry and
  // hands forks to the coordinator.
  SyncReport sync_with(SyncPeer& peer);

  // Consensus round over the given peers.
  RoundReport seal(const std::vector<ConsensusPeer*>& peers);

  // Background sync against `peers` (SyncScheduler). Idempotent.
  void start_background_sync(const std::vector<std::shared_ptr<SyncPeer>>& peers);
  void stop_background_sync();

  // Background consensus against `peers` (ConsensusScheduler), ticking every
  // quorum_timeout_ms with backoff after a quorum_timeout. Idempotent.
  void start_background_consensus(const std::vector<std::shared_ptr<ConsensusPeer>>& peers);
  void stop_background_consensus();

  // Open segment (own unsealed records).
  std::optional<std::string> open_root() const;
  uint64_t open_size() const;
  uint64_t open_first_sequence() const;
  std::optional<MerkleProof> prove_open(uint64_t local_sequence) const;

  // Sampled check of a sealed segment at the configured rate.
  VerificationResult verify_segment_sampled(uint64_t segment_id, uint64_t seed) const;

  std::vector<AuditRecord> query(const RecordQuery& q) const;
  ComplianceSummary compliance_summary() const;

  std::string status_to_json() const;

  const LedgerConfig& config() const { return config_; }
  const std::string& node_id() const { return config_.node_id; }
  HashChainLedger& ledger() { return *ledger_; }
  RecordPool& pool() { return *pool_; }
  Synchronizer& synchronizer() { return *sync_; }
  ConsensusCoordinator& coordinator() { return *coordinator_; }
  PeerRegistry& peers() { return peers_; }

 private:
  void on_append(const AuditRecord& record);
  void on_sealed(const SegmentPtr& segment);
  void on_sync_report(const SyncReport& report);

  LedgerConfig config_;
  std::shared_ptr<IRecordStore> store_;
  std::unique_ptr<HashChainLedger> ledger_;
  std::unique_ptr<RecordPool> pool_;
  std::unique_ptr<Synchronizer> sync_;
  std::unique_ptr<ConsensusCoordinator> coordinator_;
  PeerRegistry peers_;
  std::unique_ptr<SyncScheduler> scheduler_;
  std::unique_ptr<ConsensusScheduler> consensus_scheduler_;

  mutable std::mutex open_mu_;
  MerkleTree open_tree_;
  uint64_t open_first_{0};  // local_sequence of open_tree_ leaf 0
};

}  // namespace lexledger
