#pragma once

// lexledger/sync.hpp - Vector-clock synchronization between writer nodes.
//
// MODEL:
//   Each node holds its own chain (HashChainLedger) plus replicas of every
//   other node's chain (RecordPool). The pool's frontier is a vector clock:
//   frontier[n] == number of node n's records held locally. A remote record
//   (n, s) is missing iff frontier[n] <= s, i.e. the frontier does not cover
//   the record's own clock entry.
//
// PROTOCOL (one sync_with() round, initiator side):
//   1. summary(): peer returns protocol versions and per-node chain tips.
//   2. Fork check: for each node both sides hold, compare record hashes at
//      the lower of the two tips. Equal hashes imply equal prefixes (each
//      record commits to its predecessor). Unequal hashes are narrowed to
//      the first divergent slot by binary search and reported as
//      fork_detected. The forked node is quarantined; never auto-merged.
//   3. Pull: fetch missing ranges one batch per node at a time and merge
//      them by causal rank (sum of clock entries, then node_id, then
//      local_sequence; a linear extension of causal order), committing each
//      batch before the next fetch. At most batch_size records per node are
//      buffered.
//   4. Push: deliver what the peer is missing, in the same order.
//
// INVARIANTS:
//   - RecordPool::commit() validates a whole batch before writing any of it.
//     A rejected batch changes nothing.
//   - Records are deduplicated by id; repeating a sync is a no-op.
//   - A record is only accepted once its causal history (every clock entry)
//     is already held, so replicas are always causally closed.
//   - Cancellation is checked between batches; a cancelled round leaves
//     only fully validated batches behind.
//
// LOCK ORDER: RecordPool::mu_ -> HashChainLedger::mu_ -> RecordPool::ids_mu_.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "lexledger/channel.hpp"
#include "lexledger/clock.hpp"
#include "lexledger/ledger.hpp"
#include "lexledger/record.hpp"
#include "lexledger/store.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
  void reset() { cancelled_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct TipSummary {
  uint32_t sync_protocol{0};
  uint32_t hash_algorithm{0};
  std::string node_id;
  std::map<std::string, ChainHead> tips;
};

struct SyncReport {
  std::string peer_id;
  uint64_t received{0};   // records newly committed locally
  uint64_t sent{0};       // records the peer newly committed
  uint64_t conflicts{0};  // received records concurrent with the local clock
  bool cancelled{false};
  std::vector<LedgerError> errors;
  uint32_t peer_sync_protocol{0};  // as announced in the handshake; 0 if none
  uint32_t peer_hash_algorithm{0};

  bool empty() const { return received == 0 && sent == 0 && conflicts == 0; }
  bool ok() const { return errors.empty() && !cancelled; }
  std::string to_json() const;
};

struct InboundBatch {
  std::string peer_id;
  std::vector<AuditRecord> records;
};

// Orders records by causal rank: sum of clock entries, node_id, local_sequence.
void sort_causally(std::vector<AuditRecord>& records);

// ---------------------------------------------------------------------------
// RecordPool - local chain + replicas of remote chains
// ---------------------------------------------------------------------------
class RecordPool {
 public:
  RecordPool(HashChainLedger& local, StoreFactory replica_factory);

  RecordPool(const RecordPool&) = delete;
  RecordPool& operator=(const RecordPool&) = delete;

  // Indexes the ids of the local chain. Run again after the ledger's
  // recover(), which may have found records the constructor could not see.
  bool index_local(LedgerError* error = nullptr);

  // Opens (or creates) the replica store for node_id and replays it,
  // checking every record and link. Used at startup for known nodes.
  bool open_replica(const std::string& node_id, LedgerError* error = nullptr);

  const std::string& local_node_id() const { return local_.node_id(); }
  HashChainLedger& local() { return local_; }

  std::map<std::string, ChainHead> tips() const;
  VectorClock frontier() const;
  uint64_t count(const std::string& node_id) const;
  std::set<std::string> nodes() const;
  uint64_t total() const;

  // Inclusive [from, to] of one node's chain (local or replica).
  std::optional<std::vector<AuditRecord>> read(const std::string& node_id, uint64_t from,
                                               uint64_t to, LedgerError* error = nullptr) const;
  std::optional<std::string> hash_at(const std::string& node_id, uint64_t seq,
                                     LedgerError* error = nullptr) const;

  bool contains_id(const std::string& id) const;

  // Validates the batch as a whole, then persists it. Duplicates (same id,
  // same slot, same hash) are skipped. Returns the number of newly stored
  // records. After a commit the local ledger observes the merged clock.
  std::optional<uint64_t> commit(const std::vector<AuditRecord>& batch,
                                 LedgerError* error = nullptr);

  void mark_forked(const std::string& node_id, const LedgerError& fork);
  bool is_forked(const std::string& node_id) const;
  std::vector<LedgerError> forks() const;

 private:
  struct Overlay {
    uint64_t count{0};
    std::string tip_hash;
  };

  uint64_t count_locked(const std::string& node_id) const;
  std::optional<std::string> hash_at_locked(const std::string& node_id, uint64_t seq,
                                            LedgerError* error) const;
  void add_id(const std::string& id);

  HashChainLedger& local_;
  StoreFactory factory_;

  mutable std::mutex mu_;
  std::map<std::string, std::unique_ptr<IRecordStore>> replicas_;
  std::map<std::string, std::string> replica_tips_;
  std::map<std::string, LedgerError> forked_;

  mutable std::mutex ids_mu_;
  std::unordered_set<std::string> ids_;
};

// ---------------------------------------------------------------------------
// SyncPeer - transport abstraction
// ---------------------------------------------------------------------------
// Implementations must be safe to call from a background task. A transport
// failure is reported as peer_unreachable and never mutates local state.
class SyncPeer {
 public:
  virtual ~SyncPeer() = default;

  virtual std::string peer_id() const = 0;
  virtual std::optional<TipSummary> summary(LedgerError* error = nullptr) = 0;
  virtual std::optional<std::vector<AuditRecord>> fetch(const std::string& node_id,
                                                        uint64_t from, uint64_t to,
                                                        LedgerError* error = nullptr) = 0;
  virtual std::optional<uint64_t> deliver(const std::vector<AuditRecord>& batch,
                                          LedgerError* error = nullptr) = 0;
};

struct SyncOptions {
  uint64_t batch_size{256};
};

// ---------------------------------------------------------------------------
// Synchronizer
// ---------------------------------------------------------------------------
class Synchronizer {
 public:
  Synchronizer(RecordPool& pool, SyncOptions options = {});

  // Full round: fork check, pull (committed directly), push.
  SyncReport sync_with(SyncPeer& peer, const CancellationToken* cancel = nullptr);

  // Background variant: fork check and pull, with each ordered batch pushed
  // onto `inbound` instead of being committed. received counts records
  // enqueued; the ingest task commits them with ingest().
  SyncReport pull_into(SyncPeer& peer, BoundedChannel<InboundBatch>& inbound,
                       const CancellationToken* cancel = nullptr);

  // Push half only.
  SyncReport push_to(SyncPeer& peer, const CancellationToken* cancel = nullptr);

  // Ingest side of the channel.
  std::optional<uint64_t> ingest(const InboundBatch& batch, LedgerError* error = nullptr);

  // Serving side (what a transport exposes to remote initiators).
  TipSummary local_summary() const;
  std::optional<std::vector<AuditRecord>> serve_fetch(const std::string& node_id, uint64_t from,
                                                      uint64_t to,
                                                      LedgerError* error = nullptr) const;
  std::optional<uint64_t> accept(const std::vector<AuditRecord>& batch,
                                 LedgerError* error = nullptr);

  RecordPool& pool() { return pool_; }
  const SyncOptions& options() const { return options_; }

 private:
  using BatchSink = std::function<bool(std::vector<AuditRecord>&&, SyncReport&)>;

  bool handshake(SyncPeer& peer, SyncReport& report, TipSummary* remote);
  void check_forks(SyncPeer& peer, const TipSummary& remote, SyncReport& report,
                   const CancellationToken* cancel);
  void pull(SyncPeer& peer, const TipSummary& remote, SyncReport& report,
            const CancellationToken* cancel, const BatchSink& sink);
  void push(SyncPeer& peer, const TipSummary& remote, SyncReport& report,
            const CancellationToken* cancel);
  void finish(const SyncReport& report) const;

  RecordPool& pool_;
  SyncOptions options_;
};

// ---------------------------------------------------------------------------
// LocalPeer - in-process transport to another node's Synchronizer
// ---------------------------------------------------------------------------
class LocalPeer : public SyncPeer {
 public:
  explicit LocalPeer(Synchronizer& remote);

  std::string peer_id() const override;
  std::optional<TipSummary> summary(LedgerError* error = nullptr) override;
  std::optional<std::vector<AuditRecord>> fetch(const std::string& node_id, uint64_t from,
                                                uint64_t to,
                                                LedgerError* error = nullptr) override;
  std::optional<uint64_t> deliver(const std::vector<AuditRecord>& batch,
                                  LedgerError* error = nullptr) override;

  // Simulates a partition: every call fails with peer_unreachable.
  void set_reachable(bool reachable) { reachable_.store(reachable); }

  uint64_t calls() const { return calls_.load(); }

 private:
  bool reachable(LedgerError* error);

  Synchronizer& remote_;
  std::atomic<bool> reachable_{true};
  std::atomic<uint64_t> calls_{0};
};

}  // namespace lexledger
