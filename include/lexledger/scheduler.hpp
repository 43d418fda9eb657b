#pragma once

// lexledger/scheduler.hpp - Background synchronization and consensus tasks.
//
// DESIGN:
//   One worker thread per peer runs pull rounds (fork check + fetch) at a
//   fixed interval and pushes ordered batches onto a bounded inbound
//   channel, then pushes what the peer is missing. A single ingest thread
//   drains the channel into the RecordPool. Background threads never touch
//   the ledger except through RecordPool::commit().
//
// FAILURE POLICY:
//   - Transport and causal errors: retried on the next round, with the
//     wait doubled per consecutive failure (PeerRegistry::backoff_ms).
//   - Fork and integrity errors: passed to the report hook, which raises
//     them to the coordinator. They are already on the operator channel.
//
// Shutdown: stop() cancels in-flight rounds between batches, closes the
// channel, lets the ingest thread drain what was already enqueued, and joins
// every thread. The destructor calls stop(). A stopped scheduler does not
// restart.
//
// CONSENSUS: ConsensusScheduler runs beside the sync tasks on its own thread.
// Each tick fires coordinator timeouts (proposer deadline, vote expiry,
// silent leader), installs segments peers sealed meanwhile, then runs a
// round if this node may propose. A quorum_timeout doubles the wait before
// the next tick; a sealed segment resets it.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "lexledger/channel.hpp"
#include "lexledger/cluster.hpp"
#include "lexledger/consensus.hpp"
#include "lexledger/sync.hpp"

namespace lexledger {

struct SchedulerOptions {
  std::chrono::milliseconds interval{1000};
  size_t inbound_capacity{64};
};

class SyncScheduler {
 public:
  using ReportHook = std::function<void(const SyncReport&)>;

  SyncScheduler(Synchronizer& sync, PeerRegistry& registry, SchedulerOptions options = {},
                ReportHook on_report = nullptr);
  ~SyncScheduler();

  SyncScheduler(const SyncScheduler&) = delete;
  SyncScheduler& operator=(const SyncScheduler&) = delete;

  // Peers must be added before start().
  void add_peer(std::shared_ptr<SyncPeer> peer);

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // One synchronous sync_with() pass over every peer, committing directly,
  // for callers that drive rounds themselves. No-op while running().
  void run_once();

  uint64_t rounds() const { return rounds_.load(); }
  uint64_t ingested() const { return ingested_.load(); }
  size_t pending_batches() const { return inbound_.size(); }

 private:
  void peer_loop(std::shared_ptr<SyncPeer> peer);
  void ingest_loop();
  SyncReport round(SyncPeer& peer);
  void ingest_one(const InboundBatch& batch);
  void report(const SyncReport& report);

  Synchronizer& sync_;
  PeerRegistry& registry_;
  SchedulerOptions options_;
  ReportHook on_report_;

  std::vector<std::shared_ptr<SyncPeer>> peers_;
  BoundedChannel<InboundBatch> inbound_;
  CancellationToken cancel_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> running_{false};
  std::vector<std::thread> workers_;
  std::thread ingest_;

  std::atomic<uint64_t> rounds_{0};
  std::atomic<uint64_t> ingested_{0};
};

struct ConsensusSchedulerOptions {
  std::chrono::milliseconds interval{5000};
  std::chrono::milliseconds max_backoff{60000};
};

class ConsensusScheduler {
 public:
  explicit ConsensusScheduler(ConsensusCoordinator& coordinator,
                              ConsensusSchedulerOptions options = {});
  ~ConsensusScheduler();

  ConsensusScheduler(const ConsensusScheduler&) = delete;
  ConsensusScheduler& operator=(const ConsensusScheduler&) = delete;

  // Peers must be added before start().
  void add_peer(std::shared_ptr<ConsensusPeer> peer);

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // One tick on the caller's thread. error is not_leader when this node may
  // not propose, not_found when there was nothing to seal.
  RoundReport tick();

  // interval * 2^consecutive_timeouts, capped at max_backoff.
  uint64_t backoff_ms() const;

  uint64_t rounds() const { return rounds_.load(); }
  uint64_t sealed() const { return sealed_.load(); }
  uint64_t consecutive_timeouts() const { return timeouts_.load(); }

 private:
  void loop();

  ConsensusCoordinator& coordinator_;
  ConsensusSchedulerOptions options_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::shared_ptr<ConsensusPeer>> peers_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> running_{false};
  std::thread worker_;

  std::atomic<uint64_t> rounds_{0};
  std::atomic<uint64_t> sealed_{0};
  std::atomic<uint64_t> timeouts_{0};
};

}  // namespace lexledger
