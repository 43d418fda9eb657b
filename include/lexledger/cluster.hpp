#pragma once

// lexledger/cluster.hpp - Peer registry: health, backoff and version drift.
//
// DESIGN:
//   One PeerRegistry per node. The sync scheduler records every exchange
//   here; operators read it through status_to_json() / drift_status().
//
// INVARIANTS:
//   - Registration is idempotent (same peer_id -> update, not duplicate).
//   - A peer is unhealthy after `unhealthy_after` consecutive failures and
//     healthy again after its next successful exchange.
//   - backoff_ms() doubles per consecutive failure and is capped.
//   - Version drift is reported, never enforced here; the synchronizer
//     refuses incompatible peers on its own.
//
// EXTENSION_POINT: external_membership
//   Current: peers are configured (LEXLEDGER_KNOWN_NODES).
//   Upgrade: a membership service that adds and retires peers at runtime.
//   Invariant: known_nodes of the consensus strategy must not change while a
//   segment is PendingQuorum.

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "lexledger/sync.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

struct PeerRecord {
  std::string peer_id;
  uint32_t sync_protocol{0};   // as last announced; 0 = not yet seen
  uint32_t hash_algorithm{0};
  uint64_t registered_at_unix_ms{0};
  uint64_t last_contact_unix_ms{0};
  uint64_t last_success_unix_ms{0};
  uint64_t consecutive_failures{0};
  uint64_t total_syncs{0};
  uint64_t records_received{0};
  uint64_t records_sent{0};
  bool healthy{true};
  LedgerError last_error;
};

struct VersionMismatch {
  std::string field;
  std::string expected;
  std::string observed;
  std::string peer_id;
};

struct DriftStatus {
  bool ok{true};
  uint32_t total_peers{0};
  uint32_t compatible_peers{0};
  std::vector<VersionMismatch> mismatches;

  std::string to_json() const;
};

class PeerRegistry {
 public:
  explicit PeerRegistry(uint64_t unhealthy_after = 3, uint64_t max_backoff_ms = 60000)
      : unhealthy_after_(unhealthy_after), max_backoff_ms_(max_backoff_ms) {}

  void register_peer(const std::string& peer_id);

  void record_versions(const std::string& peer_id, uint32_t sync_protocol,
                       uint32_t hash_algorithm);

  // Folds a finished sync round into the peer's record. A report with
  // errors counts as a failure.
  void record_sync(const SyncReport& report);
  void record_failure(const std::string& peer_id, const LedgerError& error);

  void mark_unhealthy(const std::string& peer_id);

  std::vector<PeerRecord> snapshot() const;
  uint32_t peer_count() const;
  uint32_t healthy_count() const;
  bool is_healthy(const std::string& peer_id) const;

  // base_ms * 2^consecutive_failures, capped at max_backoff_ms.
  uint64_t backoff_ms(const std::string& peer_id, uint64_t base_ms) const;

  DriftStatus drift_status() const;
  std::string status_to_json() const;

 private:
  int find_index(const std::string& peer_id) const;
  PeerRecord& upsert(const std::string& peer_id);

  const uint64_t unhealthy_after_;
  const uint64_t max_backoff_ms_;
  mutable std::mutex mu_;
  std::vector<PeerRecord> peers_;
};

}  // namespace lexledger
