#pragma once

// lexledger/ledger.hpp - Per-node hash-chained, append-only ledger.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: records are never modified or deleted through this API.
//   2. CHAINED: record.prev_hash == predecessor.record_hash; the genesis
//      record carries zero_digest().
//   3. DENSE: local_sequence runs 0, 1, 2, ... with no gaps.
//   4. CAUSAL: vector_clock[node_id] == local_sequence + 1, and every local
//      append's clock covers every clock passed to observe_clock() before it.
//   5. ALL-OR-NOTHING: the head only advances after the store acknowledged a
//      durable write. A failed store write leaves head(), size() and clock()
//      exactly as they were.
//
// CONCURRENCY:
//   append() is the single serialization point (one mutex per instance).
//   verify_range() and read_range() snapshot the head under the lock and then
//   read without holding it, so verification never stalls appends.
//   There is no process-wide ledger: every instance is independent.
//
// MEMORY OWNERSHIP:
//   The ledger shares ownership of its store. Head and clock are derivations
//   of the store contents and are rebuilt by recover().

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/clock.hpp"
#include "lexledger/record.hpp"
#include "lexledger/store.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

// Called with every sealed record, in local_sequence order, while the append
// lock is held. Listeners must not call back into append().
using AppendListener = std::function<void(const AuditRecord&)>;

class HashChainLedger {
 public:
  HashChainLedger(std::string node_id, std::shared_ptr<IRecordStore> store);

  HashChainLedger(const HashChainLedger&) = delete;
  HashChainLedger& operator=(const HashChainLedger&) = delete;

  // Replays the persisted chain, checking every record hash and link, and
  // rebuilds head and own vector clock. Must be called before append() when
  // the store is not empty. Integrity failures are raised on the operator
  // channel.
  bool recover(LedgerError* error = nullptr);

  // Assigns node_id, local_sequence, vector_clock and prev_hash, computes
  // record_hash, persists, then advances the head. Returns the sealed record.
  std::optional<AuditRecord> append(AuditRecord record, LedgerError* error = nullptr);

  // Inclusive [from, to]. Recomputes every record hash and every chain link
  // and reports the first index that fails.
  VerificationResult verify_range(uint64_t from, uint64_t to) const;

  // Shorthand for verify_range(0, head.local_sequence). ok on an empty chain.
  VerificationResult verify_all() const;

  std::optional<ChainHead> head() const;
  uint64_t size() const;
  VectorClock clock() const;

  // Merges a clock observed from remote records so later local appends
  // causally follow them. Own entry is never lowered or raised by this.
  void observe_clock(const VectorClock& remote);

  std::optional<std::vector<AuditRecord>> read_range(uint64_t from, uint64_t to,
                                                     LedgerError* error = nullptr) const;
  std::optional<AuditRecord> read(uint64_t seq, LedgerError* error = nullptr) const;

  void add_listener(AppendListener listener);

  const std::string& node_id() const { return node_id_; }
  const IRecordStore& store() const { return *store_; }

 private:
  VerificationResult check_records(const std::vector<AuditRecord>& records, uint64_t from,
                                   const std::string& expected_prev) const;
  void report_integrity_failure(const LedgerError& e) const;

  const std::string node_id_;
  std::shared_ptr<IRecordStore> store_;

  mutable std::mutex mu_;
  uint64_t next_sequence_{0};
  std::string head_hash_;
  VectorClock clock_;
  std::vector<AppendListener> listeners_;
};

}  // namespace lexledger
