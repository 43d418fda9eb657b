#pragma once

// lexledger/observability.hpp - Stats, event stream and the operator channel.
//
// DESIGN:
//   LedgerEvent is the observable unit. Appends, verifications, sync
//   exchanges, seals and fatal findings each emit one event, which is:
//     - always folded into the process-wide LedgerStats counters;
//     - forwarded to an installed hook if one is set;
//     - otherwise appended as one JSON line to LEXLEDGER_EVENT_LOG if set.
//
//   OperatorAlert is the channel for fatal errors (integrity_violation,
//   fork_detected). An alert is always written to stderr and counted, then
//   forwarded to the alert hook. Fatal findings are never silent.
//
// INVARIANT:
//   Emission never blocks the append critical section for longer than one
//   stderr/file write, and never throws.
//
// EXTENSION_POINT: siem_forwarding
//   Current: JSONL file or in-process hook.
//   Upgrade: a hook that forwards alerts to an external incident channel.
//   Invariant: forwarding failures must not suppress the stderr line.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "lexledger/types.hpp"

namespace lexledger {

// Writes "[lexledger:<component>] <message>" to stderr.
void log_line(const std::string& component, const std::string& message);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Bucket boundaries are fixed; readers of to_json() depend on them.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Microseconds. 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

enum class LedgerEventKind {
  append,
  append_failed,
  verify,
  sync,
  seal,
  quorum_timeout,
  fork,
  integrity_violation,
  attestation,
};

std::string to_string(LedgerEventKind kind);

struct LedgerEvent {
  LedgerEventKind kind{LedgerEventKind::append};
  std::string node_id;
  bool ok{true};
  std::string error_code;
  uint64_t duration_ns{0};
  uint64_t count{0};  // records appended / checked / transferred
  std::string detail;
};

// ---------------------------------------------------------------------------
// LedgerStats - process-wide counters
// ---------------------------------------------------------------------------
// Aggregates events from every ledger instance in the process. Chain state is
// never kept here; each HashChainLedger owns its own head.
class LedgerStats {
 public:
  void record_event(const LedgerEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> appends{0};
  alignas(64) std::atomic<uint64_t> append_failures{0};
  alignas(64) std::atomic<uint64_t> verifications{0};
  alignas(64) std::atomic<uint64_t> links_checked{0};
  alignas(64) std::atomic<uint64_t> integrity_violations{0};
  alignas(64) std::atomic<uint64_t> forks_detected{0};
  alignas(64) std::atomic<uint64_t> syncs{0};
  alignas(64) std::atomic<uint64_t> records_transferred{0};
  alignas(64) std::atomic<uint64_t> quorum_timeouts{0};
  alignas(64) std::atomic<uint64_t> segments_sealed{0};
  alignas(64) std::atomic<uint64_t> attestations{0};
  alignas(64) std::atomic<uint64_t> operator_alerts{0};

  LatencyHistogram append_latency;
};

LedgerStats& global_ledger_stats();

void emit_ledger_event(const LedgerEvent& ev);

using LedgerEventHook = void (*)(const LedgerEvent&);
void set_ledger_event_hook(LedgerEventHook hook);

// ---------------------------------------------------------------------------
// Operator channel
// ---------------------------------------------------------------------------
struct OperatorAlert {
  std::string component;  // "ledger", "sync", "consensus", "archive"
  std::string node_id;    // node that observed the failure
  LedgerError error;
  uint64_t raised_at_unix_ms{0};

  std::string to_json() const;
};

void raise_operator_alert(OperatorAlert alert);

using OperatorAlertHook = void (*)(const OperatorAlert&);
void set_operator_alert_hook(OperatorAlertHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace lexledger
