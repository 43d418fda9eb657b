#include "lexledger/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "lexledger/jsonlite.hpp"
#include "lexledger/record.hpp"

namespace lexledger {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<LedgerEventHook> g_event_hook{nullptr};
std::atomic<OperatorAlertHook> g_alert_hook{nullptr};

void append_number(std::string& out, const char* key, double v, const char* fmt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += ",\"";
  out += key;
  out += "\":";
  out += buf;
}

}  // namespace

void log_line(const std::string& component, const std::string& message) {
  std::fprintf(stderr, "[lexledger:%s] %s\n", component.c_str(), message.c_str());
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count());
  append_number(out, "mean_us", mean_us(), "%.2f");
  append_number(out, "p50_us", percentile(0.50), "%.2f");
  append_number(out, "p95_us", percentile(0.95), "%.2f");
  append_number(out, "p99_us", percentile(0.99), "%.2f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// LedgerStats
// ---------------------------------------------------------------------------

std::string to_string(LedgerEventKind kind) {
  switch (kind) {
    case LedgerEventKind::append: return "append";
    case LedgerEventKind::append_failed: return "append_failed";
    case LedgerEventKind::verify: return "verify";
    case LedgerEventKind::sync: return "sync";
    case LedgerEventKind::seal: return "seal";
    case LedgerEventKind::quorum_timeout: return "quorum_timeout";
    case LedgerEventKind::fork: return "fork";
    case LedgerEventKind::integrity_violation: return "integrity_violation";
    case LedgerEventKind::attestation: return "attestation";
  }
  return "";
}

void LedgerStats::record_event(const LedgerEvent& ev) {
  switch (ev.kind) {
    case LedgerEventKind::append:
      appends.fetch_add(1, std::memory_order_relaxed);
      append_latency.record(ev.duration_ns);
      break;
    case LedgerEventKind::append_failed:
      append_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case LedgerEventKind::verify:
      verifications.fetch_add(1, std::memory_order_relaxed);
      links_checked.fetch_add(ev.count, std::memory_order_relaxed);
      break;
    case LedgerEventKind::sync:
      syncs.fetch_add(1, std::memory_order_relaxed);
      records_transferred.fetch_add(ev.count, std::memory_order_relaxed);
      break;
    case LedgerEventKind::seal:
      segments_sealed.fetch_add(1, std::memory_order_relaxed);
      break;
    case LedgerEventKind::quorum_timeout:
      quorum_timeouts.fetch_add(1, std::memory_order_relaxed);
      break;
    case LedgerEventKind::fork:
      forks_detected.fetch_add(1, std::memory_order_relaxed);
      break;
    case LedgerEventKind::integrity_violation:
      integrity_violations.fetch_add(1, std::memory_order_relaxed);
      break;
    case LedgerEventKind::attestation:
      attestations.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

std::string LedgerStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* key, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += key;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += '{';
  field("appends", appends, true);
  field("append_failures", append_failures);
  field("verifications", verifications);
  field("links_checked", links_checked);
  field("integrity_violations", integrity_violations);
  field("forks_detected", forks_detected);
  field("syncs", syncs);
  field("records_transferred", records_transferred);
  field("quorum_timeouts", quorum_timeouts);
  field("segments_sealed", segments_sealed);
  field("attestations", attestations);
  field("operator_alerts", operator_alerts);
  out += ",\"append_latency\":";
  out += append_latency.to_json();
  out += '}';
  return out;
}

LedgerStats& global_ledger_stats() {
  static LedgerStats inst;
  return inst;
}

void set_ledger_event_hook(LedgerEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_ledger_event(const LedgerEvent& ev) {
  global_ledger_stats().record_event(ev);

  LedgerEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: LEXLEDGER_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("LEXLEDGER_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line;
  line.reserve(256);
  line += "{\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"node_id\":\"";
  line += jsonlite::escape(ev.node_id);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"count\":";
  line += std::to_string(ev.count);
  line += ",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\"}\n";

  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

// ---------------------------------------------------------------------------
// Operator channel
// ---------------------------------------------------------------------------

std::string OperatorAlert::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"component\":\"";
  out += jsonlite::escape(component);
  out += "\",\"node_id\":\"";
  out += jsonlite::escape(node_id);
  out += "\",\"raised_at_unix_ms\":";
  out += std::to_string(raised_at_unix_ms);
  out += ",\"error\":";
  out += error.to_json();
  out += '}';
  return out;
}

void set_operator_alert_hook(OperatorAlertHook hook) {
  g_alert_hook.store(hook, std::memory_order_release);
}

void raise_operator_alert(OperatorAlert alert) {
  if (alert.raised_at_unix_ms == 0) alert.raised_at_unix_ms = now_unix_ms();
  global_ledger_stats().operator_alerts.fetch_add(1, std::memory_order_relaxed);
  std::fprintf(stderr, "[lexledger:%s] OPERATOR ALERT %s\n", alert.component.c_str(),
               alert.to_json().c_str());

  LedgerEvent ev;
  ev.node_id = alert.node_id;
  ev.ok = false;
  ev.error_code = to_string(alert.error.code);
  ev.detail = alert.error.detail;
  if (alert.error.code == ErrorCode::fork_detected) {
    ev.kind = LedgerEventKind::fork;
    emit_ledger_event(ev);
  } else if (alert.error.code == ErrorCode::integrity_violation) {
    ev.kind = LedgerEventKind::integrity_violation;
    emit_ledger_event(ev);
  }

  OperatorAlertHook hook = g_alert_hook.load(std::memory_order_acquire);
  if (hook) hook(alert);
}

}  // namespace lexledger
