#include "lexledger/cluster.hpp"

#include <algorithm>
#include <sstream>

#include "lexledger/jsonlite.hpp"
#include "lexledger/observability.hpp"
#include "lexledger/record.hpp"
#include "lexledger/version.hpp"

namespace lexledger {

int PeerRegistry::find_index(const std::string& peer_id) const {
  for (int i = 0; i < static_cast<int>(peers_.size()); ++i) {
    if (peers_[i].peer_id == peer_id) return i;
  }
  return -1;
}

PeerRecord& PeerRegistry::upsert(const std::string& peer_id) {
  int idx = find_index(peer_id);
  if (idx >= 0) return peers_[idx];
  PeerRecord r;
  r.peer_id = peer_id;
  r.registered_at_unix_ms = now_unix_ms();
  peers_.push_back(std::move(r));
  return peers_.back();
}

void PeerRegistry::register_peer(const std::string& peer_id) {
  std::lock_guard<std::mutex> lk(mu_);
  upsert(peer_id);
}

void PeerRegistry::record_versions(const std::string& peer_id, uint32_t sync_protocol,
                                   uint32_t hash_algorithm) {
  std::lock_guard<std::mutex> lk(mu_);
  PeerRecord& r = upsert(peer_id);
  r.sync_protocol = sync_protocol;
  r.hash_algorithm = hash_algorithm;
}

void PeerRegistry::record_sync(const SyncReport& report) {
  if (report.peer_sync_protocol != 0) {
    record_versions(report.peer_id, report.peer_sync_protocol, report.peer_hash_algorithm);
  }
  if (!report.errors.empty()) {
    record_failure(report.peer_id, report.errors.front());
    std::lock_guard<std::mutex> lk(mu_);
    PeerRecord& r = upsert(report.peer_id);
    r.records_received += report.received;
    r.records_sent += report.sent;
    return;
  }
  std::lock_guard<std::mutex> lk(mu_);
  PeerRecord& r = upsert(report.peer_id);
  const uint64_t now = now_unix_ms();
  r.last_contact_unix_ms = now;
  if (report.cancelled) return;
  r.last_success_unix_ms = now;
  r.consecutive_failures = 0;
  r.healthy = true;
  r.last_error = LedgerError{};
  ++r.total_syncs;
  r.records_received += report.received;
  r.records_sent += report.sent;
}

void PeerRegistry::record_failure(const std::string& peer_id, const LedgerError& error) {
  bool became_unhealthy = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    PeerRecord& r = upsert(peer_id);
    r.last_contact_unix_ms = now_unix_ms();
    ++r.consecutive_failures;
    r.last_error = error;
    if (r.healthy && r.consecutive_failures >= unhealthy_after_) {
      r.healthy = false;
      became_unhealthy = true;
    }
  }
  if (became_unhealthy) {
    log_line("cluster", "peer " + peer_id + " unhealthy after " +
                            std::to_string(unhealthy_after_) + " failures: " + error.detail);
  }
}

void PeerRegistry::mark_unhealthy(const std::string& peer_id) {
  std::lock_guard<std::mutex> lk(mu_);
  int idx = find_index(peer_id);
  if (idx < 0) return;
  peers_[idx].healthy = false;
  peers_[idx].last_contact_unix_ms = now_unix_ms();
}

std::vector<PeerRecord> PeerRegistry::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return peers_;
}

uint32_t PeerRegistry::peer_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<uint32_t>(peers_.size());
}

uint32_t PeerRegistry::healthy_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  uint32_t n = 0;
  for (const auto& p : peers_) if (p.healthy) ++n;
  return n;
}

bool PeerRegistry::is_healthy(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  int idx = find_index(peer_id);
  return idx >= 0 && peers_[idx].healthy;
}

uint64_t PeerRegistry::backoff_ms(const std::string& peer_id, uint64_t base_ms) const {
  std::lock_guard<std::mutex> lk(mu_);
  int idx = find_index(peer_id);
  const uint64_t failures = idx < 0 ? 0 : peers_[idx].consecutive_failures;
  const uint64_t shift = std::min<uint64_t>(failures, 20);
  const uint64_t wait = base_ms << shift;
  if (base_ms != 0 && (wait >> shift) != base_ms) return max_backoff_ms_;
  return std::min(wait, max_backoff_ms_);
}

std::string DriftStatus::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"ok\":" << (ok ? "true" : "false")
    << ",\"total_peers\":" << total_peers
    << ",\"compatible_peers\":" << compatible_peers
    << ",\"mismatches\":[";
  bool first = true;
  for (const auto& m : mismatches) {
    if (!first) o << ",";
    first = false;
    o << "{\"field\":\"" << m.field << "\""
      << ",\"expected\":\"" << m.expected << "\""
      << ",\"observed\":\"" << m.observed << "\""
      << ",\"peer_id\":\"" << jsonlite::escape(m.peer_id) << "\"}";
  }
  o << "]}";
  return o.str();
}

DriftStatus PeerRegistry::drift_status() const {
  DriftStatus drift;
  std::lock_guard<std::mutex> lk(mu_);
  drift.total_peers = static_cast<uint32_t>(peers_.size());

  for (const auto& p : peers_) {
    bool peer_ok = true;
    // Zero means the peer has not announced versions yet.
    if (p.sync_protocol != 0 && p.sync_protocol != version::SYNC_PROTOCOL_VERSION) {
      drift.mismatches.push_back(VersionMismatch{"sync_protocol",
                                                 std::to_string(version::SYNC_PROTOCOL_VERSION),
                                                 std::to_string(p.sync_protocol), p.peer_id});
      peer_ok = false;
    }
    if (p.hash_algorithm != 0 && p.hash_algorithm != version::HASH_ALGORITHM_VERSION) {
      drift.mismatches.push_back(VersionMismatch{"hash_algorithm",
                                                 std::to_string(version::HASH_ALGORITHM_VERSION),
                                                 std::to_string(p.hash_algorithm), p.peer_id});
      peer_ok = false;
    }
    if (peer_ok) ++drift.compatible_peers;
  }
  drift.ok = drift.mismatches.empty();
  return drift;
}

std::string PeerRegistry::status_to_json() const {
  const auto peers = snapshot();
  std::ostringstream o;
  o << "[";
  bool first = true;
  for (const auto& r : peers) {
    if (!first) o << ",";
    first = false;
    o << "{"
      << "\"peer_id\":\"" << jsonlite::escape(r.peer_id) << "\""
      << ",\"healthy\":" << (r.healthy ? "true" : "false")
      << ",\"consecutive_failures\":" << r.consecutive_failures
      << ",\"total_syncs\":" << r.total_syncs
      << ",\"records_received\":" << r.records_received
      << ",\"records_sent\":" << r.records_sent
      << ",\"registered_at_unix_ms\":" << r.registered_at_unix_ms
      << ",\"last_contact_unix_ms\":" << r.last_contact_unix_ms
      << ",\"last_success_unix_ms\":" << r.last_success_unix_ms
      << ",\"last_error\":" << r.last_error.to_json()
      << "}";
  }
  o << "]";
  return o.str();
}

}  // namespace lexledger
