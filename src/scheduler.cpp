#include "lexledger/scheduler.hpp"

#include <algorithm>

#include "lexledger/observability.hpp"

namespace lexledger {

SyncScheduler::SyncScheduler(Synchronizer& sync, PeerRegistry& registry, SchedulerOptions options,
                             ReportHook on_report)
    : sync_(sync),
      registry_(registry),
      options_(options),
      on_report_(std::move(on_report)),
      inbound_(options.inbound_capacity) {}

SyncScheduler::~SyncScheduler() { stop(); }

void SyncScheduler::add_peer(std::shared_ptr<SyncPeer> peer) {
  if (!peer) return;
  std::lock_guard<std::mutex> lock(mu_);
  registry_.register_peer(peer->peer_id());
  peers_.push_back(std::move(peer));
}

void SyncScheduler::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (running_ || inbound_.closed()) return;
  stopping_ = false;
  cancel_.reset();
  running_ = true;
  ingest_ = std::thread([this] { ingest_loop(); });
  for (const auto& peer : peers_) {
    workers_.emplace_back([this, peer] { peer_loop(peer); });
  }
}

void SyncScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return;
    stopping_ = true;
  }
  cancel_.cancel();
  cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
  inbound_.close();
  if (ingest_.joinable()) ingest_.join();
  running_ = false;
}

SyncReport SyncScheduler::round(SyncPeer& peer) {
  SyncReport rep = sync_.pull_into(peer, inbound_, &cancel_);
  if (rep.errors.empty() && !rep.cancelled) {
    SyncReport pushed = sync_.push_to(peer, &cancel_);
    rep.sent = pushed.sent;
    rep.cancelled = pushed.cancelled;
    rep.errors.insert(rep.errors.end(), pushed.errors.begin(), pushed.errors.end());
  }
  ++rounds_;
  return rep;
}

void SyncScheduler::report(const SyncReport& rep) {
  registry_.record_sync(rep);
  if (on_report_) on_report_(rep);
}

void SyncScheduler::peer_loop(std::shared_ptr<SyncPeer> peer) {
  const uint64_t base = static_cast<uint64_t>(options_.interval.count());
  while (true) {
    const auto wait = std::chrono::milliseconds(registry_.backoff_ms(peer->peer_id(), base));
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, wait, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    SyncReport rep = round(*peer);
    if (!rep.errors.empty()) {
      log_line("scheduler", "sync with " + peer->peer_id() + " failed: " +
                                rep.errors.front().detail);
    }
    report(rep);
  }
}

void SyncScheduler::ingest_one(const InboundBatch& batch) {
  LedgerError err;
  auto n = sync_.ingest(batch, &err);
  if (n) {
    ingested_ += *n;
    return;
  }
  // A causal gap closes on a later round once the missing history arrives.
  log_line("scheduler", "batch from " + batch.peer_id + " rejected: " + err.detail);
  SyncReport rep;
  rep.peer_id = batch.peer_id;
  rep.errors.push_back(err);
  report(rep);
}

void SyncScheduler::ingest_loop() {
  while (true) {
    auto batch = inbound_.pop_for(std::chrono::milliseconds(100));
    if (!batch) {
      if (inbound_.closed() && inbound_.size() == 0) return;
      continue;
    }
    ingest_one(*batch);
  }
}

void SyncScheduler::run_once() {
  std::vector<std::shared_ptr<SyncPeer>> peers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) return;
    peers = peers_;
  }
  for (const auto& peer : peers) {
    SyncReport rep = sync_.sync_with(*peer);
    ++rounds_;
    ingested_ += rep.received;
    report(rep);
  }
}

// ---------------------------------------------------------------------------
// ConsensusScheduler
// ---------------------------------------------------------------------------

ConsensusScheduler::ConsensusScheduler(ConsensusCoordinator& coordinator,
                                       ConsensusSchedulerOptions options)
    : coordinator_(coordinator), options_(options) {}

ConsensusScheduler::~ConsensusScheduler() { stop(); }

void ConsensusScheduler::add_peer(std::shared_ptr<ConsensusPeer> peer) {
  if (!peer) return;
  std::lock_guard<std::mutex> lock(mu_);
  peers_.push_back(std::move(peer));
}

void ConsensusScheduler::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (running_) return;
  stopping_ = false;
  running_ = true;
  worker_ = std::thread([this] { loop(); });
}

void ConsensusScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return;
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  running_ = false;
}

uint64_t ConsensusScheduler::backoff_ms() const {
  const uint64_t base = static_cast<uint64_t>(options_.interval.count());
  const uint64_t cap = static_cast<uint64_t>(options_.max_backoff.count());
  const uint64_t shift = std::min<uint64_t>(timeouts_.load(), 20);
  const uint64_t wait = base << shift;
  if (base != 0 && (wait >> shift) != base) return cap;
  return std::min(wait, cap);
}

RoundReport ConsensusScheduler::tick() {
  std::vector<std::shared_ptr<ConsensusPeer>> peers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    peers = peers_;
  }

  coordinator_.check_timeouts(now_unix_ms());
  for (const auto& peer : peers) {
    LedgerError err;
    const size_t installed = coordinator_.catch_up(*peer, &err);
    if (installed > 0) timeouts_ = 0;
    if (!err.ok() && err.code != ErrorCode::peer_unreachable) {
      log_line("scheduler", "catch-up from " + peer->peer_id() + " stopped: " + err.detail);
    }
  }

  RoundReport rep;
  if (!coordinator_.may_propose()) {
    rep.segment_id = coordinator_.current_segment_id();
    rep.error = make_error(ErrorCode::not_leader, coordinator_.node_id() + " is not proposing");
    return rep;
  }
  std::vector<ConsensusPeer*> targets;
  targets.reserve(peers.size());
  for (const auto& peer : peers) targets.push_back(peer.get());
  rep = coordinator_.run_round(targets);
  ++rounds_;
  if (rep.sealed) {
    ++sealed_;
    timeouts_ = 0;
  } else if (rep.error.code == ErrorCode::quorum_timeout) {
    ++timeouts_;
  }
  return rep;
}

void ConsensusScheduler::loop() {
  while (true) {
    const auto wait = std::chrono::milliseconds(backoff_ms());
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, wait, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    RoundReport rep = tick();
    if (rep.error.code == ErrorCode::quorum_timeout) {
      log_line("scheduler", "segment " + std::to_string(rep.segment_id) + " " + rep.error.detail +
                                "; retrying in " + std::to_string(backoff_ms()) + " ms");
    }
  }
}

}  // namespace lexledger
