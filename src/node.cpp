#include "lexledger/node.hpp"

#include <filesystem>
#include <sstream>

#include "lexledger/observability.hpp"
#include "lexledger/version.hpp"

namespace fs = std::filesystem;

namespace lexledger {

std::unique_ptr<LedgerNode> LedgerNode::open(const LedgerConfig& config, LedgerError* error) {
  if (!validate_config(config, error)) return nullptr;

  std::shared_ptr<IRecordStore> local;
  StoreFactory replicas;
  if (config.store_path.empty()) {
    local = std::make_shared<MemoryRecordStore>();
    replicas = memory_store_factory();
  } else {
    std::error_code ec;
    const fs::path replica_dir = fs::path(config.store_path) / "replicas";
    fs::create_directories(replica_dir, ec);
    if (ec) {
      fail(error, make_error(ErrorCode::persistence_failure,
                             "cannot create " + replica_dir.string() + ": " + ec.message()));
      return nullptr;
    }
    auto file = std::make_shared<FileRecordStore>(
        (fs::path(config.store_path) / "local.ndjson").string());
    if (!file->is_open()) {
      fail(error, make_error(ErrorCode::persistence_failure, "cannot open " + file->path()));
      return nullptr;
    }
    local = std::move(file);
    replicas = file_store_factory(replica_dir.string());
  }

  std::shared_ptr<ISegmentArchive> archive;
  if (!config.archive_path.empty()) {
    archive = std::make_shared<FileSegmentArchive>(config.archive_path, config.compression);
  }

  auto strategy = make_strategy(config, error);
  if (!strategy) return nullptr;

  return std::make_unique<LedgerNode>(config, std::move(local), std::move(replicas),
                                      std::move(archive), std::move(strategy));
}

LedgerNode::LedgerNode(LedgerConfig config, std::shared_ptr<IRecordStore> local_store,
                       StoreFactory replica_factory, std::shared_ptr<ISegmentArchive> archive,
                       std::unique_ptr<OrderingStrategy> strategy)
    : config_(std::move(config)), store_(std::move(local_store)) {
  ledger_ = std::make_unique<HashChainLedger>(config_.node_id, store_);
  pool_ = std::make_unique<RecordPool>(*ledger_, std::move(replica_factory));

  SyncOptions sync_opts;
  sync_opts.batch_size = config_.sync_batch_size;
  sync_ = std::make_unique<Synchronizer>(*pool_, sync_opts);

  ConsensusOptions cons_opts;
  cons_opts.quorum_timeout_ms = config_.quorum_timeout_ms;
  coordinator_ = std::make_unique<ConsensusCoordinator>(*pool_, std::move(strategy), cons_opts,
                                                        std::move(archive));

  ledger_->add_listener([this](const AuditRecord& r) { on_append(r); });
  coordinator_->add_seal_listener([this](const SegmentPtr& s) { on_sealed(s); });

  for (const auto& n : config_.known_nodes) {
    if (n != config_.node_id) peers_.register_peer(n);
  }
}

LedgerNode::~LedgerNode() {
  stop_background_consensus();
  stop_background_sync();
}

bool LedgerNode::start(LedgerError* error) {
  if (!ledger_->recover(error)) return false;
  if (!pool_->index_local(error)) return false;
  for (const auto& n : config_.known_nodes) {
    if (n == config_.node_id) continue;
    if (!pool_->open_replica(n, error)) return false;
  }
  if (!coordinator_->restore(error)) return false;

  const auto frontier = coordinator_->sealed_frontier();
  const uint64_t first = frontier.count(node_id()) ? frontier.at(node_id()) : 0;
  const uint64_t size = ledger_->size();
  std::vector<std::string> leaves;
  if (size > first) {
    auto suffix = ledger_->read_range(first, size - 1, error);
    if (!suffix) return false;
    for (const auto& r : *suffix) leaves.push_back(r.record_hash);
  }
  {
    std::lock_guard<std::mutex> lk(open_mu_);
    open_first_ = first;
    open_tree_ = MerkleTree::build(leaves);
  }

  log_line("node", node_id() + " started: " + std::to_string(size) + " local records, " +
                       std::to_string(coordinator_->current_segment_id()) + " sealed segments, " +
                       "strategy " + coordinator_->strategy_name());
  return true;
}

void LedgerNode::on_append(const AuditRecord& record) {
  std::lock_guard<std::mutex> lk(open_mu_);
  if (record.local_sequence != open_first_ + open_tree_.size()) return;
  open_tree_.append(record.record_hash);
}

void LedgerNode::on_sealed(const SegmentPtr& segment) {
  auto it = segment->ranges.find(node_id());
  if (it == segment->ranges.end()) return;
  const uint64_t new_first = it->second.last_seq + 1;

  std::lock_guard<std::mutex> lk(open_mu_);
  if (new_first <= open_first_) return;
  std::vector<std::string> keep;
  for (uint64_t i = new_first - open_first_; i < open_tree_.size(); ++i) {
    keep.push_back(open_tree_.leaf(i));
  }
  open_tree_ = MerkleTree::build(keep);
  open_first_ = new_first;
}

void LedgerNode::on_sync_report(const SyncReport& report) {
  for (const auto& e : report.errors) {
    if (e.code == ErrorCode::fork_detected) coordinator_->report_fork(e);
  }
}

std::optional<AuditRecord> LedgerNode::record_decision(EventType event_type, Actor actor,
                                                       std::string statute_id,
                                                       std::string subject_id,
                                                       std::string decision_context,
                                                       std::string decision_result,
                                                       LedgerError* error) {
  return ledger_->append(make_decision_record(event_type, std::move(actor), std::move(statute_id),
                                              std::move(subject_id), std::move(decision_context),
                                              std::move(decision_result)),
                         error);
}

std::optional<AuditRecord> LedgerNode::record_correction(const std::string& corrected_id,
                                                         EventType event_type, Actor actor,
                                                         std::string statute_id,
                                                         std::string subject_id,
                                                         std::string decision_context,
                                                         std::string decision_result,
                                                         LedgerError* error) {
  if (!pool_->contains_id(corrected_id)) {
    fail(error, make_error(ErrorCode::not_found, "no record with id " + corrected_id));
    return std::nullopt;
  }
  return ledger_->append(
      make_correction_record(corrected_id, event_type, std::move(actor), std::move(statute_id),
                             std::move(subject_id), std::move(decision_context),
                             std::move(decision_result)),
      error);
}

SyncReport LedgerNode::sync_with(SyncPeer& peer) {
  SyncReport report = sync_->sync_with(peer);
  peers_.record_sync(report);
  on_sync_report(report);
  return report;
}

RoundReport LedgerNode::seal(const std::vector<ConsensusPeer*>& peers) {
  return coordinator_->run_round(peers);
}

void LedgerNode::start_background_sync(const std::vector<std::shared_ptr<SyncPeer>>& peers) {
  if (scheduler_) return;
  SchedulerOptions opts;
  opts.interval = std::chrono::milliseconds(config_.sync_interval_ms);
  opts.inbound_capacity = static_cast<size_t>(config_.inbound_capacity);
  scheduler_ = std::make_unique<SyncScheduler>(
      *sync_, peers_, opts, [this](const SyncReport& r) { on_sync_report(r); });
  for (const auto& p : peers) scheduler_->add_peer(p);
  scheduler_->start();
}

void LedgerNode::stop_background_sync() {
  if (!scheduler_) return;
  scheduler_->stop();
  scheduler_.reset();
}

void LedgerNode::start_background_consensus(
    const std::vector<std::shared_ptr<ConsensusPeer>>& peers) {
  if (consensus_scheduler_) return;
  ConsensusSchedulerOptions opts;
  opts.interval = std::chrono::milliseconds(config_.quorum_timeout_ms);
  consensus_scheduler_ = std::make_unique<ConsensusScheduler>(*coordinator_, opts);
  for (const auto& p : peers) consensus_scheduler_->add_peer(p);
  consensus_scheduler_->start();
}

void LedgerNode::stop_background_consensus() {
  if (!consensus_scheduler_) return;
  consensus_scheduler_->stop();
  consensus_scheduler_.reset();
}

std::optional<std::string> LedgerNode::open_root() const {
  std::lock_guard<std::mutex> lk(open_mu_);
  return open_tree_.root();
}

uint64_t LedgerNode::open_size() const {
  std::lock_guard<std::mutex> lk(open_mu_);
  return open_tree_.size();
}

uint64_t LedgerNode::open_first_sequence() const {
  std::lock_guard<std::mutex> lk(open_mu_);
  return open_first_;
}

std::optional<MerkleProof> LedgerNode::prove_open(uint64_t local_sequence) const {
  std::lock_guard<std::mutex> lk(open_mu_);
  if (local_sequence < open_first_) return std::nullopt;
  return open_tree_.prove(local_sequence - open_first_);
}

VerificationResult LedgerNode::verify_segment_sampled(uint64_t segment_id, uint64_t seed) const {
  SegmentPtr seg = coordinator_->segment(segment_id);
  if (!seg) {
    VerificationResult vr;
    vr.ok = false;
    vr.error = make_error(ErrorCode::not_found, "segment " + std::to_string(segment_id));
    return vr;
  }
  return verify_sampled(*seg, config_.sample_rate, seed);
}

std::vector<AuditRecord> LedgerNode::query(const RecordQuery& q) const {
  return query_records(coordinator_->sealed_segments(), q);
}

ComplianceSummary LedgerNode::compliance_summary() const {
  return summarize(coordinator_->sealed_segments());
}

std::string LedgerNode::status_to_json() const {
  const auto head = ledger_->head();
  const auto root = open_root();
  std::ostringstream o;
  o << "{\"node_id\":\"" << jsonlite::escape(node_id()) << "\""
    << ",\"manifest\":" << version::manifest_to_json(version::current_manifest())
    << ",\"local_records\":" << ledger_->size()
    << ",\"head\":\"" << (head ? head->record_hash : std::string()) << "\""
    << ",\"pooled_records\":" << pool_->total()
    << ",\"clock\":" << ledger_->clock().to_json()
    << ",\"open_segment\":{\"first_seq\":" << open_first_sequence() << ",\"size\":" << open_size()
    << ",\"root\":\"" << (root ? *root : std::string()) << "\"}"
    << ",\"consensus\":{\"strategy\":\"" << coordinator_->strategy_name() << "\""
    << ",\"epoch\":" << coordinator_->epoch()
    << ",\"quorum\":" << coordinator_->quorum_size()
    << ",\"current_segment\":" << coordinator_->current_segment_id()
    << ",\"state\":\"" << to_string(coordinator_->current_state()) << "\"}"
    << ",\"peers\":" << peers_.status_to_json()
    << ",\"stats\":" << global_ledger_stats().to_json() << "}";
  return o.str();
}

}  // namespace lexledger
