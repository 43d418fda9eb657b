#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "lexledger/archive.hpp"
#include "lexledger/channel.hpp"
#include "lexledger/cluster.hpp"
#include "lexledger/config.hpp"
#include "lexledger/consensus.hpp"
#include "lexledger/hash.hpp"
#include "lexledger/jsonlite.hpp"
#include "lexledger/ledger.hpp"
#include "lexledger/merkle.hpp"
#include "lexledger/node.hpp"
#include "lexledger/observability.hpp"
#include "lexledger/query.hpp"
#include "lexledger/record.hpp"
#include "lexledger/scheduler.hpp"
#include "lexledger/segment.hpp"
#include "lexledger/store.hpp"
#include "lexledger/sync.hpp"
#include "lexledger/version.hpp"

namespace fs = std::filesystem;
using namespace lexledger;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
std::atomic<int> g_alerts{0};

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

void count_alert(const OperatorAlert&) { g_alerts.fetch_add(1); }

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("lexledger_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

AuditRecord decision(int i, EventType type = EventType::AutomaticDecision,
                     const std::string& statute = "statute-1") {
  return make_decision_record(type, SystemActor{"eligibility-engine"}, statute,
                              "subject-" + std::to_string(i), "{\"income\":" + std::to_string(i) + "}",
                              "result-" + std::to_string(i));
}

AuditRecord append_one(HashChainLedger& ledger, int i) {
  LedgerError err;
  auto r = ledger.append(decision(i), &err);
  expect(r.has_value(), "append must succeed: " + err.detail);
  return *r;
}

// One replica with its own chain, pool, synchronizer and coordinator.
struct TestNode {
  TestNode(const std::string& id, const std::vector<std::string>& known,
           const std::string& strategy = "majority", uint64_t quorum_timeout_ms = 5000)
      : store(std::make_shared<MemoryRecordStore>()),
        ledger(id, store),
        pool(ledger, memory_store_factory()),
        sync(pool),
        coord(pool, make_strategy(strategy, known), ConsensusOptions{quorum_timeout_ms}),
        peer(sync),
        consensus_peer(coord) {}

  std::shared_ptr<MemoryRecordStore> store;
  HashChainLedger ledger;
  RecordPool pool;
  Synchronizer sync;
  ConsensusCoordinator coord;
  LocalPeer peer;
  LocalConsensusPeer consensus_peer;
};

const std::vector<std::string> kTrio = {"node-a", "node-b", "node-c"};

// Memory store whose stored lines can be edited behind the ledger's back.
class TamperableStore : public MemoryRecordStore {
 public:
  void edit(size_t index, const std::function<void(std::string&)>& fn) {
    std::lock_guard<std::mutex> lk(mu_);
    fn(lines_[index]);
  }
};

class FailingStore : public MemoryRecordStore {
 public:
  bool append(const AuditRecord& record, LedgerError* error = nullptr) override {
    if (fail_next.exchange(false)) {
      return fail(error, make_error(ErrorCode::persistence_failure, "disk full"));
    }
    return MemoryRecordStore::append(record, error);
  }

  std::atomic<bool> fail_next{false};
};

void flip_result_byte(std::string& line) {
  const std::string key = "\"decision_result\":\"";
  const size_t pos = line.find(key);
  expect(pos != std::string::npos, "stored line carries decision_result");
  line[pos + key.size()] ^= 0x01;
}

SegmentPtr seal_solo(TestNode& node, int records) {
  for (int i = 0; i < records; ++i) append_one(node.ledger, i);
  RoundReport rep = node.coord.run_round({});
  expect(rep.sealed, "single-node round must seal: " + rep.error.detail);
  return node.coord.segment(rep.segment_id);
}

// Sync transport that tracks how many fetched records the receiving pool
// has not committed yet.
class BufferWatchPeer : public SyncPeer {
 public:
  BufferWatchPeer(Synchronizer& source, RecordPool& receiver)
      : inner_(source), receiver_(receiver), base_(receiver.total()) {}

  std::string peer_id() const override { return inner_.peer_id(); }
  std::optional<TipSummary> summary(LedgerError* error = nullptr) override {
    return inner_.summary(error);
  }
  std::optional<std::vector<AuditRecord>> fetch(const std::string& node_id, uint64_t from,
                                                uint64_t to, LedgerError* error = nullptr) override {
    auto got = inner_.fetch(node_id, from, to, error);
    if (got) {
      fetched_ += got->size();
      const uint64_t outstanding = fetched_ - (receiver_.total() - base_);
      peak_ = std::max(peak_, outstanding);
    }
    return got;
  }
  std::optional<uint64_t> deliver(const std::vector<AuditRecord>& batch,
                                  LedgerError* error = nullptr) override {
    return inner_.deliver(batch, error);
  }

  uint64_t peak_outstanding() const { return peak_; }

 private:
  LocalPeer inner_;
  RecordPool& receiver_;
  uint64_t base_{0};
  uint64_t fetched_{0};
  uint64_t peak_{0};
};

// Forwards acknowledgement requests to `voter`. The first request runs
// `between` after the voter answered and before the reply is returned.
class InterleavingPeer : public ConsensusPeer {
 public:
  InterleavingPeer(ConsensusCoordinator& voter, std::function<void()> between)
      : voter_(voter), between_(std::move(between)) {}

  std::string peer_id() const override { return voter_.node_id(); }
  std::optional<Ack> request_ack(const Proposal& proposal, LedgerError* = nullptr) override {
    Ack ack = voter_.validate_proposal(proposal);
    if (between_) {
      auto run = std::move(between_);
      between_ = nullptr;
      run();
    }
    return ack;
  }
  bool install(const SegmentPtr& segment, LedgerError* error = nullptr) override {
    return voter_.install_sealed(segment, error);
  }
  SegmentPtr fetch_segment(uint64_t segment_id, LedgerError* error = nullptr) override {
    SegmentPtr seg = voter_.segment(segment_id);
    if (!seg) fail(error, make_error(ErrorCode::not_found, "not sealed"));
    return seg;
  }

 private:
  ConsensusCoordinator& voter_;
  std::function<void()> between_;
};

// a holds a0 and a1; b holds both; c holds only a0.
void share_split_history(TestNode& a, TestNode& b, TestNode& c) {
  append_one(a.ledger, 0);
  expect(c.sync.sync_with(a.peer).ok(), "c holds a0");
  append_one(a.ledger, 1);
  expect(b.sync.sync_with(a.peer).ok(), "b holds a0 and a1");
  expect(b.pool.count("node-a") == 2 && c.pool.count("node-a") == 1, "split history");
}

// ============================================================================
// Phase 1: Hashing and canonical form
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "same bytes";
  const std::string rec = record_content_hash(payload);
  const std::string prop = proposal_digest(payload);
  const std::string seg = segment_blob_hash(payload);
  expect(rec != prop && prop != seg && rec != seg, "domains must not collide");
  expect(rec != blake3_hex(payload), "record digest is prefixed");
  expect(is_valid_digest(rec) && is_valid_digest(zero_digest()), "digests are 64 lowercase hex");
  expect(zero_digest() == std::string(64, '0'), "genesis anchor is all zeros");
  expect(!is_valid_digest("ABCDEF"), "short or upper-case digest rejected");

  const std::string a = blake3_hex("a");
  const std::string b = blake3_hex("b");
  expect(merkle_pair_hash(a, b) != merkle_pair_hash(b, a), "pair hash is ordered");
}

void test_jsonlite_strictness() {
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate keys rejected");

  err.reset();
  jsonlite::parse("{\"a\":1} trailing", &err);
  expect(err.has_value(), "trailing data rejected");

  err.reset();
  jsonlite::parse("{\"a\":NaN}", &err);
  expect(err.has_value(), "NaN rejected");

  expect(jsonlite::validate_strict("[1,2]").has_value(), "top-level array rejected");

  err.reset();
  auto obj = jsonlite::parse("{\"n\":42,\"s\":\"x\\\"y\",\"b\":true}", &err);
  expect(!err.has_value(), "valid object parses");
  expect(jsonlite::get_u64(obj, "n") == 42, "u64 field");
  expect(jsonlite::get_string(obj, "s") == "x\"y", "escaped string field");
  expect(jsonlite::get_bool(obj, "b"), "bool field");
}

void test_record_canonical_form() {
  auto store = std::make_shared<MemoryRecordStore>();
  HashChainLedger ledger("node-a", store);
  AuditRecord r = append_one(ledger, 1);

  expect(r.sealed() && record_hash_matches(r), "sealed record hash matches content");
  expect(r.prev_hash == zero_digest(), "genesis links to the zero digest");
  expect(r.local_sequence == 0 && r.vector_clock.get("node-a") == 1, "genesis clock entry");
  expect(validate_sealed_record(r), "sealed record validates");

  const std::string canon = canonical_serialize(r);
  expect(canon.find("record_hash") == std::string::npos, "record_hash excluded from hashed form");
  expect(canonical_serialize(r) == canon, "canonical form is stable");

  auto back = record_from_json(record_to_json(r));
  expect(back.has_value(), "stored form decodes");
  expect(record_to_json(*back) == record_to_json(r), "stored form is canonical");

  AuditRecord edited = r;
  edited.decision_result = "denied";
  expect(!record_hash_matches(edited), "content change breaks the hash");
  LedgerError err;
  expect(!validate_sealed_record(edited, &err), "edited record rejected");
  expect(err.code == ErrorCode::integrity_violation, "edited record is an integrity violation");

  AuditRecord user = make_decision_record(EventType::HumanOverride, UserActor{"u-7", "caseworker"},
                                          "statute-2", "subject-9", "{}", "approved");
  expect(actor_kind(user.actor) == "user", "user actor kind");
  expect(event_type_from_string(to_string(EventType::Appeal)) == EventType::Appeal,
         "event type names round-trip");
  expect(!event_type_from_string("bogus").has_value(), "unknown event type rejected");
  expect(user.id.size() == 36 && user.id[14] == '4', "record id is a UUID v4");
}

// ============================================================================
// Phase 2: Hash-chain ledger
// ============================================================================

void test_append_head_verify() {
  auto store = std::make_shared<MemoryRecordStore>();
  HashChainLedger ledger("node-a", store);
  expect(!ledger.head().has_value(), "empty chain has no head");
  expect(ledger.verify_all().ok, "empty chain verifies");

  std::string prev = zero_digest();
  for (int i = 0; i < 25; ++i) {
    AuditRecord r = append_one(ledger, i);
    expect(r.local_sequence == static_cast<uint64_t>(i), "sequence is dense");
    expect(r.prev_hash == prev, "each record links to its predecessor");
    prev = r.record_hash;
  }
  auto head = ledger.head();
  expect(head && head->local_sequence == 24 && head->record_hash == prev, "head tracks last append");

  VerificationResult all = ledger.verify_all();
  expect(all.ok && all.links_checked == 25, "full chain verifies");
  VerificationResult mid = ledger.verify_range(10, 14);
  expect(mid.ok && mid.links_checked == 5, "sub-range verifies against its anchor");
  VerificationResult bad = ledger.verify_range(20, 30);
  expect(!bad.ok && bad.error.code == ErrorCode::invalid_argument, "range past head rejected");

  LedgerError err;
  expect(!ledger.append(AuditRecord{}, &err) && err.code == ErrorCode::invalid_record,
         "record without id rejected");
}

void test_byte_flip_detected_at_every_index() {
  auto store = std::make_shared<TamperableStore>();
  HashChainLedger ledger("node-a", store);
  const int n = 20;
  for (int i = 0; i < n; ++i) append_one(ledger, i);

  const int alerts_before = g_alerts.load();
  for (int i = 0; i < n; ++i) {
    store->edit(i, flip_result_byte);
    VerificationResult vr = ledger.verify_all();
    expect(!vr.ok, "flip at " + std::to_string(i) + " must be detected");
    expect(vr.error.code == ErrorCode::integrity_violation, "flip is an integrity violation");
    expect(vr.first_mismatch_at && *vr.first_mismatch_at == static_cast<uint64_t>(i),
           "flip located at index " + std::to_string(i));
    store->edit(i, flip_result_byte);
    expect(ledger.verify_all().ok, "restoring the byte restores the chain");
  }
  expect(g_alerts.load() >= alerts_before + n, "each violation raises an operator alert");

  // Structural damage is reported at the same slot.
  store->edit(7, [](std::string& line) { line[0] = '['; });
  VerificationResult vr = ledger.verify_all();
  expect(!vr.ok && vr.first_mismatch_at && *vr.first_mismatch_at == 7,
         "undecodable slot located at its index");
  expect(ledger.verify_range(0, 6).ok, "records before the damage still verify");
}

void test_file_store_corruption() {
  const fs::path dir = fresh_dir("file_corruption");
  const std::string path = (dir / "chain.ndjson").string();
  const uint64_t target = 6;

  auto store = std::make_shared<FileRecordStore>(path);
  expect(store->is_open(), "file store opens");
  auto ledger = std::make_unique<HashChainLedger>("node-a", store);
  expect(ledger->recover(), "empty file recovers");
  for (int i = 0; i < 10; ++i) append_one(*ledger, i);

  // Flip one byte of the target record's decision_result in place.
  {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string content = ss.str();
    size_t line_start = 0;
    for (uint64_t i = 0; i < target; ++i) line_start = content.find('\n', line_start) + 1;
    const std::string key = "\"decision_result\":\"";
    const size_t at = content.find(key, line_start) + key.size();
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    f.seekp(static_cast<std::streamoff>(at));
    f.put(static_cast<char>(content[at] ^ 0x01));
  }

  VerificationResult vr = ledger->verify_range(target, target);
  expect(!vr.ok && vr.error.code == ErrorCode::integrity_violation,
         "corrupted slot is an integrity violation");
  expect(vr.first_mismatch_at && *vr.first_mismatch_at == target &&
             vr.error.at_index == target,
         "violation located at the record's local_sequence");
  expect(ledger->verify_range(0, target - 1).ok, "records before the corruption verify");
  VerificationResult all = ledger->verify_all();
  expect(!all.ok && *all.first_mismatch_at == target, "full verification stops at the same slot");

  ledger.reset();
  store.reset();
  store = std::make_shared<FileRecordStore>(path);
  HashChainLedger reopened("node-a", store);
  LedgerError err;
  expect(!reopened.recover(&err), "recovery over a corrupted chain fails");
  expect(err.code == ErrorCode::integrity_violation && err.at_index == target,
         "recovery reports the corrupted slot");
  fs::remove_all(dir);
}

void test_persistence_failure_keeps_head() {
  auto store = std::make_shared<FailingStore>();
  HashChainLedger ledger("node-a", store);
  for (int i = 0; i < 3; ++i) append_one(ledger, i);
  const auto before = ledger.head();

  store->fail_next = true;
  LedgerError err;
  expect(!ledger.append(decision(99), &err), "failed write is not acknowledged");
  expect(err.code == ErrorCode::persistence_failure, "failure surfaces as persistence_failure");
  const auto after = ledger.head();
  expect(after && after->record_hash == before->record_hash &&
             after->local_sequence == before->local_sequence,
         "head does not advance on a failed write");
  expect(ledger.size() == 3 && ledger.clock().get("node-a") == 3, "clock does not advance");

  AuditRecord next = append_one(ledger, 4);
  expect(next.local_sequence == 3 && next.prev_hash == before->record_hash,
         "next append reuses the slot");
  expect(ledger.verify_all().ok, "chain stays valid");
}

void test_concurrent_appends() {
  auto store = std::make_shared<MemoryRecordStore>();
  HashChainLedger ledger("node-a", store);
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 50; ++i) {
        if (!ledger.append(decision(t * 100 + i))) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(failures.load() == 0, "no concurrent append fails");
  expect(ledger.size() == 200, "every append got a slot");
  VerificationResult vr = ledger.verify_all();
  expect(vr.ok && vr.links_checked == 200, "concurrently built chain verifies");
}

void test_recovery_from_file() {
  const fs::path dir = fresh_dir("recovery");
  const std::string path = (dir / "chain.ndjson").string();
  ChainHead head;
  {
    auto store = std::make_shared<FileRecordStore>(path);
    HashChainLedger ledger("node-a", store);
    expect(ledger.recover(), "fresh file recovers");
    for (int i = 0; i < 5; ++i) append_one(ledger, i);
    head = *ledger.head();
  }
  {
    std::ofstream torn(path, std::ios::binary | std::ios::app);
    torn << "{\"actor\":{\"kind\":\"sys";
  }

  auto store = std::make_shared<FileRecordStore>(path);
  expect(store->is_open() && store->count() == 5, "torn tail dropped on open");
  HashChainLedger ledger("node-a", store);
  LedgerError err;
  expect(ledger.recover(&err), "recovery succeeds: " + err.detail);
  expect(ledger.size() == 5 && ledger.head()->record_hash == head.record_hash,
         "recovered head matches");
  expect(ledger.clock().get("node-a") == 5, "own clock entry restored");
  AuditRecord r = append_one(ledger, 5);
  expect(r.local_sequence == 5 && r.prev_hash == head.record_hash, "appends continue the chain");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 3: Merkle verifier
// ============================================================================

void test_merkle_proofs() {
  for (uint64_t n = 1; n <= 17; ++n) {
    std::vector<std::string> leaves;
    for (uint64_t i = 0; i < n; ++i) leaves.push_back(blake3_hex("leaf-" + std::to_string(i)));
    MerkleTree tree = MerkleTree::build(leaves);
    const std::string root = *tree.root();
    for (uint64_t i = 0; i < n; ++i) {
      auto proof = tree.prove(i);
      expect(proof.has_value(), "proof exists for every leaf");
      expect(MerkleTree::verify_proof(leaves[i], *proof, root), "proof verifies");
      expect(!MerkleTree::verify_proof(blake3_hex("other"), *proof, root), "wrong leaf rejected");
      if (!proof->steps.empty()) {
        MerkleProof bad = *proof;
        bad.steps[0].sibling = blake3_hex("tampered");
        expect(!MerkleTree::verify_proof(leaves[i], bad, root), "corrupted step rejected");
      }
    }
    expect(!tree.prove(n).has_value(), "no proof past the last leaf");
  }
  expect(!MerkleTree().root().has_value(), "empty tree has no root");
}

void test_incremental_root_matches_batch() {
  MerkleTree incremental;
  std::vector<std::string> leaves;
  for (int i = 0; i < 70; ++i) {
    leaves.push_back(blake3_hex("leaf-" + std::to_string(i)));
    expect(incremental.append(leaves.back()), "valid digest appends");
    expect(incremental.root() == MerkleTree::build(leaves).root(),
           "incremental root equals batch root at size " + std::to_string(leaves.size()));
  }
  expect(!incremental.append("not-a-digest"), "malformed leaf refused");
}

void test_sampled_verification() {
  auto store = std::make_shared<MemoryRecordStore>();
  HashChainLedger ledger("node-a", store);
  for (int i = 0; i < 10000; ++i) append_one(ledger, i);

  SealedSegment seg;
  seg.strategy = "majority";
  seg.proposer = "node-a";
  seg.ranges["node-a"] = NodeRange{0, 9999, zero_digest()};
  seg.records = *ledger.read_range(0, 9999);
  seg.merkle_root = build_segment(seg.records);
  seg.build_index();

  VerificationResult full = verify_full(seg);
  expect(full.ok && full.links_checked == 10000, "full verification checks every link");
  VerificationResult sampled = verify_sampled(seg, 0.1, 42);
  expect(sampled.ok && sampled.links_checked == 1000, "sampling 0.1 checks 1000 links");
  expect(sampled.miss_probability_single_tamper > 0.89 &&
             sampled.miss_probability_single_tamper < 0.91,
         "miss probability reported");
  expect(sample_indices(10000, 1000, 42) == sample_indices(10000, 1000, 42),
         "sample is reproducible from the seed");
  expect(!verify_sampled(seg, 0.0, 1).ok, "zero sample rate rejected");

  seg.records[5000].decision_result = "tampered";
  VerificationResult broken = verify_full(seg);
  expect(!broken.ok && broken.first_mismatch_at && *broken.first_mismatch_at == 5000,
         "full verification locates the tampered record");
  VerificationResult every = verify_sampled(seg, 1.0, 7);
  expect(!every.ok && *every.first_mismatch_at == 5000, "rate 1.0 catches the tamper");
}

// ============================================================================
// Phase 4: Vector-clock synchronizer
// ============================================================================

void test_vector_clock_order() {
  VectorClock a(std::map<std::string, uint64_t>{{"x", 1}, {"y", 2}});
  VectorClock b(std::map<std::string, uint64_t>{{"x", 2}, {"y", 2}});
  VectorClock c(std::map<std::string, uint64_t>{{"x", 0}, {"y", 3}});
  expect(a.compare(b) == ClockOrder::Before && b.compare(a) == ClockOrder::After, "ordered");
  expect(b.compare(c) == ClockOrder::Concurrent, "concurrent");
  expect(a.compare(a) == ClockOrder::Equal, "equal");
  VectorClock m = b;
  m.merge(c);
  expect(m.get("x") == 2 && m.get("y") == 3 && m.dominates(c), "merge is pointwise max");
}

void test_sync_idempotent() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  for (int i = 0; i < 10; ++i) append_one(a.ledger, i);
  for (int i = 0; i < 7; ++i) append_one(b.ledger, 100 + i);

  SyncReport first = a.sync.sync_with(b.peer);
  expect(first.ok(), "first sync succeeds");
  expect(first.received == 7 && first.sent == 10, "first sync transfers both directions");
  expect(first.peer_sync_protocol == version::SYNC_PROTOCOL_VERSION, "handshake versions recorded");
  expect(a.pool.count("node-b") == 7 && b.pool.count("node-a") == 10, "both pools hold everything");
  expect(a.ledger.clock().get("node-b") == 7, "remote progress observed in the local clock");

  SyncReport second = a.sync.sync_with(b.peer);
  expect(second.ok() && second.empty(), "second sync transfers nothing");
  SyncReport reverse = b.sync.sync_with(a.peer);
  expect(reverse.ok() && reverse.empty(), "reverse sync transfers nothing");
}

void test_sync_unreachable_peer() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  b.peer.set_reachable(false);
  SyncReport rep = a.sync.sync_with(b.peer);
  expect(!rep.ok() && rep.errors.front().code == ErrorCode::peer_unreachable,
         "unreachable peer reported");
}

void test_fork_detected() {
  TestNode honest("node-a", kTrio);
  TestNode twin("node-a", kTrio);
  TestNode b("node-b", kTrio);
  for (int i = 0; i < 3; ++i) append_one(honest.ledger, i);
  for (int i = 0; i < 3; ++i) append_one(twin.ledger, 50 + i);

  expect(b.sync.sync_with(honest.peer).ok(), "first chain syncs");
  SyncReport rep = b.sync.sync_with(twin.peer);
  bool found = false;
  for (const auto& e : rep.errors) {
    if (e.code == ErrorCode::fork_detected && e.node_id == "node-a" && e.local_sequence == 0) {
      found = true;
    }
  }
  expect(found, "divergent chain reported as fork at the first differing slot");
  expect(b.pool.is_forked("node-a"), "forked chain is quarantined");

  LedgerError err;
  expect(!b.coord.propose(&err) && err.code == ErrorCode::fork_detected,
         "coordinator refuses to propose over a fork");
  expect(b.coord.current_state() == SegmentState::ForkDetected, "segment halted");
}

void test_pull_buffers_one_batch_per_node() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  TestNode c("node-c", kTrio);
  for (int round = 0; round < 6; ++round) {
    for (int i = 0; i < 10; ++i) {
      append_one(a.ledger, round * 10 + i);
      append_one(c.ledger, 500 + round * 10 + i);
    }
    expect(a.sync.sync_with(c.peer).ok(), "a and c exchange");
  }
  expect(a.pool.count("node-a") == 60 && a.pool.count("node-c") == 60, "a holds both chains");

  BufferWatchPeer source(a.sync, b.pool);
  Synchronizer small(b.pool, SyncOptions{8});
  SyncReport rep = small.sync_with(source);
  expect(rep.ok() && rep.received == 120, "every record pulled: " + rep.to_json());
  expect(b.pool.count("node-a") == 60 && b.pool.count("node-c") == 60, "both chains committed");
  expect(source.peak_outstanding() > 0 && source.peak_outstanding() <= 8 * 2,
         "at most one batch per node held before commit");
}

void test_out_of_order_batch_rejected() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  for (int i = 0; i < 4; ++i) append_one(a.ledger, i);
  auto records = *a.ledger.read_range(2, 3);
  LedgerError err;
  expect(!b.pool.commit(records, &err), "gap in chain rejected");
  expect(err.code == ErrorCode::causal_order_violation, "gap is a causal order violation");
  expect(b.pool.count("node-a") == 0, "nothing committed from a rejected batch");
}

// ============================================================================
// Phase 5: Consensus coordinator
// ============================================================================

void test_three_nodes_converge() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  TestNode c("node-c", kTrio);
  for (int i = 0; i < 100; ++i) {
    append_one(a.ledger, i);
    append_one(b.ledger, 1000 + i);
    append_one(c.ledger, 2000 + i);
  }
  expect(a.sync.sync_with(b.peer).ok(), "a<->b");
  expect(b.sync.sync_with(c.peer).ok(), "b<->c");
  expect(a.sync.sync_with(c.peer).ok(), "a<->c");
  expect(a.pool.total() == 300 && b.pool.total() == 300 && c.pool.total() == 300,
         "every pool holds 300 records");

  RoundReport rep = a.coord.run_round({&b.consensus_peer, &c.consensus_peer});
  expect(rep.sealed, "round seals: " + rep.error.detail);
  expect(rep.acks == 3 && rep.installed == 2, "all nodes acknowledged and installed");

  SegmentPtr sa = a.coord.segment(0);
  SegmentPtr sb = b.coord.segment(0);
  SegmentPtr sc = c.coord.segment(0);
  expect(sa && sb && sc, "segment 0 sealed everywhere");
  expect(sa->records.size() == 300, "segment holds every record");
  expect(sa->merkle_root == sb->merkle_root && sb->merkle_root == sc->merkle_root,
         "identical roots on every node");
  expect(verify_full(*sb).ok, "installed segment verifies");
  expect(a.coord.current_segment_id() == 1 && a.coord.current_state() == SegmentState::Open,
         "next segment opens");
  expect(a.coord.sealed_frontier().at("node-c") == 100, "frontier advanced");

  LedgerError err;
  expect(!a.coord.propose(&err) && err.code == ErrorCode::not_found, "nothing left to seal");
}

void test_causal_order_in_segments() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  TestNode c("node-c", kTrio);
  for (int i = 0; i < 3; ++i) append_one(a.ledger, i);
  expect(b.sync.sync_with(a.peer).ok(), "b learns a");
  for (int i = 0; i < 3; ++i) {
    AuditRecord r = append_one(b.ledger, 10 + i);
    expect(r.vector_clock.get("node-a") == 3, "b's records depend on a's");
  }
  expect(a.sync.sync_with(b.peer).ok(), "a learns b");
  expect(c.sync.sync_with(a.peer).ok(), "c learns both");

  auto proposal = a.coord.propose();
  expect(proposal.has_value(), "proposal built");
  Proposal reversed = *proposal;
  std::reverse(reversed.order.begin(), reversed.order.end());
  reversed.digest = compute_proposal_digest(reversed);
  Ack ack = c.coord.validate_proposal(reversed);
  expect(!ack.accept && ack.reason.code == ErrorCode::causal_order_violation,
         "causally invalid order refused");

  RoundReport rep = a.coord.run_round({&b.consensus_peer, &c.consensus_peer});
  expect(rep.sealed, "round seals: " + rep.error.detail);
  SegmentPtr seg = a.coord.segment(0);
  for (size_t pos = 0; pos < seg->records.size(); ++pos) {
    const AuditRecord& r = seg->records[pos];
    for (const auto& [node, count] : r.vector_clock.counters()) {
      if (node == r.node_id || count == 0) continue;
      auto dep = seg->position_of(node, count - 1);
      expect(dep.has_value() && *dep < pos, "dependency sealed before its dependent");
    }
  }
}

void test_quorum_timeout() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  TestNode c("node-c", kTrio);
  for (int i = 0; i < 5; ++i) append_one(a.ledger, i);
  expect(a.sync.sync_with(b.peer).ok() && a.sync.sync_with(c.peer).ok(), "records replicated");

  b.consensus_peer.set_reachable(false);
  c.consensus_peer.set_reachable(false);
  RoundReport rep = a.coord.run_round({&b.consensus_peer, &c.consensus_peer});
  expect(!rep.sealed && rep.error.code == ErrorCode::quorum_timeout, "no quorum -> quorum_timeout");
  expect(rep.acks == 1, "only the proposer acknowledged");
  expect(a.coord.current_state() == SegmentState::PendingQuorum, "segment stays pending");
  expect(a.coord.state(0) == SegmentState::PendingQuorum, "segment 0 pending");

  b.consensus_peer.set_reachable(true);
  RoundReport retry = a.coord.run_round({&b.consensus_peer, &c.consensus_peer});
  expect(retry.sealed && retry.acks == 2, "majority of two seals after retry");
  expect(a.coord.state(0) == SegmentState::Sealed, "segment 0 sealed");

  LedgerError err;
  expect(c.coord.catch_up(b.consensus_peer, &err) == 1, "lagging node catches up");
  expect(c.coord.segment(0)->merkle_root == retry.merkle_root, "caught-up root matches");
}

void test_one_vote_per_segment() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  TestNode c("node-c", kTrio);
  share_split_history(a, b, c);

  auto pa = a.coord.propose();
  auto pc = c.coord.propose();
  expect(pa && pc && pa->digest != pc->digest, "competing proposals for segment 0");
  expect(b.coord.validate_proposal(*pa).accept, "first proposal acknowledged");
  Ack second = b.coord.validate_proposal(*pc);
  expect(!second.accept && second.reason.code == ErrorCode::proposal_mismatch,
         "second proposer refused while the vote is held");
  expect(b.coord.validate_proposal(*pa).accept, "same proposal acknowledged again");
  LedgerError err;
  expect(!b.coord.propose(&err) && err.code == ErrorCode::proposal_mismatch,
         "a voter does not propose against its own vote");
  expect(!a.coord.validate_proposal(*pc).accept, "a proposer stands behind its own proposal");

  b.coord.check_timeouts(now_unix_ms() + 10000);
  expect(b.coord.validate_proposal(*pc).accept, "vote released once it expires");
}

void test_competing_proposers_seal_one_root() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  TestNode c("node-c", kTrio);
  share_split_history(a, b, c);

  RoundReport competing;
  InterleavingPeer via_b(b.coord, [&] { competing = c.coord.run_round({&b.consensus_peer}); });
  RoundReport rep = a.coord.run_round({&via_b});
  expect(rep.sealed && rep.acks == 2, "first proposer seals: " + rep.error.detail);
  expect(!competing.sealed && competing.error.code == ErrorCode::quorum_timeout,
         "competing proposer cannot reach a majority");
  expect(competing.acks == 1, "shared voter did not acknowledge twice");
  expect(b.coord.segment(0) && b.coord.segment(0)->merkle_root == rep.merkle_root,
         "voter installed the sealed segment");
  expect(!c.coord.segment(0), "competing proposer sealed nothing");

  LedgerError err;
  expect(c.coord.catch_up(b.consensus_peer, &err) == 1, "competing proposer catches up: " + err.detail);
  expect(c.coord.segment(0)->merkle_root == rep.merkle_root &&
             c.coord.segment(0)->records.size() == 2,
         "one root for segment 0 on every node");
}

void test_proposer_deadline() {
  TestNode a("node-a", kTrio, "majority", 100);
  append_one(a.ledger, 0);
  expect(a.coord.propose().has_value(), "proposal pending");
  expect(!a.coord.check_timeouts(now_unix_ms()), "deadline not yet reached");
  expect(a.coord.check_timeouts(now_unix_ms() + 1000), "deadline passes");
  expect(a.coord.current_state() == SegmentState::PendingQuorum, "still pending after timeout");
}

void test_segment_states() {
  expect(can_transition(SegmentState::Open, SegmentState::PendingQuorum), "open -> pending");
  expect(can_transition(SegmentState::PendingQuorum, SegmentState::Sealed), "pending -> sealed");
  expect(can_transition(SegmentState::PendingQuorum, SegmentState::ForkDetected),
         "pending -> fork");
  expect(!can_transition(SegmentState::Open, SegmentState::Sealed), "open cannot seal directly");
  expect(!can_transition(SegmentState::Sealed, SegmentState::Open), "sealed is terminal");
  expect(!can_transition(SegmentState::ForkDetected, SegmentState::PendingQuorum),
         "fork is terminal");
  expect(is_terminal(SegmentState::Sealed) && is_terminal(SegmentState::ForkDetected) &&
             !is_terminal(SegmentState::Open),
         "terminal states");

  TestNode a("node-a", {"node-a"});
  SegmentPtr seg = seal_solo(a, 2);
  LedgerError err;
  SealedSegment other = *seg;
  other.merkle_root = blake3_hex("different");
  expect(!a.coord.install_sealed(std::make_shared<const SealedSegment>(other), &err),
         "sealed segment cannot be replaced");
  expect(err.code == ErrorCode::segment_state_invalid, "replacement is a state error");

  a.coord.report_fork(fork_at("node-a", 0, "test"));
  expect(a.coord.current_state() == SegmentState::ForkDetected, "fork halts the open segment");
  append_one(a.ledger, 5);
  RoundReport rep = a.coord.run_round({});
  expect(!rep.sealed && rep.error.code == ErrorCode::fork_detected, "no sealing after a fork");
}

void test_leader_failover() {
  TestNode a("node-a", kTrio, "leader", 1000);
  TestNode b("node-b", kTrio, "leader", 1000);
  TestNode c("node-c", kTrio, "leader", 1000);
  a.consensus_peer.set_reachable(false);
  for (int i = 0; i < 4; ++i) append_one(b.ledger, i);
  expect(b.sync.sync_with(c.peer).ok(), "b and c share records");

  RoundReport early = b.coord.run_round({&a.consensus_peer, &c.consensus_peer});
  expect(!early.sealed && early.error.code == ErrorCode::not_leader, "follower may not propose");

  expect(!b.coord.check_timeouts(now_unix_ms()), "leader still within its timeout");
  expect(b.coord.check_timeouts(now_unix_ms() + 5000), "silent leader detected");
  expect(b.coord.epoch() == 1, "epoch advanced");

  RoundReport rep = b.coord.run_round({&a.consensus_peer, &c.consensus_peer});
  expect(rep.sealed && rep.acks == 2, "new leader seals with a majority");
  expect(c.coord.segment(0) && c.coord.segment(0)->merkle_root == rep.merkle_root,
         "follower installed the new leader's segment");
  expect(c.coord.epoch() == 1, "follower adopted the new epoch");
}

void test_bft_strategy() {
  LedgerError err;
  expect(!make_strategy("bft", {"a", "b", "c"}, &err), "bft refuses fewer than 4 nodes");
  expect(err.code == ErrorCode::config_invalid, "bft size is a config error");
  expect(!make_strategy("paxos", {"a"}, &err) && err.code == ErrorCode::config_invalid,
         "unknown strategy refused");

  BftStrategy four({"d", "c", "b", "a"});
  expect(four.faults_tolerated() == 1 && four.quorum_size() == 3, "n=4 tolerates 1, quorum 3");
  BftStrategy seven({"a", "b", "c", "d", "e", "f", "g"});
  expect(seven.faults_tolerated() == 2 && seven.quorum_size() == 5, "n=7 tolerates 2, quorum 5");
  expect(four.primary() == "a" && four.may_propose("a", 0) && !four.may_propose("b", 0),
         "primary rotates with the view");

  four.on_conflicting_acks({"c"});
  expect(four.epoch() == 0 && four.suspected().count("c") == 1, "f conflicts only suspect");
  four.on_conflicting_acks({"c", "d"});
  expect(four.epoch() == 1 && four.primary() == "b", "more than f conflicts change the view");

  MajorityStrategy majority({"a", "b", "c", "d"});
  expect(majority.quorum_size() == 3, "majority of four is three");
}

void test_strategy_mismatch_refused() {
  TestNode a("node-a", kTrio, "majority");
  TestNode b("node-b", kTrio, "leader");
  append_one(a.ledger, 0);
  expect(a.sync.sync_with(b.peer).ok(), "records shared");
  auto p = a.coord.propose();
  expect(p.has_value(), "proposal built");
  Ack ack = b.coord.validate_proposal(*p);
  expect(!ack.accept && ack.reason.code == ErrorCode::proposal_mismatch,
         "proposal from another strategy refused");
}

void test_export_and_attestation() {
  TestNode a("node-a", {"node-a"});
  SegmentPtr seg = seal_solo(a, 4);
  LedgerError err;
  auto root = a.coord.export_root(0, &err);
  expect(root && *root == seg->merkle_root, "export returns the verified root");
  expect(!a.coord.export_root(5, &err) && err.code == ErrorCode::not_found, "unsealed id refused");

  Attestation att;
  att.segment_id = 0;
  att.merkle_root = *root;
  att.authority = "notary";
  att.proof = "signature-bytes";
  expect(a.coord.import_attestation(0, att, &err), "matching attestation imported");
  Attestation wrong = att;
  wrong.merkle_root = blake3_hex("other");
  expect(!a.coord.import_attestation(0, wrong, &err) && err.code == ErrorCode::invalid_argument,
         "attestation for another root refused");
  auto list = a.coord.attestations(0);
  expect(list.size() == 1 && list[0].authority == "notary" && list[0].imported_at_unix_ms > 0,
         "attestation stored");
}

// ============================================================================
// Phase 6: Persistence port and archive
// ============================================================================

void test_archive_round_trip_and_tamper() {
  const fs::path dir = fresh_dir("archive");
  TestNode a("node-a", {"node-a"});
  SegmentPtr seg = seal_solo(a, 6);

  FileSegmentArchive archive(dir.string());
  LedgerError err;
  expect(archive.put_segment(*seg, &err), "segment archived: " + err.detail);
  expect(archive.put_segment(*seg, &err), "re-archiving the same segment is a no-op");
  SealedSegment other = *seg;
  other.merkle_root = blake3_hex("other");
  expect(!archive.put_segment(other, &err) && err.code == ErrorCode::segment_state_invalid,
         "archived segment cannot be overwritten");

  auto loaded = archive.get_segment(seg->segment_id, &err);
  expect(loaded.has_value(), "archived segment loads");
  expect(loaded->merkle_root == seg->merkle_root && loaded->records.size() == 6,
         "loaded segment matches");
  expect(verify_full(*loaded).ok, "loaded segment verifies");
  expect(archive.segment_ids() == std::vector<uint64_t>{0}, "segment listed");

  Attestation att{0, seg->merkle_root, "notary", "proof", 1};
  expect(archive.put_attestation(att, &err), "attestation archived");
  expect(archive.attestations(0).size() == 1, "attestation listed");

  {
    std::fstream f(archive.segment_path(0), std::ios::in | std::ios::out | std::ios::binary);
    f.seekg(10);
    char ch = 0;
    f.get(ch);
    f.seekp(10);
    f.put(static_cast<char>(ch ^ 0x01));
  }
  const int alerts_before = g_alerts.load();
  expect(!archive.get_segment(0, &err), "tampered archive fails closed");
  expect(err.code == ErrorCode::integrity_violation, "tamper is an integrity violation");
  expect(g_alerts.load() > alerts_before, "tamper raises an operator alert");
  fs::remove_all(dir);
}

void test_archive_writes_leave_no_temp_files() {
  const fs::path dir = fresh_dir("archive_durable");
  TestNode a("node-a", {"node-a"});
  SegmentPtr seg = seal_solo(a, 3);
  FileSegmentArchive archive(dir.string());
  LedgerError err;
  expect(archive.put_segment(*seg, &err), "segment archived: " + err.detail);
  Attestation att{0, seg->merkle_root, "notary", "proof", 1};
  expect(archive.put_attestation(att, &err), "attestation archived: " + err.detail);

  size_t files = 0;
  for (const auto& entry : fs::recursive_directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    ++files;
    expect(entry.path().filename().string().rfind(".tmp_", 0) != 0, "no temp file left behind");
  }
  expect(files >= 3, "blob, meta sidecar and attestation written");
  FileSegmentArchive reopened(dir.string());
  auto loaded = reopened.get_segment(0, &err);
  expect(loaded && loaded->merkle_root == seg->merkle_root, "renamed blob readable after reopen");
  fs::remove_all(dir);
}

#if defined(LEXLEDGER_WITH_ZSTD)
void test_archive_zstd() {
  const fs::path dir = fresh_dir("archive_zstd");
  TestNode a("node-a", {"node-a"});
  SegmentPtr seg = seal_solo(a, 40);
  FileSegmentArchive archive(dir.string(), "zstd");
  LedgerError err;
  expect(archive.put_segment(*seg, &err), "compressed segment archived");
  auto info = archive.info(0);
  expect(info && info->encoding == "zstd" && info->stored_size < info->original_size,
         "segment stored compressed");
  auto loaded = archive.get_segment(0, &err);
  expect(loaded && loaded->merkle_root == seg->merkle_root, "compressed segment loads");
  fs::remove_all(dir);
}
#endif

// ============================================================================
// Phase 7: Configuration, peers, scheduling
// ============================================================================

void test_config_env_and_overrides() {
  ::setenv("LEXLEDGER_NODE_ID", "env-node", 1);
  ::setenv("LEXLEDGER_KNOWN_NODES", "peer-b, peer-a", 1);
  ::setenv("LEXLEDGER_SYNC_BATCH", "32", 1);
  LedgerError err;
  auto cfg = load_config_from_env({}, &err);
  expect(cfg.has_value(), "env config loads: " + err.detail);
  expect(cfg->node_id == "env-node" && cfg->sync_batch_size == 32, "env values applied");
  expect(cfg->known_nodes == std::vector<std::string>({"env-node", "peer-a", "peer-b"}),
         "known nodes include self, sorted");
  expect(cfg->consensus == "majority" && cfg->sample_rate == 0.1, "defaults kept");

  ConfigOverrides o;
  o.node_id = "explicit";
  o.sync_batch_size = 8;
  cfg = load_config_from_env(o, &err);
  expect(cfg && cfg->node_id == "explicit" && cfg->sync_batch_size == 8, "explicit values win");

  ::setenv("LEXLEDGER_SYNC_BATCH", "lots", 1);
  expect(!load_config_from_env({}, &err) && err.code == ErrorCode::config_invalid,
         "malformed number rejected");
  ::unsetenv("LEXLEDGER_NODE_ID");
  ::unsetenv("LEXLEDGER_KNOWN_NODES");
  ::unsetenv("LEXLEDGER_SYNC_BATCH");

  expect(split_node_list(" a,,b ,a") == std::vector<std::string>({"a", "b", "a"}),
         "node list trimmed");
}

void test_config_validation() {
  LedgerConfig c;
  c.node_id = "n1";
  c.known_nodes = {"n1"};
  expect(validate_config(c), "defaults are valid");
  LedgerError err;

  LedgerConfig rate = c;
  rate.sample_rate = 0.0;
  expect(!validate_config(rate, &err) && err.code == ErrorCode::config_invalid, "zero rate");
  LedgerConfig bft = c;
  bft.consensus = "bft";
  expect(!validate_config(bft, &err), "bft with one node");
  LedgerConfig comp = c;
  comp.compression = "lz4";
  expect(!validate_config(comp, &err), "unknown compression");
  LedgerConfig named = c;
  named.node_id = "a,b";
  expect(!validate_config(named, &err), "comma in node id");
  LedgerConfig batch = c;
  batch.sync_batch_size = 0;
  expect(!validate_config(batch, &err), "zero batch");
}

void test_channel_policies() {
  BoundedChannel<int> drop(2, ChannelPolicy::DropOldest);
  drop.push(1);
  drop.push(2);
  drop.push(3);
  expect(drop.dropped() == 1 && drop.size() == 2, "oldest dropped");
  expect(drop.try_pop() == 2 && drop.try_pop() == 3 && !drop.try_pop(), "newest kept in order");

  BoundedChannel<int> block(1, ChannelPolicy::Block);
  block.push(1);
  std::atomic<bool> pushed{false};
  std::thread producer([&] {
    block.push(2);
    pushed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  expect(!pushed.load(), "producer blocks when full");
  expect(block.pop_for(std::chrono::milliseconds(100)) == 1, "consumer drains");
  producer.join();
  expect(pushed.load() && block.try_pop() == 2, "blocked push completes");

  block.close();
  expect(!block.push(3) && block.closed(), "closed channel refuses pushes");
  expect(!block.pop_for(std::chrono::milliseconds(10)).has_value(), "closed and empty");
}

void test_peer_registry() {
  PeerRegistry reg(3, 60000);
  reg.register_peer("node-b");
  expect(reg.peer_count() == 1 && reg.is_healthy("node-b"), "registered peer healthy");
  expect(reg.backoff_ms("node-b", 100) == 100, "no failures, base interval");

  for (int i = 0; i < 3; ++i) reg.record_failure("node-b", make_error(ErrorCode::peer_unreachable, "down"));
  expect(!reg.is_healthy("node-b") && reg.healthy_count() == 0, "unhealthy after 3 failures");
  expect(reg.backoff_ms("node-b", 100) == 800, "backoff doubles per failure");
  for (int i = 0; i < 30; ++i) reg.record_failure("node-b", make_error(ErrorCode::peer_unreachable, "down"));
  expect(reg.backoff_ms("node-b", 100) == 60000, "backoff capped");

  SyncReport ok;
  ok.peer_id = "node-b";
  ok.received = 4;
  ok.peer_sync_protocol = version::SYNC_PROTOCOL_VERSION;
  ok.peer_hash_algorithm = version::HASH_ALGORITHM_VERSION;
  reg.record_sync(ok);
  expect(reg.is_healthy("node-b") && reg.backoff_ms("node-b", 100) == 100, "success resets");
  expect(reg.drift_status().ok, "matching versions");

  reg.record_versions("node-c", version::SYNC_PROTOCOL_VERSION + 1, version::HASH_ALGORITHM_VERSION);
  DriftStatus drift = reg.drift_status();
  expect(!drift.ok && drift.mismatches.size() == 1 && drift.mismatches[0].peer_id == "node-c",
         "protocol drift reported");
  expect(!version::check_peer_compatibility(version::SYNC_PROTOCOL_VERSION + 1,
                                            version::HASH_ALGORITHM_VERSION)
              .ok,
         "incompatible protocol refused");
}

void test_scheduler_run_once() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  for (int i = 0; i < 5; ++i) append_one(b.ledger, i);

  PeerRegistry reg;
  SyncScheduler sched(a.sync, reg);
  sched.add_peer(std::make_shared<LocalPeer>(b.sync));
  sched.run_once();
  expect(sched.rounds() == 1 && sched.ingested() == 5, "one round pulled five records");
  expect(a.pool.count("node-b") == 5, "records committed");
  expect(reg.peer_count() == 1 && reg.snapshot()[0].records_received == 5, "registry updated");
}

void test_scheduler_background() {
  TestNode a("node-a", kTrio);
  TestNode b("node-b", kTrio);
  for (int i = 0; i < 5; ++i) append_one(b.ledger, i);

  PeerRegistry reg;
  SchedulerOptions opts;
  opts.interval = std::chrono::milliseconds(10);
  opts.inbound_capacity = 4;
  SyncScheduler sched(a.sync, reg, opts);
  sched.add_peer(std::make_shared<LocalPeer>(b.sync));
  sched.start();
  expect(sched.running(), "scheduler running");
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (a.pool.count("node-b") < 5 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  sched.stop();
  expect(!sched.running(), "scheduler stopped");
  expect(a.pool.count("node-b") == 5, "background sync delivered every record");
  expect(b.pool.count("node-a") == 0, "nothing to push from an empty chain");
}

void test_consensus_background_retry() {
  TestNode a("node-a", kTrio, "majority", 500);
  TestNode b("node-b", kTrio, "majority", 500);
  TestNode c("node-c", kTrio, "majority", 500);
  for (int i = 0; i < 5; ++i) append_one(a.ledger, i);
  expect(a.sync.sync_with(b.peer).ok() && a.sync.sync_with(c.peer).ok(), "records replicated");

  auto to_b = std::make_shared<LocalConsensusPeer>(b.coord);
  auto to_c = std::make_shared<LocalConsensusPeer>(c.coord);
  to_b->set_reachable(false);
  to_c->set_reachable(false);

  ConsensusSchedulerOptions opts;
  opts.interval = std::chrono::milliseconds(20);
  opts.max_backoff = std::chrono::milliseconds(80);
  ConsensusScheduler sched(a.coord, opts);
  sched.add_peer(to_b);
  sched.add_peer(to_c);

  RoundReport first = sched.tick();
  expect(!first.sealed && first.error.code == ErrorCode::quorum_timeout, "no quorum while partitioned");
  expect(sched.consecutive_timeouts() == 1 && sched.backoff_ms() == 40, "timeout doubles the wait");
  expect(a.coord.current_state() == SegmentState::PendingQuorum, "segment pending");

  sched.start();
  to_b->set_reachable(true);
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (a.coord.state(0) != SegmentState::Sealed && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  sched.stop();
  expect(!sched.running(), "consensus task stopped");
  expect(a.coord.state(0) == SegmentState::Sealed, "pending segment sealed without a manual retry");
  expect(sched.sealed() >= 1 && sched.consecutive_timeouts() == 0, "seal resets the backoff");
  expect(b.coord.segment(0) && b.coord.segment(0)->merkle_root == a.coord.segment(0)->merkle_root,
         "reachable peer installed the segment");
}

void test_consensus_tick_follows_leader() {
  TestNode a("node-a", kTrio, "leader", 1000);
  TestNode b("node-b", kTrio, "leader", 1000);
  append_one(a.ledger, 0);
  append_one(b.ledger, 0);
  expect(a.sync.sync_with(b.peer).ok(), "records shared");

  ConsensusScheduler follower(b.coord);
  follower.add_peer(std::make_shared<LocalConsensusPeer>(a.coord));
  RoundReport idle = follower.tick();
  expect(!idle.sealed && idle.error.code == ErrorCode::not_leader, "follower does not propose");

  ConsensusScheduler leader(a.coord);
  leader.add_peer(std::make_shared<LocalConsensusPeer>(b.coord));
  RoundReport rep = leader.tick();
  expect(rep.sealed && rep.installed == 1, "leader tick seals and installs: " + rep.error.detail);
  expect(b.coord.current_segment_id() == 1, "follower holds the segment");
}

// ============================================================================
// Phase 8: Node, queries, compliance
// ============================================================================

void test_node_lifecycle() {
  const fs::path dir = fresh_dir("node");
  LedgerConfig cfg;
  cfg.node_id = "n1";
  cfg.known_nodes = {"n1"};
  cfg.store_path = (dir / "store").string();
  cfg.archive_path = (dir / "archive").string();

  std::string first_id;
  std::string root;
  {
    LedgerError err;
    auto node = LedgerNode::open(cfg, &err);
    expect(node != nullptr, "node opens: " + err.detail);
    expect(node->start(&err), "node starts: " + err.detail);

    auto r0 = node->record_decision(EventType::AutomaticDecision, SystemActor{"engine"}, "s-1",
                                    "p-1", "{}", "approved", &err);
    auto r1 = node->record_decision(EventType::HumanOverride, UserActor{"u-1", "reviewer"}, "s-1",
                                    "p-1", "{}", "denied", &err);
    auto r2 = node->record_decision(EventType::Appeal, ExternalActor{"court"}, "s-2", "p-2", "{}",
                                    "pending", &err);
    expect(r0 && r1 && r2, "decisions recorded");
    first_id = r0->id;

    expect(node->open_size() == 3, "open segment tracks appends");
    auto proof = node->prove_open(1);
    expect(proof && MerkleTree::verify_proof(r1->record_hash, *proof, *node->open_root()),
           "open segment proof verifies");

    expect(!node->record_correction("missing", EventType::HumanOverride, UserActor{"u-1", "r"},
                                    "s-1", "p-1", "{}", "x", &err),
           "correction of an unknown record refused");
    expect(err.code == ErrorCode::not_found, "unknown record is not_found");
    auto fix = node->record_correction(first_id, EventType::HumanOverride, UserActor{"u-1", "r"},
                                       "s-1", "p-1", "{}", "approved-amended", &err);
    expect(fix && fix->correction_of == first_id, "correction links to the original");

    RoundReport rep = node->seal({});
    expect(rep.sealed, "single node seals: " + rep.error.detail);
    root = rep.merkle_root;
    expect(node->open_size() == 0 && node->open_first_sequence() == 4, "open segment reset");
    expect(node->verify_segment_sampled(0, 3).ok, "sampled verification of the sealed segment");

    RecordQuery by_statute;
    by_statute.statute_id = "s-1";
    expect(node->query(by_statute).size() == 3, "query by statute");
    RecordQuery overrides;
    overrides.event_type = EventType::HumanOverride;
    overrides.limit = 1;
    expect(node->query(overrides).size() == 1, "query honours limit");
    RecordQuery users;
    users.actor_kind = "user";
    expect(node->query(users).size() == 2, "query by actor kind");

    ComplianceSummary summary = node->compliance_summary();
    expect(summary.segments == 1 && summary.total_records == 4 && summary.all_verified,
           "compliance summary counts the sealed records");
    expect(summary.human_overrides == 2 && summary.appeals == 1 && summary.corrections == 1,
           "compliance summary by type");
    expect(corrections_of(node->coordinator().sealed_segments(), first_id).size() == 1,
           "corrections found for the original");

    const std::string status = node->status_to_json();
    expect(status.find("\"node_id\":\"n1\"") != std::string::npos, "status names the node");
    expect(status.find("\"strategy\":\"majority\"") != std::string::npos, "status names strategy");
  }

  LedgerError err;
  auto node = LedgerNode::open(cfg, &err);
  expect(node && node->start(&err), "node restarts: " + err.detail);
  expect(node->ledger().size() == 4, "chain recovered");
  expect(node->coordinator().current_segment_id() == 1, "sealed segment restored");
  expect(node->coordinator().segment(0)->merkle_root == root, "restored root matches");
  expect(node->open_size() == 0 && node->open_first_sequence() == 4, "open segment restored");
  fs::remove_all(dir);
}

void test_node_background_consensus() {
  LedgerConfig cfg;
  cfg.node_id = "n1";
  cfg.known_nodes = {"n1"};
  cfg.quorum_timeout_ms = 50;
  LedgerError err;
  auto node = LedgerNode::open(cfg, &err);
  expect(node && node->start(&err), "node starts: " + err.detail);
  for (int i = 0; i < 2; ++i) {
    expect(node->record_decision(EventType::AutomaticDecision, SystemActor{"engine"}, "s-1",
                                 "p-" + std::to_string(i), "{}", "approved", &err)
               .has_value(),
           "decision recorded");
  }

  node->start_background_consensus({});
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (node->coordinator().current_segment_id() == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  node->stop_background_consensus();
  expect(node->coordinator().current_segment_id() == 1, "background task sealed the segment");
  expect(node->coordinator().segment(0)->records.size() == 2 && node->open_size() == 0,
         "open segment cut back after the background seal");
}

void test_node_rejects_bad_config() {
  LedgerConfig cfg;
  cfg.node_id = "n1";
  cfg.known_nodes = {"n1", "n2"};
  cfg.consensus = "bft";
  LedgerError err;
  expect(LedgerNode::open(cfg, &err) == nullptr && err.code == ErrorCode::config_invalid,
         "node refuses an invalid configuration");
}

}  // namespace

int main() {
  set_operator_alert_hook(count_alert);
  std::cout << "=== lexledger test suite ===\n";

  std::cout << "\n[Phase 1] Hashing and canonical form\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("jsonlite strictness", test_jsonlite_strictness);
  run_test("record canonical form", test_record_canonical_form);

  std::cout << "\n[Phase 2] Hash-chain ledger\n";
  run_test("append, head, verify", test_append_head_verify);
  run_test("byte flip detected at every index", test_byte_flip_detected_at_every_index);
  run_test("file store corruption located", test_file_store_corruption);
  run_test("persistence failure keeps head", test_persistence_failure_keeps_head);
  run_test("concurrent appends", test_concurrent_appends);
  run_test("recovery from file", test_recovery_from_file);

  std::cout << "\n[Phase 3] Merkle verifier\n";
  run_test("proofs for every leaf", test_merkle_proofs);
  run_test("incremental root equals batch root", test_incremental_root_matches_batch);
  run_test("sampled verification", test_sampled_verification);

  std::cout << "\n[Phase 4] Vector-clock synchronizer\n";
  run_test("vector clock order", test_vector_clock_order);
  run_test("sync is idempotent", test_sync_idempotent);
  run_test("unreachable peer", test_sync_unreachable_peer);
  run_test("fork detected", test_fork_detected);
  run_test("pull buffers one batch per node", test_pull_buffers_one_batch_per_node);
  run_test("out-of-order batch rejected", test_out_of_order_batch_rejected);

  std::cout << "\n[Phase 5] Consensus coordinator\n";
  run_test("three nodes converge", test_three_nodes_converge);
  run_test("causal order in sealed segments", test_causal_order_in_segments);
  run_test("quorum timeout", test_quorum_timeout);
  run_test("one vote per segment", test_one_vote_per_segment);
  run_test("competing proposers seal one root", test_competing_proposers_seal_one_root);
  run_test("proposer deadline", test_proposer_deadline);
  run_test("segment states", test_segment_states);
  run_test("leader failover", test_leader_failover);
  run_test("bft strategy", test_bft_strategy);
  run_test("strategy mismatch refused", test_strategy_mismatch_refused);
  run_test("export root and attestation", test_export_and_attestation);

  std::cout << "\n[Phase 6] Persistence port and archive\n";
  run_test("archive round trip and tamper", test_archive_round_trip_and_tamper);
  run_test("archive writes leave no temp files", test_archive_writes_leave_no_temp_files);
#if defined(LEXLEDGER_WITH_ZSTD)
  run_test("archive zstd", test_archive_zstd);
#endif

  std::cout << "\n[Phase 7] Configuration, peers, scheduling\n";
  run_test("config env and overrides", test_config_env_and_overrides);
  run_test("config validation", test_config_validation);
  run_test("channel policies", test_channel_policies);
  run_test("peer registry", test_peer_registry);
  run_test("scheduler run_once", test_scheduler_run_once);
  run_test("scheduler background", test_scheduler_background);
  run_test("consensus background retry", test_consensus_background_retry);
  run_test("consensus tick follows the leader", test_consensus_tick_follows_leader);

  std::cout << "\n[Phase 8] Node, queries, compliance\n";
  run_test("node lifecycle", test_node_lifecycle);
  run_test("node background consensus", test_node_background_consensus);
  run_test("node rejects bad config", test_node_rejects_bad_config);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
