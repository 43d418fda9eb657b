#include "lexledger/merkle.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>
#include <unordered_set>

#include "lexledger/hash.hpp"
#include "lexledger/observability.hpp"

namespace lexledger {

namespace {

VerificationResult mismatch(uint64_t index, const std::string& why) {
  VerificationResult vr;
  vr.ok = false;
  vr.first_mismatch_at = index;
  vr.error = integrity_violation_at(index, why);
  return vr;
}

// Checks record hash and chain link of the record at `pos`.
std::string check_link(const SealedSegment& s, size_t pos) {
  const AuditRecord& r = s.records[pos];
  if (!record_hash_matches(r)) return "record_hash does not match content";
  const std::string expected = s.expected_prev_hash(pos);
  if (expected.empty()) return "predecessor not resolvable inside segment";
  if (r.prev_hash != expected) return "prev_hash does not match predecessor";
  if (r.vector_clock.get(r.node_id) != r.local_sequence + 1) {
    return "own clock entry is not local_sequence + 1";
  }
  return {};
}

void emit_verify(const VerificationResult& vr) {
  LedgerEvent ev;
  ev.kind = LedgerEventKind::verify;
  ev.ok = vr.ok;
  ev.count = vr.links_checked;
  ev.error_code = to_string(vr.error.code);
  ev.detail = "segment";
  emit_ledger_event(ev);
}

}  // namespace

std::string proof_to_json(const MerkleProof& p) {
  std::ostringstream o;
  o << "{\"leaf_index\":" << p.leaf_index << ",\"leaf_count\":" << p.leaf_count
    << ",\"steps\":[";
  for (size_t i = 0; i < p.steps.size(); ++i) {
    if (i) o << ',';
    o << "{\"sibling\":\"" << p.steps[i].sibling << "\",\"left\":"
      << (p.steps[i].sibling_on_left ? "true" : "false") << "}";
  }
  o << "]}";
  return o.str();
}

// ---------------------------------------------------------------------------
// MerkleTree
// ---------------------------------------------------------------------------

MerkleTree MerkleTree::build(const std::vector<std::string>& leaves) {
  MerkleTree t;
  if (leaves.empty()) return t;
  t.levels_.push_back(leaves);
  while (t.levels_.back().size() > 1) {
    const auto& below = t.levels_.back();
    std::vector<std::string> level;
    level.reserve((below.size() + 1) / 2);
    for (size_t i = 0; i < below.size(); i += 2) {
      const std::string& left = below[i];
      const std::string& right = (i + 1 < below.size()) ? below[i + 1] : below[i];
      level.push_back(merkle_pair_hash(left, right));
    }
    t.levels_.push_back(std::move(level));
  }
  return t;
}

bool MerkleTree::append(const std::string& leaf_hash) {
  if (!is_valid_digest(leaf_hash)) return false;
  if (levels_.empty()) levels_.emplace_back();
  levels_[0].push_back(leaf_hash);

  // Walk the new leaf's ancestor path only.
  size_t index = levels_[0].size() - 1;
  for (size_t l = 0; levels_[l].size() > 1; ++l) {
    const auto& level = levels_[l];
    const size_t left_i = index & ~static_cast<size_t>(1);
    const std::string& left = level[left_i];
    const std::string& right = (left_i + 1 < level.size()) ? level[left_i + 1] : level[left_i];
    std::string parent = merkle_pair_hash(left, right);
    const size_t parent_i = index / 2;
    if (levels_.size() == l + 1) levels_.emplace_back();
    auto& up = levels_[l + 1];
    if (parent_i == up.size()) {
      up.push_back(std::move(parent));
    } else {
      up[parent_i] = std::move(parent);
    }
    index = parent_i;
  }
  return true;
}

std::optional<std::string> MerkleTree::root() const {
  if (levels_.empty() || levels_[0].empty()) return std::nullopt;
  return levels_.back()[0];
}

std::optional<MerkleProof> MerkleTree::prove(uint64_t index) const {
  if (levels_.empty() || index >= levels_[0].size()) return std::nullopt;
  MerkleProof p;
  p.leaf_index = index;
  p.leaf_count = levels_[0].size();
  size_t i = static_cast<size_t>(index);
  for (size_t l = 0; l + 1 < levels_.size(); ++l) {
    const auto& level = levels_[l];
    const size_t sib = i ^ 1u;
    ProofStep step;
    step.sibling_on_left = (i & 1u) != 0;
    step.sibling = sib < level.size() ? level[sib] : level[i];
    p.steps.push_back(std::move(step));
    i /= 2;
  }
  return p;
}

bool MerkleTree::verify_proof(const std::string& leaf_hash, const MerkleProof& proof,
                              const std::string& root) {
  if (proof.leaf_count == 0 || proof.leaf_index >= proof.leaf_count) return false;
  if (!is_valid_digest(leaf_hash) || !is_valid_digest(root)) return false;

  // The path shape is fixed by (leaf_index, leaf_count); a proof with the
  // wrong depth or flags cannot belong to that position.
  size_t depth = 0;
  for (uint64_t width = proof.leaf_count; width > 1; width = (width + 1) / 2) ++depth;
  if (proof.steps.size() != depth) return false;

  std::string h = leaf_hash;
  uint64_t i = proof.leaf_index;
  for (const auto& step : proof.steps) {
    if (step.sibling_on_left != ((i & 1u) != 0)) return false;
    h = step.sibling_on_left ? merkle_pair_hash(step.sibling, h)
                             : merkle_pair_hash(h, step.sibling);
    if (h.empty()) return false;
    i /= 2;
  }
  return h == root;
}

std::string build_segment(const std::vector<AuditRecord>& records) {
  std::vector<std::string> leaves;
  leaves.reserve(records.size());
  for (const auto& r : records) leaves.push_back(r.record_hash);
  auto root = MerkleTree::build(leaves).root();
  return root ? *root : std::string();
}

// ---------------------------------------------------------------------------
// Segment verification
// ---------------------------------------------------------------------------

VerificationResult verify_full(const SealedSegment& s) {
  VerificationResult vr;

  // Membership: exactly the declared ranges, each slot present once.
  uint64_t expected_count = 0;
  for (const auto& [node, r] : s.ranges) expected_count += r.last_seq - r.first_seq + 1;
  if (expected_count != s.records.size()) {
    vr = mismatch(0, "segment holds " + std::to_string(s.records.size()) +
                         " records, ranges declare " + std::to_string(expected_count));
    emit_verify(vr);
    return vr;
  }

  for (size_t pos = 0; pos < s.records.size(); ++pos) {
    const AuditRecord& r = s.records[pos];
    auto at = s.position_of(r.node_id, r.local_sequence);
    std::string why;
    if (!at || *at != pos) {
      why = "record outside declared ranges or duplicated";
    } else {
      why = check_link(s, pos);
    }
    if (why.empty()) {
      // Causal order: every in-segment dependency must come earlier.
      for (const auto& [dep_node, dep_count] : r.vector_clock.counters()) {
        if (dep_node == r.node_id || dep_count == 0) continue;
        auto dep = s.position_of(dep_node, dep_count - 1);
        if (dep && *dep > pos) {
          why = "record precedes a record it causally depends on";
          break;
        }
      }
    }
    ++vr.links_checked;
    if (!why.empty()) {
      const uint64_t links = vr.links_checked;
      vr = mismatch(pos, why);
      vr.links_checked = links;
      vr.error.node_id = r.node_id;
      vr.error.local_sequence = r.local_sequence;
      emit_verify(vr);
      return vr;
    }
  }

  if (build_segment(s.records) != s.merkle_root) {
    const uint64_t links = vr.links_checked;
    vr = mismatch(s.records.empty() ? 0 : s.records.size() - 1, "merkle root mismatch");
    vr.links_checked = links;
  }
  emit_verify(vr);
  return vr;
}

std::vector<uint64_t> sample_indices(uint64_t n, uint64_t k, uint64_t seed) {
  if (k > n) k = n;
  std::mt19937_64 rng(seed);
  std::unordered_set<uint64_t> chosen;
  chosen.reserve(static_cast<size_t>(k) * 2);
  for (uint64_t j = n - k; j < n; ++j) {
    std::uniform_int_distribution<uint64_t> dist(0, j);
    const uint64_t t = dist(rng);
    if (!chosen.insert(t).second) chosen.insert(j);
  }
  std::vector<uint64_t> out(chosen.begin(), chosen.end());
  std::sort(out.begin(), out.end());
  return out;
}

VerificationResult verify_sampled(const SealedSegment& s, double sample_rate, uint64_t seed) {
  VerificationResult vr;
  const uint64_t n = s.records.size();
  if (!(sample_rate > 0.0) || sample_rate > 1.0) {
    vr.ok = false;
    vr.error = make_error(ErrorCode::invalid_argument, "sample_rate must be in (0, 1]");
    return vr;
  }
  if (n == 0) return vr;

  const double want = std::ceil(sample_rate * static_cast<double>(n) - 1e-9);
  const uint64_t k = std::clamp<uint64_t>(static_cast<uint64_t>(std::max(want, 1.0)), 1, n);
  vr.miss_probability_single_tamper = 1.0 - static_cast<double>(k) / static_cast<double>(n);

  for (uint64_t pos : sample_indices(n, k, seed)) {
    const std::string why = check_link(s, static_cast<size_t>(pos));
    ++vr.links_checked;
    if (!why.empty()) {
      const uint64_t links = vr.links_checked;
      const double miss = vr.miss_probability_single_tamper;
      vr = mismatch(pos, why);
      vr.links_checked = links;
      vr.miss_probability_single_tamper = miss;
      vr.error.node_id = s.records[static_cast<size_t>(pos)].node_id;
      vr.error.local_sequence = s.records[static_cast<size_t>(pos)].local_sequence;
      break;
    }
  }
  emit_verify(vr);
  return vr;
}

}  // namespace lexledger
