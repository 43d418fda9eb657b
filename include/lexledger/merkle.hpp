#pragma once

// lexledger/merkle.hpp - Merkle commitments, proofs and segment verification.
//
// TREE SHAPE (deterministic):
//   - Leaves are record_hash values in segment order.
//   - Internal node = BLAKE3("mrk:" || raw(left) || raw(right)).
//   - A level with an odd node count pairs its last node with itself.
//   - A single leaf is its own root. An empty tree has no root.
//
// COMPLEXITY:
//   - MerkleTree::append() recomputes only the ancestors of the new leaf,
//     O(log n). MerkleTree::build() is the batch path, O(n).
//   - prove() is O(log n); verify_proof() needs only the leaf, the proof and
//     the root.
//   - verify_sampled() checks k = ceil(rate * n) distinct chain links chosen
//     by a seeded Floyd sample; cost is proportional to k, not n.
//
// EXTENSION_POINT: consistency_proofs
//   Current: inclusion proofs only.
//   Upgrade: append-only consistency proofs between two roots of the same
//   open segment, so witnesses can check growth without the leaves.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/record.hpp"
#include "lexledger/segment.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

struct ProofStep {
  std::string sibling;
  bool sibling_on_left{false};
};

struct MerkleProof {
  uint64_t leaf_index{0};
  uint64_t leaf_count{0};
  std::vector<ProofStep> steps;  // leaf level first
};

std::string proof_to_json(const MerkleProof& p);

class MerkleTree {
 public:
  MerkleTree() = default;

  // Batch construction, bottom-up.
  static MerkleTree build(const std::vector<std::string>& leaves);

  // Incremental append. Returns false (tree unchanged) for a malformed digest.
  bool append(const std::string& leaf_hash);

  std::optional<std::string> root() const;
  uint64_t size() const { return levels_.empty() ? 0 : levels_[0].size(); }
  const std::string& leaf(uint64_t index) const { return levels_[0][static_cast<size_t>(index)]; }

  std::optional<MerkleProof> prove(uint64_t index) const;

  static bool verify_proof(const std::string& leaf_hash, const MerkleProof& proof,
                           const std::string& root);

 private:
  // levels_[0] = leaves, levels_.back() = {root}
  std::vector<std::vector<std::string>> levels_;
};

// Root over the record hashes of `records`, in order. Empty string for an
// empty sequence.
std::string build_segment(const std::vector<AuditRecord>& records);

// Recomputes every record hash, every same-node chain link (against the
// segment's anchors), causal order inside the segment and the Merkle root.
// Required before a root is exported for anchoring.
VerificationResult verify_full(const SealedSegment& segment);

// Probabilistic check of k = ceil(sample_rate * n) distinct records: each
// sampled record's hash and its chain link. Never a substitute for
// verify_full() on anchored segments. miss_probability_single_tamper is the
// chance a single tampered record escapes this sample (1 - k/n).
VerificationResult verify_sampled(const SealedSegment& segment, double sample_rate,
                                  uint64_t seed);

// Floyd's algorithm: k distinct indices in [0, n), ascending.
std::vector<uint64_t> sample_indices(uint64_t n, uint64_t k, uint64_t seed);

}  // namespace lexledger
