#pragma once

// lexledger/segment.hpp - Sealed segments and external attestations.
//
// A segment is a contiguous, totally ordered run of records, possibly from
// several nodes, over which a Merkle root has been committed.
//
// INVARIANTS:
//   - A SealedSegment is immutable once constructed and is shared as
//     std::shared_ptr<const SealedSegment>; readers never lock.
//   - For every node in `ranges`, the segment holds exactly the records
//     first_seq..last_seq of that node, and anchor_hash is the record_hash of
//     first_seq - 1 (zero_digest() when first_seq == 0). Every chain link in
//     the segment can therefore be checked without leaving it.
//   - Records are held by value. Nothing in a record refers to a segment.
//   - Attestations live beside the segment (see ConsensusCoordinator); they
//     never change the segment or its root.
//
// State machine per node, per segment:
//   Open -> PendingQuorum -> Sealed         (terminal)
//   Open -> PendingQuorum -> ForkDetected   (terminal, operator action)

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/record.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

enum class SegmentState { Open, PendingQuorum, Sealed, ForkDetected };

std::string to_string(SegmentState state);
bool is_terminal(SegmentState state);

// True if `from -> to` is a legal transition.
bool can_transition(SegmentState from, SegmentState to);

struct NodeRange {
  uint64_t first_seq{0};
  uint64_t last_seq{0};
  std::string anchor_hash;  // record_hash of first_seq - 1

  bool operator==(const NodeRange& o) const {
    return first_seq == o.first_seq && last_seq == o.last_seq && anchor_hash == o.anchor_hash;
  }
};

struct SealedSegment {
  uint64_t segment_id{0};
  uint64_t epoch{0};
  std::string strategy;
  std::string proposer;
  std::string proposal_digest;
  std::map<std::string, NodeRange> ranges;
  std::vector<AuditRecord> records;  // canonical order
  std::string merkle_root;
  std::vector<std::string> certificate;  // acknowledging node ids, sorted
  uint64_t sealed_at_unix_ms{0};

  // (node_id, local_sequence) -> position in `records`. Built at seal time.
  std::map<std::string, std::vector<size_t>> positions;

  void build_index();
  std::optional<size_t> position_of(const std::string& node_id, uint64_t seq) const;

  // Hash of the predecessor of records[pos] on its own chain, resolved inside
  // the segment or from the node's anchor. Empty if it cannot be resolved.
  std::string expected_prev_hash(size_t pos) const;
};

using SegmentPtr = std::shared_ptr<const SealedSegment>;

std::string segment_to_json(const SealedSegment& s);
std::optional<SealedSegment> segment_from_json(const std::string& text,
                                               LedgerError* error = nullptr);

// ---------------------------------------------------------------------------
// Attestation - opaque third-party proof over a sealed root
// ---------------------------------------------------------------------------
// External witnesses (timestamp authorities, notaries, chain anchors) return
// an opaque proof. The ledger stores it verbatim and only checks that it
// names the right segment and root.
struct Attestation {
  uint64_t segment_id{0};
  std::string merkle_root;
  std::string authority;
  std::string proof;  // opaque bytes
  uint64_t imported_at_unix_ms{0};
};

std::string attestation_to_json(const Attestation& a);
std::optional<Attestation> attestation_from_json(const std::string& text,
                                                 LedgerError* error = nullptr);

}  // namespace lexledger
