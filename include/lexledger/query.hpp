#pragma once

// lexledger/query.hpp - Read-only views over sealed segments for analytics
// and compliance reporting.
//
// Only sealed segments are visible here. Segments are immutable, so every
// function works on a snapshot of SegmentPtr values and takes no locks.
// Nothing in this header can change a record.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/record.hpp"
#include "lexledger/segment.hpp"

namespace lexledger {

// Unset fields match everything. Timestamps are informational and the range
// is inclusive. limit == 0 means no limit.
struct RecordQuery {
  std::optional<std::string> statute_id;
  std::optional<std::string> subject_id;
  std::optional<EventType> event_type;
  std::optional<std::string> actor_kind;  // "system" | "user" | "external"
  std::optional<std::string> node_id;
  std::optional<uint64_t> from_unix_ms;
  std::optional<uint64_t> to_unix_ms;
  uint64_t offset{0};
  uint64_t limit{0};
};

bool matches(const AuditRecord& record, const RecordQuery& query);

// Segment order, then record order within each segment. Return false from
// the visitor to stop early.
using RecordVisitor = std::function<bool(const SealedSegment&, const AuditRecord&)>;
void visit_sealed_records(const std::vector<SegmentPtr>& segments, const RecordVisitor& visit);

std::vector<AuditRecord> query_records(const std::vector<SegmentPtr>& segments,
                                       const RecordQuery& query);

// Records whose correction_of names record_id, in sealed order.
std::vector<AuditRecord> corrections_of(const std::vector<SegmentPtr>& segments,
                                        const std::string& record_id);

struct ComplianceSummary {
  uint64_t segments{0};
  uint64_t total_records{0};
  std::map<std::string, uint64_t> by_event_type;
  uint64_t human_overrides{0};
  uint64_t appeals{0};
  uint64_t corrections{0};
  bool all_verified{true};
  std::optional<uint64_t> first_failed_segment;

  std::string to_json() const;
};

// Runs verify_full() on every segment.
ComplianceSummary summarize(const std::vector<SegmentPtr>& segments);

}  // namespace lexledger
