#include "lexledger/query.hpp"

#include <sstream>

#include "lexledger/jsonlite.hpp"
#include "lexledger/merkle.hpp"

namespace lexledger {

bool matches(const AuditRecord& r, const RecordQuery& q) {
  if (q.statute_id && r.statute_id != *q.statute_id) return false;
  if (q.subject_id && r.subject_id != *q.subject_id) return false;
  if (q.event_type && r.event_type != *q.event_type) return false;
  if (q.actor_kind && actor_kind(r.actor) != *q.actor_kind) return false;
  if (q.node_id && r.node_id != *q.node_id) return false;
  if (q.from_unix_ms && r.timestamp_unix_ms < *q.from_unix_ms) return false;
  if (q.to_unix_ms && r.timestamp_unix_ms > *q.to_unix_ms) return false;
  return true;
}

void visit_sealed_records(const std::vector<SegmentPtr>& segments, const RecordVisitor& visit) {
  for (const auto& seg : segments) {
    if (!seg) continue;
    for (const auto& r : seg->records) {
      if (!visit(*seg, r)) return;
    }
  }
}

std::vector<AuditRecord> query_records(const std::vector<SegmentPtr>& segments,
                                       const RecordQuery& q) {
  std::vector<AuditRecord> out;
  uint64_t skipped = 0;
  visit_sealed_records(segments, [&](const SealedSegment&, const AuditRecord& r) {
    if (!matches(r, q)) return true;
    if (skipped < q.offset) {
      ++skipped;
      return true;
    }
    out.push_back(r);
    return q.limit == 0 || out.size() < q.limit;
  });
  return out;
}

std::vector<AuditRecord> corrections_of(const std::vector<SegmentPtr>& segments,
                                        const std::string& record_id) {
  std::vector<AuditRecord> out;
  if (record_id.empty()) return out;
  visit_sealed_records(segments, [&](const SealedSegment&, const AuditRecord& r) {
    if (r.correction_of == record_id) out.push_back(r);
    return true;
  });
  return out;
}

ComplianceSummary summarize(const std::vector<SegmentPtr>& segments) {
  ComplianceSummary s;
  for (const auto& seg : segments) {
    if (!seg) continue;
    ++s.segments;
    if (!verify_full(*seg).ok && s.all_verified) {
      s.all_verified = false;
      s.first_failed_segment = seg->segment_id;
    }
    for (const auto& r : seg->records) {
      ++s.total_records;
      ++s.by_event_type[to_string(r.event_type)];
      if (r.event_type == EventType::HumanOverride) ++s.human_overrides;
      if (r.event_type == EventType::Appeal) ++s.appeals;
      if (!r.correction_of.empty()) ++s.corrections;
    }
  }
  return s;
}

std::string ComplianceSummary::to_json() const {
  std::ostringstream o;
  o << "{\"segments\":" << segments << ",\"total_records\":" << total_records
    << ",\"by_event_type\":{";
  bool first = true;
  for (const auto& [type, n] : by_event_type) {
    if (!first) o << ",";
    first = false;
    o << "\"" << jsonlite::escape(type) << "\":" << n;
  }
  o << "},\"human_overrides\":" << human_overrides << ",\"appeals\":" << appeals
    << ",\"corrections\":" << corrections << ",\"all_verified\":" << (all_verified ? "true" : "false");
  if (first_failed_segment) o << ",\"first_failed_segment\":" << *first_failed_segment;
  o << "}";
  return o.str();
}

}  // namespace lexledger
