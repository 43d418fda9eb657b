#include "lexledger/segment.hpp"

#include "lexledger/hash.hpp"
#include "lexledger/jsonlite.hpp"
#include "lexledger/version.hpp"

namespace lexledger {

namespace {
using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Value u64(uint64_t n) { return Value{static_cast<std::uint64_t>(n)}; }
}  // namespace

std::string to_string(SegmentState state) {
  switch (state) {
    case SegmentState::Open: return "open";
    case SegmentState::PendingQuorum: return "pending_quorum";
    case SegmentState::Sealed: return "sealed";
    case SegmentState::ForkDetected: return "fork_detected";
  }
  return "";
}

bool is_terminal(SegmentState state) {
  return state == SegmentState::Sealed || state == SegmentState::ForkDetected;
}

bool can_transition(SegmentState from, SegmentState to) {
  switch (from) {
    case SegmentState::Open:
      return to == SegmentState::PendingQuorum;
    case SegmentState::PendingQuorum:
      // Re-proposing after a timeout keeps the segment pending.
      return to == SegmentState::PendingQuorum || to == SegmentState::Sealed ||
             to == SegmentState::ForkDetected;
    case SegmentState::Sealed:
    case SegmentState::ForkDetected:
      return false;
  }
  return false;
}

void SealedSegment::build_index() {
  positions.clear();
  for (const auto& [node, range] : ranges) {
    positions[node].assign(static_cast<size_t>(range.last_seq - range.first_seq + 1),
                           static_cast<size_t>(-1));
  }
  for (size_t pos = 0; pos < records.size(); ++pos) {
    const AuditRecord& r = records[pos];
    auto rit = ranges.find(r.node_id);
    if (rit == ranges.end()) continue;
    if (r.local_sequence < rit->second.first_seq || r.local_sequence > rit->second.last_seq) continue;
    positions[r.node_id][static_cast<size_t>(r.local_sequence - rit->second.first_seq)] = pos;
  }
}

std::optional<size_t> SealedSegment::position_of(const std::string& node_id, uint64_t seq) const {
  auto rit = ranges.find(node_id);
  auto pit = positions.find(node_id);
  if (rit == ranges.end() || pit == positions.end()) return std::nullopt;
  if (seq < rit->second.first_seq || seq > rit->second.last_seq) return std::nullopt;
  const size_t pos = pit->second[static_cast<size_t>(seq - rit->second.first_seq)];
  if (pos == static_cast<size_t>(-1)) return std::nullopt;
  return pos;
}

std::string SealedSegment::expected_prev_hash(size_t pos) const {
  const AuditRecord& r = records[pos];
  if (r.local_sequence == 0) return zero_digest();
  auto rit = ranges.find(r.node_id);
  if (rit == ranges.end()) return {};
  if (r.local_sequence == rit->second.first_seq) return rit->second.anchor_hash;
  auto prev = position_of(r.node_id, r.local_sequence - 1);
  if (!prev) return {};
  return records[*prev].record_hash;
}

std::string segment_to_json(const SealedSegment& s) {
  Object o;
  o["segment_format"] = u64(version::SEGMENT_FORMAT_VERSION);
  o["segment_id"] = u64(s.segment_id);
  o["epoch"] = u64(s.epoch);
  o["strategy"] = Value{s.strategy};
  o["proposer"] = Value{s.proposer};
  o["proposal_digest"] = Value{s.proposal_digest};
  o["merkle_root"] = Value{s.merkle_root};
  o["sealed_at_unix_ms"] = u64(s.sealed_at_unix_ms);

  Object ranges;
  for (const auto& [node, r] : s.ranges) {
    Object ro;
    ro["first_seq"] = u64(r.first_seq);
    ro["last_seq"] = u64(r.last_seq);
    ro["anchor_hash"] = Value{r.anchor_hash};
    ranges[node] = Value{std::move(ro)};
  }
  o["ranges"] = Value{std::move(ranges)};

  Array records;
  records.reserve(s.records.size());
  for (const auto& r : s.records) records.push_back(record_to_value(r));
  o["records"] = Value{std::move(records)};

  Array cert;
  for (const auto& n : s.certificate) cert.push_back(Value{n});
  o["certificate"] = Value{std::move(cert)};
  return jsonlite::serialize(o);
}

std::optional<SealedSegment> segment_from_json(const std::string& text, LedgerError* error) {
  std::optional<jsonlite::JsonError> jerr;
  const Object o = jsonlite::parse(text, &jerr);
  if (jerr) {
    fail(error, make_error(ErrorCode::invalid_record, "segment: " + jerr->message));
    return std::nullopt;
  }
  if (jsonlite::get_u64(o, "segment_format") != version::SEGMENT_FORMAT_VERSION) {
    fail(error, make_error(ErrorCode::protocol_version_mismatch, "unsupported segment format"));
    return std::nullopt;
  }
  const Object* ranges = jsonlite::get_object(o, "ranges");
  const Array* records = jsonlite::get_array(o, "records");
  if (!ranges || !records || !jsonlite::has_string(o, "merkle_root")) {
    fail(error, make_error(ErrorCode::invalid_record, "segment missing ranges/records/root"));
    return std::nullopt;
  }

  SealedSegment s;
  s.segment_id = jsonlite::get_u64(o, "segment_id");
  s.epoch = jsonlite::get_u64(o, "epoch");
  s.strategy = jsonlite::get_string(o, "strategy");
  s.proposer = jsonlite::get_string(o, "proposer");
  s.proposal_digest = jsonlite::get_string(o, "proposal_digest");
  s.merkle_root = jsonlite::get_string(o, "merkle_root");
  s.sealed_at_unix_ms = jsonlite::get_u64(o, "sealed_at_unix_ms");
  s.certificate = jsonlite::get_string_array(o, "certificate");

  for (const auto& [node, v] : *ranges) {
    if (!std::holds_alternative<Object>(v.v)) {
      fail(error, make_error(ErrorCode::invalid_record, "segment range for " + node));
      return std::nullopt;
    }
    const Object& ro = std::get<Object>(v.v);
    NodeRange r;
    r.first_seq = jsonlite::get_u64(ro, "first_seq");
    r.last_seq = jsonlite::get_u64(ro, "last_seq");
    r.anchor_hash = jsonlite::get_string(ro, "anchor_hash");
    if (r.last_seq < r.first_seq) {
      fail(error, make_error(ErrorCode::invalid_record, "inverted range for " + node));
      return std::nullopt;
    }
    s.ranges[node] = std::move(r);
  }

  s.records.reserve(records->size());
  for (const auto& v : *records) {
    if (!std::holds_alternative<Object>(v.v)) {
      fail(error, make_error(ErrorCode::invalid_record, "segment record is not an object"));
      return std::nullopt;
    }
    auto rec = record_from_object(std::get<Object>(v.v), error);
    if (!rec) return std::nullopt;
    s.records.push_back(std::move(*rec));
  }
  s.build_index();
  return s;
}

std::string attestation_to_json(const Attestation& a) {
  Object o;
  o["segment_id"] = u64(a.segment_id);
  o["merkle_root"] = Value{a.merkle_root};
  o["authority"] = Value{a.authority};
  o["proof"] = Value{a.proof};
  o["imported_at_unix_ms"] = u64(a.imported_at_unix_ms);
  return jsonlite::serialize(o);
}

std::optional<Attestation> attestation_from_json(const std::string& text, LedgerError* error) {
  std::optional<jsonlite::JsonError> jerr;
  const Object o = jsonlite::parse(text, &jerr);
  if (jerr || !jsonlite::has_u64(o, "segment_id") || !jsonlite::has_string(o, "merkle_root") ||
      !jsonlite::has_string(o, "proof")) {
    fail(error, make_error(ErrorCode::invalid_record, "malformed attestation"));
    return std::nullopt;
  }
  Attestation a;
  a.segment_id = jsonlite::get_u64(o, "segment_id");
  a.merkle_root = jsonlite::get_string(o, "merkle_root");
  a.authority = jsonlite::get_string(o, "authority");
  a.proof = jsonlite::get_string(o, "proof");
  a.imported_at_unix_ms = jsonlite::get_u64(o, "imported_at_unix_ms");
  return a;
}

}  // namespace lexledger
