#include "lexledger/types.hpp"

#include <cstdio>
#include <sstream>

#include "lexledger/jsonlite.hpp"

namespace lexledger {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::integrity_violation: return "integrity_violation";
    case ErrorCode::fork_detected: return "fork_detected";
    case ErrorCode::causal_order_violation: return "causal_order_violation";
    case ErrorCode::quorum_timeout: return "quorum_timeout";
    case ErrorCode::persistence_failure: return "persistence_failure";
    case ErrorCode::invalid_record: return "invalid_record";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::segment_state_invalid: return "segment_state_invalid";
    case ErrorCode::proposal_mismatch: return "proposal_mismatch";
    case ErrorCode::protocol_version_mismatch: return "protocol_version_mismatch";
    case ErrorCode::peer_unreachable: return "peer_unreachable";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::not_leader: return "not_leader";
    case ErrorCode::invalid_argument: return "invalid_argument";
  }
  return "";
}

bool is_fatal(ErrorCode code) {
  return code == ErrorCode::integrity_violation || code == ErrorCode::fork_detected;
}

std::string LedgerError::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"code\":\"" << to_string(code) << "\""
    << ",\"at_index\":" << at_index
    << ",\"node_id\":\"" << jsonlite::escape(node_id) << "\""
    << ",\"local_sequence\":" << local_sequence
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\""
    << ",\"fatal\":" << (is_fatal(code) ? "true" : "false")
    << "}";
  return o.str();
}

LedgerError make_error(ErrorCode code, std::string detail) {
  LedgerError e;
  e.code = code;
  e.detail = std::move(detail);
  return e;
}

LedgerError integrity_violation_at(uint64_t index, std::string detail) {
  LedgerError e = make_error(ErrorCode::integrity_violation, std::move(detail));
  e.at_index = index;
  return e;
}

LedgerError fork_at(std::string node_id, uint64_t local_sequence, std::string detail) {
  LedgerError e = make_error(ErrorCode::fork_detected, std::move(detail));
  e.node_id = std::move(node_id);
  e.local_sequence = local_sequence;
  return e;
}

bool fail(LedgerError* out, LedgerError e) {
  if (out) *out = std::move(e);
  return false;
}

std::string VerificationResult::to_json() const {
  std::ostringstream o;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.6f", miss_probability_single_tamper);
  o << "{"
    << "\"ok\":" << (ok ? "true" : "false")
    << ",\"first_mismatch_at\":";
  if (first_mismatch_at) o << *first_mismatch_at; else o << "null";
  o << ",\"links_checked\":" << links_checked
    << ",\"miss_probability_single_tamper\":" << buf;
  if (!ok) o << ",\"error\":" << error.to_json();
  o << "}";
  return o.str();
}

}  // namespace lexledger
