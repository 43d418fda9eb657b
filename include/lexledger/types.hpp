#pragma once

// lexledger/types.hpp - Error taxonomy and shared result types.
//
// ERROR POLICY:
//   - No exceptions cross the public API. Operations return bool or
//     std::optional<T> and fill an optional LedgerError* out-parameter.
//   - integrity_violation and fork_detected are fatal: they are raised on the
//     operator channel (observability.hpp) and never repaired automatically.
//   - causal_order_violation and quorum_timeout are retried by the caller
//     (sync scheduler / consensus coordinator) with backoff.
//   - persistence_failure reaches the caller of append()/read_*(); append is
//     guaranteed not to have advanced the chain head.
//
// MEMORY OWNERSHIP:
//   - All members are value-owned. LedgerError is cheap to copy.

#include <cstdint>
#include <optional>
#include <string>

namespace lexledger {

enum class ErrorCode {
  none,
  integrity_violation,
  fork_detected,
  causal_order_violation,
  quorum_timeout,
  persistence_failure,
  invalid_record,
  not_found,
  segment_state_invalid,
  proposal_mismatch,
  protocol_version_mismatch,
  peer_unreachable,
  cancelled,
  config_invalid,
  not_leader,
  invalid_argument,
};

std::string to_string(ErrorCode code);

// Fatal errors halt trust in the affected range until an operator re-anchors
// from a trusted checkpoint.
bool is_fatal(ErrorCode code);

// Structured error. at_index is meaningful for integrity_violation; node_id
// and local_sequence identify the slot for fork_detected and
// causal_order_violation.
struct LedgerError {
  ErrorCode code{ErrorCode::none};
  uint64_t at_index{0};
  std::string node_id;
  uint64_t local_sequence{0};
  std::string detail;

  bool ok() const { return code == ErrorCode::none; }
  std::string to_json() const;
};

LedgerError make_error(ErrorCode code, std::string detail);
LedgerError integrity_violation_at(uint64_t index, std::string detail);
LedgerError fork_at(std::string node_id, uint64_t local_sequence, std::string detail);

// Writes e into *out when out is non-null. Always returns false so callers
// can `return fail(error, ...)` from bool functions.
bool fail(LedgerError* out, LedgerError e);

// ---------------------------------------------------------------------------
// ChainHead - tip of one node's local chain.
// ---------------------------------------------------------------------------
struct ChainHead {
  std::string record_hash;
  uint64_t local_sequence{0};
};

// ---------------------------------------------------------------------------
// VerificationResult - outcome of a chain or segment verification.
// ---------------------------------------------------------------------------
// ok=true: every checked link held.
// ok=false: first_mismatch_at names the first index whose record hash or
// chain link failed; error carries the typed cause.
//
// links_checked counts individual I1 link checks actually performed, so a
// sampled run reports how much work it did.
struct VerificationResult {
  bool ok{true};
  std::optional<uint64_t> first_mismatch_at;
  uint64_t links_checked{0};
  double miss_probability_single_tamper{0.0};
  LedgerError error;

  std::string to_json() const;
};

}  // namespace lexledger
