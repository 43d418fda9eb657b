#pragma once

// lexledger/record.hpp - AuditRecord, the immutable unit of the ledger.
//
// CANONICAL FORM:
//   canonical_serialize() is the jsonlite canonical JSON (sorted keys, no
//   whitespace) of every field except record_hash. record_hash is
//   BLAKE3("rec:" || canonical_serialize(record)), computed once at append
//   time by the HashChainLedger and never recomputed into the record again.
//
// INVARIANTS (per node chain):
//   - prev_hash == predecessor.record_hash; genesis carries zero_digest().
//   - vector_clock[node_id] == local_sequence + 1.
//   - local_sequence is dense from 0.
//   - No field changes after sealing. A correction is a new record whose
//     correction_of names the id of the record it supersedes.
//
// MEMORY OWNERSHIP:
//   - Value type. Records never point back at the segments that hold them.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "lexledger/clock.hpp"
#include "lexledger/types.hpp"
#include "lexledger/version.hpp"

namespace lexledger {

enum class EventType {
  AutomaticDecision,
  DiscretionaryReview,
  HumanOverride,
  Appeal,
  StatuteModified,
  SimulationRun,
};

std::string to_string(EventType type);
std::optional<EventType> event_type_from_string(const std::string& s);

struct SystemActor {
  std::string component;
};

struct UserActor {
  std::string id;
  std::string role;
};

struct ExternalActor {
  std::string system;
};

using Actor = std::variant<SystemActor, UserActor, ExternalActor>;

// "system" | "user" | "external"
std::string actor_kind(const Actor& actor);

struct AuditRecord {
  std::string id;
  std::string node_id;
  VectorClock vector_clock;
  uint64_t local_sequence{0};
  uint64_t timestamp_unix_ms{0};  // informational only
  EventType event_type{EventType::AutomaticDecision};
  Actor actor{SystemActor{}};
  std::string statute_id;
  std::string subject_id;
  std::string decision_context;
  std::string decision_result;
  std::string correction_of;  // empty unless this record corrects another
  uint32_t format_version{version::RECORD_FORMAT_VERSION};
  uint32_t hash_version{version::HASH_ALGORITHM_VERSION};
  std::string prev_hash;
  std::string record_hash;

  bool sealed() const { return !record_hash.empty(); }
};

// Canonical JSON of every field except record_hash.
std::string canonical_serialize(const AuditRecord& r);

// H("rec:" || canonical_serialize(r)).
std::string compute_record_hash(const AuditRecord& r);

// True if r.record_hash equals a fresh computation.
bool record_hash_matches(const AuditRecord& r);

// Full persisted form (canonical form plus record_hash). One line, no '\n'.
std::string record_to_json(const AuditRecord& r);

jsonlite::Value record_to_value(const AuditRecord& r);

// Strict decode of record_to_json() output. Rejects missing or mistyped
// fields, unknown event types and unsupported format/hash versions.
std::optional<AuditRecord> record_from_json(const std::string& line,
                                            LedgerError* error = nullptr);
std::optional<AuditRecord> record_from_object(const jsonlite::Object& obj,
                                              LedgerError* error = nullptr);

// Random RFC 4122 version-4 UUID, lowercase.
std::string generate_uuid_v4();

// Decision producer entry point: an unsealed record ready for append().
// node_id, vector_clock, local_sequence and the hashes are assigned by the
// ledger.
AuditRecord make_decision_record(EventType event_type,
                                 Actor actor,
                                 std::string statute_id,
                                 std::string subject_id,
                                 std::string decision_context,
                                 std::string decision_result);

// Convenience for corrections: same shape, plus correction_of = corrected_id.
AuditRecord make_correction_record(const std::string& corrected_id,
                                   EventType event_type,
                                   Actor actor,
                                   std::string statute_id,
                                   std::string subject_id,
                                   std::string decision_context,
                                   std::string decision_result);

// Structural checks on a sealed record received from storage or a peer:
// non-empty id and node_id, valid digests, own clock entry consistent with
// local_sequence, and record_hash matching the content.
bool validate_sealed_record(const AuditRecord& r, LedgerError* error = nullptr);

uint64_t now_unix_ms();

}  // namespace lexledger
