#include "lexledger/record.hpp"

#include <chrono>
#include <cstdio>
#include <random>

#include "lexledger/hash.hpp"
#include "lexledger/jsonlite.hpp"

namespace lexledger {

namespace {

using jsonlite::Object;
using jsonlite::Value;

Value str(const std::string& s) { return Value{s}; }
Value u64(uint64_t n) { return Value{static_cast<std::uint64_t>(n)}; }

Value actor_value(const Actor& actor) {
  Object o;
  o["kind"] = str(actor_kind(actor));
  if (const auto* s = std::get_if<SystemActor>(&actor)) {
    o["component"] = str(s->component);
  } else if (const auto* u = std::get_if<UserActor>(&actor)) {
    o["id"] = str(u->id);
    o["role"] = str(u->role);
  } else if (const auto* e = std::get_if<ExternalActor>(&actor)) {
    o["system"] = str(e->system);
  }
  return Value{std::move(o)};
}

std::optional<Actor> actor_from_object(const Object& o) {
  const std::string kind = jsonlite::get_string(o, "kind");
  if (kind == "system" && jsonlite::has_string(o, "component") && o.size() == 2) {
    return Actor{SystemActor{jsonlite::get_string(o, "component")}};
  }
  if (kind == "user" && jsonlite::has_string(o, "id") && jsonlite::has_string(o, "role") &&
      o.size() == 3) {
    return Actor{UserActor{jsonlite::get_string(o, "id"), jsonlite::get_string(o, "role")}};
  }
  if (kind == "external" && jsonlite::has_string(o, "system") && o.size() == 2) {
    return Actor{ExternalActor{jsonlite::get_string(o, "system")}};
  }
  return std::nullopt;
}

Object canonical_object(const AuditRecord& r) {
  Object o;
  o["actor"] = actor_value(r.actor);
  o["correction_of"] = str(r.correction_of);
  o["decision_context"] = str(r.decision_context);
  o["decision_result"] = str(r.decision_result);
  o["event_type"] = str(to_string(r.event_type));
  o["format_version"] = u64(r.format_version);
  o["hash_version"] = u64(r.hash_version);
  o["id"] = str(r.id);
  o["local_sequence"] = u64(r.local_sequence);
  o["node_id"] = str(r.node_id);
  o["prev_hash"] = str(r.prev_hash);
  o["statute_id"] = str(r.statute_id);
  o["subject_id"] = str(r.subject_id);
  o["timestamp_unix_ms"] = u64(r.timestamp_unix_ms);
  o["vector_clock"] = r.vector_clock.to_value();
  return o;
}

const char* const kStringFields[] = {
    "correction_of", "decision_context", "decision_result", "event_type", "id",
    "node_id",       "prev_hash",        "record_hash",     "statute_id", "subject_id",
};
const char* const kIntegerFields[] = {
    "format_version", "hash_version", "local_sequence", "timestamp_unix_ms",
};
constexpr size_t kPersistedFieldCount = 16;

}  // namespace

std::string to_string(EventType type) {
  switch (type) {
    case EventType::AutomaticDecision: return "automatic_decision";
    case EventType::DiscretionaryReview: return "discretionary_review";
    case EventType::HumanOverride: return "human_override";
    case EventType::Appeal: return "appeal";
    case EventType::StatuteModified: return "statute_modified";
    case EventType::SimulationRun: return "simulation_run";
  }
  return "";
}

std::optional<EventType> event_type_from_string(const std::string& s) {
  if (s == "automatic_decision") return EventType::AutomaticDecision;
  if (s == "discretionary_review") return EventType::DiscretionaryReview;
  if (s == "human_override") return EventType::HumanOverride;
  if (s == "appeal") return EventType::Appeal;
  if (s == "statute_modified") return EventType::StatuteModified;
  if (s == "simulation_run") return EventType::SimulationRun;
  return std::nullopt;
}

std::string actor_kind(const Actor& actor) {
  if (std::holds_alternative<SystemActor>(actor)) return "system";
  if (std::holds_alternative<UserActor>(actor)) return "user";
  return "external";
}

std::string canonical_serialize(const AuditRecord& r) {
  return jsonlite::serialize(canonical_object(r));
}

std::string compute_record_hash(const AuditRecord& r) {
  return record_content_hash(canonical_serialize(r));
}

bool record_hash_matches(const AuditRecord& r) {
  return !r.record_hash.empty() && compute_record_hash(r) == r.record_hash;
}

std::string record_to_json(const AuditRecord& r) {
  return jsonlite::serialize(record_to_value(r));
}

jsonlite::Value record_to_value(const AuditRecord& r) {
  Object o = canonical_object(r);
  o["record_hash"] = str(r.record_hash);
  return Value{std::move(o)};
}

std::optional<AuditRecord> record_from_json(const std::string& line, LedgerError* error) {
  std::optional<jsonlite::JsonError> jerr;
  const Object o = jsonlite::parse(line, &jerr);
  if (jerr) {
    fail(error, make_error(ErrorCode::invalid_record, jerr->code + ": " + jerr->message));
    return std::nullopt;
  }
  return record_from_object(o, error);
}

std::optional<AuditRecord> record_from_object(const jsonlite::Object& o, LedgerError* error) {
  if (o.size() != kPersistedFieldCount) {
    fail(error, make_error(ErrorCode::invalid_record, "unexpected field count"));
    return std::nullopt;
  }
  for (const char* k : kStringFields) {
    if (!jsonlite::has_string(o, k)) {
      fail(error, make_error(ErrorCode::invalid_record, std::string("missing string field: ") + k));
      return std::nullopt;
    }
  }
  for (const char* k : kIntegerFields) {
    if (!jsonlite::has_u64(o, k)) {
      fail(error, make_error(ErrorCode::invalid_record, std::string("missing integer field: ") + k));
      return std::nullopt;
    }
  }
  const Object* actor_obj = jsonlite::get_object(o, "actor");
  const Object* clock_obj = jsonlite::get_object(o, "vector_clock");
  if (!actor_obj || !clock_obj) {
    fail(error, make_error(ErrorCode::invalid_record, "missing actor or vector_clock"));
    return std::nullopt;
  }

  AuditRecord r;
  auto actor = actor_from_object(*actor_obj);
  if (!actor) {
    fail(error, make_error(ErrorCode::invalid_record, "malformed actor"));
    return std::nullopt;
  }
  auto type = event_type_from_string(jsonlite::get_string(o, "event_type"));
  if (!type) {
    fail(error, make_error(ErrorCode::invalid_record, "unknown event_type"));
    return std::nullopt;
  }
  r.actor = *actor;
  r.event_type = *type;
  r.id = jsonlite::get_string(o, "id");
  r.node_id = jsonlite::get_string(o, "node_id");
  r.vector_clock = VectorClock::from_object(*clock_obj);
  r.local_sequence = jsonlite::get_u64(o, "local_sequence");
  r.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp_unix_ms");
  r.statute_id = jsonlite::get_string(o, "statute_id");
  r.subject_id = jsonlite::get_string(o, "subject_id");
  r.decision_context = jsonlite::get_string(o, "decision_context");
  r.decision_result = jsonlite::get_string(o, "decision_result");
  r.correction_of = jsonlite::get_string(o, "correction_of");
  r.format_version = static_cast<uint32_t>(jsonlite::get_u64(o, "format_version"));
  r.hash_version = static_cast<uint32_t>(jsonlite::get_u64(o, "hash_version"));
  r.prev_hash = jsonlite::get_string(o, "prev_hash");
  r.record_hash = jsonlite::get_string(o, "record_hash");

  if (r.format_version != version::RECORD_FORMAT_VERSION ||
      r.hash_version != version::HASH_ALGORITHM_VERSION) {
    fail(error, make_error(ErrorCode::protocol_version_mismatch,
                           "record format " + std::to_string(r.format_version) + " hash " +
                               std::to_string(r.hash_version)));
    return std::nullopt;
  }
  return r;
}

std::string generate_uuid_v4() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  const uint64_t hi = rng();
  const uint64_t lo = rng();
  unsigned char b[16];
  for (int i = 0; i < 8; ++i) {
    b[i] = static_cast<unsigned char>(hi >> (56 - 8 * i));
    b[8 + i] = static_cast<unsigned char>(lo >> (56 - 8 * i));
  }
  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);  // version 4
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);  // RFC 4122 variant
  char out[37];
  std::snprintf(out, sizeof(out),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10], b[11],
                b[12], b[13], b[14], b[15]);
  return std::string(out, 36);
}

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

AuditRecord make_decision_record(EventType event_type,
                                 Actor actor,
                                 std::string statute_id,
                                 std::string subject_id,
                                 std::string decision_context,
                                 std::string decision_result) {
  AuditRecord r;
  r.id = generate_uuid_v4();
  r.timestamp_unix_ms = now_unix_ms();
  r.event_type = event_type;
  r.actor = std::move(actor);
  r.statute_id = std::move(statute_id);
  r.subject_id = std::move(subject_id);
  r.decision_context = std::move(decision_context);
  r.decision_result = std::move(decision_result);
  return r;
}

AuditRecord make_correction_record(const std::string& corrected_id,
                                   EventType event_type,
                                   Actor actor,
                                   std::string statute_id,
                                   std::string subject_id,
                                   std::string decision_context,
                                   std::string decision_result) {
  AuditRecord r = make_decision_record(event_type, std::move(actor), std::move(statute_id),
                                       std::move(subject_id), std::move(decision_context),
                                       std::move(decision_result));
  r.correction_of = corrected_id;
  return r;
}

bool validate_sealed_record(const AuditRecord& r, LedgerError* error) {
  auto reject = [&](std::string why) {
    LedgerError e = make_error(ErrorCode::invalid_record, std::move(why));
    e.node_id = r.node_id;
    e.local_sequence = r.local_sequence;
    return fail(error, std::move(e));
  };
  if (r.id.empty()) return reject("empty id");
  if (r.node_id.empty()) return reject("empty node_id");
  if (!is_valid_digest(r.prev_hash)) return reject("malformed prev_hash");
  if (!is_valid_digest(r.record_hash)) return reject("malformed record_hash");
  if (r.vector_clock.get(r.node_id) != r.local_sequence + 1) {
    LedgerError e = make_error(ErrorCode::causal_order_violation,
                               "own clock entry does not match local_sequence");
    e.node_id = r.node_id;
    e.local_sequence = r.local_sequence;
    return fail(error, std::move(e));
  }
  if (r.local_sequence == 0 && r.prev_hash != zero_digest()) {
    return reject("genesis record with non-zero prev_hash");
  }
  if (!record_hash_matches(r)) {
    LedgerError e = integrity_violation_at(r.local_sequence, "record_hash does not match content");
    e.node_id = r.node_id;
    e.local_sequence = r.local_sequence;
    return fail(error, std::move(e));
  }
  return true;
}

}  // namespace lexledger
