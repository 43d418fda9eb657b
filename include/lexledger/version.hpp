#pragma once

// lexledger/version.hpp - Explicit version manifest for every persisted and
// wire-visible format.
//
// INVARIANT:
//   Every component that reads or writes a versioned format checks its
//   constant here before processing data. Peers announcing a different
//   SYNC_PROTOCOL_VERSION or HASH_ALGORITHM_VERSION are refused.
//
// EXTENSION_POINT: version_negotiation
//   Current: hard-fail on mismatch.
//   Upgrade path: negotiate the highest common sync protocol with each peer.
//   Invariant: never accept records hashed under a newer algorithm than the
//   one this build was compiled against.

#include <cstdint>
#include <string>

namespace lexledger {
namespace version {

// ---------------------------------------------------------------------------
// RECORD_FORMAT_VERSION
// Field set of AuditRecord as covered by canonical_serialize(). Adding,
// removing or renaming a hashed field requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t RECORD_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded to 64 chars, domain-prefixed.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// SEGMENT_FORMAT_VERSION
// Archived sealed-segment blob layout (JSON object + .meta sidecar).
// ---------------------------------------------------------------------------
constexpr uint32_t SEGMENT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// SYNC_PROTOCOL_VERSION
// Tip summary / fetch / deliver exchange between nodes.
// ---------------------------------------------------------------------------
constexpr uint32_t SYNC_PROTOCOL_VERSION = 1;

// ---------------------------------------------------------------------------
// STORE_FORMAT_VERSION
// NDJSON record store line format.
// ---------------------------------------------------------------------------
constexpr uint32_t STORE_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t record_format{RECORD_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t segment_format{SEGMENT_FORMAT_VERSION};
  uint32_t sync_protocol{SYNC_PROTOCOL_VERSION};
  uint32_t store_format{STORE_FORMAT_VERSION};
  std::string ledger_semver;     // e.g. "0.3.0"
  std::string hash_primitive;    // "blake3"
  std::string build_timestamp;   // from __DATE__/__TIME__
};

VersionManifest current_manifest(const std::string& ledger_semver = "");

std::string manifest_to_json(const VersionManifest& m);

// ---------------------------------------------------------------------------
// Peer compatibility check, run before every sync exchange.
// Never throws.
// ---------------------------------------------------------------------------
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
};

CompatibilityResult check_peer_compatibility(uint32_t peer_sync_protocol,
                                             uint32_t peer_hash_algorithm);

}  // namespace version
}  // namespace lexledger
