#include "lexledger/version.hpp"

#include <sstream>

#ifndef LEXLEDGER_VERSION
#define LEXLEDGER_VERSION "0.3.0"
#endif

namespace lexledger {
namespace version {

VersionManifest current_manifest(const std::string& ledger_semver) {
  VersionManifest m;
  m.ledger_semver   = ledger_semver.empty() ? LEXLEDGER_VERSION : ledger_semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"record_format\":" << m.record_format
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"segment_format\":" << m.segment_format
    << ",\"sync_protocol\":" << m.sync_protocol
    << ",\"store_format\":" << m.store_format
    << ",\"ledger_semver\":\"" << m.ledger_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_peer_compatibility(uint32_t peer_sync_protocol,
                                             uint32_t peer_hash_algorithm) {
  CompatibilityResult r;
  if (peer_sync_protocol != SYNC_PROTOCOL_VERSION) {
    r.ok          = false;
    r.error_code  = "protocol_version_mismatch";
    r.description = "Peer sync protocol " + std::to_string(peer_sync_protocol) +
                    " != local sync protocol " + std::to_string(SYNC_PROTOCOL_VERSION);
    return r;
  }
  if (peer_hash_algorithm != HASH_ALGORITHM_VERSION) {
    r.ok          = false;
    r.error_code  = "protocol_version_mismatch";
    r.description = "Peer hash algorithm " + std::to_string(peer_hash_algorithm) +
                    " != local hash algorithm " + std::to_string(HASH_ALGORITHM_VERSION);
  }
  return r;
}

}  // namespace version
}  // namespace lexledger
