#pragma once

#include <string>
#include <string_view>

namespace lexledger {

// Core BLAKE3 hashing. Hex digests are 64 lowercase chars.
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string record_content_hash(std::string_view canonical_record);
std::string proposal_digest(std::string_view ordered_hashes);
std::string segment_blob_hash(std::string_view blob);

// Merkle internal node: H("mrk:" || raw(left) || raw(right)).
// Returns "" if either input is not a valid hex digest.
std::string merkle_pair_hash(const std::string& left_hex, const std::string& right_hex);

// All-zero digest used as prev_hash of a genesis record.
const std::string& zero_digest();

// True for a 64-char lowercase hex string.
bool is_valid_digest(std::string_view hex);

// 64 hex chars -> 32 raw bytes. Empty on invalid input.
std::string digest_to_bytes(std::string_view hex);

}  // namespace lexledger
