#include "lexledger/hash.hpp"

// Hash authority for the ledger.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "rec:", "mrk:", "prop:", "seg:" prefixes keep a
//      record digest from ever colliding with a tree node or a proposal.
//      These prefixes are part of the on-disk contract.
//   3. version::HASH_ALGORITHM_VERSION is bumped when any of the above changes.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for O(1) nibble
// encoding instead of snprintf("%02x").

#include <array>
#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace lexledger {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Returns 0xFF on invalid character. Upper case is rejected: digests are
// compared as strings, so only the canonical lowercase form is accepted.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  return 0xFF;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string record_content_hash(std::string_view canonical_record) {
  return hash_domain("rec:", canonical_record);
}

std::string proposal_digest(std::string_view ordered_hashes) {
  return hash_domain("prop:", ordered_hashes);
}

std::string segment_blob_hash(std::string_view blob) {
  return hash_domain("seg:", blob);
}

std::string merkle_pair_hash(const std::string& left_hex, const std::string& right_hex) {
  const std::string l = digest_to_bytes(left_hex);
  const std::string r = digest_to_bytes(right_hex);
  if (l.empty() || r.empty()) return {};
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, "mrk:", 4);
  blake3_hasher_update(&hasher, l.data(), l.size());
  blake3_hasher_update(&hasher, r.data(), r.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

const std::string& zero_digest() {
  static const std::string kZero(64, '0');
  return kZero;
}

bool is_valid_digest(std::string_view hex) {
  if (hex.size() != 64) return false;
  for (char c : hex) {
    if (hex_nibble(c) == 0xFF) return false;
  }
  return true;
}

std::string digest_to_bytes(std::string_view hex) {
  if (hex.size() != 64) return {};
  std::string out(32, '\0');
  for (std::size_t i = 0; i < 32; ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return {};
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

}  // namespace lexledger
