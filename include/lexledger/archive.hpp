#pragma once

// lexledger/archive.hpp - Durable storage for sealed segments and the
// attestations imported for them.
//
// LAYOUT (FileSegmentArchive):
//   <root>/segments/<segment_id, 20 digits>.seg        segment blob
//   <root>/segments/<segment_id, 20 digits>.seg.meta   sidecar (JSON)
//   <root>/attestations/<segment_id, 20 digits>/<n>.json
//
// INVARIANTS:
//   - Every file is written to a temp name and renamed into place.
//   - A segment id is written once. A second put with a different root is
//     refused; an identical put is a no-op.
//   - Reads fail closed: the stored blob must match stored_blob_hash, the
//     decoded JSON must match content_hash, and the records must reproduce
//     merkle_root, or nothing is returned.
//   - Attestations are stored beside the segment, never inside its blob.
//
// Thread-safety: all implementations MUST be safe for concurrent calls.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/segment.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

struct SegmentBlobInfo {
  uint64_t segment_id{0};
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string content_hash;      // segment_blob_hash(original JSON)
  std::string stored_blob_hash;  // blake3_hex(stored bytes)
  std::string merkle_root;
};

class ISegmentArchive {
 public:
  virtual ~ISegmentArchive() = default;

  virtual bool put_segment(const SealedSegment& segment, LedgerError* error = nullptr) = 0;
  virtual std::optional<SealedSegment> get_segment(uint64_t segment_id,
                                                   LedgerError* error = nullptr) const = 0;
  virtual std::optional<SegmentBlobInfo> info(uint64_t segment_id) const = 0;
  virtual std::vector<uint64_t> segment_ids() const = 0;

  virtual bool put_attestation(const Attestation& attestation, LedgerError* error = nullptr) = 0;
  virtual std::vector<Attestation> attestations(uint64_t segment_id) const = 0;

  virtual std::string backend_id() const = 0;
};

class FileSegmentArchive : public ISegmentArchive {
 public:
  // compression: "off" (identity) or "zstd" (if built with LEXLEDGER_WITH_ZSTD;
  // otherwise silently stored as identity).
  explicit FileSegmentArchive(std::string root, std::string compression = "off");

  bool put_segment(const SealedSegment& segment, LedgerError* error = nullptr) override;
  std::optional<SealedSegment> get_segment(uint64_t segment_id,
                                           LedgerError* error = nullptr) const override;
  std::optional<SegmentBlobInfo> info(uint64_t segment_id) const override;
  std::vector<uint64_t> segment_ids() const override;

  bool put_attestation(const Attestation& attestation, LedgerError* error = nullptr) override;
  std::vector<Attestation> attestations(uint64_t segment_id) const override;

  std::string backend_id() const override { return "file:" + root_; }

  std::string segment_path(uint64_t segment_id) const;
  std::string meta_path(uint64_t segment_id) const;

 private:
  std::string attestation_dir(uint64_t segment_id) const;

  std::string root_;
  std::string compression_;
  mutable std::mutex mu_;
};

}  // namespace lexledger
