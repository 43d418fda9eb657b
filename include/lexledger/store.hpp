#pragma once

// lexledger/store.hpp - Persistence Port and its in-tree implementations.
//
// CONTRACT (IRecordStore):
//   - One store holds one node's chain, dense by local_sequence from 0.
//   - append() succeeds only after the bytes are durable (fsync for the file
//     backend) and never reorders previously acknowledged writes. A record
//     whose local_sequence != count() is refused.
//   - read_range(from, to) is inclusive on both ends.
//   - Stored bytes are the canonical record_to_json() line. On read, a line
//     that fails to decode, decodes to a different local_sequence, or does
//     not re-serialize to exactly the stored bytes is reported as
//     integrity_violation at that index.
//
// Thread-safety: all implementations MUST be safe for concurrent calls.
//
// EXTENSION_POINT: database_backends
//   SQLite/Postgres/object-store implementations live outside this tree and
//   only need to satisfy IRecordStore. The ledger never depends on a concrete
//   backend.

#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/record.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  virtual bool append(const AuditRecord& record, LedgerError* error = nullptr) = 0;

  // Inclusive [from, to]. nullopt + error on corruption or out-of-range.
  virtual std::optional<std::vector<AuditRecord>> read_range(uint64_t from, uint64_t to,
                                                             LedgerError* error = nullptr) const = 0;

  // nullopt when the store is empty. Corruption of the last entry is reported
  // through *error and also yields nullopt.
  virtual std::optional<ChainHead> read_head(LedgerError* error = nullptr) const = 0;

  virtual uint64_t count() const = 0;

  virtual std::string backend_id() const = 0;
};

// Creates the store for a given node's chain. Used for replicas of remote
// chains held by a RecordPool.
using StoreFactory = std::function<std::unique_ptr<IRecordStore>(const std::string& node_id)>;

// Decodes one persisted line and checks it against the slot it was read from.
std::optional<AuditRecord> decode_stored_line(const std::string& line, uint64_t expected_sequence,
                                              LedgerError* error = nullptr);

// ---------------------------------------------------------------------------
// MemoryRecordStore
// ---------------------------------------------------------------------------
// Keeps the canonical lines in memory, so reads go through the same decode
// and corruption checks as the file backend. Members are protected so tests
// can derive stores that corrupt bytes or inject write failures.
class MemoryRecordStore : public IRecordStore {
 public:
  MemoryRecordStore() = default;

  bool append(const AuditRecord& record, LedgerError* error = nullptr) override;
  std::optional<std::vector<AuditRecord>> read_range(uint64_t from, uint64_t to,
                                                     LedgerError* error = nullptr) const override;
  std::optional<ChainHead> read_head(LedgerError* error = nullptr) const override;
  uint64_t count() const override;
  std::string backend_id() const override { return "memory"; }

 protected:
  mutable std::mutex mu_;
  std::vector<std::string> lines_;
};

// ---------------------------------------------------------------------------
// FileRecordStore - NDJSON append-only file
// ---------------------------------------------------------------------------
// <path> holds one canonical record per line. An index of line offsets is
// built on open so read_range() seeks directly to a slot.
//
// Crash safety:
//   - Every append seeks to end, writes the line, fflush()es and fsync()s,
//     then checks the file grew by exactly the line size.
//   - A failed or partial write is truncated back to the previous end.
//   - A torn final line (no trailing '\n') found on open is truncated away;
//     it was never acknowledged.
class FileRecordStore : public IRecordStore {
 public:
  explicit FileRecordStore(std::string path);
  ~FileRecordStore() override;

  FileRecordStore(const FileRecordStore&) = delete;
  FileRecordStore& operator=(const FileRecordStore&) = delete;

  // False if the file could not be opened or its index could not be built.
  bool is_open() const;

  bool append(const AuditRecord& record, LedgerError* error = nullptr) override;
  std::optional<std::vector<AuditRecord>> read_range(uint64_t from, uint64_t to,
                                                     LedgerError* error = nullptr) const override;
  std::optional<ChainHead> read_head(LedgerError* error = nullptr) const override;
  uint64_t count() const override;
  std::string backend_id() const override { return "file:" + path_; }

  const std::string& path() const { return path_; }

 private:
  bool build_index();
  bool read_line_locked(uint64_t seq, std::string* out) const;

  std::string path_;
  mutable std::mutex mu_;
  FILE* file_{nullptr};
  std::vector<long> offsets_;  // start offset of each line
  long end_offset_{0};
};

// Store factory for replicas: <dir>/<node_id>.ndjson.
StoreFactory file_store_factory(const std::string& dir);
StoreFactory memory_store_factory();

}  // namespace lexledger
