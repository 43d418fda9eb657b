#include "lexledger/store.hpp"

#include <filesystem>
#include <unistd.h>  // fsync, ftruncate

#include "lexledger/observability.hpp"

namespace fs = std::filesystem;

namespace lexledger {

namespace {

LedgerError corrupt_entry(uint64_t seq, const std::string& why) {
  return integrity_violation_at(seq, "corrupt entry at seq " + std::to_string(seq) + ": " + why);
}

bool check_append_slot(const AuditRecord& record, uint64_t expected, LedgerError* error) {
  if (!record.sealed()) {
    return fail(error, make_error(ErrorCode::invalid_record, "record has no record_hash"));
  }
  if (record.local_sequence != expected) {
    return fail(error, make_error(ErrorCode::persistence_failure,
                                  "out-of-order append: expected seq " + std::to_string(expected) +
                                      ", got " + std::to_string(record.local_sequence)));
  }
  return true;
}

std::string sanitize_file_stem(const std::string& node_id) {
  std::string out;
  out.reserve(node_id.size());
  for (char c : node_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    out += ok ? c : '_';
  }
  return out.empty() ? std::string("_") : out;
}

}  // namespace

std::optional<AuditRecord> decode_stored_line(const std::string& line, uint64_t expected_sequence,
                                              LedgerError* error) {
  LedgerError decode_err;
  auto rec = record_from_json(line, &decode_err);
  if (!rec) {
    fail(error, corrupt_entry(expected_sequence, decode_err.detail));
    return std::nullopt;
  }
  if (rec->local_sequence != expected_sequence) {
    fail(error, corrupt_entry(expected_sequence, "slot holds seq " +
                                                     std::to_string(rec->local_sequence)));
    return std::nullopt;
  }
  // Canonical bytes in, canonical bytes out. Anything else was edited.
  if (record_to_json(*rec) != line) {
    fail(error, corrupt_entry(expected_sequence, "non-canonical bytes"));
    return std::nullopt;
  }
  return rec;
}

// ---------------------------------------------------------------------------
// MemoryRecordStore
// ---------------------------------------------------------------------------

bool MemoryRecordStore::append(const AuditRecord& record, LedgerError* error) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!check_append_slot(record, lines_.size(), error)) return false;
  lines_.push_back(record_to_json(record));
  return true;
}

std::optional<std::vector<AuditRecord>> MemoryRecordStore::read_range(uint64_t from, uint64_t to,
                                                                      LedgerError* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (from > to || to >= lines_.size()) {
    fail(error, make_error(ErrorCode::not_found, "range out of bounds"));
    return std::nullopt;
  }
  std::vector<AuditRecord> out;
  out.reserve(static_cast<size_t>(to - from + 1));
  for (uint64_t seq = from; seq <= to; ++seq) {
    auto rec = decode_stored_line(lines_[static_cast<size_t>(seq)], seq, error);
    if (!rec) return std::nullopt;
    out.push_back(std::move(*rec));
  }
  return out;
}

std::optional<ChainHead> MemoryRecordStore::read_head(LedgerError* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (lines_.empty()) return std::nullopt;
  const uint64_t seq = lines_.size() - 1;
  auto rec = decode_stored_line(lines_.back(), seq, error);
  if (!rec) return std::nullopt;
  return ChainHead{rec->record_hash, rec->local_sequence};
}

uint64_t MemoryRecordStore::count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return lines_.size();
}

// ---------------------------------------------------------------------------
// FileRecordStore
// ---------------------------------------------------------------------------

FileRecordStore::FileRecordStore(std::string path) : path_(std::move(path)) {
  const fs::path p(path_);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
  }
  // r+ rather than a+: rollback truncates through the same stream.
  file_ = std::fopen(path_.c_str(), "r+b");
  if (!file_) file_ = std::fopen(path_.c_str(), "w+b");
  if (!file_) {
    log_line("store", "cannot open " + path_);
    return;
  }
  if (!build_index()) {
    log_line("store", "cannot index " + path_);
    std::fclose(file_);
    file_ = nullptr;
  }
}

FileRecordStore::~FileRecordStore() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool FileRecordStore::is_open() const {
  std::lock_guard<std::mutex> lk(mu_);
  return file_ != nullptr;
}

bool FileRecordStore::build_index() {
  offsets_.clear();
  if (std::fseek(file_, 0, SEEK_SET) != 0) return false;
  long line_start = 0;
  long pos = 0;
  bool in_line = false;
  int c;
  while ((c = std::fgetc(file_)) != EOF) {
    if (!in_line) {
      line_start = pos;
      in_line = true;
    }
    ++pos;
    if (c == '\n') {
      offsets_.push_back(line_start);
      in_line = false;
    }
  }
  if (std::ferror(file_)) return false;
  end_offset_ = in_line ? line_start : pos;
  if (in_line) {
    // Torn tail from an interrupted append: never acknowledged, drop it.
    std::fflush(file_);
    if (::ftruncate(::fileno(file_), end_offset_) != 0) return false;
    log_line("store", "truncated torn tail of " + path_ + " at offset " +
                          std::to_string(end_offset_));
  }
  std::clearerr(file_);
  return true;
}

bool FileRecordStore::append(const AuditRecord& record, LedgerError* error) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!file_) {
    return fail(error, make_error(ErrorCode::persistence_failure, "store not open: " + path_));
  }
  if (!check_append_slot(record, offsets_.size(), error)) return false;

  // Append-only: always write at the current end, never where the stream
  // position happens to be.
  if (std::fseek(file_, 0, SEEK_END) != 0) {
    return fail(error, make_error(ErrorCode::persistence_failure, "seek failed"));
  }
  const long pre_write_pos = std::ftell(file_);
  if (pre_write_pos < 0) {
    return fail(error, make_error(ErrorCode::persistence_failure, "ftell failed"));
  }

  const std::string line = record_to_json(record) + "\n";
  const bool written = std::fwrite(line.data(), 1, line.size(), file_) == line.size();
  const bool flushed = std::fflush(file_) == 0;
  const bool synced = flushed && ::fsync(::fileno(file_)) == 0;
  const long post_write_pos = std::ftell(file_);
  const bool grew = post_write_pos == pre_write_pos + static_cast<long>(line.size());

  if (!written || !synced || !grew) {
    std::clearerr(file_);
    if (::ftruncate(::fileno(file_), pre_write_pos) != 0) {
      log_line("store", "rollback truncate failed for " + path_);
    }
    return fail(error, make_error(ErrorCode::persistence_failure,
                                  "write to " + path_ + " did not complete"));
  }

  offsets_.push_back(pre_write_pos);
  end_offset_ = post_write_pos;
  return true;
}

bool FileRecordStore::read_line_locked(uint64_t seq, std::string* out) const {
  const long start = offsets_[static_cast<size_t>(seq)];
  const long stop = (seq + 1 < offsets_.size()) ? offsets_[static_cast<size_t>(seq + 1)] : end_offset_;
  if (stop <= start) return false;
  out->assign(static_cast<size_t>(stop - start), '\0');
  if (std::fseek(file_, start, SEEK_SET) != 0) return false;
  if (std::fread(out->data(), 1, out->size(), file_) != out->size()) {
    std::clearerr(file_);
    return false;
  }
  if (!out->empty() && out->back() == '\n') out->pop_back();
  return true;
}

std::optional<std::vector<AuditRecord>> FileRecordStore::read_range(uint64_t from, uint64_t to,
                                                                    LedgerError* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!file_) {
    fail(error, make_error(ErrorCode::persistence_failure, "store not open: " + path_));
    return std::nullopt;
  }
  if (from > to || to >= offsets_.size()) {
    fail(error, make_error(ErrorCode::not_found, "range out of bounds"));
    return std::nullopt;
  }
  std::vector<AuditRecord> out;
  out.reserve(static_cast<size_t>(to - from + 1));
  std::string line;
  for (uint64_t seq = from; seq <= to; ++seq) {
    if (!read_line_locked(seq, &line)) {
      fail(error, make_error(ErrorCode::persistence_failure,
                             "read failed at seq " + std::to_string(seq)));
      return std::nullopt;
    }
    auto rec = decode_stored_line(line, seq, error);
    if (!rec) return std::nullopt;
    out.push_back(std::move(*rec));
  }
  return out;
}

std::optional<ChainHead> FileRecordStore::read_head(LedgerError* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!file_ || offsets_.empty()) return std::nullopt;
  const uint64_t seq = offsets_.size() - 1;
  std::string line;
  if (!read_line_locked(seq, &line)) {
    fail(error, make_error(ErrorCode::persistence_failure, "read failed at head"));
    return std::nullopt;
  }
  auto rec = decode_stored_line(line, seq, error);
  if (!rec) return std::nullopt;
  return ChainHead{rec->record_hash, rec->local_sequence};
}

uint64_t FileRecordStore::count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return offsets_.size();
}

StoreFactory file_store_factory(const std::string& dir) {
  return [dir](const std::string& node_id) -> std::unique_ptr<IRecordStore> {
    return std::make_unique<FileRecordStore>(
        (fs::path(dir) / (sanitize_file_stem(node_id) + ".ndjson")).string());
  };
}

StoreFactory memory_store_factory() {
  return [](const std::string&) -> std::unique_ptr<IRecordStore> {
    return std::make_unique<MemoryRecordStore>();
  };
}

}  // namespace lexledger
