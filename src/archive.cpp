#include "lexledger/archive.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#include <fcntl.h>
#include <unistd.h>  // fsync

#if defined(LEXLEDGER_WITH_ZSTD)
#include <zstd.h>
#endif

#include "lexledger/hash.hpp"
#include "lexledger/jsonlite.hpp"
#include "lexledger/merkle.hpp"
#include "lexledger/observability.hpp"

namespace fs = std::filesystem;

namespace lexledger {

namespace {

#if defined(LEXLEDGER_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool fsync_directory(const fs::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) return false;
  const bool synced = ::fsync(fd) == 0;
  ::close(fd);
  return synced;
}

// Write to a temp file in the same directory, fsync it, rename into place,
// then fsync the directory so the rename itself is durable.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  std::FILE* f = std::fopen(tmp.c_str(), "wb");
  if (!f) return false;
  const bool written = std::fwrite(data.data(), 1, data.size(), f) == data.size();
  const bool flushed = written && std::fflush(f) == 0;
  const bool synced = flushed && ::fsync(::fileno(f)) == 0;
  const bool closed = std::fclose(f) == 0;
  if (!synced || !closed) {
    std::remove(tmp.c_str());
    return false;
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return fsync_directory(target.parent_path());
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string padded_id(uint64_t id) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(id));
  return buf;
}

std::string meta_to_json(const SegmentBlobInfo& m) {
  jsonlite::Object o;
  o["segment_id"] = jsonlite::Value{static_cast<std::uint64_t>(m.segment_id)};
  o["encoding"] = jsonlite::Value{m.encoding};
  o["original_size"] = jsonlite::Value{static_cast<std::uint64_t>(m.original_size)};
  o["stored_size"] = jsonlite::Value{static_cast<std::uint64_t>(m.stored_size)};
  o["content_hash"] = jsonlite::Value{m.content_hash};
  o["stored_blob_hash"] = jsonlite::Value{m.stored_blob_hash};
  o["merkle_root"] = jsonlite::Value{m.merkle_root};
  return jsonlite::serialize(o);
}

std::optional<SegmentBlobInfo> meta_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(text, &err);
  if (err || !jsonlite::has_string(o, "stored_blob_hash")) return std::nullopt;
  SegmentBlobInfo m;
  m.segment_id = jsonlite::get_u64(o, "segment_id");
  m.encoding = jsonlite::get_string(o, "encoding", "identity");
  m.original_size = static_cast<std::size_t>(jsonlite::get_u64(o, "original_size"));
  m.stored_size = static_cast<std::size_t>(jsonlite::get_u64(o, "stored_size"));
  m.content_hash = jsonlite::get_string(o, "content_hash");
  m.stored_blob_hash = jsonlite::get_string(o, "stored_blob_hash");
  m.merkle_root = jsonlite::get_string(o, "merkle_root");
  return m;
}

}  // namespace

FileSegmentArchive::FileSegmentArchive(std::string root, std::string compression)
    : root_(std::move(root)), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "segments", ec);
  fs::create_directories(fs::path(root_) / "attestations", ec);
}

std::string FileSegmentArchive::segment_path(uint64_t segment_id) const {
  return (fs::path(root_) / "segments" / (padded_id(segment_id) + ".seg")).string();
}

std::string FileSegmentArchive::meta_path(uint64_t segment_id) const {
  return segment_path(segment_id) + ".meta";
}

std::string FileSegmentArchive::attestation_dir(uint64_t segment_id) const {
  return (fs::path(root_) / "attestations" / padded_id(segment_id)).string();
}

bool FileSegmentArchive::put_segment(const SealedSegment& segment, LedgerError* error) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string json = segment_to_json(segment);

  if (fs::exists(segment_path(segment.segment_id))) {
    auto existing = read_file(meta_path(segment.segment_id));
    auto meta = existing ? meta_from_json(*existing) : std::nullopt;
    if (meta && meta->merkle_root == segment.merkle_root) return true;
    return fail(error, make_error(ErrorCode::segment_state_invalid,
                                  "segment " + std::to_string(segment.segment_id) +
                                      " already archived with a different root"));
  }

  std::string stored = json;
  std::string encoding = "identity";
#if defined(LEXLEDGER_WITH_ZSTD)
  if (compression_ == "zstd") {
    auto c = compress_zstd(json);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#endif

  SegmentBlobInfo meta;
  meta.segment_id = segment.segment_id;
  meta.encoding = encoding;
  meta.original_size = json.size();
  meta.stored_size = stored.size();
  meta.content_hash = segment_blob_hash(json);
  meta.stored_blob_hash = blake3_hex(stored);
  meta.merkle_root = segment.merkle_root;

  const fs::path target = segment_path(segment.segment_id);
  if (!atomic_write(target, stored)) {
    return fail(error, make_error(ErrorCode::persistence_failure, "cannot write " + target.string()));
  }
  if (!atomic_write(meta_path(segment.segment_id), meta_to_json(meta))) {
    std::error_code ec;
    fs::remove(target, ec);
    return fail(error, make_error(ErrorCode::persistence_failure, "cannot write segment meta"));
  }
  return true;
}

std::optional<SegmentBlobInfo> FileSegmentArchive::info(uint64_t segment_id) const {
  auto text = read_file(meta_path(segment_id));
  if (!text) return std::nullopt;
  return meta_from_json(*text);
}

std::optional<SealedSegment> FileSegmentArchive::get_segment(uint64_t segment_id,
                                                             LedgerError* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto data = read_file(segment_path(segment_id));
  auto meta = info(segment_id);
  if (!data || !meta) {
    fail(error, make_error(ErrorCode::not_found, "segment " + std::to_string(segment_id)));
    return std::nullopt;
  }

  auto corrupt = [&](const std::string& why) -> std::optional<SealedSegment> {
    LedgerError e = make_error(ErrorCode::integrity_violation,
                               "archived segment " + std::to_string(segment_id) + ": " + why);
    fail(error, e);
    OperatorAlert alert;
    alert.component = "archive";
    alert.error = e;
    raise_operator_alert(std::move(alert));
    return std::nullopt;
  };

  if (blake3_hex(*data) != meta->stored_blob_hash) return corrupt("stored blob hash mismatch");

  std::string json = std::move(*data);
  if (meta->encoding == "zstd") {
#if defined(LEXLEDGER_WITH_ZSTD)
    json = decompress_zstd(json, meta->original_size);
#else
    fail(error, make_error(ErrorCode::persistence_failure, "zstd support not built in"));
    return std::nullopt;
#endif
  }
  if (segment_blob_hash(json) != meta->content_hash) return corrupt("content hash mismatch");

  LedgerError parse_err;
  auto segment = segment_from_json(json, &parse_err);
  if (!segment) return corrupt(parse_err.detail);
  if (segment->segment_id != segment_id || segment->merkle_root != meta->merkle_root ||
      build_segment(segment->records) != segment->merkle_root) {
    return corrupt("merkle root mismatch");
  }
  return segment;
}

std::vector<uint64_t> FileSegmentArchive::segment_ids() const {
  std::vector<uint64_t> out;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(fs::path(root_) / "segments", ec)) {
    const auto name = entry.path().filename().string();
    if (name.size() != 24 || name.substr(20) != ".seg") continue;
    try {
      out.push_back(std::stoull(name.substr(0, 20)));
    } catch (const std::exception&) {
      continue;
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool FileSegmentArchive::put_attestation(const Attestation& attestation, LedgerError* error) {
  std::lock_guard<std::mutex> lk(mu_);
  const fs::path dir = attestation_dir(attestation.segment_id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  size_t n = 0;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.path().extension() == ".json") ++n;
  }
  const fs::path target = dir / (padded_id(n) + ".json");
  if (!atomic_write(target, attestation_to_json(attestation))) {
    return fail(error, make_error(ErrorCode::persistence_failure, "cannot write attestation"));
  }
  return true;
}

std::vector<Attestation> FileSegmentArchive::attestations(uint64_t segment_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::pair<std::string, Attestation>> found;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(attestation_dir(segment_id), ec)) {
    if (entry.path().extension() != ".json") continue;
    auto text = read_file(entry.path());
    if (!text) continue;
    auto a = attestation_from_json(*text);
    if (a) {
      found.emplace_back(entry.path().filename().string(), std::move(*a));
    } else {
      log_line("archive", "skipping malformed attestation " + entry.path().string());
    }
  }
  std::sort(found.begin(), found.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  std::vector<Attestation> out;
  for (auto& [name, a] : found) out.push_back(std::move(a));
  return out;
}

}  // namespace lexledger
