#include "lexledger/config.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <unistd.h>  // gethostname

#include "lexledger/jsonlite.hpp"

namespace lexledger {

namespace {

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
  return "unknown-host";
}

std::optional<std::string> env_string(const char* name) {
  const char* e = std::getenv(name);
  if (e && e[0]) return std::string(e);
  return std::nullopt;
}

bool env_u64(const char* name, uint64_t* out, LedgerError* error) {
  auto v = env_string(name);
  if (!v) return true;
  errno = 0;
  char* end = nullptr;
  const unsigned long long n = std::strtoull(v->c_str(), &end, 10);
  if (errno != 0 || end == v->c_str() || *end != '\0' || (*v)[0] == '-') {
    return fail(error, make_error(ErrorCode::config_invalid,
                                  std::string(name) + " is not an unsigned integer: " + *v));
  }
  *out = static_cast<uint64_t>(n);
  return true;
}

bool env_double(const char* name, double* out, LedgerError* error) {
  auto v = env_string(name);
  if (!v) return true;
  errno = 0;
  char* end = nullptr;
  const double d = std::strtod(v->c_str(), &end);
  if (errno != 0 || end == v->c_str() || *end != '\0') {
    return fail(error, make_error(ErrorCode::config_invalid,
                                  std::string(name) + " is not a number: " + *v));
  }
  *out = d;
  return true;
}

}  // namespace

std::vector<std::string> split_node_list(const std::string& csv) {
  std::vector<std::string> out;
  std::stringstream ss(csv);
  std::string item;
  while (std::getline(ss, item, ',')) {
    const auto b = item.find_first_not_of(" \t");
    if (b == std::string::npos) continue;
    const auto e = item.find_last_not_of(" \t");
    out.push_back(item.substr(b, e - b + 1));
  }
  return out;
}

std::optional<LedgerConfig> load_config_from_env(const ConfigOverrides& o, LedgerError* error) {
  LedgerConfig c;

  c.node_id = o.node_id ? *o.node_id : env_string("LEXLEDGER_NODE_ID").value_or(get_hostname());
  c.store_path = o.store_path ? *o.store_path : env_string("LEXLEDGER_STORE_PATH").value_or("");
  c.archive_path =
      o.archive_path ? *o.archive_path : env_string("LEXLEDGER_ARCHIVE_PATH").value_or("");
  c.consensus = o.consensus ? *o.consensus : env_string("LEXLEDGER_CONSENSUS").value_or("majority");
  c.compression =
      o.compression ? *o.compression : env_string("LEXLEDGER_COMPRESSION").value_or("off");

  if (o.known_nodes) {
    c.known_nodes = *o.known_nodes;
  } else if (auto csv = env_string("LEXLEDGER_KNOWN_NODES")) {
    c.known_nodes = split_node_list(*csv);
  }

  if (!env_u64("LEXLEDGER_SYNC_INTERVAL_MS", &c.sync_interval_ms, error) ||
      !env_u64("LEXLEDGER_SYNC_BATCH", &c.sync_batch_size, error) ||
      !env_u64("LEXLEDGER_QUORUM_TIMEOUT_MS", &c.quorum_timeout_ms, error) ||
      !env_u64("LEXLEDGER_INBOUND_CAPACITY", &c.inbound_capacity, error) ||
      !env_double("LEXLEDGER_SAMPLE_RATE", &c.sample_rate, error)) {
    return std::nullopt;
  }
  if (o.sync_interval_ms) c.sync_interval_ms = *o.sync_interval_ms;
  if (o.sync_batch_size) c.sync_batch_size = *o.sync_batch_size;
  if (o.quorum_timeout_ms) c.quorum_timeout_ms = *o.quorum_timeout_ms;
  if (o.inbound_capacity) c.inbound_capacity = *o.inbound_capacity;
  if (o.sample_rate) c.sample_rate = *o.sample_rate;

  if (!c.node_id.empty() &&
      std::find(c.known_nodes.begin(), c.known_nodes.end(), c.node_id) == c.known_nodes.end()) {
    c.known_nodes.push_back(c.node_id);
  }
  std::sort(c.known_nodes.begin(), c.known_nodes.end());
  c.known_nodes.erase(std::unique(c.known_nodes.begin(), c.known_nodes.end()), c.known_nodes.end());

  if (!validate_config(c, error)) return std::nullopt;
  return c;
}

bool validate_config(const LedgerConfig& c, LedgerError* error) {
  auto invalid = [&](const std::string& why) {
    return fail(error, make_error(ErrorCode::config_invalid, why));
  };
  if (c.node_id.empty()) return invalid("node_id is empty");
  if (c.node_id.find(',') != std::string::npos) return invalid("node_id may not contain ','");
  if (c.consensus != "majority" && c.consensus != "leader" && c.consensus != "bft") {
    return invalid("unknown consensus strategy: " + c.consensus);
  }
  if (!(c.sample_rate > 0.0) || c.sample_rate > 1.0) {
    return invalid("sample_rate must be in (0, 1]");
  }
  if (c.consensus == "bft" && c.known_nodes.size() < 4) {
    return invalid("bft needs at least 4 known nodes, have " + std::to_string(c.known_nodes.size()));
  }
  if (c.sync_batch_size == 0) return invalid("sync batch size must be positive");
  if (c.inbound_capacity == 0) return invalid("inbound capacity must be positive");
  if (c.quorum_timeout_ms == 0) return invalid("quorum timeout must be positive");
  if (c.compression != "off" && c.compression != "zstd") {
    return invalid("unknown compression: " + c.compression);
  }
  return true;
}

std::string config_to_json(const LedgerConfig& c) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["node_id"] = Value{c.node_id};
  o["store_path"] = Value{c.store_path};
  o["archive_path"] = Value{c.archive_path};
  o["consensus"] = Value{c.consensus};
  jsonlite::Array nodes;
  for (const auto& n : c.known_nodes) nodes.push_back(Value{n});
  o["known_nodes"] = Value{std::move(nodes)};
  o["sync_interval_ms"] = Value{static_cast<std::uint64_t>(c.sync_interval_ms)};
  o["sync_batch_size"] = Value{static_cast<std::uint64_t>(c.sync_batch_size)};
  o["quorum_timeout_ms"] = Value{static_cast<std::uint64_t>(c.quorum_timeout_ms)};
  o["sample_rate"] = Value{c.sample_rate};
  o["inbound_capacity"] = Value{static_cast<std::uint64_t>(c.inbound_capacity)};
  o["compression"] = Value{c.compression};
  return jsonlite::serialize(o);
}

std::unique_ptr<OrderingStrategy> make_strategy(const LedgerConfig& config, LedgerError* error) {
  return make_strategy(config.consensus, config.known_nodes, error);
}

}  // namespace lexledger
