#pragma once

// lexledger/config.hpp - Node configuration.
//
// PRECEDENCE: explicit override > environment > built-in default.
//
//   LEXLEDGER_NODE_ID            node identity (default: hostname)
//   LEXLEDGER_STORE_PATH         directory for NDJSON chains (default: in-memory)
//   LEXLEDGER_ARCHIVE_PATH       directory for sealed segments (default: none)
//   LEXLEDGER_CONSENSUS          majority | leader | bft (default: majority)
//   LEXLEDGER_KNOWN_NODES        comma list; this node is always included
//   LEXLEDGER_SYNC_INTERVAL_MS   pause between sync rounds per peer (1000)
//   LEXLEDGER_SYNC_BATCH         records per fetch/deliver/commit (256)
//   LEXLEDGER_QUORUM_TIMEOUT_MS  consensus round deadline (5000)
//   LEXLEDGER_SAMPLE_RATE        verify_sampled rate in (0, 1] (0.1)
//   LEXLEDGER_INBOUND_CAPACITY   bounded inbound channel, in batches (64)
//   LEXLEDGER_COMPRESSION        off | zstd (off)
//
// A malformed numeric value is a config_invalid error, never silently the
// default.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lexledger/consensus.hpp"
#include "lexledger/types.hpp"

namespace lexledger {

struct LedgerConfig {
  std::string node_id;
  std::string store_path;
  std::string archive_path;
  std::string consensus{"majority"};
  std::vector<std::string> known_nodes;
  uint64_t sync_interval_ms{1000};
  uint64_t sync_batch_size{256};
  uint64_t quorum_timeout_ms{5000};
  double sample_rate{0.1};
  uint64_t inbound_capacity{64};
  std::string compression{"off"};
};

struct ConfigOverrides {
  std::optional<std::string> node_id;
  std::optional<std::string> store_path;
  std::optional<std::string> archive_path;
  std::optional<std::string> consensus;
  std::optional<std::vector<std::string>> known_nodes;
  std::optional<uint64_t> sync_interval_ms;
  std::optional<uint64_t> sync_batch_size;
  std::optional<uint64_t> quorum_timeout_ms;
  std::optional<double> sample_rate;
  std::optional<uint64_t> inbound_capacity;
  std::optional<std::string> compression;
};

std::optional<LedgerConfig> load_config_from_env(const ConfigOverrides& overrides = {},
                                                 LedgerError* error = nullptr);

bool validate_config(const LedgerConfig& config, LedgerError* error = nullptr);

std::string config_to_json(const LedgerConfig& config);

// Splits a comma list, trimming blanks and dropping empty entries.
std::vector<std::string> split_node_list(const std::string& csv);

std::unique_ptr<OrderingStrategy> make_strategy(const LedgerConfig& config,
                                                LedgerError* error = nullptr);

}  // namespace lexledger
