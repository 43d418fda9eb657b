#pragma once

// lexledger/clock.hpp - Vector clocks for causal ordering across writer nodes.
//
// INVARIANTS:
//   - A missing entry is equivalent to a zero counter. Entries are never
//     stored with value 0 after merge/increment, so two clocks that compare
//     Equal also serialize identically.
//   - dominates(a, b): a >= b component-wise and a != b.
//   - Wall-clock timestamps are never consulted for ordering.

#include <cstdint>
#include <map>
#include <string>

#include "lexledger/jsonlite.hpp"

namespace lexledger {

enum class ClockOrder { Before, After, Equal, Concurrent };

std::string to_string(ClockOrder order);

class VectorClock {
 public:
  VectorClock() = default;
  explicit VectorClock(std::map<std::string, uint64_t> counters);

  uint64_t get(const std::string& node_id) const;
  void set(const std::string& node_id, uint64_t value);

  // Bumps node_id's own counter and returns the new value.
  uint64_t increment(const std::string& node_id);

  // Component-wise maximum.
  void merge(const VectorClock& other);

  // True if every component of *this is >= other's.
  bool covers(const VectorClock& other) const;

  // covers(other) and not equal.
  bool dominates(const VectorClock& other) const;

  ClockOrder compare(const VectorClock& other) const;

  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  bool empty() const { return counters_.empty(); }

  jsonlite::Value to_value() const;
  std::string to_json() const;
  static VectorClock from_object(const jsonlite::Object& obj);

  bool operator==(const VectorClock& other) const { return counters_ == other.counters_; }
  bool operator!=(const VectorClock& other) const { return !(*this == other); }

 private:
  std::map<std::string, uint64_t> counters_;
};

}  // namespace lexledger
