#include "lexledger/clock.hpp"

#include <algorithm>

namespace lexledger {

std::string to_string(ClockOrder order) {
  switch (order) {
    case ClockOrder::Before: return "before";
    case ClockOrder::After: return "after";
    case ClockOrder::Equal: return "equal";
    case ClockOrder::Concurrent: return "concurrent";
  }
  return "";
}

VectorClock::VectorClock(std::map<std::string, uint64_t> counters) {
  for (auto& [node, value] : counters) {
    if (value > 0) counters_.emplace(node, value);
  }
}

uint64_t VectorClock::get(const std::string& node_id) const {
  auto it = counters_.find(node_id);
  return it == counters_.end() ? 0 : it->second;
}

void VectorClock::set(const std::string& node_id, uint64_t value) {
  if (value == 0) {
    counters_.erase(node_id);
    return;
  }
  counters_[node_id] = value;
}

uint64_t VectorClock::increment(const std::string& node_id) {
  return ++counters_[node_id];
}

void VectorClock::merge(const VectorClock& other) {
  for (const auto& [node, value] : other.counters_) {
    auto& mine = counters_[node];
    mine = std::max(mine, value);
  }
}

bool VectorClock::covers(const VectorClock& other) const {
  for (const auto& [node, value] : other.counters_) {
    if (get(node) < value) return false;
  }
  return true;
}

bool VectorClock::dominates(const VectorClock& other) const {
  return covers(other) && counters_ != other.counters_;
}

ClockOrder VectorClock::compare(const VectorClock& other) const {
  const bool ge = covers(other);
  const bool le = other.covers(*this);
  if (ge && le) return ClockOrder::Equal;
  if (ge) return ClockOrder::After;
  if (le) return ClockOrder::Before;
  return ClockOrder::Concurrent;
}

jsonlite::Value VectorClock::to_value() const {
  jsonlite::Object obj;
  for (const auto& [node, value] : counters_) {
    obj[node] = jsonlite::Value{static_cast<std::uint64_t>(value)};
  }
  return jsonlite::Value{std::move(obj)};
}

std::string VectorClock::to_json() const { return jsonlite::serialize(to_value()); }

VectorClock VectorClock::from_object(const jsonlite::Object& obj) {
  std::map<std::string, uint64_t> counters;
  for (const auto& [node, v] : obj) {
    if (std::holds_alternative<std::uint64_t>(v.v)) {
      counters[node] = std::get<std::uint64_t>(v.v);
    }
  }
  return VectorClock(std::move(counters));
}

}  // namespace lexledger
