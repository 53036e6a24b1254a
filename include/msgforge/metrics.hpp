#pragma once

#include <map>
#include <mutex>
#include <string>

#include "msgforge/common.hpp"

namespace msgforge {

// Pipeline counters named "<area>.<event>", e.g. "pipeline.runs" or
// "quotes.attached". Dumped grouped by area.
class PipelineCounters {
 public:
  void inc(const std::string& name, uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[name] += delta;
  }

  uint64_t get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mu_);
    counters_.clear();
  }

  // {"pipeline": {"runs": 3, "rejected.mention_all": 1}, "quotes": {...}}
  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& [name, value] : counters_) {
      const auto dot = name.find('.');
      if (dot == std::string::npos) {
        j["other"][name] = value;
      } else {
        j[name.substr(0, dot)][name.substr(dot + 1)] = value;
      }
    }
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
};

inline PipelineCounters& metrics() {
  static PipelineCounters counters;
  return counters;
}

}  // namespace msgforge
