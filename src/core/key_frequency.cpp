#include "reroute/core/key_frequency.hpp"

#include <algorithm>
#include <set>

namespace reroute {

void KeyFrequencyAnalyzer::observe(const Route &route) {
  const auto &keys = route.generation_keys();
  for (const auto &[key, value] : keys) {
    if (std::find(first_seen_.begin(), first_seen_.end(), key) == first_seen_.end()) {
      first_seen_.push_back(key);
    }
  }
  possible_keys_.emplace_back(keys.begin(), keys.end());
  significant_.push_back(route.significant_params());
  report_.reset();
}

const std::vector<std::string> &KeyFrequencyAnalyzer::report() const {
  if (report_) {
    return *report_;
  }

  struct KeyStats {
    std::string key;
    size_t routes = 0;
    std::set<std::string> values;
  };

  std::vector<KeyStats> stats;
  stats.reserve(first_seen_.size());
  for (const auto &key : first_seen_) {
    stats.push_back(KeyStats{key, 0, {}});
  }

  size_t observations = 0;
  for (const auto &keys : possible_keys_) {
    for (auto &entry : stats) {
      auto it = keys.find(entry.key);
      if (it != keys.end()) {
        ++entry.routes;
        entry.values.insert(it->second);
        ++observations;
      }
    }
  }

  std::vector<std::string> ordered;
  if (observations > 1) {
    double mean = static_cast<double>(observations) / static_cast<double>(stats.size());

    std::stable_sort(stats.begin(), stats.end(),
                     [](const KeyStats &a, const KeyStats &b) {
                       if (a.routes != b.routes)
                         return a.routes > b.routes;
                       return a.values.size() > b.values.size();
                     });

    for (const auto &entry : stats) {
      if (static_cast<double>(entry.routes) >= mean) {
        ordered.push_back(entry.key);
      }
    }
  }

  report_ = std::move(ordered);
  return *report_;
}

void KeyFrequencyAnalyzer::expire() {
  possible_keys_.clear();
  significant_.clear();
  first_seen_.clear();
  report_.reset();
}

} // namespace reroute
