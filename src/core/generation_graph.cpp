#include "reroute/core/generation_graph.hpp"

#include <algorithm>
#include <stdexcept>

namespace reroute {

namespace {

struct Entry {
  RouteHandle route;
  const KeyFrequencyAnalyzer::PossibleKeys *values;
};

void sort_by_registration(std::vector<Entry> &entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const Entry &a, const Entry &b) {
                     return a.route->index() < b.route->index();
                   });
}

std::unique_ptr<GenerationGraph::Node>
build_level(const std::vector<std::string> &keys, size_t level,
            const std::vector<Entry> &entries) {
  auto node = std::make_unique<GenerationGraph::Node>();

  if (level == keys.size()) {
    node->routes.reserve(entries.size());
    for (const auto &entry : entries) {
      node->routes.push_back(entry.route);
    }
    return node;
  }

  std::map<std::string, std::vector<Entry>> concrete;
  std::vector<Entry> wildcard;
  for (const auto &entry : entries) {
    auto it = entry.values->find(keys[level]);
    if (it != entry.values->end()) {
      concrete[it->second].push_back(entry);
    } else {
      wildcard.push_back(entry);
    }
  }

  for (auto &[value, list] : concrete) {
    list.insert(list.end(), wildcard.begin(), wildcard.end());
    sort_by_registration(list);
    node->edges.emplace(value, build_level(keys, level + 1, list));
  }

  if (!wildcard.empty()) {
    node->wildcard = build_level(keys, level + 1, wildcard);
  }

  return node;
}

void collect(const GenerationGraph::Node &node, size_t level, size_t depth,
             const GenerationGraph::Values &values,
             GenerationGraph::Candidates &out) {
  if (level == depth) {
    out.insert(out.end(), node.routes.begin(), node.routes.end());
    return;
  }

  std::optional<std::string> value;
  if (level < values.size()) {
    value = values[level];
  }
  if (value) {
    auto it = node.edges.find(*value);
    if (it != node.edges.end()) {
      collect(*it->second, level + 1, depth, values, out);
    } else if (node.wildcard) {
      collect(*node.wildcard, level + 1, depth, values, out);
    }
    return;
  }

  for (const auto &[key, child] : node.edges) {
    collect(*child, level + 1, depth, values, out);
  }
  if (node.wildcard) {
    collect(*node.wildcard, level + 1, depth, values, out);
  }
}

void dedupe(GenerationGraph::Candidates &candidates) {
  std::sort(candidates.begin(), candidates.end(),
            [](const RouteHandle &a, const RouteHandle &b) {
              return a->index() < b->index();
            });
  candidates.erase(std::unique(candidates.begin(), candidates.end()),
                   candidates.end());
}

} // anonymous namespace

bool GenerationGraph::Node::operator==(const Node &other) const {
  if (edges.size() != other.edges.size() ||
      static_cast<bool>(wildcard) != static_cast<bool>(other.wildcard) ||
      routes.size() != other.routes.size()) {
    return false;
  }
  for (size_t i = 0; i < routes.size(); ++i) {
    if (routes[i]->index() != other.routes[i]->index())
      return false;
  }
  for (const auto &[value, child] : edges) {
    auto it = other.edges.find(value);
    if (it == other.edges.end() || !(*child == *it->second))
      return false;
  }
  return !wildcard || *wildcard == *other.wildcard;
}

GenerationGraph GenerationGraph::build(std::vector<std::string> keys,
                                       const KeyFrequencyAnalyzer &analyzer,
                                       const std::vector<RouteHandle> &routes) {
  if (analyzer.size() != routes.size()) {
    throw std::logic_error("generation graph: analyzer observed " +
                           std::to_string(analyzer.size()) + " routes, " +
                           std::to_string(routes.size()) + " registered");
  }

  std::vector<Entry> entries;
  for (size_t i = 0; i < routes.size(); ++i) {
    if (!analyzer.significant(i)) {
      continue;
    }
    entries.push_back(Entry{routes[i], &analyzer.possible_keys()[i]});
  }

  GenerationGraph graph;
  graph.keys_ = std::move(keys);
  graph.root_ = build_level(graph.keys_, 0, entries);
  return graph;
}

GenerationGraph::Candidates GenerationGraph::lookup(const Values &values) const {
  Candidates candidates;
  if (!root_) {
    return candidates;
  }
  collect(*root_, 0, keys_.size(), values, candidates);
  dedupe(candidates);
  return candidates;
}

size_t GenerationGraph::size() const {
  return lookup(Values(keys_.size())).size();
}

bool GenerationGraph::operator==(const GenerationGraph &other) const {
  if (keys_ != other.keys_)
    return false;
  if (!root_ || !other.root_)
    return !root_ && !other.root_;
  return *root_ == *other.root_;
}

} // namespace reroute
