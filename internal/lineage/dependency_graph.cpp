#include "internal/lineage/dependency_graph.hpp"

#include <algorithm>
#include <queue>
#include <utility>

namespace mediacache::lineage {

namespace {

void EraseValue(std::vector<std::string>& values, const std::string& value) {
  values.erase(std::remove(values.begin(), values.end(), value), values.end());
}

} // namespace

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------

void DependencyGraph::Add(const std::string& derived, const std::vector<std::string>& inputs) {
  // Stage the new adjacency first so a throwing allocation leaves the graph untouched.
  auto                     existing      = inputs_.find(derived);
  std::vector<std::string> staged_inputs = existing == inputs_.end() ? std::vector<std::string>{} : existing->second;

  std::vector<std::pair<std::string, std::vector<std::string>>> staged_dependents;

  for (const auto& input : inputs) {
    if (std::find(staged_inputs.begin(), staged_inputs.end(), input) != staged_inputs.end()) {
      continue;
    }
    staged_inputs.push_back(input);

    auto it   = dependents_.find(input);
    auto list = it == dependents_.end() ? std::vector<std::string>{} : it->second;
    list.push_back(derived);
    staged_dependents.emplace_back(input, std::move(list));
  }

  inputs_[derived] = std::move(staged_inputs);
  for (auto& [input, list] : staged_dependents) {
    dependents_[input] = std::move(list);
  }
}

void DependencyGraph::Remove(const std::string& id) {
  auto in = inputs_.find(id);
  if (in != inputs_.end()) {
    for (const auto& input : in->second) {
      auto it = dependents_.find(input);
      if (it == dependents_.end()) continue;
      EraseValue(it->second, id);
      if (it->second.empty()) dependents_.erase(it);
    }
    inputs_.erase(in);
  }

  auto out = dependents_.find(id);
  if (out != dependents_.end()) {
    for (const auto& derived : out->second) {
      auto it = inputs_.find(derived);
      if (it == inputs_.end()) continue;
      EraseValue(it->second, id);
    }
    dependents_.erase(out);
  }
}

void DependencyGraph::RemoveEdge(const std::string& derived, const std::string& input) {
  auto in = inputs_.find(derived);
  if (in != inputs_.end()) {
    EraseValue(in->second, input);
  }
  auto out = dependents_.find(input);
  if (out != dependents_.end()) {
    EraseValue(out->second, derived);
    if (out->second.empty()) dependents_.erase(out);
  }
}

void DependencyGraph::Clear() {
  inputs_.clear();
  dependents_.clear();
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<std::string> DependencyGraph::InputsOf(const std::string& derived) const {
  auto it = inputs_.find(derived);
  return it == inputs_.end() ? std::vector<std::string>{} : it->second;
}

bool DependencyGraph::HasDependents(const std::string& id) const {
  auto it = dependents_.find(id);
  return it != dependents_.end() && !it->second.empty();
}

std::size_t DependencyGraph::EdgeCount() const {
  std::size_t count = 0;
  for (const auto& [derived, inputs] : inputs_) {
    count += inputs.size();
  }
  return count;
}

std::set<std::string> DependencyGraph::Dependents(const std::string& id, uint32_t max_depth) const {
  return Walk(id, /*upstream=*/false, max_depth);
}

std::set<std::string> DependencyGraph::Ancestors(const std::string& id, uint32_t max_depth) const {
  return Walk(id, /*upstream=*/true, max_depth);
}

// ------------------------------------------------------------
// Traversal
// ------------------------------------------------------------

std::set<std::string> DependencyGraph::Walk(const std::string& start, bool upstream, uint32_t max_depth) const {
  std::set<std::string> result;

  std::queue<std::pair<std::string, uint32_t>> q;
  q.emplace(start, 0);

  const auto& map = upstream ? inputs_ : dependents_;

  while (!q.empty()) {
    auto [node, depth] = q.front();
    q.pop();

    if (max_depth && depth >= max_depth)
      continue;

    auto it = map.find(node);
    if (it == map.end())
      continue;

    for (const auto& other : it->second) {
      if (other == start || !result.insert(other).second)
        continue;

      q.emplace(other, depth + 1);
    }
  }

  return result;
}

} // namespace mediacache::lineage
