#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace mediacache::lineage {

/*
  Dependency edges between artifacts.

  input ---> derived

  Edges are stored both ways so upstream (what did X use) and downstream
  (what used X) walks are equally cheap. Not thread-safe; the registry
  serializes access.
*/
class DependencyGraph {
 public:
  // Records `derived` as produced from `inputs`. Repeated edges are ignored.
  void Add(const std::string& derived, const std::vector<std::string>& inputs);

  // Drops every edge touching `id`.
  void Remove(const std::string& id);

  // Drops the single edge derived -> input.
  void RemoveEdge(const std::string& derived, const std::string& input);

  // Direct inputs in registration order.
  std::vector<std::string> InputsOf(const std::string& derived) const;

  // Everything that used `id`, directly or transitively. max_depth 0 = unlimited.
  std::set<std::string> Dependents(const std::string& id, uint32_t max_depth = 0) const;

  // Everything `id` was built from, directly or transitively.
  std::set<std::string> Ancestors(const std::string& id, uint32_t max_depth = 0) const;

  bool HasDependents(const std::string& id) const;

  // derived -> ordered inputs, for persistence
  const std::unordered_map<std::string, std::vector<std::string>>& Edges() const {
    return inputs_;
  }

  std::size_t EdgeCount() const;

  void Clear();

 private:
  std::set<std::string> Walk(const std::string& start, bool upstream, uint32_t max_depth) const;

  std::unordered_map<std::string, std::vector<std::string>> inputs_;
  std::unordered_map<std::string, std::vector<std::string>> dependents_;
};

} // namespace mediacache::lineage
