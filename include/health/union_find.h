#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace health {

// Disjoint sets keyed by string with path compression and union by rank.
// Components are reported in node insertion order, so identical inputs always
// produce identical output.
class UnionFind {
public:
  // Adding an existing node is a no-op.
  void Add(const std::string &node);
  bool Contains(const std::string &node) const;

  // Throws std::out_of_range for unknown nodes.
  const std::string &Find(const std::string &node);
  void Union(const std::string &first, const std::string &second);

  std::size_t Size() const { return nodes_.size(); }
  std::vector<std::vector<std::string>> Components();

private:
  std::size_t IndexOf(const std::string &node) const;
  std::size_t FindRoot(std::size_t index);

  std::vector<std::string> nodes_;
  std::vector<std::size_t> parent_;
  std::vector<int> rank_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace health
