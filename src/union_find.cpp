#include <health/union_find.h>

#include <stdexcept>

namespace health {

void UnionFind::Add(const std::string &node) {
  if (index_.count(node) != 0) {
    return;
  }
  index_.emplace(node, nodes_.size());
  parent_.push_back(nodes_.size());
  rank_.push_back(0);
  nodes_.push_back(node);
}

bool UnionFind::Contains(const std::string &node) const {
  return index_.count(node) != 0;
}

std::size_t UnionFind::IndexOf(const std::string &node) const {
  const auto found = index_.find(node);
  if (found == index_.end()) {
    throw std::out_of_range("Unknown union-find node: " + node);
  }
  return found->second;
}

std::size_t UnionFind::FindRoot(std::size_t index) {
  auto root = index;
  while (parent_[root] != root) {
    root = parent_[root];
  }
  while (parent_[index] != root) {
    const auto next = parent_[index];
    parent_[index] = root;
    index = next;
  }
  return root;
}

const std::string &UnionFind::Find(const std::string &node) {
  return nodes_[FindRoot(IndexOf(node))];
}

void UnionFind::Union(const std::string &first, const std::string &second) {
  const auto first_root = FindRoot(IndexOf(first));
  const auto second_root = FindRoot(IndexOf(second));
  if (first_root == second_root) {
    return;
  }

  if (rank_[first_root] < rank_[second_root]) {
    parent_[first_root] = second_root;
  } else if (rank_[first_root] > rank_[second_root]) {
    parent_[second_root] = first_root;
  } else {
    parent_[second_root] = first_root;
    ++rank_[first_root];
  }
}

std::vector<std::vector<std::string>> UnionFind::Components() {
  std::vector<std::vector<std::string>> components;
  std::unordered_map<std::size_t, std::size_t> root_to_component;
  for (std::size_t index = 0; index < nodes_.size(); ++index) {
    const auto root = FindRoot(index);
    const auto existing = root_to_component.find(root);
    if (existing == root_to_component.end()) {
      root_to_component.emplace(root, components.size());
      components.push_back({nodes_[index]});
      continue;
    }
    components[existing->second].push_back(nodes_[index]);
  }
  return components;
}

} // namespace health
