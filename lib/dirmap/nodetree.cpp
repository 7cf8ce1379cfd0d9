/**
 * @file nodetree.cpp
 * @brief Implementation of the NodeTree arena
 */

#include "nodetree.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

NodeId NodeTree::addRoot(const std::string &path, NodeKind kind,
                         std::uintmax_t size) {
  if (!m_nodes.empty()) {
    throw std::logic_error("NodeTree already has a root");
  }

  TreeNode root;
  root.name = path;
  root.path = path;
  root.kind = kind;
  root.size = (kind == NodeKind::File) ? size : 0;
  // The root directory starts open so its top-level entries are displayed
  root.expanded = (kind == NodeKind::Directory);
  m_nodes.push_back(std::move(root));
  return 0;
}

NodeId NodeTree::addChild(NodeId parent, const std::string &name,
                          const std::string &path, NodeKind kind,
                          std::uintmax_t size) {
  if (!contains(parent)) {
    throw std::out_of_range("NodeTree::addChild: invalid parent id");
  }
  if (!m_nodes[parent].isDirectory()) {
    throw std::logic_error("NodeTree::addChild: parent is not a directory: " +
                           m_nodes[parent].path);
  }

  TreeNode child;
  child.name = name;
  child.path = path;
  child.kind = kind;
  child.size = (kind == NodeKind::File) ? size : 0;
  child.parent = parent;
  child.depth = m_nodes[parent].depth + 1;

  NodeId id = m_nodes.size();
  m_nodes.push_back(std::move(child));
  m_nodes[parent].children.push_back(id);
  return id;
}

void NodeTree::markInaccessible(NodeId id, const std::string &error) {
  TreeNode &n = m_nodes.at(id);
  n.accessible = false;
  n.error = error;
}

void NodeTree::sortChildren(
    const std::function<bool(const TreeNode &, const TreeNode &)> &less) {
  for (auto &n : m_nodes) {
    std::sort(n.children.begin(), n.children.end(),
              [this, &less](NodeId a, NodeId b) {
                return less(m_nodes[a], m_nodes[b]);
              });
  }
}

std::uintmax_t NodeTree::computeDirectorySizes() {
  if (m_nodes.empty())
    return 0;

  for (auto &n : m_nodes) {
    if (n.isDirectory())
      n.size = 0;
  }

  // Children always get larger ids than their parent, so a reverse sweep
  // sees every subtree complete before it is added upwards.
  for (NodeId id = m_nodes.size() - 1; id > 0; --id) {
    m_nodes[m_nodes[id].parent].size += m_nodes[id].size;
  }

  return m_nodes[0].size;
}

void NodeTree::setExpanded(NodeId id, bool expanded) {
  TreeNode &n = m_nodes.at(id);
  if (n.isDirectory())
    n.expanded = expanded;
}

void NodeTree::setVisualWeight(NodeId id, std::optional<double> weight) {
  m_nodes.at(id).visual_weight = weight;
}

bool NodeTree::isShown(NodeId id) const {
  if (!contains(id))
    return false;

  for (NodeId p = m_nodes[id].parent; p != kNoNode; p = m_nodes[p].parent) {
    if (!m_nodes[p].expanded)
      return false;
  }
  return true;
}

bool NodeTree::isDisplayedBlock(NodeId id) const {
  if (!isShown(id))
    return false;
  const TreeNode &n = m_nodes[id];
  return !n.expanded || n.children.empty();
}

void NodeTree::collectBlocks(NodeId id, std::vector<NodeId> &out) const {
  const TreeNode &n = m_nodes[id];
  if (!n.expanded || n.children.empty()) {
    out.push_back(id);
    return;
  }
  for (NodeId child : n.children) {
    collectBlocks(child, out);
  }
}

std::vector<NodeId> NodeTree::displayedBlocks() const {
  std::vector<NodeId> blocks;
  if (!m_nodes.empty())
    collectBlocks(0, blocks);
  return blocks;
}

std::vector<NodeId> NodeTree::ancestors(NodeId id) const {
  std::vector<NodeId> chain;
  for (NodeId p = m_nodes.at(id).parent; p != kNoNode; p = m_nodes[p].parent) {
    chain.push_back(p);
  }
  std::reverse(chain.begin(), chain.end());
  return chain;
}

NodeId NodeTree::nearestShownAncestor(NodeId id) const {
  NodeId current = id;
  while (current != kNoNode && !isShown(current)) {
    current = m_nodes[current].parent;
  }
  return current;
}

std::string NodeTree::pathString(NodeId id, bool with_suffix) const {
  const TreeNode &target = m_nodes.at(id);

  std::string result;
  for (NodeId a : ancestors(id)) {
    result += m_nodes[a].name;
    if (result.empty() ||
        result.back() != std::filesystem::path::preferred_separator) {
      result += std::filesystem::path::preferred_separator;
    }
  }
  result += target.name;

  if (with_suffix) {
    result += target.isDirectory() ? " (folder)" : " (file)";
  }
  return result;
}
