/**
 * @file nodetree.hpp
 * @brief Arena that owns every TreeNode of a scanned directory tree
 *
 * The NodeTree is built once by the TreeScanner and then lives for the
 * whole session. Afterwards only the display state of its nodes changes
 * (expanded flags and visual weights); the structure and the actual sizes
 * stay fixed.
 *
 * @see TreeNode
 * @see TreeScanner
 */

#ifndef DIRMAP_NODETREE_HPP
#define DIRMAP_NODETREE_HPP

#include <functional>
#include <string>
#include <vector>

#include "treenode.hpp"

/**
 * @class NodeTree
 * @brief Index-based tree of files and directories
 *
 * Nodes are stored in a flat vector and refer to each other by NodeId.
 * The root always has id 0 once created.
 *
 * Key features:
 * - Stable ids, no raw parent/child pointers
 * - Directory sizes accumulated bottom-up by computeDirectorySizes()
 * - Visibility queries for the displayed subset of the tree
 * - Path strings for the status area
 */
class NodeTree {
private:
  std::vector<TreeNode> m_nodes;

  void collectBlocks(NodeId id, std::vector<NodeId> &out) const;

public:
  NodeTree() = default;

  /**
   * @brief Creates the root node
   *
   * @param path Path as given by the user, also used as the root's name
   * @param kind File or directory
   * @param size Actual size of a file root (directories are summed later)
   * @return NodeId Always 0
   *
   * @throws std::logic_error if the tree already has a root
   */
  NodeId addRoot(const std::string &path, NodeKind kind,
                 std::uintmax_t size = 0);

  /**
   * @brief Appends a child to a directory node
   *
   * @param parent Directory receiving the child
   * @param name Last path component of the child
   * @param path Full path of the child
   * @param kind File or directory
   * @param size Actual size in bytes (ignored for directories, see
   *        computeDirectorySizes())
   * @return NodeId Id of the new node
   *
   * @throws std::out_of_range if parent is not a valid id
   * @throws std::logic_error if parent is a file
   */
  NodeId addChild(NodeId parent, const std::string &name,
                  const std::string &path, NodeKind kind,
                  std::uintmax_t size = 0);

  /**
   * @brief Marks a node as unreadable and records why
   */
  void markInaccessible(NodeId id, const std::string &error);

  /**
   * @brief Reorders the children of every directory
   *
   * @param less Strict weak ordering on nodes
   */
  void sortChildren(
      const std::function<bool(const TreeNode &, const TreeNode &)> &less);

  /**
   * @brief Sets every directory size to the sum of its children
   *
   * Runs bottom-up over the whole tree. Called once by the scanner after
   * all entries have been added.
   *
   * @return std::uintmax_t Size of the root
   */
  std::uintmax_t computeDirectorySizes();

  bool empty() const { return m_nodes.empty(); }
  std::size_t size() const { return m_nodes.size(); }
  NodeId root() const { return m_nodes.empty() ? kNoNode : 0; }
  bool contains(NodeId id) const { return id < m_nodes.size(); }

  /** @throws std::out_of_range for an invalid id */
  const TreeNode &node(NodeId id) const { return m_nodes.at(id); }

  // ===== Display state =====

  /** @brief Sets the expanded flag; ignored for files */
  void setExpanded(NodeId id, bool expanded);

  /** @brief Sets or clears (std::nullopt) the visual weight */
  void setVisualWeight(NodeId id, std::optional<double> weight);

  /**
   * @brief Returns true if every ancestor of the node is expanded
   *
   * The root is always shown.
   */
  bool isShown(NodeId id) const;

  /**
   * @brief Shown node drawn as a rectangle of its own
   *
   * True for shown nodes that are collapsed or have no children.
   */
  bool isDisplayedBlock(NodeId id) const;

  /**
   * @brief Lists the displayed blocks in depth-first order
   *
   * @return std::vector<NodeId> Empty for an empty tree
   */
  std::vector<NodeId> displayedBlocks() const;

  /**
   * @brief Ancestors of a node, from the root down to its parent
   */
  std::vector<NodeId> ancestors(NodeId id) const;

  /**
   * @brief Nearest shown node on the path from the node up to the root
   */
  NodeId nearestShownAncestor(NodeId id) const;

  /**
   * @brief Builds a display path such as "project/sub/b.txt (file)"
   *
   * Names are joined with the platform separator starting at the root;
   * the suffix " (file)" or " (folder)" is appended when with_suffix is set.
   */
  std::string pathString(NodeId id, bool with_suffix = true) const;
};

#endif // DIRMAP_NODETREE_HPP
