/**
 * @file treenode.hpp
 * @brief Node record stored in the NodeTree arena
 *
 * A TreeNode describes one file or directory found by the scanner together
 * with its display state (expanded flag, visual weight). Nodes reference
 * each other by NodeId, an index into the owning NodeTree.
 *
 * @see NodeTree
 */

#ifndef DIRMAP_TREENODE_HPP
#define DIRMAP_TREENODE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/** @brief Stable index of a node inside a NodeTree */
using NodeId = std::size_t;

/** @brief Sentinel for "no node" (root parent, empty selection, missed hit) */
inline constexpr NodeId kNoNode = static_cast<NodeId>(-1);

/**
 * @brief Share used for nodes without a visual weight and with zero bytes
 *
 * Keeps every sibling's weight strictly positive so the layout never
 * divides by zero.
 */
inline constexpr double kMinimumShare = 1e-3;

/** @brief Lower bound for a visual weight set by the shrink command */
inline constexpr double kMinimumWeight = 1.0;

enum class NodeKind { File, Directory };

struct TreeNode {
  /** @brief Last path component (the root keeps the path as given) */
  std::string name;

  /** @brief Full filesystem path */
  std::string path;

  NodeKind kind = NodeKind::File;

  /** @brief Actual size in bytes, fixed once the scan is complete */
  std::uintmax_t size = 0;

  /** @brief Display-only weight; unset means "use the actual size" */
  std::optional<double> visual_weight;

  bool expanded = false;

  /** @brief False when the scanner could not read this entry */
  bool accessible = true;
  std::string error;

  NodeId parent = kNoNode;
  std::vector<NodeId> children;
  int depth = 0;

  bool isDirectory() const { return kind == NodeKind::Directory; }
  bool isFile() const { return kind == NodeKind::File; }
  bool hasChildren() const { return !children.empty(); }

  /**
   * @brief Weight used when splitting the parent's rectangle
   *
   * @return visual_weight if set, otherwise the actual size clamped to
   *         kMinimumShare. Always greater than zero.
   */
  double effectiveWeight() const {
    if (visual_weight)
      return *visual_weight;
    double bytes = static_cast<double>(size);
    return bytes > kMinimumShare ? bytes : kMinimumShare;
  }
};

#endif // DIRMAP_TREENODE_HPP
