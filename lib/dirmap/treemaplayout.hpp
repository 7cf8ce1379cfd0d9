/**
 * @file treemaplayout.hpp
 * @brief Slice-and-dice treemap layout over the displayed part of a NodeTree
 *
 * The layout works in integer cell coordinates. Each expanded directory
 * splits its rectangle among its children along the longer axis, in
 * proportion to the children's effective weights. Collapsed directories and
 * files are leaves ("displayed blocks").
 *
 * @see NodeTree
 * @see TreeNode::effectiveWeight()
 */

#ifndef DIRMAP_TREEMAPLAYOUT_HPP
#define DIRMAP_TREEMAPLAYOUT_HPP

#include <vector>

#include "nodetree.hpp"

/**
 * @struct Rect
 * @brief Half-open cell rectangle [x, x + width) x [y, y + height)
 */
struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool empty() const { return width <= 0 || height <= 0; }
  long long area() const {
    return empty() ? 0 : static_cast<long long>(width) * height;
  }
  bool contains(int px, int py) const {
    return px >= x && px < x + width && py >= y && py < y + height;
  }
  bool operator==(const Rect &other) const {
    return x == other.x && y == other.y && width == other.width &&
           height == other.height;
  }
  bool operator!=(const Rect &other) const { return !(*this == other); }
};

struct LayoutOptions {
  /**
   * @brief Height of one cell divided by its width
   *
   * 1.0 for square pixels; terminal cells are roughly twice as tall as
   * they are wide, which the UI passes as 2.0.
   */
  double cell_aspect = 1.0;
};

/**
 * @struct LayoutResult
 * @brief Rectangles for every node of one layout pass
 */
struct LayoutResult {
  /** @brief Indexed by NodeId; empty for nodes that are not shown */
  std::vector<Rect> rects;

  /** @brief Displayed blocks in paint order (depth-first) */
  std::vector<NodeId> blocks;

  Rect viewport;

  /**
   * @brief Finds the displayed block under a cell
   *
   * @return NodeId The block containing (x, y), or kNoNode on a miss
   */
  NodeId blockAt(int x, int y) const;

  /** @brief Rectangle of a node, or an empty Rect for unknown ids */
  Rect rectOf(NodeId id) const;
};

/**
 * @class TreemapLayout
 * @brief Computes nested rectangles for the displayed tree
 *
 * Algorithm (per expanded node):
 * 1. total = sum of the children's effective weights
 * 2. Split along the longer axis (height scaled by cell_aspect vs width)
 * 3. Every child but the last gets floor(extent * weight / total) cells
 * 4. The last child takes what remains, so siblings exactly partition
 *    their parent's rectangle
 */
class TreemapLayout {
private:
  LayoutOptions m_options;

  void place(const NodeTree &tree, NodeId id, const Rect &rect,
             LayoutResult &result) const;

public:
  explicit TreemapLayout(LayoutOptions options = {}) : m_options(options) {}

  /**
   * @brief Lays out the displayed part of the tree inside the viewport
   *
   * Only nodes reachable through expanded directories get a rectangle.
   * Zero-byte nodes take a kMinimumShare weight, so no division by zero
   * can happen.
   */
  LayoutResult compute(const NodeTree &tree, const Rect &viewport) const;
};

#endif // DIRMAP_TREEMAPLAYOUT_HPP
