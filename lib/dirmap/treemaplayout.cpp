/**
 * @file treemaplayout.cpp
 * @brief Implementation of the slice-and-dice treemap layout
 */

#include "treemaplayout.hpp"

#include <algorithm>
#include <cmath>

NodeId LayoutResult::blockAt(int x, int y) const {
  for (NodeId id : blocks) {
    if (rects[id].contains(x, y))
      return id;
  }
  return kNoNode;
}

Rect LayoutResult::rectOf(NodeId id) const {
  if (id >= rects.size())
    return Rect{};
  return rects[id];
}

LayoutResult TreemapLayout::compute(const NodeTree &tree,
                                    const Rect &viewport) const {
  LayoutResult result;
  result.viewport = viewport;
  result.rects.assign(tree.size(), Rect{});

  if (tree.empty())
    return result;

  place(tree, tree.root(), viewport, result);
  result.blocks = tree.displayedBlocks();
  return result;
}

void TreemapLayout::place(const NodeTree &tree, NodeId id, const Rect &rect,
                          LayoutResult &result) const {
  result.rects[id] = rect;

  const TreeNode &node = tree.node(id);
  if (!node.expanded || node.children.empty())
    return;

  double total = 0.0;
  for (NodeId child : node.children) {
    total += tree.node(child).effectiveWeight();
  }

  bool stack_rows = rect.height * m_options.cell_aspect >= rect.width;
  int length = stack_rows ? rect.height : rect.width;
  int offset = 0;

  for (std::size_t i = 0; i < node.children.size(); ++i) {
    NodeId child = node.children[i];
    int remaining = std::max(0, length - offset);

    int extent = remaining;
    if (i + 1 < node.children.size()) {
      double share = tree.node(child).effectiveWeight() / total;
      extent = std::min(remaining,
                        static_cast<int>(std::floor(share * length)));
    }

    Rect slice = rect;
    if (stack_rows) {
      slice.y = rect.y + offset;
      slice.height = extent;
    } else {
      slice.x = rect.x + offset;
      slice.width = extent;
    }

    place(tree, child, slice, result);
    offset += extent;
  }
}
