/**
 * @file viewsession.cpp
 * @brief Implementation of the treemap interaction handler
 */

#include "viewsession.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <spdlog/spdlog.h>

#include "utils.hpp"

ViewSession::ViewSession(NodeTree &tree, SessionOptions options)
    : m_tree(tree), m_options(options) {}

// ============================================================================
// SELECTION
// ============================================================================

bool ViewSession::click(const LayoutResult &layout, int x, int y) {
  NodeId hit = layout.blockAt(x, y);
  if (hit == kNoNode || hit == m_selected)
    return false;

  m_selected = hit;
  spdlog::debug("Selected {}", m_tree.node(hit).path);
  return true;
}

bool ViewSession::select(NodeId id) {
  if (!m_tree.contains(id) || id == m_selected)
    return false;
  m_selected = id;
  return true;
}

bool ViewSession::selectNext() {
  std::vector<NodeId> blocks = m_tree.displayedBlocks();
  if (blocks.empty())
    return false;

  auto it = std::find(blocks.begin(), blocks.end(), m_selected);
  if (it == blocks.end() || ++it == blocks.end())
    it = blocks.begin();
  return select(*it);
}

bool ViewSession::selectPrevious() {
  std::vector<NodeId> blocks = m_tree.displayedBlocks();
  if (blocks.empty())
    return false;

  auto it = std::find(blocks.begin(), blocks.end(), m_selected);
  if (it == blocks.end() || it == blocks.begin())
    it = blocks.end();
  return select(*(--it));
}

// ============================================================================
// VISUAL WEIGHT
// ============================================================================

bool ViewSession::growSelected() {
  if (m_selected == kNoNode || m_selected == m_tree.root())
    return false;

  double weight = m_tree.node(m_selected).effectiveWeight();
  weight += std::ceil(weight * m_options.grow_step);
  m_tree.setVisualWeight(m_selected, weight);

  spdlog::debug("Grow {} to weight {}", m_tree.node(m_selected).path, weight);
  return true;
}

bool ViewSession::shrinkSelected() {
  if (m_selected == kNoNode || m_selected == m_tree.root())
    return false;

  double weight = m_tree.node(m_selected).effectiveWeight();
  double shrunk = weight - std::ceil(weight * m_options.grow_step);
  if (shrunk < kMinimumWeight)
    return false;

  m_tree.setVisualWeight(m_selected, shrunk);
  spdlog::debug("Shrink {} to weight {}", m_tree.node(m_selected).path,
                shrunk);
  return true;
}

bool ViewSession::resetWeightSelected() {
  if (m_selected == kNoNode || !m_tree.node(m_selected).visual_weight)
    return false;

  m_tree.setVisualWeight(m_selected, std::nullopt);
  return true;
}

// ============================================================================
// EXPAND / COLLAPSE
// ============================================================================

bool ViewSession::expandSelected() {
  if (m_selected == kNoNode)
    return false;

  const TreeNode &node = m_tree.node(m_selected);
  if (!node.isDirectory() || node.expanded)
    return false;

  m_tree.setExpanded(m_selected, true);
  spdlog::debug("Expand {}", node.path);
  return true;
}

bool ViewSession::expandPathToSelected() {
  if (m_selected == kNoNode)
    return false;

  bool changed = false;
  for (NodeId a : m_tree.ancestors(m_selected)) {
    if (!m_tree.node(a).expanded) {
      m_tree.setExpanded(a, true);
      changed = true;
    }
  }

  const TreeNode &node = m_tree.node(m_selected);
  if (node.isDirectory() && !node.expanded) {
    m_tree.setExpanded(m_selected, true);
    changed = true;
  }

  if (changed)
    spdlog::debug("Expand path to {}", node.path);
  return changed;
}

bool ViewSession::expandSubtree(NodeId id) {
  bool changed = false;
  const TreeNode &node = m_tree.node(id);
  if (node.isDirectory() && !node.expanded) {
    m_tree.setExpanded(id, true);
    changed = true;
  }
  for (NodeId child : node.children) {
    changed = expandSubtree(child) || changed;
  }
  return changed;
}

bool ViewSession::expandSubtreeSelected() {
  if (m_selected == kNoNode)
    return false;

  bool changed = false;
  for (NodeId a : m_tree.ancestors(m_selected)) {
    if (!m_tree.node(a).expanded) {
      m_tree.setExpanded(a, true);
      changed = true;
    }
  }
  changed = expandSubtree(m_selected) || changed;
  return changed;
}

bool ViewSession::collapseSubtree(NodeId id) {
  bool changed = false;
  const TreeNode &node = m_tree.node(id);
  if (node.expanded) {
    m_tree.setExpanded(id, false);
    changed = true;
  }
  for (NodeId child : node.children) {
    changed = collapseSubtree(child) || changed;
  }
  return changed;
}

void ViewSession::keepSelectionShown() {
  if (m_selected != kNoNode && !m_tree.isShown(m_selected))
    m_selected = m_tree.nearestShownAncestor(m_selected);
}

bool ViewSession::collapseSelected() {
  if (m_selected == kNoNode)
    return false;

  const TreeNode &node = m_tree.node(m_selected);
  if (!node.isDirectory() || !node.expanded)
    return false;

  collapseSubtree(m_selected);
  keepSelectionShown();
  spdlog::debug("Collapse {}", node.path);
  return true;
}

bool ViewSession::collapseParentOfSelected() {
  if (m_selected == kNoNode)
    return false;

  NodeId parent = m_tree.node(m_selected).parent;
  if (parent == kNoNode || parent == m_tree.root())
    return false;

  collapseSubtree(parent);
  m_selected = parent;
  keepSelectionShown();
  spdlog::debug("Collapse into {}", m_tree.node(parent).path);
  return true;
}

bool ViewSession::collapseAll() {
  if (m_tree.empty())
    return false;

  NodeId root = m_tree.root();
  bool changed = false;
  for (NodeId child : m_tree.node(root).children) {
    changed = collapseSubtree(child) || changed;
  }
  if (m_tree.node(root).isDirectory() && !m_tree.node(root).expanded) {
    m_tree.setExpanded(root, true);
    changed = true;
  }

  keepSelectionShown();
  if (changed)
    spdlog::debug("Collapse all");
  return changed;
}

// ============================================================================
// STATUS
// ============================================================================

std::string ViewSession::statusText() const {
  if (m_selected == kNoNode)
    return "No selection";

  const TreeNode &node = m_tree.node(m_selected);
  std::string text =
      m_tree.pathString(m_selected) + "  " + formatBytes(node.size);

  if (node.visual_weight) {
    double base = std::max(static_cast<double>(node.size), kMinimumShare);
    char buf[32];
    snprintf(buf, sizeof(buf), "  view x%.2f", *node.visual_weight / base);
    text += buf;
  }

  if (!node.accessible)
    text += "  [inaccessible: " + node.error + "]";

  return text;
}
