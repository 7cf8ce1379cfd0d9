/**
 * @file viewsession.hpp
 * @brief Selection state and display commands of an interactive treemap
 *
 * ViewSession is the interaction state machine of the viewer. It owns the
 * current selection and changes the display flags (expanded, visual
 * weight) of the NodeTree it works on. It has no UI dependency, so every
 * command can be exercised from tests.
 *
 * Every command returns true if the display changed and the caller has to
 * lay out and render again; false means the input was a no-op (no
 * selection, file instead of directory, already in that state, ...).
 *
 * @see NodeTree
 * @see TreemapUI
 */

#ifndef DIRMAP_VIEWSESSION_HPP
#define DIRMAP_VIEWSESSION_HPP

#include <string>

#include "nodetree.hpp"
#include "treemaplayout.hpp"

struct SessionOptions {
  /** @brief Relative change applied by grow/shrink (0.10 = 10 %) */
  double grow_step = 0.10;
};

/**
 * @class ViewSession
 * @brief Interaction handler for one scanned tree
 *
 * Weight policy: visual weights survive collapse/expand cycles; only
 * resetWeightSelected() drops them.
 *
 * Selection policy: whenever a collapse hides the selected node, the
 * selection moves to its nearest shown ancestor.
 */
class ViewSession {
private:
  NodeTree &m_tree;
  SessionOptions m_options;

  /** @brief Currently selected node, kNoNode when nothing is selected */
  NodeId m_selected = kNoNode;

  bool collapseSubtree(NodeId id);
  bool expandSubtree(NodeId id);
  void keepSelectionShown();

public:
  explicit ViewSession(NodeTree &tree, SessionOptions options = {});

  NodeId selected() const { return m_selected; }
  bool hasSelection() const { return m_selected != kNoNode; }

  // ===== Selection =====

  /**
   * @brief Selects the block under a cell of the last layout
   *
   * @return true if the selection changed; false on a miss or when the
   *         block was already selected
   */
  bool click(const LayoutResult &layout, int x, int y);

  /** @brief Selects any node of the tree; false for an invalid id */
  bool select(NodeId id);

  void clearSelection() { m_selected = kNoNode; }

  /** @brief Moves the selection to the next displayed block (wraps) */
  bool selectNext();

  /** @brief Moves the selection to the previous displayed block (wraps) */
  bool selectPrevious();

  // ===== Visual weight =====

  /**
   * @brief Enlarges the selected node among its siblings
   *
   * weight += ceil(weight * grow_step), starting from the effective weight
   * when no visual weight was set. No-op for the root, which has no
   * siblings.
   */
  bool growSelected();

  /**
   * @brief Shrinks the selected node among its siblings
   *
   * weight -= ceil(weight * grow_step), applied only if the result stays at
   * or above kMinimumWeight, so a block never vanishes.
   */
  bool shrinkSelected();

  /** @brief Drops the visual weight of the selected node */
  bool resetWeightSelected();

  // ===== Expand / collapse =====

  /** @brief Expands the selected directory one level; no-op on files */
  bool expandSelected();

  /**
   * @brief Expands every ancestor of the selection, and the selection
   *        itself if it is a directory
   */
  bool expandPathToSelected();

  /**
   * @brief Expands the selection's ancestors and every directory below it
   */
  bool expandSubtreeSelected();

  /**
   * @brief Collapses the selected directory and all directories below it
   *
   * No-op on files and on directories that are already collapsed.
   */
  bool collapseSelected();

  /**
   * @brief Folds the selection back into its parent directory
   *
   * The parent is collapsed and becomes the selection. No-op for top-level
   * entries and the root.
   */
  bool collapseParentOfSelected();

  /**
   * @brief Collapses every directory except the root
   *
   * Afterwards exactly the root's top-level entries are displayed.
   */
  bool collapseAll();

  // ===== Status =====

  /**
   * @brief One-line description of the selection for the status area
   *
   * Format: "<path> (file|folder)  <size>", followed by "  view xN.NN" when
   * a visual weight is set and "  [inaccessible: reason]" for unreadable
   * nodes. "No selection" when nothing is selected.
   */
  std::string statusText() const;
};

#endif // DIRMAP_VIEWSESSION_HPP
