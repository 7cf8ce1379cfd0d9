/**
 * @file uicontrol.hpp
 * @brief UI action definitions and keyboard shortcut mappings
 *
 * This header defines the action system for the treemap viewer: action
 * identifiers, their single-character shortcuts and the menu titles shown
 * in the top bar. Keys without a character (arrows, Tab) are handled
 * directly by TreemapUI and only appear in the help line.
 *
 * @see ActionID
 * @see ActionInfo
 * @see ActionMap
 */

#ifndef DIRMAP_UI_CONTROL_HPP
#define DIRMAP_UI_CONTROL_HPP

#include <map>
#include <string>
#include <vector>

/**
 * @struct ActionInfo
 * @brief Information about a UI action including shortcut and menu title
 */
struct ActionInfo {
  /** @brief Single character keyboard shortcut (lower case, matched
   *         case-insensitively) */
  char m_shortcut;

  /** @brief Formatted menu title string including shortcut hint (e.g., "(q) Quit") */
  std::string m_menu_title;
};

/**
 * @enum ActionID
 * @brief Enumeration of the character-key actions of the viewer
 */
enum class ActionID {
  /** @brief Show the selected directory's children (shortcut: 'e') */
  Expand,

  /** @brief Expand every directory from the root to the selection (shortcut: 'a') */
  ExpandPath,

  /** @brief Expand every directory below the selection (shortcut: 's') */
  ExpandSubtree,

  /** @brief Hide the selected directory's children (shortcut: 'c') */
  Collapse,

  /** @brief Fold the selection back into its parent (shortcut: 'p') */
  CollapseParent,

  /** @brief Show only the top-level entries (shortcut: 'x') */
  CollapseAll,

  /** @brief Drop the selection's visual weight (shortcut: 'r') */
  ResetWeight,

  /** @brief Quit the application (shortcut: 'q') */
  Quit
};

/**
 * @brief Global mapping of actions to their shortcuts and menu titles
 *
 * Used to dispatch key presses, to build the top menu and to map a menu
 * index back to its action.
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::Expand, {'e', "(e) Expand"}},
    {ActionID::ExpandPath, {'a', "(a) Expand Path"}},
    {ActionID::ExpandSubtree, {'s', "(s) Expand Subtree"}},
    {ActionID::Collapse, {'c', "(c) Collapse"}},
    {ActionID::CollapseParent, {'p', "(p) Collapse Parent"}},
    {ActionID::CollapseAll, {'x', "(x) Collapse All"}},
    {ActionID::ResetWeight, {'r', "(r) Reset Size"}},
    {ActionID::Quit, {'q', "(q) Quit"}}};

/** @brief Help line for the keys that are not in the menu */
inline const std::string KEY_HELP =
    "Click: select   Tab/Shift+Tab: next/previous   Up/Down: grow/shrink";

/**
 * @brief Extracts menu entry strings from the ActionMap
 *
 * @return std::vector<std::string> Menu titles in ActionID order
 */
inline std::vector<std::string> getMenuEntries() {
  std::vector<std::string> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    entries.push_back(info.m_menu_title);
  }
  return entries;
}

/**
 * @brief Actions in menu order, so a menu index maps back to its ActionID
 */
inline std::vector<ActionID> getMenuActions() {
  std::vector<ActionID> actions;
  actions.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    actions.push_back(id);
  }
  return actions;
}

#endif // DIRMAP_UI_CONTROL_HPP
