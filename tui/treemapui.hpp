/**
 * @file treemapui.hpp
 * @brief Terminal treemap viewer using FTXUI
 *
 * This header defines the TreemapUI class: a full-screen terminal UI that
 * shows a scanned directory tree as a treemap, lets the user select blocks
 * with the mouse or Tab, and dispatches the resize and expand/collapse
 * commands of ViewSession.
 *
 * Layout of the screen:
 * - Top menu bar with the character-key actions
 * - Treemap panel (one terminal cell per layout unit)
 * - Key help line and status line
 *
 * @see ViewSession
 * @see TreemapLayout
 * @see TreemapRenderer
 */

#ifndef DIRMAP_TREEMAPUI_HPP
#define DIRMAP_TREEMAPUI_HPP

#include "appconfig.hpp"
#include "nodetree.hpp"
#include "treemaplayout.hpp"
#include "treemaprenderer.hpp"
#include "uicontrol.hpp"
#include "viewsession.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <iostream>

using namespace ftxui;

/**
 * @class TreemapUI
 * @brief Interactive treemap of one directory tree
 *
 * Architecture:
 * - Single thread: the tree is scanned before the event loop starts
 * - Lazy layout: the treemap is laid out again only when a command
 *   changed the display state or the panel size changed
 * - The FTXUI layer only converts TreemapFrame cells to elements and
 *   events to ViewSession commands
 */
class TreemapUI {
private:
  // ===== Model =====

  AppConfig m_config;

  /** @brief Scanned tree, empty if the scan failed */
  NodeTree m_tree;

  /** @brief Selection and display commands on m_tree */
  ViewSession m_session;

  TreemapLayout m_layout_engine;
  TreemapRenderer m_renderer;

  // ===== Render cache =====

  /** @brief Last layout, used for hit testing mouse clicks */
  LayoutResult m_layout;

  /** @brief Last rendered frame */
  TreemapFrame m_frame;

  /** @brief Set by commands that change the display state */
  bool m_needs_layout = true;

  /** @brief Screen area of the treemap cells, updated on every render */
  Box m_map_box;

  // ===== UI Components =====

  /** @brief Top menu bar component */
  Component m_top_menu;

  /** @brief Treemap panel component */
  Component m_map_view;

  /** @brief Document/content area component */
  Component m_document;

  /** @brief Current status message displayed in the UI */
  std::string m_current_status = "Ready.";

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  /** @brief Menu entry labels for the top menu */
  std::vector<std::string> m_menu_entries;

  /** @brief Action of each menu entry, same order as m_menu_entries */
  std::vector<ActionID> m_menu_actions;

  // ===== Setup =====

  /**
   * @brief Scans the configured root into m_tree
   *
   * A failed scan leaves the tree empty and puts the error in the status
   * line; the UI still starts.
   */
  void loadTree();

  void setupTopMenu();
  void setupMapView();
  void setupMainLayout();

  // ===== Rendering =====

  /**
   * @brief Lays out and renders again if needed
   *
   * @param width Panel width in cells
   * @param height Panel height in cells
   */
  void refreshFrame(int width, int height);

  /**
   * @brief Converts m_frame to FTXUI elements
   *
   * Consecutive cells with identical style are merged into one text
   * element per run.
   */
  Element frameToElement() const;

  // ===== Events =====

  /**
   * @brief Handles a mouse event on the treemap panel
   *
   * @return true if the event was a left click inside the panel
   */
  bool handleMouse(Event event);

  /**
   * @brief Runs a ViewSession command result through the UI
   *
   * Marks the layout dirty and refreshes the status line if the command
   * changed something.
   */
  bool applyCommand(bool changed, const std::string &noop_message);

  /**
   * @brief Executes one action of the ActionMap
   */
  bool executeAction(ActionID action);

  ActionID getActionIdByIndex(int index);

public:
  /** @brief Index of currently selected item in the top menu bar */
  int m_top_menu_selected = 0;

  explicit TreemapUI(const AppConfig &config);

  /**
   * @brief Destructor for TreemapUI
   *
   * Prints the final status once the terminal is restored.
   */
  ~TreemapUI();

  /**
   * @brief Scans the tree and builds the components
   *
   * Must be called before run().
   */
  void initialize();

  /**
   * @brief Handles global keyboard shortcuts
   *
   * @param key The character code of the pressed key (case-insensitive)
   * @return true if the shortcut was handled, false if not recognized
   */
  bool handleGlobalShortcut(char key);

  /**
   * @brief Starts the main UI event loop
   *
   * Blocks until the user quits.
   */
  void run();
};

#endif // DIRMAP_TREEMAPUI_HPP
