/**
 * @file treemapui.cpp
 * @brief Implementation of the TreemapUI class
 *
 * Key implementation areas:
 * - Synchronous scan before the event loop
 * - Treemap panel sized from the terminal, laid out lazily
 * - Conversion of TreemapFrame cells to FTXUI elements
 * - Mouse and keyboard dispatch to ViewSession commands
 *
 * @see TreemapUI
 * @see treemapui.hpp
 */

#include "treemapui.hpp"

#include <algorithm>
#include <cctype>

#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>

#include "treescanner.hpp"
#include "utils.hpp"

namespace {

/** @brief Rows taken by the menu, separator, panel border, help and status */
constexpr int RESERVED_ROWS = 6;

/** @brief Columns taken by the panel border */
constexpr int RESERVED_COLUMNS = 2;

/** @brief Terminal cells are about twice as tall as wide */
constexpr double TERMINAL_CELL_ASPECT = 2.0;

Color toColor(Rgb rgb) { return Color::RGB(rgb.r, rgb.g, rgb.b); }

bool sameStyle(const FrameCell &a, const FrameCell &b) {
  return a.foreground == b.foreground && a.background == b.background &&
         a.bold == b.bold && a.inverted == b.inverted;
}

Element styledRun(const std::string &content, const FrameCell &style) {
  Element run = text(content) | color(toColor(style.foreground)) |
                bgcolor(toColor(style.background));
  if (style.bold)
    run = run | bold;
  if (style.inverted)
    run = run | inverted;
  return run;
}

} // namespace

TreemapUI::TreemapUI(const AppConfig &config)
    : m_config(config), m_session(m_tree, SessionOptions{config.grow_step}),
      m_layout_engine(LayoutOptions{TERMINAL_CELL_ASPECT}),
      m_renderer(RendererOptions{config.color_mode}) {}

TreemapUI::~TreemapUI() {
  // FTXUI leaves the alternate screen on exit; printing afterwards keeps
  // the last status visible in the normal terminal.
  std::cout << "dirmap terminated. Final status: " << m_current_status
            << std::endl;
}

// ============================================================================
// UI SETUP
// ============================================================================

/**
 * @brief Scans the tree and builds the components
 *
 * Order:
 * 1. loadTree() - synchronous scan with progress on stderr
 * 2. setupTopMenu() - menu bar from ActionMap
 * 3. setupMapView() - treemap panel
 * 4. setupMainLayout() - vertical arrangement with help and status lines
 */
void TreemapUI::initialize() {
  loadTree();
  setupTopMenu();
  setupMapView();
  setupMainLayout();
}

void TreemapUI::loadTree() {
  std::cerr << "Scanning " << m_config.root_path << " ..." << std::endl;

  try {
    TreeScanner scanner(m_config.scan);
    ScanResult result =
        scanner.scan(m_config.root_path, [](std::size_t count) {
          std::cerr << "\r" << count << " entries" << std::flush;
        });
    std::cerr << std::endl;

    m_tree = std::move(result.tree);
    m_current_status = "Loaded " + std::to_string(result.entries) +
                       " entries, " +
                       formatBytes(m_tree.node(m_tree.root()).size);
    if (!result.issues.empty()) {
      m_current_status +=
          ", " + std::to_string(result.issues.size()) + " unreadable";
    }
  } catch (const ScanError &e) {
    spdlog::error("Scan failed: {}", e.what());
    m_current_status = "Error: " + std::string(e.what());
  }

  m_needs_layout = true;
}

/**
 * @brief Initializes the top menu bar
 *
 * Enter on a menu item executes the action, the same as its shortcut.
 */
void TreemapUI::setupTopMenu() {
  m_menu_entries = ::getMenuEntries(); // from uicontrol.hpp
  m_menu_actions = ::getMenuActions();
  m_top_menu =
      Menu(&m_menu_entries, &m_top_menu_selected, MenuOption::Horizontal());

  m_top_menu = m_top_menu | CatchEvent([this](Event event) {
                 if (event == Event::Return) {
                   return executeAction(
                       getActionIdByIndex(m_top_menu_selected));
                 }
                 return false;
               });
}

/**
 * @brief Creates the treemap panel
 *
 * The panel fills the terminal below the menu bar. Its size is derived
 * from Terminal::Size() on every render so a resize lays the map out
 * again.
 */
void TreemapUI::setupMapView() {
  m_map_view = Renderer([this] {
    auto terminal = Terminal::Size();
    int width = std::max(1, terminal.dimx - RESERVED_COLUMNS);
    int height = std::max(1, terminal.dimy - RESERVED_ROWS);

    refreshFrame(width, height);

    std::string title = m_tree.empty() ? m_config.root_path
                                       : m_tree.node(m_tree.root()).path;
    return window(text(" " + title + " ") | bold | color(Color::Green),
                  frameToElement() | reflect(m_map_box));
  });
}

void TreemapUI::setupMainLayout() {
  m_document = Container::Vertical(
      {m_top_menu, Renderer([] { return separator(); }), m_map_view | flex,
       Renderer([] { return text(KEY_HELP) | color(Color::Cyan) | hcenter; }),
       Renderer([this] {
         return text("STATUS: " + m_current_status) |
                color(Color::GrayLight) | hcenter;
       })});
}

// ============================================================================
// RENDERING
// ============================================================================

void TreemapUI::refreshFrame(int width, int height) {
  if (m_needs_layout || m_layout.viewport.width != width ||
      m_layout.viewport.height != height) {
    m_layout = m_layout_engine.compute(m_tree, Rect{0, 0, width, height});
    m_needs_layout = false;
  }
  m_frame = m_renderer.render(m_tree, m_layout, m_session.selected());
}

Element TreemapUI::frameToElement() const {
  if (m_frame.cells.empty() || m_tree.empty()) {
    return text("Nothing to display") | color(Color::GrayDark) | center |
           flex;
  }

  Elements rows;
  rows.reserve(static_cast<std::size_t>(m_frame.height));

  for (int y = 0; y < m_frame.height; ++y) {
    Elements runs;
    std::string content;
    const FrameCell *style = &m_frame.at(0, y);

    for (int x = 0; x < m_frame.width; ++x) {
      const FrameCell &cell = m_frame.at(x, y);
      if (!sameStyle(cell, *style)) {
        runs.push_back(styledRun(content, *style));
        content.clear();
        style = &cell;
      }
      content += cell.glyph;
    }
    runs.push_back(styledRun(content, *style));
    rows.push_back(hbox(std::move(runs)));
  }

  return vbox(std::move(rows));
}

// ============================================================================
// MAIN LOOP
// ============================================================================

/**
 * @brief Starts the main UI event loop
 *
 * The global handler sees every event before the components:
 * - Left click on the panel: select block
 * - Up/Down: grow/shrink the selection
 * - Tab/Shift+Tab: cycle through blocks
 * - Characters: handleGlobalShortcut()
 */
void TreemapUI::run() {
  auto global_handler = CatchEvent(m_document, [this](Event event) {
    if (event.is_mouse()) {
      return handleMouse(event);
    }
    if (event == Event::ArrowUp) {
      return applyCommand(m_session.growSelected(),
                          "This block has no siblings to grow against.");
    }
    if (event == Event::ArrowDown) {
      return applyCommand(m_session.shrinkSelected(),
                          "Block is at its minimum size.");
    }
    if (event == Event::Tab) {
      return applyCommand(m_session.selectNext(), "Nothing to select.");
    }
    if (event == Event::TabReverse) {
      return applyCommand(m_session.selectPrevious(), "Nothing to select.");
    }
    if (event.is_character()) {
      return handleGlobalShortcut(event.character()[0]);
    }
    return false;
  });

  m_screen.Loop(global_handler);
}

bool TreemapUI::handleMouse(Event event) {
  const Mouse &mouse = event.mouse();
  if (mouse.button != Mouse::Left || mouse.motion != Mouse::Pressed)
    return false;
  if (!m_map_box.Contain(mouse.x, mouse.y))
    return false;

  int x = mouse.x - m_map_box.x_min;
  int y = mouse.y - m_map_box.y_min;
  if (m_session.click(m_layout, x, y)) {
    m_current_status = m_session.statusText();
  }
  return true;
}

bool TreemapUI::applyCommand(bool changed, const std::string &noop_message) {
  if (changed) {
    m_needs_layout = true;
    m_current_status = m_session.statusText();
  } else if (!m_session.hasSelection()) {
    m_current_status = "No selection. Click a block or press Tab.";
  } else {
    m_current_status = noop_message;
  }
  return true;
}

// ============================================================================
// KEYBOARD SHORTCUTS AND ACTIONS
// ============================================================================

ActionID TreemapUI::getActionIdByIndex(int index) {
  const ActionID *action = safe_at(m_menu_actions, index);
  return action ? *action : ActionID::Quit; // Fallback for an invalid index
}

bool TreemapUI::executeAction(ActionID action) {
  switch (action) {
  case ActionID::Quit:
    m_screen.Exit();
    return true;

  case ActionID::Expand:
    return applyCommand(m_session.expandSelected(),
                        "Only collapsed folders can be expanded.");

  case ActionID::ExpandPath:
    return applyCommand(m_session.expandPathToSelected(),
                        "Path is already expanded.");

  case ActionID::ExpandSubtree:
    return applyCommand(m_session.expandSubtreeSelected(),
                        "Subtree is already expanded.");

  case ActionID::Collapse:
    return applyCommand(m_session.collapseSelected(),
                        "Only expanded folders can be collapsed.");

  case ActionID::CollapseParent:
    return applyCommand(m_session.collapseParentOfSelected(),
                        "Already at the top level.");

  case ActionID::CollapseAll: {
    bool changed = m_session.collapseAll();
    if (changed)
      m_needs_layout = true;
    m_current_status = changed ? "Collapsed to top level. " +
                                     m_session.statusText()
                               : "Already collapsed.";
    return true;
  }

  case ActionID::ResetWeight:
    return applyCommand(m_session.resetWeightSelected(),
                        "Block has its actual size.");
  }
  return false;
}

/**
 * @brief Handles global keyboard shortcuts
 *
 * Looks the key up in ActionMap (case-insensitive, so 'E' and 'e' both
 * expand) and executes the action.
 */
bool TreemapUI::handleGlobalShortcut(char key_pressed) {
  char key = static_cast<char>(
      std::tolower(static_cast<unsigned char>(key_pressed)));

  for (const auto &pair : ActionMap) {
    if (key == pair.second.m_shortcut) {
      return executeAction(pair.first);
    }
  }
  return false;
}
