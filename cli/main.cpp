#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "appconfig.hpp"
#include "logging.hpp"
#include "nodetree.hpp"
#include "treemaplayout.hpp"
#include "treescanner.hpp"
#include "utils.hpp"

/**
 * @class Application
 * @brief Non-interactive report of a scanned directory tree
 *
 * Scans the configured root once and prints to standard output:
 *  - total size and number of entries,
 *  - every entry the scanner could not read,
 *  - an indented tree down to config.depth levels with the size of each
 *    entry and its share of the parent,
 *  - optionally (--layout WxH) the treemap rectangles of the top-level
 *    blocks, as the viewer would lay them out in a WxH cell grid.
 *
 * Error handling
 *  - ScanError propagates to main(), which prints it and exits with 1.
 */
class Application {
private:
  NodeTree m_tree;

public:
  void run(const AppConfig &config) {
    TreeScanner scanner(config.scan);

    std::cout << "Scan directory: " << config.root_path << std::endl;
    ScanResult result = scanner.scan(config.root_path);
    m_tree = std::move(result.tree);

    const TreeNode &root = m_tree.node(m_tree.root());
    std::cout << "Scan finished. " << result.entries << " Entries, "
              << formatBytes(root.size) << " (" << root.size << " Bytes)"
              << std::endl;

    showIssues(result.issues);

    std::cout << "\n--- Tree ---" << std::endl;
    printNode(m_tree.root(), 0, config.depth);

    if (config.layout_width > 0 && config.layout_height > 0) {
      showLayout(config.layout_width, config.layout_height);
    }
  }

private:
  void showIssues(const std::vector<ScanIssue> &issues) const {
    if (issues.empty())
      return;

    std::cout << "\n--- Unreadable entries ---" << std::endl;
    for (const auto &issue : issues) {
      std::cout << "⚠️ " << issue.path << ": " << issue.message << std::endl;
    }
    std::cout << "All unreadable entries: " << issues.size() << std::endl;
  }

  void printNode(NodeId id, int level, int max_depth) const {
    const TreeNode &node = m_tree.node(id);

    std::string share = "100.0%";
    if (node.parent != kNoNode) {
      share = formatShare(node.size, m_tree.node(node.parent).size);
    }

    std::cout << std::string(static_cast<std::size_t>(level) * 2, ' ')
              << node.name << (node.isDirectory() ? "/" : "") << "  "
              << formatBytes(node.size) << "  " << share
              << (node.accessible ? "" : "  [inaccessible]") << std::endl;

    if (level >= max_depth)
      return;
    for (NodeId child : node.children) {
      printNode(child, level + 1, max_depth);
    }
  }

  void showLayout(int width, int height) const {
    TreemapLayout layout_engine;
    LayoutResult layout =
        layout_engine.compute(m_tree, Rect{0, 0, width, height});

    std::cout << "\n--- Layout " << width << "x" << height << " ---"
              << std::endl;
    for (NodeId id : layout.blocks) {
      const Rect &r = layout.rects[id];
      std::cout << std::setw(5) << r.x << std::setw(5) << r.y
                << std::setw(5) << r.width << std::setw(5) << r.height
                << "  " << m_tree.pathString(id) << std::endl;
    }
  }
};

int main(int argc, char *argv[]) {
  AppConfig config;
  try {
    config = parseArguments(argc, argv);
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << "\n" << usage(argv[0]);
    return 1;
  }

  if (config.show_help) {
    std::cout << usage(argv[0]);
    return 0;
  }

  setupLogging(config);

  try {
    Application app;
    app.run(config);
  } catch (const ScanError &e) {
    spdlog::error("Scan failed: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
