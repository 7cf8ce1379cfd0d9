/**
 * @file treescanner.cpp
 * @brief Implementation of directory scanning into a NodeTree
 */

#include "treescanner.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

/**
 * @brief Scans a directory tree into a NodeTree
 *
 * Implementation flow:
 * 1. Checks the root with fs::status (follows a symlinked root)
 * 2. A regular file root yields a one-node tree
 * 3. Directories are listed from an explicit work list, so deep trees do
 *    not grow the call stack
 * 4. Directory sizes are summed bottom-up and children are sorted
 *
 * @see scanDirectory()
 * @see processEntry()
 */
ScanResult TreeScanner::scan(const fs::path &root,
                             ProgressCallback progress) const {
  std::error_code ec;
  fs::file_status status = fs::status(root, ec);
  if (ec) {
    throw ScanError("Cannot access '" + root.string() + "': " + ec.message());
  }
  if (!fs::exists(status)) {
    throw ScanError("Path does not exist: " + root.string());
  }

  spdlog::info("Scanning {}", root.string());

  ScanResult result;

  if (!fs::is_directory(status)) {
    std::uintmax_t size = 0;
    if (fs::is_regular_file(status)) {
      size = fs::file_size(root, ec);
      if (ec) {
        throw ScanError("Cannot read size of '" + root.string() +
                        "': " + ec.message());
      }
    }
    result.tree.addRoot(root.string(), NodeKind::File, size);
    result.entries = 1;
    if (progress)
      progress(result.entries);
    return result;
  }

  NodeId root_id = result.tree.addRoot(root.string(), NodeKind::Directory);

  std::vector<PendingDir> pending;
  pending.push_back({root_id, root});

  while (!pending.empty()) {
    PendingDir dir = std::move(pending.back());
    pending.pop_back();
    scanDirectory(dir, result, pending, progress);
  }

  std::uintmax_t total = result.tree.computeDirectorySizes();
  sortEntries(result.tree);

  // Final callback
  if (progress)
    progress(result.entries);

  spdlog::info("Scan finished: {} entries, {} bytes, {} issue(s)",
               result.entries, total, result.issues.size());
  return result;
}

void TreeScanner::scanDirectory(const PendingDir &dir, ScanResult &result,
                                std::vector<PendingDir> &pending,
                                const ProgressCallback &progress) const {
  std::error_code ec;
  fs::directory_iterator it(dir.path, ec);

  while (!ec && it != fs::directory_iterator()) {
    processEntry(*it, dir.id, result, pending);

    if (++result.entries % 100 == 0 && progress) { // Update every 100 items
      progress(result.entries);
    }

    it.increment(ec);
  }

  if (ec) {
    result.tree.markInaccessible(dir.id, ec.message());
    result.issues.push_back({dir.path.string(), ec.message()});
    spdlog::warn("Cannot list {}: {}", dir.path.string(), ec.message());
  }
}

/**
 * @brief Adds one directory entry to the tree
 *
 * Processing steps:
 * 1. Skip hidden names if configured
 * 2. Read the entry's own status (symlinks are not followed)
 * 3. Directories are added and queued for listing
 * 4. Regular files get their size; a failing size read marks the node
 *    inaccessible with size 0
 * 5. Symlinks and special files become files of size 0
 */
void TreeScanner::processEntry(const fs::directory_entry &entry,
                               NodeId parent, ScanResult &result,
                               std::vector<PendingDir> &pending) const {
  std::string name = entry.path().filename().string();
  if (!m_options.include_hidden && isHidden(name))
    return;

  std::error_code ec;
  fs::file_status status = entry.symlink_status(ec);
  if (ec) {
    NodeId id = result.tree.addChild(parent, name, entry.path().string(),
                                     NodeKind::File, 0);
    result.tree.markInaccessible(id, ec.message());
    result.issues.push_back({entry.path().string(), ec.message()});
    spdlog::warn("Cannot stat {}: {}", entry.path().string(), ec.message());
    return;
  }

  if (fs::is_directory(status)) {
    NodeId id = result.tree.addChild(parent, name, entry.path().string(),
                                     NodeKind::Directory);
    pending.push_back({id, entry.path()});
    return;
  }

  std::uintmax_t size = 0;
  bool size_failed = false;
  if (fs::is_regular_file(status)) {
    size = entry.file_size(ec);
    if (ec) {
      size = 0;
      size_failed = true;
    }
  }

  NodeId id = result.tree.addChild(parent, name, entry.path().string(),
                                   NodeKind::File, size);
  if (size_failed) {
    result.tree.markInaccessible(id, ec.message());
    result.issues.push_back({entry.path().string(), ec.message()});
    spdlog::warn("Cannot read size of {}: {}", entry.path().string(),
                 ec.message());
  }
}

/**
 * @brief Sorts the children of every directory
 *
 * Name order keeps the file manager convention: directories before files,
 * alphabetical within each group. Size order puts the largest entries
 * first so the biggest blocks land at the top-left of the treemap.
 */
void TreeScanner::sortEntries(NodeTree &tree) const {
  if (m_options.sort == SortOrder::SizeDescending) {
    tree.sortChildren([](const TreeNode &a, const TreeNode &b) {
      if (a.size != b.size)
        return a.size > b.size;
      return a.name < b.name;
    });
    return;
  }

  tree.sortChildren([](const TreeNode &a, const TreeNode &b) {
    // Directories before files
    if (a.isDirectory() != b.isDirectory()) {
      return a.isDirectory();
    }

    // Alphabetical by name
    return a.name < b.name;
  });
}
