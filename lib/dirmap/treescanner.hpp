/**
 * @file treescanner.hpp
 * @brief Directory traversal that builds the NodeTree
 *
 * This header defines the TreeScanner class which walks a root path once
 * and records every file and directory with its size. Unreadable entries
 * are kept in the tree, marked inaccessible, and reported as ScanIssue
 * records; they never abort the scan.
 */

#ifndef DIRMAP_TREESCANNER_HPP
#define DIRMAP_TREESCANNER_HPP

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nodetree.hpp"

/**
 * @brief Thrown when the root path itself cannot be scanned
 */
class ScanError : public std::runtime_error {
public:
  explicit ScanError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Problem with a single entry found during the scan
 */
struct ScanIssue {
  std::string path;
  std::string message;
};

/**
 * @enum SortOrder
 * @brief Order of the children of each directory
 *
 * - Name: directories first, then alphabetical
 * - SizeDescending: largest first, ties broken by name
 */
enum class SortOrder { Name, SizeDescending };

struct ScanOptions {
  SortOrder sort = SortOrder::Name;
  bool include_hidden = true;
};

struct ScanResult {
  NodeTree tree;
  std::vector<ScanIssue> issues;

  /** @brief Number of entries visited below the root */
  std::size_t entries = 0;
};

/**
 * @class TreeScanner
 * @brief Scans a directory tree into a NodeTree
 *
 * Key features:
 * - One synchronous pass, no symlink following
 * - Directory sizes equal the sum of their descendants' file sizes
 * - Permission errors are recorded per entry, siblings keep scanning
 * - Progress reporting via callback
 *
 * @see NodeTree
 * @see ScanResult
 */
class TreeScanner {
private:
  ScanOptions m_options;

  /** @brief Directory waiting to be listed */
  struct PendingDir {
    NodeId id;
    std::filesystem::path path;
  };

public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(std::size_t count)
   * - count: Number of entries processed so far
   */
  using ProgressCallback = std::function<void(std::size_t count)>;

  explicit TreeScanner(ScanOptions options = {}) : m_options(options) {}

  /**
   * @brief Scans the tree below root
   *
   * @param root Directory (or single file) to scan
   * @param progress Optional callback, invoked every 100 entries and once
   *        at the end
   *
   * @return ScanResult Complete tree with directory sizes computed and
   *         children sorted according to the scan options
   *
   * @throws ScanError if root does not exist or cannot be accessed
   */
  ScanResult scan(const std::filesystem::path &root,
                  ProgressCallback progress = nullptr) const;

private:
  /**
   * @brief Lists one directory and queues its subdirectories
   *
   * Errors while opening or iterating the directory mark the directory
   * inaccessible; entries already read are kept.
   */
  void scanDirectory(const PendingDir &dir, ScanResult &result,
                     std::vector<PendingDir> &pending,
                     const ProgressCallback &progress) const;

  /**
   * @brief Adds one directory entry to the tree
   */
  void processEntry(const std::filesystem::directory_entry &entry,
                    NodeId parent, ScanResult &result,
                    std::vector<PendingDir> &pending) const;

  void sortEntries(NodeTree &tree) const;

  bool isHidden(const std::string &name) const {
    return !name.empty() && name[0] == '.';
  }
};

#endif // DIRMAP_TREESCANNER_HPP
