/**
 * @file appconfig.hpp
 * @brief Command-line configuration shared by the dirmap executables
 */

#ifndef DIRMAP_APPCONFIG_HPP
#define DIRMAP_APPCONFIG_HPP

#include <stdexcept>
#include <string>

#include "treemaprenderer.hpp"
#include "treescanner.hpp"

/**
 * @brief Thrown for unknown options and malformed option values
 */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @struct AppConfig
 * @brief Settings of one dirmap run
 *
 * Defaults apply for every option not given on the command line.
 */
struct AppConfig {
  /** @brief Directory to scan (default: current directory) */
  std::string root_path;

  ScanOptions scan;
  ColorMode color_mode = ColorMode::Path;

  /** @brief Relative change of the grow/shrink commands */
  double grow_step = 0.10;

  /** @brief Log file (default: <tmp>/dirmap.log) */
  std::string log_file;

  /** @brief One of trace, debug, info, warn, error, off */
  std::string log_level = "info";

  // dirmap-cli only
  int depth = 2;
  int layout_width = 0;
  int layout_height = 0;

  bool show_help = false;
};

/**
 * @brief Parses the command line
 *
 * Supported options:
 * - -p, --path <dir>
 * - --sort name|size
 * - --color path|depth|kind
 * - --hidden / --no-hidden
 * - --step <fraction>  (0 < step <= 1)
 * - --log <file>, --log-level <level>
 * - --depth <n>, --layout <W>x<H>
 * - -h, --help
 * A single argument without a leading dash is taken as the path.
 *
 * @throws ConfigError for unknown options, missing or invalid values, and
 *         when a default path (current or temporary directory) is unavailable
 */
AppConfig parseArguments(int argc, const char *const argv[]);

/**
 * @brief Usage text for --help
 */
std::string usage(const std::string &program);

#endif // DIRMAP_APPCONFIG_HPP
