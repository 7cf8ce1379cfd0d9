/**
 * @file appconfig.cpp
 * @brief Command-line parsing for the dirmap executables
 */

#include "appconfig.hpp"

#include <filesystem>

namespace {

/** @brief Returns the value following option i, advancing i */
std::string takeValue(int argc, const char *const argv[], int &i) {
  std::string option = argv[i];
  if (i + 1 >= argc) {
    throw ConfigError("Missing value for " + option);
  }
  return argv[++i];
}

int parseInt(const std::string &option, const std::string &value) {
  try {
    std::size_t used = 0;
    int result = std::stoi(value, &used);
    if (used != value.size())
      throw ConfigError("Invalid number for " + option + ": " + value);
    return result;
  } catch (const std::logic_error &) {
    // std::invalid_argument, std::out_of_range
    throw ConfigError("Invalid number for " + option + ": " + value);
  }
}

double parseDouble(const std::string &option, const std::string &value) {
  try {
    std::size_t used = 0;
    double result = std::stod(value, &used);
    if (used != value.size())
      throw ConfigError("Invalid number for " + option + ": " + value);
    return result;
  } catch (const std::logic_error &) {
    throw ConfigError("Invalid number for " + option + ": " + value);
  }
}

} // namespace

AppConfig parseArguments(int argc, const char *const argv[]) {
  AppConfig config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
    } else if (arg == "-p" || arg == "--path") {
      config.root_path = takeValue(argc, argv, i);
    } else if (arg == "--sort") {
      std::string value = takeValue(argc, argv, i);
      if (value == "name")
        config.scan.sort = SortOrder::Name;
      else if (value == "size")
        config.scan.sort = SortOrder::SizeDescending;
      else
        throw ConfigError("Unknown sort order: " + value);
    } else if (arg == "--color") {
      std::string value = takeValue(argc, argv, i);
      if (value == "path")
        config.color_mode = ColorMode::Path;
      else if (value == "depth")
        config.color_mode = ColorMode::Depth;
      else if (value == "kind")
        config.color_mode = ColorMode::Kind;
      else
        throw ConfigError("Unknown color mode: " + value);
    } else if (arg == "--hidden") {
      config.scan.include_hidden = true;
    } else if (arg == "--no-hidden") {
      config.scan.include_hidden = false;
    } else if (arg == "--step") {
      double step = parseDouble(arg, takeValue(argc, argv, i));
      if (!(step > 0.0 && step <= 1.0))
        throw ConfigError("--step must be in (0, 1]");
      config.grow_step = step;
    } else if (arg == "--log") {
      config.log_file = takeValue(argc, argv, i);
    } else if (arg == "--log-level") {
      std::string value = takeValue(argc, argv, i);
      if (value != "trace" && value != "debug" && value != "info" &&
          value != "warn" && value != "error" && value != "off")
        throw ConfigError("Unknown log level: " + value);
      config.log_level = value;
    } else if (arg == "--depth") {
      int depth = parseInt(arg, takeValue(argc, argv, i));
      if (depth < 0)
        throw ConfigError("--depth must not be negative");
      config.depth = depth;
    } else if (arg == "--layout") {
      std::string value = takeValue(argc, argv, i);
      std::size_t x = value.find('x');
      if (x == std::string::npos)
        throw ConfigError("--layout expects <W>x<H>: " + value);
      config.layout_width = parseInt(arg, value.substr(0, x));
      config.layout_height = parseInt(arg, value.substr(x + 1));
      if (config.layout_width <= 0 || config.layout_height <= 0)
        throw ConfigError("--layout sizes must be positive: " + value);
    } else if (!arg.empty() && arg[0] != '-' && config.root_path.empty()) {
      config.root_path = arg;
    } else {
      throw ConfigError("Unknown option: " + arg);
    }
  }

  std::error_code ec;
  if (config.root_path.empty()) {
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec)
      throw ConfigError("Cannot determine current directory: " + ec.message());
    config.root_path = cwd.string();
  }
  if (config.log_file.empty()) {
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec)
      throw ConfigError("No temporary directory for the log file (use --log): " +
                        ec.message());
    config.log_file = (tmp / "dirmap.log").string();
  }

  return config;
}

std::string usage(const std::string &program) {
  return "Usage: " + program +
         " [-p <dir>] [options]\n"
         "\n"
         "  -p, --path <dir>        directory to scan (default: current)\n"
         "  --sort name|size        order of entries (default: name)\n"
         "  --color path|depth|kind block colours (default: path)\n"
         "  --hidden, --no-hidden   include entries starting with '.'\n"
         "  --step <fraction>       grow/shrink step (default: 0.10)\n"
         "  --log <file>            log file (default: <tmp>/dirmap.log)\n"
         "  --log-level <level>     trace|debug|info|warn|error|off\n"
         "  --depth <n>             report depth (dirmap-cli)\n"
         "  --layout <W>x<H>        print layout rectangles (dirmap-cli)\n"
         "  -h, --help              show this help\n";
}
