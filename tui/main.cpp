#include "logging.hpp"
#include "treemapui.hpp"

#include <spdlog/spdlog.h>

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
    TreemapUI ui(config);
    ui.initialize();
    ui.run();
  } catch (const std::exception &e) {
    // Terminal is already restored by the screen destructor
    spdlog::error("Fatal: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
