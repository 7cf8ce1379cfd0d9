/**
 * @file logging.cpp
 * @brief File logger installation with a null-sink fallback
 */

#include "logging.hpp"

#include <iostream>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

void setupLogging(const AppConfig &config) {
  std::shared_ptr<spdlog::logger> logger;
  spdlog::drop("dirmap");

  try {
    logger = spdlog::basic_logger_mt("dirmap", config.log_file, true);
  } catch (const spdlog::spdlog_ex &e) {
    std::cerr << "Warning: logging disabled: " << e.what() << std::endl;
    logger = spdlog::null_logger_mt("dirmap");
  }

  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(spdlog::level::from_str(config.log_level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}
