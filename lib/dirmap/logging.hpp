/**
 * @file logging.hpp
 * @brief spdlog setup shared by the dirmap executables
 *
 * @see setupLogging()
 */

#ifndef DIRMAP_LOGGING_HPP
#define DIRMAP_LOGGING_HPP

#include "appconfig.hpp"

/**
 * @brief Installs the default spdlog logger for a dirmap run
 *
 * Logs go to config.log_file; a full-screen terminal UI would be garbled
 * by console output. If the file cannot be opened, a null logger is
 * installed and a warning is printed on stderr.
 */
void setupLogging(const AppConfig &config);

#endif // DIRMAP_LOGGING_HPP
