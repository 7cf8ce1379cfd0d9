/**
 * @file utils.hpp
 * @brief Utility functions shared by the dirmap library and front-ends
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - formatBytes: Human-readable file size formatting
 * - formatShare: Percentage of a part in a whole
 *
 * @see safe_at()
 * @see formatBytes()
 */

#ifndef DIRMAP_UTILS_HPP
#define DIRMAP_UTILS_HPP

#include <cstddef> // size_t
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * Returns nullptr if the index is out of bounds. The viewer maps the
 * selected menu index back to its action with it.
 *
 * @tparam T The type of elements stored in the vector
 * @param vec The vector to access
 * @param index The index to access (can be negative or out of bounds)
 *
 * @return const T* Pointer to the element, or nullptr if out of bounds
 *
 * Example usage:
 * @code
 * const ActionID* action = safe_at(m_menu_actions, index);
 * return action ? *action : ActionID::Quit;
 * @endcode
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) and one decimal place.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1048576) → "1.0 MB"
 *
 * @param bytes The number of bytes to format
 * @return std::string Formatted size (maximum unit is TB)
 */
static std::string formatBytes(std::uintmax_t bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Formats part/whole as a percentage with one decimal place
 *
 * @return std::string e.g. "75.0%"; "0.0%" when whole is zero
 */
static std::string formatShare(std::uintmax_t part, std::uintmax_t whole) {
  double percent = whole == 0 ? 0.0
                              : 100.0 * static_cast<double>(part) /
                                    static_cast<double>(whole);
  char buf[16];
  snprintf(buf, sizeof(buf), "%.1f%%", percent);
  return std::string(buf);
}

#endif // DIRMAP_UTILS_HPP
