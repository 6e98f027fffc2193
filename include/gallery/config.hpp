/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values are read once on first use and never change afterwards.
 *
 */

#ifndef GALLERY_CONFIG_HPP
#define GALLERY_CONFIG_HPP

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace gallery {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws std::runtime_error naming the variable if the value is not an
 *         integer
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  size_t used = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(val, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used == 0 || val[used] != '\0')
    throw std::runtime_error(std::string(name) + ": not an integer: '" + val +
                             "'");
  return parsed;
}

/**
 * @brief Get a float value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed float value or default
 * @throws std::runtime_error naming the variable if the value is not a number
 */
inline float get_env_float(const char *name, float default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  size_t used = 0;
  float parsed = 0.0f;
  try {
    parsed = std::stof(val, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used == 0 || val[used] != '\0')
    throw std::runtime_error(std::string(name) + ": not a number: '" + val +
                             "'");
  return parsed;
}

/// String variant; empty values fall back to the default
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- BUILD PHASE ----**

/**
 * @brief Number of transcode worker threads
 * @note 0 = auto-detect from the container's CPU limit.
 *       The pool never starts more workers than there are images.
 */
inline int worker_threads() {
  static int val = get_env_int("GALLERY_WORKERS", 0);
  return val;
}

/// Preview bounding box width in pixels
inline int preview_max_width() {
  static int val = get_env_int("PREVIEW_MAX_WIDTH", DEFAULT_PREVIEW_WIDTH);
  return val;
}

/// Preview bounding box height in pixels
inline int preview_max_height() {
  static int val = get_env_int("PREVIEW_MAX_HEIGHT", DEFAULT_PREVIEW_HEIGHT);
  return val;
}

/**
 * @brief WebP quality for previews (0 = smallest, 100 = best)
 * @note Passed to the libwebp encoder as its "quality" option.
 */
inline float preview_quality() {
  static float val = get_env_float("PREVIEW_QUALITY", DEFAULT_PREVIEW_QUALITY);
  return val;
}

// **---- CONSOLE ----**

/// Lowest log level printed: debug, info, warn or error
inline const std::string &log_level() {
  static std::string val = get_env_string("GALLERY_LOG_LEVEL", "info");
  return val;
}

// **---- SERVING PHASE ----**

/// Address the HTTP server binds to
inline const std::string &listen_host() {
  static std::string val = get_env_string("GALLERY_HOST", "0.0.0.0");
  return val;
}

/// Port the HTTP server listens on
inline int listen_port() {
  static int val = get_env_int("GALLERY_PORT", 8080);
  return val;
}

} // namespace Config
} // namespace gallery

#endif // GALLERY_CONFIG_HPP
