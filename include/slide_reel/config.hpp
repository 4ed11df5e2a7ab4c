/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/slide_reel.env for documentation of each parameter.
 *
 * @note Product contracts (seconds per image, fade length, mix weights) are
 *       NOT configurable; they live in timeline.hpp.
 */

#ifndef SLIDE_REEL_CONFIG_HPP
#define SLIDE_REEL_CONFIG_HPP

#include <cstdlib>
#include <exception>
#include <string>

#include "logging.hpp"

namespace slide_reel {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a number
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    return std::stod(val);
  } catch (const std::exception &) {
    LOG_WARN("Ignoring {}='{}' (not a number), using {}", name, val,
             default_val);
    return default_val;
  }
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not an integer
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    return std::stoi(val);
  } catch (const std::exception &) {
    LOG_WARN("Ignoring {}='{}' (not an integer), using {}", name, val,
             default_val);
    return default_val;
  }
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- ENGINE ----**

/// Encoder executable (resolved through PATH when not absolute)
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/**
 * @brief Engine adapter selection: "direct" or "queued"
 * @note "queued" funnels every encoder invocation of every run through one
 *       encoder worker thread.
 */
inline const std::string &engine_mode() {
  static std::string val = get_env_string("ENGINE_MODE", "direct");
  return val;
}

// **---- STORAGE ----**

/// Parent directory of per-run workspace namespaces
inline const std::string &workspace_root() {
  static std::string val =
      get_env_string("WORKSPACE_ROOT", "/tmp/slide_reel/workspaces");
  return val;
}

/// Directory of persisted run descriptors (one JSON file per run)
inline const std::string &run_store_dir() {
  static std::string val = get_env_string("RUN_STORE_DIR", "/tmp/slide_reel/runs");
  return val;
}

/// Directory receiving finished videos
inline const std::string &output_dir() {
  static std::string val = get_env_string("OUTPUT_DIR", "/tmp/slide_reel/output");
  return val;
}

// **---- CATALOGS ----**

inline const std::string &soundtrack_catalog() {
  static std::string val =
      get_env_string("SOUNDTRACK_CATALOG", "assets/soundtracks.json");
  return val;
}

inline const std::string &filter_catalog() {
  static std::string val = get_env_string("FILTER_CATALOG", "assets/filters.json");
  return val;
}

/// Base directory for catalog file references
inline const std::string &asset_root() {
  static std::string val = get_env_string("ASSET_ROOT", "assets");
  return val;
}

// **---- RUNS ----**

/**
 * @brief Number of runs processed concurrently
 * @note 0 = auto-calculate as max(1, available_cpus / 2). Each run drives
 *       one multi-threaded encoder process at a time.
 */
inline int run_workers() {
  static int val = get_env_int("RUN_WORKERS", 0);
  return val;
}

/// Global deadline per run, measured from the moment a worker picks it up
inline double run_deadline_sec() {
  static double val = get_env_double("RUN_DEADLINE_SEC", 900.0);
  return val;
}

/**
 * @brief Probe the finished artifact before reporting completion
 * @note Checks stream layout and duration against the render plan.
 */
inline bool verify_output() {
  static bool val = (get_env_int("VERIFY_OUTPUT", 1) != 0);
  return val;
}

} // namespace Config
} // namespace slide_reel

#endif // SLIDE_REEL_CONFIG_HPP
