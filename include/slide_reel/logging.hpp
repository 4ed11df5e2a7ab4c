/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector keyed by run, so concurrent runs
 *            keep separate timing tables
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress is visible while the engine is busy.
 *
 */

#ifndef SLIDE_REEL_LOGGING_HPP
#define SLIDE_REEL_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace slide_reel {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by SLIDE_REEL_ENABLE_LOGGING at compile time.
 */
#ifndef SLIDE_REEL_ENABLE_LOGGING
#define SLIDE_REEL_ENABLE_LOGGING 1
#endif

#ifndef SLIDE_REEL_ENABLE_TIMING
#define SLIDE_REEL_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if SLIDE_REEL_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(slide_reel::log_mutex);                   \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(slide_reel::log_mutex);                   \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(slide_reel::log_mutex);                   \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(slide_reel::log_mutex);                   \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(slide_reel::log_mutex);                   \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the step name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Step or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector of timing measurements, grouped by scope.
 * @note The scope is the run id; every worker thread records into the
 *       table of the run it is executing.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, std::vector<TimingEntry>> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param scope Run id the measurement belongs to
   * @param name Step or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &scope, const std::string &name,
                     long us);

  /**
   * @brief Snapshot of the measurements recorded for a scope.
   */
  static std::vector<TimingEntry> entries_for(const std::string &scope);

  /**
   * @brief Print the measurements of one scope as a formatted table.
   *        Called when a run reaches a terminal phase.
   */
  static void print_summary(const std::string &scope);

  /**
   * @brief Drop the measurements of one scope.
   */
  static void clear(const std::string &scope);
};

// **----- TIMING MACROS -----**

#if SLIDE_REEL_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(scope, name)                                                 \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    slide_reel::TimingCollector::record(scope, #name,                          \
                                        timer_duration_##name);                \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(scope, name) ((void)0)
#endif

} // namespace slide_reel

#endif // SLIDE_REEL_LOGGING_HPP
