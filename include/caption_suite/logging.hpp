/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector folding stage durations from all workers into
 *            per-stage totals
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so worker output interleaves line by line.
 *
 */

#ifndef CAPTION_SUITE_LOGGING_HPP
#define CAPTION_SUITE_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace caption_suite {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
/// One locked, flushed line on stdout; every LOG_* macro forwards here
#define CAPTION_SUITE_LOG(style, prefix, format_str, ...)                      \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(caption_suite::log_mutex);                \
    fmt::print(style, prefix format_str "\n", ##__VA_ARGS__);                  \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  CAPTION_SUITE_LOG(fmt::text_style(), "[INFO] ", format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  CAPTION_SUITE_LOG(fg(fmt::color::yellow), "[WARN] ", format_str,             \
                    ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  CAPTION_SUITE_LOG(fg(fmt::color::red), "[ERROR] ", format_str, ##__VA_ARGS__)
/// Worker and job banners
#define LOG_PHASE(format_str, ...)                                             \
  CAPTION_SUITE_LOG(fg(fmt::color::cyan), "", format_str, ##__VA_ARGS__)
/// A caption written to disk
#define LOG_SUCCESS(format_str, ...)                                           \
  CAPTION_SUITE_LOG(fg(fmt::color::green), "", format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- STAGE TIMING -----**

/**
 * @brief StageTiming: all recorded durations of one pipeline stage.
 */
struct StageTiming {
  std::string name;  //< Stage name, e.g. "extract_frames"
  long count = 0;    //< Number of recorded runs
  long total_us = 0; //< Sum of durations in microseconds

  double total_seconds() const { return total_us / 1000000.0; }
  double average_seconds() const {
    return count > 0 ? total_seconds() / static_cast<double>(count) : 0.0;
  }
};

/**
 * @class TimingCollector
 * @brief Thread-safe per-stage timing totals shared by all workers.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, StageTiming> stages;

public:
  /**
   * @brief Add one run of a stage.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /// Totals per stage, sorted by stage name
  static std::vector<StageTiming> summary();

  /**
   * @brief Print summary() as a table. Called at program end.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   * @note Called when a new job starts.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    caption_suite::TimingCollector::record(#name, timer_duration_##name);      \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace caption_suite

#endif // CAPTION_SUITE_LOGGING_HPP
