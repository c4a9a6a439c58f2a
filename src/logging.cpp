/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "caption_suite/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace caption_suite {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, StageTiming> TimingCollector::stages;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto &stage = stages[name];
  stage.name = name;
  stage.count++;
  stage.total_us += us;
}

std::vector<StageTiming> TimingCollector::summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  std::vector<StageTiming> out;
  out.reserve(stages.size());
  for (const auto &kv : stages)
    out.push_back(kv.second);
  return out;
}

void TimingCollector::print_summary() {
  auto rows = summary();
  if (rows.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<22} {:>6} {:>10} {:>10}\n", "Stage", "Count", "Total(s)",
             "Avg(s)");
  fmt::print("{:-<22} {:-<6} {:-<10} {:-<10}\n", "", "", "", "");

  for (const auto &row : rows) {
    fmt::print("{:<22} {:>6} {:>10.2f} {:>10.2f}\n", row.name, row.count,
               row.total_seconds(), row.average_seconds());
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  stages.clear();
}

} // namespace caption_suite
