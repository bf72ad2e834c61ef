// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace diven::utils {

/**
 * @brief Process-wide registry of named wall-clock timings
 *
 * Each key accumulates a call count plus total, minimum and maximum
 * duration. Timings are usually recorded through AutoTimer.
 */
class Timer {
 public:
  using Duration = std::chrono::duration<double, std::milli>;

  /**
   * @brief Accumulated statistics of one timer key
   */
  struct Record {
    Duration total{0.0};               ///< Sum of all recorded durations
    Duration min = Duration::max();    ///< Shortest recorded duration
    Duration max = Duration::zero();   ///< Longest recorded duration
    std::size_t count = 0;             ///< Number of recorded durations

    /// Mean duration in milliseconds, 0 when nothing was recorded
    double average() const { return count ? total.count() / count : 0.0; }
  };

  /**
   * @brief Add one measured duration to a key
   * @param key Timer name
   * @param elapsed Measured duration
   */
  static void record(const std::string& key, Duration elapsed);

  /**
   * @brief Statistics of a key
   * @throws std::out_of_range if nothing was recorded under @p key
   */
  static Record get_record(const std::string& key);

  /// True if at least one duration was recorded under @p key
  static bool has_record(const std::string& key);

  /**
   * @brief Tabulate all timers, longest total first
   * @return Multi-line table with total, calls, average, max and min
   */
  static std::string summary();

  /// Write summary() to the library logger at info level
  static void log_summary();

  /// Forget all recorded timings
  static void reset();

 private:
  static Timer& instance_();

  std::mutex mutex_;
  std::unordered_map<std::string, Record> records_;
};

/**
 * @brief Scope timer feeding Timer
 *
 * @code
 * {
 *   AutoTimer timer("PerturbationMatrixBuilder::assemble");
 *   // timed work
 * }  // duration recorded and logged at debug level here
 * @endcode
 */
class AutoTimer {
 public:
  explicit AutoTimer(std::string key);
  ~AutoTimer();

  AutoTimer(const AutoTimer&) = delete;
  AutoTimer& operator=(const AutoTimer&) = delete;

 private:
  std::string key_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace diven::utils
