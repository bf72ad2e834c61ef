// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <diven/utils/logger.hpp>
#include <diven/utils/timer.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

namespace diven::utils {

Timer& Timer::instance_() {
  static Timer timer;
  return timer;
}

void Timer::record(const std::string& key, Duration elapsed) {
  auto& timer = instance_();
  std::lock_guard<std::mutex> lock(timer.mutex_);
  auto& rec = timer.records_[key];
  rec.count++;
  rec.total += elapsed;
  rec.min = std::min(rec.min, elapsed);
  rec.max = std::max(rec.max, elapsed);
}

Timer::Record Timer::get_record(const std::string& key) {
  auto& timer = instance_();
  std::lock_guard<std::mutex> lock(timer.mutex_);
  auto it = timer.records_.find(key);
  if (it == timer.records_.end()) {
    throw std::out_of_range("timer key: " + key + " not found");
  }
  return it->second;
}

bool Timer::has_record(const std::string& key) {
  auto& timer = instance_();
  std::lock_guard<std::mutex> lock(timer.mutex_);
  return timer.records_.count(key) > 0;
}

std::string Timer::summary() {
  auto& timer = instance_();
  std::vector<std::pair<std::string, Record>> rows;
  {
    std::lock_guard<std::mutex> lock(timer.mutex_);
    rows.assign(timer.records_.begin(), timer.records_.end());
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return b.second.total < a.second.total;
  });

  std::string out = fmt::format("{:-^100}\n", "Performance Profile");
  out += fmt::format("{:>15}{:>15}{:>15}{:>15}{:>15}  {:20}\n", "total(ms)",
                     "calls", "avg(ms)", "max(ms)", "min(ms)", "name");
  for (const auto& [key, rec] : rows) {
    out += fmt::format("{:>15.3f}{:>15}{:>15.3f}{:>15.3f}{:>15.3f}  {:20}\n",
                       rec.total.count(), rec.count, rec.average(),
                       rec.max.count(), rec.min.count(), key);
  }
  out += fmt::format("{:-^100}\n", "");
  return out;
}

void Timer::log_summary() { DIVEN_LOGGER().info("\n{}", summary()); }

void Timer::reset() {
  auto& timer = instance_();
  std::lock_guard<std::mutex> lock(timer.mutex_);
  timer.records_.clear();
}

AutoTimer::AutoTimer(std::string key)
    : key_(std::move(key)), start_(std::chrono::steady_clock::now()) {}

AutoTimer::~AutoTimer() {
  const Timer::Duration elapsed = std::chrono::steady_clock::now() - start_;
  Timer::record(key_, elapsed);
  DIVEN_LOGGER().debug("{} took {:.3f} ms", key_, elapsed.count());
}

}  // namespace diven::utils
