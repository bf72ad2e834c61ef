// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace diven::utils {

/**
 * @brief Thread-safe cache of immutable objects addressed by a hash index
 *
 * Cached objects are shared as `std::shared_ptr<const T>`, so an entry
 * handed out to a caller stays valid even after the cache is cleared.
 *
 * @tparam T Type of the cached objects
 */
template <typename T>
class Cache {
 public:
  using IndexType = std::size_t;
  using ValueType = T;
  using Pointer = std::shared_ptr<const T>;

  /**
   * @brief Return the entry at @p idx, building it with @p factory on a miss
   *
   * The factory runs under the cache lock, so concurrent callers asking for
   * the same index build the object once.
   *
   * @param idx Hash index of the entry
   * @param factory Callable returning a `std::shared_ptr<const T>` (or a type
   * convertible to it)
   * @return The cached or freshly built object
   */
  template <typename Factory>
  Pointer get_or_emplace(IndexType idx, Factory&& factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(idx);
    if (it != cache_.end()) {
      return it->second;
    }
    Pointer value = std::forward<Factory>(factory)();
    cache_.emplace(idx, value);
    return value;
  }

  /**
   * @brief Look up an entry
   * @param idx Hash index to look up
   * @return The entry or nullptr when absent
   */
  Pointer get(IndexType idx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(idx);
    return (it != cache_.end()) ? it->second : nullptr;
  }

  /// Number of cached entries
  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
  }

  /// Drop the entry at @p idx
  void erase(IndexType idx) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(idx);
  }

  /// Drop all entries
  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<IndexType, Pointer> cache_;
};

}  // namespace diven::utils
