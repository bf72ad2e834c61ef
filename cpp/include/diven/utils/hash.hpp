// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <functional>
#include <utility>

namespace diven::utils {

/**
 * @brief Mix the hash of a value into an existing seed
 *
 * Uses the boost::hash_combine mixing step (golden-ratio constant plus
 * shifted seed).
 *
 * @tparam T Type of the value to hash
 * @tparam Hasher Hash functor, std::hash<T> by default
 * @param seed Hash accumulated so far
 * @param v Value whose hash is mixed in
 * @return The combined hash
 */
template <typename T, typename Hasher = std::hash<T>>
inline std::size_t hash_combine(std::size_t seed, const T& v) {
  Hasher h;
  return seed ^ (h(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

/**
 * @brief Mix the hashes of several values into a seed, left to right
 *
 * @code
 *   std::size_t key = hash_combine(0, vmax, nmax);
 * @endcode
 */
template <typename T, typename... Args>
inline std::size_t hash_combine(std::size_t seed, const T& v, Args&&... args) {
  return hash_combine(hash_combine(seed, v), std::forward<Args>(args)...);
}

}  // namespace diven::utils
