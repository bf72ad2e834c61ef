// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace diven::algorithms::harmonic {

/// Highest power of a normal coordinate with a closed-form weight
inline constexpr int max_coupling_order = 8;

/**
 * @brief Whether the weight of (n, dv) vanishes identically
 *
 * True for n > 8, dv > n, negative arguments or odd n - dv. Checked before
 * any table lookup so that whole terms can be skipped.
 */
constexpr bool is_zero(int n, int dv) {
  return n < 0 || dv < 0 || n > max_coupling_order || dv > n ||
         (n - dv) % 2 != 0;
}

/**
 * @brief Harmonic-oscillator matrix-element weight of q^n
 *
 * The value of <v'| q^n |v> for dimensionless normal coordinate q, expressed
 * through dv = |v - v'| and v = max(v, v'). Evaluated in double precision.
 *
 * @param n Power of the coordinate, 0..8
 * @param dv Quantum number difference
 * @param v Larger of the two quantum numbers
 * @return The weight; exactly 0 when is_zero(n, dv)
 */
double weight(int n, int dv, int v);

/**
 * @brief Dense table of weight(n, dv, v) for 0 <= v <= vmax, n <= nmax
 *
 * Lookups outside the tabulated range, or with n > 8, return exactly 0.
 */
class HarmonicWeightTable {
 public:
  /**
   * @param vmax Largest tabulated quantum number
   * @param nmax Largest tabulated power; capped at max_coupling_order
   * @throws std::invalid_argument if vmax or nmax is negative
   */
  HarmonicWeightTable(int vmax, int nmax);

  /// Tabulated weight, 0 outside the table
  double operator()(int n, int dv, int v) const {
    if (n < 0 || n > nmax_ || dv < 0 || dv > n || v < 0 || v > vmax_) {
      return 0.0;
    }
    return values_[_offset(n, dv, v)];
  }

  int get_vmax() const { return vmax_; }

  int get_nmax() const { return nmax_; }

 private:
  std::size_t _offset(int n, int dv, int v) const {
    return (static_cast<std::size_t>(n) * (nmax_ + 1) + dv) * (vmax_ + 1) + v;
  }

  int vmax_;
  int nmax_;
  std::vector<double> values_;
};

/**
 * @brief Shared table for (vmax, nmax), built on first request
 *
 * Tables live in a process-wide cache; concurrent callers receive the same
 * immutable instance.
 */
std::shared_ptr<const HarmonicWeightTable> get_weight_table(int vmax, int nmax);

/// Number of cached tables
std::size_t weight_table_cache_size();

/// Drop all cached tables
void clear_weight_table_cache();

}  // namespace diven::algorithms::harmonic
