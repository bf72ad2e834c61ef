// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cmath>
#include <diven/algorithms/harmonic_weights.hpp>
#include <diven/utils/cache.hpp>
#include <diven/utils/hash.hpp>
#include <diven/utils/logger.hpp>
#include <stdexcept>
#include <string>

namespace diven::algorithms::harmonic {

namespace {

// v (v - 1) ... (v - k + 1)
double falling(double v, int k) {
  double product = 1.0;
  for (int i = 0; i < k; ++i) {
    product *= v - i;
  }
  return product;
}

double root_falling(double v, int k) { return std::sqrt(falling(v, k)); }

utils::Cache<HarmonicWeightTable>& table_cache() {
  static utils::Cache<HarmonicWeightTable> cache;
  return cache;
}

}  // namespace

double weight(int n, int dv, int v_int) {
  if (is_zero(n, dv) || v_int < 0) {
    return 0.0;
  }
  const double v = static_cast<double>(v_int);
  const double sqrt2 = std::sqrt(2.0);

  switch (n) {
    case 0:
      return 1.0;
    case 1:
      return std::sqrt(v / 2.0);
    case 2:
      if (dv == 0) return v + 0.5;
      return 0.5 * root_falling(v, 2);
    case 3:
      if (dv == 1) return 0.75 * sqrt2 * std::pow(v, 1.5);
      return 0.25 * sqrt2 * root_falling(v, 3);
    case 4:
      if (dv == 0) return 1.5 * v * v + 1.5 * v + 0.75;
      if (dv == 2) return (v - 0.5) * root_falling(v, 2);
      return 0.25 * root_falling(v, 4);
    case 5:
      if (dv == 1) return (1.25 * v * v + 0.625) * std::sqrt(2.0 * v);
      if (dv == 3) return (0.625 * v - 0.625) * sqrt2 * root_falling(v, 3);
      return 0.125 * sqrt2 * root_falling(v, 5);
    case 6:
      if (dv == 0) return 0.625 * (2.0 * v + 1.0) * (2.0 * v * v + 2.0 * v + 3.0);
      if (dv == 2) return 1.875 * (v * v - v + 1.0) * root_falling(v, 2);
      if (dv == 4) return (0.75 * v - 1.125) * root_falling(v, 4);
      return 0.125 * root_falling(v, 6);
    case 7:
      if (dv == 1) return 2.1875 * (v * v + 2.0) * v * std::sqrt(2.0 * v);
      if (dv == 3) {
        return 1.3125 * (v * v - 2.0 * v + 2.0) * sqrt2 * root_falling(v, 3);
      }
      if (dv == 5) return 0.4375 * (v - 2.0) * sqrt2 * root_falling(v, 5);
      return 0.0625 * sqrt2 * root_falling(v, 7);
    case 8:
      if (dv == 0) {
        return 4.375 * (std::pow(v, 4) + 2.0 * std::pow(v, 3) + 5.0 * v * v +
                        4.0 * v + 1.5);
      }
      if (dv == 2) {
        return 1.75 * (2.0 * v - 1.0) * (v * v - v + 3.0) * root_falling(v, 2);
      }
      if (dv == 4) {
        return 0.875 * (2.0 * v * v - 6.0 * v + 7.0) * root_falling(v, 4);
      }
      if (dv == 6) return (0.5 * v - 1.25) * root_falling(v, 6);
      return 0.0625 * root_falling(v, 8);
    default:
      return 0.0;
  }
}

HarmonicWeightTable::HarmonicWeightTable(int vmax, int nmax) {
  if (vmax < 0 || nmax < 0) {
    throw std::invalid_argument(
        "HarmonicWeightTable requires non-negative vmax and nmax, got vmax=" +
        std::to_string(vmax) + ", nmax=" + std::to_string(nmax));
  }
  vmax_ = vmax;
  nmax_ = std::min(nmax, max_coupling_order);
  values_.assign(static_cast<std::size_t>(nmax_ + 1) * (nmax_ + 1) *
                     (vmax_ + 1),
                 0.0);

  for (int n = 0; n <= nmax_; ++n) {
    for (int dv = 0; dv <= n; ++dv) {
      if (is_zero(n, dv)) continue;
      for (int v = 0; v <= vmax_; ++v) {
        values_[_offset(n, dv, v)] = weight(n, dv, v);
      }
    }
  }
}

std::shared_ptr<const HarmonicWeightTable> get_weight_table(int vmax,
                                                            int nmax) {
  const std::size_t key = utils::hash_combine(std::size_t{0}, vmax, nmax);
  auto table = table_cache().get_or_emplace(key, [vmax, nmax]() {
    DIVEN_LOGGER().debug("Building harmonic weight table vmax={} nmax={}",
                         vmax, nmax);
    return std::make_shared<const HarmonicWeightTable>(vmax, nmax);
  });
  if (table->get_vmax() == vmax &&
      table->get_nmax() == std::min(nmax, max_coupling_order)) {
    return table;
  }
  // Hash collision with another (vmax, nmax): serve an uncached table
  return std::make_shared<const HarmonicWeightTable>(vmax, nmax);
}

std::size_t weight_table_cache_size() { return table_cache().size(); }

void clear_weight_table_cache() { table_cache().clear(); }

}  // namespace diven::algorithms::harmonic
