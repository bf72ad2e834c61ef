// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cmath>
#include <diven/algorithms/zero_order_states.hpp>
#include <diven/errors.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/timer.hpp>
#include <stdexcept>
#include <string>

namespace diven::algorithms {

namespace {

void validate_frequencies(const Eigen::VectorXd& frequencies) {
  if (frequencies.size() == 0) {
    throw std::invalid_argument("At least one harmonic frequency is required");
  }
  for (Eigen::Index m = 0; m < frequencies.size(); ++m) {
    if (!std::isfinite(frequencies(m)) || frequencies(m) <= 0.0) {
      throw std::invalid_argument("Harmonic frequency " + std::to_string(m) +
                                  " must be finite and positive, got " +
                                  std::to_string(frequencies(m)));
    }
  }
}

}  // namespace

std::vector<data::ZeroOrderState> generate_zero_order_states(
    double e_start, double e_max, const Eigen::VectorXd& frequencies) {
  DIVEN_LOG_TRACE_ENTERING();
  validate_frequencies(frequencies);

  const auto num_modes = static_cast<size_t>(frequencies.size());
  std::vector<int> v(num_modes, 0);
  // energy[d] is the energy of the partial tuple v[0..d]
  std::vector<double> energy(num_modes, 0.0);
  std::vector<data::ZeroOrderState> states;

  energy[0] = e_start;
  size_t depth = 0;
  while (true) {
    if (energy[depth] <= e_max) {
      if (depth + 1 == num_modes) {
        states.push_back({v, energy[depth]});
        ++v[depth];
        energy[depth] += frequencies(static_cast<Eigen::Index>(depth));
      } else {
        energy[depth + 1] = energy[depth];
        ++depth;
      }
    } else {
      v[depth] = 0;
      if (depth == 0) {
        break;
      }
      --depth;
      ++v[depth];
      energy[depth] += frequencies(static_cast<Eigen::Index>(depth));
    }
  }
  return states;
}

std::shared_ptr<data::VibrationalBasis> enumerate_zero_order_states(
    double e_max, const Eigen::VectorXd& frequencies) {
  DIVEN_LOG_TRACE_ENTERING();
  utils::AutoTimer timer("enumerate_zero_order_states");
  validate_frequencies(frequencies);

  const double zero_point_energy = 0.5 * frequencies.sum();
  auto states = generate_zero_order_states(zero_point_energy, e_max, frequencies);
  if (states.empty()) {
    throw ConfigurationError(
        "no zero-order state lies below the energy cutoff " +
        std::to_string(e_max) + " (zero-point energy " +
        std::to_string(zero_point_energy) + ")");
  }

  std::sort(states.begin(), states.end(),
            [](const data::ZeroOrderState& a, const data::ZeroOrderState& b) {
              if (a.energy != b.energy) {
                return a.energy < b.energy;
              }
              return a.quantum_numbers < b.quantum_numbers;
            });

  DIVEN_LOGGER().info("Enumerated {} zero-order states of {} modes up to {}",
                      states.size(), frequencies.size(), e_max);
  return std::make_shared<data::VibrationalBasis>(
      static_cast<size_t>(frequencies.size()), states);
}

}  // namespace diven::algorithms
