// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <diven/data/vibrational_basis.hpp>
#include <memory>
#include <vector>

namespace diven::algorithms {

/**
 * @brief All quantum-number tuples whose energy stays within a bound
 *
 * Depth-first walk over the modes with an explicit stack. At each mode the
 * walk first descends to the next mode and then increments the current
 * quantum number, abandoning a branch as soon as its energy exceeds
 * @p e_max. The energy of a state is e_start + sum_i freq_i * v_i,
 * accumulated by repeated addition.
 *
 * For e_start = 0, e_max = 4 and frequencies (1, 2, 3) the output is
 * (0,0,0) (0,0,1) (0,1,0) (0,2,0) (1,0,0) (1,0,1) (1,1,0) (2,0,0) (2,1,0)
 * (3,0,0) (4,0,0).
 *
 * @param e_start Energy of the all-zero tuple
 * @param e_max Inclusive energy bound
 * @param frequencies Harmonic frequencies, one per mode
 * @return States in generation order, not sorted
 * @throws std::invalid_argument if @p frequencies is empty or has a
 * non-finite or non-positive entry
 */
std::vector<data::ZeroOrderState> generate_zero_order_states(
    double e_start, double e_max, const Eigen::VectorXd& frequencies);

/**
 * @brief Zero-order basis of all states with E0 <= e_max
 *
 * Generation starts at the zero-point energy sum_i freq_i / 2, so the
 * energies are the harmonic energies sum_i freq_i (v_i + 1/2). The states
 * are sorted by energy, then lexicographically by quantum numbers.
 *
 * @param e_max Inclusive energy bound
 * @param frequencies Harmonic frequencies, one per mode
 * @return Basis indexed densely from 0
 * @throws std::invalid_argument on invalid frequencies
 * @throws ConfigurationError if @p e_max lies below the zero-point energy
 */
std::shared_ptr<data::VibrationalBasis> enumerate_zero_order_states(
    double e_max, const Eigen::VectorXd& frequencies);

}  // namespace diven::algorithms
