// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <diven/data/anharmonic_potential.hpp>
#include <diven/data/vibrational_basis.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace testing {

/// @brief Tolerance for JSON comparisons
inline static constexpr double json_tolerance = 1e-12;

///@brief Tolerance for HDF5 comparisons
inline static constexpr double hdf5_tolerance = 1e-12;

/// @brief Tolerance for numerical zeros
inline static constexpr double numerical_zero_tolerance = 1e-12;

/// @brief Tolerance for matrix elements of the perturbation matrix
inline static constexpr double matrix_element_tolerance = 1e-10;

/// @brief Tolerance for vibrational energies from diagonalization
inline static constexpr double energy_tolerance = 1e-9;

/// @brief Tolerance for comparing a converged perturbation series with the
/// exact eigenvalue
inline static constexpr double series_tolerance = 1e-10;

using namespace diven::data;

/**
 * @brief Path in the system temporary directory for a test artifact
 * @param filename File name, including the data type suffix
 */
inline std::string temp_path(const std::string& filename) {
  return (std::filesystem::temp_directory_path() / filename).string();
}

/**
 * @brief Three-mode potential with cubic and quartic couplings
 *
 * Frequencies (1000, 1500, 2000) with weak anharmonic terms, small enough
 * that the lowest levels are dominated by a single zero-order state.
 */
inline std::shared_ptr<AnharmonicPotential> create_test_potential() {
  Eigen::VectorXd frequencies(3);
  frequencies << 1000.0, 1500.0, 2000.0;

  Eigen::MatrixXi powers(6, 3);
  powers << 3, 0, 0,  //
      1, 2, 0,        //
      2, 0, 1,        //
      4, 0, 0,        //
      2, 2, 0,        //
      0, 0, 4;
  Eigen::VectorXd coefficients(6);
  coefficients << 12.0, -8.0, 15.0, 2.5, -1.5, 1.0;

  return std::make_shared<AnharmonicPotential>(frequencies, powers,
                                               coefficients);
}

/**
 * @brief Basis from explicit quantum numbers with harmonic energies
 * @param frequencies Harmonic frequencies
 * @param labels One quantum-number tuple per state
 */
inline std::shared_ptr<VibrationalBasis> create_basis(
    const Eigen::VectorXd& frequencies,
    const std::vector<std::vector<int>>& labels) {
  std::vector<ZeroOrderState> states;
  for (const auto& label : labels) {
    ZeroOrderState state;
    state.quantum_numbers = label;
    state.energy = 0.0;
    for (size_t m = 0; m < label.size(); ++m) {
      state.energy += frequencies(static_cast<Eigen::Index>(m)) *
                      (label[m] + 0.5);
    }
    states.push_back(state);
  }
  return std::make_shared<VibrationalBasis>(
      static_cast<size_t>(frequencies.size()), states);
}

}  // namespace testing
