// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <diven/algorithms/vibrational_matrix.hpp>
#include <diven/utils/logger.hpp>
#include <stdexcept>
#include <string>

namespace diven::algorithms {

Eigen::MatrixXd add_zero_order_energies(const Eigen::MatrixXd& W,
                                        const Eigen::VectorXd& energies) {
  if (W.rows() != W.cols() || W.rows() != energies.size()) {
    throw std::invalid_argument(
        "Cannot add " + std::to_string(energies.size()) +
        " zero-order energies to a " + std::to_string(W.rows()) + "x" +
        std::to_string(W.cols()) + " matrix");
  }
  Eigen::MatrixXd H = W;
  H.diagonal() += energies;
  return H;
}

void shift_frequencies(const Eigen::VectorXd& shifts,
                       const Eigen::MatrixXi& quantum_numbers,
                       Eigen::VectorXd& energies, Eigen::MatrixXd& W) {
  DIVEN_LOG_TRACE_ENTERING();
  const Eigen::Index n = quantum_numbers.rows();
  if (shifts.size() != quantum_numbers.cols()) {
    throw std::invalid_argument(
        "Expected " + std::to_string(quantum_numbers.cols()) +
        " frequency shifts, got " + std::to_string(shifts.size()));
  }
  if (energies.size() != n || W.rows() != n || W.cols() != n) {
    throw std::invalid_argument(
        "Frequency shift operands disagree: " + std::to_string(n) +
        " states, " + std::to_string(energies.size()) + " energies and a " +
        std::to_string(W.rows()) + "x" + std::to_string(W.cols()) + " matrix");
  }

  for (Eigen::Index i = 0; i < n; ++i) {
    double d = 0.0;
    for (Eigen::Index m = 0; m < shifts.size(); ++m) {
      d += (quantum_numbers(i, m) + 0.5) * shifts(m);
    }
    energies(i) += d;
    W(i, i) -= d;
  }
}

}  // namespace diven::algorithms
