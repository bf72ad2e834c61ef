// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>

namespace diven::algorithms {

/**
 * @brief Hamiltonian matrix from a perturbation matrix
 * @param W N x N perturbation matrix
 * @param energies N zero-order energies
 * @return A copy of @p W with @p energies added to the diagonal
 * @throws std::invalid_argument if the sizes disagree
 */
Eigen::MatrixXd add_zero_order_energies(const Eigen::MatrixXd& W,
                                        const Eigen::VectorXd& energies);

/**
 * @brief Move per-mode frequency shifts from W into the zero-order energies
 *
 * For every state i, d_i = sum_m (v_im + 1/2) shifts_m is added to
 * energies(i) and subtracted from W(i, i). W + diag(energies) is unchanged
 * up to rounding, and a zero shift leaves both operands bit-identical.
 *
 * @param shifts M frequency shifts
 * @param quantum_numbers N x M quantum numbers of the basis
 * @param energies N zero-order energies, updated in place
 * @param W N x N perturbation matrix, updated in place
 * @throws std::invalid_argument if the sizes disagree
 */
void shift_frequencies(const Eigen::VectorXd& shifts,
                       const Eigen::MatrixXi& quantum_numbers,
                       Eigen::VectorXd& energies, Eigen::MatrixXd& W);

}  // namespace diven::algorithms
