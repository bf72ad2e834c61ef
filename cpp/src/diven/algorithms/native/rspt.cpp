// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "rspt.hpp"

// STL Headers
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// GMP Headers
#include <gmpxx.h>

// DivEn Headers
#include <diven/utils/logger.hpp>
#include <diven/utils/timer.hpp>

namespace diven::algorithms::native {

namespace {

// Non-zero elements of one matrix row as (column, value)
using SparseRow = std::vector<std::pair<size_t, mpf_class>>;

std::vector<SparseRow> to_sparse_rows(const Eigen::MatrixXd& W,
                                      mp_bitcnt_t bits) {
  std::vector<SparseRow> rows(static_cast<size_t>(W.rows()));
  for (Eigen::Index i = 0; i < W.rows(); ++i) {
    for (Eigen::Index j = 0; j < W.cols(); ++j) {
      if (W(i, j) != 0.0) {
        rows[static_cast<size_t>(i)].emplace_back(static_cast<size_t>(j),
                                                  mpf_class(W(i, j), bits));
      }
    }
  }
  return rows;
}

mpf_class dot(const SparseRow& row, const std::vector<mpf_class>& x,
              mp_bitcnt_t bits) {
  mpf_class sum(0, bits);
  for (const auto& [column, value] : row) {
    sum += value * x[column];
  }
  return sum;
}

}  // namespace

std::shared_ptr<data::PerturbationSeries>
GmpPerturbationSeriesGenerator::_run_impl(
    std::shared_ptr<const data::VibrationalHamiltonian> hamiltonian,
    size_t target) const {
  DIVEN_LOG_TRACE_ENTERING();
  utils::AutoTimer timer("PerturbationSeriesGenerator::gmp");

  const size_t n = hamiltonian->get_num_states();
  if (target >= n) {
    throw std::out_of_range("Target state " + std::to_string(target) +
                            " out of range for a basis of " +
                            std::to_string(n) + " states");
  }
  const auto order = static_cast<size_t>(_settings->get<int64_t>("order"));
  const auto digits =
      static_cast<unsigned>(_settings->get<int64_t>("precision_digits"));
  const mp_bitcnt_t bits = data::PerturbationSeries::bits_for_digits(digits);
  if (digits < order) {
    DIVEN_LOGGER().warn(
        "Computing {} perturbation orders with only {} significant digits; "
        "high orders may be dominated by rounding",
        order, digits);
  }
  DIVEN_LOGGER().info(
      "Perturbation series of state {} to order {} with {} digits ({} bits)",
      target, order, digits, bits);

  const auto& E0 = hamiltonian->get_zero_order_energies();
  const auto q = static_cast<Eigen::Index>(target);

  // Resolvent diagonal 1 / (E0_q - E0_i), zero at the target
  std::vector<mpf_class> resolvent(n, mpf_class(0, bits));
  const mpf_class target_energy(E0(q), bits);
  for (size_t i = 0; i < n; ++i) {
    if (i == target) {
      continue;
    }
    const auto row = static_cast<Eigen::Index>(i);
    if (E0(row) == E0(q)) {
      throw std::domain_error(
          "States " + std::to_string(target) + " and " + std::to_string(i) +
          " are degenerate at zero order (E0 = " + std::to_string(E0(q)) +
          "); apply shift_frequencies to lift the degeneracy");
    }
    mpf_class gap(target_energy - mpf_class(E0(row), bits), bits);
    resolvent[i] = mpf_class(1, bits) / gap;
  }

  const auto W = to_sparse_rows(hamiltonian->get_perturbation_matrix(), bits);
  const SparseRow& coupling = W[target];

  std::vector<mpf_class> energies;
  energies.reserve(order);
  // psi[i] is the i-th order wavefunction correction; psi[0] is not stored
  std::vector<std::vector<mpf_class>> psi(order);

  mpf_class w_qq(0, bits);
  for (const auto& [column, value] : coupling) {
    if (column == target) {
      w_qq = value;
    }
  }
  energies.push_back(w_qq);

  psi[1].assign(n, mpf_class(0, bits));
  for (const auto& [column, value] : coupling) {
    psi[1][column] = resolvent[column] * value;
  }
  energies.push_back(dot(coupling, psi[1], bits));

  std::vector<mpf_class> residual(n, mpf_class(0, bits));
  for (size_t i = 2; i < order; ++i) {
    const auto& previous = psi[i - 1];
    for (size_t r = 0; r < n; ++r) {
      residual[r] = dot(W[r], previous, bits);
    }
    for (size_t j = 1; j < i; ++j) {
      const mpf_class& e = energies[j - 1];
      const auto& lower = psi[i - j];
      for (size_t r = 0; r < n; ++r) {
        residual[r] -= e * lower[r];
      }
    }

    psi[i].assign(n, mpf_class(0, bits));
    for (size_t r = 0; r < n; ++r) {
      psi[i][r] = resolvent[r] * residual[r];
    }
    energies.push_back(dot(coupling, psi[i], bits));
  }

  DIVEN_LOGGER().debug("Second-order correction of state {}: {}", target,
                       energies[1].get_d());

  const auto& qn = hamiltonian->get_basis()->get_quantum_numbers();
  std::vector<int> label(static_cast<size_t>(qn.cols()));
  for (Eigen::Index m = 0; m < qn.cols(); ++m) {
    label[static_cast<size_t>(m)] = qn(q, m);
  }
  return std::make_shared<data::PerturbationSeries>(
      std::move(energies), target, std::move(label), E0(q), digits);
}

}  // namespace diven::algorithms::native
