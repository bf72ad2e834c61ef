// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "perturbation_matrix.hpp"

// STL Headers
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

// DivEn Headers
#include <diven/algorithms/harmonic_weights.hpp>
#include <diven/errors.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/omp_utils.hpp>
#include <diven/utils/timer.hpp>

namespace diven::algorithms::native {

namespace {

struct Term {
  std::vector<int> powers;
  double coefficient = 0.0;
};

struct PreparedTerms {
  std::vector<Term> terms;
  int max_power = 0;
};

PreparedTerms prepare_terms(const data::AnharmonicPotential& potential,
                            const data::VibrationalBasis& basis,
                            const data::Settings& settings) {
  if (basis.empty()) {
    throw ConfigurationError("the zero-order basis is empty");
  }
  if (potential.get_num_modes() != basis.get_num_modes()) {
    throw ConfigurationError(
        "the anharmonic potential has " +
        std::to_string(potential.get_num_modes()) + " modes but the basis has " +
        std::to_string(basis.get_num_modes()));
  }

  const bool fail_fast =
      settings.get<std::string>("out_of_range_order") == "throw";
  const auto& powers = potential.get_powers();
  const auto& coefficients = potential.get_coefficients();

  PreparedTerms prepared;
  size_t num_dropped = 0;
  for (Eigen::Index k = 0; k < powers.rows(); ++k) {
    Term term;
    term.coefficient = coefficients(k);
    term.powers.resize(static_cast<size_t>(powers.cols()));
    int highest = 0;
    for (Eigen::Index m = 0; m < powers.cols(); ++m) {
      term.powers[static_cast<size_t>(m)] = powers(k, m);
      highest = std::max(highest, powers(k, m));
    }
    if (highest > harmonic::max_coupling_order) {
      if (fail_fast) {
        throw DomainLimitError(
            "anharmonic term " + std::to_string(k) + " has a power of " +
            std::to_string(highest) + ", the highest supported power is " +
            std::to_string(harmonic::max_coupling_order));
      }
      ++num_dropped;
      continue;
    }
    prepared.max_power = std::max(prepared.max_power, highest);
    prepared.terms.push_back(std::move(term));
  }

  if (num_dropped > 0) {
    DIVEN_LOGGER().warn(
        "Ignoring {} anharmonic term(s) with a power above {}", num_dropped,
        harmonic::max_coupling_order);
  }
  return prepared;
}

int resolve_num_threads(const data::Settings& settings) {
  const auto requested = settings.get<int64_t>("num_threads");
  return requested > 0 ? static_cast<int>(requested) : omp_get_max_threads();
}

/**
 * Run @p row for every row index in parallel. Thread 0 polls @p cancel once
 * per row it processes; the other threads skip their remaining rows once a
 * cancellation is seen. Throws CalculationCancelled after the parallel
 * region, or rethrows an exception raised by the callback.
 */
template <typename RowKernel>
void for_each_row(Eigen::Index num_rows, int num_threads,
                  const std::function<bool()>& cancel, RowKernel&& row) {
  if (cancel && cancel()) {
    throw CalculationCancelled("perturbation matrix assembly");
  }

  std::atomic<bool> cancelled{false};
  std::exception_ptr callback_error;

#pragma omp parallel num_threads(num_threads)
  {
#pragma omp for schedule(dynamic)
    for (Eigen::Index i = 0; i < num_rows; ++i) {
      if (cancel && omp_get_thread_num() == 0 && !cancelled.load()) {
        try {
          if (cancel()) {
            cancelled.store(true);
          }
        } catch (...) {
          callback_error = std::current_exception();
          cancelled.store(true);
        }
      }
      if (cancelled.load()) {
        continue;
      }
      row(i);
    }
  }

  if (callback_error) {
    std::rethrow_exception(callback_error);
  }
  if (cancelled.load()) {
    throw CalculationCancelled("perturbation matrix assembly");
  }
}

void mirror_upper_triangle(Eigen::MatrixXd& W) {
  for (Eigen::Index j = 0; j < W.cols(); ++j) {
    for (Eigen::Index i = j + 1; i < W.rows(); ++i) {
      W(i, j) = W(j, i);
    }
  }
}

}  // namespace

std::shared_ptr<data::VibrationalHamiltonian>
TabulatedPerturbationMatrixBuilder::_run_impl(
    std::shared_ptr<const data::AnharmonicPotential> potential,
    std::shared_ptr<const data::VibrationalBasis> basis) const {
  DIVEN_LOG_TRACE_ENTERING();
  utils::AutoTimer timer("PerturbationMatrixBuilder::tabulated");

  const auto prepared = prepare_terms(*potential, *basis, *_settings);
  const auto& terms = prepared.terms;
  const auto& qn = basis->get_quantum_numbers();
  const Eigen::Index n = qn.rows();
  const Eigen::Index num_modes = qn.cols();
  const int num_threads = resolve_num_threads(*_settings);

  DIVEN_LOGGER().info(
      "Assembling {}x{} perturbation matrix from {} terms on {} thread(s)", n,
      n, terms.size(), num_threads);

  // Upper triangles of |v_m(i) - v_m(j)| and max(v_m(i), v_m(j)) per mode
  std::vector<Eigen::MatrixXi> delta(static_cast<size_t>(num_modes));
  std::vector<Eigen::MatrixXi> upper(static_cast<size_t>(num_modes));
  for (Eigen::Index m = 0; m < num_modes; ++m) {
    auto& dv = delta[static_cast<size_t>(m)];
    auto& vmax = upper[static_cast<size_t>(m)];
    dv.resize(n, n);
    vmax.resize(n, n);
    for (Eigen::Index j = 0; j < n; ++j) {
      for (Eigen::Index i = 0; i <= j; ++i) {
        dv(i, j) = std::abs(qn(i, m) - qn(j, m));
        vmax(i, j) = std::max(qn(i, m), qn(j, m));
      }
    }
  }

  const auto table = harmonic::get_weight_table(basis->get_max_quantum_number(),
                                                prepared.max_power);

  Eigen::MatrixXd W = Eigen::MatrixXd::Zero(n, n);
  for_each_row(n, num_threads, _cancellation_callback, [&](Eigen::Index i) {
    for (Eigen::Index j = i; j < n; ++j) {
      double element = 0.0;
      for (const auto& term : terms) {
        double product = term.coefficient;
        for (Eigen::Index m = 0; m < num_modes; ++m) {
          const int power = term.powers[static_cast<size_t>(m)];
          const int dv = delta[static_cast<size_t>(m)](i, j);
          if (harmonic::is_zero(power, dv)) {
            product = 0.0;
            break;
          }
          product *= (*table)(power, dv, upper[static_cast<size_t>(m)](i, j));
        }
        element += product;
      }
      W(i, j) = element;
    }
  });
  mirror_upper_triangle(W);

  return std::make_shared<data::VibrationalHamiltonian>(basis, std::move(W));
}

std::shared_ptr<data::VibrationalHamiltonian>
ClosedFormPerturbationMatrixBuilder::_run_impl(
    std::shared_ptr<const data::AnharmonicPotential> potential,
    std::shared_ptr<const data::VibrationalBasis> basis) const {
  DIVEN_LOG_TRACE_ENTERING();
  utils::AutoTimer timer("PerturbationMatrixBuilder::closed_form");

  const auto prepared = prepare_terms(*potential, *basis, *_settings);
  const auto& terms = prepared.terms;
  const auto& qn = basis->get_quantum_numbers();
  const Eigen::Index n = qn.rows();
  const Eigen::Index num_modes = qn.cols();

  DIVEN_LOGGER().info(
      "Assembling {}x{} perturbation matrix from {} terms (closed form)", n, n,
      terms.size());

  Eigen::MatrixXd W = Eigen::MatrixXd::Zero(n, n);
  for_each_row(n, 1, _cancellation_callback, [&](Eigen::Index i) {
    for (Eigen::Index j = i; j < n; ++j) {
      double element = 0.0;
      for (const auto& term : terms) {
        double product = term.coefficient;
        for (Eigen::Index m = 0; m < num_modes; ++m) {
          const int power = term.powers[static_cast<size_t>(m)];
          const int dv = std::abs(qn(i, m) - qn(j, m));
          if (harmonic::is_zero(power, dv)) {
            product = 0.0;
            break;
          }
          product *= harmonic::weight(power, dv, std::max(qn(i, m), qn(j, m)));
        }
        element += product;
      }
      W(i, j) = element;
    }
  });
  mirror_upper_triangle(W);

  return std::make_shared<data::VibrationalHamiltonian>(basis, std::move(W));
}

}  // namespace diven::algorithms::native
