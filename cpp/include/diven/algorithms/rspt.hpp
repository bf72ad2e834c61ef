// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <diven/algorithms/algorithm.hpp>
#include <diven/data/perturbation_series.hpp>
#include <diven/data/settings.hpp>
#include <diven/data/vibrational_hamiltonian.hpp>
#include <memory>
#include <string>

namespace diven::algorithms {

/**
 * @class PerturbationSeriesGenerator
 * @brief Abstract base class for Rayleigh-Schroedinger perturbation series
 * of a single zero-order state
 *
 * With H0 = diag(E0) and the perturbation W, the generator produces the
 * energy corrections e_0, e_1, ... of basis state q in intermediate
 * normalization:
 *
 *   e_0 = W(q, q),  psi_1 = R W(:, q),  e_i = W(q, :) psi_i,
 *   psi_i = R (W psi_{i-1} - sum_{j=1}^{i-1} e_{j-1} psi_{i-j}),
 *
 * where R = diag(1 / (E0_q - E0_i)) for i != q and zero at q.
 *
 * @see data::PerturbationSeries
 */
class PerturbationSeriesGenerator
    : public Algorithm<PerturbationSeriesGenerator,
                       std::shared_ptr<data::PerturbationSeries>,
                       std::shared_ptr<const data::VibrationalHamiltonian>,
                       size_t> {
 public:
  PerturbationSeriesGenerator() = default;
  virtual ~PerturbationSeriesGenerator() = default;

  /**
   * @brief Compute the perturbation series of one state
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param hamiltonian Hamiltonian on a zero-order basis
   * @param target Basis index q of the state
   * \endcond
   * @return Series with "order" coefficients
   *
   * @throws std::out_of_range if @p target is not a basis index
   * @throws std::domain_error if another state has exactly the zero-order
   * energy of the target; shift_frequencies() can lift the degeneracy
   */
  using Algorithm::run;

  virtual std::string name() const = 0;

  std::string type_name() const final {
    return "perturbation_series_generator";
  }

 protected:
  virtual std::shared_ptr<data::PerturbationSeries> _run_impl(
      std::shared_ptr<const data::VibrationalHamiltonian> hamiltonian,
      size_t target) const = 0;
};

/**
 * @brief Factory for PerturbationSeriesGenerator implementations
 *
 * Registered by default: "gmp", arbitrary-precision arithmetic with GMP.
 */
struct PerturbationSeriesGeneratorFactory
    : public AlgorithmFactory<PerturbationSeriesGenerator,
                              PerturbationSeriesGeneratorFactory> {
  static std::string algorithm_type_name() {
    return "perturbation_series_generator";
  }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "gmp"; }
};

}  // namespace diven::algorithms
