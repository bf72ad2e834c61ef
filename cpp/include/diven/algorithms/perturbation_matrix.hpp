// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <diven/algorithms/algorithm.hpp>
#include <diven/data/anharmonic_potential.hpp>
#include <diven/data/settings.hpp>
#include <diven/data/vibrational_basis.hpp>
#include <diven/data/vibrational_hamiltonian.hpp>
#include <functional>
#include <memory>
#include <string>

namespace diven::algorithms {

/**
 * @class PerturbationMatrixBuilder
 * @brief Abstract base class for assembling the anharmonic perturbation
 * matrix on a zero-order basis
 *
 * For basis states i and j the element is
 * W(i, j) = sum_k c_k prod_m w(n_km, |v_im - v_jm|, max(v_im, v_jm)),
 * where term k has coefficient c_k and powers n_km and w is the harmonic
 * weight. A term contributes only if all of its mode weights are non-zero.
 * The result is exactly symmetric.
 *
 * Implementations share two settings:
 * - "out_of_range_order": "ignore" (terms with a power above 8 contribute
 *   nothing, with one warning per build) or "throw" (DomainLimitError)
 * - "num_threads": OpenMP threads, 0 for the runtime default
 *
 * @see data::AnharmonicPotential
 * @see data::VibrationalHamiltonian
 */
class PerturbationMatrixBuilder
    : public Algorithm<PerturbationMatrixBuilder,
                       std::shared_ptr<data::VibrationalHamiltonian>,
                       std::shared_ptr<const data::AnharmonicPotential>,
                       std::shared_ptr<const data::VibrationalBasis>> {
 public:
  PerturbationMatrixBuilder() = default;
  virtual ~PerturbationMatrixBuilder() = default;

  /**
   * @brief Assemble the perturbation matrix of @p potential on @p basis
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param potential Frequencies and anharmonic terms
   * @param basis Zero-order basis
   * \endcond
   * @return Hamiltonian holding W and the zero-order energies of the basis
   *
   * @throws ConfigurationError if the basis is empty or the mode counts of
   * the potential and the basis differ
   * @throws DomainLimitError for a power above 8 when out_of_range_order is
   * "throw"
   * @throws CalculationCancelled if the cancellation callback returned true
   */
  using Algorithm::run;

  virtual std::string name() const = 0;

  std::string type_name() const final { return "perturbation_matrix_builder"; }

  /**
   * @brief Install a callback polled once per matrix row
   *
   * When the callback returns true the build stops and run() throws
   * CalculationCancelled. An empty function disables polling.
   */
  void set_cancellation_callback(std::function<bool()> callback) {
    _cancellation_callback = std::move(callback);
  }

 protected:
  virtual std::shared_ptr<data::VibrationalHamiltonian> _run_impl(
      std::shared_ptr<const data::AnharmonicPotential> potential,
      std::shared_ptr<const data::VibrationalBasis> basis) const = 0;

  std::function<bool()> _cancellation_callback;
};

/**
 * @brief Factory for PerturbationMatrixBuilder implementations
 *
 * Registered by default:
 * - "tabulated": cached weight tables, OpenMP over rows (default)
 * - "closed_form": direct evaluation of every weight, serial
 */
struct PerturbationMatrixBuilderFactory
    : public AlgorithmFactory<PerturbationMatrixBuilder,
                              PerturbationMatrixBuilderFactory> {
  static std::string algorithm_type_name() {
    return "perturbation_matrix_builder";
  }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "tabulated"; }
};

}  // namespace diven::algorithms
