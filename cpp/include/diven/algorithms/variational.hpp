// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <diven/algorithms/algorithm.hpp>
#include <diven/data/settings.hpp>
#include <diven/data/vibrational_hamiltonian.hpp>
#include <diven/data/vibrational_spectrum.hpp>
#include <memory>
#include <optional>
#include <string>

namespace diven::algorithms {

/**
 * @class VariationalSolver
 * @brief Abstract base class for diagonalizing a vibrational Hamiltonian in
 * its zero-order basis
 *
 * The eigenvectors of H = W + diag(E0) are labeled with the basis states
 * they overlap most, the levels are reordered by the index of their label,
 * and their energies are reported relative to a reference energy.
 *
 * @see data::VibrationalHamiltonian
 * @see data::VibrationalSpectrum
 */
class VariationalSolver
    : public Algorithm<VariationalSolver,
                       std::shared_ptr<data::VibrationalSpectrum>,
                       std::shared_ptr<const data::VibrationalHamiltonian>,
                       std::optional<double>> {
 public:
  VariationalSolver() = default;
  virtual ~VariationalSolver() = default;

  /**
   * @brief Diagonalize the Hamiltonian and assign the levels
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param hamiltonian Hamiltonian on a zero-order basis
   * @param reference_energy Energy subtracted from every eigenvalue; the
   * lowest eigenvalue when empty
   * \endcond
   * @return Assigned levels ordered by basis index
   *
   * @throws ConfigurationError if the Hamiltonian has no states
   * @throws std::runtime_error if the eigensolver fails
   */
  using Algorithm::run;

  virtual std::string name() const = 0;

  std::string type_name() const final { return "variational_solver"; }

 protected:
  virtual std::shared_ptr<data::VibrationalSpectrum> _run_impl(
      std::shared_ptr<const data::VibrationalHamiltonian> hamiltonian,
      std::optional<double> reference_energy) const = 0;
};

/**
 * @brief Factory for VariationalSolver implementations
 *
 * Registered by default: "eigen", a dense self-adjoint eigensolver.
 */
struct VariationalSolverFactory
    : public AlgorithmFactory<VariationalSolver, VariationalSolverFactory> {
  static std::string algorithm_type_name() { return "variational_solver"; }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "eigen"; }
};

}  // namespace diven::algorithms
