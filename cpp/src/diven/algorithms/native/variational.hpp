// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <diven/algorithms/variational.hpp>
#include <vector>

namespace diven::algorithms::native {

class VariationalSettings : public data::Settings {
 public:
  VariationalSettings() {
    set_default("assignment", "greedy",
                "Labeling of eigenvectors: 'greedy' gives every level a "
                "distinct basis state by descending overlap, 'max_overlap' "
                "takes each eigenvector's largest overlap",
                data::ListConstraint<std::string>{{"greedy", "max_overlap"}});
  }
  ~VariationalSettings() override = default;
};

/**
 * @brief Result of labeling eigenvectors with basis states
 */
struct LevelAssignment {
  std::vector<size_t> labels;  ///< Basis index per eigenvector
  size_t num_ambiguous = 0;    ///< Eigenvectors that lost their first choice
};

/**
 * @brief Label eigenvectors by a global greedy matching
 *
 * All (eigenvector, basis state) pairs are taken in order of descending
 * overlap, then ascending eigenvector index, then ascending basis index,
 * whenever neither side is taken yet. The labels form a permutation.
 *
 * @param overlaps Squared overlaps, basis states as rows and eigenvectors
 * as columns
 */
LevelAssignment assign_greedy(const Eigen::MatrixXd& overlaps);

/**
 * @brief Label each eigenvector with its largest overlap
 *
 * Ties go to the lowest basis index. Labels may repeat; every repeated
 * claim is counted as ambiguous.
 *
 * @param overlaps Squared overlaps, basis states as rows and eigenvectors
 * as columns
 */
LevelAssignment assign_max_overlap(const Eigen::MatrixXd& overlaps);

class EigenVariationalSolver : public diven::algorithms::VariationalSolver {
 public:
  EigenVariationalSolver() {
    _settings = std::make_unique<VariationalSettings>();
  };
  ~EigenVariationalSolver() override = default;

  virtual std::string name() const final { return "eigen"; };

 protected:
  std::shared_ptr<data::VibrationalSpectrum> _run_impl(
      std::shared_ptr<const data::VibrationalHamiltonian> hamiltonian,
      std::optional<double> reference_energy) const override;
};

}  // namespace diven::algorithms::native
