// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <diven/algorithms/perturbation_matrix.hpp>
#include <diven/data/vibrational_hamiltonian.hpp>

namespace diven::algorithms::native {

class PerturbationMatrixSettings : public data::Settings {
 public:
  PerturbationMatrixSettings() {
    set_default("out_of_range_order", "ignore",
                "Handling of terms with a power above 8: 'ignore' drops "
                "them with a warning, 'throw' raises DomainLimitError",
                data::ListConstraint<std::string>{{"ignore", "throw"}});
    set_default("num_threads", 0,
                "OpenMP threads used for assembly, 0 for the runtime default",
                data::BoundConstraint<int64_t>{0, 4096});
  }
  ~PerturbationMatrixSettings() override = default;
};

/**
 * @brief Production builder: cached weight tables and per-mode pair tables,
 * rows distributed over OpenMP threads
 */
class TabulatedPerturbationMatrixBuilder
    : public diven::algorithms::PerturbationMatrixBuilder {
 public:
  TabulatedPerturbationMatrixBuilder() {
    _settings = std::make_unique<PerturbationMatrixSettings>();
  };
  ~TabulatedPerturbationMatrixBuilder() override = default;

  virtual std::string name() const final { return "tabulated"; };

 protected:
  std::shared_ptr<data::VibrationalHamiltonian> _run_impl(
      std::shared_ptr<const data::AnharmonicPotential> potential,
      std::shared_ptr<const data::VibrationalBasis> basis) const override;
};

/**
 * @brief Reference builder evaluating every weight from its closed form
 */
class ClosedFormPerturbationMatrixBuilder
    : public diven::algorithms::PerturbationMatrixBuilder {
 public:
  ClosedFormPerturbationMatrixBuilder() {
    _settings = std::make_unique<PerturbationMatrixSettings>();
  };
  ~ClosedFormPerturbationMatrixBuilder() override = default;

  virtual std::string name() const final { return "closed_form"; };

 protected:
  std::shared_ptr<data::VibrationalHamiltonian> _run_impl(
      std::shared_ptr<const data::AnharmonicPotential> potential,
      std::shared_ptr<const data::VibrationalBasis> basis) const override;
};

}  // namespace diven::algorithms::native
