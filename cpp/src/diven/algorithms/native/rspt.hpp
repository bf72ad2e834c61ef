// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <diven/algorithms/rspt.hpp>

namespace diven::algorithms::native {

class PerturbationSeriesSettings : public data::Settings {
 public:
  PerturbationSeriesSettings() {
    set_default("order", 20, "Number of series coefficients",
                data::BoundConstraint<int64_t>{2, 10000});
    set_default("precision_digits", 50,
                "Significant decimal digits of the arithmetic",
                data::BoundConstraint<int64_t>{16, 100000});
  }
  ~PerturbationSeriesSettings() override = default;
};

class GmpPerturbationSeriesGenerator
    : public diven::algorithms::PerturbationSeriesGenerator {
 public:
  GmpPerturbationSeriesGenerator() {
    _settings = std::make_unique<PerturbationSeriesSettings>();
  };
  ~GmpPerturbationSeriesGenerator() override = default;

  virtual std::string name() const final { return "gmp"; };

 protected:
  std::shared_ptr<data::PerturbationSeries> _run_impl(
      std::shared_ptr<const data::VibrationalHamiltonian> hamiltonian,
      size_t target) const override;
};

}  // namespace diven::algorithms::native
