// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "native/perturbation_matrix.hpp"

#include <diven/algorithms/perturbation_matrix.hpp>

namespace diven::algorithms {

std::unique_ptr<PerturbationMatrixBuilder> make_tabulated_builder() {
  return std::make_unique<native::TabulatedPerturbationMatrixBuilder>();
}

std::unique_ptr<PerturbationMatrixBuilder> make_closed_form_builder() {
  return std::make_unique<native::ClosedFormPerturbationMatrixBuilder>();
}

void PerturbationMatrixBuilderFactory::register_default_instances() {
  PerturbationMatrixBuilderFactory::register_instance(&make_tabulated_builder);
  PerturbationMatrixBuilderFactory::register_instance(
      &make_closed_form_builder);
}

}  // namespace diven::algorithms
