// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "native/variational.hpp"

#include <diven/algorithms/variational.hpp>

namespace diven::algorithms {

std::unique_ptr<VariationalSolver> make_eigen_variational_solver() {
  return std::make_unique<native::EigenVariationalSolver>();
}

void VariationalSolverFactory::register_default_instances() {
  VariationalSolverFactory::register_instance(&make_eigen_variational_solver);
}

}  // namespace diven::algorithms
