// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "native/rspt.hpp"

#include <diven/algorithms/rspt.hpp>

namespace diven::algorithms {

std::unique_ptr<PerturbationSeriesGenerator> make_gmp_series_generator() {
  return std::make_unique<native::GmpPerturbationSeriesGenerator>();
}

void PerturbationSeriesGeneratorFactory::register_default_instances() {
  PerturbationSeriesGeneratorFactory::register_instance(
      &make_gmp_series_generator);
}

}  // namespace diven::algorithms
