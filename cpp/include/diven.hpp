// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <diven/algorithms/harmonic_weights.hpp>
#include <diven/algorithms/perturbation_matrix.hpp>
#include <diven/algorithms/rspt.hpp>
#include <diven/algorithms/variational.hpp>
#include <diven/algorithms/vibrational_matrix.hpp>
#include <diven/algorithms/zero_order_states.hpp>
#include <diven/data/anharmonic_potential.hpp>
#include <diven/data/perturbation_series.hpp>
#include <diven/data/settings.hpp>
#include <diven/data/vibrational_basis.hpp>
#include <diven/data/vibrational_hamiltonian.hpp>
#include <diven/data/vibrational_spectrum.hpp>
#include <diven/errors.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/timer.hpp>
