// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

/**
 * @file vibrational_levels.cpp
 * @brief End-to-end example computing anharmonic vibrational levels with
 * DivEn
 *
 * The workflow:
 * 1. Reading harmonic frequencies and anharmonic force constants from text
 * 2. Enumerating the zero-order harmonic-oscillator basis below a cutoff
 * 3. Assembling the anharmonic perturbation matrix
 * 4. Diagonalizing and assigning the levels
 * 5. Computing the Rayleigh-Schroedinger series of one state
 *
 * Usage:
 *   ./vibrational_levels freqs.txt terms.txt 12000
 *   ./vibrational_levels freqs.txt terms.txt 12000 "1 0 0" 30
 *
 * The frequency file lists one frequency per line. Each row of the term file
 * holds one power per mode followed by the force constant. The optional
 * fourth argument selects the state for perturbation theory (ground state by
 * default) and the fifth the number of perturbation orders.
 */

// DivEn Header Files
// One can also include <diven.hpp> to get all DivEn components
#include <diven/algorithms/perturbation_matrix.hpp>
#include <diven/algorithms/rspt.hpp>
#include <diven/algorithms/variational.hpp>
#include <diven/algorithms/zero_order_states.hpp>
#include <diven/data/anharmonic_potential.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/timer.hpp>

// Standard Library Header Files
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace data = diven::data;
namespace algorithms = diven::algorithms;
namespace utils = diven::utils;

namespace {

std::vector<int> parse_label(const std::string& text) {
  std::istringstream fields(text);
  std::vector<int> label;
  int v = 0;
  while (fields >> v) {
    label.push_back(v);
  }
  if (!fields.eof()) {
    throw std::invalid_argument("Invalid quantum numbers: '" + text + "'");
  }
  return label;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cout << "Usage: " << argv[0]
              << " <frequencies.txt> <terms.txt> <e_max> [\"v1 v2 ...\"] "
                 "[orders]"
              << std::endl;
    std::cout << "Example: " << argv[0] << " hdo.freqs hdo.terms 12000 \"0 0 1\""
              << std::endl;
    return 1;
  }

  // Algorithm configuration and timings are logged at info level
  utils::Logger::set_global_level(utils::LogLevel::info);

  try {
    // ========================================================================
    // STEP 1: INPUT
    // ========================================================================

    auto potential =
        data::AnharmonicPotential::from_text_files(argv[1], argv[2]);
    const double e_max = std::stod(argv[3]);

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "                 DivEn                  \n";
    std::cout << "========================================\n\n";
    std::cout << potential->get_summary() << "\n";
    std::cout << "Energy cutoff: " << e_max << "\n\n";

    // ========================================================================
    // STEP 2: ZERO-ORDER BASIS
    //
    // All harmonic states with E0 <= e_max, counted from the bottom of the
    // well, sorted by energy.
    // ========================================================================

    auto basis = algorithms::enumerate_zero_order_states(
        e_max, potential->get_frequencies());
    std::cout << basis->get_summary() << "\n\n";

    // ========================================================================
    // STEP 3: PERTURBATION MATRIX
    //
    // "tabulated" uses cached harmonic weight tables and OpenMP; set
    // "out_of_range_order" to "throw" to reject force constants above
    // eighth order instead of skipping them.
    // ========================================================================

    auto builder = algorithms::PerturbationMatrixBuilderFactory::create();
    auto hamiltonian = builder->run(potential, basis);
    std::cout << hamiltonian->get_summary() << "\n\n";

    // ========================================================================
    // STEP 4: VARIATIONAL LEVELS
    // ========================================================================

    std::cout << "========================================\n";
    std::cout << "          VARIATIONAL LEVELS            \n";
    std::cout << "========================================\n\n";

    auto solver = algorithms::VariationalSolverFactory::create();
    auto spectrum = solver->run(hamiltonian, std::nullopt);
    std::cout << "Zero-point level: " << std::fixed << std::setprecision(6)
              << spectrum->get_reference_energy() << "\n";
    if (spectrum->get_num_ambiguous_assignments() > 0) {
      std::cout << "Ambiguous assignments: "
                << spectrum->get_num_ambiguous_assignments() << "\n";
    }
    std::cout << "\n" << spectrum->to_table() << "\n";

    // ========================================================================
    // STEP 5: PERTURBATION SERIES
    //
    // The series diverges for states in resonance with a near-degenerate
    // partner; compare its partial sums with the variational level.
    // ========================================================================

    std::cout << "========================================\n";
    std::cout << "         PERTURBATION SERIES            \n";
    std::cout << "========================================\n\n";

    const std::vector<int> label =
        argc > 4 ? parse_label(argv[4])
                 : std::vector<int>(potential->get_num_modes(), 0);
    const auto target = basis->find_state(label);
    if (!target) {
      std::cerr << "State '" << (argc > 4 ? argv[4] : "ground")
                << "' is not in the basis\n";
      return 1;
    }

    auto generator = algorithms::PerturbationSeriesGeneratorFactory::create();
    if (argc > 5) {
      generator->settings().set("order", std::atoi(argv[5]));
    }
    auto series = generator->run(hamiltonian, *target);

    const auto partial = series->get_partial_energies();
    std::cout << "Order  Correction" << std::string(44, ' ')
              << "Partial energy\n";
    for (size_t k = 0; k < series->get_order(); ++k) {
      std::cout << std::setw(5) << k + 1 << "  " << std::setw(56)
                << series->coefficient_to_string(k) << "  " << std::fixed
                << std::setprecision(8)
                << partial(static_cast<Eigen::Index>(k)) << "\n";
    }

    const auto level = spectrum->find_level(label);
    if (level) {
      std::cout << "\nVariational level: "
                << spectrum->get_absolute_energies()(
                       static_cast<Eigen::Index>(*level))
                << "\n";
    }
    std::cout << "\n";

    utils::Timer::log_summary();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "Calculation completed successfully!\n\n";
  return 0;
}
