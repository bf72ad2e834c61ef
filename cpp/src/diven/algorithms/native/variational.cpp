// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "variational.hpp"

// STL Headers
#include <algorithm>
#include <numeric>
#include <queue>
#include <stdexcept>
#include <tuple>

// Eigen Headers
#include <Eigen/Eigenvalues>

// DivEn Headers
#include <diven/errors.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/timer.hpp>

namespace diven::algorithms::native {

namespace {

struct Candidate {
  double overlap;
  Eigen::Index eigenvector;
  Eigen::Index basis_state;
};

// True if a is visited after b: larger overlap first, then lower eigenvector
// index, then lower basis index
struct VisitedLater {
  bool operator()(const Candidate& a, const Candidate& b) const {
    if (a.overlap != b.overlap) {
      return a.overlap < b.overlap;
    }
    return std::tie(a.eigenvector, a.basis_state) >
           std::tie(b.eigenvector, b.basis_state);
  }
};

// Largest overlap of eigenvector k among free basis states, lowest index on
// ties
Candidate best_free(const Eigen::MatrixXd& overlaps, Eigen::Index k,
                    const std::vector<bool>& taken) {
  Candidate best{-1.0, k, -1};
  for (Eigen::Index b = 0; b < overlaps.rows(); ++b) {
    if (!taken[static_cast<size_t>(b)] && overlaps(b, k) > best.overlap) {
      best.overlap = overlaps(b, k);
      best.basis_state = b;
    }
  }
  return best;
}

}  // namespace

LevelAssignment assign_greedy(const Eigen::MatrixXd& overlaps) {
  const Eigen::Index n = overlaps.rows();
  if (overlaps.cols() != n) {
    throw std::invalid_argument("Greedy assignment needs a square overlap "
                                "matrix");
  }

  LevelAssignment result;
  result.labels.assign(static_cast<size_t>(n), 0);
  std::vector<bool> taken(static_cast<size_t>(n), false);
  const std::vector<bool> none_taken(static_cast<size_t>(n), false);

  // Every unassigned eigenvector keeps one candidate in the queue. A
  // candidate whose basis state was claimed since it was found is replaced
  // by the eigenvector's best remaining state, so each pop yields the
  // globally best free pair.
  std::priority_queue<Candidate, std::vector<Candidate>, VisitedLater> queue;
  std::vector<Eigen::Index> first_choice(static_cast<size_t>(n));
  for (Eigen::Index k = 0; k < n; ++k) {
    const Candidate candidate = best_free(overlaps, k, none_taken);
    first_choice[static_cast<size_t>(k)] = candidate.basis_state;
    queue.push(candidate);
  }

  while (!queue.empty()) {
    const Candidate top = queue.top();
    queue.pop();
    if (taken[static_cast<size_t>(top.basis_state)]) {
      queue.push(best_free(overlaps, top.eigenvector, taken));
      continue;
    }
    taken[static_cast<size_t>(top.basis_state)] = true;
    result.labels[static_cast<size_t>(top.eigenvector)] =
        static_cast<size_t>(top.basis_state);

    const Eigen::Index preferred =
        first_choice[static_cast<size_t>(top.eigenvector)];
    if (preferred != top.basis_state) {
      ++result.num_ambiguous;
      DIVEN_LOGGER().warn(
          "Eigenvector {} overlaps most with basis state {}, which is already "
          "assigned; labeled with basis state {} (overlap {:.6f})",
          top.eigenvector, preferred, top.basis_state, top.overlap);
    }
  }
  return result;
}

LevelAssignment assign_max_overlap(const Eigen::MatrixXd& overlaps) {
  const Eigen::Index n = overlaps.rows();
  LevelAssignment result;
  result.labels.resize(static_cast<size_t>(overlaps.cols()));
  std::vector<Eigen::Index> claimed_by(static_cast<size_t>(n), -1);

  for (Eigen::Index k = 0; k < overlaps.cols(); ++k) {
    Eigen::Index label = 0;
    overlaps.col(k).maxCoeff(&label);
    result.labels[static_cast<size_t>(k)] = static_cast<size_t>(label);
    auto& owner = claimed_by[static_cast<size_t>(label)];
    if (owner >= 0) {
      ++result.num_ambiguous;
      DIVEN_LOGGER().warn(
          "Eigenvectors {} and {} both overlap most with basis state {}",
          owner, k, label);
    } else {
      owner = k;
    }
  }
  return result;
}

std::shared_ptr<data::VibrationalSpectrum> EigenVariationalSolver::_run_impl(
    std::shared_ptr<const data::VibrationalHamiltonian> hamiltonian,
    std::optional<double> reference_energy) const {
  DIVEN_LOG_TRACE_ENTERING();
  utils::AutoTimer timer("VariationalSolver::eigen");

  const size_t n = hamiltonian->get_num_states();
  if (n == 0) {
    throw ConfigurationError("cannot diagonalize an empty Hamiltonian");
  }
  const auto policy = _settings->get<std::string>("assignment");
  DIVEN_LOGGER().info("Diagonalizing {}x{} Hamiltonian, {} assignment", n, n,
                      policy);

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(
      hamiltonian->get_hamiltonian_matrix());
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error("Eigen decomposition of the vibrational "
                             "Hamiltonian did not converge");
  }
  const Eigen::VectorXd& eigenvalues = solver.eigenvalues();
  const Eigen::MatrixXd& eigenvectors = solver.eigenvectors();
  const Eigen::MatrixXd overlaps = eigenvectors.cwiseAbs2();

  const LevelAssignment assignment = policy == "max_overlap"
                                         ? assign_max_overlap(overlaps)
                                         : assign_greedy(overlaps);
  if (assignment.num_ambiguous > 0) {
    DIVEN_LOGGER().warn("{} of {} levels have an ambiguous assignment",
                        assignment.num_ambiguous, n);
  }

  // Levels ordered by assigned basis index, eigenvalue order among equals
  std::vector<size_t> order(n);
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return assignment.labels[a] < assignment.labels[b];
  });

  const double reference = reference_energy.value_or(eigenvalues(0));
  const auto& basis = hamiltonian->get_basis();
  const auto& basis_labels = basis->get_quantum_numbers();

  const auto num_levels = static_cast<Eigen::Index>(n);
  Eigen::MatrixXi labels(num_levels, basis_labels.cols());
  Eigen::VectorXd energies(num_levels);
  Eigen::MatrixXd vectors(eigenvectors.rows(), num_levels);
  std::vector<size_t> assigned(n);
  for (size_t level = 0; level < n; ++level) {
    const auto k = static_cast<Eigen::Index>(order[level]);
    const auto row = static_cast<Eigen::Index>(level);
    const size_t label = assignment.labels[order[level]];
    labels.row(row) = basis_labels.row(static_cast<Eigen::Index>(label));
    energies(row) = eigenvalues(k) - reference;
    vectors.col(row) = eigenvectors.col(k);
    assigned[level] = label;
  }

  return std::make_shared<data::VibrationalSpectrum>(
      std::move(labels), std::move(energies), std::move(vectors),
      std::move(assigned), reference, assignment.num_ambiguous);
}

}  // namespace diven::algorithms::native
