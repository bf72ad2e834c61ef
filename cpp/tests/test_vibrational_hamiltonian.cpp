// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <diven/algorithms/perturbation_matrix.hpp>
#include <diven/algorithms/vibrational_matrix.hpp>
#include <diven/algorithms/zero_order_states.hpp>
#include <diven/data/vibrational_hamiltonian.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "ut_common.hpp"

using namespace diven::algorithms;
using namespace diven::data;

class VibrationalHamiltonianTest : public ::testing::Test {
 protected:
  void SetUp() override {
    potential_ = testing::create_test_potential();
    basis_ = enumerate_zero_order_states(8000.0, potential_->get_frequencies());
    hamiltonian_ =
        PerturbationMatrixBuilderFactory::create()->run(potential_, basis_);
    shifts_.resize(3);
    shifts_ << 3.5, -1.25, 0.75;
  }

  std::shared_ptr<AnharmonicPotential> potential_;
  std::shared_ptr<VibrationalBasis> basis_;
  std::shared_ptr<VibrationalHamiltonian> hamiltonian_;
  Eigen::VectorXd shifts_;
};

TEST_F(VibrationalHamiltonianTest, HamiltonianMatrix) {
  const Eigen::MatrixXd H = hamiltonian_->get_hamiltonian_matrix();
  const auto& W = hamiltonian_->get_perturbation_matrix();
  const auto& E0 = hamiltonian_->get_zero_order_energies();

  const Eigen::MatrixXd difference = H - W;
  EXPECT_LT((difference.diagonal() - E0).cwiseAbs().maxCoeff(),
            testing::energy_tolerance);
  Eigen::MatrixXd stripped = difference;
  stripped.diagonal().setZero();
  EXPECT_EQ(stripped.cwiseAbs().maxCoeff(), 0.0);

  EXPECT_TRUE(add_zero_order_energies(W, E0) == H);
}

TEST_F(VibrationalHamiltonianTest, AddZeroOrderEnergiesChecksSizes) {
  Eigen::MatrixXd W = Eigen::MatrixXd::Zero(3, 3);
  Eigen::VectorXd energies(2);
  energies << 1.0, 2.0;
  EXPECT_THROW(add_zero_order_energies(W, energies), std::invalid_argument);

  Eigen::MatrixXd rectangular = Eigen::MatrixXd::Zero(2, 3);
  EXPECT_THROW(add_zero_order_energies(rectangular, energies),
               std::invalid_argument);
}

TEST_F(VibrationalHamiltonianTest, ShiftPreservesHamiltonian) {
  const Eigen::MatrixXd before = hamiltonian_->get_hamiltonian_matrix();
  const Eigen::MatrixXd W_before = hamiltonian_->get_perturbation_matrix();
  const Eigen::VectorXd E_before = hamiltonian_->get_zero_order_energies();

  hamiltonian_->shift_frequencies(shifts_);

  const Eigen::MatrixXd after = hamiltonian_->get_hamiltonian_matrix();
  EXPECT_LT((after - before).cwiseAbs().maxCoeff(), testing::energy_tolerance);

  // Ground state: d = 0.5 * (3.5 - 1.25 + 0.75)
  const auto ground = basis_->find_state({0, 0, 0});
  ASSERT_TRUE(ground.has_value());
  const auto g = static_cast<Eigen::Index>(*ground);
  EXPECT_NEAR(hamiltonian_->get_zero_order_energies()(g) - E_before(g), 1.5,
              testing::numerical_zero_tolerance);
  EXPECT_NEAR(W_before(g, g) - hamiltonian_->get_perturbation_matrix()(g, g),
              1.5, testing::numerical_zero_tolerance);

  // Off-diagonal couplings are untouched
  Eigen::MatrixXd off = hamiltonian_->get_perturbation_matrix() - W_before;
  off.diagonal().setZero();
  EXPECT_EQ(off.cwiseAbs().maxCoeff(), 0.0);
}

TEST_F(VibrationalHamiltonianTest, ZeroShiftIsExactNoOp) {
  const Eigen::MatrixXd W_before = hamiltonian_->get_perturbation_matrix();
  const Eigen::VectorXd E_before = hamiltonian_->get_zero_order_energies();

  hamiltonian_->shift_frequencies(Eigen::VectorXd::Zero(3));
  EXPECT_TRUE(hamiltonian_->get_perturbation_matrix() == W_before);
  EXPECT_TRUE(hamiltonian_->get_zero_order_energies() == E_before);

  Eigen::VectorXd energies = E_before;
  Eigen::MatrixXd W = W_before;
  shift_frequencies(Eigen::VectorXd::Zero(3), basis_->get_quantum_numbers(),
                    energies, W);
  EXPECT_TRUE(W == W_before);
  EXPECT_TRUE(energies == E_before);
}

TEST_F(VibrationalHamiltonianTest, FreeFunctionMatchesMember) {
  Eigen::VectorXd energies = hamiltonian_->get_zero_order_energies();
  Eigen::MatrixXd W = hamiltonian_->get_perturbation_matrix();
  shift_frequencies(shifts_, basis_->get_quantum_numbers(), energies, W);

  hamiltonian_->shift_frequencies(shifts_);
  EXPECT_LT((energies - hamiltonian_->get_zero_order_energies())
                .cwiseAbs()
                .maxCoeff(),
            testing::numerical_zero_tolerance * 1e4);
  EXPECT_LT((W - hamiltonian_->get_perturbation_matrix()).cwiseAbs().maxCoeff(),
            testing::numerical_zero_tolerance * 1e4);
}

TEST_F(VibrationalHamiltonianTest, ShiftChecksSizes) {
  Eigen::VectorXd two(2);
  two << 1.0, 2.0;
  EXPECT_THROW(hamiltonian_->shift_frequencies(two), std::invalid_argument);

  Eigen::VectorXd energies = hamiltonian_->get_zero_order_energies();
  Eigen::MatrixXd W = hamiltonian_->get_perturbation_matrix();
  EXPECT_THROW(
      shift_frequencies(two, basis_->get_quantum_numbers(), energies, W),
      std::invalid_argument);

  Eigen::VectorXd short_energies = energies.head(energies.size() - 1);
  EXPECT_THROW(shift_frequencies(shifts_, basis_->get_quantum_numbers(),
                                 short_energies, W),
               std::invalid_argument);
}

TEST_F(VibrationalHamiltonianTest, Validation) {
  const auto n = static_cast<Eigen::Index>(basis_->get_num_states());
  EXPECT_THROW(VibrationalHamiltonian(nullptr, Eigen::MatrixXd::Zero(n, n)),
               std::invalid_argument);
  EXPECT_THROW(VibrationalHamiltonian(basis_, Eigen::MatrixXd::Zero(n, n + 1)),
               std::invalid_argument);
  EXPECT_THROW(VibrationalHamiltonian(basis_, Eigen::MatrixXd::Zero(n, n),
                                      Eigen::VectorXd::Zero(n - 1)),
               std::invalid_argument);
}

TEST_F(VibrationalHamiltonianTest, Serialization) {
  hamiltonian_->shift_frequencies(shifts_);

  const auto from_json = VibrationalHamiltonian::from_json(hamiltonian_->to_json());
  EXPECT_EQ(from_json->get_num_states(), hamiltonian_->get_num_states());
  EXPECT_TRUE(from_json->get_perturbation_matrix().isApprox(
      hamiltonian_->get_perturbation_matrix(), testing::json_tolerance));
  EXPECT_TRUE(from_json->get_zero_order_energies().isApprox(
      hamiltonian_->get_zero_order_energies(), testing::json_tolerance));
  EXPECT_EQ(from_json->get_basis()->get_quantum_numbers(),
            basis_->get_quantum_numbers());

  const auto path = testing::temp_path("test.vibrational_hamiltonian.h5");
  hamiltonian_->to_file(path, "hdf5");
  const auto from_hdf5 = VibrationalHamiltonian::from_file(path, "hdf5");
  std::filesystem::remove(path);
  EXPECT_TRUE(from_hdf5->get_hamiltonian_matrix().isApprox(
      hamiltonian_->get_hamiltonian_matrix(), testing::hdf5_tolerance));
  EXPECT_EQ(from_hdf5->get_basis()->get_quantum_numbers(),
            basis_->get_quantum_numbers());

  EXPECT_THROW(hamiltonian_->to_json_file(
                   testing::temp_path("hamiltonian.vibrational_basis.json")),
               std::invalid_argument);
}
