// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <diven/algorithms/perturbation_matrix.hpp>
#include <diven/algorithms/zero_order_states.hpp>
#include <diven/errors.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "ut_common.hpp"

using namespace diven::algorithms;
using namespace diven::data;
using diven::CalculationCancelled;
using diven::ConfigurationError;
using diven::DomainLimitError;

namespace {

std::shared_ptr<AnharmonicPotential> single_mode_potential(
    const std::vector<int>& powers, const std::vector<double>& coefficients) {
  Eigen::VectorXd frequencies(1);
  frequencies << 1.0;
  Eigen::MatrixXi p(static_cast<Eigen::Index>(powers.size()), 1);
  Eigen::VectorXd c(static_cast<Eigen::Index>(coefficients.size()));
  for (size_t k = 0; k < powers.size(); ++k) {
    p(static_cast<Eigen::Index>(k), 0) = powers[k];
    c(static_cast<Eigen::Index>(k)) = coefficients[k];
  }
  return std::make_shared<AnharmonicPotential>(frequencies, p, c);
}

}  // namespace

class PerturbationMatrixTest : public ::testing::Test {
 protected:
  void SetUp() override {
    potential_ = testing::create_test_potential();
    basis_ = enumerate_zero_order_states(9000.0, potential_->get_frequencies());
  }

  std::shared_ptr<AnharmonicPotential> potential_;
  std::shared_ptr<VibrationalBasis> basis_;
};

TEST_F(PerturbationMatrixTest, FactoryRegistry) {
  const auto names = PerturbationMatrixBuilderFactory::available();
  EXPECT_NE(std::find(names.begin(), names.end(), "tabulated"), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "closed_form"), names.end());

  auto builder = PerturbationMatrixBuilderFactory::create();
  EXPECT_EQ(builder->name(), "tabulated");
  EXPECT_EQ(builder->type_name(), "perturbation_matrix_builder");
  EXPECT_EQ(builder->settings().get<std::string>("out_of_range_order"),
            "ignore");
  EXPECT_EQ(builder->settings().get<int64_t>("num_threads"), 0);

  EXPECT_EQ(PerturbationMatrixBuilderFactory::create("closed_form")->name(),
            "closed_form");
  EXPECT_THROW(PerturbationMatrixBuilderFactory::create("sparse"),
               std::runtime_error);
}

TEST_F(PerturbationMatrixTest, SingleModeQuadratic) {
  // 0.5 q^2 couples v with v and v +- 2 only
  const auto potential = single_mode_potential({2}, {0.5});
  const auto basis =
      testing::create_basis(potential->get_frequencies(), {{0}, {1}, {2}, {3}});

  auto builder = PerturbationMatrixBuilderFactory::create("tabulated");
  const auto hamiltonian = builder->run(potential, basis);
  const auto& W = hamiltonian->get_perturbation_matrix();

  ASSERT_EQ(W.rows(), 4);
  for (int v = 0; v < 4; ++v) {
    EXPECT_NEAR(W(v, v), 0.5 * (v + 0.5), testing::matrix_element_tolerance);
  }
  EXPECT_NEAR(W(0, 2), 0.25 * std::sqrt(2.0), testing::matrix_element_tolerance);
  EXPECT_NEAR(W(1, 3), 0.25 * std::sqrt(6.0), testing::matrix_element_tolerance);
  EXPECT_EQ(W(0, 1), 0.0);
  EXPECT_EQ(W(1, 2), 0.0);
  EXPECT_EQ(W(0, 3), 0.0);
  EXPECT_EQ(W(2, 0), W(0, 2));
}

TEST_F(PerturbationMatrixTest, BilinearCoupling) {
  Eigen::VectorXd frequencies(2);
  frequencies << 1.0, 2.0;
  Eigen::MatrixXi powers(1, 2);
  powers << 1, 1;
  Eigen::VectorXd coefficients(1);
  coefficients << 2.0;
  auto potential =
      std::make_shared<AnharmonicPotential>(frequencies, powers, coefficients);
  const auto basis =
      testing::create_basis(frequencies, {{0, 0}, {1, 0}, {1, 1}});

  const auto hamiltonian =
      PerturbationMatrixBuilderFactory::create()->run(potential, basis);
  const auto& W = hamiltonian->get_perturbation_matrix();

  // 2 * sqrt(1/2) * sqrt(1/2)
  EXPECT_NEAR(W(0, 2), 1.0, testing::matrix_element_tolerance);
  // The second mode does not change, so q_2 contributes nothing
  EXPECT_EQ(W(0, 1), 0.0);
  EXPECT_EQ(W(1, 2), 0.0);
  EXPECT_EQ(W(0, 0), 0.0);
}

TEST_F(PerturbationMatrixTest, SymmetricAndCarriesBasisEnergies) {
  const auto hamiltonian =
      PerturbationMatrixBuilderFactory::create()->run(potential_, basis_);
  const auto& W = hamiltonian->get_perturbation_matrix();

  ASSERT_EQ(static_cast<size_t>(W.rows()), basis_->get_num_states());
  EXPECT_TRUE(W == W.transpose());
  EXPECT_EQ(hamiltonian->get_zero_order_energies(), basis_->get_energies());
  EXPECT_EQ(hamiltonian->get_basis(), basis_);
  EXPECT_GT(W.cwiseAbs().maxCoeff(), 0.0);
}

TEST_F(PerturbationMatrixTest, TabulatedMatchesClosedForm) {
  const auto tabulated = PerturbationMatrixBuilderFactory::create("tabulated")
                             ->run(potential_, basis_);
  const auto closed_form =
      PerturbationMatrixBuilderFactory::create("closed_form")
          ->run(potential_, basis_);
  const Eigen::MatrixXd difference = tabulated->get_perturbation_matrix() -
                                     closed_form->get_perturbation_matrix();
  EXPECT_LT(difference.cwiseAbs().maxCoeff(),
            testing::matrix_element_tolerance);
}

TEST_F(PerturbationMatrixTest, ThreadCountDoesNotChangeResult) {
  auto serial = PerturbationMatrixBuilderFactory::create();
  serial->settings().set("num_threads", 1);
  auto parallel = PerturbationMatrixBuilderFactory::create();
  parallel->settings().set("num_threads", 3);

  const auto a = serial->run(potential_, basis_);
  const auto b = parallel->run(potential_, basis_);
  EXPECT_TRUE(a->get_perturbation_matrix() == b->get_perturbation_matrix());
}

TEST_F(PerturbationMatrixTest, InconsistentInputs) {
  auto builder = PerturbationMatrixBuilderFactory::create();

  auto empty = std::make_shared<VibrationalBasis>(3, std::vector<ZeroOrderState>{});
  EXPECT_THROW(builder->run(potential_, empty), ConfigurationError);

  Eigen::VectorXd two_modes(2);
  two_modes << 1000.0, 1500.0;
  const auto small = testing::create_basis(two_modes, {{0, 0}, {1, 0}});
  EXPECT_THROW(builder->run(potential_, small), ConfigurationError);
}

TEST_F(PerturbationMatrixTest, PowersAboveEightAreIgnoredByDefault) {
  const auto potential = single_mode_potential({9, 2}, {100.0, 0.5});
  const auto basis = testing::create_basis(potential->get_frequencies(),
                                           {{0}, {1}, {2}, {3}});
  const auto reference = single_mode_potential({2}, {0.5});

  for (const std::string name : {"tabulated", "closed_form"}) {
    auto builder = PerturbationMatrixBuilderFactory::create(name);
    const auto W = builder->run(potential, basis)->get_perturbation_matrix();
    const auto expected = PerturbationMatrixBuilderFactory::create(name)
                              ->run(reference, basis)
                              ->get_perturbation_matrix();
    EXPECT_TRUE(W == expected) << name;
  }
}

TEST_F(PerturbationMatrixTest, PowersAboveEightCanThrow) {
  const auto potential = single_mode_potential({9}, {1.0});
  const auto basis =
      testing::create_basis(potential->get_frequencies(), {{0}, {1}});

  auto builder = PerturbationMatrixBuilderFactory::create();
  builder->settings().set("out_of_range_order", "throw");
  EXPECT_THROW(builder->run(potential, basis), DomainLimitError);

  auto bad_policy = PerturbationMatrixBuilderFactory::create();
  EXPECT_THROW(bad_policy->settings().set("out_of_range_order", "clamp"),
               std::invalid_argument);
}

TEST_F(PerturbationMatrixTest, CancellationStopsTheBuild) {
  for (const std::string name : {"tabulated", "closed_form"}) {
    auto builder = PerturbationMatrixBuilderFactory::create(name);
    builder->set_cancellation_callback([]() { return true; });
    EXPECT_THROW(builder->run(potential_, basis_), CalculationCancelled)
        << name;
  }
}

TEST_F(PerturbationMatrixTest, CallbackIsPolled) {
  std::atomic<int> calls{0};
  auto builder = PerturbationMatrixBuilderFactory::create();
  builder->set_cancellation_callback([&calls]() {
    ++calls;
    return false;
  });
  const auto hamiltonian = builder->run(potential_, basis_);
  EXPECT_GE(calls.load(), 1);
  EXPECT_EQ(hamiltonian->get_num_states(), basis_->get_num_states());
}

TEST_F(PerturbationMatrixTest, CallbackErrorsPropagate) {
  auto builder = PerturbationMatrixBuilderFactory::create("closed_form");
  int calls = 0;
  builder->set_cancellation_callback([&calls]() -> bool {
    if (++calls > 2) {
      throw std::logic_error("progress sink closed");
    }
    return false;
  });
  EXPECT_THROW(builder->run(potential_, basis_), std::logic_error);
}

TEST_F(PerturbationMatrixTest, SettingsLockAfterRun) {
  auto builder = PerturbationMatrixBuilderFactory::create();
  builder->run(potential_, basis_);
  EXPECT_TRUE(builder->settings().is_locked());
  EXPECT_THROW(builder->settings().set("num_threads", 2),
               diven::data::SettingsAreLocked);
}
