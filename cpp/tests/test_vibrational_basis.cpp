// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <diven/data/vibrational_basis.hpp>
#include <diven/errors.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ut_common.hpp"

using namespace diven::data;

class VibrationalBasisTest : public ::testing::Test {
 protected:
  void SetUp() override {
    frequencies_.resize(2);
    frequencies_ << 1000.0, 1600.0;
    basis_ = testing::create_basis(frequencies_,
                                   {{0, 0}, {1, 0}, {0, 1}, {2, 0}, {1, 1}});
  }

  void TearDown() override {
    for (const auto& path : created_files_) {
      std::filesystem::remove(path);
    }
  }

  std::string track(const std::string& filename) {
    const auto path = testing::temp_path(filename);
    created_files_.push_back(path);
    return path;
  }

  Eigen::VectorXd frequencies_;
  std::shared_ptr<VibrationalBasis> basis_;
  std::vector<std::string> created_files_;
};

TEST_F(VibrationalBasisTest, Accessors) {
  EXPECT_EQ(basis_->get_num_states(), 5u);
  EXPECT_EQ(basis_->get_num_modes(), 2u);
  EXPECT_FALSE(basis_->empty());
  EXPECT_EQ(basis_->get_max_quantum_number(), 2);

  const auto state = basis_->get_state(4);
  EXPECT_EQ(state.quantum_numbers, (std::vector<int>{1, 1}));
  EXPECT_DOUBLE_EQ(state.energy, 1500.0 + 2400.0);
  EXPECT_DOUBLE_EQ(basis_->get_energies()(0), 1300.0);

  EXPECT_THROW(basis_->get_state(5), std::out_of_range);
}

TEST_F(VibrationalBasisTest, FindState) {
  EXPECT_EQ(basis_->find_state({0, 0}), std::optional<size_t>(0));
  EXPECT_EQ(basis_->find_state({2, 0}), std::optional<size_t>(3));
  EXPECT_FALSE(basis_->find_state({0, 2}).has_value());
  EXPECT_FALSE(basis_->find_state({0, 0, 0}).has_value());
}

TEST_F(VibrationalBasisTest, EmptyBasis) {
  VibrationalBasis empty(3, std::vector<ZeroOrderState>{});
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.get_num_modes(), 3u);
  EXPECT_EQ(empty.get_max_quantum_number(), 0);
  EXPECT_EQ(empty.to_table(), "");
  EXPECT_NE(empty.get_summary().find("empty"), std::string::npos);
}

TEST_F(VibrationalBasisTest, Validation) {
  ZeroOrderState short_state;
  short_state.quantum_numbers = {1};
  short_state.energy = 1.0;
  EXPECT_THROW(VibrationalBasis(2, std::vector<ZeroOrderState>{short_state}),
               std::invalid_argument);

  Eigen::MatrixXi labels(2, 2);
  labels << 0, 0, 1, 0;
  Eigen::VectorXd one_energy(1);
  one_energy << 0.5;
  EXPECT_THROW(VibrationalBasis(labels, one_energy), std::invalid_argument);

  Eigen::MatrixXi negative(1, 2);
  negative << 0, -1;
  EXPECT_THROW(VibrationalBasis(negative, one_energy), std::invalid_argument);
}

TEST_F(VibrationalBasisTest, RepeatedStatesAreRejected) {
  Eigen::VectorXd frequency(1);
  frequency << 1.0;
  EXPECT_THROW(testing::create_basis(frequency, {{1}, {1}}),
               diven::ConfigurationError);

  Eigen::MatrixXi labels(3, 2);
  labels << 0, 0, 1, 0, 0, 0;
  Eigen::VectorXd energies(3);
  energies << 1300.0, 2300.0, 1300.0;
  EXPECT_THROW(VibrationalBasis(labels, energies), diven::ConfigurationError);

  auto j = basis_->to_json();
  j["quantum_numbers"][1] = j["quantum_numbers"][0];
  EXPECT_THROW(VibrationalBasis::from_json(j), diven::ConfigurationError);
}

TEST_F(VibrationalBasisTest, SelectKeepsOrder) {
  const auto odd = basis_->select([](const ZeroOrderState& state) {
    return (state.quantum_numbers[0] + state.quantum_numbers[1]) % 2 == 1;
  });
  ASSERT_EQ(odd->get_num_states(), 2u);
  EXPECT_EQ(odd->get_state(0).quantum_numbers, (std::vector<int>{1, 0}));
  EXPECT_EQ(odd->get_state(1).quantum_numbers, (std::vector<int>{0, 1}));
  EXPECT_DOUBLE_EQ(odd->get_state(1).energy, basis_->get_state(2).energy);

  const auto none = basis_->select([](const ZeroOrderState&) { return false; });
  EXPECT_TRUE(none->empty());
  EXPECT_EQ(none->get_num_modes(), 2u);
}

TEST_F(VibrationalBasisTest, TableFormat) {
  const std::string table = basis_->to_table();
  std::istringstream lines(table);
  std::string line;
  std::vector<std::string> rows;
  while (std::getline(lines, line)) {
    rows.push_back(line);
  }
  ASSERT_EQ(rows.size(), 5u);
  // Two %4d columns followed by one %24.16f column
  for (const auto& row : rows) {
    EXPECT_EQ(row.size(), 4u + 4u + 24u);
  }
  EXPECT_EQ(rows[0], "   0   0   1300.0000000000000000");
  EXPECT_EQ(rows[4], "   1   1   3900.0000000000000000");
}

TEST_F(VibrationalBasisTest, TextFile) {
  const auto path = track("test.vibrational_basis.txt");
  basis_->to_file(path, "txt");

  std::ifstream file(path);
  std::stringstream contents;
  contents << file.rdbuf();
  EXPECT_EQ(contents.str(), basis_->to_table());

  EXPECT_THROW(basis_->to_file(track("basis.txt"), "txt"),
               std::invalid_argument);
}

TEST_F(VibrationalBasisTest, JsonSerialization) {
  const auto restored = VibrationalBasis::from_json(basis_->to_json());
  EXPECT_EQ(restored->get_quantum_numbers(), basis_->get_quantum_numbers());
  EXPECT_TRUE(restored->get_energies().isApprox(basis_->get_energies(),
                                                testing::json_tolerance));

  const auto path = track("test.vibrational_basis.json");
  basis_->to_json_file(path);
  const auto from_file = VibrationalBasis::from_json_file(path);
  EXPECT_EQ(from_file->get_num_states(), 5u);
  EXPECT_EQ(from_file->get_quantum_numbers(), basis_->get_quantum_numbers());
}

TEST_F(VibrationalBasisTest, EmptyJsonKeepsModeCount) {
  VibrationalBasis empty(4, std::vector<ZeroOrderState>{});
  const auto restored = VibrationalBasis::from_json(empty.to_json());
  EXPECT_TRUE(restored->empty());
  EXPECT_EQ(restored->get_num_modes(), 4u);
}

TEST_F(VibrationalBasisTest, Hdf5Serialization) {
  const auto path = track("test.vibrational_basis.h5");
  basis_->to_hdf5_file(path);
  const auto restored = VibrationalBasis::from_hdf5_file(path);
  EXPECT_EQ(restored->get_quantum_numbers(), basis_->get_quantum_numbers());
  EXPECT_TRUE(restored->get_energies().isApprox(basis_->get_energies(),
                                                testing::hdf5_tolerance));
}

TEST_F(VibrationalBasisTest, FileNameValidation) {
  EXPECT_THROW(basis_->to_json_file(track("basis.json")),
               std::invalid_argument);
  EXPECT_THROW(
      VibrationalBasis::from_hdf5_file(track("basis.anharmonic_potential.h5")),
      std::invalid_argument);
  EXPECT_THROW(basis_->to_file(track("basis.vibrational_basis.csv"), "csv"),
               std::invalid_argument);
  EXPECT_THROW(
      VibrationalBasis::from_file(track("basis.vibrational_basis.txt"), "txt"),
      std::invalid_argument);
}
