// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cmath>
#include <diven/data/anharmonic_potential.hpp>
#include <diven/errors.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "ut_common.hpp"

using namespace diven::data;
using diven::ConfigurationError;

class AnharmonicPotentialTest : public ::testing::Test {
 protected:
  void SetUp() override { potential_ = testing::create_test_potential(); }

  void TearDown() override {
    for (const auto& path : created_files_) {
      std::filesystem::remove(path);
    }
  }

  std::string write_text(const std::string& name, const std::string& text) {
    const std::string path = testing::temp_path(name);
    std::ofstream file(path);
    file << text;
    file.close();
    created_files_.push_back(path);
    return path;
  }

  std::shared_ptr<AnharmonicPotential> potential_;
  std::vector<std::string> created_files_;
};

TEST_F(AnharmonicPotentialTest, Accessors) {
  EXPECT_EQ(potential_->get_num_modes(), 3u);
  EXPECT_EQ(potential_->get_num_terms(), 6u);
  EXPECT_EQ(potential_->get_max_power(), 4);
  EXPECT_EQ(potential_->get_max_order(), 4);
  EXPECT_DOUBLE_EQ(potential_->get_zero_point_energy(), 2250.0);

  const auto term = potential_->get_term(1);
  EXPECT_EQ(term.powers, (std::vector<int>{1, 2, 0}));
  EXPECT_DOUBLE_EQ(term.coefficient, -8.0);
  EXPECT_EQ(term.order(), 3);

  const auto terms = potential_->get_terms();
  ASSERT_EQ(terms.size(), 6u);
  EXPECT_EQ(terms[5].powers, (std::vector<int>{0, 0, 4}));
  EXPECT_DOUBLE_EQ(terms[5].coefficient, 1.0);

  EXPECT_THROW(potential_->get_term(6), std::out_of_range);
}

TEST_F(AnharmonicPotentialTest, TermListConstructor) {
  Eigen::VectorXd frequencies(2);
  frequencies << 1200.0, 800.0;
  std::vector<AnharmonicTerm> terms(2);
  terms[0].powers = {2, 1};
  terms[0].coefficient = 4.5;
  terms[1].powers = {0, 6};
  terms[1].coefficient = -0.25;

  AnharmonicPotential potential(frequencies, terms);
  EXPECT_EQ(potential.get_num_terms(), 2u);
  EXPECT_EQ(potential.get_powers()(1, 1), 6);
  EXPECT_DOUBLE_EQ(potential.get_coefficients()(0), 4.5);
  EXPECT_EQ(potential.get_max_power(), 6);
  EXPECT_EQ(potential.get_max_order(), 6);

  terms[1].powers = {1, 1, 1};
  EXPECT_THROW(AnharmonicPotential(frequencies, terms), ConfigurationError);
}

TEST_F(AnharmonicPotentialTest, HarmonicOnly) {
  Eigen::VectorXd frequencies(2);
  frequencies << 1.0, 3.0;
  AnharmonicPotential potential(frequencies, Eigen::MatrixXi(),
                                Eigen::VectorXd());
  EXPECT_EQ(potential.get_num_terms(), 0u);
  EXPECT_EQ(potential.get_num_modes(), 2u);
  EXPECT_EQ(potential.get_max_power(), 0);
  EXPECT_EQ(potential.get_max_order(), 0);
  EXPECT_DOUBLE_EQ(potential.get_zero_point_energy(), 2.0);
}

TEST_F(AnharmonicPotentialTest, Validation) {
  Eigen::MatrixXi powers(1, 2);
  powers << 2, 1;
  Eigen::VectorXd coefficients(1);
  coefficients << 1.0;

  Eigen::VectorXd good(2);
  good << 1000.0, 500.0;
  Eigen::VectorXd negative(2);
  negative << 1000.0, -500.0;
  Eigen::VectorXd not_finite(2);
  not_finite << 1000.0, std::numeric_limits<double>::infinity();

  EXPECT_NO_THROW(AnharmonicPotential(good, powers, coefficients));
  EXPECT_THROW(AnharmonicPotential(Eigen::VectorXd(), powers, coefficients),
               ConfigurationError);
  EXPECT_THROW(AnharmonicPotential(negative, powers, coefficients),
               ConfigurationError);
  EXPECT_THROW(AnharmonicPotential(not_finite, powers, coefficients),
               ConfigurationError);

  Eigen::VectorXd three(3);
  three << 1000.0, 500.0, 700.0;
  EXPECT_THROW(AnharmonicPotential(three, powers, coefficients),
               ConfigurationError);

  Eigen::VectorXd two_coefficients(2);
  two_coefficients << 1.0, 2.0;
  EXPECT_THROW(AnharmonicPotential(good, powers, two_coefficients),
               ConfigurationError);

  Eigen::MatrixXi negative_power(1, 2);
  negative_power << 2, -1;
  EXPECT_THROW(AnharmonicPotential(good, negative_power, coefficients),
               std::invalid_argument);

  Eigen::VectorXd nan_coefficient(1);
  nan_coefficient << std::nan("");
  EXPECT_THROW(AnharmonicPotential(good, powers, nan_coefficient),
               std::invalid_argument);
}

TEST_F(AnharmonicPotentialTest, ReadFrequencies) {
  const auto path = write_text("read_frequencies_test.txt",
                               "# harmonic frequencies\n"
                               "1000.5\n"
                               "\n"
                               "  1500.25  \n"
                               "2000\n");
  const auto frequencies = AnharmonicPotential::read_frequencies(path);
  ASSERT_EQ(frequencies.size(), 3);
  EXPECT_DOUBLE_EQ(frequencies(0), 1000.5);
  EXPECT_DOUBLE_EQ(frequencies(1), 1500.25);
  EXPECT_DOUBLE_EQ(frequencies(2), 2000.0);

  const auto bad = write_text("read_frequencies_bad.txt", "1000\n12abc\n");
  EXPECT_THROW(AnharmonicPotential::read_frequencies(bad), std::runtime_error);
  EXPECT_THROW(AnharmonicPotential::read_frequencies(
                   testing::temp_path("no_such_frequencies_file.txt")),
               std::runtime_error);
}

TEST_F(AnharmonicPotentialTest, ReadAnharmonicTerms) {
  const auto path = write_text("read_terms_test.txt",
                               "3 0 0  12.0\n"
                               "1 2 0  -8.0\n"
                               "# quartic\n"
                               "0 0 4  1.0e0\n");
  const auto [powers, coefficients] =
      AnharmonicPotential::read_anharmonic_terms(path);
  ASSERT_EQ(powers.rows(), 3);
  ASSERT_EQ(powers.cols(), 3);
  EXPECT_EQ(powers(1, 1), 2);
  EXPECT_EQ(powers(2, 2), 4);
  EXPECT_DOUBLE_EQ(coefficients(0), 12.0);
  EXPECT_DOUBLE_EQ(coefficients(1), -8.0);
  EXPECT_DOUBLE_EQ(coefficients(2), 1.0);

  const auto ragged = write_text("read_terms_ragged.txt", "3 0 0 1.0\n1 2 4\n");
  EXPECT_THROW(AnharmonicPotential::read_anharmonic_terms(ragged),
               std::runtime_error);

  const auto fractional =
      write_text("read_terms_fractional.txt", "1.5 0 0 1.0\n");
  EXPECT_THROW(AnharmonicPotential::read_anharmonic_terms(fractional),
               std::runtime_error);

  const auto negative = write_text("read_terms_negative.txt", "2 -1 1.0\n");
  EXPECT_THROW(AnharmonicPotential::read_anharmonic_terms(negative),
               std::runtime_error);

  const auto single = write_text("read_terms_single.txt", "1.0\n");
  EXPECT_THROW(AnharmonicPotential::read_anharmonic_terms(single),
               std::runtime_error);
}

TEST_F(AnharmonicPotentialTest, FromTextFiles) {
  const auto frequencies = write_text("from_text_frequencies.txt",
                                      "1000\n1500\n2000\n");
  const auto terms = write_text("from_text_terms.txt",
                                "3 0 0 12\n1 2 0 -8\n2 0 1 15\n");
  const auto potential =
      AnharmonicPotential::from_text_files(frequencies, terms);
  EXPECT_EQ(potential->get_num_modes(), 3u);
  EXPECT_EQ(potential->get_num_terms(), 3u);
  EXPECT_DOUBLE_EQ(potential->get_coefficients()(2), 15.0);

  const auto two_mode_terms =
      write_text("from_text_two_mode_terms.txt", "3 0 12\n");
  EXPECT_THROW(AnharmonicPotential::from_text_files(frequencies, two_mode_terms),
               ConfigurationError);

  const auto empty_terms = write_text("from_text_empty_terms.txt", "# none\n");
  const auto harmonic =
      AnharmonicPotential::from_text_files(frequencies, empty_terms);
  EXPECT_EQ(harmonic->get_num_terms(), 0u);
}

TEST_F(AnharmonicPotentialTest, JsonSerialization) {
  const auto j = potential_->to_json();
  EXPECT_EQ(j["type"].get<std::string>(), "anharmonic_potential");

  const auto restored = AnharmonicPotential::from_json(j);
  EXPECT_TRUE(restored->get_frequencies().isApprox(
      potential_->get_frequencies(), testing::json_tolerance));
  EXPECT_EQ(restored->get_powers(), potential_->get_powers());
  EXPECT_TRUE(restored->get_coefficients().isApprox(
      potential_->get_coefficients(), testing::json_tolerance));

  const auto path = testing::temp_path("test.anharmonic_potential.json");
  created_files_.push_back(path);
  potential_->to_json_file(path);
  const auto from_file = AnharmonicPotential::from_json_file(path);
  EXPECT_EQ(from_file->get_num_terms(), 6u);
  EXPECT_EQ(from_file->get_powers(), potential_->get_powers());
}

TEST_F(AnharmonicPotentialTest, Hdf5Serialization) {
  const auto path = testing::temp_path("test.anharmonic_potential.h5");
  created_files_.push_back(path);
  potential_->to_file(path, "hdf5");

  const auto restored = AnharmonicPotential::from_file(path, "hdf5");
  EXPECT_TRUE(restored->get_frequencies().isApprox(
      potential_->get_frequencies(), testing::hdf5_tolerance));
  EXPECT_EQ(restored->get_powers(), potential_->get_powers());
  EXPECT_TRUE(restored->get_coefficients().isApprox(
      potential_->get_coefficients(), testing::hdf5_tolerance));
}

TEST_F(AnharmonicPotentialTest, FileNameValidation) {
  EXPECT_THROW(potential_->to_json_file(testing::temp_path("potential.json")),
               std::invalid_argument);
  EXPECT_THROW(potential_->to_hdf5_file(
                   testing::temp_path("potential.vibrational_basis.h5")),
               std::invalid_argument);
  EXPECT_THROW(potential_->to_file(
                   testing::temp_path("potential.anharmonic_potential.xyz"),
                   "xyz"),
               std::invalid_argument);
  EXPECT_THROW(AnharmonicPotential::from_file(
                   testing::temp_path("potential.anharmonic_potential.json"),
                   "yaml"),
               std::invalid_argument);
}

TEST_F(AnharmonicPotentialTest, Summary) {
  const auto summary = potential_->get_summary();
  EXPECT_NE(summary.find("modes: 3"), std::string::npos);
  EXPECT_NE(summary.find("terms: 6"), std::string::npos);
}
