// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <diven/data/data_class.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace diven::data {

/**
 * @brief One term k * q_1^{p_1} ... q_M^{p_M} of the anharmonic potential
 */
struct AnharmonicTerm {
  std::vector<int> powers;   ///< Non-negative power of each normal coordinate
  double coefficient = 0.0;  ///< Force constant k

  /// Total degree of the term
  int order() const;
};

/**
 * @class AnharmonicPotential
 * @brief Harmonic frequencies and anharmonic force field of a molecule
 *
 * The potential is the harmonic part, fixed by M positive frequencies, plus
 * a sum of K product terms in the dimensionless normal coordinates. Terms
 * are stored as a K x M matrix of powers and a vector of K coefficients;
 * their order is irrelevant.
 *
 * Frequencies must be finite and positive, powers non-negative and
 * coefficients finite. Powers above 8 in a single mode are accepted here;
 * the matrix builders decide what to do with them.
 */
class AnharmonicPotential
    : public DataClass,
      public std::enable_shared_from_this<AnharmonicPotential> {
 public:
  /**
   * @brief Construct from dense arrays
   * @param frequencies Harmonic frequencies, one per mode
   * @param powers K x M matrix of non-negative powers
   * @param coefficients K force constants
   * @throws ConfigurationError if frequencies are empty, non-positive or
   * non-finite, or if the dimensions of @p powers and @p coefficients do not
   * match the number of modes and terms
   * @throws std::invalid_argument for negative powers or non-finite
   * coefficients
   */
  AnharmonicPotential(Eigen::VectorXd frequencies, Eigen::MatrixXi powers,
                      Eigen::VectorXd coefficients);

  /**
   * @brief Construct from a list of terms
   * @copydetails AnharmonicPotential(Eigen::VectorXd, Eigen::MatrixXi, Eigen::VectorXd)
   */
  AnharmonicPotential(Eigen::VectorXd frequencies,
                      const std::vector<AnharmonicTerm>& terms);

  AnharmonicPotential(const AnharmonicPotential&) = default;
  AnharmonicPotential(AnharmonicPotential&&) noexcept = default;
  AnharmonicPotential& operator=(const AnharmonicPotential&) = default;
  AnharmonicPotential& operator=(AnharmonicPotential&&) noexcept = default;
  virtual ~AnharmonicPotential() = default;

  const Eigen::VectorXd& get_frequencies() const { return frequencies_; }

  /// K x M matrix of powers, one row per term
  const Eigen::MatrixXi& get_powers() const { return powers_; }

  const Eigen::VectorXd& get_coefficients() const { return coefficients_; }

  size_t get_num_modes() const {
    return static_cast<size_t>(frequencies_.size());
  }

  size_t get_num_terms() const {
    return static_cast<size_t>(coefficients_.size());
  }

  /**
   * @brief Term @p index as a struct
   * @throws std::out_of_range if @p index >= get_num_terms()
   */
  AnharmonicTerm get_term(size_t index) const;

  std::vector<AnharmonicTerm> get_terms() const;

  /// Largest power of any single mode in any term, 0 without terms
  int get_max_power() const;

  /// Largest total degree of any term, 0 without terms
  int get_max_order() const;

  /**
   * @brief Harmonic zero-point energy, half the sum of the frequencies
   */
  double get_zero_point_energy() const { return 0.5 * frequencies_.sum(); }

  // === Text input ===

  /**
   * @brief Read harmonic frequencies, one per line
   *
   * Blank lines and lines starting with '#' are skipped; only the first
   * field of a line is used.
   *
   * @throws std::runtime_error if the file cannot be read or a line is not a
   * number
   */
  static Eigen::VectorXd read_frequencies(const std::string& filename);

  /**
   * @brief Read a whitespace-delimited table of anharmonic terms
   *
   * Each row lists the power of every mode followed by the coefficient, so
   * the number of modes is the column count of the first row minus one.
   * Blank lines and lines starting with '#' are skipped.
   *
   * @return The K x M power matrix and the K coefficients
   * @throws std::runtime_error if the file cannot be read, rows are ragged,
   * or a power is not a non-negative integer
   */
  static std::pair<Eigen::MatrixXi, Eigen::VectorXd> read_anharmonic_terms(
      const std::string& filename);

  /**
   * @brief Build a potential from a frequency file and a term table
   * @throws ConfigurationError if the two files disagree on the number of
   * modes
   */
  static std::shared_ptr<AnharmonicPotential> from_text_files(
      const std::string& frequencies_file, const std::string& terms_file);

  // === DataClass interface ===

  std::string get_data_type_name() const override;

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<AnharmonicPotential> from_file(
      const std::string& filename, const std::string& type);

  static std::shared_ptr<AnharmonicPotential> from_json(
      const nlohmann::json& j);

  static std::shared_ptr<AnharmonicPotential> from_json_file(
      const std::string& filename);

  static std::shared_ptr<AnharmonicPotential> from_hdf5(H5::Group& group);

  static std::shared_ptr<AnharmonicPotential> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  void _validate() const;

  Eigen::VectorXd frequencies_;
  Eigen::MatrixXi powers_;
  Eigen::VectorXd coefficients_;
};

static_assert(DataClassCompliant<AnharmonicPotential>,
              "AnharmonicPotential must derive from DataClass and implement "
              "all required deserialization methods");

}  // namespace diven::data
