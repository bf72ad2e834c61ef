// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>
#include <gmpxx.h>

#include <Eigen/Dense>
#include <diven/data/data_class.hpp>
#include <memory>
#include <string>
#include <vector>

namespace diven::data {

/**
 * @class PerturbationSeries
 * @brief Rayleigh-Schroedinger perturbation coefficients of one state
 *
 * Coefficient e_k is the k-th order correction to the zero-order energy of
 * the target state, so the energy through order K - 1 is
 * E0 + e_0 + ... + e_{K-1}. Coefficients are arbitrary-precision GMP floats
 * carried at the precision they were computed with and are serialized as
 * decimal strings of precision_digits significant digits.
 */
class PerturbationSeries
    : public DataClass,
      public std::enable_shared_from_this<PerturbationSeries> {
 public:
  /**
   * @param coefficients e_0 ... e_{K-1}
   * @param target_index Basis index of the target state
   * @param target_quantum_numbers Label of the target state
   * @param zero_order_energy E0 of the target state
   * @param precision_digits Decimal digits the series was computed with
   * @throws std::invalid_argument if @p precision_digits is zero
   */
  PerturbationSeries(std::vector<mpf_class> coefficients, size_t target_index,
                     std::vector<int> target_quantum_numbers,
                     double zero_order_energy, unsigned precision_digits);

  PerturbationSeries(const PerturbationSeries&) = default;
  PerturbationSeries(PerturbationSeries&&) noexcept = default;
  PerturbationSeries& operator=(const PerturbationSeries&) = default;
  PerturbationSeries& operator=(PerturbationSeries&&) noexcept = default;
  virtual ~PerturbationSeries() = default;

  /**
   * @brief GMP precision in bits used for @p digits significant decimal
   * digits, with 64 guard bits
   */
  static mp_bitcnt_t bits_for_digits(unsigned digits);

  /// Number of coefficients K
  size_t get_order() const { return coefficients_.size(); }

  const std::vector<mpf_class>& get_coefficients() const {
    return coefficients_;
  }

  /**
   * @brief Coefficient e_@p k
   * @throws std::out_of_range if @p k >= get_order()
   */
  const mpf_class& get_coefficient(size_t k) const;

  /// Coefficients rounded to double
  Eigen::VectorXd get_coefficients_as_double() const;

  /**
   * @brief Sum of the first @p num_terms coefficients, at full precision
   * @throws std::out_of_range if @p num_terms > get_order()
   */
  mpf_class partial_sum(size_t num_terms) const;

  /// Zero-order energy plus all coefficients, rounded to double
  double get_energy() const;

  /// Partial energies E0 + e_0 + ... + e_k for every k, rounded to double
  Eigen::VectorXd get_partial_energies() const;

  size_t get_target_index() const { return target_index_; }

  const std::vector<int>& get_target_quantum_numbers() const {
    return target_quantum_numbers_;
  }

  double get_zero_order_energy() const { return zero_order_energy_; }

  unsigned get_precision_digits() const { return precision_digits_; }

  /// Coefficient e_@p k in scientific notation with precision_digits digits
  std::string coefficient_to_string(size_t k) const;

  // === DataClass interface ===

  std::string get_data_type_name() const override;

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<PerturbationSeries> from_file(
      const std::string& filename, const std::string& type);

  static std::shared_ptr<PerturbationSeries> from_json(const nlohmann::json& j);

  static std::shared_ptr<PerturbationSeries> from_json_file(
      const std::string& filename);

  static std::shared_ptr<PerturbationSeries> from_hdf5(H5::Group& group);

  static std::shared_ptr<PerturbationSeries> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  static std::vector<mpf_class> _parse_coefficients(
      const std::vector<std::string>& texts, unsigned precision_digits);

  std::vector<std::string> _coefficient_strings() const;

  std::vector<mpf_class> coefficients_;
  size_t target_index_ = 0;
  std::vector<int> target_quantum_numbers_;
  double zero_order_energy_ = 0.0;
  unsigned precision_digits_ = 0;
};

static_assert(DataClassCompliant<PerturbationSeries>,
              "PerturbationSeries must derive from DataClass and implement "
              "all required deserialization methods");

}  // namespace diven::data
