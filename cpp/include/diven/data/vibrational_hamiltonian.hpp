// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <diven/data/data_class.hpp>
#include <diven/data/vibrational_basis.hpp>
#include <memory>
#include <string>

namespace diven::data {

/**
 * @class VibrationalHamiltonian
 * @brief Vibrational Hamiltonian H = W + diag(E0) on a zero-order basis
 *
 * Holds the real symmetric perturbation matrix W, whose diagonal excludes
 * the zero-order energies, and a private copy of the zero-order energies
 * E0. Both are indexed by the positions of the basis states.
 *
 * shift_frequencies() moves part of the perturbation into the zero-order
 * energies without changing H; it is the only mutating operation.
 */
class VibrationalHamiltonian
    : public DataClass,
      public std::enable_shared_from_this<VibrationalHamiltonian> {
 public:
  /**
   * @brief Construct from a basis and its perturbation matrix
   *
   * The zero-order energies are copied from the basis.
   *
   * @param basis Zero-order basis
   * @param perturbation_matrix N x N symmetric matrix W
   * @throws std::invalid_argument if @p basis is null or W is not N x N
   */
  VibrationalHamiltonian(std::shared_ptr<const VibrationalBasis> basis,
                         Eigen::MatrixXd perturbation_matrix);

  /**
   * @brief Construct with explicit zero-order energies, e.g. after a shift
   * @throws std::invalid_argument if @p basis is null or the sizes disagree
   */
  VibrationalHamiltonian(std::shared_ptr<const VibrationalBasis> basis,
                         Eigen::MatrixXd perturbation_matrix,
                         Eigen::VectorXd zero_order_energies);

  VibrationalHamiltonian(const VibrationalHamiltonian&) = default;
  VibrationalHamiltonian(VibrationalHamiltonian&&) noexcept = default;
  VibrationalHamiltonian& operator=(const VibrationalHamiltonian&) = default;
  VibrationalHamiltonian& operator=(VibrationalHamiltonian&&) noexcept =
      default;
  virtual ~VibrationalHamiltonian() = default;

  const std::shared_ptr<const VibrationalBasis>& get_basis() const {
    return basis_;
  }

  size_t get_num_states() const {
    return static_cast<size_t>(zero_order_energies_.size());
  }

  /// W, the Hamiltonian without its zero-order diagonal
  const Eigen::MatrixXd& get_perturbation_matrix() const { return W_; }

  /// E0, possibly shifted by shift_frequencies()
  const Eigen::VectorXd& get_zero_order_energies() const {
    return zero_order_energies_;
  }

  /// H = W + diag(E0)
  Eigen::MatrixXd get_hamiltonian_matrix() const;

  /**
   * @brief Move per-mode frequency shifts from W into E0
   *
   * For every state, d = sum_m (v_m + 1/2) * shifts_m is added to E0 and
   * subtracted from the diagonal of W, which lifts accidental degeneracies
   * for perturbation theory while leaving H unchanged up to rounding.
   *
   * @param shifts One shift per mode
   * @throws std::invalid_argument if the number of shifts differs from the
   * number of modes
   */
  void shift_frequencies(const Eigen::VectorXd& shifts);

  // === DataClass interface ===

  std::string get_data_type_name() const override;

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  /// Writes W, E0 and the basis as subgroup "basis"
  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<VibrationalHamiltonian> from_file(
      const std::string& filename, const std::string& type);

  static std::shared_ptr<VibrationalHamiltonian> from_json(
      const nlohmann::json& j);

  static std::shared_ptr<VibrationalHamiltonian> from_json_file(
      const std::string& filename);

  static std::shared_ptr<VibrationalHamiltonian> from_hdf5(H5::Group& group);

  static std::shared_ptr<VibrationalHamiltonian> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  void _validate() const;

  std::shared_ptr<const VibrationalBasis> basis_;
  Eigen::MatrixXd W_;
  Eigen::VectorXd zero_order_energies_;
};

static_assert(DataClassCompliant<VibrationalHamiltonian>,
              "VibrationalHamiltonian must derive from DataClass and implement "
              "all required deserialization methods");

}  // namespace diven::data
