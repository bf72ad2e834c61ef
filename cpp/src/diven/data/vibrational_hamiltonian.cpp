// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <diven/data/vibrational_hamiltonian.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/string_utils.hpp>
#include <sstream>
#include <stdexcept>

#include "data_class_io.hpp"
#include "filename_utils.hpp"

namespace diven::data {

VibrationalHamiltonian::VibrationalHamiltonian(
    std::shared_ptr<const VibrationalBasis> basis,
    Eigen::MatrixXd perturbation_matrix)
    : basis_(std::move(basis)), W_(std::move(perturbation_matrix)) {
  if (!basis_) {
    throw std::invalid_argument("VibrationalHamiltonian requires a basis");
  }
  zero_order_energies_ = basis_->get_energies();
  _validate();
}

VibrationalHamiltonian::VibrationalHamiltonian(
    std::shared_ptr<const VibrationalBasis> basis,
    Eigen::MatrixXd perturbation_matrix, Eigen::VectorXd zero_order_energies)
    : basis_(std::move(basis)),
      W_(std::move(perturbation_matrix)),
      zero_order_energies_(std::move(zero_order_energies)) {
  if (!basis_) {
    throw std::invalid_argument("VibrationalHamiltonian requires a basis");
  }
  _validate();
}

void VibrationalHamiltonian::_validate() const {
  const auto n = static_cast<Eigen::Index>(basis_->get_num_states());
  if (W_.rows() != n || W_.cols() != n) {
    throw std::invalid_argument(
        "Perturbation matrix is " + std::to_string(W_.rows()) + "x" +
        std::to_string(W_.cols()) + " but the basis has " + std::to_string(n) +
        " states");
  }
  if (zero_order_energies_.size() != n) {
    throw std::invalid_argument("Expected " + std::to_string(n) +
                                " zero-order energies, got " +
                                std::to_string(zero_order_energies_.size()));
  }
}

Eigen::MatrixXd VibrationalHamiltonian::get_hamiltonian_matrix() const {
  Eigen::MatrixXd H = W_;
  H.diagonal() += zero_order_energies_;
  return H;
}

void VibrationalHamiltonian::shift_frequencies(const Eigen::VectorXd& shifts) {
  DIVEN_LOG_TRACE_ENTERING();
  if (static_cast<size_t>(shifts.size()) != basis_->get_num_modes()) {
    throw std::invalid_argument(
        "Expected " + std::to_string(basis_->get_num_modes()) +
        " frequency shifts, got " + std::to_string(shifts.size()));
  }
  const Eigen::VectorXd d =
      (basis_->get_quantum_numbers().cast<double>().array() + 0.5).matrix() *
      shifts;
  zero_order_energies_ += d;
  W_.diagonal() -= d;
}

std::string VibrationalHamiltonian::get_data_type_name() const {
  return DATACLASS_TO_SNAKE_CASE(VibrationalHamiltonian);
}

std::string VibrationalHamiltonian::get_summary() const {
  std::ostringstream oss;
  oss << "VibrationalHamiltonian(states: " << get_num_states()
      << ", modes: " << basis_->get_num_modes();
  if (get_num_states() > 0) {
    oss << ", max |W|: " << W_.cwiseAbs().maxCoeff();
  }
  oss << ")";
  return oss.str();
}

void VibrationalHamiltonian::to_file(const std::string& filename,
                                     const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unsupported file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

nlohmann::json VibrationalHamiltonian::to_json() const {
  nlohmann::json j;
  write_json_header(j, SERIALIZATION_VERSION, get_data_type_name());
  j["basis"] = basis_->to_json();
  j["perturbation_matrix"] = matrix_to_json(W_);
  j["zero_order_energies"] = vector_to_json(zero_order_energies_);
  return j;
}

void VibrationalHamiltonian::to_json_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_json_file(filename, to_json());
}

void VibrationalHamiltonian::to_hdf5(H5::Group& group) const {
  write_hdf5_header(group, SERIALIZATION_VERSION, get_data_type_name());
  H5::Group basis_group = group.createGroup("basis");
  basis_->to_hdf5(basis_group);
  save_matrix_to_group(group, "perturbation_matrix", W_);
  save_vector_to_group(group, "zero_order_energies", zero_order_energies_);
}

void VibrationalHamiltonian::to_hdf5_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_hdf5_file(filename, [this](H5::Group& root) { to_hdf5(root); });
}

std::shared_ptr<VibrationalHamiltonian> VibrationalHamiltonian::from_file(
    const std::string& filename, const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

std::shared_ptr<VibrationalHamiltonian> VibrationalHamiltonian::from_json(
    const nlohmann::json& j) {
  check_json_header(j, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(VibrationalHamiltonian));
  try {
    auto basis = VibrationalBasis::from_json(j.at("basis"));
    Eigen::MatrixXd W = json_to_matrix(j.at("perturbation_matrix"));
    if (basis->empty()) {
      W.resize(0, 0);
    }
    return std::make_shared<VibrationalHamiltonian>(
        std::move(basis), std::move(W),
        json_to_vector(j.at("zero_order_energies")));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(
        std::string("Invalid VibrationalHamiltonian JSON: ") + e.what());
  }
}

std::shared_ptr<VibrationalHamiltonian> VibrationalHamiltonian::from_json_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(VibrationalHamiltonian));
  return from_json(read_json_file(filename, "VibrationalHamiltonian"));
}

std::shared_ptr<VibrationalHamiltonian> VibrationalHamiltonian::from_hdf5(
    H5::Group& group) {
  check_hdf5_header(group, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(VibrationalHamiltonian));
  if (!group_exists_in_group(group, "basis")) {
    throw std::runtime_error("VibrationalHamiltonian HDF5 data has no basis");
  }
  H5::Group basis_group = group.openGroup("basis");
  return std::make_shared<VibrationalHamiltonian>(
      VibrationalBasis::from_hdf5(basis_group),
      load_matrix_from_group(group, "perturbation_matrix"),
      load_vector_from_group(group, "zero_order_energies"));
}

std::shared_ptr<VibrationalHamiltonian>
VibrationalHamiltonian::from_hdf5_file(const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(VibrationalHamiltonian));
  return read_hdf5_file(filename, "VibrationalHamiltonian",
                        [](H5::Group& root) { return from_hdf5(root); });
}

}  // namespace diven::data
