// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/fmt/fmt.h>

#include <diven/data/vibrational_basis.hpp>
#include <diven/errors.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/string_utils.hpp>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "data_class_io.hpp"
#include "filename_utils.hpp"

namespace diven::data {

std::string format_state_table(const Eigen::MatrixXi& quantum_numbers,
                               const Eigen::VectorXd& energies) {
  std::string table;
  for (Eigen::Index i = 0; i < energies.size(); ++i) {
    for (Eigen::Index m = 0; m < quantum_numbers.cols(); ++m) {
      table += fmt::format("{:4d}", quantum_numbers(i, m));
    }
    table += fmt::format("{:24.16f}\n", energies(i));
  }
  return table;
}

VibrationalBasis::VibrationalBasis(Eigen::MatrixXi quantum_numbers,
                                   Eigen::VectorXd energies)
    : quantum_numbers_(std::move(quantum_numbers)),
      energies_(std::move(energies)) {
  _validate();
}

VibrationalBasis::VibrationalBasis(size_t num_modes,
                                   const std::vector<ZeroOrderState>& states)
    : quantum_numbers_(static_cast<Eigen::Index>(states.size()),
                       static_cast<Eigen::Index>(num_modes)),
      energies_(static_cast<Eigen::Index>(states.size())) {
  for (size_t i = 0; i < states.size(); ++i) {
    const auto& state = states[i];
    if (state.quantum_numbers.size() != num_modes) {
      throw std::invalid_argument(
          "State " + std::to_string(i) + " has " +
          std::to_string(state.quantum_numbers.size()) +
          " quantum numbers, expected " + std::to_string(num_modes));
    }
    const auto row = static_cast<Eigen::Index>(i);
    for (size_t m = 0; m < num_modes; ++m) {
      quantum_numbers_(row, static_cast<Eigen::Index>(m)) =
          state.quantum_numbers[m];
    }
    energies_(row) = state.energy;
  }
  _validate();
}

void VibrationalBasis::_validate() const {
  if (quantum_numbers_.rows() != energies_.size()) {
    throw std::invalid_argument(
        "VibrationalBasis has " + std::to_string(quantum_numbers_.rows()) +
        " quantum number rows but " + std::to_string(energies_.size()) +
        " energies");
  }
  if (quantum_numbers_.size() > 0 && quantum_numbers_.minCoeff() < 0) {
    throw std::invalid_argument("Quantum numbers must be non-negative");
  }

  std::set<std::vector<int>> seen;
  std::vector<int> label(static_cast<size_t>(quantum_numbers_.cols()));
  for (Eigen::Index i = 0; i < quantum_numbers_.rows(); ++i) {
    for (Eigen::Index m = 0; m < quantum_numbers_.cols(); ++m) {
      label[static_cast<size_t>(m)] = quantum_numbers_(i, m);
    }
    if (!seen.insert(label).second) {
      throw ConfigurationError(
          "VibrationalBasis state " + std::to_string(i) +
          " repeats the quantum numbers of an earlier state");
    }
  }
}

ZeroOrderState VibrationalBasis::get_state(size_t index) const {
  if (index >= get_num_states()) {
    throw std::out_of_range("State index " + std::to_string(index) +
                            " out of range for a basis of " +
                            std::to_string(get_num_states()) + " states");
  }
  const auto row = static_cast<Eigen::Index>(index);
  ZeroOrderState state;
  state.quantum_numbers.resize(get_num_modes());
  for (Eigen::Index m = 0; m < quantum_numbers_.cols(); ++m) {
    state.quantum_numbers[static_cast<size_t>(m)] = quantum_numbers_(row, m);
  }
  state.energy = energies_(row);
  return state;
}

std::optional<size_t> VibrationalBasis::find_state(
    const std::vector<int>& quantum_numbers) const {
  if (quantum_numbers.size() != get_num_modes()) {
    return std::nullopt;
  }
  const Eigen::Map<const Eigen::RowVectorXi> target(
      quantum_numbers.data(), static_cast<Eigen::Index>(quantum_numbers.size()));
  for (Eigen::Index i = 0; i < quantum_numbers_.rows(); ++i) {
    if (quantum_numbers_.row(i) == target) {
      return static_cast<size_t>(i);
    }
  }
  return std::nullopt;
}

int VibrationalBasis::get_max_quantum_number() const {
  return quantum_numbers_.size() > 0 ? quantum_numbers_.maxCoeff() : 0;
}

std::shared_ptr<VibrationalBasis> VibrationalBasis::select(
    const std::function<bool(const ZeroOrderState&)>& predicate) const {
  DIVEN_LOG_TRACE_ENTERING();
  std::vector<ZeroOrderState> kept;
  for (size_t i = 0; i < get_num_states(); ++i) {
    ZeroOrderState state = get_state(i);
    if (predicate(state)) {
      kept.push_back(std::move(state));
    }
  }
  DIVEN_LOGGER().debug("Selected {} of {} basis states", kept.size(),
                       get_num_states());
  return std::make_shared<VibrationalBasis>(get_num_modes(), kept);
}

std::string VibrationalBasis::to_table() const {
  return format_state_table(quantum_numbers_, energies_);
}

void VibrationalBasis::to_text_file(const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + filename);
  }
  file << to_table();
  if (file.fail()) {
    throw std::runtime_error("Failed to write to file: " + filename);
  }
}

std::string VibrationalBasis::get_data_type_name() const {
  return DATACLASS_TO_SNAKE_CASE(VibrationalBasis);
}

std::string VibrationalBasis::get_summary() const {
  if (empty()) {
    return "VibrationalBasis(empty, modes: " + std::to_string(get_num_modes()) +
           ")";
  }
  std::ostringstream oss;
  oss << "VibrationalBasis(states: " << get_num_states()
      << ", modes: " << get_num_modes()
      << ", energy range: [" << energies_.minCoeff() << ", "
      << energies_.maxCoeff()
      << "], max quantum number: " << get_max_quantum_number() << ")";
  return oss.str();
}

void VibrationalBasis::to_file(const std::string& filename,
                               const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else if (type == "txt") {
    DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
    to_text_file(filename);
  } else {
    throw std::invalid_argument("Unsupported file type: " + type +
                                ". Supported types are: json, hdf5, txt");
  }
}

nlohmann::json VibrationalBasis::to_json() const {
  nlohmann::json j;
  write_json_header(j, SERIALIZATION_VERSION, get_data_type_name());
  j["num_modes"] = get_num_modes();
  j["quantum_numbers"] = matrix_to_json(quantum_numbers_);
  j["energies"] = vector_to_json(energies_);
  return j;
}

void VibrationalBasis::to_json_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_json_file(filename, to_json());
}

void VibrationalBasis::to_hdf5(H5::Group& group) const {
  write_hdf5_header(group, SERIALIZATION_VERSION, get_data_type_name());
  save_matrix_to_group(group, "quantum_numbers", quantum_numbers_);
  save_vector_to_group(group, "energies", energies_);
}

void VibrationalBasis::to_hdf5_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_hdf5_file(filename, [this](H5::Group& root) { to_hdf5(root); });
}

std::shared_ptr<VibrationalBasis> VibrationalBasis::from_file(
    const std::string& filename, const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

std::shared_ptr<VibrationalBasis> VibrationalBasis::from_json(
    const nlohmann::json& j) {
  check_json_header(j, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(VibrationalBasis));
  try {
    Eigen::MatrixXi quantum_numbers = json_to_int_matrix(j.at("quantum_numbers"));
    if (quantum_numbers.rows() == 0) {
      quantum_numbers.resize(0, j.at("num_modes").get<Eigen::Index>());
    }
    return std::make_shared<VibrationalBasis>(std::move(quantum_numbers),
                                              json_to_vector(j.at("energies")));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid VibrationalBasis JSON: ") +
                             e.what());
  }
}

std::shared_ptr<VibrationalBasis> VibrationalBasis::from_json_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(VibrationalBasis));
  return from_json(read_json_file(filename, "VibrationalBasis"));
}

std::shared_ptr<VibrationalBasis> VibrationalBasis::from_hdf5(
    H5::Group& group) {
  check_hdf5_header(group, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(VibrationalBasis));
  return std::make_shared<VibrationalBasis>(
      load_int_matrix_from_group(group, "quantum_numbers"),
      load_vector_from_group(group, "energies"));
}

std::shared_ptr<VibrationalBasis> VibrationalBasis::from_hdf5_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(VibrationalBasis));
  return read_hdf5_file(filename, "VibrationalBasis",
                        [](H5::Group& root) { return from_hdf5(root); });
}

}  // namespace diven::data
