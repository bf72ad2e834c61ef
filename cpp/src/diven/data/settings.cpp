// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <H5Cpp.h>

#include <algorithm>
#include <cctype>
#include <diven/data/settings.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace diven::data {

namespace {

// Names of the SettingValue alternatives, in variant order
constexpr const char* KIND_NAMES[] = {
    "bool",        "int64",         "double",       "string",
    "int64_array", "double_array",  "string_array"};

const char* kind_of(const SettingValue& value) {
  return KIND_NAMES[value.index()];
}

template <typename T>
std::string join(const std::vector<T>& values) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) oss << ", ";
    if constexpr (std::is_same_v<T, std::string>) {
      oss << "\"" << values[i] << "\"";
    } else if constexpr (std::is_floating_point_v<T>) {
      oss << std::scientific << values[i];
    } else {
      oss << values[i];
    }
  }
  oss << "]";
  return oss.str();
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

std::string value_to_string(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, double>) {
          std::ostringstream oss;
          oss << std::scientific << v;
          return oss.str();
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::to_string(v);
        } else {
          return join(v);
        }
      },
      value);
}

SettingValue json_to_value(const nlohmann::json& j, const std::string& kind) {
  if (kind == "bool") return j.get<bool>();
  if (kind == "int64") return j.get<int64_t>();
  if (kind == "double") return j.get<double>();
  if (kind == "string") return j.get<std::string>();
  if (kind == "int64_array") return json_to_vector<int64_t>(j);
  if (kind == "double_array") return json_to_vector<double>(j);
  if (kind == "string_array") return json_to_vector<std::string>(j);
  throw std::runtime_error("Unsupported setting kind: " + kind);
}

// Type inferred from the JSON value itself, used when no kind was stored
std::string infer_kind(const nlohmann::json& j) {
  if (j.is_boolean()) return "bool";
  if (j.is_number_integer()) return "int64";
  if (j.is_number_float()) return "double";
  if (j.is_string()) return "string";
  if (j.is_array()) {
    if (j.empty() || j[0].is_number_integer()) return "int64_array";
    if (j[0].is_number_float()) return "double_array";
    if (j[0].is_string()) return "string_array";
  }
  throw std::runtime_error("Unsupported JSON value for a setting: " + j.dump());
}

}  // namespace

const SettingValue& Settings::_find(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::_check_constraint(const std::string& key,
                                 const SettingValue& value) const {
  auto limit = limits_.find(key);
  if (limit == limits_.end()) {
    return;
  }

  std::visit(
      [&](const auto& constraint) {
        using C = std::decay_t<decltype(constraint)>;
        if constexpr (std::is_same_v<C, BoundConstraint<int64_t>> ||
                      std::is_same_v<C, BoundConstraint<double>>) {
          using T = decltype(constraint.min);
          auto check = [&](T v) {
            if (v < constraint.min || v > constraint.max) {
              std::ostringstream range;
              range << "[" << constraint.min << ", " << constraint.max << "]";
              throw std::invalid_argument(
                  "Value for setting '" + key +
                  "' is out of allowed range. Allowed range: " + range.str());
            }
          };
          if (const T* scalar = std::get_if<T>(&value)) {
            check(*scalar);
          } else if (const auto* values = std::get_if<std::vector<T>>(&value)) {
            std::for_each(values->begin(), values->end(), check);
          }
        } else {
          using T = typename decltype(constraint.allowed_values)::value_type;
          const auto& allowed = constraint.allowed_values;
          auto check = [&](const T& v) {
            if (std::find(allowed.begin(), allowed.end(), v) ==
                allowed.end()) {
              throw std::invalid_argument(
                  "Value for setting '" + key +
                  "' is out of allowed options. Allowed options: " +
                  join(allowed));
            }
          };
          if (const T* scalar = std::get_if<T>(&value)) {
            check(*scalar);
          } else if (const auto* values = std::get_if<std::vector<T>>(&value)) {
            std::for_each(values->begin(), values->end(), check);
          }
        }
      },
      limit->second);
}

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  const SettingValue& current = _find(key);
  if (value.index() != current.index()) {
    throw SettingTypeMismatch(key, kind_of(current));
  }
  _check_constraint(key, value);
  settings_[key] = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

SettingValue Settings::get(const std::string& key) const { return _find(key); }

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, value] : settings_) {
    result.push_back(key);
  }
  return result;
}

size_t Settings::size() const { return settings_.size(); }

bool Settings::empty() const { return settings_.empty(); }

std::string Settings::get_summary() const {
  std::ostringstream oss;
  oss << "Settings Summary:\n";
  if (empty()) {
    oss << "  No settings configured.\n";
    return oss.str();
  }
  for (const auto& [key, value] : settings_) {
    std::string text = value_to_string(value);
    if (text.length() > 50) {
      text = text.substr(0, 47) + "...";
    }
    oss << "  " << key << " = " << text << "\n";
  }
  return oss.str();
}

std::string Settings::get_as_string(const std::string& key) const {
  return value_to_string(_find(key));
}

std::string Settings::get_type_name(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    return "not_found";
  }
  return kind_of(it->second);
}

bool Settings::has_description(const std::string& key) const {
  return descriptions_.find(key) != descriptions_.end();
}

std::string Settings::get_description(const std::string& key) const {
  auto it = descriptions_.find(key);
  if (it == descriptions_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

bool Settings::has_limits(const std::string& key) const {
  return limits_.find(key) != limits_.end();
}

Constraint Settings::get_limits(const std::string& key) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

bool Settings::is_documented(const std::string& key) const {
  _find(key);
  auto it = documented_.find(key);
  return it != documented_.end() && it->second;
}

SettingValue Settings::_parse_string(const std::string& key,
                                     const std::string& text) const {
  const SettingValue& current = _find(key);
  if (std::holds_alternative<bool>(current)) {
    const std::string lower = to_lower(text);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
      return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
      return false;
    }
    throw std::runtime_error("Invalid boolean value: '" + text + "'");
  }
  if (std::holds_alternative<std::string>(current)) {
    return text;
  }

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(text);
    return json_to_value(parsed, kind_of(current));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Invalid value format: '" + text + "' - " +
                             e.what());
  }
}

void Settings::update(const std::map<std::string, std::string>& updates) {
  if (_locked) {
    throw SettingsAreLocked();
  }

  std::map<std::string, SettingValue> converted;
  for (const auto& [key, text] : updates) {
    _find(key);
    try {
      SettingValue value = _parse_string(key, text);
      _check_constraint(key, value);
      converted.emplace(key, std::move(value));
    } catch (const std::exception& e) {
      throw std::runtime_error("Failed to convert value for key '" + key +
                               "': " + e.what());
    }
  }
  for (auto& [key, value] : converted) {
    settings_[key] = std::move(value);
  }
}

void Settings::update(const Settings& other) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  for (const auto& [key, value] : other.settings_) {
    const SettingValue& current = _find(key);
    if (current.index() != value.index()) {
      throw SettingTypeMismatch(key, kind_of(current));
    }
    _check_constraint(key, value);
  }
  for (const auto& [key, value] : other.settings_) {
    settings_[key] = value;
  }
}

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit, bool documented) {
  if (has(key)) {
    return;
  }

  if (limit.has_value()) {
    const bool fits = std::visit(
        [&value](const auto& constraint) {
          using C = std::decay_t<decltype(constraint)>;
          if constexpr (std::is_same_v<C, BoundConstraint<double>>) {
            return std::holds_alternative<double>(value) ||
                   std::holds_alternative<std::vector<double>>(value);
          } else if constexpr (std::is_same_v<C, ListConstraint<std::string>>) {
            return std::holds_alternative<std::string>(value) ||
                   std::holds_alternative<std::vector<std::string>>(value);
          } else {
            return std::holds_alternative<int64_t>(value) ||
                   std::holds_alternative<std::vector<int64_t>>(value);
          }
        },
        *limit);
    if (!fits) {
      throw std::invalid_argument("Constraint for setting '" + key +
                                  "' does not match its value type " +
                                  kind_of(value));
    }
    limits_[key] = *limit;
    _check_constraint(key, value);
  }

  settings_[key] = value;
  if (description.has_value()) {
    descriptions_[key] = *description;
  }
  documented_[key] = documented;
}

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit, bool documented) {
  set_default(key, SettingValue(std::string(value)), std::move(description),
              std::move(limit), documented);
}

void Settings::lock() const { _locked = true; }

nlohmann::json Settings::_metadata_to_json() const {
  nlohmann::json metadata;
  metadata["descriptions"] = descriptions_;
  metadata["documented"] = documented_;

  nlohmann::json kinds = nlohmann::json::object();
  for (const auto& [key, value] : settings_) {
    kinds[key] = kind_of(value);
  }
  metadata["kinds"] = kinds;

  nlohmann::json limits = nlohmann::json::object();
  for (const auto& [key, constraint] : limits_) {
    limits[key] = std::visit(
        [](const auto& c) -> nlohmann::json {
          using C = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<C, BoundConstraint<int64_t>> ||
                        std::is_same_v<C, BoundConstraint<double>>) {
            return {{"min", c.min}, {"max", c.max}};
          } else {
            return {{"allowed", c.allowed_values}};
          }
        },
        constraint);
  }
  metadata["limits"] = limits;
  return metadata;
}

void Settings::_metadata_from_json(const nlohmann::json& metadata) {
  if (metadata.contains("descriptions")) {
    descriptions_ =
        metadata["descriptions"].get<std::map<std::string, std::string>>();
  }
  if (metadata.contains("documented")) {
    documented_ = metadata["documented"].get<std::map<std::string, bool>>();
  }
  if (!metadata.contains("limits")) {
    return;
  }
  for (const auto& [key, limit] : metadata["limits"].items()) {
    if (limit.contains("allowed")) {
      const auto& allowed = limit["allowed"];
      if (!allowed.empty() && allowed[0].is_string()) {
        limits_[key] = ListConstraint<std::string>{
            allowed.get<std::vector<std::string>>()};
      } else {
        limits_[key] =
            ListConstraint<int64_t>{allowed.get<std::vector<int64_t>>()};
      }
    } else if (limit["min"].is_number_integer() &&
               limit["max"].is_number_integer()) {
      limits_[key] = BoundConstraint<int64_t>{limit["min"].get<int64_t>(),
                                              limit["max"].get<int64_t>()};
    } else {
      limits_[key] = BoundConstraint<double>{limit["min"].get<double>(),
                                             limit["max"].get<double>()};
    }
  }
}

nlohmann::json Settings::to_json() const {
  nlohmann::json j;
  j["serialization_version"] = SERIALIZATION_VERSION;
  j["type"] = get_data_type_name();

  nlohmann::json values = nlohmann::json::object();
  for (const auto& [key, value] : settings_) {
    values[key] = std::visit([](const auto& v) { return nlohmann::json(v); },
                             value);
  }
  j["values"] = values;
  j["metadata"] = _metadata_to_json();
  return j;
}

std::shared_ptr<Settings> Settings::from_json(const nlohmann::json& json_obj) {
  if (!json_obj.is_object() || !json_obj.contains("values")) {
    throw std::runtime_error("Settings JSON must be an object with 'values'");
  }
  if (json_obj.contains("serialization_version")) {
    validate_serialization_version(
        SERIALIZATION_VERSION,
        json_obj["serialization_version"].get<std::string>());
  }

  nlohmann::json metadata = json_obj.value("metadata", nlohmann::json::object());
  nlohmann::json kinds = metadata.value("kinds", nlohmann::json::object());

  auto settings = std::make_shared<Settings>();
  try {
    for (const auto& [key, value] : json_obj["values"].items()) {
      std::string kind = kinds.contains(key) ? kinds[key].get<std::string>()
                                             : infer_kind(value);
      settings->settings_[key] = json_to_value(value, kind);
    }
    settings->_metadata_from_json(metadata);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Malformed settings JSON: ") +
                             e.what());
  }
  return settings;
}

void Settings::to_file(const std::string& filename,
                       const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

std::shared_ptr<Settings> Settings::from_file(const std::string& filename,
                                              const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unknown file type: " + type +
                              ". Supported types are: json, hdf5");
}

void Settings::to_json_file(const std::string& filename) const {
  _to_json_file(DataTypeFilename::validate_write_suffix(
      filename, get_data_type_name()));
}

std::shared_ptr<Settings> Settings::from_json_file(
    const std::string& filename) {
  return _from_json_file(
      DataTypeFilename::validate_read_suffix(filename, "settings"));
}

void Settings::to_hdf5_file(const std::string& filename) const {
  _to_hdf5_file(DataTypeFilename::validate_write_suffix(
      filename, get_data_type_name()));
}

std::shared_ptr<Settings> Settings::from_hdf5_file(
    const std::string& filename) {
  return _from_hdf5_file(
      DataTypeFilename::validate_read_suffix(filename, "settings"));
}

void Settings::_to_json_file(const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }
  file << std::setw(2) << to_json() << std::endl;
  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + filename);
  }
}

std::shared_ptr<Settings> Settings::_from_json_file(
    const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Unable to open Settings JSON file '" + filename +
                             "'");
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Error parsing " + filename + ": " + e.what());
  }
  return from_json(j);
}

void Settings::to_hdf5(H5::Group& group) const {
  write_string_attribute(group, "serialization_version", SERIALIZATION_VERSION);
  write_string_attribute(group, "type", get_data_type_name());
  write_string_attribute(group, "metadata", _metadata_to_json().dump());

  for (const auto& [key, value] : settings_) {
    std::visit(
        [&group, &key = key](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          H5::DataSpace scalar(H5S_SCALAR);
          if constexpr (std::is_same_v<T, bool>) {
            int flag = v ? 1 : 0;
            group.createDataSet(key, H5::PredType::NATIVE_INT, scalar)
                .write(&flag, H5::PredType::NATIVE_INT);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            group.createDataSet(key, H5::PredType::NATIVE_INT64, scalar)
                .write(&v, H5::PredType::NATIVE_INT64);
          } else if constexpr (std::is_same_v<T, double>) {
            group.createDataSet(key, H5::PredType::NATIVE_DOUBLE, scalar)
                .write(&v, H5::PredType::NATIVE_DOUBLE);
          } else if constexpr (std::is_same_v<T, std::string>) {
            H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
            group.createDataSet(key, string_type, scalar).write(v, string_type);
          } else if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
            hsize_t dims[1] = {v.size()};
            H5::DataSet dataset = group.createDataSet(
                key, H5::PredType::NATIVE_INT64, H5::DataSpace(1, dims));
            if (!v.empty()) {
              dataset.write(v.data(), H5::PredType::NATIVE_INT64);
            }
          } else if constexpr (std::is_same_v<T, std::vector<double>>) {
            save_stl_to_group(group, key, v);
          } else {
            save_string_vector_to_group(group, key, v);
          }
        },
        value);
  }
}

std::shared_ptr<Settings> Settings::from_hdf5(H5::Group& group) {
  validate_serialization_version(
      SERIALIZATION_VERSION,
      read_string_attribute(group, "serialization_version"));

  nlohmann::json metadata;
  try {
    metadata = nlohmann::json::parse(read_string_attribute(group, "metadata"));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Malformed settings metadata: ") +
                             e.what());
  }

  auto settings = std::make_shared<Settings>();
  for (const auto& [key, kind_json] : metadata["kinds"].items()) {
    const std::string kind = kind_json.get<std::string>();
    if (!dataset_exists_in_group(group, key)) {
      throw std::runtime_error("Setting '" + key + "' missing from HDF5 group");
    }
    H5::DataSet dataset = group.openDataSet(key);
    SettingValue value;
    if (kind == "bool") {
      int flag = 0;
      dataset.read(&flag, H5::PredType::NATIVE_INT);
      value = flag != 0;
    } else if (kind == "int64") {
      int64_t v = 0;
      dataset.read(&v, H5::PredType::NATIVE_INT64);
      value = v;
    } else if (kind == "double") {
      double v = 0.0;
      dataset.read(&v, H5::PredType::NATIVE_DOUBLE);
      value = v;
    } else if (kind == "string") {
      H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
      std::string v;
      dataset.read(v, string_type);
      value = v;
    } else if (kind == "int64_array") {
      hsize_t dims[1] = {0};
      dataset.getSpace().getSimpleExtentDims(dims);
      std::vector<int64_t> v(dims[0]);
      if (!v.empty()) {
        dataset.read(v.data(), H5::PredType::NATIVE_INT64);
      }
      value = std::move(v);
    } else if (kind == "double_array") {
      value = load_std_vector_from_group<double>(group, key);
    } else if (kind == "string_array") {
      value = load_string_vector_from_group(group, key);
    } else {
      throw std::runtime_error("Unsupported setting kind: " + kind);
    }
    settings->settings_[key] = std::move(value);
  }
  settings->_metadata_from_json(metadata);
  return settings;
}

void Settings::_to_hdf5_file(const std::string& filename) const {
  try {
    H5::H5File file(filename, H5F_ACC_TRUNC);
    to_hdf5(file);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

std::shared_ptr<Settings> Settings::_from_hdf5_file(
    const std::string& filename) {
  if (hdf5_errors_should_be_suppressed()) {
    H5::Exception::dontPrint();
  }

  try {
    H5::H5File file(filename, H5F_ACC_RDONLY);
    return from_hdf5(file);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to read Settings from HDF5 file '" +
                             filename + "': " + e.getCDetailMsg());
  }
}

}  // namespace diven::data
