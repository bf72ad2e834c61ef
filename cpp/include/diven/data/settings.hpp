// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <concepts>
#include <cstdint>
#include <diven/data/data_class.hpp>
#include <limits>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace diven::data {

/**
 * @brief Value held by a setting
 *
 * Integers are always stored as int64_t; other integral types are converted
 * on set() and get().
 */
using SettingValue =
    std::variant<bool, int64_t, double, std::string, std::vector<int64_t>,
                 std::vector<double>, std::vector<std::string>>;

/**
 * @brief Inclusive [min, max] range allowed for a numeric setting
 */
template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();  ///< Smallest allowed value
  T max = std::numeric_limits<T>::max();     ///< Largest allowed value
};

/**
 * @brief Explicit list of values allowed for a setting
 */
template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;  ///< Accepted values
};

/**
 * @brief Any constraint that can be attached to a setting
 */
using Constraint =
    std::variant<BoundConstraint<int64_t>, ListConstraint<int64_t>,
                 BoundConstraint<double>, ListConstraint<std::string>>;

/**
 * @brief Integral types other than bool
 */
template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<T, bool>;

template <typename T>
struct is_vector_impl : std::false_type {};

template <typename T, typename A>
struct is_vector_impl<std::vector<T, A>> : std::true_type {};

/**
 * @brief Any std::vector
 */
template <typename T>
concept Vector = is_vector_impl<T>::value;

template <typename T, typename Variant>
struct is_variant_member_impl;

template <typename T, typename... Ts>
struct is_variant_member_impl<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

/**
 * @brief Types stored directly in SettingValue
 */
template <typename T>
concept SettingAlternative = is_variant_member_impl<T, SettingValue>::value;

/**
 * @brief Exception thrown when locked settings are modified
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Exception thrown when a setting key does not exist
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Exception thrown when a setting is read or written with the wrong
 * type
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @brief Typed key/value configuration of an algorithm
 *
 * The set of keys is fixed by the constructor of a derived class through the
 * protected set_default() overloads; afterwards only existing keys can be
 * changed, with their original type and within their constraints. Algorithms
 * lock their settings when run() starts.
 *
 * @code
 * class RsptSettings : public Settings {
 *  public:
 *   RsptSettings() {
 *     set_default("order", 20, "Number of series coefficients",
 *                 BoundConstraint<int64_t>{2, 100000});
 *   }
 * };
 *
 * RsptSettings settings;
 * settings.set("order", 40);
 * auto order = settings.get<std::size_t>("order");
 * @endcode
 */
class Settings : public DataClass,
                 public std::enable_shared_from_this<Settings> {
 public:
  Settings() = default;
  virtual ~Settings() = default;
  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  std::string get_data_type_name() const override { return "settings"; }

  std::string get_summary() const override;

  /**
   * @brief Change an existing setting
   * @param key Setting key
   * @param value New value, of the same alternative as the current one
   * @throws SettingsAreLocked if the settings are locked
   * @throws SettingNotFound if @p key does not exist
   * @throws SettingTypeMismatch if the value type differs from the current one
   * @throws std::invalid_argument if the value violates the key's constraint
   */
  void set(const std::string& key, const SettingValue& value);

  /// @copydoc set(const std::string&, const SettingValue&)
  void set(const std::string& key, const char* value);

  /**
   * @brief Change an integer setting from any integral type
   * @throws std::out_of_range if the value does not fit into int64_t
   */
  template <NonBoolIntegral Integer>
  void set(const std::string& key, Integer value) {
    if constexpr (std::is_unsigned_v<Integer>) {
      if (value > static_cast<std::make_unsigned_t<int64_t>>(
                      std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Value for setting '" + key +
                                "' cannot be represented as int64_t.");
      }
    }
    set(key, SettingValue(static_cast<int64_t>(value)));
  }

  /**
   * @brief Change an integer-vector setting from a vector of any integral type
   */
  template <NonBoolIntegral Integer>
    requires(!std::same_as<Integer, int64_t>)
  void set(const std::string& key, const std::vector<Integer>& values) {
    std::vector<int64_t> converted(values.begin(), values.end());
    set(key, SettingValue(std::move(converted)));
  }

  /**
   * @brief Read a setting as its raw variant
   * @throws SettingNotFound if @p key does not exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Read a setting with type checking
   *
   * Integral types other than int64_t are converted with a range check.
   *
   * @throws SettingNotFound if @p key does not exist
   * @throws SettingTypeMismatch if the stored value cannot be returned as T
   */
  template <typename T>
  T get(const std::string& key) const {
    const SettingValue& stored = _find(key);
    if constexpr (SettingAlternative<T>) {
      if (const T* value = std::get_if<T>(&stored)) {
        return *value;
      }
      throw SettingTypeMismatch(key, typeid(T).name());
    } else if constexpr (NonBoolIntegral<T>) {
      const int64_t* value = std::get_if<int64_t>(&stored);
      if (!value) {
        throw SettingTypeMismatch(key, typeid(T).name());
      }
      if (auto converted = _narrow<T>(*value)) {
        return *converted;
      }
      throw SettingTypeMismatch(key, "value out of range for requested type");
    } else if constexpr (Vector<T>) {
      using Element = typename T::value_type;
      static_assert(NonBoolIntegral<Element>,
                    "Unsupported vector type for Settings::get");
      const auto* values = std::get_if<std::vector<int64_t>>(&stored);
      if (!values) {
        throw SettingTypeMismatch(key, typeid(T).name());
      }
      T result;
      result.reserve(values->size());
      for (int64_t v : *values) {
        auto converted = _narrow<Element>(v);
        if (!converted) {
          throw SettingTypeMismatch(key, "vector element out of range");
        }
        result.push_back(*converted);
      }
      return result;
    } else {
      static_assert(SettingAlternative<T>,
                    "Type not supported by Settings::get");
    }
  }

  /**
   * @brief Read a setting, falling back to @p default_value when the key is
   * missing or holds another type
   */
  template <typename T>
  T get_or_default(const std::string& key, const T& default_value) const {
    if (!has(key)) {
      return default_value;
    }
    try {
      return get<T>(key);
    } catch (const SettingTypeMismatch&) {
      return default_value;
    }
  }

  /// True if @p key exists
  bool has(const std::string& key) const;

  /// All keys in lexicographic order
  std::vector<std::string> keys() const;

  /// Number of settings
  size_t size() const;

  /// True if there are no settings
  bool empty() const;

  /**
   * @brief Printable form of a value
   * @throws SettingNotFound if @p key does not exist
   */
  std::string get_as_string(const std::string& key) const;

  /// Type name of the stored alternative, "not_found" for unknown keys
  std::string get_type_name(const std::string& key) const;

  /// True if @p key was declared with a description
  bool has_description(const std::string& key) const;

  /**
   * @brief Description given when the key was declared
   * @throws SettingNotFound if there is no description
   */
  std::string get_description(const std::string& key) const;

  /// True if @p key carries a constraint
  bool has_limits(const std::string& key) const;

  /**
   * @brief Constraint attached to @p key
   * @throws SettingNotFound if there is no constraint
   */
  Constraint get_limits(const std::string& key) const;

  /**
   * @brief Whether the key belongs to the documented interface
   * @throws SettingNotFound if @p key does not exist
   */
  bool is_documented(const std::string& key) const;

  /**
   * @brief Apply values given as strings, parsed according to each key's
   * current type
   *
   * Booleans accept true/false, 1/0, yes/no and on/off; numbers and vectors
   * are parsed as JSON. Either all updates are applied or none.
   *
   * @throws SettingNotFound if any key does not exist
   * @throws std::runtime_error if any value cannot be parsed
   */
  void update(const std::map<std::string, std::string>& updates);

  /**
   * @brief Apply values from another Settings object; every key of
   * @p other must exist here
   */
  void update(const Settings& other);

  /// Forbid further modification
  void lock() const;

  /// True once lock() was called
  bool is_locked() const { return _locked; }

  nlohmann::json to_json() const override;

  /**
   * @brief Build a Settings object holding exactly the keys found in JSON
   * @throws std::runtime_error if the JSON is malformed
   */
  static std::shared_ptr<Settings> from_json(const nlohmann::json& json_obj);

  void to_json_file(const std::string& filename) const override;

  static std::shared_ptr<Settings> from_json_file(const std::string& filename);

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<Settings> from_hdf5_file(const std::string& filename);

  static std::shared_ptr<Settings> from_hdf5(H5::Group& group);

  void to_file(const std::string& filename,
               const std::string& type) const override;

  static std::shared_ptr<Settings> from_file(const std::string& filename,
                                             const std::string& type);

 protected:
  /**
   * @brief Declare a key with its default value
   *
   * Only derived-class constructors declare keys. Declaring an existing key
   * again is a no-op.
   *
   * @param key Setting key
   * @param value Default value
   * @param description Optional documentation string
   * @param limit Optional constraint, matching the value type
   * @param documented Whether the key is part of the documented interface
   * @throws std::invalid_argument if @p limit does not fit the value type
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt,
                   bool documented = true);

  /// @copydoc set_default(const std::string&, const SettingValue&, std::optional<std::string>, std::optional<Constraint>, bool)
  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt,
                   bool documented = true);

  /// @copydoc set_default(const std::string&, const SettingValue&, std::optional<std::string>, std::optional<Constraint>, bool)
  template <NonBoolIntegral Integer>
  void set_default(const std::string& key, Integer value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt,
                   bool documented = true) {
    set_default(key, SettingValue(static_cast<int64_t>(value)),
                std::move(description), std::move(limit), documented);
  }

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  template <typename Target>
  static std::optional<Target> _narrow(int64_t value) {
    if constexpr (std::is_signed_v<Target>) {
      if (value >= static_cast<int64_t>(std::numeric_limits<Target>::min()) &&
          value <= static_cast<int64_t>(std::numeric_limits<Target>::max())) {
        return static_cast<Target>(value);
      }
    } else {
      if (value >= 0 && static_cast<uint64_t>(value) <=
                            static_cast<uint64_t>(
                                std::numeric_limits<Target>::max())) {
        return static_cast<Target>(value);
      }
    }
    return std::nullopt;
  }

  const SettingValue& _find(const std::string& key) const;

  void _check_constraint(const std::string& key,
                         const SettingValue& value) const;

  SettingValue _parse_string(const std::string& key,
                             const std::string& text) const;

  nlohmann::json _metadata_to_json() const;

  void _metadata_from_json(const nlohmann::json& metadata);

  void _to_json_file(const std::string& filename) const;
  static std::shared_ptr<Settings> _from_json_file(const std::string& filename);
  void _to_hdf5_file(const std::string& filename) const;
  static std::shared_ptr<Settings> _from_hdf5_file(const std::string& filename);

  std::map<std::string, SettingValue> settings_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;
  std::map<std::string, bool> documented_;

  mutable bool _locked = false;
};

static_assert(DataClassCompliant<Settings>,
              "Settings must derive from DataClass and implement all required "
              "deserialization methods");

}  // namespace diven::data
