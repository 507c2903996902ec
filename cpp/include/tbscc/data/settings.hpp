// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <algorithm>
#include <cstdint>
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

namespace tbscc::data {

/**
 * @brief Value types a setting can hold
 *
 * Integers are always stored as int64_t; other integral types are converted
 * on set() and range-checked on get().
 */
using SettingValue =
    std::variant<bool, int64_t, double, std::string, std::vector<int64_t>,
                 std::vector<double>, std::vector<std::string>>;

template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();
  T max = std::numeric_limits<T>::max();
};

template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;
};

/**
 * @brief Admissible values of a setting
 */
using Constraint =
    std::variant<BoundConstraint<int64_t>, ListConstraint<int64_t>,
                 BoundConstraint<double>, ListConstraint<std::string>>;

/**
 * @brief Exception thrown when modification of locked settings is requested
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Exception thrown when a setting is not found
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Exception thrown when a setting type conversion fails
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @brief Base class for typed, self-describing configuration objects
 *
 * The set of keys is fixed by the derived class constructor through
 * set_default(); afterwards only existing keys can be changed, and only to a
 * value of the same type that satisfies the key's constraint.
 *
 * ```cpp
 * class MySettings : public Settings {
 *  public:
 *   MySettings() {
 *     set_default("max_iterations", 100, "Iteration cap",
 *                 BoundConstraint<int64_t>{0});
 *     set_default("tolerance", 1e-6);
 *   }
 * };
 *
 * MySettings s;
 * s.set("max_iterations", 50);
 * auto n = s.get<size_t>("max_iterations");
 * ```
 *
 * Algorithms lock their settings when a run starts; a locked object rejects
 * every further set() with SettingsAreLocked.
 */
class Settings {
 public:
  Settings() = default;
  virtual ~Settings() = default;

  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  /**
   * @brief Set a setting value
   * @param key The setting key
   * @param value The new value; must match the stored type
   * @throws SettingNotFound if the key does not exist
   * @throws SettingTypeMismatch if the value type differs from the stored one
   * @throws std::out_of_range if the value violates the key's constraint
   * @throws SettingsAreLocked if the settings are locked
   */
  void set(const std::string& key, const SettingValue& value);

  /**
   * @brief Set a setting value, converting integers to int64_t
   */
  template <typename T>
  void set(const std::string& key, const T& value) {
    static_assert(is_supported_type<T>(),
                  "Type not supported in SettingValue variant");
    if constexpr (is_variant_member_v<T, SettingValue>) {
      set(key, SettingValue(value));
    } else if constexpr (is_non_bool_integral_v<T>) {
      if constexpr (std::is_unsigned_v<T>) {
        if (value > static_cast<std::make_unsigned_t<int64_t>>(
                        std::numeric_limits<int64_t>::max())) {
          throw std::out_of_range("Value for setting '" + key +
                                  "' cannot be represented as int64_t.");
        }
      }
      set(key, SettingValue(static_cast<int64_t>(value)));
    } else {
      set(key, SettingValue(_convert_to_int64_vector(value)));
    }
  }

  /**
   * @brief Set a string setting from a C string
   */
  void set(const std::string& key, const char* value);

  /**
   * @brief Get a setting value as variant
   * @throws SettingNotFound if key doesn't exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Get a setting value with type checking
   * @throws SettingNotFound if key doesn't exist
   * @throws SettingTypeMismatch if the stored value cannot be returned as T
   */
  template <typename T>
  T get(const std::string& key) const {
    auto it = _settings.find(key);
    if (it == _settings.end()) {
      throw SettingNotFound(key);
    }

    if constexpr (is_variant_member_v<T, SettingValue>) {
      if (const T* value = std::get_if<T>(&it->second)) {
        return *value;
      }
      throw SettingTypeMismatch(key, typeid(T).name());
    } else if constexpr (is_non_bool_integral_v<T>) {
      if (const int64_t* value = std::get_if<int64_t>(&it->second)) {
        if (auto converted = _safe_convert<T>(*value)) {
          return *converted;
        }
      }
      throw SettingTypeMismatch(key, typeid(T).name());
    } else if constexpr (is_non_bool_integral_vector_v<T>) {
      using ElementType = typename T::value_type;
      if (const auto* vec64 = std::get_if<std::vector<int64_t>>(&it->second)) {
        T result;
        result.reserve(vec64->size());
        for (const auto& val : *vec64) {
          if (auto converted = _safe_convert<ElementType>(val)) {
            result.push_back(*converted);
          } else {
            throw SettingTypeMismatch(key, "vector element out of range");
          }
        }
        return result;
      }
      throw SettingTypeMismatch(key, typeid(T).name());
    } else {
      static_assert(is_supported_type<T>(),
                    "Type not supported in SettingValue variant");
    }
  }

  /**
   * @brief Get a setting value, or a default if missing or of another type
   */
  template <typename T>
  T get_or_default(const std::string& key, const T& default_value) const {
    if (!has(key)) return default_value;
    try {
      return get<T>(key);
    } catch (const SettingTypeMismatch&) {
      return default_value;
    }
  }

  /**
   * @brief Check if a setting exists
   */
  bool has(const std::string& key) const;

  /**
   * @brief All setting keys in lexicographic order
   */
  std::vector<std::string> keys() const;

  size_t size() const;
  bool empty() const;

  /**
   * @brief Human readable value of a setting
   * @throws SettingNotFound if key doesn't exist
   */
  std::string get_as_string(const std::string& key) const;

  /**
   * @brief Description registered with set_default(), if any
   */
  std::optional<std::string> get_description(const std::string& key) const;

  /**
   * @brief Constraint registered with set_default(), if any
   */
  std::optional<Constraint> get_limits(const std::string& key) const;

  const std::map<std::string, SettingValue>& get_all_settings() const;

  /**
   * @brief One line per setting, "key = value"
   */
  std::string get_summary() const;

  /**
   * @brief Apply several updates atomically
   *
   * Every key must exist and every value must pass the type and constraint
   * checks; otherwise nothing is modified.
   */
  void update(const std::map<std::string, SettingValue>& updates_map);

  /**
   * @brief Apply the values of a JSON object to existing keys (atomic)
   * @throws SettingNotFound for unknown keys
   * @throws SettingTypeMismatch for values of the wrong JSON type
   */
  void update(const nlohmann::json& json_obj);

  /**
   * @brief Serialize all settings to a flat JSON object
   */
  nlohmann::json to_json() const;

  /**
   * @brief Create untyped settings from a flat JSON object
   * @throws std::runtime_error if a value cannot be represented
   */
  static std::shared_ptr<Settings> from_json(const nlohmann::json& json_obj);

  /**
   * @brief Write to_json() to a file
   * @throws std::runtime_error if the file cannot be written
   */
  void to_json_file(const std::string& filename) const;

  /**
   * @brief Read settings written by to_json_file()
   * @throws std::runtime_error if the file cannot be read or parsed
   */
  static std::shared_ptr<Settings> from_json_file(const std::string& filename);

  /**
   * @brief Lock the settings to prevent further modifications
   */
  void lock() const;

  bool is_locked() const { return _locked; }

 protected:
  /**
   * @brief Register a key with its default value (constructors only)
   *
   * Does nothing if the key already exists.
   *
   * @param key The setting key
   * @param value The default value
   * @param description Optional one-line description
   * @param limit Optional constraint checked on every later set()
   */
  template <typename T>
  void set_default(const std::string& key, const T& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt) {
    static_assert(is_supported_type<T>(),
                  "Type not supported in SettingValue variant");
    if (has(key)) return;
    if constexpr (is_variant_member_v<T, SettingValue>) {
      _register(key, SettingValue(value), std::move(description),
                std::move(limit));
    } else if constexpr (is_non_bool_integral_v<T>) {
      _register(key, SettingValue(static_cast<int64_t>(value)),
                std::move(description), std::move(limit));
    } else {
      _register(key, SettingValue(_convert_to_int64_vector(value)),
                std::move(description), std::move(limit));
    }
  }

  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

 private:
  template <typename T, typename Variant>
  struct is_variant_member;

  template <typename T, typename... Ts>
  struct is_variant_member<T, std::variant<Ts...>>
      : std::disjunction<std::is_same<T, Ts>...> {};

  template <typename T, typename Variant>
  inline static constexpr bool is_variant_member_v =
      is_variant_member<T, Variant>::value;

  template <typename T>
  struct is_vector : std::false_type {};

  template <typename T, typename A>
  struct is_vector<std::vector<T, A>> : std::true_type {};

  template <typename T>
  struct is_non_bool_integral
      : std::conjunction<std::is_integral<T>,
                         std::negation<std::is_same<T, bool>>> {};

  template <typename T>
  inline static constexpr bool is_non_bool_integral_v =
      is_non_bool_integral<T>::value;

  template <typename T>
  static constexpr bool is_non_bool_integral_vector() {
    if constexpr (is_vector<T>::value) {
      return is_non_bool_integral_v<typename T::value_type>;
    } else {
      return false;
    }
  }

  template <typename T>
  inline static constexpr bool is_non_bool_integral_vector_v =
      is_non_bool_integral_vector<T>();

  template <typename T>
  static constexpr bool is_supported_type() {
    return is_variant_member_v<T, SettingValue> ||
           is_non_bool_integral_v<T> || is_non_bool_integral_vector_v<T>;
  }

  /**
   * @brief Range-checked integer conversion
   * @return The converted value, or std::nullopt if it does not fit
   */
  template <typename TargetT, typename SourceT>
  static std::optional<TargetT> _safe_convert(const SourceT& value) {
    if constexpr (std::is_signed_v<TargetT>) {
      if (value >= static_cast<SourceT>(std::numeric_limits<TargetT>::min()) &&
          value <= static_cast<SourceT>(std::numeric_limits<TargetT>::max())) {
        return static_cast<TargetT>(value);
      }
    } else {
      if (value >= 0 && static_cast<std::make_unsigned_t<SourceT>>(value) <=
                            std::numeric_limits<TargetT>::max()) {
        return static_cast<TargetT>(value);
      }
    }
    return std::nullopt;
  }

  template <typename T>
  static std::vector<int64_t> _convert_to_int64_vector(
      const std::vector<T>& value) {
    std::vector<int64_t> int64_vec(value.size());
    std::transform(value.begin(), value.end(), int64_vec.begin(),
                   [](const T& v) { return static_cast<int64_t>(v); });
    return int64_vec;
  }

  void _register(const std::string& key, SettingValue value,
                 std::optional<std::string> description,
                 std::optional<Constraint> limit);

  /**
   * @brief Type and constraint check of a candidate value for an existing key
   */
  void _validate(const std::string& key, const SettingValue& value) const;

  static std::string _visit_to_string(const SettingValue& value);
  static nlohmann::json _to_json_value(const SettingValue& value);
  static SettingValue _from_json_value(const std::string& key,
                                       const nlohmann::json& j);

  std::map<std::string, SettingValue> _settings;
  std::map<std::string, std::string> _descriptions;
  std::map<std::string, Constraint> _limits;

  mutable bool _locked = false;
};

}  // namespace tbscc::data
