// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <fstream>
#include <iomanip>
#include <sstream>
#include <tbscc/data/settings.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::data {

namespace {

const char* type_name_of(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return "bool";
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return "int";
        } else if constexpr (std::is_same_v<T, double>) {
          return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "string";
        } else if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
          return "vector<int>";
        } else if constexpr (std::is_same_v<T, std::vector<double>>) {
          return "vector<double>";
        } else {
          return "vector<string>";
        }
      },
      value);
}

}  // namespace

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  if (!has(key)) {
    throw SettingNotFound(key);
  }
  _validate(key, value);
  _settings[key] = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

SettingValue Settings::get(const std::string& key) const {
  auto it = _settings.find(key);
  if (it == _settings.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

bool Settings::has(const std::string& key) const {
  return _settings.find(key) != _settings.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(_settings.size());
  for (const auto& [key, _] : _settings) {
    result.push_back(key);
  }
  return result;
}

size_t Settings::size() const { return _settings.size(); }

bool Settings::empty() const { return _settings.empty(); }

std::string Settings::get_as_string(const std::string& key) const {
  return _visit_to_string(get(key));
}

std::optional<std::string> Settings::get_description(
    const std::string& key) const {
  if (!has(key)) throw SettingNotFound(key);
  auto it = _descriptions.find(key);
  if (it == _descriptions.end()) return std::nullopt;
  return it->second;
}

std::optional<Constraint> Settings::get_limits(const std::string& key) const {
  if (!has(key)) throw SettingNotFound(key);
  auto it = _limits.find(key);
  if (it == _limits.end()) return std::nullopt;
  return it->second;
}

const std::map<std::string, SettingValue>& Settings::get_all_settings() const {
  return _settings;
}

std::string Settings::get_summary() const {
  std::ostringstream oss;
  for (const auto& [key, value] : _settings) {
    oss << key << " = " << _visit_to_string(value) << "\n";
  }
  return oss.str();
}

void Settings::update(const std::map<std::string, SettingValue>& updates_map) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  // Validate everything first so that a failure leaves no partial update
  for (const auto& [key, value] : updates_map) {
    if (!has(key)) throw SettingNotFound(key);
    _validate(key, value);
  }
  for (const auto& [key, value] : updates_map) {
    _settings[key] = value;
  }
}

void Settings::update(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw std::runtime_error("Settings JSON must be an object");
  }
  std::map<std::string, SettingValue> updates;
  for (auto it = json_obj.begin(); it != json_obj.end(); ++it) {
    if (!has(it.key())) throw SettingNotFound(it.key());
    SettingValue value = _from_json_value(it.key(), it.value());
    // JSON does not distinguish 1.0 from 1; follow the registered type
    const SettingValue& current = _settings.at(it.key());
    if (std::holds_alternative<double>(current) &&
        std::holds_alternative<int64_t>(value)) {
      value = static_cast<double>(std::get<int64_t>(value));
    }
    updates[it.key()] = std::move(value);
  }
  update(updates);
}

nlohmann::json Settings::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [key, value] : _settings) {
    j[key] = _to_json_value(value);
  }
  return j;
}

std::shared_ptr<Settings> Settings::from_json(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw std::runtime_error("Settings JSON must be an object");
  }
  auto settings = std::make_shared<Settings>();
  for (auto it = json_obj.begin(); it != json_obj.end(); ++it) {
    settings->_register(it.key(), _from_json_value(it.key(), it.value()),
                        std::nullopt, std::nullopt);
  }
  return settings;
}

void Settings::to_json_file(const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }
  file << std::setw(2) << to_json() << std::endl;
  if (file.fail()) {
    throw std::runtime_error("Error writing settings to file: " + filename);
  }
}

std::shared_ptr<Settings> Settings::from_json_file(
    const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for reading: " + filename);
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Cannot parse settings file " + filename + ": " +
                             e.what());
  }
  return from_json(j);
}

void Settings::lock() const { _locked = true; }

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) return;
  _register(key, SettingValue(std::string(value)), std::move(description),
            std::move(limit));
}

void Settings::_register(const std::string& key, SettingValue value,
                         std::optional<std::string> description,
                         std::optional<Constraint> limit) {
  _settings[key] = std::move(value);
  if (description.has_value()) {
    _descriptions[key] = std::move(*description);
  }
  if (limit.has_value()) {
    _limits[key] = std::move(*limit);
  }
}

void Settings::_validate(const std::string& key,
                         const SettingValue& value) const {
  const SettingValue& current = _settings.at(key);
  if (current.index() != value.index()) {
    throw SettingTypeMismatch(key, type_name_of(current));
  }

  auto it = _limits.find(key);
  if (it == _limits.end()) return;

  const bool ok = std::visit(
      [&value](const auto& limit) -> bool {
        using L = std::decay_t<decltype(limit)>;
        if constexpr (std::is_same_v<L, BoundConstraint<int64_t>>) {
          const auto* v = std::get_if<int64_t>(&value);
          return v && *v >= limit.min && *v <= limit.max;
        } else if constexpr (std::is_same_v<L, BoundConstraint<double>>) {
          const auto* v = std::get_if<double>(&value);
          return v && *v >= limit.min && *v <= limit.max;
        } else if constexpr (std::is_same_v<L, ListConstraint<int64_t>>) {
          const auto* v = std::get_if<int64_t>(&value);
          return v && std::find(limit.allowed_values.begin(),
                                limit.allowed_values.end(),
                                *v) != limit.allowed_values.end();
        } else {
          const auto* v = std::get_if<std::string>(&value);
          return v && std::find(limit.allowed_values.begin(),
                                limit.allowed_values.end(),
                                *v) != limit.allowed_values.end();
        }
      },
      it->second);

  if (!ok) {
    TBSCC_LOGGER().error("Rejected value {} for setting '{}'",
                         _visit_to_string(value), key);
    throw std::out_of_range("Value " + _visit_to_string(value) +
                            " for setting '" + key +
                            "' is outside its allowed limits");
  }
}

std::string Settings::_visit_to_string(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        std::ostringstream oss;
        if constexpr (std::is_same_v<T, bool>) {
          oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
          oss << std::scientific << std::setprecision(6) << v;
        } else if constexpr (std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, std::string>) {
          oss << v;
        } else {
          oss << "[";
          for (size_t i = 0; i < v.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << v[i];
          }
          oss << "]";
        }
        return oss.str();
      },
      value);
}

nlohmann::json Settings::_to_json_value(const SettingValue& value) {
  return std::visit([](const auto& v) -> nlohmann::json { return v; }, value);
}

SettingValue Settings::_from_json_value(const std::string& key,
                                        const nlohmann::json& j) {
  if (j.is_boolean()) return j.get<bool>();
  if (j.is_number_integer()) return j.get<int64_t>();
  if (j.is_number_float()) return j.get<double>();
  if (j.is_string()) return j.get<std::string>();
  if (j.is_array()) {
    if (j.empty()) return std::vector<double>{};
    if (std::all_of(j.begin(), j.end(),
                    [](const auto& e) { return e.is_number_integer(); })) {
      return j.get<std::vector<int64_t>>();
    }
    if (std::all_of(j.begin(), j.end(),
                    [](const auto& e) { return e.is_number(); })) {
      return j.get<std::vector<double>>();
    }
    if (std::all_of(j.begin(), j.end(),
                    [](const auto& e) { return e.is_string(); })) {
      return j.get<std::vector<std::string>>();
    }
  }
  throw SettingTypeMismatch(key, "bool, number, string or homogeneous array");
}

}  // namespace tbscc::data
