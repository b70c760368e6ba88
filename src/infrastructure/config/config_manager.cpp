// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing YAML, les surcharges et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

namespace TXR {

// EN: ConfigValue template implementation for type conversion.
// FR: Implémentation de template ConfigValue pour la conversion de types.
template<typename T>
T ConfigValue::as() const {
    if (!value_) {
        throw std::runtime_error("ConfigValue is empty");
    }
    try {
        return std::get<T>(*value_);
    } catch (const std::bad_variant_access&) {
        throw std::runtime_error("ConfigValue type mismatch");
    }
}

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    if (const T* v = std::get_if<T>(&*value_)) {
        return *v;
    }
    return std::nullopt;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

std::optional<double> ConfigValue::asNumber() const {
    if (auto int_val = tryAs<int>()) {
        return static_cast<double>(*int_val);
    }
    return tryAs<double>();
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigSection::merge(const ConfigSection& other, bool overwrite) {
    for (const auto& [key, value] : other.values_) {
        if (overwrite || !has(key)) {
            set(key, value);
        }
    }
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        if (!loadYaml(yaml)) {
            LOG_ERROR("config", "Configuration root must be a mapping: " + filename);
            return false;
        }
        source_path_ = filename;

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (!loadYaml(yaml)) {
            LOG_ERROR("config", "Configuration root must be a mapping");
            return false;
        }
        source_path_.clear();

        LOG_INFO("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Each top-level mapping becomes a section; scalars land in a "value" key.
// FR: Chaque mapping de premier niveau devient une section ; les scalaires vont dans la clé "value".
bool ConfigManager::loadYaml(const YAML::Node& yaml) {
    if (!yaml.IsMap()) {
        return false;
    }

    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                std::string key = item.first.as<std::string>();
                config_section.set(key, parseYamlValue(item.second));
            }
        } else if (!section.second.IsNull()) {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    sections_ = std::move(loaded);
    return true;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsScalar()) {
        std::string str_val = node.as<std::string>();

        if (str_val == "true" || str_val == "false") {
            return ConfigValue(str_val == "true");
        }

        // EN: Quoted scalars stay strings even when they look numeric.
        // FR: Les scalaires entre guillemets restent des chaînes même s'ils semblent numériques.
        if (node.Tag() != "!") {
            if (str_val.find('.') == std::string::npos) {
                int int_val = 0;
                if (YAML::convert<int>::decode(node, int_val)) {
                    return ConfigValue(int_val);
                }
            }

            double double_val = 0.0;
            if (YAML::convert<double>::decode(node, double_val)) {
                return ConfigValue(double_val);
            }
        }

        return ConfigValue(expandVariables(str_val));
    } else if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    } else if (node.IsNull()) {
        return ConfigValue();
    }

    throw std::runtime_error("Nested mappings are not supported below section level");
}

// EN: Build the override value using the type of the value being replaced.
// FR: Construit la valeur de surcharge selon le type de la valeur remplacée.
ConfigValue ConfigManager::parseOverrideValue(const ConfigValue& current, const std::string& raw) const {
    if (current.tryAs<bool>()) {
        std::string lower = raw;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes") return ConfigValue(true);
        if (lower == "false" || lower == "0" || lower == "no") return ConfigValue(false);
        throw std::invalid_argument("expected a boolean");
    }
    if (current.tryAs<int>()) {
        size_t consumed = 0;
        int value = std::stoi(raw, &consumed);
        if (consumed != raw.size()) throw std::invalid_argument("expected an integer");
        return ConfigValue(value);
    }
    if (current.tryAs<double>()) {
        size_t consumed = 0;
        double value = std::stod(raw, &consumed);
        if (consumed != raw.size()) throw std::invalid_argument("expected a number");
        return ConfigValue(value);
    }
    if (current.tryAs<std::vector<std::string>>()) {
        std::vector<std::string> items;
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) items.push_back(item);
        }
        return ConfigValue(items);
    }
    return ConfigValue(raw);
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto to_env_token = [](const std::string& name) {
        std::string token;
        for (unsigned char c : name) {
            token += std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
        }
        return token;
    };

    size_t applied = 0;
    for (auto& [section_name, section] : sections_) {
        for (const std::string& key : section.keys()) {
            std::string env_name = prefix + to_env_token(section_name) + "_" + to_env_token(key);
            std::string env_value = getEnvironmentVariable(env_name);
            if (env_value.empty()) {
                continue;
            }

            try {
                section.set(key, parseOverrideValue(section.get(key), env_value));
                ++applied;
                LOG_INFO("config", "Environment override applied: " + section_name + "." + key);
            } catch (const std::exception& e) {
                LOG_WARN("config", "Ignoring environment override " + env_name + ": " + e.what());
            }
        }
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value;
        auto section_it = sections_.find(section_name);
        if (section_it != sections_.end()) {
            value = section_it->second.get(key_name);
        }

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

bool ConfigManager::hasSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_.find(section) != sections_.end();
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
    source_path_.clear();
}

std::string ConfigManager::dump() const {
    std::vector<std::string> names = getSectionNames();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if ((rule.type == "double" || rule.type == "number") && !value.asNumber()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if (rule.min_value || rule.max_value) {
        if (auto numeric_value = value.asNumber()) {
            if (rule.min_value && *numeric_value < *rule.min_value) {
                error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
                return false;
            }
            if (rule.max_value && *numeric_value > *rule.max_value) {
                error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
                return false;
            }
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    std::string result = value;
    std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;

    while (std::regex_search(result, match, var_regex)) {
        std::string var_value = getEnvironmentVariable(match[1].str());
        if (var_value.empty()) {
            // Leave variable as-is if not found
            break;
        }
        result.replace(match.position(), match.length(), var_value);
    }

    return result;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    const char* env_value = std::getenv(name.c_str());
    return env_value ? std::string(env_value) : "";
}

// Explicit template instantiations for non-specialized methods only
template std::optional<bool> ConfigValue::tryAs<bool>() const;
template std::optional<int> ConfigValue::tryAs<int>() const;
template std::optional<double> ConfigValue::tryAs<double>() const;
template std::optional<std::string> ConfigValue::tryAs<std::string>() const;
template std::optional<std::vector<std::string>> ConfigValue::tryAs<std::vector<std::string>>() const;

template bool ConfigValue::asOrDefault<bool>(const bool&) const;
template int ConfigValue::asOrDefault<int>(const int&) const;
template double ConfigValue::asOrDefault<double>(const double&) const;
template std::string ConfigValue::asOrDefault<std::string>(const std::string&) const;
template std::vector<std::string> ConfigValue::asOrDefault<std::vector<std::string>>(const std::vector<std::string>&) const;

} // namespace TXR
