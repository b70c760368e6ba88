#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace TXR {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    template<typename T>
    T asOrDefault(const T& default_value) const;

    // EN: Numeric view accepting both int and double payloads.
    // FR: Vue numérique acceptant les valeurs int et double.
    std::optional<double> asNumber() const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);

    // EN: Keys in lexicographic order, so callers iterate deterministically.
    // FR: Clés en ordre lexicographique, pour une itération déterministe.
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    void merge(const ConfigSection& other, bool overwrite = true);

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: YAML configuration manager with environment overrides and rule validation.
// FR: Gestionnaire de configuration YAML avec surcharges d'environnement et validation par règles.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values. Key is "section.key".
    // FR: Structure de règle de validation pour les valeurs de configuration. Clé "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "number", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file (replaces current sections).
    // FR: Charge la configuration depuis un fichier YAML (remplace les sections actuelles).
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply TXR_<SECTION>_<KEY> environment variables to keys already present.
    // FR: Applique les variables TXR_<SECTION>_<CLÉ> aux clés déjà présentes.
    size_t loadEnvironmentOverrides(const std::string& prefix = "TXR_");

    void addValidationRules(const std::vector<ValidationRule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    bool hasSection(const std::string& section) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    const std::string& getSourcePath() const { return source_path_; }

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données et règles de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadYaml(const YAML::Node& yaml);

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references using the process environment.
    // FR: Étend les références ${VAR} avec l'environnement du processus.
    std::string expandVariables(const std::string& value) const;
    std::string getEnvironmentVariable(const std::string& name) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;
    ConfigValue parseOverrideValue(const ConfigValue& current, const std::string& raw) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
    std::string source_path_;
};

// Template specializations
template<>
inline bool ConfigValue::as<bool>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<bool>(*value_);
}

template<>
inline int ConfigValue::as<int>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<int>(*value_);
}

template<>
inline double ConfigValue::as<double>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<double>(*value_);
}

template<>
inline std::string ConfigValue::as<std::string>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::string>(*value_);
}

template<>
inline std::vector<std::string> ConfigValue::as<std::vector<std::string>>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::vector<std::string>>(*value_);
}

#define CONFIG_GET_SECTION(section, key) TXR::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET_SECTION(section, key, value) TXR::ConfigManager::getInstance().set(section, key, TXR::ConfigValue(value))

} // namespace TXR
