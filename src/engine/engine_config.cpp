// EN: Engine configuration loading and validation
// FR: Chargement et validation de la configuration du moteur

#include "engine/engine_config.hpp"
#include "infrastructure/logging/logger.hpp"
#include "normalize/text_utils.hpp"

#include <cmath>

namespace TXR {
namespace Engine {

namespace {

const char* kExchangeRates = "exchange_rates";
const char* kCountrySynonyms = "country_synonyms";
const char* kCategoryAliases = "category_aliases";
const char* kValidation = "validation";
const char* kEngine = "engine";

// EN: A synonym entry is either a list of aliases, a single alias, or empty.
// FR: Une entrée de synonymes est une liste d'alias, un alias unique, ou vide.
Normalize::SynonymTable readSynonymSection(const ConfigSection& section, const std::string& section_name) {
    Normalize::SynonymTable table;
    for (const auto& canonical : section.keys()) {
        ConfigValue value = section.get(canonical);
        std::vector<std::string> aliases;
        if (!value.isValid()) {
            // EN: No aliases, the canonical name still maps to itself.
            // FR: Pas d'alias, le nom canonique se résout toujours vers lui-même.
        } else if (auto list = value.tryAs<std::vector<std::string>>()) {
            aliases = *list;
        } else if (auto single = value.tryAs<std::string>()) {
            aliases.push_back(*single);
        } else {
            throw ConfigError(section_name + "." + canonical + " must be a list of strings");
        }
        table.emplace(canonical, std::move(aliases));
    }
    return table;
}

CalendarDate readDate(const ConfigSection& section, const std::string& key, const CalendarDate& fallback) {
    if (!section.has(key)) {
        return fallback;
    }
    auto text = section.get(key).tryAs<std::string>();
    auto date = text ? CalendarDate::fromIsoString(Normalize::trim(*text)) : std::nullopt;
    if (!date) {
        throw ConfigError(std::string(kValidation) + "." + key + " must be a YYYY-MM-DD date");
    }
    return *date;
}

int readInt(const ConfigSection& section, const std::string& section_name,
            const std::string& key, int fallback, int minimum) {
    if (!section.has(key)) {
        return fallback;
    }
    auto value = section.get(key).tryAs<int>();
    if (!value || *value < minimum) {
        throw ConfigError(section_name + "." + key + " must be an integer >= " + std::to_string(minimum));
    }
    return *value;
}

double readPositiveNumber(const ConfigSection& section, const std::string& section_name,
                          const std::string& key, double fallback) {
    if (!section.has(key)) {
        return fallback;
    }
    auto value = section.get(key).asNumber();
    if (!value || !(*value > 0.0) || !std::isfinite(*value)) {
        throw ConfigError(section_name + "." + key + " must be a positive number");
    }
    return *value;
}

std::string readString(const ConfigSection& section, const std::string& section_name,
                       const std::string& key, const std::string& fallback) {
    if (!section.has(key)) {
        return fallback;
    }
    auto value = section.get(key).tryAs<std::string>();
    if (!value || Normalize::trim(*value).empty()) {
        throw ConfigError(section_name + "." + key + " must be a non-empty string");
    }
    return Normalize::trim(*value);
}

} // namespace

EngineConfig EngineConfig::fromConfigManager(const ConfigManager& manager) {
    EngineConfig config;

    // EN: Exchange rate table (required)
    // FR: Table des taux de change (requise)
    ConfigSection rates = manager.getSection(kExchangeRates);
    if (rates.empty()) {
        throw ConfigError("Missing required table: exchange_rates");
    }
    for (const auto& code : rates.keys()) {
        auto rate = rates.get(code).asNumber();
        if (!rate || !(*rate > 0.0) || !std::isfinite(*rate)) {
            throw ConfigError("exchange_rates." + code + " must be a positive number");
        }
        config.normalizer.exchange_rates[Normalize::toUpperAscii(Normalize::trim(code))] = *rate;
    }

    // EN: Country synonym table (required)
    // FR: Table de synonymes des pays (requise)
    ConfigSection countries = manager.getSection(kCountrySynonyms);
    if (countries.empty()) {
        throw ConfigError("Missing required table: country_synonyms");
    }
    config.normalizer.country_synonyms = readSynonymSection(countries, kCountrySynonyms);

    if (manager.hasSection(kCategoryAliases)) {
        config.normalizer.category_aliases = readSynonymSection(manager.getSection(kCategoryAliases), kCategoryAliases);
    }

    ConfigSection validation = manager.getSection(kValidation);
    config.validation.date_window_start = readDate(validation, "date_window_start", config.validation.date_window_start);
    config.validation.date_window_end = readDate(validation, "date_window_end", config.validation.date_window_end);
    config.validation.quantity_ceiling = readInt(validation, kValidation, "quantity_ceiling", 100, 1);
    double amount_ceiling = readPositiveNumber(validation, kValidation, "amount_ceiling", 100000.0);
    config.validation.amount_ceiling = Money::fromCents(static_cast<int64_t>(std::llround(amount_ceiling * 100.0)));
    config.validation.country_ceiling = static_cast<size_t>(readInt(validation, kValidation, "country_ceiling", 20, 0));
    config.validation.outlier_sigma = readPositiveNumber(validation, kValidation, "outlier_sigma", 3.0);
    config.normalizer.quantity_ceiling = config.validation.quantity_ceiling;

    ConfigSection engine = manager.getSection(kEngine);
    config.worker_threads = static_cast<size_t>(readInt(engine, kEngine, "worker_threads", 0, 0));
    config.chunk_size = static_cast<size_t>(readInt(engine, kEngine, "chunk_size", 1024, 1));
    config.normalizer.missing_category = readString(engine, kEngine, "missing_category", "Uncategorized");
    config.normalizer.email.inferred_domain = readString(engine, kEngine, "inferred_email_domain", "inferred.com");
    config.normalizer.email.placeholder_domain = readString(engine, kEngine, "placeholder_email_domain", "domain.com");

    config.validate();

    for (const auto& [canonical, aliases] : config.normalizer.country_synonyms) {
        config.validation.canonical_countries.insert(canonical);
    }

    LOG_INFO_META("engine_config", "Engine configuration loaded", {
        {"exchange_rates", std::to_string(config.normalizer.exchange_rates.size())},
        {"countries", std::to_string(config.normalizer.country_synonyms.size())},
        {"category_aliases", std::to_string(config.normalizer.category_aliases.size())},
        {"worker_threads", std::to_string(config.worker_threads)}
    });
    return config;
}

void EngineConfig::validate() const {
    if (normalizer.exchange_rates.empty()) {
        throw ConfigError("Missing required table: exchange_rates");
    }
    for (const auto& [code, rate] : normalizer.exchange_rates) {
        if (!(rate > 0.0)) {
            throw ConfigError("exchange_rates." + code + " must be a positive number");
        }
    }
    if (normalizer.country_synonyms.empty()) {
        throw ConfigError("Missing required table: country_synonyms");
    }
    auto conflicts = Normalize::CountryNormalizer::findConflicts(normalizer.country_synonyms);
    if (!conflicts.empty()) {
        throw ConfigError("country_synonyms: " + conflicts.front());
    }
    if (validation.date_window_end < validation.date_window_start) {
        throw ConfigError("validation.date_window_end is before validation.date_window_start");
    }
    if (normalizer.quantity_ceiling < 1) {
        throw ConfigError("validation.quantity_ceiling must be at least 1");
    }
}

std::vector<ConfigManager::ValidationRule> EngineConfig::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule quantity;
    quantity.key = "validation.quantity_ceiling";
    quantity.type = "int";
    quantity.min_value = 1;
    quantity.description = "Largest quantity kept as-is";
    rules.push_back(quantity);

    ConfigManager::ValidationRule amount;
    amount.key = "validation.amount_ceiling";
    amount.type = "number";
    amount.min_value = 0.01;
    amount.description = "Largest valid amount in USD";
    rules.push_back(amount);

    ConfigManager::ValidationRule sigma;
    sigma.key = "validation.outlier_sigma";
    sigma.type = "number";
    sigma.min_value = 0.1;
    sigma.description = "Standard deviations for the outlier check";
    rules.push_back(sigma);

    ConfigManager::ValidationRule threads;
    threads.key = "engine.worker_threads";
    threads.type = "int";
    threads.min_value = 0;
    threads.max_value = 256;
    threads.description = "Normalization worker threads";
    rules.push_back(threads);

    return rules;
}

EngineConfig EngineConfig::loadFromFile(const std::string& path,
                                        const std::unordered_map<std::string, ConfigValue>& overrides) {
    auto& manager = ConfigManager::getInstance();
    if (!manager.loadFromFile(path)) {
        LOG_ERROR("engine_config", "Cannot load configuration file: " + path);
        throw ConfigError("Cannot load configuration file: " + path);
    }
    manager.loadEnvironmentOverrides("TXR_");
    for (const auto& [key_path, value] : overrides) {
        size_t dot = key_path.find('.');
        if (dot == std::string::npos) {
            throw ConfigError("Override path must be section.key: " + key_path);
        }
        manager.set(key_path.substr(0, dot), key_path.substr(dot + 1), value);
    }
    manager.addValidationRules(validationRules());

    std::vector<std::string> errors;
    if (!manager.validate(errors)) {
        for (const auto& error : errors) {
            LOG_ERROR("engine_config", error);
        }
        throw ConfigError("Invalid configuration: " + errors.front());
    }
    return fromConfigManager(manager);
}

EngineConfig EngineConfig::loadFromString(const std::string& yaml_content) {
    auto& manager = ConfigManager::getInstance();
    if (!manager.loadFromString(yaml_content)) {
        LOG_ERROR("engine_config", "Cannot parse configuration text");
        throw ConfigError("Cannot parse configuration text");
    }
    manager.addValidationRules(validationRules());

    std::vector<std::string> errors;
    if (!manager.validate(errors)) {
        for (const auto& error : errors) {
            LOG_ERROR("engine_config", error);
        }
        throw ConfigError("Invalid configuration: " + errors.front());
    }
    return fromConfigManager(manager);
}

} // namespace Engine
} // namespace TXR
