// EN: Engine configuration - lookup tables, validation settings and runtime options built from YAML
// FR: Configuration du moteur - tables de correspondance, paramètres de validation et options issus du YAML

#pragma once

#include "infrastructure/config/config_manager.hpp"
#include "normalize/record_normalizer.hpp"
#include "validation/quality_validator.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace TXR {
namespace Engine {

// EN: Fatal configuration problem, raised before any record is processed
// FR: Problème de configuration fatal, levé avant tout traitement d'enregistrement
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct EngineConfig {
    Normalize::RecordNormalizerConfig normalizer;
    Validation::ValidationSettings validation;
    size_t worker_threads{0};   // EN: 0 or 1 = run inline / FR: 0 ou 1 = exécution en ligne
    size_t chunk_size{1024};    // EN: Records per normalization task / FR: Enregistrements par tâche de normalisation

    // EN: Build from the loaded sections. Throws ConfigError for missing or invalid tables.
    // FR: Construit depuis les sections chargées. Lance ConfigError pour les tables manquantes ou invalides.
    static EngineConfig fromConfigManager(const ConfigManager& manager);

    // EN: Load a YAML file into the ConfigManager, apply TXR_* environment overrides, then the
    //     "section.key" overrides given by the caller (command line wins), then build.
    // FR: Charge un fichier YAML dans le ConfigManager, applique les surcharges d'environnement TXR_*,
    //     puis les surcharges "section.clé" de l'appelant (la ligne de commande gagne), puis construit.
    static EngineConfig loadFromFile(const std::string& path,
                                     const std::unordered_map<std::string, ConfigValue>& overrides = {});
    static EngineConfig loadFromString(const std::string& yaml_content);

    // EN: Rules registered with the ConfigManager for the scalar sections.
    // FR: Règles enregistrées auprès du ConfigManager pour les sections scalaires.
    static std::vector<ConfigManager::ValidationRule> validationRules();

    // EN: Re-check invariants after manual edits. Throws ConfigError.
    // FR: Revérifie les invariants après modifications manuelles. Lance ConfigError.
    void validate() const;
};

} // namespace Engine
} // namespace TXR
