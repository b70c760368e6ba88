// EN: Command-line option parser for txrctl - typed options, constraints and configuration overrides
// FR: Analyseur d'options de ligne de commande pour txrctl - options typées, contraintes et surcharges de configuration

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace TXR {
namespace CLI {

// EN: CLI option types
// FR: Types d'options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Flag without value / FR: Drapeau sans valeur
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING          // EN: String value / FR: Valeur chaîne
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Unknown option provided / FR: Option inconnue fournie
    MISSING_VALUE,          // EN: Value or required option missing / FR: Valeur ou option requise manquante
    INVALID_VALUE           // EN: Value fails type or range check / FR: Valeur hors type ou hors plage
};

std::string cliParseStatusToString(CliParseStatus status);

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                      // EN: Long option name (--input) / FR: Nom d'option long (--input)
    std::optional<char> short_name;             // EN: Short option name (-i) / FR: Nom d'option court (-i)
    CliOptionType type{CliOptionType::STRING};
    std::string description;
    std::string config_path;                    // EN: "section.key" overridden by this option, empty if none / FR: "section.clé" surchargée par l'option, vide sinon
    std::optional<std::string> default_value;
    bool required = false;
    std::optional<long long> min_value;         // EN: Only for INTEGER / FR: Uniquement pour INTEGER
    std::optional<long long> max_value;
};

// EN: CLI parsing result containing all parsed options and status
// FR: Résultat d'analyse CLI contenant toutes les options analysées et le statut
struct CliParseResult {
    CliParseStatus status{CliParseStatus::SUCCESS};
    std::unordered_map<std::string, std::string> values;        // EN: Long name to raw value, defaults included / FR: Nom long vers valeur brute, défauts inclus
    std::unordered_map<std::string, ConfigValue> overrides;     // EN: Config path to typed value / FR: Chemin de config vers valeur typée
    std::vector<std::string> errors;
    std::vector<std::string> positional;
    std::string help_text;
    std::string version_text;

    bool has(const std::string& name) const { return values.count(name) > 0; }
    std::string get(const std::string& name, const std::string& fallback = "") const;
    bool flag(const std::string& name) const;
};

class OptionParser {
public:
    explicit OptionParser(std::string program_name);

    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);
    bool hasOption(const std::string& long_name) const;

    void setHelpHeader(const std::string& header) { help_header_ = header; }
    void setVersionInfo(const std::string& version, const std::string& build_info = "");

    // EN: Accepts "--name value", "--name=value" and "-n value". Help and version stop parsing.
    // FR: Accepte "--nom valeur", "--nom=valeur" et "-n valeur". Aide et version arrêtent l'analyse.
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;

private:
    const CliOptionDefinition* findOption(const std::string& arg, std::string& inline_value) const;
    bool convertValue(const CliOptionDefinition& option, const std::string& raw,
                      ConfigValue& converted, std::string& error) const;

    std::string program_name_;
    std::string help_header_;
    std::string version_;
    std::string build_info_;
    std::vector<CliOptionDefinition> options_;
};

} // namespace CLI
} // namespace TXR
