// EN: Command-line option parser implementation
// FR: Implémentation de l'analyseur d'options de ligne de commande

#include "infrastructure/cli/option_parser.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace TXR {
namespace CLI {

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS:           return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED:    return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION:    return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE:     return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE:     return "INVALID_VALUE";
        default:                                return "UNKNOWN";
    }
}

std::string CliParseResult::get(const std::string& name, const std::string& fallback) const {
    auto it = values.find(name);
    return it == values.end() ? fallback : it->second;
}

bool CliParseResult::flag(const std::string& name) const {
    auto it = values.find(name);
    return it != values.end() && it->second == "true";
}

OptionParser::OptionParser(std::string program_name) : program_name_(std::move(program_name)) {}

void OptionParser::addOption(const CliOptionDefinition& option_def) {
    if (option_def.long_name.empty()) {
        throw std::invalid_argument("Option long name cannot be empty");
    }
    if (hasOption(option_def.long_name)) {
        throw std::invalid_argument("Duplicate option: --" + option_def.long_name);
    }
    options_.push_back(option_def);
}

void OptionParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        addOption(option_def);
    }
}

bool OptionParser::hasOption(const std::string& long_name) const {
    for (const auto& option : options_) {
        if (option.long_name == long_name) return true;
    }
    return false;
}

void OptionParser::setVersionInfo(const std::string& version, const std::string& build_info) {
    version_ = version;
    build_info_ = build_info;
}

CliParseResult OptionParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) { // EN: Skip program name / FR: Ignorer le nom du programme
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult OptionParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;

    auto fail = [&result](CliParseStatus status, const std::string& message) {
        result.errors.push_back(message);
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
    };

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];
        if (arg.empty()) continue;

        // EN: Check for help or version flags first
        // FR: Vérifier d'abord les drapeaux d'aide ou de version
        if (arg == "--help" || arg == "-h") {
            result.status = CliParseStatus::HELP_REQUESTED;
            result.help_text = generateHelpText();
            return result;
        }
        if (arg == "--version" || arg == "-V") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            result.version_text = generateVersionText();
            return result;
        }

        if (arg.size() < 2 || arg[0] != '-') {
            result.positional.push_back(arg);
            continue;
        }

        std::string inline_value;
        const CliOptionDefinition* option = findOption(arg, inline_value);
        if (!option) {
            fail(CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
            continue;
        }

        std::string raw;
        if (option->type == CliOptionType::BOOLEAN) {
            raw = "true";
        } else if (!inline_value.empty()) {
            raw = inline_value;
        } else if (i + 1 < arguments.size()) {
            raw = arguments[++i];
        } else {
            fail(CliParseStatus::MISSING_VALUE, "Option --" + option->long_name + " requires a value");
            continue;
        }

        ConfigValue converted;
        std::string error;
        if (!convertValue(*option, raw, converted, error)) {
            fail(CliParseStatus::INVALID_VALUE, "Invalid value for option --" + option->long_name + ": " + error);
            continue;
        }

        result.values[option->long_name] = raw;
        if (!option->config_path.empty()) {
            result.overrides[option->config_path] = converted;
        }
    }

    // EN: Defaults and required options
    // FR: Valeurs par défaut et options requises
    for (const auto& option : options_) {
        if (result.has(option.long_name)) continue;
        if (option.default_value) {
            result.values[option.long_name] = *option.default_value;
        } else if (option.required) {
            fail(CliParseStatus::MISSING_VALUE, "Missing required option: --" + option.long_name);
        }
    }

    return result;
}

const CliOptionDefinition* OptionParser::findOption(const std::string& arg, std::string& inline_value) const {
    inline_value.clear();
    if (arg.rfind("--", 0) == 0) {
        std::string name = arg.substr(2);
        size_t equals = name.find('=');
        if (equals != std::string::npos) {
            inline_value = name.substr(equals + 1);
            name = name.substr(0, equals);
        }
        for (const auto& option : options_) {
            if (option.long_name == name) return &option;
        }
        return nullptr;
    }
    if (arg.size() == 2) {
        for (const auto& option : options_) {
            if (option.short_name && *option.short_name == arg[1]) return &option;
        }
    }
    return nullptr;
}

bool OptionParser::convertValue(const CliOptionDefinition& option, const std::string& raw,
                                ConfigValue& converted, std::string& error) const {
    switch (option.type) {
        case CliOptionType::BOOLEAN:
            converted = ConfigValue(true);
            return true;
        case CliOptionType::STRING:
            converted = ConfigValue(raw);
            return true;
        case CliOptionType::INTEGER: {
            long long value = 0;
            try {
                size_t consumed = 0;
                value = std::stoll(raw, &consumed);
                if (consumed != raw.size()) {
                    error = "not an integer";
                    return false;
                }
            } catch (const std::invalid_argument&) {
                error = "not an integer";
                return false;
            } catch (const std::out_of_range&) {
                error = "out of range";
                return false;
            }
            if ((option.min_value && value < *option.min_value) ||
                (option.max_value && value > *option.max_value)) {
                error = "must be between " + std::to_string(option.min_value.value_or(0)) +
                        " and " + std::to_string(option.max_value.value_or(value));
                return false;
            }
            converted = ConfigValue(static_cast<int>(value));
            return true;
        }
    }
    error = "unsupported option type";
    return false;
}

std::string OptionParser::generateHelpText() const {
    std::ostringstream help;
    if (!help_header_.empty()) {
        help << help_header_ << "\n\n";
    }
    help << "Usage: " << program_name_ << " [OPTIONS]\n\n";
    help << "Options:\n";

    for (const auto& option : options_) {
        std::string names = option.short_name ? std::string("-") + *option.short_name + ", " : "    ";
        names += "--" + option.long_name;
        if (option.type != CliOptionType::BOOLEAN) {
            names += option.type == CliOptionType::INTEGER ? " N" : " VALUE";
        }
        help << "  " << std::left << std::setw(26) << names << option.description;
        if (option.required) {
            help << " (required)";
        } else if (option.default_value) {
            help << " (default: " << *option.default_value << ")";
        }
        help << "\n";
    }
    help << "  " << std::left << std::setw(26) << "-h, --help" << "Show this help\n";
    help << "  " << std::left << std::setw(26) << "-V, --version" << "Show version information\n";
    return help.str();
}

std::string OptionParser::generateVersionText() const {
    std::ostringstream version;
    version << program_name_ << " " << version_;
    if (!build_info_.empty()) {
        version << " (" << build_info_ << ")";
    }
    version << "\n";
    return version.str();
}

} // namespace CLI
} // namespace TXR
