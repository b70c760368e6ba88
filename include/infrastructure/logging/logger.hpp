// EN: Thread-safe NDJSON logger used by every TXR stage.
// FR: Logger NDJSON thread-safe utilisé par toutes les étapes TXR.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace TXR {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse a level name (case-insensitive). Returns false on unknown names.
// FR: Parse un nom de niveau (insensible à la casse). Retourne false si inconnu.
bool parseLogLevel(const std::string& name, LogLevel& level);

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();

    // EN: Set the minimum log level.
    // FR: Définit le niveau de log minimum.
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    bool setOutputFile(const std::string& filename);

    // EN: Route entries back to the console and close any log file.
    // FR: Redirige les entrées vers la console et ferme le fichier de log.
    void resetOutput();

    void setCorrelationId(const std::string& correlation_id);
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    // EN: Log a message with specified level.
    // FR: Enregistre un message avec le niveau spécifié.
    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    // EN: Flush all pending log entries to output.
    // FR: Vide toutes les entrées en attente vers la sortie.
    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format log entry as a single NDJSON line (no trailing newline).
    // FR: Formate l'entrée de log en une ligne NDJSON (sans retour à la ligne).
    static std::string formatAsNDJSON(const LogEntry& entry);
    static std::string levelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) TXR::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) TXR::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) TXR::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) TXR::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, ...) TXR::Logger::getInstance().debug(module, message, __VA_ARGS__)
#define LOG_INFO_META(module, message, ...) TXR::Logger::getInstance().info(module, message, __VA_ARGS__)
#define LOG_WARN_META(module, message, ...) TXR::Logger::getInstance().warn(module, message, __VA_ARGS__)
#define LOG_ERROR_META(module, message, ...) TXR::Logger::getInstance().error(module, message, __VA_ARGS__)

} // namespace TXR
