// EN: Streaming CSV parser - reads records one at a time, supporting quoted fields that span lines
// FR: Parser CSV streaming - lit les enregistrements un par un, avec champs quotés sur plusieurs lignes

#pragma once

#include <chrono>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace TXR {
namespace CSV {

// EN: Parser error types
// FR: Types d'erreur du parser
enum class ParserError {
    SUCCESS,            // EN: No error / FR: Aucune erreur
    FILE_NOT_FOUND,     // EN: Input file not found / FR: Fichier d'entrée introuvable
    FILE_READ_ERROR,    // EN: Error reading file / FR: Erreur de lecture du fichier
    MALFORMED_ROW,      // EN: Row parsing error / FR: Erreur de parsing de ligne
    MISSING_COLUMN,     // EN: Required header column absent / FR: Colonne d'en-tête requise absente
    CALLBACK_ERROR      // EN: User callback function error / FR: Erreur de fonction callback utilisateur
};

std::string parserErrorToString(ParserError error);

// EN: Parser configuration options
// FR: Options de configuration du parser
struct ParserConfig {
    char delimiter{','};                    // EN: Field delimiter character / FR: Caractère délimiteur de champ
    char quote_char{'"'};                   // EN: Quote character for escaped fields / FR: Caractère de quote pour champs échappés
    bool has_header{true};                  // EN: First row is header / FR: Première ligne est l'en-tête
    bool strict_mode{false};                // EN: Strict parsing (fail on malformed rows) / FR: Parsing strict (échec sur lignes malformées)
    bool trim_whitespace{true};             // EN: Trim leading/trailing whitespace / FR: Supprimer espaces en début/fin
    bool skip_empty_rows{true};             // EN: Skip empty rows / FR: Ignorer les lignes vides
    size_t max_row_size{10485760};          // EN: Maximum row size (10MB default) / FR: Taille maximum de ligne (10MB par défaut)
};

// EN: Represents a parsed CSV row with field access methods
// FR: Représente une ligne CSV analysée avec méthodes d'accès aux champs
class ParsedRow {
public:
    ParsedRow(size_t row_number, std::vector<std::string> fields, const std::vector<std::string>& headers = {});

    // EN: Field access by index; out-of-range gives an empty string
    // FR: Accès aux champs par index ; hors bornes donne une chaîne vide
    const std::string& getField(size_t index) const;
    std::optional<std::string> getFieldSafe(size_t index) const;

    // EN: Field access by header name (if headers are available)
    // FR: Accès aux champs par nom d'en-tête (si en-têtes disponibles)
    const std::string& getField(const std::string& header) const;
    std::optional<std::string> getFieldSafe(const std::string& header) const;

    size_t getRowNumber() const { return row_number_; }
    size_t getFieldCount() const { return fields_.size(); }
    const std::vector<std::string>& getFields() const { return fields_; }
    bool isEmpty() const { return fields_.empty() || (fields_.size() == 1 && fields_[0].empty()); }

    std::string toString() const;

private:
    size_t row_number_;                                     // EN: 1-based record number / FR: Numéro d'enregistrement base 1
    std::vector<std::string> fields_;                       // EN: Field values / FR: Valeurs des champs
    std::unordered_map<std::string, size_t> header_map_;    // EN: Header name to index mapping / FR: Mappage nom d'en-tête vers index
};

// EN: Parser statistics
// FR: Statistiques du parser
class ParserStatistics {
public:
    void reset();
    void startTiming();
    void stopTiming();

    void incrementRowsParsed() { rows_parsed_++; }
    void incrementRowsSkipped() { rows_skipped_++; }
    void incrementRowsWithErrors() { rows_with_errors_++; }
    void addBytesRead(size_t bytes) { bytes_read_ += bytes; }

    size_t getRowsParsed() const { return rows_parsed_; }
    size_t getRowsSkipped() const { return rows_skipped_; }
    size_t getRowsWithErrors() const { return rows_with_errors_; }
    size_t getBytesRead() const { return bytes_read_; }
    std::chrono::duration<double> getParsingDuration() const { return parsing_duration_; }
    double getRowsPerSecond() const;

    std::string generateReport() const;

private:
    size_t rows_parsed_{0};         // EN: Number of successfully parsed rows / FR: Nombre de lignes analysées avec succès
    size_t rows_skipped_{0};        // EN: Header and empty rows / FR: En-tête et lignes vides
    size_t rows_with_errors_{0};    // EN: Number of rows with parsing errors / FR: Nombre de lignes avec erreurs de parsing
    size_t bytes_read_{0};          // EN: Total bytes read / FR: Total d'octets lus
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::duration<double> parsing_duration_{0};
};

// EN: Row callback: return false to stop parsing
// FR: Callback de ligne : retourner false pour arrêter le parsing
using RowCallback = std::function<bool(const ParsedRow& row)>;

// EN: Error callback function type
// FR: Type de fonction callback d'erreur
using ErrorCallback = std::function<void(ParserError error, const std::string& message, size_t row_number)>;

class StreamingParser {
public:
    StreamingParser() = default;
    explicit StreamingParser(const ParserConfig& config);

    StreamingParser(const StreamingParser&) = delete;
    StreamingParser& operator=(const StreamingParser&) = delete;

    void setConfig(const ParserConfig& config) { config_ = config; }
    const ParserConfig& getConfig() const { return config_; }

    void setRowCallback(RowCallback callback) { row_callback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback) { error_callback_ = std::move(callback); }

    // EN: Main parsing methods
    // FR: Méthodes principales de parsing
    ParserError parseFile(const std::string& file_path);
    ParserError parseStream(std::istream& stream);
    ParserError parseString(const std::string& csv_content);

    const std::vector<std::string>& getHeaders() const { return headers_; }
    const ParserStatistics& getStatistics() const { return stats_; }

    // EN: Split one complete record (quotes balanced) into fields.
    // FR: Découpe un enregistrement complet (quotes équilibrées) en champs.
    static std::vector<std::string> parseRow(const std::string& row, const ParserConfig& config = ParserConfig{});

    // EN: Quote a field when it contains the delimiter, a quote or a line break.
    // FR: Quote un champ s'il contient le délimiteur, une quote ou un saut de ligne.
    static std::string escapeField(const std::string& field, const ParserConfig& config = ParserConfig{});

private:
    ParserError parseInternal(std::istream& stream);
    ParserError processRow(const std::string& row_data, size_t row_number, bool& keep_going);
    bool isRowComplete(const std::string& row_data) const;
    void reportError(ParserError error, const std::string& message, size_t row_number);

    ParserConfig config_;
    RowCallback row_callback_;
    ErrorCallback error_callback_;
    ParserStatistics stats_;
    std::vector<std::string> headers_;
};

} // namespace CSV
} // namespace TXR
