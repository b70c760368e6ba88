// EN: Streaming CSV parser implementation - one logical record in memory at a time
// FR: Implémentation du parser CSV streaming - un seul enregistrement logique en mémoire à la fois

#include "csv/streaming_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace TXR {
namespace CSV {

std::string parserErrorToString(ParserError error) {
    switch (error) {
        case ParserError::SUCCESS:         return "SUCCESS";
        case ParserError::FILE_NOT_FOUND:  return "FILE_NOT_FOUND";
        case ParserError::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ParserError::MALFORMED_ROW:   return "MALFORMED_ROW";
        case ParserError::MISSING_COLUMN:  return "MISSING_COLUMN";
        case ParserError::CALLBACK_ERROR:  return "CALLBACK_ERROR";
        default:                           return "UNKNOWN";
    }
}

// EN: ParsedRow implementation
// FR: Implémentation de ParsedRow

ParsedRow::ParsedRow(size_t row_number, std::vector<std::string> fields, const std::vector<std::string>& headers)
    : row_number_(row_number), fields_(std::move(fields)) {
    for (size_t i = 0; i < headers.size(); ++i) {
        header_map_.emplace(headers[i], i);
    }
}

const std::string& ParsedRow::getField(size_t index) const {
    static const std::string empty_string;
    if (index >= fields_.size()) {
        return empty_string;
    }
    return fields_[index];
}

std::optional<std::string> ParsedRow::getFieldSafe(size_t index) const {
    if (index >= fields_.size()) {
        return std::nullopt;
    }
    return fields_[index];
}

const std::string& ParsedRow::getField(const std::string& header) const {
    static const std::string empty_string;
    auto it = header_map_.find(header);
    if (it == header_map_.end()) {
        return empty_string;
    }
    return getField(it->second);
}

std::optional<std::string> ParsedRow::getFieldSafe(const std::string& header) const {
    auto it = header_map_.find(header);
    if (it == header_map_.end()) {
        return std::nullopt;
    }
    return getFieldSafe(it->second);
}

std::string ParsedRow::toString() const {
    std::ostringstream oss;
    oss << "Row " << row_number_ << ": [";
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << fields_[i] << "\"";
    }
    oss << "]";
    return oss.str();
}

// EN: ParserStatistics implementation
// FR: Implémentation de ParserStatistics

void ParserStatistics::reset() {
    rows_parsed_ = 0;
    rows_skipped_ = 0;
    rows_with_errors_ = 0;
    bytes_read_ = 0;
    parsing_duration_ = std::chrono::duration<double>(0);
}

void ParserStatistics::startTiming() {
    start_time_ = std::chrono::steady_clock::now();
}

void ParserStatistics::stopTiming() {
    parsing_duration_ = std::chrono::steady_clock::now() - start_time_;
}

double ParserStatistics::getRowsPerSecond() const {
    double seconds = parsing_duration_.count();
    return seconds > 0.0 ? static_cast<double>(rows_parsed_) / seconds : 0.0;
}

std::string ParserStatistics::generateReport() const {
    std::ostringstream oss;
    oss << "=== CSV Parser Statistics ===\n";
    oss << "Rows parsed: " << rows_parsed_ << "\n";
    oss << "Rows skipped: " << rows_skipped_ << "\n";
    oss << "Rows with errors: " << rows_with_errors_ << "\n";
    oss << "Bytes read: " << bytes_read_ << "\n";
    oss << "Parsing duration: " << std::fixed << std::setprecision(3) << parsing_duration_.count() << " seconds\n";
    oss << "Rows per second: " << std::fixed << std::setprecision(0) << getRowsPerSecond() << "\n";
    return oss.str();
}

// EN: StreamingParser implementation
// FR: Implémentation de StreamingParser

StreamingParser::StreamingParser(const ParserConfig& config) : config_(config) {}

ParserError StreamingParser::parseFile(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        reportError(ParserError::FILE_NOT_FOUND, "Cannot open file: " + file_path, 0);
        return ParserError::FILE_NOT_FOUND;
    }
    LOG_INFO("streaming_parser", "Parsing file: " + file_path);
    return parseInternal(file);
}

ParserError StreamingParser::parseStream(std::istream& stream) {
    return parseInternal(stream);
}

ParserError StreamingParser::parseString(const std::string& csv_content) {
    std::istringstream stream(csv_content);
    return parseInternal(stream);
}

std::vector<std::string> StreamingParser::parseRow(const std::string& row, const ParserConfig& config) {
    std::vector<std::string> fields;
    if (row.empty()) {
        return fields;
    }

    auto finish_field = [&config, &fields](std::string& field) {
        if (config.trim_whitespace) {
            size_t start = field.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) {
                field.clear();
            } else {
                size_t end = field.find_last_not_of(" \t\r\n");
                field = field.substr(start, end - start + 1);
            }
        }
        fields.push_back(std::move(field));
        field.clear();
    };

    bool in_quotes = false;
    std::string current_field;

    for (size_t pos = 0; pos < row.length(); ++pos) {
        char c = row[pos];
        if (c == config.quote_char) {
            if (in_quotes && pos + 1 < row.length() && row[pos + 1] == config.quote_char) {
                // EN: Escaped quote within quoted field
                // FR: Quote échappée dans un champ quoté
                current_field += config.quote_char;
                ++pos;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == config.delimiter && !in_quotes) {
            finish_field(current_field);
        } else {
            current_field += c;
        }
    }
    finish_field(current_field);

    return fields;
}

std::string StreamingParser::escapeField(const std::string& field, const ParserConfig& config) {
    bool needs_quoting = field.find(config.delimiter) != std::string::npos ||
                         field.find(config.quote_char) != std::string::npos ||
                         field.find('\n') != std::string::npos ||
                         field.find('\r') != std::string::npos;
    if (!needs_quoting) {
        return field;
    }

    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped += config.quote_char;
    for (char c : field) {
        if (c == config.quote_char) {
            escaped += config.quote_char;
        }
        escaped += c;
    }
    escaped += config.quote_char;
    return escaped;
}

ParserError StreamingParser::parseInternal(std::istream& stream) {
    stats_.reset();
    stats_.startTiming();
    headers_.clear();

    ParserError result = ParserError::SUCCESS;
    std::string line;
    std::string pending;
    size_t row_number = 0;
    bool first_line = true;
    bool keep_going = true;

    while (keep_going && std::getline(stream, line)) {
        stats_.addBytesRead(line.size() + 1);

        // EN: Drop a UTF-8 BOM and Windows line endings
        // FR: Supprime un BOM UTF-8 et les fins de ligne Windows
        if (first_line && line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        first_line = false;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!pending.empty()) {
            pending += '\n';
        }
        pending += line;

        if (pending.size() > config_.max_row_size) {
            ++row_number;
            stats_.incrementRowsWithErrors();
            reportError(ParserError::MALFORMED_ROW, "Row exceeds maximum size", row_number);
            pending.clear();
            if (config_.strict_mode) {
                result = ParserError::MALFORMED_ROW;
                break;
            }
            continue;
        }

        // EN: A quoted field may continue on the next line
        // FR: Un champ quoté peut continuer sur la ligne suivante
        if (!isRowComplete(pending)) {
            continue;
        }

        ++row_number;
        ParserError row_result = processRow(pending, row_number, keep_going);
        pending.clear();
        if (row_result != ParserError::SUCCESS) {
            result = row_result;
            break;
        }
    }

    if (result == ParserError::SUCCESS && !pending.empty()) {
        ++row_number;
        stats_.incrementRowsWithErrors();
        reportError(ParserError::MALFORMED_ROW, "Unterminated quoted field at end of input", row_number);
        if (config_.strict_mode) {
            result = ParserError::MALFORMED_ROW;
        }
    }

    if (result == ParserError::SUCCESS && stream.bad()) {
        reportError(ParserError::FILE_READ_ERROR, "Stream read failure", row_number);
        result = ParserError::FILE_READ_ERROR;
    }

    stats_.stopTiming();
    LOG_INFO_META("streaming_parser", "Parsing completed", {
        {"rows_parsed", std::to_string(stats_.getRowsParsed())},
        {"rows_with_errors", std::to_string(stats_.getRowsWithErrors())},
        {"bytes_read", std::to_string(stats_.getBytesRead())}
    });
    return result;
}

ParserError StreamingParser::processRow(const std::string& row_data, size_t row_number, bool& keep_going) {
    bool blank = row_data.find_first_not_of(" \t") == std::string::npos;
    if (blank && config_.skip_empty_rows) {
        stats_.incrementRowsSkipped();
        return ParserError::SUCCESS;
    }

    std::vector<std::string> fields = parseRow(row_data, config_);

    if (config_.has_header && headers_.empty()) {
        headers_ = std::move(fields);
        stats_.incrementRowsSkipped(); // EN: Header is not counted as data row / FR: En-tête n'est pas comptée comme ligne de données
        return ParserError::SUCCESS;
    }

    if (config_.has_header && fields.size() != headers_.size()) {
        stats_.incrementRowsWithErrors();
        reportError(ParserError::MALFORMED_ROW,
                    "Expected " + std::to_string(headers_.size()) + " fields, found " + std::to_string(fields.size()),
                    row_number);
        if (config_.strict_mode) {
            return ParserError::MALFORMED_ROW;
        }
        return ParserError::SUCCESS; // EN: Skip the row in non-strict mode / FR: Ignore la ligne en mode non-strict
    }

    ParsedRow parsed_row(row_number, std::move(fields), headers_);
    stats_.incrementRowsParsed();

    if (row_callback_) {
        try {
            keep_going = row_callback_(parsed_row);
        } catch (const std::exception& e) {
            stats_.incrementRowsWithErrors();
            reportError(ParserError::CALLBACK_ERROR, e.what(), row_number);
            return ParserError::CALLBACK_ERROR;
        }
    }
    return ParserError::SUCCESS;
}

bool StreamingParser::isRowComplete(const std::string& row_data) const {
    // EN: Complete when every quote is closed; doubled quotes toggle twice
    // FR: Complète quand toutes les quotes sont fermées ; les quotes doublées basculent deux fois
    bool in_quotes = false;
    for (char c : row_data) {
        if (c == config_.quote_char) {
            in_quotes = !in_quotes;
        }
    }
    return !in_quotes;
}

void StreamingParser::reportError(ParserError error, const std::string& message, size_t row_number) {
    LOG_WARN_META("streaming_parser", message, {
        {"error", parserErrorToString(error)},
        {"row", std::to_string(row_number)}
    });
    if (error_callback_) {
        error_callback_(error, message, row_number);
    }
}

} // namespace CSV
} // namespace TXR
