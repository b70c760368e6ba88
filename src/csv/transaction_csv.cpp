#include "csv/transaction_csv.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace TXR {
namespace CSV {

namespace {

std::optional<std::string> nullableCell(const ParsedRow& row, const std::string& column) {
    auto value = row.getFieldSafe(column);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return value;
}

RawRecord toRawRecord(const ParsedRow& row) {
    RawRecord record;
    record.transaction_id = row.getField("transaction_id");
    record.customer_id = row.getField("customer_id");
    record.customer_email = nullableCell(row, "customer_email");
    record.product_sku = row.getField("product_sku");
    record.quantity = row.getField("quantity");
    record.amount = row.getField("amount");
    record.currency = nullableCell(row, "currency");
    record.order_date = row.getField("order_date");
    record.ship_country = row.getField("ship_country");
    record.payment_method = row.getField("payment_method");
    record.category = nullableCell(row, "category");
    return record;
}

const char* flag(bool value) {
    return value ? "Y" : "N";
}

} // namespace

// EN: TransactionReader implementation
// FR: Implémentation de TransactionReader

TransactionReader::TransactionReader(const ParserConfig& config) : parser_(config) {}

const std::vector<std::string>& TransactionReader::requiredColumns() {
    static const std::vector<std::string> columns = {
        "transaction_id", "customer_id", "quantity", "amount", "order_date"
    };
    return columns;
}

const std::vector<std::string>& TransactionReader::optionalColumns() {
    static const std::vector<std::string> columns = {
        "customer_email", "product_sku", "currency", "ship_country", "payment_method", "category"
    };
    return columns;
}

bool TransactionReader::checkHeaders(const std::vector<std::string>& headers) {
    missing_columns_.clear();
    for (const auto& column : requiredColumns()) {
        if (std::find(headers.begin(), headers.end(), column) == headers.end()) {
            missing_columns_.push_back(column);
        }
    }
    for (const auto& column : optionalColumns()) {
        if (std::find(headers.begin(), headers.end(), column) == headers.end()) {
            LOG_WARN("transaction_reader", "Optional column absent, treated as empty: " + column);
        }
    }
    return missing_columns_.empty();
}

ParserError TransactionReader::read(const std::function<ParserError(StreamingParser&)>& run,
                                    std::vector<RawRecord>& records) {
    records.clear();
    bool headers_checked = false;
    bool headers_ok = true;

    parser_.setRowCallback([this, &records, &headers_checked, &headers_ok](const ParsedRow& row) {
        if (!headers_checked) {
            headers_checked = true;
            headers_ok = checkHeaders(parser_.getHeaders());
            if (!headers_ok) {
                return false;
            }
        }
        records.push_back(toRawRecord(row));
        return true;
    });

    ParserError result = run(parser_);
    parser_.setRowCallback(nullptr);

    // EN: A header-only file never reaches the callback; check it here.
    // FR: Un fichier avec en-tête seul n'atteint jamais le callback ; vérifié ici.
    if (result == ParserError::SUCCESS && !headers_checked) {
        headers_ok = checkHeaders(parser_.getHeaders());
    }

    if (result == ParserError::SUCCESS && !headers_ok) {
        records.clear();
        std::string missing;
        for (const auto& column : missing_columns_) {
            missing += (missing.empty() ? "" : ", ") + column;
        }
        LOG_ERROR("transaction_reader", "Missing required columns: " + missing);
        return ParserError::MISSING_COLUMN;
    }

    if (result == ParserError::SUCCESS) {
        LOG_INFO_META("transaction_reader", "Transactions read", {
            {"records", std::to_string(records.size())},
            {"malformed_rows", std::to_string(parser_.getStatistics().getRowsWithErrors())}
        });
    }
    return result;
}

ParserError TransactionReader::readFile(const std::string& file_path, std::vector<RawRecord>& records) {
    return read([&file_path](StreamingParser& parser) { return parser.parseFile(file_path); }, records);
}

ParserError TransactionReader::readString(const std::string& csv_content, std::vector<RawRecord>& records) {
    return read([&csv_content](StreamingParser& parser) { return parser.parseString(csv_content); }, records);
}

ParserError TransactionReader::readStream(std::istream& stream, std::vector<RawRecord>& records) {
    return read([&stream](StreamingParser& parser) { return parser.parseStream(stream); }, records);
}

// EN: CanonicalWriter implementation
// FR: Implémentation de CanonicalWriter

const std::vector<std::string>& CanonicalWriter::header() {
    static const std::vector<std::string> columns = {
        "transaction_id", "customer_id", "customer_email", "product_sku", "quantity",
        "amount_usd", "original_currency", "order_date", "ship_country", "payment_method",
        "category", "email_was_inferred", "quantity_was_adjusted"
    };
    return columns;
}

std::vector<std::string> CanonicalWriter::toRow(const NormalizedRecord& record) {
    return {
        record.transaction_id,
        record.customer_id,
        record.customer_email,
        record.product_sku,
        record.quantity ? std::to_string(*record.quantity) : "",
        record.amount_usd ? record.amount_usd->toString() : "",
        record.currency_detected,
        record.order_date ? record.order_date->toIsoString() : "",
        record.ship_country,
        record.payment_method,
        record.category,
        flag(record.email_was_inferred),
        flag(record.quantity_was_adjusted)
    };
}

void CanonicalWriter::write(std::ostream& out, const std::vector<NormalizedRecord>& records) {
    auto write_row = [&out](const std::vector<std::string>& fields) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out << ',';
            out << StreamingParser::escapeField(fields[i]);
        }
        out << '\n';
    };

    write_row(header());
    for (const auto& record : records) {
        write_row(toRow(record));
    }
}

std::string CanonicalWriter::toCsv(const std::vector<NormalizedRecord>& records) {
    std::ostringstream oss;
    write(oss, records);
    return oss.str();
}

bool CanonicalWriter::writeFile(const std::string& file_path, const std::vector<NormalizedRecord>& records) {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("canonical_writer", "Cannot open output file: " + file_path);
        return false;
    }
    write(file, records);
    file.flush();
    if (!file.good()) {
        LOG_ERROR("canonical_writer", "Write failed: " + file_path);
        return false;
    }
    LOG_INFO("canonical_writer", "Wrote " + std::to_string(records.size()) + " canonical records to " + file_path);
    return true;
}

} // namespace CSV
} // namespace TXR
