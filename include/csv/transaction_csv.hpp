// EN: Transaction CSV input/output - maps header columns to RawRecord and canonical records to CSV rows
// FR: Entrée/sortie CSV des transactions - associe les colonnes d'en-tête à RawRecord et les enregistrements canoniques aux lignes CSV

#pragma once

#include "csv/streaming_parser.hpp"
#include "types/transaction_record.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace TXR {
namespace CSV {

class TransactionReader {
public:
    explicit TransactionReader(const ParserConfig& config = ParserConfig{});

    // EN: Read every data row into RawRecords. Columns may come in any order and unknown
    //     columns are ignored. Empty cells of nullable columns become nullopt.
    // FR: Lit chaque ligne de données en RawRecord. Les colonnes peuvent être dans n'importe
    //     quel ordre et les inconnues sont ignorées. Les cellules vides des colonnes nullables deviennent nullopt.
    ParserError readFile(const std::string& file_path, std::vector<RawRecord>& records);
    ParserError readString(const std::string& csv_content, std::vector<RawRecord>& records);
    ParserError readStream(std::istream& stream, std::vector<RawRecord>& records);

    const ParserStatistics& getStatistics() const { return parser_.getStatistics(); }
    const std::vector<std::string>& getMissingColumns() const { return missing_columns_; }

    static const std::vector<std::string>& requiredColumns();
    static const std::vector<std::string>& optionalColumns();

private:
    ParserError read(const std::function<ParserError(StreamingParser&)>& run, std::vector<RawRecord>& records);
    bool checkHeaders(const std::vector<std::string>& headers);

    StreamingParser parser_;
    std::vector<std::string> missing_columns_;
};

class CanonicalWriter {
public:
    static const std::vector<std::string>& header();

    // EN: Unparsed typed fields render as empty cells, flags as Y/N.
    // FR: Les champs typés non parsés sont rendus en cellules vides, les indicateurs en Y/N.
    static std::vector<std::string> toRow(const NormalizedRecord& record);

    static void write(std::ostream& out, const std::vector<NormalizedRecord>& records);
    static std::string toCsv(const std::vector<NormalizedRecord>& records);
    static bool writeFile(const std::string& file_path, const std::vector<NormalizedRecord>& records);
};

} // namespace CSV
} // namespace TXR
