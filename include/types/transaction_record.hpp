// EN: Raw and normalized transaction records flowing through the reconciliation engine
// FR: Enregistrements de transaction bruts et normalisés circulant dans le moteur de réconciliation

#pragma once

#include "types/calendar_date.hpp"
#include "types/money.hpp"

#include <optional>
#include <string>
#include <vector>

namespace TXR {

// EN: One input row, untyped. Nullable columns use std::optional.
// FR: Une ligne d'entrée, non typée. Les colonnes nullables utilisent std::optional.
struct RawRecord {
    std::string transaction_id;
    std::string customer_id;
    std::optional<std::string> customer_email;
    std::string product_sku;
    std::string quantity;
    std::string amount;
    std::optional<std::string> currency;
    std::string order_date;
    std::string ship_country;
    std::string payment_method;
    std::optional<std::string> category;
};

// EN: True for nullopt, blank text or the literal NULL marker (any case).
// FR: Vrai pour nullopt, un texte vide ou le marqueur littéral NULL (toute casse).
bool isMissingValue(const std::optional<std::string>& value);

// EN: Lifecycle of a record inside the reconciler
// FR: Cycle de vie d'un enregistrement dans le réconciliateur
enum class RecordStatus {
    PENDING,    // EN: Not reconciled yet / FR: Pas encore réconcilié
    KEPT,       // EN: Survivor of its group / FR: Survivant de son groupe
    DUPLICATE   // EN: Superseded by a survivor / FR: Remplacé par un survivant
};

std::string recordStatusToString(RecordStatus status);

// EN: A field that could not be parsed; the raw text is kept here.
// FR: Un champ qui n'a pas pu être parsé ; le texte brut est conservé ici.
struct FieldIssue {
    std::string field;          // EN: Field name / FR: Nom du champ
    std::string raw_value;      // EN: Raw input text / FR: Texte brut d'entrée
    std::string code;           // EN: Error code name / FR: Nom du code d'erreur
    std::string message;        // EN: Human readable reason / FR: Raison lisible
};

struct NormalizedRecord {
    size_t source_row{0};                       // EN: 1-based input position / FR: Position d'entrée base 1
    std::string transaction_id;
    std::string customer_id;
    std::string customer_email;
    std::string product_sku;
    std::optional<int> quantity;                // EN: Empty when unparsable / FR: Vide si non parsable
    std::optional<Money> amount_usd;            // EN: Empty when unparsable / FR: Vide si non parsable
    std::optional<Money> amount_original;       // EN: Amount in detected currency / FR: Montant dans la devise détectée
    std::string currency_detected;
    std::optional<CalendarDate> order_date;     // EN: Empty when unparsable / FR: Vide si non parsable
    std::string ship_country;
    std::string payment_method;
    std::string category;

    // EN: Quality flags
    // FR: Indicateurs de qualité
    bool email_was_inferred{false};
    bool email_was_repaired{false};
    bool raw_email_complete{false};
    bool quantity_was_adjusted{false};
    bool date_was_ambiguous{false};

    RecordStatus status{RecordStatus::PENDING};
    std::vector<FieldIssue> issues;

    bool hasIssue(const std::string& field) const;
};

} // namespace TXR
