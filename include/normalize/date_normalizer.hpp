// EN: Date normalization - classifies four structural date shapes and resolves them to a calendar date
// FR: Normalisation des dates - classe quatre formes structurelles et les résout en date calendaire

#pragma once

#include "types/calendar_date.hpp"

#include <string>

namespace TXR {
namespace Normalize {

// EN: Recognized input shapes. SLASH_DAY_FIRST is the reinterpretation of the
//     two-digit slash form when its first group cannot be a month.
// FR: Formes d'entrée reconnues. SLASH_DAY_FIRST est la réinterprétation de la
//     forme slash à deux chiffres quand le premier groupe ne peut pas être un mois.
enum class DateShape {
    SLASH_MONTH_FIRST,   // EN: MM/DD/YYYY / FR: MM/JJ/AAAA
    SLASH_DAY_FIRST,     // EN: DD/MM/YYYY / FR: JJ/MM/AAAA
    DASH_DAY_FIRST,      // EN: DD-MM-YYYY / FR: JJ-MM-AAAA
    SLASH_YEAR_FIRST,    // EN: YYYY/MM/DD / FR: AAAA/MM/JJ
    ISO                  // EN: YYYY-MM-DD / FR: AAAA-MM-JJ
};

std::string dateShapeToString(DateShape shape);

struct DateResult {
    CalendarDate date;
    DateShape shape{DateShape::ISO};
    bool ambiguous{false};  // EN: Both leading groups could be a month; US order applied / FR: Les deux groupes pouvaient être un mois ; ordre US appliqué
};

class DateNormalizer {
public:
    // EN: Throws NormalizationException(DATE_FORMAT_ERROR) for unknown shapes and impossible dates.
    // FR: Lance NormalizationException(DATE_FORMAT_ERROR) pour les formes inconnues et les dates impossibles.
    DateResult normalize(const std::string& raw_date) const;

    // EN: The slash-form heuristic: first group above 12 means day-first, otherwise month-first.
    //     This is a best-effort rule; 03/04/2024 is read as March 4th and flagged ambiguous.
    // FR: L'heuristique de la forme slash : premier groupe au-dessus de 12 signifie jour d'abord,
    //     sinon mois d'abord. Règle approximative ; 03/04/2024 est lu 4 mars et marqué ambigu.
    static DateShape resolveSlashOrder(int first_group, int second_group, bool& ambiguous);
};

} // namespace Normalize
} // namespace TXR
