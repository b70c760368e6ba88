// EN: Fixed-point monetary amount with two fraction digits, stored as signed cents
// FR: Montant monétaire à virgule fixe avec deux décimales, stocké en centimes signés

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace TXR {

class Money {
public:
    Money() = default;

    static Money fromCents(int64_t cents) { return Money(cents); }

    // EN: Parse a plain decimal ("-1234.5", ".75", "12.") and round half away from zero to cents.
    //     Returns nullopt for anything else, or for more than 15 integer digits.
    // FR: Parse un décimal simple ("-1234.5", ".75", "12.") et arrondit au centime (demi loin de zéro).
    //     Retourne nullopt sinon, ou au-delà de 15 chiffres entiers.
    static std::optional<Money> parseDecimal(const std::string& text);

    int64_t cents() const { return cents_; }
    double toDouble() const { return static_cast<double>(cents_) / 100.0; }

    // EN: Multiply by an exchange rate, rounding half away from zero to cents.
    //     Returns nullopt when the product does not fit in int64 cents.
    // FR: Multiplie par un taux de change, arrondi au centime (demi loin de zéro).
    //     Retourne nullopt si le produit ne tient pas en centimes int64.
    std::optional<Money> convert(double rate) const;

    bool isPositive() const { return cents_ > 0; }
    bool isZero() const { return cents_ == 0; }

    // EN: Always two fraction digits: "1234.56", "-0.50".
    // FR: Toujours deux décimales : "1234.56", "-0.50".
    std::string toString() const;

    bool operator==(const Money& other) const { return cents_ == other.cents_; }
    bool operator!=(const Money& other) const { return cents_ != other.cents_; }
    bool operator<(const Money& other) const { return cents_ < other.cents_; }
    bool operator<=(const Money& other) const { return cents_ <= other.cents_; }
    bool operator>(const Money& other) const { return cents_ > other.cents_; }

private:
    explicit Money(int64_t cents) : cents_(cents) {}

    int64_t cents_{0};
};

} // namespace TXR
