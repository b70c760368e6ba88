// EN: Unit tests for DateNormalizer - shape classification and the day/month heuristic
// FR: Tests unitaires pour DateNormalizer - classification des formes et heuristique jour/mois

#include <gtest/gtest.h>
#include "normalize/date_normalizer.hpp"
#include "normalize/normalization_error.hpp"

using namespace TXR;
using namespace TXR::Normalize;

class DateNormalizerTest : public ::testing::Test {
protected:
    DateNormalizer normalizer_;
};

TEST_F(DateNormalizerTest, IsoDateRoundTrips) {
    for (const std::string text : {"2024-01-01", "2024-02-29", "2024-12-31", "1999-07-04"}) {
        DateResult result = normalizer_.normalize(text);
        EXPECT_EQ(result.shape, DateShape::ISO);
        EXPECT_FALSE(result.ambiguous);
        EXPECT_EQ(result.date.toIsoString(), text);
    }
}

TEST_F(DateNormalizerTest, SlashMonthFirstIsTheDefault) {
    DateResult result = normalizer_.normalize("03/15/2024");
    EXPECT_EQ(result.shape, DateShape::SLASH_MONTH_FIRST);
    EXPECT_EQ(result.date, CalendarDate(2024, 3, 15));
    EXPECT_FALSE(result.ambiguous);
}

TEST_F(DateNormalizerTest, FirstGroupAboveTwelveMeansDayFirst) {
    DateResult result = normalizer_.normalize("15/03/2024");
    EXPECT_EQ(result.shape, DateShape::SLASH_DAY_FIRST);
    EXPECT_EQ(result.date, CalendarDate(2024, 3, 15));
    EXPECT_FALSE(result.ambiguous);
}

TEST_F(DateNormalizerTest, AmbiguousSlashDateIsFlagged) {
    DateResult result = normalizer_.normalize("03/04/2024");
    EXPECT_EQ(result.shape, DateShape::SLASH_MONTH_FIRST);
    EXPECT_EQ(result.date, CalendarDate(2024, 3, 4));
    EXPECT_TRUE(result.ambiguous);

    // EN: Same value in both groups reads the same either way
    // FR: Même valeur dans les deux groupes, lecture identique
    DateResult same = normalizer_.normalize("05/05/2024");
    EXPECT_FALSE(same.ambiguous);
}

TEST_F(DateNormalizerTest, DashDayFirst) {
    DateResult result = normalizer_.normalize("16-03-2024");
    EXPECT_EQ(result.shape, DateShape::DASH_DAY_FIRST);
    EXPECT_EQ(result.date, CalendarDate(2024, 3, 16));

    DateResult low_day = normalizer_.normalize("02-11-2024");
    EXPECT_EQ(low_day.date, CalendarDate(2024, 11, 2));
}

TEST_F(DateNormalizerTest, SlashYearFirst) {
    DateResult result = normalizer_.normalize("2024/03/17");
    EXPECT_EQ(result.shape, DateShape::SLASH_YEAR_FIRST);
    EXPECT_EQ(result.date, CalendarDate(2024, 3, 17));
}

TEST_F(DateNormalizerTest, SurroundingWhitespaceIsIgnored) {
    EXPECT_EQ(normalizer_.normalize("  2024-06-01 ").date, CalendarDate(2024, 6, 1));
}

TEST_F(DateNormalizerTest, UnknownShapesThrow) {
    for (const std::string text : {"", "March 5, 2024", "2024.03.05", "3/5/2024", "20240305", "2024-3-05", "05/03/24"}) {
        try {
            normalizer_.normalize(text);
            FAIL() << "Expected DATE_FORMAT_ERROR for '" << text << "'";
        } catch (const NormalizationException& e) {
            EXPECT_EQ(e.code(), NormalizationError::DATE_FORMAT_ERROR);
            EXPECT_EQ(e.field(), "order_date");
            EXPECT_EQ(e.rawValue(), text);
        }
    }
}

TEST_F(DateNormalizerTest, ImpossibleCalendarDatesThrow) {
    EXPECT_THROW(normalizer_.normalize("2023-02-29"), NormalizationException);
    EXPECT_THROW(normalizer_.normalize("13/13/2024"), NormalizationException);
    EXPECT_THROW(normalizer_.normalize("31-04-2024"), NormalizationException);
    EXPECT_THROW(normalizer_.normalize("2024/00/10"), NormalizationException);
}

TEST(DateShapeTest, SlashOrderHeuristic) {
    bool ambiguous = true;
    EXPECT_EQ(DateNormalizer::resolveSlashOrder(13, 1, ambiguous), DateShape::SLASH_DAY_FIRST);
    EXPECT_FALSE(ambiguous);

    EXPECT_EQ(DateNormalizer::resolveSlashOrder(1, 13, ambiguous), DateShape::SLASH_MONTH_FIRST);
    EXPECT_FALSE(ambiguous);

    EXPECT_EQ(DateNormalizer::resolveSlashOrder(2, 11, ambiguous), DateShape::SLASH_MONTH_FIRST);
    EXPECT_TRUE(ambiguous);
}

TEST(DateShapeTest, ShapeNames) {
    EXPECT_EQ(dateShapeToString(DateShape::SLASH_MONTH_FIRST), "MM/DD/YYYY");
    EXPECT_EQ(dateShapeToString(DateShape::SLASH_DAY_FIRST), "DD/MM/YYYY");
    EXPECT_EQ(dateShapeToString(DateShape::DASH_DAY_FIRST), "DD-MM-YYYY");
    EXPECT_EQ(dateShapeToString(DateShape::SLASH_YEAR_FIRST), "YYYY/MM/DD");
    EXPECT_EQ(dateShapeToString(DateShape::ISO), "YYYY-MM-DD");
}
