#include <ParcelInfo.hpp>
#include <cmath>
#include <gtest/gtest.h>

#include "TestHelpers.hpp"

using parcelinfo::kMissing;

namespace
{
    QString valueOf(const std::vector<parcelinfo::Row>& rows, const QString& label)
    {
        for (const auto& r : rows)
        {
            if (r.label == label)
                return r.value;
        }
        return {};
    }

    QStringList labelsOf(const std::vector<parcelinfo::Row>& rows)
    {
        QStringList out;
        for (const auto& r : rows)
            out << r.label;
        return out;
    }
} // namespace

TEST(ParcelInfo, RowsInCardOrder)
{
    const FeatureAttributes attrs = {
        {"id", std::string("P-7")},
        {"address", std::string("12 Elm Ave SW")},
        {"zoning", std::string("R-CG")},
        {"assessed_value", 450000.0},
        {"community", std::string("Altadore")},
        {"year", 1952.0},
    };

    const auto rows = parcelinfo::rows(attrs);
    const QStringList expected = {"Address", "Zoning", "Assessment", "Community", "Year", "ID"};
    EXPECT_EQ(labelsOf(rows), expected);

    EXPECT_EQ(valueOf(rows, "Address"), "12 Elm Ave SW");
    EXPECT_EQ(valueOf(rows, "Assessment"), "$450,000");
    EXPECT_EQ(valueOf(rows, "Year"), "1952");
    EXPECT_EQ(valueOf(rows, "ID"), "P-7");
}

TEST(ParcelInfo, BlankValuesShowPlaceholder)
{
    const FeatureAttributes attrs = {
        {"address", std::string("")},
        {"zoning", std::monostate{}},
        {"assessed_value", 0.0},
        {"community", false},
    };

    const auto rows = parcelinfo::rows(attrs);
    EXPECT_EQ(valueOf(rows, "Address"), kMissing);
    EXPECT_EQ(valueOf(rows, "Zoning"), kMissing);
    EXPECT_EQ(valueOf(rows, "Assessment"), kMissing);
    EXPECT_EQ(valueOf(rows, "Community"), kMissing);
    EXPECT_EQ(valueOf(rows, "ID"), kMissing);
}

TEST(ParcelInfo, YearOnlyWhenPresent)
{
    EXPECT_FALSE(labelsOf(parcelinfo::rows(FeatureAttributes{})).contains("Year"));

    FeatureAttributes attrs;
    attrs["year"] = std::monostate{};
    EXPECT_EQ(valueOf(parcelinfo::rows(attrs), "Year"), kMissing);

    attrs["year"] = std::string("1910s");
    EXPECT_EQ(valueOf(parcelinfo::rows(attrs), "Year"), "1910s");
}

TEST(ParcelInfo, AssessmentFormatting)
{
    const AttributeValue big      = 1234567.0;
    const AttributeValue fraction = 1234.5678;
    const AttributeValue text     = std::string("1500000");
    const AttributeValue label    = std::string("pending");
    const AttributeValue nan      = std::nan("");

    EXPECT_EQ(parcelinfo::formatAssessment(&big), "$1,234,567");
    EXPECT_EQ(parcelinfo::formatAssessment(&fraction), "$1,234.568");
    EXPECT_EQ(parcelinfo::formatAssessment(&text), "$1,500,000");
    EXPECT_EQ(parcelinfo::formatAssessment(&label), "$pending");
    EXPECT_EQ(parcelinfo::formatAssessment(&nan), kMissing);
    EXPECT_EQ(parcelinfo::formatAssessment(nullptr), kMissing);
}

TEST(ParcelInfo, ParseHighlightIds)
{
    const HighlightSet ids = parcelinfo::parseHighlightIds(" A-1, B-2\n\tC-3,,D-4 ");
    const HighlightSet expected = {"A-1", "B-2", "C-3", "D-4"};
    EXPECT_EQ(ids, expected);

    EXPECT_TRUE(parcelinfo::parseHighlightIds("  ,\t ").empty());
}

TEST(ParcelInfo, FilterKeepsFeatureOrder)
{
    const std::vector<GeoFeature> features = {
        testutil::rectFeature("a", -114.0, 51.0, 0.0, 0.0, 10.0, 10.0),
        testutil::rectFeature("b", -114.0, 51.0, 20.0, 0.0, 10.0, 10.0),
        testutil::rectFeature("c", -114.0, 51.0, 40.0, 0.0, 10.0, 10.0),
    };

    const auto shown = parcelinfo::filterByIds(features, {"c", "a", "zzz"});
    ASSERT_EQ(shown.size(), 2u);
    EXPECT_EQ(shown[0].id(), "a");
    EXPECT_EQ(shown[1].id(), "c");
    EXPECT_EQ(shown[0].attributes, features[0].attributes);

    EXPECT_TRUE(parcelinfo::filterByIds(features, {}).empty());
}

TEST(ParcelInfo, StatusText)
{
    EXPECT_EQ(parcelinfo::statusText(120, 3), QString::fromUtf8("Loaded: 120 · Highlighted: 3"));
}
