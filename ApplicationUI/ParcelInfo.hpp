//============================================================
// ParcelInfo.hpp
//============================================================
#pragma once

#include <GeoFeature.hpp>
#include <QString>
#include <QStringList>
#include <vector>

/**
 * @brief Display formatting of parcel attributes for the info cards.
 */
namespace parcelinfo
{
    /// Shown for values that are missing or empty.
    inline const QString kMissing = QStringLiteral("—");

    struct Row
    {
        QString label = {};
        QString value = {};
    };

    /**
     * @brief Card rows: Address, Zoning, Assessment, Community, Year, ID.
     *
     * Year is only listed when the attribute exists. Empty, zero, false
     * and null values show kMissing, except for Year where only null does.
     */
    [[nodiscard]] std::vector<Row> rows(const FeatureAttributes& attrs);

    /**
     * @brief "$" followed by the amount with thousands separators.
     *
     * Fractions keep at most three digits. Returns kMissing for missing,
     * null, zero or empty values.
     */
    [[nodiscard]] QString formatAssessment(const AttributeValue* value);

    /**
     * @brief Splits highlight id input on commas and whitespace.
     */
    [[nodiscard]] HighlightSet parseHighlightIds(const QString& text);

    /**
     * @brief Features whose id is in @p ids, in their original order.
     */
    [[nodiscard]] std::vector<GeoFeature> filterByIds(const std::vector<GeoFeature>& features, const HighlightSet& ids);

    /// "Loaded: N · Highlighted: M"
    [[nodiscard]] QString statusText(size_t loaded, size_t highlighted);

} // namespace parcelinfo
