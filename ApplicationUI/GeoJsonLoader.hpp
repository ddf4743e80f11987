//============================================================
// GeoJsonLoader.hpp
//============================================================
#pragma once

#include <GeoFeature.hpp>
#include <QByteArray>
#include <QString>
#include <vector>

class QJsonObject;
class QJsonValue;

/**
 * @brief Reads a GeoJSON FeatureCollection into GeoFeature records.
 *
 * Polygon and MultiPolygon geometries are converted, any other geometry
 * type (or a null geometry) becomes GeoGeometryType::None. Feature
 * properties are kept as scalar attributes; arrays and objects are stored
 * as compact JSON text.
 *
 * A feature whose coordinates cannot be read is skipped with a warning and
 * counted in skipped(). Only an unreadable document fails the load.
 */
class GeoJsonLoader
{
public:
    GeoJsonLoader() = default;

    /**
     * @brief Reads and parses a file.
     * @return False if the file cannot be opened or is not a GeoJSON document.
     */
    bool loadFile(const QString& path);

    /**
     * @brief Parses an in-memory document.
     *
     * Accepts a FeatureCollection or a single Feature.
     */
    bool parse(const QByteArray& data);

    [[nodiscard]] const std::vector<GeoFeature>& features() const noexcept
    {
        return m_features;
    }

    /// Moves the parsed features out, leaving the loader empty.
    [[nodiscard]] std::vector<GeoFeature> takeFeatures() noexcept;

    [[nodiscard]] int skipped() const noexcept
    {
        return m_skipped;
    }

    [[nodiscard]] const QString& errorString() const noexcept
    {
        return m_error;
    }

private:
    void reset() noexcept;
    bool readFeature(const QJsonObject& obj, int index);

    static bool readGeometry(const QJsonValue& value, GeoGeometry& out);
    static bool readPolygon(const QJsonValue& value, GeoPolygon& out);
    static bool readRing(const QJsonValue& value, GeoRing& out);

    static FeatureAttributes readProperties(const QJsonObject& feature);
    static AttributeValue    toAttribute(const QJsonValue& value);

private:
    std::vector<GeoFeature> m_features = {};

    int     m_skipped = 0;
    QString m_error   = {};
};
