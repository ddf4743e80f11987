#include "GeoJsonLoader.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

bool GeoJsonLoader::loadFile(const QString& path)
{
    reset();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        m_error = QObject::tr("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    return parse(file.readAll());
}

bool GeoJsonLoader::parse(const QByteArray& data)
{
    reset();

    QJsonParseError     parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError)
    {
        m_error = QObject::tr("Invalid JSON at offset %1: %2").arg(parseError.offset).arg(parseError.errorString());
        return false;
    }

    if (!doc.isObject())
    {
        m_error = QObject::tr("Expected a GeoJSON object.");
        return false;
    }

    const QJsonObject root = doc.object();
    const QString     type = root.value("type").toString();

    if (type == "Feature")
    {
        readFeature(root, 0);
        return true;
    }

    if (type != "FeatureCollection" || !root.value("features").isArray())
    {
        m_error = QObject::tr("Expected a FeatureCollection, got \"%1\".").arg(type);
        return false;
    }

    const QJsonArray items = root.value("features").toArray();
    m_features.reserve(static_cast<size_t>(items.size()));

    int index = 0;
    for (const QJsonValue& item : items)
    {
        if (!item.isObject())
        {
            qWarning() << "GeoJsonLoader: feature" << index << "is not an object, skipped.";
            ++m_skipped;
        }
        else
        {
            readFeature(item.toObject(), index);
        }
        ++index;
    }

    return true;
}

std::vector<GeoFeature> GeoJsonLoader::takeFeatures() noexcept
{
    std::vector<GeoFeature> out = std::move(m_features);
    m_features.clear();
    return out;
}

void GeoJsonLoader::reset() noexcept
{
    m_features.clear();
    m_skipped = 0;
    m_error.clear();
}

bool GeoJsonLoader::readFeature(const QJsonObject& obj, int index)
{
    GeoFeature feature;

    if (!readGeometry(obj.value("geometry"), feature.geometry))
    {
        qWarning() << "GeoJsonLoader: feature" << index << "has malformed coordinates, skipped.";
        ++m_skipped;
        return false;
    }

    feature.attributes = geo::makeAttributes(readProperties(obj));
    m_features.push_back(std::move(feature));
    return true;
}

bool GeoJsonLoader::readGeometry(const QJsonValue& value, GeoGeometry& out)
{
    out = {};

    // Null or missing geometry is a feature without a shape, not an error.
    if (!value.isObject())
        return value.isNull() || value.isUndefined();

    const QJsonObject geom   = value.toObject();
    const QString     type   = geom.value("type").toString();
    const QJsonValue  coords = geom.value("coordinates");

    if (type == "Polygon")
    {
        GeoPolygon poly;
        if (!readPolygon(coords, poly))
            return false;

        out.type = GeoGeometryType::Polygon;
        out.polygons.push_back(std::move(poly));
        return true;
    }

    if (type == "MultiPolygon")
    {
        if (!coords.isArray())
            return false;

        for (const QJsonValue& member : coords.toArray())
        {
            GeoPolygon poly;
            if (!readPolygon(member, poly))
                return false;
            out.polygons.push_back(std::move(poly));
        }

        out.type = GeoGeometryType::MultiPolygon;
        return true;
    }

    // Points, lines and collections carry no footprint.
    return true;
}

bool GeoJsonLoader::readPolygon(const QJsonValue& value, GeoPolygon& out)
{
    if (!value.isArray())
        return false;

    const QJsonArray rings = value.toArray();
    out.rings.reserve(static_cast<size_t>(rings.size()));

    for (const QJsonValue& r : rings)
    {
        GeoRing ring;
        if (!readRing(r, ring))
            return false;
        out.rings.push_back(std::move(ring));
    }

    return true;
}

bool GeoJsonLoader::readRing(const QJsonValue& value, GeoRing& out)
{
    if (!value.isArray())
        return false;

    const QJsonArray positions = value.toArray();
    out.reserve(static_cast<size_t>(positions.size()));

    for (const QJsonValue& p : positions)
    {
        const QJsonArray pos = p.toArray();
        if (pos.size() < 2 || !pos.at(0).isDouble() || !pos.at(1).isDouble())
            return false;

        const double lon = pos.at(0).toDouble();
        const double lat = pos.at(1).toDouble();
        if (!std::isfinite(lon) || !std::isfinite(lat))
            return false;

        // Altitude and any further ordinates are ignored.
        out.emplace_back(lon, lat);
    }

    return true;
}

FeatureAttributes GeoJsonLoader::readProperties(const QJsonObject& feature)
{
    FeatureAttributes attrs;

    const QJsonObject props = feature.value("properties").toObject();
    for (auto it = props.begin(); it != props.end(); ++it)
        attrs.emplace(it.key().toStdString(), toAttribute(it.value()));

    // A feature-level id stands in when the properties carry none.
    const QJsonValue featureId = feature.value("id");
    if (!attrs.contains(geo::kIdKey) && (featureId.isString() || featureId.isDouble()))
        attrs.emplace(geo::kIdKey, toAttribute(featureId));

    return attrs;
}

AttributeValue GeoJsonLoader::toAttribute(const QJsonValue& value)
{
    switch (value.type())
    {
        case QJsonValue::Bool:
            return value.toBool();
        case QJsonValue::Double:
            return value.toDouble();
        case QJsonValue::String:
            return value.toString().toStdString();
        case QJsonValue::Array:
            return QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact).toStdString();
        case QJsonValue::Object:
            return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact).toStdString();
        default:
            return std::monostate{};
    }
}
