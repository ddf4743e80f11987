#include "ParcelInfo.hpp"

#include <QLocale>
#include <QObject>
#include <QRegularExpression>
#include <cmath>

namespace
{
    // Empty string, zero, NaN, false and null count as "no value".
    bool isBlank(const AttributeValue* v)
    {
        if (!v || std::holds_alternative<std::monostate>(*v))
            return true;

        if (const bool* b = std::get_if<bool>(v))
            return !*b;

        if (const double* d = std::get_if<double>(v))
            return *d == 0.0 || std::isnan(*d);

        return std::get<std::string>(*v).empty();
    }

    QString text(const AttributeValue& v)
    {
        return QString::fromStdString(geo::attributeText(v));
    }

    QString textOrMissing(const FeatureAttributes& attrs, const char* key)
    {
        const AttributeValue* v = geo::findAttribute(&attrs, key);
        return isBlank(v) ? parcelinfo::kMissing : text(*v);
    }

    QString groupedAmount(double amount)
    {
        const QLocale locale(QLocale::English, QLocale::UnitedStates);

        const double rounded = std::round(amount * 1000.0) / 1000.0;
        if (std::floor(rounded) == rounded && std::fabs(rounded) < 9.0e15)
            return locale.toString(static_cast<qlonglong>(rounded));

        QString s = locale.toString(rounded, 'f', 3);
        while (s.endsWith('0'))
            s.chop(1);
        if (s.endsWith('.'))
            s.chop(1);
        return s;
    }
} // namespace

namespace parcelinfo
{
    std::vector<Row> rows(const FeatureAttributes& attrs)
    {
        std::vector<Row> out;
        out.reserve(6);

        out.push_back({QObject::tr("Address"), textOrMissing(attrs, "address")});
        out.push_back({QObject::tr("Zoning"), textOrMissing(attrs, "zoning")});
        out.push_back({QObject::tr("Assessment"), formatAssessment(geo::findAttribute(&attrs, "assessed_value"))});
        out.push_back({QObject::tr("Community"), textOrMissing(attrs, "community")});

        if (const AttributeValue* year = geo::findAttribute(&attrs, "year"))
        {
            const bool isNull = std::holds_alternative<std::monostate>(*year);
            out.push_back({QObject::tr("Year"), isNull ? kMissing : text(*year)});
        }

        out.push_back({QObject::tr("ID"), textOrMissing(attrs, geo::kIdKey)});
        return out;
    }

    QString formatAssessment(const AttributeValue* value)
    {
        if (isBlank(value))
            return kMissing;

        const std::optional<double> amount = geo::attributeNumber(*value);
        if (!amount || !std::isfinite(*amount))
            return QStringLiteral("$") + text(*value);

        return QStringLiteral("$") + groupedAmount(*amount);
    }

    HighlightSet parseHighlightIds(const QString& text)
    {
        static const QRegularExpression separators(QStringLiteral("[,\\s]+"));

        HighlightSet ids;
        for (const QString& part : text.split(separators, Qt::SkipEmptyParts))
            ids.insert(part.toStdString());
        return ids;
    }

    std::vector<GeoFeature> filterByIds(const std::vector<GeoFeature>& features, const HighlightSet& ids)
    {
        std::vector<GeoFeature> out;
        for (const GeoFeature& f : features)
        {
            if (ids.contains(f.id()))
                out.push_back(f);
        }
        return out;
    }

    QString statusText(size_t loaded, size_t highlighted)
    {
        return QObject::tr("Loaded: %1 · Highlighted: %2").arg(static_cast<qulonglong>(loaded)).arg(static_cast<qulonglong>(highlighted));
    }

} // namespace parcelinfo
