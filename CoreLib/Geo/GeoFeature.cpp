#include "GeoFeature.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>

#include "Projector.hpp"

namespace
{
    std::optional<double> parseNumber(const std::string& text)
    {
        std::size_t begin = 0;
        std::size_t end   = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
            ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
            --end;

        if (begin == end)
            return std::nullopt;

        double value = 0.0;

        const char* first = text.data() + begin;
        const char* last  = text.data() + end;
        if (*first == '+')
            ++first;

        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last)
            return std::nullopt;

        return value;
    }

    std::string formatNumber(double v)
    {
        if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15)
            return std::to_string(static_cast<long long>(v));

        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
} // namespace

const GeoPolygon* GeoGeometry::primary() const noexcept
{
    if (type == GeoGeometryType::None || polygons.empty())
        return nullptr;

    return &polygons.front();
}

std::string GeoFeature::id() const
{
    const AttributeValue* v = geo::findAttribute(attributes.get(), geo::kIdKey);
    return v ? geo::attributeText(*v) : std::string{};
}

std::optional<double> GeoFeature::heightAttribute() const
{
    const AttributeValue* v = geo::findAttribute(attributes.get(), geo::kHeightKey);
    if (!v || std::holds_alternative<bool>(*v))
        return std::nullopt;

    return geo::attributeNumber(*v);
}

double GeoFeature::referenceLatitude() const
{
    const AttributeValue* v = geo::findAttribute(attributes.get(), geo::kRefLatKey);
    if (!v)
        return geo::kDefaultRefLat;

    const std::optional<double> lat = geo::attributeNumber(*v);
    return (lat && std::isfinite(*lat)) ? *lat : geo::kDefaultRefLat;
}

namespace geo
{
    const AttributeValue* findAttribute(const FeatureAttributes* attrs, const std::string& key) noexcept
    {
        if (!attrs)
            return nullptr;

        auto it = attrs->find(key);
        return it == attrs->end() ? nullptr : &it->second;
    }

    std::optional<double> attributeNumber(const AttributeValue& value)
    {
        if (const double* d = std::get_if<double>(&value))
            return *d;

        if (const bool* b = std::get_if<bool>(&value))
            return *b ? 1.0 : 0.0;

        if (const std::string* s = std::get_if<std::string>(&value))
            return parseNumber(*s);

        return std::nullopt;
    }

    std::string attributeText(const AttributeValue& value)
    {
        if (const std::string* s = std::get_if<std::string>(&value))
            return *s;

        if (const double* d = std::get_if<double>(&value))
            return formatNumber(*d);

        if (const bool* b = std::get_if<bool>(&value))
            return *b ? "true" : "false";

        return {};
    }

    double extrusionHeight(const GeoFeature& feature)
    {
        double h = kDefaultHeight;

        const std::optional<double> raw = feature.heightAttribute();
        if (raw && std::isfinite(*raw) && *raw != 0.0)
            h = *raw;

        return std::max(kMinHeight, h);
    }

    FeatureAttributesPtr makeAttributes(FeatureAttributes attrs)
    {
        return std::make_shared<const FeatureAttributes>(std::move(attrs));
    }

} // namespace geo
