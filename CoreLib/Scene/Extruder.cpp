//============================================================
// Extruder.cpp
//============================================================
#include "Extruder.hpp"

#include <array>
#include <cmath>
#include <glm/vec3.hpp>
#include <iostream>
#include <mapbox/earcut.hpp>
#include <vector>

#include "Projector.hpp"
#include "Solid.hpp"

namespace
{
    using PlanarRing = std::vector<glm::dvec2>;

    // Projects a ring relative to the origin. A duplicated closing point is
    // dropped. Returns false when fewer than three distinct points remain.
    bool projectRing(const GeoRing& ring, double refLat, const glm::dvec2& origin, PlanarRing& out)
    {
        out.clear();

        std::size_t count = ring.size();
        if (count > 1 && ring.front() == ring.back())
            --count;

        out.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
            out.push_back(geo::project(ring[i], refLat) - origin);

        std::size_t distinct = 0;
        for (std::size_t i = 0; i < out.size() && distinct < 3; ++i)
        {
            bool seen = false;
            for (std::size_t j = 0; j < i && !seen; ++j)
                seen = (out[j] == out[i]);

            if (!seen)
                ++distinct;
        }

        return distinct >= 3;
    }

    // Shoelace; positive for counter-clockwise rings in the planar frame.
    double signedArea(const PlanarRing& ring) noexcept
    {
        double sum = 0.0;
        for (std::size_t i = 0, n = ring.size(); i < n; ++i)
        {
            const glm::dvec2& a = ring[i];
            const glm::dvec2& b = ring[(i + 1) % n];
            sum += a.x * b.y - b.x * a.y;
        }
        return 0.5 * sum;
    }

    glm::vec3 toWorld(const glm::dvec2& p, double elevation) noexcept
    {
        return {static_cast<float>(p.x), static_cast<float>(elevation), static_cast<float>(-p.y)};
    }

    void addWalls(SolidMesh& mesh, const PlanarRing& ring, double depth)
    {
        for (std::size_t i = 0, n = ring.size(); i < n; ++i)
        {
            const glm::dvec2& a = ring[i];
            const glm::dvec2& b = ring[(i + 1) % n];

            mesh.addQuad(toWorld(a, 0.0), toWorld(b, 0.0), toWorld(b, depth), toWorld(a, depth));
        }
    }
} // namespace

Extruder::Extruder(uint32_t defaultColor, uint32_t highlightColor) noexcept :
    m_defaultColor{defaultColor},
    m_highlightColor{highlightColor}
{
}

std::unique_ptr<Solid> Extruder::extrude(const GeoFeature&   feature,
                                         const glm::dvec2&   origin,
                                         const HighlightSet& highlightSet) const
{
    const GeoPolygon* polygon = feature.geometry.primary();
    const GeoRing*    outer   = polygon ? polygon->outer() : nullptr;
    if (!outer || outer->empty())
        return nullptr;

    const double refLat = feature.referenceLatitude();

    std::vector<PlanarRing> rings(1);
    if (!projectRing(*outer, refLat, origin, rings.front()))
        return nullptr;

    const std::string id = feature.id();

    const double outerArea         = signedArea(rings.front());
    bool         windingConsistent = true;

    for (std::size_t r = 1; r < polygon->rings.size(); ++r)
    {
        PlanarRing hole;
        if (!projectRing(polygon->rings[r], refLat, origin, hole))
            continue;

        if (signedArea(hole) * outerArea > 0.0)
            windingConsistent = false;

        rings.push_back(std::move(hole));
    }

    if (!windingConsistent)
    {
        std::cerr << "Extruder: feature '" << id
                  << "' has a hole wound like its outer ring; caps may be wrong.\n";
    }

    // earcut indexes the rings as one flat vertex list.
    std::vector<std::vector<std::array<double, 2>>> earcutRings;
    std::vector<glm::dvec2>                         flat;
    earcutRings.reserve(rings.size());

    for (const PlanarRing& ring : rings)
    {
        auto& er = earcutRings.emplace_back();
        er.reserve(ring.size());
        for (const glm::dvec2& p : ring)
        {
            er.push_back({p.x, p.y});
            flat.push_back(p);
        }
    }

    const std::vector<uint32_t> indices = mapbox::earcut<uint32_t>(earcutRings);

    const double depth = geo::extrusionHeight(feature);

    auto solid = std::make_unique<Solid>(id, feature.attributes);

    SolidMesh& mesh = solid->mesh();

    std::size_t wallQuads = 0;
    for (const PlanarRing& ring : rings)
        wallQuads += ring.size();

    mesh.reserveTriangles(indices.size() / 3 * 2 + wallQuads * 2);

    const glm::vec3 up{0.0f, 1.0f, 0.0f};
    const glm::vec3 down{0.0f, -1.0f, 0.0f};

    double footprint = 0.0;

    for (std::size_t t = 0; t + 2 < indices.size(); t += 3)
    {
        const glm::dvec2& a = flat[indices[t + 0]];
        const glm::dvec2& b = flat[indices[t + 1]];
        const glm::dvec2& c = flat[indices[t + 2]];

        footprint += 0.5 * std::fabs((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y));

        mesh.addTriangle(toWorld(a, depth), toWorld(b, depth), toWorld(c, depth), up);
        mesh.addTriangle(toWorld(a, 0.0), toWorld(c, 0.0), toWorld(b, 0.0), down);
    }

    for (const PlanarRing& ring : rings)
        addWalls(mesh, ring, depth);

    const bool highlighted = highlightSet.contains(id);

    SolidMaterial material = {};
    material.color         = highlighted ? m_highlightColor : m_defaultColor;
    material.highlighted   = highlighted;
    solid->setMaterial(material);

    solid->setShapeInfo(depth, static_cast<int>(rings.size()) - 1, footprint, windingConsistent);

    return solid;
}
