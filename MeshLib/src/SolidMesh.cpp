#include "SolidMesh.hpp"

#include <glm/common.hpp>
#include <glm/geometric.hpp>

void SolidBounds::expand(const glm::vec3& p) noexcept
{
    if (empty)
    {
        min   = p;
        max   = p;
        empty = false;
        return;
    }

    min = glm::min(min, p);
    max = glm::max(max, p);
}

bool SolidBounds::contains(const glm::vec3& p, float eps) const noexcept
{
    if (empty)
        return false;

    return p.x >= min.x - eps && p.x <= max.x + eps &&
           p.y >= min.y - eps && p.y <= max.y + eps &&
           p.z >= min.z - eps && p.z <= max.z + eps;
}

glm::vec3 SolidBounds::center() const noexcept
{
    return (min + max) * 0.5f;
}

void SolidMesh::reserveTriangles(std::size_t count)
{
    m_positions.reserve(count * 3);
    m_normals.reserve(count * 3);
}

void SolidMesh::addTriangle(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c)
{
    const glm::vec3 n   = glm::cross(b - a, c - a);
    const float     len = glm::length(n);

    if (len <= 0.0f)
        return;

    addTriangle(a, b, c, n / len);
}

void SolidMesh::addTriangle(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, const glm::vec3& n)
{
    m_positions.push_back(a);
    m_positions.push_back(b);
    m_positions.push_back(c);

    m_normals.push_back(n);
    m_normals.push_back(n);
    m_normals.push_back(n);

    m_bounds.expand(a);
    m_bounds.expand(b);
    m_bounds.expand(c);
}

void SolidMesh::addQuad(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, const glm::vec3& d)
{
    addTriangle(a, b, c);
    addTriangle(a, c, d);
}

void SolidMesh::clear() noexcept
{
    m_positions.clear();
    m_normals.clear();
    m_bounds = {};
}

bool SolidMesh::empty() const noexcept
{
    return m_positions.empty();
}

std::size_t SolidMesh::triangleCount() const noexcept
{
    return m_positions.size() / 3;
}

const glm::vec3& SolidMesh::corner(std::size_t tri, int c) const noexcept
{
    return m_positions[tri * 3 + static_cast<std::size_t>(c)];
}

const std::vector<glm::vec3>& SolidMesh::positions() const noexcept
{
    return m_positions;
}

const std::vector<glm::vec3>& SolidMesh::normals() const noexcept
{
    return m_normals;
}

const SolidBounds& SolidMesh::bounds() const noexcept
{
    return m_bounds;
}

double SolidMesh::surfaceArea() const noexcept
{
    double area = 0.0;
    for (std::size_t t = 0; t < triangleCount(); ++t)
    {
        const glm::vec3 e1 = corner(t, 1) - corner(t, 0);
        const glm::vec3 e2 = corner(t, 2) - corner(t, 0);
        area += 0.5 * static_cast<double>(glm::length(glm::cross(e1, e2)));
    }
    return area;
}
