#ifndef SOLID_MESH_HPP_INCLUDED
#define SOLID_MESH_HPP_INCLUDED

#include <cstddef>
#include <glm/vec3.hpp>
#include <vector>

/**
 * @brief Axis-aligned bounds. Empty until the first point is added.
 */
struct SolidBounds
{
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
    bool      empty = true;

    void expand(const glm::vec3& p) noexcept;

    [[nodiscard]] bool contains(const glm::vec3& p, float eps = 0.0f) const noexcept;

    [[nodiscard]] glm::vec3 center() const noexcept;
};

/**
 * @brief Flat-shaded, non-indexed triangle soup.
 *
 * Three consecutive entries in positions()/normals() form one triangle. Each
 * triangle carries a single face normal replicated to its three corners,
 * which is what the raster path uploads as-is.
 */
class SolidMesh
{
public:
    SolidMesh() = default;

    void reserveTriangles(std::size_t count);

    /**
     * @brief Appends a triangle; the normal is derived from the corner order (a, b, c).
     *
     * Degenerate triangles (zero area) are dropped.
     */
    void addTriangle(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c);

    /**
     * @brief Appends a triangle with an explicit face normal.
     */
    void addTriangle(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, const glm::vec3& n);

    /**
     * @brief Appends the quad (a, b, c, d) as two triangles sharing the a-c diagonal.
     */
    void addQuad(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, const glm::vec3& d);

    void clear() noexcept;

    [[nodiscard]] bool        empty() const noexcept;
    [[nodiscard]] std::size_t triangleCount() const noexcept;

    [[nodiscard]] const glm::vec3& corner(std::size_t tri, int c) const noexcept;

    [[nodiscard]] const std::vector<glm::vec3>& positions() const noexcept;
    [[nodiscard]] const std::vector<glm::vec3>& normals() const noexcept;
    [[nodiscard]] const SolidBounds&            bounds() const noexcept;

    /**
     * @brief Sum of triangle areas.
     */
    [[nodiscard]] double surfaceArea() const noexcept;

private:
    std::vector<glm::vec3> m_positions = {};
    std::vector<glm::vec3> m_normals   = {};
    SolidBounds            m_bounds    = {};
};

#endif // SOLID_MESH_HPP_INCLUDED
