#pragma once

#include "../geom/vec3.hpp"

namespace probe {
namespace colliders {

/**
 * Triangle collider - двусторонний треугольник без толщины.
 */
struct TriangleCollider {
    Vec3 point_a;
    Vec3 point_b;
    Vec3 point_c;

    TriangleCollider() : point_a(0, 0, 0), point_b(1, 0, 0), point_c(0, 1, 0) {}
    TriangleCollider(const Vec3& a, const Vec3& b, const Vec3& c)
        : point_a(a), point_b(b), point_c(c) {}

    /**
     * Нормаль по обходу (a, b, c); нулевой вектор для вырожденного треугольника.
     */
    Vec3 normal() const {
        Vec3 n = (point_b - point_a).cross(point_c - point_a);
        float len = n.norm();
        return len > 1e-12f ? n / len : Vec3::zero();
    }

    Vec3 centroid() const {
        return (point_a + point_b + point_c) / 3.0f;
    }
};

} // namespace colliders
} // namespace probe
