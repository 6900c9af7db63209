#pragma once

#include "../geom/vec3.hpp"

namespace probe {
namespace colliders {

/**
 * Sphere collider - сфера.
 *
 * Геометрия задаётся в локальных координатах коллайдера:
 * - center: центр
 * - radius: радиус
 */
struct SphereCollider {
    Vec3 center;
    float radius;

    SphereCollider() : center(), radius(0.5f) {}
    SphereCollider(const Vec3& center, float radius) : center(center), radius(radius) {}
};

} // namespace colliders
} // namespace probe
