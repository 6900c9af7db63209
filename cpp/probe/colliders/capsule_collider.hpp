#pragma once

#include "../geom/vec3.hpp"

namespace probe {
namespace colliders {

/**
 * Capsule collider - капсула (цилиндр с полусферами на концах).
 * Ось - отрезок [point_a, point_b] в локальных координатах.
 */
struct CapsuleCollider {
    Vec3 point_a;
    Vec3 point_b;
    float radius;

    CapsuleCollider()
        : point_a(0, 0, -0.5f), point_b(0, 0, 0.5f), radius(0.25f) {}

    CapsuleCollider(const Vec3& a, const Vec3& b, float radius)
        : point_a(a), point_b(b), radius(radius) {}
};

} // namespace colliders
} // namespace probe
