#pragma once

#include "../geom/vec3.hpp"
#include <array>

namespace probe {
namespace colliders {

/**
 * Box collider - параллелепипед, выровненный по осям локальной системы.
 */
struct BoxCollider {
    Vec3 center;     // Центр в локальных координатах
    Vec3 half_size;  // Половинные размеры

    BoxCollider() : center(0, 0, 0), half_size(0.5f, 0.5f, 0.5f) {}
    BoxCollider(const Vec3& center, const Vec3& half_size)
        : center(center), half_size(half_size) {}

    // Создать из полного размера
    static BoxCollider from_size(const Vec3& center, const Vec3& size) {
        return BoxCollider(center, size * 0.5f);
    }

    Vec3 min_point() const { return center - half_size; }
    Vec3 max_point() const { return center + half_size; }

    /**
     * 8 вершин в локальных координатах.
     */
    std::array<Vec3, 8> corners() const {
        Vec3 c = center;
        Vec3 h = half_size;
        return {{
            {c.x - h.x, c.y - h.y, c.z - h.z},
            {c.x + h.x, c.y - h.y, c.z - h.z},
            {c.x - h.x, c.y + h.y, c.z - h.z},
            {c.x + h.x, c.y + h.y, c.z - h.z},
            {c.x - h.x, c.y - h.y, c.z + h.z},
            {c.x + h.x, c.y - h.y, c.z + h.z},
            {c.x - h.x, c.y + h.y, c.z + h.z},
            {c.x + h.x, c.y + h.y, c.z + h.z}
        }};
    }
};

} // namespace colliders
} // namespace probe
