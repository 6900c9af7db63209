#pragma once

#include "vec3.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace probe {

/**
 * Axis-Aligned Bounding Box in 3D space.
 */
struct AABB {
    Vec3 min_point;
    Vec3 max_point;

    AABB() : min_point(0, 0, 0), max_point(0, 0, 0) {}
    AABB(const Vec3& min_pt, const Vec3& max_pt) : min_point(min_pt), max_point(max_pt) {}

    // Extend the AABB to include the given point
    void extend(const Vec3& point) {
        min_point = Vec3::min(min_point, point);
        max_point = Vec3::max(max_point, point);
    }

    // Check if this AABB intersects with another AABB
    bool intersects(const AABB& other) const {
        return max_point.x >= other.min_point.x && other.max_point.x >= min_point.x &&
               max_point.y >= other.min_point.y && other.max_point.y >= min_point.y &&
               max_point.z >= other.min_point.z && other.max_point.z >= min_point.z;
    }

    // Check if this AABB contains a point
    bool contains(const Vec3& point) const {
        return point.x >= min_point.x && point.x <= max_point.x &&
               point.y >= min_point.y && point.y <= max_point.y &&
               point.z >= min_point.z && point.z <= max_point.z;
    }

    // Check if this AABB fully contains another AABB
    bool contains(const AABB& inner) const {
        return min_point.x <= inner.min_point.x &&
               min_point.y <= inner.min_point.y &&
               min_point.z <= inner.min_point.z &&
               max_point.x >= inner.max_point.x &&
               max_point.y >= inner.max_point.y &&
               max_point.z >= inner.max_point.z;
    }

    // Merge this AABB with another AABB
    AABB merge(const AABB& other) const {
        return AABB(Vec3::min(min_point, other.min_point),
                    Vec3::max(max_point, other.max_point));
    }

    // Grow every side by margin
    AABB expanded(float margin) const {
        Vec3 m(margin, margin, margin);
        return AABB(min_point - m, max_point + m);
    }

    // Get center of the AABB
    Vec3 center() const {
        return (min_point + max_point) * 0.5f;
    }

    // Get half size
    Vec3 half_size() const {
        return (max_point - min_point) * 0.5f;
    }

    // Get the 8 corners of the AABB
    std::array<Vec3, 8> corners() const {
        return {{
            {min_point.x, min_point.y, min_point.z},
            {min_point.x, min_point.y, max_point.z},
            {min_point.x, max_point.y, min_point.z},
            {min_point.x, max_point.y, max_point.z},
            {max_point.x, min_point.y, min_point.z},
            {max_point.x, min_point.y, max_point.z},
            {max_point.x, max_point.y, min_point.z},
            {max_point.x, max_point.y, max_point.z}
        }};
    }

    // Surface area (useful for BVH)
    float surface_area() const {
        Vec3 d = max_point - min_point;
        return 2.0f * (d.x * d.y + d.y * d.z + d.z * d.x);
    }

    // Transform AABB by pose (returns new AABB that bounds the transformed box)
    template<typename PoseType>
    AABB transformed_by(const PoseType& pose) const {
        auto c = corners();
        Vec3 first = pose.transform_point(c[0]);
        AABB result(first, first);
        for (size_t i = 1; i < 8; ++i) {
            result.extend(pose.transform_point(c[i]));
        }
        return result;
    }
};

} // namespace probe
