#pragma once

/**
 * @file point_distance.hpp
 * @brief Signed distance from a point to a single collider placed in the world.
 */

#include "query_results.hpp"
#include "../geom/pose3.hpp"
#include "../colliders/colliders.hpp"
#include "../narrow/point_distance_local.hpp"

namespace probe {
namespace queries {

using colliders::Collider;
using colliders::ColliderType;

namespace detail {

inline bool point_distance_local(const Vec3& point, const Collider& collider, float max_distance,
                                 Vec3& hitpoint, Vec3& normal, float& distance, int& sub_index) {
    if (collider.type() != ColliderType::Compound) {
        sub_index = 0;
        return narrow::point_distance_primitive(point, collider, max_distance, hitpoint, normal, distance);
    }

    const auto& compound = collider.as_compound();
    if (!compound.blob) return false;
    const auto& blob = *compound.blob;

    float s = compound.scale;
    Vec3 scaled = point / s;
    float cutoff = max_distance / s;

    int best_index = -1;
    float best = 0.0f;
    Vec3 best_hitpoint, best_normal;
    for (int i = 0; i < blob.size(); ++i) {
        const Pose3& child = blob.transforms[i];
        Vec3 h, n;
        float d;
        if (!narrow::point_distance_primitive(child.inverse_transform_point(scaled), blob.colliders[i],
                                              cutoff, h, n, d)) {
            continue;
        }
        if (best_index < 0 || d < best) {
            best = d;
            best_index = i;
            best_hitpoint = child.transform_point(h);
            best_normal = child.transform_vector(n);
            cutoff = d;
        }
    }

    if (best_index < 0) return false;
    hitpoint = best_hitpoint * s;
    normal = best_normal;
    distance = best * s;
    sub_index = best_index;
    return true;
}

} // namespace detail

/**
 * Ближайшая к point точка поверхности коллайдера в позе pose,
 * если знаковое расстояние не больше max_distance.
 */
inline bool distance_between(const Vec3& point, const Collider& collider, const Pose3& pose,
                             float max_distance, PointDistanceResult& result) {
    Vec3 local = pose.inverse_transform_point(point);

    Vec3 hitpoint, normal;
    float distance;
    int sub_index;
    if (!detail::point_distance_local(local, collider, max_distance, hitpoint, normal, distance, sub_index)) {
        result = PointDistanceResult{};
        return false;
    }

    result.hitpoint = pose.transform_point(hitpoint);
    result.normal = pose.transform_vector(normal);
    result.distance = distance;
    result.sub_collider_index = sub_index;
    return true;
}

} // namespace queries
} // namespace probe
