#pragma once

/**
 * @file collider_distance.hpp
 * @brief Distance between two colliders placed in the world, compounds on either side.
 */

#include "query_results.hpp"
#include "../geom/pose3.hpp"
#include "../colliders/colliders.hpp"
#include "../narrow/collider_distance_local.hpp"

namespace probe {
namespace queries {

using colliders::Collider;
using colliders::ColliderType;

namespace detail {

/**
 * a - не составной, поза a_in_b в системе b; b - любой.
 * Результат в системе b.
 */
inline bool distance_to_collider_local(const Collider& a, const Pose3& a_in_b, const Collider& b,
                                       float max_distance, narrow::ShapeDistance& out, int& sub_index_b) {
    if (b.type() != ColliderType::Compound) {
        sub_index_b = 0;
        return narrow::distance_between_local(a, a_in_b, b, max_distance, out);
    }

    const auto& compound = b.as_compound();
    if (!compound.blob) return false;
    const auto& blob = *compound.blob;

    // Переход в масштабированное пространство compound
    float s = compound.scale;
    Collider scaled_a = colliders::scale_collider(a, 1.0f / s);
    Pose3 a_in_scaled(a_in_b.ang, a_in_b.lin / s);
    float cutoff = max_distance / s;

    int best_index = -1;
    narrow::ShapeDistance best;
    for (int i = 0; i < blob.size(); ++i) {
        const Pose3& child = blob.transforms[i];
        narrow::ShapeDistance hit;
        if (!narrow::distance_between_local(scaled_a, child.inverse() * a_in_scaled, blob.colliders[i],
                                            cutoff, hit)) {
            continue;
        }
        if (best_index < 0 || hit.distance < best.distance) {
            best.point_a = child.transform_point(hit.point_a);
            best.point_b = child.transform_point(hit.point_b);
            best.normal_a = child.transform_vector(hit.normal_a);
            best.normal_b = child.transform_vector(hit.normal_b);
            best.distance = hit.distance;
            best_index = i;
            cutoff = hit.distance;
        }
    }

    if (best_index < 0) return false;
    out.point_a = best.point_a * s;
    out.point_b = best.point_b * s;
    out.normal_a = best.normal_a;
    out.normal_b = best.normal_b;
    out.distance = best.distance * s;
    sub_index_b = best_index;
    return true;
}

inline bool distance_single(const Collider& a, const Pose3& a_pose, const Collider& b, const Pose3& b_pose,
                            float max_distance, ColliderDistanceResult& result) {
    narrow::ShapeDistance hit;
    int sub_index_b;
    if (!distance_to_collider_local(a, a_pose.in_frame_of(b_pose), b, max_distance, hit, sub_index_b)) {
        return false;
    }
    result.hitpoint_a = b_pose.transform_point(hit.point_a);
    result.hitpoint_b = b_pose.transform_point(hit.point_b);
    result.normal_a = b_pose.transform_vector(hit.normal_a);
    result.normal_b = b_pose.transform_vector(hit.normal_b);
    result.distance = hit.distance;
    result.sub_collider_index_a = 0;
    result.sub_collider_index_b = sub_index_b;
    return true;
}

} // namespace detail

/**
 * Ближайшие точки коллайдеров a и b, если расстояние не больше max_distance.
 * Отрицательное расстояние - глубина проникновения.
 */
inline bool distance_between(const Collider& a, const Pose3& a_pose, const Collider& b, const Pose3& b_pose,
                             float max_distance, ColliderDistanceResult& result) {
    if (a.type() != ColliderType::Compound) {
        if (!detail::distance_single(a, a_pose, b, b_pose, max_distance, result)) {
            result = ColliderDistanceResult{};
            return false;
        }
        return true;
    }

    const auto& compound = a.as_compound();
    if (!compound.blob) {
        result = ColliderDistanceResult{};
        return false;
    }
    const auto& blob = *compound.blob;
    float s = compound.scale;

    float cutoff = max_distance;
    bool found = false;
    ColliderDistanceResult best;
    for (int i = 0; i < blob.size(); ++i) {
        const Pose3& child = blob.transforms[i];
        Pose3 child_pose = a_pose * Pose3(child.ang, child.lin * s);
        Collider child_collider = colliders::scale_collider(blob.colliders[i], s);

        ColliderDistanceResult hit;
        if (!detail::distance_single(child_collider, child_pose, b, b_pose, cutoff, hit)) continue;
        if (!found || hit.distance < best.distance) {
            best = hit;
            best.sub_collider_index_a = i;
            cutoff = hit.distance;
            found = true;
        }
    }

    result = found ? best : ColliderDistanceResult{};
    return found;
}

} // namespace queries
} // namespace probe
