#pragma once

/**
 * @file raycast.hpp
 * @brief Raycast against a single collider placed in the world.
 */

#include "query_results.hpp"
#include "../geom/ray.hpp"
#include "../geom/pose3.hpp"
#include "../colliders/colliders.hpp"
#include "../narrow/raycast_local.hpp"

namespace probe {
namespace queries {

using colliders::Collider;
using colliders::ColliderType;

namespace detail {

/**
 * Raycast в локальном пространстве коллайдера, включая составные.
 * normal - в локальном пространстве, sub_index - индекс ребёнка (0 для простых).
 */
inline bool raycast_local(const Ray& ray, const Collider& collider, float& fraction, Vec3& normal, int& sub_index) {
    if (collider.type() != ColliderType::Compound) {
        sub_index = 0;
        return narrow::raycast_primitive(ray, collider, fraction, normal);
    }

    const auto& compound = collider.as_compound();
    if (!compound.blob) return false;
    const auto& blob = *compound.blob;

    float s = compound.scale;
    Ray scaled(ray.start / s, ray.end / s);

    float best = 1.0f;
    int best_index = -1;
    Vec3 best_normal;
    for (int i = 0; i < blob.size(); ++i) {
        Pose3 child_inv = blob.transforms[i].inverse();
        // Луч укорачивается до лучшего попадания
        Ray clipped = best_index < 0 ? scaled : Ray(scaled.start, scaled.point_at(best));

        float f;
        Vec3 n;
        if (!narrow::raycast_primitive(Ray::transformed(child_inv, clipped), blob.colliders[i], f, n)) continue;

        // Сравнение только по полному лучу: равные попадания дают равные доли
        float full = f;
        if (best_index >= 0) {
            if (!narrow::raycast_primitive(Ray::transformed(child_inv, scaled), blob.colliders[i], full, n)) continue;
        }
        if (best_index < 0 || full < best) {
            best = full;
            best_index = i;
            best_normal = blob.transforms[i].transform_vector(n);
        }
    }

    if (best_index < 0) return false;
    fraction = best;
    normal = best_normal;
    sub_index = best_index;
    return true;
}

} // namespace detail

/**
 * Первое пересечение отрезка ray с коллайдером в позе pose.
 * При промахе result сбрасывается.
 */
inline bool raycast(const Ray& ray, const Collider& collider, const Pose3& pose, RaycastResult& result) {
    Ray local = Ray::transformed(pose.inverse(), ray);

    float fraction;
    Vec3 normal;
    int sub_index;
    if (!detail::raycast_local(local, collider, fraction, normal, sub_index)) {
        result = RaycastResult{};
        return false;
    }

    result.position = ray.point_at(fraction);
    result.normal = pose.transform_vector(normal);
    result.distance = ray.length() * fraction;
    result.sub_collider_index = sub_index;
    return true;
}

inline bool raycast(const Vec3& start, const Vec3& end, const Collider& collider, const Pose3& pose,
                    RaycastResult& result) {
    return raycast(Ray(start, end), collider, pose, result);
}

} // namespace queries
} // namespace probe
