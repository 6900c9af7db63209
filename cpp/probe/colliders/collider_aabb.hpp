#pragma once

/**
 * @file collider_aabb.hpp
 * @brief AABB коллайдеров в мировом пространстве и равномерное масштабирование.
 */

#include "collider.hpp"
#include "compound_collider_blob.hpp"
#include "../geom/aabb.hpp"
#include "../geom/pose3.hpp"
#include "pc_log.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace probe {
namespace colliders {

/**
 * Коллайдер, равномерно масштабированный относительно локального начала координат.
 * factor > 0.
 */
inline Collider scale_collider(const Collider& collider, float factor) {
    switch (collider.type()) {
        case ColliderType::Sphere: {
            const auto& s = collider.as_sphere();
            return SphereCollider(s.center * factor, s.radius * factor);
        }
        case ColliderType::Capsule: {
            const auto& c = collider.as_capsule();
            return CapsuleCollider(c.point_a * factor, c.point_b * factor, c.radius * factor);
        }
        case ColliderType::Box: {
            const auto& b = collider.as_box();
            return BoxCollider(b.center * factor, b.half_size * factor);
        }
        case ColliderType::Triangle: {
            const auto& t = collider.as_triangle();
            return TriangleCollider(t.point_a * factor, t.point_b * factor, t.point_c * factor);
        }
        case ColliderType::Convex: {
            const auto& c = collider.as_convex();
            return ConvexCollider(c.blob, c.scale * factor);
        }
        case ColliderType::Compound: {
            const auto& c = collider.as_compound();
            return CompoundCollider(c.blob, c.scale * factor);
        }
    }
    return collider;
}

/**
 * AABB коллайдера, размещённого позой pose.
 */
inline AABB aabb_from(const Collider& collider, const Pose3& pose) {
    switch (collider.type()) {
        case ColliderType::Sphere: {
            const auto& s = collider.as_sphere();
            Vec3 c = pose.transform_point(s.center);
            return AABB(c, c).expanded(s.radius);
        }
        case ColliderType::Capsule: {
            const auto& cap = collider.as_capsule();
            AABB box(pose.transform_point(cap.point_a), pose.transform_point(cap.point_a));
            box.extend(pose.transform_point(cap.point_b));
            return box.expanded(cap.radius);
        }
        case ColliderType::Box: {
            const auto& b = collider.as_box();
            return AABB(b.min_point(), b.max_point()).transformed_by(pose);
        }
        case ColliderType::Triangle: {
            const auto& t = collider.as_triangle();
            AABB box(pose.transform_point(t.point_a), pose.transform_point(t.point_a));
            box.extend(pose.transform_point(t.point_b));
            box.extend(pose.transform_point(t.point_c));
            return box;
        }
        case ColliderType::Convex: {
            const auto& c = collider.as_convex();
            int n = c.vertex_count();
            if (n == 0) return AABB(pose.lin, pose.lin);
            Vec3 first = pose.transform_point(c.vertex(0));
            AABB box(first, first);
            for (int i = 1; i < n; ++i) {
                box.extend(pose.transform_point(c.vertex(i)));
            }
            return box;
        }
        case ColliderType::Compound: {
            const auto& c = collider.as_compound();
            if (!c.blob || c.blob->colliders.empty()) return AABB(pose.lin, pose.lin);
            AABB box;
            for (int i = 0; i < c.blob->size(); ++i) {
                // Масштаб compound переносится в ребёнка и в смещение его позы
                const Pose3& child_pose = c.blob->transforms[i];
                Pose3 scaled_pose(child_pose.ang, child_pose.lin * c.scale);
                AABB child = aabb_from(scale_collider(c.blob->colliders[i], c.scale), pose * scaled_pose);
                box = i == 0 ? child : box.merge(child);
            }
            return box;
        }
    }
    return AABB(pose.lin, pose.lin);
}

/**
 * AABB, охватывающий коллайдер в начальной позе и в конечной позиции
 * (вращение не меняется).
 */
inline AABB aabb_from_sweep(const Collider& collider, const Pose3& start_pose, const Vec3& end_position) {
    AABB start = aabb_from(collider, start_pose);
    AABB end = aabb_from(collider, start_pose.with_translation(end_position));
    return start.merge(end);
}

inline std::shared_ptr<const CompoundColliderBlob> CompoundColliderBlob::build(
    std::vector<Collider> colliders, std::vector<Pose3> transforms)
{
    auto fail = [](const std::string& msg) {
        log_error("CompoundColliderBlob: " + msg);
        throw std::invalid_argument("CompoundColliderBlob: " + msg);
    };

    if (colliders.size() != transforms.size()) {
        fail("collider count " + std::to_string(colliders.size())
             + " does not match transform count " + std::to_string(transforms.size()));
    }
    if (colliders.empty()) {
        fail("no child colliders");
    }
    for (size_t i = 0; i < colliders.size(); ++i) {
        if (colliders[i].type() == ColliderType::Compound) {
            fail("child " + std::to_string(i) + " is a compound collider");
        }
    }

    auto blob = std::make_shared<CompoundColliderBlob>();
    blob->colliders = std::move(colliders);
    blob->transforms = std::move(transforms);
    blob->local_aabb = aabb_from(blob->colliders[0], blob->transforms[0]);
    for (int i = 1; i < blob->size(); ++i) {
        blob->local_aabb = blob->local_aabb.merge(aabb_from(blob->colliders[i], blob->transforms[i]));
    }
    return blob;
}

} // namespace colliders
} // namespace probe
