#pragma once

/**
 * @file collider_cast.hpp
 * @brief Translational sweep of a collider against a single target collider.
 */

#include "query_results.hpp"
#include "../geom/pose3.hpp"
#include "../colliders/colliders.hpp"
#include "../narrow/collider_cast_local.hpp"

namespace probe {
namespace queries {

using colliders::Collider;
using colliders::ColliderType;

namespace detail {

/**
 * caster - не составной, всё в системе target.
 */
inline bool cast_local(const Collider& caster, const Pose3& start, const Vec3& end_position,
                       const Collider& target, float& fraction, narrow::ShapeDistance& contact,
                       int& sub_index_target) {
    if (target.type() != ColliderType::Compound) {
        sub_index_target = 0;
        return narrow::collider_cast_local(caster, start, end_position, target, fraction, contact);
    }

    const auto& compound = target.as_compound();
    if (!compound.blob) return false;
    const auto& blob = *compound.blob;

    float s = compound.scale;
    Collider scaled_caster = colliders::scale_collider(caster, 1.0f / s);
    Pose3 scaled_start(start.ang, start.lin / s);
    Vec3 scaled_end = end_position / s;

    float best = 1.0f;
    int best_index = -1;
    narrow::ShapeDistance best_contact;
    for (int i = 0; i < blob.size(); ++i) {
        const Pose3& child = blob.transforms[i];
        Pose3 child_inv = child.inverse();
        // Sweep укорачивается до лучшего контакта
        Vec3 clipped_end = best_index < 0 ? scaled_end : Vec3::lerp(scaled_start.lin, scaled_end, best);

        float full;
        narrow::ShapeDistance hit;
        if (!narrow::collider_cast_local(scaled_caster, child_inv * scaled_start,
                                         child_inv.transform_point(clipped_end), blob.colliders[i], full, hit)) {
            continue;
        }

        // Сравнение только по полному sweep: равные контакты дают равные доли
        if (best_index >= 0) {
            if (!narrow::collider_cast_local(scaled_caster, child_inv * scaled_start,
                                             child_inv.transform_point(scaled_end), blob.colliders[i], full, hit)) {
                continue;
            }
        }
        if (best_index < 0 || full < best) {
            best = full;
            best_index = i;
            best_contact.point_a = child.transform_point(hit.point_a);
            best_contact.point_b = child.transform_point(hit.point_b);
            best_contact.normal_a = child.transform_vector(hit.normal_a);
            best_contact.normal_b = child.transform_vector(hit.normal_b);
            best_contact.distance = hit.distance;
        }
    }

    if (best_index < 0) return false;
    fraction = best;
    contact = best_contact;
    contact.point_a = best_contact.point_a * s;
    contact.point_b = best_contact.point_b * s;
    contact.distance = best_contact.distance * s;
    sub_index_target = best_index;
    return true;
}

inline bool cast_single(const Collider& caster, const Pose3& caster_start, const Vec3& caster_end,
                        const Collider& target, const Pose3& target_pose,
                        float& fraction, ColliderCastResult& result) {
    narrow::ShapeDistance contact;
    int sub_index_target;
    if (!cast_local(caster, caster_start.in_frame_of(target_pose), target_pose.inverse_transform_point(caster_end), target,
                    fraction, contact, sub_index_target)) {
        return false;
    }
    result.hitpoint = target_pose.transform_point(contact.point_b);
    result.normal_on_caster = target_pose.transform_vector(contact.normal_a);
    result.normal_on_target = target_pose.transform_vector(contact.normal_b);
    result.distance = (caster_end - caster_start.lin).norm() * fraction;
    result.sub_collider_index_on_caster = 0;
    result.sub_collider_index_on_target = sub_index_target;
    return true;
}

} // namespace detail

/**
 * Sweep caster из caster_start в позицию caster_end (вращение постоянно)
 * против target в позе target_pose.
 */
inline bool collider_cast(const Collider& caster, const Pose3& caster_start, const Vec3& caster_end,
                          const Collider& target, const Pose3& target_pose, ColliderCastResult& result) {
    float fraction;
    if (caster.type() != ColliderType::Compound) {
        if (!detail::cast_single(caster, caster_start, caster_end, target, target_pose, fraction, result)) {
            result = ColliderCastResult{};
            return false;
        }
        return true;
    }

    const auto& compound = caster.as_compound();
    if (!compound.blob) {
        result = ColliderCastResult{};
        return false;
    }
    const auto& blob = *compound.blob;
    float s = compound.scale;
    Vec3 sweep = caster_end - caster_start.lin;
    float sweep_length = sweep.norm();

    float best = 1.0f;
    int best_index = -1;
    ColliderCastResult best_result;
    for (int i = 0; i < blob.size(); ++i) {
        const Pose3& child = blob.transforms[i];
        Pose3 child_start = caster_start * Pose3(child.ang, child.lin * s);
        Collider child_collider = colliders::scale_collider(blob.colliders[i], s);

        ColliderCastResult hit;
        if (!detail::cast_single(child_collider, child_start, child_start.lin + sweep * best,
                                 target, target_pose, fraction, hit)) {
            continue;
        }
        if (best_index >= 0) {
            if (!detail::cast_single(child_collider, child_start, child_start.lin + sweep,
                                     target, target_pose, fraction, hit)) {
                continue;
            }
        }
        float full = fraction;
        if (best_index < 0 || full < best) {
            best = full;
            best_index = i;
            best_result = hit;
            best_result.sub_collider_index_on_caster = i;
            best_result.distance = sweep_length * full;
        }
    }

    if (best_index < 0) {
        result = ColliderCastResult{};
        return false;
    }
    result = best_result;
    return true;
}

} // namespace queries
} // namespace probe
