#pragma once

/**
 * @file query_results.hpp
 * @brief Result records of collision queries, all in world space.
 *
 * sub_collider_index identifies the child of a compound collider that produced
 * the hit; it is 0 for non-compound colliders.
 */

#include "../geom/vec3.hpp"

namespace probe {
namespace queries {

struct RaycastResult {
    Vec3 position;
    float distance = 0.0f;
    Vec3 normal;
    int sub_collider_index = 0;
};

struct PointDistanceResult {
    Vec3 hitpoint;
    float distance = 0.0f;  // negative inside the collider
    Vec3 normal;
    int sub_collider_index = 0;
};

struct ColliderDistanceResult {
    Vec3 hitpoint_a;
    Vec3 hitpoint_b;
    Vec3 normal_a;
    Vec3 normal_b;
    float distance = 0.0f;  // negative = penetration
    int sub_collider_index_a = 0;
    int sub_collider_index_b = 0;
};

struct ColliderCastResult {
    Vec3 hitpoint;            // on the target
    Vec3 normal_on_caster;
    Vec3 normal_on_target;
    float distance = 0.0f;    // distance travelled by the caster
    int sub_collider_index_on_caster = 0;
    int sub_collider_index_on_target = 0;
};

} // namespace queries
} // namespace probe
