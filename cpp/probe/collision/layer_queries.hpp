#pragma once

/**
 * @file layer_queries.hpp
 * @brief Queries against every body of a spatial index.
 *
 * Each query returns true on a hit and fills result and info. On a miss the
 * result and info are reset. The sub collider index is never negative on return.
 */

#include "spatial_index.hpp"
#include "layer_query_processors.hpp"
#include "../colliders/collider_aabb.hpp"
#include <algorithm>

namespace probe {
namespace collision {

namespace detail {

inline AABB point_bounds(const Vec3& point, float max_distance) {
    return AABB(point, point).expanded(std::max(max_distance, 0.0f));
}

inline bool finish_query(int& sub_collider_index) {
    bool hit = sub_collider_index >= 0;
    sub_collider_index = std::max(sub_collider_index, 0);
    return hit;
}

} // namespace detail

// ==================== Raycast ====================

inline bool raycast(const Ray& ray, const SpatialIndex& index, RaycastResult& result, LayerBodyInfo& info) {
    result = RaycastResult{};
    info = LayerBodyInfo{};
    RaycastClosestProcessor processor(ray, result, info);
    index.find_candidates(aabb_from(ray), processor);
    return detail::finish_query(result.sub_collider_index);
}

inline bool raycast_any(const Ray& ray, const SpatialIndex& index, RaycastResult& result, LayerBodyInfo& info) {
    result = RaycastResult{};
    info = LayerBodyInfo{};
    RaycastAnyProcessor processor(ray, result, info);
    index.find_candidates(aabb_from(ray), processor);
    return detail::finish_query(result.sub_collider_index);
}

inline bool raycast(const Vec3& start, const Vec3& end, const SpatialIndex& index,
                    RaycastResult& result, LayerBodyInfo& info) {
    return raycast(Ray(start, end), index, result, info);
}

inline bool raycast_any(const Vec3& start, const Vec3& end, const SpatialIndex& index,
                        RaycastResult& result, LayerBodyInfo& info) {
    return raycast_any(Ray(start, end), index, result, info);
}

// ==================== Point distance ====================

inline bool distance_between(const Vec3& point, const SpatialIndex& index, float max_distance,
                             PointDistanceResult& result, LayerBodyInfo& info) {
    result = PointDistanceResult{};
    info = LayerBodyInfo{};
    PointDistanceClosestProcessor processor(point, max_distance, result, info);
    index.find_candidates(detail::point_bounds(point, max_distance), processor);
    return detail::finish_query(result.sub_collider_index);
}

inline bool distance_between_any(const Vec3& point, const SpatialIndex& index, float max_distance,
                                 PointDistanceResult& result, LayerBodyInfo& info) {
    result = PointDistanceResult{};
    info = LayerBodyInfo{};
    PointDistanceAnyProcessor processor(point, max_distance, result, info);
    index.find_candidates(detail::point_bounds(point, max_distance), processor);
    return detail::finish_query(result.sub_collider_index);
}

// ==================== Collider distance ====================

inline bool distance_between(const Collider& collider, const Pose3& pose, const SpatialIndex& index,
                             float max_distance, ColliderDistanceResult& result, LayerBodyInfo& info) {
    result = ColliderDistanceResult{};
    info = LayerBodyInfo{};
    ColliderDistanceClosestProcessor processor(collider, pose, max_distance, result, info);
    AABB bounds = colliders::aabb_from(collider, pose).expanded(std::max(max_distance, 0.0f));
    index.find_candidates(bounds, processor);
    return detail::finish_query(result.sub_collider_index_b);
}

inline bool distance_between_any(const Collider& collider, const Pose3& pose, const SpatialIndex& index,
                                 float max_distance, ColliderDistanceResult& result, LayerBodyInfo& info) {
    result = ColliderDistanceResult{};
    info = LayerBodyInfo{};
    ColliderDistanceAnyProcessor processor(collider, pose, max_distance, result, info);
    AABB bounds = colliders::aabb_from(collider, pose).expanded(std::max(max_distance, 0.0f));
    index.find_candidates(bounds, processor);
    return detail::finish_query(result.sub_collider_index_b);
}

// ==================== Collider cast ====================

inline bool collider_cast(const Collider& caster, const Pose3& start, const Vec3& end, const SpatialIndex& index,
                          ColliderCastResult& result, LayerBodyInfo& info) {
    result = ColliderCastResult{};
    info = LayerBodyInfo{};
    ColliderCastClosestProcessor processor(caster, start, end, result, info);
    index.find_candidates(colliders::aabb_from_sweep(caster, start, end), processor);
    return detail::finish_query(result.sub_collider_index_on_target);
}

inline bool collider_cast_any(const Collider& caster, const Pose3& start, const Vec3& end,
                              const SpatialIndex& index, ColliderCastResult& result, LayerBodyInfo& info) {
    result = ColliderCastResult{};
    info = LayerBodyInfo{};
    ColliderCastAnyProcessor processor(caster, start, end, result, info);
    index.find_candidates(colliders::aabb_from_sweep(caster, start, end), processor);
    return detail::finish_query(result.sub_collider_index_on_target);
}

} // namespace collision
} // namespace probe
