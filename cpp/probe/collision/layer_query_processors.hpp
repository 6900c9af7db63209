#pragma once

/**
 * @file layer_query_processors.hpp
 * @brief Candidate visitors that run the narrow phase for layer queries.
 *
 * One processor per query kind and policy. A processor owns a private copy of
 * the query and writes into the caller's result and body info.
 *
 * Closest: accepts a hit if none was accepted yet or if it is strictly closer,
 * then narrows the query (ray end, distance cutoff, sweep end) to that hit.
 * The narrowed ray or sweep only culls: a later candidate is re-measured on the
 * full query, so equal hits compare equal and the first one visited stays.
 * Any: stops doing geometric work once a hit was accepted.
 *
 * The sub collider index of the result is -1 until a hit is accepted.
 */

#include "spatial_index.hpp"
#include "../queries/queries.hpp"
#include "../geom/ray.hpp"

namespace probe {
namespace collision {

using colliders::Collider;
using queries::RaycastResult;
using queries::PointDistanceResult;
using queries::ColliderDistanceResult;
using queries::ColliderCastResult;

inline LayerBodyInfo body_info(const CandidateBody& candidate) {
    LayerBodyInfo info;
    info.body = candidate.body;
    info.body_index = candidate.body_index;
    info.aabb = candidate.aabb;
    return info;
}

// ==================== Raycast ====================

class RaycastClosestProcessor : public CandidateVisitor {
public:
    RaycastClosestProcessor(const Ray& ray, RaycastResult& result, LayerBodyInfo& info)
        : full_ray_(ray), ray_(ray), result_(result), info_(info) {
        result_.sub_collider_index = -1;
    }

    void visit(const CandidateBody& candidate) override {
        RaycastResult hit;
        if (!queries::raycast(ray_, candidate.collider, candidate.pose, hit)) return;
        if (result_.sub_collider_index >= 0) {
            // Укороченный луч только отсекает. Расстояния сравниваются на полном луче
            if (!queries::raycast(full_ray_, candidate.collider, candidate.pose, hit)) return;
            if (!(hit.distance < result_.distance)) return;
        }

        result_ = hit;
        info_ = body_info(candidate);
        ray_.end = hit.position;
    }

private:
    Ray full_ray_;
    Ray ray_;
    RaycastResult& result_;
    LayerBodyInfo& info_;
};

class RaycastAnyProcessor : public CandidateVisitor {
public:
    RaycastAnyProcessor(const Ray& ray, RaycastResult& result, LayerBodyInfo& info)
        : ray_(ray), result_(result), info_(info) {
        result_.sub_collider_index = -1;
    }

    void visit(const CandidateBody& candidate) override {
        if (result_.sub_collider_index >= 0) return;

        RaycastResult hit;
        if (!queries::raycast(ray_, candidate.collider, candidate.pose, hit)) return;
        result_ = hit;
        info_ = body_info(candidate);
    }

private:
    Ray ray_;
    RaycastResult& result_;
    LayerBodyInfo& info_;
};

// ==================== Point distance ====================

class PointDistanceClosestProcessor : public CandidateVisitor {
public:
    PointDistanceClosestProcessor(const Vec3& point, float max_distance,
                                  PointDistanceResult& result, LayerBodyInfo& info)
        : point_(point), max_distance_(max_distance), result_(result), info_(info) {
        result_.sub_collider_index = -1;
    }

    void visit(const CandidateBody& candidate) override {
        PointDistanceResult hit;
        if (!queries::distance_between(point_, candidate.collider, candidate.pose, max_distance_, hit)) return;
        if (result_.sub_collider_index >= 0 && !(hit.distance < result_.distance)) return;

        result_ = hit;
        info_ = body_info(candidate);
        max_distance_ = hit.distance;
    }

private:
    Vec3 point_;
    float max_distance_;
    PointDistanceResult& result_;
    LayerBodyInfo& info_;
};

class PointDistanceAnyProcessor : public CandidateVisitor {
public:
    PointDistanceAnyProcessor(const Vec3& point, float max_distance,
                              PointDistanceResult& result, LayerBodyInfo& info)
        : point_(point), max_distance_(max_distance), result_(result), info_(info) {
        result_.sub_collider_index = -1;
    }

    void visit(const CandidateBody& candidate) override {
        if (result_.sub_collider_index >= 0) return;

        PointDistanceResult hit;
        if (!queries::distance_between(point_, candidate.collider, candidate.pose, max_distance_, hit)) return;
        result_ = hit;
        info_ = body_info(candidate);
    }

private:
    Vec3 point_;
    float max_distance_;
    PointDistanceResult& result_;
    LayerBodyInfo& info_;
};

// ==================== Collider distance ====================

class ColliderDistanceClosestProcessor : public CandidateVisitor {
public:
    ColliderDistanceClosestProcessor(const Collider& collider, const Pose3& pose, float max_distance,
                                     ColliderDistanceResult& result, LayerBodyInfo& info)
        : collider_(collider), pose_(pose), max_distance_(max_distance), result_(result), info_(info) {
        result_.sub_collider_index_b = -1;
    }

    void visit(const CandidateBody& candidate) override {
        ColliderDistanceResult hit;
        if (!queries::distance_between(collider_, pose_, candidate.collider, candidate.pose,
                                       max_distance_, hit)) {
            return;
        }
        if (result_.sub_collider_index_b >= 0 && !(hit.distance < result_.distance)) return;

        result_ = hit;
        info_ = body_info(candidate);
        max_distance_ = hit.distance;
    }

private:
    const Collider& collider_;
    Pose3 pose_;
    float max_distance_;
    ColliderDistanceResult& result_;
    LayerBodyInfo& info_;
};

class ColliderDistanceAnyProcessor : public CandidateVisitor {
public:
    ColliderDistanceAnyProcessor(const Collider& collider, const Pose3& pose, float max_distance,
                                 ColliderDistanceResult& result, LayerBodyInfo& info)
        : collider_(collider), pose_(pose), max_distance_(max_distance), result_(result), info_(info) {
        result_.sub_collider_index_b = -1;
    }

    void visit(const CandidateBody& candidate) override {
        if (result_.sub_collider_index_b >= 0) return;

        ColliderDistanceResult hit;
        if (!queries::distance_between(collider_, pose_, candidate.collider, candidate.pose,
                                       max_distance_, hit)) {
            return;
        }
        result_ = hit;
        info_ = body_info(candidate);
    }

private:
    const Collider& collider_;
    Pose3 pose_;
    float max_distance_;
    ColliderDistanceResult& result_;
    LayerBodyInfo& info_;
};

// ==================== Collider cast ====================

class ColliderCastClosestProcessor : public CandidateVisitor {
public:
    ColliderCastClosestProcessor(const Collider& caster, const Pose3& start, const Vec3& end,
                                 ColliderCastResult& result, LayerBodyInfo& info)
        : caster_(caster), start_(start), full_end_(end), end_(end), result_(result), info_(info) {
        result_.sub_collider_index_on_target = -1;
        Vec3 sweep = end - start.lin;
        float length = sweep.norm();
        direction_ = length > 0.0f ? sweep / length : Vec3::zero();
    }

    void visit(const CandidateBody& candidate) override {
        ColliderCastResult hit;
        if (!queries::collider_cast(caster_, start_, end_, candidate.collider, candidate.pose, hit)) return;
        if (result_.sub_collider_index_on_target >= 0) {
            if (!queries::collider_cast(caster_, start_, full_end_, candidate.collider, candidate.pose, hit)) return;
            if (!(hit.distance < result_.distance)) return;
        }

        result_ = hit;
        info_ = body_info(candidate);
        end_ = start_.lin + direction_ * hit.distance;
    }

private:
    const Collider& caster_;
    Pose3 start_;
    Vec3 full_end_;
    Vec3 end_;
    Vec3 direction_;
    ColliderCastResult& result_;
    LayerBodyInfo& info_;
};

class ColliderCastAnyProcessor : public CandidateVisitor {
public:
    ColliderCastAnyProcessor(const Collider& caster, const Pose3& start, const Vec3& end,
                             ColliderCastResult& result, LayerBodyInfo& info)
        : caster_(caster), start_(start), end_(end), result_(result), info_(info) {
        result_.sub_collider_index_on_target = -1;
    }

    void visit(const CandidateBody& candidate) override {
        if (result_.sub_collider_index_on_target >= 0) return;

        ColliderCastResult hit;
        if (!queries::collider_cast(caster_, start_, end_, candidate.collider, candidate.pose, hit)) return;
        result_ = hit;
        info_ = body_info(candidate);
    }

private:
    const Collider& caster_;
    Pose3 start_;
    Vec3 end_;
    ColliderCastResult& result_;
    LayerBodyInfo& info_;
};

} // namespace collision
} // namespace probe
