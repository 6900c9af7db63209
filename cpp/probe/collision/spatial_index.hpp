#pragma once

/**
 * @file spatial_index.hpp
 * @brief Contract between layer queries and a broad-phase spatial index.
 *
 * A spatial index reports every stored body whose AABB overlaps the query
 * bounds. Visitation order is unspecified.
 */

#include "../geom/aabb.hpp"
#include "../geom/pose3.hpp"
#include "../colliders/collider.hpp"
#include <cstdint>

namespace probe {
namespace collision {

/**
 * Кандидат broad-phase: коллайдер тела, его поза и сохранённый AABB.
 */
struct CandidateBody {
    const colliders::Collider& collider;
    Pose3 pose;
    AABB aabb;
    int body_index;
    uint64_t body;  // opaque handle supplied by the owner
};

class CandidateVisitor {
public:
    virtual ~CandidateVisitor() = default;
    virtual void visit(const CandidateBody& candidate) = 0;
};

class SpatialIndex {
public:
    virtual ~SpatialIndex() = default;

    // Calls visitor.visit for every body whose stored AABB overlaps bounds
    virtual void find_candidates(const AABB& bounds, CandidateVisitor& visitor) const = 0;
};

/**
 * Тело, давшее принятое попадание.
 */
struct LayerBodyInfo {
    uint64_t body = 0;
    int body_index = 0;
    AABB aabb;
};

} // namespace collision
} // namespace probe
