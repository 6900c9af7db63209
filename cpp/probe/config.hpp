#pragma once

/**
 * @file config.hpp
 * @brief Tuning constants shared by the narrow-phase and broad-phase code.
 */

#include <cstdint>

namespace probe {

/// Lengths and squared lengths below this are treated as zero
constexpr float GEOM_EPSILON = 1e-6f;

// ==================== GJK / EPA ====================

constexpr int GJK_MAX_ITERATIONS = 64;

/// Relative convergence threshold: v·v - v·w <= GJK_RELATIVE_TOLERANCE * v·v
constexpr float GJK_RELATIVE_TOLERANCE = 1e-5f;

/// Squared distance at which GJK reports the cores as intersecting
constexpr float GJK_INTERSECTION_TOLERANCE = 1e-10f;

/// Tetrahedron with |AB·(AC×AD)| <= tol * edge^3 is flat, never contains the origin
constexpr float GJK_FLAT_TOLERANCE = 1e-5f;

constexpr int EPA_MAX_ITERATIONS = 48;
constexpr float EPA_TOLERANCE = 1e-4f;

/// Fixed capacity of the EPA polytope, keeps the query path allocation free
constexpr int EPA_MAX_POINTS = 64;
constexpr int EPA_MAX_FACES = 128;
constexpr int EPA_MAX_HORIZON = 64;

// ==================== Collider cast ====================

/// Maximum steps of conservative advancement
constexpr int CAST_MAX_ITERATIONS = 32;

/// Separation at which a sweeping collider is considered in contact
constexpr float CAST_CONTACT_TOLERANCE = 1e-4f;

// ==================== BVH ====================

/// Margin added to AABBs to reduce updates on small movements
constexpr float BVH_AABB_MARGIN = 0.1f;

/// Index representing null/invalid node
constexpr int32_t BVH_NULL_NODE = -1;

/// Traversal stack of a query, deeper subtrees continue recursively
constexpr int BVH_QUERY_STACK_SIZE = 64;

} // namespace probe
