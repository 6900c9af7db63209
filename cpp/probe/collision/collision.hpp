#pragma once

/**
 * @file collision.hpp
 * @brief Broad-phase and layer-wide queries.
 *
 * This module provides:
 * - SpatialIndex / CandidateVisitor, the contract of a broad-phase index
 * - BVH, a dynamic AABB tree
 * - CollisionLayer, posed colliders indexed by a BVH
 * - closest-hit and any-hit queries over any SpatialIndex
 */

#include "spatial_index.hpp"
#include "bvh.hpp"
#include "collision_layer.hpp"
#include "layer_query_processors.hpp"
#include "layer_queries.hpp"
