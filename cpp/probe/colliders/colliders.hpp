#pragma once

/**
 * @file colliders.hpp
 * @brief Convenience header для всех коллайдеров.
 */

#include "sphere_collider.hpp"
#include "capsule_collider.hpp"
#include "box_collider.hpp"
#include "triangle_collider.hpp"
#include "convex_collider.hpp"
#include "compound_collider.hpp"
#include "collider.hpp"
#include "compound_collider_blob.hpp"
#include "collider_aabb.hpp"
