#pragma once

// Convenience header for single-collider queries
#include "query_results.hpp"
#include "raycast.hpp"
#include "point_distance.hpp"
#include "collider_distance.hpp"
#include "collider_cast.hpp"
