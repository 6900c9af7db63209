#pragma once

// Convenience header for all geom types
#include "vec3.hpp"
#include "quat.hpp"
#include "pose3.hpp"
#include "aabb.hpp"
#include "ray.hpp"
