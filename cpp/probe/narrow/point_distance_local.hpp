#pragma once

// Расстояние от точки до примитива в его локальном пространстве.
//
// Попадание, если знаковое расстояние <= max_distance. Внутри тела расстояние
// отрицательно, hitpoint лежит на ближайшем элементе поверхности, normal -
// внешняя нормаль этого элемента.

#include "../colliders/sphere_collider.hpp"
#include "../colliders/capsule_collider.hpp"
#include "../colliders/box_collider.hpp"
#include "../colliders/triangle_collider.hpp"
#include "../colliders/convex_collider.hpp"
#include "../colliders/collider.hpp"
#include "../config.hpp"
#include "closest_points.hpp"
#include "gjk.hpp"
#include <cmath>
#include <limits>

namespace probe {
namespace narrow {

using colliders::SphereCollider;
using colliders::CapsuleCollider;
using colliders::BoxCollider;
using colliders::TriangleCollider;
using colliders::ConvexCollider;

// Ball around center; also serves capsules through the closest axis point
inline bool point_distance_ball(const Vec3& point, const Vec3& center, float radius, float max_distance,
                                Vec3& hitpoint, Vec3& normal, float& distance) {
    Vec3 delta = point - center;
    float len = delta.norm();
    float d = len - radius;
    if (d > max_distance) return false;

    normal = len > GEOM_EPSILON ? delta / len : Vec3::unit_z();
    hitpoint = center + normal * radius;
    distance = d;
    return true;
}

inline bool point_distance_sphere(const Vec3& point, const SphereCollider& sphere, float max_distance,
                                  Vec3& hitpoint, Vec3& normal, float& distance) {
    return point_distance_ball(point, sphere.center, sphere.radius, max_distance, hitpoint, normal, distance);
}

inline bool point_distance_capsule(const Vec3& point, const CapsuleCollider& capsule, float max_distance,
                                   Vec3& hitpoint, Vec3& normal, float& distance) {
    Vec3 axis_point = closest_point_on_segment(capsule.point_a, capsule.point_b, point);
    if (!point_distance_ball(point, axis_point, capsule.radius, max_distance, hitpoint, normal, distance)) {
        return false;
    }
    // Точка на оси: нормаль перпендикулярно оси
    if ((point - axis_point).norm_squared() <= GEOM_EPSILON * GEOM_EPSILON) {
        Vec3 axis = capsule.point_b - capsule.point_a;
        Vec3 perp = axis.cross(Vec3::unit_x());
        if (perp.norm_squared() < GEOM_EPSILON) perp = axis.cross(Vec3::unit_y());
        normal = axis.norm_squared() > GEOM_EPSILON * GEOM_EPSILON ? perp.normalized() : Vec3::unit_z();
        hitpoint = axis_point + normal * capsule.radius;
    }
    return true;
}

inline bool point_distance_box(const Vec3& point, const BoxCollider& box, float max_distance,
                               Vec3& hitpoint, Vec3& normal, float& distance) {
    Vec3 local = point - box.center;
    const Vec3& h = box.half_size;

    bool inside = std::abs(local.x) <= h.x && std::abs(local.y) <= h.y && std::abs(local.z) <= h.z;
    if (!inside) {
        Vec3 clamped(
            std::clamp(local.x, -h.x, h.x),
            std::clamp(local.y, -h.y, h.y),
            std::clamp(local.z, -h.z, h.z));
        Vec3 delta = local - clamped;
        float len = delta.norm();
        if (len > max_distance) return false;
        hitpoint = box.center + clamped;
        normal = delta.normalized();
        distance = len;
        return true;
    }

    // Внутри: ближайшая грань
    int axis = 0;
    float depth = h.x - std::abs(local.x);
    for (int i = 1; i < 3; ++i) {
        float d = h[i] - std::abs(local[i]);
        if (d < depth) {
            depth = d;
            axis = i;
        }
    }
    if (-depth > max_distance) return false;

    float sign = local[axis] >= 0.0f ? 1.0f : -1.0f;
    normal = Vec3::zero();
    normal[axis] = sign;
    Vec3 on_face = local;
    on_face[axis] = sign * h[axis];
    hitpoint = box.center + on_face;
    distance = -depth;
    return true;
}

/**
 * Треугольник без толщины: расстояние неотрицательно.
 */
inline bool point_distance_triangle(const Vec3& point, const TriangleCollider& tri, float max_distance,
                                    Vec3& hitpoint, Vec3& normal, float& distance) {
    TriangleFeature feature;
    Vec3 closest = closest_point_on_triangle(point, tri.point_a, tri.point_b, tri.point_c, feature);
    Vec3 delta = point - closest;
    float len = delta.norm();
    if (len > max_distance) return false;

    Vec3 face_normal = tri.normal();
    if (feature == TriangleFeature::Face || len <= GEOM_EPSILON) {
        if (face_normal.norm_squared() == 0.0f) {
            normal = len > GEOM_EPSILON ? delta / len : Vec3::unit_z();
        } else {
            normal = face_normal.dot(delta) < 0.0f ? -face_normal : face_normal;
        }
    } else {
        normal = delta / len;
    }
    hitpoint = closest;
    distance = len;
    return true;
}

inline bool point_distance_convex(const Vec3& point, const ConvexCollider& convex, float max_distance,
                                  Vec3& hitpoint, Vec3& normal, float& distance) {
    int face_count = convex.face_count();
    if (face_count == 0) return false;

    // Наибольшее превышение над плоскостями граней
    float max_sep = -std::numeric_limits<float>::max();
    Vec3 sep_normal;
    for (int i = 0; i < face_count; ++i) {
        Vec3 n;
        float plane_d;
        convex.face_plane(i, n, plane_d);
        float sep = n.dot(point) - plane_d;
        if (sep > max_sep) {
            max_sep = sep;
            sep_normal = n;
        }
    }

    if (max_sep <= 0.0f) {
        if (max_sep > max_distance) return false;
        normal = sep_normal;
        hitpoint = point - sep_normal * max_sep;
        distance = max_sep;
        return true;
    }

    // Снаружи: точное расстояние через GJK точка-оболочка
    if (max_sep > max_distance) return false;
    GjkResult gjk_result = gjk(make_point_shape(point), make_hull_shape(convex));
    Vec3 delta = point - gjk_result.closest_on_b;
    float len = delta.norm();
    if (len > max_distance) return false;

    hitpoint = gjk_result.closest_on_b;
    normal = len > GEOM_EPSILON ? delta / len : sep_normal;
    distance = len;
    return true;
}

inline bool point_distance_primitive(const Vec3& point, const colliders::Collider& collider, float max_distance,
                                    Vec3& hitpoint, Vec3& normal, float& distance) {
    using colliders::ColliderType;
    switch (collider.type()) {
        case ColliderType::Sphere:
            return point_distance_sphere(point, collider.as_sphere(), max_distance, hitpoint, normal, distance);
        case ColliderType::Capsule:
            return point_distance_capsule(point, collider.as_capsule(), max_distance, hitpoint, normal, distance);
        case ColliderType::Box:
            return point_distance_box(point, collider.as_box(), max_distance, hitpoint, normal, distance);
        case ColliderType::Triangle:
            return point_distance_triangle(point, collider.as_triangle(), max_distance, hitpoint, normal, distance);
        case ColliderType::Convex:
            return point_distance_convex(point, collider.as_convex(), max_distance, hitpoint, normal, distance);
        case ColliderType::Compound:
            return false;
    }
    return false;
}

} // namespace narrow
} // namespace probe
