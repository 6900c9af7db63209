#pragma once

/**
 * @file collider_distance_local.hpp
 * @brief Distance between two non-compound colliders, in the frame of the second one.
 *
 * Sphere pairs reduce to point distance, capsule/capsule is a segment/segment test.
 * Everything else runs GJK on the shape cores with the radii subtracted,
 * and EPA when the cores intersect.
 */

#include "../colliders/collider.hpp"
#include "../config.hpp"
#include "closest_points.hpp"
#include "point_distance_local.hpp"
#include "support.hpp"
#include "gjk.hpp"
#include <cmath>

namespace probe {
namespace narrow {

struct ShapeDistance {
    Vec3 point_a;    // closest (or deepest) point on A
    Vec3 point_b;    // closest (or deepest) point on B
    Vec3 normal_a;   // outward normal of A at point_a, towards B
    Vec3 normal_b;   // outward normal of B at point_b, towards A
    float distance = 0.0f;  // negative = penetration depth
};

namespace detail {

inline bool sphere_distance(const colliders::SphereCollider& sphere, const Pose3& sphere_in_b,
                            const Collider& b, float max_distance, ShapeDistance& out) {
    Vec3 center = sphere_in_b.transform_point(sphere.center);
    Vec3 hitpoint, normal;
    float d;
    if (!point_distance_primitive(center, b, max_distance + sphere.radius, hitpoint, normal, d)) {
        return false;
    }
    out.point_b = hitpoint;
    out.normal_b = normal;
    out.normal_a = -normal;
    out.point_a = center - normal * sphere.radius;
    out.distance = d - sphere.radius;
    return true;
}

inline bool capsule_capsule_distance(const colliders::CapsuleCollider& ca, const Pose3& a_in_b,
                                     const colliders::CapsuleCollider& cb, float max_distance,
                                     ShapeDistance& out) {
    Vec3 a0 = a_in_b.transform_point(ca.point_a);
    Vec3 a1 = a_in_b.transform_point(ca.point_b);
    float s, t;
    closest_segment_segment(a0, a1, cb.point_a, cb.point_b, s, t);
    Vec3 pa = Vec3::lerp(a0, a1, s);
    Vec3 pb = Vec3::lerp(cb.point_a, cb.point_b, t);

    Vec3 delta = pb - pa;
    float len = delta.norm();
    float distance = len - ca.radius - cb.radius;
    if (distance > max_distance) return false;

    Vec3 n;
    if (len > GEOM_EPSILON) {
        n = delta / len;
    } else {
        // Оси пересекаются: нормаль перпендикулярно обеим осям
        Vec3 da = a1 - a0;
        Vec3 db = cb.point_b - cb.point_a;
        n = da.cross(db);
        if (n.norm_squared() < GEOM_EPSILON * GEOM_EPSILON) {
            n = da.cross(Vec3::unit_x());
            if (n.norm_squared() < GEOM_EPSILON * GEOM_EPSILON) n = da.cross(Vec3::unit_y());
        }
        n = n.normalized();
        Vec3 centers = (cb.point_a + cb.point_b) * 0.5f - (a0 + a1) * 0.5f;
        if (n.dot(centers) < 0.0f) n = -n;
    }

    out.point_a = pa + n * ca.radius;
    out.point_b = pb - n * cb.radius;
    out.normal_a = n;
    out.normal_b = -n;
    out.distance = distance;
    return true;
}

inline bool core_distance(const Collider& a, const Pose3& a_in_b, const Collider& b,
                          float max_distance, ShapeDistance& out) {
    SupportShape sa = make_support_shape(a, a_in_b);
    SupportShape sb = make_support_shape(b, Pose3::identity());

    Vec3 core_a, core_b, n;
    float core_distance;

    GjkResult g = gjk(sa, sb);
    if (!g.intersecting) {
        core_a = g.closest_on_a;
        core_b = g.closest_on_b;
        Vec3 delta = core_b - core_a;
        n = g.distance > GEOM_EPSILON ? delta / g.distance : (sb.center() - sa.center()).normalized();
        core_distance = g.distance;
    } else {
        EpaResult e = epa(sa, sb);
        if (e.valid) {
            n = e.normal;
            core_a = e.point_on_a;
            core_b = e.point_on_b;
            core_distance = -e.depth;
        } else {
            // Плоский политоп: глубина по оси между центрами
            n = (sb.center() - sa.center()).normalized();
            core_a = sa.support(n);
            core_b = sb.support(-n);
            core_distance = -std::max((core_a - core_b).dot(n), 0.0f);
        }
    }

    float distance = core_distance - sa.radius - sb.radius;
    if (distance > max_distance) return false;

    out.point_a = core_a + n * sa.radius;
    out.point_b = core_b - n * sb.radius;
    out.normal_a = n;
    out.normal_b = -n;
    out.distance = distance;
    return true;
}

} // namespace detail

/**
 * Расстояние между не-составными коллайдерами a и b.
 * a_in_b - поза a в системе b; результат в системе b.
 * false, если расстояние больше max_distance.
 */
inline bool distance_between_local(const Collider& a, const Pose3& a_in_b, const Collider& b,
                                   float max_distance, ShapeDistance& out) {
    if (a.type() == ColliderType::Compound || b.type() == ColliderType::Compound) {
        return false;
    }

    if (a.type() == ColliderType::Sphere) {
        return detail::sphere_distance(a.as_sphere(), a_in_b, b, max_distance, out);
    }

    if (b.type() == ColliderType::Sphere) {
        // Считаем в системе a и переносим обратно в систему b
        ShapeDistance swapped;
        if (!detail::sphere_distance(b.as_sphere(), a_in_b.inverse(), a, max_distance, swapped)) {
            return false;
        }
        out.point_a = a_in_b.transform_point(swapped.point_b);
        out.point_b = a_in_b.transform_point(swapped.point_a);
        out.normal_a = a_in_b.transform_vector(swapped.normal_b);
        out.normal_b = a_in_b.transform_vector(swapped.normal_a);
        out.distance = swapped.distance;
        return true;
    }

    if (a.type() == ColliderType::Capsule && b.type() == ColliderType::Capsule) {
        return detail::capsule_capsule_distance(a.as_capsule(), a_in_b, b.as_capsule(), max_distance, out);
    }

    return detail::core_distance(a, a_in_b, b, max_distance, out);
}

} // namespace narrow
} // namespace probe
