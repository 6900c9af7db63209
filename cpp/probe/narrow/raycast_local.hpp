#pragma once

// Raycast примитивов в их локальном пространстве.
//
// fraction - параметр точки входа на [start, end], normal - внешняя нормаль
// поверхности в точке входа. Луч, начинающийся внутри тела (сфера, капсула,
// бокс, выпуклая оболочка), попадает в fraction = 0 с нормалью против луча.
// Треугольник двусторонний: нормаль всегда смотрит навстречу лучу.

#include "../geom/ray.hpp"
#include "../colliders/sphere_collider.hpp"
#include "../colliders/capsule_collider.hpp"
#include "../colliders/box_collider.hpp"
#include "../colliders/triangle_collider.hpp"
#include "../colliders/convex_collider.hpp"
#include "../colliders/collider.hpp"
#include "../config.hpp"
#include "closest_points.hpp"
#include <cmath>
#include <limits>
#include <utility>

namespace probe {
namespace narrow {

using colliders::SphereCollider;
using colliders::CapsuleCollider;
using colliders::BoxCollider;
using colliders::TriangleCollider;
using colliders::ConvexCollider;

inline void inside_hit(const Ray& ray, float& fraction, Vec3& normal) {
    fraction = 0.0f;
    normal = -ray.displacement().normalized();
}

// Entry into a ball from a start point known to be outside of it
inline bool raycast_ball_from_outside(const Ray& ray, const Vec3& center, float radius,
                                      float& fraction, Vec3& normal) {
    Vec3 d = ray.displacement();
    Vec3 m = ray.start - center;
    float a = d.dot(d);
    if (a < GEOM_EPSILON * GEOM_EPSILON) return false;

    float b = m.dot(d);
    float c = m.dot(m) - radius * radius;
    if (b > 0.0f) return false;  // удаляется от центра

    float disc = b * b - a * c;
    if (disc < 0.0f) return false;

    float t = (-b - std::sqrt(disc)) / a;
    if (t < 0.0f) t = 0.0f;
    if (t > 1.0f) return false;

    fraction = t;
    normal = (ray.point_at(t) - center).normalized();
    return true;
}

inline bool raycast_sphere(const Ray& ray, const SphereCollider& sphere, float& fraction, Vec3& normal) {
    if ((ray.start - sphere.center).norm_squared() <= sphere.radius * sphere.radius) {
        inside_hit(ray, fraction, normal);
        return true;
    }
    return raycast_ball_from_outside(ray, sphere.center, sphere.radius, fraction, normal);
}

inline bool raycast_capsule(const Ray& ray, const CapsuleCollider& capsule, float& fraction, Vec3& normal) {
    const Vec3& a = capsule.point_a;
    const Vec3& b = capsule.point_b;
    float r = capsule.radius;

    Vec3 axis_point = closest_point_on_segment(a, b, ray.start);
    if ((ray.start - axis_point).norm_squared() <= r * r) {
        inside_hit(ray, fraction, normal);
        return true;
    }

    bool hit = false;
    float best = std::numeric_limits<float>::max();
    Vec3 best_normal;

    // Боковая поверхность цилиндра
    Vec3 ab = b - a;
    Vec3 d = ray.displacement();
    Vec3 m = ray.start - a;
    float dd = ab.dot(ab);
    if (dd > GEOM_EPSILON * GEOM_EPSILON) {
        float md = m.dot(ab);
        float nd = d.dot(ab);
        float nn = d.dot(d);
        float mn = m.dot(d);
        float qa = dd * nn - nd * nd;
        float qc = dd * (m.dot(m) - r * r) - md * md;
        float qb = dd * mn - nd * md;
        if (std::abs(qa) > GEOM_EPSILON * dd * nn) {
            float disc = qb * qb - qa * qc;
            if (disc >= 0.0f) {
                float t = (-qb - std::sqrt(disc)) / qa;
                float axial = md + t * nd;
                if (t >= 0.0f && t <= 1.0f && axial >= 0.0f && axial <= dd) {
                    Vec3 p = ray.point_at(t);
                    Vec3 on_axis = a + ab * (axial / dd);
                    hit = true;
                    best = t;
                    best_normal = (p - on_axis).normalized();
                }
            }
        }
    }

    // Полусферы на концах
    float t;
    Vec3 n;
    if (raycast_ball_from_outside(ray, a, r, t, n) && t < best) {
        hit = true;
        best = t;
        best_normal = n;
    }
    if (raycast_ball_from_outside(ray, b, r, t, n) && t < best) {
        hit = true;
        best = t;
        best_normal = n;
    }

    if (hit) {
        fraction = best;
        normal = best_normal;
    }
    return hit;
}

inline bool raycast_box(const Ray& ray, const BoxCollider& box, float& fraction, Vec3& normal) {
    Vec3 lo = box.min_point();
    Vec3 hi = box.max_point();
    const Vec3& s = ray.start;

    if (s.x >= lo.x && s.x <= hi.x && s.y >= lo.y && s.y <= hi.y && s.z >= lo.z && s.z <= hi.z) {
        inside_hit(ray, fraction, normal);
        return true;
    }

    Vec3 d = ray.displacement();
    Vec3 inv = ray.reciprocal_displacement();
    float t_enter = -std::numeric_limits<float>::max();
    float t_exit = std::numeric_limits<float>::max();
    int enter_axis = -1;

    for (int i = 0; i < 3; ++i) {
        if (std::abs(d[i]) < GEOM_EPSILON) {
            // Параллельно плитам оси i
            if (s[i] < lo[i] || s[i] > hi[i]) return false;
            continue;
        }
        float t1 = (lo[i] - s[i]) * inv[i];
        float t2 = (hi[i] - s[i]) * inv[i];
        if (t1 > t2) std::swap(t1, t2);
        if (t1 > t_enter) {
            t_enter = t1;
            enter_axis = i;
        }
        t_exit = std::min(t_exit, t2);
        if (t_enter > t_exit) return false;
    }

    if (enter_axis < 0 || t_enter < 0.0f || t_enter > 1.0f) return false;

    fraction = t_enter;
    normal = Vec3::zero();
    normal[enter_axis] = d[enter_axis] > 0.0f ? -1.0f : 1.0f;
    return true;
}

inline bool raycast_triangle(const Ray& ray, const TriangleCollider& tri, float& fraction, Vec3& normal) {
    Vec3 d = ray.displacement();
    Vec3 e1 = tri.point_b - tri.point_a;
    Vec3 e2 = tri.point_c - tri.point_a;

    Vec3 pvec = d.cross(e2);
    float det = e1.dot(pvec);
    if (std::abs(det) <= GEOM_EPSILON * e1.norm() * e2.norm() * d.norm()) return false;

    float inv_det = 1.0f / det;
    Vec3 tvec = ray.start - tri.point_a;
    float u = tvec.dot(pvec) * inv_det;
    if (u < 0.0f || u > 1.0f) return false;

    Vec3 qvec = tvec.cross(e1);
    float v = d.dot(qvec) * inv_det;
    if (v < 0.0f || u + v > 1.0f) return false;

    float t = e2.dot(qvec) * inv_det;
    if (t < 0.0f || t > 1.0f) return false;

    fraction = t;
    normal = tri.normal();
    if (normal.dot(d) > 0.0f) normal = -normal;
    return true;
}

/**
 * Отсечение луча плоскостями граней оболочки.
 */
inline bool raycast_convex(const Ray& ray, const ConvexCollider& convex, float& fraction, Vec3& normal) {
    int face_count = convex.face_count();
    if (face_count == 0) return false;

    Vec3 d = ray.displacement();
    float t_enter = 0.0f;
    float t_exit = 1.0f;
    int enter_face = -1;
    Vec3 enter_normal;
    bool inside = true;

    for (int i = 0; i < face_count; ++i) {
        Vec3 n;
        float plane_d;
        convex.face_plane(i, n, plane_d);

        float dist = n.dot(ray.start) - plane_d;
        float denom = n.dot(d);
        if (dist > 0.0f) inside = false;

        if (std::abs(denom) < GEOM_EPSILON) {
            if (dist > 0.0f) return false;
            continue;
        }

        float t = -dist / denom;
        if (denom < 0.0f) {
            if (t > t_enter || enter_face < 0) {
                if (t > t_enter) t_enter = t;
                enter_face = i;
                enter_normal = n;
            }
        } else {
            t_exit = std::min(t_exit, t);
        }
        if (t_enter > t_exit) return false;
    }

    if (inside) {
        inside_hit(ray, fraction, normal);
        return true;
    }
    if (enter_face < 0) return false;

    fraction = t_enter;
    normal = enter_normal;
    return true;
}

/**
 * Raycast не-составного коллайдера. Для Compound возвращает false:
 * составные разбираются в queries.
 */
inline bool raycast_primitive(const Ray& ray, const colliders::Collider& collider, float& fraction, Vec3& normal) {
    using colliders::ColliderType;
    switch (collider.type()) {
        case ColliderType::Sphere: return raycast_sphere(ray, collider.as_sphere(), fraction, normal);
        case ColliderType::Capsule: return raycast_capsule(ray, collider.as_capsule(), fraction, normal);
        case ColliderType::Box: return raycast_box(ray, collider.as_box(), fraction, normal);
        case ColliderType::Triangle: return raycast_triangle(ray, collider.as_triangle(), fraction, normal);
        case ColliderType::Convex: return raycast_convex(ray, collider.as_convex(), fraction, normal);
        case ColliderType::Compound: return false;
    }
    return false;
}

} // namespace narrow
} // namespace probe
