#pragma once

// Ближайшие точки для отрезков и треугольников.

#include "../geom/vec3.hpp"
#include "../config.hpp"
#include <algorithm>
#include <cmath>

namespace probe {
namespace narrow {

// Parameter t in [0,1] of the point of [a, b] closest to p
inline float closest_t_on_segment(const Vec3& a, const Vec3& b, const Vec3& p) {
    Vec3 ab = b - a;
    float denom = ab.dot(ab);
    if (denom < GEOM_EPSILON * GEOM_EPSILON) return 0.0f;
    float t = (p - a).dot(ab) / denom;
    return std::clamp(t, 0.0f, 1.0f);
}

inline Vec3 closest_point_on_segment(const Vec3& a, const Vec3& b, const Vec3& p) {
    return Vec3::lerp(a, b, closest_t_on_segment(a, b, p));
}

/**
 * Ближайшие точки двух отрезков [p1, q1] и [p2, q2].
 * s, t - параметры на первом и втором отрезках.
 */
inline void closest_segment_segment(const Vec3& p1, const Vec3& q1,
                                    const Vec3& p2, const Vec3& q2,
                                    float& s, float& t) {
    Vec3 d1 = q1 - p1;
    Vec3 d2 = q2 - p2;
    Vec3 r = p1 - p2;
    float a = d1.dot(d1);
    float e = d2.dot(d2);
    float f = d2.dot(r);
    const float eps = GEOM_EPSILON * GEOM_EPSILON;

    if (a <= eps && e <= eps) {
        s = t = 0.0f;
        return;
    }
    if (a <= eps) {
        s = 0.0f;
        t = std::clamp(f / e, 0.0f, 1.0f);
        return;
    }

    float c = d1.dot(r);
    if (e <= eps) {
        t = 0.0f;
        s = std::clamp(-c / a, 0.0f, 1.0f);
        return;
    }

    float b = d1.dot(d2);
    float denom = a * e - b * b;

    // Параллельные отрезки: s = 0
    if (denom > eps * a * e) {
        s = std::clamp((b * f - c * e) / denom, 0.0f, 1.0f);
    } else {
        s = 0.0f;
    }

    t = (b * s + f) / e;
    if (t < 0.0f) {
        t = 0.0f;
        s = std::clamp(-c / a, 0.0f, 1.0f);
    } else if (t > 1.0f) {
        t = 1.0f;
        s = std::clamp((b - c) / a, 0.0f, 1.0f);
    }
}

/// Feature of a triangle the closest point lies on
enum class TriangleFeature {
    Face,
    Edge,
    Vertex
};

/**
 * Ближайшая к p точка треугольника abc (Voronoi regions).
 */
inline Vec3 closest_point_on_triangle(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c,
                                      TriangleFeature& feature) {
    Vec3 ab = b - a;
    Vec3 ac = c - a;
    Vec3 ap = p - a;
    float d1 = ab.dot(ap);
    float d2 = ac.dot(ap);
    if (d1 <= 0.0f && d2 <= 0.0f) {
        feature = TriangleFeature::Vertex;
        return a;
    }

    Vec3 bp = p - b;
    float d3 = ab.dot(bp);
    float d4 = ac.dot(bp);
    if (d3 >= 0.0f && d4 <= d3) {
        feature = TriangleFeature::Vertex;
        return b;
    }

    float vc = d1 * d4 - d3 * d2;
    if (vc <= 0.0f && d1 >= 0.0f && d3 <= 0.0f) {
        feature = TriangleFeature::Edge;
        float v = d1 / (d1 - d3);
        return a + ab * v;
    }

    Vec3 cp = p - c;
    float d5 = ab.dot(cp);
    float d6 = ac.dot(cp);
    if (d6 >= 0.0f && d5 <= d6) {
        feature = TriangleFeature::Vertex;
        return c;
    }

    float vb = d5 * d2 - d1 * d6;
    if (vb <= 0.0f && d2 >= 0.0f && d6 <= 0.0f) {
        feature = TriangleFeature::Edge;
        float w = d2 / (d2 - d6);
        return a + ac * w;
    }

    float va = d3 * d6 - d5 * d4;
    if (va <= 0.0f && (d4 - d3) >= 0.0f && (d5 - d6) >= 0.0f) {
        feature = TriangleFeature::Edge;
        float w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
        return b + (c - b) * w;
    }

    float denom = va + vb + vc;
    if (std::abs(denom) < GEOM_EPSILON * GEOM_EPSILON) {
        // Вырожденный треугольник: ближайшая из трёх рёбер
        feature = TriangleFeature::Edge;
        Vec3 best = closest_point_on_segment(a, b, p);
        Vec3 q = closest_point_on_segment(b, c, p);
        if ((q - p).norm_squared() < (best - p).norm_squared()) best = q;
        q = closest_point_on_segment(c, a, p);
        if ((q - p).norm_squared() < (best - p).norm_squared()) best = q;
        return best;
    }

    feature = TriangleFeature::Face;
    float v = vb / denom;
    float w = vc / denom;
    return a + ab * v + ac * w;
}

inline Vec3 closest_point_on_triangle(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c) {
    TriangleFeature feature;
    return closest_point_on_triangle(p, a, b, c, feature);
}

} // namespace narrow
} // namespace probe
