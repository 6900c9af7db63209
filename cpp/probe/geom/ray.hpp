#pragma once

#include "vec3.hpp"
#include "pose3.hpp"
#include "aabb.hpp"
#include <limits>

namespace probe {

/**
 * Луч-отрезок в 3D пространстве.
 * start - начало, end - конец. Параметр fraction ∈ [0, 1] вдоль [start, end].
 */
struct Ray {
    Vec3 start;
    Vec3 end;

    Ray() : start(0, 0, 0), end(0, 0, 1) {}
    Ray(const Vec3& start, const Vec3& end) : start(start), end(end) {}

    Vec3 displacement() const { return end - start; }

    /**
     * 1 / displacement по компонентам; для нулевых компонент - ±inf.
     */
    Vec3 reciprocal_displacement() const {
        Vec3 d = displacement();
        const float inf = std::numeric_limits<float>::infinity();
        return {
            d.x != 0.0f ? 1.0f / d.x : (std::signbit(d.x) ? -inf : inf),
            d.y != 0.0f ? 1.0f / d.y : (std::signbit(d.y) ? -inf : inf),
            d.z != 0.0f ? 1.0f / d.z : (std::signbit(d.z) ? -inf : inf)
        };
    }

    float length() const { return displacement().norm(); }

    /**
     * Точка на отрезке: P(f) = start + (end - start) * f
     */
    Vec3 point_at(float fraction) const {
        return Vec3::lerp(start, end, fraction);
    }

    /**
     * Перенос обоих концов луча преобразованием pose.
     */
    static Ray transformed(const Pose3& pose, const Ray& ray) {
        return {pose.transform_point(ray.start), pose.transform_point(ray.end)};
    }
};

/**
 * AABB, охватывающий оба конца луча.
 */
inline AABB aabb_from(const Ray& ray) {
    return AABB(Vec3::min(ray.start, ray.end), Vec3::max(ray.start, ray.end));
}

} // namespace probe
