#pragma once

// Support mapping выпуклого ядра коллайдера.
// Сфера сводится к точке, капсула к отрезку; радиус хранится отдельно
// и вычитается из расстояния между ядрами.

#include "../geom/pose3.hpp"
#include "../colliders/collider.hpp"
#include <limits>

namespace probe {
namespace narrow {

using colliders::Collider;
using colliders::ColliderType;

struct SupportShape {
    enum class Kind {
        Point,
        Segment,
        Box,
        Triangle,
        Hull
    };

    Kind kind = Kind::Point;
    Vec3 a;  // Point, Segment, Triangle: вершина; Box: центр
    Vec3 b;  // Segment, Triangle: вершина; Box: половинные размеры
    Vec3 c;  // Triangle: вершина
    const colliders::ConvexCollider* hull = nullptr;
    Pose3 pose;           // local -> frame of the query
    float radius = 0.0f;

    // Support point of the core in the query frame
    Vec3 support(const Vec3& direction) const {
        Vec3 d = pose.inverse_transform_vector(direction);
        return pose.transform_point(local_support(d));
    }

    Vec3 center() const {
        switch (kind) {
            case Kind::Point: return pose.transform_point(a);
            case Kind::Segment: return pose.transform_point((a + b) * 0.5f);
            case Kind::Box: return pose.transform_point(a);
            case Kind::Triangle: return pose.transform_point((a + b + c) / 3.0f);
            case Kind::Hull: {
                if (!hull || !hull->blob) return pose.lin;
                return pose.transform_point(hull->local_aabb().center());
            }
        }
        return pose.lin;
    }

private:
    Vec3 local_support(const Vec3& d) const {
        switch (kind) {
            case Kind::Point:
                return a;
            case Kind::Segment:
                return d.dot(b - a) > 0.0f ? b : a;
            case Kind::Box:
                return {
                    a.x + (d.x >= 0.0f ? b.x : -b.x),
                    a.y + (d.y >= 0.0f ? b.y : -b.y),
                    a.z + (d.z >= 0.0f ? b.z : -b.z)
                };
            case Kind::Triangle: {
                float da = d.dot(a);
                float db = d.dot(b);
                float dc = d.dot(c);
                if (da >= db && da >= dc) return a;
                return db >= dc ? b : c;
            }
            case Kind::Hull:
                return hull ? hull->support(d) : Vec3();
        }
        return a;
    }
};

/**
 * Ядро не-составного коллайдера, размещённого позой pose.
 * collider должен жить дольше результата (Hull хранит указатель).
 */
inline SupportShape make_support_shape(const Collider& collider, const Pose3& pose) {
    SupportShape shape;
    shape.pose = pose;
    switch (collider.type()) {
        case ColliderType::Sphere: {
            const auto& s = collider.as_sphere();
            shape.kind = SupportShape::Kind::Point;
            shape.a = s.center;
            shape.radius = s.radius;
            break;
        }
        case ColliderType::Capsule: {
            const auto& cap = collider.as_capsule();
            shape.kind = SupportShape::Kind::Segment;
            shape.a = cap.point_a;
            shape.b = cap.point_b;
            shape.radius = cap.radius;
            break;
        }
        case ColliderType::Box: {
            const auto& box = collider.as_box();
            shape.kind = SupportShape::Kind::Box;
            shape.a = box.center;
            shape.b = box.half_size;
            break;
        }
        case ColliderType::Triangle: {
            const auto& tri = collider.as_triangle();
            shape.kind = SupportShape::Kind::Triangle;
            shape.a = tri.point_a;
            shape.b = tri.point_b;
            shape.c = tri.point_c;
            break;
        }
        case ColliderType::Convex: {
            shape.kind = SupportShape::Kind::Hull;
            shape.hull = &collider.as_convex();
            break;
        }
        case ColliderType::Compound:
            // Составные коллайдеры разбираются на детей до narrow-phase
            shape.kind = SupportShape::Kind::Point;
            shape.a = Vec3::zero();
            break;
    }
    return shape;
}

/**
 * Ядро-точка (для расстояния от точки до оболочки).
 */
inline SupportShape make_point_shape(const Vec3& point) {
    SupportShape shape;
    shape.kind = SupportShape::Kind::Point;
    shape.a = point;
    return shape;
}

/**
 * Выпуклая оболочка без позы.
 */
inline SupportShape make_hull_shape(const colliders::ConvexCollider& convex) {
    SupportShape shape;
    shape.kind = SupportShape::Kind::Hull;
    shape.hull = &convex;
    return shape;
}

} // namespace narrow
} // namespace probe
