#pragma once

/**
 * @file collider.hpp
 * @brief Collider - значение, содержащее ровно один вариант коллайдера.
 *
 * Набор вариантов закрыт: Sphere, Capsule, Box, Triangle, Convex, Compound.
 * Диспетчеризация - switch по type() и std::get.
 */

#include "sphere_collider.hpp"
#include "capsule_collider.hpp"
#include "box_collider.hpp"
#include "triangle_collider.hpp"
#include "convex_collider.hpp"
#include "compound_collider.hpp"
#include <variant>

namespace probe {
namespace colliders {

// Порядок совпадает с порядком альтернатив в Collider::Variant
enum class ColliderType {
    Sphere,
    Capsule,
    Box,
    Triangle,
    Convex,
    Compound
};

inline const char* collider_type_name(ColliderType type) {
    switch (type) {
        case ColliderType::Sphere: return "Sphere";
        case ColliderType::Capsule: return "Capsule";
        case ColliderType::Box: return "Box";
        case ColliderType::Triangle: return "Triangle";
        case ColliderType::Convex: return "Convex";
        case ColliderType::Compound: return "Compound";
    }
    return "Unknown";
}

class Collider {
public:
    using Variant = std::variant<SphereCollider, CapsuleCollider, BoxCollider,
                                 TriangleCollider, ConvexCollider, CompoundCollider>;

    Collider() : value_(SphereCollider()) {}
    Collider(const SphereCollider& c) : value_(c) {}
    Collider(const CapsuleCollider& c) : value_(c) {}
    Collider(const BoxCollider& c) : value_(c) {}
    Collider(const TriangleCollider& c) : value_(c) {}
    Collider(const ConvexCollider& c) : value_(c) {}
    Collider(const CompoundCollider& c) : value_(c) {}

    ColliderType type() const { return static_cast<ColliderType>(value_.index()); }

    const SphereCollider& as_sphere() const { return std::get<SphereCollider>(value_); }
    const CapsuleCollider& as_capsule() const { return std::get<CapsuleCollider>(value_); }
    const BoxCollider& as_box() const { return std::get<BoxCollider>(value_); }
    const TriangleCollider& as_triangle() const { return std::get<TriangleCollider>(value_); }
    const ConvexCollider& as_convex() const { return std::get<ConvexCollider>(value_); }
    const CompoundCollider& as_compound() const { return std::get<CompoundCollider>(value_); }

    const Variant& value() const { return value_; }

private:
    Variant value_;
};

} // namespace colliders
} // namespace probe
