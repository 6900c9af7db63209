#pragma once

/**
 * @file collision_layer.hpp
 * @brief Set of posed colliders indexed by a BVH.
 *
 * Usage:
 *   CollisionLayer layer;
 *   int wall = layer.add(BoxCollider(...), Pose3::translation(0, 0, 5), wall_entity);
 *
 *   // After moving objects:
 *   layer.update(wall, new_pose);
 *
 *   RaycastResult hit;
 *   LayerBodyInfo info;
 *   if (raycast(ray, layer, hit, info)) { ... }
 */

#include "spatial_index.hpp"
#include "bvh.hpp"
#include "../colliders/colliders.hpp"
#include <vector>
#include <stdexcept>
#include <string>
#include <cstdint>

namespace probe {
namespace collision {

using colliders::Collider;

class CollisionLayer : public SpatialIndex {
public:
    CollisionLayer() = default;

    // ==================== Body management ====================

    /**
     * Добавить тело. Возвращает body index.
     * Индексы удалённых тел переиспользуются.
     */
    int add(const Collider& collider, const Pose3& pose, uint64_t body = 0) {
        int index;
        if (!free_indices_.empty()) {
            index = free_indices_.back();
            free_indices_.pop_back();
        } else {
            index = static_cast<int>(bodies_.size());
            bodies_.emplace_back();
        }

        LayerBody& entry = bodies_[index];
        entry.collider = collider;
        entry.pose = pose;
        entry.aabb = colliders::aabb_from(collider, pose);
        entry.body = body;
        entry.alive = true;
        entry.proxy = bvh_.insert(index, entry.aabb);
        ++size_;
        return index;
    }

    void update(int index, const Pose3& pose) {
        LayerBody& entry = checked(index);
        entry.pose = pose;
        entry.aabb = colliders::aabb_from(entry.collider, pose);
        bvh_.update(entry.proxy, entry.aabb);
    }

    void remove(int index) {
        LayerBody& entry = checked(index);
        bvh_.remove(entry.proxy);
        entry = LayerBody{};
        free_indices_.push_back(index);
        --size_;
    }

    bool contains(int index) const {
        return index >= 0 && index < static_cast<int>(bodies_.size()) && bodies_[index].alive;
    }

    size_t size() const { return size_; }

    uint64_t body(int index) const { return checked(index).body; }
    const Collider& collider(int index) const { return checked(index).collider; }
    const Pose3& pose(int index) const { return checked(index).pose; }
    const AABB& aabb(int index) const { return checked(index).aabb; }

    const BVH& bvh() const { return bvh_; }

    // ==================== SpatialIndex ====================

    void find_candidates(const AABB& bounds, CandidateVisitor& visitor) const override {
        bvh_.query_aabb(bounds, [&](int32_t index) {
            const LayerBody& entry = bodies_[index];
            // Дерево хранит расширенные AABB, кандидат - по точному
            if (!entry.aabb.intersects(bounds)) return;
            visitor.visit(CandidateBody{entry.collider, entry.pose, entry.aabb, index, entry.body});
        });
    }

private:
    struct LayerBody {
        Collider collider;
        Pose3 pose;
        AABB aabb;
        uint64_t body = 0;
        int32_t proxy = BVH_NULL_NODE;
        bool alive = false;
    };

    std::vector<LayerBody> bodies_;
    std::vector<int> free_indices_;
    BVH bvh_;
    size_t size_ = 0;

    const LayerBody& checked(int index) const {
        if (!contains(index)) {
            throw std::out_of_range("CollisionLayer: no body with index " + std::to_string(index));
        }
        return bodies_[index];
    }

    LayerBody& checked(int index) {
        if (!contains(index)) {
            throw std::out_of_range("CollisionLayer: no body with index " + std::to_string(index));
        }
        return bodies_[index];
    }
};

} // namespace collision
} // namespace probe
