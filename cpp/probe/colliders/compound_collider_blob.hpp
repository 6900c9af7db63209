#pragma once

/**
 * @file compound_collider_blob.hpp
 * @brief Неизменяемые данные составного коллайдера.
 */

#include "collider.hpp"
#include "../geom/pose3.hpp"
#include "../geom/aabb.hpp"
#include <vector>
#include <memory>

namespace probe {
namespace colliders {

struct CompoundColliderBlob {
    std::vector<Collider> colliders;  // дочерние коллайдеры, порядок = sub collider index
    std::vector<Pose3> transforms;    // поза каждого ребёнка в пространстве compound
    AABB local_aabb;                  // объединение AABB детей, без масштаба

    int size() const { return (int)colliders.size(); }

    /**
     * Собирает blob. Бросает std::invalid_argument, если
     * число детей не совпадает с числом трансформов, набор пуст
     * или один из детей сам составной.
     * Определение - в collider_aabb.hpp, подключается ниже.
     */
    static std::shared_ptr<const CompoundColliderBlob> build(std::vector<Collider> colliders,
                                                             std::vector<Pose3> transforms);
};

} // namespace colliders
} // namespace probe

// build() нужен AABB детей
#include "collider_aabb.hpp"
