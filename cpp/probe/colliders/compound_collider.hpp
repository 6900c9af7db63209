#pragma once

#include <memory>
#include <utility>

namespace probe {
namespace colliders {

struct CompoundColliderBlob;

/**
 * Составной коллайдер: упорядоченный набор дочерних коллайдеров
 * со своими трансформами и общим равномерным масштабом.
 * Дочерний коллайдер не может быть составным.
 */
struct CompoundCollider {
    std::shared_ptr<const CompoundColliderBlob> blob;
    float scale;

    CompoundCollider() : blob(), scale(1.0f) {}
    explicit CompoundCollider(std::shared_ptr<const CompoundColliderBlob> blob, float scale = 1.0f)
        : blob(std::move(blob)), scale(scale) {}
};

} // namespace colliders
} // namespace probe
