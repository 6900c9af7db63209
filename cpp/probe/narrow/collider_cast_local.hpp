#pragma once

// Поступательный sweep коллайдера консервативным продвижением
// (conservative advancement) по расстоянию между формами.

#include "collider_distance_local.hpp"
#include "../config.hpp"
#include "pc_log.hpp"
#include <limits>

namespace probe {
namespace narrow {

/**
 * caster движется из позы caster_start в позицию caster_end_position
 * (вращение постоянно). Всё в системе target.
 * fraction - доля пути до первого контакта, contact - точки и нормали в момент контакта.
 * Уже пересекающиеся в начале формы дают fraction = 0.
 */
inline bool collider_cast_local(const Collider& caster, const Pose3& caster_start,
                                const Vec3& caster_end_position, const Collider& target,
                                float& fraction, ShapeDistance& contact) {
    const float unbounded = std::numeric_limits<float>::max();
    Vec3 sweep = caster_end_position - caster_start.lin;
    float t = 0.0f;

    for (int iter = 0; iter < CAST_MAX_ITERATIONS; ++iter) {
        Pose3 pose = caster_start.with_translation(caster_start.lin + sweep * t);
        ShapeDistance hit;
        if (!distance_between_local(caster, pose, target, unbounded, hit)) {
            return false;
        }

        if (hit.distance <= CAST_CONTACT_TOLERANCE) {
            fraction = t;
            contact = hit;
            return true;
        }

        // Скорость сближения вдоль разделяющей нормали
        float approach = sweep.dot(hit.normal_a);
        if (approach <= GEOM_EPSILON * GEOM_EPSILON) {
            return false;
        }

        // Цель шага: зазор 0.5 * CAST_CONTACT_TOLERANCE, формы не касаются
        t += (hit.distance - 0.5f * CAST_CONTACT_TOLERANCE) / approach;
        if (t > 1.0f) {
            return false;
        }
    }

    log_debug("collider_cast: iteration limit reached without contact");
    return false;
}

} // namespace narrow
} // namespace probe
