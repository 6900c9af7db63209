#pragma once

#include "vec3.hpp"
#include "quat.hpp"

namespace probe {

/**
 * Жёсткое преобразование без масштаба: из локального пространства
 * коллайдера в мировое (или в пространство родителя для детей compound).
 *
 * (a * b).transform_point(p) == a.transform_point(b.transform_point(p))
 */
struct Pose3 {
    Quat ang;  // единичный
    Vec3 lin;

    Pose3() : ang(Quat::identity()), lin(Vec3::zero()) {}
    Pose3(const Quat& ang, const Vec3& lin) : ang(ang), lin(lin) {}

    static Pose3 identity() { return {}; }

    Pose3 operator*(const Pose3& other) const {
        return {ang * other.ang, transform_point(other.lin)};
    }

    Pose3 inverse() const {
        Quat inv = ang.inverse();
        return {inv, inv.rotate(-lin)};
    }

    // Эта поза, выраженная в системе frame: frame^-1 * this
    Pose3 in_frame_of(const Pose3& frame) const {
        return frame.inverse() * *this;
    }

    Vec3 transform_point(const Vec3& p) const { return ang.rotate(p) + lin; }
    Vec3 transform_vector(const Vec3& v) const { return ang.rotate(v); }
    Vec3 inverse_transform_point(const Vec3& p) const { return ang.inverse_rotate(p - lin); }
    Vec3 inverse_transform_vector(const Vec3& v) const { return ang.inverse_rotate(v); }

    // Та же ориентация в другой точке (шаг sweep)
    Pose3 with_translation(const Vec3& new_lin) const { return {ang, new_lin}; }

    static Pose3 translation(float x, float y, float z) { return {Quat::identity(), Vec3(x, y, z)}; }
    static Pose3 translation(const Vec3& t) { return {Quat::identity(), t}; }

    static Pose3 rotation(const Vec3& axis, float angle) {
        return {Quat::from_axis_angle(axis, angle), Vec3::zero()};
    }

    static Pose3 rotate_x(float angle) { return rotation(Vec3::unit_x(), angle); }
    static Pose3 rotate_y(float angle) { return rotation(Vec3::unit_y(), angle); }
    static Pose3 rotate_z(float angle) { return rotation(Vec3::unit_z(), angle); }
};

} // namespace probe
