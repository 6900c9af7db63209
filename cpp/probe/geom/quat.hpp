#pragma once

#include "vec3.hpp"
#include <cmath>

namespace probe {

/**
 * Единичный кватернион поворота, порядок (x, y, z, w).
 * Позы коллайдеров хранят только единичные кватернионы; inverse() это опирается.
 */
struct Quat {
    float x, y, z, w;

    Quat() : x(0), y(0), z(0), w(1) {}
    Quat(float x, float y, float z, float w) : x(x), y(y), z(z), w(w) {}

    static Quat identity() { return {0, 0, 0, 1}; }

    static Quat from_axis_angle(const Vec3& axis, float angle) {
        Vec3 n = axis.normalized();
        float s = std::sin(angle * 0.5f);
        return {n.x * s, n.y * s, n.z * s, std::cos(angle * 0.5f)};
    }

    // Гамильтоново произведение: сначала q, потом this
    Quat operator*(const Quat& q) const {
        return {
            w * q.x + x * q.w + y * q.z - z * q.y,
            w * q.y - x * q.z + y * q.w + z * q.x,
            w * q.z + x * q.y - y * q.x + z * q.w,
            w * q.w - x * q.x - y * q.y - z * q.z
        };
    }

    float dot(const Quat& q) const { return x * q.x + y * q.y + z * q.z + w * q.w; }
    float norm() const { return std::sqrt(dot(*this)); }

    Quat conjugate() const { return {-x, -y, -z, w}; }
    Quat inverse() const { return conjugate(); }

    // Для поз из внешних данных: нулевой кватернион даёт identity
    Quat normalized() const {
        float n = norm();
        if (n < 1e-10f) return identity();
        return {x / n, y / n, z / n, w / n};
    }

    // v' = v + w*t + u×t, t = 2 u×v, u = (x, y, z)
    Vec3 rotate(const Vec3& v) const {
        Vec3 u(x, y, z);
        Vec3 t = u.cross(v) * 2.0f;
        return v + t * w + u.cross(t);
    }

    Vec3 inverse_rotate(const Vec3& v) const {
        return conjugate().rotate(v);
    }
};

} // namespace probe
