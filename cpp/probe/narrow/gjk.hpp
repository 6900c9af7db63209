#pragma once

// GJK (Gilbert-Johnson-Keerthi) + EPA (Expanding Polytope Algorithm)
// над support mapping ядер. Без выделения памяти: симплекс и политоп EPA
// живут в массивах фиксированной ёмкости.

#include "support.hpp"
#include "../config.hpp"
#include "pc_log.hpp"
#include <array>
#include <cmath>
#include <algorithm>
#include <limits>
#include <utility>

namespace probe {
namespace narrow {

// Support point in Minkowski difference space.
struct MinkowskiPoint {
    Vec3 point;      // support_a - support_b
    Vec3 support_a;
    Vec3 support_b;
};

inline MinkowskiPoint minkowski_support(const SupportShape& a, const SupportShape& b, const Vec3& direction) {
    MinkowskiPoint result;
    result.support_a = a.support(direction);
    result.support_b = b.support(-direction);
    result.point = result.support_a - result.support_b;
    return result;
}

// ==================== GJK ====================

struct GjkResult {
    bool intersecting = false;
    std::array<MinkowskiPoint, 4> simplex;
    int simplex_size = 0;
    Vec3 closest_on_a;
    Vec3 closest_on_b;
    float distance = 0.0f;
};

namespace detail {

// Closest point on segment [A, B] to origin, closest = A*(1-t) + B*t
inline float origin_t_on_segment(const Vec3& A, const Vec3& B) {
    Vec3 AB = B - A;
    float denom = AB.dot(AB);
    if (denom < 1e-20f) return 0.0f;
    float t = -(A.dot(AB)) / denom;
    return std::clamp(t, 0.0f, 1.0f);
}

struct BaryResult {
    float u, v, w;  // closest = A*u + B*v + C*w
    Vec3 closest;
};

// Closest point on triangle ABC to origin.
inline BaryResult origin_on_triangle(const Vec3& A, const Vec3& B, const Vec3& C) {
    Vec3 AB = B - A;
    Vec3 AC = C - A;
    Vec3 AO = -A;

    float d00 = AB.dot(AB);
    float d01 = AB.dot(AC);
    float d11 = AC.dot(AC);
    float d20 = AO.dot(AB);
    float d21 = AO.dot(AC);
    float denom = d00 * d11 - d01 * d01;

    if (std::abs(denom) > 1e-12f * std::max(d00 * d11, 1e-30f)) {
        float bv = (d11 * d20 - d01 * d21) / denom;
        float bw = (d00 * d21 - d01 * d20) / denom;
        float bu = 1.0f - bv - bw;
        if (bu >= 0.0f && bv >= 0.0f && bw >= 0.0f) {
            return {bu, bv, bw, A * bu + B * bv + C * bw};
        }
    }

    // Снаружи или вырожден: ближайшая на рёбрах
    float best_dist_sq = std::numeric_limits<float>::max();
    BaryResult best = {1, 0, 0, A};

    float t = origin_t_on_segment(A, B);
    Vec3 p = A * (1.0f - t) + B * t;
    if (p.dot(p) < best_dist_sq) { best_dist_sq = p.dot(p); best = {1.0f - t, t, 0, p}; }

    t = origin_t_on_segment(A, C);
    p = A * (1.0f - t) + C * t;
    if (p.dot(p) < best_dist_sq) { best_dist_sq = p.dot(p); best = {1.0f - t, 0, t, p}; }

    t = origin_t_on_segment(B, C);
    p = B * (1.0f - t) + C * t;
    if (p.dot(p) < best_dist_sq) { best_dist_sq = p.dot(p); best = {0, 1.0f - t, t, p}; }

    return best;
}

} // namespace detail

/**
 * GJK distance: tracks closest point v of the simplex to the origin.
 * Converges when a new support point no longer improves the distance.
 */
inline GjkResult gjk(const SupportShape& a, const SupportShape& b) {
    GjkResult result;

    Vec3 direction = a.center() - b.center();
    if (direction.dot(direction) < 1e-20f) direction = Vec3(1, 0, 0);

    result.simplex[0] = minkowski_support(a, b, -direction);
    result.simplex_size = 1;
    Vec3 v = result.simplex[0].point;

    int iter = 0;
    for (; iter < GJK_MAX_ITERATIONS; ++iter) {
        float vv = v.dot(v);
        if (vv < GJK_INTERSECTION_TOLERANCE) {
            result.intersecting = true;
            return result;
        }

        MinkowskiPoint w = minkowski_support(a, b, -v);

        // v·v - v·w <= eps·v·v
        float vw = v.dot(w.point);
        if (vv - vw <= GJK_RELATIVE_TOLERANCE * vv) {
            break;
        }

        // Повторная вершина: дальше не продвинемся
        bool duplicate = false;
        for (int i = 0; i < result.simplex_size; ++i) {
            if ((result.simplex[i].point - w.point).norm_squared() < 1e-12f * std::max(vv, 1.0f)) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) break;

        result.simplex[result.simplex_size++] = w;

        if (result.simplex_size == 2) {
            float t = detail::origin_t_on_segment(result.simplex[0].point, result.simplex[1].point);
            v = result.simplex[0].point * (1.0f - t) + result.simplex[1].point * t;
            if (t <= 0.0f) {
                result.simplex_size = 1;
            } else if (t >= 1.0f) {
                result.simplex[0] = result.simplex[1];
                result.simplex_size = 1;
            }

        } else if (result.simplex_size == 3) {
            auto bary = detail::origin_on_triangle(
                result.simplex[0].point, result.simplex[1].point, result.simplex[2].point);
            v = bary.closest;

            float weights[3] = {bary.u, bary.v, bary.w};
            std::array<MinkowskiPoint, 4> reduced;
            int count = 0;
            for (int i = 0; i < 3; ++i) {
                if (weights[i] > 0.0f) reduced[count++] = result.simplex[i];
            }
            if (count > 0 && count < 3) {
                for (int i = 0; i < count; ++i) result.simplex[i] = reduced[i];
                result.simplex_size = count;
            }

        } else {
            const Vec3& A = result.simplex[0].point;
            const Vec3& B = result.simplex[1].point;
            const Vec3& C = result.simplex[2].point;
            const Vec3& D = result.simplex[3].point;

            Vec3 AB = B - A, AC = C - A, AD = D - A;
            Vec3 n_ABC = AB.cross(AC);
            Vec3 n_ACD = AC.cross(AD);
            Vec3 n_ADB = AD.cross(AB);

            // Внешние нормали (от противоположной вершины)
            if (n_ABC.dot(AD) > 0) n_ABC = -n_ABC;
            if (n_ACD.dot(AB) > 0) n_ACD = -n_ACD;
            if (n_ADB.dot(AC) > 0) n_ADB = -n_ADB;

            Vec3 AO = -A;
            bool out_ABC = n_ABC.dot(AO) > 0;
            bool out_ACD = n_ACD.dot(AO) > 0;
            bool out_ADB = n_ADB.dot(AO) > 0;

            Vec3 n_BCD = (C - B).cross(D - B);
            if (n_BCD.dot(A - B) > 0) n_BCD = -n_BCD;
            bool out_BCD = n_BCD.dot(-B) > 0;

            // Плоский симплекс: нормали граней вырождены, ищем ближайшую по всем граням
            float edge_sq = std::max({AB.norm_squared(), AC.norm_squared(), AD.norm_squared()});
            float volume = std::abs(AB.dot(AC.cross(AD)));
            if (volume <= GJK_FLAT_TOLERANCE * edge_sq * std::sqrt(edge_sq)) {
                out_ABC = out_ACD = out_ADB = out_BCD = true;
            } else if (!out_ABC && !out_ACD && !out_ADB && !out_BCD) {
                result.intersecting = true;
                return result;
            }

            float best_dist_sq = std::numeric_limits<float>::max();
            detail::BaryResult best_bary = {1, 0, 0, A};
            int best_idx[3] = {0, 0, 0};

            auto try_face = [&](int i0, int i1, int i2, bool outside) {
                if (!outside) return;
                auto bary = detail::origin_on_triangle(
                    result.simplex[i0].point, result.simplex[i1].point, result.simplex[i2].point);
                float d = bary.closest.dot(bary.closest);
                if (d < best_dist_sq) {
                    best_dist_sq = d;
                    best_bary = bary;
                    best_idx[0] = i0; best_idx[1] = i1; best_idx[2] = i2;
                }
            };

            try_face(0, 1, 2, out_ABC);
            try_face(0, 2, 3, out_ACD);
            try_face(0, 3, 1, out_ADB);
            try_face(1, 2, 3, out_BCD);

            v = best_bary.closest;

            MinkowskiPoint face_pts[3] = {
                result.simplex[best_idx[0]],
                result.simplex[best_idx[1]],
                result.simplex[best_idx[2]]
            };
            float weights[3] = {best_bary.u, best_bary.v, best_bary.w};
            int count = 0;
            for (int i = 0; i < 3; ++i) {
                if (weights[i] > 0.0f) result.simplex[count++] = face_pts[i];
            }
            if (count == 0) {
                result.simplex[0] = face_pts[0];
                count = 1;
            }
            result.simplex_size = count;
        }
    }

    if (iter == GJK_MAX_ITERATIONS) {
        log_debug("gjk: iteration limit reached, using best estimate");
    }

    // Ближайшие точки через барицентрические координаты
    result.intersecting = false;

    if (result.simplex_size == 1) {
        result.closest_on_a = result.simplex[0].support_a;
        result.closest_on_b = result.simplex[0].support_b;
        result.distance = result.simplex[0].point.norm();
    } else if (result.simplex_size == 2) {
        float t = detail::origin_t_on_segment(result.simplex[0].point, result.simplex[1].point);
        result.closest_on_a = result.simplex[0].support_a * (1.0f - t) + result.simplex[1].support_a * t;
        result.closest_on_b = result.simplex[0].support_b * (1.0f - t) + result.simplex[1].support_b * t;
        Vec3 closest = result.simplex[0].point * (1.0f - t) + result.simplex[1].point * t;
        result.distance = closest.norm();
    } else {
        auto bary = detail::origin_on_triangle(
            result.simplex[0].point, result.simplex[1].point, result.simplex[2].point);
        result.closest_on_a = result.simplex[0].support_a * bary.u
            + result.simplex[1].support_a * bary.v + result.simplex[2].support_a * bary.w;
        result.closest_on_b = result.simplex[0].support_b * bary.u
            + result.simplex[1].support_b * bary.v + result.simplex[2].support_b * bary.w;
        result.distance = bary.closest.norm();
    }

    if (result.distance * result.distance < GJK_INTERSECTION_TOLERANCE) {
        result.intersecting = true;
    }
    return result;
}

// ==================== EPA ====================

struct EpaResult {
    bool valid = false;  // false: политоп выродился, глубина неизвестна
    Vec3 normal;         // from A towards B
    float depth = 0.0f;
    Vec3 point_on_a;
    Vec3 point_on_b;
};

namespace detail {

struct EpaFace {
    int a, b, c;
    Vec3 normal;
    float distance;
};

// Normal and distance from winding (a,b,c), no flip
inline EpaFace make_epa_face(const MinkowskiPoint* polytope, int a, int b, int c) {
    EpaFace face;
    face.a = a; face.b = b; face.c = c;
    Vec3 n = (polytope[b].point - polytope[a].point).cross(polytope[c].point - polytope[a].point);
    float len = n.norm();
    if (len < 1e-20f) {
        face.normal = Vec3(0, 0, 1);
        face.distance = 0;
        return face;
    }
    face.normal = n / len;
    face.distance = std::max(face.normal.dot(polytope[a].point), 0.0f);
    return face;
}

// Tetrahedron from 14 support directions, greedy max volume.
inline bool build_epa_tetrahedron(const SupportShape& a, const SupportShape& b,
                                  std::array<MinkowskiPoint, 4>& tet) {
    constexpr int N_DIRS = 14;
    MinkowskiPoint pts[N_DIRS];
    const Vec3 dirs[N_DIRS] = {
        {1, 0, 0}, {-1, 0, 0}, {0, 1, 0}, {0, -1, 0}, {0, 0, 1}, {0, 0, -1},
        {1, 1, 1}, {1, 1, -1}, {1, -1, 1}, {1, -1, -1},
        {-1, 1, 1}, {-1, 1, -1}, {-1, -1, 1}, {-1, -1, -1}
    };
    for (int i = 0; i < N_DIRS; ++i) {
        pts[i] = minkowski_support(a, b, dirs[i]);
    }

    int idx0 = 0;
    float best = pts[0].point.dot(pts[0].point);
    for (int i = 1; i < N_DIRS; ++i) {
        float d = pts[i].point.dot(pts[i].point);
        if (d > best) { best = d; idx0 = i; }
    }

    int idx1 = -1;
    best = -1;
    for (int i = 0; i < N_DIRS; ++i) {
        if (i == idx0) continue;
        float d = (pts[i].point - pts[idx0].point).norm_squared();
        if (d > best) { best = d; idx1 = i; }
    }

    Vec3 line = pts[idx1].point - pts[idx0].point;
    float line_len_sq = std::max(line.dot(line), 1e-20f);
    int idx2 = -1;
    best = -1;
    for (int i = 0; i < N_DIRS; ++i) {
        if (i == idx0 || i == idx1) continue;
        Vec3 diff = pts[i].point - pts[idx0].point;
        Vec3 proj = diff - line * (diff.dot(line) / line_len_sq);
        float d = proj.dot(proj);
        if (d > best) { best = d; idx2 = i; }
    }

    Vec3 normal = line.cross(pts[idx2].point - pts[idx0].point);
    int idx3 = -1;
    best = -1;
    for (int i = 0; i < N_DIRS; ++i) {
        if (i == idx0 || i == idx1 || i == idx2) continue;
        float d = std::abs((pts[i].point - pts[idx0].point).dot(normal));
        if (d > best) { best = d; idx3 = i; }
    }

    tet[0] = pts[idx0];
    tet[1] = pts[idx1];
    tet[2] = pts[idx2];
    tet[3] = pts[idx3];

    Vec3 AB = tet[1].point - tet[0].point;
    Vec3 AC = tet[2].point - tet[0].point;
    Vec3 AD = tet[3].point - tet[0].point;
    float vol = std::abs(AB.dot(AC.cross(AD)));
    float scale = std::max({AB.norm_squared(), AC.norm_squared(), AD.norm_squared(), 1e-20f});
    return vol > 1e-6f * scale * std::sqrt(scale);
}

} // namespace detail

/**
 * Глубина проникновения пересекающихся ядер.
 */
inline EpaResult epa(const SupportShape& a, const SupportShape& b) {
    EpaResult result;

    std::array<MinkowskiPoint, 4> tet;
    if (!detail::build_epa_tetrahedron(a, b, tet)) {
        return result;
    }

    std::array<MinkowskiPoint, EPA_MAX_POINTS> polytope;
    std::array<detail::EpaFace, EPA_MAX_FACES> faces;
    std::array<std::pair<int, int>, EPA_MAX_HORIZON> horizon;
    std::array<bool, EPA_MAX_FACES> visible;
    int point_count = 4;
    int face_count = 0;

    for (int i = 0; i < 4; ++i) polytope[i] = tet[i];

    // Знак объёма определяет обход для внешних нормалей
    Vec3 AB = polytope[1].point - polytope[0].point;
    Vec3 AC = polytope[2].point - polytope[0].point;
    Vec3 AD = polytope[3].point - polytope[0].point;
    float vol = AB.cross(AC).dot(AD);

    static const int flipped[4][3] = {{0, 2, 1}, {0, 1, 3}, {0, 3, 2}, {1, 2, 3}};
    static const int straight[4][3] = {{0, 1, 2}, {0, 3, 1}, {0, 2, 3}, {1, 3, 2}};
    const int (*face_idx)[3] = vol > 0 ? flipped : straight;
    for (int i = 0; i < 4; ++i) {
        faces[face_count++] = detail::make_epa_face(polytope.data(), face_idx[i][0], face_idx[i][1], face_idx[i][2]);
    }

    auto closest_face = [&]() {
        int best = 0;
        for (int i = 1; i < face_count; ++i) {
            if (faces[i].distance < faces[best].distance) best = i;
        }
        return best;
    };

    auto finish = [&](const detail::EpaFace& f) {
        result.valid = true;
        result.normal = f.normal;
        result.depth = f.distance;

        // Барицентрические координаты проекции начала координат на грань
        Vec3 proj = f.normal * f.distance;
        Vec3 v0 = polytope[f.b].point - polytope[f.a].point;
        Vec3 v1 = polytope[f.c].point - polytope[f.a].point;
        Vec3 v2 = proj - polytope[f.a].point;
        float d00 = v0.dot(v0);
        float d01 = v0.dot(v1);
        float d11 = v1.dot(v1);
        float d20 = v2.dot(v0);
        float d21 = v2.dot(v1);
        float denom = d00 * d11 - d01 * d01;
        if (std::abs(denom) > 1e-20f) {
            float bv = (d11 * d20 - d01 * d21) / denom;
            float bw = (d00 * d21 - d01 * d20) / denom;
            float bu = 1.0f - bv - bw;
            result.point_on_a = polytope[f.a].support_a * bu
                + polytope[f.b].support_a * bv + polytope[f.c].support_a * bw;
            result.point_on_b = polytope[f.a].support_b * bu
                + polytope[f.b].support_b * bv + polytope[f.c].support_b * bw;
        } else {
            result.point_on_a = polytope[f.a].support_a;
            result.point_on_b = polytope[f.a].support_b;
        }
    };

    for (int iter = 0; iter < EPA_MAX_ITERATIONS; ++iter) {
        int best = closest_face();
        const detail::EpaFace& f = faces[best];

        MinkowskiPoint new_point = minkowski_support(a, b, f.normal);
        float new_dist = new_point.point.dot(f.normal);

        if (new_dist - f.distance < EPA_TOLERANCE) {
            finish(f);
            return result;
        }

        if (point_count == EPA_MAX_POINTS) {
            log_debug("epa: polytope capacity reached, using best face");
            finish(f);
            return result;
        }

        int visible_count = 0;
        for (int i = 0; i < face_count; ++i) {
            visible[i] = faces[i].normal.dot(new_point.point - polytope[faces[i].a].point) > 1e-7f;
            if (visible[i]) ++visible_count;
        }

        // Горизонт: рёбра видимых граней, соседние с невидимыми
        int horizon_count = 0;
        bool overflow = false;
        for (int i = 0; i < face_count && !overflow; ++i) {
            if (!visible[i]) continue;
            int edges[3][2] = {
                {faces[i].a, faces[i].b},
                {faces[i].b, faces[i].c},
                {faces[i].c, faces[i].a}
            };
            for (int e = 0; e < 3; ++e) {
                int ea = edges[e][0], eb = edges[e][1];
                for (int j = 0; j < face_count; ++j) {
                    if (j == i || visible[j]) continue;
                    if ((faces[j].a == eb && faces[j].b == ea) ||
                        (faces[j].b == eb && faces[j].c == ea) ||
                        (faces[j].c == eb && faces[j].a == ea)) {
                        if (horizon_count == EPA_MAX_HORIZON) {
                            overflow = true;
                            break;
                        }
                        horizon[horizon_count++] = {ea, eb};
                        break;
                    }
                }
                if (overflow) break;
            }
        }

        if (overflow || visible_count == 0 ||
            face_count - visible_count + horizon_count > EPA_MAX_FACES) {
            log_debug("epa: cannot expand polytope, using best face");
            finish(f);
            return result;
        }

        int new_idx = point_count;
        polytope[point_count++] = new_point;

        int kept = 0;
        for (int i = 0; i < face_count; ++i) {
            if (!visible[i]) faces[kept++] = faces[i];
        }
        face_count = kept;
        for (int i = 0; i < horizon_count; ++i) {
            faces[face_count++] = detail::make_epa_face(polytope.data(), horizon[i].first, horizon[i].second, new_idx);
        }
        if (face_count == 0) return result;
    }

    log_debug("epa: iteration limit reached, using best face");
    finish(faces[closest_face()]);
    return result;
}

} // namespace narrow
} // namespace probe
