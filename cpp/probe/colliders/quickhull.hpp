#pragma once

// Quickhull: выпуклая оболочка облака точек.
// Результат - треугольные грани с внешними нормалями (CCW при взгляде снаружи).

#include "../geom/vec3.hpp"
#include <vector>
#include <cmath>
#include <algorithm>
#include <utility>

namespace probe {
namespace colliders {
namespace quickhull {

struct HullTriangle {
    int a, b, c;  // indices into the input points
    Vec3 normal;  // outward unit normal
};

struct QhFace {
    int a, b, c;
    Vec3 normal;
    float dist;  // n.dot(verts[a])
    std::vector<int> outside_set;
    bool alive = true;
};

inline void compute_face_normal(QhFace& face, const std::vector<Vec3>& verts) {
    Vec3 AB = verts[face.b] - verts[face.a];
    Vec3 AC = verts[face.c] - verts[face.a];
    Vec3 n = AB.cross(AC);
    float len = n.norm();
    if (len > 1e-20f) {
        face.normal = n / len;
    } else {
        face.normal = Vec3(0, 0, 1);
    }
    face.dist = face.normal.dot(verts[face.a]);
}

/**
 * Строит оболочку. Пустой результат - вход вырожден
 * (меньше 4 точек, все точки на прямой или в одной плоскости).
 */
inline std::vector<HullTriangle> build(const std::vector<Vec3>& verts) {
    std::vector<HullTriangle> result;
    if (verts.size() < 4) return result;

    // Допуск пропорционален размеру облака
    Vec3 lo = verts[0], hi = verts[0];
    for (const auto& v : verts) {
        lo = Vec3::min(lo, v);
        hi = Vec3::max(hi, v);
    }
    const float eps = std::max((hi - lo).max_component(), 1e-6f) * 1e-5f;

    // Крайние точки по осям
    int extremes[6] = {0, 0, 0, 0, 0, 0};
    for (int i = 1; i < (int)verts.size(); ++i) {
        if (verts[i].x < verts[extremes[0]].x) extremes[0] = i;
        if (verts[i].x > verts[extremes[1]].x) extremes[1] = i;
        if (verts[i].y < verts[extremes[2]].y) extremes[2] = i;
        if (verts[i].y > verts[extremes[3]].y) extremes[3] = i;
        if (verts[i].z < verts[extremes[4]].z) extremes[4] = i;
        if (verts[i].z > verts[extremes[5]].z) extremes[5] = i;
    }

    // Самая удалённая пара
    int p0 = 0, p1 = 1;
    float best_dist = -1;
    for (int i = 0; i < 6; ++i) {
        for (int j = i + 1; j < 6; ++j) {
            float d = (verts[extremes[i]] - verts[extremes[j]]).norm_squared();
            if (d > best_dist) {
                best_dist = d;
                p0 = extremes[i];
                p1 = extremes[j];
            }
        }
    }
    if (best_dist <= eps * eps) return result;

    // Самая удалённая от прямой p0-p1
    Vec3 line_dir = verts[p1] - verts[p0];
    float line_len_sq = line_dir.norm_squared();
    int p2 = -1;
    best_dist = -1;
    for (int i = 0; i < (int)verts.size(); ++i) {
        if (i == p0 || i == p1) continue;
        Vec3 diff = verts[i] - verts[p0];
        Vec3 proj = diff - line_dir * (diff.dot(line_dir) / line_len_sq);
        float d = proj.norm_squared();
        if (d > best_dist) { best_dist = d; p2 = i; }
    }
    if (p2 < 0 || best_dist <= eps * eps) return result;

    // Самая удалённая от плоскости p0-p1-p2
    Vec3 tri_normal = (verts[p1] - verts[p0]).cross(verts[p2] - verts[p0]).normalized();

    int p3 = -1;
    best_dist = -1;
    for (int i = 0; i < (int)verts.size(); ++i) {
        if (i == p0 || i == p1 || i == p2) continue;
        float d = std::abs((verts[i] - verts[p0]).dot(tri_normal));
        if (d > best_dist) { best_dist = d; p3 = i; }
    }
    if (p3 < 0 || best_dist <= eps) return result;

    // Ориентация тетраэдра: внешние нормали
    float vol = (verts[p1] - verts[p0]).cross(verts[p2] - verts[p0]).dot(verts[p3] - verts[p0]);
    if (vol > 0) std::swap(p1, p2);

    std::vector<QhFace> faces(4);
    int face_tris[4][3] = {{p0, p1, p2}, {p0, p3, p1}, {p0, p2, p3}, {p1, p3, p2}};
    for (int i = 0; i < 4; ++i) {
        faces[i].a = face_tris[i][0];
        faces[i].b = face_tris[i][1];
        faces[i].c = face_tris[i][2];
        compute_face_normal(faces[i], verts);
    }

    // Распределение точек по outside-множествам
    for (int i = 0; i < (int)verts.size(); ++i) {
        if (i == p0 || i == p1 || i == p2 || i == p3) continue;
        float best_above = eps;
        int best_face = -1;
        for (int f = 0; f < (int)faces.size(); ++f) {
            float above = faces[f].normal.dot(verts[i]) - faces[f].dist;
            if (above > best_above) {
                best_above = above;
                best_face = f;
            }
        }
        if (best_face >= 0) {
            faces[best_face].outside_set.push_back(i);
        }
    }

    const int max_iterations = 4 * (int)verts.size() + 16;
    for (int iter = 0; iter < max_iterations; ++iter) {
        // Грань с самой удалённой внешней точкой
        int work_face = -1;
        float max_above = 0;
        int eye_point = -1;

        for (int f = 0; f < (int)faces.size(); ++f) {
            if (!faces[f].alive || faces[f].outside_set.empty()) continue;
            for (int pi : faces[f].outside_set) {
                float above = faces[f].normal.dot(verts[pi]) - faces[f].dist;
                if (above > max_above) {
                    max_above = above;
                    work_face = f;
                    eye_point = pi;
                }
            }
        }
        if (work_face < 0) break;

        // Видимые из eye_point грани
        std::vector<bool> visible(faces.size(), false);
        for (int f = 0; f < (int)faces.size(); ++f) {
            if (!faces[f].alive) continue;
            float above = faces[f].normal.dot(verts[eye_point]) - faces[f].dist;
            if (above > eps) {
                visible[f] = true;
            }
        }

        // Горизонт
        using Edge = std::pair<int, int>;
        std::vector<Edge> horizon;
        for (int f = 0; f < (int)faces.size(); ++f) {
            if (!visible[f]) continue;
            int edges[3][2] = {
                {faces[f].a, faces[f].b},
                {faces[f].b, faces[f].c},
                {faces[f].c, faces[f].a}
            };
            for (int e = 0; e < 3; ++e) {
                int ea = edges[e][0], eb = edges[e][1];
                for (int j = 0; j < (int)faces.size(); ++j) {
                    if (j == f || !faces[j].alive || visible[j]) continue;
                    if ((faces[j].a == eb && faces[j].b == ea) ||
                        (faces[j].b == eb && faces[j].c == ea) ||
                        (faces[j].c == eb && faces[j].a == ea)) {
                        horizon.push_back({ea, eb});
                        break;
                    }
                }
            }
        }

        // Осиротевшие точки видимых граней
        std::vector<int> orphans;
        for (int f = 0; f < (int)faces.size(); ++f) {
            if (!visible[f]) continue;
            for (int pi : faces[f].outside_set) {
                if (pi != eye_point) orphans.push_back(pi);
            }
            faces[f].outside_set.clear();
            faces[f].alive = false;
        }

        int first_new = (int)faces.size();
        for (const auto& edge : horizon) {
            QhFace nf;
            nf.a = edge.first;
            nf.b = edge.second;
            nf.c = eye_point;
            compute_face_normal(nf, verts);
            faces.push_back(nf);
        }

        for (int pi : orphans) {
            float best_above = eps;
            int best_face = -1;
            for (int f = first_new; f < (int)faces.size(); ++f) {
                float above = faces[f].normal.dot(verts[pi]) - faces[f].dist;
                if (above > best_above) {
                    best_above = above;
                    best_face = f;
                }
            }
            if (best_face >= 0) {
                faces[best_face].outside_set.push_back(pi);
            }
        }
    }

    for (const auto& f : faces) {
        if (!f.alive) continue;
        result.push_back({f.a, f.b, f.c, f.normal});
    }
    return result;
}

} // namespace quickhull
} // namespace colliders
} // namespace probe
