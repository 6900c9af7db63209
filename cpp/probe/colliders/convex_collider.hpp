#pragma once

// ConvexCollider - выпуклая оболочка из набора вершин.
// Геометрия хранится в неизменяемом blob, общем для всех копий коллайдера.
// Масштаб задаётся per-axis и применяется к вершинам в локальном пространстве.

#include "../geom/vec3.hpp"
#include "../geom/aabb.hpp"
#include "quickhull.hpp"
#include "pc_log.hpp"
#include <vector>
#include <memory>
#include <stdexcept>
#include <string>
#include <limits>
#include <utility>
#include <algorithm>

namespace probe {
namespace colliders {

struct ConvexFace {
    int a, b, c;      // indices into vertices (CCW when viewed from outside)
    Vec3 normal;      // outward unit normal
    float distance;   // normal.dot(vertices[a])
};

/**
 * Неизменяемые данные выпуклой оболочки.
 * Вершины - только вершины оболочки (внутренние точки облака отброшены).
 */
struct ConvexColliderBlob {
    std::vector<Vec3> vertices;
    std::vector<ConvexFace> faces;
    std::vector<std::pair<int, int>> edges;  // unique edges
    AABB local_aabb;

    /**
     * Строит оболочку из облака точек.
     * Бросает std::invalid_argument, если точек меньше четырёх
     * или все они лежат в одной плоскости.
     */
    static std::shared_ptr<const ConvexColliderBlob> from_points(const std::vector<Vec3>& points) {
        std::vector<quickhull::HullTriangle> hull = quickhull::build(points);
        if (hull.empty()) {
            std::string msg = "ConvexColliderBlob: degenerate point cloud ("
                + std::to_string(points.size())
                + " points), need at least 4 non-coplanar points";
            log_error(msg);
            throw std::invalid_argument(msg);
        }

        auto blob = std::make_shared<ConvexColliderBlob>();

        // Переиндексация: только используемые вершины
        std::vector<int> remap(points.size(), -1);
        auto use = [&](int idx) {
            if (remap[idx] < 0) {
                remap[idx] = (int)blob->vertices.size();
                blob->vertices.push_back(points[idx]);
            }
            return remap[idx];
        };

        blob->faces.reserve(hull.size());
        for (const auto& tri : hull) {
            ConvexFace face;
            face.a = use(tri.a);
            face.b = use(tri.b);
            face.c = use(tri.c);
            face.normal = tri.normal;
            face.distance = tri.normal.dot(points[tri.a]);
            blob->faces.push_back(face);
        }

        for (const auto& face : blob->faces) {
            int pairs[3][2] = {{face.a, face.b}, {face.b, face.c}, {face.c, face.a}};
            for (auto& p : pairs) {
                std::pair<int, int> e(std::min(p[0], p[1]), std::max(p[0], p[1]));
                if (std::find(blob->edges.begin(), blob->edges.end(), e) == blob->edges.end()) {
                    blob->edges.push_back(e);
                }
            }
        }

        blob->local_aabb = AABB(blob->vertices[0], blob->vertices[0]);
        for (const auto& v : blob->vertices) {
            blob->local_aabb.extend(v);
        }

        if (log_enabled(PC_LOG_DEBUG)) {
            log_debug("ConvexColliderBlob: " + std::to_string(blob->vertices.size()) + " vertices, "
                      + std::to_string(blob->faces.size()) + " faces");
        }
        return blob;
    }

    // Support point without scale
    int support_index(const Vec3& direction) const {
        float best_dot = -std::numeric_limits<float>::max();
        int best_idx = 0;
        for (int i = 0; i < (int)vertices.size(); ++i) {
            float d = vertices[i].dot(direction);
            if (d > best_dot) {
                best_dot = d;
                best_idx = i;
            }
        }
        return best_idx;
    }
};

/**
 * Выпуклая оболочка с масштабом.
 * scale - положительный масштаб по осям локальной системы.
 */
struct ConvexCollider {
    std::shared_ptr<const ConvexColliderBlob> blob;
    Vec3 scale;

    ConvexCollider() : blob(), scale(1, 1, 1) {}
    explicit ConvexCollider(std::shared_ptr<const ConvexColliderBlob> blob,
                            const Vec3& scale = Vec3(1, 1, 1))
        : blob(std::move(blob)), scale(scale) {}

    int vertex_count() const { return blob ? (int)blob->vertices.size() : 0; }

    Vec3 vertex(int idx) const { return blob->vertices[idx].mul(scale); }

    /**
     * Опорная точка в направлении direction (локальное пространство).
     * argmax по (s*v)·d = v·(s*d).
     */
    Vec3 support(const Vec3& direction) const {
        if (!blob || blob->vertices.empty()) return Vec3();
        return vertex(blob->support_index(direction.mul(scale)));
    }

    /**
     * Плоскость грани после масштабирования: нормаль n/s, нормированная.
     */
    void face_plane(int face_idx, Vec3& normal, float& distance) const {
        const ConvexFace& f = blob->faces[face_idx];
        normal = f.normal.div(scale).normalized();
        distance = normal.dot(vertex(f.a));
    }

    int face_count() const { return blob ? (int)blob->faces.size() : 0; }

    AABB local_aabb() const {
        if (!blob) return AABB();
        Vec3 a = blob->local_aabb.min_point.mul(scale);
        Vec3 b = blob->local_aabb.max_point.mul(scale);
        return AABB(Vec3::min(a, b), Vec3::max(a, b));
    }
};

} // namespace colliders
} // namespace probe
