#include "guard/guard.h"
#include "probe/queries/queries.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using guard::Approx;
using namespace probe;
using namespace probe::colliders;
using namespace probe::queries;

TEST_CASE("Collider distance two spheres")
{
    Collider a = SphereCollider(Vec3(0, 0, 0), 1.0f);
    Collider b = SphereCollider(Vec3(0, 0, 0), 1.0f);
    ColliderDistanceResult r;

    CHECK(distance_between(a, Pose3(), b, Pose3::translation(3, 0, 0), 10.0f, r));
    CHECK_EQ(r.distance, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_a.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.x, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.normal_a.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.normal_b.x, Approx(-1.0).epsilon(1e-5));
    CHECK_EQ(r.sub_collider_index_a, 0);
    CHECK_EQ(r.sub_collider_index_b, 0);
}

TEST_CASE("Collider distance beyond max resets result")
{
    Collider a = SphereCollider(Vec3(0, 0, 0), 1.0f);
    Collider b = SphereCollider(Vec3(0, 0, 0), 1.0f);
    ColliderDistanceResult r;
    r.distance = 5.0f;
    CHECK(!distance_between(a, Pose3(), b, Pose3::translation(3, 0, 0), 0.5f, r));
    CHECK_EQ(r.distance, Approx(0.0).epsilon(1e-6));
}

TEST_CASE("Collider distance overlapping spheres")
{
    Collider a = SphereCollider(Vec3(0, 0, 0), 1.0f);
    Collider b = SphereCollider(Vec3(0, 0, 0), 1.0f);
    ColliderDistanceResult r;
    CHECK(distance_between(a, Pose3(), b, Pose3::translation(1.5f, 0, 0), 0.0f, r));
    CHECK_EQ(r.distance, Approx(-0.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_a.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.x, Approx(0.5).epsilon(1e-5));
}

TEST_CASE("Collider distance box and sphere in both orders")
{
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    Collider sphere = SphereCollider(Vec3(0, 0, 0), 1.0f);
    ColliderDistanceResult r;

    CHECK(distance_between(box, Pose3(), sphere, Pose3::translation(4, 0, 0), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_a.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.x, Approx(3.0).epsilon(1e-5));
    CHECK_EQ(r.normal_a.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.normal_b.x, Approx(-1.0).epsilon(1e-5));

    CHECK(distance_between(sphere, Pose3::translation(4, 0, 0), box, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_a.x, Approx(3.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.normal_a.x, Approx(-1.0).epsilon(1e-5));
    CHECK_EQ(r.normal_b.x, Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Collider distance parallel capsules")
{
    Collider a = CapsuleCollider(Vec3(0, 0, -1), Vec3(0, 0, 1), 0.5f);
    Collider b = CapsuleCollider(Vec3(0, 0, -1), Vec3(0, 0, 1), 0.5f);
    ColliderDistanceResult r;
    CHECK(distance_between(a, Pose3(), b, Pose3::translation(3, 0, 0), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_a.x, Approx(0.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.x, Approx(2.5).epsilon(1e-5));
}

TEST_CASE("Collider distance crossing capsules")
{
    Collider a = CapsuleCollider(Vec3(0, 0, -1), Vec3(0, 0, 1), 0.5f);
    Collider b = CapsuleCollider(Vec3(-1, 0, 0), Vec3(1, 0, 0), 0.5f);
    ColliderDistanceResult r;
    CHECK(distance_between(a, Pose3(), b, Pose3(), 0.0f, r));
    CHECK_EQ(r.distance, Approx(-1.0).epsilon(1e-5));
    // Оси пересекаются: нормаль перпендикулярна обеим
    CHECK_EQ(std::abs(r.normal_a.y), Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Collider distance capsule and box")
{
    Collider capsule = CapsuleCollider(Vec3(0, 0, -1), Vec3(0, 0, 1), 0.5f);
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    ColliderDistanceResult ab, ba;

    CHECK(distance_between(capsule, Pose3::translation(3, 0, 0), box, Pose3(), 10.0f, ab));
    CHECK_EQ(ab.distance, Approx(1.5).epsilon(1e-4));
    CHECK_EQ(ab.hitpoint_a.x, Approx(2.5).epsilon(1e-4));
    CHECK_EQ(ab.hitpoint_b.x, Approx(1.0).epsilon(1e-4));
    CHECK_EQ(ab.normal_a.x, Approx(-1.0).epsilon(1e-4));

    CHECK(distance_between(box, Pose3(), capsule, Pose3::translation(3, 0, 0), 10.0f, ba));
    CHECK_EQ(ba.distance, Approx(ab.distance).epsilon(1e-4));
    CHECK_EQ(ba.hitpoint_a.x, Approx(ab.hitpoint_b.x).epsilon(1e-4));
    CHECK_EQ(ba.hitpoint_b.x, Approx(ab.hitpoint_a.x).epsilon(1e-4));
}

TEST_CASE("Collider distance triangle and sphere")
{
    Collider tri = TriangleCollider(Vec3(-1, -1, 0), Vec3(1, -1, 0), Vec3(0, 1, 0));
    Collider sphere = SphereCollider(Vec3(0, 0, 0), 0.5f);
    ColliderDistanceResult r;
    CHECK(distance_between(tri, Pose3(), sphere, Pose3::translation(0, 0, 2), 10.0f, r));
    CHECK_EQ(r.distance, Approx(1.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_a.z, Approx(0.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.z, Approx(1.5).epsilon(1e-5));
    CHECK_EQ(r.normal_a.z, Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Collider distance convex and box")
{
    auto blob = ConvexColliderBlob::from_points({
        {-1, -1, -1}, {1, -1, -1}, {-1, 1, -1}, {1, 1, -1},
        {-1, -1, 1}, {1, -1, 1}, {-1, 1, 1}, {1, 1, 1}
    });
    Collider convex = ConvexCollider(blob);
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    ColliderDistanceResult r;
    CHECK(distance_between(convex, Pose3(), box, Pose3::translation(5, 0, 0), 10.0f, r));
    CHECK_EQ(r.distance, Approx(3.0).epsilon(1e-4));
    CHECK_EQ(r.hitpoint_a.x, Approx(1.0).epsilon(1e-4));
    CHECK_EQ(r.hitpoint_b.x, Approx(4.0).epsilon(1e-4));
}

TEST_CASE("Collider distance penetrating boxes")
{
    Collider a = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    Collider b = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    ColliderDistanceResult r;
    CHECK(distance_between(a, Pose3(), b, Pose3::translation(1.5f, 0.2f, 0.1f), 0.0f, r));
    CHECK_EQ(r.distance, Approx(-0.5).epsilon(1e-3));
    CHECK_EQ(r.normal_a.x, Approx(1.0).epsilon(1e-3));
    CHECK_EQ(r.normal_b.x, Approx(-1.0).epsilon(1e-3));
}

TEST_CASE("Collider distance respects rotation")
{
    Collider a = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    Collider b = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    ColliderDistanceResult r;
    Pose3 b_pose = Pose3::translation(4, 0, 0) * Pose3::rotate_z(3.14159265f / 4);
    CHECK(distance_between(a, Pose3(), b, b_pose, 10.0f, r));
    CHECK_EQ(r.distance, Approx(3.0 - std::sqrt(2.0)).epsilon(1e-4));
    CHECK_EQ(r.hitpoint_b.x, Approx(4.0 - std::sqrt(2.0)).epsilon(1e-4));
}

// ==================== Randomized pairs ====================

namespace {

unsigned g_seed = 2024;

// [-1, 1)
float next_unit()
{
    g_seed = g_seed * 1103515245u + 12345u;
    return (float)((g_seed >> 8) % 20000) / 10000.0f - 1.0f;
}

Pose3 random_pose(float spread)
{
    Quat q(next_unit(), next_unit(), next_unit(), next_unit() + 1.5f);
    float len = std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z + q.w * q.w);
    q = Quat(q.x / len, q.y / len, q.z / len, q.w / len);
    return Pose3(q, Vec3(next_unit(), next_unit(), next_unit()) * spread);
}

std::vector<Collider> primitive_shapes()
{
    static auto hull = ConvexColliderBlob::from_points({
        {-0.6f, -0.5f, -0.4f}, {0.7f, -0.5f, -0.3f}, {-0.5f, 0.6f, -0.5f}, {0.6f, 0.6f, -0.4f},
        {-0.4f, -0.6f, 0.5f}, {0.5f, -0.4f, 0.6f}, {0.0f, 0.7f, 0.5f}, {0.1f, 0.0f, 0.9f}
    });
    return {
        SphereCollider(Vec3(0.1f, 0, 0), 0.6f),
        CapsuleCollider(Vec3(0, -0.5f, 0), Vec3(0, 0.5f, 0), 0.3f),
        BoxCollider(Vec3(0, 0, 0), Vec3(0.5f, 0.3f, 0.7f)),
        TriangleCollider(Vec3(-1, 0, 0), Vec3(1, 0, 0), Vec3(0, 1, 0.3f)),
        ConvexCollider(hull, Vec3(1.0f, 1.2f, 0.8f)),
    };
}

float distance_or_max(const Collider& a, const Pose3& pa, const Collider& b, const Pose3& pb,
                      ColliderDistanceResult& r)
{
    if (!distance_between(a, pa, b, pb, 100.0f, r)) return 100.0f;
    return r.distance;
}

} // namespace

TEST_CASE("Separated triangles on a flat simplex are not reported as touching")
{
    Collider tri = TriangleCollider(Vec3(-1, 0, 0), Vec3(1, 0, 0), Vec3(0, 1, 0.3f));
    Pose3 pa(Quat(0.0943863f, 0.0891857f, -0.138795f, 0.98177f), Vec3(1.261242f, -0.330393f, -0.226445f));
    Pose3 pb(Quat(0.54332f, 0.553648f, -0.147279f, 0.613666f), Vec3(0, 0, 0));
    Pose3 shift_plus = Pose3::translation(1e-4f, 0, 0) * pa;
    Pose3 shift_minus = Pose3::translation(-1e-4f, 0, 0) * pa;

    ColliderDistanceResult r, r_plus, r_minus;
    bool touching = distance_between(tri, pa, tri, pb, 0.0f, r);
    bool touching_plus = distance_between(tri, shift_plus, tri, pb, 0.0f, r_plus);
    bool touching_minus = distance_between(tri, shift_minus, tri, pb, 0.0f, r_minus);
    CHECK_EQ(touching, touching_plus);
    CHECK_EQ(touching, touching_minus);

    float d = distance_or_max(tri, pa, tri, pb, r);
    float d_plus = distance_or_max(tri, shift_plus, tri, pb, r_plus);
    float d_minus = distance_or_max(tri, shift_minus, tri, pb, r_minus);
    CHECK(std::abs(d - d_plus) < 1e-3f);
    CHECK(std::abs(d - d_minus) < 1e-3f);
    if (d > 1e-3f) {
        CHECK_EQ((r.hitpoint_a - r.hitpoint_b).norm(), Approx(d).epsilon(1e-3));
    }
}

TEST_CASE("Random primitive pairs: distance matches closest points and is continuous")
{
    std::vector<Collider> shapes = primitive_shapes();
    int separated = 0;
    int bad_points = 0;
    int jumps = 0;

    for (size_t i = 0; i < shapes.size(); ++i) {
        for (size_t j = 0; j < shapes.size(); ++j) {
            for (int trial = 0; trial < 200; ++trial) {
                Pose3 pa = random_pose(1.5f);
                Pose3 pb = random_pose(1.5f);
                Vec3 step = Vec3(next_unit(), next_unit(), next_unit()).normalized() * 1e-4f;

                ColliderDistanceResult r, r_plus, r_minus;
                float d = distance_or_max(shapes[i], pa, shapes[j], pb, r);
                float d_plus = distance_or_max(shapes[i], Pose3::translation(step) * pa, shapes[j], pb, r_plus);
                float d_minus = distance_or_max(shapes[i], Pose3::translation(-step) * pa, shapes[j], pb, r_minus);

                if (d > 1e-3f) {
                    ++separated;
                    float gap = (r.hitpoint_a - r.hitpoint_b).norm();
                    if (std::abs(gap - d) > 2e-3f) ++bad_points;
                }
                // Соседние позы заведомо разнесены: расстояние меняется не больше сдвига
                if (std::min(d_plus, d_minus) > 2e-3f) {
                    if (std::abs(d - d_plus) > 1e-3f || std::abs(d - d_minus) > 1e-3f) ++jumps;
                }
            }
        }
    }

    CHECK(separated > 1000);
    CHECK_EQ(bad_points, 0);
    CHECK_EQ(jumps, 0);
}
