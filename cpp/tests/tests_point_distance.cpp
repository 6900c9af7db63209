#include "guard/guard.h"
#include "probe/queries/queries.hpp"
#include <cmath>

using guard::Approx;
using namespace probe;
using namespace probe::colliders;
using namespace probe::queries;

static Collider unit_cube_convex()
{
    static auto blob = ConvexColliderBlob::from_points({
        {-1, -1, -1}, {1, -1, -1}, {-1, 1, -1}, {1, 1, -1},
        {-1, -1, 1}, {1, -1, 1}, {-1, 1, 1}, {1, 1, 1}
    });
    return ConvexCollider(blob);
}

TEST_CASE("Point distance sphere respects max distance")
{
    Collider sphere = SphereCollider(Vec3(0, 0, 0), 1.0f);
    PointDistanceResult r;
    CHECK(!distance_between(Vec3(0, 0, 5), sphere, Pose3(), 3.0f, r));

    CHECK(distance_between(Vec3(0, 0, 5), sphere, Pose3(), 5.0f, r));
    CHECK_EQ(r.distance, Approx(4.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.z, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.normal.z, Approx(1.0).epsilon(1e-5));

    // Ровно на границе max_distance
    CHECK(distance_between(Vec3(0, 0, 5), sphere, Pose3(), 4.0f, r));
}

TEST_CASE("Point distance inside sphere is negative")
{
    Collider sphere = SphereCollider(Vec3(0, 0, 0), 1.0f);
    PointDistanceResult r;
    CHECK(distance_between(Vec3(0, 0, 0.5f), sphere, Pose3(), 0.0f, r));
    CHECK_EQ(r.distance, Approx(-0.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.z, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.normal.z, Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Point distance box outside, inside, corner")
{
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    PointDistanceResult r;

    CHECK(distance_between(Vec3(3, 0, 0), box, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.normal.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.x, Approx(1.0).epsilon(1e-5));

    CHECK(distance_between(Vec3(0.5f, 0, 0), box, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(-0.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.normal.x, Approx(1.0).epsilon(1e-5));

    CHECK(distance_between(Vec3(2, 2, 0), box, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(std::sqrt(2.0)).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.x, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.y, Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Point distance posed box")
{
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    Pose3 pose = Pose3::translation(10, 0, 0) * Pose3::rotate_z(3.14159265f / 2);
    PointDistanceResult r;
    CHECK(distance_between(Vec3(13, 0, 0), box, pose, 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.x, Approx(11.0).epsilon(1e-5));
    CHECK_EQ(r.normal.x, Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Point distance capsule")
{
    Collider capsule = CapsuleCollider(Vec3(0, 0, -1), Vec3(0, 0, 1), 0.5f);
    PointDistanceResult r;

    CHECK(distance_between(Vec3(2, 0, 0.5f), capsule, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(1.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.x, Approx(0.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.z, Approx(0.5).epsilon(1e-5));

    CHECK(distance_between(Vec3(0, 0, 3), capsule, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(1.5).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.z, Approx(1.5).epsilon(1e-5));

    // Точка на оси: нормаль перпендикулярна оси
    CHECK(distance_between(Vec3(0, 0, 0), capsule, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(-0.5).epsilon(1e-5));
    CHECK_EQ(r.normal.z, Approx(0.0).epsilon(1e-5));
    CHECK_EQ(r.normal.norm(), Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Point distance triangle faces the point")
{
    Collider tri = TriangleCollider(Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(0, 1, 0));
    PointDistanceResult r;

    CHECK(distance_between(Vec3(0.25f, 0.25f, 2), tri, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.normal.z, Approx(1.0).epsilon(1e-5));

    CHECK(distance_between(Vec3(0.25f, 0.25f, -2), tri, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.normal.z, Approx(-1.0).epsilon(1e-5));

    // Ближайший элемент - вершина
    CHECK(distance_between(Vec3(-3, -4, 0), tri, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(5.0).epsilon(1e-5));
    CHECK_EQ(r.normal.x, Approx(-0.6).epsilon(1e-5));

    // Точка в плоскости треугольника
    CHECK(distance_between(Vec3(0.25f, 0.25f, 0), tri, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(0.0).epsilon(1e-6));
}

TEST_CASE("Point distance convex hull")
{
    Collider cube = unit_cube_convex();
    PointDistanceResult r;

    CHECK(distance_between(Vec3(3, 0, 0), cube, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0).epsilon(1e-4));
    CHECK_EQ(r.normal.x, Approx(1.0).epsilon(1e-4));

    CHECK(distance_between(Vec3(3, 3, 3), cube, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(2.0 * std::sqrt(3.0)).epsilon(1e-4));
    CHECK_EQ(r.hitpoint.x, Approx(1.0).epsilon(1e-4));
    CHECK_EQ(r.hitpoint.y, Approx(1.0).epsilon(1e-4));
    CHECK_EQ(r.hitpoint.z, Approx(1.0).epsilon(1e-4));

    CHECK(distance_between(Vec3(0, 0.5f, 0), cube, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(-0.5).epsilon(1e-5));
    CHECK_EQ(r.normal.y, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.y, Approx(1.0).epsilon(1e-5));

    CHECK(!distance_between(Vec3(3, 3, 3), cube, Pose3(), 3.0f, r));
}
