#include "guard/guard.h"
#include "probe/queries/queries.hpp"
#include <cmath>
#include <vector>

using guard::Approx;
using namespace probe;
using namespace probe::colliders;
using namespace probe::queries;

// Две единичные сферы в (-10, 0, 0) и (10, 0, 0)
static std::shared_ptr<const CompoundColliderBlob> two_spheres()
{
    return CompoundColliderBlob::build(
        {SphereCollider(Vec3(0, 0, 0), 1.0f), SphereCollider(Vec3(0, 0, 0), 1.0f)},
        {Pose3::translation(-10, 0, 0), Pose3::translation(10, 0, 0)});
}

TEST_CASE("Compound raycast picks nearest child")
{
    Collider compound = CompoundCollider(two_spheres());
    RaycastResult r;

    CHECK(raycast(Vec3(-20, 0, 0), Vec3(20, 0, 0), compound, Pose3(), r));
    CHECK_EQ(r.sub_collider_index, 0);
    CHECK_EQ(r.position.x, Approx(-11.0).epsilon(1e-5));
    CHECK_EQ(r.distance, Approx(9.0).epsilon(1e-5));
    CHECK_EQ(r.normal.x, Approx(-1.0).epsilon(1e-5));

    CHECK(raycast(Vec3(20, 0, 0), Vec3(-20, 0, 0), compound, Pose3(), r));
    CHECK_EQ(r.sub_collider_index, 1);
    CHECK_EQ(r.position.x, Approx(11.0).epsilon(1e-5));
    CHECK_EQ(r.distance, Approx(9.0).epsilon(1e-5));
    CHECK_EQ(r.normal.x, Approx(1.0).epsilon(1e-5));

    CHECK(!raycast(Vec3(0, -5, 0), Vec3(0, 5, 0), compound, Pose3(), r));
}

TEST_CASE("Compound raycast with scale")
{
    Collider compound = CompoundCollider(two_spheres(), 2.0f);
    RaycastResult r;
    CHECK(raycast(Vec3(-40, 0, 0), Vec3(40, 0, 0), compound, Pose3(), r));
    CHECK_EQ(r.sub_collider_index, 0);
    CHECK_EQ(r.position.x, Approx(-22.0).epsilon(1e-5));
    CHECK_EQ(r.distance, Approx(18.0).epsilon(1e-5));
}

TEST_CASE("Compound raycast with rotated pose returns world hit")
{
    Collider compound = CompoundCollider(two_spheres());
    Pose3 pose = Pose3::translation(0, 0, 5) * Pose3::rotate_z(3.14159265f / 2);
    RaycastResult r;
    CHECK(raycast(Vec3(0, -20, 5), Vec3(0, 20, 5), compound, pose, r));
    CHECK_EQ(r.sub_collider_index, 0);
    CHECK_EQ(r.position.y, Approx(-11.0).epsilon(1e-4));
    CHECK_EQ(r.position.z, Approx(5.0).epsilon(1e-4));
    CHECK_EQ(r.normal.y, Approx(-1.0).epsilon(1e-4));
    CHECK_EQ(r.distance, Approx(9.0).epsilon(1e-4));
}

TEST_CASE("Compound point distance ties go to first child")
{
    Collider compound = CompoundCollider(two_spheres());
    PointDistanceResult r;

    CHECK(distance_between(Vec3(0, 0, 0), compound, Pose3(), 100.0f, r));
    CHECK_EQ(r.sub_collider_index, 0);
    CHECK_EQ(r.distance, Approx(9.0).epsilon(1e-5));

    CHECK(distance_between(Vec3(8, 0, 0), compound, Pose3(), 100.0f, r));
    CHECK_EQ(r.sub_collider_index, 1);
    CHECK_EQ(r.distance, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.x, Approx(9.0).epsilon(1e-5));

    CHECK(!distance_between(Vec3(0, 0, 0), compound, Pose3(), 5.0f, r));
    CHECK_EQ(r.sub_collider_index, 0);
}

TEST_CASE("Compound point distance with scale")
{
    Collider compound = CompoundCollider(two_spheres(), 2.0f);
    PointDistanceResult r;
    CHECK(distance_between(Vec3(30, 0, 0), compound, Pose3(), 100.0f, r));
    CHECK_EQ(r.sub_collider_index, 1);
    CHECK_EQ(r.distance, Approx(8.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint.x, Approx(22.0).epsilon(1e-5));
}

TEST_CASE("Compound collider distance on either side")
{
    Collider compound = CompoundCollider(two_spheres());
    Collider sphere = SphereCollider(Vec3(0, 0, 0), 1.0f);
    Pose3 sphere_pose = Pose3::translation(10, 0, 3);
    ColliderDistanceResult r;

    CHECK(distance_between(sphere, sphere_pose, compound, Pose3(), 10.0f, r));
    CHECK_EQ(r.distance, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.sub_collider_index_a, 0);
    CHECK_EQ(r.sub_collider_index_b, 1);
    CHECK_EQ(r.hitpoint_a.z, Approx(2.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.z, Approx(1.0).epsilon(1e-5));

    CHECK(distance_between(compound, Pose3(), sphere, sphere_pose, 10.0f, r));
    CHECK_EQ(r.distance, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.sub_collider_index_a, 1);
    CHECK_EQ(r.sub_collider_index_b, 0);
    CHECK_EQ(r.hitpoint_a.z, Approx(1.0).epsilon(1e-5));
    CHECK_EQ(r.hitpoint_b.z, Approx(2.0).epsilon(1e-5));
}

TEST_CASE("Compound against compound")
{
    Collider a = CompoundCollider(two_spheres());
    Collider b = CompoundCollider(two_spheres());
    ColliderDistanceResult r;
    CHECK(distance_between(a, Pose3(), b, Pose3::translation(0, 5, 0), 10.0f, r));
    CHECK_EQ(r.distance, Approx(3.0).epsilon(1e-5));
    CHECK_EQ(r.sub_collider_index_a, 0);
    CHECK_EQ(r.sub_collider_index_b, 0);
}

TEST_CASE("Compound collider distance with scale")
{
    Collider compound = CompoundCollider(two_spheres(), 2.0f);
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    ColliderDistanceResult r;
    CHECK(distance_between(box, Pose3::translation(30, 0, 0), compound, Pose3(), 100.0f, r));
    CHECK_EQ(r.distance, Approx(7.0).epsilon(1e-4));
    CHECK_EQ(r.sub_collider_index_b, 1);
    CHECK_EQ(r.hitpoint_b.x, Approx(22.0).epsilon(1e-4));
    CHECK_EQ(r.hitpoint_a.x, Approx(29.0).epsilon(1e-4));
}

TEST_CASE("Collider cast against compound target")
{
    Collider compound = CompoundCollider(two_spheres());
    Collider caster = SphereCollider(Vec3(0, 0, 0), 1.0f);
    ColliderCastResult r;
    CHECK(collider_cast(caster, Pose3::translation(10, 10, 0), Vec3(10, -10, 0), compound, Pose3(), r));
    CHECK_EQ(r.sub_collider_index_on_target, 1);
    CHECK_EQ(r.sub_collider_index_on_caster, 0);
    CHECK_EQ(r.distance, Approx(8.0).epsilon(1e-3));
    CHECK_EQ(r.hitpoint.x, Approx(10.0).epsilon(1e-3));
    CHECK_EQ(r.hitpoint.y, Approx(1.0).epsilon(1e-3));
}

TEST_CASE("Compound caster")
{
    Collider compound = CompoundCollider(two_spheres());
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    ColliderCastResult r;
    CHECK(collider_cast(compound, Pose3(), Vec3(20, 0, 0), box, Pose3::translation(30, 0, 0), r));
    CHECK_EQ(r.sub_collider_index_on_caster, 1);
    CHECK_EQ(r.sub_collider_index_on_target, 0);
    CHECK_EQ(r.distance, Approx(18.0).epsilon(1e-3));
    CHECK_EQ(r.hitpoint.x, Approx(29.0).epsilon(1e-3));

    CHECK(!collider_cast(compound, Pose3(), Vec3(10, 0, 0), box, Pose3::translation(30, 0, 0), r));
}

TEST_CASE("Compound raycast matches its children raycast separately")
{
    Collider box = BoxCollider(Vec3(0, 0, 0), Vec3(1, 0.5f, 2));
    Collider capsule = CapsuleCollider(Vec3(0, 0, -1), Vec3(0, 0, 1), 0.75f);
    Pose3 box_pose = Pose3::translation(2, 1, 0) * Pose3::rotate_z(0.4f);
    Pose3 capsule_pose = Pose3::translation(-2, 0, 1) * Pose3::rotate_x(1.1f);
    auto blob = CompoundColliderBlob::build({box, capsule}, {box_pose, capsule_pose});

    Collider compound = CompoundCollider(blob);
    Pose3 pose = Pose3::translation(0, 0, 4) * Pose3::rotate_y(0.3f);

    std::vector<Ray> rays = {
        Ray(Vec3(-10, 0.5f, 4), Vec3(10, 0.5f, 4)),
        Ray(Vec3(10, 0.5f, 4), Vec3(-10, 0.5f, 4)),
        Ray(Vec3(2, 10, 4), Vec3(2, -10, 4)),
        Ray(Vec3(-2, 0, 15), Vec3(-2, 0, -15)),
        Ray(Vec3(0, 20, 20), Vec3(0, 21, 20)),
    };

    for (const Ray& ray : rays) {
        RaycastResult whole, a, b;
        bool hit = raycast(ray, compound, pose, whole);
        bool hit_a = raycast(ray, box, pose * box_pose, a);
        bool hit_b = raycast(ray, capsule, pose * capsule_pose, b);

        CHECK_EQ(hit, hit_a || hit_b);
        if (!hit) continue;

        bool expect_first = hit_a && (!hit_b || a.distance <= b.distance);
        const RaycastResult& expected = expect_first ? a : b;
        CHECK_EQ(whole.sub_collider_index, expect_first ? 0 : 1);
        CHECK_EQ(whole.distance, Approx(expected.distance).epsilon(1e-4));
        CHECK_EQ(whole.position.x, Approx(expected.position.x).epsilon(1e-4));
        CHECK_EQ(whole.position.y, Approx(expected.position.y).epsilon(1e-4));
        CHECK_EQ(whole.position.z, Approx(expected.position.z).epsilon(1e-4));
    }
}
