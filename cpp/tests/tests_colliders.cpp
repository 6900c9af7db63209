#include "guard/guard.h"
#include "probe/colliders/colliders.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

using guard::Approx;
using namespace probe;
using namespace probe::colliders;

static const float PI = 3.14159265358979f;

TEST_CASE("Collider default is sphere")
{
    Collider c;
    CHECK(c.type() == ColliderType::Sphere);
    CHECK_EQ(c.as_sphere().radius, Approx(0.5).epsilon(1e-6));
}

TEST_CASE("Collider holds exactly one variant")
{
    Collider box = BoxCollider(Vec3(1, 2, 3), Vec3(0.5f, 0.5f, 0.5f));
    CHECK(box.type() == ColliderType::Box);
    CHECK_EQ(box.as_box().center.y, Approx(2.0).epsilon(1e-6));

    bool threw = false;
    try {
        box.as_sphere();
    } catch (const std::bad_variant_access&) {
        threw = true;
    }
    CHECK(threw);

    CHECK(std::string(collider_type_name(ColliderType::Capsule)) == "Capsule");
    CHECK(std::string(collider_type_name(ColliderType::Compound)) == "Compound");
}

TEST_CASE("BoxCollider corners span min and max")
{
    BoxCollider box = BoxCollider::from_size(Vec3(1, 0, 0), Vec3(2, 4, 6));
    CHECK_EQ(box.half_size.y, Approx(2.0).epsilon(1e-6));
    auto corners = box.corners();
    CHECK_EQ(corners[0].x, Approx(0.0).epsilon(1e-6));
    CHECK_EQ(corners[7].x, Approx(2.0).epsilon(1e-6));
    CHECK_EQ(corners[7].z, Approx(3.0).epsilon(1e-6));
}

TEST_CASE("TriangleCollider normal follows winding")
{
    TriangleCollider tri(Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(0, 1, 0));
    CHECK_EQ(tri.normal().z, Approx(1.0).epsilon(1e-6));

    TriangleCollider flat(Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(2, 0, 0));
    CHECK_EQ(flat.normal().norm(), Approx(0.0).epsilon(1e-6));
}

TEST_CASE("Sphere AABB follows pose")
{
    Collider s = SphereCollider(Vec3(1, 0, 0), 0.5f);
    AABB box = aabb_from(s, Pose3::translation(0, 2, 0));
    CHECK_EQ(box.min_point.x, Approx(0.5).epsilon(1e-6));
    CHECK_EQ(box.max_point.x, Approx(1.5).epsilon(1e-6));
    CHECK_EQ(box.min_point.y, Approx(1.5).epsilon(1e-6));
    CHECK_EQ(box.max_point.y, Approx(2.5).epsilon(1e-6));
}

TEST_CASE("Capsule AABB covers both caps")
{
    Collider c = CapsuleCollider(Vec3(0, 0, -1), Vec3(0, 0, 1), 0.5f);
    AABB box = aabb_from(c, Pose3::rotate_y(PI / 2));
    CHECK_EQ(box.min_point.x, Approx(-1.5).epsilon(1e-5));
    CHECK_EQ(box.max_point.x, Approx(1.5).epsilon(1e-5));
    CHECK_EQ(box.max_point.z, Approx(0.5).epsilon(1e-5));
}

TEST_CASE("Rotated box AABB grows")
{
    Collider b = BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1));
    AABB box = aabb_from(b, Pose3::rotate_z(PI / 4));
    CHECK_EQ(box.max_point.x, Approx(std::sqrt(2.0)).epsilon(1e-5));
    CHECK_EQ(box.max_point.y, Approx(std::sqrt(2.0)).epsilon(1e-5));
    CHECK_EQ(box.max_point.z, Approx(1.0).epsilon(1e-5));
}

TEST_CASE("Triangle AABB is tight")
{
    Collider t = TriangleCollider(Vec3(0, 0, 0), Vec3(2, 0, 0), Vec3(0, 3, 0));
    AABB box = aabb_from(t, Pose3::translation(1, 1, 1));
    CHECK_EQ(box.min_point.x, Approx(1.0).epsilon(1e-6));
    CHECK_EQ(box.max_point.x, Approx(3.0).epsilon(1e-6));
    CHECK_EQ(box.max_point.y, Approx(4.0).epsilon(1e-6));
    CHECK_EQ(box.max_point.z, Approx(1.0).epsilon(1e-6));
}

TEST_CASE("Sweep AABB covers start and end")
{
    Collider s = SphereCollider(Vec3(0, 0, 0), 1.0f);
    AABB box = aabb_from_sweep(s, Pose3::translation(-5, 0, 0), Vec3(5, 1, 0));
    CHECK_EQ(box.min_point.x, Approx(-6.0).epsilon(1e-6));
    CHECK_EQ(box.max_point.x, Approx(6.0).epsilon(1e-6));
    CHECK_EQ(box.max_point.y, Approx(2.0).epsilon(1e-6));
    CHECK_EQ(box.min_point.y, Approx(-1.0).epsilon(1e-6));
}

TEST_CASE("scale_collider scales geometry about local origin")
{
    Collider c = CapsuleCollider(Vec3(0, 0, 1), Vec3(0, 0, 2), 0.25f);
    Collider s = scale_collider(c, 2.0f);
    CHECK(s.type() == ColliderType::Capsule);
    CHECK_EQ(s.as_capsule().point_a.z, Approx(2.0).epsilon(1e-6));
    CHECK_EQ(s.as_capsule().point_b.z, Approx(4.0).epsilon(1e-6));
    CHECK_EQ(s.as_capsule().radius, Approx(0.5).epsilon(1e-6));

    Collider b = scale_collider(BoxCollider(Vec3(1, 0, 0), Vec3(1, 1, 1)), 0.5f);
    CHECK_EQ(b.as_box().center.x, Approx(0.5).epsilon(1e-6));
    CHECK_EQ(b.as_box().half_size.y, Approx(0.5).epsilon(1e-6));
}

TEST_CASE("Convex collider scale applies per axis")
{
    std::vector<Vec3> cube = {
        {-1, -1, -1}, {1, -1, -1}, {-1, 1, -1}, {1, 1, -1},
        {-1, -1, 1}, {1, -1, 1}, {-1, 1, 1}, {1, 1, 1}
    };
    auto blob = ConvexColliderBlob::from_points(cube);
    ConvexCollider convex(blob, Vec3(2, 1, 3));

    Vec3 s = convex.support(Vec3(1, 0.1f, 0.1f));
    CHECK_EQ(s.x, Approx(2.0).epsilon(1e-6));

    AABB local = convex.local_aabb();
    CHECK_EQ(local.max_point.x, Approx(2.0).epsilon(1e-6));
    CHECK_EQ(local.min_point.z, Approx(-3.0).epsilon(1e-6));

    AABB world = aabb_from(Collider(convex), Pose3::translation(10, 0, 0));
    CHECK_EQ(world.min_point.x, Approx(8.0).epsilon(1e-6));
    CHECK_EQ(world.max_point.z, Approx(3.0).epsilon(1e-6));

    // Плоскость грани после масштаба остаётся касательной
    for (int i = 0; i < convex.face_count(); ++i) {
        Vec3 n;
        float d;
        convex.face_plane(i, n, d);
        CHECK_EQ(n.norm(), Approx(1.0).epsilon(1e-5));
        CHECK(d > 0.99f);
    }
}

TEST_CASE("Convex collider copies share blob")
{
    std::vector<Vec3> tetra = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}, {0, 0, 1}};
    auto blob = ConvexColliderBlob::from_points(tetra);
    Collider a = ConvexCollider(blob);
    Collider b = a;
    CHECK(a.as_convex().blob.get() == b.as_convex().blob.get());
    CHECK_EQ(blob.use_count(), 3);
}

TEST_CASE("Compound AABB includes children and scale")
{
    auto blob = CompoundColliderBlob::build(
        {SphereCollider(Vec3(0, 0, 0), 1.0f), BoxCollider(Vec3(0, 0, 0), Vec3(1, 1, 1))},
        {Pose3::translation(-10, 0, 0), Pose3::translation(10, 0, 0)});

    CHECK_EQ(blob->size(), 2);
    CHECK_EQ(blob->local_aabb.min_point.x, Approx(-11.0).epsilon(1e-6));
    CHECK_EQ(blob->local_aabb.max_point.x, Approx(11.0).epsilon(1e-6));

    Collider compound = CompoundCollider(blob, 2.0f);
    AABB box = aabb_from(compound, Pose3::translation(0, 5, 0));
    CHECK_EQ(box.min_point.x, Approx(-22.0).epsilon(1e-5));
    CHECK_EQ(box.max_point.x, Approx(22.0).epsilon(1e-5));
    CHECK_EQ(box.min_point.y, Approx(3.0).epsilon(1e-5));
    CHECK_EQ(box.max_point.y, Approx(7.0).epsilon(1e-5));
}

TEST_CASE("Compound blob rejects mismatched input")
{
    bool mismatch = false;
    try {
        CompoundColliderBlob::build({SphereCollider()}, {});
    } catch (const std::invalid_argument&) {
        mismatch = true;
    }
    CHECK(mismatch);

    bool empty = false;
    try {
        CompoundColliderBlob::build({}, {});
    } catch (const std::invalid_argument&) {
        empty = true;
    }
    CHECK(empty);

    auto inner = CompoundColliderBlob::build({SphereCollider()}, {Pose3()});
    bool nested = false;
    try {
        CompoundColliderBlob::build({SphereCollider(), CompoundCollider(inner)}, {Pose3(), Pose3()});
    } catch (const std::invalid_argument&) {
        nested = true;
    }
    CHECK(nested);
}
