#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/operators.h>
#include <nanobind/stl/vector.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/tuple.h>
#include <nanobind/stl/string.h>

#include "probe/geom/geom.hpp"
#include "probe/colliders/colliders.hpp"
#include "probe/queries/queries.hpp"
#include "probe/collision/collision.hpp"
#include "pc_log.hpp"

#include <cstdint>
#include <string>
#include <tuple>
#include <memory>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace probe;
using namespace probe::colliders;
using namespace probe::queries;
using namespace probe::collision;

// Helper to create Vec3 from numpy array
static Vec3 numpy_to_vec3(nb::ndarray<float, nb::c_contig, nb::device::cpu> arr) {
    float* ptr = arr.data();
    return {ptr[0], ptr[1], ptr[2]};
}

static std::string vec3_repr(const Vec3& v) {
    return "Vec3(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ", " + std::to_string(v.z) + ")";
}

static void bind_geom(nb::module_& m) {
    nb::class_<Vec3>(m, "Vec3")
        .def(nb::init<>())
        .def(nb::init<float, float, float>(), nb::arg("x"), nb::arg("y"), nb::arg("z"))
        .def("__init__", [](Vec3* self, nb::ndarray<float, nb::c_contig, nb::device::cpu> arr) {
            new (self) Vec3(numpy_to_vec3(arr));
        }, nb::arg("array"))
        .def_rw("x", &Vec3::x)
        .def_rw("y", &Vec3::y)
        .def_rw("z", &Vec3::z)
        .def(nb::self + nb::self)
        .def(nb::self - nb::self)
        .def(nb::self * float())
        .def(-nb::self)
        .def(nb::self == nb::self)
        .def("dot", &Vec3::dot, nb::arg("other"))
        .def("cross", &Vec3::cross, nb::arg("other"))
        .def("norm", &Vec3::norm)
        .def("normalized", &Vec3::normalized)
        .def("__getitem__", [](const Vec3& v, int i) {
            if (i < 0 || i > 2) throw nb::index_error();
            return v[i];
        })
        .def("__repr__", &vec3_repr);

    nb::class_<Quat>(m, "Quat")
        .def(nb::init<>())
        .def(nb::init<float, float, float, float>(), nb::arg("x"), nb::arg("y"), nb::arg("z"), nb::arg("w"))
        .def_rw("x", &Quat::x)
        .def_rw("y", &Quat::y)
        .def_rw("z", &Quat::z)
        .def_rw("w", &Quat::w)
        .def(nb::self * nb::self)
        .def("inverse", &Quat::inverse)
        .def("rotate", &Quat::rotate, nb::arg("v"))
        .def_static("identity", &Quat::identity)
        .def_static("from_axis_angle", &Quat::from_axis_angle, nb::arg("axis"), nb::arg("angle"));

    nb::class_<Pose3>(m, "Pose3")
        .def(nb::init<>())
        .def(nb::init<const Quat&, const Vec3&>(), nb::arg("ang"), nb::arg("lin"))
        .def_rw("ang", &Pose3::ang)
        .def_rw("lin", &Pose3::lin)
        .def(nb::self * nb::self)
        .def("inverse", &Pose3::inverse)
        .def("transform_point", &Pose3::transform_point, nb::arg("p"))
        .def("transform_vector", &Pose3::transform_vector, nb::arg("v"))
        .def("inverse_transform_point", &Pose3::inverse_transform_point, nb::arg("p"))
        .def("inverse_transform_vector", &Pose3::inverse_transform_vector, nb::arg("v"))
        .def_static("identity", &Pose3::identity)
        .def_static("translation", nb::overload_cast<const Vec3&>(&Pose3::translation), nb::arg("t"))
        .def_static("rotation", &Pose3::rotation, nb::arg("axis"), nb::arg("angle"));

    nb::class_<AABB>(m, "AABB")
        .def(nb::init<>())
        .def(nb::init<const Vec3&, const Vec3&>(), nb::arg("min_point"), nb::arg("max_point"))
        .def_rw("min_point", &AABB::min_point)
        .def_rw("max_point", &AABB::max_point)
        .def("intersects", &AABB::intersects, nb::arg("other"))
        .def("contains", nb::overload_cast<const Vec3&>(&AABB::contains, nb::const_), nb::arg("point"))
        .def("merge", &AABB::merge, nb::arg("other"))
        .def("expanded", &AABB::expanded, nb::arg("margin"))
        .def("center", &AABB::center)
        .def("surface_area", &AABB::surface_area);

    nb::class_<Ray>(m, "Ray")
        .def(nb::init<>())
        .def(nb::init<const Vec3&, const Vec3&>(), nb::arg("start"), nb::arg("end"))
        .def_rw("start", &Ray::start)
        .def_rw("end", &Ray::end)
        .def("displacement", &Ray::displacement)
        .def("length", &Ray::length)
        .def("point_at", &Ray::point_at, nb::arg("fraction"));
}

static void bind_colliders(nb::module_& m) {
    nb::enum_<ColliderType>(m, "ColliderType")
        .value("Sphere", ColliderType::Sphere)
        .value("Capsule", ColliderType::Capsule)
        .value("Box", ColliderType::Box)
        .value("Triangle", ColliderType::Triangle)
        .value("Convex", ColliderType::Convex)
        .value("Compound", ColliderType::Compound);

    nb::class_<SphereCollider>(m, "SphereCollider")
        .def(nb::init<>())
        .def(nb::init<const Vec3&, float>(), nb::arg("center"), nb::arg("radius"))
        .def_rw("center", &SphereCollider::center)
        .def_rw("radius", &SphereCollider::radius);

    nb::class_<CapsuleCollider>(m, "CapsuleCollider")
        .def(nb::init<>())
        .def(nb::init<const Vec3&, const Vec3&, float>(), nb::arg("point_a"), nb::arg("point_b"), nb::arg("radius"))
        .def_rw("point_a", &CapsuleCollider::point_a)
        .def_rw("point_b", &CapsuleCollider::point_b)
        .def_rw("radius", &CapsuleCollider::radius);

    nb::class_<BoxCollider>(m, "BoxCollider")
        .def(nb::init<>())
        .def(nb::init<const Vec3&, const Vec3&>(), nb::arg("center"), nb::arg("half_size"))
        .def_rw("center", &BoxCollider::center)
        .def_rw("half_size", &BoxCollider::half_size)
        .def_static("from_size", &BoxCollider::from_size, nb::arg("center"), nb::arg("size"));

    nb::class_<TriangleCollider>(m, "TriangleCollider")
        .def(nb::init<>())
        .def(nb::init<const Vec3&, const Vec3&, const Vec3&>(), nb::arg("point_a"), nb::arg("point_b"), nb::arg("point_c"))
        .def_rw("point_a", &TriangleCollider::point_a)
        .def_rw("point_b", &TriangleCollider::point_b)
        .def_rw("point_c", &TriangleCollider::point_c)
        .def("normal", &TriangleCollider::normal);

    nb::class_<ConvexColliderBlob>(m, "ConvexColliderBlob")
        .def_ro("vertices", &ConvexColliderBlob::vertices)
        .def_ro("local_aabb", &ConvexColliderBlob::local_aabb)
        .def("face_count", [](const ConvexColliderBlob& b) { return b.faces.size(); })
        .def("edge_count", [](const ConvexColliderBlob& b) { return b.edges.size(); })
        .def_static("from_points", [](const std::vector<Vec3>& points) {
            return std::const_pointer_cast<ConvexColliderBlob>(ConvexColliderBlob::from_points(points));
        }, nb::arg("points"));

    nb::class_<ConvexCollider>(m, "ConvexCollider")
        .def("__init__", [](ConvexCollider* self, std::shared_ptr<ConvexColliderBlob> blob, const Vec3& scale) {
            new (self) ConvexCollider(std::move(blob), scale);
        }, nb::arg("blob"), nb::arg("scale") = Vec3(1, 1, 1))
        .def_rw("scale", &ConvexCollider::scale)
        .def("support", &ConvexCollider::support, nb::arg("direction"));

    nb::class_<Collider>(m, "Collider")
        .def(nb::init<const SphereCollider&>(), nb::arg("sphere"))
        .def(nb::init<const CapsuleCollider&>(), nb::arg("capsule"))
        .def(nb::init<const BoxCollider&>(), nb::arg("box"))
        .def(nb::init<const TriangleCollider&>(), nb::arg("triangle"))
        .def(nb::init<const ConvexCollider&>(), nb::arg("convex"))
        .def(nb::init<const CompoundCollider&>(), nb::arg("compound"))
        .def("type", &Collider::type)
        .def("__repr__", [](const Collider& c) {
            return std::string("Collider(") + collider_type_name(c.type()) + ")";
        });

    nb::implicitly_convertible<SphereCollider, Collider>();
    nb::implicitly_convertible<CapsuleCollider, Collider>();
    nb::implicitly_convertible<BoxCollider, Collider>();
    nb::implicitly_convertible<TriangleCollider, Collider>();
    nb::implicitly_convertible<ConvexCollider, Collider>();

    nb::class_<CompoundColliderBlob>(m, "CompoundColliderBlob")
        .def_ro("colliders", &CompoundColliderBlob::colliders)
        .def_ro("transforms", &CompoundColliderBlob::transforms)
        .def_ro("local_aabb", &CompoundColliderBlob::local_aabb)
        .def("size", &CompoundColliderBlob::size)
        .def_static("build", [](std::vector<Collider> colliders, std::vector<Pose3> transforms) {
            return std::const_pointer_cast<CompoundColliderBlob>(
                CompoundColliderBlob::build(std::move(colliders), std::move(transforms)));
        }, nb::arg("colliders"), nb::arg("transforms"));

    nb::class_<CompoundCollider>(m, "CompoundCollider")
        .def("__init__", [](CompoundCollider* self, std::shared_ptr<CompoundColliderBlob> blob, float scale) {
            new (self) CompoundCollider(std::move(blob), scale);
        }, nb::arg("blob"), nb::arg("scale") = 1.0f)
        .def_rw("scale", &CompoundCollider::scale);

    nb::implicitly_convertible<CompoundCollider, Collider>();

    m.def("aabb_from", nb::overload_cast<const Collider&, const Pose3&>(&colliders::aabb_from),
          nb::arg("collider"), nb::arg("pose"));
    m.def("aabb_from_sweep", &aabb_from_sweep,
          nb::arg("collider"), nb::arg("start_pose"), nb::arg("end_position"));
    m.def("scale_collider", &scale_collider, nb::arg("collider"), nb::arg("factor"));
}

static void bind_results(nb::module_& m) {
    nb::class_<RaycastResult>(m, "RaycastResult")
        .def(nb::init<>())
        .def_rw("position", &RaycastResult::position)
        .def_rw("distance", &RaycastResult::distance)
        .def_rw("normal", &RaycastResult::normal)
        .def_rw("sub_collider_index", &RaycastResult::sub_collider_index);

    nb::class_<PointDistanceResult>(m, "PointDistanceResult")
        .def(nb::init<>())
        .def_rw("hitpoint", &PointDistanceResult::hitpoint)
        .def_rw("distance", &PointDistanceResult::distance)
        .def_rw("normal", &PointDistanceResult::normal)
        .def_rw("sub_collider_index", &PointDistanceResult::sub_collider_index);

    nb::class_<ColliderDistanceResult>(m, "ColliderDistanceResult")
        .def(nb::init<>())
        .def_rw("hitpoint_a", &ColliderDistanceResult::hitpoint_a)
        .def_rw("hitpoint_b", &ColliderDistanceResult::hitpoint_b)
        .def_rw("normal_a", &ColliderDistanceResult::normal_a)
        .def_rw("normal_b", &ColliderDistanceResult::normal_b)
        .def_rw("distance", &ColliderDistanceResult::distance)
        .def_rw("sub_collider_index_a", &ColliderDistanceResult::sub_collider_index_a)
        .def_rw("sub_collider_index_b", &ColliderDistanceResult::sub_collider_index_b);

    nb::class_<ColliderCastResult>(m, "ColliderCastResult")
        .def(nb::init<>())
        .def_rw("hitpoint", &ColliderCastResult::hitpoint)
        .def_rw("normal_on_caster", &ColliderCastResult::normal_on_caster)
        .def_rw("normal_on_target", &ColliderCastResult::normal_on_target)
        .def_rw("distance", &ColliderCastResult::distance)
        .def_rw("sub_collider_index_on_caster", &ColliderCastResult::sub_collider_index_on_caster)
        .def_rw("sub_collider_index_on_target", &ColliderCastResult::sub_collider_index_on_target);

    nb::class_<LayerBodyInfo>(m, "LayerBodyInfo")
        .def(nb::init<>())
        .def_rw("body", &LayerBodyInfo::body)
        .def_rw("body_index", &LayerBodyInfo::body_index)
        .def_rw("aabb", &LayerBodyInfo::aabb);
}

// Single-collider queries return (hit, result)
static void bind_queries(nb::module_& m) {
    m.def("raycast", [](const Ray& ray, const Collider& collider, const Pose3& pose) {
        RaycastResult result;
        bool hit = queries::raycast(ray, collider, pose, result);
        return std::make_pair(hit, result);
    }, nb::arg("ray"), nb::arg("collider"), nb::arg("pose"));

    m.def("distance_between", [](const Vec3& point, const Collider& collider, const Pose3& pose, float max_distance) {
        PointDistanceResult result;
        bool hit = queries::distance_between(point, collider, pose, max_distance, result);
        return std::make_pair(hit, result);
    }, nb::arg("point"), nb::arg("collider"), nb::arg("pose"), nb::arg("max_distance"));

    m.def("distance_between", [](const Collider& a, const Pose3& a_pose, const Collider& b, const Pose3& b_pose,
                                 float max_distance) {
        ColliderDistanceResult result;
        bool hit = queries::distance_between(a, a_pose, b, b_pose, max_distance, result);
        return std::make_pair(hit, result);
    }, nb::arg("a"), nb::arg("a_pose"), nb::arg("b"), nb::arg("b_pose"), nb::arg("max_distance"));

    m.def("collider_cast", [](const Collider& caster, const Pose3& start, const Vec3& end,
                              const Collider& target, const Pose3& target_pose) {
        ColliderCastResult result;
        bool hit = queries::collider_cast(caster, start, end, target, target_pose, result);
        return std::make_pair(hit, result);
    }, nb::arg("caster"), nb::arg("start"), nb::arg("end"), nb::arg("target"), nb::arg("target_pose"));
}

// Layer queries return (hit, result, info)
static void bind_layer(nb::module_& m) {
    nb::class_<CollisionLayer>(m, "CollisionLayer")
        .def(nb::init<>())
        .def("add", &CollisionLayer::add, nb::arg("collider"), nb::arg("pose"), nb::arg("body") = 0)
        .def("update", &CollisionLayer::update, nb::arg("index"), nb::arg("pose"))
        .def("remove", &CollisionLayer::remove, nb::arg("index"))
        .def("contains", &CollisionLayer::contains, nb::arg("index"))
        .def("size", &CollisionLayer::size)
        .def("body", &CollisionLayer::body, nb::arg("index"))
        .def("aabb", &CollisionLayer::aabb, nb::arg("index"))
        .def("__len__", &CollisionLayer::size);

    m.def("layer_raycast", [](const Ray& ray, const CollisionLayer& layer, bool any) {
        RaycastResult result;
        LayerBodyInfo info;
        bool hit = any ? raycast_any(ray, layer, result, info) : collision::raycast(ray, layer, result, info);
        return std::make_tuple(hit, result, info);
    }, nb::arg("ray"), nb::arg("layer"), nb::arg("any") = false);

    m.def("layer_point_distance", [](const Vec3& point, const CollisionLayer& layer, float max_distance, bool any) {
        PointDistanceResult result;
        LayerBodyInfo info;
        bool hit = any ? distance_between_any(point, layer, max_distance, result, info)
                       : collision::distance_between(point, layer, max_distance, result, info);
        return std::make_tuple(hit, result, info);
    }, nb::arg("point"), nb::arg("layer"), nb::arg("max_distance"), nb::arg("any") = false);

    m.def("layer_collider_distance", [](const Collider& collider, const Pose3& pose, const CollisionLayer& layer,
                                        float max_distance, bool any) {
        ColliderDistanceResult result;
        LayerBodyInfo info;
        bool hit = any ? distance_between_any(collider, pose, layer, max_distance, result, info)
                       : collision::distance_between(collider, pose, layer, max_distance, result, info);
        return std::make_tuple(hit, result, info);
    }, nb::arg("collider"), nb::arg("pose"), nb::arg("layer"), nb::arg("max_distance"), nb::arg("any") = false);

    m.def("layer_collider_cast", [](const Collider& caster, const Pose3& start, const Vec3& end,
                                    const CollisionLayer& layer, bool any) {
        ColliderCastResult result;
        LayerBodyInfo info;
        bool hit = any ? collider_cast_any(caster, start, end, layer, result, info)
                       : collision::collider_cast(caster, start, end, layer, result, info);
        return std::make_tuple(hit, result, info);
    }, nb::arg("caster"), nb::arg("start"), nb::arg("end"), nb::arg("layer"), nb::arg("any") = false);
}

NB_MODULE(_probe_native, m) {
    m.doc() = "Native C++ collision query module";

    bind_geom(m);
    bind_colliders(m);
    bind_results(m);
    bind_queries(m);
    bind_layer(m);

    nb::enum_<pc_log_level>(m, "LogLevel")
        .value("DEBUG", PC_LOG_DEBUG)
        .value("INFO", PC_LOG_INFO)
        .value("WARN", PC_LOG_WARN)
        .value("ERROR", PC_LOG_ERROR);

    m.def("set_log_level", &probe::set_log_level, nb::arg("level"));
}
