#include <gtest/gtest.h>
#include <mesh/mesh_assembler.hpp>
#include <gear/gear_errors.hpp>
#include <gear/ring_builder.hpp>
#include <gear/tooth_profiles.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <numbers>
#include <utility>

using namespace geargen;
using namespace geargen::test;

namespace {

Mesh build(const GearSpec& spec) {
    return assemble(build_rings(spec), spec);
}

Vec3 face_normal(const Mesh& mesh, const Face& face) {
    const Vec3& a = mesh.vertices()[face.indices[0]];
    const Vec3& b = mesh.vertices()[face.indices[1]];
    const Vec3& c = mesh.vertices()[face.indices[2]];
    return (b - a).cross(c - a);
}

}  // namespace

// ============================================
// Size law Tests
// ============================================

TEST(MeshAssemblerTest, FanCapSizeLaw) {
    for (int layers : {1, 2, 7}) {
        GearSpec spec = small_spec(5, 4, layers);
        Mesh mesh = build(spec);

        size_t ppr = 20;
        EXPECT_EQ(mesh.vertex_count(), (layers + 1) * ppr + 2) << "layers " << layers;
        EXPECT_EQ(mesh.face_count(), layers * ppr + 2 * ppr) << "layers " << layers;
        EXPECT_EQ(mesh.vertex_count(), expected_vertex_count(spec));
        EXPECT_EQ(mesh.face_count(), expected_face_count(spec));
    }
}

TEST(MeshAssemblerTest, EarClipCapSizeLaw) {
    GearSpec spec = small_spec(5, 4, 3);
    spec.cap_style = CapStyle::EarClip;
    Mesh mesh = build(spec);

    EXPECT_EQ(mesh.vertex_count(), 80u);
    EXPECT_EQ(mesh.face_count(), 3u * 20u + 2u * 18u);
    EXPECT_EQ(mesh.vertex_count(), expected_vertex_count(spec));
    EXPECT_EQ(mesh.face_count(), expected_face_count(spec));
}

TEST(MeshAssemblerTest, FaceKinds) {
    GearSpec spec = spur_spec(2);
    Mesh mesh = build(spec);

    const size_t side_faces = 2 * 240;
    for (size_t i = 0; i < mesh.face_count(); ++i) {
        EXPECT_EQ(mesh.faces()[i].size(), i < side_faces ? 4u : 3u) << "face " << i;
    }
}

// ============================================
// Vertex layout Tests
// ============================================

TEST(MeshAssemblerTest, VertexIndexIsLayerMajor) {
    GearSpec spec = spur_spec(3);
    spec.twist = [](int layer) { return 0.1 * layer; };
    auto rings = build_rings(spec);
    Mesh mesh = assemble(rings, spec);

    const size_t ppr = 240;
    for (int layer = 0; layer <= 3; ++layer) {
        for (size_t i = 0; i < ppr; i += 13) {
            Vec3 expected = lift_point(rings[layer].points[i], layer_z(spec, layer));
            EXPECT_EQ(mesh.vertices()[layer * ppr + i], expected);
        }
    }
}

TEST(MeshAssemblerTest, LayersEvenlySpaced) {
    GearSpec spec = spur_spec(4);
    EXPECT_DOUBLE_EQ(layer_z(spec, 0), 0.0);
    EXPECT_DOUBLE_EQ(layer_z(spec, 1), 1.0);
    EXPECT_DOUBLE_EQ(layer_z(spec, 4), 4.0);
}

TEST(MeshAssemblerTest, StraightTwelveToothGear) {
    GearSpec spec = spur_spec(1);
    spec.twist = [](int) { return 0.0; };
    auto rings = build_rings(spec);
    ASSERT_EQ(rings.size(), 2u);

    Mesh mesh = assemble(rings, spec);
    for (const auto& v : mesh.vertices()) {
        EXPECT_TRUE(v.z == 0.0 || v.z == 4.0) << "z = " << v.z;
    }
    for (size_t i = 0; i < 480; ++i) {
        double r = std::hypot(mesh.vertices()[i].x, mesh.vertices()[i].y);
        EXPECT_GE(r, 20.0 - 1e-9);
        EXPECT_LE(r, 24.0 + 1e-9);
    }

    // Twelve tooth tips on the bottom ring
    int tips = 0;
    for (size_t i = 0; i < 240; ++i) {
        double r = std::hypot(mesh.vertices()[i].x, mesh.vertices()[i].y);
        if (r > 24.0 - 1e-9) {
            ++tips;
        }
    }
    EXPECT_EQ(tips, 12);
}

TEST(MeshAssemblerTest, ConstantTwistIsPureExtrusion) {
    GearSpec spec = spur_spec(5);
    spec.twist = [](int) { return 1.25; };
    Mesh mesh = build(spec);

    const size_t ppr = 240;
    for (int layer = 1; layer <= 5; ++layer) {
        for (size_t i = 0; i < ppr; ++i) {
            const Vec3& base = mesh.vertices()[i];
            const Vec3& v = mesh.vertices()[layer * ppr + i];
            EXPECT_DOUBLE_EQ(v.x, base.x);
            EXPECT_DOUBLE_EQ(v.y, base.y);
            EXPECT_DOUBLE_EQ(v.z, layer * 0.8);
        }
    }
}

// ============================================
// Face layout Tests
// ============================================

TEST(MeshAssemblerTest, SideQuadsStitchAdjacentRings) {
    GearSpec spec = spur_spec(1);
    Mesh mesh = build(spec);

    EXPECT_EQ(mesh.faces()[0].indices, (std::vector<VertexIndex>{0, 1, 241, 240}));
    // Last quad of the band wraps back to point 0
    EXPECT_EQ(mesh.faces()[239].indices, (std::vector<VertexIndex>{239, 0, 240, 479}));
}

TEST(MeshAssemblerTest, CapsFollowSideWalls) {
    GearSpec spec = spur_spec(1);
    Mesh mesh = build(spec);

    // Bottom centre 480, top centre 481
    EXPECT_EQ(mesh.vertices()[480], Vec3(0.0, 0.0, 0.0));
    EXPECT_EQ(mesh.vertices()[481], Vec3(0.0, 0.0, 4.0));
    EXPECT_EQ(mesh.faces()[240].indices, (std::vector<VertexIndex>{1, 0, 480}));
    EXPECT_EQ(mesh.faces()[480].indices, (std::vector<VertexIndex>{240, 241, 481}));
}

TEST(MeshAssemblerTest, NormalsFaceOutward) {
    GearSpec spec = spur_spec(1);
    Mesh mesh = build(spec);

    for (size_t i = 0; i < 240; ++i) {
        const Face& face = mesh.faces()[i];
        const Vec3& a = mesh.vertices()[face.indices[0]];
        Vec3 radial(a.x, a.y, 0.0);
        EXPECT_GT(face_normal(mesh, face).dot(radial), 0.0) << "side face " << i;
    }
    for (size_t i = 240; i < 480; ++i) {
        EXPECT_LT(face_normal(mesh, mesh.faces()[i]).z, 0.0) << "bottom face " << i;
    }
    for (size_t i = 480; i < 720; ++i) {
        EXPECT_GT(face_normal(mesh, mesh.faces()[i]).z, 0.0) << "top face " << i;
    }
}

TEST(MeshAssemblerTest, ClosedAndOutwardForEveryCapStyle) {
    for (CapStyle style : {CapStyle::Fan, CapStyle::EarClip}) {
        GearSpec spec = spur_spec(6);
        spec.cap_style = style;
        spec.tooth_shape = tooth_shape_from_profile(profile::half_sine, spec.tooth_depth());
        spec.twist = twist_over_layers(twist::fishbone(0.2), spec.vertical_layers);
        Mesh mesh = build(spec);

        EXPECT_TRUE(mesh.is_edge_manifold()) << cap_style_name(style);

        double volume = mesh.signed_volume();
        EXPECT_GT(volume, std::numbers::pi * 20.0 * 20.0 * 4.0 * 0.99) << cap_style_name(style);
        EXPECT_LT(volume, std::numbers::pi * 24.0 * 24.0 * 4.0) << cap_style_name(style);
    }
}

TEST(MeshAssemblerTest, CapStylesEncloseSameVolume) {
    GearSpec fan = small_spec(6, 8, 2);
    fan.tooth_shape = tooth_shape_from_profile(profile::vshape, fan.tooth_depth());
    GearSpec ear = fan;
    ear.cap_style = CapStyle::EarClip;

    EXPECT_NEAR(build(fan).signed_volume(), build(ear).signed_volume(), 1e-9);
}

// ============================================
// Failure Tests
// ============================================

TEST(MeshAssemblerTest, CoincidentRingPointsAreDegenerate) {
    GearSpec spec = small_spec(2, 2, 1);

    Ring ring;
    ring.points = {
        {0.0, 2.5},
        {0.0, 2.5},
        {std::numbers::pi, 2.5},
        {1.5 * std::numbers::pi, 2.5}
    };
    Ring top = ring;
    top.layer = 1;

    EXPECT_THROW(assemble({ring, top}, spec), DegenerateMeshError);
}

TEST(MeshAssemblerTest, RingsMustMatchSpec) {
    GearSpec spec = small_spec(3, 3, 2);
    auto rings = build_rings(spec);

    auto missing = rings;
    missing.pop_back();
    EXPECT_THROW(assemble(missing, spec), InvalidParameter);

    auto short_ring = rings;
    short_ring[1].points.pop_back();
    EXPECT_THROW(assemble(short_ring, spec), InvalidParameter);

    auto swapped = rings;
    std::swap(swapped[0], swapped[1]);
    EXPECT_THROW(assemble(swapped, spec), InvalidParameter);
}
