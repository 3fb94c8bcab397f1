#include "lgtools/lgmd.h"
#include "lgtools/lgmesh.h"

#include "lgmd_builder.h"

#include <gtest/gtest.h>

#include <sstream>

namespace lgmd = lgtools::lgmd;
namespace lgmesh = lgtools::lgmesh;
using namespace lgmd_test;

namespace {

// hinged_box_model is a two-object model: a base triangle and a lid quad
// hanging off the base through a rotating joint, plus one broken polygon.
TestModel hinged_box_model() {
    TestModel m = flat_triangle_model();
    m.version = 4;

    TestMaterial lid_tex;
    lid_tex.name = "Lid.gif";
    lid_tex.translucency = 0.5f;
    m.materials.push_back(lid_tex);

    const uint32_t up = pack_light_normal(0.0f, 0.0f, 1.0f);
    for (uint16_t i = 3; i < 7; ++i) {
        m.points.push_back({static_cast<float>(i), 0.0f, 0.0f});
        m.lights.push_back({1, i, up});
    }
    m.uvs = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};

    TestPolygon lid;
    lid.type = lgmd::poly_type_textured;
    lid.points = {3, 4, 5, 6};
    lid.lights = {3, 4, 5, 6};
    lid.uvs = {0, 1, 2, 3};
    lid.material_byte = 1;
    m.polygons.push_back(lid);

    TestPolygon broken;
    broken.points = {0, 1, 60};
    broken.lights = {0, 1, 2};
    m.polygons.push_back(broken);

    m.objects[0].child = 1;

    TestObject hinge;
    hinge.name = "lid";
    hinge.transform_type = 1;
    hinge.center = {0.0f, 0.0f, 2.0f};
    hinge.first_point = 3;
    hinge.num_points = 4;
    hinge.first_light = 3;
    hinge.num_lights = 4;
    m.objects.push_back(hinge);
    return m;
}

} // namespace

TEST(Pipeline, FlatTriangle) {
    std::istringstream s(flat_triangle_model().build());
    auto result = lgmd::read(s);

    ASSERT_EQ(result.model.objects.size(), 1u);
    auto geometry = lgmesh::build(result.model);
    ASSERT_EQ(geometry.size(), 1u);
    ASSERT_TRUE(geometry[0].mesh.has_value());
    const auto& mesh = *geometry[0].mesh;
    EXPECT_EQ(mesh.vertex_count(), 3u);
    ASSERT_EQ(mesh.groups.size(), 1u);
    EXPECT_EQ(mesh.groups[0].start, 0u);
    EXPECT_EQ(mesh.groups[0].count, 3u);
    EXPECT_EQ(mesh.groups[0].material_index, 0u);
    EXPECT_FALSE(geometry[0].transform.has_value());

    const auto& mat = result.model.materials[mesh.groups[0].material_index];
    ASSERT_TRUE(std::holds_alternative<lgmd::ColorMaterial>(mat.kind));
    EXPECT_EQ(std::get<lgmd::ColorMaterial>(mat.kind).red, 255);

    // Every normal comes from the light table.
    for (size_t v = 0; v < mesh.vertex_count(); ++v)
        EXPECT_FLOAT_EQ(mesh.normals[v * 3 + 2], 1.0f);
}

TEST(Pipeline, HingedBox) {
    auto data = hinged_box_model().bytes();
    auto result = lgmd::read(std::span<const uint8_t>(data));
    const auto& model = result.model;

    EXPECT_EQ(result.sanitize.kept, 2u);
    EXPECT_EQ(result.sanitize.dropped, 1u);
    EXPECT_EQ(result.link.roots, 1u);
    EXPECT_TRUE(result.link.warnings.empty());
    EXPECT_EQ(model.objects[1].parent, 0);

    ASSERT_TRUE(model.materials[1].extra.has_value());
    EXPECT_FLOAT_EQ(model.materials[1].extra->translucency, 0.5f);

    auto geometry = lgmesh::build(model);
    ASSERT_EQ(geometry.size(), 2u);
    ASSERT_TRUE(geometry[0].mesh.has_value());
    ASSERT_TRUE(geometry[1].mesh.has_value());
    EXPECT_EQ(geometry[0].mesh->triangle_count(), 1u);
    EXPECT_EQ(geometry[1].mesh->triangle_count(), 2u);
    ASSERT_EQ(geometry[1].mesh->groups.size(), 1u);
    EXPECT_EQ(geometry[1].mesh->groups[0].material_index, 1u);

    auto world = lgmesh::world_transforms(model, geometry);
    auto p = lgmesh::transform_point(world[1], model.point(3));
    EXPECT_FLOAT_EQ(p[0], 3.0f);
    EXPECT_FLOAT_EQ(p[2], 2.0f);
}

TEST(Pipeline, UnknownFormatRejected) {
    std::istringstream s(std::string("PK\x03\x04 not a model"));
    EXPECT_THROW(lgmd::read(s), lgmd::FormatError);
}
