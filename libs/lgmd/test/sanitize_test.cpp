#include "lgtools/lgmd.h"

#include "lgmd_builder.h"

#include <gtest/gtest.h>

using namespace lgtools::lgmd;
using namespace lgmd_test;

namespace {

// base_model decodes a textured quad plus the flat triangle: 4 points,
// 4 lights, 1 normal, 4 uv entries and 2 materials.
Model base_model() {
    TestModel tm = flat_triangle_model();
    TestMaterial wood;
    wood.name = "wood.gif";
    tm.materials.push_back(wood);
    tm.points.push_back({1.0f, 1.0f, 0.0f});
    tm.lights.push_back({0, 3, 0});
    tm.uvs = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};
    tm.objects[0].num_points = 4;
    auto data = tm.bytes();
    return decode(data);
}

Polygon flat(std::vector<uint16_t> points) {
    Polygon p;
    p.type = poly_type_flat_rgb;
    p.material_ref = 1;
    p.lights = points;
    p.points = std::move(points);
    return p;
}

Polygon textured(std::vector<uint16_t> points, std::vector<uint16_t> uvs) {
    Polygon p = flat(std::move(points));
    p.type = poly_type_textured;
    p.uvs = std::move(uvs);
    return p;
}

void expect_no_dangling(const Model& m) {
    const size_t num_points = m.points.size() / 3;
    const size_t num_normals = m.normals.size() / 3;
    const size_t num_uvs = m.uvmaps.size() / 2;
    for (const auto& p : m.polygons) {
        EXPECT_GE(p.vertex_count(), 3u);
        EXPECT_LT(p.normal, num_normals);
        ASSERT_EQ(p.lights.size(), p.points.size());
        for (auto i : p.points) EXPECT_LT(i, num_points);
        for (auto i : p.lights) EXPECT_LT(i, m.lights.size());
        if (p.textured()) {
            ASSERT_TRUE(p.uvs.has_value());
            for (auto i : *p.uvs) EXPECT_LT(i, num_uvs);
        }
        EXPECT_LT(p.material_index, std::max<size_t>(m.materials.size(), 1));
    }
}

} // namespace

TEST(Sanitize, KeepsValidPolygons) {
    auto m = base_model();
    m.polygons = {flat({0, 1, 2}), textured({0, 1, 3, 2}, {0, 1, 2, 3})};
    auto report = sanitize(m);
    EXPECT_EQ(report.kept, 2u);
    EXPECT_EQ(report.dropped, 0u);
    expect_no_dangling(m);
}

TEST(Sanitize, DropsUnknownType) {
    auto m = base_model();
    auto p = flat({0, 1, 2});
    p.type = 0x42;
    m.polygons = {p, flat({1, 2, 3})};
    auto report = sanitize(m);
    EXPECT_EQ(report.dropped, 1u);
    ASSERT_EQ(m.polygons.size(), 1u);
    EXPECT_EQ(m.polygons[0].points, (std::vector<uint16_t>{1, 2, 3}));
}

TEST(Sanitize, DropsDegenerate) {
    auto m = base_model();
    m.polygons = {flat({0, 1}), flat({}), flat({0, 1, 2})};
    auto report = sanitize(m);
    EXPECT_EQ(report.dropped, 2u);
    EXPECT_EQ(report.kept, 1u);
}

TEST(Sanitize, DropsOutOfRangePoint) {
    auto m = base_model();
    auto p = flat({0, 1, 4});
    p.lights = {0, 1, 2};
    m.polygons = {p};
    sanitize(m);
    EXPECT_TRUE(m.polygons.empty());
}

TEST(Sanitize, DropsOutOfRangeLight) {
    auto m = base_model();
    auto p = flat({0, 1, 2});
    p.lights = {0, 1, 9};
    m.polygons = {p};
    sanitize(m);
    EXPECT_TRUE(m.polygons.empty());
}

TEST(Sanitize, DropsOutOfRangeNormal) {
    auto m = base_model();
    auto p = flat({0, 1, 2});
    p.normal = 1;
    m.polygons = {p};
    sanitize(m);
    EXPECT_TRUE(m.polygons.empty());
}

TEST(Sanitize, DropsBadUvIndex) {
    auto m = base_model();
    m.polygons = {textured({0, 1, 2}, {0, 1, 4}),
                  textured({0, 1, 2}, {0, 1}),
                  textured({0, 1, 2}, {0, 1, 2})};
    auto p = textured({0, 1, 2}, {});
    p.uvs.reset();
    m.polygons.push_back(p);

    auto report = sanitize(m);
    EXPECT_EQ(report.dropped, 3u);
    ASSERT_EQ(m.polygons.size(), 1u);
    EXPECT_EQ(*m.polygons[0].uvs, (std::vector<uint16_t>{0, 1, 2}));
}

TEST(Sanitize, DropsTexturedWithoutUvTable) {
    auto m = base_model();
    m.uvmaps.clear();
    m.num_uvmaps = 0;
    m.polygons = {textured({0, 1, 2}, {0, 0, 0}), flat({0, 1, 2})};
    auto report = sanitize(m);
    EXPECT_EQ(report.dropped, 1u);
    EXPECT_FALSE(m.polygons[0].textured());
}

TEST(Sanitize, IndexEqualToCountIsRejected) {
    auto m = base_model();
    m.polygons = {flat({0, 1, 2})};
    m.polygons[0].points[2] = static_cast<uint16_t>(m.points.size() / 3);
    sanitize(m);
    EXPECT_TRUE(m.polygons.empty());
}

TEST(Sanitize, MaterialFromReference) {
    auto m = base_model();
    auto a = flat({0, 1, 2});
    a.material_ref = 2;
    auto b = flat({0, 1, 2});
    b.material_ref = 0; // below range
    auto c = flat({0, 1, 2});
    c.material_ref = 99; // above range
    m.polygons = {a, b, c};

    sanitize(m);
    ASSERT_EQ(m.polygons.size(), 3u);
    EXPECT_EQ(m.polygons[0].material_index, 1u);
    EXPECT_EQ(m.polygons[1].material_index, 0u);
    EXPECT_EQ(m.polygons[2].material_index, 1u);
}

TEST(Sanitize, MaterialByteWins) {
    auto m = base_model();
    auto p = flat({0, 1, 2});
    p.material_ref = 1;
    p.material_byte = 1;
    auto q = flat({0, 1, 2});
    q.material_byte = 200;
    m.polygons = {p, q};

    sanitize(m);
    EXPECT_EQ(m.polygons[0].material_index, 1u);
    EXPECT_EQ(m.polygons[1].material_index, 1u);
}

TEST(Sanitize, NoMaterials) {
    auto m = base_model();
    m.materials.clear();
    auto p = flat({0, 1, 2});
    p.material_ref = 5;
    m.polygons = {p};
    sanitize(m);
    ASSERT_EQ(m.polygons.size(), 1u);
    EXPECT_EQ(m.polygons[0].material_index, 0u);
}

TEST(Sanitize, Idempotent) {
    auto m = base_model();
    m.polygons = {flat({0, 1, 2}), flat({0, 7, 2}), textured({0, 1, 3}, {0, 1, 3})};
    auto first = sanitize(m);
    auto second = sanitize(m);
    EXPECT_EQ(first.kept, 2u);
    EXPECT_EQ(second.kept, 2u);
    EXPECT_EQ(second.dropped, 0u);
    expect_no_dangling(m);
}
