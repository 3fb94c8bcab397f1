#include "lgtools/lgmd.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace lgtools::lgmd;

namespace {

Model objects_model(size_t count) {
    Model m;
    m.objects.resize(count);
    for (size_t i = 0; i < count; ++i)
        m.objects[i].name = "o" + std::to_string(i);
    return m;
}

Polygon tri(uint16_t a, uint16_t b, uint16_t c) {
    Polygon p;
    p.type = poly_type_flat_rgb;
    p.points = {a, b, c};
    p.lights = {0, 0, 0};
    return p;
}

void expect_forest(const Model& m) {
    const int n = static_cast<int>(m.objects.size());
    for (int i = 0; i < n; ++i) {
        // Walking up from any node reaches a root within n steps.
        int x = i;
        int steps = 0;
        while (x != -1 && steps <= n) {
            x = m.objects[static_cast<size_t>(x)].parent;
            ++steps;
        }
        EXPECT_EQ(x, -1) << "object " << i << " is on a cycle";

        for (int c : m.objects[static_cast<size_t>(i)].children)
            EXPECT_EQ(m.objects[static_cast<size_t>(c)].parent, i);
    }
}

} // namespace

TEST(Link, ChildAndSiblingChain) {
    auto m = objects_model(4);
    m.objects[0].child = 1;
    m.objects[1].sibling = 2;
    m.objects[2].child = 3;

    auto report = link_objects(m);
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(report.roots, 1u);
    EXPECT_EQ(m.objects[0].parent, -1);
    EXPECT_EQ(m.objects[1].parent, 0);
    EXPECT_EQ(m.objects[2].parent, 0);
    EXPECT_EQ(m.objects[3].parent, 2);
    EXPECT_EQ(m.objects[0].children, (std::vector<int>{1, 2}));
    EXPECT_EQ(m.objects[2].children, (std::vector<int>{3}));
    expect_forest(m);
}

TEST(Link, NoLinksGivesAllRoots) {
    auto m = objects_model(3);
    auto report = link_objects(m);
    EXPECT_EQ(report.roots, 3u);
    EXPECT_TRUE(report.warnings.empty());
}

TEST(Link, SelfLoopTerminates) {
    auto m = objects_model(2);
    m.objects[0].child = 0;
    m.objects[1].sibling = 1;

    auto report = link_objects(m);
    EXPECT_FALSE(report.warnings.empty());
    EXPECT_EQ(m.objects[0].parent, -1);
    EXPECT_TRUE(m.objects[0].children.empty());
    expect_forest(m);
}

TEST(Link, TwoNodeCycle) {
    auto m = objects_model(2);
    m.objects[0].child = 1;
    m.objects[1].child = 0;

    auto report = link_objects(m);
    EXPECT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(m.objects[1].parent, 0);
    EXPECT_EQ(m.objects[0].parent, -1);
    EXPECT_EQ(report.roots, 1u);
    expect_forest(m);
}

TEST(Link, SiblingChainLoop) {
    auto m = objects_model(3);
    m.objects[0].child = 1;
    m.objects[1].sibling = 2;
    m.objects[2].sibling = 1;

    auto report = link_objects(m);
    EXPECT_EQ(m.objects[0].children, (std::vector<int>{1, 2}));
    EXPECT_FALSE(report.warnings.empty());
    expect_forest(m);
}

TEST(Link, FirstParentWins) {
    auto m = objects_model(3);
    m.objects[0].child = 2;
    m.objects[1].child = 2;

    auto report = link_objects(m);
    EXPECT_EQ(m.objects[2].parent, 0);
    EXPECT_TRUE(m.objects[1].children.empty());
    EXPECT_EQ(report.warnings.size(), 1u);
    expect_forest(m);
}

TEST(Link, OutOfRangeLink) {
    auto m = objects_model(2);
    m.objects[0].child = 1;
    m.objects[1].sibling = 7;

    auto report = link_objects(m);
    EXPECT_EQ(m.objects[1].parent, 0);
    EXPECT_EQ(report.warnings.size(), 1u);
    expect_forest(m);
}

TEST(Link, RelinkIsStable) {
    auto m = objects_model(3);
    m.objects[0].child = 1;
    m.objects[1].sibling = 2;
    link_objects(m);
    link_objects(m);
    EXPECT_EQ(m.objects[0].children, (std::vector<int>{1, 2}));
}

TEST(Link, PolygonsGoToFirstTouchingObject) {
    auto m = objects_model(2);
    m.objects[0].first_point = 0;
    m.objects[0].num_points = 3;
    m.objects[1].first_point = 3;
    m.objects[1].num_points = 3;
    m.polygons = {tri(0, 1, 2), tri(3, 4, 5), tri(2, 3, 4), tri(9, 10, 11)};

    auto report = link_objects(m);
    EXPECT_EQ(m.objects[0].polygons, (std::vector<uint32_t>{0, 2}));
    EXPECT_EQ(m.objects[1].polygons, (std::vector<uint32_t>{1}));
    EXPECT_EQ(report.unassigned_polygons, 1u);
}

TEST(Link, EachPolygonAssignedOnce) {
    auto m = objects_model(2);
    // Overlapping ranges: the first object still owns everything it touches.
    m.objects[0].num_points = 4;
    m.objects[1].num_points = 4;
    m.polygons = {tri(0, 1, 2), tri(1, 2, 3)};

    link_objects(m);
    size_t total = m.objects[0].polygons.size() + m.objects[1].polygons.size();
    EXPECT_EQ(total, 2u);
    EXPECT_TRUE(m.objects[1].polygons.empty());
}
