#include "lgtools/lgmesh.h"

#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

namespace lgtools::lgmesh {

namespace {

using lgmd::Model;
using lgmd::Polygon;

// emit_corner appends one vertex of polygon corner `corner`.
void emit_corner(const Model& model, const Polygon& poly, size_t corner, TriangleBuffer& out) {
    const auto p = model.point(poly.points[corner]);
    out.positions.push_back(p[0]);
    out.positions.push_back(p[1]);
    out.positions.push_back(p[2]);

    const auto& n = model.lights[poly.lights[corner]].normal;
    out.normals.push_back(n[0]);
    out.normals.push_back(n[1]);
    out.normals.push_back(n[2]);

    if (poly.textured()) {
        const size_t uv = static_cast<size_t>((*poly.uvs)[corner]) * 2;
        // Stored UVs have a top-left origin.
        out.uvs.push_back(model.uvmaps[uv]);
        out.uvs.push_back(1.0f - model.uvmaps[uv + 1]);
    } else {
        out.uvs.push_back(0.0f);
        out.uvs.push_back(0.0f);
    }
}

void emit_triangle(const Model& model, const Polygon& poly,
                   size_t a, size_t b, size_t c, TriangleBuffer& out) {
    const auto start = static_cast<uint32_t>(out.vertex_count());
    emit_corner(model, poly, a, out);
    emit_corner(model, poly, b, out);
    emit_corner(model, poly, c, out);

    if (out.groups.empty() || out.groups.back().material_index != poly.material_index)
        out.groups.push_back(MaterialGroup{start, 0, poly.material_index});
    out.groups.back().count += 3;
}

// triangulate reverses the stored winding. Triangles are emitted as-is in
// reverse order; larger faces are fanned around corner 0 as (0, i+1, i).
void triangulate(const Model& model, const Polygon& poly, TriangleBuffer& out) {
    const size_t n = poly.vertex_count();
    if (n == 3) {
        emit_triangle(model, poly, 2, 1, 0, out);
        return;
    }
    for (size_t i = 1; i + 1 < n; ++i)
        emit_triangle(model, poly, 0, i + 1, i, out);
}

} // namespace

std::optional<Matrix4> local_transform(const lgmd::Transform& t) {
    if (t.type == 0) return std::nullopt;

    Matrix4 m = identity;
    for (size_t col = 0; col < 3; ++col) {
        for (size_t row = 0; row < 3; ++row)
            m[col * 4 + row] = t.axis[col][row];
    }
    m[12] = t.center[0];
    m[13] = t.center[1];
    m[14] = t.center[2];
    return m;
}

ObjectGeometry build_object(const lgmd::Model& model, size_t object_index) {
    if (object_index >= model.objects.size())
        throw std::out_of_range(std::format(
            "lgmesh: object index {} out of range ({} objects)", object_index, model.objects.size()));

    const auto& obj = model.objects[object_index];

    ObjectGeometry geom;
    geom.transform = local_transform(obj.transform);

    TriangleBuffer buf;
    for (auto pi : obj.polygons)
        triangulate(model, model.polygons[pi], buf);

    if (buf.vertex_count() > 0)
        geom.mesh = std::move(buf);
    return geom;
}

std::vector<ObjectGeometry> build(const lgmd::Model& model) {
    std::vector<ObjectGeometry> out;
    out.reserve(model.objects.size());
    for (size_t i = 0; i < model.objects.size(); ++i)
        out.push_back(build_object(model, i));
    return out;
}

Matrix4 multiply(const Matrix4& a, const Matrix4& b) {
    Matrix4 r{};
    for (size_t col = 0; col < 4; ++col) {
        for (size_t row = 0; row < 4; ++row) {
            float sum = 0.0f;
            for (size_t k = 0; k < 4; ++k)
                sum += a[k * 4 + row] * b[col * 4 + k];
            r[col * 4 + row] = sum;
        }
    }
    return r;
}

std::vector<Matrix4> world_transforms(const lgmd::Model& model,
                                      const std::vector<ObjectGeometry>& geometry) {
    const size_t n = model.objects.size();
    std::vector<Matrix4> world(n, identity);

    auto local = [&](size_t i) -> Matrix4 {
        if (i < geometry.size() && geometry[i].transform) return *geometry[i].transform;
        return identity;
    };

    // link_objects guarantees a forest, so a walk from the roots reaches
    // every object exactly once.
    std::vector<size_t> stack;
    for (size_t i = 0; i < n; ++i) {
        if (model.objects[i].parent == -1) {
            world[i] = local(i);
            stack.push_back(i);
        }
    }
    while (!stack.empty()) {
        auto p = stack.back();
        stack.pop_back();
        for (int c : model.objects[p].children) {
            auto ci = static_cast<size_t>(c);
            world[ci] = multiply(world[p], local(ci));
            stack.push_back(ci);
        }
    }
    return world;
}

lgmd::Vector3 transform_point(const Matrix4& m, const lgmd::Vector3& p) {
    return {m[0] * p[0] + m[4] * p[1] + m[8] * p[2] + m[12],
            m[1] * p[0] + m[5] * p[1] + m[9] * p[2] + m[13],
            m[2] * p[0] + m[6] * p[1] + m[10] * p[2] + m[14]};
}

lgmd::Vector3 transform_direction(const Matrix4& m, const lgmd::Vector3& d) {
    lgmd::Vector3 r = {m[0] * d[0] + m[4] * d[1] + m[8] * d[2],
                       m[1] * d[0] + m[5] * d[1] + m[9] * d[2],
                       m[2] * d[0] + m[6] * d[1] + m[10] * d[2]};
    float len = std::sqrt(r[0] * r[0] + r[1] * r[1] + r[2] * r[2]);
    if (len > 0.0f) {
        for (auto& v : r) v /= len;
    }
    return r;
}

} // namespace lgtools::lgmesh
