#pragma once

#include "lgtools/lgmd.h"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace lgtools::lgmesh {

// Matrix4 is column-major: m[col * 4 + row].
using Matrix4 = std::array<float, 16>;

constexpr Matrix4 identity = {1.0f, 0.0f, 0.0f, 0.0f,
                              0.0f, 1.0f, 0.0f, 0.0f,
                              0.0f, 0.0f, 1.0f, 0.0f,
                              0.0f, 0.0f, 0.0f, 1.0f};

// MaterialGroup is a run of consecutive vertices sharing one material.
struct MaterialGroup {
    uint32_t start = 0; // first vertex
    uint32_t count = 0; // vertices, always a multiple of 3
    uint32_t material_index = 0;
};

// TriangleBuffer holds non-indexed triangles: three vertices per triangle,
// counter-clockwise front faces.
struct TriangleBuffer {
    std::vector<float> positions; // x,y,z per vertex
    std::vector<float> normals;   // x,y,z per vertex
    std::vector<float> uvs;       // u,v per vertex, v flipped to bottom-left origin
    std::vector<MaterialGroup> groups;

    size_t vertex_count() const { return positions.size() / 3; }
    size_t triangle_count() const { return vertex_count() / 3; }
};

struct ObjectGeometry {
    std::optional<TriangleBuffer> mesh;  // absent when the object owns no polygons
    std::optional<Matrix4> transform;    // absent for identity (type 0) transforms
};

// local_transform assembles the object-local matrix: the three axes become
// the first three columns and center the translation column.
// Returns std::nullopt when t.type is 0.
std::optional<Matrix4> local_transform(const lgmd::Transform& t);

// build_object triangulates the polygons owned by one sub-object.
// The model must have been through sanitize and link_objects.
// Throws std::out_of_range for an object index outside the table.
ObjectGeometry build_object(const lgmd::Model& model, size_t object_index);

// build runs build_object for every sub-object, in table order.
std::vector<ObjectGeometry> build(const lgmd::Model& model);

// world_transforms composes each object's local matrix with its parent's
// world matrix. Objects without a transform contribute identity.
std::vector<Matrix4> world_transforms(const lgmd::Model& model,
                                      const std::vector<ObjectGeometry>& geometry);

Matrix4 multiply(const Matrix4& a, const Matrix4& b);

lgmd::Vector3 transform_point(const Matrix4& m, const lgmd::Vector3& p);

// transform_direction applies only the 3x3 part and renormalizes.
lgmd::Vector3 transform_direction(const Matrix4& m, const lgmd::Vector3& d);

} // namespace lgtools::lgmesh
