#include "lgtools/lgmd.h"

#include <algorithm>

namespace lgtools::lgmd {

namespace {

struct Limits {
    size_t points = 0;
    size_t normals = 0;
    size_t lights = 0;
    size_t uvs = 0;
    bool has_uv_table = false;
};

bool known_type(uint8_t type) {
    return type == poly_type_textured || type == poly_type_flat_rgb ||
           type == poly_type_paletted;
}

bool all_below(const std::vector<uint16_t>& indices, size_t limit) {
    return std::all_of(indices.begin(), indices.end(),
                       [limit](uint16_t idx) { return idx < limit; });
}

bool valid_polygon(const Polygon& poly, const Limits& lim) {
    if (!known_type(poly.type)) return false;

    const auto n = poly.points.size();
    if (n < 3) return false;

    if (poly.normal >= lim.normals) return false;
    if (!all_below(poly.points, lim.points)) return false;

    // Vertex normals live in the light table, one entry per vertex.
    if (poly.lights.size() != n) return false;
    if (!all_below(poly.lights, lim.lights)) return false;

    if (poly.textured()) {
        if (!poly.uvs || poly.uvs->size() != n) return false;
        if (!lim.has_uv_table) return false;
        if (!all_below(*poly.uvs, lim.uvs)) return false;
    }
    return true;
}

uint32_t normalize_material(const Polygon& poly, size_t material_count) {
    const int64_t max_index = std::max<int64_t>(static_cast<int64_t>(material_count), 1) - 1;
    int64_t idx = poly.material_byte ? static_cast<int64_t>(*poly.material_byte)
                                     : static_cast<int64_t>(poly.material_ref) - 1;
    return static_cast<uint32_t>(std::clamp<int64_t>(idx, 0, max_index));
}

} // namespace

SanitizeReport sanitize(Model& model) {
    Limits lim;
    lim.points = model.points.size() / 3;
    lim.normals = model.normals.size() / 3;
    lim.lights = model.lights.size();
    lim.uvs = model.uvmaps.size() / 2;
    lim.has_uv_table = model.num_uvmaps > 0 && !model.uvmaps.empty();

    const auto before = model.polygons.size();
    model.polygons.erase(std::remove_if(model.polygons.begin(), model.polygons.end(),
                                        [&lim](const Polygon& poly) {
                                            return !valid_polygon(poly, lim);
                                        }),
                         model.polygons.end());

    for (auto& poly : model.polygons)
        poly.material_index = normalize_material(poly, model.materials.size());

    SanitizeReport report;
    report.kept = model.polygons.size();
    report.dropped = before - report.kept;
    return report;
}

} // namespace lgtools::lgmd
