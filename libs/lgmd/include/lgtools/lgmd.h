#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace lgtools::lgmd {

using Vector3 = std::array<float, 3>;

// "LGMD" read as a little-endian u32.
constexpr uint32_t signature = 0x444D474C;

// Version 4 adds the extended material block and per-polygon material bytes.
constexpr uint32_t extended_version = 4;

// Fixed on-disk record sizes.
constexpr size_t header_size = 110;
constexpr size_t header_size_v4 = 122;
constexpr size_t material_record_size = 26;
constexpr size_t light_record_size = 8;
constexpr size_t vhot_record_size = 16;
constexpr size_t polygon_header_size = 12;
constexpr size_t transform_record_size = 61;
constexpr size_t object_record_size = 93;

// Polygon type bytes.
constexpr uint8_t poly_type_textured = 0x1B;
constexpr uint8_t poly_type_flat_rgb = 0x59;
constexpr uint8_t poly_type_paletted = 0x39;

// Raw material type bytes.
constexpr uint8_t material_type_texture = 0;
constexpr uint8_t material_type_color = 1;

// FormatError is thrown when the buffer does not start with the LGMD magic.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Transform is the rigid joint of a sub-object. type 0 means identity.
struct Transform {
    uint8_t type = 0;
    int32_t id = -1;
    float min_range = 0.0f;
    float max_range = 0.0f;
    std::array<Vector3, 3> axis = {Vector3{1.0f, 0.0f, 0.0f},
                                   Vector3{0.0f, 1.0f, 0.0f},
                                   Vector3{0.0f, 0.0f, 1.0f}};
    Vector3 center = {0.0f, 0.0f, 0.0f};
};

struct SubObject {
    std::string name;
    Transform transform;

    // On-disk first-child / next-sibling links (-1 = none). Use parent and
    // children once link_objects has run.
    int16_t child = -1;
    int16_t sibling = -1;

    uint16_t first_vhot = 0;
    uint16_t num_vhots = 0;
    uint16_t first_point = 0;
    uint16_t num_points = 0;
    uint16_t first_light = 0;
    uint16_t num_lights = 0;
    uint16_t first_normal = 0;
    uint16_t num_normals = 0;
    uint16_t first_node = 0; // byte offset into the node table
    uint16_t num_nodes = 0;

    // Filled by link_objects.
    int parent = -1;
    std::vector<int> children;
    std::vector<uint32_t> polygons; // indices into Model::polygons
};

struct TextureMaterial {
    uint32_t handle = 0;
    float uv_scale = 0.0f;
};

struct ColorMaterial {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;
    uint32_t palette_index = 0;
};

// ReplacerMaterial is a "replace<N>.gif" placeholder whose texture is
// assigned externally. The texture tail is kept as stored.
struct ReplacerMaterial {
    int slot = 0;
    uint32_t handle = 0;
    float uv_scale = 0.0f;
};

using MaterialKind = std::variant<TextureMaterial, ColorMaterial, ReplacerMaterial>;

// MaterialExtra comes from the version 4 extended material block.
struct MaterialExtra {
    float translucency = 0.0f;
    float illumination = 0.0f;
};

struct Material {
    std::string name;
    uint8_t raw_type = material_type_texture;
    int8_t id = 0;
    MaterialKind kind;
    std::optional<MaterialExtra> extra;
};

struct Light {
    uint16_t object = 0;
    uint16_t point = 0;
    Vector3 normal = {0.0f, 0.0f, 0.0f};
};

struct Vhot {
    int32_t id = 0;
    Vector3 point = {0.0f, 0.0f, 0.0f};
};

struct Polygon {
    int16_t id = 0;
    int16_t material_ref = 0;                // 1-based reference as stored
    std::optional<uint8_t> material_byte;    // version 4 only, 0-based
    uint32_t material_index = 0;             // normalized by sanitize
    uint8_t type = 0;
    uint16_t normal = 0;
    float plane = 0.0f;
    std::vector<uint16_t> points;
    std::vector<uint16_t> lights;
    std::optional<std::vector<uint16_t>> uvs; // textured polygons only
    uint32_t table_offset = 0;                // byte offset within the polygon table

    size_t vertex_count() const { return points.size(); }
    bool textured() const { return type == poly_type_textured; }
};

struct Model {
    uint32_t signature = 0;
    uint32_t version = 0;
    std::string name;

    float max_radius = 0.0f;
    float min_radius = 0.0f;
    Vector3 max_bounds = {0.0f, 0.0f, 0.0f};
    Vector3 min_bounds = {0.0f, 0.0f, 0.0f};
    Vector3 center = {0.0f, 0.0f, 0.0f};

    uint16_t num_polys = 0;
    uint16_t num_points = 0;
    uint16_t num_params = 0;
    uint8_t num_materials = 0;
    uint8_t num_vcalls = 0;
    uint8_t num_vhots = 0;
    uint8_t num_objs = 0;

    uint32_t offset_obj = 0;
    uint32_t offset_material = 0;
    uint32_t offset_mapping = 0;
    uint32_t offset_vhot = 0;
    uint32_t offset_point = 0;
    uint32_t offset_light = 0;
    uint32_t offset_normal = 0;
    uint32_t offset_poly = 0;
    uint32_t offset_node = 0;
    uint32_t bin_size = 0;

    // Version 4 only.
    uint32_t material_ex_flags = 0;
    uint32_t material_ex_offset = 0;
    uint32_t material_ex_size = 0;
    bool uses_trans = false;
    bool uses_illum = false;

    // Derived from offset deltas.
    uint32_t num_uvmaps = 0;
    uint32_t num_lights = 0;
    uint32_t num_normals = 0;
    uint32_t num_nodes = 0;

    std::vector<float> points;  // x,y,z per point
    std::vector<float> normals; // x,y,z per normal
    std::vector<float> uvmaps;  // u,v per entry
    std::vector<Light> lights;
    std::vector<Vhot> vhots;
    std::vector<Material> materials;
    std::vector<Polygon> polygons;
    std::vector<SubObject> objects;

    Vector3 point(size_t i) const {
        return {points[i * 3], points[i * 3 + 1], points[i * 3 + 2]};
    }
};

struct SanitizeReport {
    size_t kept = 0;
    size_t dropped = 0;
};

struct LinkReport {
    size_t roots = 0;
    size_t unassigned_polygons = 0;
    std::vector<std::string> warnings; // one per refused child/sibling link
};

// decode parses the header and every record table. Throws FormatError on a
// wrong magic and binutil::OutOfBounds when a table runs past the buffer.
// Polygons are returned exactly as stored; run sanitize before using them.
Model decode(std::span<const uint8_t> data);

// sanitize drops polygons with an unknown type, a bad vertex count or any
// out-of-range index and sets material_index on the survivors.
SanitizeReport sanitize(Model& model);

// link_objects rebuilds parent/children from the child/sibling links and
// assigns each polygon to the first object whose point range it touches.
// Cyclic or conflicting links are refused and reported, never followed.
LinkReport link_objects(Model& model);

struct ReadResult {
    Model model;
    SanitizeReport sanitize;
    LinkReport link;
};

// read runs decode, sanitize and link_objects.
ReadResult read(std::span<const uint8_t> data);

// read loads the whole stream, then behaves like read(span).
ReadResult read(std::istream& r);

// unpack_light_normal decodes the 32-bit packed normal of a light record.
Vector3 unpack_light_normal(uint32_t packed);

// replacer_slot returns 0..3 for "replace0".."replace3" (any case, optional
// ".gif"), std::nullopt otherwise.
std::optional<int> replacer_slot(const std::string& name);

// kind_name returns "texture", "color" or "replacer".
const char* kind_name(const MaterialKind& kind);

// poly_type_name returns a readable name for a polygon type byte.
const char* poly_type_name(uint8_t type);

// translucency and illumination return the material's extended values only
// when the model's extended flags enable them, 0 otherwise.
float translucency(const Model& model, const Material& mat);
float illumination(const Model& model, const Material& mat);

} // namespace lgtools::lgmd
