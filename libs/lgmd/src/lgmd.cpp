#include "lgtools/lgmd.h"

#include "lgtools/binutil.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <stdexcept>
#include <string>

namespace lgtools::lgmd {

namespace {

using binutil::ByteReader;

// ---------------------------------------------------------------------------
// Header
// ---------------------------------------------------------------------------

static void read_header(ByteReader& r, Model& m) {
    m.version = r.read_u32();
    m.name = r.read_fixed_string(8);

    m.max_radius = r.read_f32();
    m.min_radius = r.read_f32();
    m.max_bounds = r.read_vec3();
    m.min_bounds = r.read_vec3();
    m.center = r.read_vec3();

    m.num_polys = r.read_u16();
    m.num_points = r.read_u16();
    m.num_params = r.read_u16();
    m.num_materials = r.read_u8();
    m.num_vcalls = r.read_u8();
    m.num_vhots = r.read_u8();
    m.num_objs = r.read_u8();

    m.offset_obj = r.read_u32();
    m.offset_material = r.read_u32();
    m.offset_mapping = r.read_u32();
    m.offset_vhot = r.read_u32();
    m.offset_point = r.read_u32();
    m.offset_light = r.read_u32();
    m.offset_normal = r.read_u32();
    m.offset_poly = r.read_u32();
    m.offset_node = r.read_u32();

    m.bin_size = r.read_u32();

    if (m.version == extended_version) {
        m.material_ex_flags = r.read_u32();
        m.material_ex_offset = r.read_u32();
        m.material_ex_size = r.read_u32();
        m.uses_trans = (m.material_ex_flags & 1) != 0;
        m.uses_illum = (m.material_ex_flags & 2) != 0;
    }
}

// table_count derives a record count from two table offsets. The format does
// not store these counts; it relies on the tables being laid out in order.
// A table out of order yields 0 rather than a negative count.
static uint32_t table_count(uint32_t start, uint32_t next, uint32_t record_size) {
    if (next <= start) return 0;
    return (next - start) / record_size;
}

// ---------------------------------------------------------------------------
// Record tables
// ---------------------------------------------------------------------------

static void read_lights(ByteReader& r, Model& m) {
    m.lights.reserve(m.num_lights);
    r.seek(m.offset_light);
    for (uint32_t i = 0; i < m.num_lights; ++i) {
        Light light;
        light.object = r.read_u16();
        light.point = r.read_u16();
        light.normal = unpack_light_normal(r.read_u32());
        m.lights.push_back(light);
    }
}

static void read_vhots(ByteReader& r, Model& m) {
    m.vhots.reserve(m.num_vhots);
    r.seek(m.offset_vhot);
    for (uint32_t i = 0; i < m.num_vhots; ++i) {
        Vhot vhot;
        // Stored as 32 bits even though tools treat it as a short.
        vhot.id = r.read_i32();
        vhot.point = r.read_vec3();
        m.vhots.push_back(vhot);
    }
}

static Material read_material(ByteReader& r) {
    Material mat;
    mat.name = r.read_fixed_string(16);
    mat.raw_type = r.read_u8();
    mat.id = r.read_i8();

    // replace<N>.gif wins over the stored type byte; the tail is then read
    // as a texture tail like every other non-color material.
    if (auto slot = replacer_slot(mat.name)) {
        ReplacerMaterial rep;
        rep.slot = *slot;
        rep.handle = r.read_u32();
        rep.uv_scale = r.read_f32();
        mat.kind = rep;
    } else if (mat.raw_type == material_type_color) {
        ColorMaterial color;
        color.blue = r.read_u8();
        color.green = r.read_u8();
        color.red = r.read_u8();
        r.skip(1); // pad
        color.palette_index = r.read_u32();
        mat.kind = color;
    } else {
        TextureMaterial tex;
        tex.handle = r.read_u32();
        tex.uv_scale = r.read_f32();
        mat.kind = tex;
    }
    return mat;
}

static void read_materials(ByteReader& r, Model& m) {
    m.materials.reserve(m.num_materials);
    r.seek(m.offset_material);
    for (uint32_t i = 0; i < m.num_materials; ++i)
        m.materials.push_back(read_material(r));
}

// read_material_extras reads the version 4 translucency/illumination block.
// Records may declare more than the two floats; the rest is skipped.
static void read_material_extras(ByteReader& r, Model& m) {
    const size_t stride = std::max<size_t>(m.material_ex_size, 8);
    r.seek(m.material_ex_offset);
    for (auto& mat : m.materials) {
        MaterialExtra extra;
        extra.translucency = r.read_f32();
        extra.illumination = r.read_f32();
        r.skip(stride - 8);
        mat.extra = extra;
    }
}

static void read_polygons(ByteReader& r, Model& m) {
    m.polygons.reserve(m.num_polys);
    r.seek(m.offset_poly);
    for (uint32_t i = 0; i < m.num_polys; ++i) {
        Polygon poly;
        poly.table_offset = static_cast<uint32_t>(r.tell() - m.offset_poly);
        poly.id = r.read_i16();
        poly.material_ref = r.read_i16();
        poly.type = r.read_u8();
        auto n = r.read_u8();
        poly.normal = r.read_u16();
        poly.plane = r.read_f32();

        poly.points = r.read_u16_slice(n);
        poly.lights = r.read_u16_slice(n);
        if (poly.type == poly_type_textured)
            poly.uvs = r.read_u16_slice(n);
        if (m.version == extended_version)
            poly.material_byte = r.read_u8();

        m.polygons.push_back(std::move(poly));
    }
}

static Transform read_transform(ByteReader& r) {
    Transform t;
    t.type = r.read_u8();
    t.id = r.read_i32();
    t.min_range = r.read_f32();
    t.max_range = r.read_f32();
    for (auto& axis : t.axis)
        axis = r.read_vec3();
    t.center = r.read_vec3();
    return t;
}

static void read_objects(ByteReader& r, Model& m) {
    m.objects.reserve(m.num_objs);
    m.num_nodes = 0;
    r.seek(m.offset_obj);
    for (uint32_t i = 0; i < m.num_objs; ++i) {
        SubObject obj;
        obj.name = r.read_fixed_string(8);
        obj.transform = read_transform(r);
        obj.child = r.read_i16();
        obj.sibling = r.read_i16();
        obj.first_vhot = r.read_u16();
        obj.num_vhots = r.read_u16();
        obj.first_point = r.read_u16();
        obj.num_points = r.read_u16();
        obj.first_light = r.read_u16();
        obj.num_lights = r.read_u16();
        obj.first_normal = r.read_u16();
        obj.num_normals = r.read_u16();
        obj.first_node = r.read_u16();
        obj.num_nodes = r.read_u16();
        m.num_nodes += obj.num_nodes;
        m.objects.push_back(std::move(obj));
    }
}

static std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Vector3 unpack_light_normal(uint32_t packed) {
    return {static_cast<float>(((packed >> 16) & 0xFFC0) / 16384.0),
            static_cast<float>(((packed >> 6) & 0xFFC0) / 16384.0),
            static_cast<float>(((packed << 4) & 0xFFC0) / 16384.0)};
}

std::optional<int> replacer_slot(const std::string& name) {
    auto lower = to_lower_ascii(trim(name));
    auto first_dot = lower.find('.');
    auto base = lower.substr(0, first_dot);
    std::string ext;
    if (first_dot != std::string::npos)
        ext = lower.substr(lower.rfind('.') + 1);

    if (!ext.empty() && ext != "gif") return std::nullopt;
    if (base.size() != 8 || !base.starts_with("replace")) return std::nullopt;
    char digit = base[7];
    if (digit < '0' || digit > '3') return std::nullopt;
    return digit - '0';
}

const char* kind_name(const MaterialKind& kind) {
    if (std::holds_alternative<ColorMaterial>(kind)) return "color";
    if (std::holds_alternative<ReplacerMaterial>(kind)) return "replacer";
    return "texture";
}

const char* poly_type_name(uint8_t type) {
    switch (type) {
    case poly_type_textured: return "textured";
    case poly_type_flat_rgb: return "rgb";
    case poly_type_paletted: return "paletted";
    default: return "unknown";
    }
}

float translucency(const Model& model, const Material& mat) {
    if (!model.uses_trans || !mat.extra) return 0.0f;
    return mat.extra->translucency;
}

float illumination(const Model& model, const Material& mat) {
    if (!model.uses_illum || !mat.extra) return 0.0f;
    return mat.extra->illumination;
}

Model decode(std::span<const uint8_t> data) {
    ByteReader r(data);

    Model m;
    m.signature = r.read_u32();
    if (m.signature != signature)
        throw FormatError(std::format(
            "lgmd: unrecognized format (signature 0x{:08X})", m.signature));

    read_header(r, m);

    m.num_uvmaps = table_count(m.offset_mapping, m.offset_vhot, 8);
    m.num_lights = table_count(m.offset_light, m.offset_normal, light_record_size);
    m.num_normals = table_count(m.offset_normal, m.offset_poly, 12);

    // A table with no entries is never touched, so its offset may be stale.
    if (m.num_points > 0)
        m.points = r.read_f32_slice(m.offset_point, static_cast<size_t>(m.num_points) * 3);
    if (m.num_normals > 0)
        m.normals = r.read_f32_slice(m.offset_normal, static_cast<size_t>(m.num_normals) * 3);

    if (m.num_uvmaps > 0)
        m.uvmaps = r.read_f32_slice(m.offset_mapping, static_cast<size_t>(m.num_uvmaps) * 2);

    if (m.num_lights > 0)
        read_lights(r, m);

    if (m.num_vhots > 0)
        read_vhots(r, m);

    if (m.num_materials > 0) {
        read_materials(r, m);
        if (m.version == extended_version && m.material_ex_offset != 0)
            read_material_extras(r, m);
    }

    if (m.num_polys > 0)
        read_polygons(r, m);

    if (m.num_objs > 0)
        read_objects(r, m);

    return m;
}

ReadResult read(std::span<const uint8_t> data) {
    ReadResult result;
    result.model = decode(data);
    result.sanitize = sanitize(result.model);
    result.link = link_objects(result.model);
    return result;
}

ReadResult read(std::istream& r) {
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(r)),
                              std::istreambuf_iterator<char>());
    if (r.bad())
        throw std::runtime_error("lgmd: failed to read stream");
    return read(std::span<const uint8_t>(data));
}

} // namespace lgtools::lgmd
