#include "lgtools/lgmd.h"
#include "lgtools/lgmesh.h"
#include "lgtools/lgpath.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace lgmd = lgtools::lgmd;
namespace lgmesh = lgtools::lgmesh;
namespace lgpath = lgtools::lgpath;

namespace {

json vec3_to_json(const std::array<float, 3>& v) {
    return json::array({v[0], v[1], v[2]});
}

json matrix_to_json(const lgmesh::Matrix4& m) {
    json out = json::array();
    for (float v : m) out.push_back(v);
    return out;
}

json header_to_json(const lgmd::Model& m) {
    json doc = {
        {"version", m.version},
        {"name", m.name},
        {"maxRadius", m.max_radius},
        {"minRadius", m.min_radius},
        {"maxBounds", vec3_to_json(m.max_bounds)},
        {"minBounds", vec3_to_json(m.min_bounds)},
        {"center", vec3_to_json(m.center)},
        {"binSize", m.bin_size},
        {"offsets", {
            {"objects", m.offset_obj},
            {"materials", m.offset_material},
            {"mapping", m.offset_mapping},
            {"vhots", m.offset_vhot},
            {"points", m.offset_point},
            {"lights", m.offset_light},
            {"normals", m.offset_normal},
            {"polygons", m.offset_poly},
            {"nodes", m.offset_node},
        }},
        {"counts", {
            {"polygons", m.num_polys},
            {"points", m.num_points},
            {"params", m.num_params},
            {"materials", m.num_materials},
            {"vcalls", m.num_vcalls},
            {"vhots", m.num_vhots},
            {"objects", m.num_objs},
            {"uvmaps", m.num_uvmaps},
            {"lights", m.num_lights},
            {"normals", m.num_normals},
            {"nodes", m.num_nodes},
        }},
    };
    if (m.version == lgmd::extended_version) {
        doc["materialEx"] = {
            {"flags", m.material_ex_flags},
            {"offset", m.material_ex_offset},
            {"size", m.material_ex_size},
            {"usesTranslucency", m.uses_trans},
            {"usesIllumination", m.uses_illum},
        };
    }
    return doc;
}

json material_to_json(const lgmd::Material& mat, const lgpath::TextureIndex* textures) {
    json doc = {
        {"name", mat.name},
        {"kind", lgmd::kind_name(mat.kind)},
        {"rawType", mat.raw_type},
        {"id", mat.id},
    };

    if (const auto* color = std::get_if<lgmd::ColorMaterial>(&mat.kind)) {
        doc["rgb"] = json::array({color->red, color->green, color->blue});
        doc["paletteIndex"] = color->palette_index;
    } else if (const auto* rep = std::get_if<lgmd::ReplacerMaterial>(&mat.kind)) {
        doc["replacerSlot"] = rep->slot;
    } else if (const auto* tex = std::get_if<lgmd::TextureMaterial>(&mat.kind)) {
        doc["handle"] = tex->handle;
        doc["uvScale"] = tex->uv_scale;
        if (textures) {
            auto found = textures->find(mat.name);
            if (found)
                doc["texture"] = found->string();
            else
                doc["texture"] = nullptr;
        }
    }

    if (mat.extra) {
        doc["translucency"] = mat.extra->translucency;
        doc["illumination"] = mat.extra->illumination;
    }
    return doc;
}

json geometry_to_json(const lgmesh::ObjectGeometry& geom) {
    json doc = json::object();
    if (geom.transform)
        doc["localMatrix"] = matrix_to_json(*geom.transform);
    if (!geom.mesh) {
        doc["vertices"] = 0;
        doc["triangles"] = 0;
        return doc;
    }
    doc["vertices"] = geom.mesh->vertex_count();
    doc["triangles"] = geom.mesh->triangle_count();
    json groups = json::array();
    for (const auto& g : geom.mesh->groups) {
        groups.push_back({{"start", g.start}, {"count", g.count}, {"material", g.material_index}});
    }
    doc["groups"] = std::move(groups);
    return doc;
}

json build_json(const lgmd::ReadResult& result, const std::string& filename,
                const lgpath::TextureIndex* textures, bool with_geometry) {
    const auto& m = result.model;

    json materials = json::array();
    for (const auto& mat : m.materials)
        materials.push_back(material_to_json(mat, textures));

    json vhots = json::array();
    for (const auto& v : m.vhots)
        vhots.push_back({{"id", v.id}, {"point", vec3_to_json(v.point)}});

    std::vector<lgmesh::ObjectGeometry> geometry;
    if (with_geometry) geometry = lgmesh::build(m);

    json objects = json::array();
    for (size_t i = 0; i < m.objects.size(); ++i) {
        const auto& o = m.objects[i];
        json obj = {
            {"index", i},
            {"name", o.name},
            {"parent", o.parent},
            {"children", o.children},
            {"transform", {
                {"type", o.transform.type},
                {"id", o.transform.id},
                {"min", o.transform.min_range},
                {"max", o.transform.max_range},
                {"axis", json::array({vec3_to_json(o.transform.axis[0]),
                                      vec3_to_json(o.transform.axis[1]),
                                      vec3_to_json(o.transform.axis[2])})},
                {"center", vec3_to_json(o.transform.center)},
            }},
            {"vhots", {o.first_vhot, o.num_vhots}},
            {"points", {o.first_point, o.num_points}},
            {"lights", {o.first_light, o.num_lights}},
            {"normals", {o.first_normal, o.num_normals}},
            {"nodes", {o.first_node, o.num_nodes}},
            {"polygons", o.polygons.size()},
        };
        std::map<std::string, size_t> types;
        for (uint32_t pi : o.polygons) ++types[lgmd::poly_type_name(m.polygons[pi].type)];
        obj["polygonTypes"] = types;
        if (with_geometry) obj["geometry"] = geometry_to_json(geometry[i]);
        objects.push_back(std::move(obj));
    }

    json link_warnings = result.link.warnings;

    return {
        {"schemaVersion", 1},
        {"filename", filename},
        {"header", header_to_json(m)},
        {"materials", std::move(materials)},
        {"vhots", std::move(vhots)},
        {"objects", std::move(objects)},
        {"sanitize", {{"kept", result.sanitize.kept}, {"dropped", result.sanitize.dropped}}},
        {"link", {
            {"roots", result.link.roots},
            {"unassignedPolygons", result.link.unassigned_polygons},
            {"warnings", std::move(link_warnings)},
        }},
    };
}

static void write_json(std::ostream& w, const json& doc, bool pretty) {
    if (pretty)
        w << std::setw(2) << doc << '\n';
    else
        w << doc << '\n';
}

static void print_usage() {
    lgtools::cli::print("Usage: bin_info [flags] [model.bin | asset-dir | -]...");
    lgtools::cli::print("Extracts header, materials, object tree and geometry stats from LGMD .bin models.");
    lgtools::cli::print("An asset directory is searched for a .bin at its root, then in obj/.");
    lgtools::cli::print("A directory without one has each subdirectory searched the same way.");
    lgtools::cli::print("Output:");
    lgtools::cli::print("  <name>_bin_info/bin.json - Full structured metadata, one per model");
    lgtools::cli::print("");
    lgtools::cli::print("Flags:");
    lgtools::cli::print("  --pretty           Pretty-print JSON output");
    lgtools::cli::print("  --json             Write JSON to stdout instead of files (an array for several models)");
    lgtools::cli::print("  --textures <dir>   Texture base directory (holding txt/ and txt16/)");
    lgtools::cli::print("  --no-geometry      Skip triangulation stats");
    lgtools::cli::print("  -v, --verbose      Verbose logging");
    lgtools::cli::print("  -vv, --debug       Debug logging");
}

// Input is one model to report on. An empty path means stdin.
struct Input {
    fs::path model;
    std::string textures_dir;
};

struct Options {
    bool pretty = false;
    bool json_stdout = false;
    bool with_geometry = true;
    std::string textures_dir;
};

// collect_inputs expands one positional argument. Returns false when a
// directory holds no model.
bool collect_inputs(const std::string& arg, const Options& opts, std::vector<Input>& out) {
    if (arg == "-") {
        out.push_back({});
        return true;
    }

    fs::path path = arg;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        out.push_back({path, opts.textures_dir});
        return true;
    }

    auto locations = lgpath::locate_models(path);
    if (locations.empty()) {
        LOGE("no .bin file found in", path.string(), "or its subdirectories");
        return false;
    }
    for (const auto& loc : locations) {
        LOGD("found", loc.model.string());
        out.push_back({loc.model,
                       opts.textures_dir.empty() ? loc.base_dir.string() : opts.textures_dir});
    }
    return true;
}

std::vector<uint8_t> load_input(const Input& in, std::string& filename) {
    std::vector<uint8_t> data;
    if (in.model.empty()) {
        std::ostringstream buf;
        buf << std::cin.rdbuf();
        auto s = buf.str();
        data.assign(s.begin(), s.end());
        filename = "stdin";
        LOGI("Reading from stdin");
        return data;
    }

    std::ifstream f(in.model, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + in.model.string());
    data.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    filename = in.model.filename().string();
    LOGI("Reading", in.model.string());
    if (lgtools::cli::debug_enabled())
        LOGD("Size (bytes):", data.size());
    return data;
}

void write_report(const Input& in, const json& doc, bool pretty) {
    std::string base = in.model.stem().string();
    fs::path output_dir = in.model.parent_path() / (base + "_bin_info");
    LOGI("Writing to", output_dir.string());
    fs::create_directories(output_dir);
    std::ofstream jf(output_dir / "bin.json");
    if (!jf) throw std::runtime_error("failed to create bin.json");
    write_json(jf, doc, pretty);
    LOGI("Output:", output_dir.string());
}

// process reads one model and builds its report. Returns std::nullopt after
// logging the error when the model cannot be read.
std::optional<json> process(const Input& in, const Options& opts) {
    std::string filename = in.model.filename().string();
    lgmd::ReadResult result;
    try {
        auto data = load_input(in, filename);
        result = lgmd::read(std::span<const uint8_t>(data));
    } catch (const std::exception& e) {
        LOGE("parsing", in.model.empty() ? std::string("stdin") : in.model.string(), e.what());
        return std::nullopt;
    }

    if (result.sanitize.dropped > 0)
        LOGW(filename + ":", result.sanitize.dropped, "invalid polygons dropped");
    for (const auto& w : result.link.warnings)
        LOGW(filename + ":", w);

    std::optional<lgpath::TextureIndex> textures;
    if (!in.textures_dir.empty()) {
        textures = lgpath::index_textures(in.textures_dir);
        LOGI("Textures indexed:", textures->size(), "from", in.textures_dir);
    }

    json doc;
    try {
        doc = build_json(result, filename, textures ? &*textures : nullptr, opts.with_geometry);
    } catch (const std::exception& e) {
        LOGE("building geometry for", filename + ":", e.what());
        return std::nullopt;
    }

    const auto& m = result.model;
    LOGI("BIN:", filename, "( LGMD v" + std::to_string(m.version), ")");
    LOGI("Objects:", m.objects.size(), "Materials:", m.materials.size(),
         "Polygons:", result.sanitize.kept, "of", m.num_polys);
    if (lgtools::cli::debug_enabled()) {
        for (size_t i = 0; i < m.objects.size(); ++i) {
            LOGD("object", i, m.objects[i].name, "parent", m.objects[i].parent,
                 "polys", m.objects[i].polygons.size());
        }
    }
    return doc;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) opts.pretty = true;
        else if (std::strcmp(argv[i], "--json") == 0) opts.json_stdout = true;
        else if (std::strcmp(argv[i], "--no-geometry") == 0) opts.with_geometry = false;
        else if (std::strcmp(argv[i], "--textures") == 0) {
            if (i + 1 >= argc) {
                LOGE("missing value for", argv[i]);
                return 1;
            }
            opts.textures_dir = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            verbosity = std::min(verbosity + 1, 2);
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0)
            verbosity = 2;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    lgtools::cli::set_verbosity(verbosity);

    if (positional.empty()) positional.push_back("-");
    if (std::count(positional.begin(), positional.end(), "-") > 1) {
        LOGE("stdin can only be read once");
        return 1;
    }

    bool failed = false;
    std::vector<Input> inputs;
    for (const auto& arg : positional) {
        if (!collect_inputs(arg, opts, inputs)) failed = true;
    }

    json reports = json::array();
    for (const auto& in : inputs) {
        auto doc = process(in, opts);
        if (!doc) {
            failed = true;
            continue;
        }

        if (opts.json_stdout || in.model.empty()) {
            reports.push_back(std::move(*doc));
            continue;
        }
        try {
            write_report(in, *doc, opts.pretty);
        } catch (const std::exception& e) {
            LOGE("writing output for", in.model.string() + ":", e.what());
            failed = true;
        }
    }

    // Several models under --json become one array; a single report stays a
    // plain object.
    if (opts.json_stdout && inputs.size() > 1)
        write_json(std::cout, reports, opts.pretty);
    else if (!reports.empty())
        write_json(std::cout, reports[0], opts.pretty);

    return failed ? 1 : 0;
}
