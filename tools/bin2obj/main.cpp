#include "lgtools/lgmd.h"
#include "lgtools/lgmesh.h"
#include "lgtools/lgpath.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;

namespace lgmd = lgtools::lgmd;
namespace lgmesh = lgtools::lgmesh;
namespace lgpath = lgtools::lgpath;

static void print_usage() {
    lgtools::cli::print("Usage: bin2obj [flags] <model.bin | asset-dir> [output.obj]");
    lgtools::cli::print("Converts an LGMD .bin model to Wavefront OBJ with a sibling .mtl file.");
    lgtools::cli::print("");
    lgtools::cli::print("Flags:");
    lgtools::cli::print("  --local            Keep sub-objects in their local space");
    lgtools::cli::print("  --textures <dir>   Texture base directory (holding txt/ and txt16/)");
    lgtools::cli::print("  -v, --verbose      Verbose logging");
    lgtools::cli::print("  -vv, --debug       Debug logging");
}

// mtl_name gives each material a unique, whitespace-free MTL name.
static std::string mtl_name(const lgmd::Material& mat, size_t index) {
    std::string key = lgpath::texture_key(mat.name);
    for (auto& c : key) {
        if (std::isspace(static_cast<unsigned char>(c))) c = '_';
    }
    if (key.empty()) key = "unnamed";
    return std::format("m{}_{}", index, key);
}

static std::string texture_ref(const fs::path& texture, const fs::path& out_dir) {
    std::error_code ec;
    auto rel = fs::relative(texture, out_dir.empty() ? fs::path(".") : out_dir, ec);
    if (ec || rel.empty()) return lgpath::to_slash(texture.string());
    return rel.generic_string();
}

static void write_mtl(std::ostream& w, const lgmd::Model& model,
                      const lgpath::TextureIndex* textures, const fs::path& out_dir) {
    w << "# " << model.name << '\n';
    for (size_t i = 0; i < model.materials.size(); ++i) {
        const auto& mat = model.materials[i];
        w << "\nnewmtl " << mtl_name(mat, i) << '\n';

        if (const auto* color = std::get_if<lgmd::ColorMaterial>(&mat.kind)) {
            w << std::format("Kd {} {} {}\n", color->red / 255.0f, color->green / 255.0f,
                             color->blue / 255.0f);
        } else {
            w << "Kd 1 1 1\n";
            if (const auto* rep = std::get_if<lgmd::ReplacerMaterial>(&mat.kind)) {
                w << "# replacer slot " << rep->slot << '\n';
            } else if (textures) {
                if (auto file = textures->find(mat.name))
                    w << "map_Kd " << texture_ref(*file, out_dir) << '\n';
                else
                    LOGW_ONCE(lgtools::log::detail::fnv1a_hash(mat.name.c_str()),
                              "texture not found:", mat.name);
            }
        }

        if (const float trans = lgmd::translucency(model, mat); trans > 0.0f)
            w << std::format("d {}\n", 1.0f - trans);
    }
    if (!w) throw std::runtime_error("failed to write material library");
}

struct ObjCounters {
    size_t vertices = 0;
    size_t triangles = 0;
};

static void write_object(std::ostream& w, const lgmd::Model& model, size_t index,
                         const lgmesh::TriangleBuffer& mesh, const lgmesh::Matrix4& world,
                         ObjCounters& counters) {
    const auto& obj = model.objects[index];
    w << "\no " << (obj.name.empty() ? std::format("object{}", index) : obj.name) << '\n';

    for (size_t v = 0; v < mesh.vertex_count(); ++v) {
        auto p = lgmesh::transform_point(
            world, {mesh.positions[v * 3], mesh.positions[v * 3 + 1], mesh.positions[v * 3 + 2]});
        w << std::format("v {} {} {}\n", p[0], p[1], p[2]);
    }
    for (size_t v = 0; v < mesh.vertex_count(); ++v)
        w << std::format("vt {} {}\n", mesh.uvs[v * 2], mesh.uvs[v * 2 + 1]);
    for (size_t v = 0; v < mesh.vertex_count(); ++v) {
        auto n = lgmesh::transform_direction(
            world, {mesh.normals[v * 3], mesh.normals[v * 3 + 1], mesh.normals[v * 3 + 2]});
        w << std::format("vn {} {} {}\n", n[0], n[1], n[2]);
    }

    // OBJ indices are 1-based and global across objects.
    const size_t base = counters.vertices + 1;
    for (const auto& g : mesh.groups) {
        if (g.material_index < model.materials.size())
            w << "usemtl " << mtl_name(model.materials[g.material_index], g.material_index) << '\n';
        for (uint32_t t = 0; t < g.count; t += 3) {
            size_t a = base + g.start + t;
            w << std::format("f {0}/{0}/{0} {1}/{1}/{1} {2}/{2}/{2}\n", a, a + 1, a + 2);
        }
    }

    counters.vertices += mesh.vertex_count();
    counters.triangles += mesh.triangle_count();
}

int main(int argc, char* argv[]) {
    bool local_space = false;
    int verbosity = 0;
    std::string textures_dir;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--local") == 0) local_space = true;
        else if (std::strcmp(argv[i], "--textures") == 0) {
            if (i + 1 >= argc) {
                LOGE("missing value for", argv[i]);
                return 1;
            }
            textures_dir = argv[++i];
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

    if (positional.empty() || positional.size() > 2) {
        print_usage();
        return 1;
    }

    fs::path model_path = positional[0];
    std::error_code ec;
    if (fs::is_directory(model_path, ec)) {
        auto loc = lgpath::locate_model(model_path);
        if (!loc) {
            LOGE("no .bin file found in", model_path.string(), "or its obj/ directory");
            return 1;
        }
        if (textures_dir.empty()) textures_dir = loc->base_dir.string();
        model_path = loc->model;
    }

    fs::path out_path = positional.size() > 1 ? fs::path(positional[1])
                                               : fs::path(model_path).replace_extension(".obj");
    fs::path mtl_path = fs::path(out_path).replace_extension(".mtl");

    std::ifstream in(model_path, std::ios::binary);
    if (!in) {
        LOGE("cannot open", model_path.string());
        return 1;
    }

    lgmd::ReadResult result;
    try {
        LOGI("Reading", model_path.string());
        result = lgmd::read(in);
    } catch (const std::exception& e) {
        LOGE("parsing", model_path.string(), e.what());
        return 1;
    }

    const auto& model = result.model;
    if (result.sanitize.dropped > 0)
        LOGW(model_path.filename().string() + ":", result.sanitize.dropped,
             "invalid polygons dropped");
    for (const auto& w : result.link.warnings)
        LOGW(model_path.filename().string() + ":", w);
    if (result.link.unassigned_polygons > 0)
        LOGW(result.link.unassigned_polygons, "polygons belong to no object and are skipped");

    std::optional<lgpath::TextureIndex> textures;
    if (!textures_dir.empty()) {
        textures = lgpath::index_textures(textures_dir);
        LOGI("Textures indexed:", textures->size(), "from", textures_dir);
    }

    ObjCounters counters;
    try {
        auto geometry = lgmesh::build(model);
        std::vector<lgmesh::Matrix4> world(model.objects.size(), lgmesh::identity);
        if (!local_space) world = lgmesh::world_transforms(model, geometry);

        std::ofstream mtl(mtl_path);
        if (!mtl) throw std::runtime_error("cannot create " + mtl_path.string());
        write_mtl(mtl, model, textures ? &*textures : nullptr, out_path.parent_path());

        std::ofstream obj(out_path);
        if (!obj) throw std::runtime_error("cannot create " + out_path.string());
        obj << "# " << model.name << " (LGMD v" << model.version << ")\n";
        obj << "mtllib " << mtl_path.filename().string() << '\n';
        for (size_t i = 0; i < geometry.size(); ++i) {
            if (!geometry[i].mesh) {
                LOGD("object", i, model.objects[i].name, "has no triangles");
                continue;
            }
            write_object(obj, model, i, *geometry[i].mesh, world[i], counters);
        }
        if (!obj) throw std::runtime_error("failed to write " + out_path.string());
    } catch (const std::exception& e) {
        LOGE("converting", model_path.string(), e.what());
        return 1;
    }

    LOGI("Output:", out_path.string(), "(", counters.vertices, "vertices,",
         counters.triangles, "triangles )");
    return 0;
}
