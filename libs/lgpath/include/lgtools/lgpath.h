#pragma once

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lgtools::lgpath {

// to_slash converts backslashes to forward slashes and trims a leading slash.
inline std::string to_slash(std::string p) {
    std::replace(p.begin(), p.end(), '\\', '/');
    if (!p.empty() && p[0] == '/') p.erase(0, 1);
    return p;
}

// texture_key returns the lookup key for a material or texture file name:
// trimmed, lowercased and cut at the first '.'. "Wood.GIF" and "wood.pcx"
// share the key "wood".
std::string texture_key(const std::string& name);

// find_file_ci resolves a relative path under root using case-insensitive
// matching for each path component.
std::optional<std::filesystem::path> find_file_ci(const std::filesystem::path& root,
                                                   const std::string& rel_path);

// ModelLocation is where a model file was found in an asset directory.
struct ModelLocation {
    std::filesystem::path model;    // the .bin file
    std::filesystem::path base_dir; // directory holding txt/ and txt16/
};

// locate_model finds the model file of an unpacked asset directory: the
// first .bin (by name) directly in dir, otherwise the first .bin in dir/obj.
std::optional<ModelLocation> locate_model(const std::filesystem::path& dir);

// locate_models returns locate_model(dir) when dir is itself an asset
// directory. Otherwise every subdirectory (by name) is tried as an asset
// directory and each one holding a model contributes it.
std::vector<ModelLocation> locate_models(const std::filesystem::path& dir);

// TextureIndex maps texture keys to texture files.
class TextureIndex {
public:
    void add(const std::filesystem::path& file);

    // find resolves a material name by texture key.
    std::optional<std::filesystem::path> find(const std::string& material_name) const;

    size_t size() const { return entries_.size(); }
    const std::map<std::string, std::filesystem::path>& entries() const { return entries_; }

private:
    std::map<std::string, std::filesystem::path> entries_;
};

// index_textures scans base/txt and base/txt16 (either may be missing, any
// case). On a key collision the txt/ file wins.
TextureIndex index_textures(const std::filesystem::path& base);

} // namespace lgtools::lgpath
