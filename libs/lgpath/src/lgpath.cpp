#include "lgtools/lgpath.h"

#include <cctype>
#include <sstream>
#include <vector>

namespace lgtools::lgpath {

namespace fs = std::filesystem;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// sorted_bins lists the regular .bin files directly inside dir, by name.
std::vector<fs::path> sorted_bins(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (lower(entry.path().extension().string()) == ".bin")
            out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

std::string texture_key(const std::string& name) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(name.begin(), name.end(), is_space);
    auto end = std::find_if_not(name.rbegin(), name.rend(), is_space).base();
    if (begin >= end) return {};

    auto key = lower(std::string(begin, end));
    // Keys come from bare file names; drop any directory part.
    key = to_slash(key);
    auto slash = key.rfind('/');
    if (slash != std::string::npos) key.erase(0, slash + 1);
    auto dot = key.find('.');
    if (dot != std::string::npos) key.resize(dot);
    return key;
}

std::optional<fs::path> find_file_ci(const fs::path& root, const std::string& rel_path) {
    std::string normalized = to_slash(rel_path);
    std::istringstream ss(normalized);
    std::string part;
    fs::path cur = root;

    while (std::getline(ss, part, '/')) {
        if (part.empty()) continue;
        std::string lower_part = lower(part);

        bool found = false;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(cur, ec)) {
            if (lower(entry.path().filename().string()) == lower_part) {
                cur = entry.path();
                found = true;
                break;
            }
        }
        if (!found) return std::nullopt;
    }

    return cur;
}

std::optional<ModelLocation> locate_model(const fs::path& dir) {
    auto root_bins = sorted_bins(dir);
    if (!root_bins.empty())
        return ModelLocation{root_bins.front(), dir};

    auto obj_dir = find_file_ci(dir, "obj");
    if (!obj_dir) return std::nullopt;

    auto obj_bins = sorted_bins(*obj_dir);
    if (!obj_bins.empty())
        return ModelLocation{obj_bins.front(), *obj_dir};

    return std::nullopt;
}

std::vector<ModelLocation> locate_models(const fs::path& dir) {
    if (auto loc = locate_model(dir))
        return {*loc};

    std::vector<fs::path> subdirs;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_directory(ec))
            subdirs.push_back(entry.path());
    }
    std::sort(subdirs.begin(), subdirs.end());

    std::vector<ModelLocation> out;
    for (const auto& sub : subdirs) {
        if (auto loc = locate_model(sub))
            out.push_back(*loc);
    }
    return out;
}

void TextureIndex::add(const fs::path& file) {
    auto key = texture_key(file.filename().string());
    if (key.empty()) return;
    entries_.emplace(key, file);
}

std::optional<fs::path> TextureIndex::find(const std::string& material_name) const {
    auto it = entries_.find(texture_key(material_name));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

TextureIndex index_textures(const fs::path& base) {
    TextureIndex index;
    // emplace keeps the first entry for a key, so txt/ goes first.
    for (const char* sub : {"txt", "txt16"}) {
        auto dir = find_file_ci(base, sub);
        if (!dir) continue;

        std::vector<fs::path> files;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(*dir, ec)) {
            if (entry.is_regular_file(ec))
                files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        for (const auto& f : files)
            index.add(f);
    }
    return index;
}

} // namespace lgtools::lgpath
