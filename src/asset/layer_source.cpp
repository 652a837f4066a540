/// @file layer_source.cpp
/// @brief Filesystem discovery of definition layers

#include <mobdef/asset/layer_source.hpp>
#include <mobdef/asset/mob_ref.hpp>
#include <mobdef/core/log.hpp>

#include <fstream>
#include <sstream>

namespace mobdef_asset {

namespace {

bool has_suffix(const std::string& s, const std::string& suffix) {
    return !suffix.empty() && s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

mobdef_core::Result<std::string> read_text(const std::filesystem::path& path, const std::string& name) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return mobdef_core::Err<std::string>(
            mobdef_core::DefinitionError::io(name, "cannot open " + path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // anonymous namespace

mobdef_core::Result<LayerFiles> collect_layer(const std::filesystem::path& dir,
                                              const mobdef_core::LayerPaths& rules,
                                              bool optional) {
    namespace fs = std::filesystem;
    auto logger = mobdef_core::asset_logger();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        if (optional) {
            logger->info("[LayerSource] Layer directory '{}' absent, skipping", dir.string());
            return LayerFiles{};
        }
        return mobdef_core::Err<LayerFiles>(mobdef_core::DefinitionError::not_found(dir.string()));
    }

    LayerFiles layer;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        return mobdef_core::Err<LayerFiles>(mobdef_core::DefinitionError::io(dir.string(), ec.message()));
    }

    const fs::recursive_directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }

        std::string relative = it->path().lexically_relative(dir).generic_string();
        bool is_patch = has_suffix(relative, rules.patch_extension);
        bool is_definition = !is_patch && has_suffix(relative, rules.definition_extension);
        if (!is_patch && !is_definition) {
            logger->debug("[LayerSource] Ignoring '{}'", relative);
            continue;
        }

        std::string name = normalize_mob_ref(relative, rules);
        auto text = read_text(it->path(), name);
        if (!text) {
            if (!optional) {
                return mobdef_core::Err<LayerFiles>(std::move(text.error()));
            }
            logger->warn("[LayerSource] Skipping '{}': {}", relative, text.error().message());
            layer.unreadable.push_back(relative);
            continue;
        }

        auto& target = is_patch ? layer.patches : layer.definitions;
        target[name] = std::move(*text);
    }
    if (ec) {
        return mobdef_core::Err<LayerFiles>(mobdef_core::DefinitionError::io(dir.string(), ec.message()));
    }

    logger->info("[LayerSource] '{}': {} definitions, {} patches",
                 dir.string(), layer.definitions.size(), layer.patches.size());
    return layer;
}

} // namespace mobdef_asset
