/// @file config.cpp
/// @brief Pipeline configuration loading

#include <mobdef/core/config.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace mobdef_core {

namespace {

Result<void> read_paths(const toml::table& tbl, LayerPaths& paths) {
    if (auto base = tbl["base"].value<std::string>()) {
        paths.base_dir = *base;
    }
    if (auto extended = tbl["extended"].value<std::string>()) {
        if (!extended->empty()) {
            paths.extended_dir = std::filesystem::path(*extended);
        }
    }
    if (auto prefix = tbl["root_prefix"].value<std::string>()) {
        paths.root_prefix = *prefix;
    }
    return Ok();
}

Result<void> read_files(const toml::table& tbl, LayerPaths& paths) {
    if (auto ext = tbl["definition_extension"].value<std::string>()) {
        if (ext->empty() || (*ext)[0] != '.') {
            return Err(ConfigError::invalid_value("files.definition_extension", "must start with '.'"));
        }
        paths.definition_extension = *ext;
    }
    if (auto ext = tbl["patch_extension"].value<std::string>()) {
        if (ext->empty() || (*ext)[0] != '.') {
            return Err(ConfigError::invalid_value("files.patch_extension", "must start with '.'"));
        }
        paths.patch_extension = *ext;
    }
    if (paths.definition_extension == paths.patch_extension) {
        return Err(ConfigError::invalid_value("files.patch_extension",
                                              "must differ from definition_extension"));
    }
    return Ok();
}

Result<void> read_logging(const toml::table& tbl, LogConfig& logging) {
    if (auto level = tbl["level"].value<std::string>()) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return Err(ConfigError::invalid_value("logging.level", "unknown level '" + *level + "'"));
        }
        logging.level = *parsed;
    }
    if (auto console = tbl["console"].value<bool>()) {
        logging.console_enabled = *console;
    }
    if (auto file = tbl["file"].value<bool>()) {
        logging.file_enabled = *file;
    }
    if (auto dir = tbl["directory"].value<std::string>()) {
        logging.log_directory = *dir;
    }
    if (auto max_files = tbl["max_files"].value<std::int64_t>()) {
        if (*max_files <= 0) {
            return Err(ConfigError::invalid_value("logging.max_files", "must be positive"));
        }
        logging.max_files = static_cast<std::size_t>(*max_files);
    }
    return Ok();
}

} // anonymous namespace

Result<PipelineConfig> PipelineConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        core_logger()->debug("No config at '{}', using defaults", path.string());
        return PipelineConfig{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<PipelineConfig>(Error(ErrorCode::IOError, "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse(buffer.str(), path.string());
}

Result<PipelineConfig> PipelineConfig::parse(const std::string& content, const std::string& source_name) {
    PipelineConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto paths = tbl["paths"].as_table()) {
            auto r = read_paths(*paths, config.paths);
            if (!r) return Err<PipelineConfig>(r.error());
        }

        if (auto files = tbl["files"].as_table()) {
            auto r = read_files(*files, config.paths);
            if (!r) return Err<PipelineConfig>(r.error());
        }

        if (auto editor = tbl["editor"].as_table()) {
            if (auto limit = (*editor)["history_limit"].value<std::int64_t>()) {
                if (*limit <= 0) {
                    return Err<PipelineConfig>(
                        ConfigError::invalid_value("editor.history_limit", "must be positive"));
                }
                config.history_limit = static_cast<std::size_t>(*limit);
            }
        }

        if (auto logging = tbl["logging"].as_table()) {
            auto r = read_logging(*logging, config.logging);
            if (!r) return Err<PipelineConfig>(r.error());
        }

    } catch (const toml::parse_error& err) {
        return Err<PipelineConfig>(ConfigError::parse(source_name, err.what()));
    }

    return config;
}

} // namespace mobdef_core
