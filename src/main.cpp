/// @file main.cpp
/// @brief mobdef command line tool
///
/// Commands:
/// - resolve: resolve base + extended layers and list the registry
/// - tree: compile one mob's behavior and dump the tree as JSON
/// - validate: run authoring checks on a .mob / .mobpatch file

#include <mobdef/asset/mob_ref.hpp>
#include <mobdef/asset/mob_registry.hpp>
#include <mobdef/asset/validation.hpp>
#include <mobdef/ai/behavior_tree.hpp>
#include <mobdef/core/config.hpp>
#include <mobdef/core/log.hpp>
#include <mobdef/data/json_codec.hpp>
#include <mobdef/data/toml_codec.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// =============================================================================
// Usage
// =============================================================================

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] <COMMAND> [ARGS]\n"
              << "\n"
              << "Commands:\n"
              << "  resolve <BASE_DIR> [--extended DIR] [--json]\n"
              << "                      Resolve all layers and list the mobs\n"
              << "  tree <BASE_DIR> <MOB_REF> [--extended DIR]\n"
              << "                      Compile a mob's behavior and print it as JSON\n"
              << "  validate <FILE>     Check a .mob or .mobpatch file\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE       Pipeline configuration (default: mobdef.toml)\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " resolve assets/mobs --extended my-game/assets/mobs\n"
              << "  " << program_name << " tree assets/mobs xhitara/grunt\n"
              << "  " << program_name << " validate assets/mobs/xhitara/grunt.mob\n";
}

void print_version() {
    std::cout << "mobdef 0.1.0\n"
              << "Layered mob definition pipeline\n";
}

// =============================================================================
// Commands
// =============================================================================

struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::optional<fs::path> extended;
    bool json = false;
};

std::optional<mobdef_asset::MobRegistry> load(const mobdef_core::PipelineConfig& config,
                                              const CommandLine& cli) {
    mobdef_core::LayerPaths paths = config.paths;
    paths.base_dir = cli.positional.at(0);
    if (cli.extended) {
        paths.extended_dir = cli.extended;
    }

    auto registry = mobdef_asset::load_registry(paths);
    if (!registry) {
        spdlog::error("Failed to resolve mobs: {}", mobdef_core::build_error_chain(registry.error()));
        return std::nullopt;
    }
    return std::move(*registry);
}

int run_resolve(const mobdef_core::PipelineConfig& config, const CommandLine& cli) {
    auto registry = load(config, cli);
    if (!registry) {
        return 1;
    }

    if (cli.json) {
        nlohmann::json out;
        out["mobs"] = nlohmann::json::object();
        for (const auto& name : registry->keys()) {
            out["mobs"][name] = mobdef_data::to_json(mobdef_asset::mob_asset_to_value(*registry->get_mob(name)));
        }
        out["failures"] = nlohmann::json::array();
        for (const auto& failure : registry->failures()) {
            out["failures"].push_back({
                {"entity", failure.entity},
                {"stage", mobdef_asset::failure_stage_name(failure.stage)},
                {"error", failure.error.message()},
            });
        }
        out["orphan_patches"] = registry->orphan_patches();
        std::cout << out.dump(2) << "\n";
        return registry->failures().empty() ? 0 : 2;
    }

    for (const auto& name : registry->keys()) {
        const auto* mob = registry->get_mob(name);
        const auto* behavior = registry->get_behavior(name);
        std::cout << name << "  name=\"" << mob->name << "\" health=" << mob->health
                  << (mob->spawnable ? "" : " [not spawnable]");
        if (behavior != nullptr) {
            std::cout << " behavior_nodes=" << behavior->node_count();
        }
        std::cout << "\n";
    }
    std::cout << registry->size() << " mobs, " << registry->spawnable_mobs().size() << " spawnable\n";

    for (const auto& failure : registry->failures()) {
        std::cout << "FAILED " << failure.entity << " (" << mobdef_asset::failure_stage_name(failure.stage)
                  << "): " << failure.error.message() << "\n";
    }
    for (const auto& orphan : registry->orphan_patches()) {
        std::cout << "ORPHAN PATCH " << orphan << "\n";
    }
    return registry->failures().empty() ? 0 : 2;
}

int run_tree(const mobdef_core::PipelineConfig& config, const CommandLine& cli) {
    auto registry = load(config, cli);
    if (!registry) {
        return 1;
    }

    const std::string& mob_ref = cli.positional.at(1);
    if (!registry->contains(mob_ref)) {
        std::cerr << "Unknown mob: " << mob_ref << "\n";
        return 1;
    }
    const auto* tree = registry->get_behavior(mob_ref);
    if (tree == nullptr) {
        std::cerr << "Mob has no behavior: " << mob_ref << "\n";
        return 1;
    }

    std::cout << mobdef_ai::tree_to_json(*tree).dump(2) << "\n";

    auto diagnostics = registry->diagnostics().find(mobdef_asset::normalize_mob_ref(mob_ref, config.paths));
    if (diagnostics != registry->diagnostics().end()) {
        for (const auto& diag : diagnostics->second) {
            std::cerr << "[" << mobdef_ai::diagnostic_severity_name(diag.severity) << "] " << diag.path << ": "
                      << diag.message << "\n";
        }
    }
    return 0;
}

int run_validate(const mobdef_core::PipelineConfig& config, const CommandLine& cli) {
    fs::path file = cli.positional.at(0);
    auto value = mobdef_data::read_toml_file(file);
    if (!value) {
        std::cerr << mobdef_core::build_error_chain(value.error()) << "\n";
        return 1;
    }

    std::string filename = file.filename().string();
    const std::string& ext = config.paths.patch_extension;
    bool is_patch = filename.size() > ext.size() &&
                    filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;

    auto result = mobdef_asset::validate_mob(*value, is_patch);
    if (result.empty()) {
        std::cout << file.string() << ": OK\n";
        return 0;
    }
    std::cout << result.format() << "\n";
    return result.has_errors() ? 1 : 0;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    CommandLine cli;
    fs::path config_path = "mobdef.toml";
    std::optional<std::string> log_level;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--json") {
            cli.json = true;
        } else if ((arg == "--config" || arg == "--log-level" || arg == "--extended") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") {
                config_path = value;
            } else if (arg == "--log-level") {
                log_level = value;
            } else {
                cli.extended = fs::path(value);
            }
        } else if (!arg.empty() && arg[0] != '-') {
            if (cli.command.empty()) {
                cli.command = arg;
            } else {
                cli.positional.push_back(arg);
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (cli.command.empty()) {
        std::cerr << "Error: No command specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    auto config = mobdef_core::PipelineConfig::load(config_path);
    if (!config) {
        std::cerr << mobdef_core::build_error_chain(config.error()) << "\n";
        return 1;
    }

    if (log_level) {
        auto level = mobdef_core::parse_log_level(*log_level);
        if (!level) {
            std::cerr << "Unknown log level: " << *log_level << "\n";
            return 1;
        }
        config->logging.level = *level;
    }
    mobdef_core::configure_logging(config->logging);

    std::size_t expected_args = cli.command == "tree" ? 2 : 1;
    if (cli.command != "resolve" && cli.command != "tree" && cli.command != "validate") {
        std::cerr << "Unknown command: " << cli.command << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (cli.positional.size() != expected_args) {
        std::cerr << "Error: '" << cli.command << "' expects " << expected_args << " argument(s).\n\n";
        print_usage(argv[0]);
        return 1;
    }

    int rc = 0;
    if (cli.command == "resolve") {
        rc = run_resolve(*config, cli);
    } else if (cli.command == "tree") {
        rc = run_tree(*config, cli);
    } else {
        rc = run_validate(*config, cli);
    }

    mobdef_core::shutdown_logging();
    return rc;
}
