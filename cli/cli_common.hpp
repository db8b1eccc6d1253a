#ifndef PANELROUTE_CLI_COMMON_HPP
#define PANELROUTE_CLI_COMMON_HPP

#include <placement/placement_service.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <twin/routing_config.hpp>
#include <common/logging.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace panelroute::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<float> resolution;
    bool verbose = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "--resolution") {
            if (i + 1 < argc) {
                try {
                    ctx.resolution = std::stof(argv[++i]);
                } catch (const std::logic_error&) {
                    throw std::runtime_error("--resolution expects a number, got: " +
                                             std::string(argv[i]));
                }
                ++i;
            } else {
                throw std::runtime_error("--resolution requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }

    return {ctx, i};
}

// Routing and placement settings gathered from the project file's config
// block, then the -c file, then command-line overrides
struct Settings {
    RoutingConfig routing;
    PlacementConfig placement;
};

// Layers a config block over settings; keys it leaves out are kept
inline void apply_config(const nlohmann::json& config, Settings& settings) {
    if (!config.is_object()) return;
    if (config.contains("routing")) {
        config["routing"].get_to(settings.routing);
    }
    if (config.contains("placement")) {
        config["placement"].get_to(settings.placement);
    }
}

inline Settings resolve_settings(const CommandContext& ctx, const json::SerializedData& input) {
    auto log = logging::get_logger();
    Settings settings;

    apply_config(input.config, settings);
    if (ctx.config_path) {
        log->info("Loading configuration from {}", *ctx.config_path);
        apply_config(json::read_json_file(*ctx.config_path), settings);
    }
    if (ctx.resolution) {
        settings.routing.resolution = *ctx.resolution;
    }
    return settings;
}

// Command function declarations
int command_route(int argc, char** argv);
int command_check(int argc, char** argv);
int command_library(int argc, char** argv);

}  // namespace panelroute::cli

#endif // PANELROUTE_CLI_COMMON_HPP
