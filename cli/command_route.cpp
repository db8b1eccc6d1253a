#include "cli_common.hpp"
#include <twin/digital_twin.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/panel_json.hpp>
#include <common/logging.hpp>

namespace panelroute::cli {

int command_route(int argc, char** argv) {
    auto log = panelroute::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: panelroute route <project.json> -o <routed.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config <file>   Configuration with 'routing' and 'placement' blocks\n";
            std::cerr << "  --resolution MM       Grid cell size (default: from config or 10)\n";
            return 1;
        }

        log->info("Routing project: {}", ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        Settings settings = resolve_settings(ctx, input_data);

        DigitalTwin twin(Enclosure::standard_panel(), settings.routing, settings.placement);
        twin.load_snapshot(snapshot_from_json(input_data.data));
        log->debug("Loaded {} instances, {} connections",
                   twin.instances().size(), twin.connections().size());

        RoutingReport report = twin.route_all_wires();
        for (const auto& [connection_id, reason] : report.failures) {
            log->warn("Connection {} unroutable: {}", connection_id, to_string(reason));
        }

        float total_length = 0.0f;
        for (const auto& wire : twin.wires()) {
            if (wire.length) total_length += *wire.length;
        }

        json::SerializedData data;
        data.step = "routed";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = {
            {"routing", settings.routing},
            {"placement", settings.placement}
        };
        data.data = snapshot_to_json(twin.export_snapshot(SnapshotRoutes::All));

        nlohmann::json failures = nlohmann::json::array();
        for (const auto& [connection_id, reason] : report.failures) {
            failures.push_back({{"connection", connection_id}, {"reason", to_string(reason)}});
        }
        data.stats = {
            {"wire_count", twin.wires().size()},
            {"routed", report.routed},
            {"unroutable", report.unroutable()},
            {"total_length", total_length},
            {"failures", failures}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote routed project to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << report.routed << " routed, "
                  << report.unroutable() << " unroutable)\n";

        return report.unroutable() == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace panelroute::cli
