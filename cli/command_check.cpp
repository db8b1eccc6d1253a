#include "cli_common.hpp"
#include <twin/digital_twin.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/panel_json.hpp>
#include <common/logging.hpp>
#include <set>
#include <utility>

namespace panelroute::cli {

int command_check(int argc, char** argv) {
    auto log = panelroute::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: panelroute check <project.json> [-c <config.json>]\n";
            return 1;
        }

        log->info("Checking placements in: {}", ctx.input_path);

        json::SerializedData input_data = json::read_serialized(ctx.input_path);
        Settings settings = resolve_settings(ctx, input_data);

        DigitalTwin twin(Enclosure::standard_panel(), settings.routing, settings.placement);
        twin.load_snapshot(snapshot_from_json(input_data.data));

        // Each overlapping pair is reported once
        std::set<std::pair<InstanceId, InstanceId>> pairs;
        for (const auto& inst : twin.instances()) {
            CollisionResult result = twin.find_collisions(inst.id);
            for (const auto& other : result.colliding_with) {
                pairs.insert(std::minmax(inst.id, other));
            }
        }

        for (const auto& [a, b] : pairs) {
            log->warn("Collision: {} overlaps {}", a, b);
            std::cout << a << " overlaps " << b << "\n";
        }

        size_t unplaced = 0;
        for (const auto& inst : twin.instances()) {
            if (!inst.physically_placed) ++unplaced;
        }

        log->info("Checked {} instances ({} unplaced): {} collisions",
                  twin.instances().size(), unplaced, pairs.size());

        return pairs.empty() ? 0 : 2;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace panelroute::cli
