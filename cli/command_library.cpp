#include "cli_common.hpp"
#include <panel/component_library.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/panel_json.hpp>
#include <common/logging.hpp>

namespace panelroute::cli {

int command_library(int argc, char** argv) {
    auto log = panelroute::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.output_path.empty()) {
            std::cerr << "Usage: panelroute library -o <library.json>\n";
            return 1;
        }

        ComponentLibrary library = ComponentLibrary::standard();

        json::SerializedData data;
        data.step = "library";
        data.timestamp = json::get_timestamp();
        data.data = library.definitions();
        data.stats = {{"definition_count", library.size()}};

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote component library to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << library.size() << " definitions)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace panelroute::cli
