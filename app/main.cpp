#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Routes wires between components placed in an electrical panel.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  route <project.json> -o <routed.json>   Route every wire in the project\n";
    std::cerr << "  check <project.json>                    Report overlapping placements\n";
    std::cerr << "  library -o <library.json>               Write the built-in component catalog\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -c, --config <file>   Configuration with 'routing' and 'placement' blocks\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  --help                Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Exit status:\n";
    std::cerr << "  0 success, 1 error, 2 unroutable wires or collisions found\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  PANELROUTE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "route") {
        return panelroute::cli::command_route(argc, argv);
    } else if (command == "check") {
        return panelroute::cli::command_check(argc, argv);
    } else if (command == "library") {
        return panelroute::cli::command_library(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
