/// mcpconf: manage the MCP server registry of a desktop host application.
/// Usage: ./mcpconf [--config FILE] [--backup-dir DIR] <command> ...

#include <mcpconf/cli.hpp>
#include <iostream>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        mcpconf::Cli cli{mcpconf::Cli::system_collaborators(), std::cout, std::cerr};
        return cli.run(args);
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
