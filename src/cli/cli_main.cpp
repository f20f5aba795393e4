// src/cli/cli_main.cpp
#include <iostream>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "igknight/api/game_api.h"
#include "igknight/cli/cli_interface.h"
#include "igknight/cli/command_parser.h"

using namespace igknight;

void showHelp() {
    std::cout << "Usage: igknight_cli [options] [command...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --help, -h            Show this help message" << std::endl;
    std::cout << "  --config FILE         Read options from a JSON file" << std::endl;
    std::cout << "  --legal-moves         Include legal moves in request responses" << std::endl;
    std::cout << "  --diagram             Include a board diagram in request responses" << std::endl;
    std::cout << "  --verbose             Log rejected requests to stderr" << std::endl;
    std::cout << std::endl;
    std::cout << "With a command (e.g. igknight_cli request '{\"action\":\"status\",...}')" << std::endl;
    std::cout << "it runs once and exits; otherwise an interactive shell starts." << std::endl;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            showHelp();
            return 0;
        }
    }

    std::map<std::string, std::string> flags = cli::CommandParser::extractFlags(args);

    // A bare switch followed by the command swallows the command word
    for (const char* name : {"legal-moves", "diagram", "verbose"}) {
        auto it = flags.find(name);
        if (it == flags.end() || it->second.empty()) {
            continue;
        }
        bool recognized = cli::CommandParser::getFlagValueBool(flags, name, true) ==
                          cli::CommandParser::getFlagValueBool(flags, name, false);
        if (!recognized) {
            args.insert(args.begin(), it->second);
            it->second.clear();
        }
    }

    api::GameApiConfig config;
    if (cli::CommandParser::hasFlag(flags, "config")) {
        std::string path = cli::CommandParser::getFlagValue(flags, "config");
        std::ifstream file(path);
        if (!file) {
            std::cerr << "Error: cannot open config file " << path << std::endl;
            return 1;
        }

        try {
            config = api::GameApiConfig::fromJson(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Error reading config file " << path << ": " << e.what() << std::endl;
            return 1;
        }
    }

    // Command-line flags override the config file
    config.includeLegalMoves = cli::CommandParser::getFlagValueBool(flags, "legal-moves", config.includeLegalMoves);
    config.includeDiagram = cli::CommandParser::getFlagValueBool(flags, "diagram", config.includeDiagram);
    config.verbose = cli::CommandParser::getFlagValueBool(flags, "verbose", config.verbose);

    cli::CLIInterface cliInterface(config);

    if (!args.empty()) {
        std::string line;
        for (const auto& arg : args) {
            if (!line.empty()) {
                line += " ";
            }
            line += arg;
        }
        return cliInterface.executeLine(line) ? 0 : 1;
    }

    return cliInterface.run();
}
