#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/QueryFacade.h"
#include "core/RequestServer.h"
#include "model/SnapshotLoader.h"
#include "tools/NavigationTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[31m";
const std::string GREEN = "\033[32m";
const std::string GRAY = "\033[38;5;242m";

void printUsage() {
    std::cerr << "Usage: prism [--config <config.json>] [--snapshot <file>] [--debug] <command>" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  tools                      List available tools and their schemas" << std::endl;
    std::cerr << "  call <tool> [json-args]    Run one tool and print its JSON response" << std::endl;
    std::cerr << "  serve                      Answer line-delimited JSON requests on stdin" << std::endl;
}

struct CliOptions {
    std::string configPath;
    std::string snapshotPath;
    bool debug = false;
    std::vector<std::string> positional;
};

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--snapshot") {
            if (i + 1 >= argc) {
                std::cerr << RED << "✖ Missing value for " << arg << RESET << std::endl;
                return false;
            }
            (arg == "--config" ? opts.configPath : opts.snapshotPath) = argv[++i];
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return !opts.positional.empty();
}

int serve(ToolRegistry& tools) {
    RequestServer server(tools, [](const nlohmann::json& message) {
        std::cout << message.dump() << std::endl;
    });

    std::string line;
    while (std::getline(std::cin, line)) {
        server.handleLine(line);
    }
    server.shutdown();
    return 0;
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 1;
    }

    Config cfg;
    try {
        if (!opts.configPath.empty()) {
            cfg = Config::load(opts.configPath);
        } else if (fs::exists(fs::u8path("prism.json"))) {
            cfg = Config::load("prism.json");
        }
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        return 1;
    }
    if (!opts.snapshotPath.empty()) cfg.snapshotPath = opts.snapshotPath;
    if (opts.debug) cfg.enableDebug = true;

    Logger::getInstance().setLogFile(cfg.logFile);
    Logger::getInstance().setDebugEnabled(cfg.enableDebug);

    if (cfg.snapshotPath.empty()) {
        std::cerr << RED << "✖ No snapshot given (use --snapshot or \"snapshot\" in the config)" << RESET << std::endl;
        return 1;
    }

    std::unique_ptr<SnapshotCodeModel> model;
    try {
        model = SnapshotLoader::loadFile(cfg.snapshotPath);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load snapshot: " << e.what() << RESET << std::endl;
        return 1;
    }
    std::cerr << GREEN << "✔ Loaded snapshot: " << BOLD << cfg.snapshotPath << RESET
              << GRAY << " (" << model->elementCount() << " elements)" << RESET << std::endl;

    QueryFacade facade = QueryFacade::create(*model, cfg);
    ToolRegistry tools;
    registerNavigationTools(tools, facade);

    const std::string& command = opts.positional[0];
    if (command == "tools") {
        nlohmann::json list = tools.listToolSchemas();
        std::cout << list.dump(2) << std::endl;
        return 0;
    }

    if (command == "call") {
        if (opts.positional.size() < 2) {
            printUsage();
            return 1;
        }
        nlohmann::json args = nlohmann::json::object();
        if (opts.positional.size() >= 3) {
            try {
                args = nlohmann::json::parse(opts.positional[2]);
            } catch (const nlohmann::json::parse_error& e) {
                std::cerr << RED << "✖ Invalid JSON arguments: " << e.what() << RESET << std::endl;
                return 1;
            }
        }
        nlohmann::json result = tools.executeTool(opts.positional[1], args);
        std::cout << result.dump(2) << std::endl;
        return result.value("isError", false) ? 2 : 0;
    }

    if (command == "serve") {
        return serve(tools);
    }

    std::cerr << RED << "✖ Unknown command: " << command << RESET << std::endl;
    printUsage();
    return 1;
}
