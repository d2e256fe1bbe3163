#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <algorithm>
#include <nlohmann/json.hpp>

/**
 * @brief Traversal bounds shared by every resolution algorithm.
 */
struct QueryLimits {
    int typeHierarchyDepth = 100;     // recursion ceiling, static family
    int dynamicHierarchyDepth = 50;   // recursion ceiling, dynamic/script families
    int subtypeLimit = 100;
    int callStackDepth = 50;
    int callResultsPerLevel = 20;
    int superMethodSearchCap = 10;    // overridden methods searched for callers
    int implementationLimit = 100;
    int defaultCallDepth = 3;
    int maxCallDepth = 5;
    int defaultSymbolLimit = 25;
    int maxSymbolLimit = 100;

    // Pulls configured values back inside the supported ranges: call depth
    // 1..5, symbol limit 1..100, and the recursion ceilings above.
    void normalize() {
        typeHierarchyDepth = std::min(typeHierarchyDepth, 100);
        dynamicHierarchyDepth = std::min(dynamicHierarchyDepth, 50);
        callStackDepth = std::min(callStackDepth, 50);
        maxCallDepth = std::clamp(maxCallDepth, 1, 5);
        defaultCallDepth = std::clamp(defaultCallDepth, 1, maxCallDepth);
        maxSymbolLimit = std::clamp(maxSymbolLimit, 1, 100);
        defaultSymbolLimit = std::clamp(defaultSymbolLimit, 1, maxSymbolLimit);
    }

    int clampCallDepth(int depth) const {
        return std::clamp(depth, 1, std::max(1, maxCallDepth));
    }
    int clampSymbolLimit(int limit) const {
        return std::clamp(limit, 1, std::max(1, maxSymbolLimit));
    }
};

struct Config {
    std::string snapshotPath;
    std::string logFile = "prism.log";
    bool enableDebug = false;
    std::vector<std::string> disabledLanguages;
    QueryLimits limits;

    bool isLanguageDisabled(const std::string& languageId) const {
        return std::find(disabledLanguages.begin(), disabledLanguages.end(), languageId) != disabledLanguages.end();
    }

    static Config defaults() { return Config{}; }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        cfg.snapshotPath = j.value("snapshot", "");
        cfg.logFile = j.value("log_file", cfg.logFile);
        cfg.enableDebug = j.value("debug", false);
        if (j.contains("disabled_languages")) {
            cfg.disabledLanguages = j["disabled_languages"].get<std::vector<std::string>>();
        }

        if (j.contains("limits")) {
            const auto& l = j["limits"];
            QueryLimits& lim = cfg.limits;
            auto read = [&l](const char* key, int& field) {
                field = l.value(key, field);
                if (field < 0) {
                    throw std::runtime_error(std::string("limits.") + key + " must not be negative");
                }
            };
            read("type_hierarchy_depth", lim.typeHierarchyDepth);
            read("dynamic_hierarchy_depth", lim.dynamicHierarchyDepth);
            read("subtype_limit", lim.subtypeLimit);
            read("call_stack_depth", lim.callStackDepth);
            read("call_results_per_level", lim.callResultsPerLevel);
            read("super_method_search_cap", lim.superMethodSearchCap);
            read("implementation_limit", lim.implementationLimit);
            read("default_call_depth", lim.defaultCallDepth);
            read("max_call_depth", lim.maxCallDepth);
            read("default_symbol_limit", lim.defaultSymbolLimit);
            read("max_symbol_limit", lim.maxSymbolLimit);
            lim.normalize();
        }
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        Config cfg;
        try {
            cfg = fromJson(j);
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
        }

        // Relative snapshot paths are resolved against the config file.
        if (!cfg.snapshotPath.empty()) {
            std::filesystem::path snap = std::filesystem::u8path(cfg.snapshotPath);
            if (snap.is_relative() && path.has_parent_path()) {
                cfg.snapshotPath = (path.parent_path() / snap).u8string();
            }
        }
        return cfg;
    }
};
