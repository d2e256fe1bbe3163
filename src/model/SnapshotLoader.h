#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "model/SnapshotCodeModel.h"

/**
 * @brief Reads a code model snapshot exported by an external indexer.
 *
 * Two containers are understood:
 * - JSON documents (`.json`), always available
 * - SQLite databases (`.db`, `.sqlite`, `.sqlite3`), when built with PRISM_USE_SQLITE
 *
 * All loaders throw std::runtime_error with the offending path and reason.
 */
class SnapshotLoader {
public:
    static std::unique_ptr<SnapshotCodeModel> loadFile(const std::string& path);
    static std::unique_ptr<SnapshotCodeModel> loadJson(const nlohmann::json& document);
    static std::unique_ptr<SnapshotCodeModel> loadJsonFile(const std::string& path);

#ifdef PRISM_USE_SQLITE
    static std::unique_ptr<SnapshotCodeModel> loadSqlite(const std::string& path);
#endif

    static bool isSqlitePath(const std::string& path);

private:
    static SnapshotCodeModel::Element elementFromJson(const nlohmann::json& j);
    static SnapshotCodeModel::Element referenceFromJson(const nlohmann::json& j, std::int64_t id);
};
