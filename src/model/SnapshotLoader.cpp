#include "model/SnapshotLoader.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#ifdef PRISM_USE_SQLITE
#include <sqlite3.h>
#endif

namespace fs = std::filesystem;

namespace {
    ElementKind kindFromString(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
        auto kind = parseKind(upper);
        return kind ? *kind : ElementKind::Unknown;
    }
}

bool SnapshotLoader::isSqlitePath(const std::string& path) {
    std::string ext = fs::u8path(path).extension().u8string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".db" || ext == ".sqlite" || ext == ".sqlite3";
}

std::unique_ptr<SnapshotCodeModel> SnapshotLoader::loadFile(const std::string& path) {
    if (isSqlitePath(path)) {
#ifdef PRISM_USE_SQLITE
        return loadSqlite(path);
#else
        throw std::runtime_error("SQLite snapshots are not supported in this build: " + path);
#endif
    }
    return loadJsonFile(path);
}

std::unique_ptr<SnapshotCodeModel> SnapshotLoader::loadJsonFile(const std::string& path) {
    std::ifstream f(fs::u8path(path));
    if (!f.is_open()) {
        throw std::runtime_error("Could not open snapshot file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON Parse Error in " + path + ": " + e.what());
    }

    try {
        auto model = loadJson(document);
        Logger::getInstance().info("Loaded snapshot " + path + " (" + std::to_string(model->elementCount()) + " elements)");
        return model;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid snapshot " + path + ": " + e.what());
    }
}

SnapshotCodeModel::Element SnapshotLoader::elementFromJson(const nlohmann::json& j) {
    SnapshotCodeModel::Element e;
    e.id = j.at("id").get<std::int64_t>();
    e.kind = kindFromString(j.value("kind", "UNKNOWN"));
    e.name = j.value("name", "");
    e.qualifiedName = j.value("qualifiedName", "");
    e.language = j.value("language", "");
    e.location.path = j.value("file", "");
    e.location.line = j.value("line", 0);
    e.location.column = j.value("column", 0);
    e.endLine = j.value("endLine", 0);
    e.container = j.value("container", static_cast<std::int64_t>(0));
    e.library = j.value("library", false);
    e.signature.returnType = j.value("returnType", "");

    if (j.contains("parameters")) {
        for (const auto& p : j["parameters"]) {
            e.signature.parameters.push_back({p.value("name", ""), p.value("type", "")});
        }
    }
    if (j.contains("supertypes")) {
        for (const auto& s : j["supertypes"]) {
            SnapshotCodeModel::SupertypeEntry st;
            st.name = s.at("name").get<std::string>();
            st.isInterface = s.value("interface", false);
            st.target = s.value("target", static_cast<std::int64_t>(0));
            e.supertypes.push_back(std::move(st));
        }
    }
    if (j.contains("overrides")) {
        e.overrides = j["overrides"].get<std::vector<std::int64_t>>();
    }
    if (j.contains("calls")) {
        for (const auto& c : j["calls"]) {
            SnapshotCodeModel::CallEntry call;
            call.text = c.value("text", "");
            call.location.path = c.value("file", e.location.path);
            call.location.line = c.value("line", 0);
            call.location.column = c.value("column", 0);
            call.target = c.value("target", static_cast<std::int64_t>(0));
            e.calls.push_back(std::move(call));
        }
    }
    return e;
}

SnapshotCodeModel::Element SnapshotLoader::referenceFromJson(const nlohmann::json& j, std::int64_t id) {
    SnapshotCodeModel::Element ref;
    ref.id = j.value("id", id);
    ref.kind = ElementKind::Reference;
    ref.referenceTarget = j.at("target").get<std::int64_t>();
    ref.container = j.value("enclosing", static_cast<std::int64_t>(0));
    ref.location.path = j.value("file", "");
    ref.location.line = j.value("line", 0);
    ref.location.column = j.value("column", 0);
    return ref;
}

std::unique_ptr<SnapshotCodeModel> SnapshotLoader::loadJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Snapshot root must be a JSON object");
    }
    int version = document.value("version", 1);
    if (version != 1) {
        throw std::runtime_error("Unsupported snapshot version: " + std::to_string(version));
    }

    auto model = std::make_unique<SnapshotCodeModel>();
    model->setIndexReady(document.value("indexReady", true));

    if (document.contains("languages")) {
        for (const auto& lang : document["languages"]) {
            model->addLanguage(lang.get<std::string>());
        }
    }

    std::int64_t maxId = 0;
    if (document.contains("elements")) {
        for (const auto& item : document["elements"]) {
            auto element = elementFromJson(item);
            maxId = std::max(maxId, element.id);
            model->addElement(std::move(element));
        }
    }

    // References without an explicit id are numbered after the declarations.
    if (document.contains("references")) {
        std::int64_t nextId = maxId + 1;
        for (const auto& item : document["references"]) {
            auto ref = referenceFromJson(item, nextId);
            nextId = std::max(nextId, ref.id) + 1;
            model->addElement(std::move(ref));
        }
    }

    model->buildIndices();
    return model;
}

#ifdef PRISM_USE_SQLITE

namespace {
    std::string columnText(sqlite3_stmt* stmt, int col) {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    class Statement {
    public:
        Statement(sqlite3* db, const char* sql) {
            if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
                std::string err = sqlite3_errmsg(db);
                sqlite3_finalize(stmt);
                throw std::runtime_error("SQLite prepare failed (" + err + "): " + sql);
            }
        }
        ~Statement() { sqlite3_finalize(stmt); }
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        bool step() { return sqlite3_step(stmt) == SQLITE_ROW; }
        sqlite3_stmt* get() const { return stmt; }

    private:
        sqlite3_stmt* stmt = nullptr;
    };
}

std::unique_ptr<SnapshotCodeModel> SnapshotLoader::loadSqlite(const std::string& path) {
    if (!fs::exists(fs::u8path(path))) {
        throw std::runtime_error("Could not open snapshot database: " + path);
    }

    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw std::runtime_error("Could not open snapshot database " + path + ": " + err);
    }
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> guard(db, sqlite3_close);

    auto model = std::make_unique<SnapshotCodeModel>();
    std::unordered_map<std::int64_t, SnapshotCodeModel::Element> pending;
    std::vector<std::int64_t> order;

    {
        Statement meta(db, "SELECT key, value FROM meta;");
        while (meta.step()) {
            std::string key = columnText(meta.get(), 0);
            std::string value = columnText(meta.get(), 1);
            if (key == "index_ready") model->setIndexReady(value != "0" && value != "false");
            if (key == "language") model->addLanguage(value);
            if (key == "version" && value != "1") {
                throw std::runtime_error("Unsupported snapshot version in " + path + ": " + value);
            }
        }
    }

    {
        Statement rows(db,
            "SELECT id, kind, name, qualified_name, language, file, line, col, end_line, container, library, return_type "
            "FROM elements ORDER BY id;");
        while (rows.step()) {
            sqlite3_stmt* s = rows.get();
            SnapshotCodeModel::Element e;
            e.id = sqlite3_column_int64(s, 0);
            e.kind = kindFromString(columnText(s, 1));
            e.name = columnText(s, 2);
            e.qualifiedName = columnText(s, 3);
            e.language = columnText(s, 4);
            e.location.path = columnText(s, 5);
            e.location.line = sqlite3_column_int(s, 6);
            e.location.column = sqlite3_column_int(s, 7);
            e.endLine = sqlite3_column_int(s, 8);
            e.container = sqlite3_column_int64(s, 9);
            e.library = sqlite3_column_int(s, 10) != 0;
            e.signature.returnType = columnText(s, 11);
            order.push_back(e.id);
            pending.emplace(e.id, std::move(e));
        }
    }

    auto owner = [&](std::int64_t id) -> SnapshotCodeModel::Element* {
        auto it = pending.find(id);
        return it == pending.end() ? nullptr : &it->second;
    };

    {
        Statement rows(db, "SELECT element_id, name, type FROM parameters ORDER BY element_id, position;");
        while (rows.step()) {
            if (auto* e = owner(sqlite3_column_int64(rows.get(), 0))) {
                e->signature.parameters.push_back({columnText(rows.get(), 1), columnText(rows.get(), 2)});
            }
        }
    }
    {
        Statement rows(db,
            "SELECT element_id, declared_name, is_interface, target FROM supertypes ORDER BY element_id, position;");
        while (rows.step()) {
            if (auto* e = owner(sqlite3_column_int64(rows.get(), 0))) {
                SnapshotCodeModel::SupertypeEntry st;
                st.name = columnText(rows.get(), 1);
                st.isInterface = sqlite3_column_int(rows.get(), 2) != 0;
                st.target = sqlite3_column_int64(rows.get(), 3);
                e->supertypes.push_back(std::move(st));
            }
        }
    }
    {
        Statement rows(db, "SELECT method_id, super_id FROM overrides ORDER BY method_id, super_id;");
        while (rows.step()) {
            if (auto* e = owner(sqlite3_column_int64(rows.get(), 0))) {
                e->overrides.push_back(sqlite3_column_int64(rows.get(), 1));
            }
        }
    }
    {
        Statement rows(db,
            "SELECT method_id, text, file, line, col, target FROM call_sites ORDER BY method_id, position;");
        while (rows.step()) {
            if (auto* e = owner(sqlite3_column_int64(rows.get(), 0))) {
                SnapshotCodeModel::CallEntry call;
                call.text = columnText(rows.get(), 1);
                call.location.path = columnText(rows.get(), 2);
                call.location.line = sqlite3_column_int(rows.get(), 3);
                call.location.column = sqlite3_column_int(rows.get(), 4);
                call.target = sqlite3_column_int64(rows.get(), 5);
                e->calls.push_back(std::move(call));
            }
        }
    }

    for (auto id : order) {
        model->addElement(std::move(pending.at(id)));
    }

    {
        Statement rows(db, "SELECT id, target, file, line, col, enclosing FROM refs ORDER BY id;");
        while (rows.step()) {
            SnapshotCodeModel::Element ref;
            ref.id = sqlite3_column_int64(rows.get(), 0);
            ref.kind = ElementKind::Reference;
            ref.referenceTarget = sqlite3_column_int64(rows.get(), 1);
            ref.location.path = columnText(rows.get(), 2);
            ref.location.line = sqlite3_column_int(rows.get(), 3);
            ref.location.column = sqlite3_column_int(rows.get(), 4);
            ref.container = sqlite3_column_int64(rows.get(), 5);
            model->addElement(std::move(ref));
        }
    }

    model->buildIndices();
    Logger::getInstance().info("Loaded snapshot database " + path + " (" + std::to_string(model->elementCount()) + " elements)");
    return model;
}

#endif
