// json_interop_demo: docstore-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Loading records from a JSON document into a store
//   - Filters and updates written as JSON objects
//   - Exporting query results and operation results back to JSON
//   - Round-tripping a Config through JSON
//
// Build: cmake --build build -DDOCSTORE_BUILD_EXAMPLES=ON
// Run:   ./build/examples/json_interop_demo

#include <docstore-cpp/docstore.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace ds = docstore_cpp;
using json = nlohmann::json;

// =============================================================================
// Import: nlohmann::json → store
// =============================================================================

static auto import_table(ds::Database& db, const std::string& table, const json& rows)
    -> std::vector<ds::Value> {
    auto records = rows.get<std::vector<ds::Value>>();
    return db.create_list(table, std::move(records));
}

// =============================================================================
// Export: store → nlohmann::json
// =============================================================================

static auto export_table(ds::Database& db, const std::string& table, const json& filter) -> json {
    auto result = json::array();
    for (const auto& record : db.get_list(table, filter.get<ds::Filter>())) {
        result.push_back(record);
    }
    return result;
}

int main() {
    const auto catalog = json::parse(R"([
        {"_id": "nsd-1", "name": "web", "version": 2, "tags": ["http", "edge"]},
        {"_id": "nsd-2", "name": "db", "version": 5, "tags": ["storage"]},
        {"_id": "nsd-3", "name": "cache", "version": 1, "tags": ["storage", "edge"]}
    ])");

    auto db = ds::InMemoryStore{};
    auto ids = import_table(db, "nsds", catalog);
    std::printf("Imported %zu records\n", ids.size());

    // -- Filters as JSON ------------------------------------------------------
    const auto edge = export_table(db, "nsds", json::parse(R"({"tags.cont": ["edge"]})"));
    std::printf("Edge descriptors:\n%s\n", edge.dump(2).c_str());

    const auto recent = export_table(db, "nsds", json::parse(R"({"version.gt": 1, "tags.ncont": ["http"]})"));
    std::printf("Recent non-http descriptors: %s\n", recent.dump().c_str());

    // -- Updates as JSON ------------------------------------------------------
    const auto update = json::parse(R"({"tags": {"$storage": null, "$+": "persistent"}})");
    auto updated = db.set_list("nsds", {{"tags.cont", ds::Array{"storage"}}}, update.get<ds::Update>());
    if (updated) {
        std::printf("set_list: %s\n", json(*updated).dump().c_str());
    }
    std::printf("After update: %s\n", export_table(db, "nsds", json::object()).dump().c_str());

    auto deleted = db.del_list("nsds", {{"name", "cache"}});
    std::printf("del_list: %s\n", json(deleted).dump().c_str());

    // -- Config round-trip ----------------------------------------------------
    auto config = ds::load_config(R"({"name": "osm", "loglevel": "ERROR", "masterpassword": "k"})");
    db.connect(config);
    const auto written = json(config);
    std::printf("Config: %s\n", written.dump().c_str());
    std::printf("Round-trip equal: %s\n", written.get<ds::Config>() == config ? "yes" : "no");

    return 0;
}
