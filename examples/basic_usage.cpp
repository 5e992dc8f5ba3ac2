// basic_usage: demonstrates the core docstore-cpp API
//
// Shows create/create_list, filters with operators and ANYINDEX groups,
// dotted set with push/pull/unset, array-edit merge patches, replace and
// delete, and how failures surface as DbError.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <docstore-cpp/docstore.hpp>

#include <cstdio>
#include <string>

namespace ds = docstore_cpp;

namespace {

void print_table(ds::InMemoryStore& db, const std::string& table, const ds::Filter& filter = {}) {
    for (const auto& record : db.get_list(table, filter)) {
        std::printf("  %s\n", ds::dump_json(record).c_str());
    }
}

}  // anonymous namespace

int main() {
    auto db = ds::InMemoryStore{};
    db.connect(ds::load_config(R"({"name": "demo", "loglevel": "INFO"})"));

    // -- Inserts --------------------------------------------------------------
    db.create_list("vnfs", {
        ds::parse_json(R"({"_id": "vnf-1", "member": 1, "state": "running",
                           "vdur": [{"id": 1, "ip": "10.0.0.1"}, {"id": 2, "ip": "10.0.0.2"}]})"),
        ds::parse_json(R"({"_id": "vnf-2", "member": 2, "state": "stopped", "vdur": []})"),
    });
    auto generated = db.create("vnfs", ds::Value{ds::Object{{"member", 3}, {"state", "running"}}});
    std::printf("Generated id: %s\n", ds::dump_json(generated).c_str());

    // -- Filters --------------------------------------------------------------
    std::printf("Running VNFs: %zu\n", db.count("vnfs", {{"state", "running"}}));
    std::printf("Members 2 and above:\n");
    print_table(db, "vnfs", {{"member.gte", 2}});

    auto with_vdu = db.get_one("vnfs", {{"vdur.ANYINDEX.id", 2}, {"vdur.ANYINDEX.ip", "10.0.0.2"}});
    std::printf("Owner of vdu 2: %s\n", ds::dump_json(*with_vdu->find(ds::Key{"_id"})).c_str());

    // -- Dotted updates -------------------------------------------------------
    auto options = ds::UpdateOptions{};
    options.push = {{"history", "scaled"}};
    db.set_one("vnfs", {{"_id", "vnf-1"}}, {{"config.replicas", 3}}, options);

    // -- Array edition through a merge patch -----------------------------------
    db.set_one("vnfs", {{"_id", "vnf-1"}},
               {{"vdur", ds::parse_json(R"({"${id: 2}": {"ip": "10.0.0.9"}, "$+": {"id": 3}})")}});
    std::printf("After updates:\n");
    print_table(db, "vnfs", {{"_id", "vnf-1"}});

    // -- Replace and delete ---------------------------------------------------
    db.replace("vnfs", "vnf-2", ds::parse_json(R"({"member": 2, "state": "terminated"})"));
    auto removed = db.del_list("vnfs", {{"state.neq", "running"}});
    std::printf("Deleted: %zu, left: %zu\n", removed.deleted, db.count("vnfs"));

    // -- Errors ---------------------------------------------------------------
    try {
        db.get_one("vnfs", {{"_id", "nope"}});
    } catch (const ds::DbError& e) {
        std::printf("%s (http %d)\n", e.what(), ds::http_status(e.kind()));
    }

    if (!db.get_one("vnfs", {{"_id", "nope"}}, false)) {
        std::printf("Lookup without fail_on_empty returned nothing\n");
    }

    db.disconnect();
    return 0;
}
