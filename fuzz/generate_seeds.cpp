// Helper to generate seed corpus files for the fuzz targets.
// Build and run once: ./generate_seeds
// Writes the seed corpora; it is not a fuzz target.

#include <docstore-cpp/docstore.hpp>

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

// Seeds for the two-part targets are "<first json>\n<second json>".
static auto pair_seed(const docstore_cpp::Value& first, const docstore_cpp::Value& second)
    -> std::string {
    return docstore_cpp::dump_json(first) + "\n" + docstore_cpp::dump_json(second);
}

int main() {
    namespace fs = std::filesystem;
    using docstore_cpp::parse_json;

    const auto patch_dir = std::string{"fuzz/corpus/patch"};
    const auto selector_dir = std::string{"fuzz/corpus/selector"};
    const auto filter_dir = std::string{"fuzz/corpus/filter"};
    fs::create_directories(patch_dir);
    fs::create_directories(selector_dir);
    fs::create_directories(filter_dir);

    // -- fuzz_patch -----------------------------------------------------------
    write_seed(patch_dir + "/seed_dict.txt",
               pair_seed(parse_json(R"({"a": "b", "c": {"d": 1}})"),
                         parse_json(R"({"a": null, "c": {"e": [1, 2]}})")));
    write_seed(patch_dir + "/seed_array_edit.txt",
               pair_seed(parse_json(R"({"A": ["a", "b", "a"]})"),
                         parse_json(R"({"A": {"$a": null, "$+[1]": "x", "$[-1]": "z"}})")));
    write_seed(patch_dir + "/seed_selector.txt",
               pair_seed(parse_json(R"({"vdur": [{"id": 1, "ip": "a"}, {"id": 2}]})"),
                         parse_json(R"({"vdur": {"${id: 2}": {"ip": "b"}, "$+{id: 3}": {"id": 3}}})")));

    // -- fuzz_selector --------------------------------------------------------
    write_seed(selector_dir + "/seed_scalar.txt", "12");
    write_seed(selector_dir + "/seed_pair.txt", "id: 'x'");
    write_seed(selector_dir + "/seed_flow_map.txt", "{id: 1, tags: [a, \"b\"], ok: true}");

    // -- fuzz_filter ----------------------------------------------------------
    const auto record = parse_json(
        R"({"_id": 8, "data": {"size": 4}, "list": [{"a": 3, "b": 0, "c": [{"a": 0, "b": "v"}]}]})");
    write_seed(filter_dir + "/seed_ops.txt",
               pair_seed(parse_json(R"({"data.size.gte": 4, "_id.neq": null})"), record));
    write_seed(filter_dir + "/seed_anyindex.txt",
               pair_seed(parse_json(R"({"list.ANYINDEX.a": 3, "list.ANYINDEX.c.ANYINDEX.b": "v"})"),
                         record));

    return 0;
}
