// Fuzz target for apply_merge_patch: the input is "<target json>\n<patch json>".
// Rejections are reported as DbError; anything else escaping is a bug.

#include <docstore-cpp/docstore.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = text.find('\n');
    if (split == std::string_view::npos) return 0;

    try {
        auto target = docstore_cpp::parse_json(text.substr(0, split));
        const auto patch = docstore_cpp::parse_json(text.substr(split + 1));
        docstore_cpp::apply_merge_patch(target, patch);

        // A patch that went through once must serialize
        auto dumped = docstore_cpp::dump_json(target);
        (void)dumped;
    } catch (const docstore_cpp::DbError&) {
        return 0;
    }
    return 0;
}
