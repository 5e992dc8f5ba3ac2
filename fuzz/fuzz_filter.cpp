// Fuzz target for the filter compiler and matcher: the input is
// "<filter json object>\n<document json>".

#include <docstore-cpp/docstore.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = text.find('\n');
    if (split == std::string_view::npos) return 0;

    const auto filter_json = nlohmann::json::parse(text.substr(0, split), nullptr, false);
    if (filter_json.is_discarded() || !filter_json.is_object()) return 0;

    try {
        const auto filter = filter_json.get<docstore_cpp::Filter>();
        const auto document = docstore_cpp::parse_json(text.substr(split + 1));
        const auto predicate = docstore_cpp::compile(filter);
        auto matched = docstore_cpp::matches(document, predicate);
        (void)matched;
    } catch (const docstore_cpp::DbError&) {
        return 0;
    }
    return 0;
}
