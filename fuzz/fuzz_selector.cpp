// Fuzz target for parse_selector: exercises YAML loading and the scalar
// type resolution used by "$<selector>" array-edit keys.

#include <docstore-cpp/patch.hpp>

#include <docstore-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto selector = docstore_cpp::parse_selector(text);
        (void)selector;
    } catch (const docstore_cpp::PatchError&) {
        return 0;
    }
    return 0;
}
