#pragma once

// Internal header, not installed.
// Immutable key path threaded through recursive patch application,
// used only to name the failing location in error messages.

#include <string>
#include <utility>
#include <vector>

namespace docstore_cpp::detail {

struct PathFrame {
    const PathFrame* parent = nullptr;
    std::string segment;

    auto child(std::string seg) const -> PathFrame {
        return PathFrame{this, std::move(seg)};
    }

    // Segments from the root joined with ':' (the root frame is unnamed).
    auto to_string() const -> std::string {
        auto segments = std::vector<const std::string*>{};
        for (const auto* f = this; f && f->parent; f = f->parent) {
            segments.push_back(&f->segment);
        }
        auto result = std::string{};
        for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
            if (it != segments.rbegin()) result += ':';
            result += **it;
        }
        return result;
    }
};

}  // namespace docstore_cpp::detail
