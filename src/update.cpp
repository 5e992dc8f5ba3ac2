#include <docstore-cpp/update.hpp>

#include <docstore-cpp/error.hpp>
#include <docstore-cpp/json.hpp>
#include <docstore-cpp/patch.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docstore_cpp {

namespace {

// Nulls a set may add to pad a sequence up to a numeric segment.
constexpr std::size_t max_padding = 10000;

auto split_path(const std::string& dotted) -> std::vector<std::string> {
    auto segments = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto dot = dotted.find('.', start);
        auto segment = dotted.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (segment.empty()) {
            throw DbError{ErrorKind::bad_request, "Invalid update path '" + dotted + "'"};
        }
        segments.push_back(std::move(segment));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

auto decimal_index(const std::string& segment) -> std::optional<std::size_t> {
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec != std::errc{} || ptr != segment.data() + segment.size()) return std::nullopt;
    return result;
}

auto map_key(const Value& map, const std::string& segment) -> Key {
    if (!map.contains(Key{segment})) {
        if (auto index = decimal_index(segment)) {
            auto int_key = Key{static_cast<std::int64_t>(*index)};
            if (map.contains(int_key)) return int_key;
        }
    }
    return Key{segment};
}

/// Walks a dotted path inside one record. With `populate` the missing
/// pieces are created on the way; without it a missing piece ends the walk.
class PathWalker {
public:
    PathWalker(Value& root, const std::string& dotted, bool populate)
        : root_{root}, dotted_{dotted}, segments_{split_path(dotted)}, populate_{populate} {}

    /// The slot addressed by the full path, or nullptr when absent.
    auto slot() -> Value* {
        auto* node = &root_;
        for (std::size_t i = 0; i < segments_.size() && node; ++i) {
            node = step(*node, i);
        }
        return node;
    }

    /// Remove the addressed slot. Returns true when something was removed.
    auto remove() -> bool {
        auto* parent = &root_;
        for (std::size_t i = 0; i + 1 < segments_.size() && parent; ++i) {
            parent = step(*parent, i);
        }
        if (!parent) return false;
        const auto& leaf = segments_.back();
        if (parent->is_object()) return parent->erase(map_key(*parent, leaf));
        if (auto* items = parent->get_if<Array>()) {
            auto index = decimal_index(leaf);
            if (!index || *index >= items->size()) return false;
            items->erase(items->begin() + static_cast<std::ptrdiff_t>(*index));
            return true;
        }
        return false;
    }

private:
    Value& root_;
    const std::string& dotted_;
    std::vector<std::string> segments_;
    bool populate_;

    auto prefix(std::size_t count) const -> std::string {
        auto result = std::string{};
        for (std::size_t i = 0; i < count; ++i) {
            if (i) result += '.';
            result += segments_[i];
        }
        return result;
    }

    auto step(Value& node, std::size_t i) -> Value* {
        const auto& segment = segments_[i];
        if (node.is_null() && populate_) node = Object{};

        if (node.is_object()) {
            auto key = map_key(node, segment);
            if (auto* found = node.find(key)) return found;
            if (!populate_) return nullptr;
            return &node.as_object().emplace(std::move(key), Value{}).first->second;
        }

        if (auto* items = node.get_if<Array>()) {
            auto index = decimal_index(segment);
            if (!index) {
                if (!populate_) return nullptr;
                throw DbError{ErrorKind::bad_request,
                              "Cannot set '" + dotted_ + "': '" + prefix(i) +
                              "' is an array and '" + segment + "' is not an index"};
            }
            if (*index >= items->size()) {
                if (!populate_) return nullptr;
                if (*index - items->size() > max_padding) {
                    throw DbError{ErrorKind::bad_request,
                                  "Cannot set '" + dotted_ + "': index " + segment +
                                  " is too far past the end of '" + prefix(i) + "'"};
                }
                items->resize(*index + 1);
            }
            return &(*items)[*index];
        }

        if (!populate_) return nullptr;
        throw DbError{ErrorKind::bad_request,
                      "Cannot set '" + dotted_ + "' on existing '" + prefix(i) + "=" +
                      dump_json(node) + "'"};
    }
};

auto require_array(Value& slot, const std::string& path, const char* operation) -> Array& {
    auto* items = slot.get_if<Array>();
    if (!items) {
        throw DbError{ErrorKind::bad_request, std::string{"Cannot "} + operation + " '" + path +
                                              "': it is not an array"};
    }
    return *items;
}

auto require_list(const Value& v, const std::string& path, const char* operation) -> const Array& {
    const auto* items = v.get_if<Array>();
    if (!items) {
        throw DbError{ErrorKind::bad_request, std::string{"Invalid "} + operation + " for '" + path +
                                              "': a list is expected"};
    }
    return *items;
}

void pull_matching(Value& record, const std::string& path, const Array& unwanted) {
    auto* slot = PathWalker{record, path, false}.slot();
    if (!slot) return;
    auto& items = require_array(*slot, path, "pull from");
    std::erase_if(items, [&](const Value& item) { return array_contains(unwanted, item); });
}

// Only a missing sequence is created; an existing null is not a sequence.
void push_all(Value& record, const std::string& path, const Array& extra) {
    auto* slot = PathWalker{record, path, false}.slot();
    if (!slot) {
        slot = PathWalker{record, path, true}.slot();
        *slot = Array{};
    }
    auto& items = require_array(*slot, path, "push to");
    items.insert(items.end(), extra.begin(), extra.end());
}

}  // anonymous namespace

auto apply_update(Value& record, const Update& set, const UpdateOptions& options) -> bool {
    const auto before = record;

    for (const auto& [path, v] : set) {
        auto* slot = PathWalker{record, path, true}.slot();
        if (v.is_object()) {
            apply_merge_patch(*slot, v);
        } else {
            *slot = v;
        }
    }

    for (const auto& path : options.unset) {
        PathWalker{record, path, false}.remove();
    }

    for (const auto& [path, v] : options.pull) {
        pull_matching(record, path, Array{v});
    }
    for (const auto& [path, v] : options.pull_list) {
        pull_matching(record, path, require_list(v, path, "pull_list"));
    }

    for (const auto& [path, v] : options.push) {
        push_all(record, path, Array{v});
    }
    for (const auto& [path, v] : options.push_list) {
        push_all(record, path, require_list(v, path, "push_list"));
    }

    return record != before;
}

}  // namespace docstore_cpp
