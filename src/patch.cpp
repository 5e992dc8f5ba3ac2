#include <docstore-cpp/patch.hpp>

#include <docstore-cpp/error.hpp>

#include "path_frame.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docstore_cpp {

namespace {

using detail::PathFrame;

enum class NodeKind : std::uint8_t {
    plain,       // no key starts with '$' (an empty map is plain)
    array_edit,  // every key starts with '$'
};

auto is_directive(const Key& key) -> bool {
    const auto* s = std::get_if<std::string>(&key);
    return s && s->starts_with('$');
}

auto classify(const Object& node, const PathFrame& path) -> NodeKind {
    auto kind = std::optional<NodeKind>{};
    for (const auto& [key, _] : node) {
        auto this_kind = is_directive(key) ? NodeKind::array_edit : NodeKind::plain;
        if (kind && *kind != this_kind) {
            throw PatchError{"Found array edition (keys starting with '$') and pure dictionary "
                             "edition in the same dict at '" + path.to_string() + "'"};
        }
        kind = this_kind;
    }
    return kind.value_or(NodeKind::plain);
}

void merge_object(Object& target, const Object& patch, const PathFrame& path);
void edit_array(Array& target, const Object& patch, const PathFrame& path);

void require_plain(const Object& patch, const PathFrame& path) {
    if (classify(patch, path) == NodeKind::array_edit) {
        throw PatchError{"Array edition (keys starting with '$') over a value that is not "
                         "an array at '" + path.to_string() + "'"};
    }
}

// A fresh copy of a map patch value: RFC 7396 merge into an empty map,
// which drops null members at every depth.
auto fresh_copy(const Object& patch, const PathFrame& path) -> Value {
    auto result = Object{};
    merge_object(result, patch, path);
    return Value{std::move(result)};
}

// Copy of a value about to be inserted or appended into an array.
auto materialize(const Value& v, const PathFrame& path) -> Value {
    if (const auto* obj = v.get_if<Object>()) return fresh_copy(*obj, path);
    return v;
}

// Merge one patch value into an existing slot (map member or array element).
void merge_into(Value& slot, const Object& patch, const PathFrame& path) {
    if (auto* obj = slot.get_if<Object>()) {
        merge_object(*obj, patch, path);
        return;
    }
    if (auto* arr = slot.get_if<Array>()) {
        if (classify(patch, path) == NodeKind::array_edit) {
            edit_array(*arr, patch, path);
            return;
        }
    }
    slot = fresh_copy(patch, path);
}

void merge_object(Object& target, const Object& patch, const PathFrame& path) {
    require_plain(patch, path);
    for (const auto& [key, v] : patch) {
        auto here = path.child(key_to_string(key));
        if (v.is_null()) {
            target.erase(key);
            continue;
        }
        const auto* v_obj = v.get_if<Object>();
        if (!v_obj) {
            target.insert_or_assign(key, v);
            continue;
        }
        auto it = target.find(key);
        if (it == target.end()) {
            target.emplace(key, fresh_copy(*v_obj, here));
            continue;
        }
        merge_into(it->second, *v_obj, here);
    }
}

// -- Array edition ------------------------------------------------------------

auto parse_index(std::string_view text) -> std::optional<std::int64_t> {
    if (text.starts_with('+')) text.remove_prefix(1);
    if (text.empty()) return std::nullopt;
    auto result = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return result;
}

auto element_matches(const Value& element, const Value& selector) -> bool {
    if (const auto* filter = selector.get_if<Object>()) {
        const auto* item = element.get_if<Object>();
        if (!item) return false;
        return std::ranges::all_of(*filter, [&](const auto& entry) {
            auto it = item->find(entry.first);
            return it != item->end() && it->second == entry.second;
        });
    }
    if (element == selector) return true;
    if (const auto* inner = element.get_if<Array>()) return array_contains(*inner, selector);
    return false;
}

auto matching_indexes(const Array& target, const Value& selector) -> std::vector<std::size_t> {
    auto result = std::vector<std::size_t>{};
    for (std::size_t i = 0; i < target.size(); ++i) {
        if (element_matches(target[i], selector)) result.push_back(i);
    }
    return result;
}

// Register one directive value for an index, rejecting a different value
// already registered for the same index.
void queue_at(std::map<std::size_t, const Value*>& queue, std::size_t index,
              const Value& v, bool insert, const PathFrame& here) {
    auto [it, inserted] = queue.try_emplace(index, &v);
    if (!inserted && *it->second != v) {
        throw PatchError{std::string{"Conflict at '"} + here.to_string() + "'. Several " +
                         (insert ? "insertions" : "editions") + " on array index " +
                         std::to_string(index)};
    }
}

void apply_edit(Array& target, std::size_t index, const Value& v, const PathFrame& here) {
    if (v.is_null()) {
        // Deleting an index that no longer exists is not an error
        if (index < target.size()) {
            target.erase(target.begin() + static_cast<std::ptrdiff_t>(index));
        }
        return;
    }
    if (index >= target.size()) {
        throw PatchError{"Array edition index out of range at '" + here.to_string() + "'"};
    }
    auto& element = target[index];
    if (const auto* v_obj = v.get_if<Object>()) {
        merge_into(element, *v_obj, here);
    } else {
        element = v;
    }
}

void edit_array(Array& target, const Object& patch, const PathFrame& path) {
    auto edits = std::map<std::size_t, const Value*>{};
    auto inserts = std::map<std::size_t, const Value*>{};
    auto appends = std::vector<std::pair<const Value*, std::string>>{};

    for (const auto& [key, v] : patch) {
        const auto& text = std::get<std::string>(key);
        auto here = path.child(text);
        auto item = std::string_view{text}.substr(1);

        auto insert = false;
        if (item.starts_with('+')) {
            insert = true;
            item.remove_prefix(1);
            if (v.is_null()) {
                throw PatchError{"A null value makes no sense for insertions at '" +
                                 here.to_string() + "'"};
            }
        }

        auto indexes = std::vector<std::size_t>{};
        if (item.size() >= 2 && item.front() == '[' && item.back() == ']') {
            auto index = parse_index(item.substr(1, item.size() - 2));
            if (!index) {
                throw PatchError{"Wrong format at '" + here.to_string() +
                                 "'. Expecting integer index inside brackets"};
            }
            if (*index < 0) *index += static_cast<std::int64_t>(target.size());
            if (*index < 0) *index = 0;
            indexes.push_back(static_cast<std::size_t>(*index));
        } else if (!item.empty()) {
            auto selector = Value{};
            try {
                selector = parse_selector(item);
            } catch (const PatchError& e) {
                throw PatchError{"Wrong format at '" + here.to_string() +
                                 "'. Expecting '$<yaml-format>': " + e.message()};
            }
            auto matched = matching_indexes(target, selector);
            if (insert) {
                // Conditional append: any match cancels it
                if (!matched.empty()) continue;
            } else {
                indexes = std::move(matched);
            }
        } else if (!insert) {
            throw PatchError{"Wrong format at '" + here.to_string() +
                             "'. Expecting '$+', '$[<index>]' or '$<filter>'"};
        }

        for (auto index : indexes) {
            queue_at(insert ? inserts : edits, index, v, insert, here);
        }
        if (indexes.empty() && insert) {
            appends.emplace_back(&v, text);
        }
    }

    // Edition and deletion go first, from the highest index down
    for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
        apply_edit(target, it->first, *it->second, path.child(std::to_string(it->first)));
    }

    for (auto it = inserts.rbegin(); it != inserts.rend(); ++it) {
        auto here = path.child(std::to_string(it->first));
        auto position = std::min(it->first, target.size());
        target.insert(target.begin() + static_cast<std::ptrdiff_t>(position),
                      materialize(*it->second, here));
    }

    for (const auto& [v, key_text] : appends) {
        target.push_back(materialize(*v, path.child(key_text)));
    }
}

}  // anonymous namespace

void apply_merge_patch(Value& target, const Value& patch) {
    const auto root_frame = PathFrame{};
    const auto* patch_obj = patch.get_if<Object>();
    if (!patch_obj) {
        target = patch;
        return;
    }
    if (auto* arr = target.get_if<Array>()) {
        if (classify(*patch_obj, root_frame) == NodeKind::array_edit) {
            edit_array(*arr, *patch_obj, root_frame);
            return;
        }
    }
    require_plain(*patch_obj, root_frame);
    if (!target.is_object()) target = Object{};
    merge_object(target.as_object(), *patch_obj, root_frame);
}

}  // namespace docstore_cpp
