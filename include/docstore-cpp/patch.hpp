/// @file patch.hpp
/// @brief RFC 7396 merge patch with array-edit extensions.

#pragma once

#include <docstore-cpp/value.hpp>

#include <string_view>

namespace docstore_cpp {

/// Apply a merge patch to `target` in place.
///
/// Follows RFC 7396: a null member deletes the key, a map member is merged
/// recursively, anything else replaces. Values copied out of `patch` are
/// deep copies with null members stripped; `patch` itself is never
/// modified.
///
/// A map whose keys all start with `$` is an array-edit node and applies
/// to a sequence instead of replacing it:
///
/// | Key            | Effect                                                     |
/// |----------------|------------------------------------------------------------|
/// | `$[i]`         | edit index i (null deletes); negative i counts from the end |
/// | `$+[i]`        | insert the value at index i                                |
/// | `$+`           | append the value                                           |
/// | `$<literal>`   | edit/delete every element equal to (or containing) literal |
/// | `$<k: v>`      | edit/delete every map element holding all given pairs      |
/// | `$+<selector>` | append the value only when nothing matches selector        |
///
/// Edits and deletes run first in descending index order, then indexed
/// inserts in descending order, then appends.
///
/// @code
/// auto doc = parse_json(R"({"A": ["a", "b", "c"]})");
/// apply_merge_patch(doc, parse_json(R"({"A": {"$b": null, "$+[0]": "b"}})"));
/// // doc is {"A": ["b", "a", "c"]}
/// @endcode
///
/// @throws PatchError on a malformed directive, a node mixing `$` keys with
///   plain keys, two different values for one index, an edit past the end,
///   a null insert, or array-edit keys applied to something not a sequence.
///   `target` may be partially modified when an error is thrown.
void apply_merge_patch(Value& target, const Value& patch);

/// Parse the selector text of an array-edit key (the part after `$` or `$+`)
/// as a single YAML document.
///
/// Plain scalars take their YAML 1.1 implicit type (`~`, `yes`/`no`,
/// `0x1A`, `1_000`, `1.5`, `.inf`); quoted scalars and `!!str` stay strings.
/// Mapping keys that resolve to integers become integer keys.
///
/// @throws PatchError on malformed YAML, several documents, collection keys,
///   an integer outside int64, or nesting deeper than 64 levels.
auto parse_selector(std::string_view text) -> Value;

}  // namespace docstore_cpp
