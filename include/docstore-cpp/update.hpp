/// @file update.hpp
/// @brief Dotted-path updates: set, unset, pull, push, push_list, pull_list.

#pragma once

#include <docstore-cpp/value.hpp>

#include <map>
#include <string>
#include <vector>

namespace docstore_cpp {

/// Assignments keyed by dotted path (`"a.b.0.c" -> value`).
using Update = std::map<std::string, Value>;

/// The non-`set` parts of an update, all keyed by dotted path.
struct UpdateOptions {
    std::vector<std::string> unset;          ///< Paths removed when present.
    std::map<std::string, Value> pull;       ///< Remove every equal element.
    std::map<std::string, Value> push;       ///< Append one element.
    std::map<std::string, Value> push_list;  ///< Append every element of a list.
    std::map<std::string, Value> pull_list;  ///< Remove every element equal to one of a list.
    bool fail_on_empty = true;               ///< set_one: raise not_found on no match.
};

/// Apply a dotted update to `record` in place. Returns true when the
/// record changed.
///
/// Set paths are created as needed: missing maps are added and sequences
/// are padded with nulls up to a numeric segment. A map value is merged
/// with apply_merge_patch, so array-edit nodes work at any path; other
/// values are assigned.
///
/// @throws DbError (bad_request) when a path walks through a scalar, a
///   numeric segment is required but missing, or pull/push target
///   something other than a sequence.
/// @throws PatchError from merging a map value.
auto apply_update(Value& record, const Update& set, const UpdateOptions& options = {}) -> bool;

}  // namespace docstore_cpp
