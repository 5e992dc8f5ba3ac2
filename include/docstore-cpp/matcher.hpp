/// @file matcher.hpp
/// @brief Evaluation of compiled filters against documents.

#pragma once

#include <docstore-cpp/query.hpp>
#include <docstore-cpp/value.hpp>

namespace docstore_cpp {

/// True if `document` satisfies every condition of `predicate`.
///
/// A missing key reads as null. When a path crosses a sequence, each
/// element is tried at the same path position: positive operators need one
/// matching element, while negated operators and null targets need every
/// element to pass. A decimal segment over a sequence is also tried as a
/// direct index. Incomparable types never match a range operator.
auto matches(const Value& document, const Predicate& predicate) -> bool;

/// Leaf comparison of the content found at a path (nullptr for missing)
/// against a filter target.
auto compare_leaf(const Value* content, const Comparison& comparison) -> bool;

}  // namespace docstore_cpp
