/// @file json.hpp
/// @brief nlohmann/json interoperability for docstore-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Value and the
/// result types, plus text parse/dump helpers.

#pragma once

#include <docstore-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace docstore_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);

/// Maps become JSON objects (integer keys are written in decimal),
/// arrays become JSON arrays, scalars map naturally.
void to_json(nlohmann::json& j, const Value& v);

/// JSON objects become maps with string keys. Unsigned integers that do
/// not fit in int64 become reals.
void from_json(const nlohmann::json& j, Value& v);

// =============================================================================
// Text helpers
// =============================================================================

/// Parse JSON text into a Value.
/// @throws DbError (bad_request) on malformed text.
auto parse_json(std::string_view text) -> Value;

/// Serialize a Value to JSON text.
/// @param indent Pretty-print indentation; -1 for the compact form.
auto dump_json(const Value& value, int indent = -1) -> std::string;

}  // namespace docstore_cpp
