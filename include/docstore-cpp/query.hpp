/// @file query.hpp
/// @brief Filter vocabulary and the filter compiler.

#pragma once

#include <docstore-cpp/value.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docstore_cpp {

/// Comparison operators accepted as the last segment of a filter key.
enum class Operator : std::uint8_t {
    eq,
    neq,
    gt,
    gte,
    lt,
    lte,
    cont,
    ncont,
};

/// Convert an Operator to its filter-key spelling.
constexpr auto to_string_view(Operator op) noexcept -> std::string_view {
    switch (op) {
        case Operator::eq:    return "eq";
        case Operator::neq:   return "neq";
        case Operator::gt:    return "gt";
        case Operator::gte:   return "gte";
        case Operator::lt:    return "lt";
        case Operator::lte:   return "lte";
        case Operator::cont:  return "cont";
        case Operator::ncont: return "ncont";
    }
    return "unknown";
}

/// True if `text` names an operator (`ne` is accepted as an alias of `neq`).
auto is_operator(std::string_view text) noexcept -> bool;

/// Parse an operator name.
/// @throws QueryError if `text` is not in the vocabulary.
auto parse_operator(std::string_view text) -> Operator;

/// True for the operators whose meaning is the negation of another.
constexpr auto is_negated(Operator op) noexcept -> bool {
    return op == Operator::neq || op == Operator::ncont;
}

/// Path segment that starts a correlated ("same array element") group.
inline constexpr std::string_view any_index = "ANYINDEX";

/// A filter: `"<dotted.path>[.<op>]" -> target`. An empty filter matches everything.
using Filter = std::map<std::string, Value>;

struct Condition;

/// Compare the content found at a path against a target.
struct Comparison {
    Operator op = Operator::eq;
    Value target;

    auto operator==(const Comparison&) const -> bool = default;
};

/// Succeeds when one element of the sequence at a path satisfies every
/// nested condition.
struct ElementMatch {
    std::vector<Condition> conditions;

    auto operator==(const ElementMatch&) const -> bool;
};

/// One compiled filter entry: a path relative to the enclosing scope and
/// the test applied at its end.
struct Condition {
    std::vector<std::string> path;
    std::variant<Comparison, ElementMatch> test;

    auto operator==(const Condition&) const -> bool = default;
};

inline auto ElementMatch::operator==(const ElementMatch& other) const -> bool {
    return conditions == other.conditions;
}

/// A compiled filter; its conditions are ANDed.
struct Predicate {
    std::vector<Condition> conditions;

    auto operator==(const Predicate&) const -> bool = default;
};

/// Compile a filter into a Predicate.
///
/// The last key segment is split off as the operator when it names one
/// (otherwise the operator is `eq`). Keys with an inner `ANYINDEX`
/// segment are grouped by their prefix into an ElementMatch, so
/// `{"vnfs.ANYINDEX.id": 1, "vnfs.ANYINDEX.name": "x"}` needs a single
/// element with both properties. Groups nest. A leading or trailing
/// `ANYINDEX` is an ordinary segment.
///
/// @code
/// auto pred = compile({{"data.size.gt", 4}, {"tags.cont", Array{"a"}}});
/// @endcode
///
/// @throws QueryError on an empty key, an empty segment or an
///   operator-only key.
auto compile(const Filter& filter) -> Predicate;

}  // namespace docstore_cpp
