#include <docstore-cpp/matcher.hpp>

#include <algorithm>
#include <charconv>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docstore_cpp {

namespace {

using Test = std::variant<Comparison, ElementMatch>;

auto decimal_index(const std::string& segment) -> std::optional<std::size_t> {
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec != std::errc{} || ptr != segment.data() + segment.size()) return std::nullopt;
    return result;
}

// Map lookup by path segment; integer keys are reachable by their decimal text.
auto child(const Value& map, const std::string& segment) -> const Value* {
    if (const auto* found = map.find(Key{segment})) return found;
    if (auto index = decimal_index(segment)) {
        return map.find(Key{static_cast<std::int64_t>(*index)});
    }
    return nullptr;
}

auto equals_or_contains(const Value& content, const Value& target) -> bool {
    if (const auto* wanted = target.get_if<Array>()) {
        if (const auto* items = content.get_if<Array>()) {
            return std::ranges::any_of(*items, [&](const Value& item) {
                return array_contains(*wanted, item);
            });
        }
        return array_contains(*wanted, content);
    }
    if (const auto* items = content.get_if<Array>()) {
        return array_contains(*items, target);
    }
    return content == target;
}

auto evaluate(const Value* content, const std::vector<std::string>& path, std::size_t index,
              const Test& test) -> bool;

auto all_conditions(const Value& element, const std::vector<Condition>& conditions) -> bool {
    return std::ranges::all_of(conditions, [&](const Condition& c) {
        return evaluate(&element, c.path, 0, c.test);
    });
}

// Whether an element-wise search over a sequence looks for a passing
// element (true) or for a failing one (false).
auto looks_for_match(const Test& test) -> bool {
    const auto* comparison = std::get_if<Comparison>(&test);
    if (!comparison) return true;
    return comparison->target.is_null() == is_negated(comparison->op);
}

auto evaluate(const Value* content, const std::vector<std::string>& path, std::size_t index,
              const Test& test) -> bool {
    if (index == path.size() || !content || content->is_null()) {
        if (const auto* comparison = std::get_if<Comparison>(&test)) {
            return compare_leaf(content, *comparison);
        }
        const auto* items = content ? content->get_if<Array>() : nullptr;
        if (!items || index != path.size()) return false;
        const auto& conditions = std::get<ElementMatch>(test).conditions;
        return std::ranges::any_of(*items, [&](const Value& element) {
            return all_conditions(element, conditions);
        });
    }

    const auto& segment = path[index];

    if (content->is_object()) {
        return evaluate(child(*content, segment), path, index + 1, test);
    }

    if (const auto* items = content->get_if<Array>()) {
        const auto look = looks_for_match(test);
        for (const auto& element : *items) {
            if (evaluate(&element, path, index, test) == look) return look;
        }
        if (auto position = decimal_index(segment); position && *position < items->size()) {
            if (evaluate(&(*items)[*position], path, index + 1, test) == look) return look;
        }
        return !look;
    }

    // A scalar in the middle of the path: nothing below it exists
    const auto* comparison = std::get_if<Comparison>(&test);
    if (!comparison) return false;
    return is_negated(comparison->op) ? !comparison->target.is_null()
                                      : comparison->target.is_null();
}

}  // anonymous namespace

auto compare_leaf(const Value* content, const Comparison& comparison) -> bool {
    static const auto null_value = Value{};
    const auto& actual = content ? *content : null_value;
    const auto& target = comparison.target;

    switch (comparison.op) {
        case Operator::eq:
        case Operator::cont:
            return equals_or_contains(actual, target);
        case Operator::neq:
        case Operator::ncont:
            return !equals_or_contains(actual, target);
        case Operator::gt:
        case Operator::gte:
        case Operator::lt:
        case Operator::lte: {
            auto order = compare(actual, target);
            if (!order) return false;
            switch (comparison.op) {
                case Operator::gt:  return std::is_gt(*order);
                case Operator::gte: return std::is_gteq(*order);
                case Operator::lt:  return std::is_lt(*order);
                default:            return std::is_lteq(*order);
            }
        }
    }
    return false;
}

auto matches(const Value& document, const Predicate& predicate) -> bool {
    return std::ranges::all_of(predicate.conditions, [&](const Condition& c) {
        return evaluate(&document, c.path, 0, c.test);
    });
}

}  // namespace docstore_cpp
