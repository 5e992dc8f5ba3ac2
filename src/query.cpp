#include <docstore-cpp/query.hpp>

#include <docstore-cpp/error.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docstore_cpp {

auto is_operator(std::string_view text) noexcept -> bool {
    return text == "eq" || text == "ne" || text == "neq" || text == "gt" || text == "gte" ||
           text == "lt" || text == "lte" || text == "cont" || text == "ncont";
}

auto parse_operator(std::string_view text) -> Operator {
    if (text == "eq") return Operator::eq;
    if (text == "ne" || text == "neq") return Operator::neq;
    if (text == "gt") return Operator::gt;
    if (text == "gte") return Operator::gte;
    if (text == "lt") return Operator::lt;
    if (text == "lte") return Operator::lte;
    if (text == "cont") return Operator::cont;
    if (text == "ncont") return Operator::ncont;
    throw QueryError{"Invalid query string filter operator '" + std::string{text} + "'"};
}

namespace {

auto split_key(const std::string& key) -> std::vector<std::string> {
    if (key.empty()) throw QueryError{"Invalid query string filter: empty key"};
    auto segments = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto dot = key.find('.', start);
        auto segment = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (segment.empty()) {
            throw QueryError{"Invalid query string filter: empty segment in '" + key + "'"};
        }
        segments.push_back(std::move(segment));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

// Position of the first ANYINDEX that has both a prefix and a suffix.
auto group_position(const std::vector<std::string>& path) -> std::size_t {
    for (std::size_t i = 1; i + 1 < path.size(); ++i) {
        if (path[i] == any_index) return i;
    }
    return 0;
}

void add_condition(std::vector<Condition>& conditions, std::vector<std::string> path,
                   Comparison comparison) {
    auto pos = group_position(path);
    if (pos == 0) {
        conditions.push_back(Condition{std::move(path), std::move(comparison)});
        return;
    }

    auto prefix = std::vector<std::string>(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(pos));
    auto rest = std::vector<std::string>(path.begin() + static_cast<std::ptrdiff_t>(pos) + 1, path.end());

    auto it = std::ranges::find_if(conditions, [&](const Condition& c) {
        return c.path == prefix && std::holds_alternative<ElementMatch>(c.test);
    });
    if (it == conditions.end()) {
        conditions.push_back(Condition{std::move(prefix), ElementMatch{}});
        it = std::prev(conditions.end());
    }
    add_condition(std::get<ElementMatch>(it->test).conditions, std::move(rest),
                  std::move(comparison));
}

}  // anonymous namespace

auto compile(const Filter& filter) -> Predicate {
    auto predicate = Predicate{};
    for (const auto& [key, target] : filter) {
        auto path = split_key(key);
        auto op = Operator::eq;
        if (is_operator(path.back())) {
            op = parse_operator(path.back());
            path.pop_back();
            if (path.empty()) {
                throw QueryError{"Invalid query string filter: missing path before operator in '" +
                                 key + "'"};
            }
        }
        add_condition(predicate.conditions, std::move(path), Comparison{op, target});
    }
    return predicate;
}

}  // namespace docstore_cpp
