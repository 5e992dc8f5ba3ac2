#include <docstore-cpp/patch.hpp>

#include <docstore-cpp/error.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docstore_cpp {

namespace {

// Aliases can make a node graph cyclic; nothing deeper is a sensible selector.
constexpr int max_depth = 64;

constexpr std::string_view str_tag = "tag:yaml.org,2002:str";

// YAML 1.1 implicit types for plain scalars.
auto null_pattern() -> const std::regex& {
    static const auto re = std::regex{"~|null|Null|NULL|"};
    return re;
}

auto bool_pattern() -> const std::regex& {
    static const auto re = std::regex{
        "yes|Yes|YES|no|No|NO|true|True|TRUE|false|False|FALSE|on|On|ON|off|Off|OFF"};
    return re;
}

auto int_pattern() -> const std::regex& {
    static const auto re = std::regex{
        "[-+]?0b[0-1_]+"
        "|[-+]?0[0-7_]+"
        "|[-+]?(?:0|[1-9][0-9_]*)"
        "|[-+]?0x[0-9a-fA-F_]+"
        "|[-+]?[1-9][0-9_]*(?::[0-5]?[0-9])+"};
    return re;
}

auto float_pattern() -> const std::regex& {
    static const auto re = std::regex{
        "[-+]?(?:[0-9][0-9_]*)\\.[0-9_]*(?:[eE][-+][0-9]+)?"
        "|\\.[0-9_]+(?:[eE][-+][0-9]+)?"
        "|[-+]?[0-9][0-9_]*(?::[0-5]?[0-9])+\\.[0-9_]*"
        "|[-+]?\\.(?:inf|Inf|INF)"
        "|\\.(?:nan|NaN|NAN)"};
    return re;
}

auto is_true(const std::string& text) -> bool {
    static const auto re = std::regex{"yes|Yes|YES|true|True|TRUE|on|On|ON"};
    return std::regex_match(text, re);
}

// Splits a leading sign off `text`; returns true when it was '-'.
auto take_sign(std::string& text) -> bool {
    if (text.empty() || (text.front() != '-' && text.front() != '+')) return false;
    const auto negative = text.front() == '-';
    text.erase(0, 1);
    return negative;
}

auto without_underscores(std::string text) -> std::string {
    std::erase(text, '_');
    return text;
}

auto split_colons(const std::string& text) -> std::vector<std::string> {
    auto parts = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto colon = text.find(':', start);
        parts.push_back(text.substr(start, colon == std::string::npos ? std::string::npos
                                                                       : colon - start));
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return parts;
}

[[noreturn]] void out_of_range(const std::string& text) {
    throw PatchError{"integer '" + text + "' is out of range"};
}

auto parse_digits(const std::string& digits, int base, const std::string& text) -> std::uint64_t {
    if (digits.empty()) return 0;
    auto result = std::uint64_t{0};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result, base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) out_of_range(text);
    return result;
}

auto construct_int(const std::string& text) -> std::int64_t {
    auto body = without_underscores(text);
    const auto negative = take_sign(body);

    auto magnitude = std::uint64_t{0};
    if (body.starts_with("0b")) {
        magnitude = parse_digits(body.substr(2), 2, text);
    } else if (body.starts_with("0x")) {
        magnitude = parse_digits(body.substr(2), 16, text);
    } else if (body.find(':') != std::string::npos) {
        for (const auto& part : split_colons(body)) {
            const auto digit = parse_digits(part, 10, text);
            if (magnitude > (std::numeric_limits<std::uint64_t>::max() - digit) / 60) {
                out_of_range(text);
            }
            magnitude = magnitude * 60 + digit;
        }
    } else if (body.size() > 1 && body.front() == '0') {
        magnitude = parse_digits(body.substr(1), 8, text);
    } else {
        magnitude = parse_digits(body, 10, text);
    }

    constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude > max + 1) out_of_range(text);
        return magnitude == max + 1 ? std::numeric_limits<std::int64_t>::min()
                                    : -static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > max) out_of_range(text);
    return static_cast<std::int64_t>(magnitude);
}

auto parse_double(const std::string& digits) -> double {
    auto result = 0.0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw PatchError{"invalid float '" + digits + "'"};
    }
    return result;
}

auto construct_float(const std::string& text) -> double {
    auto body = without_underscores(text);
    std::ranges::transform(body, body.begin(), [](char c) {
        return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
    });
    const auto sign = take_sign(body) ? -1.0 : 1.0;

    if (body == ".inf") return sign * std::numeric_limits<double>::infinity();
    if (body == ".nan") return std::numeric_limits<double>::quiet_NaN();
    if (body.find(':') != std::string::npos) {
        auto result = 0.0;
        for (const auto& part : split_colons(body)) result = result * 60 + parse_double(part);
        return sign * result;
    }
    return sign * parse_double(body);
}

// Quoted scalars and explicit !!str stay strings; plain scalars get their
// implicit YAML 1.1 type.
auto resolve(const YAML::Node& node) -> Value {
    const auto& text = node.Scalar();
    if (node.Tag() != "?") {
        if (node.Tag() == "!" || node.Tag() == str_tag) return Value{text};
    }
    if (std::regex_match(text, null_pattern())) return Value{};
    if (std::regex_match(text, bool_pattern())) return Value{is_true(text)};
    if (std::regex_match(text, int_pattern())) return Value{construct_int(text)};
    if (std::regex_match(text, float_pattern())) return Value{construct_float(text)};
    return Value{text};
}

auto to_key(const YAML::Node& node) -> Key {
    if (node.IsNull()) return Key{std::string{}};
    if (!node.IsScalar()) throw PatchError{"collection keys are not supported"};
    auto resolved = resolve(node);
    if (resolved.is_int()) return Key{resolved.get<std::int64_t>()};
    return Key{node.Scalar()};
}

auto to_value(const YAML::Node& node, int depth) -> Value {
    if (depth > max_depth) throw PatchError{"nesting deeper than " + std::to_string(max_depth)};

    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value{};
        case YAML::NodeType::Scalar:
            return resolve(node);
        case YAML::NodeType::Sequence: {
            auto items = Array{};
            items.reserve(node.size());
            for (const auto& item : node) items.push_back(to_value(item, depth + 1));
            return Value{std::move(items)};
        }
        case YAML::NodeType::Map: {
            auto members = Object{};
            for (const auto& entry : node) {
                members.insert_or_assign(to_key(entry.first), to_value(entry.second, depth + 1));
            }
            return Value{std::move(members)};
        }
    }
    return Value{};
}

}  // anonymous namespace

auto parse_selector(std::string_view text) -> Value {
    const auto source = std::string{text};
    try {
        const auto documents = YAML::LoadAll(source);
        if (documents.empty()) return Value{};
        if (documents.size() > 1) {
            throw PatchError{"expected a single document in '" + source + "'"};
        }
        return to_value(documents.front(), 0);
    } catch (const YAML::Exception& e) {
        auto where = e.mark.is_null() ? std::string{}
                                      : " at column " + std::to_string(e.mark.column + 1);
        throw PatchError{e.msg + where + " of '" + source + "'"};
    }
}

}  // namespace docstore_cpp
