#include <docstore-cpp/json.hpp>

#include <docstore-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace docstore_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Array& a) {
            j = nlohmann::json::array();
            for (const auto& item : a) {
                auto item_j = nlohmann::json{};
                to_json(item_j, item);
                j.push_back(std::move(item_j));
            }
        },
        [&](const Object& o) {
            j = nlohmann::json::object();
            for (const auto& [key, member] : o) {
                auto member_j = nlohmann::json{};
                to_json(member_j, member);
                j[key_to_string(key)] = std::move(member_j);
            }
        },
    }, v.storage());
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            v = Null{};
            return;
        case nlohmann::json::value_t::boolean:
            v = j.get<bool>();
            return;
        case nlohmann::json::value_t::number_integer:
            v = j.get<std::int64_t>();
            return;
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<std::uint64_t>();
            // If it fits in int64, prefer int64 for consistency
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                v = static_cast<std::int64_t>(u);
            } else {
                v = static_cast<double>(u);
            }
            return;
        }
        case nlohmann::json::value_t::number_float:
            v = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            v = j.get<std::string>();
            return;
        case nlohmann::json::value_t::array: {
            auto a = Array{};
            a.reserve(j.size());
            for (const auto& item : j) {
                auto item_v = Value{};
                from_json(item, item_v);
                a.push_back(std::move(item_v));
            }
            v = std::move(a);
            return;
        }
        case nlohmann::json::value_t::object: {
            auto o = Object{};
            for (const auto& [key, member] : j.items()) {
                auto member_v = Value{};
                from_json(member, member_v);
                o.emplace(Key{key}, std::move(member_v));
            }
            v = std::move(o);
            return;
        }
        case nlohmann::json::value_t::binary:
            break;
    }
    throw DbError{ErrorKind::bad_request, "cannot convert JSON binary to a document value"};
}

// =============================================================================
// Text helpers
// =============================================================================

auto parse_json(std::string_view text) -> Value {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw DbError{ErrorKind::bad_request,
                      "invalid JSON text: '" + std::string{text} + "'"};
    }
    auto v = Value{};
    from_json(j, v);
    return v;
}

auto dump_json(const Value& value, int indent) -> std::string {
    auto j = nlohmann::json{};
    to_json(j, value);
    return j.dump(indent);
}

}  // namespace docstore_cpp
