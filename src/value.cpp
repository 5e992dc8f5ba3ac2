#include <docstore-cpp/value.hpp>

#include <algorithm>
#include <string>
#include <variant>

namespace docstore_cpp {

auto Value::as_number() const noexcept -> std::optional<double> {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&data_)) return *d;
    return std::nullopt;
}

auto Value::find(const Key& key) -> Value* {
    auto* obj = std::get_if<Object>(&data_);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    return it != obj->end() ? &it->second : nullptr;
}

auto Value::find(const Key& key) const -> const Value* {
    const auto* obj = std::get_if<Object>(&data_);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    return it != obj->end() ? &it->second : nullptr;
}

auto Value::operator[](const Key& key) -> Value& {
    if (is_null()) data_ = Object{};
    return std::get<Object>(data_)[key];
}

auto Value::erase(const Key& key) -> bool {
    auto* obj = std::get_if<Object>(&data_);
    if (!obj) return false;
    return obj->erase(key) > 0;
}

auto Value::size() const noexcept -> std::size_t {
    return std::visit(overload{
        [](const Array& a) -> std::size_t { return a.size(); },
        [](const Object& o) -> std::size_t { return o.size(); },
        [](const auto&) -> std::size_t { return 0; },
    }, data_);
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
    // Integers and reals compare by numeric value, as 1 == 1.0
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_int() && rhs.is_int()) {
            return lhs.get<std::int64_t>() == rhs.get<std::int64_t>();
        }
        return *lhs.as_number() == *rhs.as_number();
    }
    return lhs.data_ == rhs.data_;
}

auto compare(const Value& lhs, const Value& rhs) -> std::optional<std::partial_ordering> {
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_int() && rhs.is_int()) {
            return lhs.get<std::int64_t>() <=> rhs.get<std::int64_t>();
        }
        return *lhs.as_number() <=> *rhs.as_number();
    }
    if (lhs.type() != rhs.type()) return std::nullopt;

    return std::visit(overload{
        [&](const std::string& s) -> std::optional<std::partial_ordering> {
            return s <=> rhs.get<std::string>();
        },
        [&](bool b) -> std::optional<std::partial_ordering> {
            return b <=> rhs.get<bool>();
        },
        [&](const Array& a) -> std::optional<std::partial_ordering> {
            const auto& other = rhs.as_array();
            const auto n = std::min(a.size(), other.size());
            for (std::size_t i = 0; i < n; ++i) {
                if (a[i] == other[i]) continue;
                return compare(a[i], other[i]);
            }
            return a.size() <=> other.size();
        },
        [](const auto&) -> std::optional<std::partial_ordering> {
            return std::nullopt;
        },
    }, lhs.storage());
}

auto array_contains(const Array& array, const Value& item) -> bool {
    return std::ranges::any_of(array, [&](const Value& v) { return v == item; });
}

auto key_to_string(const Key& key) -> std::string {
    return std::visit(overload{
        [](std::int64_t i) { return std::to_string(i); },
        [](const std::string& s) { return s; },
    }, key);
}

}  // namespace docstore_cpp
