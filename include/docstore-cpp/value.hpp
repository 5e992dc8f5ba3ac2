/// @file value.hpp
/// @brief The document model: Value, Array, Object, Key and helpers.

#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docstore_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A key into a map: either a string or an integer.
using Key = std::variant<std::int64_t, std::string>;

class Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A map of values. Iteration order is the key order, which carries no meaning.
using Object = std::map<Key, Value>;

/// The seven shapes a Value can take, in variant index order.
enum class ValueType : std::uint8_t {
    null,
    boolean,
    integer,
    real,
    string,
    array,
    object,
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:    return "null";
        case ValueType::boolean: return "boolean";
        case ValueType::integer: return "integer";
        case ValueType::real:    return "real";
        case ValueType::string:  return "string";
        case ValueType::array:   return "array";
        case ValueType::object:  return "object";
    }
    return "unknown";
}

/// A document: a map, a sequence, or a scalar.
///
/// Value owns its whole subtree, so copying a Value is a deep copy.
/// Equality is structural, with integers and reals compared numerically.
///
/// @code
/// auto record = Value{Object{
///     {"_id", "r1"},
///     {"tags", Array{"a", "b"}},
///     {"limits", Object{{"cpu", 2}, {"ram", 4.5}}},
/// }};
/// @endcode
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        std::string,
        Array,
        Object
    >;

    Value() = default;
    Value(Null) {}
    Value(std::nullptr_t) {}
    Value(bool b) : data_{b} {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) : data_{static_cast<std::int64_t>(i)} {}

    template <std::floating_point T>
    Value(T d) : data_{static_cast<double>(d)} {}

    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(Array a) : data_{std::move(a)} {}
    Value(Object o) : data_{std::move(o)} {}

    // -- Shape ----------------------------------------------------------------

    auto type() const noexcept -> ValueType {
        return static_cast<ValueType>(data_.index());
    }

    auto is_null() const noexcept -> bool { return std::holds_alternative<Null>(data_); }
    auto is_bool() const noexcept -> bool { return std::holds_alternative<bool>(data_); }
    auto is_int() const noexcept -> bool { return std::holds_alternative<std::int64_t>(data_); }
    auto is_double() const noexcept -> bool { return std::holds_alternative<double>(data_); }
    auto is_number() const noexcept -> bool { return is_int() || is_double(); }
    auto is_string() const noexcept -> bool { return std::holds_alternative<std::string>(data_); }
    auto is_array() const noexcept -> bool { return std::holds_alternative<Array>(data_); }
    auto is_object() const noexcept -> bool { return std::holds_alternative<Object>(data_); }

    /// True for null, bool, numbers and strings.
    auto is_scalar() const noexcept -> bool { return !is_array() && !is_object(); }

    // -- Typed access ---------------------------------------------------------

    /// Pointer to the alternative T, or nullptr on type mismatch.
    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    /// Reference to the alternative T; throws std::bad_variant_access on mismatch.
    template <typename T>
    auto get() -> T& { return std::get<T>(data_); }

    template <typename T>
    auto get() const -> const T& { return std::get<T>(data_); }

    auto as_array() -> Array& { return std::get<Array>(data_); }
    auto as_array() const -> const Array& { return std::get<Array>(data_); }
    auto as_object() -> Object& { return std::get<Object>(data_); }
    auto as_object() const -> const Object& { return std::get<Object>(data_); }

    /// Numeric content as a double, or nullopt if this is not a number.
    auto as_number() const noexcept -> std::optional<double>;

    auto storage() noexcept -> Storage& { return data_; }
    auto storage() const noexcept -> const Storage& { return data_; }

    // -- Map access -----------------------------------------------------------

    /// Find a member of a map. Returns nullptr when absent or not a map.
    auto find(const Key& key) -> Value*;
    auto find(const Key& key) const -> const Value*;

    auto contains(const Key& key) const -> bool { return find(key) != nullptr; }

    /// Access a map member, inserting null if absent.
    /// A null Value becomes an empty map first.
    /// @throws std::bad_variant_access if this is neither null nor a map.
    auto operator[](const Key& key) -> Value&;

    /// Remove a map member. Returns true if something was removed.
    auto erase(const Key& key) -> bool;

    /// Number of elements of an array or members of a map; 0 for scalars.
    auto size() const noexcept -> std::size_t;

    friend auto operator==(const Value& lhs, const Value& rhs) -> bool;

private:
    Storage data_{};
};

/// Ordering used by the range operators of the query matcher.
///
/// Numbers order numerically, strings and bools by value, arrays
/// lexicographically. Any other pair is incomparable and yields nullopt.
auto compare(const Value& lhs, const Value& rhs) -> std::optional<std::partial_ordering>;

/// True if `item` equals any element of `array`.
auto array_contains(const Array& array, const Value& item) -> bool;

/// Render a map key as text (integers in decimal).
auto key_to_string(const Key& key) -> std::string;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { printf("%lld\n", i); },
///     [](auto&&) { printf("other\n"); },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace docstore_cpp
