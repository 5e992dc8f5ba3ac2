/// @file database.hpp
/// @brief The backend-independent CRUD contract.

#pragma once

#include <docstore-cpp/config.hpp>
#include <docstore-cpp/query.hpp>
#include <docstore-cpp/update.hpp>
#include <docstore-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docstore_cpp {

/// Outcome of a delete: `{"deleted": n}`.
struct DeleteResult {
    std::size_t deleted = 0;

    auto operator==(const DeleteResult&) const -> bool = default;
};

/// Outcome of a replace or set: `{"updated": n}`.
struct UpdateResult {
    std::size_t updated = 0;

    auto operator==(const UpdateResult&) const -> bool = default;
};

inline void to_json(nlohmann::json& j, const DeleteResult& r) { j = {{"deleted", r.deleted}}; }
inline void from_json(const nlohmann::json& j, DeleteResult& r) { r.deleted = j.at("deleted").get<std::size_t>(); }
inline void to_json(nlohmann::json& j, const UpdateResult& r) { j = {{"updated", r.updated}}; }
inline void from_json(const nlohmann::json& j, UpdateResult& r) { r.updated = j.at("updated").get<std::size_t>(); }

/// A store of named tables of records.
///
/// Records are maps with a unique `_id`. Tables come into existence on
/// first insert and keep insertion order. Filters follow query.hpp,
/// updates follow update.hpp and patch.hpp. Every failure is reported as
/// DbError (or a subclass); the kind tells not_found, conflict,
/// bad_request and internal apart.
class Database {
public:
    virtual ~Database() = default;

    /// Apply settings; networked backends connect here.
    virtual void connect(const Config& config) = 0;

    virtual void disconnect() = 0;

    /// Deep copies of every matching record, in insertion order.
    virtual auto get_list(const std::string& table, const Filter& filter = {})
        -> std::vector<Value> = 0;

    /// The single matching record.
    /// @param fail_on_empty raise not_found instead of returning nullopt.
    /// @param fail_on_more raise conflict on several matches instead of
    ///   returning the first one.
    virtual auto get_one(const std::string& table, const Filter& filter = {},
                         bool fail_on_empty = true, bool fail_on_more = true)
        -> std::optional<Value> = 0;

    virtual auto count(const std::string& table, const Filter& filter = {}) -> std::size_t = 0;

    virtual auto del_list(const std::string& table, const Filter& filter = {})
        -> DeleteResult = 0;

    /// Delete the first matching record. Returns nullopt when nothing
    /// matched and `fail_on_empty` is false.
    virtual auto del_one(const std::string& table, const Filter& filter = {},
                         bool fail_on_empty = true, bool fail_on_more = false)
        -> std::optional<DeleteResult> = 0;

    /// Insert a record. A missing, null or empty `_id` is replaced by a
    /// random UUID. Returns the id.
    virtual auto create(const std::string& table, Value record) -> Value = 0;

    /// Insert several records; nothing is inserted if any one is invalid.
    virtual auto create_list(const std::string& table, std::vector<Value> records)
        -> std::vector<Value> = 0;

    /// Replace the whole content of the record with `id`.
    virtual auto replace(const std::string& table, const Value& id, Value record,
                         bool fail_on_empty = true) -> std::optional<UpdateResult> = 0;

    /// Update the single matching record. Returns nullopt when nothing
    /// matched and `options.fail_on_empty` is false.
    virtual auto set_one(const std::string& table, const Filter& filter, const Update& update,
                         const UpdateOptions& options = {}) -> std::optional<UpdateResult> = 0;

    /// Update every matching record. Returns nullopt when nothing matched.
    virtual auto set_list(const std::string& table, const Filter& filter, const Update& update,
                          const UpdateOptions& options = {}) -> std::optional<UpdateResult> = 0;
};

}  // namespace docstore_cpp
