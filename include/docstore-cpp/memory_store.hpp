/// @file memory_store.hpp
/// @brief In-process reference implementation of Database.

#pragma once

#include <docstore-cpp/database.hpp>
#include <docstore-cpp/lock.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docstore_cpp {

/// A Database that keeps every table in memory.
///
/// Reads return deep copies, so callers never alias stored records. Each
/// operation runs its whole scan (and mutation) under one scope of the
/// injected lock. Use make_lock(true) when several threads share a store.
///
/// @code
/// auto db = InMemoryStore{};
/// db.create("vnfs", parse_json(R"({"_id": "v1", "state": "off"})"));
/// db.set_one("vnfs", {{"_id", "v1"}}, {{"state", "on"}});
/// auto vnf = db.get_one("vnfs", {{"state", "on"}});
/// @endcode
class InMemoryStore final : public Database {
public:
    /// @param logger_name spdlog logger used until connect() selects another.
    /// @param lock Lock taken by every operation; nullptr means NoopLock.
    explicit InMemoryStore(std::string logger_name = "db",
                           std::shared_ptr<Lockable> lock = nullptr);

    void connect(const Config& config) override;
    void disconnect() override;

    auto get_list(const std::string& table, const Filter& filter = {})
        -> std::vector<Value> override;

    auto get_one(const std::string& table, const Filter& filter = {},
                 bool fail_on_empty = true, bool fail_on_more = true)
        -> std::optional<Value> override;

    auto count(const std::string& table, const Filter& filter = {}) -> std::size_t override;

    auto del_list(const std::string& table, const Filter& filter = {}) -> DeleteResult override;

    auto del_one(const std::string& table, const Filter& filter = {},
                 bool fail_on_empty = true, bool fail_on_more = false)
        -> std::optional<DeleteResult> override;

    auto create(const std::string& table, Value record) -> Value override;

    auto create_list(const std::string& table, std::vector<Value> records)
        -> std::vector<Value> override;

    auto replace(const std::string& table, const Value& id, Value record,
                 bool fail_on_empty = true) -> std::optional<UpdateResult> override;

    auto set_one(const std::string& table, const Filter& filter, const Update& update,
                 const UpdateOptions& options = {}) -> std::optional<UpdateResult> override;

    auto set_list(const std::string& table, const Filter& filter, const Update& update,
                  const UpdateOptions& options = {}) -> std::optional<UpdateResult> override;

    // -- Introspection --------------------------------------------------------

    /// The logger selected at construction or by the last connect().
    auto logger() const -> std::shared_ptr<spdlog::logger>;

    /// The key given by `commonkey` (or `masterpassword`) at connect().
    auto master_key() const -> const std::optional<std::string>& { return master_key_; }

private:
    using Table = std::vector<Value>;

    /// Runs `fn` under the lock, logging the call first. Exceptions other
    /// than DbError are reported as internal errors.
    template <typename Fn>
    auto guarded(std::string_view operation, const std::string& table, const Filter* filter,
                 Fn&& fn) -> decltype(fn());

    void log_call(std::string_view operation, const std::string& table,
                  const Filter* filter = nullptr) const;

    auto find_table(const std::string& table) -> Table*;
    auto matching(const std::string& table, const Filter& filter) -> std::vector<std::size_t>;
    auto prepare(const std::string& table, Value& record,
                 const std::vector<Value>& pending) -> Value;

    std::map<std::string, Table> tables_;
    std::shared_ptr<Lockable> lock_;
    std::shared_ptr<spdlog::logger> logger_;
    std::optional<std::string> master_key_;
};

}  // namespace docstore_cpp
