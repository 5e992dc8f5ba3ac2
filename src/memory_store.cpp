#include <docstore-cpp/memory_store.hpp>

#include <docstore-cpp/error.hpp>
#include <docstore-cpp/json.hpp>
#include <docstore-cpp/logging.hpp>
#include <docstore-cpp/matcher.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace docstore_cpp {

namespace {

auto bytes_to_hex(const std::uint8_t* data, std::size_t len) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[data[i] >> 4]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

// Random (version 4) UUID in its 8-4-4-4-12 text form.
auto random_uuid() -> std::string {
    static thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto bytes = std::array<std::uint8_t, 16>{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        auto word = engine();
        for (std::size_t b = 0; b < 8; ++b) {
            bytes[i + b] = static_cast<std::uint8_t>(word >> (b * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    auto hex = bytes_to_hex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' +
           hex.substr(16, 4) + '-' + hex.substr(20);
}

auto filter_text(const Filter& filter) -> std::string {
    return nlohmann::json(filter).dump();
}

// Ids are shown bare when they are strings.
auto id_text(const Value& id) -> std::string {
    if (const auto* s = id.get_if<std::string>()) return *s;
    return dump_json(id);
}

auto record_id(const Value& record) -> const Value* {
    return record.find(Key{"_id"});
}

void require_same_id(const Value& before, const Value& after) {
    const auto* old_id = record_id(before);
    const auto* new_id = record_id(after);
    if (!old_id || !new_id || *old_id != *new_id) {
        throw DbError{ErrorKind::bad_request, "Cannot modify the _id of a record"};
    }
}

}  // anonymous namespace

InMemoryStore::InMemoryStore(std::string logger_name, std::shared_ptr<Lockable> lock)
    : lock_{lock ? std::move(lock) : std::make_shared<NoopLock>()},
      logger_{get_logger(logger_name)} {}

template <typename Fn>
auto InMemoryStore::guarded(std::string_view operation, const std::string& table,
                            const Filter* filter, Fn&& fn) -> decltype(fn()) {
    auto guard = std::lock_guard{*lock_};
    log_call(operation, table, filter);
    try {
        return fn();
    } catch (const DbError&) {
        throw;
    } catch (const std::exception& e) {
        logger_->error("{} failed: {}", operation, e.what());
        throw DbError{ErrorKind::internal, e.what()};
    }
}

void InMemoryStore::log_call(std::string_view operation, const std::string& table,
                             const Filter* filter) const {
    if (!logger_->should_log(spdlog::level::debug)) return;
    if (filter) {
        logger_->debug("{} table='{}' filter={}", operation, table, filter_text(*filter));
    } else {
        logger_->debug("{} table='{}'", operation, table);
    }
}

auto InMemoryStore::find_table(const std::string& table) -> Table* {
    auto it = tables_.find(table);
    return it != tables_.end() ? &it->second : nullptr;
}

auto InMemoryStore::matching(const std::string& table, const Filter& filter)
    -> std::vector<std::size_t> {
    auto predicate = compile(filter);
    auto result = std::vector<std::size_t>{};
    const auto* rows = find_table(table);
    if (!rows) return result;
    for (std::size_t i = 0; i < rows->size(); ++i) {
        if (matches((*rows)[i], predicate)) result.push_back(i);
    }
    return result;
}

// Validate a record for insertion and give it an id when it has none.
auto InMemoryStore::prepare(const std::string& table, Value& record,
                            const std::vector<Value>& pending) -> Value {
    if (!record.is_object()) {
        throw DbError{ErrorKind::bad_request, "Cannot insert into '" + table +
                                              "': a record must be a map, got " +
                                              std::string{to_string_view(record.type())}};
    }
    auto* id = record.find(Key{"_id"});
    if (!id || id->is_null() || (id->is_string() && id->get<std::string>().empty())) {
        record[Key{"_id"}] = random_uuid();
        return *record.find(Key{"_id"});
    }
    if (!id->is_scalar()) {
        throw DbError{ErrorKind::bad_request, "Invalid _id " + dump_json(*id) + ": it must be a scalar"};
    }

    auto same_id = [&](const Value& other) {
        const auto* other_id = record_id(other);
        return other_id && *other_id == *id;
    };
    const auto* rows = find_table(table);
    if ((rows && std::ranges::any_of(*rows, same_id)) || std::ranges::any_of(pending, same_id)) {
        throw DbError{ErrorKind::conflict, "Duplicate _id '" + id_text(*id) + "' at table '" +
                                           table + "'"};
    }
    return *id;
}

// =============================================================================
// Connection
// =============================================================================

void InMemoryStore::connect(const Config& config) {
    auto guard = std::lock_guard{*lock_};
    logger_ = get_logger(config.logger_name);
    if (config.loglevel) logger_->set_level(parse_log_level(*config.loglevel));
    master_key_ = config.master_key;
    logger_->info("Connected to in-memory database '{}'", config.name);
}

void InMemoryStore::disconnect() {
    auto guard = std::lock_guard{*lock_};
    logger_->debug("Disconnected from in-memory database");
}

auto InMemoryStore::logger() const -> std::shared_ptr<spdlog::logger> {
    auto guard = std::lock_guard{*lock_};
    return logger_;
}

// =============================================================================
// Reads
// =============================================================================

auto InMemoryStore::get_list(const std::string& table, const Filter& filter)
    -> std::vector<Value> {
    return guarded("get_list", table, &filter, [&] {
        auto result = std::vector<Value>{};
        const auto indexes = matching(table, filter);
        if (indexes.empty()) return result;
        const auto& rows = *find_table(table);
        result.reserve(indexes.size());
        for (auto i : indexes) result.push_back(rows[i]);
        return result;
    });
}

auto InMemoryStore::get_one(const std::string& table, const Filter& filter,
                            bool fail_on_empty, bool fail_on_more) -> std::optional<Value> {
    return guarded("get_one", table, &filter, [&]() -> std::optional<Value> {
        const auto indexes = matching(table, filter);
        if (indexes.empty()) {
            if (fail_on_empty) {
                throw DbError{ErrorKind::not_found,
                              "Not found entry with filter='" + filter_text(filter) + "'"};
            }
            return std::nullopt;
        }
        if (fail_on_more && indexes.size() > 1) {
            throw DbError{ErrorKind::conflict,
                          "Found more than one entry with filter='" + filter_text(filter) + "'"};
        }
        return (*find_table(table))[indexes.front()];
    });
}

auto InMemoryStore::count(const std::string& table, const Filter& filter) -> std::size_t {
    return guarded("count", table, &filter, [&] { return matching(table, filter).size(); });
}

// =============================================================================
// Deletes
// =============================================================================

auto InMemoryStore::del_list(const std::string& table, const Filter& filter) -> DeleteResult {
    return guarded("del_list", table, &filter, [&] {
        const auto indexes = matching(table, filter);
        if (indexes.empty()) return DeleteResult{};
        auto& rows = *find_table(table);
        for (auto it = indexes.rbegin(); it != indexes.rend(); ++it) {
            rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(*it));
        }
        return DeleteResult{indexes.size()};
    });
}

auto InMemoryStore::del_one(const std::string& table, const Filter& filter,
                            bool fail_on_empty, bool fail_on_more)
    -> std::optional<DeleteResult> {
    return guarded("del_one", table, &filter, [&]() -> std::optional<DeleteResult> {
        const auto indexes = matching(table, filter);
        if (indexes.empty()) {
            if (fail_on_empty) {
                throw DbError{ErrorKind::not_found,
                              "Not found entry with filter='" + filter_text(filter) + "'"};
            }
            return std::nullopt;
        }
        if (fail_on_more && indexes.size() > 1) {
            throw DbError{ErrorKind::conflict,
                          "Found more than one entry with filter='" + filter_text(filter) + "'"};
        }
        auto& rows = *find_table(table);
        rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(indexes.front()));
        return DeleteResult{1};
    });
}

// =============================================================================
// Inserts
// =============================================================================

auto InMemoryStore::create(const std::string& table, Value record) -> Value {
    return guarded("create", table, nullptr, [&] {
        auto id = prepare(table, record, {});
        tables_[table].push_back(std::move(record));
        return id;
    });
}

auto InMemoryStore::create_list(const std::string& table, std::vector<Value> records)
    -> std::vector<Value> {
    return guarded("create_list", table, nullptr, [&] {
        auto ids = std::vector<Value>{};
        ids.reserve(records.size());
        auto accepted = std::vector<Value>{};
        accepted.reserve(records.size());
        for (auto& record : records) {
            ids.push_back(prepare(table, record, accepted));
            accepted.push_back(std::move(record));
        }
        auto& rows = tables_[table];
        for (auto& record : accepted) rows.push_back(std::move(record));
        return ids;
    });
}

// =============================================================================
// Updates
// =============================================================================

auto InMemoryStore::replace(const std::string& table, const Value& id, Value record,
                            bool fail_on_empty) -> std::optional<UpdateResult> {
    return guarded("replace", table, nullptr, [&]() -> std::optional<UpdateResult> {
        if (!record.is_object()) {
            throw DbError{ErrorKind::bad_request, "Cannot replace at '" + table +
                                                  "': a record must be a map"};
        }
        if (const auto* new_id = record_id(record); new_id && *new_id != id) {
            throw DbError{ErrorKind::bad_request, "Cannot modify the _id of a record"};
        }
        record[Key{"_id"}] = id;

        auto* target = static_cast<Value*>(nullptr);
        if (auto* rows = find_table(table)) {
            for (auto& row : *rows) {
                const auto* row_id = record_id(row);
                if (row_id && *row_id == id) {
                    target = &row;
                    break;
                }
            }
        }
        if (!target) {
            if (fail_on_empty) {
                throw DbError{ErrorKind::not_found, "Not found entry with _id='" + id_text(id) + "'"};
            }
            return std::nullopt;
        }
        *target = std::move(record);
        return UpdateResult{1};
    });
}

auto InMemoryStore::set_one(const std::string& table, const Filter& filter, const Update& update,
                            const UpdateOptions& options) -> std::optional<UpdateResult> {
    return guarded("set_one", table, &filter, [&]() -> std::optional<UpdateResult> {
        const auto indexes = matching(table, filter);
        if (indexes.empty()) {
            if (options.fail_on_empty) {
                throw DbError{ErrorKind::not_found,
                              "Not found entry with filter='" + filter_text(filter) + "'"};
            }
            return std::nullopt;
        }
        auto& row = (*find_table(table))[indexes.front()];
        auto updated = row;
        if (!apply_update(updated, update, options)) return UpdateResult{0};
        require_same_id(row, updated);
        row = std::move(updated);
        return UpdateResult{1};
    });
}

auto InMemoryStore::set_list(const std::string& table, const Filter& filter, const Update& update,
                             const UpdateOptions& options) -> std::optional<UpdateResult> {
    return guarded("set_list", table, &filter, [&]() -> std::optional<UpdateResult> {
        const auto indexes = matching(table, filter);
        if (indexes.empty()) return std::nullopt;

        // Every record is updated on a copy first so a failure changes nothing
        auto& rows = *find_table(table);
        auto changed = std::vector<std::pair<std::size_t, Value>>{};
        for (auto i : indexes) {
            auto updated = rows[i];
            if (!apply_update(updated, update, options)) continue;
            require_same_id(rows[i], updated);
            changed.emplace_back(i, std::move(updated));
        }
        for (auto& [i, updated] : changed) rows[i] = std::move(updated);
        return UpdateResult{changed.size()};
    });
}

}  // namespace docstore_cpp
