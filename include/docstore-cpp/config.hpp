/// @file config.hpp
/// @brief Connection settings passed to Database::connect.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docstore_cpp {

/// Settings for a store. The in-memory store uses only the logging fields
/// and the master key; the network fields are for networked backends.
struct Config {
    std::string name;                       ///< Database name.
    std::string logger_name = "db";         ///< spdlog logger the store reports to.
    std::optional<std::string> loglevel;    ///< DEBUG, INFO, WARNING, ERROR or CRITICAL.
    std::optional<std::string> master_key;  ///< From `commonkey`, else `masterpassword`.
    std::string uri;
    std::string host;
    std::uint16_t port = 0;
    std::string user;
    std::string password;

    auto operator==(const Config&) const -> bool = default;
};

/// Writes `master_key` back as `commonkey`; empty fields are omitted.
void to_json(nlohmann::json& j, const Config& config);

/// @throws DbError (bad_request) on a field of the wrong type or an
///   unknown loglevel.
void from_json(const nlohmann::json& j, Config& config);

/// Parse a JSON configuration document.
/// @throws DbError (bad_request) on malformed text or invalid fields.
auto load_config(std::string_view text) -> Config;

}  // namespace docstore_cpp
