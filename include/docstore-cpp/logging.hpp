/// @file logging.hpp
/// @brief Named spdlog loggers for the stores.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace docstore_cpp {

/// The spdlog logger registered under `name`, creating a stderr color
/// logger when none is registered yet. Safe to call from several threads.
auto get_logger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

/// Map a level name (`DEBUG`, `INFO`, `WARNING`, `ERROR`, `CRITICAL`, and
/// the `WARN`/`FATAL`/`NOTSET` aliases) to an spdlog level.
/// @throws DbError (bad_request) on an unknown name.
auto parse_log_level(std::string_view text) -> spdlog::level::level_enum;

}  // namespace docstore_cpp
