#include <docstore-cpp/logging.hpp>

#include <docstore-cpp/error.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace docstore_cpp {

auto get_logger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    static auto registry_mutex = std::mutex{};
    auto guard = std::lock_guard{registry_mutex};
    if (auto logger = spdlog::get(name)) return logger;
    return spdlog::stderr_color_mt(name);
}

auto parse_log_level(std::string_view text) -> spdlog::level::level_enum {
    if (text == "DEBUG") return spdlog::level::debug;
    if (text == "INFO") return spdlog::level::info;
    if (text == "WARNING" || text == "WARN") return spdlog::level::warn;
    if (text == "ERROR") return spdlog::level::err;
    if (text == "CRITICAL" || text == "FATAL") return spdlog::level::critical;
    if (text == "NOTSET") return spdlog::level::trace;
    throw DbError{ErrorKind::bad_request, "Invalid loglevel '" + std::string{text} + "'"};
}

}  // namespace docstore_cpp
