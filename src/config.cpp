#include <docstore-cpp/config.hpp>

#include <docstore-cpp/error.hpp>
#include <docstore-cpp/logging.hpp>

#include <string>

namespace docstore_cpp {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw DbError{ErrorKind::bad_request,
                      std::string{"Invalid config field '"} + key + "': " + e.what()};
    }
}

}  // anonymous namespace

void to_json(nlohmann::json& j, const Config& config) {
    j = nlohmann::json::object();
    if (!config.name.empty()) j["name"] = config.name;
    j["logger_name"] = config.logger_name;
    if (config.loglevel) j["loglevel"] = *config.loglevel;
    if (config.master_key) j["commonkey"] = *config.master_key;
    if (!config.uri.empty()) j["uri"] = config.uri;
    if (!config.host.empty()) j["host"] = config.host;
    if (config.port != 0) j["port"] = config.port;
    if (!config.user.empty()) j["user"] = config.user;
    if (!config.password.empty()) j["password"] = config.password;
}

void from_json(const nlohmann::json& j, Config& config) {
    if (!j.is_object()) {
        throw DbError{ErrorKind::bad_request, "Invalid config: a JSON object is expected"};
    }
    config = Config{};
    read_field(j, "name", config.name);
    read_field(j, "logger_name", config.logger_name);
    read_field(j, "uri", config.uri);
    read_field(j, "host", config.host);
    read_field(j, "port", config.port);
    read_field(j, "user", config.user);
    read_field(j, "password", config.password);

    auto loglevel = std::string{};
    read_field(j, "loglevel", loglevel);
    if (!loglevel.empty()) {
        parse_log_level(loglevel);
        config.loglevel = loglevel;
    }

    // commonkey wins over the older masterpassword
    auto commonkey = std::string{};
    auto masterpassword = std::string{};
    read_field(j, "commonkey", commonkey);
    read_field(j, "masterpassword", masterpassword);
    if (!commonkey.empty()) {
        config.master_key = commonkey;
    } else if (!masterpassword.empty()) {
        config.master_key = masterpassword;
    }
}

auto load_config(std::string_view text) -> Config {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw DbError{ErrorKind::bad_request, "invalid config text: '" + std::string{text} + "'"};
    }
    return j.get<Config>();
}

}  // namespace docstore_cpp
