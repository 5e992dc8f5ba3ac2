#include <docstore-cpp/config.hpp>

#include <docstore-cpp/error.hpp>
#include <docstore-cpp/logging.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

namespace ds = docstore_cpp;
using json = nlohmann::json;

// =============================================================================
// load_config
// =============================================================================

TEST(LoadConfig, defaults) {
    const auto config = ds::load_config("{}");
    EXPECT_EQ(config, ds::Config{});
    EXPECT_EQ(config.logger_name, "db");
    EXPECT_FALSE(config.loglevel.has_value());
    EXPECT_FALSE(config.master_key.has_value());
}

TEST(LoadConfig, reads_every_field) {
    const auto config = ds::load_config(R"({
        "name": "osm", "logger_name": "db_local", "loglevel": "DEBUG",
        "commonkey": "k", "uri": "mongodb://h:27017", "host": "h", "port": 27017,
        "user": "u", "password": "p"
    })");
    EXPECT_EQ(config.name, "osm");
    EXPECT_EQ(config.logger_name, "db_local");
    EXPECT_EQ(config.loglevel, "DEBUG");
    EXPECT_EQ(config.master_key, "k");
    EXPECT_EQ(config.uri, "mongodb://h:27017");
    EXPECT_EQ(config.host, "h");
    EXPECT_EQ(config.port, 27017);
    EXPECT_EQ(config.user, "u");
    EXPECT_EQ(config.password, "p");
}

TEST(LoadConfig, commonkey_wins_over_masterpassword) {
    EXPECT_EQ(ds::load_config(R"({"commonkey": "a", "masterpassword": "b"})").master_key, "a");
    EXPECT_EQ(ds::load_config(R"({"masterpassword": "b"})").master_key, "b");
    EXPECT_EQ(ds::load_config(R"({"commonkey": "", "masterpassword": "b"})").master_key, "b");
}

TEST(LoadConfig, null_fields_keep_defaults) {
    const auto config = ds::load_config(R"({"logger_name": null, "port": null})");
    EXPECT_EQ(config.logger_name, "db");
    EXPECT_EQ(config.port, 0);
}

TEST(LoadConfig, malformed_text_is_bad_request) {
    try {
        (void)ds::load_config("{oops");
        FAIL() << "malformed config was accepted";
    } catch (const ds::DbError& e) {
        EXPECT_EQ(e.kind(), ds::ErrorKind::bad_request);
    }
}

TEST(LoadConfig, non_object_is_bad_request) {
    EXPECT_THROW((void)ds::load_config("[1, 2]"), ds::DbError);
}

TEST(LoadConfig, wrong_field_type_is_bad_request) {
    try {
        (void)ds::load_config(R"({"port": "many"})");
        FAIL() << "string port was accepted";
    } catch (const ds::DbError& e) {
        EXPECT_EQ(e.kind(), ds::ErrorKind::bad_request);
        EXPECT_NE(e.message().find("port"), std::string::npos) << e.message();
    }
}

TEST(LoadConfig, unknown_loglevel_is_bad_request) {
    EXPECT_THROW((void)ds::load_config(R"({"loglevel": "CHATTY"})"), ds::DbError);
}

// =============================================================================
// to_json
// =============================================================================

TEST(ConfigJson, omits_empty_fields) {
    EXPECT_EQ(json(ds::Config{}), json::parse(R"({"logger_name": "db"})"));
}

TEST(ConfigJson, writes_master_key_as_commonkey) {
    auto config = ds::Config{};
    config.name = "osm";
    config.master_key = "secret";
    config.port = 27017;
    EXPECT_EQ(json(config), json::parse(R"({"name": "osm", "logger_name": "db",
                                            "commonkey": "secret", "port": 27017})"));
    EXPECT_EQ(json(config).get<ds::Config>(), config);
}

// =============================================================================
// Logging
// =============================================================================

TEST(Logging, level_names) {
    EXPECT_EQ(ds::parse_log_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(ds::parse_log_level("INFO"), spdlog::level::info);
    EXPECT_EQ(ds::parse_log_level("WARNING"), spdlog::level::warn);
    EXPECT_EQ(ds::parse_log_level("WARN"), spdlog::level::warn);
    EXPECT_EQ(ds::parse_log_level("ERROR"), spdlog::level::err);
    EXPECT_EQ(ds::parse_log_level("CRITICAL"), spdlog::level::critical);
    EXPECT_EQ(ds::parse_log_level("FATAL"), spdlog::level::critical);
    EXPECT_EQ(ds::parse_log_level("NOTSET"), spdlog::level::trace);
}

TEST(Logging, unknown_level_is_bad_request) {
    try {
        (void)ds::parse_log_level("debug");
        FAIL() << "lowercase level was accepted";
    } catch (const ds::DbError& e) {
        EXPECT_EQ(e.kind(), ds::ErrorKind::bad_request);
        EXPECT_EQ(e.message(), "Invalid loglevel 'debug'");
    }
}

TEST(Logging, get_logger_returns_the_registered_instance) {
    auto first = ds::get_logger("config_test");
    auto second = ds::get_logger("config_test");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "config_test");
}
