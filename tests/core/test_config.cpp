#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "rrsync/core/config.hpp"

namespace fs = std::filesystem;

namespace {

auto write_config(const std::string& content) -> fs::path {
    auto tmp = fs::temp_directory_path() /
               ("rrsync_test_config_" + std::to_string(::getpid()) + ".json");
    std::ofstream out(tmp);
    out << content;
    return tmp;
}

} // namespace

TEST_CASE("default_config returns the stock values", "[config]") {
    auto cfg = rrsync::default_config();

    CHECK(cfg.engine_path == "/usr/bin/rsync");
    CHECK(cfg.helper.path == "/usr/bin/sudo");
    CHECK(cfg.helper.user == "root");
    CHECK(cfg.audit_log == "rrsync.log");
    CHECK(cfg.log_level == "info");
    CHECK(cfg.max_glob_matches == 4096);
    CHECK(cfg.options.disabled_short == "s");
    CHECK(cfg.options.disabled_long.empty());
}

TEST_CASE("load_config reads a partial file over the defaults", "[config]") {
    auto path = write_config(R"({
        "engine_path": "/opt/rsync/bin/rsync",
        "helper": { "user": "backup" },
        "options": { "disabled_long": ["delete", "log-file"] }
    })");

    auto cfg = rrsync::load_config(path);
    REQUIRE(cfg.has_value());
    CHECK(cfg->engine_path == "/opt/rsync/bin/rsync");
    CHECK(cfg->helper.path == "/usr/bin/sudo");
    CHECK(cfg->helper.user == "backup");
    CHECK(cfg->options.disabled_short == "s");
    REQUIRE(cfg->options.disabled_long.size() == 2);
    CHECK(cfg->options.disabled_long[0] == "delete");

    fs::remove(path);
}

TEST_CASE("load_config accepts an empty helper path", "[config]") {
    auto path = write_config(R"({ "helper": { "path": "" }, "audit_log": "" })");

    auto cfg = rrsync::load_config(path);
    REQUIRE(cfg.has_value());
    CHECK(cfg->helper.path.empty());
    CHECK(cfg->audit_log.empty());

    fs::remove(path);
}

TEST_CASE("load_config rejects malformed files", "[config]") {
    SECTION("not JSON") {
        auto path = write_config("engine_path = /usr/bin/rsync");
        auto cfg = rrsync::load_config(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == rrsync::ErrorCode::InvalidConfig);
        fs::remove(path);
    }

    SECTION("wrong type") {
        auto path = write_config(R"({ "max_glob_matches": "many" })");
        auto cfg = rrsync::load_config(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == rrsync::ErrorCode::InvalidConfig);
        fs::remove(path);
    }

    SECTION("not an object") {
        auto path = write_config("[1, 2, 3]");
        auto cfg = rrsync::load_config(path);
        REQUIRE_FALSE(cfg.has_value());
        fs::remove(path);
    }

    SECTION("zero glob limit") {
        auto path = write_config(R"({ "max_glob_matches": 0 })");
        auto cfg = rrsync::load_config(path);
        REQUIRE_FALSE(cfg.has_value());
        fs::remove(path);
    }

    SECTION("negative glob limit") {
        auto path = write_config(R"({ "max_glob_matches": -1 })");
        auto cfg = rrsync::load_config(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == rrsync::ErrorCode::InvalidConfig);
        CHECK(cfg.error().message() == "max_glob_matches must be a positive integer");
        fs::remove(path);
    }

    SECTION("fractional glob limit") {
        auto path = write_config(R"({ "max_glob_matches": 2.5 })");
        auto cfg = rrsync::load_config(path);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == rrsync::ErrorCode::InvalidConfig);
        fs::remove(path);
    }
}

TEST_CASE("load_config fails for a missing file", "[config]") {
    auto cfg = rrsync::load_config("/nonexistent/rrsync/config.json");
    REQUIRE_FALSE(cfg.has_value());
    CHECK(cfg.error().code() == rrsync::ErrorCode::InvalidConfig);
}
