#include <catch2/catch_test_macros.hpp>

#include "rrsync/gateway/gateway.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace rrsync;
using rrsync::gateway::Gateway;
using rrsync::infra::RestrictedRoot;

using Strings = std::vector<std::string>;

namespace {

// A confined root that is also the working directory for the test.
struct RootDir {
    fs::path path;
    fs::path previous;

    RootDir() : previous(fs::current_path()) {
        path = fs::temp_directory_path() / ("test_gateway_" + std::to_string(::getpid()));
        fs::create_directories(path / "logs");
        path = fs::canonical(path);
        std::ofstream(path / "logs" / "mon.txt") << "1";
        std::ofstream(path / "logs" / "tue.txt") << "2";
        fs::current_path(path);
    }
    ~RootDir() {
        std::error_code ec;
        fs::current_path(previous, ec);
        fs::remove_all(path, ec);
    }

    [[nodiscard]] auto root() const -> RestrictedRoot {
        return RestrictedRoot::from_canonical(path);
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Accepted requests
// ---------------------------------------------------------------------------

TEST_CASE("Push is forwarded with its destination", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), false);

    auto invocation = gateway.authorize("rsync --server -vlogDtpre.iLsfxC . /uploads_zz9/");
    REQUIRE(invocation.has_value());
    CHECK_FALSE(invocation->mode.is_sender);
    CHECK(invocation->final_argv ==
          Strings{"--server", "-vlogDtpre.iLsfxC", ".", "uploads_zz9/"});
}

TEST_CASE("Pull expands wildcards inside the root", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), true);

    auto invocation = gateway.authorize("rsync --server --sender -vlogDtpr . /logs/*.txt");
    REQUIRE(invocation.has_value());
    CHECK(invocation->mode.is_sender);
    CHECK(invocation->mode.read_only);
    CHECK(invocation->parsed.raw_args == Strings{"logs/*.txt"});
    CHECK(invocation->final_argv ==
          Strings{"--server", "--sender", "-vlogDtpr", ".", "logs/mon.txt", "logs/tue.txt"});
}

TEST_CASE("Missing path defaults to the root itself", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), false);

    auto invocation = gateway.authorize("rsync --server .");
    REQUIRE(invocation.has_value());
    CHECK(invocation->final_argv == Strings{"--server", ".", "."});
}

TEST_CASE("Comparison directories are anchored in the root", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), false);

    auto invocation = gateway.authorize("rsync --server -vlogDtpr --compare-dest=/snap_01 . cur");
    REQUIRE(invocation.has_value());
    CHECK(invocation->final_argv[2] == "--compare-dest=" + dir.path.string() + "/snap_01");
}

// ---------------------------------------------------------------------------
// Rejected requests
// ---------------------------------------------------------------------------

TEST_CASE("Read-only key cannot push", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), true);

    auto invocation = gateway.authorize("rsync --server -vlogDtpr . uploads_zz9");
    REQUIRE_FALSE(invocation.has_value());
    CHECK(invocation.error().code() == ErrorCode::PolicyViolation);
}

TEST_CASE("Other commands are refused", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), false);

    auto invocation = gateway.authorize("scp -t /etc");
    REQUIRE_FALSE(invocation.has_value());
    CHECK(invocation.error().code() == ErrorCode::ProtocolPrecondition);

    auto missing = gateway.authorize(std::nullopt);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().message() == "Not invoked via sshd");
}

TEST_CASE("Escapes through braces are refused", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), false);

    auto invocation = gateway.authorize("rsync --server --sender -v . {.,x}./etc");
    REQUIRE_FALSE(invocation.has_value());
    CHECK(invocation.error().code() == ErrorCode::TraversalAttempt);
}

// ---------------------------------------------------------------------------
// Administrator overrides
// ---------------------------------------------------------------------------

TEST_CASE("Configured long options are disabled", "[gateway]") {
    RootDir dir;
    Config config;
    config.options.disabled_long = {"delete", "not-a-real-option"};
    Gateway gateway(config, dir.root(), false);

    auto invocation = gateway.authorize("rsync --server -vlogDtpr --delete . uploads_zz9");
    REQUIRE_FALSE(invocation.has_value());
    CHECK(invocation.error().code() == ErrorCode::DisabledOption);
    CHECK(invocation.error().message() == "option --delete has been disabled on this server.");
}

TEST_CASE("Short option set can be widened", "[gateway]") {
    RootDir dir;
    Config config;

    Gateway strict(config, dir.root(), false);
    CHECK_FALSE(strict.authorize("rsync --server -vlogs . uploads_zz9").has_value());

    config.options.disabled_short = "";
    Gateway relaxed(config, dir.root(), false);
    auto invocation = relaxed.authorize("rsync --server -vlogs . uploads_zz9");
    REQUIRE(invocation.has_value());
    CHECK(invocation->final_argv[1] == "-vlogs");
}

TEST_CASE("Glob match limit comes from the config", "[gateway]") {
    RootDir dir;
    Config config;
    config.max_glob_matches = 1;
    Gateway gateway(config, dir.root(), false);

    auto invocation = gateway.authorize("rsync --server --sender -v . logs/*");
    REQUIRE_FALSE(invocation.has_value());
    CHECK(invocation.error().code() == ErrorCode::ExpansionLimit);
}

TEST_CASE("Absolute brace alternatives do not glob the host", "[gateway]") {
    RootDir dir;
    Config config;
    Gateway gateway(config, dir.root(), true);

    // Resolves to real files only when read from the host's "/".
    auto host_path = dir.path.relative_path().string() + "/logs/*.txt";
    auto invocation = gateway.authorize("rsync --server --sender -v . {/,}" + host_path);
    REQUIRE(invocation.has_value());
    CHECK(invocation->final_argv ==
          Strings{"--server", "--sender", "-v", ".", host_path, host_path});
}
