#include <catch2/catch_test_macros.hpp>

#include "rrsync/command/request.hpp"

using rrsync::ErrorCode;
using rrsync::command::parse_request;

TEST_CASE("Push request is a receiving session", "[command][request]") {
    auto request = parse_request("rsync --server -vlogDtpr --partial . dir", false);
    REQUIRE(request.has_value());
    CHECK(request->command == "--server -vlogDtpr --partial . dir");
    CHECK_FALSE(request->mode.is_sender);
    CHECK_FALSE(request->mode.read_only);
}

TEST_CASE("Pull request is a sending session", "[command][request]") {
    auto request = parse_request("rsync  --server\t--sender -vlogDtpr . dir", true);
    REQUIRE(request.has_value());
    CHECK(request->command == "--server\t--sender -vlogDtpr . dir");
    CHECK(request->mode.is_sender);
    CHECK(request->mode.read_only);
}

TEST_CASE("--sender must directly follow --server", "[command][request]") {
    auto request = parse_request("rsync --server -v --sender . dir", false);
    REQUIRE(request.has_value());
    CHECK_FALSE(request->mode.is_sender);
}

TEST_CASE("Missing command means not invoked via sshd", "[command][request]") {
    auto request = parse_request(std::nullopt, false);
    REQUIRE_FALSE(request.has_value());
    CHECK(request.error().code() == ErrorCode::ProtocolPrecondition);
    CHECK(request.error().message() == "Not invoked via sshd");
}

TEST_CASE("Only rsync may be invoked", "[command][request]") {
    for (auto command : {"ls -la", "rsync", "rsyncd --server .", "/usr/bin/rsync --server .", ""}) {
        auto request = parse_request(command, false);
        REQUIRE_FALSE(request.has_value());
        CHECK(request.error().code() == ErrorCode::ProtocolPrecondition);
    }
}

TEST_CASE("--server must come first", "[command][request]") {
    for (auto command : {"rsync -v --server .", "rsync --server", "rsync --servers ."}) {
        auto request = parse_request(command, false);
        REQUIRE_FALSE(request.has_value());
        CHECK(request.error().code() == ErrorCode::ProtocolPrecondition);
        CHECK(request.error().message() == "--server option is not first");
    }
}

TEST_CASE("Read-only rejects a push", "[command][request]") {
    auto request = parse_request("rsync --server -vlogDtpr . dir", true);
    REQUIRE_FALSE(request.has_value());
    CHECK(request.error().code() == ErrorCode::PolicyViolation);
}
