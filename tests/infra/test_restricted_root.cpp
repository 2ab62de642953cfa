#include <catch2/catch_test_macros.hpp>

#include "rrsync/infra/restricted_root.hpp"

#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;
using rrsync::ErrorCode;
using rrsync::infra::RestrictedRoot;

namespace {

struct TmpDir {
    fs::path path;
    TmpDir() {
        path = fs::temp_directory_path() / ("test_restricted_root_" + std::to_string(::getpid()));
        fs::create_directories(path / "inner");
        path = fs::canonical(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("Root resolves to its canonical form", "[infra][root]") {
    TmpDir tmp;
    auto root = RestrictedRoot::resolve((tmp.path / "inner" / ".." / "inner").string());
    REQUIRE(root.has_value());
    CHECK(root->path() == tmp.path / "inner");
    CHECK(root->is_confined());
}

TEST_CASE("Slash is the unconfined root", "[infra][root]") {
    auto root = RestrictedRoot::resolve("/");
    REQUIRE(root.has_value());
    CHECK(root->path() == "/");
    CHECK_FALSE(root->is_confined());
}

TEST_CASE("Missing or empty roots are rejected", "[infra][root]") {
    TmpDir tmp;

    auto empty = RestrictedRoot::resolve("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == ErrorCode::ConfigurationError);
    CHECK(empty.error().message() == "No subdirectory specified");

    auto missing = RestrictedRoot::resolve((tmp.path / "absent_q7").string());
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::ConfigurationError);
    CHECK(missing.error().message() == "Restricted directory does not exist!");
}

TEST_CASE("A regular file is not a root", "[infra][root]") {
    TmpDir tmp;
    std::ofstream(tmp.path / "plain.txt") << "x";

    auto root = RestrictedRoot::resolve((tmp.path / "plain.txt").string());
    REQUIRE_FALSE(root.has_value());
    CHECK(root.error().code() == ErrorCode::ConfigurationError);
}

TEST_CASE("Entering the root changes the working directory", "[infra][root]") {
    TmpDir tmp;
    auto previous = fs::current_path();

    auto root = RestrictedRoot::resolve((tmp.path / "inner").string());
    REQUIRE(root.has_value());
    REQUIRE(root->enter().has_value());
    CHECK(fs::current_path() == tmp.path / "inner");

    fs::current_path(previous);
}

TEST_CASE("Entering a vanished root fails", "[infra][root]") {
    auto root = RestrictedRoot::from_canonical("/nonexistent_rrsync_root_k3");
    auto entered = root.enter();
    REQUIRE_FALSE(entered.has_value());
    CHECK(entered.error().code() == ErrorCode::ConfigurationError);
    CHECK(entered.error().message() == "Unable to chdir to restricted dir");
    CHECK_FALSE(entered.error().detail().empty());
}
