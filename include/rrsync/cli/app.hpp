#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "rrsync/core/config.hpp"
#include "rrsync/core/error.hpp"

namespace rrsync::cli {

/// Rewrites the historical `-ro` spelling used in authorized_keys lines
/// into `--read-only`. Arguments are returned in order, without argv[0].
auto normalize_arguments(int argc, char** argv) -> std::vector<std::string>;

/// The forced-command entry point.
///
/// Usage (from authorized_keys):
///   command="rrsync [--config FILE] [-ro] SUBDIR" ssh-ed25519 AAAA...
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parses arguments and, if the request is accepted, replaces the
    /// process with the sync engine.
    /// @returns Process exit code; only returned on failure.
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() const -> const Config&;
    [[nodiscard]] auto read_only() const -> bool { return read_only_; }
    [[nodiscard]] auto subdir() const -> const std::string& { return subdir_; }

    /// Loads the config file (if one was given) and applies overrides.
    [[nodiscard]] auto configure() -> VoidResult;

private:
    [[nodiscard]] auto execute() -> Error;

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    std::string subdir_;
    bool read_only_ = false;
};

} // namespace rrsync::cli
