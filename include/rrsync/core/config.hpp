#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rrsync/core/error.hpp"

namespace rrsync {

using json = nlohmann::json;

/// The privileged helper that performs the identity switch before the
/// engine runs. An empty path execs the engine directly.
struct HelperConfig {
    std::string path = "/usr/bin/sudo";
    std::string user = "root";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(HelperConfig, path, user)

/// Narrowing overrides for the built-in option table.
struct OptionOverrides {
    std::string disabled_short = "s";       // replaces the default set
    std::vector<std::string> disabled_long; // become Forbidden
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(OptionOverrides, disabled_short, disabled_long)

struct Config {
    std::string engine_path = "/usr/bin/rsync";
    HelperConfig helper;
    std::string audit_log = "rrsync.log";  // relative to the starting directory
    std::string log_level = "info";
    std::size_t max_glob_matches = 4096;
    OptionOverrides options;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, engine_path, helper, audit_log, log_level, max_glob_matches, options)

/// Loads a JSON configuration file. Keys that are absent keep their
/// defaults; an unreadable or malformed file is an error, since silently
/// falling back to defaults could re-enable options the administrator
/// turned off.
auto load_config(const std::filesystem::path& path) -> Result<Config>;
auto default_config() -> Config;

} // namespace rrsync
