#include "rrsync/core/config.hpp"
#include "rrsync/core/logger.hpp"

#include <cstdint>
#include <fstream>

namespace rrsync {

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Config file not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Cannot open config file", path.string()));
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "Config root must be an object", path.string()));
        }

        // Checked on the JSON value: a negative number would wrap when
        // converted to std::size_t.
        if (auto it = j.find("max_glob_matches");
            it != j.end() && (!it->is_number_integer() || it->get<std::int64_t>() <= 0)) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "max_glob_matches must be a positive integer", path.string()));
        }

        auto config = j.get<Config>();
        if (config.engine_path.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "engine_path must not be empty", path.string()));
        }
        if (!config.helper.path.empty() && config.helper.user.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "helper.user must be set when helper.path is", path.string()));
        }

        LOG_DEBUG("Loaded configuration from {}", path.string());
        return config;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Failed to parse config", path.string() + ": " + e.what()));
    }
}

auto default_config() -> Config {
    return Config{};
}

} // namespace rrsync
