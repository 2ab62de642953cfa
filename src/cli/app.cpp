#include "rrsync/cli/app.hpp"

#include "rrsync/core/logger.hpp"
#include "rrsync/gateway/gateway.hpp"
#include "rrsync/infra/audit_log.hpp"
#include "rrsync/infra/dispatcher.hpp"
#include "rrsync/infra/restricted_root.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <string_view>

// Version string; typically injected by CMake via -DRRSYNC_VERSION_STRING=...
#ifndef RRSYNC_VERSION_STRING
#define RRSYNC_VERSION_STRING "0.1.0-dev"
#endif

namespace rrsync::cli {

namespace {

auto env(const char* name) -> std::optional<std::string_view> {
    if (const char* value = std::getenv(name)) {
        return std::string_view(value);
    }
    return std::nullopt;
}

void log_usage() {
    auto home = env("HOME").value_or("~");
    LOG_ERROR("Use 'command=\"rrsync [-ro] SUBDIR\"' in front of lines in {}/.ssh/authorized_keys",
              home);
}

} // anonymous namespace

auto normalize_arguments(int argc, char** argv) -> std::vector<std::string> {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-ro") {
            args.emplace_back("--read-only");
        } else {
            args.emplace_back(arg);
        }
    }
    return args;
}

App::App()
    : cli_("rrsync", "Restrict rsync to a subdirectory declared in authorized_keys")
{
    cli_.set_version_flag("--version", RRSYNC_VERSION_STRING,
                          "Display version information");

    // Deliberately no envname(): the peer may be allowed to set variables.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.add_flag("--read-only", read_only_,
                  "Only allow the peer to pull (historical spelling: -ro)");

    cli_.add_option("subdir", subdir_,
                    "Directory the key is restricted to (\"/\" for no restriction)");
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    Logger::init("rrsync", "info");

    try {
        auto args = normalize_arguments(argc, argv);
        // CLI11 consumes the vector form back to front.
        std::reverse(args.begin(), args.end());
        cli_.parse(std::move(args));
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    if (auto configured = configure(); !configured) {
        LOG_ERROR("{}", configured.error().what());
        return 1;
    }

    auto error = execute();
    LOG_ERROR("{}", error.what());
    if (error.code() == ErrorCode::ConfigurationError && subdir_.empty()) {
        log_usage();
    } else if (error.code() == ErrorCode::ProtocolPrecondition &&
               !env("SSH_ORIGINAL_COMMAND")) {
        log_usage();
    }
    Logger::flush();
    return 1;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

auto App::configure() -> VoidResult {
    if (!config_path_.empty()) {
        auto loaded = load_config(config_path_);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config_ = std::move(*loaded);
    }
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
    Logger::set_level(config_.log_level);
    return {};
}

auto App::execute() -> Error {
    auto root = infra::RestrictedRoot::resolve(subdir_);
    if (!root) {
        return root.error();
    }

    // Opened relative to where sshd started us (the account's home).
    auto audit = infra::AuditLog::open_existing(config_.audit_log);

    if (auto entered = root->enter(); !entered) {
        return entered.error();
    }

    gateway::Gateway gateway(config_, *root, read_only_);
    auto invocation = gateway.authorize(env("SSH_ORIGINAL_COMMAND"));
    if (!invocation) {
        return invocation.error();
    }

    if (audit) {
        auto now = std::time(nullptr);
        std::tm local{};
        ::localtime_r(&now, &local);
        auto host = infra::resolve_client_host(env("SSH_CONNECTION"));
        auto line = infra::format_audit_line(local, host, invocation->final_argv);
        if (auto written = audit->write(line); !written) {
            LOG_WARN("{}", written.error().what());
        }
    }

    infra::Dispatcher dispatcher(config_);
    return dispatcher.exec(invocation->final_argv);
}

} // namespace rrsync::cli
