#include "rrsync/infra/dispatcher.hpp"

#include "rrsync/core/logger.hpp"

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace rrsync::infra {

Dispatcher::Dispatcher(const Config& config)
    : config_(config)
{
}

auto Dispatcher::build_exec_argv(const std::vector<std::string>& final_argv) const
    -> std::vector<std::string> {
    std::vector<std::string> argv;
    argv.reserve(final_argv.size() + 4);
    if (!config_.helper.path.empty()) {
        argv.push_back(config_.helper.path);
        argv.emplace_back("-u");
        argv.push_back(config_.helper.user);
    }
    argv.push_back(config_.engine_path);
    argv.insert(argv.end(), final_argv.begin(), final_argv.end());
    return argv;
}

auto Dispatcher::exec(const std::vector<std::string>& final_argv) const -> Error {
    auto argv = build_exec_argv(final_argv);

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (auto& arg : argv) {
        c_argv.push_back(arg.data());
    }
    c_argv.push_back(nullptr);

    LOG_DEBUG("Executing {} with {} argument(s)", argv.front(), argv.size() - 1);
    Logger::flush();

    ::execv(c_argv.front(), c_argv.data());

    // Only reached if the exec itself failed.
    int saved_errno = errno;
    std::string joined;
    for (const auto& arg : final_argv) {
        joined += ' ';
        joined += arg;
    }
    return make_error(ErrorCode::DispatchFailure,
        "exec(rsync" + joined + ") failed", std::strerror(saved_errno));
}

} // namespace rrsync::infra
