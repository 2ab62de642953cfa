#include "rrsync/infra/restricted_root.hpp"

#include "rrsync/core/logger.hpp"

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace rrsync::infra {

namespace fs = std::filesystem;

auto RestrictedRoot::resolve(std::string_view subdir) -> Result<RestrictedRoot> {
    if (subdir.empty()) {
        return std::unexpected(make_error(ErrorCode::ConfigurationError,
            "No subdirectory specified"));
    }

    std::error_code ec;
    auto canonical = fs::canonical(fs::path(std::string(subdir)), ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::ConfigurationError,
            "Restricted directory does not exist!"));
    }

    if (canonical != "/" && !fs::is_directory(canonical, ec)) {
        return std::unexpected(make_error(ErrorCode::ConfigurationError,
            "Restricted directory does not exist!"));
    }

    LOG_DEBUG("Restricted root resolved to {}", canonical.string());
    return RestrictedRoot(std::move(canonical));
}

auto RestrictedRoot::from_canonical(fs::path path) -> RestrictedRoot {
    return RestrictedRoot(std::move(path));
}

auto RestrictedRoot::enter() const -> VoidResult {
    if (::chdir(path_.c_str()) != 0) {
        return std::unexpected(make_error(ErrorCode::ConfigurationError,
            "Unable to chdir to restricted dir", std::strerror(errno)));
    }
    return {};
}

} // namespace rrsync::infra
