#include "rrsync/infra/audit_log.hpp"

#include "rrsync/core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace rrsync::infra {

auto AuditLog::open_existing(const std::filesystem::path& path) -> std::optional<AuditLog> {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        LOG_WARN("Cannot open audit log {}: {}", path.string(), std::strerror(errno));
        return std::nullopt;
    }
    return AuditLog(fd);
}

AuditLog::AuditLog(AuditLog&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
{
}

AuditLog& AuditLog::operator=(AuditLog&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

AuditLog::~AuditLog() {
    if (fd_ >= 0) ::close(fd_);
}

auto AuditLog::write(std::string_view line) -> VoidResult {
    auto written = ::write(fd_, line.data(), line.size());
    if (written < 0) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Audit log write failed", std::strerror(errno)));
    }
    if (static_cast<std::size_t>(written) != line.size()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Audit log write truncated"));
    }
    return {};
}

auto format_audit_line(const std::tm& local_time,
                       std::string_view host,
                       const std::vector<std::string>& final_argv) -> std::string {
    return fmt::format("{:02}:{:02} {:<13} [{}]\n",
                       local_time.tm_hour, local_time.tm_min, host,
                       fmt::join(final_argv, " "));
}

auto client_address(std::optional<std::string_view> ssh_connection) -> std::string {
    if (!ssh_connection || ssh_connection->empty()) {
        return "unknown";
    }
    auto address = ssh_connection->substr(0, ssh_connection->find(' '));
    if (address.starts_with("::ffff:")) {
        address.remove_prefix(7);
    }
    return std::string(address);
}

auto resolve_client_host(std::optional<std::string_view> ssh_connection) -> std::string {
    auto address = client_address(ssh_connection);

    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
        return address;
    }

    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(boost::asio::ip::tcp::endpoint(ip, 0), ec);
    if (ec || results.empty()) {
        LOG_DEBUG("Reverse lookup of {} failed: {}", address, ec.message());
        return address;
    }
    return results.begin()->host_name();
}

} // namespace rrsync::infra
