#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rrsync/core/error.hpp"

namespace rrsync::infra {

/// Append-only per-account transfer log.
///
/// Logging is opt-in: the file is only used if it already exists. Each
/// invocation appends exactly one line with a single write(2), so lines
/// from concurrent connections never interleave.
class AuditLog {
public:
    /// Opens `path` for appending if it exists and is a regular file.
    static auto open_existing(const std::filesystem::path& path) -> std::optional<AuditLog>;

    AuditLog(AuditLog&& other) noexcept;
    AuditLog& operator=(AuditLog&& other) noexcept;
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    [[nodiscard]] auto write(std::string_view line) -> VoidResult;

private:
    explicit AuditLog(int fd) : fd_(fd) {}

    int fd_ = -1;
};

/// `HH:MM host [argv...]` followed by a newline; the host is padded to 13
/// columns.
auto format_audit_line(const std::tm& local_time,
                       std::string_view host,
                       const std::vector<std::string>& final_argv) -> std::string;

/// The client address from an SSH_CONNECTION value ("addr port port"),
/// without an IPv4-mapped "::ffff:" prefix; "unknown" if absent.
auto client_address(std::optional<std::string_view> ssh_connection) -> std::string;

/// Reverse-resolves the client address to a host name, falling back to the
/// address itself.
auto resolve_client_host(std::optional<std::string_view> ssh_connection) -> std::string;

} // namespace rrsync::infra
