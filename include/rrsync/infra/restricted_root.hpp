#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "rrsync/core/error.hpp"

namespace rrsync::infra {

/// The directory subtree an invocation is confined to. The literal root
/// `/` means no confinement.
class RestrictedRoot {
public:
    /// Canonicalizes `subdir` (which may be relative) and checks that it is
    /// an existing directory.
    static auto resolve(std::string_view subdir) -> Result<RestrictedRoot>;

    /// Wraps a path that is already absolute and canonical. No filesystem
    /// access; used when the caller has resolved the path itself.
    static auto from_canonical(std::filesystem::path path) -> RestrictedRoot;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto is_confined() const -> bool { return path_ != "/"; }

    /// Makes the root the current working directory.
    [[nodiscard]] auto enter() const -> VoidResult;

private:
    explicit RestrictedRoot(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

} // namespace rrsync::infra
