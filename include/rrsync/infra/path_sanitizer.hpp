#pragma once

#include <string>
#include <string_view>

#include "rrsync/core/error.hpp"
#include "rrsync/core/types.hpp"
#include "rrsync/infra/restricted_root.hpp"
#include "rrsync/policy/option_policy.hpp"

namespace rrsync::infra {

/// Removes one level of backslash escaping. A trailing backslash with
/// nothing after it is kept. Values without backslashes are unchanged.
auto unescape(std::string_view value) -> std::string;

/// Collapses every run of '/' into a single separator.
auto collapse_separators(std::string_view path) -> std::string;

/// True if any '/'-separated segment of `path` is exactly "..".
auto has_parent_segment(std::string_view path) -> bool;

enum class PathContext {
    PositionalArgument,
    OptionArgument,
};

/// Normalizes path-bearing values against the restricted root.
///
/// Positional arguments come back as glob patterns: their single level of
/// escaping is removed later by the glob expander, but the traversal check
/// here always runs on the unescaped view. Option arguments are never
/// globbed and come back fully unescaped.
class PathSanitizer {
public:
    PathSanitizer(RestrictedRoot root, SessionMode mode);

    /// Generic entry point. `option` names the owning long option for
    /// diagnostics when `context` is OptionArgument.
    [[nodiscard]] auto sanitize(std::string_view value,
                                PathContext context,
                                policy::LongOptionPolicy policy,
                                std::string_view option = {}) const -> Result<std::string>;

    /// Sanitizes a positional (post-sentinel) path.
    [[nodiscard]] auto sanitize_argument(std::string_view value) const -> Result<std::string>;

    /// Unescapes the argument of `--option` and, when the policy says it
    /// resolves on this host, checks it and anchors absolute paths under
    /// the root.
    [[nodiscard]] auto sanitize_option_argument(std::string_view option,
                                                std::string_view value,
                                                policy::LongOptionPolicy policy) const
        -> Result<std::string>;

    /// Re-checks one literal path produced by glob expansion.
    [[nodiscard]] auto confine_expanded(std::string_view path) const -> Result<std::string>;

    /// Whether an argument under `policy` must be checked and anchored in
    /// this session.
    [[nodiscard]] auto requires_anchoring(policy::LongOptionPolicy policy) const -> bool;

    [[nodiscard]] auto root() const -> const RestrictedRoot& { return root_; }
    [[nodiscard]] auto mode() const -> const SessionMode& { return mode_; }

private:
    RestrictedRoot root_;
    SessionMode mode_;
};

} // namespace rrsync::infra
