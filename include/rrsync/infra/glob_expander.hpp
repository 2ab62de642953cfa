#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "rrsync/core/error.hpp"
#include "rrsync/infra/path_sanitizer.hpp"

namespace rrsync::infra {

/// Expands `a{b,c}d` style alternatives. Nested groups are expanded,
/// `{}` and groups without a closing brace stay literal, and escaped
/// braces and commas are never special. Escapes are preserved.
///
/// Fails with ExpansionLimit once more than `limit` alternatives exist.
auto expand_braces(std::string_view pattern, std::size_t limit)
    -> Result<std::vector<std::string>>;

/// Shell-style expansion of sanitized positional arguments.
///
/// Each brace alternative is sanitized like a positional argument and then
/// matched with glob(3), so globbing never leaves the root. An alternative
/// without matches is passed through literally with its quoting removed,
/// so no argument is ever dropped. Every resulting path is re-confined by
/// the sanitizer as well.
class GlobExpander {
public:
    GlobExpander(const PathSanitizer& sanitizer, std::size_t max_matches);

    [[nodiscard]] auto expand(std::string_view pattern) const
        -> Result<std::vector<std::string>>;

private:
    const PathSanitizer& sanitizer_;
    std::size_t max_matches_;
};

} // namespace rrsync::infra
