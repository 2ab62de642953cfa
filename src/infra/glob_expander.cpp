#include "rrsync/infra/glob_expander.hpp"

#include "rrsync/core/logger.hpp"

#include <glob.h>

namespace rrsync::infra {

namespace {

struct BraceGroup {
    std::size_t open;
    std::size_t close;
    std::vector<std::string_view> alternatives;
};

// Finds the first unescaped '{' with a matching '}' and splits its body on
// top-level commas. Returns false if there is no such group.
auto find_brace_group(std::string_view pattern, BraceGroup& group) -> bool {
    for (std::size_t open = 0; open < pattern.size(); ++open) {
        if (pattern[open] == '\\') {
            ++open;
            continue;
        }
        if (pattern[open] != '{') {
            continue;
        }
        // "{}" is literal, as in the shell.
        if (open + 1 < pattern.size() && pattern[open + 1] == '}') {
            ++open;
            continue;
        }

        int depth = 0;
        std::size_t item_start = open + 1;
        group.alternatives.clear();
        for (std::size_t i = open + 1; i < pattern.size(); ++i) {
            char c = pattern[i];
            if (c == '\\') {
                ++i;
            } else if (c == '{') {
                ++depth;
            } else if (c == '}' && depth > 0) {
                --depth;
            } else if (c == ',' && depth == 0) {
                group.alternatives.push_back(pattern.substr(item_start, i - item_start));
                item_start = i + 1;
            } else if (c == '}') {
                group.alternatives.push_back(pattern.substr(item_start, i - item_start));
                group.open = open;
                group.close = i;
                return true;
            }
        }
        // Unbalanced: nothing after this point can close a group either.
        return false;
    }
    return false;
}

auto expand_braces_into(std::string_view pattern, std::size_t limit,
                        std::vector<std::string>& out) -> VoidResult {
    BraceGroup group;
    if (!find_brace_group(pattern, group)) {
        if (out.size() >= limit) {
            return std::unexpected(make_error(ErrorCode::ExpansionLimit,
                "Too many paths in brace expansion"));
        }
        out.emplace_back(pattern);
        return {};
    }

    auto prefix = pattern.substr(0, group.open);
    auto suffix = pattern.substr(group.close + 1);
    for (auto alternative : group.alternatives) {
        std::string candidate;
        candidate.reserve(prefix.size() + alternative.size() + suffix.size());
        candidate.append(prefix).append(alternative).append(suffix);
        auto result = expand_braces_into(candidate, limit, out);
        if (!result) {
            return result;
        }
    }
    return {};
}

} // anonymous namespace

auto expand_braces(std::string_view pattern, std::size_t limit)
    -> Result<std::vector<std::string>> {
    std::vector<std::string> out;
    auto result = expand_braces_into(pattern, limit, out);
    if (!result) {
        return std::unexpected(result.error());
    }
    return out;
}

GlobExpander::GlobExpander(const PathSanitizer& sanitizer, std::size_t max_matches)
    : sanitizer_(sanitizer)
    , max_matches_(max_matches)
{
}

auto GlobExpander::expand(std::string_view pattern) const
    -> Result<std::vector<std::string>> {
    auto alternatives = expand_braces(pattern, max_matches_);
    if (!alternatives) {
        return std::unexpected(alternatives.error());
    }

    std::vector<std::string> paths;
    auto append = [&](std::string_view path) -> VoidResult {
        if (paths.size() >= max_matches_) {
            return std::unexpected(make_error(ErrorCode::ExpansionLimit,
                "Too many paths match", std::string(pattern)));
        }
        auto confined = sanitizer_.confine_expanded(path);
        if (!confined) {
            return std::unexpected(confined.error());
        }
        paths.push_back(std::move(*confined));
        return {};
    };

    for (const auto& candidate : *alternatives) {
        // An alternative can form a ".." segment or an absolute path the
        // whole pattern did not have; check it before touching the disk.
        auto alternative = sanitizer_.sanitize_argument(candidate);
        if (!alternative) {
            return std::unexpected(alternative.error());
        }

        glob_t matches{};
        int rc = ::glob(alternative->c_str(), 0, nullptr, &matches);

        VoidResult appended;
        if (rc == 0) {
            for (std::size_t i = 0; i < matches.gl_pathc && appended; ++i) {
                std::string_view match = matches.gl_pathv[i];
                // A wildcard such as ".*" also matches the parent entry.
                if (sanitizer_.root().is_confined() &&
                    (match == ".." || match.ends_with("/.."))) {
                    continue;
                }
                appended = append(match);
            }
        } else if (rc == GLOB_NOMATCH) {
            appended = append(unescape(*alternative));
        } else {
            appended = std::unexpected(make_error(ErrorCode::IoError,
                "Glob expansion failed", *alternative));
        }
        ::globfree(&matches);

        if (!appended) {
            return std::unexpected(appended.error());
        }
    }

    LOG_TRACE("Expanded '{}' into {} path(s)", pattern, paths.size());
    return paths;
}

} // namespace rrsync::infra
