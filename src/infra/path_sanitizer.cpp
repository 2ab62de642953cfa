#include "rrsync/infra/path_sanitizer.hpp"

#include "rrsync/core/logger.hpp"

namespace rrsync::infra {

namespace {

constexpr std::string_view kTraversalMessage = "Do not use .. in any path!";

// Drops escapes in front of '/' and '.', which mean nothing to glob(3) but
// would hide separators and dot segments from the checks below. Other
// escapes are kept for the glob expander.
auto drop_inert_escapes(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '\\' && i + 1 < value.size()) {
            char next = value[i + 1];
            if (next != '/' && next != '.') {
                out += '\\';
            }
            out += next;
            ++i;
            continue;
        }
        out += c;
    }
    return out;
}

// Positional paths are interpreted relative to the root we chdir'd into.
auto strip_leading_separator(std::string path) -> std::string {
    if (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    if (path.empty()) {
        path = ".";
    }
    return path;
}

} // anonymous namespace

auto unescape(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            ++i;
        }
        out += value[i];
    }
    return out;
}

auto collapse_separators(std::string_view path) -> std::string {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out += c;
    }
    return out;
}

auto has_parent_segment(std::string_view path) -> bool {
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (path.substr(start, end - start) == "..") {
            return true;
        }
        start = end + 1;
    }
    return false;
}

PathSanitizer::PathSanitizer(RestrictedRoot root, SessionMode mode)
    : root_(std::move(root))
    , mode_(mode)
{
}

auto PathSanitizer::sanitize(std::string_view value,
                             PathContext context,
                             policy::LongOptionPolicy policy,
                             std::string_view option) const -> Result<std::string> {
    if (context == PathContext::PositionalArgument) {
        return sanitize_argument(value);
    }
    return sanitize_option_argument(option, value, policy);
}

auto PathSanitizer::sanitize_argument(std::string_view value) const -> Result<std::string> {
    if (!root_.is_confined()) {
        return std::string(value);
    }

    auto pattern = collapse_separators(drop_inert_escapes(value));
    if (has_parent_segment(unescape(pattern))) {
        LOG_DEBUG("Rejected positional path '{}'", value);
        return std::unexpected(make_error(ErrorCode::TraversalAttempt,
            std::string(kTraversalMessage)));
    }
    return strip_leading_separator(std::move(pattern));
}

auto PathSanitizer::sanitize_option_argument(std::string_view option,
                                             std::string_view value,
                                             policy::LongOptionPolicy policy) const
    -> Result<std::string> {
    auto arg = unescape(value);
    if (!requires_anchoring(policy)) {
        return arg;
    }

    arg = collapse_separators(arg);
    if (has_parent_segment(arg)) {
        LOG_DEBUG("Rejected argument '{}' of --{}", value, option);
        return std::unexpected(make_error(ErrorCode::TraversalAttempt,
            "Do not use .. in --" + std::string(option) +
            "; anchor the path at the root of your restricted dir."));
    }
    if (!arg.empty() && arg.front() == '/') {
        arg = root_.path().string() + arg;
    }
    return arg;
}

auto PathSanitizer::confine_expanded(std::string_view path) const -> Result<std::string> {
    if (!root_.is_confined()) {
        return std::string(path);
    }

    auto collapsed = collapse_separators(path);
    if (has_parent_segment(collapsed)) {
        LOG_DEBUG("Expansion produced escaping path '{}'", path);
        return std::unexpected(make_error(ErrorCode::TraversalAttempt,
            std::string(kTraversalMessage)));
    }
    return strip_leading_separator(std::move(collapsed));
}

auto PathSanitizer::requires_anchoring(policy::LongOptionPolicy policy) const -> bool {
    if (!root_.is_confined()) {
        return false;
    }
    switch (policy) {
        case policy::LongOptionPolicy::ArgCheckedAlways:
            return true;
        case policy::LongOptionPolicy::ArgCheckedWhenReceiving:
            return !mode_.is_sender;
        default:
            return false;
    }
}

} // namespace rrsync::infra
