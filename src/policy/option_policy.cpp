#include "rrsync/policy/option_policy.hpp"

#include "rrsync/core/logger.hpp"

namespace rrsync::policy {

namespace {

using enum LongOptionPolicy;

// Options rsync 3.x may send to the server side, and only in the form the
// stock client produces them.
auto builtin_long_options(bool read_only)
    -> std::unordered_map<std::string, LongOptionPolicy> {
    const auto removal = read_only ? Forbidden : NoArgCheck;
    return {
        {"append", NoArgCheck},
        {"backup-dir", ArgCheckedWhenReceiving},
        {"bwlimit", TrustedArg},
        {"checksum-seed", TrustedArg},
        {"compare-dest", ArgCheckedWhenReceiving},
        {"compress-level", TrustedArg},
        {"copy-dest", ArgCheckedWhenReceiving},
        {"copy-unsafe-links", NoArgCheck},
        {"daemon", Forbidden},
        {"delay-updates", NoArgCheck},
        {"delete", NoArgCheck},
        {"delete-after", NoArgCheck},
        {"delete-before", NoArgCheck},
        {"delete-delay", NoArgCheck},
        {"delete-during", NoArgCheck},
        {"delete-excluded", NoArgCheck},
        {"existing", NoArgCheck},
        {"fake-super", NoArgCheck},
        {"files-from", ArgCheckedAlways},
        {"force", NoArgCheck},
        {"from0", NoArgCheck},
        {"fuzzy", NoArgCheck},
        {"iconv", TrustedArg},
        {"ignore-errors", NoArgCheck},
        {"ignore-existing", NoArgCheck},
        {"inplace", NoArgCheck},
        {"link-dest", ArgCheckedWhenReceiving},
        {"list-only", NoArgCheck},
        {"log-file", ArgCheckedAlways},
        {"log-format", TrustedArg},
        {"max-delete", TrustedArg},
        {"max-size", TrustedArg},
        {"min-size", TrustedArg},
        {"modify-window", TrustedArg},
        {"no-i-r", NoArgCheck},
        {"no-implied-dirs", NoArgCheck},
        {"no-r", NoArgCheck},
        {"no-relative", NoArgCheck},
        {"no-specials", NoArgCheck},
        {"numeric-ids", NoArgCheck},
        {"only-write-batch", TrustedArg},
        {"partial", NoArgCheck},
        {"partial-dir", ArgCheckedWhenReceiving},
        {"remove-sent-files", removal},
        {"remove-source-files", removal},
        {"safe-links", NoArgCheck},
        {"sender", NoArgCheck},
        {"server", NoArgCheck},
        {"size-only", NoArgCheck},
        {"skip-compress", TrustedArg},
        {"specials", NoArgCheck},
        {"suffix", TrustedArg},
        {"super", NoArgCheck},
        {"temp-dir", ArgCheckedWhenReceiving},
        {"timeout", TrustedArg},
        {"use-qsort", NoArgCheck},
    };
}

} // anonymous namespace

OptionPolicy::OptionPolicy(bool read_only)
    : long_options_(builtin_long_options(read_only))
    , disabled_short_(kDefaultShortDisabled)
{
}

OptionPolicy::OptionPolicy(bool read_only,
                           std::string_view disabled_short,
                           const std::vector<std::string>& disabled_long)
    : long_options_(builtin_long_options(read_only))
    , disabled_short_(disabled_short)
{
    for (const auto& name : disabled_long) {
        auto it = long_options_.find(name);
        if (it == long_options_.end()) {
            LOG_DEBUG("Ignoring override for unknown option --{}", name);
            continue;
        }
        it->second = Forbidden;
    }
}

auto OptionPolicy::classify_long(std::string_view name) const
    -> std::optional<LongOptionPolicy> {
    auto it = long_options_.find(std::string(name));
    if (it == long_options_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto OptionPolicy::is_short_allowed_no_arg(char letter) const -> bool {
    return kShortNoArg.find(letter) != std::string_view::npos &&
           !is_short_disabled(letter);
}

auto OptionPolicy::is_short_allowed_with_number(char letter) const -> bool {
    return kShortWithNumber.find(letter) != std::string_view::npos &&
           !is_short_disabled(letter);
}

auto OptionPolicy::is_short_disabled(char letter) const -> bool {
    return disabled_short_.find(letter) != std::string::npos;
}

} // namespace rrsync::policy
