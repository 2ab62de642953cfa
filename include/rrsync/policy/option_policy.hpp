#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rrsync::policy {

/// How a long option and its argument are treated.
enum class LongOptionPolicy {
    Forbidden,                // recognized, but turned off on this server
    NoArgCheck,               // takes no argument
    TrustedArg,               // argument passed through, never path-checked
    ArgCheckedWhenReceiving,  // argument is a path only when we receive
    ArgCheckedAlways,         // argument is always a local path
};

/// Whitelist of the options rsync may send to a server.
///
/// The table is fixed; the only knobs narrow it (disable short letters,
/// forbid long options). Instances are immutable once built.
class OptionPolicy {
public:
    /// Built-in table. `read_only` forbids the options that remove files
    /// on this side.
    explicit OptionPolicy(bool read_only);

    /// Built-in table narrowed by administrator overrides. Unknown long
    /// names in `disabled_long` are ignored: they are rejected anyway.
    OptionPolicy(bool read_only,
                 std::string_view disabled_short,
                 const std::vector<std::string>& disabled_long);

    [[nodiscard]] auto classify_long(std::string_view name) const
        -> std::optional<LongOptionPolicy>;

    [[nodiscard]] auto is_short_allowed_no_arg(char letter) const -> bool;
    [[nodiscard]] auto is_short_allowed_with_number(char letter) const -> bool;
    [[nodiscard]] auto is_short_disabled(char letter) const -> bool;

    [[nodiscard]] auto disabled_short() const -> const std::string& { return disabled_short_; }

    /// Short letters rsync sends without an argument. Do not remove any.
    static constexpr std::string_view kShortNoArg = "ACDEHIKLORSWXbcdgklmnoprstuvxz";
    /// Short letters rsync sends with a numeric suffix. Do not remove any.
    static constexpr std::string_view kShortWithNumber = "B";
    /// Disabled by default.
    static constexpr std::string_view kDefaultShortDisabled = "s";

private:
    std::unordered_map<std::string, LongOptionPolicy> long_options_;
    std::string disabled_short_;
};

} // namespace rrsync::policy
