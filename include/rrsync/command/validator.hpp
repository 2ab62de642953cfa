#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "rrsync/core/error.hpp"
#include "rrsync/core/types.hpp"
#include "rrsync/infra/path_sanitizer.hpp"
#include "rrsync/policy/option_policy.hpp"

namespace rrsync::command {

/// Where the validator is within the command.
struct ParseState {
    enum class Phase {
        InOptions,
        InArguments,
        AwaitingOptionArgument,
    };

    Phase phase = Phase::InOptions;
    std::string pending_option;  // long name, set while awaiting its argument
    policy::LongOptionPolicy pending_policy = policy::LongOptionPolicy::NoArgCheck;
};

/// Walks an rsync server command once, left to right, and accepts only
/// shapes the option table positively allows. Everything else fails.
///
/// The validator holds no mutable state; each parse threads its own
/// ParseState, so one instance can check any number of commands.
class CommandValidator {
public:
    CommandValidator(const policy::OptionPolicy& policy,
                     const infra::PathSanitizer& sanitizer);

    /// Parses `command` (already stripped of the leading "rsync").
    /// Succeeds only if the "." sentinel was reached.
    [[nodiscard]] auto parse(std::string_view command) const -> Result<ParsedCommand>;

    /// Feeds one token to the state machine.
    [[nodiscard]] auto advance(ParseState& state, std::string_view token,
                               ParsedCommand& parsed) const -> VoidResult;

    /// `-` followed only by no-argument letters, optionally ending with the
    /// protocol suffix `e<digits>.<word chars>`.
    [[nodiscard]] auto is_short_no_arg_cluster(std::string_view token) const -> bool;

    /// `-` followed by one with-number letter and at least one digit.
    [[nodiscard]] auto is_short_with_number(std::string_view token) const -> bool;

    /// If `token` is a run of allowed letters ending in a disabled one,
    /// returns that letter.
    [[nodiscard]] auto disabled_short_letter(std::string_view token) const
        -> std::optional<char>;

private:
    [[nodiscard]] auto advance_option(ParseState& state, std::string_view token,
                                      ParsedCommand& parsed) const -> VoidResult;
    [[nodiscard]] auto advance_long_option(ParseState& state, std::string_view token,
                                           ParsedCommand& parsed) const -> VoidResult;

    const policy::OptionPolicy& policy_;
    const infra::PathSanitizer& sanitizer_;
};

} // namespace rrsync::command
