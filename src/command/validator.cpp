#include "rrsync/command/validator.hpp"

#include "rrsync/command/tokenizer.hpp"
#include "rrsync/core/logger.hpp"

namespace rrsync::command {

namespace {

using policy::LongOptionPolicy;
using Phase = ParseState::Phase;

constexpr std::string_view kSyntaxMessage = "invalid rsync-command syntax or options";

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_word_char(char c) -> bool {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto syntax_error() -> Error {
    return make_error(ErrorCode::MalformedSyntax, std::string(kSyntaxMessage));
}

auto disabled_error(std::string_view option) -> Error {
    return make_error(ErrorCode::DisabledOption,
        "option " + std::string(option) + " has been disabled on this server.");
}

} // anonymous namespace

CommandValidator::CommandValidator(const policy::OptionPolicy& policy,
                                   const infra::PathSanitizer& sanitizer)
    : policy_(policy)
    , sanitizer_(sanitizer)
{
}

auto CommandValidator::parse(std::string_view command) const -> Result<ParsedCommand> {
    ParsedCommand parsed;
    ParseState state;

    Tokenizer tokenizer(command);
    while (auto token = tokenizer.next()) {
        auto result = advance(state, *token, parsed);
        if (!result) {
            return std::unexpected(result.error());
        }
    }

    if (state.phase != Phase::InArguments) {
        return std::unexpected(syntax_error());
    }
    return parsed;
}

auto CommandValidator::advance(ParseState& state, std::string_view token,
                               ParsedCommand& parsed) const -> VoidResult {
    switch (state.phase) {
        case Phase::AwaitingOptionArgument: {
            auto arg = sanitizer_.sanitize(token, infra::PathContext::OptionArgument,
                                           state.pending_policy, state.pending_option);
            if (!arg) {
                return std::unexpected(arg.error());
            }
            parsed.options.push_back(std::move(*arg));
            state.phase = Phase::InOptions;
            state.pending_option.clear();
            return {};
        }

        case Phase::InOptions:
            return advance_option(state, token, parsed);

        case Phase::InArguments: {
            auto path = sanitizer_.sanitize(token, infra::PathContext::PositionalArgument,
                                            LongOptionPolicy::ArgCheckedAlways);
            if (!path) {
                return std::unexpected(path.error());
            }
            parsed.raw_args.push_back(std::move(*path));
            return {};
        }
    }
    return std::unexpected(syntax_error());
}

auto CommandValidator::advance_option(ParseState& state, std::string_view token,
                                      ParsedCommand& parsed) const -> VoidResult {
    if (token == ".") {
        parsed.options.emplace_back(token);
        state.phase = Phase::InArguments;
        return {};
    }

    if (token == "-") {
        return std::unexpected(make_error(ErrorCode::MalformedSyntax,
            "invalid option: '-'"));
    }

    if (is_short_no_arg_cluster(token) || is_short_with_number(token)) {
        parsed.options.emplace_back(token);
        return {};
    }

    if (token.starts_with("--")) {
        auto name_end = token.find('=', 2);
        // "--" and "--=..." name nothing.
        if (name_end != 2 && token.size() > 2) {
            return advance_long_option(state, token, parsed);
        }
    }

    if (auto letter = disabled_short_letter(token)) {
        return std::unexpected(disabled_error(std::string("-") + *letter));
    }

    LOG_DEBUG("Unrecognized option token '{}'", token);
    return std::unexpected(syntax_error());
}

auto CommandValidator::advance_long_option(ParseState& state, std::string_view token,
                                           ParsedCommand& parsed) const -> VoidResult {
    auto body = token.substr(2);
    auto eq = body.find('=');
    auto name = body.substr(0, eq);

    auto policy = policy_.classify_long(name);
    if (!policy) {
        LOG_DEBUG("Unknown long option --{}", name);
        return std::unexpected(make_error(ErrorCode::UnknownOption,
            std::string(kSyntaxMessage)));
    }

    switch (*policy) {
        case LongOptionPolicy::Forbidden:
            return std::unexpected(disabled_error("--" + std::string(name)));

        case LongOptionPolicy::NoArgCheck:
            parsed.options.emplace_back(token);
            return {};

        case LongOptionPolicy::TrustedArg:
        case LongOptionPolicy::ArgCheckedWhenReceiving:
        case LongOptionPolicy::ArgCheckedAlways:
            break;
    }

    if (eq == std::string_view::npos) {
        // The argument is the next token.
        parsed.options.emplace_back(token);
        state.phase = Phase::AwaitingOptionArgument;
        state.pending_option = std::string(name);
        state.pending_policy = *policy;
        return {};
    }

    auto arg = sanitizer_.sanitize(body.substr(eq + 1), infra::PathContext::OptionArgument,
                                   *policy, name);
    if (!arg) {
        return std::unexpected(arg.error());
    }
    parsed.options.push_back("--" + std::string(name) + "=" + *arg);
    return {};
}

auto CommandValidator::is_short_no_arg_cluster(std::string_view token) const -> bool {
    if (token.size() < 2 || token.front() != '-') {
        return false;
    }

    std::size_t i = 1;
    while (i < token.size() && policy_.is_short_allowed_no_arg(token[i])) {
        ++i;
    }
    if (i == token.size()) {
        return true;
    }

    // Protocol suffix: e<digits>*.<word>*
    if (token[i] != 'e' || policy_.is_short_disabled('e')) {
        return false;
    }
    ++i;
    while (i < token.size() && is_digit(token[i])) {
        ++i;
    }
    if (i == token.size() || token[i] != '.') {
        return false;
    }
    ++i;
    while (i < token.size() && is_word_char(token[i])) {
        ++i;
    }
    return i == token.size();
}

auto CommandValidator::is_short_with_number(std::string_view token) const -> bool {
    if (token.size() < 3 || token[0] != '-' ||
        !policy_.is_short_allowed_with_number(token[1])) {
        return false;
    }
    for (std::size_t i = 2; i < token.size(); ++i) {
        if (!is_digit(token[i])) {
            return false;
        }
    }
    return true;
}

auto CommandValidator::disabled_short_letter(std::string_view token) const
    -> std::optional<char> {
    if (token.size() < 2 || token.front() != '-') {
        return std::nullopt;
    }
    std::size_t i = 1;
    while (i < token.size() && policy_.is_short_allowed_no_arg(token[i])) {
        ++i;
    }
    if (i < token.size() && policy_.is_short_disabled(token[i])) {
        return token[i];
    }
    return std::nullopt;
}

} // namespace rrsync::command
