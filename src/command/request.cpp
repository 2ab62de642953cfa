#include "rrsync/command/request.hpp"

#include "rrsync/command/tokenizer.hpp"
#include "rrsync/core/logger.hpp"

namespace rrsync::command {

namespace {

// Matches `word` followed by at least one whitespace character and returns
// the length consumed including all of that whitespace.
auto match_word(std::string_view input, std::string_view word) -> std::size_t {
    if (!input.starts_with(word) || input.size() <= word.size() ||
        !is_command_space(input[word.size()])) {
        return 0;
    }
    auto pos = word.size();
    while (pos < input.size() && is_command_space(input[pos])) {
        ++pos;
    }
    return pos;
}

} // anonymous namespace

auto parse_request(std::optional<std::string_view> original_command, bool read_only)
    -> Result<Request> {
    if (!original_command) {
        return std::unexpected(make_error(ErrorCode::ProtocolPrecondition,
            "Not invoked via sshd"));
    }

    auto command = *original_command;
    auto skip = match_word(command, "rsync");
    if (skip == 0) {
        return std::unexpected(make_error(ErrorCode::ProtocolPrecondition,
            "SSH_ORIGINAL_COMMAND='" + std::string(command) + "' is not rsync"));
    }
    command.remove_prefix(skip);

    auto server = match_word(command, "--server");
    if (server == 0) {
        return std::unexpected(make_error(ErrorCode::ProtocolPrecondition,
            "--server option is not first"));
    }

    // Restrictive on purpose: only the exact prefix the stock client sends.
    bool is_sender = match_word(command.substr(server), "--sender") != 0;
    if (read_only && !is_sender) {
        return std::unexpected(make_error(ErrorCode::PolicyViolation,
            "sending to read-only server not allowed"));
    }

    LOG_DEBUG("Request accepted for parsing ({}, {})",
              is_sender ? "sender" : "receiver", read_only ? "read-only" : "read-write");
    return Request{std::string(command), SessionMode{read_only, is_sender}};
}

} // namespace rrsync::command
