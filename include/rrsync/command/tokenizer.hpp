#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rrsync::command {

/// Whitespace as the remote shell would split on it.
inline auto is_command_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// Splits a command string into whitespace-delimited tokens.
///
/// A backslash escapes the character after it (anything but a newline), so
/// escaped whitespace stays inside the token. Escapes are kept verbatim;
/// consumers decide how to unescape. Tokens are never empty, and a trailing
/// backslash with nothing to escape is dropped.
///
/// The tokenizer only holds a view: `command` must outlive it.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view command) : command_(command) {}

    /// Returns the next token, or nullopt once the input is exhausted.
    auto next() -> std::optional<std::string_view>;

    /// Restarts from the beginning of the command.
    void reset() { pos_ = 0; }

private:
    std::string_view command_;
    std::size_t pos_ = 0;
};

/// Convenience: all tokens of `command`, in order.
auto tokenize(std::string_view command) -> std::vector<std::string>;

} // namespace rrsync::command
