#include "rrsync/command/tokenizer.hpp"

namespace rrsync::command {

auto Tokenizer::next() -> std::optional<std::string_view> {
    while (pos_ < command_.size()) {
        // Skip separators, and stray backslashes that escape nothing.
        while (pos_ < command_.size()) {
            char c = command_[pos_];
            if (is_command_space(c)) {
                ++pos_;
            } else if (c == '\\' &&
                       (pos_ + 1 >= command_.size() || command_[pos_ + 1] == '\n')) {
                ++pos_;
            } else {
                break;
            }
        }

        auto start = pos_;
        while (pos_ < command_.size()) {
            char c = command_[pos_];
            if (is_command_space(c)) {
                break;
            }
            if (c == '\\') {
                if (pos_ + 1 >= command_.size() || command_[pos_ + 1] == '\n') {
                    break;
                }
                pos_ += 2;
                continue;
            }
            ++pos_;
        }

        if (pos_ > start) {
            return command_.substr(start, pos_ - start);
        }
    }
    return std::nullopt;
}

auto tokenize(std::string_view command) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    Tokenizer tokenizer(command);
    while (auto token = tokenizer.next()) {
        tokens.emplace_back(*token);
    }
    return tokens;
}

} // namespace rrsync::command
