#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "rrsync/core/error.hpp"
#include "rrsync/core/types.hpp"

namespace rrsync::command {

/// A command that passed the protocol preconditions.
struct Request {
    std::string command;  // with the leading "rsync" word stripped
    SessionMode mode;
};

/// Checks the shape of SSH_ORIGINAL_COMMAND before any option is parsed:
/// it must be "rsync --server ...", and a read-only session may only send.
/// The direction is decided here, once, from the "--server --sender" prefix.
auto parse_request(std::optional<std::string_view> original_command, bool read_only)
    -> Result<Request>;

} // namespace rrsync::command
