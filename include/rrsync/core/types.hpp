#pragma once

#include <string>
#include <vector>

namespace rrsync {

/// Direction and permissions of one invocation, fixed before any option
/// is looked at.
struct SessionMode {
    bool read_only = false;
    bool is_sender = false;  // the peer is pulling from this host
};

/// Output of the option validator: options to pass through (possibly with
/// a rewritten argument) and positional path patterns, not yet expanded.
struct ParsedCommand {
    std::vector<std::string> options;
    std::vector<std::string> raw_args;
};

} // namespace rrsync
