#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rrsync/core/config.hpp"
#include "rrsync/core/error.hpp"
#include "rrsync/core/types.hpp"
#include "rrsync/infra/glob_expander.hpp"
#include "rrsync/infra/restricted_root.hpp"

namespace rrsync::gateway {

/// Everything decided about one accepted request.
struct Invocation {
    SessionMode mode;
    ParsedCommand parsed;
    std::vector<std::string> final_argv;  // handed to the engine
};

/// `options` followed by every expanded positional argument, or a single
/// "." when nothing remains.
auto assemble_final_argv(const ParsedCommand& parsed, const infra::GlobExpander& expander)
    -> Result<std::vector<std::string>>;

/// Turns SSH_ORIGINAL_COMMAND into the argument vector for the engine, or
/// rejects it. Performs no filesystem changes; globbing is relative to the
/// current directory, which the caller has already set to the root.
class Gateway {
public:
    Gateway(const Config& config, infra::RestrictedRoot root, bool read_only);

    [[nodiscard]] auto authorize(std::optional<std::string_view> original_command) const
        -> Result<Invocation>;

    [[nodiscard]] auto root() const -> const infra::RestrictedRoot& { return root_; }

private:
    const Config& config_;
    infra::RestrictedRoot root_;
    bool read_only_;
};

} // namespace rrsync::gateway
