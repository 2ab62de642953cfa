#include "rrsync/gateway/gateway.hpp"

#include "rrsync/command/request.hpp"
#include "rrsync/command/validator.hpp"
#include "rrsync/core/logger.hpp"
#include "rrsync/infra/path_sanitizer.hpp"
#include "rrsync/policy/option_policy.hpp"

#include <spdlog/fmt/ranges.h>

namespace rrsync::gateway {

auto assemble_final_argv(const ParsedCommand& parsed, const infra::GlobExpander& expander)
    -> Result<std::vector<std::string>> {
    std::vector<std::string> argv = parsed.options;
    auto option_count = argv.size();

    for (const auto& raw : parsed.raw_args) {
        auto expanded = expander.expand(raw);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        argv.insert(argv.end(),
                    std::make_move_iterator(expanded->begin()),
                    std::make_move_iterator(expanded->end()));
    }

    if (argv.size() == option_count) {
        argv.emplace_back(".");
    }
    return argv;
}

Gateway::Gateway(const Config& config, infra::RestrictedRoot root, bool read_only)
    : config_(config)
    , root_(std::move(root))
    , read_only_(read_only)
{
}

auto Gateway::authorize(std::optional<std::string_view> original_command) const
    -> Result<Invocation> {
    auto request = command::parse_request(original_command, read_only_);
    if (!request) {
        return std::unexpected(request.error());
    }

    policy::OptionPolicy policy(read_only_,
                                config_.options.disabled_short,
                                config_.options.disabled_long);
    infra::PathSanitizer sanitizer(root_, request->mode);
    command::CommandValidator validator(policy, sanitizer);

    auto parsed = validator.parse(request->command);
    if (!parsed) {
        LOG_DEBUG("Rejected ({}): {}", error_code_to_string(parsed.error().code()),
                  request->command);
        return std::unexpected(parsed.error());
    }

    infra::GlobExpander expander(sanitizer, config_.max_glob_matches);
    auto argv = assemble_final_argv(*parsed, expander);
    if (!argv) {
        return std::unexpected(argv.error());
    }

    LOG_DEBUG("Accepted: [{}]", fmt::join(*argv, " "));
    return Invocation{request->mode, std::move(*parsed), std::move(*argv)};
}

} // namespace rrsync::gateway
