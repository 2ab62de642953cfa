#pragma once

#include <string>
#include <vector>

#include "rrsync/core/config.hpp"
#include "rrsync/core/error.hpp"

namespace rrsync::infra {

/// Replaces the current process with the privileged helper running the
/// sync engine. There is no fork: the helper inherits our pid, our stdio
/// and the ssh channel.
class Dispatcher {
public:
    explicit Dispatcher(const Config& config);

    /// `helper -u user engine final_argv...`, or `engine final_argv...` when
    /// no helper is configured. Element 0 is also the program to exec.
    [[nodiscard]] auto build_exec_argv(const std::vector<std::string>& final_argv) const
        -> std::vector<std::string>;

    /// Does not return on success. The returned error is always
    /// DispatchFailure.
    [[nodiscard]] auto exec(const std::vector<std::string>& final_argv) const -> Error;

private:
    const Config& config_;
};

} // namespace rrsync::infra
