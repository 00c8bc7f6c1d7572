/**
 * @file SubprocessRunner.hpp
 * @brief GLib-based implementation of ICommandRunner
 */

#pragma once

#include "interfaces/ICommandRunner.hpp"

namespace diskinfo {

/**
 * @class SubprocessRunner
 * @brief Runs commands with g_spawn_sync in the C locale
 *
 * LC_ALL=C is forced in the child environment so tool output (smartctl,
 * df) is not localized.
 */
class SubprocessRunner : public ICommandRunner {
public:
    SubprocessRunner() = default;
    ~SubprocessRunner() override = default;

    SubprocessRunner(const SubprocessRunner&) = delete;
    SubprocessRunner& operator=(const SubprocessRunner&) = delete;
    SubprocessRunner(SubprocessRunner&&) = default;
    SubprocessRunner& operator=(SubprocessRunner&&) = default;

    [[nodiscard]] auto run(const std::vector<std::string>& argv)
        -> std::expected<CommandOutput, util::Error> override;
};

}  // namespace diskinfo
