/**
 * @file ICommandRunner.hpp
 * @brief Interface for running external tools (smartctl, df)
 */

#pragma once

#include "util/Result.hpp"

#include <expected>
#include <string>
#include <vector>

namespace diskinfo {

/**
 * @struct CommandOutput
 * @brief Captured result of a finished command
 */
struct CommandOutput {
    int exit_status = 0;
    std::string stdout_data;  ///< Raw bytes written to stdout
    std::string stderr_data;  ///< Raw bytes written to stderr
};

/**
 * @class ICommandRunner
 * @brief Runs a command synchronously and captures its output
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Run a command
     * @param argv Program and arguments; argv[0] is looked up in PATH if not absolute
     * @return Output of the finished command, or a COMMAND error if it could not run
     *         (code is ENOENT when the program does not exist, EACCES when not executable)
     */
    [[nodiscard]] virtual auto run(const std::vector<std::string>& argv)
        -> std::expected<CommandOutput, util::Error> = 0;
};

}  // namespace diskinfo
