/**
 * @file SubprocessRunner.cpp
 * @brief GLib-based implementation of ICommandRunner
 */

#include "services/SubprocessRunner.hpp"

#include "util/GLibPtr.hpp"
#include "util/Logger.hpp"

#include <glib.h>
#include <sys/wait.h>

#include <cerrno>
#include <format>

namespace diskinfo {

namespace {

auto spawn_error_code(const GError* error) -> int {
    if (error == nullptr || error->domain != G_SPAWN_ERROR) {
        return 0;
    }
    switch (error->code) {
        case G_SPAWN_ERROR_NOENT:
            return ENOENT;
        case G_SPAWN_ERROR_ACCES:
        case G_SPAWN_ERROR_PERM:
            return EACCES;
        default:
            return 0;
    }
}

auto join_command(const std::vector<std::string>& argv) -> std::string {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        text += arg;
    }
    return text;
}

}  // namespace

auto SubprocessRunner::run(const std::vector<std::string>& argv)
    -> std::expected<CommandOutput, util::Error> {
    if (argv.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::COMMAND, {}, {}, "empty command line"});
    }

    std::vector<gchar*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<gchar*>(arg.c_str()));
    }
    args.push_back(nullptr);

    util::GStrvPtr envp{g_environ_setenv(g_get_environ(), "LC_ALL", "C", TRUE)};

    gchar* raw_stdout = nullptr;
    gchar* raw_stderr = nullptr;
    gint wait_status = 0;
    GError* error = nullptr;

    LOG_DEBUG("SubprocessRunner", std::format("Running: {}", join_command(argv)));

    const gboolean spawned = g_spawn_sync(nullptr,     // working directory
                                          args.data(),  // arguments
                                          envp.get(),   // environment
                                          G_SPAWN_SEARCH_PATH,
                                          nullptr,      // child setup
                                          nullptr,      // user data
                                          &raw_stdout, &raw_stderr, &wait_status, &error);

    util::GCharPtr out{raw_stdout};
    util::GCharPtr err{raw_stderr};

    if (!spawned) {
        util::GErrorPtr owned{error};
        return std::unexpected(util::Error{util::ErrorKind::COMMAND, {}, argv.front(),
                                           owned ? owned->message : "failed to spawn",
                                           spawn_error_code(owned.get())});
    }

    CommandOutput output;
    output.stdout_data = out ? std::string{out.get()} : std::string{};
    output.stderr_data = err ? std::string{err.get()} : std::string{};

    if (WIFEXITED(wait_status)) {
        output.exit_status = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        return std::unexpected(util::make_error(util::ErrorKind::COMMAND, {}, argv.front(),
                                                "terminated by signal {}",
                                                WTERMSIG(wait_status)));
    }
    return output;
}

}  // namespace diskinfo
