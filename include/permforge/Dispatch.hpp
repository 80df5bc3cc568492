/**
 * @file Dispatch.hpp
 * @brief Relaying commands to a server console through mark2
 */

#ifndef PERMFORGE_DISPATCH_HPP
#define PERMFORGE_DISPATCH_HPP

#include <functional>
#include <ostream>
#include <string>

namespace permforge {

/**
 * @brief Build the mark2 invocation for one console command
 *
 * `mark2 send [-n <server>] <command>`; the -n option is omitted when no
 * server name is given.
 */
std::string mark2_command_line(const std::string& server, const std::string& command);

/// Wrap an argument in single quotes for /bin/sh; embedded quotes become '\''.
std::string shell_quote(const std::string& arg);

/**
 * @brief The mark2 invocation as passed to the shell
 *
 * Same as mark2_command_line() with the server name and the command quoted,
 * so the shell neither expands globs in permission nodes nor splits the
 * command at `;`.
 */
std::string mark2_shell_command(const std::string& server, const std::string& command);

/**
 * @brief Prints each command line and, when updating, runs it
 *
 * The printed line is the readable mark2_command_line(); the runner gets
 * mark2_shell_command().
 *
 * A failing command is reported on the error stream and counted; later
 * commands are still sent, in order.
 */
class Dispatcher {
public:
    /// Runs a shell command line and returns its exit status.
    using Runner = std::function<int(const std::string&)>;

    Dispatcher(std::string server, bool update, std::ostream& out, std::ostream& err);

    /// Replace the shell runner (std::system by default).
    void set_runner(Runner runner) { runner_ = std::move(runner); }

    void send(const std::string& command);

    int failures() const noexcept { return failures_; }

private:
    std::string server_;
    bool update_;
    std::ostream& out_;
    std::ostream& err_;
    Runner runner_;
    int failures_ = 0;
};

} // namespace permforge

#endif // PERMFORGE_DISPATCH_HPP
