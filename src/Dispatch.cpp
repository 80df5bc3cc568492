/**
 * @file Dispatch.cpp
 * @brief mark2 command relay
 */

#include "permforge/Dispatch.hpp"

#include <cstdlib>
#include <utility>

namespace permforge {

std::string mark2_command_line(const std::string& server, const std::string& command) {
    std::string line = "mark2 send ";
    if (!server.empty()) {
        line += "-n " + server + " ";
    }
    return line + command;
}

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

std::string mark2_shell_command(const std::string& server, const std::string& command) {
    std::string line = "mark2 send ";
    if (!server.empty()) {
        line += "-n " + shell_quote(server) + " ";
    }
    return line + shell_quote(command);
}

Dispatcher::Dispatcher(std::string server, bool update, std::ostream& out, std::ostream& err)
    : server_(std::move(server))
    , update_(update)
    , out_(out)
    , err_(err)
    , runner_([](const std::string& line) { return std::system(line.c_str()); })
{}

void Dispatcher::send(const std::string& command) {
    out_ << mark2_command_line(server_, command) << "\n";
    if (!update_) return;

    out_.flush();
    const int status = runner_(mark2_shell_command(server_, command));
    if (status != 0) {
        ++failures_;
        err_ << "ERROR: failed to send to mark2: " << status << "\n";
    }
}

} // namespace permforge
