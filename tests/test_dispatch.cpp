/**
 * @file test_dispatch.cpp
 * @brief Tests for the mark2 command relay
 */

#include <gtest/gtest.h>
#include "permforge/Dispatch.hpp"

#include <sstream>
#include <vector>

using namespace permforge;

TEST(Mark2CommandLine, WithServer) {
    EXPECT_EQ(mark2_command_line("pve23", "lp creategroup Admins"),
              "mark2 send -n pve23 lp creategroup Admins");
}

TEST(Mark2CommandLine, WithoutServer) {
    EXPECT_EQ(mark2_command_line("", "group Admins"), "mark2 send group Admins");
}

TEST(ShellQuote, PlainAndEmbeddedQuotes) {
    EXPECT_EQ(shell_quote("worldedit.*"), "'worldedit.*'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Mark2ShellCommand, GlobsAndSeparatorsStayInOneArgument) {
    EXPECT_EQ(mark2_shell_command("pve", "lp group Admins permission set worldedit.* true; rm x"),
              "mark2 send -n 'pve' 'lp group Admins permission set worldedit.* true; rm x'");
    EXPECT_EQ(mark2_shell_command("", "group Admins"), "mark2 send 'group Admins'");
}

TEST(Dispatcher, RunnerGetsQuotedCommand) {
    std::ostringstream out;
    std::ostringstream err;
    std::vector<std::string> ran;

    Dispatcher dispatcher("pve", true, out, err);
    dispatcher.set_runner([&](const std::string& line) {
        ran.push_back(line);
        return 0;
    });
    dispatcher.send("lp group Admins permission set worldedit.* true");

    EXPECT_EQ(out.str(), "mark2 send -n pve lp group Admins permission set worldedit.* true\n");
    ASSERT_EQ(ran.size(), 1u);
    EXPECT_EQ(ran[0], "mark2 send -n 'pve' 'lp group Admins permission set worldedit.* true'");
}

TEST(Dispatcher, PrintsWithoutRunning) {
    std::ostringstream out;
    std::ostringstream err;
    std::vector<std::string> ran;

    Dispatcher dispatcher("pve", false, out, err);
    dispatcher.set_runner([&](const std::string& line) {
        ran.push_back(line);
        return 0;
    });
    dispatcher.send("lp creategroup Admins");

    EXPECT_EQ(out.str(), "mark2 send -n pve lp creategroup Admins\n");
    EXPECT_TRUE(ran.empty());
    EXPECT_EQ(dispatcher.failures(), 0);
}

TEST(Dispatcher, FailureReportedAndLaterCommandsSent) {
    std::ostringstream out;
    std::ostringstream err;
    std::vector<std::string> ran;

    Dispatcher dispatcher("pve", true, out, err);
    dispatcher.set_runner([&](const std::string& line) {
        ran.push_back(line);
        return ran.size() == 1 ? 256 : 0;
    });
    dispatcher.send("first");
    dispatcher.send("second");

    ASSERT_EQ(ran.size(), 2u);
    EXPECT_EQ(ran[1], "mark2 send -n 'pve' 'second'");
    EXPECT_EQ(dispatcher.failures(), 1);
    EXPECT_EQ(err.str(), "ERROR: failed to send to mark2: 256\n");
}
