#include <gtest/gtest.h>
#include "Core/CommandLine.h"
#include <vector>

using namespace od;

namespace {
std::optional<CommandLine> Parse(std::vector<const char*> args, std::string* err = nullptr) {
    args.insert(args.begin(), "overdrip");
    return ParseCommandLine(static_cast<int>(args.size()), args.data(), err);
}
}

TEST(CommandLine, Subcommands) {
    EXPECT_EQ(Parse({ "run" })->command, Command::Run);
    EXPECT_EQ(Parse({ "login" })->command, Command::Login);
    EXPECT_EQ(Parse({ "logout" })->command, Command::Logout);
    EXPECT_EQ(Parse({ "config", "show" })->command, Command::ConfigShow);
    EXPECT_EQ(Parse({ "config", "edit" })->command, Command::ConfigEdit);
    EXPECT_EQ(Parse({ "--help" })->command, Command::Help);
}

TEST(CommandLine, GlobalOptions) {
    auto cl = Parse({ "-v", "--config", "/etc/overdrip.json", "login" });
    ASSERT_TRUE(cl.has_value());
    EXPECT_TRUE(cl->verbose);
    ASSERT_TRUE(cl->config_path.has_value());
    EXPECT_EQ(*cl->config_path, std::filesystem::path("/etc/overdrip.json"));

    auto eq = Parse({ "login", "--config=other.json" });
    ASSERT_TRUE(eq.has_value());
    EXPECT_EQ(*eq->config_path, std::filesystem::path("other.json"));
}

TEST(CommandLine, Errors) {
    std::string err;
    EXPECT_FALSE(Parse({}, &err).has_value());
    EXPECT_FALSE(Parse({ "dance" }, &err).has_value());
    EXPECT_NE(err.find("dance"), std::string::npos);
    EXPECT_FALSE(Parse({ "config" }, &err).has_value());
    EXPECT_FALSE(Parse({ "config", "delete" }, &err).has_value());
    EXPECT_FALSE(Parse({ "login", "extra" }, &err).has_value());
    EXPECT_FALSE(Parse({ "--config" }, &err).has_value());
    EXPECT_FALSE(Parse({ "--frobnicate", "run" }, &err).has_value());
}
