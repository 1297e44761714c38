#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/types.hpp>
#include <core/log.hpp>
#include <filesystem>
#include <fstream>

TEST(Utils, JoinInts) {
    EXPECT_EQ(join_ints({}), "");
    EXPECT_EQ(join_ints({4}), "4");
    EXPECT_EQ(join_ints({0, 2, 3}), "0,2,3");
    EXPECT_EQ(join_ints({1, 2}, " "), "1 2");
}

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", -1), -1);
    EXPECT_EQ(safe_stoi("12abc", -1), -1);
    EXPECT_EQ(safe_stoi("", -1), -1);
}

TEST(Utils, Trim) {
    std::string s = "  Linux\r\n";
    trim(s);
    EXPECT_EQ(s, "Linux");
}

TEST(Utils, ErrorCodeNames) {
    EXPECT_STREQ(error_code_name(ErrorCode::NotFound), "not found");
    EXPECT_STREQ(error_code_name(ErrorCode::ConstructionFailed), "construction failed");
}

TEST(Log, WritesToOverriddenPath) {
    auto path = std::filesystem::temp_directory_path() / "shellpool_log_test.log";
    std::filesystem::remove(path);
    set_log_path(path.string());

    shellpool_log("hello from test");
    shellpool_log_ssh("[t]", "uname -s", SSHResult{0, "Linux", ""});

    std::ifstream in(path);
    std::string all((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(all.find("hello from test"), std::string::npos);
    EXPECT_NE(all.find("[t] CMD: uname -s"), std::string::npos);
    EXPECT_NE(all.find("exit=0"), std::string::npos);

    set_log_path("");
    std::filesystem::remove(path);
}
