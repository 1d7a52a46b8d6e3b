#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "esh.h"
#include "flags.h"
#include "shell_options.h"

namespace {

class FlagsTest : public ::testing::Test {
   protected:
    ShellOptions options;

    void SetUp() override {
        config::execute_command = false;
        config::cmd_to_execute.clear();
        config::show_help = false;
        config::show_version = false;
    }

    flags::ParseResult parse(std::vector<std::string> args) {
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        argv_.push_back(nullptr);
        return flags::parse_arguments(static_cast<int>(storage_.size()), argv_.data(), options);
    }

   private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

}  // namespace

TEST_F(FlagsTest, ScriptAndArguments) {
    auto result = parse({"esh", "build.sh", "one", "-x"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.script_file, "build.sh");
    EXPECT_EQ(result.script_args, (std::vector<std::string>{"one", "-x"}));
    EXPECT_FALSE(options.xtrace);
}

TEST_F(FlagsTest, CommandString) {
    auto result = parse({"esh", "-c", "echo hi", "name", "arg"});
    EXPECT_TRUE(config::execute_command);
    EXPECT_EQ(config::cmd_to_execute, "echo hi");
    EXPECT_EQ(result.script_file, "name");
    EXPECT_EQ(result.script_args, std::vector<std::string>{"arg"});
}

TEST_F(FlagsTest, ShellOptionLetters) {
    parse({"esh", "-eu", "-x", "-v"});
    EXPECT_TRUE(options.errexit);
    EXPECT_TRUE(options.nounset);
    EXPECT_TRUE(options.xtrace);
    EXPECT_TRUE(options.verbose);
}

TEST_F(FlagsTest, LongOptionNames) {
    auto result = parse({"esh", "-o", "globstar", "script"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_TRUE(options.globstar);

    auto bad = parse({"esh", "-o", "nonsense"});
    EXPECT_TRUE(bad.should_exit);
    EXPECT_EQ(bad.exit_code, 2);
}

TEST_F(FlagsTest, HelpAndVersion) {
    parse({"esh", "--help"});
    EXPECT_TRUE(config::show_help);
    parse({"esh", "--version"});
    EXPECT_TRUE(config::show_version);
    EXPECT_FALSE(get_version().empty());
}

TEST_F(FlagsTest, UnknownOptionAndMissingArgument) {
    auto unknown = parse({"esh", "-q"});
    EXPECT_TRUE(unknown.should_exit);
    EXPECT_EQ(unknown.exit_code, 2);

    auto missing = parse({"esh", "-c"});
    EXPECT_TRUE(missing.should_exit);
    EXPECT_EQ(missing.exit_code, 2);
}
