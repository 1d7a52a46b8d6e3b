#include <gtest/gtest.h>

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "glob_expander.h"
#include "pattern_matcher.h"

namespace fs = std::filesystem;

TEST(PatternMatcher, WildcardsAndClasses) {
    PatternMatcher matcher;
    EXPECT_TRUE(matcher.matches_pattern("main.cpp", "*.cpp"));
    EXPECT_FALSE(matcher.matches_pattern("main.h", "*.cpp"));
    EXPECT_TRUE(matcher.matches_pattern("a1", "a?"));
    EXPECT_FALSE(matcher.matches_pattern("a", "a?"));
    EXPECT_TRUE(matcher.matches_pattern("b", "[abc]"));
    EXPECT_TRUE(matcher.matches_pattern("x", "[!abc]"));
    EXPECT_TRUE(matcher.matches_pattern("x", "[^abc]"));
    EXPECT_TRUE(matcher.matches_pattern("m", "[a-z]"));
    EXPECT_TRUE(matcher.matches_pattern("7", "[[:digit:]]"));
    EXPECT_FALSE(matcher.matches_pattern("q", "[[:digit:]]"));
}

TEST(PatternMatcher, EscapesMatchLiterally) {
    PatternMatcher matcher;
    EXPECT_TRUE(matcher.matches_pattern("*", "\\*"));
    EXPECT_FALSE(matcher.matches_pattern("abc", "\\*"));
    EXPECT_TRUE(matcher.matches_pattern("a?b", PatternMatcher::escape("a?b")));
    EXPECT_FALSE(matcher.matches_pattern("axb", PatternMatcher::escape("a?b")));
}

TEST(PatternMatcher, AlternativesOnlyInFullMatch) {
    PatternMatcher matcher;
    EXPECT_TRUE(matcher.matches_pattern("stop", "start|stop"));
    EXPECT_FALSE(matcher.matches_single_pattern("stop", "start|stop"));
}

TEST(PatternMatcher, GlobCharacterDetection) {
    EXPECT_TRUE(PatternMatcher::has_glob_chars("*.txt"));
    EXPECT_TRUE(PatternMatcher::has_glob_chars("file[12]"));
    EXPECT_FALSE(PatternMatcher::has_glob_chars("plain.txt"));
    EXPECT_FALSE(PatternMatcher::has_glob_chars("\\*"));
    EXPECT_EQ(PatternMatcher::unescape("a\\*b"), "a*b");
}

namespace {

class GlobTest : public ::testing::Test {
   protected:
    std::string root;

    void SetUp() override {
        char templ[] = "/tmp/esh_glob_XXXXXX";
        ASSERT_NE(mkdtemp(templ), nullptr);
        root = templ;
        touch("a.txt");
        touch("b.txt");
        touch("c.log");
        touch(".hidden.txt");
        fs::create_directories(root + "/sub/deep");
        touch("sub/d.txt");
        touch("sub/deep/e.txt");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void touch(const std::string& relative) {
        std::ofstream(root + "/" + relative) << "x";
    }
};

}  // namespace

TEST_F(GlobTest, MatchesSortedAndSkipsHidden) {
    auto result = glob_expander::pathname_expand(root + "/*.txt", false);
    std::vector<std::string> expected = {root + "/a.txt", root + "/b.txt"};
    EXPECT_EQ(result, expected);
}

TEST_F(GlobTest, LeadingDotPatternMatchesHidden) {
    auto result = glob_expander::pathname_expand(root + "/.*.txt", false);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], root + "/.hidden.txt");
}

TEST_F(GlobTest, NoMatchReturnsPatternUnescaped) {
    auto result = glob_expander::pathname_expand(root + "/*.none", false);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], root + "/*.none");
    EXPECT_TRUE(glob_expander::match_paths(root + "/*.none", false).empty());
}

TEST_F(GlobTest, GlobstarDescendsDirectories) {
    auto result = glob_expander::pathname_expand(root + "/**/*.txt", true);
    std::vector<std::string> expected = {root + "/a.txt", root + "/b.txt",
                                         root + "/sub/d.txt", root + "/sub/deep/e.txt"};
    EXPECT_EQ(result, expected);
}

TEST_F(GlobTest, DoubleStarWithoutGlobstarIsSingleLevel) {
    auto result = glob_expander::pathname_expand(root + "/**/*.txt", false);
    std::vector<std::string> expected = {root + "/sub/d.txt"};
    EXPECT_EQ(result, expected);
}
