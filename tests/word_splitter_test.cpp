#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "word_splitter.h"

using word_splitter::word_split;

TEST(WordSplit, DefaultIfsCollapsesWhitespace) {
    std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(word_split("  a \t b\n\nc  ", std::nullopt), expected);
}

TEST(WordSplit, EmptyIfsDisablesSplitting) {
    std::vector<std::string> expected = {"a b c"};
    EXPECT_EQ(word_split("a b c", std::string()), expected);
}

TEST(WordSplit, NonWhitespaceSeparatorsKeepEmptyFields) {
    std::vector<std::string> expected = {"a", "", "b"};
    EXPECT_EQ(word_split("a::b", std::string(":")), expected);
}

TEST(WordSplit, TrailingNonWhitespaceSeparatorEndsField) {
    std::vector<std::string> expected = {"a", "b"};
    EXPECT_EQ(word_split("a:b:", std::string(":")), expected);
}

TEST(WordSplit, MixedWhitespaceAndDelimiter) {
    std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(word_split("a , b ,c", std::string(" ,")), expected);
}

TEST(WordSplit, EmptyTextYieldsNoFields) {
    EXPECT_TRUE(word_split("", std::nullopt).empty());
    EXPECT_TRUE(word_split("   ", std::nullopt).empty());
}

TEST(WordSplit, IfsWhitespaceClassification) {
    EXPECT_TRUE(word_splitter::is_ifs_whitespace(' '));
    EXPECT_TRUE(word_splitter::is_ifs_whitespace('\t'));
    EXPECT_TRUE(word_splitter::is_ifs_whitespace('\n'));
    EXPECT_FALSE(word_splitter::is_ifs_whitespace(':'));
}
