#include "PhraseMatcher.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace tagmend;

namespace {

class PhraseMatcherTest : public ::testing::Test {
protected:
    // "begin-end:name" for each match, in order.
    std::vector<std::string> describeMatches(std::string const& text) const
    {
        std::vector<std::string> r;
        for (PhraseMatch const& m : matcher.findMatches(text)) {
            r.push_back(std::to_string(m.begin) + '-' + std::to_string(m.end)
                + ':' + matcher.name(m.nameIdx));
        }
        return r;
    }

    PhraseMatcher matcher;
};

} // anonymous namespace

TEST(TokenizeTest, SplitsOnNonAlphanumerics) {
    auto tokens = tokenize("  Hello, w0rld!\xC3\xA9t\xC3\xA9 x");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].begin, 2u);
    EXPECT_EQ(tokens[0].end, 7u);
    EXPECT_EQ(tokens[1].begin, 9u);
    EXPECT_EQ(tokens[1].end, 14u);
    // Non-ASCII bytes belong to tokens.
    EXPECT_EQ(tokens[2].begin, 15u);
    EXPECT_EQ(tokens[2].end, 20u);
    EXPECT_EQ(tokens[3].begin, 21u);
}

TEST(TokenizeTest, EmptyAndSeparatorOnly) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize(" -\n\t.").empty());
}

TEST_F(PhraseMatcherTest, AddNameRejectsEmptyAndDuplicates) {
    EXPECT_TRUE(matcher.addName("John Smith"));
    EXPECT_FALSE(matcher.addName("john   SMITH"));
    EXPECT_FALSE(matcher.addName(""));
    EXPECT_FALSE(matcher.addName(" - "));
    EXPECT_TRUE(matcher.addName("John"));
    EXPECT_EQ(matcher.size(), 2u);
    EXPECT_EQ(matcher.name(0), "John Smith");
    EXPECT_EQ(matcher.name(1), "John");
}

TEST_F(PhraseMatcherTest, LoadDictionarySkipsCommentsAndBlankLines) {
    std::istringstream in(
        "# people\n"
        "  Ada Lovelace \n"
        "\n"
        "Alan Turing\r\n"
        "ada lovelace\n"
        "   \n"
        "Grace Hopper");
    EXPECT_EQ(matcher.loadDictionary(in), 3u);
    EXPECT_EQ(matcher.size(), 3u);
    EXPECT_EQ(matcher.name(0), "Ada Lovelace");
    EXPECT_EQ(matcher.name(1), "Alan Turing");
}

TEST_F(PhraseMatcherTest, MatchesCaseInsensitivelyAtTokenBoundaries) {
    matcher.addName("Ada");
    EXPECT_EQ(describeMatches("ADA, ada; Adam"),
        (std::vector<std::string>{"0-3:Ada", "5-8:Ada"}));
}

TEST_F(PhraseMatcherTest, SeparatorsBetweenWordsAreIgnored) {
    matcher.addName("New York");
    EXPECT_EQ(describeMatches("in New\nYork, new-york."),
        (std::vector<std::string>{"3-11:New York", "13-21:New York"}));
}

TEST_F(PhraseMatcherTest, OverlappingMatchesLongestFirst) {
    matcher.addName("John");
    matcher.addName("John Smith");
    matcher.addName("Smith");
    EXPECT_EQ(describeMatches("John Smith"),
        (std::vector<std::string>{
            "0-10:John Smith", "0-4:John", "5-10:Smith"}));
}

TEST_F(PhraseMatcherTest, PrefixWithoutFullNameDoesNotMatch) {
    matcher.addName("Alan Mathison Turing");
    EXPECT_TRUE(describeMatches("Alan Mathison").empty());
    EXPECT_TRUE(describeMatches("Alan Turing").empty());
}

TEST_F(PhraseMatcherTest, EmptyDictionaryFindsNothing) {
    EXPECT_TRUE(describeMatches("anything at all").empty());
}
