#include "StrippedText.hpp"

#include <gtest/gtest.h>

using namespace tagmend;

TEST(StrippedTextTest, UnchangedTextMapsToItself) {
    StrippedText s;
    s.append("hello");
    s.append(" world");
    EXPECT_EQ(s.str(), "hello world");
    for (unsigned i = 0; i <= s.size(); ++i)
        EXPECT_EQ(s.toOriginal(i), i);
}

TEST(StrippedTextTest, RemovedRegionShiftsFollowingOffsets) {
    // "ab<x>cd" with "<x>" removed.
    StrippedText s;
    s.append("ab");
    s.replace(3, "");
    s.append("cd");
    EXPECT_EQ(s.str(), "abcd");
    EXPECT_EQ(s.toOriginal(0), 0u);
    EXPECT_EQ(s.toOriginal(1), 1u);
    EXPECT_EQ(s.toOriginal(2), 5u); // Past the removed markup.
    EXPECT_EQ(s.toOriginal(3), 6u);
    EXPECT_EQ(s.toOriginal(4), 7u);
}

TEST(StrippedTextTest, ReplacementKeepsWordBreak) {
    // "a<br/>b" with the tag replaced by a newline.
    StrippedText s;
    s.append("a");
    s.replace(5, "\n");
    s.append("b");
    EXPECT_EQ(s.str(), "a\nb");
    EXPECT_EQ(s.toOriginal(1), 1u);
    EXPECT_EQ(s.toOriginal(2), 6u);
    EXPECT_EQ(s.toOriginal(3), 7u);
}

TEST(StrippedTextTest, AdjacentReplacementsAccumulate) {
    // "<a><b>x" with both tags removed.
    StrippedText s;
    s.replace(3, "");
    s.replace(3, "");
    s.append("x");
    EXPECT_EQ(s.str(), "x");
    EXPECT_EQ(s.toOriginal(0), 6u);
    EXPECT_EQ(s.toOriginal(1), 7u);
}

TEST(StrippedTextTest, SameLengthReplacementNeedsNoCorrection) {
    StrippedText s;
    s.append("a");
    s.replace(1, "b");
    s.append("c");
    EXPECT_EQ(s.str(), "abc");
    EXPECT_EQ(s.toOriginal(2), 2u);
}

TEST(StrippedTextTest, LongerReplacementShiftsBackwards) {
    // "&#233;" decodes to two UTF-8 bytes.
    StrippedText s;
    s.append("caf");
    s.replace(6, "\xC3\xA9");
    s.append("!");
    EXPECT_EQ(s.toOriginal(5), 9u);
    EXPECT_EQ(s.toOriginal(6), 10u);
}

TEST(StrippedTextTest, EndOffsetsStopBeforeRemovedMarkup) {
    // "ab<x>cd" with "<x>" removed.
    StrippedText s;
    s.append("ab");
    s.replace(3, "");
    s.append("cd");
    EXPECT_EQ(s.toOriginalEnd(1), 1u);
    EXPECT_EQ(s.toOriginalEnd(2), 2u); // Before "<x>".
    EXPECT_EQ(s.toOriginalEnd(3), 6u);
    EXPECT_EQ(s.toOriginalEnd(4), 7u);
}

TEST(StrippedTextTest, EndOffsetsIncludeReplacements) {
    // "a<br/>b": the newline stands for the tag, so an end after it maps past
    // the tag.
    StrippedText s;
    s.append("a");
    s.replace(5, "\n");
    s.append("b");
    EXPECT_EQ(s.toOriginalEnd(1), 1u);
    EXPECT_EQ(s.toOriginalEnd(2), 6u);
}

TEST(StrippedTextTest, EndOffsetAfterReferenceAndRemovedTag) {
    // "caf&#233;</b>!"
    StrippedText s;
    s.append("caf");
    s.replace(6, "\xC3\xA9");
    s.replace(4, "");
    s.append("!");
    EXPECT_EQ(s.toOriginalEnd(5), 9u); // After the reference, before "</b>".
    EXPECT_EQ(s.toOriginal(5), 13u);
    EXPECT_EQ(s.toOriginalEnd(6), 14u);
}

TEST(StrippedTextTest, EndOffsetAtStartAfterLeadingRemovals) {
    // "<a><b>x"
    StrippedText s;
    s.replace(3, "");
    s.replace(3, "");
    s.append("x");
    EXPECT_EQ(s.toOriginalEnd(0), 0u);
    EXPECT_EQ(s.toOriginalEnd(1), 7u);
}
