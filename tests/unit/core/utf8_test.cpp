#include <gtest/gtest.h>
#include <memex/core/utf8.h>

#include <string>

using namespace memex;

namespace {

const std::string kReplacement = "\xEF\xBF\xBD";

} // namespace

TEST(Utf8Test, PrefixNeverEndsMidCharacter) {
    const std::string text = "ab\xC3\xA9\xE2\x82\xAC";
    EXPECT_EQ(utf8::prefix(text, 100), text);
    EXPECT_EQ(utf8::prefix(text, 3), "ab");
    EXPECT_EQ(utf8::prefix(text, 4), "ab\xC3\xA9");
    EXPECT_EQ(utf8::prefix(text, 6), "ab\xC3\xA9");
    EXPECT_EQ(utf8::prefix(text, 0), "");
}

TEST(Utf8Test, BoundariesSnapToLeadBytes) {
    const std::string text = "a\xE2\x82\xAC" "b";
    EXPECT_EQ(utf8::boundaryAtOrBefore(text, 2), 1u);
    EXPECT_EQ(utf8::boundaryAtOrBefore(text, 3, 2), 2u);
    EXPECT_EQ(utf8::boundaryAtOrBefore(text, 99), text.size());
    EXPECT_EQ(utf8::boundaryAtOrAfter(text, 2), 4u);
    EXPECT_EQ(utf8::boundaryAtOrAfter(text, 4), 4u);
}

TEST(Utf8Test, SanitizeKeepsValidText) {
    const std::string text = "plain \xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_EQ(utf8::sanitize(text), text);
    EXPECT_TRUE(utf8::isValid(text));
}

TEST(Utf8Test, SanitizeReplacesMalformedSequences) {
    EXPECT_EQ(utf8::sanitize("caf\xE9"), "caf" + kReplacement);
    EXPECT_EQ(utf8::sanitize("x\x80y"), "x" + kReplacement + "y");
    // Truncated three-byte sequence counts once
    EXPECT_EQ(utf8::sanitize("\xE2\x82"), kReplacement);
    // Overlong encoding of '/'
    EXPECT_EQ(utf8::sanitize("\xC0\xAF"), kReplacement + kReplacement);
    // UTF-16 surrogate
    EXPECT_EQ(utf8::sanitize("\xED\xA0\x80"), kReplacement + kReplacement + kReplacement);
    // Above U+10FFFF
    EXPECT_FALSE(utf8::isValid("\xF4\x90\x80\x80"));
    EXPECT_TRUE(utf8::isValid(utf8::sanitize("\xF4\x90\x80\x80")));
}
