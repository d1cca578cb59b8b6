#include <gtest/gtest.h>

#include <string>

#include "core/text.hpp"

using pocket::core::text::truncate_utf8;

TEST(Text, ShortTextIsUnchanged) {
    EXPECT_EQ(truncate_utf8("abc", 5), "abc");
    EXPECT_EQ(truncate_utf8("caf\xC3\xA9", 5), "caf\xC3\xA9");
    EXPECT_EQ(truncate_utf8("", 0), "");
}

TEST(Text, CutsAsciiAtLimit) {
    EXPECT_EQ(truncate_utf8("abcdefgh", 3), "abc");
    EXPECT_EQ(truncate_utf8("abc", 0), "");
}

TEST(Text, NeverSplitsMultiByteCharacter) {
    // "é" is two bytes
    EXPECT_EQ(truncate_utf8("caf\xC3\xA9!", 4), "caf");
    EXPECT_EQ(truncate_utf8("caf\xC3\xA9!", 5), "caf\xC3\xA9");

    // "€" is three bytes
    const std::string euro = "a\xE2\x82\xAC" "b";
    EXPECT_EQ(truncate_utf8(euro, 2), "a");
    EXPECT_EQ(truncate_utf8(euro, 3), "a");
    EXPECT_EQ(truncate_utf8(euro, 4), "a\xE2\x82\xAC");

    // Four-byte emoji at the very start
    EXPECT_EQ(truncate_utf8("\xF0\x9F\x98\x80x", 3), "");
}
