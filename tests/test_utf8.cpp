#include "safewhisper/utf8.hpp"

#include <gtest/gtest.h>

#include <string>

using safewhisper::isValidUtf8;

TEST(Utf8, AcceptsWellFormedText) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("ask not what your country can do for you"));
    EXPECT_TRUE(isValidUtf8("h\xC3\xA9llo"));                // é
    EXPECT_TRUE(isValidUtf8("\xE6\x97\xA5\xE6\x9C\xAC"));    // 日本
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x8E\xA4"));            // U+1F3A4
    EXPECT_TRUE(isValidUtf8("\xF4\x8F\xBF\xBF"));            // U+10FFFF
}

TEST(Utf8, RejectsMalformedSequences) {
    EXPECT_FALSE(isValidUtf8("\x80"));                       // lone continuation
    EXPECT_FALSE(isValidUtf8("\xC0\x80"));                   // overlong NUL
    EXPECT_FALSE(isValidUtf8("\xE0\x80\xAF"));               // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));               // surrogate
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));           // past U+10FFFF
    EXPECT_FALSE(isValidUtf8("\xF5\x80\x80\x80"));
    EXPECT_FALSE(isValidUtf8("\xE6\x97"));                   // truncated
    EXPECT_FALSE(isValidUtf8("ok\xC3"));
    EXPECT_FALSE(isValidUtf8("\xC3\x28"));                   // bad continuation
}

TEST(Utf8, SplitByteLevelTokenIsInvalidAlone) {
    const std::string word = "\xE6\x97\xA5";
    EXPECT_TRUE(isValidUtf8(word));
    EXPECT_FALSE(isValidUtf8(word.substr(0, 1)));
    EXPECT_FALSE(isValidUtf8(word.substr(1)));
}
