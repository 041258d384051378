#include "safewhisper/error.hpp"
#include "safewhisper/language.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace safewhisper;

TEST(Language, EnglishIsFirst) {
    EXPECT_EQ(languageId("en"), 0);
    EXPECT_EQ(languageCode(0), "en");
    EXPECT_EQ(languageName(0), "english");
}

TEST(Language, CodesRoundTrip) {
    ASSERT_GT(maxLanguageId(), 0);
    for (int id = 0; id <= maxLanguageId(); ++id) {
        EXPECT_EQ(languageId(languageCode(id)), id) << languageCode(id);
    }
}

TEST(Language, UnknownLookupsFail) {
    try {
        languageId("xx-unknown");
        FAIL() << "expected LookupFailed";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::LookupFailed);
    }

    EXPECT_THROW(languageCode(-1), Error);
    EXPECT_THROW(languageCode(maxLanguageId() + 1), Error);
    EXPECT_THROW(languageName(maxLanguageId() + 1), Error);
}

TEST(Language, CodeWithNulByteIsRejected) {
    try {
        languageId(std::string("e\0n", 3));
        FAIL() << "expected InvalidArgument";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

TEST(SystemInfo, IsNotEmpty) {
    EXPECT_FALSE(systemInfo().empty());
}
